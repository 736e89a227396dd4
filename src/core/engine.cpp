// core/engine.cpp
#include "core/engine.h"
#include <fstream>
#include <iostream>
#include <sstream>

namespace funcmodel {

Result<std::unique_ptr<FunctionModelEngine>> FunctionModelEngine::from_yaml(const std::string& yaml_content,
                                                                             const std::string& config_path,
                                                                             DomainServices services) {
    auto config = load_engine_config(config_path);

    ModelLoader loader(services, ModelLoader::Config{
                                     .default_action_duration_sec = config.default_action_duration_sec,
                                     .default_escalation = config.default_escalation,
                                 });
    auto loaded = loader.parse_from_string(yaml_content);
    if (loaded.is_failure()) return loaded.error();

    LoadedModel result = std::move(loaded).value();
    auto engine = std::make_unique<FunctionModelEngine>(std::move(result.model), config);
    engine->keys_ = std::move(result.keys);
    return Result<std::unique_ptr<FunctionModelEngine>>::ok(std::move(engine));
}

Result<std::unique_ptr<FunctionModelEngine>> FunctionModelEngine::from_file(const std::string& file_path,
                                                                             const std::string& config_path,
                                                                             DomainServices services) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return not_found_error("Cannot open file: " + file_path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_yaml(buffer.str(), config_path, std::move(services));
}

FunctionModelEngine::FunctionModelEngine(FunctionModel model, EngineConfig config)
    : config_(config),
      model_(std::move(model)),
      executor_(model_.services(), ExecutionEngine::Config{.trace_enabled = config.trace_enabled}),
      contexts_(model_.services(), ContextAccessService::Config{
                                       .max_context_depth = config.max_context_depth,
                                       .default_merge_strategy = config.default_merge_strategy,
                                       .ancestors_can_write = config.ancestors_can_write,
                                   }) {}

Result<NodeId> FunctionModelEngine::node_id(const std::string& key) const {
    auto it = keys_.find(key);
    if (it == keys_.end()) return not_found_error("Unknown node key: " + key);
    return Result<NodeId>::ok(it->second);
}

Result<ExecutionPlan> FunctionModelEngine::plan(const Context& context, std::optional<bool> dry_run) {
    bool dry = dry_run.value_or(config_.dry_run);
    std::vector<NodeId> to_activate;
    if (!dry) {
        auto prepared = prepare_live_run();
        if (prepared.is_failure()) return prepared.error();
        to_activate = std::move(prepared).value();
    }
    auto planned = executor_.plan_execution(model_, PlanOptions{.context = context, .dry_run = dry});
    if (planned.is_failure()) return planned;

    // activate only once the plan has been built
    for (const auto& id : to_activate) {
        auto res = model_.update_action_status(id, ActionStatus::ACTIVE);
        if (res.is_failure()) return res.error();
    }
    return planned;
}

Result<ExecutionPlan> FunctionModelEngine::advance(const ExecutionPlan& plan, const NodeId& node_id,
                                                   ExecutionOutcome outcome) {
    auto next = executor_.advance(plan, node_id, outcome);
    if (next.is_failure() || next.value().dry_run) return next;
    auto written = write_back(next.value());
    if (written.is_failure()) return written.error();
    return next;
}

Result<ExecutionPlan> FunctionModelEngine::stop(const ExecutionPlan& plan) {
    auto next = executor_.stop_execution(plan);
    if (next.is_failure() || next.value().dry_run) return next;
    auto written = write_back(next.value());
    if (written.is_failure()) return written.error();
    return next;
}

Result<ExecutionSummary> FunctionModelEngine::simulate(const Context& context) {
    return executor_.simulate(model_, context);
}

VoidResult FunctionModelEngine::sync_context_hierarchy() {
    return contexts_.register_model(model_);
}

Result<std::vector<NodeId>> FunctionModelEngine::prepare_live_run() const {
    // rejected before any action status changes
    if (model_.is_deleted()) return invalid_state_error("Cannot execute a deleted model");
    if (model_.status() == ModelStatus::ARCHIVED) return invalid_state_error("Cannot execute an archived model");
    if (model_.status() != ModelStatus::PUBLISHED) {
        return invalid_state_error("Model must be published before execution (status: " +
                                   std::string(to_string(model_.status())) + ")");
    }

    std::vector<NodeId> to_activate;
    for (const auto& id : model_.registration_order()) {
        const ActionNode* action = model_.find_action(id);
        if (!action) continue;
        switch (action->status) {
            case ActionStatus::DRAFT:
            case ActionStatus::CONFIGURED:
                to_activate.push_back(id);
                break;
            case ActionStatus::ACTIVE:
            case ActionStatus::INACTIVE:
            case ActionStatus::ARCHIVED:
                break;
            default:
                return conflict_error("Action '" + action->header.name + "' is not ready for execution (status " +
                                      std::string(to_string(action->status)) + ")");
        }
    }

    return Result<std::vector<NodeId>>::ok(std::move(to_activate));
}

VoidResult FunctionModelEngine::write_back(const ExecutionPlan& plan) {
    for (const auto& t : plan.last_transitions) {
        const ActionNode* action = model_.find_action(t.node_id);
        if (!action) continue;

        std::vector<ActionStatus> steps;
        switch (t.to) {
            case RunStatus::EXECUTING: steps = {ActionStatus::EXECUTING}; break;
            case RunStatus::RETRYING: steps = {ActionStatus::FAILED, ActionStatus::RETRYING}; break;
            case RunStatus::COMPLETED: steps = {ActionStatus::COMPLETED}; break;
            case RunStatus::FAILED: steps = {ActionStatus::FAILED}; break;
            case RunStatus::ERROR: steps = {ActionStatus::ERROR}; break;
            case RunStatus::CANCELLED:
                if (action->status == ActionStatus::EXECUTING || action->status == ActionStatus::RETRYING) {
                    steps = {ActionStatus::FAILED};
                }
                break;
            case RunStatus::PENDING:
            case RunStatus::READY:
            case RunStatus::SKIPPED:
                break;
        }
        for (auto status : steps) {
            auto res = model_.update_action_status(t.node_id, status);
            if (res.is_failure()) {
                std::cerr << "[WARNING] Action status write-back failed for " << t.node_id.value() << ": "
                          << res.message() << std::endl;
                return res;
            }
        }
    }
    return VoidResult::ok();
}

} // namespace funcmodel
