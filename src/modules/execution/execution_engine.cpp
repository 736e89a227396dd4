// modules/execution/execution_engine.cpp
#include "modules/execution/execution_engine.h"
#include <algorithm>
#include <functional>
#include <iostream>
#include <queue>

namespace funcmodel {

namespace {

bool is_unsuccessful(RunStatus s) {
    return s == RunStatus::FAILED || s == RunStatus::ERROR || s == RunStatus::SKIPPED || s == RunStatus::CANCELLED;
}

ExecutionMode child_mode_of(const FunctionModel& model, const ContainerNode& container) {
    if (const auto* stage = container.stage(); stage && stage->parallel_execution) {
        return ExecutionMode::PARALLEL;
    }
    if (container.action_ids.empty()) return ExecutionMode::SEQUENTIAL;
    bool all_parallel = std::all_of(container.action_ids.begin(), container.action_ids.end(), [&](const NodeId& id) {
        const auto* a = model.find_action(id);
        return a && a->header.execution_type == ExecutionMode::PARALLEL;
    });
    return all_parallel ? ExecutionMode::PARALLEL : ExecutionMode::SEQUENTIAL;
}

} // namespace

ExecutionEngine::ExecutionEngine(DomainServices services, Config config)
    : services_(std::move(services)), config_(config) {}

Result<std::vector<NodeId>> ExecutionEngine::order_containers(const FunctionModel& model) const {
    std::unordered_map<NodeId, int> in_degree;
    std::unordered_map<NodeId, std::vector<NodeId>> successors;
    for (const auto& [id, node] : model.nodes()) {
        auto deps = model.container_dependencies(id);
        in_degree[id] = static_cast<int>(deps.size());
        for (const auto& d : deps) successors[d].push_back(id);
    }

    // Kahn's algorithm; ties resolved by registration order
    using Item = std::pair<size_t, NodeId>;
    std::priority_queue<Item, std::vector<Item>, std::greater<>> ready;
    for (const auto& [id, deg] : in_degree) {
        if (deg == 0) ready.emplace(model.registration_index(id), id);
    }

    std::vector<NodeId> order;
    while (!ready.empty()) {
        NodeId current = ready.top().second;
        ready.pop();
        order.push_back(current);
        for (const auto& next : successors[current]) {
            if (--in_degree[next] == 0) ready.emplace(model.registration_index(next), next);
        }
    }

    if (order.size() != model.nodes().size()) {
        return validation_error("Dependency cycle detected between container nodes");
    }
    return Result<std::vector<NodeId>>::ok(std::move(order));
}

std::vector<NodeId> ExecutionEngine::order_actions(const FunctionModel& model, const ContainerNode& container) const {
    std::vector<NodeId> ids = container.action_ids;
    std::stable_sort(ids.begin(), ids.end(), [&](const NodeId& lhs, const NodeId& rhs) {
        const ActionNode& a = *model.find_action(lhs);
        const ActionNode& b = *model.find_action(rhs);
        if (a.execution_order != b.execution_order) return a.execution_order < b.execution_order;
        if (a.priority != b.priority) return a.priority > b.priority;
        if (a.header.created_at != b.header.created_at) return a.header.created_at < b.header.created_at;
        return model.registration_index(lhs) < model.registration_index(rhs);
    });
    return ids;
}

Result<ExecutionPlan> ExecutionEngine::plan_execution(const FunctionModel& model, const PlanOptions& options) {
    if (model.is_deleted()) {
        return invalid_state_error("Cannot execute a deleted model");
    }
    if (model.status() == ModelStatus::ARCHIVED) {
        return invalid_state_error("Cannot execute an archived model");
    }
    if (!options.dry_run && model.status() != ModelStatus::PUBLISHED) {
        return invalid_state_error("Model must be published before execution (status: " +
                                   std::string(to_string(model.status())) + ")");
    }
    if (model.nodes().empty()) {
        return validation_error("Model has no container nodes to execute");
    }

    auto container_order = order_containers(model);
    if (container_order.is_failure()) return container_order.error();

    const Context& context = options.context.is_null() ? Context::object() : options.context;

    // Guards are decided up front so a bad guard fails the whole plan
    std::unordered_map<NodeId, std::string> skipped;
    for (const auto& cid : container_order.value()) {
        for (const auto& aid : model.find_container(cid)->action_ids) {
            const ActionNode& action = *model.find_action(aid);
            if (action.status == ActionStatus::INACTIVE || action.status == ActionStatus::ARCHIVED) {
                skipped[aid] = "action is " + std::string(to_string(action.status));
                continue;
            }
            if (action.header.execution_type != ExecutionMode::CONDITIONAL) continue;
            if (!action.guard || action.guard->empty()) {
                return validation_error("Conditional action '" + action.header.name + "' has no guard defined");
            }
            auto pass = guards_.evaluate(*action.guard, context);
            if (pass.is_failure()) {
                return validation_error("Conditional action '" + action.header.name + "': " + pass.message());
            }
            if (!pass.value()) skipped[aid] = "guard evaluated to false";
        }
    }

    ExecutionPlan plan{
        .plan_id = services_.ids->next_uuid(),
        .model_id = model.id(),
        .dry_run = options.dry_run,
        .context = context,
        .created_at = services_.clock->now(),
        .container_order = container_order.value(),
    };

    for (const auto& cid : plan.container_order) {
        const ContainerNode& container = *model.find_container(cid);
        plan.entries.emplace(cid, PlanEntry{
            .node_id = cid,
            .node_type = container.type(),
            .parent_id = container.parent_node_id,
            .depends_on = model.container_dependencies(cid),
            .mode = child_mode_of(model, container),
            .timeout_ms = container.header.timeout_ms,
        });

        std::vector<NodeId> actions = order_actions(model, container);
        for (const auto& aid : actions) {
            const ActionNode& action = *model.find_action(aid);
            plan.entries.emplace(aid, PlanEntry{
                .node_id = aid,
                .node_type = action.type(),
                .parent_id = cid,
                .mode = action.header.execution_type,
                .max_retries = action.retry_policy.max_retries,
                .escalation = action.retry_policy.escalation,
                .execution_order = action.execution_order,
                .priority = action.priority,
                .estimated_duration_sec = action.estimated_duration_sec,
                .timeout_ms = action.header.timeout_ms,
            });
        }
        plan.action_order.emplace(cid, std::move(actions));
    }

    for (const auto& aid : plan.ordered_actions()) {
        auto it = skipped.find(aid);
        if (it == skipped.end()) continue;
        PlanEntry& entry = plan.entries.at(aid);
        entry.skip_reason = it->second;
        set_status(plan, entry, RunStatus::SKIPPED);
    }

    refresh(plan);

    std::cout << "[DEBUG] Planned " << (plan.dry_run ? "dry run " : "run ") << plan.plan_id << ": "
              << plan.container_order.size() << " containers, " << model.action_nodes().size() << " actions"
              << std::endl;
    return Result<ExecutionPlan>::ok(std::move(plan));
}

void ExecutionEngine::set_status(ExecutionPlan& plan, PlanEntry& entry, RunStatus to,
                                 std::optional<ExecutionOutcome> outcome) {
    RunStatus from = entry.status;
    if (from == to) return;

    Timestamp now = services_.clock->now();
    entry.status = to;
    if (to == RunStatus::EXECUTING) entry.started_at = now;
    if (is_terminal(to)) entry.finished_at = now;

    plan.last_transitions.push_back(StatusTransition{
        .node_id = entry.node_id,
        .from = from,
        .to = to,
        .outcome = outcome,
        .attempt = entry.attempt,
    });

    if (!config_.trace_enabled) return;
    std::lock_guard<std::mutex> lock(trace_mutex_);
    std::optional<std::string> outcome_str;
    if (outcome) outcome_str = std::string(to_string(*outcome));
    if (to == RunStatus::EXECUTING) {
        trace_.on_node_start(plan.plan_id, entry.node_id.value(), entry.node_type, entry.attempt, plan.dry_run, now);
    } else if (to == RunStatus::RETRYING || is_terminal(to)) {
        trace_.on_node_end(plan.plan_id, entry.node_id.value(), entry.node_type, std::string(to_string(to)),
                           outcome_str, plan.dry_run, now);
    }
}

bool ExecutionEngine::refresh_container(ExecutionPlan& plan, PlanEntry& container) {
    const std::vector<NodeId>& actions = plan.action_order[container.node_id];

    auto skip_all = [&](const std::string& reason) {
        for (const auto& aid : actions) {
            PlanEntry& a = plan.entries.at(aid);
            if (is_terminal(a.status)) continue;
            a.skip_reason = reason;
            set_status(plan, a, RunStatus::SKIPPED);
        }
        container.skip_reason = reason;
        set_status(plan, container, RunStatus::SKIPPED);
    };

    if (container.status == RunStatus::PENDING) {
        for (const auto& dep : container.depends_on) {
            if (is_unsuccessful(plan.status_of(dep))) {
                skip_all("dependency " + dep.value() + " did not complete");
                return true;
            }
        }
        if (container.parent_id) {
            RunStatus parent = plan.status_of(*container.parent_id);
            if (is_unsuccessful(parent)) {
                skip_all("enclosing container " + container.parent_id->value() + " did not run");
                return true;
            }
            if (parent != RunStatus::EXECUTING && parent != RunStatus::COMPLETED) return false;
        }
        bool deps_done = std::all_of(container.depends_on.begin(), container.depends_on.end(),
                                     [&](const NodeId& d) { return plan.status_of(d) == RunStatus::COMPLETED; });
        if (!deps_done) return false;
        set_status(plan, container, RunStatus::EXECUTING);
    }

    if (container.status != RunStatus::EXECUTING) return false;

    bool changed = false;
    if (container.mode == ExecutionMode::PARALLEL) {
        for (const auto& aid : actions) {
            PlanEntry& a = plan.entries.at(aid);
            if (a.status == RunStatus::PENDING) {
                set_status(plan, a, RunStatus::READY);
                changed = true;
            }
        }
    } else {
        // sequential: only the first unfinished action may run
        for (const auto& aid : actions) {
            PlanEntry& a = plan.entries.at(aid);
            if (is_terminal(a.status)) continue;
            if (a.status == RunStatus::PENDING) {
                set_status(plan, a, RunStatus::READY);
                changed = true;
            }
            break;
        }
    }

    bool all_done = true;
    bool any_failed = false;
    for (const auto& aid : actions) {
        RunStatus s = plan.status_of(aid);
        all_done &= is_terminal(s);
        any_failed |= (s == RunStatus::FAILED || s == RunStatus::ERROR);
    }
    for (const auto& [id, e] : plan.entries) {
        if (e.is_container() && e.parent_id && *e.parent_id == container.node_id) {
            all_done &= is_terminal(e.status);
            any_failed |= (e.status == RunStatus::FAILED || e.status == RunStatus::ERROR);
        }
    }
    if (all_done) {
        set_status(plan, container, any_failed ? RunStatus::FAILED : RunStatus::COMPLETED);
        changed = true;
    }
    return changed;
}

void ExecutionEngine::refresh(ExecutionPlan& plan) {
    bool changed = true;
    while (changed) {
        changed = false;
        for (const auto& cid : plan.container_order) {
            changed |= refresh_container(plan, plan.entries.at(cid));
        }
    }
}

Result<ExecutionPlan> ExecutionEngine::advance(const ExecutionPlan& plan, const NodeId& node_id,
                                               ExecutionOutcome outcome) {
    if (plan.cancelled) {
        return conflict_error("Execution plan " + plan.plan_id + " has been cancelled");
    }
    const PlanEntry* current = plan.entry(node_id);
    if (!current) {
        return not_found_error("Node is not part of execution plan: " + node_id.value());
    }
    if (current->is_container()) {
        return validation_error("Container status follows its actions and cannot be advanced directly");
    }

    const std::string label = "Action " + node_id.value();
    if (current->status == RunStatus::PENDING) {
        return conflict_error(label + " is not ready yet");
    }
    if (is_terminal(current->status)) {
        return conflict_error(label + " has already finished with status " + std::string(to_string(current->status)));
    }
    if (current->status == RunStatus::EXECUTING) {
        if (outcome == ExecutionOutcome::STARTED) return conflict_error(label + " is already executing");
        if (outcome == ExecutionOutcome::SKIPPED) return conflict_error(label + " is executing and cannot be skipped");
    }

    ExecutionPlan next = plan;
    next.last_transitions.clear();
    PlanEntry& entry = next.entries.at(node_id);

    if (entry.status == RunStatus::READY || entry.status == RunStatus::RETRYING) {
        if (outcome == ExecutionOutcome::SKIPPED) {
            entry.skip_reason = "skipped by caller";
            set_status(next, entry, RunStatus::SKIPPED, outcome);
            refresh(next);
            return Result<ExecutionPlan>::ok(std::move(next));
        }
        // completing, failing or starting all pass through EXECUTING
        set_status(next, entry, RunStatus::EXECUTING,
                   outcome == ExecutionOutcome::STARTED ? std::optional(outcome) : std::nullopt);
    }

    switch (outcome) {
        case ExecutionOutcome::COMPLETED:
            set_status(next, entry, RunStatus::COMPLETED, outcome);
            break;
        case ExecutionOutcome::FAILED:
        case ExecutionOutcome::TIMEOUT:
            if (entry.attempt < entry.max_retries) {
                entry.attempt++;
                set_status(next, entry, RunStatus::RETRYING, outcome);
            } else {
                set_status(next, entry, entry.escalation == Escalation::ERROR ? RunStatus::ERROR : RunStatus::FAILED,
                           outcome);
            }
            break;
        case ExecutionOutcome::ERROR:
            set_status(next, entry, RunStatus::ERROR, outcome);
            break;
        case ExecutionOutcome::STARTED:
        case ExecutionOutcome::SKIPPED:
            break;
    }

    refresh(next);
    return Result<ExecutionPlan>::ok(std::move(next));
}

Result<ExecutionPlan> ExecutionEngine::stop_execution(const ExecutionPlan& plan) {
    if (plan.cancelled) {
        return conflict_error("Execution plan " + plan.plan_id + " has already been cancelled");
    }
    ExecutionPlan next = plan;
    next.last_transitions.clear();
    for (const auto& cid : next.container_order) {
        for (const auto& aid : next.action_order[cid]) {
            PlanEntry& a = next.entries.at(aid);
            if (!is_terminal(a.status)) set_status(next, a, RunStatus::CANCELLED);
        }
        PlanEntry& c = next.entries.at(cid);
        if (!is_terminal(c.status)) set_status(next, c, RunStatus::CANCELLED);
    }
    next.cancelled = true;
    return Result<ExecutionPlan>::ok(std::move(next));
}

ExecutionSummary ExecutionEngine::summarize(const ExecutionPlan& plan) const {
    ExecutionSummary summary;
    summary.plan_id = plan.plan_id;
    summary.dry_run = plan.dry_run;

    for (const auto& aid : plan.ordered_actions()) {
        summary.total_actions++;
        switch (plan.status_of(aid)) {
            case RunStatus::PENDING: summary.pending++; break;
            case RunStatus::READY: summary.ready++; break;
            case RunStatus::EXECUTING: summary.executing++; break;
            case RunStatus::RETRYING: summary.retrying++; break;
            case RunStatus::COMPLETED: summary.completed++; break;
            case RunStatus::FAILED: summary.failed++; break;
            case RunStatus::ERROR: summary.errored++; break;
            case RunStatus::SKIPPED: summary.skipped++; break;
            case RunStatus::CANCELLED: summary.cancelled++; break;
        }
    }

    summary.finished = std::all_of(plan.entries.begin(), plan.entries.end(),
                                   [](const auto& kv) { return is_terminal(kv.second.status); });
    summary.partial_failure = (summary.failed + summary.errored) > 0 && summary.completed > 0;

    for (const auto& cid : plan.container_order) {
        const PlanEntry& c = plan.entries.at(cid);
        double total = 0.0;
        for (const auto& aid : plan.action_order.at(cid)) {
            const PlanEntry& a = plan.entries.at(aid);
            if (a.status == RunStatus::SKIPPED) continue;
            total = c.mode == ExecutionMode::PARALLEL ? std::max(total, a.estimated_duration_sec)
                                                      : total + a.estimated_duration_sec;
        }
        summary.estimated_duration_sec += total;
    }
    return summary;
}

Result<ExecutionSummary> ExecutionEngine::simulate(const FunctionModel& model, const Context& context) {
    auto planned = plan_execution(model, PlanOptions{.context = context, .dry_run = true});
    if (planned.is_failure()) return planned.error();

    ExecutionPlan current = std::move(planned).value();
    for (auto ready = next_ready(current); !ready.empty(); ready = next_ready(current)) {
        for (const auto& id : ready) {
            auto step = advance(current, id, ExecutionOutcome::COMPLETED);
            if (step.is_failure()) return step.error();
            current = std::move(step).value();
        }
    }
    ExecutionSummary summary = summarize(current);
    if (!summary.finished) {
        return invalid_state_error("Simulation stalled with " + std::to_string(summary.pending) +
                                   " actions still pending");
    }
    return Result<ExecutionSummary>::ok(std::move(summary));
}

std::vector<NodeId> ExecutionEngine::next_ready(const ExecutionPlan& plan) const {
    std::vector<NodeId> out;
    for (const auto& aid : plan.ordered_actions()) {
        RunStatus s = plan.status_of(aid);
        if (s == RunStatus::READY || s == RunStatus::RETRYING) out.push_back(aid);
    }
    return out;
}

std::vector<TraceRecord> ExecutionEngine::get_traces() const {
    std::lock_guard<std::mutex> lock(trace_mutex_);
    return trace_.get_traces();
}

void ExecutionEngine::clear_traces() {
    std::lock_guard<std::mutex> lock(trace_mutex_);
    trace_.clear_traces();
}

} // namespace funcmodel
