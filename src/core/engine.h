// core/engine.h
#ifndef FUNCMODEL_CORE_ENGINE_H
#define FUNCMODEL_CORE_ENGINE_H

#include "common/config/engine_config.h"
#include "core/function_model.h"
#include "modules/context/context_access_service.h"
#include "modules/execution/execution_engine.h"
#include "modules/parser/model_loader.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace funcmodel {

// One model with its execution engine and context tree.
// Live runs write action status back into the model; dry runs leave it untouched.
class FunctionModelEngine {
public:
    static Result<std::unique_ptr<FunctionModelEngine>> from_yaml(
        const std::string& yaml_content, const std::string& config_path = "funcmodel_config.json",
        DomainServices services = DomainServices::system_default());
    static Result<std::unique_ptr<FunctionModelEngine>> from_file(
        const std::string& file_path, const std::string& config_path = "funcmodel_config.json",
        DomainServices services = DomainServices::system_default());

    explicit FunctionModelEngine(FunctionModel model, EngineConfig config = {});

    FunctionModel& model() { return model_; }
    const FunctionModel& model() const { return model_; }
    ContextAccessService& contexts() { return contexts_; }
    ExecutionEngine& executor() { return executor_; }
    const EngineConfig& config() const { return config_; }

    // Node ids by definition key, empty when the engine was built from a FunctionModel
    const std::map<std::string, NodeId>& keys() const { return keys_; }
    Result<NodeId> node_id(const std::string& key) const;

    // dry_run defaults to the configured value
    Result<ExecutionPlan> plan(const Context& context = Context::object(), std::optional<bool> dry_run = std::nullopt);
    Result<ExecutionPlan> advance(const ExecutionPlan& plan, const NodeId& node_id, ExecutionOutcome outcome);
    Result<ExecutionPlan> stop(const ExecutionPlan& plan);
    ExecutionSummary summarize(const ExecutionPlan& plan) const { return executor_.summarize(plan); }
    Result<ExecutionSummary> simulate(const Context& context = Context::object());

    // Registers every node of the model with the context service
    VoidResult sync_context_hierarchy();

    std::vector<TraceRecord> get_last_traces() const { return executor_.get_traces(); }

private:
    // Actions a live run will activate; rejects models that cannot run live
    Result<std::vector<NodeId>> prepare_live_run() const;
    VoidResult write_back(const ExecutionPlan& plan);

    EngineConfig config_;
    FunctionModel model_;
    std::map<std::string, NodeId> keys_;
    ExecutionEngine executor_;
    ContextAccessService contexts_;
};

} // namespace funcmodel

#endif // FUNCMODEL_CORE_ENGINE_H
