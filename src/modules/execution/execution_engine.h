// modules/execution/execution_engine.h
#ifndef FUNCMODEL_MODULES_EXECUTION_EXECUTION_ENGINE_H
#define FUNCMODEL_MODULES_EXECUTION_EXECUTION_ENGINE_H

#include "core/function_model.h"
#include "core/services.h"
#include "modules/execution/execution_plan.h"
#include "modules/execution/guard_evaluator.h"
#include "modules/trace/trace_exporter.h"
#include <mutex>
#include <vector>

namespace funcmodel {

struct ExecutionConfig {
    bool trace_enabled = true;
};

// Plans runs of a FunctionModel and drives per-node run status.
// Performs no work itself: callers execute actions and report outcomes through advance().
// Calls touching the same node id must be serialized by the caller.
class ExecutionEngine {
public:
    using Config = ExecutionConfig;

    explicit ExecutionEngine(DomainServices services = DomainServices::system_default(), Config config = {});

    Result<ExecutionPlan> plan_execution(const FunctionModel& model, const PlanOptions& options = {});
    Result<ExecutionPlan> advance(const ExecutionPlan& plan, const NodeId& node_id, ExecutionOutcome outcome);
    Result<ExecutionPlan> stop_execution(const ExecutionPlan& plan);

    ExecutionSummary summarize(const ExecutionPlan& plan) const;
    // Dry-run plan driven to the end with synthetic successes
    Result<ExecutionSummary> simulate(const FunctionModel& model, const Context& context = Context::object());

    // READY and RETRYING actions, in plan order
    std::vector<NodeId> next_ready(const ExecutionPlan& plan) const;

    std::vector<TraceRecord> get_traces() const;
    void clear_traces();

private:
    Result<std::vector<NodeId>> order_containers(const FunctionModel& model) const;
    std::vector<NodeId> order_actions(const FunctionModel& model, const ContainerNode& container) const;

    void refresh(ExecutionPlan& plan);
    bool refresh_container(ExecutionPlan& plan, PlanEntry& container);
    void set_status(ExecutionPlan& plan, PlanEntry& entry, RunStatus to,
                    std::optional<ExecutionOutcome> outcome = std::nullopt);

    DomainServices services_;
    Config config_;
    GuardEvaluator guards_;
    TraceExporter trace_;
    mutable std::mutex trace_mutex_;
};

} // namespace funcmodel

#endif // FUNCMODEL_MODULES_EXECUTION_EXECUTION_ENGINE_H
