// modules/execution/execution_plan.h
#ifndef FUNCMODEL_MODULES_EXECUTION_EXECUTION_PLAN_H
#define FUNCMODEL_MODULES_EXECUTION_EXECUTION_PLAN_H

#include "core/types/context.h"
#include "core/types/node.h"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace funcmodel {

struct PlanEntry {
    NodeId node_id;
    NodeType node_type = NodeType::STAGE_NODE;
    std::optional<NodeId> parent_id;   // owning container (actions) or enclosing container (nested stages)
    std::vector<NodeId> depends_on;    // containers only: sources of dependency links
    ExecutionMode mode = ExecutionMode::SEQUENTIAL; // containers: how their actions are scheduled
    RunStatus status = RunStatus::PENDING;
    int attempt = 0;                   // retries consumed so far
    int max_retries = 0;
    Escalation escalation = Escalation::FAILED;
    int execution_order = 0;
    int priority = 0;
    double estimated_duration_sec = 0.0;
    std::optional<int> timeout_ms;
    std::optional<std::string> skip_reason;
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> finished_at;

    bool is_container() const { return is_container_type(node_type); }
};

struct StatusTransition {
    NodeId node_id;
    RunStatus from = RunStatus::PENDING;
    RunStatus to = RunStatus::PENDING;
    std::optional<ExecutionOutcome> outcome;
    int attempt = 0;
};

// Snapshot of one run. advance() returns a new plan; the previous one is left untouched.
struct ExecutionPlan {
    std::string plan_id;
    ModelId model_id;
    bool dry_run = false;
    bool cancelled = false;
    Context context = Context::object();
    Timestamp created_at;

    std::vector<NodeId> container_order;                          // topological
    std::unordered_map<NodeId, std::vector<NodeId>> action_order; // per container, scheduling order
    std::unordered_map<NodeId, PlanEntry> entries;

    std::vector<StatusTransition> last_transitions;              // produced by the last call

    const PlanEntry* entry(const NodeId& id) const {
        auto it = entries.find(id);
        return it == entries.end() ? nullptr : &it->second;
    }
    RunStatus status_of(const NodeId& id) const {
        const auto* e = entry(id);
        return e ? e->status : RunStatus::PENDING;
    }
    // Every action id in plan order
    std::vector<NodeId> ordered_actions() const {
        std::vector<NodeId> out;
        for (const auto& c : container_order) {
            auto it = action_order.find(c);
            if (it != action_order.end()) out.insert(out.end(), it->second.begin(), it->second.end());
        }
        return out;
    }
};

struct ExecutionSummary {
    std::string plan_id;
    bool dry_run = false;
    size_t total_actions = 0;
    size_t pending = 0;
    size_t ready = 0;
    size_t executing = 0;
    size_t retrying = 0;
    size_t completed = 0;
    size_t failed = 0;
    size_t errored = 0;
    size_t skipped = 0;
    size_t cancelled = 0;
    bool finished = false;
    bool partial_failure = false;
    double estimated_duration_sec = 0.0;
};

struct PlanOptions {
    Context context = Context::object(); // guard input
    bool dry_run = false;
};

} // namespace funcmodel

#endif // FUNCMODEL_MODULES_EXECUTION_EXECUTION_PLAN_H
