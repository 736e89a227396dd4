// core/types/enums.cpp
#include "core/types/enums.h"
#include <array>
#include <utility>

namespace funcmodel {

namespace {

template <typename E, size_t N>
using Table = std::array<std::pair<E, std::string_view>, N>;

constexpr Table<ModelStatus, 3> kModelStatus{{
    {ModelStatus::DRAFT, "draft"},
    {ModelStatus::PUBLISHED, "published"},
    {ModelStatus::ARCHIVED, "archived"},
}};

constexpr Table<NodeStatus, 6> kNodeStatus{{
    {NodeStatus::ACTIVE, "active"},
    {NodeStatus::INACTIVE, "inactive"},
    {NodeStatus::DRAFT, "draft"},
    {NodeStatus::CONFIGURED, "configured"},
    {NodeStatus::ARCHIVED, "archived"},
    {NodeStatus::ERROR, "error"},
}};

constexpr Table<ActionStatus, 10> kActionStatus{{
    {ActionStatus::DRAFT, "draft"},
    {ActionStatus::CONFIGURED, "configured"},
    {ActionStatus::ACTIVE, "active"},
    {ActionStatus::INACTIVE, "inactive"},
    {ActionStatus::EXECUTING, "executing"},
    {ActionStatus::COMPLETED, "completed"},
    {ActionStatus::FAILED, "failed"},
    {ActionStatus::RETRYING, "retrying"},
    {ActionStatus::ARCHIVED, "archived"},
    {ActionStatus::ERROR, "error"},
}};

constexpr Table<ExecutionMode, 3> kExecutionMode{{
    {ExecutionMode::SEQUENTIAL, "sequential"},
    {ExecutionMode::PARALLEL, "parallel"},
    {ExecutionMode::CONDITIONAL, "conditional"},
}};

constexpr Table<LinkType, 14> kLinkType{{
    {LinkType::DOCUMENTS, "documents"},
    {LinkType::IMPLEMENTS, "implements"},
    {LinkType::REFERENCES, "references"},
    {LinkType::SUPPORTS, "supports"},
    {LinkType::NESTED, "nested"},
    {LinkType::TRIGGERS, "triggers"},
    {LinkType::CONSUMES, "consumes"},
    {LinkType::PRODUCES, "produces"},
    {LinkType::DEPENDENCY, "dependency"},
    {LinkType::REFERENCE, "reference"},
    {LinkType::DATA_FLOW, "data_flow"},
    {LinkType::CONTROL_FLOW, "control_flow"},
    {LinkType::AGGREGATION, "aggregation"},
    {LinkType::COMPOSITION, "composition"},
}};

constexpr Table<RaciRole, 4> kRaciRole{{
    {RaciRole::RESPONSIBLE, "responsible"},
    {RaciRole::ACCOUNTABLE, "accountable"},
    {RaciRole::CONSULTED, "consulted"},
    {RaciRole::INFORMED, "informed"},
}};

constexpr Table<NodeType, 5> kNodeType{{
    {NodeType::IO_NODE, "ioNode"},
    {NodeType::STAGE_NODE, "stageNode"},
    {NodeType::TETHER_NODE, "tetherNode"},
    {NodeType::KB_NODE, "kbNode"},
    {NodeType::FUNCTION_MODEL_CONTAINER, "functionModelContainer"},
}};

constexpr Table<IOBoundary, 3> kIOBoundary{{
    {IOBoundary::INPUT, "input"},
    {IOBoundary::OUTPUT, "output"},
    {IOBoundary::INPUT_OUTPUT, "input-output"},
}};

constexpr Table<BackoffStrategy, 3> kBackoff{{
    {BackoffStrategy::LINEAR, "linear"},
    {BackoffStrategy::EXPONENTIAL, "exponential"},
    {BackoffStrategy::CONSTANT, "constant"},
}};

constexpr Table<Escalation, 2> kEscalation{{
    {Escalation::FAILED, "failed"},
    {Escalation::ERROR, "error"},
}};

constexpr Table<ContextScope, 5> kContextScope{{
    {ContextScope::EXECUTION, "execution"},
    {ContextScope::SESSION, "session"},
    {ContextScope::GLOBAL, "global"},
    {ContextScope::ISOLATED, "isolated"},
    {ContextScope::SHARED, "shared"},
}};

constexpr Table<ContextAccessLevel, 4> kAccessLevel{{
    {ContextAccessLevel::NONE, "none"},
    {ContextAccessLevel::READ, "read"},
    {ContextAccessLevel::WRITE, "write"},
    {ContextAccessLevel::READ_WRITE, "read_write"},
}};

constexpr Table<MergeStrategy, 4> kMergeStrategy{{
    {MergeStrategy::FIRST_WINS, "first_wins"},
    {MergeStrategy::LAST_WINS, "last_wins"},
    {MergeStrategy::DEEP_MERGE, "deep_merge"},
    {MergeStrategy::ERROR_ON_CONFLICT, "error_on_conflict"},
}};

constexpr Table<RunStatus, 9> kRunStatus{{
    {RunStatus::PENDING, "pending"},
    {RunStatus::READY, "ready"},
    {RunStatus::EXECUTING, "executing"},
    {RunStatus::RETRYING, "retrying"},
    {RunStatus::COMPLETED, "completed"},
    {RunStatus::FAILED, "failed"},
    {RunStatus::ERROR, "error"},
    {RunStatus::SKIPPED, "skipped"},
    {RunStatus::CANCELLED, "cancelled"},
}};

constexpr Table<ExecutionOutcome, 6> kOutcome{{
    {ExecutionOutcome::STARTED, "started"},
    {ExecutionOutcome::COMPLETED, "completed"},
    {ExecutionOutcome::FAILED, "failed"},
    {ExecutionOutcome::TIMEOUT, "timeout"},
    {ExecutionOutcome::ERROR, "error"},
    {ExecutionOutcome::SKIPPED, "skipped"},
}};

template <typename E, size_t N>
std::string_view name_of(const Table<E, N>& table, E value) {
    for (const auto& [e, name] : table) {
        if (e == value) return name;
    }
    return "unknown";
}

template <typename E, size_t N>
Result<E> parse_from(const Table<E, N>& table, std::string_view s, std::string_view what) {
    for (const auto& [e, name] : table) {
        if (name == s) return Result<E>::ok(e);
    }
    return validation_error("Invalid " + std::string(what) + ": '" + std::string(s) + "'");
}

} // namespace

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION: return "validation";
        case ErrorKind::NOT_FOUND: return "not_found";
        case ErrorKind::CONFLICT: return "conflict";
        case ErrorKind::ACCESS_DENIED: return "access_denied";
        case ErrorKind::INVALID_STATE: return "invalid_state";
        case ErrorKind::INTERNAL: return "internal";
    }
    return "internal";
}

std::string_view to_string(ModelStatus v) { return name_of(kModelStatus, v); }
std::string_view to_string(NodeStatus v) { return name_of(kNodeStatus, v); }
std::string_view to_string(ActionStatus v) { return name_of(kActionStatus, v); }
std::string_view to_string(ExecutionMode v) { return name_of(kExecutionMode, v); }
std::string_view to_string(LinkType v) { return name_of(kLinkType, v); }
std::string_view to_string(RaciRole v) { return name_of(kRaciRole, v); }
std::string_view to_string(NodeType v) { return name_of(kNodeType, v); }
std::string_view to_string(IOBoundary v) { return name_of(kIOBoundary, v); }
std::string_view to_string(BackoffStrategy v) { return name_of(kBackoff, v); }
std::string_view to_string(Escalation v) { return name_of(kEscalation, v); }
std::string_view to_string(ContextScope v) { return name_of(kContextScope, v); }
std::string_view to_string(ContextAccessLevel v) { return name_of(kAccessLevel, v); }
std::string_view to_string(MergeStrategy v) { return name_of(kMergeStrategy, v); }
std::string_view to_string(RunStatus v) { return name_of(kRunStatus, v); }
std::string_view to_string(ExecutionOutcome v) { return name_of(kOutcome, v); }

Result<ModelStatus> parse_model_status(std::string_view s) { return parse_from(kModelStatus, s, "model status"); }
Result<NodeStatus> parse_node_status(std::string_view s) { return parse_from(kNodeStatus, s, "node status"); }
Result<ActionStatus> parse_action_status(std::string_view s) { return parse_from(kActionStatus, s, "action status"); }
Result<ExecutionMode> parse_execution_mode(std::string_view s) { return parse_from(kExecutionMode, s, "execution mode"); }
Result<LinkType> parse_link_type(std::string_view s) { return parse_from(kLinkType, s, "link type"); }
Result<RaciRole> parse_raci_role(std::string_view s) { return parse_from(kRaciRole, s, "RACI role"); }
Result<NodeType> parse_node_type(std::string_view s) { return parse_from(kNodeType, s, "node type"); }
Result<IOBoundary> parse_io_boundary(std::string_view s) { return parse_from(kIOBoundary, s, "IO boundary"); }
Result<BackoffStrategy> parse_backoff_strategy(std::string_view s) { return parse_from(kBackoff, s, "backoff strategy"); }
Result<Escalation> parse_escalation(std::string_view s) { return parse_from(kEscalation, s, "escalation"); }
Result<ContextScope> parse_context_scope(std::string_view s) { return parse_from(kContextScope, s, "context scope"); }
Result<ContextAccessLevel> parse_access_level(std::string_view s) { return parse_from(kAccessLevel, s, "access level"); }

Result<MergeStrategy> parse_merge_strategy(std::string_view s) {
    // the hyphenated spelling is accepted too
    if (s == "first-wins") return Result<MergeStrategy>::ok(MergeStrategy::FIRST_WINS);
    if (s == "last-wins") return Result<MergeStrategy>::ok(MergeStrategy::LAST_WINS);
    return parse_from(kMergeStrategy, s, "merge strategy");
}

bool can_transition(ActionStatus from, ActionStatus to) {
    using S = ActionStatus;
    switch (from) {
        case S::DRAFT: return to == S::CONFIGURED || to == S::ACTIVE;
        case S::CONFIGURED: return to == S::ACTIVE || to == S::DRAFT;
        case S::ACTIVE: return to == S::INACTIVE || to == S::EXECUTING;
        case S::INACTIVE: return to == S::ACTIVE || to == S::ARCHIVED;
        case S::EXECUTING: return to == S::COMPLETED || to == S::FAILED || to == S::ERROR;
        case S::FAILED: return to == S::RETRYING || to == S::ARCHIVED;
        case S::RETRYING: return to == S::EXECUTING || to == S::FAILED || to == S::ERROR;
        case S::COMPLETED: return to == S::ARCHIVED;
        case S::ERROR: return to == S::ARCHIVED;
        case S::ARCHIVED: return false;
    }
    return false;
}

NodeStatus derive_node_status(ActionStatus s) {
    switch (s) {
        case ActionStatus::DRAFT: return NodeStatus::DRAFT;
        case ActionStatus::CONFIGURED: return NodeStatus::CONFIGURED;
        case ActionStatus::INACTIVE: return NodeStatus::INACTIVE;
        case ActionStatus::ARCHIVED: return NodeStatus::ARCHIVED;
        case ActionStatus::FAILED:
        case ActionStatus::ERROR: return NodeStatus::ERROR;
        case ActionStatus::ACTIVE:
        case ActionStatus::EXECUTING:
        case ActionStatus::COMPLETED:
        case ActionStatus::RETRYING: return NodeStatus::ACTIVE;
    }
    return NodeStatus::ERROR;
}

bool is_terminal(RunStatus s) {
    return s == RunStatus::COMPLETED || s == RunStatus::FAILED || s == RunStatus::ERROR ||
           s == RunStatus::SKIPPED || s == RunStatus::CANCELLED;
}

bool allows_read(ContextAccessLevel level) {
    return level == ContextAccessLevel::READ || level == ContextAccessLevel::READ_WRITE;
}

bool allows_write(ContextAccessLevel level) {
    return level == ContextAccessLevel::WRITE || level == ContextAccessLevel::READ_WRITE;
}

} // namespace funcmodel
