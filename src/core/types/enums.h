// core/types/enums.h
#ifndef FUNCMODEL_CORE_TYPES_ENUMS_H
#define FUNCMODEL_CORE_TYPES_ENUMS_H

#include "result.h"
#include <cstdint>
#include <string>
#include <string_view>

namespace funcmodel {

enum class ModelStatus : uint8_t { DRAFT, PUBLISHED, ARCHIVED };

enum class NodeStatus : uint8_t { ACTIVE, INACTIVE, DRAFT, CONFIGURED, ARCHIVED, ERROR };

enum class ActionStatus : uint8_t {
    DRAFT,
    CONFIGURED,
    ACTIVE,
    INACTIVE,
    EXECUTING,
    COMPLETED,
    FAILED,
    RETRYING,
    ARCHIVED,
    ERROR
};

enum class ExecutionMode : uint8_t { SEQUENTIAL, PARALLEL, CONDITIONAL };

enum class LinkType : uint8_t {
    DOCUMENTS,
    IMPLEMENTS,
    REFERENCES,
    SUPPORTS,
    NESTED,
    TRIGGERS,
    CONSUMES,
    PRODUCES,
    DEPENDENCY,
    REFERENCE,
    DATA_FLOW,
    CONTROL_FLOW,
    AGGREGATION,
    COMPOSITION
};

enum class RaciRole : uint8_t { RESPONSIBLE, ACCOUNTABLE, CONSULTED, INFORMED };

// Containers: IO_NODE, STAGE_NODE. Actions: the rest.
enum class NodeType : uint8_t { IO_NODE, STAGE_NODE, TETHER_NODE, KB_NODE, FUNCTION_MODEL_CONTAINER };

enum class IOBoundary : uint8_t { INPUT, OUTPUT, INPUT_OUTPUT };

enum class BackoffStrategy : uint8_t { LINEAR, EXPONENTIAL, CONSTANT };

// Where retries go once exhausted
enum class Escalation : uint8_t { FAILED, ERROR };

enum class ContextScope : uint8_t { EXECUTION, SESSION, GLOBAL, ISOLATED, SHARED };

enum class ContextAccessLevel : uint8_t { NONE, READ, WRITE, READ_WRITE };

enum class MergeStrategy : uint8_t { FIRST_WINS, LAST_WINS, DEEP_MERGE, ERROR_ON_CONFLICT };

// Per-node status inside an execution plan
enum class RunStatus : uint8_t {
    PENDING,
    READY,
    EXECUTING,
    RETRYING,
    COMPLETED,
    FAILED,
    ERROR,
    SKIPPED,
    CANCELLED
};

// What the caller observed when it performed the work
enum class ExecutionOutcome : uint8_t { STARTED, COMPLETED, FAILED, TIMEOUT, ERROR, SKIPPED };

std::string_view to_string(ModelStatus v);
std::string_view to_string(NodeStatus v);
std::string_view to_string(ActionStatus v);
std::string_view to_string(ExecutionMode v);
std::string_view to_string(LinkType v);
std::string_view to_string(RaciRole v);
std::string_view to_string(NodeType v);
std::string_view to_string(IOBoundary v);
std::string_view to_string(BackoffStrategy v);
std::string_view to_string(Escalation v);
std::string_view to_string(ContextScope v);
std::string_view to_string(ContextAccessLevel v);
std::string_view to_string(MergeStrategy v);
std::string_view to_string(RunStatus v);
std::string_view to_string(ExecutionOutcome v);

Result<ModelStatus> parse_model_status(std::string_view s);
Result<NodeStatus> parse_node_status(std::string_view s);
Result<ActionStatus> parse_action_status(std::string_view s);
Result<ExecutionMode> parse_execution_mode(std::string_view s);
Result<LinkType> parse_link_type(std::string_view s);
Result<RaciRole> parse_raci_role(std::string_view s);
Result<NodeType> parse_node_type(std::string_view s);
Result<IOBoundary> parse_io_boundary(std::string_view s);
Result<BackoffStrategy> parse_backoff_strategy(std::string_view s);
Result<Escalation> parse_escalation(std::string_view s);
Result<ContextScope> parse_context_scope(std::string_view s);
Result<ContextAccessLevel> parse_access_level(std::string_view s);
Result<MergeStrategy> parse_merge_strategy(std::string_view s);

inline bool is_container_type(NodeType t) {
    return t == NodeType::IO_NODE || t == NodeType::STAGE_NODE;
}

inline bool is_action_type(NodeType t) { return !is_container_type(t); }

// ActionStatus state machine; archived is terminal
bool can_transition(ActionStatus from, ActionStatus to);

// Coarse status of an action, derived from its ActionStatus
NodeStatus derive_node_status(ActionStatus s);

bool is_terminal(RunStatus s);

bool allows_read(ContextAccessLevel level);
bool allows_write(ContextAccessLevel level);

} // namespace funcmodel

#endif // FUNCMODEL_CORE_TYPES_ENUMS_H
