// core/types/node.h
#ifndef FUNCMODEL_CORE_TYPES_NODE_H
#define FUNCMODEL_CORE_TYPES_NODE_H

#include "context.h" // Value
#include "enums.h"
#include "value_objects.h"
#include <chrono>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace funcmodel {

using Timestamp = std::chrono::system_clock::time_point;

// Attributes every node carries
struct NodeHeader {
    NodeId id;
    ModelId model_id;
    std::string name;
    std::string description;
    Position position = Position::origin();
    std::vector<NodeId> dependencies; // sources of incoming dependency links
    ExecutionMode execution_type = ExecutionMode::SEQUENTIAL;
    std::optional<int> timeout_ms;    // declared bound, enforced by the caller
    Value metadata = Value::object();
    Value visual_properties = Value::object();
    Timestamp created_at;
    Timestamp updated_at;
};

// --- Container payloads ---

struct IONodeData {
    IOBoundary boundary_type = IOBoundary::INPUT;
    std::string data_type;
    Value schema = Value::object();
    bool is_required = false;
    Value validation_rules = Value::object();
    Value default_value = nullptr;
};

struct StageNodeData {
    std::string stage_type = "process"; // milestone, process, gateway, checkpoint
    Value completion_criteria = Value::object();
    std::vector<std::string> stage_goals;
    Value resource_requirements = Value::object();
    bool parallel_execution = false;
    Value configuration = Value::object();
};

// --- Action payloads ---

struct TetherNodeData {
    std::string tether_reference_id;
    Value connection_config = Value::object();
};

struct KBNodeData {
    std::string kb_reference_id;
    std::string short_description;
    std::vector<std::string> search_keywords;
    std::optional<std::string> documentation_context;
};

struct NestedModelNodeData {
    std::string nested_model_id;
    Value context_mapping = Value::object();
    std::string orchestration_mode = "embedded"; // embedded, parallel, sequential
};

using ContainerData = std::variant<IONodeData, StageNodeData>;
using ActionData = std::variant<TetherNodeData, KBNodeData, NestedModelNodeData>;

// Structural node (IO or Stage) that owns action nodes
struct ContainerNode {
    NodeHeader header;
    NodeStatus status = NodeStatus::ACTIVE;
    std::optional<NodeId> parent_node_id; // enclosing container when nested
    ContainerData data;
    std::vector<NodeId> action_ids;       // owned actions, in registration order

    NodeType type() const {
        return std::holds_alternative<IONodeData>(data) ? NodeType::IO_NODE : NodeType::STAGE_NODE;
    }
    const IONodeData* io() const { return std::get_if<IONodeData>(&data); }
    const StageNodeData* stage() const { return std::get_if<StageNodeData>(&data); }
};

// Unit of executable work owned by a container
struct ActionNode {
    NodeHeader header;
    NodeId parent_node_id;
    std::string action_type;
    ActionStatus status = ActionStatus::DRAFT;
    int execution_order = 1;
    int priority = 5;                       // 1..10, higher runs first on ties
    double estimated_duration_sec = 60.0;
    RetryPolicy retry_policy;
    RaciAssignment raci;
    std::optional<std::string> guard;       // inja expression, required for conditional mode
    ActionData data;

    NodeType type() const {
        switch (data.index()) {
            case 0: return NodeType::TETHER_NODE;
            case 1: return NodeType::KB_NODE;
            default: return NodeType::FUNCTION_MODEL_CONTAINER;
        }
    }
    NodeStatus node_status() const { return derive_node_status(status); }
};

using AnyNode = std::variant<ContainerNode, ActionNode>;

inline const NodeHeader& header_of(const AnyNode& node) {
    return std::visit([](const auto& n) -> const NodeHeader& { return n.header; }, node);
}

inline const NodeId& id_of(const AnyNode& node) { return header_of(node).id; }

inline NodeType type_of(const AnyNode& node) {
    return std::visit([](const auto& n) { return n.type(); }, node);
}

} // namespace funcmodel

#endif // FUNCMODEL_CORE_TYPES_NODE_H
