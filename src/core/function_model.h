// core/function_model.h
#ifndef FUNCMODEL_CORE_FUNCTION_MODEL_H
#define FUNCMODEL_CORE_FUNCTION_MODEL_H

#include "core/services.h"
#include "core/types/link.h"
#include "core/types/node.h"
#include "core/types/result.h"
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace funcmodel {

struct Permissions {
    std::string owner;
    std::vector<std::string> editors;
    std::vector<std::string> viewers;
};

// Optional attributes for add_node
struct NodeOptions {
    std::string description;
    std::optional<ExecutionMode> execution_type;
    std::optional<int> timeout_ms;
    Value metadata = Value::object();
    Value visual_properties = Value::object();
    std::optional<NodeId> parent_node_id;  // enclosing container, or owning container for actions
    std::optional<IONodeData> io_data;
    std::optional<StageNodeData> stage_data;
    Value action_data = Value::object();   // action payload when adding an action through add_node
};

struct ActionSpec {
    NodeId parent_node_id;
    NodeType type = NodeType::TETHER_NODE;
    std::string name;
    std::string description;
    std::string action_type;
    ExecutionMode execution_mode = ExecutionMode::SEQUENTIAL;
    std::optional<int> execution_order;        // next free order in the parent when unset
    int priority = 5;
    std::optional<double> estimated_duration_sec;
    std::optional<int> timeout_ms;
    RetryPolicy retry_policy;
    RaciAssignment raci;
    std::optional<std::string> guard;
    Value metadata = Value::object();
    Value action_data = Value::object();       // tether / kb / nested model payload
    Position position = Position::origin();
};

struct NodeDetailsUpdate {
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<Position> position;
    std::optional<Value> metadata;
    std::optional<ExecutionMode> execution_type;
};

struct ValidationReport {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

struct ModelStatistics {
    size_t container_count = 0;
    size_t action_count = 0;
    size_t link_count = 0;
    std::map<std::string, size_t> nodes_by_type;
    std::map<std::string, size_t> actions_by_status;
    double total_estimated_duration_sec = 0.0;
    double average_estimated_duration_sec = 0.0;
    int max_hierarchy_depth = 0;
};

class FunctionModel {
public:
    static constexpr size_t kMaxDescriptionLength = 5000;
    static constexpr int kMinPriority = 1;
    static constexpr int kMaxPriority = 10;

    static Result<FunctionModel> create(const std::string& name,
                                        const std::string& description = "",
                                        DomainServices services = DomainServices::system_default(),
                                        std::optional<ModelId> id = std::nullopt);

    // --- Structure (draft only) ---
    Result<AnyNode> add_node(NodeType type, const std::string& name, double x, double y,
                             const NodeOptions& options = {});
    Result<ContainerNode> add_container_node(NodeType type, const std::string& name, Position position,
                                             const NodeOptions& options = {});
    Result<ActionNode> add_action_node(const ActionSpec& spec);
    VoidResult remove_node(const NodeId& id);

    Result<NodeLink> create_edge(const NodeId& source, const NodeId& target, LinkType type,
                                 double strength = 1.0, const Value& context = Value::object(),
                                 bool bidirectional = false);
    VoidResult remove_edge(const std::string& link_id);
    VoidResult update_node_details(const NodeId& id, const NodeDetailsUpdate& update);

    // --- Descriptive (draft or published) ---
    VoidResult update_name(const std::string& name);
    VoidResult update_description(const std::string& description);
    VoidResult update_metadata(const Value& metadata);
    VoidResult update_permissions(const Permissions& permissions);
    // Draft models only; versions of published models come from create_version
    VoidResult update_version(const std::string& version);
    VoidResult update_action_status(const NodeId& action_id, ActionStatus status);

    // --- Lifecycle ---
    ValidationReport validate_workflow() const;
    VoidResult publish();
    VoidResult archive();
    VoidResult soft_delete(const std::string& deleted_by = "");
    VoidResult restore();
    Result<FunctionModel> create_version(const std::string& new_version) const;

    ModelStatistics calculate_statistics() const;

    // --- Accessors ---
    const ModelId& id() const { return id_; }
    const ModelName& name() const { return name_; }
    const std::string& description() const { return description_; }
    const Version& version() const { return version_; }
    const Version& current_version() const { return current_version_; }
    int version_count() const { return version_count_; }
    ModelStatus status() const { return status_; }
    bool is_deleted() const { return deleted_at_.has_value(); }
    const std::optional<Timestamp>& deleted_at() const { return deleted_at_; }
    const std::optional<std::string>& deleted_by() const { return deleted_by_; }
    const Permissions& permissions() const { return permissions_; }
    const Value& metadata() const { return metadata_; }
    Timestamp created_at() const { return created_at_; }
    Timestamp updated_at() const { return updated_at_; }
    const DomainServices& services() const { return services_; }

    const std::unordered_map<NodeId, ContainerNode>& nodes() const { return nodes_; }
    const std::unordered_map<NodeId, ActionNode>& action_nodes() const { return actions_; }
    const std::vector<NodeLink>& links() const { return links_; }

    const ContainerNode* find_container(const NodeId& id) const;
    const ActionNode* find_action(const NodeId& id) const;
    std::optional<AnyNode> find_node(const NodeId& id) const;
    bool contains(const NodeId& id) const { return nodes_.count(id) > 0 || actions_.count(id) > 0; }

    // Containers and actions in the order they were added
    const std::vector<NodeId>& registration_order() const { return order_; }
    size_t registration_index(const NodeId& id) const;

    // Container nesting depth: 0 for top-level containers, parent + 1 for actions
    int hierarchy_level(const NodeId& id) const;
    std::optional<NodeId> parent_of(const NodeId& id) const;

    std::vector<NodeLink> links_of(const NodeId& id) const;
    std::vector<NodeId> container_dependencies(const NodeId& container) const;

private:
    enum class Mutation { STRUCTURE, DESCRIPTION };

    FunctionModel(ModelId id, ModelName name, DomainServices services);

    VoidResult check_mutable(Mutation kind) const;
    void touch();
    NodeHeader make_header(const std::string& name, Position position) const;
    Result<ActionData> build_action_data(NodeType type, const Value& data) const;
    int next_execution_order(const ContainerNode& parent) const;
    bool reaches(const NodeId& from, const NodeId& to) const;
    bool has_dependency_cycle() const;
    bool nested_within(const NodeId& node, const NodeId& ancestor) const;
    void erase_node(const NodeId& id);
    NodeHeader* mutable_header(const NodeId& id);

    ModelId id_;
    ModelName name_;
    std::string description_;
    Version version_ = Version::initial();
    Version current_version_ = Version::initial();
    int version_count_ = 1;
    ModelStatus status_ = ModelStatus::DRAFT;
    Permissions permissions_;
    Value metadata_ = Value::object();
    Timestamp created_at_;
    Timestamp updated_at_;
    std::optional<Timestamp> deleted_at_;
    std::optional<std::string> deleted_by_;

    std::unordered_map<NodeId, ContainerNode> nodes_;
    std::unordered_map<NodeId, ActionNode> actions_;
    std::vector<NodeLink> links_;
    std::vector<NodeId> order_;

    DomainServices services_;
};

} // namespace funcmodel

#endif // FUNCMODEL_CORE_FUNCTION_MODEL_H
