// modules/context/context_access_service.h
#ifndef FUNCMODEL_MODULES_CONTEXT_CONTEXT_ACCESS_SERVICE_H
#define FUNCMODEL_MODULES_CONTEXT_CONTEXT_ACCESS_SERVICE_H

#include "core/function_model.h"
#include "core/services.h"
#include "modules/context/context_types.h"
#include <cstdint>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace funcmodel {

struct ContextAccessConfig {
    int max_context_depth = 10;
    MergeStrategy default_merge_strategy = MergeStrategy::FIRST_WINS;
    bool ancestors_can_write = false;
};

// Owns the context tree of one model. Nodes are referenced by id only.
class ContextAccessService {
public:
    using Config = ContextAccessConfig;

    explicit ContextAccessService(DomainServices services = DomainServices::system_default(), Config config = {});

    VoidResult register_node(const NodeId& node_id, std::optional<NodeType> node_type,
                             const std::optional<NodeId>& parent_node_id, const Context& context_data,
                             int hierarchy_level);
    // Registers every container and action of the model, parents first
    VoidResult register_model(const FunctionModel& model);

    Result<HierarchicalContext> build_context(const NodeId& node_id, const Context& data, ContextScope scope,
                                              const std::optional<std::string>& parent_context_id = std::nullopt,
                                              const std::vector<ContextInheritanceRule>& rules = {});

    Result<HierarchicalContext> get_node_context(const NodeId& node_id) const;
    Result<HierarchicalContext> get_context(const std::string& context_id) const;
    Result<HierarchicalContext> update_node_context(const NodeId& node_id, const Context& data, bool replace = false);
    Result<HierarchicalContext> update_context(const std::string& context_id, const Context& data, bool replace = false);

    Result<ContextHierarchy> get_hierarchical_context(const NodeId& node_id) const;

    VoidResult propagate_context(const std::string& source_context_id, const NodeId& target_node_id,
                                 const std::vector<ContextInheritanceRule>& rules);

    Result<ContextValidationResult> validate_context_access(const NodeId& context_node_id,
                                                            const NodeId& requesting_node_id,
                                                            ContextAccessLevel access_level,
                                                            const std::vector<std::string>& properties = {}) const;

    Result<std::string> clone_context_scope(const std::string& source_context_id, const NodeId& target_node_id,
                                            ContextScope new_scope, const CloneOptions& options = {});
    Result<std::string> merge_context_scopes(const std::vector<std::string>& source_context_ids,
                                             const NodeId& target_node_id, ContextScope target_scope,
                                             const MergeOptions& options = {});

    VoidResult clear_node_context(const NodeId& node_id);

    VoidResult share_context(const NodeId& owner_node_id, const NodeId& sibling_node_id);
    Result<std::vector<HierarchicalContext>> get_accessible_contexts(const NodeId& node_id) const;

    bool is_registered(const NodeId& node_id) const { return nodes_.count(node_id) > 0; }
    const NodeRegistration* registration(const NodeId& node_id) const;
    size_t context_count() const { return contexts_.size(); }

private:
    std::string next_context_id(const NodeId& node_id);
    HierarchicalContext& store(HierarchicalContext ctx);
    const HierarchicalContext* latest_context(const NodeId& node_id) const;
    bool is_ancestor(const NodeId& ancestor, const NodeId& node) const;
    bool isolated_between(const NodeId& ancestor, const NodeId& descendant) const;
    ContextValidationResult evaluate_access(const HierarchicalContext& ctx, const NodeId& requesting,
                                            ContextAccessLevel requested,
                                            const std::vector<std::string>& properties) const;

    DomainServices services_;
    Config config_;
    std::unordered_map<NodeId, NodeRegistration> nodes_;
    std::unordered_map<std::string, HierarchicalContext> contexts_;
    std::vector<std::string> context_order_;
    std::unordered_map<NodeId, std::vector<std::string>> node_contexts_;
    std::unordered_map<NodeId, std::unordered_set<NodeId>> shares_; // owner -> siblings granted read
    uint64_t counter_ = 0;
};

} // namespace funcmodel

#endif // FUNCMODEL_MODULES_CONTEXT_CONTEXT_ACCESS_SERVICE_H
