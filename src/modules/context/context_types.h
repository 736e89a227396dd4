// modules/context/context_types.h
#ifndef FUNCMODEL_MODULES_CONTEXT_CONTEXT_TYPES_H
#define FUNCMODEL_MODULES_CONTEXT_CONTEXT_TYPES_H

#include "core/types/context.h"
#include "core/types/node.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace funcmodel {

struct ContextInheritanceRule {
    std::string property;
    bool inherit = true;
    bool override_allowed = true; // false: descendants may not shadow the property
};

struct HierarchicalContext {
    std::string context_id;
    NodeId node_id;
    ContextScope scope = ContextScope::EXECUTION;
    Context data = Context::object();            // own properties
    ContextAccessLevel access_level = ContextAccessLevel::READ_WRITE;
    std::optional<std::string> parent_context_id;
    Context inherited_data = Context::object();  // copied from the parent at build time
    std::vector<std::string> locked_properties;  // inherited with override disabled
    Timestamp created_at;
    Timestamp updated_at;

    // Inherited properties overlaid by own ones
    Context effective_data() const {
        Context merged = inherited_data.is_object() ? inherited_data : Context::object();
        for (auto it = data.begin(); it != data.end(); ++it) merged[it.key()] = it.value();
        return merged;
    }
    bool is_locked(const std::string& property) const {
        for (const auto& p : locked_properties) {
            if (p == property) return true;
        }
        return false;
    }
};

struct NodeRegistration {
    NodeId node_id;
    std::optional<NodeType> node_type;  // unset when registered implicitly by build_context
    std::optional<NodeId> parent_node_id;
    Context context_data = Context::object();
    int hierarchy_level = 0;
    std::vector<NodeId> children;
};

struct HierarchyLevel {
    int level = 0;                       // 0 is the requested node, 1 its parent, ...
    NodeId node_id;
    std::optional<std::string> context_id;
    std::optional<ContextScope> scope;
    Context data = Context::object();    // effective data of the node's latest context
};

struct ContextHierarchy {
    NodeId node_id;
    std::vector<HierarchyLevel> levels;  // self -> parent -> ... -> root
    int total_levels = 0;
    bool max_depth_reached = false;
    std::vector<NodeId> child_node_ids;
    Context merged_data = Context::object(); // root first, nearer levels override, isolated ancestors excluded
};

struct ContextValidationResult {
    bool granted = false;
    ContextAccessLevel granted_level = ContextAccessLevel::NONE;
    std::string relationship;            // self, global, ancestor, descendant, sibling, unrelated
    std::vector<std::string> accessible_properties;
    std::vector<std::string> restricted_properties;
    std::optional<std::string> denial_reason;
};

struct CloneOptions {
    std::vector<std::string> exclude_properties;
    std::map<std::string, Value> transform; // property -> replacement value
};

struct MergeOptions {
    std::optional<MergeStrategy> strategy; // service default when unset
    bool preserve_source_metadata = false; // records the source ids under "_sources"
};

} // namespace funcmodel

#endif // FUNCMODEL_MODULES_CONTEXT_CONTEXT_TYPES_H
