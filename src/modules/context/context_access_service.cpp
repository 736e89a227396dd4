// modules/context/context_access_service.cpp
#include "modules/context/context_access_service.h"
#include "modules/context/context_merge.h"
#include <algorithm>
#include <iostream>

namespace funcmodel {

namespace {

ContextAccessLevel level_for_scope(ContextScope scope) {
    return scope == ContextScope::ISOLATED ? ContextAccessLevel::READ : ContextAccessLevel::READ_WRITE;
}

// Treats NONE as a plain read request
bool covers(ContextAccessLevel allowed, ContextAccessLevel requested) {
    bool need_read = requested != ContextAccessLevel::WRITE;
    bool need_write = allows_write(requested);
    return (!need_read || allows_read(allowed)) && (!need_write || allows_write(allowed));
}

ContextAccessLevel intersect(ContextAccessLevel a, ContextAccessLevel b) {
    bool read = allows_read(a) && allows_read(b);
    bool write = allows_write(a) && allows_write(b);
    if (read && write) return ContextAccessLevel::READ_WRITE;
    if (read) return ContextAccessLevel::READ;
    if (write) return ContextAccessLevel::WRITE;
    return ContextAccessLevel::NONE;
}

VoidResult require_object(const Context& data) {
    if (!data.is_null() && !data.is_object()) {
        return validation_error("Context data must be an object");
    }
    return VoidResult::ok();
}

} // namespace

ContextAccessService::ContextAccessService(DomainServices services, Config config)
    : services_(std::move(services)), config_(config) {}

const NodeRegistration* ContextAccessService::registration(const NodeId& node_id) const {
    auto it = nodes_.find(node_id);
    return it == nodes_.end() ? nullptr : &it->second;
}

std::string ContextAccessService::next_context_id(const NodeId& node_id) {
    const std::string& raw = node_id.value();
    std::string suffix = raw.size() > 8 ? raw.substr(raw.size() - 8) : raw;
    return "ctx-" + std::to_string(++counter_) + "-" + suffix;
}

HierarchicalContext& ContextAccessService::store(HierarchicalContext ctx) {
    std::string id = ctx.context_id;
    node_contexts_[ctx.node_id].push_back(id);
    context_order_.push_back(id);
    return contexts_.insert_or_assign(id, std::move(ctx)).first->second;
}

const HierarchicalContext* ContextAccessService::latest_context(const NodeId& node_id) const {
    auto it = node_contexts_.find(node_id);
    if (it == node_contexts_.end() || it->second.empty()) return nullptr;
    return &contexts_.at(it->second.back());
}

bool ContextAccessService::is_ancestor(const NodeId& ancestor, const NodeId& node) const {
    const NodeRegistration* current = registration(node);
    size_t guard = 0;
    while (current && current->parent_node_id && guard++ <= nodes_.size()) {
        if (*current->parent_node_id == ancestor) return true;
        current = registration(*current->parent_node_id);
    }
    return false;
}

// Any isolated context on the path ancestor -> descendant, ancestor included, descendant excluded
bool ContextAccessService::isolated_between(const NodeId& ancestor, const NodeId& descendant) const {
    const NodeRegistration* current = registration(descendant);
    size_t guard = 0;
    while (current && current->parent_node_id && guard++ <= nodes_.size()) {
        const NodeId& parent = *current->parent_node_id;
        if (const auto* ctx = latest_context(parent); ctx && ctx->scope == ContextScope::ISOLATED) return true;
        if (parent == ancestor) return false;
        current = registration(parent);
    }
    return false;
}

// --- Registration ---

VoidResult ContextAccessService::register_node(const NodeId& node_id, std::optional<NodeType> node_type,
                                               const std::optional<NodeId>& parent_node_id,
                                               const Context& context_data, int hierarchy_level) {
    auto data_ok = require_object(context_data);
    if (data_ok.is_failure()) return data_ok;
    if (hierarchy_level < 0) {
        return validation_error("Hierarchy level cannot be negative");
    }
    if (parent_node_id) {
        if (*parent_node_id == node_id) {
            return validation_error("A node cannot be its own parent");
        }
        const NodeRegistration* parent = registration(*parent_node_id);
        if (!parent) {
            return not_found_error("Parent node not registered: " + parent_node_id->value());
        }
        if (hierarchy_level <= parent->hierarchy_level) {
            return validation_error("Hierarchy level must be greater than the parent's level");
        }
        if (is_ancestor(node_id, *parent_node_id)) {
            return validation_error("Registration would create a circular hierarchy");
        }
    }

    if (auto existing = nodes_.find(node_id); existing != nodes_.end()) {
        for (const auto& child : existing->second.children) {
            const NodeRegistration* child_reg = registration(child);
            if (child_reg && hierarchy_level >= child_reg->hierarchy_level) {
                return validation_error("Hierarchy level must be lower than the level of child " + child.value());
            }
        }
    }

    // re-registration moves the node under its new parent
    if (auto existing = nodes_.find(node_id); existing != nodes_.end() && existing->second.parent_node_id) {
        auto& siblings = nodes_.at(*existing->second.parent_node_id).children;
        siblings.erase(std::remove(siblings.begin(), siblings.end(), node_id), siblings.end());
    }

    NodeRegistration reg{
        .node_id = node_id,
        .node_type = node_type,
        .parent_node_id = parent_node_id,
        .context_data = context_data.is_null() ? Context::object() : context_data,
        .hierarchy_level = hierarchy_level,
    };
    if (auto existing = nodes_.find(node_id); existing != nodes_.end()) {
        reg.children = existing->second.children;
    }
    nodes_.insert_or_assign(node_id, std::move(reg));
    if (parent_node_id) nodes_.at(*parent_node_id).children.push_back(node_id);
    return VoidResult::ok();
}

VoidResult ContextAccessService::register_model(const FunctionModel& model) {
    std::vector<NodeId> containers;
    for (const auto& id : model.registration_order()) {
        if (model.find_container(id)) containers.push_back(id);
    }
    std::stable_sort(containers.begin(), containers.end(), [&](const NodeId& a, const NodeId& b) {
        return model.hierarchy_level(a) < model.hierarchy_level(b);
    });

    for (const auto& id : containers) {
        const ContainerNode& node = *model.find_container(id);
        auto res = register_node(id, node.type(), node.parent_node_id, node.header.metadata, model.hierarchy_level(id));
        if (res.is_failure()) return res;
    }
    for (const auto& id : model.registration_order()) {
        const ActionNode* action = model.find_action(id);
        if (!action) continue;
        auto res = register_node(id, action->type(), action->parent_node_id, action->header.metadata,
                                 model.hierarchy_level(id));
        if (res.is_failure()) return res;
    }
    return VoidResult::ok();
}

// --- Lifecycle ---

Result<HierarchicalContext> ContextAccessService::build_context(const NodeId& node_id, const Context& data,
                                                                ContextScope scope,
                                                                const std::optional<std::string>& parent_context_id,
                                                                const std::vector<ContextInheritanceRule>& rules) {
    auto data_ok = require_object(data);
    if (data_ok.is_failure()) return data_ok.error();

    const HierarchicalContext* parent = nullptr;
    if (parent_context_id) {
        auto it = contexts_.find(*parent_context_id);
        if (it == contexts_.end()) {
            return not_found_error("Parent context not found: " + *parent_context_id);
        }
        parent = &it->second;
    }

    if (!is_registered(node_id)) {
        std::optional<NodeId> parent_node;
        int level = 0;
        if (parent) {
            parent_node = parent->node_id;
            level = nodes_.at(parent->node_id).hierarchy_level + 1;
        }
        auto reg = register_node(node_id, std::nullopt, parent_node, Context::object(), level);
        if (reg.is_failure()) return reg.error();
    } else if (parent && parent->node_id != node_id && !is_ancestor(parent->node_id, node_id)) {
        return validation_error("Parent context " + parent->context_id + " does not belong to an ancestor of the node");
    }

    Timestamp now = services_.clock->now();
    HierarchicalContext ctx{
        .context_id = next_context_id(node_id),
        .node_id = node_id,
        .scope = scope,
        .data = data.is_null() ? Context::object() : data,
        .access_level = level_for_scope(scope),
        .parent_context_id = parent_context_id,
        .created_at = now,
        .updated_at = now,
    };

    // isolated parents pass nothing down
    if (parent && parent->scope != ContextScope::ISOLATED) {
        Context base = parent->effective_data();
        for (auto it = base.begin(); it != base.end(); ++it) {
            auto rule = std::find_if(rules.begin(), rules.end(),
                                     [&](const ContextInheritanceRule& r) { return r.property == it.key(); });
            if (rule != rules.end() && !rule->inherit) continue;
            ctx.inherited_data[it.key()] = it.value();
            bool locked = (rule != rules.end() && !rule->override_allowed) ||
                          (rule == rules.end() && parent->is_locked(it.key()));
            if (locked) ctx.locked_properties.push_back(it.key());
        }
    }

    for (auto it = ctx.data.begin(); it != ctx.data.end(); ++it) {
        if (ctx.is_locked(it.key())) {
            return access_denied_error("Property '" + it.key() + "' is inherited with override disabled");
        }
    }

    return Result<HierarchicalContext>::ok(store(std::move(ctx)));
}

Result<HierarchicalContext> ContextAccessService::get_node_context(const NodeId& node_id) const {
    if (!is_registered(node_id)) {
        return not_found_error("Node not registered: " + node_id.value());
    }
    const HierarchicalContext* ctx = latest_context(node_id);
    if (!ctx) {
        return not_found_error("No context found for node: " + node_id.value());
    }
    return Result<HierarchicalContext>::ok(*ctx);
}

Result<HierarchicalContext> ContextAccessService::get_context(const std::string& context_id) const {
    auto it = contexts_.find(context_id);
    if (it == contexts_.end()) {
        return not_found_error("Context not found: " + context_id);
    }
    return Result<HierarchicalContext>::ok(it->second);
}

Result<HierarchicalContext> ContextAccessService::update_context(const std::string& context_id, const Context& data,
                                                                 bool replace) {
    auto it = contexts_.find(context_id);
    if (it == contexts_.end()) {
        return not_found_error("Context not found: " + context_id);
    }
    auto data_ok = require_object(data);
    if (data_ok.is_failure()) return data_ok.error();

    HierarchicalContext& ctx = it->second;
    if (!data.is_null()) {
        for (auto field = data.begin(); field != data.end(); ++field) {
            if (ctx.is_locked(field.key())) {
                return access_denied_error("Property '" + field.key() + "' is inherited with override disabled");
            }
        }
    }

    if (replace) {
        ctx.data = data.is_null() ? Context::object() : data;
    } else {
        auto merged = merge_context(ctx.data, data, MergeStrategy::LAST_WINS);
        if (merged.is_failure()) return merged.error();
    }
    ctx.updated_at = services_.clock->now();
    return Result<HierarchicalContext>::ok(ctx);
}

Result<HierarchicalContext> ContextAccessService::update_node_context(const NodeId& node_id, const Context& data,
                                                                      bool replace) {
    auto current = get_node_context(node_id);
    if (current.is_failure()) return current.error();
    return update_context(current.value().context_id, data, replace);
}

Result<ContextHierarchy> ContextAccessService::get_hierarchical_context(const NodeId& node_id) const {
    const NodeRegistration* reg = registration(node_id);
    if (!reg) {
        return not_found_error("Node not registered: " + node_id.value());
    }

    ContextHierarchy hierarchy{.node_id = node_id, .child_node_ids = reg->children};
    const NodeRegistration* current = reg;
    int level = 0;
    while (current) {
        HierarchyLevel entry{.level = level, .node_id = current->node_id};
        if (const auto* ctx = latest_context(current->node_id)) {
            entry.context_id = ctx->context_id;
            entry.scope = ctx->scope;
            entry.data = ctx->effective_data();
        }
        hierarchy.levels.push_back(std::move(entry));

        if (!current->parent_node_id) break;
        if (level + 1 >= config_.max_context_depth) {
            hierarchy.max_depth_reached = true;
            std::cerr << "[WARNING] Context hierarchy of " << node_id.value() << " truncated at depth "
                      << config_.max_context_depth << std::endl;
            break;
        }
        current = registration(*current->parent_node_id);
        ++level;
    }
    hierarchy.total_levels = static_cast<int>(hierarchy.levels.size());

    // root first so nearer levels win
    for (auto it = hierarchy.levels.rbegin(); it != hierarchy.levels.rend(); ++it) {
        bool hidden = it->level > 0 && it->scope == ContextScope::ISOLATED;
        if (hidden) continue;
        auto merged = merge_context(hierarchy.merged_data, it->data, MergeStrategy::LAST_WINS);
        if (merged.is_failure()) return merged.error();
    }
    return Result<ContextHierarchy>::ok(std::move(hierarchy));
}

// --- Data flow ---

VoidResult ContextAccessService::propagate_context(const std::string& source_context_id,
                                                   const NodeId& target_node_id,
                                                   const std::vector<ContextInheritanceRule>& rules) {
    auto source_it = contexts_.find(source_context_id);
    if (source_it == contexts_.end()) {
        return not_found_error("Context not found: " + source_context_id);
    }
    if (!is_registered(target_node_id)) {
        return not_found_error("Node not registered: " + target_node_id.value());
    }
    const HierarchicalContext& source = source_it->second;
    if (source.node_id == target_node_id) {
        return validation_error("Cannot propagate a context to its own node");
    }
    if (source.scope == ContextScope::ISOLATED) {
        return access_denied_error("Isolated context " + source_context_id + " cannot be propagated");
    }

    Context source_data = source.effective_data();
    std::string target_id;
    if (const auto* existing = latest_context(target_node_id)) {
        target_id = existing->context_id;
    } else {
        auto created = build_context(target_node_id, Context::object(), ContextScope::EXECUTION);
        if (created.is_failure()) return created.error();
        target_id = created.value().context_id;
    }
    HierarchicalContext& target = contexts_.at(target_id);

    for (const auto& rule : rules) {
        if (!rule.inherit || !source_data.contains(rule.property)) continue;
        bool present = target.data.contains(rule.property) || target.inherited_data.contains(rule.property);
        if (target.is_locked(rule.property)) continue;
        if (present && !rule.override_allowed) continue;
        target.data[rule.property] = source_data[rule.property];
    }
    target.updated_at = services_.clock->now();
    return VoidResult::ok();
}

Result<std::string> ContextAccessService::clone_context_scope(const std::string& source_context_id,
                                                              const NodeId& target_node_id, ContextScope new_scope,
                                                              const CloneOptions& options) {
    auto source_it = contexts_.find(source_context_id);
    if (source_it == contexts_.end()) {
        return not_found_error("Context not found: " + source_context_id);
    }
    if (!is_registered(target_node_id)) {
        return not_found_error("Node not registered: " + target_node_id.value());
    }

    Context data = source_it->second.effective_data(); // deep copy
    for (const auto& key : options.exclude_properties) data.erase(key);
    for (const auto& [key, replacement] : options.transform) {
        if (data.contains(key)) data[key] = replacement;
    }

    Timestamp now = services_.clock->now();
    HierarchicalContext clone{
        .context_id = next_context_id(target_node_id),
        .node_id = target_node_id,
        .scope = new_scope,
        .data = std::move(data),
        .access_level = level_for_scope(new_scope),
        .created_at = now,
        .updated_at = now,
    };
    return Result<std::string>::ok(store(std::move(clone)).context_id);
}

Result<std::string> ContextAccessService::merge_context_scopes(const std::vector<std::string>& source_context_ids,
                                                               const NodeId& target_node_id,
                                                               ContextScope target_scope,
                                                               const MergeOptions& options) {
    if (source_context_ids.empty()) {
        return validation_error("At least one source context is required");
    }
    if (!is_registered(target_node_id)) {
        return not_found_error("Node not registered: " + target_node_id.value());
    }

    MergeStrategy strategy = options.strategy.value_or(config_.default_merge_strategy);
    Context merged = Context::object();
    for (const auto& id : source_context_ids) {
        auto it = contexts_.find(id);
        if (it == contexts_.end()) {
            return not_found_error("Context not found: " + id);
        }
        auto res = merge_context(merged, it->second.effective_data(), strategy);
        if (res.is_failure()) return res.error();
    }
    if (options.preserve_source_metadata) {
        merged["_sources"] = source_context_ids;
    }

    Timestamp now = services_.clock->now();
    HierarchicalContext ctx{
        .context_id = next_context_id(target_node_id),
        .node_id = target_node_id,
        .scope = target_scope,
        .data = std::move(merged),
        .access_level = level_for_scope(target_scope),
        .created_at = now,
        .updated_at = now,
    };
    return Result<std::string>::ok(store(std::move(ctx)).context_id);
}

VoidResult ContextAccessService::clear_node_context(const NodeId& node_id) {
    if (!is_registered(node_id)) {
        return not_found_error("Node not registered: " + node_id.value());
    }
    auto owned = node_contexts_.find(node_id);
    if (owned == node_contexts_.end() || owned->second.empty()) return VoidResult::ok();

    std::unordered_set<std::string> doomed(owned->second.begin(), owned->second.end());
    // descendant contexts: anything whose parent chain reaches a doomed context
    bool grew = true;
    while (grew) {
        grew = false;
        for (const auto& [id, ctx] : contexts_) {
            if (!doomed.count(id) && ctx.parent_context_id && doomed.count(*ctx.parent_context_id)) {
                doomed.insert(id);
                grew = true;
            }
        }
    }

    for (const auto& id : doomed) {
        auto& list = node_contexts_[contexts_.at(id).node_id];
        list.erase(std::remove(list.begin(), list.end(), id), list.end());
        contexts_.erase(id);
    }
    context_order_.erase(std::remove_if(context_order_.begin(), context_order_.end(),
                                        [&](const std::string& id) { return doomed.count(id) > 0; }),
                         context_order_.end());
    return VoidResult::ok();
}

// --- Access ---

ContextValidationResult ContextAccessService::evaluate_access(const HierarchicalContext& ctx,
                                                              const NodeId& requesting,
                                                              ContextAccessLevel requested,
                                                              const std::vector<std::string>& properties) const {
    ContextValidationResult result;
    ContextAccessLevel allowed = ContextAccessLevel::NONE;
    std::string denial;

    const NodeRegistration* owner = registration(ctx.node_id);
    const NodeRegistration* requester = registration(requesting);
    bool siblings = owner && requester && owner->parent_node_id && requester->parent_node_id &&
                    *owner->parent_node_id == *requester->parent_node_id;

    if (requesting == ctx.node_id) {
        result.relationship = "self";
        allowed = ContextAccessLevel::READ_WRITE;
    } else if (ctx.scope == ContextScope::GLOBAL) {
        result.relationship = "global";
        allowed = ContextAccessLevel::READ_WRITE;
    } else if (is_ancestor(requesting, ctx.node_id)) {
        result.relationship = "ancestor";
        allowed = config_.ancestors_can_write ? ContextAccessLevel::READ_WRITE : ContextAccessLevel::READ;
        denial = "Ancestors have read-only access";
    } else if (is_ancestor(ctx.node_id, requesting)) {
        result.relationship = "descendant";
        if (ctx.scope == ContextScope::ISOLATED || isolated_between(ctx.node_id, requesting)) {
            denial = "Context is isolated from descendants";
        } else {
            allowed = ContextAccessLevel::READ;
            denial = "Descendants have read-only access";
        }
    } else if (siblings) {
        result.relationship = "sibling";
        auto shared = shares_.find(ctx.node_id);
        bool explicitly_shared = shared != shares_.end() && shared->second.count(requesting) > 0;
        if (ctx.scope == ContextScope::SHARED) {
            allowed = ContextAccessLevel::READ_WRITE;
        } else if (explicitly_shared) {
            allowed = ContextAccessLevel::READ;
            denial = "Write access across siblings requires a shared or global scope";
        } else {
            denial = "Sibling context is not shared";
        }
    } else {
        result.relationship = "unrelated";
        denial = "No hierarchical relationship between nodes";
    }

    // an isolated context is read-only for everyone but its owner
    if (result.relationship != "self") allowed = intersect(allowed, ctx.access_level);

    Context visible = ctx.effective_data();
    std::vector<std::string> wanted = properties;
    if (wanted.empty()) {
        for (auto it = visible.begin(); it != visible.end(); ++it) wanted.push_back(it.key());
    }

    if (allowed != ContextAccessLevel::NONE && covers(allowed, requested)) {
        result.granted = true;
        result.granted_level = allowed;
        for (const auto& p : wanted) {
            bool write_blocked = allows_write(requested) && ctx.is_locked(p);
            (write_blocked ? result.restricted_properties : result.accessible_properties).push_back(p);
        }
    } else {
        result.granted = false;
        result.granted_level = allowed;
        result.restricted_properties = wanted;
        result.denial_reason = denial.empty() ? "Requested access level exceeds what is allowed" : denial;
    }
    return result;
}

Result<ContextValidationResult> ContextAccessService::validate_context_access(
    const NodeId& context_node_id, const NodeId& requesting_node_id, ContextAccessLevel access_level,
    const std::vector<std::string>& properties) const {
    if (!is_registered(context_node_id)) {
        return not_found_error("Node not registered: " + context_node_id.value());
    }
    if (!is_registered(requesting_node_id)) {
        return not_found_error("Node not registered: " + requesting_node_id.value());
    }
    const HierarchicalContext* ctx = latest_context(context_node_id);
    if (!ctx) {
        return not_found_error("No context found for node: " + context_node_id.value());
    }
    return Result<ContextValidationResult>::ok(evaluate_access(*ctx, requesting_node_id, access_level, properties));
}

VoidResult ContextAccessService::share_context(const NodeId& owner_node_id, const NodeId& sibling_node_id) {
    const NodeRegistration* owner = registration(owner_node_id);
    if (!owner) return not_found_error("Node not registered: " + owner_node_id.value());
    const NodeRegistration* sibling = registration(sibling_node_id);
    if (!sibling) return not_found_error("Node not registered: " + sibling_node_id.value());

    if (owner_node_id == sibling_node_id || !owner->parent_node_id || !sibling->parent_node_id ||
        *owner->parent_node_id != *sibling->parent_node_id) {
        return validation_error("Contexts can only be shared between sibling nodes");
    }
    shares_[owner_node_id].insert(sibling_node_id);
    return VoidResult::ok();
}

Result<std::vector<HierarchicalContext>> ContextAccessService::get_accessible_contexts(const NodeId& node_id) const {
    if (!is_registered(node_id)) {
        return not_found_error("Node not registered: " + node_id.value());
    }
    std::vector<HierarchicalContext> out;
    for (const auto& id : context_order_) {
        const HierarchicalContext& ctx = contexts_.at(id);
        if (evaluate_access(ctx, node_id, ContextAccessLevel::READ, {}).granted) out.push_back(ctx);
    }
    return Result<std::vector<HierarchicalContext>>::ok(std::move(out));
}

} // namespace funcmodel
