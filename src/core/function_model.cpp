// core/function_model.cpp
#include "core/function_model.h"
#include <algorithm>
#include <cctype>
#include <queue>
#include <set>
#include <unordered_set>

namespace funcmodel {

namespace {

constexpr double kDefaultActionDurationSec = 60.0;

VoidResult check_node_name(const std::string& name) {
    auto checked = ModelName::create(name);
    if (checked.is_failure()) {
        return validation_error("Invalid node name: " + checked.message());
    }
    return VoidResult::ok();
}

std::string trimmed(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

} // namespace

FunctionModel::FunctionModel(ModelId id, ModelName name, DomainServices services)
    : id_(std::move(id)), name_(std::move(name)), services_(std::move(services)) {
    created_at_ = services_.clock->now();
    updated_at_ = created_at_;
}

Result<FunctionModel> FunctionModel::create(const std::string& name,
                                            const std::string& description,
                                            DomainServices services,
                                            std::optional<ModelId> id) {
    if (!services.clock || !services.ids) {
        return invalid_state_error("FunctionModel requires a clock and an id generator");
    }
    auto model_name = ModelName::create(name);
    if (model_name.is_failure()) return model_name.error();
    if (description.size() > kMaxDescriptionLength) {
        return validation_error("Description cannot exceed " + std::to_string(kMaxDescriptionLength) + " characters");
    }

    ModelId model_id = id ? *id : services.new_model_id();
    FunctionModel model(std::move(model_id), model_name.value(), std::move(services));
    model.description_ = description;
    return Result<FunctionModel>::ok(std::move(model));
}

// --- Guards and helpers ---

VoidResult FunctionModel::check_mutable(Mutation kind) const {
    if (deleted_at_) {
        return conflict_error("Cannot modify deleted model");
    }
    if (status_ == ModelStatus::ARCHIVED) {
        return conflict_error("Cannot modify archived model");
    }
    if (status_ == ModelStatus::PUBLISHED && kind == Mutation::STRUCTURE) {
        return conflict_error("Cannot modify structure of published model");
    }
    return VoidResult::ok();
}

void FunctionModel::touch() {
    updated_at_ = services_.clock->now();
}

NodeHeader FunctionModel::make_header(const std::string& name, Position position) const {
    Timestamp now = services_.clock->now();
    return NodeHeader{
        .id = services_.new_node_id(),
        .model_id = id_,
        .name = trimmed(name),
        .position = position,
        .created_at = now,
        .updated_at = now,
    };
}

NodeHeader* FunctionModel::mutable_header(const NodeId& id) {
    if (auto it = nodes_.find(id); it != nodes_.end()) return &it->second.header;
    if (auto it = actions_.find(id); it != actions_.end()) return &it->second.header;
    return nullptr;
}

const ContainerNode* FunctionModel::find_container(const NodeId& id) const {
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : &it->second;
}

const ActionNode* FunctionModel::find_action(const NodeId& id) const {
    auto it = actions_.find(id);
    return it == actions_.end() ? nullptr : &it->second;
}

std::optional<AnyNode> FunctionModel::find_node(const NodeId& id) const {
    if (const auto* c = find_container(id)) return AnyNode{*c};
    if (const auto* a = find_action(id)) return AnyNode{*a};
    return std::nullopt;
}

size_t FunctionModel::registration_index(const NodeId& id) const {
    auto it = std::find(order_.begin(), order_.end(), id);
    return static_cast<size_t>(it - order_.begin());
}

std::optional<NodeId> FunctionModel::parent_of(const NodeId& id) const {
    if (const auto* c = find_container(id)) return c->parent_node_id;
    if (const auto* a = find_action(id)) return a->parent_node_id;
    return std::nullopt;
}

int FunctionModel::hierarchy_level(const NodeId& id) const {
    if (!contains(id)) return -1;
    int level = 0;
    std::optional<NodeId> current = parent_of(id);
    // nesting can never exceed the number of containers
    while (current && level <= static_cast<int>(nodes_.size())) {
        ++level;
        current = parent_of(*current);
    }
    return level;
}

std::vector<NodeLink> FunctionModel::links_of(const NodeId& id) const {
    std::vector<NodeLink> out;
    for (const auto& link : links_) {
        if (link.touches(id)) out.push_back(link);
    }
    return out;
}

std::vector<NodeId> FunctionModel::container_dependencies(const NodeId& container) const {
    std::vector<NodeId> deps;
    for (const auto& link : links_) {
        if (is_ordering_link(link.type) && link.target == container && nodes_.count(link.source)) {
            deps.push_back(link.source);
        }
    }
    return deps;
}

int FunctionModel::next_execution_order(const ContainerNode& parent) const {
    int highest = 0;
    for (const auto& aid : parent.action_ids) {
        if (const auto* a = find_action(aid)) highest = std::max(highest, a->execution_order);
    }
    return highest + 1;
}

// Is `to` reachable from `from` along container ordering links
bool FunctionModel::reaches(const NodeId& from, const NodeId& to) const {
    std::unordered_set<NodeId> visited;
    std::queue<NodeId> frontier;
    frontier.push(from);
    while (!frontier.empty()) {
        NodeId current = frontier.front();
        frontier.pop();
        if (current == to) return true;
        if (!visited.insert(current).second) continue;
        for (const auto& link : links_) {
            if (is_ordering_link(link.type) && link.source == current && nodes_.count(link.target)) {
                frontier.push(link.target);
            }
        }
    }
    return false;
}

// Is `ancestor` on the parent chain of `node`
bool FunctionModel::nested_within(const NodeId& node, const NodeId& ancestor) const {
    std::optional<NodeId> current = parent_of(node);
    for (size_t hops = 0; current && hops <= nodes_.size(); ++hops) {
        if (*current == ancestor) return true;
        current = parent_of(*current);
    }
    return false;
}

bool FunctionModel::has_dependency_cycle() const {
    std::unordered_map<NodeId, int> in_degree;
    for (const auto& [id, _] : nodes_) in_degree[id] = 0;
    for (const auto& link : links_) {
        if (is_ordering_link(link.type) && in_degree.count(link.source) && in_degree.count(link.target)) {
            in_degree[link.target]++;
        }
    }
    std::queue<NodeId> ready;
    for (const auto& [id, deg] : in_degree) {
        if (deg == 0) ready.push(id);
    }
    size_t visited = 0;
    while (!ready.empty()) {
        NodeId current = ready.front();
        ready.pop();
        ++visited;
        for (const auto& link : links_) {
            if (is_ordering_link(link.type) && link.source == current && in_degree.count(link.target)) {
                if (--in_degree[link.target] == 0) ready.push(link.target);
            }
        }
    }
    return visited != nodes_.size();
}

Result<ActionData> FunctionModel::build_action_data(NodeType type, const Value& data) const {
    if (!data.is_null() && !data.is_object()) {
        return validation_error("Action data must be an object");
    }
    const Value payload = data.is_null() ? Value::object() : data;
    try {
        switch (type) {
            case NodeType::TETHER_NODE:
                return Result<ActionData>::ok(TetherNodeData{
                    .tether_reference_id = payload.value("tetherReferenceId", std::string()),
                    .connection_config = payload.value("connectionConfig", Value::object()),
                });
            case NodeType::KB_NODE: {
                KBNodeData kb;
                kb.kb_reference_id = payload.value("kbReferenceId", std::string());
                if (trimmed(kb.kb_reference_id).empty()) {
                    return validation_error("KB node requires a kbReferenceId");
                }
                kb.short_description = payload.value("shortDescription", std::string());
                kb.search_keywords = payload.value("searchKeywords", std::vector<std::string>{});
                if (payload.contains("documentationContext")) {
                    kb.documentation_context = payload["documentationContext"].get<std::string>();
                }
                return Result<ActionData>::ok(std::move(kb));
            }
            case NodeType::FUNCTION_MODEL_CONTAINER: {
                NestedModelNodeData nested;
                nested.nested_model_id = to_lower(payload.value("nestedModelId", std::string()));
                if (!is_uuid_v4(nested.nested_model_id)) {
                    return validation_error("Nested model container requires a valid nestedModelId");
                }
                nested.context_mapping = payload.value("contextMapping", Value::object());
                nested.orchestration_mode = payload.value("orchestrationMode", std::string("embedded"));
                return Result<ActionData>::ok(std::move(nested));
            }
            default:
                return validation_error("Node type " + std::string(to_string(type)) + " is not an action type");
        }
    } catch (const nlohmann::json::exception& e) {
        return validation_error(std::string("Malformed action data: ") + e.what());
    }
}

// --- Structure ---

Result<AnyNode> FunctionModel::add_node(NodeType type, const std::string& name, double x, double y,
                                        const NodeOptions& options) {
    auto guard = check_mutable(Mutation::STRUCTURE);
    if (guard.is_failure()) return guard.error();

    auto position = Position::create(x, y);
    if (position.is_failure()) return position.error();

    if (is_container_type(type)) {
        return add_container_node(type, name, position.value(), options)
            .map([](const ContainerNode& n) { return AnyNode{n}; });
    }

    if (!options.parent_node_id) {
        return validation_error("Action nodes require a parent node");
    }
    ActionSpec spec{
        .parent_node_id = *options.parent_node_id,
        .type = type,
        .name = name,
        .description = options.description,
        .execution_mode = options.execution_type.value_or(ExecutionMode::SEQUENTIAL),
        .timeout_ms = options.timeout_ms,
        .metadata = options.metadata,
        .action_data = options.action_data,
        .position = position.value(),
    };
    return add_action_node(spec).map([](const ActionNode& n) { return AnyNode{n}; });
}

Result<ContainerNode> FunctionModel::add_container_node(NodeType type, const std::string& name, Position position,
                                                        const NodeOptions& options) {
    auto guard = check_mutable(Mutation::STRUCTURE);
    if (guard.is_failure()) return guard.error();

    if (!is_container_type(type)) {
        return validation_error("Node type " + std::string(to_string(type)) + " is not a container type");
    }
    auto name_ok = check_node_name(name);
    if (name_ok.is_failure()) return name_ok.error();

    if (options.parent_node_id && !find_container(*options.parent_node_id)) {
        return not_found_error("Parent node not found: " + options.parent_node_id->value());
    }
    if (options.timeout_ms && *options.timeout_ms < 0) {
        return validation_error("Timeout cannot be negative");
    }

    ContainerNode node{
        .header = make_header(name, position),
        .parent_node_id = options.parent_node_id,
        .data = type == NodeType::IO_NODE ? ContainerData{options.io_data.value_or(IONodeData{})}
                                          : ContainerData{options.stage_data.value_or(StageNodeData{})},
    };
    node.header.description = options.description;
    node.header.execution_type = options.execution_type.value_or(ExecutionMode::SEQUENTIAL);
    node.header.timeout_ms = options.timeout_ms;
    node.header.metadata = options.metadata;
    node.header.visual_properties = options.visual_properties;

    NodeId id = node.header.id;
    nodes_.emplace(id, node);
    order_.push_back(id);
    touch();
    return Result<ContainerNode>::ok(std::move(node));
}

Result<ActionNode> FunctionModel::add_action_node(const ActionSpec& spec) {
    auto guard = check_mutable(Mutation::STRUCTURE);
    if (guard.is_failure()) return guard.error();

    if (!is_action_type(spec.type)) {
        return validation_error("Node type " + std::string(to_string(spec.type)) + " is not an action type");
    }
    auto name_ok = check_node_name(spec.name);
    if (name_ok.is_failure()) return name_ok.error();

    auto parent_it = nodes_.find(spec.parent_node_id);
    if (parent_it == nodes_.end()) {
        if (actions_.count(spec.parent_node_id)) {
            return validation_error("Action nodes can only be owned by container nodes");
        }
        return not_found_error("Parent node not found: " + spec.parent_node_id.value());
    }
    if (spec.priority < kMinPriority || spec.priority > kMaxPriority) {
        return validation_error("Priority must be between 1 and 10");
    }
    if (spec.execution_order && *spec.execution_order < 1) {
        return validation_error("Execution order must be at least 1");
    }
    double duration = spec.estimated_duration_sec.value_or(kDefaultActionDurationSec);
    if (!(duration > 0)) {
        return validation_error("Estimated duration must be positive");
    }
    if (spec.timeout_ms && *spec.timeout_ms < 0) {
        return validation_error("Timeout cannot be negative");
    }

    auto checks = spec.retry_policy.validate().flat_map([&] { return spec.raci.validate(); });
    if (checks.is_failure()) return checks.error();

    auto data = build_action_data(spec.type, spec.action_data);
    if (data.is_failure()) return data.error();

    ActionNode action{
        .header = make_header(spec.name, spec.position),
        .parent_node_id = spec.parent_node_id,
        .action_type = spec.action_type.empty() ? std::string(to_string(spec.type)) : spec.action_type,
        .execution_order = spec.execution_order.value_or(next_execution_order(parent_it->second)),
        .priority = spec.priority,
        .estimated_duration_sec = duration,
        .retry_policy = spec.retry_policy,
        .raci = spec.raci,
        .guard = spec.guard,
        .data = data.value(),
    };
    action.header.description = spec.description;
    action.header.execution_type = spec.execution_mode;
    action.header.timeout_ms = spec.timeout_ms;
    action.header.metadata = spec.metadata;

    NodeId id = action.header.id;
    actions_.emplace(id, action);
    parent_it->second.action_ids.push_back(id);
    order_.push_back(id);
    touch();
    return Result<ActionNode>::ok(std::move(action));
}

void FunctionModel::erase_node(const NodeId& id) {
    if (auto it = actions_.find(id); it != actions_.end()) {
        if (auto parent = nodes_.find(it->second.parent_node_id); parent != nodes_.end()) {
            auto& ids = parent->second.action_ids;
            ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
        }
        actions_.erase(it);
    } else {
        nodes_.erase(id);
    }
    order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
}

VoidResult FunctionModel::remove_node(const NodeId& id) {
    auto guard = check_mutable(Mutation::STRUCTURE);
    if (guard.is_failure()) return guard;
    if (!contains(id)) {
        return not_found_error("Node not found: " + id.value());
    }

    // Collect the node plus everything it owns: actions and nested containers
    std::vector<NodeId> doomed{id};
    for (size_t i = 0; i < doomed.size(); ++i) {
        const auto* container = find_container(doomed[i]);
        if (!container) continue;
        for (const auto& aid : container->action_ids) doomed.push_back(aid);
        for (const auto& [cid, child] : nodes_) {
            if (child.parent_node_id && *child.parent_node_id == doomed[i]) doomed.push_back(cid);
        }
    }
    std::unordered_set<NodeId> removed(doomed.begin(), doomed.end());

    for (const auto& nid : doomed) erase_node(nid);

    links_.erase(std::remove_if(links_.begin(), links_.end(),
                                [&](const NodeLink& l) { return removed.count(l.source) || removed.count(l.target); }),
                 links_.end());

    auto prune = [&](NodeHeader& h) {
        h.dependencies.erase(std::remove_if(h.dependencies.begin(), h.dependencies.end(),
                                            [&](const NodeId& d) { return removed.count(d) > 0; }),
                             h.dependencies.end());
    };
    for (auto& [_, n] : nodes_) prune(n.header);
    for (auto& [_, a] : actions_) prune(a.header);

    touch();
    return VoidResult::ok();
}

Result<NodeLink> FunctionModel::create_edge(const NodeId& source, const NodeId& target, LinkType type,
                                            double strength, const Value& context, bool bidirectional) {
    auto guard = check_mutable(Mutation::STRUCTURE);
    if (guard.is_failure()) return guard.error();

    if (!contains(source)) return not_found_error("Source node not found: " + source.value());
    if (!contains(target)) return not_found_error("Target node not found: " + target.value());
    if (source == target) {
        return validation_error("Cannot create a link from a node to itself");
    }
    auto link_strength = LinkStrength::create(strength);
    if (link_strength.is_failure()) return link_strength.error();

    for (const auto& link : links_) {
        if (link.type != type) continue;
        if (link.connects(source, target) || (bidirectional && link.connects(target, source))) {
            return validation_error("A " + std::string(to_string(type)) + " link already exists between these nodes");
        }
    }

    bool container_pair = nodes_.count(source) && nodes_.count(target);
    if (is_ordering_link(type) && container_pair) {
        if (bidirectional) {
            return validation_error("Dependency links between containers cannot be bidirectional");
        }
        if (nested_within(source, target) || nested_within(target, source)) {
            return validation_error("Dependency links cannot connect a container to its enclosing container");
        }
        if (reaches(target, source)) {
            return validation_error("Link would create a dependency cycle");
        }
    }

    NodeLink link{
        .id = services_.ids->next_uuid(),
        .source = source,
        .target = target,
        .type = type,
        .strength = link_strength.value(),
        .bidirectional = bidirectional,
        .context = context.is_null() ? Value::object() : context,
        .created_at = services_.clock->now(),
    };

    if (is_ordering_link(type)) {
        NodeHeader* h = mutable_header(target);
        if (std::find(h->dependencies.begin(), h->dependencies.end(), source) == h->dependencies.end()) {
            h->dependencies.push_back(source);
        }
        h->updated_at = link.created_at;
    }

    links_.push_back(link);
    touch();
    return Result<NodeLink>::ok(std::move(link));
}

VoidResult FunctionModel::remove_edge(const std::string& link_id) {
    auto guard = check_mutable(Mutation::STRUCTURE);
    if (guard.is_failure()) return guard;

    auto it = std::find_if(links_.begin(), links_.end(), [&](const NodeLink& l) { return l.id == link_id; });
    if (it == links_.end()) {
        return not_found_error("Link not found: " + link_id);
    }
    if (is_ordering_link(it->type)) {
        if (NodeHeader* h = mutable_header(it->target)) {
            auto& deps = h->dependencies;
            deps.erase(std::remove(deps.begin(), deps.end(), it->source), deps.end());
        }
    }
    links_.erase(it);
    touch();
    return VoidResult::ok();
}

VoidResult FunctionModel::update_node_details(const NodeId& id, const NodeDetailsUpdate& update) {
    auto guard = check_mutable(Mutation::STRUCTURE);
    if (guard.is_failure()) return guard;

    NodeHeader* h = mutable_header(id);
    if (!h) return not_found_error("Node not found: " + id.value());

    if (update.name) {
        auto name_ok = check_node_name(*update.name);
        if (name_ok.is_failure()) return name_ok;
    }
    if (update.metadata && !update.metadata->is_object()) {
        return validation_error("Node metadata must be an object");
    }

    if (update.name) h->name = trimmed(*update.name);
    if (update.description) h->description = *update.description;
    if (update.position) h->position = *update.position;
    if (update.metadata) h->metadata = *update.metadata;
    if (update.execution_type) h->execution_type = *update.execution_type;
    h->updated_at = services_.clock->now();
    touch();
    return VoidResult::ok();
}

// --- Descriptive ---

VoidResult FunctionModel::update_name(const std::string& name) {
    auto guard = check_mutable(Mutation::DESCRIPTION);
    if (guard.is_failure()) return guard;
    auto model_name = ModelName::create(name);
    if (model_name.is_failure()) return model_name.error();
    name_ = model_name.value();
    touch();
    return VoidResult::ok();
}

VoidResult FunctionModel::update_description(const std::string& description) {
    auto guard = check_mutable(Mutation::DESCRIPTION);
    if (guard.is_failure()) return guard;
    if (description.size() > kMaxDescriptionLength) {
        return validation_error("Description cannot exceed " + std::to_string(kMaxDescriptionLength) + " characters");
    }
    description_ = description;
    touch();
    return VoidResult::ok();
}

VoidResult FunctionModel::update_metadata(const Value& metadata) {
    auto guard = check_mutable(Mutation::DESCRIPTION);
    if (guard.is_failure()) return guard;
    if (!metadata.is_object()) {
        return validation_error("Model metadata must be an object");
    }
    metadata_ = metadata;
    touch();
    return VoidResult::ok();
}

VoidResult FunctionModel::update_permissions(const Permissions& permissions) {
    auto guard = check_mutable(Mutation::DESCRIPTION);
    if (guard.is_failure()) return guard;
    if (trimmed(permissions.owner).empty()) {
        return validation_error("Permissions require an owner");
    }
    permissions_ = permissions;
    touch();
    return VoidResult::ok();
}

VoidResult FunctionModel::update_version(const std::string& version) {
    auto guard = check_mutable(Mutation::STRUCTURE);
    if (guard.is_failure()) return guard;
    auto parsed = Version::create(version);
    if (parsed.is_failure()) return parsed.error();
    version_ = parsed.value();
    current_version_ = parsed.value();
    touch();
    return VoidResult::ok();
}

VoidResult FunctionModel::update_action_status(const NodeId& action_id, ActionStatus status) {
    auto guard = check_mutable(Mutation::DESCRIPTION);
    if (guard.is_failure()) return guard;

    auto it = actions_.find(action_id);
    if (it == actions_.end()) {
        return not_found_error("Action node not found: " + action_id.value());
    }
    ActionNode& action = it->second;
    if (action.status == status) return VoidResult::ok();
    if (!can_transition(action.status, status)) {
        return invalid_state_error("Invalid action status transition from " + std::string(to_string(action.status)) +
                                   " to " + std::string(to_string(status)));
    }
    action.status = status;
    action.header.updated_at = services_.clock->now();
    touch();
    return VoidResult::ok();
}

// --- Lifecycle ---

ValidationReport FunctionModel::validate_workflow() const {
    ValidationReport report;

    if (nodes_.empty()) {
        report.errors.push_back("Workflow must contain at least one container node");
    }

    for (const auto& id : order_) {
        const auto* action = find_action(id);
        if (!action) continue;
        if (!find_container(action->parent_node_id)) {
            report.errors.push_back("Action node '" + action->header.name + "' references a missing parent");
        }
        if (const auto* nested = std::get_if<NestedModelNodeData>(&action->data)) {
            if (nested->nested_model_id == id_.value()) {
                report.errors.push_back("Nested model container '" + action->header.name + "' references its own model");
            }
        }
    }

    if (has_dependency_cycle()) {
        report.errors.push_back("Workflow contains a dependency cycle");
    }
    for (const auto& link : links_) {
        if (!is_ordering_link(link.type) || !nodes_.count(link.source) || !nodes_.count(link.target)) continue;
        if (nested_within(link.source, link.target) || nested_within(link.target, link.source)) {
            report.errors.push_back("Dependency link between '" + nodes_.at(link.source).header.name + "' and '" +
                                    nodes_.at(link.target).header.name + "' crosses container nesting");
        }
    }

    bool has_input = false;
    bool has_output = false;
    bool has_stage = false;
    for (const auto& id : order_) {
        const auto* node = find_container(id);
        if (!node) continue;
        if (const auto* io = node->io()) {
            has_input |= io->boundary_type != IOBoundary::OUTPUT;
            has_output |= io->boundary_type != IOBoundary::INPUT;
        } else {
            has_stage = true;
            if (node->action_ids.empty()) {
                report.warnings.push_back("Stage '" + node->header.name + "' has no actions");
            }
        }
        std::set<int> seen;
        for (const auto& aid : node->action_ids) {
            const auto* a = find_action(aid);
            if (a && !seen.insert(a->execution_order).second) {
                report.warnings.push_back("Duplicate execution order " + std::to_string(a->execution_order) +
                                          " in container '" + node->header.name + "'");
            }
        }
    }
    if (!nodes_.empty()) {
        if (!has_input) report.warnings.push_back("Workflow has no input node");
        if (!has_output) report.warnings.push_back("Workflow has no output node");
        if (!has_stage) report.warnings.push_back("Workflow has no stage nodes");
    }

    report.valid = report.errors.empty();
    return report;
}

VoidResult FunctionModel::publish() {
    if (deleted_at_) return conflict_error("Cannot publish deleted model");
    if (status_ == ModelStatus::PUBLISHED) return conflict_error("Model is already published");
    if (status_ == ModelStatus::ARCHIVED) return conflict_error("Cannot publish archived model");

    ValidationReport report = validate_workflow();
    if (!report.valid) {
        return validation_error("Cannot publish invalid workflow: " + join(report.errors, "; "));
    }
    status_ = ModelStatus::PUBLISHED;
    current_version_ = version_;
    touch();
    return VoidResult::ok();
}

VoidResult FunctionModel::archive() {
    if (deleted_at_) return conflict_error("Cannot archive deleted model");
    if (status_ == ModelStatus::ARCHIVED) return conflict_error("Model is already archived");
    status_ = ModelStatus::ARCHIVED;
    touch();
    return VoidResult::ok();
}

VoidResult FunctionModel::soft_delete(const std::string& deleted_by) {
    if (deleted_at_) return conflict_error("Model is already deleted");
    if (status_ == ModelStatus::ARCHIVED) return conflict_error("Cannot soft delete an archived model");
    deleted_at_ = services_.clock->now();
    deleted_by_ = trimmed(deleted_by);
    touch();
    return VoidResult::ok();
}

VoidResult FunctionModel::restore() {
    if (!deleted_at_) return conflict_error("Model is not deleted and cannot be restored");
    deleted_at_.reset();
    deleted_by_.reset();
    touch();
    return VoidResult::ok();
}

Result<FunctionModel> FunctionModel::create_version(const std::string& new_version) const {
    if (deleted_at_) return conflict_error("Cannot version a deleted model");
    if (status_ != ModelStatus::PUBLISHED) {
        return conflict_error("Can only create version from published model");
    }
    auto version = Version::create(new_version);
    if (version.is_failure()) return version.error();
    if (!version.value().is_greater_than(version_)) {
        return validation_error("New version must be greater than current version " + version_.to_string());
    }

    FunctionModel next = *this;
    next.version_ = version.value();
    next.current_version_ = version.value();
    next.status_ = ModelStatus::DRAFT;
    next.version_count_ = version_count_ + 1;
    next.created_at_ = services_.clock->now();
    next.updated_at_ = next.created_at_;
    return Result<FunctionModel>::ok(std::move(next));
}

ModelStatistics FunctionModel::calculate_statistics() const {
    ModelStatistics stats;
    stats.container_count = nodes_.size();
    stats.action_count = actions_.size();
    stats.link_count = links_.size();

    for (const auto& [id, node] : nodes_) {
        stats.nodes_by_type[std::string(to_string(node.type()))]++;
        stats.max_hierarchy_depth = std::max(stats.max_hierarchy_depth, hierarchy_level(id));
    }
    for (const auto& [id, action] : actions_) {
        stats.nodes_by_type[std::string(to_string(action.type()))]++;
        stats.actions_by_status[std::string(to_string(action.status))]++;
        stats.total_estimated_duration_sec += action.estimated_duration_sec;
        stats.max_hierarchy_depth = std::max(stats.max_hierarchy_depth, hierarchy_level(id));
    }
    if (!actions_.empty()) {
        stats.average_estimated_duration_sec = stats.total_estimated_duration_sec / actions_.size();
    }
    return stats;
}

} // namespace funcmodel
