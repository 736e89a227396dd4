// core/serialization.cpp
#include "core/serialization.h"
#include <chrono>

namespace funcmodel {

namespace {

template <typename E>
std::string lit(E e) {
    return std::string(to_string(e));
}

template <typename T>
json optional_json(const std::optional<T>& v) {
    return v ? json(*v) : json(nullptr);
}

json header_json(const NodeHeader& h) {
    return json{
        {"id", h.id.value()},
        {"modelId", h.model_id.value()},
        {"name", h.name},
        {"description", h.description},
        {"position", h.position},
        {"dependencies", h.dependencies},
        {"executionType", lit(h.execution_type)},
        {"timeout", optional_json(h.timeout_ms)},
        {"metadata", h.metadata},
        {"visualProperties", h.visual_properties},
        {"createdAt", to_epoch_ms(h.created_at)},
        {"updatedAt", to_epoch_ms(h.updated_at)},
    };
}

} // namespace

int64_t to_epoch_ms(Timestamp t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

void to_json(json& j, const Error& e) {
    j = json{{"kind", lit(e.kind)}, {"message", e.message}};
}

void to_json(json& j, const ModelName& n) { j = n.value(); }

void to_json(json& j, const Version& v) { j = v.to_string(); }

void to_json(json& j, const Position& p) { j = json{{"x", p.x()}, {"y", p.y()}}; }

void to_json(json& j, const LinkStrength& s) { j = s.value(); }

void to_json(json& j, const RetryPolicy& p) {
    j = json{
        {"maxRetries", p.max_retries},
        {"backoffStrategy", lit(p.backoff)},
        {"initialDelayMs", p.initial_delay_ms},
        {"maxDelayMs", p.max_delay_ms},
        {"escalation", lit(p.escalation)},
    };
}

void to_json(json& j, const RaciAssignment& r) {
    j = json{
        {"responsible", r.responsible},
        {"accountable", r.accountable},
        {"consulted", r.consulted},
        {"informed", r.informed},
    };
}

void to_json(json& j, const IONodeData& d) {
    j = json{
        {"boundaryType", lit(d.boundary_type)},
        {"dataType", d.data_type},
        {"schema", d.schema},
        {"isRequired", d.is_required},
        {"validationRules", d.validation_rules},
        {"defaultValue", d.default_value},
    };
}

void to_json(json& j, const StageNodeData& d) {
    j = json{
        {"stageType", d.stage_type},
        {"completionCriteria", d.completion_criteria},
        {"stageGoals", d.stage_goals},
        {"resourceRequirements", d.resource_requirements},
        {"parallelExecution", d.parallel_execution},
        {"configuration", d.configuration},
    };
}

void to_json(json& j, const TetherNodeData& d) {
    j = json{{"tetherReferenceId", d.tether_reference_id}, {"connectionConfig", d.connection_config}};
}

void to_json(json& j, const KBNodeData& d) {
    j = json{
        {"kbReferenceId", d.kb_reference_id},
        {"shortDescription", d.short_description},
        {"searchKeywords", d.search_keywords},
        {"documentationContext", optional_json(d.documentation_context)},
    };
}

void to_json(json& j, const NestedModelNodeData& d) {
    j = json{
        {"nestedModelId", d.nested_model_id},
        {"contextMapping", d.context_mapping},
        {"orchestrationMode", d.orchestration_mode},
    };
}

void to_json(json& j, const ContainerNode& n) {
    j = header_json(n.header);
    j["type"] = lit(n.type());
    j["status"] = lit(n.status);
    j["parentNodeId"] = optional_json(n.parent_node_id);
    j["actionIds"] = n.action_ids;
    std::visit([&](const auto& data) { j["data"] = data; }, n.data);
}

void to_json(json& j, const ActionNode& n) {
    j = header_json(n.header);
    j["type"] = lit(n.type());
    j["parentNodeId"] = n.parent_node_id;
    j["actionType"] = n.action_type;
    j["actionStatus"] = lit(n.status);
    j["status"] = lit(n.node_status());
    j["executionOrder"] = n.execution_order;
    j["priority"] = n.priority;
    j["estimatedDuration"] = n.estimated_duration_sec;
    j["retryPolicy"] = n.retry_policy;
    j["raci"] = n.raci;
    j["guard"] = optional_json(n.guard);
    std::visit([&](const auto& data) { j["data"] = data; }, n.data);
}

void to_json(json& j, const AnyNode& n) {
    std::visit([&](const auto& node) { j = node; }, n);
}

void to_json(json& j, const NodeLink& l) {
    j = json{
        {"id", l.id},
        {"sourceNodeId", l.source},
        {"targetNodeId", l.target},
        {"linkType", lit(l.type)},
        {"linkStrength", l.strength},
        {"bidirectional", l.bidirectional},
        {"linkContext", l.context},
        {"metadata", l.metadata},
        {"createdAt", to_epoch_ms(l.created_at)},
    };
}

void to_json(json& j, const Permissions& p) {
    j = json{{"owner", p.owner}, {"editors", p.editors}, {"viewers", p.viewers}};
}

void to_json(json& j, const ValidationReport& r) {
    j = json{{"isValid", r.valid}, {"errors", r.errors}, {"warnings", r.warnings}};
}

void to_json(json& j, const ModelStatistics& s) {
    j = json{
        {"containerCount", s.container_count},
        {"actionCount", s.action_count},
        {"linkCount", s.link_count},
        {"nodesByType", s.nodes_by_type},
        {"actionsByStatus", s.actions_by_status},
        {"totalEstimatedDuration", s.total_estimated_duration_sec},
        {"averageEstimatedDuration", s.average_estimated_duration_sec},
        {"maxHierarchyDepth", s.max_hierarchy_depth},
    };
}

void to_json(json& j, const FunctionModel& m) {
    j = json{
        {"modelId", m.id()},
        {"name", m.name()},
        {"description", m.description()},
        {"version", m.version()},
        {"currentVersion", m.current_version()},
        {"versionCount", m.version_count()},
        {"status", lit(m.status())},
        {"permissions", m.permissions()},
        {"metadata", m.metadata()},
        {"createdAt", to_epoch_ms(m.created_at())},
        {"updatedAt", to_epoch_ms(m.updated_at())},
        {"deletedAt", m.deleted_at() ? json(to_epoch_ms(*m.deleted_at())) : json(nullptr)},
        {"deletedBy", optional_json(m.deleted_by())},
    };

    // registration order keeps the output stable
    json nodes = json::array();
    json actions = json::array();
    for (const auto& id : m.registration_order()) {
        if (const auto* c = m.find_container(id)) nodes.push_back(*c);
        if (const auto* a = m.find_action(id)) actions.push_back(*a);
    }
    j["nodes"] = std::move(nodes);
    j["actionNodes"] = std::move(actions);
    j["nodeLinks"] = m.links();
}

void to_json(json& j, const PlanEntry& e) {
    j = json{
        {"nodeId", e.node_id},
        {"nodeType", lit(e.node_type)},
        {"parentId", optional_json(e.parent_id)},
        {"dependsOn", e.depends_on},
        {"mode", lit(e.mode)},
        {"status", lit(e.status)},
        {"attempt", e.attempt},
        {"maxRetries", e.max_retries},
        {"escalation", lit(e.escalation)},
        {"executionOrder", e.execution_order},
        {"priority", e.priority},
        {"estimatedDuration", e.estimated_duration_sec},
        {"timeout", optional_json(e.timeout_ms)},
        {"skipReason", optional_json(e.skip_reason)},
        {"startedAt", e.started_at ? json(to_epoch_ms(*e.started_at)) : json(nullptr)},
        {"finishedAt", e.finished_at ? json(to_epoch_ms(*e.finished_at)) : json(nullptr)},
    };
}

void to_json(json& j, const StatusTransition& t) {
    j = json{
        {"nodeId", t.node_id},
        {"from", lit(t.from)},
        {"to", lit(t.to)},
        {"outcome", t.outcome ? json(lit(*t.outcome)) : json(nullptr)},
        {"attempt", t.attempt},
    };
}

void to_json(json& j, const ExecutionPlan& p) {
    j = json{
        {"planId", p.plan_id},
        {"modelId", p.model_id},
        {"dryRun", p.dry_run},
        {"cancelled", p.cancelled},
        {"context", p.context},
        {"createdAt", to_epoch_ms(p.created_at)},
        {"containerOrder", p.container_order},
        {"lastTransitions", p.last_transitions},
    };
    json entries = json::array();
    for (const auto& cid : p.container_order) {
        entries.push_back(p.entries.at(cid));
        auto it = p.action_order.find(cid);
        if (it == p.action_order.end()) continue;
        for (const auto& aid : it->second) entries.push_back(p.entries.at(aid));
    }
    j["entries"] = std::move(entries);
}

void to_json(json& j, const ExecutionSummary& s) {
    j = json{
        {"planId", s.plan_id},
        {"dryRun", s.dry_run},
        {"totalActions", s.total_actions},
        {"pending", s.pending},
        {"ready", s.ready},
        {"executing", s.executing},
        {"retrying", s.retrying},
        {"completed", s.completed},
        {"failed", s.failed},
        {"errored", s.errored},
        {"skipped", s.skipped},
        {"cancelled", s.cancelled},
        {"finished", s.finished},
        {"partialFailure", s.partial_failure},
        {"estimatedDuration", s.estimated_duration_sec},
    };
}

void to_json(json& j, const TraceRecord& r) {
    j = json{
        {"traceId", r.trace_id},
        {"nodeId", r.node_id},
        {"type", r.type},
        {"startTime", to_epoch_ms(r.start_time)},
        {"endTime", to_epoch_ms(r.end_time)},
        {"status", r.status},
        {"outcome", optional_json(r.outcome)},
        {"attempt", r.attempt},
        {"mode", r.mode},
        {"metadata", r.metadata},
    };
}

void to_json(json& j, const ContextInheritanceRule& r) {
    j = json{{"property", r.property}, {"inherit", r.inherit}, {"overrideAllowed", r.override_allowed}};
}

void to_json(json& j, const HierarchicalContext& c) {
    j = json{
        {"contextId", c.context_id},
        {"nodeId", c.node_id},
        {"scope", lit(c.scope)},
        {"data", c.data},
        {"accessLevel", lit(c.access_level)},
        {"parentContextId", optional_json(c.parent_context_id)},
        {"inheritedData", c.inherited_data},
        {"lockedProperties", c.locked_properties},
        {"createdAt", to_epoch_ms(c.created_at)},
        {"updatedAt", to_epoch_ms(c.updated_at)},
    };
}

void to_json(json& j, const HierarchyLevel& l) {
    j = json{
        {"level", l.level},
        {"nodeId", l.node_id},
        {"contextId", optional_json(l.context_id)},
        {"scope", l.scope ? json(lit(*l.scope)) : json(nullptr)},
        {"data", l.data},
    };
}

void to_json(json& j, const ContextHierarchy& h) {
    j = json{
        {"nodeId", h.node_id},
        {"levels", h.levels},
        {"totalLevels", h.total_levels},
        {"maxDepthReached", h.max_depth_reached},
        {"childNodeIds", h.child_node_ids},
        {"mergedData", h.merged_data},
    };
}

void to_json(json& j, const ContextValidationResult& r) {
    j = json{
        {"granted", r.granted},
        {"grantedLevel", lit(r.granted_level)},
        {"relationship", r.relationship},
        {"accessibleProperties", r.accessible_properties},
        {"restrictedProperties", r.restricted_properties},
        {"denialReason", optional_json(r.denial_reason)},
    };
}

} // namespace funcmodel
