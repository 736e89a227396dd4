// core/serialization.h
#ifndef FUNCMODEL_CORE_SERIALIZATION_H
#define FUNCMODEL_CORE_SERIALIZATION_H

#include "core/function_model.h"
#include "core/types/result.h"
#include "modules/context/context_types.h"
#include "modules/execution/execution_plan.h"
#include "modules/trace/trace_exporter.h"
#include <nlohmann/json.hpp>
#include <type_traits>

// nlohmann to_json overloads for everything handed to an outer shell.
// Keys are camelCase, enums use their string literals, timestamps are epoch milliseconds.
namespace funcmodel {

using json = nlohmann::json;

int64_t to_epoch_ms(Timestamp t);

template <typename Tag>
void to_json(json& j, const UuidValue<Tag>& id) {
    j = id.value();
}

void to_json(json& j, const Error& e);
void to_json(json& j, const ModelName& n);
void to_json(json& j, const Version& v);
void to_json(json& j, const Position& p);
void to_json(json& j, const LinkStrength& s);
void to_json(json& j, const RetryPolicy& p);
void to_json(json& j, const RaciAssignment& r);

void to_json(json& j, const IONodeData& d);
void to_json(json& j, const StageNodeData& d);
void to_json(json& j, const TetherNodeData& d);
void to_json(json& j, const KBNodeData& d);
void to_json(json& j, const NestedModelNodeData& d);
void to_json(json& j, const ContainerNode& n);
void to_json(json& j, const ActionNode& n);
void to_json(json& j, const AnyNode& n);
void to_json(json& j, const NodeLink& l);

void to_json(json& j, const Permissions& p);
void to_json(json& j, const ValidationReport& r);
void to_json(json& j, const ModelStatistics& s);
void to_json(json& j, const FunctionModel& m);

void to_json(json& j, const PlanEntry& e);
void to_json(json& j, const StatusTransition& t);
void to_json(json& j, const ExecutionPlan& p);
void to_json(json& j, const ExecutionSummary& s);
void to_json(json& j, const TraceRecord& r);

void to_json(json& j, const ContextInheritanceRule& r);
void to_json(json& j, const HierarchicalContext& c);
void to_json(json& j, const HierarchyLevel& l);
void to_json(json& j, const ContextHierarchy& h);
void to_json(json& j, const ContextValidationResult& r);

// { "isSuccess": bool, "value"?: T, "error"?: string, "errorKind"?: string }
template <typename T>
void to_json(json& j, const Result<T>& r) {
    j = json::object();
    j["isSuccess"] = r.is_success();
    if (r.is_failure()) {
        j["error"] = r.message();
        j["errorKind"] = std::string(to_string(r.error_kind()));
        return;
    }
    if constexpr (!std::is_void_v<T>) {
        j["value"] = r.value();
    }
}

} // namespace funcmodel

#endif // FUNCMODEL_CORE_SERIALIZATION_H
