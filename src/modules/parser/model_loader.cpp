// modules/parser/model_loader.cpp
#include "modules/parser/model_loader.h"
#include "common/utils/yaml_json.h"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <iostream>
#include <sstream>

namespace funcmodel {

namespace {

Result<NodeId> resolve_key(const LoadedModel& loaded, const nlohmann::json& j, const char* field) {
    std::string key = j.value(field, "");
    auto it = loaded.keys.find(key);
    if (it == loaded.keys.end()) {
        return validation_error("Unknown node key '" + key + "' in field '" + field + "'");
    }
    return Result<NodeId>::ok(it->second);
}

std::vector<std::string> string_list(const nlohmann::json& j, const char* field) {
    std::vector<std::string> out;
    if (j.contains(field) && j[field].is_array()) {
        for (const auto& item : j[field]) {
            if (item.is_string()) out.push_back(item.get<std::string>());
        }
    }
    return out;
}

Result<Position> read_position(const nlohmann::json& j) {
    if (!j.contains("position")) return Result<Position>::ok(Position::origin());
    const auto& p = j["position"];
    return Position::create(p.value("x", 0.0), p.value("y", 0.0));
}

} // namespace

ModelLoader::ModelLoader(DomainServices services, Config config)
    : services_(std::move(services)), config_(config) {}

Result<LoadedModel> ModelLoader::parse_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return not_found_error("Cannot open file: " + file_path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_from_string(buffer.str());
}

Result<LoadedModel> ModelLoader::parse_from_string(const std::string& yaml_content) {
    try {
        YAML::Node yaml_root = YAML::Load(yaml_content);
        return build(yaml_to_json(yaml_root));
    } catch (const YAML::Exception& e) {
        return validation_error("YAML parse error: " + std::string(e.what()));
    } catch (const nlohmann::json::exception& e) {
        return validation_error("Malformed model definition: " + std::string(e.what()));
    }
}

Result<LoadedModel> ModelLoader::build(const nlohmann::json& doc) {
    if (!doc.is_object() || !doc.contains("model") || !doc["model"].is_object()) {
        return validation_error("Model definition requires a 'model' section");
    }
    const auto& m = doc["model"];

    auto created = FunctionModel::create(m.value("name", ""), m.value("description", ""), services_);
    if (created.is_failure()) return created.error();
    LoadedModel loaded{.model = std::move(created).value()};

    if (m.contains("version")) {
        auto res = loaded.model.update_version(m["version"].get<std::string>());
        if (res.is_failure()) return res.error();
    }
    if (m.contains("metadata")) {
        auto res = loaded.model.update_metadata(m["metadata"]);
        if (res.is_failure()) return res.error();
    }
    if (m.contains("owner")) {
        auto res = loaded.model.update_permissions(Permissions{
            .owner = m["owner"].get<std::string>(),
            .editors = string_list(m, "editors"),
            .viewers = string_list(m, "viewers"),
        });
        if (res.is_failure()) return res.error();
    }

    auto steps = add_nodes(doc.value("nodes", nlohmann::json::array()), loaded)
                     .flat_map([&] { return add_actions(doc.value("actions", nlohmann::json::array()), loaded); })
                     .flat_map([&] { return add_links(doc.value("links", nlohmann::json::array()), loaded); });
    if (steps.is_failure()) return steps.error();

    if (doc.value("publish", false)) {
        auto published = loaded.model.publish();
        if (published.is_failure()) return published.error();
    }

    std::cout << "[DEBUG] Loaded model '" << loaded.model.name().value() << "': " << loaded.model.nodes().size()
              << " containers, " << loaded.model.action_nodes().size() << " actions, "
              << loaded.model.links().size() << " links" << std::endl;
    return Result<LoadedModel>::ok(std::move(loaded));
}

VoidResult ModelLoader::add_nodes(const nlohmann::json& nodes, LoadedModel& loaded) {
    for (const auto& n : nodes) {
        std::string key = n.value("key", "");
        if (key.empty()) return validation_error("Node definition missing 'key'");
        if (loaded.keys.count(key)) return validation_error("Duplicate node key '" + key + "'");

        auto type = parse_node_type(n.value("type", ""));
        if (type.is_failure()) return type.error();
        auto position = read_position(n);
        if (position.is_failure()) return position.error();

        NodeOptions options;
        options.description = n.value("description", "");
        options.metadata = n.value("metadata", nlohmann::json::object());
        options.visual_properties = n.value("visual_properties", nlohmann::json::object());
        if (n.contains("timeout_ms")) options.timeout_ms = n["timeout_ms"].get<int>();
        if (n.contains("execution_type")) {
            auto mode = parse_execution_mode(n["execution_type"].get<std::string>());
            if (mode.is_failure()) return mode.error();
            options.execution_type = mode.value();
        }
        if (n.contains("parent")) {
            auto parent = resolve_key(loaded, n, "parent");
            if (parent.is_failure()) return parent.error();
            options.parent_node_id = parent.value();
        }
        if (n.contains("io")) {
            const auto& io = n["io"];
            IONodeData data;
            auto boundary = parse_io_boundary(io.value("boundary", "input"));
            if (boundary.is_failure()) return boundary.error();
            data.boundary_type = boundary.value();
            data.data_type = io.value("data_type", "");
            data.schema = io.value("schema", nlohmann::json::object());
            data.is_required = io.value("required", false);
            data.validation_rules = io.value("validation_rules", nlohmann::json::object());
            data.default_value = io.value("default", nlohmann::json());
            options.io_data = data;
        }
        if (n.contains("stage")) {
            const auto& st = n["stage"];
            options.stage_data = StageNodeData{
                .stage_type = st.value("stage_type", "process"),
                .completion_criteria = st.value("completion_criteria", nlohmann::json::object()),
                .stage_goals = string_list(st, "goals"),
                .resource_requirements = st.value("resource_requirements", nlohmann::json::object()),
                .parallel_execution = st.value("parallel", false),
                .configuration = st.value("configuration", nlohmann::json::object()),
            };
        }

        auto added = loaded.model.add_container_node(type.value(), n.value("name", ""), position.value(), options);
        if (added.is_failure()) return added.error();
        loaded.keys.emplace(key, added.value().header.id);
    }
    return VoidResult::ok();
}

VoidResult ModelLoader::add_actions(const nlohmann::json& actions, LoadedModel& loaded) {
    for (const auto& a : actions) {
        std::string key = a.value("key", "");
        if (key.empty()) return validation_error("Action definition missing 'key'");
        if (loaded.keys.count(key)) return validation_error("Duplicate node key '" + key + "'");

        auto parent = resolve_key(loaded, a, "parent");
        if (parent.is_failure()) return parent.error();
        auto type = parse_node_type(a.value("type", "tetherNode"));
        if (type.is_failure()) return type.error();
        auto mode = parse_execution_mode(a.value("execution_mode", "sequential"));
        if (mode.is_failure()) return mode.error();
        auto position = read_position(a);
        if (position.is_failure()) return position.error();

        ActionSpec spec{
            .parent_node_id = parent.value(),
            .type = type.value(),
            .name = a.value("name", ""),
            .description = a.value("description", ""),
            .action_type = a.value("action_type", ""),
            .execution_mode = mode.value(),
            .priority = a.value("priority", 5),
            .estimated_duration_sec = a.value("duration_sec", config_.default_action_duration_sec),
            .metadata = a.value("metadata", nlohmann::json::object()),
            .action_data = a.value("data", nlohmann::json::object()),
            .position = position.value(),
        };
        if (a.contains("order")) spec.execution_order = a["order"].get<int>();
        if (a.contains("timeout_ms")) spec.timeout_ms = a["timeout_ms"].get<int>();
        if (a.contains("guard")) spec.guard = a["guard"].get<std::string>();

        spec.retry_policy.escalation = config_.default_escalation;
        if (a.contains("retry")) {
            const auto& r = a["retry"];
            spec.retry_policy.max_retries = r.value("max_retries", 0);
            spec.retry_policy.initial_delay_ms = r.value("initial_delay_ms", spec.retry_policy.initial_delay_ms);
            spec.retry_policy.max_delay_ms = r.value("max_delay_ms", spec.retry_policy.max_delay_ms);
            if (r.contains("backoff")) {
                auto backoff = parse_backoff_strategy(r["backoff"].get<std::string>());
                if (backoff.is_failure()) return backoff.error();
                spec.retry_policy.backoff = backoff.value();
            }
            if (r.contains("escalation")) {
                auto escalation = parse_escalation(r["escalation"].get<std::string>());
                if (escalation.is_failure()) return escalation.error();
                spec.retry_policy.escalation = escalation.value();
            }
        }
        if (a.contains("raci")) {
            const auto& raci = a["raci"];
            spec.raci = RaciAssignment{
                .responsible = string_list(raci, "responsible"),
                .accountable = string_list(raci, "accountable"),
                .consulted = string_list(raci, "consulted"),
                .informed = string_list(raci, "informed"),
            };
        }

        auto added = loaded.model.add_action_node(spec);
        if (added.is_failure()) return added.error();
        loaded.keys.emplace(key, added.value().header.id);
    }
    return VoidResult::ok();
}

VoidResult ModelLoader::add_links(const nlohmann::json& links, LoadedModel& loaded) {
    for (const auto& l : links) {
        auto source = resolve_key(loaded, l, "source");
        if (source.is_failure()) return source.error();
        auto target = resolve_key(loaded, l, "target");
        if (target.is_failure()) return target.error();
        auto type = parse_link_type(l.value("type", "dependency"));
        if (type.is_failure()) return type.error();

        auto created = loaded.model.create_edge(source.value(), target.value(), type.value(),
                                                l.value("strength", 1.0),
                                                l.value("context", nlohmann::json::object()),
                                                l.value("bidirectional", false));
        if (created.is_failure()) return created.error();
    }
    return VoidResult::ok();
}

} // namespace funcmodel
