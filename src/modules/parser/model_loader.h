// modules/parser/model_loader.h
#ifndef FUNCMODEL_MODULES_PARSER_MODEL_LOADER_H
#define FUNCMODEL_MODULES_PARSER_MODEL_LOADER_H

#include "core/function_model.h"
#include "core/services.h"
#include <nlohmann/json.hpp>
#include <map>
#include <string>

namespace funcmodel {

struct LoadedModel {
    FunctionModel model;
    std::map<std::string, NodeId> keys; // definition key -> node id
};

struct ModelLoaderConfig {
    double default_action_duration_sec = 60.0;
    Escalation default_escalation = Escalation::FAILED;
};

// Builds a FunctionModel from a YAML definition with sections
// model, nodes, actions, links and an optional `publish: true`.
class ModelLoader {
public:
    using Config = ModelLoaderConfig;

    explicit ModelLoader(DomainServices services = DomainServices::system_default(), Config config = {});

    Result<LoadedModel> parse_from_string(const std::string& yaml_content);
    Result<LoadedModel> parse_from_file(const std::string& file_path);

private:
    Result<LoadedModel> build(const nlohmann::json& doc);
    VoidResult add_nodes(const nlohmann::json& nodes, LoadedModel& loaded);
    VoidResult add_actions(const nlohmann::json& actions, LoadedModel& loaded);
    VoidResult add_links(const nlohmann::json& links, LoadedModel& loaded);

    DomainServices services_;
    Config config_;
};

} // namespace funcmodel

#endif // FUNCMODEL_MODULES_PARSER_MODEL_LOADER_H
