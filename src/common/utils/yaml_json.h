// common/utils/yaml_json.h
#ifndef FUNCMODEL_COMMON_UTILS_YAML_JSON_H
#define FUNCMODEL_COMMON_UTILS_YAML_JSON_H

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace funcmodel {

// YAML::Node -> nlohmann::json. Plain scalars become bool/null/number where they parse as one;
// quoted scalars always stay strings.
nlohmann::json yaml_to_json(const YAML::Node& node);

} // namespace funcmodel

#endif // FUNCMODEL_COMMON_UTILS_YAML_JSON_H
