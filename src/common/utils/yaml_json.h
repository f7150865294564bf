#ifndef AGENTGRAPH_COMMON_UTILS_YAML_JSON_H
#define AGENTGRAPH_COMMON_UTILS_YAML_JSON_H

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>
#include <string>

namespace agentgraph {

// 将 YAML::Node 转换为 nlohmann::json
// Plain scalars become bool/null/integer/float where they parse as such;
// quoted scalars always stay strings.
nlohmann::json yaml_to_json(const YAML::Node& node);

// Parses a YAML document; throws ConfigurationError on syntax errors.
nlohmann::json parse_yaml(const std::string& content);

} // namespace agentgraph

#endif // AGENTGRAPH_COMMON_UTILS_YAML_JSON_H
