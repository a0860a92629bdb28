#ifndef AGENTTEAM_COMMON_UTILS_YAML_JSON_H
#define AGENTTEAM_COMMON_UTILS_YAML_JSON_H

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>
#include <string>

namespace agentteam {

// 将 YAML::Node 转换为 nlohmann::json
nlohmann::json yaml_to_json(const YAML::Node& node);

// Parse a YAML document into JSON. Throws YAML::Exception on malformed input.
nlohmann::json parse_yaml_string(const std::string& yaml_text);

// Parse a YAML file into JSON. Throws YAML::Exception (BadFile when unreadable).
nlohmann::json load_yaml_file(const std::string& path);

} // namespace agentteam

#endif // AGENTTEAM_COMMON_UTILS_YAML_JSON_H
