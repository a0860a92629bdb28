// src/core/project_config.cpp
#include "agentteam/core/project_config.h"
#include "common/utils/yaml_json.h"
#include <cstdint>
#include <filesystem>
#include <limits>
#include <sstream>

namespace agentteam {

nlohmann::json ProjectConfig::defaults() {
    return {
        {"scheduler", {{"max_workers", 4}}},
        {"tools", {
            {"circuit_breaker_threshold", 3},
            {"servers", nlohmann::json::array()}
        }},
        {"agents", {{"directory", ""}}},
        {"logging", {{"level", "info"}}},
        {"llm", {{"config", ""}}}
    };
}

ProjectConfig::ProjectConfig() : data_(defaults()) {}

ProjectConfig ProjectConfig::from_string(const std::string& yaml_text) {
    ProjectConfig config;
    nlohmann::json loaded;
    try {
        loaded = parse_yaml_string(yaml_text);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid project config: ") + e.what());
    }
    if (loaded.is_null()) {
        return config;
    }
    if (!loaded.is_object()) {
        throw ConfigError("Project config must be a mapping at the top level");
    }
    config.data_.merge_patch(loaded);
    return config;
}

ProjectConfig ProjectConfig::from_file(const std::string& path) {
    namespace fs = std::filesystem;
    if (!fs::exists(path)) {
        log_info("No project config at " + path + ", using defaults");
        return ProjectConfig();
    }

    nlohmann::json loaded;
    try {
        loaded = load_yaml_file(path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Invalid project config " + path + ": " + e.what());
    }

    ProjectConfig config;
    config.base_dir_ = fs::absolute(path).parent_path().string();
    if (loaded.is_null()) {
        return config;
    }
    if (!loaded.is_object()) {
        throw ConfigError("Project config " + path + " must be a mapping at the top level");
    }
    config.data_.merge_patch(loaded);
    return config;
}

nlohmann::json ProjectConfig::get(const std::string& dotted_path, const nlohmann::json& default_value) const {
    const nlohmann::json* node = &data_;
    std::istringstream ss(dotted_path);
    std::string segment;
    while (std::getline(ss, segment, '.')) {
        if (!node->is_object()) return default_value;
        auto it = node->find(segment);
        if (it == node->end()) return default_value;
        node = &*it;
    }
    return node->is_null() ? default_value : *node;
}

int ProjectConfig::max_workers() const {
    return positive_int("scheduler.max_workers", 4);
}

int ProjectConfig::circuit_breaker_threshold() const {
    return positive_int("tools.circuit_breaker_threshold", 3);
}

int ProjectConfig::positive_int(const std::string& dotted_path, int default_value) const {
    auto v = get(dotted_path, default_value);
    if (!v.is_number_integer()) {
        throw ConfigError(dotted_path + " must be a positive integer");
    }
    // 先按 int64 取值, 避免超出 int 范围的值被截断
    const int64_t value = v.get<int64_t>();
    if (value <= 0 || value > std::numeric_limits<int>::max()) {
        throw ConfigError(dotted_path + " must be a positive integer no larger than " +
                          std::to_string(std::numeric_limits<int>::max()) + ", got " + std::to_string(value));
    }
    return static_cast<int>(value);
}

std::vector<ToolHandlerConfig> ProjectConfig::tool_servers() const {
    std::vector<ToolHandlerConfig> out;
    auto servers = get("tools.servers", nlohmann::json::array());
    if (!servers.is_array()) {
        throw ConfigError("tools.servers must be a list");
    }
    for (const auto& entry : servers) {
        try {
            out.push_back(ToolHandlerConfig::from_json(entry));
        } catch (const std::exception& e) {
            throw ConfigError(std::string("Invalid tools.servers entry: ") + e.what());
        }
    }
    return out;
}

std::string ProjectConfig::agents_directory() const {
    auto v = get("agents.directory", "");
    return v.is_string() ? resolve(v.get<std::string>()) : std::string();
}

LogLevel ProjectConfig::log_level() const {
    auto v = get("logging.level", "info");
    return parse_log_level(v.is_string() ? v.get<std::string>() : "info");
}

std::string ProjectConfig::llm_config_path() const {
    auto v = get("llm.config", "");
    return v.is_string() ? resolve(v.get<std::string>()) : std::string();
}

std::string ProjectConfig::resolve(const std::string& path) const {
    if (path.empty() || base_dir_.empty()) return path;
    std::filesystem::path p(path);
    if (p.is_absolute()) return path;
    return (std::filesystem::path(base_dir_) / p).string();
}

} // namespace agentteam
