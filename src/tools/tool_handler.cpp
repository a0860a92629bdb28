// src/tools/tool_handler.cpp
#include "agentteam/tools/tool_handler.h"
#include <algorithm>
#include <stdexcept>

namespace agentteam {

namespace {

std::optional<std::vector<std::string>> optional_list(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    if (j[key].is_string()) return std::vector<std::string>{j[key].get<std::string>()};
    return j[key].get<std::vector<std::string>>();
}

} // namespace

ToolHandlerConfig ToolHandlerConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("name") || !j["name"].is_string()) {
        throw std::invalid_argument("Tool handler config requires a 'name'");
    }
    ToolHandlerConfig c;
    c.name = j["name"].get<std::string>();
    c.type = j.value("type", c.type);
    c.stages = optional_list(j, "stages");
    c.agents = optional_list(j, "agents");
    c.enabled = j.value("enabled", c.enabled);
    c.timeout_sec = j.value("timeout", c.timeout_sec);
    c.max_retries = j.value("max_retries", c.max_retries);
    c.max_result_bytes = j.value("max_result_bytes", c.max_result_bytes);
    if (j.contains("settings") && j["settings"].is_object()) {
        c.settings = j["settings"];
    }
    return c;
}

ToolHandler::ToolHandler(ToolHandlerConfig config, nlohmann::json project_config)
    : config_(std::move(config)), project_config_(std::move(project_config)) {}

bool ToolHandler::matches_scope(const std::optional<std::string>& stage,
                                const std::optional<std::string>& agent) const {
    if (!config_.enabled) {
        return false;
    }
    if (config_.stages && stage) {
        const auto& stages = *config_.stages;
        bool any = std::find(stages.begin(), stages.end(), "all") != stages.end();
        if (!any && std::find(stages.begin(), stages.end(), *stage) == stages.end()) {
            return false;
        }
    }
    if (config_.agents && agent) {
        const auto& agents = *config_.agents;
        if (std::find(agents.begin(), agents.end(), *agent) == agents.end()) {
            return false;
        }
    }
    return true;
}

} // namespace agentteam
