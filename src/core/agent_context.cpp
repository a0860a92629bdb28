// src/core/agent_context.cpp
#include "agentteam/core/agent_context.h"

namespace agentteam {

void AgentContext::add_artifact(const std::string& key, Value value) {
    if (!artifacts.is_object()) {
        artifacts = nlohmann::json::object();
    }
    artifacts[key] = std::move(value);
}

Value AgentContext::get_artifact(const std::string& key, const Value& default_value) const {
    if (!artifacts.is_object()) {
        return default_value;
    }
    auto it = artifacts.find(key);
    return it != artifacts.end() ? *it : default_value;
}

bool AgentContext::has_artifact(const std::string& key) const {
    return artifacts.is_object() && artifacts.contains(key);
}

AgentContext AgentContext::fork() const {
    AgentContext sub;
    sub.ai_provider = ai_provider;
    sub.project_config = project_config;
    sub.project_dir = project_dir;
    sub.tool_manager = tool_manager;
    // json and vector copies are deep: no container is shared with the parent
    sub.conversation_history = conversation_history;
    sub.artifacts = artifacts;
    sub.shared_state = shared_state;
    return sub;
}

} // namespace agentteam
