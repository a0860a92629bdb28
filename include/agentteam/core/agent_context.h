// agentteam/core/agent_context.h
#ifndef AGENTTEAM_CORE_AGENT_CONTEXT_H
#define AGENTTEAM_CORE_AGENT_CONTEXT_H

#include "agentteam/llm/ai_provider.h"
#include "common/types.h"
#include <memory>
#include <string>
#include <vector>

namespace agentteam {

class ToolManager; // agentteam/tools/manager.h

/**
 * AgentContext: 单次运行中 agent 可见的状态
 *
 * The provider, tool manager and project config are shared; the
 * conversation history, artifacts and shared state are per-copy and
 * fork() duplicates them so a delegate can never write into its caller.
 */
struct AgentContext {
    std::shared_ptr<AIProvider> ai_provider;
    nlohmann::json project_config = nlohmann::json::object();
    std::string project_dir;
    std::vector<AIMessage> conversation_history;
    nlohmann::json artifacts = nlohmann::json::object();
    nlohmann::json shared_state = nlohmann::json::object();
    ToolManager* tool_manager = nullptr; // optional, not owned

    void add_artifact(const std::string& key, Value value);
    Value get_artifact(const std::string& key, const Value& default_value = nullptr) const;
    bool has_artifact(const std::string& key) const;

    // Independent copy of the mutable containers; shares provider and tool manager.
    AgentContext fork() const;
};

} // namespace agentteam

#endif // AGENTTEAM_CORE_AGENT_CONTEXT_H
