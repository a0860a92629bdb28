// agentteam/core/prompt_agent.h
#ifndef AGENTTEAM_CORE_PROMPT_AGENT_H
#define AGENTTEAM_CORE_PROMPT_AGENT_H

#include "agentteam/core/agent.h"
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace agentteam {

class AgentLoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * PromptAgent: 由 YAML 定义驱动的 agent
 *
 *   name: cloud-architect            # required
 *   description: ...
 *   role: architect
 *   capabilities: [architect, analyze]
 *   constraints: [...]
 *   system_prompt: |
 *     Known services: {{ artifacts.services }}
 *   examples:
 *     - user: ...
 *       assistant: ...
 *   contract:
 *     inputs: [requirements]
 *     outputs: [architecture]
 *     delegates_to: [terraform-agent]
 *
 * system_prompt is an inja template rendered against
 * {artifacts, shared_state, project_dir} on every execution.
 */
class PromptAgent : public Agent {
public:
    // Throws AgentLoadError when "name" is missing or the definition is not a mapping
    explicit PromptAgent(const nlohmann::json& definition);

    AIResponse execute(AgentContext& context, const std::string& task) override;
    double can_handle(const std::string& task) const override;
    std::vector<AIMessage> system_messages(const AgentContext& context) const override;

    const std::string& role() const { return role_; }
    const nlohmann::json& definition() const { return definition_; }

private:
    std::string role_;
    std::vector<std::pair<std::string, std::string>> examples_; // (role, content)
    nlohmann::json definition_;
};

std::shared_ptr<Agent> load_yaml_agent(const std::string& file_path);
std::shared_ptr<Agent> load_yaml_agent_from_string(const std::string& yaml_text);

// Loads every .yaml/.yml file in name order; files that fail to load are
// skipped with a warning. A missing directory yields an empty list.
std::vector<std::shared_ptr<Agent>> load_agents_from_directory(const std::string& directory);

} // namespace agentteam

#endif // AGENTTEAM_CORE_PROMPT_AGENT_H
