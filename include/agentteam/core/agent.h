// agentteam/core/agent.h
#ifndef AGENTTEAM_CORE_AGENT_H
#define AGENTTEAM_CORE_AGENT_H

#include "agentteam/core/agent_context.h"
#include "common/types.h"
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace agentteam {

// Agent 能力枚举
enum class AgentCapability : uint8_t {
    ARCHITECT,
    DEVELOP,
    TERRAFORM,
    BICEP,
    ANALYZE,
    DOCUMENT,
    DEPLOY,
    TEST,
    COORDINATE,
    QA,
    BIZ_ANALYSIS,
    COST_ANALYSIS,
    BACKLOG_GENERATION,
    SECURITY_REVIEW,
    MONITORING
};

std::string to_string(AgentCapability capability);
std::optional<AgentCapability> parse_capability(const std::string& value);

// Artifacts an agent reads and writes. Used only to infer task ordering.
struct AgentContract {
    std::set<ArtifactName> inputs;
    std::set<ArtifactName> outputs;
    std::vector<std::string> delegates_to; // informational

    bool empty() const { return inputs.empty() && outputs.empty() && delegates_to.empty(); }
};

class Agent {
public:
    // Knobs for the default execute()/can_handle(); subclasses adjust them in their constructor
    struct Options {
        float temperature = 0.7f;
        int max_tokens = 4096;
        std::vector<std::string> keywords; // matched case-insensitively
        double keyword_weight = 0.1;
        bool enable_tools = true;
        int max_tool_iterations = 10;
    };

    Agent(std::string name,
          std::string description,
          std::vector<AgentCapability> capabilities = {},
          std::vector<std::string> constraints = {},
          std::string system_prompt = "");
    virtual ~Agent() = default;

    Agent(const Agent&) = delete;
    Agent& operator=(const Agent&) = delete;

    const std::string& name() const { return name_; }
    void set_name(std::string name) { name_ = std::move(name); }
    const std::string& description() const { return description_; }
    const std::vector<AgentCapability>& capabilities() const { return capabilities_; }
    const std::vector<std::string>& constraints() const { return constraints_; }
    const std::string& system_prompt() const { return system_prompt_; }
    bool has_capability(AgentCapability capability) const;

    bool is_builtin() const { return is_builtin_; }
    void set_builtin(bool builtin) { is_builtin_ = builtin; }

    // system messages -> history -> task, then provider.chat(); runs the
    // tool-call loop when the context carries a ToolManager
    virtual AIResponse execute(AgentContext& context, const std::string& task);

    // 0.0 .. 1.0 relevance score
    virtual double can_handle(const std::string& task) const;

    virtual AgentContract get_contract() const;

    virtual std::vector<AIMessage> system_messages(const AgentContext& context) const;

    nlohmann::json to_json() const;

protected:
    Options& options() { return options_; }
    const Options& options() const { return options_; }
    void set_contract(AgentContract contract) { contract_ = std::move(contract); }

    std::optional<nlohmann::json> scoped_tools(const AgentContext& context) const;
    AIResponse run_tool_loop(AIResponse response,
                             std::vector<AIMessage>& messages,
                             const nlohmann::json& tools,
                             AgentContext& context);

private:
    std::string name_;
    std::string description_;
    std::vector<AgentCapability> capabilities_;
    std::vector<std::string> constraints_;
    std::string system_prompt_;
    bool is_builtin_ = true;
    Options options_;
    std::optional<AgentContract> contract_;
};

} // namespace agentteam

#endif // AGENTTEAM_CORE_AGENT_H
