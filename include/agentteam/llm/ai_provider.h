// agentteam/llm/ai_provider.h
#ifndef AGENTTEAM_LLM_AI_PROVIDER_H
#define AGENTTEAM_LLM_AI_PROVIDER_H

#include "common/types.h"
#include <optional>
#include <string>
#include <vector>

namespace agentteam {

struct ChatOptions {
    std::optional<std::string> model; // provider default when empty
    float temperature = 0.7f;
    int max_tokens = 4096;
    std::optional<nlohmann::json> tools;           // function-calling schema array
    std::optional<nlohmann::json> response_format; // e.g. {"type": "json_object"}
};

/**
 * AIProvider: 统一的模型调用接口
 * Implementations may be called from several scheduler threads at once.
 */
class AIProvider {
public:
    virtual ~AIProvider() = default;

    virtual AIResponse chat(const std::vector<AIMessage>& messages, const ChatOptions& options) = 0;

    AIResponse chat(const std::vector<AIMessage>& messages) {
        return chat(messages, ChatOptions{});
    }

    virtual std::string provider_name() const = 0;
    virtual std::string default_model() const = 0;
};

} // namespace agentteam

#endif // AGENTTEAM_LLM_AI_PROVIDER_H
