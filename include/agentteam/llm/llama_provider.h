// agentteam/llm/llama_provider.h
#ifndef AGENTTEAM_LLM_LLAMA_PROVIDER_H
#define AGENTTEAM_LLM_LLAMA_PROVIDER_H

#include "agentteam/llm/ai_provider.h"
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <llama.h>

namespace agentteam {

/**
 * LlamaProvider: 本地 llama.cpp 模型
 *
 * Messages are flattened with the model's chat template. One generation
 * runs at a time; concurrent chat() calls queue on an internal mutex.
 * Tool schemas in ChatOptions are ignored, so responses never carry tool_calls.
 */
class LlamaProvider : public AIProvider {
public:
    struct Config {
        std::string model_path;
        int n_ctx = 4096;
        int n_threads = 4;
        float temperature = 0.7f;
        float min_p = 0.05f;
        int n_predict = 1024;
    };

    explicit LlamaProvider(const Config& config);
    ~LlamaProvider() override;

    using AIProvider::chat;
    AIResponse chat(const std::vector<AIMessage>& messages, const ChatOptions& options) override;

    std::string provider_name() const override { return "llama.cpp"; }
    std::string default_model() const override;

private:
    std::string apply_chat_template(const std::vector<AIMessage>& messages) const;
    std::vector<llama_token> tokenize(const std::string& text) const;
    std::string detokenize(llama_token token) const;

    Config config_;
    std::unique_ptr<llama_model, decltype(&llama_model_free)> model_;
    std::unique_ptr<llama_context, decltype(&llama_free)> ctx_;
    std::mutex generate_mutex_;
};

// {"model_path": "...", "n_ctx": 4096, ...}; model_path is resolved against
// the config file's directory. Throws std::runtime_error on unreadable or invalid JSON.
LlamaProvider::Config load_llama_config(const std::string& path);

} // namespace agentteam

#endif // AGENTTEAM_LLM_LLAMA_PROVIDER_H
