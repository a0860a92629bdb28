// src/llm/llama_provider.cpp
#include "agentteam/llm/llama_provider.h"
#include "common/logging.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace agentteam {

namespace {

std::string fallback_prompt(const std::vector<AIMessage>& messages) {
    std::string prompt;
    for (const auto& m : messages) {
        prompt += m.role + ": " + m.content + "\n";
    }
    prompt += "assistant: ";
    return prompt;
}

} // namespace

LlamaProvider::LlamaProvider(const Config& config)
    : config_(config),
      model_(nullptr, llama_model_free),
      ctx_(nullptr, llama_free) {

    llama_model_params model_params = llama_model_default_params();
    model_params.n_gpu_layers = 99; // offload everything that fits

    llama_model* raw_model = llama_model_load_from_file(config_.model_path.c_str(), model_params);
    if (!raw_model) {
        throw std::runtime_error("Failed to load model: " + config_.model_path);
    }
    model_.reset(raw_model);

    llama_context_params ctx_params = llama_context_default_params();
    ctx_params.n_ctx = config_.n_ctx;
    ctx_params.n_threads = config_.n_threads;
    ctx_params.n_threads_batch = config_.n_threads;

    llama_context* raw_ctx = llama_init_from_model(model_.get(), ctx_params);
    if (!raw_ctx) {
        throw std::runtime_error("Failed to create context");
    }
    ctx_.reset(raw_ctx);

    log_info("Loaded llama model " + config_.model_path);
}

LlamaProvider::~LlamaProvider() = default;

std::string LlamaProvider::default_model() const {
    return std::filesystem::path(config_.model_path).filename().string();
}

std::string LlamaProvider::apply_chat_template(const std::vector<AIMessage>& messages) const {
    const char* tmpl = llama_model_chat_template(model_.get(), nullptr);
    if (!tmpl) {
        return fallback_prompt(messages);
    }

    std::vector<llama_chat_message> chat;
    chat.reserve(messages.size());
    for (const auto& m : messages) {
        // the template only knows system/user/assistant
        const char* role = m.role == "tool" ? "user" : m.role.c_str();
        chat.push_back(llama_chat_message{role, m.content.c_str()});
    }

    std::vector<char> buf(4096);
    int32_t n = llama_chat_apply_template(tmpl, chat.data(), chat.size(), true, buf.data(),
                                          static_cast<int32_t>(buf.size()));
    if (n > static_cast<int32_t>(buf.size())) {
        buf.resize(static_cast<size_t>(n));
        n = llama_chat_apply_template(tmpl, chat.data(), chat.size(), true, buf.data(),
                                      static_cast<int32_t>(buf.size()));
    }
    if (n < 0) {
        log_warning("Model chat template not supported by llama.cpp, using plain prompt");
        return fallback_prompt(messages);
    }
    return std::string(buf.data(), static_cast<size_t>(n));
}

std::vector<llama_token> LlamaProvider::tokenize(const std::string& text) const {
    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    int32_t n_tokens = -llama_tokenize(vocab, text.data(), static_cast<int32_t>(text.size()),
                                       nullptr, 0, true, true);
    if (n_tokens <= 0) return {};

    std::vector<llama_token> tokens(static_cast<size_t>(n_tokens));
    if (llama_tokenize(vocab, text.data(), static_cast<int32_t>(text.size()),
                       tokens.data(), n_tokens, true, true) < 0) {
        return {};
    }
    return tokens;
}

std::string LlamaProvider::detokenize(llama_token token) const {
    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    char buf[256] = {0};
    int n = llama_token_to_piece(vocab, token, buf, sizeof(buf) - 1, 0, true);
    if (n < 0) return "";
    return std::string(buf, n);
}

AIResponse LlamaProvider::chat(const std::vector<AIMessage>& messages, const ChatOptions& options) {
    std::lock_guard<std::mutex> lock(generate_mutex_);

    const std::string prompt = apply_chat_template(messages);
    auto tokens = tokenize(prompt);
    if (tokens.empty()) {
        throw std::runtime_error("Tokenization failed");
    }

    // every call starts from an empty KV cache
    llama_memory_clear(llama_get_memory(ctx_.get()), true);

    std::unique_ptr<llama_sampler, decltype(&llama_sampler_free)> sampler(
        llama_sampler_chain_init(llama_sampler_chain_default_params()), llama_sampler_free);
    llama_sampler_chain_add(sampler.get(), llama_sampler_init_min_p(config_.min_p, 1));
    llama_sampler_chain_add(sampler.get(), llama_sampler_init_temp(options.temperature));
    llama_sampler_chain_add(sampler.get(), llama_sampler_init_dist(LLAMA_DEFAULT_SEED));

    llama_batch batch = llama_batch_get_one(tokens.data(), static_cast<int32_t>(tokens.size()));
    if (llama_decode(ctx_.get(), batch)) {
        throw std::runtime_error("Prompt evaluation failed");
    }

    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    const int limit = std::min(options.max_tokens, config_.n_predict);

    AIResponse response;
    response.model = options.model.value_or(default_model());
    response.finish_reason = "length";

    int generated = 0;
    for (; generated < limit; ++generated) {
        llama_token new_token = llama_sampler_sample(sampler.get(), ctx_.get(), -1);
        if (llama_vocab_is_eog(vocab, new_token)) {
            response.finish_reason = "stop";
            break;
        }
        response.content += detokenize(new_token);

        batch = llama_batch_get_one(&new_token, 1);
        if (llama_decode(ctx_.get(), batch)) {
            log_warning("llama_decode failed after " + std::to_string(generated + 1) + " tokens");
            break;
        }
    }

    response.usage["prompt_tokens"] = static_cast<int>(tokens.size());
    response.usage["completion_tokens"] = generated;
    response.usage["total_tokens"] = static_cast<int>(tokens.size()) + generated;
    return response;
}

LlamaProvider::Config load_llama_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open llama config: " + path);
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid llama config " + path + ": " + e.what());
    }
    if (!j.is_object() || !j.contains("model_path") || !j["model_path"].is_string()) {
        throw std::runtime_error("llama config " + path + " requires a string 'model_path'");
    }

    LlamaProvider::Config config;
    std::filesystem::path model_path(j["model_path"].get<std::string>());
    if (model_path.is_relative()) {
        model_path = std::filesystem::absolute(path).parent_path() / model_path;
    }
    config.model_path = model_path.string();
    config.n_ctx = j.value("n_ctx", config.n_ctx);
    config.n_threads = j.value("n_threads", config.n_threads);
    config.temperature = j.value("temperature", config.temperature);
    config.min_p = j.value("min_p", config.min_p);
    config.n_predict = j.value("n_predict", config.n_predict);
    return config;
}

} // namespace agentteam
