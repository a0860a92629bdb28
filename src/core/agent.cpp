// src/core/agent.cpp
#include "agentteam/core/agent.h"
#include "agentteam/tools/manager.h"
#include "common/logging.h"
#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace agentteam {

namespace {

constexpr std::array<std::pair<AgentCapability, const char*>, 15> kCapabilityNames{{
    {AgentCapability::ARCHITECT, "architect"},
    {AgentCapability::DEVELOP, "develop"},
    {AgentCapability::TERRAFORM, "terraform"},
    {AgentCapability::BICEP, "bicep"},
    {AgentCapability::ANALYZE, "analyze"},
    {AgentCapability::DOCUMENT, "document"},
    {AgentCapability::DEPLOY, "deploy"},
    {AgentCapability::TEST, "test"},
    {AgentCapability::COORDINATE, "coordinate"},
    {AgentCapability::QA, "qa"},
    {AgentCapability::BIZ_ANALYSIS, "biz_analysis"},
    {AgentCapability::COST_ANALYSIS, "cost_analysis"},
    {AgentCapability::BACKLOG_GENERATION, "backlog_generation"},
    {AgentCapability::SECURITY_REVIEW, "security_review"},
    {AgentCapability::MONITORING, "monitoring"},
}};

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

std::string to_string(AgentCapability capability) {
    for (const auto& [cap, text] : kCapabilityNames) {
        if (cap == capability) return text;
    }
    return "unknown";
}

std::optional<AgentCapability> parse_capability(const std::string& value) {
    for (const auto& [cap, text] : kCapabilityNames) {
        if (value == text) return cap;
    }
    return std::nullopt;
}

Agent::Agent(std::string name,
             std::string description,
             std::vector<AgentCapability> capabilities,
             std::vector<std::string> constraints,
             std::string system_prompt)
    : name_(std::move(name)),
      description_(std::move(description)),
      capabilities_(std::move(capabilities)),
      constraints_(std::move(constraints)),
      system_prompt_(std::move(system_prompt)) {}

bool Agent::has_capability(AgentCapability capability) const {
    return std::find(capabilities_.begin(), capabilities_.end(), capability) != capabilities_.end();
}

AIResponse Agent::execute(AgentContext& context, const std::string& task) {
    if (!context.ai_provider) {
        throw std::runtime_error("Agent '" + name_ + "' has no AI provider in its context");
    }

    std::vector<AIMessage> messages = system_messages(context);
    messages.insert(messages.end(), context.conversation_history.begin(), context.conversation_history.end());
    messages.push_back(AIMessage{"user", task});

    ChatOptions chat_options;
    chat_options.temperature = options_.temperature;
    chat_options.max_tokens = options_.max_tokens;

    auto tools = scoped_tools(context);
    if (tools) {
        chat_options.tools = *tools;
    }

    AIResponse response = context.ai_provider->chat(messages, chat_options);

    if (tools && !response.tool_calls.empty()) {
        response = run_tool_loop(std::move(response), messages, *tools, context);
    }
    return response;
}

double Agent::can_handle(const std::string& task) const {
    if (options_.keywords.empty()) {
        return 0.5;
    }
    const std::string lowered = to_lower(task);
    int matches = 0;
    for (const auto& keyword : options_.keywords) {
        if (lowered.find(to_lower(keyword)) != std::string::npos) {
            ++matches;
        }
    }
    return std::min(0.3 + matches * options_.keyword_weight, 1.0);
}

AgentContract Agent::get_contract() const {
    return contract_.value_or(AgentContract{});
}

std::vector<AIMessage> Agent::system_messages(const AgentContext& /*context*/) const {
    std::vector<AIMessage> messages;
    if (!system_prompt_.empty()) {
        messages.push_back(AIMessage{"system", system_prompt_});
    }
    if (!constraints_.empty()) {
        std::string text = "CONSTRAINTS:";
        for (const auto& c : constraints_) {
            text += "\n- " + c;
        }
        messages.push_back(AIMessage{"system", std::move(text)});
    }
    return messages;
}

nlohmann::json Agent::to_json() const {
    nlohmann::json j;
    j["name"] = name_;
    j["description"] = description_;
    j["capabilities"] = nlohmann::json::array();
    for (auto cap : capabilities_) {
        j["capabilities"].push_back(to_string(cap));
    }
    j["constraints"] = constraints_;
    j["is_builtin"] = is_builtin_;

    AgentContract contract = get_contract();
    if (!contract.empty()) {
        j["contract"] = {
            {"inputs", contract.inputs},
            {"outputs", contract.outputs},
            {"delegates_to", contract.delegates_to}
        };
    }
    return j;
}

std::optional<nlohmann::json> Agent::scoped_tools(const AgentContext& context) const {
    if (!options_.enable_tools || context.tool_manager == nullptr) {
        return std::nullopt;
    }

    // 当前阶段由外部 session 写入 shared_state
    std::optional<std::string> stage;
    if (context.shared_state.is_object() && context.shared_state.contains("current_stage") &&
        context.shared_state["current_stage"].is_string()) {
        stage = context.shared_state["current_stage"].get<std::string>();
    }

    nlohmann::json tools = context.tool_manager->get_tools_as_schema(stage, name_);
    if (tools.empty()) {
        return std::nullopt;
    }
    return tools;
}

AIResponse Agent::run_tool_loop(AIResponse response,
                                std::vector<AIMessage>& messages,
                                const nlohmann::json& tools,
                                AgentContext& context) {
    std::unordered_map<std::string, int> total_usage = response.usage;

    ChatOptions chat_options;
    chat_options.temperature = options_.temperature;
    chat_options.max_tokens = options_.max_tokens;
    chat_options.tools = tools;

    for (int iteration = 0; iteration < options_.max_tool_iterations; ++iteration) {
        if (response.tool_calls.empty()) {
            break;
        }

        AIMessage assistant{"assistant", response.content};
        assistant.tool_calls = response.tool_calls;
        messages.push_back(std::move(assistant));

        for (const auto& call : response.tool_calls) {
            ToolResult result = context.tool_manager->call_tool(call.name, call.arguments);
            AIMessage tool_message{"tool", result.is_error ? "Error: " + result.error_message : result.content};
            tool_message.tool_call_id = call.id;
            messages.push_back(std::move(tool_message));
        }

        response = context.ai_provider->chat(messages, chat_options);
        for (const auto& [key, count] : response.usage) {
            total_usage[key] += count;
        }
    }

    if (!response.tool_calls.empty()) {
        log_warning("Agent '" + name_ + "' stopped after " + std::to_string(options_.max_tool_iterations) +
                    " tool iterations with calls still pending");
    }

    response.usage = std::move(total_usage);
    return response;
}

} // namespace agentteam
