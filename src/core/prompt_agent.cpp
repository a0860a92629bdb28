// src/core/prompt_agent.cpp
#include "agentteam/core/prompt_agent.h"
#include "common/logging.h"
#include "common/utils/template_renderer.h"
#include "common/utils/yaml_json.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>

namespace agentteam {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> string_list(const nlohmann::json& def, const char* key) {
    std::vector<std::string> out;
    if (!def.contains(key) || !def[key].is_array()) return out;
    for (const auto& item : def[key]) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

std::string string_field(const nlohmann::json& def, const char* key, const std::string& fallback = "") {
    if (def.contains(key) && def[key].is_string()) return def[key].get<std::string>();
    return fallback;
}

const nlohmann::json& require_mapping(const nlohmann::json& definition) {
    if (!definition.is_object()) {
        throw AgentLoadError("Agent YAML must be a mapping at the top level.");
    }
    if (string_field(definition, "name").empty()) {
        throw AgentLoadError("YAML agent definition must include 'name'.");
    }
    return definition;
}

std::vector<AgentCapability> parse_capabilities(const nlohmann::json& def) {
    std::vector<AgentCapability> caps;
    const std::string name = string_field(def, "name");
    for (const auto& raw : string_list(def, "capabilities")) {
        if (auto cap = parse_capability(raw)) {
            caps.push_back(*cap);
        } else {
            log_warning("Unknown capability '" + raw + "' in agent '" + name + "', skipping.");
        }
    }
    return caps;
}

} // namespace

PromptAgent::PromptAgent(const nlohmann::json& definition)
    : Agent(string_field(require_mapping(definition), "name"),
            string_field(definition, "description"),
            parse_capabilities(definition),
            string_list(definition, "constraints"),
            string_field(definition, "system_prompt")),
      role_(string_field(definition, "role", "general")),
      definition_(definition) {
    set_builtin(false);

    if (definition.contains("examples") && definition["examples"].is_array()) {
        for (const auto& ex : definition["examples"]) {
            if (!ex.is_object()) continue;
            if (ex.contains("user") && ex["user"].is_string()) {
                examples_.emplace_back("user", ex["user"].get<std::string>());
            }
            if (ex.contains("assistant") && ex["assistant"].is_string()) {
                examples_.emplace_back("assistant", ex["assistant"].get<std::string>());
            }
        }
    }

    if (definition.contains("contract") && definition["contract"].is_object()) {
        const auto& c = definition["contract"];
        AgentContract contract;
        for (auto& in : string_list(c, "inputs")) contract.inputs.insert(std::move(in));
        for (auto& out : string_list(c, "outputs")) contract.outputs.insert(std::move(out));
        contract.delegates_to = string_list(c, "delegates_to");
        set_contract(std::move(contract));
    }

    // YAML agents only talk to the model
    options().enable_tools = false;
}

std::vector<AIMessage> PromptAgent::system_messages(const AgentContext& context) const {
    std::vector<AIMessage> messages;
    if (!system_prompt().empty()) {
        nlohmann::json data = {
            {"artifacts", context.artifacts},
            {"shared_state", context.shared_state},
            {"project_dir", context.project_dir}
        };
        messages.push_back(AIMessage{"system", PromptTemplateRenderer::render(system_prompt(), data)});
    }
    if (!constraints().empty()) {
        std::string text = "CONSTRAINTS:";
        for (const auto& c : constraints()) {
            text += "\n- " + c;
        }
        messages.push_back(AIMessage{"system", std::move(text)});
    }
    return messages;
}

AIResponse PromptAgent::execute(AgentContext& context, const std::string& task) {
    if (!context.ai_provider) {
        throw std::runtime_error("Agent '" + name() + "' has no AI provider in its context");
    }

    std::vector<AIMessage> messages = system_messages(context);
    for (const auto& [role, content] : examples_) {
        messages.push_back(AIMessage{role, content});
    }
    messages.insert(messages.end(), context.conversation_history.begin(), context.conversation_history.end());
    messages.push_back(AIMessage{"user", task});

    return context.ai_provider->chat(messages);
}

double PromptAgent::can_handle(const std::string& task) const {
    const std::string lowered = to_lower(task);
    double score = 0.3;

    if (!role_.empty() && lowered.find(to_lower(role_)) != std::string::npos) {
        score += 0.3;
    }

    std::string spaced = to_lower(name());
    std::replace(spaced.begin(), spaced.end(), '-', ' ');
    std::replace(spaced.begin(), spaced.end(), '_', ' ');
    std::istringstream parts(spaced);
    std::string part;
    while (parts >> part) {
        if (lowered.find(part) != std::string::npos) {
            score += 0.15;
        }
    }
    return std::min(score, 1.0);
}

std::shared_ptr<Agent> load_yaml_agent_from_string(const std::string& yaml_text) {
    nlohmann::json definition;
    try {
        definition = parse_yaml_string(yaml_text);
    } catch (const YAML::Exception& e) {
        throw AgentLoadError(std::string("Invalid YAML in agent definition: ") + e.what());
    }
    return std::make_shared<PromptAgent>(definition);
}

std::shared_ptr<Agent> load_yaml_agent(const std::string& file_path) {
    namespace fs = std::filesystem;
    fs::path path(file_path);

    if (!fs::exists(path)) {
        throw AgentLoadError("Agent definition file not found: " + file_path);
    }
    const std::string ext = path.extension().string();
    if (ext != ".yaml" && ext != ".yml") {
        throw AgentLoadError("Expected .yaml or .yml file, got: " + ext);
    }

    nlohmann::json definition;
    try {
        definition = load_yaml_file(file_path);
    } catch (const YAML::Exception& e) {
        throw AgentLoadError(std::string("Invalid YAML in agent definition: ") + e.what());
    }
    return std::make_shared<PromptAgent>(definition);
}

std::vector<std::shared_ptr<Agent>> load_agents_from_directory(const std::string& directory) {
    namespace fs = std::filesystem;
    std::vector<std::shared_ptr<Agent>> agents;

    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        log_warning("Agent directory not found: " + directory);
        return agents;
    }

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(directory)) {
        const std::string ext = entry.path().extension().string();
        if (entry.is_regular_file() && (ext == ".yaml" || ext == ".yml")) {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());

    for (const auto& file : files) {
        try {
            agents.push_back(load_yaml_agent(file.string()));
        } catch (const AgentLoadError& e) {
            log_warning("Failed to load agent from " + file.string() + ": " + e.what());
        }
    }
    return agents;
}

} // namespace agentteam
