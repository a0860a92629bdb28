// src/core/agent_registry.cpp
#include "agentteam/core/agent_registry.h"
#include "common/logging.h"
#include <algorithm>
#include <unordered_set>

namespace agentteam {

namespace {

std::string join_names(const std::vector<std::string>& names) {
    std::string out;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += ", ";
        out += names[i];
    }
    return out;
}

} // namespace

AgentNotFoundError::AgentNotFoundError(const std::string& agent_name, const std::vector<std::string>& available)
    : std::runtime_error("Agent '" + agent_name + "' not found. Available: " + join_names(available)),
      agent_name_(agent_name) {}

void AgentRegistry::put(Layer& layer, AgentPtr agent) {
    const std::string name = agent->name();
    auto it = std::find_if(layer.begin(), layer.end(), [&](const auto& e) { return e.first == name; });
    if (it != layer.end()) {
        it->second = std::move(agent);
    } else {
        layer.emplace_back(name, std::move(agent));
    }
}

bool AgentRegistry::erase(Layer& layer, const std::string& name) {
    auto it = std::find_if(layer.begin(), layer.end(), [&](const auto& e) { return e.first == name; });
    if (it == layer.end()) return false;
    layer.erase(it);
    return true;
}

AgentRegistry::AgentPtr AgentRegistry::find(const Layer& layer, const std::string& name) {
    auto it = std::find_if(layer.begin(), layer.end(), [&](const auto& e) { return e.first == name; });
    return it != layer.end() ? it->second : nullptr;
}

void AgentRegistry::register_builtin(AgentPtr agent) {
    if (!agent) throw std::invalid_argument("register_builtin: null agent");
    agent->set_builtin(true);
    put(builtin_, std::move(agent));
}

void AgentRegistry::register_override(AgentPtr agent) {
    if (!agent) throw std::invalid_argument("register_override: null agent");
    if (!find(builtin_, agent->name())) {
        log_warning("Override '" + agent->name() + "' has no built-in agent to override");
    }
    agent->set_builtin(false);
    put(overrides_, std::move(agent));
}

void AgentRegistry::register_custom(AgentPtr agent) {
    if (!agent) throw std::invalid_argument("register_custom: null agent");
    agent->set_builtin(false);
    put(custom_, std::move(agent));
}

bool AgentRegistry::remove_custom(const std::string& name) {
    return erase(custom_, name);
}

bool AgentRegistry::remove_override(const std::string& name) {
    return erase(overrides_, name);
}

AgentRegistry::AgentPtr AgentRegistry::get(const std::string& name) const {
    if (auto a = find(custom_, name)) return a;
    if (auto a = find(overrides_, name)) return a;
    if (auto a = find(builtin_, name)) return a;
    throw AgentNotFoundError(name, list_names());
}

bool AgentRegistry::contains(const std::string& name) const {
    return find(custom_, name) || find(overrides_, name) || find(builtin_, name);
}

std::vector<AgentRegistry::AgentPtr> AgentRegistry::find_by_capability(AgentCapability capability) const {
    std::vector<AgentPtr> result;
    std::unordered_set<std::string> seen;
    for (const Layer* layer : {&custom_, &overrides_, &builtin_}) {
        for (const auto& [name, agent] : *layer) {
            if (seen.count(name)) continue;
            if (agent->has_capability(capability)) {
                result.push_back(agent);
                seen.insert(name);
            }
        }
    }
    return result;
}

AgentRegistry::AgentPtr AgentRegistry::find_best_match(const std::string& task) const {
    AgentPtr best;
    double best_score = 0.0;
    for (const auto& agent : list_all()) {
        double score = agent->can_handle(task);
        if (score > best_score) {
            best_score = score;
            best = agent;
        }
    }
    return best;
}

std::vector<AgentRegistry::AgentPtr> AgentRegistry::list_all() const {
    std::vector<AgentPtr> result;
    for (const auto& name : list_names()) {
        result.push_back(get(name));
    }
    return result;
}

std::vector<std::string> AgentRegistry::list_names() const {
    // builtin 顺序在前，新的 override/custom 名字依次追加
    std::vector<std::string> names;
    std::unordered_set<std::string> seen;
    for (const Layer* layer : {&builtin_, &overrides_, &custom_}) {
        for (const auto& entry : *layer) {
            if (seen.insert(entry.first).second) {
                names.push_back(entry.first);
            }
        }
    }
    return names;
}

nlohmann::json AgentRegistry::list_all_detailed() const {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& name : list_names()) {
        std::string source = "builtin";
        if (find(custom_, name)) source = "custom";
        else if (find(overrides_, name)) source = "override";
        nlohmann::json entry = get(name)->to_json();
        entry["source"] = source;
        out.push_back(std::move(entry));
    }
    return out;
}

} // namespace agentteam
