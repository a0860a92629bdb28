// src/tools/registry.cpp
#include "agentteam/tools/registry.h"
#include "common/logging.h"
#include <algorithm>
#include <stdexcept>

namespace agentteam {

void ToolRegistry::put(Layer& layer, HandlerPtr handler) {
    const std::string name = handler->name();
    auto it = std::find_if(layer.begin(), layer.end(), [&](const auto& e) { return e.first == name; });
    if (it != layer.end()) {
        it->second = std::move(handler);
    } else {
        layer.emplace_back(name, std::move(handler));
    }
}

void ToolRegistry::register_builtin(HandlerPtr handler) {
    if (!handler) throw std::invalid_argument("register_builtin: null handler");
    log_debug("Registering built-in tool handler: " + handler->name());
    put(builtin_, std::move(handler));
}

void ToolRegistry::register_custom(HandlerPtr handler) {
    if (!handler) throw std::invalid_argument("register_custom: null handler");
    log_info("Custom tool handler registered: " + handler->name());
    put(custom_, std::move(handler));
}

ToolRegistry::HandlerPtr ToolRegistry::get(const std::string& name) const {
    for (const Layer* layer : {&custom_, &builtin_}) {
        for (const auto& [n, h] : *layer) {
            if (n == name) return h;
        }
    }
    return nullptr;
}

bool ToolRegistry::contains(const std::string& name) const {
    return get(name) != nullptr;
}

std::vector<ToolRegistry::HandlerPtr> ToolRegistry::list_all() const {
    Layer resolved = builtin_;
    for (const auto& entry : custom_) {
        put(resolved, entry.second);
    }
    std::vector<HandlerPtr> out;
    out.reserve(resolved.size());
    for (auto& entry : resolved) {
        out.push_back(std::move(entry.second));
    }
    return out;
}

std::vector<ToolRegistry::HandlerPtr> ToolRegistry::get_for_scope(const std::optional<std::string>& stage,
                                                                  const std::optional<std::string>& agent) const {
    std::vector<HandlerPtr> out;
    for (auto& h : list_all()) {
        if (h->matches_scope(stage, agent)) {
            out.push_back(std::move(h));
        }
    }
    return out;
}

} // namespace agentteam
