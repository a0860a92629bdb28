// src/tools/handler_factory.cpp
#include "agentteam/tools/handler_factory.h"
#include "agentteam/tools/local_handler.h"
#include "common/logging.h"
#include <stdexcept>

namespace agentteam {

ToolHandlerFactory::ToolHandlerFactory() {
    register_type("local", [](const ToolHandlerConfig& config, const nlohmann::json& project_config) {
        return std::make_shared<LocalToolHandler>(config, project_config);
    });
}

void ToolHandlerFactory::register_type(const std::string& type, Creator creator) {
    creators_[type] = std::move(creator);
}

bool ToolHandlerFactory::has_type(const std::string& type) const {
    return creators_.count(type) > 0;
}

std::vector<std::string> ToolHandlerFactory::types() const {
    std::vector<std::string> out;
    for (const auto& [type, _] : creators_) {
        out.push_back(type);
    }
    return out;
}

std::shared_ptr<ToolHandler> ToolHandlerFactory::create(const ToolHandlerConfig& config,
                                                        const nlohmann::json& project_config) const {
    auto it = creators_.find(config.type);
    if (it == creators_.end()) {
        throw std::invalid_argument("Unknown tool handler type '" + config.type + "' for '" + config.name + "'");
    }
    return it->second(config, project_config);
}

std::vector<std::shared_ptr<ToolHandler>> load_handlers(const std::vector<ToolHandlerConfig>& configs,
                                                        const ToolHandlerFactory& factory,
                                                        const nlohmann::json& project_config) {
    std::vector<std::shared_ptr<ToolHandler>> handlers;
    for (const auto& config : configs) {
        if (!config.enabled) {
            log_debug("Tool handler '" + config.name + "' is disabled, skipping");
            continue;
        }
        if (!factory.has_type(config.type)) {
            log_warning("Unknown tool handler type '" + config.type + "' for '" + config.name + "', skipping");
            continue;
        }
        try {
            auto handler = factory.create(config, project_config);
            if (!handler) {
                log_warning("Tool handler factory returned nothing for '" + config.name + "'");
                continue;
            }
            handlers.push_back(std::move(handler));
        } catch (const std::exception& e) {
            log_warning("Failed to create tool handler '" + config.name + "': " + e.what());
        }
    }
    return handlers;
}

} // namespace agentteam
