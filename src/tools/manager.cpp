// src/tools/manager.cpp
#include "agentteam/tools/manager.h"
#include "common/logging.h"

namespace agentteam {

ToolManager::ToolManager(ToolRegistry& registry)
    : ToolManager(registry, Config{}) {}

ToolManager::ToolManager(ToolRegistry& registry, Config config, NoticeSink notice_sink)
    : registry_(registry), config_(config), notice_sink_(std::move(notice_sink)) {}

ToolManager::~ToolManager() {
    shutdown_all();
}

void ToolManager::notify(const std::string& message) const {
    if (notice_sink_) {
        notice_sink_(message);
    }
}

std::vector<ToolDefinition> ToolManager::get_tools_for_scope(const std::optional<std::string>& stage,
                                                             const std::optional<std::string>& agent) {
    std::vector<ToolDefinition> tools;

    for (const auto& scoped : registry_.get_for_scope(stage, agent)) {
        const std::string handler_name = scoped->name();
        ToolRegistry::HandlerPtr handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (failed_.count(handler_name)) continue;
            auto it = connected_.find(handler_name);
            if (it != connected_.end()) handler = it->second;
        }

        if (!handler) {
            ensure_connected(scoped);
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = connected_.find(handler_name);
            if (failed_.count(handler_name) || it == connected_.end()) continue;
            handler = it->second;
        }

        // list_tools() may block on the server; the lock is not held
        std::vector<ToolDefinition> handler_tools = handler->list_tools();

        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& tool : handler_tools) {
            auto it = tool_map_.find(tool.name);
            if (it != tool_map_.end() && it->second != handler_name) {
                log_warning("Tool name collision: '" + tool.name + "' already registered by '" + it->second +
                            "', ignoring from '" + handler_name + "'");
                continue;
            }
            tool_map_[tool.name] = handler_name;
            tool.handler_name = handler_name;
            tools.push_back(std::move(tool));
        }
    }
    return tools;
}

nlohmann::json ToolManager::get_tools_as_schema(const std::optional<std::string>& stage,
                                                const std::optional<std::string>& agent) {
    nlohmann::json schema = nlohmann::json::array();
    for (const auto& tool : get_tools_for_scope(stage, agent)) {
        nlohmann::json parameters = tool.input_schema;
        if (!parameters.is_object() || parameters.empty()) {
            parameters = {{"type", "object"}, {"properties", nlohmann::json::object()}};
        }
        schema.push_back({
            {"type", "function"},
            {"function", {
                {"name", tool.name},
                {"description", tool.description},
                {"parameters", std::move(parameters)}
            }}
        });
    }
    return schema;
}

ToolResult ToolManager::call_tool(const std::string& tool_name, const nlohmann::json& arguments) {
    std::string handler_name;
    ToolRegistry::HandlerPtr handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tool_map_.find(tool_name);
        if (it == tool_map_.end()) {
            return ToolResult::failure("Unknown tool: " + tool_name, ToolErrorKind::UNKNOWN_TOOL);
        }
        handler_name = it->second;
        auto conn = connected_.find(handler_name);
        if (failed_.count(handler_name) || conn == connected_.end()) {
            return ToolResult::failure("Handler '" + handler_name + "' is unavailable",
                                       ToolErrorKind::HANDLER_UNAVAILABLE);
        }
        handler = conn->second;
    }

    // 不持锁调用 handler; 并发调用之间只在计数时同步
    ToolResult result = handler->call_tool(tool_name, arguments);

    std::string notice;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (result.is_error) {
            int count = ++error_counts_[handler_name];
            if (count >= config_.circuit_breaker_threshold && failed_.insert(handler_name).second) {
                log_warning("Circuit breaker tripped for handler '" + handler_name + "' after " +
                            std::to_string(count) + " errors");
                notice = "Tool handler '" + handler_name + "' disabled after " + std::to_string(count) +
                         " consecutive failures";
            }
        } else {
            error_counts_[handler_name] = 0;
        }
    }
    if (!notice.empty()) {
        notify(notice);
    }
    return result;
}

void ToolManager::shutdown_all() {
    std::vector<ToolRegistry::HandlerPtr> to_disconnect;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, handler] : connected_) {
            to_disconnect.push_back(handler);
        }
    }

    for (const auto& handler : to_disconnect) {
        try {
            handler->disconnect();
        } catch (const std::exception& e) {
            log_warning("Error disconnecting handler '" + handler->name() + "': " + e.what());
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    connected_.clear();
    tool_map_.clear();
    error_counts_.clear();
    failed_.clear();
}

bool ToolManager::is_connected(const std::string& handler_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_.count(handler_name) > 0;
}

bool ToolManager::is_failed(const std::string& handler_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_.count(handler_name) > 0;
}

int ToolManager::error_count(const std::string& handler_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = error_counts_.find(handler_name);
    return it != error_counts_.end() ? it->second : 0;
}

std::optional<std::string> ToolManager::handler_for_tool(const std::string& tool_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tool_map_.find(tool_name);
    if (it == tool_map_.end()) return std::nullopt;
    return it->second;
}

void ToolManager::ensure_connected(const ToolRegistry::HandlerPtr& handler) {
    const std::string& name = handler->name();
    std::string notice;
    {
        // held across connect(): a handler is never connected twice
        std::lock_guard<std::mutex> lock(mutex_);
        if (connected_.count(name) || failed_.count(name)) {
            return;
        }
        try {
            handler->connect();
            if (handler->is_connected()) {
                connected_[name] = handler;
            } else {
                failed_.insert(name);
                log_warning("Handler '" + name + "' connect() completed but is not connected");
            }
        } catch (const std::exception& e) {
            log_warning("Failed to connect tool handler '" + name + "': " + e.what());
            failed_.insert(name);
            notice = "Tool handler '" + name + "' failed to connect: " + e.what();
        }
    }
    if (!notice.empty()) {
        notify(notice);
    }
}

} // namespace agentteam
