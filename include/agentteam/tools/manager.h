// agentteam/tools/manager.h
#ifndef AGENTTEAM_TOOLS_MANAGER_H
#define AGENTTEAM_TOOLS_MANAGER_H

#include "agentteam/tools/registry.h"
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace agentteam {

/**
 * ToolManager: handler 生命周期, 工具路由, 熔断
 *
 * - handlers connect lazily the first time a scope lists them
 * - tool name -> handler name routing; on a name collision the handler
 *   discovered first keeps the tool
 * - a handler that fails to connect, or returns `threshold` consecutive
 *   error results, is disabled until shutdown_all()
 * - the destructor calls shutdown_all()
 *
 * call_tool() may be used from several threads at once. The notice sink is
 * invoked without the manager lock held, so it may call back into the manager.
 * Tools route to the handler instance that was connected, even if the
 * registry later maps that name to another handler.
 */
class ToolManager {
public:
    struct Config {
        int circuit_breaker_threshold = 3;
    };

    // Receives user-facing warnings (handler disabled, connect failure)
    using NoticeSink = std::function<void(const std::string&)>;

    explicit ToolManager(ToolRegistry& registry);
    ToolManager(ToolRegistry& registry, Config config, NoticeSink notice_sink = nullptr);
    ~ToolManager();

    ToolManager(const ToolManager&) = delete;
    ToolManager& operator=(const ToolManager&) = delete;

    std::vector<ToolDefinition> get_tools_for_scope(const std::optional<std::string>& stage = std::nullopt,
                                                    const std::optional<std::string>& agent = std::nullopt);

    // [{"type": "function", "function": {"name", "description", "parameters"}}, ...]
    nlohmann::json get_tools_as_schema(const std::optional<std::string>& stage = std::nullopt,
                                       const std::optional<std::string>& agent = std::nullopt);

    ToolResult call_tool(const std::string& tool_name, const nlohmann::json& arguments);

    // Disconnects every connected handler and forgets all routing and breaker state
    void shutdown_all();

    bool is_connected(const std::string& handler_name) const;
    bool is_failed(const std::string& handler_name) const;
    int error_count(const std::string& handler_name) const;
    std::optional<std::string> handler_for_tool(const std::string& tool_name) const;

private:
    void ensure_connected(const ToolRegistry::HandlerPtr& handler);
    void notify(const std::string& message) const;

    ToolRegistry& registry_;
    Config config_;
    NoticeSink notice_sink_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> tool_map_; // tool -> handler
    std::unordered_map<std::string, ToolRegistry::HandlerPtr> connected_; // instances to disconnect
    std::unordered_set<std::string> failed_;
    std::unordered_map<std::string, int> error_counts_;
};

} // namespace agentteam

#endif // AGENTTEAM_TOOLS_MANAGER_H
