// agentteam/tools/tool_handler.h
#ifndef AGENTTEAM_TOOLS_TOOL_HANDLER_H
#define AGENTTEAM_TOOLS_TOOL_HANDLER_H

#include "common/types.h"
#include <atomic>
#include <optional>
#include <string>
#include <vector>

namespace agentteam {

// Identity sent to tool servers during their handshake
struct ClientInfo {
    std::string name = "agentteam";
    std::string version = "1.0.0";

    nlohmann::json to_json() const { return {{"name", name}, {"version", version}}; }
};

// One entry of tools.servers in agentteam.yaml
struct ToolHandlerConfig {
    std::string name;
    std::string type = "local";                       // key into ToolHandlerFactory
    std::optional<std::vector<std::string>> stages;   // nullopt = all stages
    std::optional<std::vector<std::string>> agents;   // nullopt = all agents
    bool enabled = true;
    int timeout_sec = 30;
    int max_retries = 2;
    size_t max_result_bytes = 8192;
    nlohmann::json settings = nlohmann::json::object();

    // Throws std::invalid_argument when "name" is missing
    static ToolHandlerConfig from_json(const nlohmann::json& j);
};

/**
 * ToolHandler: 单个工具服务器的适配器
 *
 * A handler owns its transport, auth and protocol. Contract:
 *   connect()    - called lazily on first use; must leave is_connected() true on success
 *   list_tools() - called after connect()
 *   call_tool()  - must never throw; failures are ToolResult::failure()
 *   disconnect() - safe to call more than once
 */
class ToolHandler {
public:
    explicit ToolHandler(ToolHandlerConfig config, nlohmann::json project_config = nlohmann::json::object());
    virtual ~ToolHandler() = default;

    ToolHandler(const ToolHandler&) = delete;
    ToolHandler& operator=(const ToolHandler&) = delete;

    virtual void connect() = 0;
    virtual std::vector<ToolDefinition> list_tools() = 0;
    virtual ToolResult call_tool(const std::string& name, const nlohmann::json& arguments) = 0;
    virtual void disconnect() = 0;

    virtual bool health_check() const { return is_connected(); }

    // 是否对给定 stage / agent 可见; an absent stage or agent is not filtered
    bool matches_scope(const std::optional<std::string>& stage, const std::optional<std::string>& agent) const;

    const std::string& name() const { return config_.name; }
    const ToolHandlerConfig& config() const { return config_; }
    const ClientInfo& client_info() const { return client_info_; }
    const nlohmann::json& project_config() const { return project_config_; }
    bool is_connected() const { return connected_.load(); }

protected:
    void set_connected(bool connected) { connected_.store(connected); }

private:
    ToolHandlerConfig config_;
    ClientInfo client_info_;
    nlohmann::json project_config_;
    std::atomic<bool> connected_{false};
};

} // namespace agentteam

#endif // AGENTTEAM_TOOLS_TOOL_HANDLER_H
