// agentteam/tools/local_handler.h
#ifndef AGENTTEAM_TOOLS_LOCAL_HANDLER_H
#define AGENTTEAM_TOOLS_LOCAL_HANDLER_H

#include "agentteam/tools/tool_handler.h"
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentteam {

/**
 * LocalToolHandler: 进程内工具
 *
 * Tools are C++ callables taking the JSON arguments and returning JSON.
 * A returned {"error": "..."} object or a thrown exception becomes an
 * error ToolResult; string results are passed through, anything else
 * is serialized. Results are cut at max_result_bytes.
 */
class LocalToolHandler : public ToolHandler {
public:
    using ToolFunc = std::function<nlohmann::json(const nlohmann::json&)>;

    explicit LocalToolHandler(ToolHandlerConfig config, nlohmann::json project_config = nlohmann::json::object());

    template<typename Func>
    void register_tool(std::string name, std::string description, nlohmann::json input_schema, Func&& func) {
        std::lock_guard<std::mutex> lock(mutex_);
        ToolDefinition def{name, std::move(description), std::move(input_schema), this->name()};
        if (funcs_.count(name) == 0) {
            order_.push_back(name);
        }
        defs_[name] = std::move(def);
        funcs_[std::move(name)] = ToolFunc(std::forward<Func>(func));
    }

    // calculate(a, b, op) and echo(text)
    void register_default_tools();

    void connect() override;
    std::vector<ToolDefinition> list_tools() override;
    ToolResult call_tool(const std::string& name, const nlohmann::json& arguments) override;
    void disconnect() override;

private:
    mutable std::mutex mutex_;
    std::vector<std::string> order_;
    std::unordered_map<std::string, ToolDefinition> defs_;
    std::unordered_map<std::string, ToolFunc> funcs_;
};

} // namespace agentteam

#endif // AGENTTEAM_TOOLS_LOCAL_HANDLER_H
