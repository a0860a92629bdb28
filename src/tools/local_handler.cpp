// src/tools/local_handler.cpp
#include "agentteam/tools/local_handler.h"
#include <stdexcept>

namespace agentteam {

LocalToolHandler::LocalToolHandler(ToolHandlerConfig config, nlohmann::json project_config)
    : ToolHandler(std::move(config), std::move(project_config)) {
    if (this->config().settings.value("default_tools", false)) {
        register_default_tools();
    }
}

void LocalToolHandler::register_default_tools() {
    register_tool(
        "calculate", "Apply a binary arithmetic operator to two numbers",
        {
            {"type", "object"},
            {"properties", {
                {"a", {{"type", "number"}}},
                {"b", {{"type", "number"}}},
                {"op", {{"type", "string"}, {"enum", {"+", "-", "*", "/"}}}}
            }},
            {"required", {"a", "b", "op"}}
        },
        [](const nlohmann::json& args) -> nlohmann::json {
            if (!args.contains("a") || !args.contains("b") || !args.contains("op")) {
                return nlohmann::json{{"error", "Missing arguments: a, b, op"}};
            }
            if (!args["a"].is_number() || !args["b"].is_number() || !args["op"].is_string()) {
                return nlohmann::json{{"error", "Invalid number format"}};
            }

            double a = args["a"].get<double>();
            double b = args["b"].get<double>();
            std::string op = args["op"].get<std::string>();

            if (op == "/" && b == 0.0) {
                return nlohmann::json{{"error", "Division by zero"}};
            }

            double result = 0.0;
            if (op == "+") result = a + b;
            else if (op == "-") result = a - b;
            else if (op == "*") result = a * b;
            else if (op == "/") result = a / b;
            else return nlohmann::json{{"error", "Unsupported operator: " + op}};

            return nlohmann::json{{"result", result}};
        });

    register_tool(
        "echo", "Return the given text unchanged",
        {
            {"type", "object"},
            {"properties", {{"text", {{"type", "string"}}}}},
            {"required", nlohmann::json::array({"text"})}
        },
        [](const nlohmann::json& args) -> nlohmann::json {
            return args.value("text", std::string());
        });
}

void LocalToolHandler::connect() {
    set_connected(true);
}

void LocalToolHandler::disconnect() {
    set_connected(false);
}

std::vector<ToolDefinition> LocalToolHandler::list_tools() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ToolDefinition> out;
    out.reserve(order_.size());
    for (const auto& name : order_) {
        out.push_back(defs_.at(name));
    }
    return out;
}

ToolResult LocalToolHandler::call_tool(const std::string& name, const nlohmann::json& arguments) {
    ToolFunc func;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = funcs_.find(name);
        if (it == funcs_.end()) {
            return ToolResult::failure("Tool not found: " + name);
        }
        func = it->second;
    }

    nlohmann::json output;
    try {
        output = func(arguments.is_null() ? nlohmann::json::object() : arguments);
    } catch (const std::exception& e) {
        return ToolResult::failure(std::string("Tool execution failed: ") + e.what());
    }

    if (output.is_object() && output.contains("error")) {
        const auto& err = output["error"];
        return ToolResult::failure(err.is_string() ? err.get<std::string>() : err.dump());
    }

    std::string content = output.is_string() ? output.get<std::string>() : output.dump();
    nlohmann::json metadata = nlohmann::json::object();
    const size_t limit = config().max_result_bytes;
    if (limit > 0 && content.size() > limit) {
        metadata["truncated"] = true;
        metadata["original_bytes"] = content.size();
        content.resize(limit);
    }
    return ToolResult::success(std::move(content), std::move(metadata));
}

} // namespace agentteam
