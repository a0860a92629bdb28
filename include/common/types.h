#ifndef AGENTTEAM_COMMON_TYPES_H
#define AGENTTEAM_COMMON_TYPES_H

#include <string>
#include <unordered_map>
#include <vector>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace agentteam {

// 使用 nlohmann::json 作为统一的数据类型
using Value = nlohmann::json;

// Artifact key produced/consumed by an agent, e.g. "architecture"
using ArtifactName = std::string;

// A tool invocation requested by the model
struct ToolCall {
    std::string id;
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();
};

// A message in an AI conversation ("system", "user", "assistant", "tool")
struct AIMessage {
    std::string role;
    std::string content;
    std::optional<std::string> tool_call_id; // set on role == "tool"
    std::vector<ToolCall> tool_calls;        // set on assistant turns that requested tools
    nlohmann::json metadata = nlohmann::json::object();
};

// Response from an AI provider, also the result type of an agent execution
struct AIResponse {
    std::string content;
    std::string model;
    std::unordered_map<std::string, int> usage; // token counters
    nlohmann::json metadata = nlohmann::json::object();
    std::string finish_reason = "stop";
    std::vector<ToolCall> tool_calls;
};

// 任务状态: PENDING -> RUNNING -> {COMPLETED | FAILED}
enum class TaskStatus : uint8_t {
    PENDING,
    RUNNING,
    COMPLETED,
    FAILED
};

inline std::string to_string(TaskStatus status) {
    switch (status) {
        case TaskStatus::PENDING: return "pending";
        case TaskStatus::RUNNING: return "running";
        case TaskStatus::COMPLETED: return "completed";
        case TaskStatus::FAILED: return "failed";
    }
    return "unknown";
}

inline bool is_terminal(TaskStatus status) {
    return status == TaskStatus::COMPLETED || status == TaskStatus::FAILED;
}

enum class TaskErrorKind : uint8_t {
    NO_AGENT_ASSIGNED, // no agent named and none matched the description
    AGENT_NOT_FOUND,   // the named agent is not in the registry
    EXECUTION_FAILED,  // Agent::execute threw
    PARENT_FAILED      // sub-task skipped because its parent failed
};

struct TaskError {
    TaskErrorKind kind;
    std::string message;
};

// A tool exposed by a handler
struct ToolDefinition {
    std::string name;
    std::string description;
    nlohmann::json input_schema = nlohmann::json::object(); // JSON Schema for arguments
    std::string handler_name;                                // owning handler
};

enum class ToolErrorKind : uint8_t {
    NONE,
    UNKNOWN_TOOL,        // no handler routes this tool name
    HANDLER_UNAVAILABLE, // handler is circuit-broken or gone
    CALL_FAILED          // handler reported an error
};

// Result from a tool invocation. Handlers report failure here, never by throwing.
struct ToolResult {
    std::string content;
    bool is_error = false;
    std::string error_message;
    nlohmann::json metadata = nlohmann::json::object();
    ToolErrorKind error_kind = ToolErrorKind::NONE;

    static ToolResult success(std::string content, nlohmann::json metadata = nlohmann::json::object()) {
        ToolResult r;
        r.content = std::move(content);
        r.metadata = std::move(metadata);
        return r;
    }

    static ToolResult failure(std::string message, ToolErrorKind kind = ToolErrorKind::CALL_FAILED) {
        ToolResult r;
        r.is_error = true;
        r.error_message = std::move(message);
        r.error_kind = kind;
        return r;
    }
};

} // namespace agentteam

#endif // AGENTTEAM_COMMON_TYPES_H
