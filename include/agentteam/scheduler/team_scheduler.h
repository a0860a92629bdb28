// agentteam/scheduler/team_scheduler.h
#ifndef AGENTTEAM_SCHEDULER_TEAM_SCHEDULER_H
#define AGENTTEAM_SCHEDULER_TEAM_SCHEDULER_H

#include "agentteam/core/agent_context.h"
#include "agentteam/core/agent_registry.h"
#include "common/types.h"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agentteam {

// 一个分配给 agent 的任务; sub_tasks run after the task itself completes
struct AgentTask {
    std::string description;
    std::optional<std::string> assigned_agent;
    std::vector<AgentTask> sub_tasks;
    std::optional<AIResponse> result;
    TaskStatus status = TaskStatus::PENDING;
    std::optional<TaskError> error; // set when status == FAILED

    AgentTask() = default;
    explicit AgentTask(std::string description, std::optional<std::string> assigned_agent = std::nullopt)
        : description(std::move(description)), assigned_agent(std::move(assigned_agent)) {}
};

struct TeamPlan {
    std::string objective;
    std::vector<AgentTask> tasks;
};

struct ExecutionLogEntry {
    enum class Kind : uint8_t {
        DELEGATION, // from -> to
        EXECUTION   // agent
    };

    Kind kind;
    std::string from;
    std::string to;
    std::string agent;
    std::string task;

    nlohmann::json to_json() const;
};

/**
 * TeamScheduler: 计划执行与委派
 *
 * Ordering between top-level tasks comes from agent contracts: task i waits
 * for task j when an input of i's agent is an output of j's agent. Sub-tasks
 * are not part of that graph.
 *
 * Agents never write the shared context directly. Each task runs on a fork
 * of it; when the task completes, the artifacts and shared_state keys it
 * changed are merged back (last write wins) and an "[agent]: content"
 * assistant message is appended to the conversation history. Those writes
 * and the execution log are serialized by one scheduler mutex.
 */
class TeamScheduler {
public:
    struct Config {
        int max_workers = 4;
        float plan_temperature = 0.2f;
        int plan_max_tokens = 2048;
    };

    TeamScheduler(AgentRegistry& registry, AgentContext& context);
    TeamScheduler(AgentRegistry& registry, AgentContext& context, Config config);

    TeamScheduler(const TeamScheduler&) = delete;
    TeamScheduler& operator=(const TeamScheduler&) = delete;

    // Ask the context's provider to break `objective` into agent-assigned tasks.
    // Empty agent_names = every registered agent. Throws when the context has no provider.
    TeamPlan plan(const std::string& objective, const std::vector<std::string>& agent_names = {});

    // "1. [agent] text" lines; indented or "1a."-numbered lines become sub-tasks.
    // Agents not in available_agents are dropped from the line, leaving the task unassigned.
    static TeamPlan parse_plan(const std::string& objective,
                               const std::string& plan_text,
                               const std::vector<std::string>& available_agents);

    // Warnings for inputs no earlier task (or existing artifact) provides
    std::vector<std::string> check_contracts(const TeamPlan& plan) const;

    // Tasks in order, sub-tasks depth-first. One failure does not stop the rest.
    std::vector<AgentTask>& execute_plan(TeamPlan& plan);

    // Throws std::invalid_argument when max_workers <= 0 and the plan is not empty
    std::vector<AgentTask>& execute_plan_parallel(TeamPlan& plan, int max_workers);
    std::vector<AgentTask>& execute_plan_parallel(TeamPlan& plan);

    // plan() then execute_plan()
    TeamPlan run_team(const std::string& objective, const std::vector<std::string>& agent_names = {});

    // Runs `sub_task` on `to_agent` against a fork of the context; nothing is merged back.
    // Never throws: an unknown agent or a failing execution comes back as an "Error: ..." response.
    AIResponse delegate(const std::string& from_agent, const std::string& to_agent, const std::string& sub_task);

    std::vector<ExecutionLogEntry> execution_log() const;

    const Config& config() const { return config_; }

private:
    using AgentPtr = std::shared_ptr<Agent>;

    // agent may be null: resolved (or auto-assigned) here
    void execute_task(AgentTask& task, AgentPtr agent);
    void fail_task(AgentTask& task, TaskErrorKind kind, const std::string& message);
    void skip_sub_tasks(AgentTask& task);
    AgentPtr resolve_agent(const std::optional<std::string>& name) const;
    // Named agent, or the best match for an unassigned task. Marks the task
    // FAILED and returns null when none is found; may throw from can_handle().
    AgentPtr assign_agent(AgentTask& task);
    // Empty contract for a null agent or when get_contract() throws
    AgentContract read_contract(const AgentPtr& agent) const;

    // caller holds log_mutex_
    std::string enrich_task_locked(const AgentTask& task) const;
    void merge_back_locked(const AgentContext& snapshot, const AgentContext& result);

    AgentRegistry& registry_;
    AgentContext& context_;
    Config config_;

    mutable std::mutex log_mutex_; // guards log_ and the shared context
    std::vector<ExecutionLogEntry> log_;
};

} // namespace agentteam

#endif // AGENTTEAM_SCHEDULER_TEAM_SCHEDULER_H
