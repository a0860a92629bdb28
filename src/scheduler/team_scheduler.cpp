// src/scheduler/team_scheduler.cpp
#include "agentteam/scheduler/team_scheduler.h"
#include "agentteam/scheduler/worker_pool.h"
#include "common/logging.h"
#include <algorithm>
#include <condition_variable>
#include <queue>
#include <set>
#include <stdexcept>

namespace agentteam {

namespace {

// Indices of finished tasks, pushed by pool threads and drained by the scheduling loop
class CompletionQueue {
public:
    void push(size_t index) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            done_.push(index);
        }
        cv_.notify_one();
    }

    size_t pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return !done_.empty(); });
        size_t index = done_.front();
        done_.pop();
        return index;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<size_t> done_;
};

bool intersects(const std::set<ArtifactName>& a, const std::set<ArtifactName>& b) {
    for (const auto& item : a) {
        if (b.count(item)) return true;
    }
    return false;
}

// Copy keys that the task added or changed
void merge_changed(const nlohmann::json& before, const nlohmann::json& after, nlohmann::json& target) {
    if (!after.is_object()) return;
    if (!target.is_object()) target = nlohmann::json::object();
    for (auto it = after.begin(); it != after.end(); ++it) {
        auto prev = before.is_object() ? before.find(it.key()) : before.end();
        if (!before.is_object() || prev == before.end() || *prev != it.value()) {
            target[it.key()] = it.value();
        }
    }
}

} // namespace

nlohmann::json ExecutionLogEntry::to_json() const {
    if (kind == Kind::DELEGATION) {
        return {{"type", "delegation"}, {"from", from}, {"to", to}, {"task", task}};
    }
    return {{"type", "execution"}, {"agent", agent}, {"task", task}};
}

TeamScheduler::TeamScheduler(AgentRegistry& registry, AgentContext& context)
    : TeamScheduler(registry, context, Config{}) {}

TeamScheduler::TeamScheduler(AgentRegistry& registry, AgentContext& context, Config config)
    : registry_(registry), context_(context), config_(config) {}

TeamPlan TeamScheduler::plan(const std::string& objective, const std::vector<std::string>& agent_names) {
    if (!context_.ai_provider) {
        throw std::runtime_error("Cannot plan without an AI provider in the context");
    }

    const std::vector<std::string> available = agent_names.empty() ? registry_.list_names() : agent_names;

    std::string agent_lines;
    for (const auto& name : available) {
        if (!registry_.contains(name)) {
            log_debug("Planner skipping unknown agent '" + name + "'");
            continue;
        }
        auto agent = registry_.get(name);
        agent_lines += "- " + agent->name() + ": " + agent->description() + "\n";
    }

    std::string prompt =
        "You are a project planner. Decompose the following objective "
        "into discrete tasks and assign each to exactly one agent.\n\n"
        "Objective: " + objective + "\n\n"
        "Available agents:\n" + agent_lines + "\n"
        "Respond as a numbered list. Prefix each task with the agent "
        "name in square brackets.  Indent sub-tasks under their parent.\n"
        "Example:\n"
        "1. [cloud-architect] Design the overall architecture\n"
        "   1a. [terraform] Generate networking module\n"
        "2. [app-developer] Build the API service\n";

    ChatOptions options;
    options.temperature = config_.plan_temperature;
    options.max_tokens = config_.plan_max_tokens;

    AIResponse response = context_.ai_provider->chat({AIMessage{"user", prompt}}, options);
    return parse_plan(objective, response.content, available);
}

std::vector<std::string> TeamScheduler::check_contracts(const TeamPlan& plan) const {
    std::vector<std::string> warnings;
    std::set<ArtifactName> available;
    {
        std::lock_guard<std::mutex> lock(log_mutex_);
        if (context_.artifacts.is_object()) {
            for (auto it = context_.artifacts.begin(); it != context_.artifacts.end(); ++it) {
                available.insert(it.key());
            }
        }
    }

    for (const auto& task : plan.tasks) {
        auto agent = resolve_agent(task.assigned_agent);
        if (!agent) continue;

        AgentContract contract = read_contract(agent);
        for (const auto& input : contract.inputs) {
            if (!available.count(input)) {
                warnings.push_back("Agent '" + *task.assigned_agent + "' expects artifact '" + input +
                                   "' which may not be available at execution time");
            }
        }
        // 假定该 agent 会产出其声明的 outputs
        available.insert(contract.outputs.begin(), contract.outputs.end());
    }
    return warnings;
}

std::vector<AgentTask>& TeamScheduler::execute_plan(TeamPlan& plan) {
    for (auto& task : plan.tasks) {
        execute_task(task, nullptr);
    }
    return plan.tasks;
}

std::vector<AgentTask>& TeamScheduler::execute_plan_parallel(TeamPlan& plan) {
    return execute_plan_parallel(plan, config_.max_workers);
}

std::vector<AgentTask>& TeamScheduler::execute_plan_parallel(TeamPlan& plan, int max_workers) {
    if (plan.tasks.empty()) {
        return plan.tasks;
    }
    if (max_workers <= 0) {
        throw std::invalid_argument("max_workers must be positive, got " + std::to_string(max_workers));
    }

    const size_t n = plan.tasks.size();

    // 1. resolve each task's agent once and read its contract
    std::vector<AgentPtr> agents(n);
    std::vector<AgentContract> contracts(n);
    for (size_t i = 0; i < n; ++i) {
        agents[i] = resolve_agent(plan.tasks[i].assigned_agent);
        contracts[i] = read_contract(agents[i]);
    }

    // 2. depends_on[i] = { j != i : inputs[i] ∩ outputs[j] != ∅ }
    std::vector<std::set<size_t>> depends_on(n);
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < n; ++j) {
            if (i != j && intersects(contracts[i].inputs, contracts[j].outputs)) {
                depends_on[i].insert(j);
            }
        }
    }

    // 3. release tasks as their dependencies complete
    std::set<size_t> completed;
    std::set<size_t> remaining;
    for (size_t i = 0; i < n; ++i) remaining.insert(i);

    CompletionQueue done;
    size_t in_flight = 0;
    {
        WorkerPool pool(max_workers);

        while (!remaining.empty() || in_flight > 0) {
            std::vector<size_t> ready;
            for (size_t i : remaining) {
                if (std::includes(completed.begin(), completed.end(),
                                  depends_on[i].begin(), depends_on[i].end())) {
                    ready.push_back(i);
                }
            }

            if (ready.empty() && in_flight == 0) {
                log_warning("Dependency cycle among " + std::to_string(remaining.size()) +
                            " tasks, running them sequentially");
                for (size_t i : remaining) {
                    execute_task(plan.tasks[i], agents[i]);
                    completed.insert(i);
                }
                remaining.clear();
                break;
            }

            for (size_t i : ready) {
                remaining.erase(i);
                ++in_flight;
                pool.submit([this, &plan, &agents, &done, i]() {
                    try {
                        execute_task(plan.tasks[i], agents[i]);
                    } catch (const std::exception& e) {
                        log_error("Parallel task " + std::to_string(i) + " failed: " + e.what());
                        // 已完成的任务保持其终态
                        if (!is_terminal(plan.tasks[i].status)) {
                            fail_task(plan.tasks[i], TaskErrorKind::EXECUTION_FAILED, e.what());
                            skip_sub_tasks(plan.tasks[i]);
                        }
                    }
                    done.push(i);
                });
            }

            // wait for the fastest task, then re-evaluate readiness
            size_t finished = done.pop();
            --in_flight;
            completed.insert(finished);
        }
    }
    return plan.tasks;
}

TeamPlan TeamScheduler::run_team(const std::string& objective, const std::vector<std::string>& agent_names) {
    TeamPlan team_plan = plan(objective, agent_names);
    execute_plan(team_plan);
    return team_plan;
}

AIResponse TeamScheduler::delegate(const std::string& from_agent,
                                   const std::string& to_agent,
                                   const std::string& sub_task) {
    AgentPtr agent = resolve_agent(to_agent);
    if (!agent) {
        AIResponse missing;
        missing.content = "Error: agent '" + to_agent + "' not found.";
        missing.model = "none";
        return missing;
    }

    AgentContext sub_context;
    {
        std::lock_guard<std::mutex> lock(log_mutex_);
        log_.push_back(ExecutionLogEntry{ExecutionLogEntry::Kind::DELEGATION, from_agent, to_agent, "", sub_task});
        sub_context = context_.fork();
    }

    try {
        return agent->execute(sub_context, sub_task);
    } catch (const std::exception& e) {
        log_error("Delegation from '" + from_agent + "' to '" + to_agent + "' failed: " + e.what());
        AIResponse failed;
        failed.content = std::string("Error: ") + e.what();
        failed.model = "none";
        failed.finish_reason = "error";
        return failed;
    }
}

std::vector<ExecutionLogEntry> TeamScheduler::execution_log() const {
    std::lock_guard<std::mutex> lock(log_mutex_);
    return log_;
}

TeamScheduler::AgentPtr TeamScheduler::resolve_agent(const std::optional<std::string>& name) const {
    if (!name || name->empty()) {
        return nullptr;
    }
    try {
        return registry_.get(*name);
    } catch (const AgentNotFoundError& e) {
        log_debug(e.what());
        return nullptr;
    }
}

void TeamScheduler::fail_task(AgentTask& task, TaskErrorKind kind, const std::string& message) {
    task.status = TaskStatus::FAILED;
    task.error = TaskError{kind, message};
    AIResponse result;
    result.content = "Error: " + message;
    result.model = "none";
    result.finish_reason = "error";
    task.result = std::move(result);
}

void TeamScheduler::skip_sub_tasks(AgentTask& task) {
    for (auto& sub : task.sub_tasks) {
        if (is_terminal(sub.status)) continue;
        fail_task(sub, TaskErrorKind::PARENT_FAILED, "parent task '" + task.description + "' failed");
        skip_sub_tasks(sub);
    }
}

void TeamScheduler::execute_task(AgentTask& task, AgentPtr agent) {
    if (is_terminal(task.status)) {
        log_debug("Task already " + to_string(task.status) + ", not re-running: " + task.description);
        return;
    }

    // find_best_match() runs agent code (can_handle), so assignment fails this task only
    try {
        if (!agent) {
            agent = assign_agent(task);
        }
    } catch (const std::exception& e) {
        log_error("Agent assignment failed for '" + task.description + "': " + e.what());
        fail_task(task, TaskErrorKind::EXECUTION_FAILED, e.what());
        skip_sub_tasks(task);
        return;
    }
    if (!agent) {
        skip_sub_tasks(task);
        return;
    }

    const std::string agent_name = agent->name();
    task.status = TaskStatus::RUNNING;

    try {
        std::string enriched;
        AgentContext snapshot;
        {
            std::lock_guard<std::mutex> lock(log_mutex_);
            log_.push_back(ExecutionLogEntry{ExecutionLogEntry::Kind::EXECUTION, "", "", agent_name, task.description});
            enriched = enrich_task_locked(task);
            snapshot = context_.fork();
        }
        AgentContext working = snapshot.fork();

        AIResponse response = agent->execute(working, enriched);
        {
            std::lock_guard<std::mutex> lock(log_mutex_);
            merge_back_locked(snapshot, working);
            context_.conversation_history.push_back(AIMessage{"assistant", "[" + agent_name + "]: " + response.content});
        }
        task.result = std::move(response);
        task.status = TaskStatus::COMPLETED;
    } catch (const std::exception& e) {
        log_error("Agent '" + agent_name + "' failed: " + e.what());
        fail_task(task, TaskErrorKind::EXECUTION_FAILED, e.what());
        skip_sub_tasks(task);
        return;
    }

    for (auto& sub : task.sub_tasks) {
        execute_task(sub, nullptr);
    }
}

TeamScheduler::AgentPtr TeamScheduler::assign_agent(AgentTask& task) {
    AgentPtr agent;
    if (!task.assigned_agent || task.assigned_agent->empty()) {
        agent = registry_.find_best_match(task.description);
        if (!agent) {
            log_warning("No agent could be assigned for: " + task.description);
            fail_task(task, TaskErrorKind::NO_AGENT_ASSIGNED, "no agent could be assigned for: " + task.description);
            return nullptr;
        }
        task.assigned_agent = agent->name();
        return agent;
    }

    agent = resolve_agent(task.assigned_agent);
    if (!agent) {
        log_warning("Agent '" + *task.assigned_agent + "' not found for: " + task.description);
        fail_task(task, TaskErrorKind::AGENT_NOT_FOUND, "agent '" + *task.assigned_agent + "' not found");
    }
    return agent;
}

AgentContract TeamScheduler::read_contract(const AgentPtr& agent) const {
    if (!agent) {
        return AgentContract{};
    }
    try {
        return agent->get_contract();
    } catch (const std::exception& e) {
        log_warning("Could not read contract of agent '" + agent->name() + "', treating it as empty: " + e.what());
        return AgentContract{};
    }
}

std::string TeamScheduler::enrich_task_locked(const AgentTask& task) const {
    std::string prior;
    for (const auto& entry : log_) {
        if (entry.kind != ExecutionLogEntry::Kind::EXECUTION || entry.task == task.description) continue;
        if (!prior.empty()) prior += "\n";
        prior += "[" + entry.agent + "]: completed";
    }
    if (prior.empty()) {
        return task.description;
    }
    return "Previous agent work:\n" + prior + "\n\nYour task: " + task.description;
}

void TeamScheduler::merge_back_locked(const AgentContext& snapshot, const AgentContext& result) {
    merge_changed(snapshot.artifacts, result.artifacts, context_.artifacts);
    merge_changed(snapshot.shared_state, result.shared_state, context_.shared_state);
}

} // namespace agentteam
