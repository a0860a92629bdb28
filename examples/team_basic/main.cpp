// main.cpp
#include <iostream>
#include <fstream>
#include <memory>
#include <nlohmann/json.hpp>
#include "agentteam/core/agent_registry.h"
#include "agentteam/core/project_config.h"
#include "agentteam/core/prompt_agent.h"
#include "agentteam/llm/llama_provider.h"
#include "agentteam/scheduler/team_scheduler.h"
#include "agentteam/tools/handler_factory.h"
#include "agentteam/tools/manager.h"

namespace {

void print_task(const agentteam::AgentTask& task, int depth) {
    std::string indent(static_cast<size_t>(depth) * 2, ' ');
    std::cout << indent << "- [" << agentteam::to_string(task.status) << "] "
              << task.assigned_agent.value_or("?") << ": " << task.description << "\n";
    if (task.result) {
        std::cout << indent << "  " << task.result->content << "\n";
    }
    for (const auto& sub : task.sub_tasks) {
        print_task(sub, depth + 1);
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <agentteam.yaml> <objective> [--sequential]\n";
        return 1;
    }
    const bool sequential = argc > 3 && std::string(argv[3]) == "--sequential";

    try {
        // 1. 项目配置
        auto config = agentteam::ProjectConfig::from_file(argv[1]);
        agentteam::set_log_level(config.log_level());

        // 2. agents
        agentteam::AgentRegistry registry;
        for (auto& agent : agentteam::load_agents_from_directory(config.agents_directory())) {
            registry.register_custom(std::move(agent));
        }
        if (registry.size() == 0) {
            std::cerr << "[ERROR] No agents found in " << config.agents_directory() << "\n";
            return 1;
        }

        // 3. tool handlers
        agentteam::ToolRegistry tools;
        agentteam::ToolHandlerFactory factory;
        for (auto& handler : agentteam::load_handlers(config.tool_servers(), factory, config.data())) {
            tools.register_builtin(std::move(handler));
        }
        agentteam::ToolManager tool_manager(
            tools,
            agentteam::ToolManager::Config{config.circuit_breaker_threshold()},
            [](const std::string& notice) { std::cerr << "[NOTICE] " << notice << "\n"; });

        // 4. 模型 + 上下文
        agentteam::AgentContext context;
        context.ai_provider = std::make_shared<agentteam::LlamaProvider>(
            agentteam::load_llama_config(config.llm_config_path()));
        context.project_config = config.data();
        context.project_dir = config.base_dir();
        context.tool_manager = &tool_manager;

        // 5. 规划并执行
        agentteam::TeamScheduler scheduler(registry, context,
                                           agentteam::TeamScheduler::Config{config.max_workers()});
        auto plan = scheduler.plan(argv[2]);
        for (const auto& warning : scheduler.check_contracts(plan)) {
            std::cerr << "[WARNING] " << warning << "\n";
        }

        if (sequential) {
            scheduler.execute_plan(plan);
        } else {
            scheduler.execute_plan_parallel(plan);
        }

        std::cout << "Objective: " << plan.objective << "\n";
        for (const auto& task : plan.tasks) {
            print_task(task, 0);
        }

        // 6. 导出执行日志
        nlohmann::json log_json = nlohmann::json::array();
        for (const auto& entry : scheduler.execution_log()) {
            log_json.push_back(entry.to_json());
        }
        std::ofstream log_file("execution_log.json");
        log_file << log_json.dump(2) << std::endl;
        std::cout << "Execution log exported to execution_log.json (" << log_json.size() << " entries)\n";

    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
