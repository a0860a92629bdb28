// src/scheduler/plan_parser.cpp
#include "agentteam/scheduler/team_scheduler.h"
#include <algorithm>
#include <regex>
#include <sstream>
#include <utility>

namespace agentteam {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

// (agent, description) from one plan line; agent is empty when absent or unknown
std::pair<std::optional<std::string>, std::string> parse_task_line(const std::string& line,
                                                                   const std::vector<std::string>& available) {
    static const std::regex numbering(R"(^\d+[a-z]?\.\s*)");
    static const std::regex bullet(R"(^[-*]\s*)");
    static const std::regex assigned(R"(^\[([^\]]+)\]\s*(.*)$)");

    std::string cleaned = std::regex_replace(line, numbering, "", std::regex_constants::format_first_only);
    cleaned = std::regex_replace(cleaned, bullet, "", std::regex_constants::format_first_only);
    if (cleaned.empty()) {
        return {std::nullopt, ""};
    }

    std::smatch m;
    if (std::regex_match(cleaned, m, assigned)) {
        std::string agent = trim(m[1].str());
        std::string description = trim(m[2].str());
        if (std::find(available.begin(), available.end(), agent) != available.end()) {
            return {agent, description};
        }
        return {std::nullopt, description};
    }
    return {std::nullopt, cleaned};
}

} // namespace

TeamPlan TeamScheduler::parse_plan(const std::string& objective,
                                   const std::string& plan_text,
                                   const std::vector<std::string>& available_agents) {
    static const std::regex sub_numbering(R"(^\d+[a-z]\.)");

    TeamPlan plan;
    plan.objective = objective;

    // index of the latest top-level task; sub-tasks attach to it
    std::optional<size_t> current;

    std::istringstream lines(trim(plan_text));
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        const std::string stripped = trim(line);
        if (stripped.empty()) continue;

        auto [agent, description] = parse_task_line(stripped, available_agents);
        if (description.empty()) continue;

        const bool indented = line[0] == ' ' || line[0] == '\t';
        const bool is_sub = indented || std::regex_search(stripped, sub_numbering);

        AgentTask task(std::move(description), std::move(agent));
        if (is_sub && current) {
            plan.tasks[*current].sub_tasks.push_back(std::move(task));
        } else {
            plan.tasks.push_back(std::move(task));
            current = plan.tasks.size() - 1;
        }
    }
    return plan;
}

} // namespace agentteam
