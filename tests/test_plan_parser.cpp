// tests/test_plan_parser.cpp
#include <catch2/catch_test_macros.hpp>
#include "agentteam/scheduler/team_scheduler.h"

using namespace agentteam;

TEST_CASE("Numbered lines with agent tags become tasks", "[plan_parser]") {
    const std::string text = R"(
1. [cloud-architect] Design the overall architecture
   1a. [terraform] Generate networking module
   1b. [app-developer] Scaffold the service
2. [app-developer] Build the API service
)";
    auto plan = TeamScheduler::parse_plan("Ship it", text, {"cloud-architect", "terraform", "app-developer"});

    REQUIRE(plan.objective == "Ship it");
    REQUIRE(plan.tasks.size() == 2);
    REQUIRE(plan.tasks[0].description == "Design the overall architecture");
    REQUIRE(plan.tasks[0].assigned_agent == "cloud-architect");
    REQUIRE(plan.tasks[0].sub_tasks.size() == 2);
    REQUIRE(plan.tasks[0].sub_tasks[0].description == "Generate networking module");
    REQUIRE(plan.tasks[0].sub_tasks[0].assigned_agent == "terraform");
    REQUIRE(plan.tasks[0].sub_tasks[1].assigned_agent == "app-developer");
    REQUIRE(plan.tasks[1].description == "Build the API service");
    REQUIRE(plan.tasks[1].status == TaskStatus::PENDING);
}

TEST_CASE("Unknown agents are dropped but the task is kept", "[plan_parser]") {
    auto plan = TeamScheduler::parse_plan("o", "1. [wizard] Cast a spell", {"cloud-architect"});
    REQUIRE(plan.tasks.size() == 1);
    REQUIRE(plan.tasks[0].description == "Cast a spell");
    REQUIRE_FALSE(plan.tasks[0].assigned_agent.has_value());
}

TEST_CASE("Bullets, untagged lines and blank lines", "[plan_parser]") {
    const std::string text =
        "- [qa] Write tests\r\n"
        "\n"
        "* Plain bullet without agent\n"
        "3. \n"
        "Review everything\n";
    auto plan = TeamScheduler::parse_plan("o", text, {"qa"});

    REQUIRE(plan.tasks.size() == 3);
    REQUIRE(plan.tasks[0].assigned_agent == "qa");
    REQUIRE(plan.tasks[0].description == "Write tests");
    REQUIRE(plan.tasks[1].description == "Plain bullet without agent");
    REQUIRE_FALSE(plan.tasks[1].assigned_agent.has_value());
    REQUIRE(plan.tasks[2].description == "Review everything");
}

TEST_CASE("A leading sub-task without a parent becomes top-level", "[plan_parser]") {
    auto plan = TeamScheduler::parse_plan("o", "1a. [qa] Orphan step\n2. [qa] Next", {"qa"});
    REQUIRE(plan.tasks.size() == 2);
    REQUIRE(plan.tasks[0].description == "Orphan step");
    REQUIRE(plan.tasks[0].sub_tasks.empty());
}

TEST_CASE("Empty plan text yields no tasks", "[plan_parser]") {
    REQUIRE(TeamScheduler::parse_plan("o", "", {}).tasks.empty());
    REQUIRE(TeamScheduler::parse_plan("o", "   \n\n", {}).tasks.empty());
}
