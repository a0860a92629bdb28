// tests/test_delegation.cpp
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "agentteam/scheduler/team_scheduler.h"
#include "test_helpers.h"
#include <memory>

using namespace agentteam;
using namespace agentteam::test;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("AgentContext::fork copies the mutable containers", "[delegation][context]") {
    AgentContext ctx;
    ctx.ai_provider = std::make_shared<FakeProvider>();
    ctx.project_dir = "/tmp/project";
    ctx.add_artifact("architecture", "v1");
    ctx.shared_state["stage"] = "design";
    ctx.conversation_history.push_back(AIMessage{"user", "hello"});

    AgentContext sub = ctx.fork();
    REQUIRE(sub.ai_provider == ctx.ai_provider);
    REQUIRE(sub.project_dir == "/tmp/project");
    REQUIRE(sub.get_artifact("architecture") == "v1");

    sub.add_artifact("architecture", "v2");
    sub.shared_state["stage"] = "build";
    sub.conversation_history.push_back(AIMessage{"assistant", "hi"});

    REQUIRE(ctx.get_artifact("architecture") == "v1");
    REQUIRE(ctx.shared_state["stage"] == "design");
    REQUIRE(ctx.conversation_history.size() == 1);

    ctx.add_artifact("late", true);
    REQUIRE_FALSE(sub.has_artifact("late"));
}

TEST_CASE("Delegated agent works on an isolated fork", "[delegation]") {
    AgentRegistry registry;
    AgentContext context;
    context.ai_provider = std::make_shared<FakeProvider>();
    context.add_artifact("plan", "original");

    RecordingAgent::Behavior behavior;
    behavior.hook = [](AgentContext& ctx) {
        ctx.add_artifact("plan", "rewritten by B");
        ctx.shared_state["touched"] = true;
        ctx.conversation_history.push_back(AIMessage{"assistant", "B was here"});
    };
    auto b = std::make_shared<RecordingAgent>("B", std::set<ArtifactName>{}, std::set<ArtifactName>{"result"},
                                              nullptr, behavior);
    registry.register_builtin(b);

    TeamScheduler scheduler(registry, context);
    AIResponse response = scheduler.delegate("A", "B", "x");

    REQUIRE(response.content == "B done");
    REQUIRE(b->tasks() == std::vector<std::string>{"x"});

    // the delegate's writes stay in its fork
    REQUIRE(context.get_artifact("plan") == "original");
    REQUIRE_FALSE(context.has_artifact("result"));
    REQUIRE_FALSE(context.shared_state.contains("touched"));
    REQUIRE(context.conversation_history.empty());

    // and later caller writes do not reach what the delegate saw
    context.add_artifact("plan", "changed after");
    REQUIRE(b->seen_artifacts()[0]["plan"] == "original");

    auto log = scheduler.execution_log();
    REQUIRE(log.size() == 1);
    REQUIRE(log[0].kind == ExecutionLogEntry::Kind::DELEGATION);
    REQUIRE(log[0].from == "A");
    REQUIRE(log[0].to == "B");
    REQUIRE(log[0].task == "x");
    REQUIRE(log[0].to_json() == nlohmann::json{{"type", "delegation"}, {"from", "A"}, {"to", "B"}, {"task", "x"}});
}

TEST_CASE("Delegating to an unknown agent returns an error response", "[delegation]") {
    AgentRegistry registry;
    AgentContext context;
    TeamScheduler scheduler(registry, context);

    AIResponse response;
    REQUIRE_NOTHROW(response = scheduler.delegate("A", "nobody", "x"));
    REQUIRE(response.content == "Error: agent 'nobody' not found.");
    REQUIRE(response.model == "none");
    REQUIRE(response.usage.empty());
    REQUIRE(scheduler.execution_log().empty());
}

TEST_CASE("A throwing delegate is reported, not propagated", "[delegation]") {
    AgentRegistry registry;
    AgentContext context;
    RecordingAgent::Behavior behavior;
    behavior.throw_message = "quota exceeded";
    registry.register_builtin(std::make_shared<RecordingAgent>("B", std::set<ArtifactName>{},
                                                               std::set<ArtifactName>{}, nullptr, behavior));

    TeamScheduler scheduler(registry, context);
    CaptureStderr err;
    AIResponse response = scheduler.delegate("A", "B", "x");

    REQUIRE(response.content == "Error: quota exceeded");
    REQUIRE(response.model == "none");
    REQUIRE_THAT(err.str(), ContainsSubstring("Delegation from 'A' to 'B' failed"));
}
