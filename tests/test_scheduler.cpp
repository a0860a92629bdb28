// tests/test_scheduler.cpp
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "agentteam/scheduler/team_scheduler.h"
#include "test_helpers.h"
#include <chrono>
#include <memory>

using namespace agentteam;
using namespace agentteam::test;
using Catch::Matchers::ContainsSubstring;

namespace {

struct Fixture {
    AgentRegistry registry;
    AgentContext context;
    Timeline timeline;

    Fixture() { context.ai_provider = std::make_shared<FakeProvider>(); }

    std::shared_ptr<RecordingAgent> add(const std::string& name,
                                        std::set<ArtifactName> inputs,
                                        std::set<ArtifactName> outputs,
                                        RecordingAgent::Behavior behavior = RecordingAgent::Behavior{}) {
        auto agent = std::make_shared<RecordingAgent>(name, std::move(inputs), std::move(outputs),
                                                      &timeline, std::move(behavior));
        registry.register_builtin(agent);
        return agent;
    }
};

RecordingAgent::Behavior slow(int ms) {
    RecordingAgent::Behavior b;
    b.delay = std::chrono::milliseconds(ms);
    return b;
}

RecordingAgent::Behavior failing(const std::string& message) {
    RecordingAgent::Behavior b;
    b.throw_message = message;
    return b;
}

} // namespace

TEST_CASE("Producer finishes before its consumer starts", "[scheduler][parallel]") {
    Fixture f;
    f.add("w1", {}, {"x"}, slow(30));
    f.add("w2", {"x"}, {});

    TeamPlan plan{"build", {AgentTask("T1", "w1"), AgentTask("T2", "w2")}};
    TeamScheduler scheduler(f.registry, f.context);
    auto& tasks = scheduler.execute_plan_parallel(plan, 4);

    REQUIRE(tasks[0].status == TaskStatus::COMPLETED);
    REQUIRE(tasks[1].status == TaskStatus::COMPLETED);
    REQUIRE(f.timeline.end_of("w1") <= f.timeline.start_of("w2"));
    REQUIRE(f.context.get_artifact("x") == "w1");
}

TEST_CASE("Start order respects a diamond dependency graph", "[scheduler][parallel]") {
    Fixture f;
    f.add("root", {}, {"design"}, slow(10));
    f.add("left", {"design"}, {"left_out"}, slow(20));
    f.add("right", {"design"}, {"right_out"}, slow(5));
    f.add("join", {"left_out", "right_out"}, {});

    TeamPlan plan{"diamond", {AgentTask("join it", "join"), AgentTask("left side", "left"),
                              AgentTask("right side", "right"), AgentTask("root", "root")}};
    TeamScheduler scheduler(f.registry, f.context);
    scheduler.execute_plan_parallel(plan, 4);

    for (const auto& task : plan.tasks) {
        REQUIRE(task.status == TaskStatus::COMPLETED);
    }
    REQUIRE(f.timeline.end_of("root") <= f.timeline.start_of("left"));
    REQUIRE(f.timeline.end_of("root") <= f.timeline.start_of("right"));
    REQUIRE(f.timeline.end_of("left") <= f.timeline.start_of("join"));
    REQUIRE(f.timeline.end_of("right") <= f.timeline.start_of("join"));
}

TEST_CASE("Independent tasks run concurrently up to max_workers", "[scheduler][parallel]") {
    Fixture f;
    for (int i = 0; i < 4; ++i) {
        f.add("a" + std::to_string(i), {}, {}, slow(60));
    }
    TeamPlan plan{"fan out", {}};
    for (int i = 0; i < 4; ++i) {
        plan.tasks.emplace_back("task " + std::to_string(i), "a" + std::to_string(i));
    }

    TeamScheduler scheduler(f.registry, f.context);
    scheduler.execute_plan_parallel(plan, 2);

    REQUIRE(f.timeline.max_running() <= 2);
    REQUIRE(f.timeline.max_running() == 2);
}

TEST_CASE("A dependency cycle falls back to sequential execution", "[scheduler][parallel]") {
    Fixture f;
    f.add("A", {"c"}, {"a"});
    f.add("B", {"a"}, {"b"});
    f.add("C", {"b"}, {"c"});

    TeamPlan plan{"cycle", {AgentTask("first", "A"), AgentTask("second", "B"), AgentTask("third", "C")}};
    TeamScheduler scheduler(f.registry, f.context);

    CaptureStderr err;
    REQUIRE_NOTHROW(scheduler.execute_plan_parallel(plan, 4));

    for (const auto& task : plan.tasks) {
        REQUIRE(is_terminal(task.status));
        REQUIRE(task.status == TaskStatus::COMPLETED);
    }
    REQUIRE(f.timeline.start_order() == std::vector<std::string>{"A", "B", "C"});
    REQUIRE_THAT(err.str(), ContainsSubstring("Dependency cycle"));
}

TEST_CASE("Ready tasks run before the cyclic remainder", "[scheduler][parallel]") {
    Fixture f;
    f.add("free", {}, {"seed"});
    f.add("P", {"seed", "q"}, {"p"});
    f.add("Q", {"p"}, {"q"});

    TeamPlan plan{"mixed", {AgentTask("p", "P"), AgentTask("q", "Q"), AgentTask("free", "free")}};
    TeamScheduler scheduler(f.registry, f.context);
    CaptureStderr err;
    scheduler.execute_plan_parallel(plan, 2);

    REQUIRE(f.timeline.start_order() == std::vector<std::string>{"free", "P", "Q"});
    for (const auto& task : plan.tasks) {
        REQUIRE(task.status == TaskStatus::COMPLETED);
    }
}

TEST_CASE("One failing task does not stop independent tasks", "[scheduler][parallel]") {
    Fixture f;
    f.add("t1", {}, {});
    f.add("t2", {}, {}, failing("boom"));
    f.add("t3", {}, {});
    f.add("t4", {}, {});
    f.add("t5", {}, {});

    TeamPlan plan{"five", {}};
    for (int i = 1; i <= 5; ++i) {
        plan.tasks.emplace_back("job " + std::to_string(i), "t" + std::to_string(i));
    }

    TeamScheduler scheduler(f.registry, f.context);
    CaptureStderr err;
    scheduler.execute_plan_parallel(plan, 3);

    REQUIRE(plan.tasks[1].status == TaskStatus::FAILED);
    REQUIRE(plan.tasks[1].error.has_value());
    REQUIRE(plan.tasks[1].error->kind == TaskErrorKind::EXECUTION_FAILED);
    REQUIRE(plan.tasks[1].result->content == "Error: boom");
    for (size_t i : {0u, 2u, 3u, 4u}) {
        REQUIRE(plan.tasks[i].status == TaskStatus::COMPLETED);
    }
    REQUIRE_THAT(err.str(), ContainsSubstring("Agent 't2' failed: boom"));
}

TEST_CASE("Unknown and unassignable agents fail their task only", "[scheduler]") {
    Fixture f;
    f.add("real", {}, {});

    SECTION("named agent missing from the registry") {
        TeamPlan plan{"p", {AgentTask("ghost work", "ghost"), AgentTask("real work", "real")}};
        TeamScheduler scheduler(f.registry, f.context);
        CaptureStderr err;
        scheduler.execute_plan_parallel(plan, 2);

        REQUIRE(plan.tasks[0].status == TaskStatus::FAILED);
        REQUIRE(plan.tasks[0].error->kind == TaskErrorKind::AGENT_NOT_FOUND);
        REQUIRE_THAT(plan.tasks[0].result->content, ContainsSubstring("Error:"));
        REQUIRE(plan.tasks[1].status == TaskStatus::COMPLETED);
    }

    SECTION("no agent named and none matches") {
        AgentRegistry empty;
        TeamPlan plan{"p", {AgentTask("anything")}};
        TeamScheduler scheduler(empty, f.context);
        CaptureStderr err;
        scheduler.execute_plan(plan);

        REQUIRE(plan.tasks[0].status == TaskStatus::FAILED);
        REQUIRE(plan.tasks[0].error->kind == TaskErrorKind::NO_AGENT_ASSIGNED);
        REQUIRE_THAT(err.str(), ContainsSubstring("No agent could be assigned for: anything"));
    }
}

TEST_CASE("Unassigned tasks are matched to the best scoring agent", "[scheduler]") {
    Fixture f;
    auto docs = f.add("docs", {}, {});
    docs->set_keywords({"document", "readme"});
    auto infra = f.add("infra", {}, {});
    infra->set_keywords({"network"});

    TeamPlan plan{"p", {AgentTask("Write the README document")}};
    TeamScheduler scheduler(f.registry, f.context);
    scheduler.execute_plan(plan);

    REQUIRE(plan.tasks[0].assigned_agent == "docs");
    REQUIRE(plan.tasks[0].status == TaskStatus::COMPLETED);
}

TEST_CASE("Sequential execution feeds prior work to later tasks", "[scheduler]") {
    Fixture f;
    auto first = f.add("first", {}, {"a"});
    auto second = f.add("second", {}, {});

    TeamPlan plan{"p", {AgentTask("do a", "first"), AgentTask("do b", "second")}};
    TeamScheduler scheduler(f.registry, f.context);
    scheduler.execute_plan(plan);

    REQUIRE(first->tasks() == std::vector<std::string>{"do a"});
    REQUIRE(second->tasks() == std::vector<std::string>{"Previous agent work:\n[first]: completed\n\nYour task: do b"});
    REQUIRE(second->seen_artifacts()[0].contains("a"));
    REQUIRE(second->seen_history_sizes()[0] == 1);

    REQUIRE(f.context.conversation_history.size() == 2);
    REQUIRE(f.context.conversation_history[0].role == "assistant");
    REQUIRE(f.context.conversation_history[0].content == "[first]: first done");

    auto log = scheduler.execution_log();
    REQUIRE(log.size() == 2);
    REQUIRE(log[0].kind == ExecutionLogEntry::Kind::EXECUTION);
    REQUIRE(log[0].agent == "first");
    REQUIRE(log[1].to_json()["type"] == "execution");
}

TEST_CASE("Sub-tasks run after their parent, failures skip descendants", "[scheduler]") {
    Fixture f;
    f.add("parent", {}, {"p"});
    f.add("child", {}, {});
    f.add("broken", {}, {}, failing("parent exploded"));

    AgentTask ok("parent work", "parent");
    ok.sub_tasks.emplace_back("child 1", "child");
    ok.sub_tasks.emplace_back("child 2", "child");

    AgentTask bad("broken work", "broken");
    bad.sub_tasks.emplace_back("orphan", "child");

    TeamPlan plan{"p", {std::move(ok), std::move(bad)}};
    TeamScheduler scheduler(f.registry, f.context);
    CaptureStderr err;
    scheduler.execute_plan_parallel(plan, 2);

    REQUIRE(plan.tasks[0].status == TaskStatus::COMPLETED);
    REQUIRE(plan.tasks[0].sub_tasks[0].status == TaskStatus::COMPLETED);
    REQUIRE(plan.tasks[0].sub_tasks[1].status == TaskStatus::COMPLETED);
    REQUIRE(f.timeline.end_of("parent") <= f.timeline.start_of("child"));

    REQUIRE(plan.tasks[1].status == TaskStatus::FAILED);
    REQUIRE(plan.tasks[1].sub_tasks[0].status == TaskStatus::FAILED);
    REQUIRE(plan.tasks[1].sub_tasks[0].error->kind == TaskErrorKind::PARENT_FAILED);
}

TEST_CASE("Terminal tasks are not executed again", "[scheduler]") {
    Fixture f;
    auto agent = f.add("once", {}, {});

    TeamPlan plan{"p", {AgentTask("only once", "once")}};
    TeamScheduler scheduler(f.registry, f.context);
    scheduler.execute_plan(plan);
    scheduler.execute_plan_parallel(plan, 2);

    REQUIRE(agent->tasks().size() == 1);
    REQUIRE(plan.tasks[0].status == TaskStatus::COMPLETED);
}

TEST_CASE("execute_plan_parallel argument handling", "[scheduler][parallel]") {
    Fixture f;
    f.add("w", {}, {});
    TeamScheduler scheduler(f.registry, f.context);

    TeamPlan empty{"nothing", {}};
    REQUIRE(scheduler.execute_plan_parallel(empty, 0).empty());

    TeamPlan plan{"p", {AgentTask("x", "w")}};
    REQUIRE_THROWS_AS(scheduler.execute_plan_parallel(plan, 0), std::invalid_argument);
    REQUIRE(plan.tasks[0].status == TaskStatus::PENDING);

    TeamScheduler configured(f.registry, f.context, TeamScheduler::Config{1});
    configured.execute_plan_parallel(plan);
    REQUIRE(plan.tasks[0].status == TaskStatus::COMPLETED);
}

TEST_CASE("Parallel tasks merge their artifacts into the shared context", "[scheduler][parallel]") {
    Fixture f;
    for (int i = 0; i < 6; ++i) {
        f.add("p" + std::to_string(i), {}, {"out" + std::to_string(i)}, slow(5));
    }
    TeamPlan plan{"p", {}};
    for (int i = 0; i < 6; ++i) {
        plan.tasks.emplace_back("make " + std::to_string(i), "p" + std::to_string(i));
    }

    TeamScheduler scheduler(f.registry, f.context);
    scheduler.execute_plan_parallel(plan, 3);

    for (int i = 0; i < 6; ++i) {
        REQUIRE(f.context.get_artifact("out" + std::to_string(i)) == "p" + std::to_string(i));
    }
    REQUIRE(f.context.conversation_history.size() == 6);
    REQUIRE(scheduler.execution_log().size() == 6);
}

TEST_CASE("check_contracts reports inputs nobody produces", "[scheduler][contracts]") {
    Fixture f;
    f.add("arch", {"requirements"}, {"architecture"});
    f.add("dev", {"architecture", "secrets"}, {"code"});

    TeamPlan plan{"p", {AgentTask("design", "arch"), AgentTask("build", "dev"), AgentTask("free text")}};
    TeamScheduler scheduler(f.registry, f.context);

    auto warnings = scheduler.check_contracts(plan);
    REQUIRE(warnings.size() == 2);
    REQUIRE(warnings[0] == "Agent 'arch' expects artifact 'requirements' which may not be available at execution time");
    REQUIRE_THAT(warnings[1], ContainsSubstring("'secrets'"));

    f.context.add_artifact("requirements", "given");
    f.context.add_artifact("secrets", "given");
    REQUIRE(scheduler.check_contracts(plan).empty());
}

TEST_CASE("plan and run_team go through the context's provider", "[scheduler][plan]") {
    Fixture f;
    f.add("cloud-architect", {}, {"architecture"});
    f.add("app-developer", {"architecture"}, {});

    auto provider = std::make_shared<FakeProvider>();
    provider->script("1. [cloud-architect] Design it\n2. [app-developer] Build it\n");
    f.context.ai_provider = provider;

    TeamScheduler scheduler(f.registry, f.context);
    TeamPlan result = scheduler.run_team("Ship an API");

    REQUIRE(result.objective == "Ship an API");
    REQUIRE(result.tasks.size() == 2);
    REQUIRE(result.tasks[0].status == TaskStatus::COMPLETED);
    REQUIRE(result.tasks[1].status == TaskStatus::COMPLETED);

    auto calls = provider->calls();
    REQUIRE(calls.size() == 1);
    REQUIRE_THAT(calls[0][0].content, ContainsSubstring("Objective: Ship an API"));
    REQUIRE_THAT(calls[0][0].content, ContainsSubstring("- cloud-architect: records cloud-architect"));
    REQUIRE(provider->options()[0].temperature == 0.2f);
    REQUIRE(provider->options()[0].max_tokens == 2048);
}

TEST_CASE("plan without a provider throws", "[scheduler][plan]") {
    AgentRegistry registry;
    AgentContext context;
    TeamScheduler scheduler(registry, context);
    REQUIRE_THROWS_AS(scheduler.plan("anything"), std::runtime_error);
}

namespace {

// Agent whose contract cannot be read
class UnreadableContractAgent : public Agent {
public:
    explicit UnreadableContractAgent(std::string name) : Agent(std::move(name), "contract throws") {}

    AIResponse execute(AgentContext&, const std::string&) override {
        AIResponse r;
        r.content = name() + " done";
        return r;
    }
    AgentContract get_contract() const override { throw std::runtime_error("contract unreadable"); }
};

// Agent whose relevance scoring fails
class FailingScorerAgent : public Agent {
public:
    explicit FailingScorerAgent(std::string name) : Agent(std::move(name), "scoring throws") {}

    AIResponse execute(AgentContext&, const std::string&) override {
        AIResponse r;
        r.content = name() + " done";
        return r;
    }
    double can_handle(const std::string&) const override { throw std::runtime_error("scorer down"); }
};

TeamPlan plan_with_unassigned_child() {
    AgentTask parent("lead the work", "lead");
    parent.sub_tasks.emplace_back("figure out the rest");
    return TeamPlan{"o", {parent, AgentTask("help out", "helper")}};
}

} // namespace

TEST_CASE("An unreadable contract counts as empty", "[scheduler][parallel][contracts]") {
    Fixture f;
    f.registry.register_builtin(std::make_shared<UnreadableContractAgent>("opaque"));
    f.add("writer", {}, {"notes"});

    TeamPlan plan{"o", {AgentTask("first", "opaque"), AgentTask("second", "writer")}};
    TeamScheduler scheduler(f.registry, f.context);

    CaptureStderr err;
    REQUIRE_NOTHROW(scheduler.execute_plan_parallel(plan, 2));
    REQUIRE(plan.tasks[0].status == TaskStatus::COMPLETED);
    REQUIRE(plan.tasks[1].status == TaskStatus::COMPLETED);
    REQUIRE_THAT(err.str(), ContainsSubstring("Could not read contract of agent 'opaque'"));

    std::vector<std::string> warnings;
    REQUIRE_NOTHROW(warnings = scheduler.check_contracts(plan));
    REQUIRE(warnings.empty());
}

TEST_CASE("A throwing scorer fails only the task being assigned", "[scheduler]") {
    Fixture f;
    f.add("lead", {}, {});
    f.add("helper", {}, {});
    f.registry.register_builtin(std::make_shared<FailingScorerAgent>("scorer"));

    TeamPlan plan = plan_with_unassigned_child();
    TeamScheduler scheduler(f.registry, f.context);

    CaptureStderr err;
    REQUIRE_NOTHROW(scheduler.execute_plan(plan));

    REQUIRE(plan.tasks[0].status == TaskStatus::COMPLETED);
    const auto& child = plan.tasks[0].sub_tasks[0];
    REQUIRE(child.status == TaskStatus::FAILED);
    REQUIRE(child.error->kind == TaskErrorKind::EXECUTION_FAILED);
    REQUIRE(child.error->message == "scorer down");
    REQUIRE(plan.tasks[1].status == TaskStatus::COMPLETED);
}

TEST_CASE("A failing sub-task never overwrites its completed parent", "[scheduler][parallel]") {
    Fixture f;
    f.add("lead", {}, {});
    f.add("helper", {}, {});
    f.registry.register_builtin(std::make_shared<FailingScorerAgent>("scorer"));

    TeamPlan plan = plan_with_unassigned_child();
    TeamScheduler scheduler(f.registry, f.context);

    CaptureStderr err;
    REQUIRE_NOTHROW(scheduler.execute_plan_parallel(plan, 2));

    REQUIRE(plan.tasks[0].status == TaskStatus::COMPLETED);
    REQUIRE(plan.tasks[0].result->content == "lead done");
    REQUIRE(plan.tasks[0].sub_tasks[0].status == TaskStatus::FAILED);
    REQUIRE(plan.tasks[1].status == TaskStatus::COMPLETED);
}

TEST_CASE("A throwing scorer does not stop the cycle fallback", "[scheduler][parallel]") {
    Fixture f;
    f.add("a", {"b_out"}, {"a_out"});
    f.add("b", {"a_out"}, {"b_out"});
    f.registry.register_builtin(std::make_shared<FailingScorerAgent>("scorer"));

    TeamPlan plan{"o", {AgentTask("cyclic a", "a"), AgentTask("no owner"), AgentTask("cyclic b", "b")}};
    TeamScheduler scheduler(f.registry, f.context);

    CaptureStderr err;
    REQUIRE_NOTHROW(scheduler.execute_plan_parallel(plan, 2));
    REQUIRE(plan.tasks[0].status == TaskStatus::COMPLETED);
    REQUIRE(plan.tasks[1].status == TaskStatus::FAILED);
    REQUIRE(plan.tasks[2].status == TaskStatus::COMPLETED);
}
