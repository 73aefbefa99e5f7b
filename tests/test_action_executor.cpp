#include "action_executor.hpp"
#include "fakes.hpp"
#include "test_harness.hpp"
#include <atomic>
#include <thread>

using namespace orga;
using orga_test::expect;
using orga_test::run_test;
using orga_test::ScriptedInvoker;

namespace {

ProposedAction call(const std::string& id, const std::string& tool, const std::string& args = "{}") {
    return ProposedAction::tool_call(id, tool, args);
}

LoopConfig config_with(RecoveryStrategy recovery) {
    LoopConfig c;
    c.default_recovery = std::move(recovery);
    c.tool_timeout = Millis{2000};
    return c;
}

CircuitBreakerRegistry lenient_breakers() {
    CircuitBreakerConfig cfg;
    cfg.failure_threshold = 100;
    return CircuitBreakerRegistry(cfg);
}

void test_results_follow_action_order() {
    auto invoker = std::make_shared<ScriptedInvoker>();
    for (int i = 0; i < 4; i++) {
        int delay = (4 - i) * 20; // later actions finish first
        invoker->on("t" + std::to_string(i), [i, delay](const std::string&, Millis) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
            return ToolOutcome::success("r" + std::to_string(i));
        });
    }
    DefaultActionExecutor exec(invoker);
    auto breakers = lenient_breakers();
    std::vector<ProposedAction> actions;
    for (int i = 0; i < 4; i++) actions.push_back(call("c" + std::to_string(i), "t" + std::to_string(i)));

    auto obs = exec.execute_actions(actions, LoopConfig{}, breakers, DispatchContext{});
    expect(obs.size() == 4, "one observation per action");
    for (int i = 0; i < 4; i++) {
        expect(obs[i].source_action_id == "c" + std::to_string(i), "observation order matches actions");
        expect(obs[i].ok() && obs[i].as_success().payload == "r" + std::to_string(i), "payload matches tool");
    }
}

void test_concurrency_is_bounded() {
    std::atomic<int> in_flight{0};
    std::atomic<int> peak{0};
    auto invoker = std::make_shared<ScriptedInvoker>();
    invoker->on("slow", [&](const std::string&, Millis) {
        int now = ++in_flight;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
        std::this_thread::sleep_for(std::chrono::milliseconds(40));
        --in_flight;
        return ToolOutcome::success("ok");
    });
    DefaultActionExecutor exec(invoker);
    auto breakers = lenient_breakers();
    std::vector<ProposedAction> actions;
    for (int i = 0; i < 8; i++) actions.push_back(call("c" + std::to_string(i), "slow"));

    LoopConfig cfg;
    cfg.max_concurrent_tools = 3;
    auto obs = exec.execute_actions(actions, cfg, breakers, DispatchContext{});
    expect(obs.size() == 8, "all actions completed");
    expect(peak.load() <= 3, "never more than max_concurrent_tools in flight");
    expect(peak.load() >= 2, "calls actually ran in parallel");
    expect(invoker->calls("slow") == 8, "every action invoked once");
}

void test_hung_tool_times_out_without_blocking_siblings() {
    auto invoker = std::make_shared<ScriptedInvoker>();
    invoker->on("hang", [](const std::string&, Millis) {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        return ToolOutcome::success("late");
    });
    invoker->succeed("fast", "quick");
    DefaultActionExecutor exec(invoker, Millis{2000});
    auto breakers = lenient_breakers();
    auto cfg = config_with(DeadLetterRecovery{});
    cfg.tool_timeout = Millis{50};

    auto start = Clock::now();
    auto obs = exec.execute_actions({call("a", "hang"), call("b", "fast")}, cfg, breakers, DispatchContext{});
    auto elapsed = std::chrono::duration_cast<Millis>(Clock::now() - start);

    expect(obs[0].is_error(ExecutionErrorKind::tool_timeout), "hung call reported as timeout");
    expect(obs[0].as_failure().error == "Tool 'hang' timed out after 50ms", "timeout message");
    expect(obs[1].ok() && obs[1].as_success().payload == "quick", "sibling unaffected");
    expect(elapsed < Millis{2000}, "phase returns once the straggler drains");
}

void test_open_breaker_short_circuits() {
    auto invoker = std::make_shared<ScriptedInvoker>();
    invoker->fail("flaky", "boom");
    DefaultActionExecutor exec(invoker);
    CircuitBreakerConfig bc;
    bc.failure_threshold = 1;
    CircuitBreakerRegistry breakers(bc);
    auto cfg = config_with(DeadLetterRecovery{});

    exec.execute_actions({call("1", "flaky")}, cfg, breakers, DispatchContext{});
    expect(breakers.state("flaky") == CircuitState::open, "failure opened the breaker");

    auto obs = exec.execute_actions({call("2", "flaky")}, cfg, breakers, DispatchContext{});
    expect(obs[0].is_error(ExecutionErrorKind::breaker_open), "second call short-circuited");
    expect(!obs[0].as_failure().retriable, "breaker rejection is not retriable");
    expect(invoker->calls("flaky") == 1, "open breaker prevented the invocation");
}

void test_retry_recovers_transient_failure() {
    auto invoker = std::make_shared<ScriptedInvoker>();
    std::atomic<int> attempts{0};
    invoker->on("net", [&](const std::string&, Millis) {
        return ++attempts < 3 ? ToolOutcome::failure("reset", true) : ToolOutcome::success("data");
    });
    DefaultActionExecutor exec(invoker);
    auto breakers = lenient_breakers();
    auto obs = exec.execute_actions({call("1", "net")}, config_with(RetryRecovery{3, Millis{1}}), breakers,
                                    DispatchContext{});
    expect(obs[0].ok() && obs[0].as_success().payload == "data", "third attempt succeeded");
    expect(obs[0].recovery == "retry", "recovery recorded");
    expect(invoker->calls("net") == 3, "max_attempts counts the first attempt");
}

void test_retry_skips_non_retriable_failure() {
    auto invoker = std::make_shared<ScriptedInvoker>();
    invoker->fail("strict", "bad input", false);
    DefaultActionExecutor exec(invoker);
    auto breakers = lenient_breakers();
    auto obs = exec.execute_actions({call("1", "strict")}, config_with(RetryRecovery{5, Millis{1}}), breakers,
                                    DispatchContext{});
    expect(!obs[0].ok(), "still failed");
    expect(invoker->calls("strict") == 1, "non-retriable failure not retried");
}

void test_fallback_uses_declared_alternative() {
    auto invoker = std::make_shared<ScriptedInvoker>();
    invoker->fail("primary", "down");
    invoker->succeed("undeclared", "should not run");
    invoker->succeed("backup", "from backup");
    DefaultActionExecutor exec(invoker);
    auto breakers = lenient_breakers();
    auto cfg = config_with(FallbackRecovery{{"undeclared", "backup"}});
    cfg.tool_definitions = {{"primary", "", nlohmann::json::object()}, {"backup", "", nlohmann::json::object()}};

    auto obs = exec.execute_actions({call("1", "primary")}, cfg, breakers, DispatchContext{});
    expect(obs[0].ok() && obs[0].as_success().payload == "from backup", "backup result used");
    expect(obs[0].recovery == "fallback:backup", "fallback target recorded");
    expect(obs[0].source_action_id == "1" && obs[0].tool_name == "primary", "observation stays tied to the action");
    expect(invoker->calls("undeclared") == 0, "undeclared alternative skipped");
}

void test_cached_result_serves_fresh_payload() {
    auto invoker = std::make_shared<ScriptedInvoker>();
    std::atomic<int> n{0};
    invoker->on("quote", [&](const std::string&, Millis) {
        return n++ == 0 ? ToolOutcome::success("42.0") : ToolOutcome::failure("feed down", true);
    });
    DefaultActionExecutor exec(invoker);
    auto breakers = lenient_breakers();
    auto cfg = config_with(CachedResultRecovery{Millis{60000}});

    exec.execute_actions({call("1", "quote", R"({"s":"X"})")}, cfg, breakers, DispatchContext{});
    auto obs = exec.execute_actions({call("2", "quote", R"({"s":"X"})")}, cfg, breakers, DispatchContext{});
    expect(obs[0].ok(), "served from cache");
    expect(obs[0].as_success().payload == "[cached result from 0s ago] 42.0", "cached payload is labelled");

    auto miss = exec.execute_actions({call("3", "quote", R"({"s":"Y"})")}, cfg, breakers, DispatchContext{});
    expect(!miss[0].ok(), "different arguments have no cached result");
}

void test_llm_recovery_hints_then_dead_letters() {
    auto invoker = std::make_shared<ScriptedInvoker>();
    invoker->fail("parse", "syntax error");
    DefaultActionExecutor exec(invoker);
    auto breakers = lenient_breakers();
    auto cfg = config_with(LlmRecovery{1});
    DispatchContext ctx;

    auto first = exec.execute_actions({call("1", "parse")}, cfg, breakers, ctx);
    expect(first[0].recovery == "llm_recovery", "first failure fed back to the model");
    expect(first[0].as_failure().error.find("Consider different arguments") != std::string::npos,
           "hint appended to the error");

    auto second = exec.execute_actions({call("2", "parse")}, cfg, breakers, ctx);
    expect(second[0].dead_lettered, "quota exhausted, dead-lettered");
    expect(ctx.ledger->dead_letters().size() == 1, "dead letter recorded in the ledger");
}

void test_escalate_flags_observation() {
    auto invoker = std::make_shared<ScriptedInvoker>();
    invoker->fail("pay", "declined", false);
    DefaultActionExecutor exec(invoker);
    auto breakers = lenient_breakers();
    DispatchContext ctx;
    ctx.agent_id = "billing";

    auto obs = exec.execute_actions({call("1", "pay", R"({"amount":5})")},
                                    config_with(EscalateRecovery{"finance", true}), breakers, ctx);
    expect(obs[0].escalated && obs[0].escalation_queue == "finance", "escalated to the configured queue");
    expect(obs[0].escalation_context["agent_id"] == "billing", "context snapshot captured");
    expect(obs[0].content() == "[Escalated to finance] declined", "escalation visible to the model");
    expect(ctx.ledger->escalations().size() == 1, "escalation recorded in the ledger");
}

void test_per_tool_recovery_override() {
    auto invoker = std::make_shared<ScriptedInvoker>();
    invoker->fail("a", "x");
    invoker->fail("b", "y");
    DefaultActionExecutor exec(invoker);
    auto breakers = lenient_breakers();
    auto cfg = config_with(DeadLetterRecovery{});
    cfg.tool_recovery["b"] = EscalateRecovery{};
    DispatchContext ctx;

    auto obs = exec.execute_actions({call("1", "a"), call("2", "b")}, cfg, breakers, ctx);
    expect(obs[0].dead_lettered && !obs[0].escalated, "default strategy for a");
    expect(obs[1].escalated && !obs[1].dead_lettered, "override for b");
}

void test_expired_deadline_skips_invocation() {
    auto invoker = std::make_shared<ScriptedInvoker>();
    invoker->succeed("t", "never");
    DefaultActionExecutor exec(invoker);
    auto breakers = lenient_breakers();
    DispatchContext ctx;
    ctx.deadline = Clock::now() - Millis{1};

    auto obs = exec.execute_actions({call("1", "t")}, config_with(DeadLetterRecovery{}), breakers, ctx);
    expect(obs[0].is_error(ExecutionErrorKind::tool_timeout), "deadline reported as timeout");
    expect(invoker->calls("t") == 0, "tool never started");
}

void test_registry_invocation_errors() {
    ToolRegistry reg;
    reg.register_tool({"strict", "", nlohmann::json::object(), [](const nlohmann::json&, Millis) -> std::string {
        throw ToolError("refused", false);
    }});
    reg.register_tool({"flaky", "", nlohmann::json::object(), [](const nlohmann::json&, Millis) -> std::string {
        throw std::runtime_error("io");
    }});
    reg.register_tool({"echo", "", nlohmann::json::object(), [](const nlohmann::json& a, Millis) {
        return a.value("text", std::string{});
    }});

    auto unknown = reg.invoke("nope", "{}", Millis{10});
    expect(!unknown.ok && unknown.kind == ExecutionErrorKind::tool_not_found && !unknown.retriable, "unknown tool");
    expect(!reg.invoke("strict", "{}", Millis{10}).retriable, "ToolError keeps its retriable flag");
    expect(reg.invoke("flaky", "{}", Millis{10}).retriable, "other exceptions are retriable");
    expect(!reg.invoke("echo", "{oops", Millis{10}).retriable, "bad JSON is not retriable");
    expect(reg.invoke("echo", R"({"text":"hi"})", Millis{10}).output == "hi", "arguments reach the tool");
    expect(reg.definitions().size() == 3, "every tool advertised");
    expect(reg.has("echo") && !reg.has("nope"), "lookup by name");
}

void test_result_cache_evicts_oldest() {
    ResultCache cache(2);
    cache.put("t", "1", "a");
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    cache.put("t", "2", "b");
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    cache.put("t", "3", "c");
    expect(cache.size() == 2, "capacity respected");
    expect(!cache.get("t", "1", Millis{60000}), "oldest entry evicted");
    expect(cache.get("t", "3", Millis{60000})->payload == "c", "newest entry kept");
    expect(!cache.get("t", "3", Millis{-1}), "stale entry not served");
}

} // namespace

int main() {
    std::cout << "action_executor\n";
    run_test("results_follow_action_order", test_results_follow_action_order);
    run_test("concurrency_is_bounded", test_concurrency_is_bounded);
    run_test("hung_tool_times_out_without_blocking_siblings", test_hung_tool_times_out_without_blocking_siblings);
    run_test("open_breaker_short_circuits", test_open_breaker_short_circuits);
    run_test("retry_recovers_transient_failure", test_retry_recovers_transient_failure);
    run_test("retry_skips_non_retriable_failure", test_retry_skips_non_retriable_failure);
    run_test("fallback_uses_declared_alternative", test_fallback_uses_declared_alternative);
    run_test("cached_result_serves_fresh_payload", test_cached_result_serves_fresh_payload);
    run_test("llm_recovery_hints_then_dead_letters", test_llm_recovery_hints_then_dead_letters);
    run_test("escalate_flags_observation", test_escalate_flags_observation);
    run_test("per_tool_recovery_override", test_per_tool_recovery_override);
    run_test("expired_deadline_skips_invocation", test_expired_deadline_skips_invocation);
    run_test("registry_invocation_errors", test_registry_invocation_errors);
    run_test("result_cache_evicts_oldest", test_result_cache_evicts_oldest);
    return orga_test::finish("action_executor");
}
