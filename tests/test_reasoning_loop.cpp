#include "reasoning_loop.hpp"
#include "phases.hpp"
#include "policy_gate.hpp"
#include "fakes.hpp"
#include "test_harness.hpp"
#include <algorithm>
#include <thread>

using namespace orga;
using orga_test::expect;
using orga_test::run_test;
using orga_test::EventLog;
using orga_test::ScriptedGate;
using orga_test::ScriptedInvoker;
using orga_test::ScriptedProvider;
using orga_test::final_reply;
using orga_test::tool_reply;

namespace {

LoopConfig fast_config() {
    LoopConfig c;
    c.model = "test-model";
    c.tool_timeout = Millis{2000};
    c.inference_retry.base_delay = Millis{1};
    c.inference_retry.max_delay = Millis{5};
    c.tool_definitions = {{"lookup", "Look something up", nlohmann::json::object()},
                          {"calc", "Evaluate arithmetic", nlohmann::json::object()}};
    return c;
}

// Everything a run needs, wired to scripted collaborators.
struct Rig {
    EventLog log;
    ScriptedProvider provider{&log};
    std::shared_ptr<ScriptedInvoker> invoker = std::make_shared<ScriptedInvoker>(&log);
    ScriptedGate::Rule rule = [](const ProposedAction&) { return LoopDecision::allow(); };
    ScriptedGate gate{[this](const ProposedAction& a) { return rule(a); }, &log};
    DefaultActionExecutor executor{invoker};
    SlidingWindowBudgeter budgeter;
    CircuitBreakerRegistry breakers;
    std::shared_ptr<BufferedJournal> journal = std::make_shared<BufferedJournal>();
    LoopRunner runner{provider, gate, executor, budgeter, breakers};

    Rig() { runner.set_journal(journal); }

    LoopResult run(const std::string& prompt, LoopConfig cfg = fast_config()) {
        auto conv = Conversation::with_system("You are a test agent.");
        conv.push(Message::user(prompt));
        return runner.run("agent-1", std::move(conv), std::move(cfg));
    }

    std::vector<std::string> types(const std::string& run_id) const {
        std::vector<std::string> out;
        for (auto& e : journal->entries_for_run(run_id)) out.push_back(e.type());
        return out;
    }

    size_t count(const std::string& run_id, const std::string& type) const {
        auto t = types(run_id);
        return static_cast<size_t>(std::count(t.begin(), t.end(), type));
    }

    // Last message the provider saw on its n-th call.
    const Message& last_seen(size_t call) const { return provider.seen().at(call).messages().back(); }
};

class FailingSink : public JournalSink {
public:
    void append(const JournalEntry&) override { throw JournalError("journal offline"); }
};

class FixedStore : public KnowledgeStore {
public:
    size_t stores = 0;
    std::vector<KnowledgeItem> query(const std::string&, size_t) override {
        return {{"1", "Paris is the capital of France", "fact", 0.9f}};
    }
    std::string store(const std::string&, const std::string&, const std::string&, float) override {
        return std::to_string(++stores);
    }
};

// Always finds nothing and hands every tool call back to the executor.
class EmptyBridge : public KnowledgeBridge {
public:
    size_t injections = 0;
    size_t tool_calls_seen = 0;
    size_t persisted = 0;

    size_t inject_context(const std::string&, Conversation& conversation) override {
        injections++;
        conversation.clear_knowledge_context();
        return 0;
    }
    std::vector<ToolDefinition> tool_definitions() const override { return {}; }
    std::optional<Observation> handle_tool_call(const std::string&, const ProposedAction&) override {
        tool_calls_seen++;
        return std::nullopt;
    }
    void persist_learnings(const std::string&, const Conversation&) override { persisted++; }
};

void test_direct_answer_completes() {
    Rig rig;
    rig.provider.then(final_reply("42"));
    auto r = rig.run("What is 6*7?");

    expect(r.termination_reason == TerminationReason::completed, "completed");
    expect(r.output == "42", "final answer returned");
    expect(r.iterations == 1, "one iteration");
    expect(r.total_usage.total_tokens == 15, "usage accumulated");
    expect(r.error.empty(), "no error");
    expect(r.conversation.last_assistant_text() == "42", "answer recorded in the conversation");

    auto types = rig.types(r.run_id);
    std::vector<std::string> want = {"started", "reasoning_complete", "policy_evaluated",
                                     "tools_dispatched", "observations_collected", "terminated"};
    expect(types == want, "phase events in order");
    auto entries = rig.journal->entries_for_run(r.run_id);
    for (size_t i = 0; i < entries.size(); i++) {
        expect(entries[i].sequence == i, "sequence numbers start at zero and are contiguous");
        expect(entries[i].agent_id == "agent-1", "agent stamped on every entry");
    }
    expect(std::get<ToolsDispatchedEvent>(entries[3].event).tools.empty(), "nothing dispatched for an answer");
}

void test_single_iteration_budget_answers() {
    Rig rig;
    rig.provider.then(final_reply("42"));
    auto cfg = fast_config();
    cfg.max_iterations = 1;
    auto r = rig.run("What is 6*7?", cfg);

    expect(r.output == "42", "answer returned");
    expect(r.iterations == 1, "one iteration");
    expect(r.termination_reason == TerminationReason::completed, "completed, not max_iterations");
}

void test_gate_runs_before_every_invocation() {
    Rig rig;
    rig.provider.then(tool_reply("c1", "lookup", R"({"q":"x"})")).then(final_reply("done"));
    rig.invoker->succeed("lookup", "found it");
    auto r = rig.run("find x");

    expect(r.termination_reason == TerminationReason::completed && r.iterations == 2, "two iterations");
    std::vector<std::string> want = {"infer", "gate:c1", "invoke:lookup", "infer", "gate:final_done"};
    expect(rig.log.events() == want, "reason, gate, invoke, reason, gate");

    auto& obs = rig.last_seen(1);
    expect(obs.role == Role::tool && obs.tool_call_id == "c1", "observation answers the tool call");
    expect(obs.content == "found it", "payload fed back to the model");
    expect(rig.provider.last_options().tool_definitions.size() == 2, "tools advertised to the provider");
}

void test_parallel_results_keep_action_order() {
    Rig rig;
    InferenceResponse two;
    two.proposed_actions = {ProposedAction::tool_call("a", "lookup", "{}"),
                            ProposedAction::tool_call("b", "calc", "{}")};
    two.usage = orga_test::usage(5, 5);
    rig.provider.then(two).then(final_reply("ok"));
    rig.invoker->on("lookup", [](const std::string&, Millis) {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        return ToolOutcome::success("slow");
    });
    rig.invoker->succeed("calc", "fast");
    rig.run("both");

    auto& msgs = rig.provider.seen().at(1).messages();
    auto n = msgs.size();
    expect(msgs[n - 2].tool_call_id == "a" && msgs[n - 2].content == "slow", "first action first");
    expect(msgs[n - 1].tool_call_id == "b" && msgs[n - 1].content == "fast", "second action second");
}

void test_denied_tool_is_fed_back() {
    Rig rig;
    rig.rule = [](const ProposedAction& a) {
        return a.tool_name() == "lookup" ? LoopDecision::deny("lookups disabled") : LoopDecision::allow();
    };
    rig.provider.then(tool_reply("c1", "lookup")).then(final_reply("fine"));
    auto r = rig.run("look it up");

    expect(r.termination_reason == TerminationReason::completed, "run continues after a denial");
    expect(rig.invoker->calls("lookup") == 0, "denied tool never invoked");
    auto& feedback = rig.last_seen(1);
    expect(feedback.role == Role::tool && feedback.tool_call_id == "c1", "denial answers the call");
    expect(feedback.content == "[Policy Denied] lookups disabled", "reason visible to the model");

    auto entries = rig.journal->entries_for_run(r.run_id);
    auto& policy = std::get<PolicyEvaluatedEvent>(entries[2].event);
    expect(policy.denied == 1 && policy.allowed == 0, "denial journaled");
    expect(policy.decisions[0]["reason"] == "lookups disabled", "reason journaled");
}

void test_denied_answer_gets_policy_feedback() {
    Rig rig;
    rig.rule = [](const ProposedAction& a) {
        if (a.is_final_answer() && a.as_final_answer().text == "draft") return LoopDecision::deny("cite a source");
        return LoopDecision::allow();
    };
    rig.provider.then(final_reply("draft")).then(final_reply("Paris [atlas]"));
    auto r = rig.run("capital of France?");

    expect(r.termination_reason == TerminationReason::completed, "completed on the second answer");
    expect(r.output == "Paris [atlas]", "approved answer returned");
    expect(r.iterations == 2, "denied answer cost an iteration");
    auto& feedback = rig.last_seen(1);
    expect(feedback.role == Role::user && feedback.content == "[Policy Feedback] cite a source",
           "denied answer reported as user feedback");
}

void test_nameless_call_denied_as_tool_result() {
    Rig rig;
    RulePolicyGate rules{PolicyRules{}};
    LoopRunner runner{rig.provider, rules, rig.executor, rig.budgeter, rig.breakers};
    rig.provider.then(tool_reply("c1", "", "{}")).then(final_reply("sorry"));

    auto conv = Conversation::with_system("You are a test agent.");
    conv.push(Message::user("do something"));
    auto r = runner.run("agent-1", std::move(conv), fast_config());

    expect(r.termination_reason == TerminationReason::completed, "run continues after the denial");
    auto& feedback = rig.last_seen(1);
    expect(feedback.role == Role::tool && feedback.tool_call_id == "c1", "denied call c1 answered by a tool message");
    expect(feedback.content.find("[Policy Denied] malformed action") == 0, "reason visible to the model");
    auto& msgs = rig.provider.seen().at(1).messages();
    expect(std::none_of(msgs.begin(), msgs.end(),
                        [](const Message& m) { return m.content.find("[Policy Feedback]") == 0; }),
           "no answer feedback for a tool call");
}

void test_modified_action_is_dispatched_instead() {
    Rig rig;
    rig.rule = [](const ProposedAction& a) {
        if (a.tool_name() == "lookup") {
            return LoopDecision::modify(ProposedAction::tool_call("", "calc", "{\"expr\":\"1+1\"}"), "rerouted");
        }
        return LoopDecision::allow();
    };
    rig.provider.then(tool_reply("c1", "lookup")).then(final_reply("2"));
    rig.invoker->succeed("calc", "2");
    auto r = rig.run("add");

    expect(rig.invoker->calls("lookup") == 0 && rig.invoker->calls("calc") == 1, "replacement invoked");
    expect(rig.last_seen(1).tool_call_id == "c1", "replacement keeps the original call id");
    auto entries = rig.journal->entries_for_run(r.run_id);
    auto& policy = std::get<PolicyEvaluatedEvent>(entries[2].event);
    expect(policy.modified == 1, "modification journaled");
}

void test_iteration_limit() {
    Rig rig;
    rig.provider.otherwise(tool_reply("c", "lookup"));
    rig.invoker->succeed("lookup", "again");
    auto cfg = fast_config();
    cfg.max_iterations = 2;
    auto r = rig.run("loop forever", cfg);

    expect(r.termination_reason == TerminationReason::max_iterations, "max_iterations");
    expect(r.iterations == 2 && rig.provider.calls() == 2, "stopped before a third inference");
    expect(rig.count(r.run_id, "reasoning_complete") == 2, "two complete cycles journaled");
}

void test_token_limit() {
    Rig rig;
    rig.provider.otherwise(tool_reply("c", "lookup"));
    rig.invoker->succeed("lookup", "more");
    auto cfg = fast_config();
    cfg.max_total_tokens = 20;
    auto r = rig.run("spend tokens", cfg);

    expect(r.termination_reason == TerminationReason::max_tokens, "max_tokens");
    expect(r.total_usage.total_tokens == 30 && r.iterations == 2, "limit checked before each inference");
}

void test_timeout_mid_cycle() {
    Rig rig;
    rig.provider.otherwise(tool_reply("c", "lookup"));
    rig.invoker->on("lookup", [](const std::string&, Millis) {
        std::this_thread::sleep_for(std::chrono::milliseconds(120));
        return ToolOutcome::success("late");
    });
    auto cfg = fast_config();
    cfg.timeout = Millis{60};
    cfg.default_recovery = DeadLetterRecovery{};
    auto r = rig.run("slow", cfg);

    expect(r.termination_reason == TerminationReason::timeout, "timeout");
    expect(r.iterations == 1, "stopped after the first cycle");
    expect(rig.count(r.run_id, "observations_collected") == 1, "cycle finished before terminating");
    expect(rig.types(r.run_id).back() == "terminated", "terminated recorded last");
}

void test_breaker_opens_on_repeated_failures() {
    Rig rig;
    rig.breakers.configure("lookup", CircuitBreakerConfig{2, std::chrono::milliseconds{60000}, 1});
    rig.provider.then(tool_reply("l1", "lookup"))
        .then(tool_reply("l2", "lookup"))
        .then(tool_reply("l3", "lookup"))
        .then(final_reply("gave up"));
    rig.invoker->fail("lookup", "service down");
    auto cfg = fast_config();
    cfg.default_recovery = DeadLetterRecovery{};
    auto r = rig.run("look up", cfg);

    expect(r.termination_reason == TerminationReason::completed && r.iterations == 4, "run finished");
    expect(rig.invoker->calls("lookup") == 2, "third call short-circuited");
    expect(rig.last_seen(2).content.find("service down") != std::string::npos, "second failure observed");
    expect(rig.last_seen(3).content.find("Circuit breaker open") != std::string::npos, "breaker rejection observed");
    expect(rig.breakers.state("lookup") == CircuitState::open, "breaker open");
    expect(r.dead_letters.size() == 3, "every failure dead-lettered");
    expect(rig.count(r.run_id, "recovery_triggered") == 3, "recoveries journaled");
}

void test_escalations_reach_the_result() {
    Rig rig;
    rig.provider.then(tool_reply("c1", "lookup")).then(final_reply("handed off"));
    rig.invoker->fail("lookup", "needs a human", false);
    auto cfg = fast_config();
    cfg.tool_recovery["lookup"] = EscalateRecovery{"ops", true};
    auto r = rig.run("escalate", cfg);

    expect(r.escalations.size() == 1 && r.escalations[0].escalation_queue == "ops", "escalation surfaced");
    expect(r.escalations[0].escalation_context["tool"] == "lookup", "context snapshot taken");
    expect(rig.last_seen(1).content == "[Escalated to ops] needs a human", "model told about the escalation");
    expect(r.dead_letters.empty(), "nothing dead-lettered");
}

void test_transient_inference_failure_retried() {
    Rig rig;
    rig.provider.then_fail(InferenceErrorKind::transient, "blip").then(final_reply("ok"));
    auto r = rig.run("hello");

    expect(r.termination_reason == TerminationReason::completed && r.output == "ok", "recovered");
    expect(rig.provider.calls() == 2, "one retry");
    expect(r.iterations == 1, "retry is not an iteration");
    auto entries = rig.journal->entries_for_run(r.run_id);
    auto it = std::find_if(entries.begin(), entries.end(),
                           [](const JournalEntry& e) { return std::string(e.type()) == "inference_retry"; });
    expect(it != entries.end(), "retry journaled");
    auto& retry = std::get<InferenceRetryEvent>(it->event);
    expect(retry.attempt == 1 && retry.error_kind == "transient", "retry details");
}

void test_unauthorized_is_not_retried() {
    Rig rig;
    rig.provider.then_fail(InferenceErrorKind::unauthorized, "bad key").then(final_reply("never"));
    auto r = rig.run("hello");

    expect(r.termination_reason == TerminationReason::error, "error");
    expect(r.error == "Inference failed (unauthorized): bad key", "error names the failure kind");
    expect(rig.provider.calls() == 1, "no retry");
    auto entries = rig.journal->entries_for_run(r.run_id);
    expect(std::get<TerminatedEvent>(entries.back().event).reason == TerminationReason::error, "termination journaled");
}

void test_retries_exhausted() {
    Rig rig;
    rig.provider.then_fail(InferenceErrorKind::rate_limited, "429")
        .then_fail(InferenceErrorKind::rate_limited, "429");
    auto cfg = fast_config();
    cfg.inference_retry.max_retries = 1;
    auto r = rig.run("hello", cfg);

    expect(r.termination_reason == TerminationReason::error, "error after retries");
    expect(rig.provider.calls() == 2, "first attempt plus one retry");
    expect(rig.count(r.run_id, "inference_retry") == 1, "one retry journaled");
}

void test_journal_failure_is_not_fatal() {
    Rig rig;
    rig.runner.set_journal(std::make_shared<FailingSink>());
    rig.provider.then(final_reply("still fine"));
    auto r = rig.run("hello");
    expect(r.termination_reason == TerminationReason::completed && r.output == "still fine", "run unaffected");
}

void test_runs_are_independent() {
    Rig rig;
    rig.provider.then(final_reply("one")).then(final_reply("two"));
    auto first = rig.run("a");
    auto second = rig.run("b");

    expect(first.run_id != second.run_id, "distinct run ids");
    expect(first.output == "one" && second.output == "two", "separate results");
    auto entries = rig.journal->entries_for_run(second.run_id);
    expect(!entries.empty() && entries.front().sequence == 0, "sequence restarts per run");
    expect(std::string(entries.front().type()) == "started", "second run starts cleanly");
}

void test_knowledge_bridge_participates() {
    Rig rig;
    auto store = std::make_shared<FixedStore>();
    rig.runner.set_knowledge(std::make_shared<StoreKnowledgeBridge>(store));
    rig.provider.then(tool_reply("k1", "recall_knowledge", R"({"query":"capital France"})"))
        .then(final_reply("Paris"));
    auto r = rig.run("What is the capital of France?");

    expect(r.termination_reason == TerminationReason::completed, "completed");
    auto& defs = rig.provider.last_options().tool_definitions;
    expect(std::any_of(defs.begin(), defs.end(), [](const ToolDefinition& d) { return d.name == "recall_knowledge"; }),
           "knowledge tools advertised");
    auto& slot = rig.provider.seen().at(0).knowledge_context();
    expect(slot && slot->content.find("Paris is the capital") != std::string::npos, "context injected");
    expect(rig.invoker->calls("recall_knowledge") == 0, "recall answered without the executor");
    expect(rig.last_seen(1).content.find("1. Paris is the capital of France") == 0, "recall result observed");
    expect(rig.count(r.run_id, "knowledge_injected") == 2, "injection before each reasoning phase");
    expect(store->stores == 1, "learnings persisted on completion");
}

void test_empty_bridge_matches_no_bridge() {
    auto script = [](Rig& rig) {
        rig.provider.then(tool_reply("c1", "lookup")).then(final_reply("same"));
        rig.invoker->succeed("lookup", "value");
    };
    Rig plain;
    script(plain);
    auto a = plain.run("compare");

    Rig bridged;
    auto bridge = std::make_shared<EmptyBridge>();
    bridged.runner.set_knowledge(bridge);
    script(bridged);
    auto b = bridged.run("compare");

    expect(bridge->injections == 2 && bridge->tool_calls_seen == 1 && bridge->persisted == 1,
           "bridge consulted on every hook");
    expect(a.output == b.output && a.iterations == b.iterations, "same outcome");
    expect(a.termination_reason == b.termination_reason, "same termination");
    expect(a.total_usage.total_tokens == b.total_usage.total_tokens, "same usage");
    expect(plain.types(a.run_id) == bridged.types(b.run_id), "same journal shape");
    expect(plain.log.events() == bridged.log.events(), "same collaborator calls");
    expect(a.conversation.to_json() == b.conversation.to_json(), "same conversation");
    expect(!bridged.provider.seen().at(0).knowledge_context(), "no knowledge slot");
    expect(bridged.provider.last_options().tool_definitions.size() == 2, "no extra tools");
}

void test_metrics_count_runs_tools_and_denials() {
    Rig rig;
    auto metrics = std::make_shared<LoopMetrics>();
    rig.runner.set_metrics(metrics);
    rig.rule = [](const ProposedAction& a) {
        return a.tool_name() == "calc" ? LoopDecision::deny("no math") : LoopDecision::allow();
    };
    rig.invoker->fail("lookup", "backend down", false);
    rig.provider.then(tool_reply("c1", "lookup"))
        .then(tool_reply("c2", "calc"))
        .then(final_reply("done"))
        .otherwise(tool_reply("c3", "lookup"));

    auto ok = rig.run("first");
    auto cfg = fast_config();
    cfg.max_iterations = 1;
    auto capped = rig.run("second", cfg);
    expect(ok.termination_reason == TerminationReason::completed, "first run completed");
    expect(capped.termination_reason == TerminationReason::max_iterations, "second run hit the cap");

    auto snap = metrics->snapshot();
    expect(snap.loops_started == 2, "two loops started");
    expect(snap.loops_completed == 1 && snap.loops_failed == 1, "one completed, one not");
    expect(snap.total_iterations == 4, "iterations summed");
    expect(snap.total_tokens == 60, "tokens summed");
    expect(snap.tool_calls == 2, "denied call never dispatched");
    expect(snap.tool_errors == 2, "failed lookups counted");
    expect(snap.policy_denials == 1, "denial counted");
    expect(snap.success_rate() == 0.5 && snap.avg_iterations() == 2.0, "derived rates");
    expect(&rig.runner.metrics() == metrics.get(), "runner reports into the shared counters");

    metrics->reset();
    expect(metrics->snapshot().loops_started == 0, "reset clears counters");
}

void test_phases_drive_by_hand() {
    // The typestate chain can also be driven directly, one transition at a time.
    ScriptedProvider provider;
    provider.then(tool_reply("c1", "calc"));
    auto invoker = std::make_shared<ScriptedInvoker>();
    invoker->succeed("calc", "4");
    DefaultActionExecutor executor(invoker);
    SlidingWindowBudgeter budgeter;
    CircuitBreakerRegistry breakers;
    auto gate = orga_test::allow_all_gate();
    auto cfg = fast_config();

    LoopState state;
    state.conversation = Conversation::with_system("sys");
    state.conversation.push(Message::user("2+2"));
    ReasoningPhase reasoning(std::move(state), cfg);

    auto produced = std::move(reasoning).produce_output(provider, budgeter);
    auto policy = std::get<PolicyCheckPhase>(std::move(produced));
    expect(policy.proposed_actions().size() == 1 && policy.state().iteration == 1, "iteration counted");

    auto dispatching = std::move(policy).check_policy(gate);
    expect(dispatching.count(Verdict::allow) == 1, "approved");

    auto observing = std::move(dispatching).dispatch_tools(executor, breakers);
    expect(observing.observations().size() == 1 && !observing.is_terminal(), "one observation");
    expect(observing.state().dispatched_count("calc") == 1, "dispatch counted");

    auto next = std::move(observing).observe_results();
    auto& again = std::get<ReasoningPhase>(next);
    expect(again.state().conversation.messages().back().content == "4", "observation appended");
}

} // namespace

int main() {
    std::cout << "reasoning_loop\n";
    run_test("direct_answer_completes", test_direct_answer_completes);
    run_test("single_iteration_budget_answers", test_single_iteration_budget_answers);
    run_test("gate_runs_before_every_invocation", test_gate_runs_before_every_invocation);
    run_test("parallel_results_keep_action_order", test_parallel_results_keep_action_order);
    run_test("denied_tool_is_fed_back", test_denied_tool_is_fed_back);
    run_test("denied_answer_gets_policy_feedback", test_denied_answer_gets_policy_feedback);
    run_test("nameless_call_denied_as_tool_result", test_nameless_call_denied_as_tool_result);
    run_test("modified_action_is_dispatched_instead", test_modified_action_is_dispatched_instead);
    run_test("iteration_limit", test_iteration_limit);
    run_test("token_limit", test_token_limit);
    run_test("timeout_mid_cycle", test_timeout_mid_cycle);
    run_test("breaker_opens_on_repeated_failures", test_breaker_opens_on_repeated_failures);
    run_test("escalations_reach_the_result", test_escalations_reach_the_result);
    run_test("transient_inference_failure_retried", test_transient_inference_failure_retried);
    run_test("unauthorized_is_not_retried", test_unauthorized_is_not_retried);
    run_test("retries_exhausted", test_retries_exhausted);
    run_test("journal_failure_is_not_fatal", test_journal_failure_is_not_fatal);
    run_test("runs_are_independent", test_runs_are_independent);
    run_test("knowledge_bridge_participates", test_knowledge_bridge_participates);
    run_test("empty_bridge_matches_no_bridge", test_empty_bridge_matches_no_bridge);
    run_test("metrics_count_runs_tools_and_denials", test_metrics_count_runs_tools_and_denials);
    run_test("phases_drive_by_hand", test_phases_drive_by_hand);
    return orga_test::finish("reasoning_loop");
}
