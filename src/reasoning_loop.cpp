#include "reasoning_loop.hpp"
#include "phases.hpp"
#include "utils.hpp"
#include <algorithm>
#include <iostream>

namespace orga {

// Stamps events with run identity and a per-run sequence number. A journal
// that fails to record an entry is logged and otherwise ignored.
struct LoopRunner::RunRecorder {
    JournalSink* sink;
    std::string run_id;
    std::string agent_id;
    uint64_t sequence = 0;

    void record(uint32_t iteration, LoopEvent event) {
        if (!sink) return;
        JournalEntry entry;
        entry.run_id = run_id;
        entry.agent_id = agent_id;
        entry.sequence = sequence++;
        entry.timestamp = std::chrono::system_clock::now();
        entry.iteration = iteration;
        entry.event = std::move(event);
        try {
            sink->append(entry);
        } catch (const std::exception& e) {
            std::cerr << "[journal] append failed (" << entry.type() << "): " << e.what() << "\n";
        }
    }
};

LoopRunner::LoopRunner(InferenceProvider& provider, PolicyGate& gate, ActionExecutor& executor,
                       ContextBudgeter& budgeter, CircuitBreakerRegistry& breakers)
    : provider_(provider), gate_(gate), executor_(executor), budgeter_(budgeter), breakers_(breakers),
      knowledge_(std::make_shared<NullKnowledgeBridge>()), metrics_(std::make_shared<LoopMetrics>()) {}

void LoopRunner::set_knowledge(std::shared_ptr<KnowledgeBridge> bridge) {
    knowledge_ = bridge ? std::move(bridge) : std::make_shared<NullKnowledgeBridge>();
}

void LoopRunner::set_metrics(std::shared_ptr<LoopMetrics> metrics) {
    metrics_ = metrics ? std::move(metrics) : std::make_shared<LoopMetrics>();
}

LoopResult LoopRunner::run(const std::string& agent_id, Conversation conversation, LoopConfig config) {
    auto started = Clock::now();
    RunRecorder rec{journal_.get(), generate_id("run"), agent_id};
    metrics_->record_loop_started();

    LoopResult result;
    result.run_id = rec.run_id;
    result.conversation = conversation;

    auto finish = [&](LoopTermination t) {
        result.output = std::move(t.output);
        result.termination_reason = t.reason;
        result.error = std::move(t.error);
        result.iterations = t.state.iteration;
        result.total_usage = t.state.total_usage;
        result.conversation = std::move(t.state.conversation);
        if (t.state.recovery) {
            result.escalations = t.state.recovery->escalations();
            result.dead_letters = t.state.recovery->dead_letters();
        }
    };

    try {
        for (auto& def : knowledge_->tool_definitions()) {
            if (!config.declares_tool(def.name)) config.tool_definitions.push_back(def);
        }
        KnowledgeAwareExecutor executor(executor_, *knowledge_);

        rec.record(0, StartedEvent{config.model, config.max_iterations, config.max_total_tokens,
                                   config.timeout, config.tool_definitions.size()});

        LoopState state;
        state.agent_id = agent_id;
        state.run_id = rec.run_id;
        state.conversation = std::move(conversation);
        state.started_at = started;
        state.breakers = &breakers_;

        ReasoningPhase reasoning(std::move(state), config);
        std::optional<LoopTermination> end;

        while (!end) {
            uint32_t iteration = reasoning.state().iteration;

            try {
                size_t injected = knowledge_->inject_context(agent_id, reasoning.state().conversation);
                if (injected > 0) rec.record(iteration, KnowledgeInjectedEvent{injected});
            } catch (const std::exception& e) {
                std::cerr << "[knowledge] injection failed: " << e.what() << "\n";
            }

            auto produced = std::move(reasoning).produce_output(
                provider_, budgeter_,
                [&](const InferenceRetryEvent& ev) { rec.record(iteration, ev); });
            if (auto* t = std::get_if<LoopTermination>(&produced)) {
                end = std::move(*t);
                break;
            }

            auto policy = std::get<PolicyCheckPhase>(std::move(produced));
            iteration = policy.state().iteration;
            {
                ReasoningCompleteEvent ev;
                for (auto& a : policy.proposed_actions()) ev.actions.push_back(a.to_json());
                ev.usage = policy.usage();
                rec.record(iteration, std::move(ev));
            }

            auto dispatching = std::move(policy).check_policy(gate_);
            {
                PolicyEvaluatedEvent ev;
                ev.allowed = dispatching.count(Verdict::allow);
                ev.denied = dispatching.count(Verdict::deny);
                ev.modified = dispatching.count(Verdict::modify);
                for (auto& d : dispatching.decisions()) {
                    ev.decisions.push_back({{"action_id", d.action_id},
                                            {"tool", d.tool},
                                            {"verdict", verdict_name(d.verdict)},
                                            {"reason", d.reason}});
                }
                metrics_->record_policy_denials(ev.denied);
                rec.record(iteration, std::move(ev));
            }

            auto observing = std::move(dispatching).dispatch_tools(executor, breakers_);
            rec.record(iteration, ToolsDispatchedEvent{observing.dispatched_tools(), observing.dispatch_duration()});
            metrics_->record_tool_calls(observing.dispatched_tools().size());
            metrics_->record_tool_errors(static_cast<uint64_t>(std::count_if(
                observing.observations().begin(), observing.observations().end(),
                [](const IndexedObservation& o) {
                    return !o.second.ok() && o.second.origin != ObservationOrigin::policy_gate;
                })));
            for (auto& [index, obs] : observing.observations()) {
                if (obs.recovery.empty()) continue;
                std::string error = obs.ok() ? "" : std::get<ObservationFailure>(obs.result).error;
                rec.record(iteration, RecoveryTriggeredEvent{obs.tool_name, obs.recovery, error});
            }
            rec.record(iteration, ObservationsCollectedEvent{observing.observations().size(),
                                                             observing.failure_count(), observing.is_terminal()});

            auto next = std::move(observing).observe_results();
            if (auto* t = std::get_if<LoopTermination>(&next)) {
                end = std::move(*t);
            } else {
                reasoning = std::get<ReasoningPhase>(std::move(next));
            }
        }

        if (end->reason == TerminationReason::completed) {
            try {
                knowledge_->persist_learnings(agent_id, end->state.conversation);
            } catch (const std::exception& e) {
                std::cerr << "[knowledge] persist failed: " << e.what() << "\n";
            }
        }
        finish(std::move(*end));
    } catch (const std::exception& e) {
        std::cerr << "[loop] run " << rec.run_id << " aborted: " << e.what() << "\n";
        result.termination_reason = TerminationReason::error;
        result.error = e.what();
    }

    result.duration = std::chrono::duration_cast<Millis>(Clock::now() - started);
    metrics_->record_loop_finished(result.termination_reason == TerminationReason::completed,
                                   result.iterations, result.total_usage.total_tokens);
    rec.record(result.iterations, TerminatedEvent{result.termination_reason, result.error, result.iterations,
                                                  result.total_usage, result.duration});
    return result;
}

} // namespace orga
