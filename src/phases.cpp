#include "phases.hpp"
#include <algorithm>
#include <iostream>
#include <thread>

namespace orga {

// ── Reasoning ─────────────────────────────────────────────────────────

ReasoningPhase::ReasoningPhase(LoopState state, const LoopConfig& config)
    : state_(std::move(state)), config_(&config) {}

LoopTermination ReasoningPhase::terminate(TerminationReason reason, std::string error) {
    LoopTermination t;
    t.reason = reason;
    t.output = state_.conversation.last_assistant_text();
    t.error = std::move(error);
    t.state = std::move(state_);
    return t;
}

std::optional<LoopTermination> ReasoningPhase::check_limits() {
    if (state_.iteration >= config_->max_iterations)
        return terminate(TerminationReason::max_iterations);
    if (state_.total_usage.total_tokens >= config_->max_total_tokens)
        return terminate(TerminationReason::max_tokens);
    if (state_.elapsed() >= config_->timeout)
        return terminate(TerminationReason::timeout);
    return std::nullopt;
}

std::variant<PolicyCheckPhase, LoopTermination>
ReasoningPhase::produce_output(InferenceProvider& provider, ContextBudgeter& budgeter,
                               const InferenceRetryListener& on_retry) && {
    if (auto stop = check_limits()) return std::move(*stop);

    budgeter.enforce_budget(state_.conversation, config_->context_token_budget);
    size_t estimated = budgeter.estimator().estimate(state_.conversation);

    auto deadline = state_.started_at + config_->timeout;

    InferenceOptions opts;
    opts.model = config_->model;
    opts.max_tokens = config_->max_tokens;
    opts.temperature = config_->temperature;
    opts.tool_definitions = config_->tool_definitions;

    const auto& retry = config_->inference_retry;
    std::optional<InferenceResponse> response;

    for (uint32_t attempt = 0; !response; ++attempt) {
        auto now = Clock::now();
        if (now >= deadline) return terminate(TerminationReason::timeout);
        opts.request_timeout = std::chrono::duration_cast<Millis>(deadline - now);

        try {
            response = provider.complete(state_.conversation, opts);
        } catch (const InferenceError& e) {
            if (!e.retryable() || attempt >= retry.max_retries) {
                return terminate(TerminationReason::error,
                                 std::string("Inference failed (") + inference_error_name(e.kind()) +
                                     "): " + e.what());
            }

            Millis delay = retry.base_delay * (int64_t{1} << std::min<uint32_t>(attempt, 20));
            if (e.retry_after() && *e.retry_after() > delay) delay = *e.retry_after();
            delay = std::min(delay, retry.max_delay);

            if (Clock::now() + delay >= deadline) return terminate(TerminationReason::timeout);

            std::cerr << "[loop] " << provider.name() << " " << inference_error_name(e.kind())
                      << ", retrying in " << delay.count() << "ms: " << e.what() << "\n";
            if (on_retry) {
                on_retry(InferenceRetryEvent{attempt + 1, inference_error_name(e.kind()), e.what(), delay});
            }
            std::this_thread::sleep_for(delay);
        } catch (const std::exception& e) {
            return terminate(TerminationReason::error, std::string("Inference failed: ") + e.what());
        }
    }

    Usage usage = response->usage;
    if (usage.total_tokens == 0) usage.total_tokens = usage.prompt_tokens + usage.completion_tokens;
    state_.total_usage.add(usage);
    if (usage.prompt_tokens > 0) budgeter.estimator().reconcile(estimated, usage.prompt_tokens);
    state_.iteration++;

    auto actions = std::move(response->proposed_actions);
    if (actions.empty()) actions = actions_from_reply(response->assistant_text, {});

    std::string text = response->assistant_text;
    std::vector<ToolCall> calls;
    for (auto& a : actions) {
        if (a.is_tool_call()) {
            auto& tc = a.as_tool_call();
            calls.push_back({a.raw_id, tc.name, tc.arguments});
        } else if (text.empty()) {
            text = std::get<FinalAnswerAction>(a.kind).text;
        }
    }
    state_.conversation.push(Message::assistant(std::move(text), std::move(calls)));

    return PolicyCheckPhase(std::move(state_), *config_, std::move(actions), usage);
}

// ── Policy check ──────────────────────────────────────────────────────

PolicyCheckPhase::PolicyCheckPhase(LoopState state, const LoopConfig& config,
                                   std::vector<ProposedAction> actions, Usage usage)
    : state_(std::move(state)), config_(&config), actions_(std::move(actions)), usage_(usage) {}

ToolDispatchingPhase PolicyCheckPhase::check_policy(PolicyGate& gate) && {
    std::vector<std::pair<size_t, ProposedAction>> approved;
    std::vector<IndexedObservation> denials;
    std::vector<PolicyRecord> decisions;

    for (size_t i = 0; i < actions_.size(); i++) {
        const auto& action = actions_[i];
        LoopDecision d;
        try {
            d = gate.evaluate(state_.agent_id, action, state_);
        } catch (const std::exception& e) {
            std::cerr << "[policy] evaluation failed, denying: " << e.what() << "\n";
            d = LoopDecision::deny(e.what());
        }
        if (d.verdict == Verdict::modify && !d.replacement) {
            d = LoopDecision::deny("Modify verdict without a replacement action");
        }

        decisions.push_back({action.raw_id, action.tool_name(), d.verdict, d.reason});

        switch (d.verdict) {
        case Verdict::allow:
            approved.emplace_back(i, action);
            break;
        case Verdict::modify: {
            ProposedAction repl = std::move(*d.replacement);
            if (repl.raw_id.empty()) repl.raw_id = action.raw_id;
            approved.emplace_back(i, std::move(repl));
            break;
        }
        case Verdict::deny: {
            auto obs = Observation::failure(action.raw_id, action.tool_name(), d.reason, false, std::nullopt);
            obs.origin = ObservationOrigin::policy_gate;
            obs.final_answer = action.is_final_answer();
            denials.emplace_back(i, std::move(obs));
            break;
        }
        }
    }

    return ToolDispatchingPhase(std::move(state_), *config_, std::move(approved),
                                std::move(denials), std::move(decisions));
}

// ── Tool dispatching ──────────────────────────────────────────────────

ToolDispatchingPhase::ToolDispatchingPhase(LoopState state, const LoopConfig& config,
                                           std::vector<std::pair<size_t, ProposedAction>> approved,
                                           std::vector<IndexedObservation> denials,
                                           std::vector<PolicyRecord> decisions)
    : state_(std::move(state)), config_(&config), approved_(std::move(approved)),
      denials_(std::move(denials)), decisions_(std::move(decisions)) {}

size_t ToolDispatchingPhase::count(Verdict v) const {
    return std::count_if(decisions_.begin(), decisions_.end(),
                         [v](const PolicyRecord& r) { return r.verdict == v; });
}

ObservingPhase ToolDispatchingPhase::dispatch_tools(ActionExecutor& executor,
                                                    CircuitBreakerRegistry& breakers) && {
    std::optional<std::string> final_answer;
    for (auto& [index, action] : approved_) {
        if (action.is_final_answer()) {
            final_answer = std::get<FinalAnswerAction>(action.kind).text;
            break;
        }
    }

    auto observations = std::move(denials_);
    std::vector<std::string> dispatched;
    auto start = Clock::now();

    if (!final_answer) {
        std::vector<ProposedAction> calls;
        std::vector<size_t> indices;
        for (auto& [index, action] : approved_) {
            calls.push_back(action);
            indices.push_back(index);
            dispatched.push_back(action.tool_name());
            state_.tool_calls_dispatched[action.tool_name()]++;
        }

        if (!calls.empty()) {
            DispatchContext ctx;
            ctx.agent_id = state_.agent_id;
            ctx.deadline = state_.started_at + config_->timeout;
            ctx.ledger = state_.recovery;

            std::vector<Observation> results;
            try {
                results = executor.execute_actions(calls, *config_, breakers, ctx);
            } catch (const std::exception& e) {
                std::cerr << "[loop] executor failed: " << e.what() << "\n";
            }
            if (results.size() != calls.size()) {
                // Executor broke its contract; every call still gets an observation.
                std::string reason = results.empty() ? "Executor failed to produce a result"
                                                     : "Executor returned mismatched results";
                results.clear();
                for (auto& c : calls) {
                    results.push_back(Observation::failure(c.raw_id, c.tool_name(), reason, false,
                                                           ExecutionErrorKind::invocation_failed));
                }
            }
            for (size_t i = 0; i < results.size(); i++) {
                observations.emplace_back(indices[i], std::move(results[i]));
            }
        }
    }

    std::stable_sort(observations.begin(), observations.end(),
                     [](const IndexedObservation& a, const IndexedObservation& b) { return a.first < b.first; });

    auto duration = std::chrono::duration_cast<Millis>(Clock::now() - start);
    return ObservingPhase(std::move(state_), *config_, std::move(observations), std::move(final_answer),
                          std::move(dispatched), duration);
}

// ── Observing ─────────────────────────────────────────────────────────

ObservingPhase::ObservingPhase(LoopState state, const LoopConfig& config,
                               std::vector<IndexedObservation> observations,
                               std::optional<std::string> final_answer,
                               std::vector<std::string> dispatched, Millis dispatch_duration)
    : state_(std::move(state)), config_(&config), observations_(std::move(observations)),
      final_answer_(std::move(final_answer)), dispatched_(std::move(dispatched)),
      dispatch_duration_(dispatch_duration) {}

size_t ObservingPhase::failure_count() const {
    return std::count_if(observations_.begin(), observations_.end(),
                         [](const IndexedObservation& o) { return !o.second.ok(); });
}

std::variant<ReasoningPhase, LoopTermination> ObservingPhase::observe_results() && {
    if (final_answer_) {
        LoopTermination t;
        t.reason = TerminationReason::completed;
        t.output = std::move(*final_answer_);
        t.state = std::move(state_);
        return t;
    }

    for (auto& [index, obs] : observations_) {
        if (obs.origin == ObservationOrigin::policy_gate && obs.final_answer) {
            // The model sees why its answer was rejected and tries again.
            const auto& failure = std::get<ObservationFailure>(obs.result);
            state_.conversation.push(Message::user("[Policy Feedback] " + failure.error));
        } else {
            state_.conversation.push(Message::tool(obs.source_action_id, obs.content()));
        }
    }

    if (state_.elapsed() >= config_->timeout) {
        LoopTermination t;
        t.reason = TerminationReason::timeout;
        t.output = state_.conversation.last_assistant_text();
        t.state = std::move(state_);
        return t;
    }
    return ReasoningPhase(std::move(state_), *config_);
}

} // namespace orga
