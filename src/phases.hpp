#pragma once
#include "action_executor.hpp"
#include "circuit_breaker.hpp"
#include "context_budget.hpp"
#include "inference.hpp"
#include "journal.hpp"
#include "loop_types.hpp"
#include "policy_gate.hpp"
#include <functional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace orga {

// The ORGA cycle as a typestate: each phase type exposes exactly one
// transition, callable only on an rvalue, which consumes the phase and
// yields the next one. Only ReasoningPhase can be constructed from outside,
// so Reasoning -> PolicyCheck -> ToolDispatching -> Observing is the only
// order a caller can write.

class PolicyCheckPhase;
class ToolDispatchingPhase;
class ObservingPhase;

struct LoopTermination {
    TerminationReason reason = TerminationReason::completed;
    std::string output;
    std::string error;
    LoopState state;
};

using InferenceRetryListener = std::function<void(const InferenceRetryEvent&)>;

struct PolicyRecord {
    std::string action_id;
    std::string tool;        // "" for a final answer
    Verdict verdict = Verdict::allow;
    std::string reason;
};

// Observation tagged with the position of the action that produced it.
using IndexedObservation = std::pair<size_t, Observation>;

class ReasoningPhase {
public:
    ReasoningPhase(LoopState state, const LoopConfig& config);

    // Checks the run limits, fits the conversation to the context budget and
    // asks the provider for the next actions. Transient provider failures are
    // retried here with capped exponential backoff.
    std::variant<PolicyCheckPhase, LoopTermination>
    produce_output(InferenceProvider& provider, ContextBudgeter& budgeter,
                   const InferenceRetryListener& on_retry = nullptr) &&;

    LoopState& state() { return state_; }
    const LoopState& state() const { return state_; }

private:
    LoopState state_;
    const LoopConfig* config_;

    std::optional<LoopTermination> check_limits();
    LoopTermination terminate(TerminationReason reason, std::string error = "");
};

class PolicyCheckPhase {
public:
    // Every action goes through the gate. Denials become observations;
    // Modify substitutes the replacement action.
    ToolDispatchingPhase check_policy(PolicyGate& gate) &&;

    const std::vector<ProposedAction>& proposed_actions() const { return actions_; }
    const Usage& usage() const { return usage_; }
    const LoopState& state() const { return state_; }

private:
    friend class ReasoningPhase;
    PolicyCheckPhase(LoopState state, const LoopConfig& config,
                     std::vector<ProposedAction> actions, Usage usage);

    LoopState state_;
    const LoopConfig* config_;
    std::vector<ProposedAction> actions_;
    Usage usage_;
};

class ToolDispatchingPhase {
public:
    // Hands approved tool calls to the executor and waits for all of them.
    // An approved final answer ends the cycle without dispatching anything.
    ObservingPhase dispatch_tools(ActionExecutor& executor, CircuitBreakerRegistry& breakers) &&;

    const std::vector<PolicyRecord>& decisions() const { return decisions_; }
    size_t count(Verdict v) const;
    const LoopState& state() const { return state_; }

private:
    friend class PolicyCheckPhase;
    ToolDispatchingPhase(LoopState state, const LoopConfig& config,
                         std::vector<std::pair<size_t, ProposedAction>> approved,
                         std::vector<IndexedObservation> denials,
                         std::vector<PolicyRecord> decisions);

    LoopState state_;
    const LoopConfig* config_;
    std::vector<std::pair<size_t, ProposedAction>> approved_;
    std::vector<IndexedObservation> denials_;
    std::vector<PolicyRecord> decisions_;
};

class ObservingPhase {
public:
    // Appends observations to the conversation, then either starts the next
    // Reasoning phase or ends the run.
    std::variant<ReasoningPhase, LoopTermination> observe_results() &&;

    const std::vector<IndexedObservation>& observations() const { return observations_; }
    const std::vector<std::string>& dispatched_tools() const { return dispatched_; }
    Millis dispatch_duration() const { return dispatch_duration_; }
    bool is_terminal() const { return final_answer_.has_value(); }
    size_t failure_count() const;
    const LoopState& state() const { return state_; }

private:
    friend class ToolDispatchingPhase;
    ObservingPhase(LoopState state, const LoopConfig& config,
                   std::vector<IndexedObservation> observations,
                   std::optional<std::string> final_answer,
                   std::vector<std::string> dispatched, Millis dispatch_duration);

    LoopState state_;
    const LoopConfig* config_;
    std::vector<IndexedObservation> observations_;
    std::optional<std::string> final_answer_;
    std::vector<std::string> dispatched_;
    Millis dispatch_duration_;
};

} // namespace orga
