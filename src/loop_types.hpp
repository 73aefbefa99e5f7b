#pragma once
#include "conversation.hpp"
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <memory>
#include <chrono>
#include <cstdint>
#include <optional>
#include <variant>
#include <nlohmann/json.hpp>

namespace orga {

class CircuitBreakerRegistry;

using Clock = std::chrono::steady_clock;
using Millis = std::chrono::milliseconds;

// ── Usage ─────────────────────────────────────────────────────────────

struct Usage {
    uint64_t prompt_tokens = 0;
    uint64_t completion_tokens = 0;
    uint64_t total_tokens = 0;

    void add(const Usage& other) {
        prompt_tokens += other.prompt_tokens;
        completion_tokens += other.completion_tokens;
        total_tokens += other.total_tokens;
    }

    nlohmann::json to_json() const {
        return {{"prompt_tokens", prompt_tokens},
                {"completion_tokens", completion_tokens},
                {"total_tokens", total_tokens}};
    }

    static Usage from_json(const nlohmann::json& j) {
        Usage u;
        u.prompt_tokens = j.value("prompt_tokens", uint64_t{0});
        u.completion_tokens = j.value("completion_tokens", uint64_t{0});
        u.total_tokens = j.value("total_tokens", u.prompt_tokens + u.completion_tokens);
        return u;
    }
};

// ── Tool schema ───────────────────────────────────────────────────────

struct ToolDefinition {
    std::string name;
    std::string description;
    nlohmann::json parameters; // JSON-Schema-like object, passed through unchanged
};

// ── Proposed actions ──────────────────────────────────────────────────

struct ToolCallAction {
    std::string name;
    std::string arguments; // JSON text as produced by the model
};

struct FinalAnswerAction {
    std::string text;
};

struct ProposedAction {
    std::string raw_id;
    std::variant<ToolCallAction, FinalAnswerAction> kind;

    static ProposedAction tool_call(std::string id, std::string name, std::string arguments) {
        return {std::move(id), ToolCallAction{std::move(name), std::move(arguments)}};
    }
    static ProposedAction final_answer(std::string id, std::string text) {
        return {std::move(id), FinalAnswerAction{std::move(text)}};
    }

    bool is_tool_call() const { return std::holds_alternative<ToolCallAction>(kind); }
    bool is_final_answer() const { return std::holds_alternative<FinalAnswerAction>(kind); }
    const ToolCallAction& as_tool_call() const { return std::get<ToolCallAction>(kind); }
    const FinalAnswerAction& as_final_answer() const { return std::get<FinalAnswerAction>(kind); }

    // Tool name, or "" for a final answer.
    std::string tool_name() const { return is_tool_call() ? as_tool_call().name : ""; }

    nlohmann::json to_json() const;
};

// ── Policy verdicts ───────────────────────────────────────────────────

enum class Verdict { allow, deny, modify };

const char* verdict_name(Verdict v);

struct LoopDecision {
    Verdict verdict = Verdict::allow;
    std::string reason;
    std::optional<ProposedAction> replacement; // set for Verdict::modify

    static LoopDecision allow() { return {}; }
    static LoopDecision deny(std::string reason) {
        return {Verdict::deny, std::move(reason), std::nullopt};
    }
    static LoopDecision modify(ProposedAction replacement, std::string reason) {
        return {Verdict::modify, std::move(reason), std::move(replacement)};
    }
};

// ── Observations ──────────────────────────────────────────────────────

enum class ExecutionErrorKind { tool_timeout, tool_not_found, breaker_open, invocation_failed };

const char* execution_error_name(ExecutionErrorKind k);

enum class ObservationOrigin { tool, policy_gate, knowledge };

struct ObservationSuccess {
    std::string payload;
};

struct ObservationFailure {
    std::string error;
    bool retriable = false;
    std::optional<ExecutionErrorKind> kind; // unset for policy denials
};

struct Observation {
    std::string source_action_id;
    std::string tool_name;
    std::variant<ObservationSuccess, ObservationFailure> result;
    Millis duration{0};
    ObservationOrigin origin = ObservationOrigin::tool;
    bool final_answer = false;     // set on a denied final answer rather than a tool call

    std::string recovery;          // name of the recovery strategy applied, if any
    bool escalated = false;
    std::string escalation_queue;
    nlohmann::json escalation_context;
    bool dead_lettered = false;

    static Observation success(std::string action_id, std::string tool, std::string payload, Millis duration = Millis{0}) {
        Observation o;
        o.source_action_id = std::move(action_id);
        o.tool_name = std::move(tool);
        o.result = ObservationSuccess{std::move(payload)};
        o.duration = duration;
        return o;
    }

    static Observation failure(std::string action_id, std::string tool, std::string error,
                               bool retriable, std::optional<ExecutionErrorKind> kind,
                               Millis duration = Millis{0}) {
        Observation o;
        o.source_action_id = std::move(action_id);
        o.tool_name = std::move(tool);
        o.result = ObservationFailure{std::move(error), retriable, kind};
        o.duration = duration;
        return o;
    }

    bool ok() const { return std::holds_alternative<ObservationSuccess>(result); }
    const ObservationSuccess& as_success() const { return std::get<ObservationSuccess>(result); }
    const ObservationFailure& as_failure() const { return std::get<ObservationFailure>(result); }

    bool is_error(ExecutionErrorKind k) const {
        return !ok() && as_failure().kind == k;
    }

    // Text appended to the conversation for this observation.
    std::string content() const;

    nlohmann::json to_json() const;
};

// ── Recovery strategies ───────────────────────────────────────────────

struct RetryRecovery {
    uint32_t max_attempts = 2;       // total attempts, including the first
    Millis base_delay{500};
};

struct FallbackRecovery {
    std::vector<std::string> alternatives;
};

struct CachedResultRecovery {
    Millis max_staleness{300000};
};

struct LlmRecovery {
    uint32_t max_recovery_attempts = 3;
};

struct EscalateRecovery {
    std::string queue = "default";
    bool context_snapshot = true;
};

struct DeadLetterRecovery {};

using RecoveryStrategy = std::variant<RetryRecovery, FallbackRecovery, CachedResultRecovery,
                                      LlmRecovery, EscalateRecovery, DeadLetterRecovery>;

const char* recovery_name(const RecoveryStrategy& s);
nlohmann::json recovery_to_json(const RecoveryStrategy& s);
// Throws std::invalid_argument on an unknown "type".
RecoveryStrategy recovery_from_json(const nlohmann::json& j);

// ── Configuration for one run ─────────────────────────────────────────

struct InferenceRetryConfig {
    uint32_t max_retries = 2;
    Millis base_delay{500};
    Millis max_delay{8000};
};

struct LoopConfig {
    uint32_t max_iterations = 25;
    uint64_t max_total_tokens = 100000;
    Millis timeout{300000};
    Millis tool_timeout{30000};
    size_t max_concurrent_tools = 5;
    size_t context_token_budget = 32000;
    RecoveryStrategy default_recovery = RetryRecovery{};
    std::map<std::string, RecoveryStrategy> tool_recovery;
    std::vector<ToolDefinition> tool_definitions;

    std::string model;
    int max_tokens = 4096;
    double temperature = 0.3;
    InferenceRetryConfig inference_retry;

    // Per-tool override, falling back to the run-wide default.
    const RecoveryStrategy& recovery_for(const std::string& tool) const {
        auto it = tool_recovery.find(tool);
        return it != tool_recovery.end() ? it->second : default_recovery;
    }

    bool declares_tool(const std::string& name) const {
        for (auto& d : tool_definitions) {
            if (d.name == name) return true;
        }
        return false;
    }
};

// ── Per-run recovery bookkeeping ──────────────────────────────────────

// Written concurrently by dispatch workers; read by the runner between phases.
class RecoveryLedger {
public:
    // Returns false once the tool has used up its quota of LLM recovery hints.
    bool consume_llm_attempt(const std::string& tool, uint32_t max_attempts);
    void record_escalation(const Observation& obs);
    void record_dead_letter(const Observation& obs);

    std::vector<Observation> escalations() const;
    std::vector<Observation> dead_letters() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, uint32_t> llm_attempts_;
    std::vector<Observation> escalations_;
    std::vector<Observation> dead_letters_;
};

// ── Loop state ────────────────────────────────────────────────────────

struct LoopState {
    std::string agent_id;
    std::string run_id;
    uint32_t iteration = 0;
    Usage total_usage;
    Conversation conversation;
    Clock::time_point started_at = Clock::now();
    const CircuitBreakerRegistry* breakers = nullptr; // read-only view
    std::map<std::string, uint32_t> tool_calls_dispatched;
    std::shared_ptr<RecoveryLedger> recovery = std::make_shared<RecoveryLedger>();

    Millis elapsed() const {
        return std::chrono::duration_cast<Millis>(Clock::now() - started_at);
    }

    uint32_t failure_count(const std::string& tool) const;

    uint32_t dispatched_count(const std::string& tool) const {
        auto it = tool_calls_dispatched.find(tool);
        return it == tool_calls_dispatched.end() ? 0 : it->second;
    }
};

// ── Terminal result ───────────────────────────────────────────────────

enum class TerminationReason { completed, max_iterations, max_tokens, timeout, error };

const char* termination_name(TerminationReason r);

struct LoopResult {
    std::string output;
    uint32_t iterations = 0;
    Usage total_usage;
    TerminationReason termination_reason = TerminationReason::completed;
    std::string error;          // set for TerminationReason::error
    Millis duration{0};
    std::string run_id;
    Conversation conversation;
    std::vector<Observation> escalations;
    std::vector<Observation> dead_letters;

    nlohmann::json to_json() const;
};

} // namespace orga
