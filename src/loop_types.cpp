#include "loop_types.hpp"
#include "circuit_breaker.hpp"
#include <stdexcept>

namespace orga {

nlohmann::json ProposedAction::to_json() const {
    nlohmann::json j;
    j["id"] = raw_id;
    if (is_tool_call()) {
        j["type"] = "tool_call";
        j["name"] = as_tool_call().name;
        j["arguments"] = as_tool_call().arguments;
    } else {
        j["type"] = "final_answer";
        j["text"] = as_final_answer().text;
    }
    return j;
}

const char* verdict_name(Verdict v) {
    switch (v) {
    case Verdict::allow:  return "allow";
    case Verdict::deny:   return "deny";
    case Verdict::modify: return "modify";
    }
    return "allow";
}

const char* execution_error_name(ExecutionErrorKind k) {
    switch (k) {
    case ExecutionErrorKind::tool_timeout:      return "tool_timeout";
    case ExecutionErrorKind::tool_not_found:    return "tool_not_found";
    case ExecutionErrorKind::breaker_open:      return "breaker_open";
    case ExecutionErrorKind::invocation_failed: return "invocation_failed";
    }
    return "invocation_failed";
}

const char* termination_name(TerminationReason r) {
    switch (r) {
    case TerminationReason::completed:      return "completed";
    case TerminationReason::max_iterations: return "max_iterations";
    case TerminationReason::max_tokens:     return "max_tokens";
    case TerminationReason::timeout:        return "timeout";
    case TerminationReason::error:          return "error";
    }
    return "error";
}

// ── Observation ───────────────────────────────────────────────────────

std::string Observation::content() const {
    if (ok()) return as_success().payload;
    auto& f = as_failure();
    if (origin == ObservationOrigin::policy_gate) return "[Policy Denied] " + f.error;
    if (escalated) return "[Escalated to " + escalation_queue + "] " + f.error;
    return "[Error] " + f.error;
}

nlohmann::json Observation::to_json() const {
    nlohmann::json j;
    j["source_action_id"] = source_action_id;
    j["tool_name"] = tool_name;
    j["duration_ms"] = duration.count();
    switch (origin) {
    case ObservationOrigin::tool:        j["origin"] = "tool"; break;
    case ObservationOrigin::policy_gate: j["origin"] = "policy_gate"; break;
    case ObservationOrigin::knowledge:   j["origin"] = "knowledge"; break;
    }
    if (ok()) {
        j["success"] = true;
        j["payload"] = as_success().payload;
    } else {
        auto& f = as_failure();
        j["success"] = false;
        j["error"] = f.error;
        j["retriable"] = f.retriable;
        if (f.kind) j["error_kind"] = execution_error_name(*f.kind);
    }
    if (!recovery.empty()) j["recovery"] = recovery;
    if (escalated) {
        j["escalated"] = true;
        j["escalation_queue"] = escalation_queue;
        if (!escalation_context.is_null()) j["escalation_context"] = escalation_context;
    }
    if (dead_lettered) j["dead_lettered"] = true;
    if (final_answer) j["final_answer"] = true;
    return j;
}

// ── Recovery strategies ───────────────────────────────────────────────

namespace {

struct RecoveryNamer {
    const char* operator()(const RetryRecovery&) const { return "retry"; }
    const char* operator()(const FallbackRecovery&) const { return "fallback"; }
    const char* operator()(const CachedResultRecovery&) const { return "cached_result"; }
    const char* operator()(const LlmRecovery&) const { return "llm_recovery"; }
    const char* operator()(const EscalateRecovery&) const { return "escalate"; }
    const char* operator()(const DeadLetterRecovery&) const { return "dead_letter"; }
};

struct RecoveryWriter {
    nlohmann::json operator()(const RetryRecovery& r) const {
        return {{"type", "retry"}, {"max_attempts", r.max_attempts}, {"base_delay_ms", r.base_delay.count()}};
    }
    nlohmann::json operator()(const FallbackRecovery& r) const {
        return {{"type", "fallback"}, {"alternatives", r.alternatives}};
    }
    nlohmann::json operator()(const CachedResultRecovery& r) const {
        return {{"type", "cached_result"}, {"max_staleness_ms", r.max_staleness.count()}};
    }
    nlohmann::json operator()(const LlmRecovery& r) const {
        return {{"type", "llm_recovery"}, {"max_recovery_attempts", r.max_recovery_attempts}};
    }
    nlohmann::json operator()(const EscalateRecovery& r) const {
        return {{"type", "escalate"}, {"queue", r.queue}, {"context_snapshot", r.context_snapshot}};
    }
    nlohmann::json operator()(const DeadLetterRecovery&) const {
        return {{"type", "dead_letter"}};
    }
};

} // namespace

const char* recovery_name(const RecoveryStrategy& s) {
    return std::visit(RecoveryNamer{}, s);
}

nlohmann::json recovery_to_json(const RecoveryStrategy& s) {
    return std::visit(RecoveryWriter{}, s);
}

RecoveryStrategy recovery_from_json(const nlohmann::json& j) {
    std::string type = j.value("type", "");
    if (type == "retry") {
        RetryRecovery r;
        r.max_attempts = j.value("max_attempts", r.max_attempts);
        r.base_delay = Millis{j.value("base_delay_ms", static_cast<int64_t>(r.base_delay.count()))};
        if (r.max_attempts == 0) r.max_attempts = 1;
        return r;
    }
    if (type == "fallback") {
        FallbackRecovery r;
        if (j.contains("alternatives") && j["alternatives"].is_array()) {
            for (auto& a : j["alternatives"]) {
                if (a.is_string()) r.alternatives.push_back(a.get<std::string>());
            }
        }
        return r;
    }
    if (type == "cached_result") {
        CachedResultRecovery r;
        r.max_staleness = Millis{j.value("max_staleness_ms", static_cast<int64_t>(r.max_staleness.count()))};
        return r;
    }
    if (type == "llm_recovery") {
        LlmRecovery r;
        r.max_recovery_attempts = j.value("max_recovery_attempts", r.max_recovery_attempts);
        return r;
    }
    if (type == "escalate") {
        EscalateRecovery r;
        r.queue = j.value("queue", r.queue);
        r.context_snapshot = j.value("context_snapshot", r.context_snapshot);
        return r;
    }
    if (type == "dead_letter") return DeadLetterRecovery{};
    throw std::invalid_argument("Unknown recovery strategy type: '" + type + "'");
}

// ── RecoveryLedger ────────────────────────────────────────────────────

bool RecoveryLedger::consume_llm_attempt(const std::string& tool, uint32_t max_attempts) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& used = llm_attempts_[tool];
    if (used >= max_attempts) return false;
    used++;
    return true;
}

void RecoveryLedger::record_escalation(const Observation& obs) {
    std::lock_guard<std::mutex> lock(mutex_);
    escalations_.push_back(obs);
}

void RecoveryLedger::record_dead_letter(const Observation& obs) {
    std::lock_guard<std::mutex> lock(mutex_);
    dead_letters_.push_back(obs);
}

std::vector<Observation> RecoveryLedger::escalations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return escalations_;
}

std::vector<Observation> RecoveryLedger::dead_letters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dead_letters_;
}

// ── LoopState / LoopResult ────────────────────────────────────────────

uint32_t LoopState::failure_count(const std::string& tool) const {
    return breakers ? breakers->failure_count(tool) : 0;
}

nlohmann::json LoopResult::to_json() const {
    nlohmann::json j;
    j["run_id"] = run_id;
    j["output"] = output;
    j["iterations"] = iterations;
    j["usage"] = total_usage.to_json();
    j["termination_reason"] = termination_name(termination_reason);
    if (!error.empty()) j["error"] = error;
    j["duration_ms"] = duration.count();
    if (!escalations.empty()) {
        auto& arr = j["escalations"];
        for (auto& o : escalations) arr.push_back(o.to_json());
    }
    if (!dead_letters.empty()) {
        auto& arr = j["dead_letters"];
        for (auto& o : dead_letters) arr.push_back(o.to_json());
    }
    return j;
}

} // namespace orga
