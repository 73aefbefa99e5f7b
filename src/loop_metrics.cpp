#include "loop_metrics.hpp"

namespace orga {

double MetricsSnapshot::success_rate() const {
    uint64_t finished = loops_completed + loops_failed;
    return finished == 0 ? 1.0 : static_cast<double>(loops_completed) / static_cast<double>(finished);
}

double MetricsSnapshot::avg_iterations() const {
    uint64_t finished = loops_completed + loops_failed;
    return finished == 0 ? 0.0 : static_cast<double>(total_iterations) / static_cast<double>(finished);
}

nlohmann::json MetricsSnapshot::to_json() const {
    return {{"loops_started", loops_started},
            {"loops_completed", loops_completed},
            {"loops_failed", loops_failed},
            {"total_iterations", total_iterations},
            {"total_tokens", total_tokens},
            {"tool_calls", tool_calls},
            {"tool_errors", tool_errors},
            {"policy_denials", policy_denials},
            {"success_rate", success_rate()},
            {"avg_iterations", avg_iterations()}};
}

void LoopMetrics::record_loop_finished(bool completed, uint64_t iterations, uint64_t tokens) {
    if (completed) loops_completed_++;
    else loops_failed_++;
    total_iterations_ += iterations;
    total_tokens_ += tokens;
}

MetricsSnapshot LoopMetrics::snapshot() const {
    MetricsSnapshot s;
    s.loops_started = loops_started_.load();
    s.loops_completed = loops_completed_.load();
    s.loops_failed = loops_failed_.load();
    s.total_iterations = total_iterations_.load();
    s.total_tokens = total_tokens_.load();
    s.tool_calls = tool_calls_.load();
    s.tool_errors = tool_errors_.load();
    s.policy_denials = policy_denials_.load();
    return s;
}

void LoopMetrics::reset() {
    loops_started_ = 0;
    loops_completed_ = 0;
    loops_failed_ = 0;
    total_iterations_ = 0;
    total_tokens_ = 0;
    tool_calls_ = 0;
    tool_errors_ = 0;
    policy_denials_ = 0;
}

} // namespace orga
