#pragma once
#include <atomic>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace orga {

struct MetricsSnapshot {
    uint64_t loops_started = 0;
    uint64_t loops_completed = 0;
    uint64_t loops_failed = 0;     // every termination other than completed
    uint64_t total_iterations = 0;
    uint64_t total_tokens = 0;
    uint64_t tool_calls = 0;
    uint64_t tool_errors = 0;
    uint64_t policy_denials = 0;

    // 1.0 when no loop has finished yet.
    double success_rate() const;
    // Per finished loop; 0.0 when none has finished.
    double avg_iterations() const;

    nlohmann::json to_json() const;
};

// Process-wide counters for loop runs. Lock-free; one instance may be shared
// by any number of runners.
class LoopMetrics {
public:
    void record_loop_started() { loops_started_++; }
    void record_loop_finished(bool completed, uint64_t iterations, uint64_t tokens);
    void record_tool_calls(uint64_t n) { tool_calls_ += n; }
    void record_tool_errors(uint64_t n) { tool_errors_ += n; }
    void record_policy_denials(uint64_t n) { policy_denials_ += n; }

    MetricsSnapshot snapshot() const;
    void reset();

private:
    std::atomic<uint64_t> loops_started_{0};
    std::atomic<uint64_t> loops_completed_{0};
    std::atomic<uint64_t> loops_failed_{0};
    std::atomic<uint64_t> total_iterations_{0};
    std::atomic<uint64_t> total_tokens_{0};
    std::atomic<uint64_t> tool_calls_{0};
    std::atomic<uint64_t> tool_errors_{0};
    std::atomic<uint64_t> policy_denials_{0};
};

} // namespace orga
