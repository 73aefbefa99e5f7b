#pragma once
#include <string>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <functional>
#include <optional>
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace orga {

enum class CircuitState { closed, open, half_open };

const char* circuit_state_name(CircuitState s);

struct CircuitBreakerConfig {
    uint32_t failure_threshold = 5;                   // consecutive failures before opening
    std::chrono::milliseconds recovery_timeout{30000}; // open -> half-open cooldown
    uint32_t half_open_max_calls = 2;                 // probe quota while half-open

    nlohmann::json to_json() const;
    static CircuitBreakerConfig from_json(const nlohmann::json& j);
    // Fields missing from `j` are taken from `base`.
    static CircuitBreakerConfig from_json(const nlohmann::json& j, const CircuitBreakerConfig& base);
};

struct BreakerRejection {
    std::string tool;
    CircuitState state = CircuitState::open;
    uint32_t consecutive_failures = 0;
    std::chrono::milliseconds retry_after{0};

    std::string message() const;
};

// State machine for a single tool. Not synchronized; the registry serializes
// access per tool.
class CircuitBreaker {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    explicit CircuitBreaker(CircuitBreakerConfig cfg);

    // Returns the remaining cooldown when the call is rejected, nullopt when
    // it may proceed. An expired cooldown moves the breaker to half-open and
    // the admitted call counts as the first probe.
    std::optional<std::chrono::milliseconds> admit(TimePoint now);
    void record_success();
    void record_failure(TimePoint now);

    CircuitState state() const { return state_; }
    uint32_t failure_count() const { return consecutive_failures_; }
    const CircuitBreakerConfig& config() const { return config_; }

private:
    CircuitBreakerConfig config_;
    CircuitState state_ = CircuitState::closed;
    uint32_t consecutive_failures_ = 0;
    uint32_t half_open_calls_ = 0;
    TimePoint opened_at_{};
};

// One independently locked breaker per tool name. The registry lock only
// guards insertion of new tool entries; transitions lock just their tool.
class CircuitBreakerRegistry {
public:
    using TimeSource = std::function<std::chrono::steady_clock::time_point()>;

    explicit CircuitBreakerRegistry(CircuitBreakerConfig defaults = {},
                                    TimeSource now = nullptr);

    // Per-tool configuration; resets an existing breaker for that tool.
    void configure(const std::string& tool, const CircuitBreakerConfig& cfg);

    std::optional<BreakerRejection> check(const std::string& tool);
    void record_success(const std::string& tool);
    void record_failure(const std::string& tool);
    void reset(const std::string& tool);

    CircuitState state(const std::string& tool) const;
    uint32_t failure_count(const std::string& tool) const;
    std::map<std::string, CircuitState> snapshot() const;

private:
    struct Entry {
        explicit Entry(const CircuitBreakerConfig& cfg) : breaker(cfg) {}
        mutable std::mutex mutex;
        CircuitBreaker breaker;
    };

    Entry& entry(const std::string& tool);
    const Entry* find(const std::string& tool) const;
    CircuitBreakerConfig config_for(const std::string& tool) const;

    CircuitBreakerConfig defaults_;
    TimeSource now_;
    mutable std::shared_mutex map_mutex_;
    std::map<std::string, CircuitBreakerConfig> overrides_;
    std::unordered_map<std::string, std::unique_ptr<Entry>> entries_;
};

} // namespace orga
