#include "circuit_breaker.hpp"
#include <iostream>

namespace orga {

using std::chrono::milliseconds;

const char* circuit_state_name(CircuitState s) {
    switch (s) {
    case CircuitState::closed:    return "closed";
    case CircuitState::open:      return "open";
    case CircuitState::half_open: return "half_open";
    }
    return "closed";
}

nlohmann::json CircuitBreakerConfig::to_json() const {
    return {{"failure_threshold", failure_threshold},
            {"recovery_timeout_ms", recovery_timeout.count()},
            {"half_open_max_calls", half_open_max_calls}};
}

CircuitBreakerConfig CircuitBreakerConfig::from_json(const nlohmann::json& j) {
    return from_json(j, CircuitBreakerConfig());
}

CircuitBreakerConfig CircuitBreakerConfig::from_json(const nlohmann::json& j, const CircuitBreakerConfig& base) {
    CircuitBreakerConfig c = base;
    c.failure_threshold = j.value("failure_threshold", c.failure_threshold);
    c.recovery_timeout = milliseconds{j.value("recovery_timeout_ms", static_cast<int64_t>(c.recovery_timeout.count()))};
    c.half_open_max_calls = j.value("half_open_max_calls", c.half_open_max_calls);
    if (c.failure_threshold == 0) c.failure_threshold = 1;
    if (c.half_open_max_calls == 0) c.half_open_max_calls = 1;
    return c;
}

std::string BreakerRejection::message() const {
    return "Circuit breaker open for tool '" + tool + "' after " +
           std::to_string(consecutive_failures) + " consecutive failures; retry in " +
           std::to_string(retry_after.count()) + "ms";
}

// ── CircuitBreaker ────────────────────────────────────────────────────

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig cfg) : config_(cfg) {
    if (config_.failure_threshold == 0) config_.failure_threshold = 1;
    if (config_.half_open_max_calls == 0) config_.half_open_max_calls = 1;
}

std::optional<milliseconds> CircuitBreaker::admit(TimePoint now) {
    switch (state_) {
    case CircuitState::closed:
        return std::nullopt;
    case CircuitState::open: {
        auto since = std::chrono::duration_cast<milliseconds>(now - opened_at_);
        if (since >= config_.recovery_timeout) {
            state_ = CircuitState::half_open;
            half_open_calls_ = 1;
            return std::nullopt;
        }
        return config_.recovery_timeout - since;
    }
    case CircuitState::half_open:
        if (half_open_calls_ < config_.half_open_max_calls) {
            half_open_calls_++;
            return std::nullopt;
        }
        return milliseconds{0};
    }
    return std::nullopt;
}

void CircuitBreaker::record_success() {
    switch (state_) {
    case CircuitState::closed:
        consecutive_failures_ = 0;
        break;
    case CircuitState::half_open:
        state_ = CircuitState::closed;
        consecutive_failures_ = 0;
        half_open_calls_ = 0;
        break;
    case CircuitState::open:
        // late completion of a call admitted before the breaker opened
        break;
    }
}

void CircuitBreaker::record_failure(TimePoint now) {
    consecutive_failures_++;
    switch (state_) {
    case CircuitState::closed:
        if (consecutive_failures_ >= config_.failure_threshold) {
            state_ = CircuitState::open;
            opened_at_ = now;
        }
        break;
    case CircuitState::half_open:
        state_ = CircuitState::open;
        opened_at_ = now;
        half_open_calls_ = 0;
        break;
    case CircuitState::open:
        break;
    }
}

// ── CircuitBreakerRegistry ────────────────────────────────────────────

CircuitBreakerRegistry::CircuitBreakerRegistry(CircuitBreakerConfig defaults, TimeSource now)
    : defaults_(defaults), now_(std::move(now)) {
    if (!now_) now_ = [] { return std::chrono::steady_clock::now(); };
}

CircuitBreakerConfig CircuitBreakerRegistry::config_for(const std::string& tool) const {
    auto it = overrides_.find(tool);
    return it != overrides_.end() ? it->second : defaults_;
}

void CircuitBreakerRegistry::configure(const std::string& tool, const CircuitBreakerConfig& cfg) {
    std::unique_lock<std::shared_mutex> lock(map_mutex_);
    overrides_[tool] = cfg;
    auto it = entries_.find(tool);
    if (it != entries_.end()) {
        std::lock_guard<std::mutex> entry_lock(it->second->mutex);
        it->second->breaker = CircuitBreaker(cfg);
    }
}

CircuitBreakerRegistry::Entry& CircuitBreakerRegistry::entry(const std::string& tool) {
    {
        std::shared_lock<std::shared_mutex> lock(map_mutex_);
        auto it = entries_.find(tool);
        if (it != entries_.end()) return *it->second;
    }
    std::unique_lock<std::shared_mutex> lock(map_mutex_);
    auto it = entries_.find(tool);
    if (it == entries_.end()) {
        it = entries_.emplace(tool, std::make_unique<Entry>(config_for(tool))).first;
    }
    return *it->second;
}

const CircuitBreakerRegistry::Entry* CircuitBreakerRegistry::find(const std::string& tool) const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    auto it = entries_.find(tool);
    return it == entries_.end() ? nullptr : it->second.get();
}

std::optional<BreakerRejection> CircuitBreakerRegistry::check(const std::string& tool) {
    auto& e = entry(tool);
    std::lock_guard<std::mutex> lock(e.mutex);
    auto before = e.breaker.state();
    auto wait = e.breaker.admit(now_());
    if (before == CircuitState::open && e.breaker.state() == CircuitState::half_open) {
        std::cerr << "[breaker] '" << tool << "' half-open, admitting probe\n";
    }
    if (!wait) return std::nullopt;
    return BreakerRejection{tool, e.breaker.state(), e.breaker.failure_count(), *wait};
}

void CircuitBreakerRegistry::record_success(const std::string& tool) {
    auto& e = entry(tool);
    std::lock_guard<std::mutex> lock(e.mutex);
    auto before = e.breaker.state();
    e.breaker.record_success();
    if (before == CircuitState::half_open && e.breaker.state() == CircuitState::closed) {
        std::cerr << "[breaker] '" << tool << "' closed after successful probe\n";
    }
}

void CircuitBreakerRegistry::record_failure(const std::string& tool) {
    auto& e = entry(tool);
    std::lock_guard<std::mutex> lock(e.mutex);
    auto before = e.breaker.state();
    e.breaker.record_failure(now_());
    if (before != CircuitState::open && e.breaker.state() == CircuitState::open) {
        std::cerr << "[breaker] '" << tool << "' opened after "
                  << e.breaker.failure_count() << " consecutive failures\n";
    }
}

void CircuitBreakerRegistry::reset(const std::string& tool) {
    auto& e = entry(tool);
    std::lock_guard<std::mutex> lock(e.mutex);
    e.breaker = CircuitBreaker(e.breaker.config());
}

CircuitState CircuitBreakerRegistry::state(const std::string& tool) const {
    auto* e = find(tool);
    if (!e) return CircuitState::closed;
    std::lock_guard<std::mutex> lock(e->mutex);
    return e->breaker.state();
}

uint32_t CircuitBreakerRegistry::failure_count(const std::string& tool) const {
    auto* e = find(tool);
    if (!e) return 0;
    std::lock_guard<std::mutex> lock(e->mutex);
    return e->breaker.failure_count();
}

std::map<std::string, CircuitState> CircuitBreakerRegistry::snapshot() const {
    std::map<std::string, CircuitState> out;
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    for (auto& [name, e] : entries_) {
        std::lock_guard<std::mutex> entry_lock(e->mutex);
        out[name] = e->breaker.state();
    }
    return out;
}

} // namespace orga
