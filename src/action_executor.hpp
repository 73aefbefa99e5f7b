#pragma once
#include "loop_types.hpp"
#include "circuit_breaker.hpp"
#include "tool_registry.hpp"
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

namespace orga {

// What a dispatch needs to know about the run it belongs to.
struct DispatchContext {
    std::string agent_id;
    Clock::time_point deadline = Clock::time_point::max();
    std::shared_ptr<RecoveryLedger> ledger = std::make_shared<RecoveryLedger>();
};

class ActionExecutor {
public:
    virtual ~ActionExecutor() = default;

    // One observation per action, in action order.
    virtual std::vector<Observation> execute_actions(const std::vector<ProposedAction>& actions,
                                                     const LoopConfig& config,
                                                     CircuitBreakerRegistry& breakers,
                                                     const DispatchContext& context) = 0;
};

// Last successful result per (tool, arguments).
class ResultCache {
public:
    explicit ResultCache(size_t max_entries = 256) : max_entries_(max_entries) {}

    void put(const std::string& tool, const std::string& arguments, const std::string& payload);

    struct Hit {
        std::string payload;
        Millis age{0};
    };
    std::optional<Hit> get(const std::string& tool, const std::string& arguments, Millis max_staleness) const;

    size_t size() const;

private:
    struct Entry {
        std::string payload;
        Clock::time_point stored_at;
    };
    size_t max_entries_;
    mutable std::mutex mutex_;
    std::map<std::pair<std::string, std::string>, Entry> entries_;
};

class DefaultActionExecutor : public ActionExecutor {
public:
    // `drain_grace` bounds how long a timed-out call may keep running after
    // the phase finished before its thread is detached.
    explicit DefaultActionExecutor(std::shared_ptr<ToolInvoker> invoker,
                                   Millis drain_grace = Millis{200});

    std::vector<Observation> execute_actions(const std::vector<ProposedAction>& actions,
                                             const LoopConfig& config,
                                             CircuitBreakerRegistry& breakers,
                                             const DispatchContext& context) override;

    ResultCache& cache() { return cache_; }

private:
    struct CallState;
    class Stragglers;
    struct Recovery;

    Observation run_action(const ProposedAction& action, const LoopConfig& config,
                           CircuitBreakerRegistry& breakers, const DispatchContext& context,
                           Stragglers& stragglers);

    // Breaker check, deadline-bounded invocation, breaker report.
    ToolOutcome invoke_guarded(const std::string& tool, const std::string& arguments,
                               const LoopConfig& config, CircuitBreakerRegistry& breakers,
                               const DispatchContext& context, Stragglers& stragglers);

    ToolOutcome invoke_with_timeout(const std::string& tool, const std::string& arguments,
                                    Millis timeout, Stragglers& stragglers);

    std::shared_ptr<ToolInvoker> invoker_;
    Millis drain_grace_;
    ResultCache cache_;
};

} // namespace orga
