#include "action_executor.hpp"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <iostream>
#include <thread>

namespace orga {

// ── ResultCache ───────────────────────────────────────────────────────

void ResultCache::put(const std::string& tool, const std::string& arguments, const std::string& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[{tool, arguments}] = Entry{payload, Clock::now()};
    if (entries_.size() <= max_entries_) return;

    auto oldest = entries_.begin();
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (it->second.stored_at < oldest->second.stored_at) oldest = it;
    }
    entries_.erase(oldest);
}

std::optional<ResultCache::Hit> ResultCache::get(const std::string& tool, const std::string& arguments,
                                                 Millis max_staleness) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find({tool, arguments});
    if (it == entries_.end()) return std::nullopt;
    auto age = std::chrono::duration_cast<Millis>(Clock::now() - it->second.stored_at);
    if (age > max_staleness) return std::nullopt;
    return Hit{it->second.payload, age};
}

size_t ResultCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

// ── Worker bookkeeping ────────────────────────────────────────────────

struct DefaultActionExecutor::CallState {
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    ToolOutcome outcome;
};

// Calls that overran their timeout. They are given a short grace period at
// the end of the phase, then detached; each owns everything it touches.
class DefaultActionExecutor::Stragglers {
public:
    void add(std::string tool, std::thread worker, std::shared_ptr<CallState> state) {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back({std::move(tool), std::move(worker), std::move(state)});
    }

    void drain(Millis grace) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto deadline = Clock::now() + grace;
        for (auto& call : calls_) {
            bool finished;
            {
                std::unique_lock<std::mutex> state_lock(call.state->mutex);
                finished = call.state->cv.wait_until(state_lock, deadline, [&] { return call.state->done; });
            }
            if (finished) {
                call.worker.join();
            } else {
                std::cerr << "[executor] '" << call.tool << "' still running after timeout, detaching\n";
                call.worker.detach();
            }
        }
        calls_.clear();
    }

private:
    struct Call {
        std::string tool;
        std::thread worker;
        std::shared_ptr<CallState> state;
    };
    std::mutex mutex_;
    std::vector<Call> calls_;
};

DefaultActionExecutor::DefaultActionExecutor(std::shared_ptr<ToolInvoker> invoker, Millis drain_grace)
    : invoker_(std::move(invoker)), drain_grace_(drain_grace) {
    if (!invoker_) throw std::invalid_argument("DefaultActionExecutor needs a tool invoker");
}

ToolOutcome DefaultActionExecutor::invoke_with_timeout(const std::string& tool, const std::string& arguments,
                                                       Millis timeout, Stragglers& stragglers) {
    auto state = std::make_shared<CallState>();
    auto invoker = invoker_;
    std::thread worker([invoker, state, tool, arguments, timeout] {
        ToolOutcome out;
        try {
            out = invoker->invoke(tool, arguments, timeout);
        } catch (const std::exception& e) {
            out = ToolOutcome::failure(e.what(), true);
        }
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->outcome = std::move(out);
            state->done = true;
        }
        state->cv.notify_all();
    });

    std::unique_lock<std::mutex> lock(state->mutex);
    if (state->cv.wait_for(lock, timeout, [&] { return state->done; })) {
        ToolOutcome out = std::move(state->outcome);
        lock.unlock();
        worker.join();
        return out;
    }
    lock.unlock();

    std::cerr << "[executor] '" << tool << "' timed out after " << timeout.count() << "ms\n";
    stragglers.add(tool, std::move(worker), state);
    return ToolOutcome::failure("Tool '" + tool + "' timed out after " + std::to_string(timeout.count()) + "ms",
                                true, ExecutionErrorKind::tool_timeout);
}

ToolOutcome DefaultActionExecutor::invoke_guarded(const std::string& tool, const std::string& arguments,
                                                  const LoopConfig& config, CircuitBreakerRegistry& breakers,
                                                  const DispatchContext& context, Stragglers& stragglers) {
    auto now = Clock::now();
    if (now >= context.deadline) {
        return ToolOutcome::failure("Run deadline reached before '" + tool + "' could start",
                                    false, ExecutionErrorKind::tool_timeout);
    }
    if (auto rejection = breakers.check(tool)) {
        return ToolOutcome::failure(rejection->message(), false, ExecutionErrorKind::breaker_open);
    }

    auto remaining = std::chrono::duration_cast<Millis>(context.deadline - now);
    auto timeout = std::min(config.tool_timeout, remaining);
    auto out = invoke_with_timeout(tool, arguments, timeout, stragglers);

    if (out.ok) {
        breakers.record_success(tool);
        cache_.put(tool, arguments, out.output);
    } else {
        breakers.record_failure(tool);
    }
    return out;
}

// ── Recovery ──────────────────────────────────────────────────────────

// Resolves one failed action against its recovery strategy.
struct DefaultActionExecutor::Recovery {
    DefaultActionExecutor& executor;
    const ProposedAction& action;
    const ToolOutcome& failure;
    const LoopConfig& config;
    CircuitBreakerRegistry& breakers;
    const DispatchContext& context;
    Stragglers& stragglers;
    Clock::time_point started;

    Millis elapsed() const { return std::chrono::duration_cast<Millis>(Clock::now() - started); }
    const std::string& tool() const { return action.as_tool_call().name; }
    const std::string& arguments() const { return action.as_tool_call().arguments; }

    Observation to_observation(const ToolOutcome& out, const char* strategy) const {
        auto obs = out.ok
            ? Observation::success(action.raw_id, tool(), out.output, elapsed())
            : Observation::failure(action.raw_id, tool(), out.output, out.retriable, out.kind, elapsed());
        obs.recovery = strategy;
        return obs;
    }

    Observation operator()(const RetryRecovery& r) const {
        ToolOutcome out = failure;
        auto cap = r.base_delay * 8;
        for (uint32_t attempt = 1; !out.ok && out.retriable && attempt < r.max_attempts; attempt++) {
            auto delay = std::min(r.base_delay * (1 << std::min<uint32_t>(attempt - 1, 16)), cap);
            if (Clock::now() + delay >= context.deadline) break;
            std::this_thread::sleep_for(delay);
            std::cerr << "[executor] retrying '" << tool() << "' (attempt " << attempt + 1
                      << "/" << r.max_attempts << ")\n";
            out = executor.invoke_guarded(tool(), arguments(), config, breakers, context, stragglers);
        }
        return to_observation(out, "retry");
    }

    Observation operator()(const FallbackRecovery& r) const {
        std::string errors = failure.output;
        for (auto& alt : r.alternatives) {
            if (alt == tool()) continue;
            if (!config.declares_tool(alt)) {
                std::cerr << "[executor] fallback '" << alt << "' is not a declared tool, skipping\n";
                continue;
            }
            auto out = executor.invoke_guarded(alt, arguments(), config, breakers, context, stragglers);
            if (out.ok) {
                auto obs = to_observation(out, "fallback");
                obs.recovery = "fallback:" + alt;
                return obs;
            }
            errors += "; fallback '" + alt + "' failed: " + out.output;
        }
        ToolOutcome combined = failure;
        combined.output = errors;
        return to_observation(combined, "fallback");
    }

    Observation operator()(const CachedResultRecovery& r) const {
        auto hit = executor.cache_.get(tool(), arguments(), r.max_staleness);
        if (!hit) return to_observation(failure, "cached_result");
        auto secs = std::chrono::duration_cast<std::chrono::seconds>(hit->age).count();
        return to_observation(ToolOutcome::success("[cached result from " + std::to_string(secs) +
                                                   "s ago] " + hit->payload),
                              "cached_result");
    }

    Observation operator()(const LlmRecovery& r) const {
        if (!context.ledger->consume_llm_attempt(tool(), r.max_recovery_attempts)) {
            std::cerr << "[executor] '" << tool() << "' exhausted " << r.max_recovery_attempts
                      << " recovery hints\n";
            return (*this)(DeadLetterRecovery{});
        }
        ToolOutcome hinted = failure;
        hinted.retriable = false;
        hinted.output += "\nThe tool call failed. Consider different arguments, a different tool, "
                         "or answering without it.";
        return to_observation(hinted, "llm_recovery");
    }

    Observation operator()(const EscalateRecovery& r) const {
        auto obs = to_observation(failure, "escalate");
        obs.escalated = true;
        obs.escalation_queue = r.queue;
        if (r.context_snapshot) {
            obs.escalation_context = {
                {"agent_id", context.agent_id},
                {"tool", tool()},
                {"arguments", arguments()},
                {"error", failure.output}
            };
        }
        context.ledger->record_escalation(obs);
        std::cerr << "[executor] '" << tool() << "' escalated to queue '" << r.queue << "'\n";
        return obs;
    }

    Observation operator()(const DeadLetterRecovery&) const {
        auto obs = to_observation(failure, "dead_letter");
        obs.dead_lettered = true;
        context.ledger->record_dead_letter(obs);
        std::cerr << "[executor] '" << tool() << "' dead-lettered: " << failure.output << "\n";
        return obs;
    }
};

Observation DefaultActionExecutor::run_action(const ProposedAction& action, const LoopConfig& config,
                                              CircuitBreakerRegistry& breakers, const DispatchContext& context,
                                              Stragglers& stragglers) {
    auto started = Clock::now();
    if (!action.is_tool_call()) {
        return Observation::failure(action.raw_id, "", "Only tool calls can be dispatched", false,
                                    ExecutionErrorKind::invocation_failed);
    }
    auto& call = action.as_tool_call();
    auto out = invoke_guarded(call.name, call.arguments, config, breakers, context, stragglers);
    if (out.ok) {
        return Observation::success(action.raw_id, call.name, out.output,
                                    std::chrono::duration_cast<Millis>(Clock::now() - started));
    }

    Recovery recovery{*this, action, out, config, breakers, context, stragglers, started};
    return std::visit(recovery, config.recovery_for(call.name));
}

std::vector<Observation> DefaultActionExecutor::execute_actions(const std::vector<ProposedAction>& actions,
                                                                const LoopConfig& config,
                                                                CircuitBreakerRegistry& breakers,
                                                                const DispatchContext& context) {
    std::vector<Observation> results(actions.size());
    if (actions.empty()) return results;

    Stragglers stragglers;
    std::atomic<size_t> next{0};
    auto work = [&] {
        for (;;) {
            size_t i = next++;
            if (i >= actions.size()) return;
            try {
                results[i] = run_action(actions[i], config, breakers, context, stragglers);
            } catch (const std::exception& e) {
                results[i] = Observation::failure(actions[i].raw_id, actions[i].tool_name(), e.what(),
                                                  false, ExecutionErrorKind::invocation_failed);
            }
        }
    };

    size_t workers = std::min(std::max<size_t>(config.max_concurrent_tools, 1), actions.size());
    if (workers == 1) {
        work();
    } else {
        std::vector<std::thread> pool;
        pool.reserve(workers);
        for (size_t i = 0; i < workers; i++) pool.emplace_back(work);
        for (auto& t : pool) t.join();
    }

    stragglers.drain(drain_grace_);
    return results;
}

} // namespace orga
