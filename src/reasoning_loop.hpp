#pragma once
#include "action_executor.hpp"
#include "circuit_breaker.hpp"
#include "context_budget.hpp"
#include "inference.hpp"
#include "journal.hpp"
#include "knowledge_bridge.hpp"
#include "loop_metrics.hpp"
#include "loop_types.hpp"
#include "policy_gate.hpp"
#include <memory>
#include <string>

namespace orga {

// Drives one phase machine per invocation from the first Reasoning phase to
// a LoopResult. Collaborators are borrowed and must outlive the runner; the
// runner itself keeps no per-run state, so independent runs may share it.
class LoopRunner {
public:
    LoopRunner(InferenceProvider& provider, PolicyGate& gate, ActionExecutor& executor,
               ContextBudgeter& budgeter, CircuitBreakerRegistry& breakers);

    // No journal means entries are dropped.
    void set_journal(std::shared_ptr<JournalSink> journal) { journal_ = std::move(journal); }
    // No bridge means NullKnowledgeBridge.
    void set_knowledge(std::shared_ptr<KnowledgeBridge> bridge);
    // Counters start private to the runner; pass one instance to several
    // runners to aggregate them.
    void set_metrics(std::shared_ptr<LoopMetrics> metrics);
    const LoopMetrics& metrics() const { return *metrics_; }

    // Never throws; failures end the run with TerminationReason::error.
    LoopResult run(const std::string& agent_id, Conversation conversation, LoopConfig config);

private:
    InferenceProvider& provider_;
    PolicyGate& gate_;
    ActionExecutor& executor_;
    ContextBudgeter& budgeter_;
    CircuitBreakerRegistry& breakers_;
    std::shared_ptr<JournalSink> journal_;
    std::shared_ptr<KnowledgeBridge> knowledge_;
    std::shared_ptr<LoopMetrics> metrics_;

    struct RunRecorder;
};

} // namespace orga
