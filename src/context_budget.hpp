#pragma once
#include "conversation.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <atomic>
#include <nlohmann/json.hpp>

namespace orga {

// Advisory token counter. The per-message heuristic is pluggable; a
// calibration ratio is reconciled against provider-reported prompt usage.
// Safe to share between concurrent runs; the heuristic must be too.
class TokenEstimator {
public:
    using Heuristic = std::function<size_t(const Message&)>;

    TokenEstimator();
    explicit TokenEstimator(Heuristic heuristic);

    // max(chars / 4, 1) + 4 per message
    static size_t default_heuristic(const Message& msg);

    size_t estimate(const Message& msg) const;
    size_t estimate(const std::vector<Message>& msgs) const;
    size_t estimate(const Conversation& conv) const;

    // Moves the calibration ratio toward reported/estimated.
    void reconcile(size_t estimated_prompt_tokens, size_t reported_prompt_tokens);
    double calibration() const { return calibration_.load(); }

private:
    Heuristic heuristic_;
    std::atomic<double> calibration_{1.0};
};

enum class BudgetStrategy { sliding_window, observation_masking, anchored_summary };

const char* budget_strategy_name(BudgetStrategy s);
BudgetStrategy parse_budget_strategy(const std::string& s);

struct ContextConfig {
    BudgetStrategy strategy = BudgetStrategy::observation_masking;
    size_t recent_count = 4;   // anchored summary: messages kept verbatim
    size_t keep_recent = 6;    // observation masking: messages never masked
    size_t mask_threshold = 0; // observation masking: 0 = the budget limit

    nlohmann::json to_json() const;
    static ContextConfig from_json(const nlohmann::json& j);
};

class ContextBudgeter {
public:
    explicit ContextBudgeter(std::shared_ptr<TokenEstimator> estimator = nullptr);
    virtual ~ContextBudgeter() = default;

    // Shrinks the conversation until its estimate is at or under limit.
    // Returns the number of messages removed or rewritten.
    virtual size_t enforce_budget(Conversation& conv, size_t limit) = 0;
    virtual const char* name() const = 0;

    TokenEstimator& estimator() { return *estimator_; }
    const TokenEstimator& estimator() const { return *estimator_; }

protected:
    std::shared_ptr<TokenEstimator> estimator_;
};

class SlidingWindowBudgeter : public ContextBudgeter {
public:
    using ContextBudgeter::ContextBudgeter;
    size_t enforce_budget(Conversation& conv, size_t limit) override;
    const char* name() const override { return "sliding_window"; }
};

class ObservationMaskingBudgeter : public ContextBudgeter {
public:
    ObservationMaskingBudgeter(size_t keep_recent, size_t mask_threshold,
                               std::shared_ptr<TokenEstimator> estimator = nullptr);
    size_t enforce_budget(Conversation& conv, size_t limit) override;
    const char* name() const override { return "observation_masking"; }

private:
    size_t keep_recent_;
    size_t mask_threshold_;
    SlidingWindowBudgeter fallback_;
};

class AnchoredSummaryBudgeter : public ContextBudgeter {
public:
    // Folds the dropped middle of a conversation into one summary text.
    using Summarizer = std::function<std::string(const std::vector<Message>& dropped)>;

    AnchoredSummaryBudgeter(size_t recent_count, Summarizer summarizer = nullptr,
                            std::shared_ptr<TokenEstimator> estimator = nullptr);
    size_t enforce_budget(Conversation& conv, size_t limit) override;
    const char* name() const override { return "anchored_summary"; }

    static std::string structural_summary(const std::vector<Message>& dropped);

private:
    size_t recent_count_;
    Summarizer summarizer_;
    SlidingWindowBudgeter fallback_;
};

std::unique_ptr<ContextBudgeter> make_budgeter(const ContextConfig& cfg,
                                               std::shared_ptr<TokenEstimator> estimator = nullptr);

} // namespace orga
