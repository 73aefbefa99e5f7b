#include "context_budget.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <map>
#include <set>
#include <stdexcept>

namespace orga {

// ── TokenEstimator ────────────────────────────────────────────────────

TokenEstimator::TokenEstimator() : heuristic_(&TokenEstimator::default_heuristic) {}

TokenEstimator::TokenEstimator(Heuristic heuristic) : heuristic_(std::move(heuristic)) {
    if (!heuristic_) heuristic_ = &TokenEstimator::default_heuristic;
}

size_t TokenEstimator::default_heuristic(const Message& msg) {
    size_t chars = msg.content.size();
    for (auto& tc : msg.tool_calls) chars += tc.name.size() + tc.arguments.size();
    return std::max<size_t>(chars / 4, 1) + 4;
}

size_t TokenEstimator::estimate(const Message& msg) const {
    return static_cast<size_t>(std::ceil(static_cast<double>(heuristic_(msg)) * calibration_.load()));
}

size_t TokenEstimator::estimate(const std::vector<Message>& msgs) const {
    size_t total = 0;
    for (auto& m : msgs) total += estimate(m);
    return total;
}

size_t TokenEstimator::estimate(const Conversation& conv) const {
    return estimate(conv.rendered_messages());
}

void TokenEstimator::reconcile(size_t estimated_prompt_tokens, size_t reported_prompt_tokens) {
    if (estimated_prompt_tokens == 0 || reported_prompt_tokens == 0) return;
    double observed = static_cast<double>(reported_prompt_tokens) /
                      static_cast<double>(estimated_prompt_tokens);
    double current = calibration_.load();
    double next;
    do {
        next = std::clamp(0.5 * current + 0.5 * current * observed, 0.25, 4.0);
    } while (!calibration_.compare_exchange_weak(current, next));
}

// ── Strategy config ───────────────────────────────────────────────────

const char* budget_strategy_name(BudgetStrategy s) {
    switch (s) {
    case BudgetStrategy::sliding_window:      return "sliding_window";
    case BudgetStrategy::observation_masking: return "observation_masking";
    case BudgetStrategy::anchored_summary:    return "anchored_summary";
    }
    return "sliding_window";
}

BudgetStrategy parse_budget_strategy(const std::string& s) {
    if (s == "sliding_window") return BudgetStrategy::sliding_window;
    if (s == "observation_masking") return BudgetStrategy::observation_masking;
    if (s == "anchored_summary") return BudgetStrategy::anchored_summary;
    throw std::invalid_argument("Unknown context strategy: '" + s + "'");
}

nlohmann::json ContextConfig::to_json() const {
    return {{"strategy", budget_strategy_name(strategy)},
            {"recent_count", recent_count},
            {"keep_recent", keep_recent},
            {"mask_threshold", mask_threshold}};
}

ContextConfig ContextConfig::from_json(const nlohmann::json& j) {
    ContextConfig c;
    if (j.contains("strategy")) c.strategy = parse_budget_strategy(j["strategy"].get<std::string>());
    c.recent_count = j.value("recent_count", c.recent_count);
    c.keep_recent = j.value("keep_recent", c.keep_recent);
    c.mask_threshold = j.value("mask_threshold", c.mask_threshold);
    return c;
}

ContextBudgeter::ContextBudgeter(std::shared_ptr<TokenEstimator> estimator)
    : estimator_(estimator ? std::move(estimator) : std::make_shared<TokenEstimator>()) {}

// ── Sliding window ────────────────────────────────────────────────────

size_t SlidingWindowBudgeter::enforce_budget(Conversation& conv, size_t limit) {
    if (estimator_->estimate(conv) <= limit) return 0;

    const auto& msgs = conv.messages();
    size_t first = conv.has_system() ? 1 : 0;

    size_t overhead = 0;
    if (conv.has_system()) overhead += estimator_->estimate(msgs.front());
    if (conv.knowledge_context()) overhead += estimator_->estimate(*conv.knowledge_context());
    size_t available = limit > overhead ? limit - overhead : 0;

    // Newest messages first, until the next one would not fit
    size_t keep_from = msgs.size();
    size_t used = 0;
    while (keep_from > first) {
        size_t cost = estimator_->estimate(msgs[keep_from - 1]);
        if (used + cost > available) break;
        used += cost;
        keep_from--;
    }

    // A tool result is meaningless without the assistant turn that asked for it
    while (keep_from < msgs.size() && msgs[keep_from].role == Role::tool) keep_from++;

    // Nothing whole fits: keep the newest turn, walking back over its tool
    // results to the assistant message that requested them
    if (keep_from >= msgs.size() && msgs.size() > first) {
        keep_from = msgs.size() - 1;
        while (keep_from > first && msgs[keep_from].role == Role::tool) keep_from--;
        std::cerr << "[context] newest turn (" << msgs.size() - keep_from
                  << " message(s)) exceeds budget of " << limit << " tokens\n";
    }

    std::vector<Message> kept;
    if (conv.has_system()) kept.push_back(msgs.front());
    kept.insert(kept.end(), msgs.begin() + static_cast<std::ptrdiff_t>(keep_from), msgs.end());

    size_t removed = msgs.size() - kept.size();
    conv.replace_messages(std::move(kept));
    return removed;
}

// ── Observation masking ───────────────────────────────────────────────

ObservationMaskingBudgeter::ObservationMaskingBudgeter(size_t keep_recent, size_t mask_threshold,
                                                       std::shared_ptr<TokenEstimator> estimator)
    : ContextBudgeter(estimator)
    , keep_recent_(keep_recent)
    , mask_threshold_(mask_threshold)
    , fallback_(estimator_) {}

static std::string placeholder_for(const std::string& tool) {
    return "[Previous " + tool + " result omitted for context management]";
}

size_t ObservationMaskingBudgeter::enforce_budget(Conversation& conv, size_t limit) {
    size_t threshold = mask_threshold_ > 0 ? std::min(mask_threshold_, limit) : limit;
    if (estimator_->estimate(conv) <= threshold) return 0;

    std::vector<Message> msgs = conv.messages();
    std::map<std::string, std::string> call_names;
    size_t masked = 0;
    size_t protect_from = msgs.size() > keep_recent_ ? msgs.size() - keep_recent_ : 0;

    for (size_t i = 0; i < protect_from; i++) {
        auto& m = msgs[i];
        for (auto& tc : m.tool_calls) call_names[tc.id] = tc.name;
        if (m.role != Role::tool) continue;

        auto it = call_names.find(m.tool_call_id);
        std::string placeholder = placeholder_for(it != call_names.end() ? it->second : "tool");
        if (m.content == placeholder) continue;
        m.content = std::move(placeholder);
        masked++;
    }

    conv.replace_messages(std::move(msgs));
    if (estimator_->estimate(conv) <= limit) return masked;
    return masked + fallback_.enforce_budget(conv, limit);
}

// ── Anchored summary ──────────────────────────────────────────────────

AnchoredSummaryBudgeter::AnchoredSummaryBudgeter(size_t recent_count, Summarizer summarizer,
                                                 std::shared_ptr<TokenEstimator> estimator)
    : ContextBudgeter(estimator)
    , recent_count_(recent_count)
    , summarizer_(summarizer ? std::move(summarizer) : &AnchoredSummaryBudgeter::structural_summary)
    , fallback_(estimator_) {}

std::string AnchoredSummaryBudgeter::structural_summary(const std::vector<Message>& dropped) {
    size_t tool_calls = 0;
    size_t tool_results = 0;
    std::set<std::string> tools_used;
    for (auto& m : dropped) {
        if (m.role == Role::tool) tool_results++;
        for (auto& tc : m.tool_calls) {
            tool_calls++;
            tools_used.insert(tc.name);
        }
    }

    std::string out = "[Context summary: " + std::to_string(dropped.size()) + " messages omitted (" +
                      std::to_string(tool_calls) + " tool calls, " +
                      std::to_string(tool_results) + " tool results).";
    if (!tools_used.empty()) {
        out += " Tools used: ";
        bool first = true;
        for (auto& t : tools_used) {
            if (!first) out += ", ";
            out += t;
            first = false;
        }
        out += ".";
    }
    out += "]";
    return out;
}

size_t AnchoredSummaryBudgeter::enforce_budget(Conversation& conv, size_t limit) {
    if (estimator_->estimate(conv) <= limit) return 0;

    const auto& msgs = conv.messages();
    size_t anchor_end = conv.has_system() ? 1 : 0;
    for (size_t i = anchor_end; i < msgs.size(); i++) {
        if (msgs[i].role == Role::user) {
            anchor_end = i + 1;
            break;
        }
    }

    size_t recent_start = msgs.size() > recent_count_ ? msgs.size() - recent_count_ : 0;
    recent_start = std::max(recent_start, anchor_end);
    while (recent_start > anchor_end && recent_start < msgs.size() && msgs[recent_start].role == Role::tool) {
        recent_start--;
    }

    if (recent_start <= anchor_end) return fallback_.enforce_budget(conv, limit);

    std::vector<Message> dropped(msgs.begin() + static_cast<std::ptrdiff_t>(anchor_end),
                                 msgs.begin() + static_cast<std::ptrdiff_t>(recent_start));

    std::vector<Message> rebuilt(msgs.begin(), msgs.begin() + static_cast<std::ptrdiff_t>(anchor_end));
    rebuilt.push_back(Message::user(summarizer_(dropped)));
    rebuilt.insert(rebuilt.end(), msgs.begin() + static_cast<std::ptrdiff_t>(recent_start), msgs.end());

    // The summary replaces the dropped middle with one message
    size_t changed = dropped.size();
    conv.replace_messages(std::move(rebuilt));
    if (estimator_->estimate(conv) <= limit) return changed;
    return changed + fallback_.enforce_budget(conv, limit);
}

std::unique_ptr<ContextBudgeter> make_budgeter(const ContextConfig& cfg,
                                               std::shared_ptr<TokenEstimator> estimator) {
    switch (cfg.strategy) {
    case BudgetStrategy::sliding_window:
        return std::make_unique<SlidingWindowBudgeter>(estimator);
    case BudgetStrategy::observation_masking:
        return std::make_unique<ObservationMaskingBudgeter>(cfg.keep_recent, cfg.mask_threshold, estimator);
    case BudgetStrategy::anchored_summary:
        return std::make_unique<AnchoredSummaryBudgeter>(cfg.recent_count, nullptr, estimator);
    }
    return std::make_unique<SlidingWindowBudgeter>(estimator);
}

} // namespace orga
