#include "knowledge_bridge.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iostream>

namespace orga {

nlohmann::json KnowledgeConfig::to_json() const {
    return {{"max_context_items", max_context_items},
            {"relevance_threshold", relevance_threshold},
            {"auto_persist", auto_persist}};
}

KnowledgeConfig KnowledgeConfig::from_json(const nlohmann::json& j) {
    KnowledgeConfig c;
    c.max_context_items = j.value("max_context_items", c.max_context_items);
    c.relevance_threshold = j.value("relevance_threshold", c.relevance_threshold);
    c.auto_persist = j.value("auto_persist", c.auto_persist);
    return c;
}

// ── Search terms ──────────────────────────────────────────────────────

static std::string trim_non_alnum(const std::string& word) {
    size_t b = 0, e = word.size();
    while (b < e && !std::isalnum(static_cast<unsigned char>(word[b]))) b++;
    while (e > b && !std::isalnum(static_cast<unsigned char>(word[e - 1]))) e--;
    return word.substr(b, e - b);
}

std::vector<std::string> extract_search_terms(const Conversation& conversation) {
    const size_t max_terms = 15;
    std::vector<std::string> terms;
    auto& msgs = conversation.messages();

    size_t seen = 0;
    for (auto it = msgs.rbegin(); it != msgs.rend() && seen < 5; ++it, ++seen) {
        if (it->role != Role::user && it->role != Role::tool) continue;

        size_t taken = 0;
        std::string word;
        auto flush = [&] {
            if (word.size() > 3 && taken < 10) {
                taken++;
                auto cleaned = trim_non_alnum(word);
                if (!cleaned.empty() && std::find(terms.begin(), terms.end(), cleaned) == terms.end()) {
                    terms.push_back(cleaned);
                }
            }
            word.clear();
        };
        for (char c : it->content) {
            if (std::isspace(static_cast<unsigned char>(c))) flush();
            else word += c;
        }
        flush();

        if (terms.size() >= max_terms) break;
    }
    if (terms.size() > max_terms) terms.resize(max_terms);
    return terms;
}

// ── StoreKnowledgeBridge ──────────────────────────────────────────────

StoreKnowledgeBridge::StoreKnowledgeBridge(std::shared_ptr<KnowledgeStore> store,
                                           KnowledgeConfig cfg, Scorer scorer)
    : store_(std::move(store)), config_(cfg), scorer_(std::move(scorer)) {
    if (!store_) throw std::invalid_argument("StoreKnowledgeBridge needs a knowledge store");
    if (!scorer_) scorer_ = [](const std::string&, const KnowledgeItem& item) { return item.score; };
}

std::vector<KnowledgeItem> StoreKnowledgeBridge::ranked(const std::string& query, size_t k) const {
    auto items = store_->query(query, k);
    for (auto& item : items) item.score = scorer_(query, item);
    std::stable_sort(items.begin(), items.end(),
                     [](const KnowledgeItem& a, const KnowledgeItem& b) { return a.score > b.score; });
    if (items.size() > k) items.resize(k);
    return items;
}

static std::string format_score(float score) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%.2f", score);
    return buf;
}

size_t StoreKnowledgeBridge::inject_context(const std::string&, Conversation& conversation) {
    auto terms = extract_search_terms(conversation);
    if (terms.empty()) return 0;

    std::string query;
    for (auto& t : terms) {
        if (!query.empty()) query += " ";
        query += t;
    }

    std::vector<KnowledgeItem> items;
    try {
        items = ranked(query, config_.max_context_items);
    } catch (const std::exception& e) {
        std::cerr << "[knowledge] context query failed: " << e.what() << "\n";
        return 0;
    }

    std::string text = "The following relevant knowledge and context was retrieved for this conversation:";
    size_t injected = 0;
    for (auto& item : items) {
        if (item.score < config_.relevance_threshold) continue;
        text += "\n- [" + (item.source.empty() ? std::string("memory") : item.source) +
                ", relevance=" + format_score(item.score) + "] " + item.content;
        injected++;
    }

    if (injected == 0) {
        conversation.clear_knowledge_context();
        return 0;
    }
    conversation.set_knowledge_context(text);
    return injected;
}

std::vector<ToolDefinition> StoreKnowledgeBridge::tool_definitions() const {
    return {
        {recall_tool,
         "Search the knowledge store for facts relevant to a query.",
         nlohmann::json::parse(R"JSON({
             "type": "object",
             "properties": {
                 "query": {"type": "string", "description": "What to look for"},
                 "limit": {"type": "integer", "description": "Maximum results (default 5)"}
             },
             "required": ["query"]
         })JSON")},
        {store_tool,
         "Store a fact in the knowledge store as a subject-predicate-object triple.",
         nlohmann::json::parse(R"JSON({
             "type": "object",
             "properties": {
                 "subject": {"type": "string"},
                 "predicate": {"type": "string"},
                 "object": {"type": "string"},
                 "confidence": {"type": "number", "description": "0.0 to 1.0 (default 0.8)"}
             },
             "required": ["subject", "predicate", "object"]
         })JSON")}
    };
}

Observation StoreKnowledgeBridge::recall(const ProposedAction& action, const nlohmann::json& args) const {
    std::string query = args.value("query", "");
    if (query.empty()) {
        return Observation::failure(action.raw_id, recall_tool, "recall_knowledge requires a query", false,
                                    ExecutionErrorKind::invocation_failed);
    }
    int limit = std::clamp(args.value("limit", 5), 1, 20);

    auto items = ranked(query, static_cast<size_t>(limit));
    if (items.empty()) {
        return Observation::success(action.raw_id, recall_tool, "No relevant knowledge found.");
    }
    std::string out;
    int n = 1;
    for (auto& item : items) {
        if (!out.empty()) out += "\n";
        out += std::to_string(n++) + ". " + item.content + " (relevance: " + format_score(item.score) + ")";
    }
    return Observation::success(action.raw_id, recall_tool, out);
}

Observation StoreKnowledgeBridge::remember(const ProposedAction& action, const nlohmann::json& args) const {
    std::string subject = args.value("subject", "");
    std::string predicate = args.value("predicate", "");
    std::string object = args.value("object", "");
    if (subject.empty() || predicate.empty() || object.empty()) {
        return Observation::failure(action.raw_id, store_tool,
                                    "store_knowledge requires subject, predicate and object", false,
                                    ExecutionErrorKind::invocation_failed);
    }
    float confidence = std::clamp(args.value("confidence", 0.8f), 0.0f, 1.0f);
    auto id = store_->store(subject, predicate, object, confidence);
    return Observation::success(action.raw_id, store_tool,
                                "Stored fact: " + subject + " " + predicate + " " + object + " (id: " + id + ")");
}

std::optional<Observation> StoreKnowledgeBridge::handle_tool_call(const std::string&, const ProposedAction& action) {
    if (!action.is_tool_call()) return std::nullopt;
    auto& call = action.as_tool_call();
    if (call.name != recall_tool && call.name != store_tool) return std::nullopt;

    auto started = Clock::now();
    Observation obs;
    try {
        auto args = call.arguments.empty() ? nlohmann::json::object() : nlohmann::json::parse(call.arguments);
        obs = call.name == recall_tool ? recall(action, args) : remember(action, args);
    } catch (const nlohmann::json::parse_error& e) {
        obs = Observation::failure(action.raw_id, call.name, std::string("Invalid arguments: ") + e.what(),
                                   false, ExecutionErrorKind::invocation_failed);
    } catch (const std::exception& e) {
        obs = Observation::failure(action.raw_id, call.name, std::string("Knowledge store error: ") + e.what(),
                                   true, ExecutionErrorKind::invocation_failed);
    }
    obs.origin = ObservationOrigin::knowledge;
    obs.duration = std::chrono::duration_cast<Millis>(Clock::now() - started);
    return obs;
}

void StoreKnowledgeBridge::persist_learnings(const std::string& agent_id, const Conversation& conversation) {
    if (!config_.auto_persist) return;

    std::vector<std::string> responses;
    for (auto& m : conversation.messages()) {
        if (m.role == Role::assistant && !m.content.empty()) responses.push_back(m.content);
    }
    if (responses.empty()) return;

    std::string summary;
    for (auto& r : responses) {
        if (!summary.empty()) summary += "\n---\n";
        summary += r;
    }
    if (summary.size() > 2000) summary = summary.substr(0, 2000) + "...";

    try {
        store_->store(agent_id, "last_conversation_summary", summary, 1.0f);
    } catch (const std::exception& e) {
        std::cerr << "[knowledge] persist failed: " << e.what() << "\n";
    }
}

// ── KnowledgeAwareExecutor ────────────────────────────────────────────

KnowledgeAwareExecutor::KnowledgeAwareExecutor(ActionExecutor& inner, KnowledgeBridge& bridge)
    : inner_(inner), bridge_(bridge) {}

std::vector<Observation> KnowledgeAwareExecutor::execute_actions(const std::vector<ProposedAction>& actions,
                                                                 const LoopConfig& config,
                                                                 CircuitBreakerRegistry& breakers,
                                                                 const DispatchContext& context) {
    std::vector<std::optional<Observation>> answered(actions.size());
    std::vector<ProposedAction> delegated;

    for (size_t i = 0; i < actions.size(); i++) {
        answered[i] = bridge_.handle_tool_call(context.agent_id, actions[i]);
        if (!answered[i]) {
            delegated.push_back(actions[i]);
        }
    }

    std::vector<Observation> inner_results;
    if (!delegated.empty()) {
        inner_results = inner_.execute_actions(delegated, config, breakers, context);
    }

    std::vector<Observation> results;
    results.reserve(actions.size());
    size_t next_inner = 0;
    for (size_t i = 0; i < actions.size(); i++) {
        if (answered[i]) {
            results.push_back(std::move(*answered[i]));
        } else if (next_inner < inner_results.size()) {
            results.push_back(std::move(inner_results[next_inner++]));
        }
    }
    return results;
}

} // namespace orga
