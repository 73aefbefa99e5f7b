#pragma once
#include "action_executor.hpp"
#include "conversation.hpp"
#include "loop_types.hpp"
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <functional>
#include <nlohmann/json.hpp>

namespace orga {

struct KnowledgeItem {
    std::string id;
    std::string content;
    std::string source;
    float score = 0.0f; // relevance in [0, 1]
};

// Query side of an external fact store.
class KnowledgeStore {
public:
    virtual ~KnowledgeStore() = default;
    virtual std::vector<KnowledgeItem> query(const std::string& text, size_t k) = 0;
    // Returns the id of the stored fact.
    virtual std::string store(const std::string& subject, const std::string& predicate,
                              const std::string& object, float confidence) = 0;
};

struct KnowledgeConfig {
    size_t max_context_items = 5;
    float relevance_threshold = 0.3f;
    bool auto_persist = true;

    nlohmann::json to_json() const;
    static KnowledgeConfig from_json(const nlohmann::json& j);
};

class KnowledgeBridge {
public:
    static constexpr const char* recall_tool = "recall_knowledge";
    static constexpr const char* store_tool = "store_knowledge";

    virtual ~KnowledgeBridge() = default;

    // Refreshes the conversation's knowledge slot; returns items injected.
    virtual size_t inject_context(const std::string& agent_id, Conversation& conversation) = 0;

    // Extra tools to advertise to the model.
    virtual std::vector<ToolDefinition> tool_definitions() const = 0;

    // Answers a reserved knowledge tool directly. nullopt means the action
    // is not for the bridge and must be delegated unchanged.
    virtual std::optional<Observation> handle_tool_call(const std::string& agent_id,
                                                        const ProposedAction& action) = 0;

    virtual void persist_learnings(const std::string& agent_id, const Conversation& conversation) = 0;
};

class NullKnowledgeBridge final : public KnowledgeBridge {
public:
    size_t inject_context(const std::string&, Conversation&) override { return 0; }
    std::vector<ToolDefinition> tool_definitions() const override { return {}; }
    std::optional<Observation> handle_tool_call(const std::string&, const ProposedAction&) override {
        return std::nullopt;
    }
    void persist_learnings(const std::string&, const Conversation&) override {}
};

class StoreKnowledgeBridge : public KnowledgeBridge {
public:
    // Ranks one item for a query; the default trusts the store's score.
    using Scorer = std::function<float(const std::string& query, const KnowledgeItem& item)>;

    explicit StoreKnowledgeBridge(std::shared_ptr<KnowledgeStore> store,
                                  KnowledgeConfig cfg = {},
                                  Scorer scorer = nullptr);

    size_t inject_context(const std::string& agent_id, Conversation& conversation) override;
    std::vector<ToolDefinition> tool_definitions() const override;
    std::optional<Observation> handle_tool_call(const std::string& agent_id,
                                                const ProposedAction& action) override;
    void persist_learnings(const std::string& agent_id, const Conversation& conversation) override;

    const KnowledgeConfig& config() const { return config_; }

private:
    std::shared_ptr<KnowledgeStore> store_;
    KnowledgeConfig config_;
    Scorer scorer_;

    std::vector<KnowledgeItem> ranked(const std::string& query, size_t k) const;
    Observation recall(const ProposedAction& action, const nlohmann::json& args) const;
    Observation remember(const ProposedAction& action, const nlohmann::json& args) const;
};

// Words worth searching for, taken from the most recent user and tool messages.
std::vector<std::string> extract_search_terms(const Conversation& conversation);

// Answers knowledge tools through the bridge and hands every other action to
// the wrapped executor in one batch, preserving action order.
class KnowledgeAwareExecutor : public ActionExecutor {
public:
    KnowledgeAwareExecutor(ActionExecutor& inner, KnowledgeBridge& bridge);

    std::vector<Observation> execute_actions(const std::vector<ProposedAction>& actions,
                                             const LoopConfig& config,
                                             CircuitBreakerRegistry& breakers,
                                             const DispatchContext& context) override;

private:
    ActionExecutor& inner_;
    KnowledgeBridge& bridge_;
};

} // namespace orga
