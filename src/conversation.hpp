#pragma once
#include "message.hpp"
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace orga {

enum class WireFormat { openai, anthropic };

// Ordered, role-tagged message log for one loop run. The log itself is
// append-only; the budgeter is the only writer allowed to rebuild it, and the
// knowledge context lives in its own replaceable slot outside the log.
class Conversation {
public:
    static constexpr const char* knowledge_marker = "[KNOWLEDGE_CONTEXT]";

    Conversation() = default;
    static Conversation with_system(const std::string& system_prompt);

    // Throws std::invalid_argument when a System message would not be the
    // single leading entry.
    void push(Message msg);

    const std::vector<Message>& messages() const { return messages_; }
    size_t size() const { return messages_.size(); }
    bool empty() const { return messages_.empty(); }
    bool has_system() const { return !messages_.empty() && messages_.front().role == Role::system; }
    const Message* system_message() const { return has_system() ? &messages_.front() : nullptr; }

    void set_knowledge_context(const std::string& text);
    void clear_knowledge_context() { knowledge_.reset(); }
    const std::optional<Message>& knowledge_context() const { return knowledge_; }

    // Full message sequence as sent to a provider: system, knowledge slot,
    // then the rest of the log.
    std::vector<Message> rendered_messages() const;

    // openai    -> [{role, content, tool_calls?, tool_call_id?}, ...]
    // anthropic -> {"system": "...", "messages": [...content blocks...]}
    nlohmann::json render_for_provider(WireFormat format) const;

    // Content of the most recent assistant message, or "" if none.
    std::string last_assistant_text() const;

    // Used by context budgeting strategies only.
    void replace_messages(std::vector<Message> msgs);

    nlohmann::json to_json() const;
    static Conversation from_json(const nlohmann::json& j);

private:
    std::vector<Message> messages_;
    std::optional<Message> knowledge_;

    nlohmann::json render_openai() const;
    nlohmann::json render_anthropic() const;
};

} // namespace orga
