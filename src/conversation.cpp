#include "conversation.hpp"
#include <stdexcept>

namespace orga {

Conversation Conversation::with_system(const std::string& system_prompt) {
    Conversation c;
    c.push(Message::system(system_prompt));
    return c;
}

void Conversation::push(Message msg) {
    if (msg.role == Role::system && !messages_.empty()) {
        throw std::invalid_argument("System message must be the single leading entry");
    }
    messages_.push_back(std::move(msg));
}

void Conversation::set_knowledge_context(const std::string& text) {
    knowledge_ = Message::user(std::string(knowledge_marker) + "\n" + text);
}

std::vector<Message> Conversation::rendered_messages() const {
    std::vector<Message> out;
    out.reserve(messages_.size() + 1);
    size_t i = 0;
    if (has_system()) out.push_back(messages_[i++]);
    if (knowledge_) out.push_back(*knowledge_);
    for (; i < messages_.size(); i++) out.push_back(messages_[i]);
    return out;
}

nlohmann::json Conversation::render_for_provider(WireFormat format) const {
    return format == WireFormat::anthropic ? render_anthropic() : render_openai();
}

nlohmann::json Conversation::render_openai() const {
    auto arr = nlohmann::json::array();
    for (auto& m : rendered_messages()) {
        auto j = m.to_json();
        // OpenAI expects null content on pure tool-call turns
        if (m.role == Role::assistant && m.content.empty() && !m.tool_calls.empty()) {
            j["content"] = nullptr;
        }
        arr.push_back(std::move(j));
    }
    return arr;
}

static nlohmann::json parse_tool_input(const std::string& arguments) {
    if (arguments.empty()) return nlohmann::json::object();
    try {
        auto j = nlohmann::json::parse(arguments);
        if (j.is_object()) return j;
    } catch (const nlohmann::json::parse_error&) {}
    return nlohmann::json{{"_raw", arguments}};
}

nlohmann::json Conversation::render_anthropic() const {
    nlohmann::json out;
    std::string system_text;
    auto msgs = nlohmann::json::array();

    // Anthropic requires strictly alternating roles, so consecutive tool
    // results are merged into one user turn.
    auto append_block = [&](const char* role, nlohmann::json block) {
        if (!msgs.empty() && msgs.back()["role"] == role && msgs.back()["content"].is_array()) {
            msgs.back()["content"].push_back(std::move(block));
            return;
        }
        msgs.push_back({{"role", role}, {"content", nlohmann::json::array({std::move(block)})}});
    };

    for (auto& m : rendered_messages()) {
        switch (m.role) {
        case Role::system:
            system_text = m.content;
            break;
        case Role::user:
            append_block("user", {{"type", "text"}, {"text", m.content}});
            break;
        case Role::assistant:
            if (!m.content.empty()) {
                append_block("assistant", {{"type", "text"}, {"text", m.content}});
            }
            for (auto& tc : m.tool_calls) {
                append_block("assistant", {
                    {"type", "tool_use"},
                    {"id", tc.id},
                    {"name", tc.name},
                    {"input", parse_tool_input(tc.arguments)}
                });
            }
            break;
        case Role::tool:
            append_block("user", {
                {"type", "tool_result"},
                {"tool_use_id", m.tool_call_id},
                {"content", m.content}
            });
            break;
        }
    }

    if (!system_text.empty()) out["system"] = system_text;
    out["messages"] = std::move(msgs);
    return out;
}

std::string Conversation::last_assistant_text() const {
    for (auto it = messages_.rbegin(); it != messages_.rend(); ++it) {
        if (it->role == Role::assistant) return it->content;
    }
    return "";
}

void Conversation::replace_messages(std::vector<Message> msgs) {
    for (size_t i = 1; i < msgs.size(); i++) {
        if (msgs[i].role == Role::system) {
            throw std::invalid_argument("System message must be the single leading entry");
        }
    }
    messages_ = std::move(msgs);
}

nlohmann::json Conversation::to_json() const {
    nlohmann::json j;
    auto& arr = j["messages"];
    arr = nlohmann::json::array();
    for (auto& m : messages_) arr.push_back(m.to_json());
    if (knowledge_) j["knowledge_context"] = knowledge_->content;
    return j;
}

Conversation Conversation::from_json(const nlohmann::json& j) {
    Conversation c;
    if (j.contains("messages") && j["messages"].is_array()) {
        for (auto& m : j["messages"]) c.push(Message::from_json(m));
    }
    if (j.contains("knowledge_context") && j["knowledge_context"].is_string()) {
        c.knowledge_ = Message::user(j["knowledge_context"].get<std::string>());
    }
    return c;
}

} // namespace orga
