#pragma once
#include <string>
#include <vector>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace orga {

enum class Role { system, user, assistant, tool };

inline const char* role_name(Role r) {
    switch (r) {
    case Role::system:    return "system";
    case Role::user:      return "user";
    case Role::assistant: return "assistant";
    case Role::tool:      return "tool";
    }
    return "user";
}

inline Role parse_role(const std::string& s) {
    if (s == "system") return Role::system;
    if (s == "user") return Role::user;
    if (s == "assistant") return Role::assistant;
    if (s == "tool") return Role::tool;
    throw std::invalid_argument("Unknown message role: " + s);
}

struct ToolCall {
    std::string id;
    std::string name;
    std::string arguments; // JSON string
};

struct Message {
    Role role = Role::user;
    std::string content;
    std::string tool_call_id;         // for Role::tool
    std::vector<ToolCall> tool_calls; // for Role::assistant with tool calls

    static Message system(std::string text) { return {Role::system, std::move(text), "", {}}; }
    static Message user(std::string text) { return {Role::user, std::move(text), "", {}}; }
    static Message assistant(std::string text, std::vector<ToolCall> calls = {}) {
        return {Role::assistant, std::move(text), "", std::move(calls)};
    }
    static Message tool(std::string call_id, std::string text) {
        return {Role::tool, std::move(text), std::move(call_id), {}};
    }

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["role"] = role_name(role);
        j["content"] = content;
        if (!tool_call_id.empty()) j["tool_call_id"] = tool_call_id;
        if (!tool_calls.empty()) {
            auto& arr = j["tool_calls"];
            for (auto& tc : tool_calls) {
                arr.push_back({
                    {"id", tc.id},
                    {"type", "function"},
                    {"function", {{"name", tc.name}, {"arguments", tc.arguments}}}
                });
            }
        }
        return j;
    }

    static Message from_json(const nlohmann::json& j) {
        Message m;
        m.role = parse_role(j.value("role", "user"));
        if (j.contains("content") && j["content"].is_string()) m.content = j["content"].get<std::string>();
        m.tool_call_id = j.value("tool_call_id", "");
        if (j.contains("tool_calls") && j["tool_calls"].is_array()) {
            for (auto& tc : j["tool_calls"]) {
                ToolCall t;
                t.id = tc.value("id", "");
                if (tc.contains("function")) {
                    t.name = tc["function"].value("name", "");
                    t.arguments = tc["function"].value("arguments", "");
                }
                m.tool_calls.push_back(std::move(t));
            }
        }
        return m;
    }
};

} // namespace orga
