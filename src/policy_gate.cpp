#include "policy_gate.hpp"
#include "utils.hpp"
#include <algorithm>

namespace orga {

static bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

static std::vector<std::string> string_array(const nlohmann::json& j, const char* key) {
    std::vector<std::string> out;
    if (!j.contains(key) || !j[key].is_array()) return out;
    for (auto& item : j[key]) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

nlohmann::json PolicyRules::to_json() const {
    nlohmann::json j;
    j["denied_tools"] = denied_tools;
    j["allowed_tools"] = allowed_tools;
    j["max_argument_bytes"] = max_argument_bytes;
    j["max_calls_per_tool"] = max_calls_per_tool;
    j["redact_keys"] = redact_keys;
    j["blocked_output_terms"] = blocked_output_terms;
    return j;
}

PolicyRules PolicyRules::from_json(const nlohmann::json& j) {
    PolicyRules r;
    r.denied_tools = string_array(j, "denied_tools");
    r.allowed_tools = string_array(j, "allowed_tools");
    r.max_argument_bytes = j.value("max_argument_bytes", r.max_argument_bytes);
    if (j.contains("max_calls_per_tool") && j["max_calls_per_tool"].is_object()) {
        for (auto& [tool, limit] : j["max_calls_per_tool"].items()) {
            r.max_calls_per_tool[tool] = limit.get<uint32_t>();
        }
    }
    r.redact_keys = string_array(j, "redact_keys");
    r.blocked_output_terms = string_array(j, "blocked_output_terms");
    return r;
}

RulePolicyGate::RulePolicyGate(PolicyRules rules) : rules_(std::move(rules)) {}

LoopDecision RulePolicyGate::evaluate(const std::string&, const ProposedAction& action,
                                      const LoopState& state) const {
    if (action.is_final_answer()) return evaluate_final_answer(action.as_final_answer());
    return evaluate_tool_call(action, state);
}

LoopDecision RulePolicyGate::evaluate_tool_call(const ProposedAction& action, const LoopState& state) const {
    auto& call = action.as_tool_call();
    if (call.name.empty()) throw PolicyError("malformed action: tool call without a name");

    nlohmann::json args;
    try {
        args = call.arguments.empty() ? nlohmann::json::object() : nlohmann::json::parse(call.arguments);
    } catch (const nlohmann::json::parse_error& e) {
        throw PolicyError("malformed action: arguments for '" + call.name + "' are not valid JSON (" + e.what() + ")");
    }
    if (!args.is_object()) {
        throw PolicyError("malformed action: arguments for '" + call.name + "' must be a JSON object");
    }

    if (contains(rules_.denied_tools, call.name)) {
        return LoopDecision::deny("Tool '" + call.name + "' is denied by policy");
    }
    if (!rules_.allowed_tools.empty() && !contains(rules_.allowed_tools, call.name)) {
        return LoopDecision::deny("Tool '" + call.name + "' is not in the allowed tool list");
    }
    if (rules_.max_argument_bytes > 0 && call.arguments.size() > rules_.max_argument_bytes) {
        return LoopDecision::deny("Arguments for '" + call.name + "' exceed " +
                                  std::to_string(rules_.max_argument_bytes) + " bytes");
    }
    auto limit = rules_.max_calls_per_tool.find(call.name);
    if (limit != rules_.max_calls_per_tool.end() && state.dispatched_count(call.name) >= limit->second) {
        return LoopDecision::deny("Tool '" + call.name + "' reached its limit of " +
                                  std::to_string(limit->second) + " calls per run");
    }

    if (!rules_.redact_keys.empty() && redact(args)) {
        return LoopDecision::modify(ProposedAction::tool_call(action.raw_id, call.name, args.dump()),
                                    "Sensitive arguments redacted");
    }
    return LoopDecision::allow();
}

LoopDecision RulePolicyGate::evaluate_final_answer(const FinalAnswerAction& answer) const {
    std::string lower = to_lower(answer.text);
    for (auto& term : rules_.blocked_output_terms) {
        if (!term.empty() && lower.find(to_lower(term)) != std::string::npos) {
            return LoopDecision::deny("Response contains blocked term '" + term + "'");
        }
    }
    return LoopDecision::allow();
}

bool RulePolicyGate::redact(nlohmann::json& value) const {
    bool changed = false;
    if (value.is_object()) {
        for (auto it = value.begin(); it != value.end(); ++it) {
            auto& item = it.value();
            if (contains(rules_.redact_keys, it.key())) {
                if (item != "[REDACTED]") {
                    item = "[REDACTED]";
                    changed = true;
                }
            } else {
                changed = redact(item) || changed;
            }
        }
    } else if (value.is_array()) {
        for (auto& item : value) changed = redact(item) || changed;
    }
    return changed;
}

} // namespace orga
