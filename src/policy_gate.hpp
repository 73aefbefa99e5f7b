#pragma once
#include "loop_types.hpp"
#include <string>
#include <vector>
#include <map>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace orga {

// Raised by a gate that cannot evaluate an action; the loop treats it as Deny.
class PolicyError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class PolicyGate {
public:
    virtual ~PolicyGate() = default;

    // Must not mutate anything and must return the same decision for the
    // same inputs, so a journal can be replayed against it.
    virtual LoopDecision evaluate(const std::string& agent_id,
                                  const ProposedAction& action,
                                  const LoopState& state) const = 0;
};

class PermissivePolicyGate : public PolicyGate {
public:
    LoopDecision evaluate(const std::string&, const ProposedAction&, const LoopState&) const override {
        return LoopDecision::allow();
    }
};

struct PolicyRules {
    std::vector<std::string> denied_tools;
    std::vector<std::string> allowed_tools;       // empty = every tool
    size_t max_argument_bytes = 0;                // 0 = unlimited
    std::map<std::string, uint32_t> max_calls_per_tool;
    std::vector<std::string> redact_keys;
    std::vector<std::string> blocked_output_terms;

    nlohmann::json to_json() const;
    static PolicyRules from_json(const nlohmann::json& j);
};

// Default rule set, evaluated in the order the fields are declared above.
class RulePolicyGate : public PolicyGate {
public:
    explicit RulePolicyGate(PolicyRules rules);

    LoopDecision evaluate(const std::string& agent_id,
                          const ProposedAction& action,
                          const LoopState& state) const override;

    const PolicyRules& rules() const { return rules_; }

private:
    PolicyRules rules_;

    LoopDecision evaluate_tool_call(const ProposedAction& action, const LoopState& state) const;
    LoopDecision evaluate_final_answer(const FinalAnswerAction& answer) const;
    bool redact(nlohmann::json& value) const;
};

} // namespace orga
