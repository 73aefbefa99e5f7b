#include "policy_gate.hpp"
#include "test_harness.hpp"

using namespace orga;
using orga_test::expect;
using orga_test::run_test;

namespace {

ProposedAction call(const std::string& tool, const std::string& args = "{}") {
    return ProposedAction::tool_call("id_" + tool, tool, args);
}

void test_permissive_gate_allows_everything() {
    PermissivePolicyGate gate;
    LoopState state;
    expect(gate.evaluate("a", call("anything"), state).verdict == Verdict::allow, "tool call allowed");
    expect(gate.evaluate("a", ProposedAction::final_answer("f", "x"), state).verdict == Verdict::allow,
           "final answer allowed");
}

void test_denied_tool_list() {
    PolicyRules rules;
    rules.denied_tools = {"exec"};
    RulePolicyGate gate(rules);
    LoopState state;
    auto d = gate.evaluate("a", call("exec"), state);
    expect(d.verdict == Verdict::deny, "denied tool refused");
    expect(d.reason == "Tool 'exec' is denied by policy", "denial reason names the tool");
    expect(gate.evaluate("a", call("read_file"), state).verdict == Verdict::allow, "other tools pass");
}

void test_allowed_tool_list() {
    PolicyRules rules;
    rules.allowed_tools = {"read_file"};
    RulePolicyGate gate(rules);
    LoopState state;
    auto d = gate.evaluate("a", call("exec"), state);
    expect(d.verdict == Verdict::deny, "tool outside the allow list refused");
    expect(d.reason.find("not in the allowed tool list") != std::string::npos, "allow-list reason");
}

void test_deny_list_checked_before_allow_list() {
    PolicyRules rules;
    rules.denied_tools = {"exec"};
    rules.allowed_tools = {"exec"};
    RulePolicyGate gate(rules);
    LoopState state;
    expect(gate.evaluate("a", call("exec"), state).reason == "Tool 'exec' is denied by policy",
           "explicit deny wins over allow");
}

void test_argument_size_limit() {
    PolicyRules rules;
    rules.max_argument_bytes = 16;
    RulePolicyGate gate(rules);
    LoopState state;
    auto d = gate.evaluate("a", call("exec", R"({"command":"a very long command line"})"), state);
    expect(d.verdict == Verdict::deny, "oversized arguments refused");
    expect(d.reason.find("exceed 16 bytes") != std::string::npos, "size reason");
}

void test_per_run_call_limit_reads_loop_state() {
    PolicyRules rules;
    rules.max_calls_per_tool["search"] = 2;
    RulePolicyGate gate(rules);
    LoopState state;
    state.tool_calls_dispatched["search"] = 1;
    expect(gate.evaluate("a", call("search"), state).verdict == Verdict::allow, "under the limit");
    state.tool_calls_dispatched["search"] = 2;
    auto d = gate.evaluate("a", call("search"), state);
    expect(d.verdict == Verdict::deny, "at the limit");
    expect(d.reason == "Tool 'search' reached its limit of 2 calls per run", "limit reason");
}

void test_redaction_modifies_arguments() {
    PolicyRules rules;
    rules.redact_keys = {"password", "token"};
    RulePolicyGate gate(rules);
    LoopState state;
    auto d = gate.evaluate("a", call("login", R"({"user":"bob","auth":{"password":"hunter2"},"list":[{"token":"t"}]})"), state);
    expect(d.verdict == Verdict::modify, "sensitive arguments produce Modify");
    expect(d.replacement.has_value(), "Modify carries a replacement");
    expect(d.replacement->raw_id == "id_login", "replacement keeps the action id");
    auto args = nlohmann::json::parse(d.replacement->as_tool_call().arguments);
    expect(args["user"] == "bob", "other fields untouched");
    expect(args["auth"]["password"] == "[REDACTED]", "nested key redacted");
    expect(args["list"][0]["token"] == "[REDACTED]", "key inside an array redacted");

    expect(gate.evaluate("a", call("login", R"({"user":"bob"})"), state).verdict == Verdict::allow,
           "nothing to redact means Allow");
}

void test_malformed_arguments_raise_policy_error() {
    RulePolicyGate gate(PolicyRules{});
    LoopState state;
    bool threw = false;
    try {
        gate.evaluate("a", call("exec", "{not json"), state);
    } catch (const PolicyError& e) {
        threw = std::string(e.what()).rfind("malformed action", 0) == 0;
    }
    expect(threw, "unparseable arguments raise PolicyError");

    threw = false;
    try {
        gate.evaluate("a", call("exec", "[1,2]"), state);
    } catch (const PolicyError&) {
        threw = true;
    }
    expect(threw, "non-object arguments raise PolicyError");
}

void test_blocked_output_terms() {
    PolicyRules rules;
    rules.blocked_output_terms = {"Secret Plan"};
    RulePolicyGate gate(rules);
    LoopState state;
    auto d = gate.evaluate("a", ProposedAction::final_answer("f", "here is the secret plan"), state);
    expect(d.verdict == Verdict::deny, "blocked term matched case-insensitively");
    expect(d.reason == "Response contains blocked term 'Secret Plan'", "blocked term reason");
    expect(gate.evaluate("a", ProposedAction::final_answer("f", "all clear"), state).verdict == Verdict::allow,
           "clean answer allowed");
}

void test_rules_json_round_trip() {
    auto rules = PolicyRules::from_json({
        {"denied_tools", nlohmann::json::array({"exec"})},
        {"max_argument_bytes", 1024},
        {"max_calls_per_tool", {{"search", 3}}},
        {"redact_keys", nlohmann::json::array({"password"})}
    });
    expect(rules.denied_tools.size() == 1, "denied tools parsed");
    expect(rules.max_argument_bytes == 1024, "size limit parsed");
    expect(rules.max_calls_per_tool.at("search") == 3, "call limit parsed");
    auto again = PolicyRules::from_json(rules.to_json());
    expect(again.redact_keys == rules.redact_keys, "to_json feeds back into from_json");
}

} // namespace

int main() {
    std::cout << "policy_gate\n";
    run_test("permissive_gate_allows_everything", test_permissive_gate_allows_everything);
    run_test("denied_tool_list", test_denied_tool_list);
    run_test("allowed_tool_list", test_allowed_tool_list);
    run_test("deny_list_checked_before_allow_list", test_deny_list_checked_before_allow_list);
    run_test("argument_size_limit", test_argument_size_limit);
    run_test("per_run_call_limit_reads_loop_state", test_per_run_call_limit_reads_loop_state);
    run_test("redaction_modifies_arguments", test_redaction_modifies_arguments);
    run_test("malformed_arguments_raise_policy_error", test_malformed_arguments_raise_policy_error);
    run_test("blocked_output_terms", test_blocked_output_terms);
    run_test("rules_json_round_trip", test_rules_json_round_trip);
    return orga_test::finish("policy_gate");
}
