#include "inference.hpp"
#include "utils.hpp"

namespace orga {

const char* inference_error_name(InferenceErrorKind k) {
    switch (k) {
    case InferenceErrorKind::transient:        return "transient";
    case InferenceErrorKind::rate_limited:     return "rate_limited";
    case InferenceErrorKind::invalid_response: return "invalid_response";
    case InferenceErrorKind::unauthorized:     return "unauthorized";
    }
    return "transient";
}

std::vector<ProposedAction> actions_from_reply(const std::string& text,
                                               const std::vector<ToolCall>& tool_calls) {
    std::vector<ProposedAction> actions;
    for (auto& tc : tool_calls) {
        std::string id = tc.id.empty() ? generate_id("call") : tc.id;
        actions.push_back(ProposedAction::tool_call(std::move(id), tc.name,
                                                    tc.arguments.empty() ? "{}" : tc.arguments));
    }
    if (actions.empty()) {
        actions.push_back(ProposedAction::final_answer(generate_id("final"), text));
    }
    return actions;
}

} // namespace orga
