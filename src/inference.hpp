#pragma once
#include "conversation.hpp"
#include "loop_types.hpp"
#include <string>
#include <vector>
#include <optional>
#include <stdexcept>

namespace orga {

enum class InferenceErrorKind { transient, rate_limited, invalid_response, unauthorized };

const char* inference_error_name(InferenceErrorKind k);

class InferenceError : public std::runtime_error {
public:
    InferenceError(InferenceErrorKind kind, const std::string& message,
                   std::optional<Millis> retry_after = std::nullopt)
        : std::runtime_error(message), kind_(kind), retry_after_(retry_after) {}

    InferenceErrorKind kind() const { return kind_; }
    std::optional<Millis> retry_after() const { return retry_after_; }
    bool retryable() const {
        return kind_ == InferenceErrorKind::transient || kind_ == InferenceErrorKind::rate_limited;
    }

private:
    InferenceErrorKind kind_;
    std::optional<Millis> retry_after_;
};

struct InferenceOptions {
    std::string model;
    int max_tokens = 4096;
    double temperature = 0.3;
    std::vector<ToolDefinition> tool_definitions;
    // Upper bound for a single request, derived from the run deadline.
    std::optional<Millis> request_timeout;
};

struct InferenceResponse {
    std::vector<ProposedAction> proposed_actions;
    std::string assistant_text;
    Usage usage;
    std::string model;

    bool has_tool_calls() const {
        for (auto& a : proposed_actions) {
            if (a.is_tool_call()) return true;
        }
        return false;
    }
};

class InferenceProvider {
public:
    virtual ~InferenceProvider() = default;

    // Throws InferenceError.
    virtual InferenceResponse complete(const Conversation& conversation,
                                       const InferenceOptions& options) = 0;

    virtual std::string name() const = 0;
    virtual bool supports_native_tools() const { return true; }
};

// Builds actions from a model reply: each tool call becomes a ToolCall
// action, and a reply without tool calls becomes a single FinalAnswer.
std::vector<ProposedAction> actions_from_reply(const std::string& text,
                                               const std::vector<ToolCall>& tool_calls);

} // namespace orga
