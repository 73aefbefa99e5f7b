#pragma once
#include "config.hpp"
#include "inference.hpp"
#include "message.hpp"
#include <httplib.h>
#include <string>
#include <vector>

namespace orga {

// OpenAI- or Anthropic-compatible chat endpoint over HTTP.
class HttpInferenceProvider : public InferenceProvider {
public:
    explicit HttpInferenceProvider(const ProviderConfig& cfg, std::string name = "default");

    InferenceResponse complete(const Conversation& conversation,
                               const InferenceOptions& options) override;

    std::string name() const override { return name_; }
    bool supports_native_tools() const override { return config_.native_tools; }
    const ProviderConfig& config() const { return config_; }

    nlohmann::json build_request(const Conversation& conversation,
                                 const InferenceOptions& options) const;

private:
    ProviderConfig config_;
    std::string name_;
    // Cached URL components (parsed once in constructor)
    std::string scheme_;
    std::string host_;
    int port_;
    std::string path_prefix_;
    std::string base_url_;  // scheme://host:port
};

// Maps a non-200 reply (status 0 = no connection) to an InferenceError.
InferenceError classify_http_failure(int status, const std::string& body,
                                     const std::string& retry_after_header);

// Throw InferenceError(invalid_response) when the body has no usable reply.
InferenceResponse parse_openai_response(const nlohmann::json& body);
InferenceResponse parse_anthropic_response(const nlohmann::json& body);

// Textual tool-call conventions for models without native tool calling:
// <toolcall>{...}</toolcall>, <tool_call>{...}</tool_call>, ```json {...}```.
std::vector<ToolCall> parse_textual_tool_calls(const std::string& text);
std::string strip_tool_call_markup(const std::string& text);

// System-prompt text advertising tools to a model without native tool calling.
std::string textual_tool_instructions(const std::vector<ToolDefinition>& tools);

} // namespace orga
