#pragma once
#include <string>
#include <vector>
#include <map>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "utils.hpp"
#include "conversation.hpp"
#include "loop_types.hpp"
#include "circuit_breaker.hpp"
#include "context_budget.hpp"
#include "policy_gate.hpp"
#include "knowledge_bridge.hpp"

namespace orga {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ProviderConfig {
    std::string api_key;
    std::string api_base;
    std::string default_model;  // Optional: default model for this provider
    WireFormat wire_format = WireFormat::openai;
    bool native_tools = true;   // false = tools described in the prompt, calls parsed from text
};

struct FallbackConfig {
    bool enabled = false;
    std::vector<std::string> provider_order;  // keys into providers map
    int rate_limit_cooldown = 60;     // seconds
    int auth_cooldown = 3600;         // 1 hour
    int transient_cooldown = 30;      // seconds
};

struct KnowledgeSettings {
    bool enabled = false;
    std::string db_path = "~/.orga/knowledge.db";
    KnowledgeConfig bridge;
};

struct JournalSettings {
    std::string path;             // empty = in-memory only
    size_t buffer_capacity = 1000;
};

struct Config {
    std::string model = "gpt-4.1-mini";
    std::string workspace = "~/.orga/workspace";
    std::string provider;  // which provider key to use (empty = auto-detect)
    int max_tokens = 4096;
    double temperature = 0.3;
    std::string system_prompt = "You are a helpful assistant. Use the available tools when they help; "
                                "reply with a plain answer once you are done.";

    // Loop limits
    uint32_t max_iterations = 25;
    uint64_t max_total_tokens = 100000;
    int64_t timeout_ms = 300000;
    int64_t tool_timeout_ms = 30000;
    size_t max_concurrent_tools = 5;
    size_t context_token_budget = 32000;
    InferenceRetryConfig inference_retry;

    RecoveryStrategy default_recovery = RetryRecovery{};
    std::map<std::string, RecoveryStrategy> tool_recovery;

    CircuitBreakerConfig breaker;
    std::map<std::string, CircuitBreakerConfig> breaker_overrides;

    ContextConfig context;
    PolicyRules policy;
    KnowledgeSettings knowledge;
    JournalSettings journal;

    std::map<std::string, ProviderConfig> providers;

    // Provider fallback chain
    FallbackConfig fallback;

    // Tool config
    nlohmann::json tools;   // flexible tool-specific config (e.g. exec allowlist)

    // Derived helpers
    std::string workspace_path() const {
        return expand_path(workspace);
    }

    ProviderConfig resolve_provider() const;

    // Run limits for one loop invocation, advertising the given tools.
    LoopConfig loop_config(std::vector<ToolDefinition> tool_definitions) const;

    static Config make_default();
    // Missing file -> defaults. Throws ConfigError when the file does not parse.
    static Config load(const std::string& path);
    void save(const std::string& path) const;
    nlohmann::json to_json() const;
    static Config from_json(const nlohmann::json& j);
};

} // namespace orga
