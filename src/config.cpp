#include "config.hpp"
#include <fstream>
#include <iostream>

namespace orga {

static const char* wire_format_name(WireFormat f) {
    return f == WireFormat::anthropic ? "anthropic" : "openai";
}

static WireFormat parse_wire_format(const std::string& s) {
    if (s == "openai") return WireFormat::openai;
    if (s == "anthropic") return WireFormat::anthropic;
    throw ConfigError("Unknown wire_format: " + s);
}

ProviderConfig Config::resolve_provider() const {
    // 1. If explicit provider name is set, use it
    if (!provider.empty()) {
        auto it = providers.find(provider);
        if (it != providers.end()) return it->second;
        std::cerr << "[config] provider '" << provider << "' not found, falling back\n";
    }
    // 2. Try "default" key
    if (providers.count("default")) return providers.at("default");
    // 3. Use the first configured provider
    if (!providers.empty()) return providers.begin()->second;
    // 4. Local OpenAI-compatible server
    ProviderConfig local;
    local.api_base = "http://127.0.0.1:8000/v1";
    return local;
}

LoopConfig Config::loop_config(std::vector<ToolDefinition> tool_definitions) const {
    LoopConfig lc;
    lc.max_iterations = max_iterations;
    lc.max_total_tokens = max_total_tokens;
    lc.timeout = Millis{timeout_ms};
    lc.tool_timeout = Millis{tool_timeout_ms};
    lc.max_concurrent_tools = max_concurrent_tools;
    lc.context_token_budget = context_token_budget;
    lc.default_recovery = default_recovery;
    lc.tool_recovery = tool_recovery;
    lc.tool_definitions = std::move(tool_definitions);
    lc.model = model;
    lc.max_tokens = max_tokens;
    lc.temperature = temperature;
    lc.inference_retry = inference_retry;
    return lc;
}

Config Config::make_default() {
    Config c;
    ProviderConfig local;
    local.api_base = "http://127.0.0.1:8000/v1";
    c.providers["default"] = local;
    c.tools = {
        {"exec", {{"enabled", true},
                  {"timeout_sec", 30},
                  {"allowlist", nlohmann::json::array({"git", "ls", "cat", "echo", "date"})}}}
    };
    return c;
}

nlohmann::json Config::to_json() const {
    nlohmann::json j;

    j["model"] = model;
    j["workspace"] = workspace;
    if (!provider.empty()) j["provider"] = provider;
    j["max_tokens"] = max_tokens;
    j["temperature"] = temperature;
    j["system_prompt"] = system_prompt;

    // Providers
    for (auto& [k, v] : providers) {
        auto& p = j["providers"][k];
        p["api_base"] = v.api_base;
        if (!v.api_key.empty()) p["api_key"] = v.api_key;
        if (!v.default_model.empty()) p["default_model"] = v.default_model;
        p["wire_format"] = wire_format_name(v.wire_format);
        p["native_tools"] = v.native_tools;
    }

    j["fallback"] = {
        {"enabled", fallback.enabled},
        {"providers", fallback.provider_order},
        {"rate_limit_cooldown", fallback.rate_limit_cooldown},
        {"auth_cooldown", fallback.auth_cooldown},
        {"transient_cooldown", fallback.transient_cooldown}
    };

    j["loop"] = {
        {"max_iterations", max_iterations},
        {"max_total_tokens", max_total_tokens},
        {"timeout_ms", timeout_ms},
        {"tool_timeout_ms", tool_timeout_ms},
        {"max_concurrent_tools", max_concurrent_tools},
        {"context_token_budget", context_token_budget},
        {"inference_max_retries", inference_retry.max_retries},
        {"inference_retry_base_ms", inference_retry.base_delay.count()},
        {"inference_retry_max_ms", inference_retry.max_delay.count()}
    };

    auto& rec = j["recovery"];
    rec["default"] = recovery_to_json(default_recovery);
    rec["tools"] = nlohmann::json::object();
    for (auto& [tool, s] : tool_recovery) rec["tools"][tool] = recovery_to_json(s);

    j["breaker"] = breaker.to_json();
    j["breaker"]["tools"] = nlohmann::json::object();
    for (auto& [tool, b] : breaker_overrides) j["breaker"]["tools"][tool] = b.to_json();

    j["context"] = context.to_json();
    j["policy"] = policy.to_json();

    j["knowledge"] = knowledge.bridge.to_json();
    j["knowledge"]["enabled"] = knowledge.enabled;
    j["knowledge"]["db_path"] = knowledge.db_path;

    j["journal"] = {{"path", journal.path}, {"buffer_capacity", journal.buffer_capacity}};

    // Tools
    if (!tools.is_null()) {
        j["tools"] = tools;
    }

    return j;
}

static std::vector<std::string> parse_string_array(const nlohmann::json& arr) {
    std::vector<std::string> result;
    if (arr.is_array()) {
        for (auto& item : arr) {
            if (item.is_string()) result.push_back(item.get<std::string>());
        }
    }
    return result;
}

Config Config::from_json(const nlohmann::json& j) {
    if (!j.is_object()) throw ConfigError("Config root must be a JSON object");

    Config c;
    try {
        c.model = j.value("model", c.model);
        c.workspace = j.value("workspace", c.workspace);
        c.provider = j.value("provider", c.provider);
        c.max_tokens = j.value("max_tokens", c.max_tokens);
        c.temperature = j.value("temperature", c.temperature);
        c.system_prompt = j.value("system_prompt", c.system_prompt);

        // Providers
        if (j.contains("providers")) {
            for (auto& [k, v] : j["providers"].items()) {
                ProviderConfig p;
                p.api_key = v.value("api_key", "");
                p.api_base = v.value("api_base", "");
                p.default_model = v.value("default_model", "");
                p.wire_format = parse_wire_format(v.value("wire_format", "openai"));
                p.native_tools = v.value("native_tools", true);
                c.providers[k] = std::move(p);
            }
        }

        if (j.contains("fallback")) {
            auto& fb = j["fallback"];
            c.fallback.enabled = fb.value("enabled", false);
            if (fb.contains("providers")) c.fallback.provider_order = parse_string_array(fb["providers"]);
            c.fallback.rate_limit_cooldown = fb.value("rate_limit_cooldown", c.fallback.rate_limit_cooldown);
            c.fallback.auth_cooldown = fb.value("auth_cooldown", c.fallback.auth_cooldown);
            c.fallback.transient_cooldown = fb.value("transient_cooldown", c.fallback.transient_cooldown);
        }

        if (j.contains("loop")) {
            auto& l = j["loop"];
            c.max_iterations = l.value("max_iterations", c.max_iterations);
            c.max_total_tokens = l.value("max_total_tokens", c.max_total_tokens);
            c.timeout_ms = l.value("timeout_ms", c.timeout_ms);
            c.tool_timeout_ms = l.value("tool_timeout_ms", c.tool_timeout_ms);
            c.max_concurrent_tools = l.value("max_concurrent_tools", c.max_concurrent_tools);
            c.context_token_budget = l.value("context_token_budget", c.context_token_budget);
            c.inference_retry.max_retries = l.value("inference_max_retries", c.inference_retry.max_retries);
            c.inference_retry.base_delay =
                Millis{l.value("inference_retry_base_ms", static_cast<int64_t>(c.inference_retry.base_delay.count()))};
            c.inference_retry.max_delay =
                Millis{l.value("inference_retry_max_ms", static_cast<int64_t>(c.inference_retry.max_delay.count()))};
            if (c.max_concurrent_tools == 0) throw ConfigError("loop.max_concurrent_tools must be at least 1");
        }

        if (j.contains("recovery")) {
            auto& r = j["recovery"];
            if (r.contains("default")) c.default_recovery = recovery_from_json(r["default"]);
            if (r.contains("tools")) {
                for (auto& [tool, s] : r["tools"].items()) c.tool_recovery[tool] = recovery_from_json(s);
            }
        }

        if (j.contains("breaker")) {
            auto& b = j["breaker"];
            c.breaker = CircuitBreakerConfig::from_json(b);
            if (b.contains("tools")) {
                for (auto& [tool, o] : b["tools"].items()) {
                    c.breaker_overrides[tool] = CircuitBreakerConfig::from_json(o, c.breaker);
                }
            }
        }

        if (j.contains("context")) c.context = ContextConfig::from_json(j["context"]);
        if (j.contains("policy")) c.policy = PolicyRules::from_json(j["policy"]);

        if (j.contains("knowledge")) {
            auto& k = j["knowledge"];
            c.knowledge.enabled = k.value("enabled", false);
            c.knowledge.db_path = k.value("db_path", c.knowledge.db_path);
            c.knowledge.bridge = KnowledgeConfig::from_json(k);
        }

        if (j.contains("journal")) {
            auto& jr = j["journal"];
            c.journal.path = jr.value("path", "");
            c.journal.buffer_capacity = jr.value("buffer_capacity", c.journal.buffer_capacity);
        }

        // Tools
        if (j.contains("tools")) {
            c.tools = j["tools"];
        }
    } catch (const ConfigError&) {
        throw;
    } catch (const std::exception& e) {
        // type_error from a mistyped field, invalid_argument from an unknown enum name
        throw ConfigError(std::string("Invalid config: ") + e.what());
    }
    return c;
}

Config Config::load(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        std::cerr << "[config] Config not found at " << path << ", using defaults\n";
        return make_default();
    }
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(f);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Failed to parse " + path + ": " + e.what());
    }
    return from_json(j);
}

void Config::save(const std::string& path) const {
    auto parent = fs::path(path).parent_path();
    if (!parent.empty()) fs::create_directories(parent);
    std::ofstream f(path);
    if (!f) throw ConfigError("Cannot write config to " + path);
    f << to_json().dump(2) << std::endl;
}

} // namespace orga
