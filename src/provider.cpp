#include "provider.hpp"
#include "utils.hpp"
#include <iostream>

namespace orga {

static void parse_url(const std::string& url, std::string& scheme, std::string& host, int& port, std::string& path_prefix) {
    scheme = "http";
    host = "127.0.0.1";
    port = 80;
    path_prefix = "";

    size_t pos = 0;
    if (url.substr(0, 8) == "https://") {
        scheme = "https"; pos = 8; port = 443;
    } else if (url.substr(0, 7) == "http://") {
        scheme = "http"; pos = 7; port = 80;
    }

    size_t slash = url.find('/', pos);
    std::string host_port = (slash != std::string::npos) ? url.substr(pos, slash - pos) : url.substr(pos);
    if (slash != std::string::npos) {
        path_prefix = url.substr(slash);
        while (!path_prefix.empty() && path_prefix.back() == '/') path_prefix.pop_back();
    }

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        host = host_port.substr(0, colon);
        port = std::stoi(host_port.substr(colon + 1));
    } else {
        host = host_port;
    }
}

HttpInferenceProvider::HttpInferenceProvider(const ProviderConfig& cfg, std::string name)
    : config_(cfg), name_(std::move(name)) {
    parse_url(config_.api_base, scheme_, host_, port_, path_prefix_);
    base_url_ = scheme_ + "://" + host_ + ":" + std::to_string(port_);
}

// ── Hand-rolled JSON fix (no regex) ──────────────────────────────────

// Drops trailing commas before } or ], which small models emit often.
static std::string fix_json(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool in_string = false;
    bool escape = false;
    for (size_t i = 0; i < s.size(); i++) {
        char c = s[i];
        if (escape) { out += c; escape = false; continue; }
        if (c == '\\' && in_string) { out += c; escape = true; continue; }
        if (c == '"') { in_string = !in_string; out += c; continue; }
        if (in_string) { out += c; continue; }
        if (c == ',') {
            size_t j = i + 1;
            while (j < s.size() && (s[j] == ' ' || s[j] == '\t' || s[j] == '\n' || s[j] == '\r')) j++;
            if (j < s.size() && (s[j] == '}' || s[j] == ']')) continue;
        }
        out += c;
    }
    return out;
}

// ── Textual tool-call parsing ────────────────────────────────────────

static bool tool_call_from_json(const nlohmann::json& j, ToolCall& tc) {
    if (!j.is_object()) return false;
    tc.id = generate_id("call");
    tc.name = j.value("name", "");
    if (tc.name.empty()) return false;
    const char* key = j.contains("arguments") ? "arguments" : (j.contains("parameters") ? "parameters" : nullptr);
    if (key) {
        tc.arguments = j[key].is_string() ? j[key].get<std::string>() : j[key].dump();
    } else {
        tc.arguments = "{}";
    }
    return true;
}

// Matching closing brace for the object starting at s[pos] == '{'
static size_t find_json_object_end(const std::string& s, size_t pos) {
    if (pos >= s.size() || s[pos] != '{') return std::string::npos;
    int depth = 0;
    bool in_str = false;
    bool esc = false;
    for (size_t i = pos; i < s.size(); i++) {
        char c = s[i];
        if (esc) { esc = false; continue; }
        if (c == '\\' && in_str) { esc = true; continue; }
        if (c == '"') { in_str = !in_str; continue; }
        if (in_str) continue;
        if (c == '{') depth++;
        else if (c == '}') { depth--; if (depth == 0) return i; }
    }
    return std::string::npos;
}

static bool parse_first_object(const std::string& text, ToolCall& tc) {
    size_t brace = text.find('{');
    if (brace == std::string::npos) return false;
    size_t brace_end = find_json_object_end(text, brace);
    if (brace_end == std::string::npos) return false;
    try {
        auto j = nlohmann::json::parse(fix_json(text.substr(brace, brace_end - brace + 1)));
        return tool_call_from_json(j, tc);
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "[provider] ignoring unparseable tool call: " << e.what() << "\n";
        return false;
    }
}

static std::vector<ToolCall> parse_tagged(const std::string& text,
                                          const std::string& open_tag,
                                          const std::string& close_tag) {
    std::vector<ToolCall> calls;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t tag_start = text.find(open_tag, pos);
        if (tag_start == std::string::npos) break;
        size_t content_start = tag_start + open_tag.size();
        size_t tag_end = text.find(close_tag, content_start);
        if (tag_end == std::string::npos) break;

        ToolCall tc;
        if (parse_first_object(text.substr(content_start, tag_end - content_start), tc)) {
            calls.push_back(std::move(tc));
        }
        pos = tag_end + close_tag.size();
    }
    return calls;
}

static std::vector<ToolCall> parse_fenced_blocks(const std::string& text) {
    std::vector<ToolCall> calls;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t fence_start = text.find("```", pos);
        if (fence_start == std::string::npos) break;
        size_t line_end = text.find('\n', fence_start);
        if (line_end == std::string::npos) break;

        std::string lang = text.substr(fence_start + 3, line_end - fence_start - 3);
        while (!lang.empty() && (lang.front() == ' ' || lang.front() == '\t')) lang.erase(lang.begin());
        while (!lang.empty() && (lang.back() == ' ' || lang.back() == '\t' || lang.back() == '\r')) lang.pop_back();

        size_t fence_end = text.find("\n```", line_end);
        if (fence_end == std::string::npos) { pos = line_end; continue; }

        std::string block = text.substr(line_end + 1, fence_end - line_end - 1);
        pos = fence_end + 4;

        if (!lang.empty() && lang != "json" && lang != "tool") continue;
        if (block.find("\"name\"") == std::string::npos) continue;

        ToolCall tc;
        if (parse_first_object(block, tc)) calls.push_back(std::move(tc));
    }
    return calls;
}

std::vector<ToolCall> parse_textual_tool_calls(const std::string& text) {
    auto calls = parse_tagged(text, "<toolcall>", "</toolcall>");
    if (calls.empty()) calls = parse_tagged(text, "<tool_call>", "</tool_call>");
    if (calls.empty()) calls = parse_fenced_blocks(text);
    return calls;
}

std::string strip_tool_call_markup(const std::string& text) {
    std::string result = text;
    for (auto [open, close] : {std::pair<const char*, const char*>{"<toolcall>", "</toolcall>"},
                               std::pair<const char*, const char*>{"<tool_call>", "</tool_call>"}}) {
        std::string o = open, c = close;
        for (;;) {
            size_t s = result.find(o);
            if (s == std::string::npos) break;
            size_t e = result.find(c, s);
            if (e == std::string::npos) break;
            result.erase(s, e + c.size() - s);
        }
    }
    while (!result.empty() && (result.back() == ' ' || result.back() == '\n')) result.pop_back();
    while (!result.empty() && (result.front() == ' ' || result.front() == '\n')) result.erase(result.begin());
    return result;
}

std::string textual_tool_instructions(const std::vector<ToolDefinition>& tools) {
    std::string out = "You can call tools. To call one, reply with exactly\n"
                      "<tool_call>{\"name\": \"TOOL_NAME\", \"arguments\": {...}}</tool_call>\n"
                      "and nothing else. Available tools:\n";
    for (auto& t : tools) {
        out += "- " + t.name + ": " + t.description + "\n  parameters: " + t.parameters.dump() + "\n";
    }
    return out;
}

// ── Response parsing ─────────────────────────────────────────────────

static void apply_textual_fallback(InferenceResponse& resp, std::vector<ToolCall>& calls) {
    if (!calls.empty() || resp.assistant_text.empty()) return;
    calls = parse_textual_tool_calls(resp.assistant_text);
    if (!calls.empty()) resp.assistant_text = strip_tool_call_markup(resp.assistant_text);
}

InferenceResponse parse_openai_response(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("choices") || !j["choices"].is_array() || j["choices"].empty()) {
        throw InferenceError(InferenceErrorKind::invalid_response, "Provider response has no choices");
    }
    auto& choice = j["choices"][0];
    if (!choice.contains("message") || !choice["message"].is_object()) {
        throw InferenceError(InferenceErrorKind::invalid_response, "Provider choice has no message");
    }
    auto& msg = choice["message"];

    InferenceResponse resp;
    resp.model = j.value("model", "");
    if (msg.contains("content") && msg["content"].is_string()) {
        resp.assistant_text = msg["content"].get<std::string>();
    }

    std::vector<ToolCall> calls;
    if (msg.contains("tool_calls") && msg["tool_calls"].is_array()) {
        for (auto& tc : msg["tool_calls"]) {
            ToolCall t;
            t.id = tc.value("id", "");
            if (tc.contains("function")) {
                auto& fn = tc["function"];
                t.name = fn.value("name", "");
                if (fn.contains("arguments")) {
                    auto& args = fn["arguments"];
                    t.arguments = args.is_string() ? args.get<std::string>() : args.dump();
                }
            }
            if (!t.name.empty()) calls.push_back(std::move(t));
        }
    }
    apply_textual_fallback(resp, calls);

    if (j.contains("usage") && j["usage"].is_object()) {
        resp.usage = Usage::from_json(j["usage"]);
    }
    resp.proposed_actions = actions_from_reply(resp.assistant_text, calls);
    return resp;
}

InferenceResponse parse_anthropic_response(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("content") || !j["content"].is_array()) {
        throw InferenceError(InferenceErrorKind::invalid_response, "Provider response has no content blocks");
    }

    InferenceResponse resp;
    resp.model = j.value("model", "");
    std::vector<ToolCall> calls;
    for (auto& block : j["content"]) {
        std::string type = block.value("type", "");
        if (type == "text") {
            if (!resp.assistant_text.empty()) resp.assistant_text += "\n";
            resp.assistant_text += block.value("text", "");
        } else if (type == "tool_use") {
            ToolCall t;
            t.id = block.value("id", "");
            t.name = block.value("name", "");
            t.arguments = block.contains("input") ? block["input"].dump() : "{}";
            if (!t.name.empty()) calls.push_back(std::move(t));
        }
    }
    apply_textual_fallback(resp, calls);

    if (j.contains("usage") && j["usage"].is_object()) {
        auto& u = j["usage"];
        resp.usage.prompt_tokens = u.value("input_tokens", uint64_t{0});
        resp.usage.completion_tokens = u.value("output_tokens", uint64_t{0});
        resp.usage.total_tokens = resp.usage.prompt_tokens + resp.usage.completion_tokens;
    }
    resp.proposed_actions = actions_from_reply(resp.assistant_text, calls);
    return resp;
}

InferenceError classify_http_failure(int status, const std::string& body,
                                     const std::string& retry_after_header) {
    std::string detail = body.size() > 500 ? body.substr(0, 500) + "..." : body;
    if (status == 0) {
        return InferenceError(InferenceErrorKind::transient, "Provider request failed: connection error");
    }
    std::string msg = "Provider returned status " + std::to_string(status) + ": " + detail;
    if (status == 429) {
        std::optional<Millis> hint;
        if (!retry_after_header.empty()) {
            try {
                hint = Millis{static_cast<int64_t>(std::stod(retry_after_header) * 1000)};
            } catch (const std::exception&) {
                std::cerr << "[provider] ignoring non-numeric Retry-After: " << retry_after_header << "\n";
            }
        }
        return InferenceError(InferenceErrorKind::rate_limited, msg, hint);
    }
    if (status == 401 || status == 403) return InferenceError(InferenceErrorKind::unauthorized, msg);
    if (status == 408 || status == 529 || status >= 500) return InferenceError(InferenceErrorKind::transient, msg);
    return InferenceError(InferenceErrorKind::invalid_response, msg);
}

// ── Request ──────────────────────────────────────────────────────────

nlohmann::json HttpInferenceProvider::build_request(const Conversation& conversation,
                                                    const InferenceOptions& options) const {
    nlohmann::json body;
    body["model"] = options.model.empty() ? config_.default_model : options.model;
    body["max_tokens"] = options.max_tokens;
    body["temperature"] = options.temperature;

    bool advertise_natively = config_.native_tools && !options.tool_definitions.empty();
    std::string tool_text;
    if (!config_.native_tools && !options.tool_definitions.empty()) {
        tool_text = textual_tool_instructions(options.tool_definitions);
    }

    if (config_.wire_format == WireFormat::anthropic) {
        auto rendered = conversation.render_for_provider(WireFormat::anthropic);
        std::string system = rendered.value("system", "");
        if (!tool_text.empty()) system = system.empty() ? tool_text : system + "\n\n" + tool_text;
        if (!system.empty()) body["system"] = system;
        body["messages"] = rendered["messages"];
        if (advertise_natively) {
            auto& tools = body["tools"];
            for (auto& t : options.tool_definitions) {
                tools.push_back({{"name", t.name}, {"description", t.description}, {"input_schema", t.parameters}});
            }
        }
        return body;
    }

    auto msgs = conversation.render_for_provider(WireFormat::openai);
    if (!tool_text.empty()) {
        if (!msgs.empty() && msgs[0].value("role", "") == "system") {
            msgs[0]["content"] = msgs[0].value("content", "") + "\n\n" + tool_text;
        } else {
            msgs.insert(msgs.begin(), nlohmann::json{{"role", "system"}, {"content", tool_text}});
        }
    }
    body["messages"] = std::move(msgs);
    if (advertise_natively) {
        auto& tools = body["tools"];
        for (auto& t : options.tool_definitions) {
            tools.push_back({
                {"type", "function"},
                {"function", {{"name", t.name}, {"description", t.description}, {"parameters", t.parameters}}}
            });
        }
    }
    return body;
}

InferenceResponse HttpInferenceProvider::complete(const Conversation& conversation,
                                                  const InferenceOptions& options) {
    httplib::Client cli(base_url_);
    cli.set_connection_timeout(30);
    int read_timeout = 120;
    if (options.request_timeout) {
        auto secs = std::chrono::duration_cast<std::chrono::seconds>(*options.request_timeout).count();
        read_timeout = static_cast<int>(std::max<int64_t>(1, std::min<int64_t>(secs, read_timeout)));
    }
    cli.set_read_timeout(read_timeout);

    bool anthropic = config_.wire_format == WireFormat::anthropic;
    std::string path = path_prefix_ + (anthropic ? "/messages" : "/chat/completions");
    std::string payload = build_request(conversation, options).dump();

    httplib::Headers headers;
    if (!config_.api_key.empty()) {
        if (anthropic) {
            headers.emplace("x-api-key", config_.api_key);
        } else {
            headers.emplace("Authorization", "Bearer " + config_.api_key);
        }
    }
    if (anthropic) headers.emplace("anthropic-version", "2023-06-01");

    auto res = cli.Post(path, headers, payload, "application/json");
    if (!res) throw classify_http_failure(0, "", "");
    if (res->status != 200) {
        throw classify_http_failure(res->status, res->body, res->get_header_value("Retry-After"));
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(res->body);
    } catch (const nlohmann::json::parse_error& e) {
        throw InferenceError(InferenceErrorKind::invalid_response,
                             std::string("Failed to parse provider response: ") + e.what());
    }
    return anthropic ? parse_anthropic_response(j) : parse_openai_response(j);
}

} // namespace orga
