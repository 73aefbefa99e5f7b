#include "journal.hpp"
#include "utils.hpp"
#include <iostream>

namespace orga {

// ── Event serialization ───────────────────────────────────────────────

namespace {

struct EventTyper {
    const char* operator()(const StartedEvent&) const { return "started"; }
    const char* operator()(const ReasoningCompleteEvent&) const { return "reasoning_complete"; }
    const char* operator()(const PolicyEvaluatedEvent&) const { return "policy_evaluated"; }
    const char* operator()(const ToolsDispatchedEvent&) const { return "tools_dispatched"; }
    const char* operator()(const ObservationsCollectedEvent&) const { return "observations_collected"; }
    const char* operator()(const RecoveryTriggeredEvent&) const { return "recovery_triggered"; }
    const char* operator()(const InferenceRetryEvent&) const { return "inference_retry"; }
    const char* operator()(const KnowledgeInjectedEvent&) const { return "knowledge_injected"; }
    const char* operator()(const TerminatedEvent&) const { return "terminated"; }
};

struct EventWriter {
    nlohmann::json operator()(const StartedEvent& e) const {
        return {{"model", e.model}, {"max_iterations", e.max_iterations},
                {"max_total_tokens", e.max_total_tokens}, {"timeout_ms", e.timeout.count()},
                {"tool_count", e.tool_count}};
    }
    nlohmann::json operator()(const ReasoningCompleteEvent& e) const {
        return {{"actions", e.actions}, {"usage", e.usage.to_json()}};
    }
    nlohmann::json operator()(const PolicyEvaluatedEvent& e) const {
        return {{"allowed", e.allowed}, {"denied", e.denied}, {"modified", e.modified},
                {"decisions", e.decisions}};
    }
    nlohmann::json operator()(const ToolsDispatchedEvent& e) const {
        return {{"tools", e.tools}, {"duration_ms", e.duration.count()}};
    }
    nlohmann::json operator()(const ObservationsCollectedEvent& e) const {
        return {{"observations", e.observations}, {"failures", e.failures}, {"terminal", e.terminal}};
    }
    nlohmann::json operator()(const RecoveryTriggeredEvent& e) const {
        return {{"tool", e.tool}, {"strategy", e.strategy}, {"error", e.error}};
    }
    nlohmann::json operator()(const InferenceRetryEvent& e) const {
        return {{"attempt", e.attempt}, {"error_kind", e.error_kind}, {"error", e.error},
                {"delay_ms", e.delay.count()}};
    }
    nlohmann::json operator()(const KnowledgeInjectedEvent& e) const {
        return {{"items", e.items}};
    }
    nlohmann::json operator()(const TerminatedEvent& e) const {
        nlohmann::json j = {{"reason", termination_name(e.reason)}, {"iterations", e.iterations},
                            {"usage", e.usage.to_json()}, {"duration_ms", e.duration.count()}};
        if (!e.error.empty()) j["error"] = e.error;
        return j;
    }
};

Millis millis_field(const nlohmann::json& j, const char* key) {
    return Millis{j.value(key, int64_t{0})};
}

} // namespace

const char* event_type(const LoopEvent& event) {
    return std::visit(EventTyper{}, event);
}

nlohmann::json event_to_json(const LoopEvent& event) {
    auto j = std::visit(EventWriter{}, event);
    j["type"] = event_type(event);
    return j;
}

TerminationReason parse_termination(const std::string& s) {
    if (s == "completed") return TerminationReason::completed;
    if (s == "max_iterations") return TerminationReason::max_iterations;
    if (s == "max_tokens") return TerminationReason::max_tokens;
    if (s == "timeout") return TerminationReason::timeout;
    if (s == "error") return TerminationReason::error;
    throw JournalError("Unknown termination reason: '" + s + "'");
}

LoopEvent event_from_json(const nlohmann::json& j) {
    if (!j.is_object()) throw JournalError("Journal event is not an object");
    std::string type = j.value("type", "");
    try {
        if (type == "started") {
            StartedEvent e;
            e.model = j.value("model", "");
            e.max_iterations = j.value("max_iterations", 0u);
            e.max_total_tokens = j.value("max_total_tokens", uint64_t{0});
            e.timeout = millis_field(j, "timeout_ms");
            e.tool_count = j.value("tool_count", size_t{0});
            return e;
        }
        if (type == "reasoning_complete") {
            ReasoningCompleteEvent e;
            if (j.contains("actions")) e.actions = j["actions"];
            if (j.contains("usage")) e.usage = Usage::from_json(j["usage"]);
            return e;
        }
        if (type == "policy_evaluated") {
            PolicyEvaluatedEvent e;
            e.allowed = j.value("allowed", size_t{0});
            e.denied = j.value("denied", size_t{0});
            e.modified = j.value("modified", size_t{0});
            if (j.contains("decisions")) e.decisions = j["decisions"];
            return e;
        }
        if (type == "tools_dispatched") {
            ToolsDispatchedEvent e;
            if (j.contains("tools")) e.tools = j["tools"].get<std::vector<std::string>>();
            e.duration = millis_field(j, "duration_ms");
            return e;
        }
        if (type == "observations_collected") {
            ObservationsCollectedEvent e;
            e.observations = j.value("observations", size_t{0});
            e.failures = j.value("failures", size_t{0});
            e.terminal = j.value("terminal", false);
            return e;
        }
        if (type == "recovery_triggered") {
            return RecoveryTriggeredEvent{j.value("tool", ""), j.value("strategy", ""), j.value("error", "")};
        }
        if (type == "inference_retry") {
            InferenceRetryEvent e;
            e.attempt = j.value("attempt", 0u);
            e.error_kind = j.value("error_kind", "");
            e.error = j.value("error", "");
            e.delay = millis_field(j, "delay_ms");
            return e;
        }
        if (type == "knowledge_injected") {
            return KnowledgeInjectedEvent{j.value("items", size_t{0})};
        }
        if (type == "terminated") {
            TerminatedEvent e;
            e.reason = parse_termination(j.value("reason", ""));
            e.error = j.value("error", "");
            e.iterations = j.value("iterations", 0u);
            if (j.contains("usage")) e.usage = Usage::from_json(j["usage"]);
            e.duration = millis_field(j, "duration_ms");
            return e;
        }
    } catch (const nlohmann::json::exception& e) {
        throw JournalError("Malformed '" + type + "' event: " + e.what());
    }
    throw JournalError("Unknown journal event type: '" + type + "'");
}

// ── JournalEntry ──────────────────────────────────────────────────────

nlohmann::json JournalEntry::to_json() const {
    return {{"run_id", run_id},
            {"agent_id", agent_id},
            {"sequence", sequence},
            {"timestamp", iso_timestamp(timestamp)},
            {"timestamp_ms", epoch_millis(timestamp)},
            {"iteration", iteration},
            {"event", event_to_json(event)}};
}

JournalEntry JournalEntry::from_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("event")) throw JournalError("Journal entry has no event");
    JournalEntry e;
    e.run_id = j.value("run_id", "");
    e.agent_id = j.value("agent_id", "");
    e.sequence = j.value("sequence", uint64_t{0});
    e.timestamp = std::chrono::system_clock::time_point(
        std::chrono::milliseconds(j.value("timestamp_ms", int64_t{0})));
    e.iteration = j.value("iteration", 0u);
    e.event = event_from_json(j["event"]);
    return e;
}

// ── BufferedJournal ───────────────────────────────────────────────────

BufferedJournal::BufferedJournal(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

void BufferedJournal::append(const JournalEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.size() >= capacity_) entries_.pop_front();
    entries_.push_back(entry);
}

std::vector<JournalEntry> BufferedJournal::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<JournalEntry>(entries_.begin(), entries_.end());
}

std::vector<JournalEntry> BufferedJournal::entries_for_run(const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<JournalEntry> out;
    for (auto& e : entries_) {
        if (e.run_id == run_id) out.push_back(e);
    }
    return out;
}

size_t BufferedJournal::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void BufferedJournal::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

// ── JsonlJournal ──────────────────────────────────────────────────────

JsonlJournal::JsonlJournal(const std::string& path) : path_(expand_path(path)) {
    auto parent = fs::path(path_).parent_path();
    if (!parent.empty()) fs::create_directories(parent);
    out_.open(path_, std::ios::app);
    if (!out_) throw JournalError("Cannot open journal file: " + path_);
}

void JsonlJournal::append(const JournalEntry& entry) {
    std::string line = entry.to_json().dump();
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << "\n";
    out_.flush();
    if (!out_) {
        out_.clear();
        throw JournalError("Failed to write journal entry to " + path_);
    }
}

std::vector<JournalEntry> JsonlJournal::read_all(const std::string& path) {
    std::vector<JournalEntry> result;
    std::ifstream f(expand_path(path));
    if (!f) throw JournalError("Cannot read journal file: " + path);

    std::string line;
    size_t line_no = 0;
    while (std::getline(f, line)) {
        line_no++;
        if (line.empty()) continue;
        try {
            result.push_back(JournalEntry::from_json(nlohmann::json::parse(line)));
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[journal] " << path << ":" << line_no << " skipped: " << e.what() << "\n";
        } catch (const JournalError& e) {
            std::cerr << "[journal] " << path << ":" << line_no << " skipped: " << e.what() << "\n";
        }
    }
    return result;
}

std::vector<JournalEntry> JsonlJournal::read_run(const std::string& path, const std::string& run_id) {
    std::vector<JournalEntry> out;
    for (auto& e : read_all(path)) {
        if (e.run_id == run_id) out.push_back(std::move(e));
    }
    return out;
}

// ── FanoutJournal ─────────────────────────────────────────────────────

void FanoutJournal::append(const JournalEntry& entry) {
    std::string errors;
    for (auto& sink : sinks_) {
        try {
            sink->append(entry);
        } catch (const JournalError& e) {
            if (!errors.empty()) errors += "; ";
            errors += e.what();
        }
    }
    if (!errors.empty()) throw JournalError(errors);
}

} // namespace orga
