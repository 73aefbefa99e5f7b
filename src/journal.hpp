#pragma once
#include "loop_types.hpp"
#include <string>
#include <vector>
#include <deque>
#include <memory>
#include <mutex>
#include <fstream>
#include <variant>
#include <chrono>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace orga {

class JournalError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ── Events ────────────────────────────────────────────────────────────

struct StartedEvent {
    std::string model;
    uint32_t max_iterations = 0;
    uint64_t max_total_tokens = 0;
    Millis timeout{0};
    size_t tool_count = 0;
};

struct ReasoningCompleteEvent {
    nlohmann::json actions = nlohmann::json::array(); // ProposedAction::to_json() each
    Usage usage;
};

struct PolicyEvaluatedEvent {
    size_t allowed = 0;
    size_t denied = 0;
    size_t modified = 0;
    nlohmann::json decisions = nlohmann::json::array(); // {action_id, verdict, reason}
};

struct ToolsDispatchedEvent {
    std::vector<std::string> tools;
    Millis duration{0};
};

struct ObservationsCollectedEvent {
    size_t observations = 0;
    size_t failures = 0;
    bool terminal = false;
};

struct RecoveryTriggeredEvent {
    std::string tool;
    std::string strategy;
    std::string error;
};

struct InferenceRetryEvent {
    uint32_t attempt = 0;
    std::string error_kind;
    std::string error;
    Millis delay{0};
};

struct KnowledgeInjectedEvent {
    size_t items = 0;
};

struct TerminatedEvent {
    TerminationReason reason = TerminationReason::completed;
    std::string error;
    uint32_t iterations = 0;
    Usage usage;
    Millis duration{0};
};

using LoopEvent = std::variant<StartedEvent, ReasoningCompleteEvent, PolicyEvaluatedEvent,
                               ToolsDispatchedEvent, ObservationsCollectedEvent,
                               RecoveryTriggeredEvent, InferenceRetryEvent,
                               KnowledgeInjectedEvent, TerminatedEvent>;

// "started", "reasoning_complete", "policy_evaluated", ...
const char* event_type(const LoopEvent& event);
nlohmann::json event_to_json(const LoopEvent& event);
// Throws JournalError on an unknown or malformed event.
LoopEvent event_from_json(const nlohmann::json& j);

TerminationReason parse_termination(const std::string& s);

struct JournalEntry {
    std::string run_id;
    std::string agent_id;
    uint64_t sequence = 0;
    std::chrono::system_clock::time_point timestamp;
    uint32_t iteration = 0;
    LoopEvent event;

    const char* type() const { return event_type(event); }

    nlohmann::json to_json() const;
    static JournalEntry from_json(const nlohmann::json& j);
};

// ── Sinks ─────────────────────────────────────────────────────────────

class JournalSink {
public:
    virtual ~JournalSink() = default;
    // Throws JournalError when the entry could not be recorded.
    virtual void append(const JournalEntry& entry) = 0;
};

// In-memory ring buffer; the oldest entries fall off once full.
class BufferedJournal : public JournalSink {
public:
    explicit BufferedJournal(size_t capacity = 1000);

    void append(const JournalEntry& entry) override;

    std::vector<JournalEntry> entries() const;
    std::vector<JournalEntry> entries_for_run(const std::string& run_id) const;
    size_t size() const;
    size_t capacity() const { return capacity_; }
    void clear();

private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<JournalEntry> entries_;
};

// Durable append-only log, one JSON object per line.
class JsonlJournal : public JournalSink {
public:
    explicit JsonlJournal(const std::string& path);

    void append(const JournalEntry& entry) override;
    const std::string& path() const { return path_; }

    // Malformed lines are reported and skipped.
    static std::vector<JournalEntry> read_all(const std::string& path);
    static std::vector<JournalEntry> read_run(const std::string& path, const std::string& run_id);

private:
    std::string path_;
    std::mutex mutex_;
    std::ofstream out_;
};

// Writes every entry to each sink; one failing sink does not starve the others.
class FanoutJournal : public JournalSink {
public:
    void add(std::shared_ptr<JournalSink> sink) { sinks_.push_back(std::move(sink)); }
    void append(const JournalEntry& entry) override;
    size_t sink_count() const { return sinks_.size(); }

private:
    std::vector<std::shared_ptr<JournalSink>> sinks_;
};

} // namespace orga
