#include "run_cmd.hpp"
#include "config.hpp"
#include "journal.hpp"
#include "knowledge_store.hpp"
#include "provider_chain.hpp"
#include "reasoning_loop.hpp"
#include "tools/builtin_tools.hpp"
#include <iostream>

namespace orga {

static std::string resolve_config_path(const std::string& config_path) {
    return config_path.empty() ? default_config_path() : expand_path(config_path);
}

int cmd_run(const std::string& message, const std::string& config_path,
            const std::string& agent_id, const std::string& model_override) {
    if (message.empty()) {
        std::cerr << "orga run: -m MESSAGE is required\n";
        return 1;
    }

    Config cfg;
    try {
        cfg = Config::load(resolve_config_path(config_path));
    } catch (const ConfigError& e) {
        std::cerr << "[config] " << e.what() << "\n";
        return 1;
    }
    if (!model_override.empty()) cfg.model = model_override;

    auto tools = std::make_shared<ToolRegistry>();
    register_exec_tool(*tools, cfg);
    register_fs_tools(*tools, cfg);

    std::shared_ptr<InferenceProvider> provider;
    try {
        provider = ProviderChain::from_config(cfg);
    } catch (const std::exception& e) {
        std::cerr << "[provider] " << e.what() << "\n";
        return 1;
    }
    RulePolicyGate gate(cfg.policy);
    DefaultActionExecutor executor(tools);
    auto budgeter = make_budgeter(cfg.context);
    CircuitBreakerRegistry breakers(cfg.breaker);
    for (auto& [tool, b] : cfg.breaker_overrides) breakers.configure(tool, b);

    LoopRunner runner(*provider, gate, executor, *budgeter, breakers);

    auto journal = std::make_shared<FanoutJournal>();
    journal->add(std::make_shared<BufferedJournal>(cfg.journal.buffer_capacity));
    try {
        if (!cfg.journal.path.empty()) {
            journal->add(std::make_shared<JsonlJournal>(expand_path(cfg.journal.path)));
        }
    } catch (const std::exception& e) {
        std::cerr << "[journal] " << e.what() << ", continuing without a durable journal\n";
    }
    runner.set_journal(journal);

    if (cfg.knowledge.enabled) {
        try {
            auto store = std::make_shared<SqliteKnowledgeStore>(expand_path(cfg.knowledge.db_path));
            runner.set_knowledge(std::make_shared<StoreKnowledgeBridge>(store, cfg.knowledge.bridge));
        } catch (const std::exception& e) {
            std::cerr << "[knowledge] " << e.what() << ", running without knowledge\n";
        }
    }

    Conversation conversation;
    if (!cfg.system_prompt.empty()) conversation = Conversation::with_system(cfg.system_prompt);
    conversation.push(Message::user(message));

    auto result = runner.run(agent_id, std::move(conversation), cfg.loop_config(tools->definitions()));

    if (!result.output.empty()) std::cout << result.output << "\n";
    std::cerr << "[loop] " << termination_name(result.termination_reason)
              << " after " << result.iterations << " iteration(s), "
              << result.total_usage.total_tokens << " tokens, "
              << result.duration.count() << "ms (run " << result.run_id << ")\n";
    if (!result.error.empty()) std::cerr << "[loop] error: " << result.error << "\n";
    for (auto& e : result.escalations) {
        std::cerr << "[loop] escalated to '" << e.escalation_queue << "': " << e.tool_name << "\n";
    }
    for (auto& d : result.dead_letters) {
        std::cerr << "[loop] dead letter: " << d.tool_name << ": " << d.content() << "\n";
    }

    switch (result.termination_reason) {
    case TerminationReason::completed: return 0;
    case TerminationReason::error:     return 1;
    default:                           return 2;
    }
}

int cmd_journal(const std::string& path, const std::string& run_id) {
    if (path.empty()) {
        std::cerr << "orga journal: PATH is required\n";
        return 1;
    }
    std::vector<JournalEntry> entries;
    try {
        entries = run_id.empty() ? JsonlJournal::read_all(expand_path(path))
                                 : JsonlJournal::read_run(expand_path(path), run_id);
    } catch (const JournalError& e) {
        std::cerr << "[journal] " << e.what() << "\n";
        return 1;
    }
    for (auto& entry : entries) {
        std::cout << iso_timestamp(entry.timestamp) << "  " << entry.run_id
                  << " #" << entry.sequence << " it=" << entry.iteration
                  << "  " << entry.type() << "  " << event_to_json(entry.event).dump() << "\n";
    }
    return 0;
}

int cmd_config(const std::string& config_path) {
    std::string path = resolve_config_path(config_path);
    try {
        Config cfg = Config::load(path);
        std::cout << "# " << path << "\n" << cfg.to_json().dump(2) << "\n";
    } catch (const ConfigError& e) {
        std::cerr << "[config] " << e.what() << "\n";
        return 1;
    }
    return 0;
}

} // namespace orga
