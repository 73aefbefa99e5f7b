#pragma once
#include <string>

namespace orga {

// `orga run`: one loop run against the configured provider.
int cmd_run(const std::string& message, const std::string& config_path,
            const std::string& agent_id, const std::string& model_override);

// `orga journal`: replays a JSONL journal, optionally a single run.
int cmd_journal(const std::string& path, const std::string& run_id);

// `orga config`: prints the effective configuration.
int cmd_config(const std::string& config_path);

} // namespace orga
