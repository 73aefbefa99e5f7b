#pragma once
#include "../tool_registry.hpp"
#include "../config.hpp"

namespace orga {

// exec: shell commands, gated by tools.exec {enabled, timeout_sec, allowlist}.
void register_exec_tool(ToolRegistry& reg, const Config& cfg);

// read_file and list_dir, resolved against the workspace.
void register_fs_tools(ToolRegistry& reg, const Config& cfg);

} // namespace orga
