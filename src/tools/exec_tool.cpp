#include "builtin_tools.hpp"
#include <cstdio>
#include <algorithm>
#include <memory>
#include <sys/wait.h>

namespace orga {

static constexpr size_t max_output = 64 * 1024;

// Dangerous patterns to block, plain substring matching
static bool is_dangerous(const std::string& cmd) {
    return contains_any(to_lower(cmd), {"rm -rf /", "rm -rf /*", "mkfs", "shutdown", "reboot",
                                        "halt", "poweroff", "dd if=", ":(){ :|:& };:"});
}

static std::string first_word(const std::string& cmd) {
    auto start = cmd.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    auto end = cmd.find_first_of(" \t;|&", start);
    return cmd.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

// Quote for a single-quoted sh -c argument.
static std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    return out + "'";
}

static std::string exec_command(const std::string& cmd, const std::string& working_dir, int timeout_sec) {
    std::string inner;
    if (!working_dir.empty()) inner = "cd " + shell_quote(working_dir) + " && ";
    inner += cmd;
    std::string full_cmd = "timeout " + std::to_string(timeout_sec) + " sh -c " + shell_quote(inner) + " 2>&1";

    std::unique_ptr<FILE, int (*)(FILE*)> pipe(popen(full_cmd.c_str(), "r"), pclose);
    if (!pipe) throw ToolError("Failed to execute command");

    std::string result;
    char buffer[4096];
    bool truncated = false;
    while (fgets(buffer, sizeof(buffer), pipe.get())) {
        result += buffer;
        if (result.size() > max_output) {
            result.resize(max_output);
            truncated = true;
            break;
        }
    }
    int status = pclose(pipe.release());
    if (WIFEXITED(status)) status = WEXITSTATUS(status);

    if (status == 124) {
        throw ToolError("Command timed out after " + std::to_string(timeout_sec) + "s");
    }
    if (truncated) result += "\n...[truncated]";
    result += "\n[exit code: " + std::to_string(status) + "]";
    return result;
}

void register_exec_tool(ToolRegistry& reg, const Config& cfg) {
    nlohmann::json exec_cfg = cfg.tools.is_object() && cfg.tools.contains("exec")
        ? cfg.tools["exec"] : nlohmann::json::object();
    if (!exec_cfg.value("enabled", true)) return;

    int default_timeout = exec_cfg.value("timeout_sec", 30);
    std::vector<std::string> allowlist;
    if (exec_cfg.contains("allowlist") && exec_cfg["allowlist"].is_array()) {
        for (auto& a : exec_cfg["allowlist"]) {
            if (a.is_string()) allowlist.push_back(a.get<std::string>());
        }
    }
    std::string workspace = cfg.workspace_path();

    ToolDef def;
    def.name = "exec";
    def.description = "Run a shell command in the workspace and return its output.";
    def.parameters = nlohmann::json::parse(R"JSON({
        "type": "object",
        "properties": {
            "command": {"type": "string"},
            "working_dir": {"type": "string"},
            "timeout": {"type": "integer"}
        },
        "required": ["command"]
    })JSON");

    def.func = [allowlist, default_timeout, workspace](const nlohmann::json& args, Millis timeout) -> std::string {
        std::string command = args.value("command", "");
        std::string working_dir = args.value("working_dir", "");
        if (working_dir.empty() && fs::is_directory(workspace)) working_dir = workspace;
        int timeout_sec = args.value("timeout", default_timeout);
        // Stay inside the per-call budget the executor grants.
        int budget_sec = static_cast<int>(std::max<int64_t>(1, timeout.count() / 1000));
        timeout_sec = std::clamp(timeout_sec, 1, budget_sec);

        if (command.empty()) throw ToolError("No command provided", false);
        if (is_dangerous(command)) {
            throw ToolError("Command blocked by security guard: potentially destructive operation", false);
        }
        if (!allowlist.empty()) {
            auto cmd = first_word(command);
            if (std::find(allowlist.begin(), allowlist.end(), cmd) == allowlist.end()) {
                throw ToolError("Command '" + cmd + "' is not in the exec allowlist", false);
            }
        }
        if (!working_dir.empty() && !fs::is_directory(working_dir)) {
            throw ToolError("Working directory does not exist: " + working_dir, false);
        }
        return exec_command(command, working_dir, timeout_sec);
    };

    reg.register_tool(std::move(def));
}

} // namespace orga
