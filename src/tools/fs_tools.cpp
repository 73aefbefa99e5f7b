#include "builtin_tools.hpp"
#include <fstream>
#include <algorithm>

namespace orga {

static constexpr size_t max_output = 64 * 1024;

// Relative paths resolve against the workspace; absolute paths pass through.
static std::string resolve_workspace_path(const std::string& workspace, const std::string& path) {
    if (!path.empty() && path[0] == '/') return path;
    fs::path base(workspace);
    return (base / path).lexically_normal().string();
}

void register_fs_tools(ToolRegistry& reg, const Config& cfg) {
    std::string workspace = cfg.workspace_path();

    // ── read_file ──
    {
        ToolDef def;
        def.name = "read_file";
        def.description = "Read file contents. Supports offset/limit for line ranges.";
        def.parameters = nlohmann::json::parse(R"JSON({
            "type": "object",
            "properties": {
                "path": {"type": "string"},
                "offset": {"type": "integer"},
                "limit": {"type": "integer"}
            },
            "required": ["path"]
        })JSON");

        def.func = [workspace](const nlohmann::json& args, Millis) -> std::string {
            std::string path = args.value("path", "");
            int offset = std::max(1, args.value("offset", 1));
            int limit = args.value("limit", 0);
            if (path.empty()) throw ToolError("path is required", false);

            std::string resolved = resolve_workspace_path(workspace, path);
            std::ifstream f(resolved);
            if (!f) throw ToolError("Cannot read file: " + resolved, false);

            std::string result;
            std::string line;
            int line_num = 0;
            int collected = 0;
            while (std::getline(f, line)) {
                line_num++;
                if (line_num < offset) continue;
                if (limit > 0 && collected >= limit) break;
                result += line;
                result += '\n';
                collected++;
                if (result.size() > max_output) {
                    result += "\n...[truncated at line " + std::to_string(line_num) + "]";
                    break;
                }
            }

            if (result.empty() && line_num >= offset) return "(empty file)";
            if (result.empty()) {
                throw ToolError("Offset " + std::to_string(offset) + " beyond file (" +
                                std::to_string(line_num) + " lines)", false);
            }
            return result;
        };
        reg.register_tool(std::move(def));
    }

    // ── list_dir ──
    {
        ToolDef def;
        def.name = "list_dir";
        def.description = "List directory contents.";
        def.parameters = nlohmann::json::parse(R"JSON({
            "type": "object",
            "properties": {
                "path": {"type": "string"}
            }
        })JSON");

        def.func = [workspace](const nlohmann::json& args, Millis) -> std::string {
            std::string resolved = resolve_workspace_path(workspace, args.value("path", "."));

            if (!fs::exists(resolved)) throw ToolError("Path does not exist: " + resolved, false);
            if (!fs::is_directory(resolved)) throw ToolError("Not a directory: " + resolved, false);

            std::vector<std::string> lines;
            for (auto& entry : fs::directory_iterator(resolved)) {
                std::string name = entry.path().filename().string();
                std::error_code ec;
                if (entry.is_directory(ec)) {
                    lines.push_back(name + "/");
                } else {
                    auto size = entry.file_size(ec);
                    lines.push_back(name + " (" + std::to_string(ec ? 0 : size) + " bytes)");
                }
            }
            std::sort(lines.begin(), lines.end());

            std::string result;
            size_t shown = 0;
            for (auto& l : lines) {
                result += l + "\n";
                shown++;
                if (result.size() > max_output) {
                    result += "...[truncated, " + std::to_string(shown) + " of " +
                              std::to_string(lines.size()) + " entries shown]\n";
                    break;
                }
            }
            if (result.empty()) result = "(empty directory)";
            return result;
        };
        reg.register_tool(std::move(def));
    }
}

} // namespace orga
