#include "tools/builtin_tools.hpp"
#include "test_harness.hpp"
#include <fstream>

using namespace orga;
using orga_test::expect;
using orga_test::run_test;

namespace {

struct Workspace {
    std::string dir;
    Workspace() : dir((fs::temp_directory_path() / generate_id("orga-tools-test")).string()) {
        fs::create_directories(dir + "/sub");
        std::ofstream(dir + "/notes.txt") << "one\ntwo\nthree\n";
        std::ofstream(dir + "/empty.txt");
    }
    ~Workspace() {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }
};

Config config_for(const Workspace& ws) {
    auto cfg = Config::make_default();
    cfg.workspace = ws.dir;
    return cfg;
}

ToolOutcome call(ToolRegistry& reg, const std::string& tool, const nlohmann::json& args) {
    return reg.invoke(tool, args.dump(), Millis{10000});
}

void test_exec_runs_allowlisted_commands() {
    Workspace ws;
    ToolRegistry reg;
    register_exec_tool(reg, config_for(ws));

    auto out = call(reg, "exec", {{"command", "echo hello"}});
    expect(out.ok, "echo allowed");
    expect(out.output.find("hello") != std::string::npos, "command output captured");
    expect(out.output.find("[exit code: 0]") != std::string::npos, "exit code reported");

    auto listed = call(reg, "exec", {{"command", "ls"}});
    expect(listed.ok && listed.output.find("notes.txt") != std::string::npos, "runs inside the workspace");
}

void test_exec_refuses_unsafe_commands() {
    Workspace ws;
    ToolRegistry reg;
    register_exec_tool(reg, config_for(ws));

    auto blocked = call(reg, "exec", {{"command", "echo hi; rm -rf /"}});
    expect(!blocked.ok && !blocked.retriable, "destructive command refused");
    expect(blocked.output.find("blocked") != std::string::npos, "reason given");

    auto outside = call(reg, "exec", {{"command", "whoami"}});
    expect(!outside.ok && outside.output.find("allowlist") != std::string::npos, "allowlist enforced");

    auto empty = call(reg, "exec", nlohmann::json::object());
    expect(!empty.ok && !empty.retriable, "missing command");

    auto nowhere = call(reg, "exec", {{"command", "ls"}, {"working_dir", ws.dir + "/missing"}});
    expect(!nowhere.ok, "unknown working directory");
}

void test_exec_can_be_disabled() {
    Workspace ws;
    auto cfg = config_for(ws);
    cfg.tools["exec"]["enabled"] = false;
    ToolRegistry reg;
    register_exec_tool(reg, cfg);
    expect(!reg.has("exec"), "not registered when disabled");
}

void test_read_file_ranges() {
    Workspace ws;
    ToolRegistry reg;
    register_fs_tools(reg, config_for(ws));

    auto all = call(reg, "read_file", {{"path", "notes.txt"}});
    expect(all.ok && all.output == "one\ntwo\nthree\n", "whole file, relative to the workspace");

    auto middle = call(reg, "read_file", {{"path", ws.dir + "/notes.txt"}, {"offset", 2}, {"limit", 1}});
    expect(middle.ok && middle.output == "two\n", "offset and limit");

    auto beyond = call(reg, "read_file", {{"path", "notes.txt"}, {"offset", 10}});
    expect(!beyond.ok && beyond.output.find("beyond file") != std::string::npos, "offset past the end");

    expect(call(reg, "read_file", {{"path", "empty.txt"}}).output == "(empty file)", "empty file");
    auto missing = call(reg, "read_file", {{"path", "nope.txt"}});
    expect(!missing.ok && !missing.retriable, "missing file is a permanent failure");
}

void test_list_dir_sorted() {
    Workspace ws;
    ToolRegistry reg;
    register_fs_tools(reg, config_for(ws));

    auto out = call(reg, "list_dir", nlohmann::json::object());
    expect(out.ok, "workspace listed");
    expect(out.output == "empty.txt (0 bytes)\nnotes.txt (14 bytes)\nsub/\n", "sorted entries with sizes");

    expect(call(reg, "list_dir", {{"path", "sub"}}).output == "(empty directory)", "empty directory");
    expect(!call(reg, "list_dir", {{"path", "notes.txt"}}).ok, "file is not a directory");
    expect(!call(reg, "list_dir", {{"path", "missing"}}).ok, "missing directory");
}

} // namespace

int main() {
    std::cout << "tools\n";
    run_test("exec_runs_allowlisted_commands", test_exec_runs_allowlisted_commands);
    run_test("exec_refuses_unsafe_commands", test_exec_refuses_unsafe_commands);
    run_test("exec_can_be_disabled", test_exec_can_be_disabled);
    run_test("read_file_ranges", test_read_file_ranges);
    run_test("list_dir_sorted", test_list_dir_sorted);
    return orga_test::finish("tools");
}
