#include <iostream>
#include <string>
#include <vector>
#include "run_cmd.hpp"

static void print_usage() {
    std::cout << "Usage: orga <command> [options]\n\n"
              << "Commands:\n"
              << "  run -m MSG [--config PATH] [--agent ID] [--model MODEL]\n"
              << "                              Run the reasoning loop on one message\n"
              << "  journal PATH [--run ID]     Replay a JSONL journal\n"
              << "  config [--config PATH]      Show the effective configuration\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string cmd = argv[1];
    std::vector<std::string> args;
    for (int i = 2; i < argc; i++) {
        args.push_back(argv[i]);
    }

    std::string config_path;
    for (size_t i = 0; i + 1 < args.size(); i++) {
        if (args[i] == "--config") config_path = args[i + 1];
    }

    if (cmd == "run") {
        std::string message;
        std::string agent_id = "default";
        std::string model_override;
        for (size_t i = 0; i < args.size(); i++) {
            if ((args[i] == "-m" || args[i] == "--message") && i + 1 < args.size()) {
                message = args[++i];
            } else if (args[i] == "--agent" && i + 1 < args.size()) {
                agent_id = args[++i];
            } else if (args[i] == "--model" && i + 1 < args.size()) {
                model_override = args[++i];
            } else if (args[i] == "--config") {
                ++i;
            }
        }
        return orga::cmd_run(message, config_path, agent_id, model_override);
    }
    else if (cmd == "journal") {
        std::string path;
        std::string run_id;
        for (size_t i = 0; i < args.size(); i++) {
            if (args[i] == "--run" && i + 1 < args.size()) {
                run_id = args[++i];
            } else if (path.empty()) {
                path = args[i];
            }
        }
        return orga::cmd_journal(path, run_id);
    }
    else if (cmd == "config") {
        return orga::cmd_config(config_path);
    }
    else {
        std::cerr << "Unknown command: " << cmd << "\n";
        print_usage();
        return 1;
    }
}
