#include <iostream>
#include <string>
#include <vector>
#include "config.hpp"
#include "logging.hpp"
#include "onboard.hpp"
#include "status.hpp"
#include "tool_cmd.hpp"
#include "utils.hpp"

static void print_usage() {
    std::cout << "Usage: mcplink <command> [options]\n\n"
              << "Commands:\n"
              << "  init                        Write a starter config\n"
              << "  status                      Show configured MCP servers\n"
              << "  tools                       Start enabled servers and list their tools\n"
              << "  call <tool> [JSON]          Call server.tool (or a unique bare name)\n\n"
              << "Options:\n"
              << "  --config PATH               Config file (default ~/.mcplink/config.json)\n"
              << "  --log-level LEVEL           debug, info, warn or error\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string cmd = argv[1];
    std::string config_path = mcplink::default_config_path();
    std::string level_override;
    std::vector<std::string> args;
    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) {
            config_path = mcplink::expand_path(argv[++i]);
        } else if (a == "--log-level" && i + 1 < argc) {
            level_override = argv[++i];
        } else {
            args.push_back(a);
        }
    }

    if (!level_override.empty()) {
        mcplink::set_log_level(mcplink::parse_log_level(level_override));
    } else if (cmd != "init") {
        std::string level = mcplink::Config::load(config_path).log_level;
        mcplink::set_log_level(mcplink::parse_log_level(level));
    }

    if (cmd == "init") {
        return mcplink::cmd_init(config_path);
    }
    else if (cmd == "status") {
        return mcplink::cmd_status(config_path);
    }
    else if (cmd == "tools") {
        return mcplink::cmd_tools(config_path);
    }
    else if (cmd == "call") {
        if (args.empty()) {
            std::cerr << "Usage: mcplink call <server.tool> [JSON_ARGS]\n";
            return 1;
        }
        return mcplink::cmd_call(config_path, args[0], args.size() > 1 ? args[1] : "");
    }
    else if (cmd == "-h" || cmd == "--help" || cmd == "help") {
        print_usage();
        return 0;
    }
    else {
        std::cerr << "Unknown command: " << cmd << "\n";
        print_usage();
        return 1;
    }
}
