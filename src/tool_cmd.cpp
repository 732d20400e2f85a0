#include "tool_cmd.hpp"
#include "config.hpp"
#include "mcp_manager.hpp"
#include <iostream>

namespace mcplink {

static void report_failures(const std::vector<StartFailure>& failures) {
    for (auto& f : failures) {
        std::cerr << "[mcp] " << f.server << ": " << f.message << "\n";
    }
}

int cmd_tools(const std::string& config_path) {
    Config cfg = Config::load(config_path);
    McpManager manager(cfg.enabled_servers());
    if (manager.server_count() == 0) {
        std::cerr << "No enabled MCP servers in " << config_path << "\n";
        return 1;
    }

    auto failures = manager.start_enabled_servers();
    report_failures(failures);

    for (auto& [name, status] : manager.all_statuses()) {
        std::cout << name << " [" << to_string(status) << "]\n";
    }
    for (auto& t : manager.all_tools()) {
        std::cout << "  " << t.qualified_name;
        if (!t.tool.description.empty()) std::cout << "  - " << t.tool.description;
        std::cout << "\n";
    }

    manager.stop_all();
    return failures.size() == manager.server_count() ? 1 : 0;
}

int cmd_call(const std::string& config_path, const std::string& tool, const std::string& args_json) {
    nlohmann::json args = nlohmann::json::object();
    if (!args_json.empty()) {
        try {
            args = nlohmann::json::parse(args_json);
        } catch (const nlohmann::json::parse_error& e) {
            std::cerr << "[error] Arguments are not valid JSON: " << e.what() << "\n";
            return 1;
        }
        if (!args.is_object()) {
            std::cerr << "[error] Arguments must be a JSON object\n";
            return 1;
        }
    }

    Config cfg = Config::load(config_path);
    McpManager manager(cfg.enabled_servers());
    report_failures(manager.start_enabled_servers());

    int rc = 0;
    try {
        auto result = manager.call_tool(tool, args);
        if (result.is_error) {
            std::cerr << "[tool error] " << result.text() << "\n";
            rc = 2;
        } else {
            std::cout << result.text() << "\n";
        }
    } catch (const McpError& e) {
        std::cerr << "[error] " << to_string(e.kind()) << ": " << e.what() << "\n";
        rc = 1;
    }

    manager.stop_all();
    return rc;
}

} // namespace mcplink
