#include "status.hpp"
#include "mcp_types.hpp"
#include <iostream>

namespace mcplink {

int cmd_status(const std::string& config_path) {
    Config cfg = Config::load(config_path);

    std::cout << "=== mcplink status ===\n";
    std::cout << "Config path  : " << config_path << "\n";
    std::cout << "Log level    : " << cfg.log_level << "\n";
    std::cout << "Protocol     : " << kProtocolVersion << "\n";

    size_t enabled = cfg.enabled_servers().size();
    std::cout << "MCP servers  : " << cfg.mcp_servers.size() << " configured, "
              << enabled << " enabled\n";

    for (auto& srv : cfg.mcp_servers) {
        std::cout << "  " << srv.name << (srv.enabled ? "" : " (disabled)") << "\n";
        std::cout << "    command  : " << (srv.command.empty() ? "(none)" : srv.command);
        for (auto& arg : srv.args) std::cout << " " << arg;
        std::cout << "\n";
        if (!srv.env.empty()) {
            std::cout << "    env      : ";
            bool first = true;
            for (auto& [k, _] : srv.env) {
                if (!first) std::cout << ", ";
                std::cout << k;
                first = false;
            }
            std::cout << "\n";
        }
    }

    auto warnings = cfg.validate();
    for (auto& w : warnings) {
        std::cout << "Warning      : " << w << "\n";
    }

    return warnings.empty() ? 0 : 1;
}

} // namespace mcplink
