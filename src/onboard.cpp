#include "onboard.hpp"
#include "config.hpp"
#include <iostream>

namespace mcplink {

int cmd_init(const std::string& config_path) {
    if (fs::exists(config_path)) {
        std::cout << "[init] Config already exists: " << config_path << "\n";
        return 0;
    }

    // One disabled example entry so the file documents its own format
    Config cfg = Config::make_default();
    McpServerConfig example;
    example.name = "filesystem";
    example.command = "npx";
    example.args = {"-y", "@modelcontextprotocol/server-filesystem", "/tmp"};
    example.enabled = false;
    cfg.mcp_servers.push_back(example);

    try {
        cfg.save(config_path);
    } catch (const fs::filesystem_error& e) {
        std::cerr << "[init] Could not write " << config_path << ": " << e.what() << "\n";
        return 1;
    }
    std::cout << "[init] Created config: " << config_path << "\n";
    return 0;
}

} // namespace mcplink
