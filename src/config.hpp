#pragma once
#include <string>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>
#include "utils.hpp"

namespace mcplink {

struct McpServerConfig {
    std::string name;           // unique key, also the prefix of qualified tool names
    std::string command;        // executable path or name looked up in PATH
    std::vector<std::string> args;
    std::map<std::string, std::string> env;  // added to the inherited environment
    bool enabled = true;
};

struct Config {
    std::string log_level = "info";

    // Sorted by name
    std::vector<McpServerConfig> mcp_servers;

    std::vector<McpServerConfig> enabled_servers() const;
    const McpServerConfig* find_server(const std::string& name) const;

    // Human-readable warnings; an empty list means the config is usable as is
    std::vector<std::string> validate() const;

    static Config make_default();
    static Config load(const std::string& path);
    void save(const std::string& path) const;
    nlohmann::json to_json() const;
    static Config from_json(const nlohmann::json& j);
};

} // namespace mcplink
