#include "config.hpp"
#include "logging.hpp"
#include <algorithm>
#include <fstream>

namespace mcplink {

std::vector<McpServerConfig> Config::enabled_servers() const {
    std::vector<McpServerConfig> result;
    for (auto& srv : mcp_servers) {
        if (srv.enabled) result.push_back(srv);
    }
    return result;
}

const McpServerConfig* Config::find_server(const std::string& name) const {
    for (auto& srv : mcp_servers) {
        if (srv.name == name) return &srv;
    }
    return nullptr;
}

std::vector<std::string> Config::validate() const {
    std::vector<std::string> warnings;
    for (auto& srv : mcp_servers) {
        if (srv.enabled && srv.command.empty()) {
            warnings.push_back("server '" + srv.name + "' is enabled but has an empty command");
        }
        if (srv.name.find('.') != std::string::npos) {
            warnings.push_back("server '" + srv.name +
                               "' contains '.', qualified tool names may be ambiguous");
        }
    }
    return warnings;
}

Config Config::make_default() {
    return Config{};
}

nlohmann::json Config::to_json() const {
    nlohmann::json j;
    j["log_level"] = log_level;

    j["mcp_servers"] = nlohmann::json::object();
    for (auto& srv : mcp_servers) {
        nlohmann::json s;
        s["command"] = srv.command;
        if (!srv.args.empty()) s["args"] = srv.args;
        if (!srv.env.empty()) s["env"] = srv.env;
        s["enabled"] = srv.enabled;
        j["mcp_servers"][srv.name] = s;
    }
    return j;
}

static std::vector<std::string> parse_string_array(const nlohmann::json& arr) {
    std::vector<std::string> result;
    if (arr.is_array()) {
        for (auto& item : arr) {
            if (item.is_string()) result.push_back(item.get<std::string>());
        }
    }
    return result;
}

Config Config::from_json(const nlohmann::json& j) {
    Config c;
    c.log_level = j.value("log_level", c.log_level);

    if (j.contains("mcp_servers") && j["mcp_servers"].is_object()) {
        for (auto& [name, srv] : j["mcp_servers"].items()) {
            if (!srv.is_object()) {
                log_line(LogLevel::warn, "config", "ignoring server '" + name + "': not an object");
                continue;
            }
            McpServerConfig mcp;
            mcp.name = name;
            mcp.command = srv.value("command", "");
            if (srv.contains("args")) mcp.args = parse_string_array(srv["args"]);
            if (srv.contains("env") && srv["env"].is_object()) {
                for (auto& [ek, ev] : srv["env"].items()) {
                    if (ev.is_string()) mcp.env[ek] = ev.get<std::string>();
                }
            }
            mcp.enabled = srv.value("enabled", true);
            c.mcp_servers.push_back(std::move(mcp));
        }
    }

    std::sort(c.mcp_servers.begin(), c.mcp_servers.end(),
              [](const McpServerConfig& a, const McpServerConfig& b) { return a.name < b.name; });
    return c;
}

Config Config::load(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        log_line(LogLevel::warn, "config", "not found at " + path + ", using defaults");
        return make_default();
    }
    try {
        nlohmann::json j = nlohmann::json::parse(f);
        return from_json(j);
    } catch (const std::exception& e) {
        log_line(LogLevel::warn, "config", std::string("failed to parse: ") + e.what() + ", using defaults");
        return make_default();
    }
}

void Config::save(const std::string& path) const {
    auto parent = fs::path(path).parent_path();
    if (!parent.empty()) fs::create_directories(parent);
    std::ofstream f(path);
    f << to_json().dump(2) << std::endl;
}

} // namespace mcplink
