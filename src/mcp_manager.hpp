#pragma once
#include "mcp_client.hpp"
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace mcplink {

struct StartFailure {
    std::string server;
    std::string message;
};

struct QualifiedTool {
    std::string qualified_name;   // "<server>.<tool>"
    std::string server;
    ToolInfo tool;
};

// Owns one McpClient per enabled server. Start failures are collected, not
// fatal, so one broken server never keeps the others from coming up.
class McpManager {
public:
    explicit McpManager(std::vector<McpServerConfig> servers,
                        McpClient::Timeouts timeouts = McpClient::Timeouts{});
    ~McpManager();

    McpManager(const McpManager&) = delete;
    McpManager& operator=(const McpManager&) = delete;

    std::vector<StartFailure> start_enabled_servers();
    void stop_all();

    // stop() + start(); the only way out of the error state
    void restart_server(const std::string& name);

    // Stops servers that disappeared or were disabled, starts new ones,
    // leaves the rest alone
    std::vector<StartFailure> update_configuration(std::vector<McpServerConfig> servers);

    ServerStatus server_status(const std::string& name) const;
    std::optional<McpError> server_last_error(const std::string& name) const;
    std::map<std::string, ServerStatus> all_statuses() const;

    // Flattened catalog of running servers
    std::vector<QualifiedTool> all_tools() const;
    std::map<std::string, std::vector<ToolInfo>> tools_by_server() const;

    std::vector<StartFailure> refresh_tools();

    // Accepts "server.tool" or a bare tool name owned by exactly one
    // running server. Throws McpError(tool_not_found) otherwise.
    CallToolResult call_tool(const std::string& name, const nlohmann::json& args);
    CallToolResult call_tool(const std::string& server, const std::string& tool,
                             const nlohmann::json& args);

    size_t server_count() const;
    size_t running_count() const;
    std::vector<std::string> server_names() const;

    std::shared_ptr<McpClient> client(const std::string& name) const;

    static std::string qualify(const std::string& server, const std::string& tool) {
        return server + "." + tool;
    }

private:
    McpClient::Timeouts timeouts_;
    std::vector<McpServerConfig> configs_;

    mutable std::shared_mutex clients_mutex_;
    std::map<std::string, std::shared_ptr<McpClient>> clients_;

    std::vector<std::shared_ptr<McpClient>> snapshot() const;
    std::pair<std::shared_ptr<McpClient>, std::string> resolve(const std::string& name) const;
};

} // namespace mcplink
