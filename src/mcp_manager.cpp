#include "mcp_manager.hpp"
#include "logging.hpp"
#include <algorithm>
#include <set>

namespace mcplink {

static const char* kTag = "mcp";

static bool same_launch(const McpServerConfig& a, const McpServerConfig& b) {
    return a.command == b.command && a.args == b.args && a.env == b.env;
}

McpManager::McpManager(std::vector<McpServerConfig> servers, McpClient::Timeouts timeouts)
    : timeouts_(timeouts), configs_(std::move(servers)) {
    for (auto& cfg : configs_) {
        if (!cfg.enabled) continue;
        if (clients_.count(cfg.name)) {
            log_line(LogLevel::warn, kTag, "duplicate server name '" + cfg.name + "' ignored");
            continue;
        }
        clients_[cfg.name] = std::make_shared<McpClient>(cfg, timeouts_);
    }
}

McpManager::~McpManager() {
    stop_all();
}

std::vector<std::shared_ptr<McpClient>> McpManager::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(clients_mutex_);
    std::vector<std::shared_ptr<McpClient>> result;
    for (auto& [_, c] : clients_) result.push_back(c);
    return result;
}

std::shared_ptr<McpClient> McpManager::client(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(clients_mutex_);
    auto it = clients_.find(name);
    return it == clients_.end() ? nullptr : it->second;
}

// ── Fan-out ─────────────────────────────────────────────────────────

std::vector<StartFailure> McpManager::start_enabled_servers() {
    std::vector<StartFailure> failures;
    auto clients = snapshot();

    for (auto& c : clients) {
        if (c->status() == ServerStatus::running) continue;
        // Clears a previous error so start() accepts the client again
        c->stop();
        try {
            c->start();
            log_line(LogLevel::info, kTag, "connected to server: " + c->name());
        } catch (const McpError& e) {
            log_line(LogLevel::error, kTag, "failed to start server " + c->name() + ": " + e.what());
            failures.push_back({c->name(), e.what()});
        }
    }

    log_line(LogLevel::info, kTag, std::to_string(running_count()) + "/" +
             std::to_string(clients.size()) + " servers running");
    return failures;
}

void McpManager::stop_all() {
    for (auto& c : snapshot()) {
        if (c->status() != ServerStatus::stopped) {
            c->stop();
            log_line(LogLevel::info, kTag, "disconnected from server: " + c->name());
        }
    }
}

void McpManager::restart_server(const std::string& name) {
    auto c = client(name);
    if (!c) {
        throw McpError(McpErrorKind::invalid_state, "unknown or disabled server '" + name + "'");
    }
    c->stop();
    c->start();
}

std::vector<StartFailure> McpManager::update_configuration(std::vector<McpServerConfig> servers) {
    std::vector<std::shared_ptr<McpClient>> removed;
    std::vector<std::shared_ptr<McpClient>> added;
    {
        std::unique_lock<std::shared_mutex> lock(clients_mutex_);

        std::map<std::string, const McpServerConfig*> wanted;
        for (auto& cfg : servers) {
            if (cfg.enabled && !wanted.count(cfg.name)) wanted[cfg.name] = &cfg;
        }

        for (auto it = clients_.begin(); it != clients_.end();) {
            auto w = wanted.find(it->first);
            if (w == wanted.end() || !same_launch(*w->second, it->second->config())) {
                removed.push_back(it->second);
                it = clients_.erase(it);
            } else {
                ++it;
            }
        }

        for (auto& [name, cfg] : wanted) {
            if (clients_.count(name)) continue;
            auto c = std::make_shared<McpClient>(*cfg, timeouts_);
            clients_[name] = c;
            added.push_back(c);
        }
        configs_ = std::move(servers);
    }

    for (auto& c : removed) {
        log_line(LogLevel::info, kTag, "removing server: " + c->name());
        c->stop();
    }

    std::vector<StartFailure> failures;
    for (auto& c : added) {
        try {
            c->start();
            log_line(LogLevel::info, kTag, "connected to server: " + c->name());
        } catch (const McpError& e) {
            log_line(LogLevel::error, kTag, "failed to start server " + c->name() + ": " + e.what());
            failures.push_back({c->name(), e.what()});
        }
    }
    return failures;
}

// ── Status ──────────────────────────────────────────────────────────

ServerStatus McpManager::server_status(const std::string& name) const {
    auto c = client(name);
    return c ? c->status() : ServerStatus::stopped;
}

std::optional<McpError> McpManager::server_last_error(const std::string& name) const {
    auto c = client(name);
    if (!c) return std::nullopt;
    return c->last_error();
}

std::map<std::string, ServerStatus> McpManager::all_statuses() const {
    std::shared_lock<std::shared_mutex> lock(clients_mutex_);
    std::map<std::string, ServerStatus> result;
    for (auto& cfg : configs_) {
        auto it = clients_.find(cfg.name);
        result[cfg.name] = it == clients_.end() ? ServerStatus::stopped : it->second->status();
    }
    return result;
}

size_t McpManager::server_count() const {
    std::shared_lock<std::shared_mutex> lock(clients_mutex_);
    return clients_.size();
}

size_t McpManager::running_count() const {
    size_t n = 0;
    for (auto& c : snapshot()) {
        if (c->status() == ServerStatus::running) n++;
    }
    return n;
}

std::vector<std::string> McpManager::server_names() const {
    std::shared_lock<std::shared_mutex> lock(clients_mutex_);
    std::vector<std::string> names;
    for (auto& [n, _] : clients_) names.push_back(n);
    return names;
}

// ── Tools ───────────────────────────────────────────────────────────

std::vector<QualifiedTool> McpManager::all_tools() const {
    std::vector<QualifiedTool> result;
    for (auto& c : snapshot()) {
        if (c->status() != ServerStatus::running) continue;
        for (auto& t : c->tools()) {
            result.push_back({qualify(c->name(), t.name), c->name(), t});
        }
    }
    return result;
}

std::map<std::string, std::vector<ToolInfo>> McpManager::tools_by_server() const {
    std::map<std::string, std::vector<ToolInfo>> result;
    for (auto& c : snapshot()) {
        if (c->status() != ServerStatus::running) continue;
        auto tools = c->tools();
        if (!tools.empty()) result[c->name()] = std::move(tools);
    }
    return result;
}

std::vector<StartFailure> McpManager::refresh_tools() {
    std::vector<StartFailure> failures;
    for (auto& c : snapshot()) {
        if (c->status() != ServerStatus::running) continue;
        try {
            c->refresh_tools();
        } catch (const McpError& e) {
            log_line(LogLevel::error, kTag, "failed to refresh tools for " + c->name() + ": " + e.what());
            failures.push_back({c->name(), e.what()});
        }
    }
    return failures;
}

std::pair<std::shared_ptr<McpClient>, std::string>
McpManager::resolve(const std::string& name) const {
    auto clients = snapshot();

    // Longest server name first so "a.b" wins over "a" for "a.b.tool"
    std::sort(clients.begin(), clients.end(),
              [](const std::shared_ptr<McpClient>& a, const std::shared_ptr<McpClient>& b) {
                  return a->name().size() > b->name().size();
              });
    for (auto& c : clients) {
        const std::string prefix = c->name() + ".";
        if (name.size() > prefix.size() && name.compare(0, prefix.size(), prefix) == 0) {
            return {c, name.substr(prefix.size())};
        }
    }

    std::vector<std::shared_ptr<McpClient>> owners;
    for (auto& c : clients) {
        if (c->status() == ServerStatus::running && c->has_tool(name)) owners.push_back(c);
    }
    if (owners.size() == 1) {
        return {owners.front(), name};
    }
    if (owners.empty()) {
        throw McpError(McpErrorKind::tool_not_found, "unknown tool '" + name + "'");
    }

    std::string candidates;
    std::set<std::string> sorted;
    for (auto& c : owners) sorted.insert(qualify(c->name(), name));
    for (auto& s : sorted) {
        if (!candidates.empty()) candidates += ", ";
        candidates += s;
    }
    throw McpError(McpErrorKind::tool_not_found,
                   "tool '" + name + "' is ambiguous, use one of: " + candidates);
}

CallToolResult McpManager::call_tool(const std::string& name, const nlohmann::json& args) {
    auto [c, tool] = resolve(name);
    return call_tool(c->name(), tool, args);
}

CallToolResult McpManager::call_tool(const std::string& server, const std::string& tool,
                                     const nlohmann::json& args) {
    auto c = client(server);
    if (!c) {
        throw McpError(McpErrorKind::not_running, "server " + server + " is not running");
    }
    auto st = c->status();
    if (st != ServerStatus::running) {
        throw McpError(McpErrorKind::not_running,
                       "server " + server + " is not running (status: " + to_string(st) + ")");
    }
    if (!c->has_tool(tool)) {
        throw McpError(McpErrorKind::tool_not_found,
                       "server " + server + " has no tool '" + tool + "'");
    }
    return c->call_tool(tool, args);
}

} // namespace mcplink
