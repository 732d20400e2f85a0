#pragma once
#include "config.hpp"
#include "cancel_token.hpp"
#include "child_process.hpp"
#include "jsonrpc.hpp"
#include "mcp_error.hpp"
#include "mcp_types.hpp"
#include "pending_requests.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcplink {

enum class ServerStatus {
    stopped,
    starting,
    running,
    error
};

const char* to_string(ServerStatus status);

using NotificationHandler = std::function<void(const Notification&)>;

// One MCP server over stdio.
//
// stopped -> starting -> running -> {error, stopped}. error and stopped stay
// put until someone calls start() again (after stop() in the error case).
// call_tool() may be used from any number of threads at once; responses are
// matched to callers by id, never by arrival order.
class McpClient {
public:
    struct Timeouts {
        std::chrono::milliseconds request{30000};
        std::chrono::milliseconds shutdown_grace{5000};
    };

    explicit McpClient(McpServerConfig cfg);
    McpClient(McpServerConfig cfg, Timeouts timeouts);
    ~McpClient();

    McpClient(const McpClient&) = delete;
    McpClient& operator=(const McpClient&) = delete;

    // Spawns the server and runs the handshake. Throws McpError and leaves
    // status error on failure; throws without touching state when not stopped.
    void start();

    // Idempotent. Returns once the process is gone, every worker has been
    // joined and every pending call has returned.
    void stop();

    ServerStatus status() const;
    std::optional<McpError> last_error() const;

    std::vector<ToolInfo> tools() const;
    bool has_tool(const std::string& tool_name) const;

    // Re-lists the catalog and swaps it in whole
    void refresh_tools();

    // Throws McpError for anything that kept the call from completing.
    // A tool that ran and failed comes back with is_error set.
    CallToolResult call_tool(const std::string& tool_name, const nlohmann::json& arguments);

    void set_notification_handler(NotificationHandler handler);

    const std::string& name() const { return config_.name; }
    const McpServerConfig& config() const { return config_; }
    ServerInfo server_info() const;
    nlohmann::json capabilities() const;
    std::string protocol_version() const;

    // Diagnostics
    size_t pending_count() const { return pending_.size(); }
    pid_t pid() const;

private:
    McpServerConfig config_;
    Timeouts timeouts_;
    std::string tag_;

    // Serializes start() and stop() against each other
    std::mutex lifecycle_mutex_;

    mutable std::shared_mutex status_mutex_;
    ServerStatus status_ = ServerStatus::stopped;
    std::optional<McpError> last_error_;

    // Replaced only by start(), released only by stop(). Workers and
    // in-flight writers hold a snapshot so a concurrent stop() cannot pull
    // the pipes out from under them.
    mutable std::mutex process_mutex_;
    std::shared_ptr<ChildProcess> process_;
    std::shared_ptr<CancelToken> cancel_;
    std::thread stdout_thread_;
    std::thread stderr_thread_;
    std::thread exit_thread_;

    std::atomic<int64_t> next_id_{0};
    PendingRequests pending_;

    mutable std::shared_mutex tools_mutex_;
    std::vector<ToolInfo> tools_;

    mutable std::mutex info_mutex_;
    InitializeResult init_result_;

    std::mutex handler_mutex_;
    NotificationHandler notification_handler_;

    void initialize();
    void stop_locked();
    McpError fail(McpErrorKind kind, const std::string& message);

    nlohmann::json send_request(const std::string& method, const nlohmann::json& params);
    void send_notification(const std::string& method, const nlohmann::json& params = {});
    void send_frame(const Message& msg, std::chrono::milliseconds timeout);

    // Background workers; each receives its own copy of the cancel token
    void read_stdout(std::shared_ptr<ChildProcess> process, std::shared_ptr<CancelToken> cancel);
    void read_stderr(std::shared_ptr<ChildProcess> process, std::shared_ptr<CancelToken> cancel);
    void watch_exit(std::shared_ptr<ChildProcess> process, std::shared_ptr<CancelToken> cancel);

    void handle_response(Response resp);
    void handle_notification(const Notification& notif);
    void handle_server_request(const Request& req);
};

} // namespace mcplink
