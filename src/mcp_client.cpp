#include "mcp_client.hpp"
#include "logging.hpp"
#include "utils.hpp"

namespace mcplink {

// Replies written from the stdout reader must not stall it for long: a
// server blocked writing its own stdout may never drain our pipe
static constexpr std::chrono::milliseconds kReplyTimeout{1000};

const char* to_string(ServerStatus status) {
    switch (status) {
        case ServerStatus::stopped:  return "stopped";
        case ServerStatus::starting: return "starting";
        case ServerStatus::running:  return "running";
        case ServerStatus::error:    return "error";
    }
    return "unknown";
}

McpClient::McpClient(McpServerConfig cfg)
    : McpClient(std::move(cfg), Timeouts{}) {}

McpClient::McpClient(McpServerConfig cfg, Timeouts timeouts)
    : config_(std::move(cfg)), timeouts_(timeouts), tag_("mcp:" + config_.name) {}

McpClient::~McpClient() {
    stop();
}

// ── Lifecycle ───────────────────────────────────────────────────────

void McpClient::start() {
    std::lock_guard<std::mutex> life(lifecycle_mutex_);

    {
        std::unique_lock<std::shared_mutex> lock(status_mutex_);
        if (status_ != ServerStatus::stopped) {
            log_line(LogLevel::warn, tag_, std::string("start ignored, status is ") + to_string(status_));
            throw McpError(McpErrorKind::invalid_state,
                           std::string("server is ") + to_string(status_) + ", stop it first");
        }
        status_ = ServerStatus::starting;
        last_error_.reset();
    }
    {
        std::unique_lock<std::shared_mutex> lock(tools_mutex_);
        tools_.clear();
    }
    {
        std::lock_guard<std::mutex> lock(info_mutex_);
        init_result_ = InitializeResult{};
    }

    std::string cmdline = config_.command;
    for (auto& arg : config_.args) cmdline += " " + arg;
    log_line(LogLevel::info, tag_, "starting: " + cmdline);

    auto process = std::make_shared<ChildProcess>();
    try {
        process->spawn(config_.command, config_.args, config_.env);
    } catch (const McpError& e) {
        throw fail(McpErrorKind::spawn, e.what());
    }
    log_line(LogLevel::info, tag_, "process started, pid " + std::to_string(process->pid()));

    auto cancel = std::make_shared<CancelToken>();
    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        process_ = process;
        cancel_ = cancel;
    }
    stdout_thread_ = std::thread(&McpClient::read_stdout, this, process, cancel);
    stderr_thread_ = std::thread(&McpClient::read_stderr, this, process, cancel);
    exit_thread_ = std::thread(&McpClient::watch_exit, this, process, cancel);

    try {
        initialize();
    } catch (const std::exception& e) {
        std::string message = std::string("failed to initialize MCP connection: ") + e.what();
        stop_locked();
        throw fail(McpErrorKind::handshake, message);
    }

    bool died = false;
    {
        std::unique_lock<std::shared_mutex> lock(status_mutex_);
        // The exit watcher only flips running -> error, so a child that died
        // after the handshake but before this point has to be caught here.
        if (process->exited()) {
            died = true;
        } else {
            status_ = ServerStatus::running;
        }
    }
    if (died) {
        std::string message = "server process exited during startup: " + process->exit_description();
        stop_locked();
        throw fail(McpErrorKind::handshake, message);
    }

    log_line(LogLevel::info, tag_, "running");
}

void McpClient::stop() {
    std::lock_guard<std::mutex> life(lifecycle_mutex_);
    stop_locked();
}

void McpClient::stop_locked() {
    {
        std::unique_lock<std::shared_mutex> lock(status_mutex_);
        if (status_ == ServerStatus::stopped) {
            return;
        }
        // Flip first so status() never waits on the shutdown sequence
        status_ = ServerStatus::stopped;
    }
    log_line(LogLevel::info, tag_, "stopping");

    std::shared_ptr<ChildProcess> process;
    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        process = process_;
        if (cancel_) cancel_->cancel();
    }

    pending_.cancel_all(McpErrorKind::shutdown, "client shutting down");

    if (process) {
        process->close_stdin();
        if (process->wait_for_exit(timeouts_.shutdown_grace)) {
            log_line(LogLevel::debug, tag_, "process exited: " + process->exit_description());
        } else {
            log_line(LogLevel::warn, tag_, "server did not exit gracefully, force killing");
            process->kill_now();
        }
    }

    if (stdout_thread_.joinable()) stdout_thread_.join();
    if (stderr_thread_.joinable()) stderr_thread_.join();
    if (exit_thread_.joinable()) exit_thread_.join();

    // Anything registered while the sequence above was running
    size_t late = pending_.cancel_all(McpErrorKind::shutdown, "client shutting down");
    if (late > 0) {
        log_line(LogLevel::debug, tag_, "cancelled " + std::to_string(late) + " late request(s)");
    }

    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        process_.reset();
        cancel_.reset();
    }
    {
        std::unique_lock<std::shared_mutex> lock(tools_mutex_);
        tools_.clear();
    }

    log_line(LogLevel::info, tag_, "stopped");
}

McpError McpClient::fail(McpErrorKind kind, const std::string& message) {
    McpError err(kind, message);
    {
        std::unique_lock<std::shared_mutex> lock(status_mutex_);
        status_ = ServerStatus::error;
        last_error_ = err;
    }
    log_line(LogLevel::error, tag_, message);
    return err;
}

void McpClient::initialize() {
    auto result = send_request("initialize", initialize_params());

    InitializeResult init;
    try {
        init = InitializeResult::from_json(result);
    } catch (const std::exception& e) {
        throw McpError(McpErrorKind::protocol, std::string("bad initialize result: ") + e.what());
    }
    {
        std::lock_guard<std::mutex> lock(info_mutex_);
        init_result_ = init;
    }
    log_line(LogLevel::debug, tag_, "server " + init.server_info.name + " " +
             init.server_info.version + ", protocol " + init.protocol_version);

    send_notification("notifications/initialized");
    refresh_tools();

    log_line(LogLevel::info, tag_, "initialized (" + std::to_string(tools().size()) + " tools)");
}

// ── Queries ─────────────────────────────────────────────────────────

ServerStatus McpClient::status() const {
    std::shared_lock<std::shared_mutex> lock(status_mutex_);
    return status_;
}

std::optional<McpError> McpClient::last_error() const {
    std::shared_lock<std::shared_mutex> lock(status_mutex_);
    return last_error_;
}

std::vector<ToolInfo> McpClient::tools() const {
    std::shared_lock<std::shared_mutex> lock(tools_mutex_);
    return tools_;
}

bool McpClient::has_tool(const std::string& tool_name) const {
    std::shared_lock<std::shared_mutex> lock(tools_mutex_);
    for (auto& t : tools_) {
        if (t.name == tool_name) return true;
    }
    return false;
}

ServerInfo McpClient::server_info() const {
    std::lock_guard<std::mutex> lock(info_mutex_);
    return init_result_.server_info;
}

nlohmann::json McpClient::capabilities() const {
    std::lock_guard<std::mutex> lock(info_mutex_);
    return init_result_.capabilities;
}

std::string McpClient::protocol_version() const {
    std::lock_guard<std::mutex> lock(info_mutex_);
    return init_result_.protocol_version;
}

pid_t McpClient::pid() const {
    std::lock_guard<std::mutex> lock(process_mutex_);
    return process_ ? process_->pid() : -1;
}

void McpClient::set_notification_handler(NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    notification_handler_ = std::move(handler);
}

// ── Operations ──────────────────────────────────────────────────────

void McpClient::refresh_tools() {
    auto st = status();
    if (st != ServerStatus::starting && st != ServerStatus::running) {
        throw McpError(McpErrorKind::not_running,
                       std::string("server is not running (status: ") + to_string(st) + ")");
    }

    auto result = send_request("tools/list", nlohmann::json::object());

    std::vector<ToolInfo> fresh;
    try {
        fresh = parse_tool_list(result);
    } catch (const std::exception& e) {
        throw McpError(McpErrorKind::protocol, std::string("bad tools/list result: ") + e.what());
    }

    for (auto& t : fresh) {
        log_line(LogLevel::debug, tag_, "tool: " + t.name);
    }
    size_t count = fresh.size();
    {
        std::unique_lock<std::shared_mutex> lock(tools_mutex_);
        tools_.swap(fresh);
    }
    log_line(LogLevel::debug, tag_, "catalog refreshed, " + std::to_string(count) + " tools");
}

CallToolResult McpClient::call_tool(const std::string& tool_name, const nlohmann::json& arguments) {
    auto st = status();
    if (st != ServerStatus::running) {
        throw McpError(McpErrorKind::not_running,
                       std::string("server is not running (status: ") + to_string(st) + ")");
    }

    nlohmann::json params = {
        {"name", tool_name},
        {"arguments", arguments.is_null() ? nlohmann::json::object() : arguments}
    };

    nlohmann::json result;
    try {
        result = send_request("tools/call", params);
    } catch (const McpError& e) {
        log_line(LogLevel::warn, tag_, "tool " + tool_name + " failed: " + e.what());
        throw;
    }

    auto r = CallToolResult::from_json(result);
    log_line(LogLevel::debug, tag_, "tool " + tool_name + " returned" +
             (r.is_error ? " an error result" : ""));
    return r;
}

// ── Wire ────────────────────────────────────────────────────────────

nlohmann::json McpClient::send_request(const std::string& method, const nlohmann::json& params) {
    RequestId id = ++next_id_;
    auto deadline = std::chrono::steady_clock::now() + timeouts_.request;
    auto future = pending_.register_request(id);

    // The write and the wait share one budget
    try {
        send_frame(Request{id, method, params}, timeouts_.request);
    } catch (const std::exception&) {
        pending_.forget(id);
        throw;
    }

    if (future.wait_until(deadline) != std::future_status::ready) {
        pending_.forget(id);
        log_line(LogLevel::error, tag_, method + " (id " + id_to_string(id) + ") timed out");
        throw McpError(McpErrorKind::timeout,
                       method + " timed out after " + std::to_string(timeouts_.request.count()) + "ms");
    }

    // Rethrows shutdown / process_exited failures delivered by cancel_all
    Response resp = future.get();
    if (resp.error) {
        throw McpError(McpErrorKind::rpc_error, "server error: " + resp.error->message, resp.error->code);
    }
    return resp.result;
}

void McpClient::send_notification(const std::string& method, const nlohmann::json& params) {
    send_frame(Notification{method, params}, timeouts_.request);
}

void McpClient::send_frame(const Message& msg, std::chrono::milliseconds timeout) {
    std::shared_ptr<ChildProcess> process;
    std::shared_ptr<CancelToken> cancel;
    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        process = process_;
        cancel = cancel_;
    }
    if (!process || !cancel) {
        throw McpError(McpErrorKind::not_running, "server process is not running");
    }

    std::string line;
    try {
        line = serialize(msg);
    } catch (const nlohmann::json::exception& e) {
        throw McpError(McpErrorKind::transport, std::string("failed to encode frame: ") + e.what());
    }

    if (log_enabled(LogLevel::debug)) {
        log_line(LogLevel::debug, tag_, "-> " + clip(line));
    }
    process->write_line(line, *cancel, timeout);
}

// ── Workers ─────────────────────────────────────────────────────────

void McpClient::read_stdout(std::shared_ptr<ChildProcess> process, std::shared_ptr<CancelToken> cancel) {
    LineReader reader(process->stdout_fd());
    std::string line;

    while (true) {
        auto st = reader.next(line, *cancel);
        if (st == LineReader::Status::cancelled) break;
        if (st == LineReader::Status::eof) {
            log_line(LogLevel::debug, tag_, "stdout closed");
            break;
        }
        if (line.empty()) continue;

        if (log_enabled(LogLevel::debug)) {
            log_line(LogLevel::debug, tag_, "<- " + clip(line));
        }

        try {
            Message msg = parse_message(line);
            if (auto resp = std::get_if<Response>(&msg)) {
                handle_response(std::move(*resp));
            } else if (auto notif = std::get_if<Notification>(&msg)) {
                handle_notification(*notif);
            } else {
                handle_server_request(std::get<Request>(msg));
            }
        } catch (const DecodeError& e) {
            log_line(LogLevel::warn, tag_, std::string("discarding malformed line: ") + e.what() +
                     ": " + clip(line, 120));
        }
    }
}

void McpClient::read_stderr(std::shared_ptr<ChildProcess> process, std::shared_ptr<CancelToken> cancel) {
    LineReader reader(process->stderr_fd());
    std::string line;

    while (reader.next(line, *cancel) == LineReader::Status::line) {
        if (!line.empty()) {
            log_line(LogLevel::info, tag_, "stderr: " + line);
        }
    }
}

// Returns once the child is reaped; stop() guarantees that by killing it
// after the grace period.
void McpClient::watch_exit(std::shared_ptr<ChildProcess> process, std::shared_ptr<CancelToken> cancel) {
    process->wait_exit();
    std::string cause = process->exit_description();

    if (cancel->cancelled()) {
        log_line(LogLevel::debug, tag_, "process exited as expected: " + cause);
        return;
    }

    std::string message = "server process exited unexpectedly: " + cause;
    bool unexpected = false;
    {
        std::unique_lock<std::shared_mutex> lock(status_mutex_);
        if (status_ == ServerStatus::running) {
            status_ = ServerStatus::error;
            last_error_ = McpError(McpErrorKind::process_exited, message);
            unexpected = true;
        } else if (status_ == ServerStatus::starting) {
            // start() turns this into a handshake failure
            unexpected = true;
        }
    }

    if (!unexpected) {
        log_line(LogLevel::debug, tag_, "process exited: " + cause);
        return;
    }

    log_line(LogLevel::error, tag_, message);
    size_t n = pending_.cancel_all(McpErrorKind::process_exited, message);
    if (n > 0) {
        log_line(LogLevel::debug, tag_, "failed " + std::to_string(n) + " pending request(s)");
    }
}

void McpClient::handle_response(Response resp) {
    std::string id = id_to_string(resp.id);
    if (!pending_.resolve(std::move(resp))) {
        log_line(LogLevel::warn, tag_, "no pending request for response id " + id +
                 " (" + std::to_string(pending_.size()) + " pending), dropped");
    }
}

void McpClient::handle_notification(const Notification& notif) {
    log_line(LogLevel::debug, tag_, "notification: " + notif.method);

    NotificationHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = notification_handler_;
    }
    if (!handler) return;

    try {
        handler(notif);
    } catch (const std::exception& e) {
        log_line(LogLevel::warn, tag_, "notification handler error: " + std::string(e.what()));
    }
}

void McpClient::handle_server_request(const Request& req) {
    Response resp;
    resp.id = req.id;
    if (req.method == "ping") {
        resp.result = nlohmann::json::object();
    } else {
        log_line(LogLevel::debug, tag_, "unsupported request from server: " + req.method);
        resp.error = JsonRpcError{kMethodNotFound, "Method not found: " + req.method, nullptr};
    }

    try {
        send_frame(resp, kReplyTimeout);
    } catch (const McpError& e) {
        log_line(LogLevel::warn, tag_, "failed to answer " + req.method + ": " + e.what());
    }
}

} // namespace mcplink
