#pragma once
#include <stdexcept>
#include <string>

namespace mcplink {

// ── Error classification ────────────────────────────────────────────
// spawn, handshake and process_exited are fatal to a session.
// Everything else belongs to the single call that raised it.
enum class McpErrorKind {
    spawn,
    handshake,
    process_exited,
    not_running,
    tool_not_found,
    timeout,
    shutdown,
    transport,
    protocol,
    rpc_error,
    invalid_state
};

inline const char* to_string(McpErrorKind kind) {
    switch (kind) {
        case McpErrorKind::spawn:          return "spawn";
        case McpErrorKind::handshake:      return "handshake";
        case McpErrorKind::process_exited: return "process_exited";
        case McpErrorKind::not_running:    return "not_running";
        case McpErrorKind::tool_not_found: return "tool_not_found";
        case McpErrorKind::timeout:        return "timeout";
        case McpErrorKind::shutdown:       return "shutdown";
        case McpErrorKind::transport:      return "transport";
        case McpErrorKind::protocol:       return "protocol";
        case McpErrorKind::rpc_error:      return "rpc_error";
        case McpErrorKind::invalid_state:  return "invalid_state";
    }
    return "unknown";
}

class McpError : public std::runtime_error {
public:
    McpError(McpErrorKind kind, const std::string& message, int rpc_code = 0)
        : std::runtime_error(message), kind_(kind), rpc_code_(rpc_code) {}

    McpErrorKind kind() const { return kind_; }

    // JSON-RPC error code, only meaningful for rpc_error
    int rpc_code() const { return rpc_code_; }

    bool is_fatal() const {
        return kind_ == McpErrorKind::spawn ||
               kind_ == McpErrorKind::handshake ||
               kind_ == McpErrorKind::process_exited;
    }

private:
    McpErrorKind kind_;
    int rpc_code_;
};

} // namespace mcplink
