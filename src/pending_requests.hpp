#pragma once
#include "jsonrpc.hpp"
#include "mcp_error.hpp"
#include <future>
#include <map>
#include <mutex>

namespace mcplink {

// Outstanding request id -> single-use result slot.
// The reader thread resolves slots; callers wait on the returned future.
class PendingRequests {
public:
    PendingRequests() = default;
    PendingRequests(const PendingRequests&) = delete;
    PendingRequests& operator=(const PendingRequests&) = delete;

    // Must be called before the request is written to the wire
    std::future<Response> register_request(const RequestId& id);

    // Delivers the response and erases the slot; false when nobody waits for it
    bool resolve(Response response);

    // Caller gave up (timeout, write failure); no-op if already resolved
    void forget(const RequestId& id);

    // Fails every outstanding slot with McpError(kind, reason) and empties the table
    size_t cancel_all(McpErrorKind kind, const std::string& reason);

    size_t size() const;
    bool contains(const RequestId& id) const;

private:
    mutable std::mutex mutex_;
    std::map<RequestId, std::promise<Response>> slots_;
};

} // namespace mcplink
