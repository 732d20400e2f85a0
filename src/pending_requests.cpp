#include "pending_requests.hpp"

namespace mcplink {

std::future<Response> PendingRequests::register_request(const RequestId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = slots_.try_emplace(id);
    if (!inserted) {
        throw McpError(McpErrorKind::transport,
                       "request id " + id_to_string(id) + " is already outstanding");
    }
    return it->second.get_future();
}

bool PendingRequests::resolve(Response response) {
    std::promise<Response> slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(response.id);
        if (it == slots_.end()) return false;
        slot = std::move(it->second);
        slots_.erase(it);
    }
    slot.set_value(std::move(response));
    return true;
}

void PendingRequests::forget(const RequestId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    slots_.erase(id);
}

size_t PendingRequests::cancel_all(McpErrorKind kind, const std::string& reason) {
    std::map<RequestId, std::promise<Response>> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drained.swap(slots_);
    }
    for (auto& [id, slot] : drained) {
        slot.set_exception(std::make_exception_ptr(McpError(kind, reason)));
    }
    return drained.size();
}

size_t PendingRequests::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
}

bool PendingRequests::contains(const RequestId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.count(id) > 0;
}

} // namespace mcplink
