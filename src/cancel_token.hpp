#pragma once
#include <atomic>

namespace mcplink {

// Shared between a session and its worker threads. Workers poll it at
// least once per read iteration and return as soon as it is set.
class CancelToken {
public:
    void cancel() { cancelled_ = true; }
    bool cancelled() const { return cancelled_; }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace mcplink
