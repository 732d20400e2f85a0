#pragma once
#include "cancel_token.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <sys/types.h>

namespace mcplink {

// Owns one child process and the parent ends of its stdin/stdout/stderr pipes.
//
// Exactly one thread (the session's exit watcher) calls wait_exit(); every
// other thread learns about the exit through exited() / wait_for_exit().
// The child is reaped under state_mutex_, so kill_now() never signals a pid
// that has already been recycled.
class ChildProcess {
public:
    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    // Throws McpError(spawn) when pipes cannot be created, fork fails, or
    // the command cannot be executed.
    void spawn(const std::string& command,
               const std::vector<std::string>& args,
               const std::map<std::string, std::string>& env = {});

    pid_t pid() const { return pid_; }
    int stdout_fd() const { return stdout_fd_; }
    int stderr_fd() const { return stderr_fd_; }

    // Writes line + '\n' atomically with respect to other writers. The pipe
    // is non-blocking; while it is full the writer waits in poll() slices of
    // at most 100ms. Throws McpError: shutdown when cancel is set or stdin is
    // being closed, timeout past the deadline, transport on a write error or
    // once an earlier write was abandoned mid-frame.
    void write_line(const std::string& line, const CancelToken& cancel,
                    std::chrono::milliseconds timeout);

    // Cooperative "please exit": the server sees EOF on its stdin. A writer
    // blocked on a full pipe gives up within one poll slice.
    void close_stdin();

    void wait_exit();
    bool wait_for_exit(std::chrono::milliseconds timeout);
    bool exited() const;

    // "exit code 1", "killed by signal 9 (Killed)", ...
    std::string exit_description() const;

    void kill_now();

private:
    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;

    std::mutex write_mutex_;
    std::atomic<bool> stdin_closing_{false};
    bool stdin_broken_ = false;   // guarded by write_mutex_

    mutable std::mutex state_mutex_;
    std::condition_variable exit_cv_;
    bool exited_ = false;
    int wait_status_ = 0;
    int wait_errno_ = 0;

    void close_fds();
};

// Splits a pipe into lines. Blocks in poll() for at most 100ms at a time so
// the owning worker notices cancellation within one iteration.
class LineReader {
public:
    enum class Status { line, eof, cancelled };

    explicit LineReader(int fd) : fd_(fd) {}

    Status next(std::string& line, const CancelToken& cancel);

private:
    int fd_;
    std::string buffer_;
    bool eof_ = false;

    bool take_line(std::string& line);
};

} // namespace mcplink
