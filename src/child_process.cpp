#include "child_process.hpp"
#include "mcp_error.hpp"
#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace mcplink {

namespace {

std::once_flag g_sigpipe_once;

// A server that dies mid-write must surface as EPIPE, not kill us
void ignore_sigpipe() {
    std::call_once(g_sigpipe_once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

void close_pair(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
    fds[0] = fds[1] = -1;
}

std::string errno_text(int err) {
    return std::strerror(err);
}

} // namespace

ChildProcess::~ChildProcess() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (pid_ > 0 && !exited_) {
            kill(pid_, SIGKILL);
            int status = 0;
            while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
            exited_ = true;
            wait_status_ = status;
        }
    }
    close_fds();
}

void ChildProcess::spawn(const std::string& command,
                         const std::vector<std::string>& args,
                         const std::map<std::string, std::string>& env) {
    if (pid_ != -1) {
        throw McpError(McpErrorKind::spawn, "process already spawned");
    }
    if (command.empty()) {
        throw McpError(McpErrorKind::spawn, "no command specified");
    }

    ignore_sigpipe();

    int pipe_stdin[2] = {-1, -1};
    int pipe_stdout[2] = {-1, -1};
    int pipe_stderr[2] = {-1, -1};
    int pipe_exec[2] = {-1, -1};

    // Close-on-exec everywhere: sibling servers must not inherit our ends,
    // otherwise closing stdin would never reach the child as EOF.
    if (pipe2(pipe_stdin, O_CLOEXEC) != 0) {
        throw McpError(McpErrorKind::spawn, "failed to create stdin pipe: " + errno_text(errno));
    }
    if (pipe2(pipe_stdout, O_CLOEXEC) != 0) {
        int err = errno;
        close_pair(pipe_stdin);
        throw McpError(McpErrorKind::spawn, "failed to create stdout pipe: " + errno_text(err));
    }
    if (pipe2(pipe_stderr, O_CLOEXEC) != 0) {
        int err = errno;
        close_pair(pipe_stdin);
        close_pair(pipe_stdout);
        throw McpError(McpErrorKind::spawn, "failed to create stderr pipe: " + errno_text(err));
    }
    if (pipe2(pipe_exec, O_CLOEXEC) != 0) {
        int err = errno;
        close_pair(pipe_stdin);
        close_pair(pipe_stdout);
        close_pair(pipe_stderr);
        throw McpError(McpErrorKind::spawn, "failed to create exec status pipe: " + errno_text(err));
    }

    // Everything the child needs is built before fork; after fork only
    // async-signal-safe calls are allowed.
    std::vector<const char*> argv;
    argv.push_back(command.c_str());
    for (auto& arg : args) {
        argv.push_back(arg.c_str());
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_storage;
    std::vector<char*> envp;
    if (!env.empty()) {
        for (char** e = environ; e && *e; ++e) {
            std::string entry(*e);
            auto eq = entry.find('=');
            if (eq != std::string::npos && env.count(entry.substr(0, eq))) continue;
            env_storage.push_back(std::move(entry));
        }
        for (auto& [k, v] : env) {
            env_storage.push_back(k + "=" + v);
        }
        for (auto& s : env_storage) {
            envp.push_back(const_cast<char*>(s.c_str()));
        }
        envp.push_back(nullptr);
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close_pair(pipe_stdin);
        close_pair(pipe_stdout);
        close_pair(pipe_stderr);
        close_pair(pipe_exec);
        throw McpError(McpErrorKind::spawn, "fork failed: " + errno_text(err));
    }

    if (pid == 0) {
        // Child process
        dup2(pipe_stdin[0], STDIN_FILENO);
        dup2(pipe_stdout[1], STDOUT_FILENO);
        dup2(pipe_stderr[1], STDERR_FILENO);
        std::signal(SIGPIPE, SIG_DFL);

        if (envp.empty()) {
            execvp(command.c_str(), const_cast<char* const*>(argv.data()));
        } else {
            execvpe(command.c_str(), const_cast<char* const*>(argv.data()), envp.data());
        }

        int err = errno;
        ssize_t ignored = write(pipe_exec[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent process
    close(pipe_stdin[0]);
    close(pipe_stdout[1]);
    close(pipe_stderr[1]);
    close(pipe_exec[1]);

    // EOF on the status pipe means exec succeeded (close-on-exec fired)
    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(pipe_exec[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close(pipe_exec[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        close(pipe_stdin[1]);
        close(pipe_stdout[0]);
        close(pipe_stderr[0]);
        throw McpError(McpErrorKind::spawn,
                       "failed to execute '" + command + "': " + errno_text(exec_errno));
    }

    // Only our end; the child's read end is a separate open file description
    int flags = fcntl(pipe_stdin[1], F_GETFL);
    if (flags < 0 || fcntl(pipe_stdin[1], F_SETFL, flags | O_NONBLOCK) != 0) {
        int err = errno;
        kill(pid, SIGKILL);
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        close(pipe_stdin[1]);
        close(pipe_stdout[0]);
        close(pipe_stderr[0]);
        throw McpError(McpErrorKind::spawn, "failed to make server stdin non-blocking: " + errno_text(err));
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    pid_ = pid;
    stdin_fd_ = pipe_stdin[1];
    stdout_fd_ = pipe_stdout[0];
    stderr_fd_ = pipe_stderr[0];
    exited_ = false;
    wait_status_ = 0;
    wait_errno_ = 0;
}

void ChildProcess::write_line(const std::string& line, const CancelToken& cancel,
                              std::chrono::milliseconds timeout) {
    std::string data = line + "\n";
    auto deadline = std::chrono::steady_clock::now() + timeout;

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (stdin_fd_ < 0 || stdin_closing_) {
        throw McpError(McpErrorKind::transport, "server stdin is closed");
    }
    if (stdin_broken_) {
        throw McpError(McpErrorKind::transport, "server stdin holds an incomplete frame");
    }

    size_t total = 0;
    while (total < data.size()) {
        // A partial frame cannot be taken back; the stream is unusable after it
        auto abandon = [&](McpErrorKind kind, const std::string& why) {
            if (total > 0) stdin_broken_ = true;
            return McpError(kind, why);
        };

        if (cancel.cancelled() || stdin_closing_) {
            throw abandon(McpErrorKind::shutdown, "write aborted, client shutting down");
        }

        ssize_t n = write(stdin_fd_, data.data() + total, data.size() - total);
        if (n >= 0) {
            total += static_cast<size_t>(n);
            continue;
        }
        if (errno == EINTR) continue;
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            throw abandon(McpErrorKind::transport,
                          "failed to write to server stdin: " + errno_text(errno));
        }

        // Pipe full: the server is not reading
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            throw abandon(McpErrorKind::timeout,
                          "server stopped reading stdin, write timed out after " +
                          std::to_string(timeout.count()) + "ms");
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        struct pollfd pfd{};
        pfd.fd = stdin_fd_;
        pfd.events = POLLOUT;
        int ret = poll(&pfd, 1, static_cast<int>(std::min<long long>(left + 1, 100)));
        if (ret < 0 && errno != EINTR) {
            throw abandon(McpErrorKind::transport, "poll on server stdin failed: " + errno_text(errno));
        }
        // POLLERR/POLLHUP show up as EPIPE on the next write()
    }
}

void ChildProcess::close_stdin() {
    // Tell a writer stuck on a full pipe to let go of write_mutex_
    stdin_closing_ = true;
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (stdin_fd_ >= 0) {
        close(stdin_fd_);
        stdin_fd_ = -1;
    }
}

void ChildProcess::wait_exit() {
    if (pid_ <= 0) return;

    // Wait without reaping, then reap under the lock so kill_now() can
    // trust exited_.
    siginfo_t info{};
    int rc;
    do {
        rc = waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT);
    } while (rc != 0 && errno == EINTR);

    std::lock_guard<std::mutex> lock(state_mutex_);
    if (exited_) return;

    int status = 0;
    pid_t r;
    do {
        r = waitpid(pid_, &status, 0);
    } while (r < 0 && errno == EINTR);

    wait_status_ = status;
    wait_errno_ = r < 0 ? errno : 0;
    exited_ = true;
    exit_cv_.notify_all();
}

bool ChildProcess::wait_for_exit(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(state_mutex_);
    return exit_cv_.wait_for(lock, timeout, [this] { return exited_; });
}

bool ChildProcess::exited() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return exited_;
}

std::string ChildProcess::exit_description() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!exited_) return "still running";
    if (wait_errno_ != 0) return "wait failed: " + errno_text(wait_errno_);
    if (WIFEXITED(wait_status_)) {
        return "exit code " + std::to_string(WEXITSTATUS(wait_status_));
    }
    if (WIFSIGNALED(wait_status_)) {
        int sig = WTERMSIG(wait_status_);
        const char* name = strsignal(sig);
        return "killed by signal " + std::to_string(sig) +
               (name ? std::string(" (") + name + ")" : std::string());
    }
    return "status " + std::to_string(wait_status_);
}

void ChildProcess::kill_now() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (pid_ > 0 && !exited_) {
        kill(pid_, SIGKILL);
    }
}

void ChildProcess::close_fds() {
    close_stdin();
    if (stdout_fd_ >= 0) {
        close(stdout_fd_);
        stdout_fd_ = -1;
    }
    if (stderr_fd_ >= 0) {
        close(stderr_fd_);
        stderr_fd_ = -1;
    }
}

// ── LineReader ──────────────────────────────────────────────────────

bool LineReader::take_line(std::string& line) {
    auto pos = buffer_.find('\n');
    if (pos == std::string::npos) return false;
    line = buffer_.substr(0, pos);
    buffer_.erase(0, pos + 1);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return true;
}

LineReader::Status LineReader::next(std::string& line, const CancelToken& cancel) {
    while (true) {
        if (take_line(line)) return Status::line;

        if (eof_) {
            // Unterminated final line
            if (!buffer_.empty()) {
                line = std::move(buffer_);
                buffer_.clear();
                if (!line.empty() && line.back() == '\r') line.pop_back();
                return Status::line;
            }
            return Status::eof;
        }

        if (cancel.cancelled()) return Status::cancelled;

        struct pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLIN;
        int ret = poll(&pfd, 1, 100);
        if (ret < 0) {
            if (errno == EINTR) continue;
            eof_ = true;
            continue;
        }
        if (ret == 0) continue;

        std::array<char, 4096> buf;
        ssize_t n = read(fd_, buf.data(), buf.size());
        if (n > 0) {
            buffer_.append(buf.data(), static_cast<size_t>(n));
        } else if (n == 0) {
            eof_ = true;
        } else if (errno != EINTR && errno != EAGAIN) {
            eof_ = true;
        }
    }
}

} // namespace mcplink
