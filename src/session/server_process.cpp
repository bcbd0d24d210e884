#include "session/server_process.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
#include "core/logging/logger.hpp"

namespace relay::session {

using core::errors::ErrorCategory;
using core::errors::RelayError;

namespace {

constexpr std::size_t kMaxDiagnosticLines = 256;

void set_cloexec(const int fd) {
    const int flags = fcntl(fd, F_GETFD, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFD, flags | FD_CLOEXEC));
}

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_pipe(int (&fds)[2]) {
    for (int& fd : fds) {
        if (fd >= 0) {
            static_cast<void>(close(fd));
            fd = -1;
        }
    }
}

bool wait_for_exit(const pid_t pid, const std::chrono::milliseconds grace) {
    const auto deadline = std::chrono::steady_clock::now() + grace;
    int status = 0;
    while (std::chrono::steady_clock::now() < deadline) {
        const pid_t waited = waitpid(pid, &status, WNOHANG);
        if (waited == pid || (waited < 0 && errno == ECHILD)) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
}

}  // namespace

ServerProcess::~ServerProcess() {
    stop();
}

core::errors::Result<pid_t> ServerProcess::start(const ServerLaunch& launch) {
    if (pid_ > 0) {
        return RelayError{ErrorCategory::Internal, "Tool server is already running.",
                          "server_already_running"};
    }
    if (launch.command.empty()) {
        return RelayError{ErrorCategory::Input, "Tool server command is empty.",
                          "missing_server_command"};
    }

    // A dead server must surface as a write error, not kill the client.
    static_cast<void>(std::signal(SIGPIPE, SIG_IGN));

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe(stdin_pipe) != 0 || pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0) {
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return RelayError{ErrorCategory::Internal, "Failed to create process pipes.",
                          "pipe_creation_failed"};
    }

    std::vector<std::string> argv_storage;
    argv_storage.push_back(launch.command);
    argv_storage.insert(argv_storage.end(), launch.args.begin(), launch.args.end());
    std::vector<char*> argv;
    for (auto& arg : argv_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    const pid_t pid = fork();
    if (pid < 0) {
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return RelayError{ErrorCategory::Internal, "Failed to fork tool server.", "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(dup2(stdin_pipe[0], STDIN_FILENO));
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        execvp(argv[0], argv.data());
        _exit(127);
    }

    static_cast<void>(close(stdin_pipe[0]));
    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    stdin_fd_ = stdin_pipe[1];
    stdout_fd_ = stdout_pipe[0];
    stderr_fd_ = stderr_pipe[0];
    set_cloexec(stdin_fd_);
    set_cloexec(stdout_fd_);
    set_cloexec(stderr_fd_);
    set_nonblocking(stderr_fd_);

    pid_ = pid;
    transport_ = std::make_unique<transport::FdTransport>(stdout_fd_, stdin_fd_,
                                                          launch.read_timeout_ms);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ready_ = launch.ready_marker.empty();
        diagnostics_closed_ = false;
        diagnostic_lines_.clear();
    }
    stop_requested_ = false;
    drain_thread_ = std::thread(&ServerProcess::drain_diagnostics, this, launch.ready_marker,
                                launch.drain_after_ready);

    RELAY_LOG_INFO("ServerProcess: started " + launch.command + " (pid " +
                   std::to_string(pid) + ")");
    return pid;
}

bool ServerProcess::wait_until_ready(const std::uint32_t timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    ready_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                       [this]() { return ready_ || diagnostics_closed_; });
    return ready_;
}

core::errors::Result<transport::LineTransport*> ServerProcess::transport() {
    if (!transport_) {
        return RelayError{ErrorCategory::Internal, "Tool server is not running.",
                          "server_not_running"};
    }
    return transport_.get();
}

std::vector<std::string> ServerProcess::diagnostics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return diagnostic_lines_;
}

void ServerProcess::drain_diagnostics(const std::string ready_marker,
                                      const bool drain_after_ready) {
    std::string pending;
    char buffer[1024];

    while (!stop_requested_.load()) {
        pollfd fds[1];
        fds[0].fd = stderr_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        const int polled = poll(fds, 1, 100);
        if (polled < 0 && errno != EINTR) {
            break;
        }
        if (polled <= 0) {
            continue;
        }

        const ssize_t n = read(stderr_fd_, buffer, sizeof(buffer));
        if (n == 0) {
            break;
        }
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                continue;
            }
            break;
        }
        pending.append(buffer, static_cast<std::size_t>(n));

        bool stop_after_batch = false;
        std::size_t newline = 0;
        while ((newline = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, newline);
            pending.erase(0, newline + 1);
            RELAY_LOG_DEBUG("[tool-server] " + line);

            std::lock_guard<std::mutex> lock(mutex_);
            if (diagnostic_lines_.size() >= kMaxDiagnosticLines) {
                diagnostic_lines_.erase(diagnostic_lines_.begin());
            }
            diagnostic_lines_.push_back(line);
            if (!ready_ && !ready_marker.empty() && line.find(ready_marker) != std::string::npos) {
                ready_ = true;
                ready_cv_.notify_all();
                stop_after_batch = !drain_after_ready;
            }
        }
        if (stop_after_batch) {
            return;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    diagnostics_closed_ = true;
    ready_cv_.notify_all();
}

void ServerProcess::stop() {
    if (pid_ > 0) {
        // Closing stdin lets a well-behaved server leave its read loop.
        if (stdin_fd_ >= 0) {
            static_cast<void>(close(stdin_fd_));
            stdin_fd_ = -1;
        }
        if (!wait_for_exit(pid_, std::chrono::milliseconds(500))) {
            static_cast<void>(kill(pid_, SIGTERM));
            if (!wait_for_exit(pid_, std::chrono::milliseconds(500))) {
                static_cast<void>(kill(pid_, SIGKILL));
                int status = 0;
                static_cast<void>(waitpid(pid_, &status, 0));
            }
        }
        RELAY_LOG_INFO("ServerProcess: stopped pid " + std::to_string(pid_));
        pid_ = -1;
    }

    stop_requested_ = true;
    if (drain_thread_.joinable()) {
        drain_thread_.join();
    }
    transport_.reset();
    close_fds();
}

void ServerProcess::close_fds() {
    for (int* fd : {&stdin_fd_, &stdout_fd_, &stderr_fd_}) {
        if (*fd >= 0) {
            static_cast<void>(close(*fd));
            *fd = -1;
        }
    }
}

}  // namespace relay::session
