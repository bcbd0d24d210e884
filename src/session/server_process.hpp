#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <thread>
#include <vector>
#include "core/errors/relay_errors.hpp"
#include "transport/fd_transport.hpp"

namespace relay::session {

struct ServerLaunch {
    std::string command;
    std::vector<std::string> args;
    std::string ready_marker;
    std::uint32_t read_timeout_ms = 0;
    // Keep reading the diagnostic channel after the marker so a chatty
    // server can never block on a full stderr pipe.
    bool drain_after_ready = true;
};

// Owns the tool-server child process, its three pipes and the thread that
// drains its stderr.
class ServerProcess {
public:
    ServerProcess() = default;
    ~ServerProcess();

    ServerProcess(const ServerProcess&) = delete;
    ServerProcess& operator=(const ServerProcess&) = delete;

    core::errors::Result<pid_t> start(const ServerLaunch& launch);

    // True once the ready marker was seen on the diagnostic channel. False on
    // timeout or when the channel closed first.
    bool wait_until_ready(std::uint32_t timeout_ms);

    // The child's stdin/stdout as a line channel. Only available between a
    // successful start() and stop().
    core::errors::Result<transport::LineTransport*> transport();

    void stop();

    bool is_running() const { return pid_ > 0; }
    pid_t pid() const { return pid_; }

    // Diagnostic lines seen so far.
    std::vector<std::string> diagnostics() const;

private:
    void drain_diagnostics(std::string ready_marker, bool drain_after_ready);
    void close_fds();

    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    std::unique_ptr<transport::FdTransport> transport_;

    std::thread drain_thread_;
    std::atomic_bool stop_requested_{false};
    mutable std::mutex mutex_;
    std::condition_variable ready_cv_;
    bool ready_ = false;
    bool diagnostics_closed_ = false;
    std::vector<std::string> diagnostic_lines_;
};

}  // namespace relay::session
