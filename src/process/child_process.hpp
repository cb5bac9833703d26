#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <sys/types.h>
#include <vector>
#include "core/errors/agent_errors.hpp"

namespace autopilot::process {

// A spawned child with its three standard streams connected to pipes.
// Destruction always terminates the child (SIGTERM, bounded grace, SIGKILL).
class ChildProcess {
public:
    static core::errors::Result<std::unique_ptr<ChildProcess>> spawn(
        const std::vector<std::string>& argv,
        std::chrono::milliseconds shutdown_grace = std::chrono::milliseconds(5000));

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    int stdin_fd() const { return stdin_fd_; }
    int stdout_fd() const { return stdout_fd_; }
    int stderr_fd() const { return stderr_fd_; }

    // Closes our end of the child's stdin. Safe to call more than once.
    void close_stdin();

    // SIGTERM, wait up to the grace period, then SIGKILL. Returns the exit code
    // (128 + signal for signalled children). Idempotent.
    int terminate();

    void close_output_pipes();

private:
    // Only spawn() can name this, so only spawn() can construct.
    struct SpawnKey {
        explicit SpawnKey() = default;
    };

public:
    ChildProcess(SpawnKey, pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd,
                 std::chrono::milliseconds shutdown_grace);

private:

    bool reap(bool block);

    pid_t pid_;
    int stdin_fd_;
    int stdout_fd_;
    int stderr_fd_;
    std::chrono::milliseconds shutdown_grace_;
    bool exited_ = false;
    int exit_code_ = -1;
};

}  // namespace autopilot::process
