#include "process/child_process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include "core/logging/logger.hpp"

namespace autopilot::process {

using core::errors::AgentError;
using core::errors::ErrorCategory;

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

void close_pair(int (&fds)[2]) {
    close_fd(fds[0]);
    close_fd(fds[1]);
}

void set_cloexec(const int fd) {
    const int flags = fcntl(fd, F_GETFD, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFD, flags | FD_CLOEXEC));
}

std::string join_command(const std::vector<std::string>& argv) {
    std::string joined;
    for (const auto& part : argv) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += part;
    }
    return joined;
}

}  // namespace

core::errors::Result<std::unique_ptr<ChildProcess>> ChildProcess::spawn(
    const std::vector<std::string>& argv, const std::chrono::milliseconds shutdown_grace) {
    if (argv.empty() || argv.front().empty()) {
        return AgentError{ErrorCategory::Input, "Server command cannot be empty.",
                          "empty_server_command"};
    }

    // Writes to a child that already exited must surface as EPIPE, not kill us.
    static_cast<void>(std::signal(SIGPIPE, SIG_IGN));

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    if (pipe(stdin_pipe) != 0 || pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0 ||
        pipe(exec_pipe) != 0) {
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(exec_pipe);
        return AgentError{ErrorCategory::Process, "Failed to create process pipes.",
                          "pipe_creation_failed"};
    }
    set_cloexec(stdin_pipe[1]);
    set_cloexec(stdout_pipe[0]);
    set_cloexec(stderr_pipe[0]);
    set_cloexec(exec_pipe[1]);

    std::vector<char*> exec_argv;
    exec_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        exec_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    exec_argv.push_back(nullptr);

    const pid_t pid = fork();
    if (pid < 0) {
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(exec_pipe);
        return AgentError{ErrorCategory::Process, "Failed to fork process.", "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(dup2(stdin_pipe[0], STDIN_FILENO));
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        static_cast<void>(close(stdin_pipe[0]));
        static_cast<void>(close(stdin_pipe[1]));
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stdout_pipe[1]));
        static_cast<void>(close(stderr_pipe[0]));
        static_cast<void>(close(stderr_pipe[1]));
        static_cast<void>(close(exec_pipe[0]));
        static_cast<void>(std::signal(SIGPIPE, SIG_DFL));
        execvp(exec_argv[0], exec_argv.data());
        const int exec_errno = errno;
        static_cast<void>(write(exec_pipe[1], &exec_errno, sizeof(exec_errno)));
        _exit(127);
    }

    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(exec_pipe[1]);

    // The exec pipe is close-on-exec: EOF means exec succeeded, data is the errno.
    int exec_errno = 0;
    ssize_t n = 0;
    do {
        n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        static_cast<void>(waitpid(pid, &status, 0));
        close_fd(stdin_pipe[1]);
        close_fd(stdout_pipe[0]);
        close_fd(stderr_pipe[0]);
        return AgentError{ErrorCategory::Process,
                          "Could not start MCP server command '" + join_command(argv) +
                              "': " + std::strerror(exec_errno),
                          "process_start_failed",
                          "Check that the server executable is installed and on PATH."};
    }

    LOG_INFO("ChildProcess: started '" + join_command(argv) + "' pid=" + std::to_string(pid));
    return std::make_unique<ChildProcess>(SpawnKey{}, pid, stdin_pipe[1], stdout_pipe[0],
                                          stderr_pipe[0], shutdown_grace);
}

ChildProcess::ChildProcess(SpawnKey, const pid_t pid, const int stdin_fd, const int stdout_fd,
                           const int stderr_fd, const std::chrono::milliseconds shutdown_grace)
    : pid_(pid),
      stdin_fd_(stdin_fd),
      stdout_fd_(stdout_fd),
      stderr_fd_(stderr_fd),
      shutdown_grace_(shutdown_grace) {}

ChildProcess::~ChildProcess() {
    terminate();
    close_output_pipes();
}

bool ChildProcess::reap(const bool block) {
    if (exited_) {
        return true;
    }
    int status = 0;
    pid_t waited = 0;
    do {
        waited = waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (waited < 0 && errno == EINTR);

    if (waited == 0) {
        return false;
    }
    exited_ = true;
    if (waited < 0) {
        exit_code_ = -1;
    } else if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = 128 + WTERMSIG(status);
    }
    return true;
}

void ChildProcess::close_stdin() {
    close_fd(stdin_fd_);
}

void ChildProcess::close_output_pipes() {
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

int ChildProcess::terminate() {
    close_stdin();
    if (reap(false)) {
        return exit_code_;
    }

    LOG_INFO("ChildProcess: sending SIGTERM to pid " + std::to_string(pid_));
    static_cast<void>(kill(pid_, SIGTERM));

    const auto deadline = std::chrono::steady_clock::now() + shutdown_grace_;
    while (std::chrono::steady_clock::now() < deadline) {
        if (reap(false)) {
            return exit_code_;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    LOG_WARN("ChildProcess: pid " + std::to_string(pid_) +
             " ignored SIGTERM, sending SIGKILL");
    static_cast<void>(kill(pid_, SIGKILL));
    static_cast<void>(reap(true));
    return exit_code_;
}

}  // namespace autopilot::process
