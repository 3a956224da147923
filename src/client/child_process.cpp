#include "client/child_process.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include "core/logging/logger.hpp"

namespace regdesk::client {

using core::errors::DeskError;
using core::errors::Done;
using core::errors::ErrorCategory;

namespace {

constexpr std::size_t kMaxDiagnosticBytes = 64 * 1024;
constexpr int kTerminateGraceMs = 500;

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

void drain_pipe(int& fd, bool& is_open, std::string& out) {
    if (!is_open) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            is_open = false;
            close_fd(fd);
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        is_open = false;
        close_fd(fd);
        return;
    }
}

// A write to a child that already exited must surface as EPIPE, not kill
// the caller.
void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, []() { static_cast<void>(signal(SIGPIPE, SIG_IGN)); });
}

int decode_status(const int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

void write_child_error(const std::string& message) {
    static_cast<void>(write(STDERR_FILENO, message.data(), message.size()));
}

}  // namespace

core::errors::Result<std::unique_ptr<ChildProcess>> ChildProcess::spawn(
    const ServerCommand& command) {
    ignore_sigpipe_once();

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe2(stdin_pipe, O_CLOEXEC) != 0 || pipe2(stdout_pipe, O_CLOEXEC) != 0 ||
        pipe2(stderr_pipe, O_CLOEXEC) != 0) {
        for (int* fds : {stdin_pipe, stdout_pipe, stderr_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        return DeskError{ErrorCategory::Internal, "Failed to create process pipes.",
                         "pipe_creation_failed"};
    }

    // argv is assembled before fork so the child only calls async-signal-safe functions.
    std::vector<std::string> owned_args;
    owned_args.push_back(command.executable.string());
    owned_args.insert(owned_args.end(), command.arguments.begin(), command.arguments.end());
    std::vector<char*> argv;
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    const std::string cwd =
        command.working_directory ? command.working_directory->string() : std::string();
    const std::string exec_error = "regdesk: failed to start " + owned_args.front() + "\n";
    const std::string chdir_error = "regdesk: failed to enter " + cwd + "\n";

    const pid_t pid = fork();
    if (pid < 0) {
        for (int* fds : {stdin_pipe, stdout_pipe, stderr_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        return DeskError{ErrorCategory::Internal, "Failed to fork process.", "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(dup2(stdin_pipe[0], STDIN_FILENO));
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            write_child_error(chdir_error);
            _exit(126);
        }
        execvp(argv[0], argv.data());
        write_child_error(exec_error);
        _exit(127);
    }

    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    LOG_DEBUG("ChildProcess: spawned " + owned_args.front() + " as pid " + std::to_string(pid));
    return std::unique_ptr<ChildProcess>(
        new ChildProcess(pid, stdin_pipe[1], stdout_pipe[0], stderr_pipe[0]));
}

ChildProcess::ChildProcess(const pid_t pid, const int stdin_fd, const int stdout_fd,
                           const int stderr_fd)
    : pid_(pid), stdin_fd_(stdin_fd), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd) {}

ChildProcess::~ChildProcess() { static_cast<void>(terminate()); }

core::errors::Result<Done> ChildProcess::write_all(const std::string& data) {
    if (stdin_fd_ < 0) {
        return DeskError{ErrorCategory::ServerUnavailable,
                         "Server input channel is already closed.", "write_failed"};
    }

    std::size_t written = 0;
    while (written < data.size()) {
        const ssize_t n = write(stdin_fd_, data.data() + written, data.size() - written);
        if (n > 0) {
            written += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        const std::string reason = n < 0 ? std::strerror(errno) : "short write";
        return DeskError{ErrorCategory::ServerUnavailable,
                         "Failed to write to server: " + reason, "write_failed"};
    }
    return Done{};
}

void ChildProcess::pump(const int timeout_ms) {
    pollfd fds[2];
    nfds_t nfds = 0;
    if (stdout_open_) {
        fds[nfds].fd = stdout_fd_;
        fds[nfds].events = POLLIN;
        ++nfds;
    }
    if (stderr_open_) {
        fds[nfds].fd = stderr_fd_;
        fds[nfds].events = POLLIN;
        ++nfds;
    }
    if (nfds == 0) {
        return;
    }

    static_cast<void>(poll(fds, nfds, timeout_ms));

    drain_pipe(stdout_fd_, stdout_open_, stdout_buffer_);
    drain_pipe(stderr_fd_, stderr_open_, stderr_buffer_);
    if (stderr_buffer_.size() > kMaxDiagnosticBytes) {
        stderr_buffer_.erase(0, stderr_buffer_.size() - kMaxDiagnosticBytes);
    }
}

ReadOutcome ChildProcess::read_line(const std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        const auto newline = stdout_buffer_.find('\n');
        if (newline != std::string::npos) {
            ReadOutcome outcome{ReadStatus::Line, stdout_buffer_.substr(0, newline)};
            stdout_buffer_.erase(0, newline + 1);
            if (!outcome.line.empty() && outcome.line.back() == '\r') {
                outcome.line.pop_back();
            }
            return outcome;
        }
        if (!stdout_open_) {
            if (!stdout_buffer_.empty()) {
                ReadOutcome outcome{ReadStatus::Line, stdout_buffer_};
                stdout_buffer_.clear();
                return outcome;
            }
            return ReadOutcome{ReadStatus::EndOfStream, ""};
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return ReadOutcome{ReadStatus::TimedOut, ""};
        }
        pump(static_cast<int>(std::min<std::int64_t>(remaining.count(), 50)));
    }
}

std::string ChildProcess::drain_diagnostics(const std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (stderr_open_ && std::chrono::steady_clock::now() < deadline) {
        pump(20);
    }
    return stderr_buffer_;
}

void ChildProcess::close_input() { close_fd(stdin_fd_); }

bool ChildProcess::try_reap() {
    int status = 0;
    const pid_t waited = waitpid(pid_, &status, WNOHANG);
    if (waited == pid_) {
        reaped_ = true;
        exit_code_ = decode_status(status);
    } else if (waited < 0 && errno == ECHILD) {
        reaped_ = true;
    }
    return reaped_;
}

int ChildProcess::terminate() {
    if (reaped_) {
        return exit_code_;
    }

    close_input();
    if (!try_reap()) {
        static_cast<void>(kill(pid_, SIGTERM));
        const auto deadline = std::chrono::steady_clock::now() +
                              std::chrono::milliseconds(kTerminateGraceMs);
        while (!try_reap() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        if (!reaped_) {
            LOG_WARN("ChildProcess: pid " + std::to_string(pid_) +
                     " ignored SIGTERM, sending SIGKILL");
            static_cast<void>(kill(pid_, SIGKILL));
            int status = 0;
            while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
            }
            reaped_ = true;
            exit_code_ = decode_status(status);
        }
    }

    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
    stdout_open_ = false;
    stderr_open_ = false;
    LOG_DEBUG("ChildProcess: pid " + std::to_string(pid_) + " exited with " +
              std::to_string(exit_code_));
    return exit_code_;
}

}  // namespace regdesk::client
