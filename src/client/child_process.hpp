#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>
#include "core/errors/desk_errors.hpp"

namespace regdesk::client {

// How to launch the tool server.
struct ServerCommand {
    std::filesystem::path executable;
    std::vector<std::string> arguments;
    std::optional<std::filesystem::path> working_directory;
};

enum class ReadStatus {
    Line,
    EndOfStream,
    TimedOut
};

struct ReadOutcome {
    ReadStatus status = ReadStatus::EndOfStream;
    std::string line;  // without the trailing newline
};

// A child process with its stdin, stdout and stderr attached to pipes.
// The destructor always terminates and reaps the child.
class ChildProcess {
public:
    static core::errors::Result<std::unique_ptr<ChildProcess>> spawn(
        const ServerCommand& command);

    ~ChildProcess();
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    // Writes the whole buffer; a closed pipe is reported as ServerUnavailable.
    core::errors::Result<core::errors::Done> write_all(const std::string& data);

    // Blocks until one full line, EOF, or the timeout. stderr is drained
    // while waiting so the child never stalls on a full diagnostic pipe.
    ReadOutcome read_line(std::chrono::milliseconds timeout);

    // Collects whatever the child still writes to stderr until it closes
    // the pipe or the timeout expires.
    std::string drain_diagnostics(std::chrono::milliseconds timeout);

    void close_input();

    // Closes stdin, sends SIGTERM, escalates to SIGKILL after a grace
    // period and reaps the child. Idempotent; returns the exit code.
    int terminate();

    pid_t pid() const { return pid_; }
    bool reaped() const { return reaped_; }
    const std::string& diagnostics() const { return stderr_buffer_; }

private:
    ChildProcess(pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd);

    void pump(int timeout_ms);
    bool try_reap();

    pid_t pid_;
    int stdin_fd_;
    int stdout_fd_;
    int stderr_fd_;
    bool stdout_open_ = true;
    bool stderr_open_ = true;
    bool reaped_ = false;
    int exit_code_ = -1;
    std::string stdout_buffer_;
    std::string stderr_buffer_;
};

}  // namespace regdesk::client
