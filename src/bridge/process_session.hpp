#pragma once

#include <sys/types.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "core/errors/server_errors.hpp"

namespace rustmcp::bridge {

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

// One spawned child with its three pipes. Owned by exactly one invocation;
// the destructor kills (if alive) and reaps the child and closes every pipe.
class ProcessSession {
public:
    static core::errors::Result<std::unique_ptr<ProcessSession>> spawn(
        const std::filesystem::path& executable, const std::vector<std::string>& args);

    ~ProcessSession();
    ProcessSession(const ProcessSession&) = delete;
    ProcessSession& operator=(const ProcessSession&) = delete;

    // Writes stdin_payload, closes stdin, then collects stdout/stderr until the
    // child exits or the timeout elapses. On timeout the child is killed.
    ProcessCapture communicate(const std::string& stdin_payload,
                               std::chrono::milliseconds timeout);

    // SIGKILL if still running, reap, close pipes. Safe to call repeatedly.
    void terminate();

    pid_t pid() const { return pid_; }
    bool reaped() const { return reaped_; }

private:
    ProcessSession(pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd);

    bool poll_exit();
    void record_status(int status);

    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    bool reaped_ = false;
    int exit_code_ = -1;
};

}  // namespace rustmcp::bridge
