#include "bridge/process_session.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace rustmcp::bridge {

using core::errors::ErrorCategory;
using core::errors::ServerError;

namespace {

constexpr int kPollTickMs = 50;

void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, []() { static_cast<void>(std::signal(SIGPIPE, SIG_IGN)); });
}

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

void close_pair(int fds[2]) {
    close_fd(fds[0]);
    close_fd(fds[1]);
}

void drain_pipe(int& fd, std::string& out) {
    if (fd < 0) {
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
            close_fd(fd);
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        close_fd(fd);
        return;
    }
}

// Pushes as much of the payload as the pipe accepts. Closes stdin when the
// payload is complete or the child stopped reading (EPIPE).
void feed_stdin(int& fd, const std::string& payload, std::size_t& offset) {
    while (fd >= 0 && offset < payload.size()) {
        const ssize_t n = write(fd, payload.data() + offset, payload.size() - offset);
        if (n > 0) {
            offset += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        close_fd(fd);
        return;
    }
    close_fd(fd);
}

}  // namespace

core::errors::Result<std::unique_ptr<ProcessSession>> ProcessSession::spawn(
    const std::filesystem::path& executable, const std::vector<std::string>& args) {
    ignore_sigpipe_once();

    // CLOEXEC keeps these pipes out of children spawned concurrently by other invocations.
    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    if (pipe2(stdin_pipe, O_CLOEXEC) != 0 || pipe2(stdout_pipe, O_CLOEXEC) != 0 ||
        pipe2(stderr_pipe, O_CLOEXEC) != 0 || pipe2(exec_pipe, O_CLOEXEC) != 0) {
        const std::string reason = std::strerror(errno);
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(exec_pipe);
        return ServerError{ErrorCategory::Internal,
                           "Failed to create process pipes: " + reason,
                           "pipe_creation_failed"};
    }

    // argv must be fully built before fork; the child only calls async-signal-safe functions.
    const std::string program = executable.string();
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(program.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    const pid_t pid = fork();
    if (pid < 0) {
        const std::string reason = std::strerror(errno);
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(exec_pipe);
        return ServerError{ErrorCategory::Internal, "Failed to fork process: " + reason,
                           "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(dup2(stdin_pipe[0], STDIN_FILENO));
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        std::signal(SIGPIPE, SIG_DFL);
        // The server blocks its shutdown signals; the analyzer must not inherit that mask.
        sigset_t unblocked;
        sigemptyset(&unblocked);
        static_cast<void>(sigprocmask(SIG_SETMASK, &unblocked, nullptr));
        execv(program.c_str(), argv.data());
        const int exec_errno = errno;
        static_cast<void>(write(exec_pipe[1], &exec_errno, sizeof(exec_errno)));
        _exit(127);
    }

    static_cast<void>(close(stdin_pipe[0]));
    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    static_cast<void>(close(exec_pipe[1]));

    // The exec pipe closes on a successful exec; otherwise it carries the child's errno.
    int exec_errno = 0;
    ssize_t n = 0;
    do {
        n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    static_cast<void>(close(exec_pipe[0]));

    std::unique_ptr<ProcessSession> session(
        new ProcessSession(pid, stdin_pipe[1], stdout_pipe[0], stderr_pipe[0]));
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        session->terminate();
        return ServerError{ErrorCategory::Execution,
                           "Failed to execute " + program + ": " + std::strerror(exec_errno),
                           "exec_failed"};
    }

    set_nonblocking(session->stdin_fd_);
    set_nonblocking(session->stdout_fd_);
    set_nonblocking(session->stderr_fd_);
    return session;
}

ProcessSession::ProcessSession(const pid_t pid, const int stdin_fd, const int stdout_fd,
                               const int stderr_fd)
    : pid_(pid), stdin_fd_(stdin_fd), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd) {}

ProcessSession::~ProcessSession() {
    terminate();
}

void ProcessSession::record_status(const int status) {
    reaped_ = true;
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = 128 + WTERMSIG(status);
    } else {
        exit_code_ = -1;
    }
}

bool ProcessSession::poll_exit() {
    if (reaped_) {
        return true;
    }
    int status = 0;
    const pid_t waited = waitpid(pid_, &status, WNOHANG);
    if (waited == pid_) {
        record_status(status);
        return true;
    }
    if (waited < 0 && errno == ECHILD) {
        reaped_ = true;
        return true;
    }
    return false;
}

ProcessCapture ProcessSession::communicate(const std::string& stdin_payload,
                                           const std::chrono::milliseconds timeout) {
    ProcessCapture capture;
    const auto started = std::chrono::steady_clock::now();
    const auto deadline = started + timeout;
    std::size_t written = 0;

    feed_stdin(stdin_fd_, stdin_payload, written);

    while (true) {
        const bool exited = poll_exit();
        if (exited && stdout_fd_ < 0 && stderr_fd_ < 0) {
            break;
        }

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            // A reaped child whose pipes are still held open by a descendant is not a timeout.
            capture.timed_out = !exited;
            break;
        }

        pollfd fds[3];
        nfds_t nfds = 0;
        if (stdout_fd_ >= 0) {
            fds[nfds++] = pollfd{stdout_fd_, POLLIN, 0};
        }
        if (stderr_fd_ >= 0) {
            fds[nfds++] = pollfd{stderr_fd_, POLLIN, 0};
        }
        if (stdin_fd_ >= 0) {
            fds[nfds++] = pollfd{stdin_fd_, POLLOUT, 0};
        }

        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        const int wait_ms = static_cast<int>(std::min<long long>(kPollTickMs, remaining + 1));
        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, wait_ms));
        } else {
            static_cast<void>(poll(nullptr, 0, wait_ms));
        }

        feed_stdin(stdin_fd_, stdin_payload, written);
        drain_pipe(stdout_fd_, capture.stdout_text);
        drain_pipe(stderr_fd_, capture.stderr_text);
    }

    if (capture.timed_out) {
        terminate();
    } else {
        // Pick up anything written between the last poll and exit.
        drain_pipe(stdout_fd_, capture.stdout_text);
        drain_pipe(stderr_fd_, capture.stderr_text);
    }

    capture.exit_code = exit_code_;
    capture.duration_ms = std::chrono::duration<double, std::milli>(
                              std::chrono::steady_clock::now() - started)
                              .count();
    return capture;
}

void ProcessSession::terminate() {
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);

    if (pid_ <= 0 || reaped_) {
        return;
    }

    static_cast<void>(kill(pid_, SIGKILL));
    int status = 0;
    pid_t waited = 0;
    do {
        waited = waitpid(pid_, &status, 0);
    } while (waited < 0 && errno == EINTR);

    if (waited == pid_) {
        record_status(status);
    } else {
        reaped_ = true;
    }
}

}  // namespace rustmcp::bridge
