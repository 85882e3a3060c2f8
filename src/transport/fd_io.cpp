#include "transport/fd_io.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace rustmcp::transport {

using core::errors::ErrorCategory;
using core::errors::ServerError;

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(::close(fd));
        fd = -1;
    }
}

bool set_nonblocking(const int fd) {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return false;
    }
    return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

core::errors::Status write_all(const int fd, const char* data, const std::size_t size,
                               const bool is_socket, const WakePipe* wake) {
    if (fd < 0) {
        return ServerError{ErrorCategory::Transport, "Transport is closed", "transport_closed"};
    }

    std::size_t offset = 0;
    while (offset < size) {
        const ssize_t n = is_socket ? ::send(fd, data + offset, size - offset, MSG_NOSIGNAL)
                                    : ::write(fd, data + offset, size - offset);
        if (n > 0) {
            offset += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            if (wake == nullptr) {
                pollfd pfd{fd, POLLOUT, 0};
                static_cast<void>(::poll(&pfd, 1, -1));
                continue;
            }
            const ReadReady ready = wake->wait_writable(fd);
            if (ready == ReadReady::Woken) {
                return ServerError{ErrorCategory::Transport,
                                   "Transport closed during write", "transport_closed"};
            }
            if (ready == ReadReady::Error) {
                return ServerError{ErrorCategory::Transport, "Output is not pollable",
                                   "write_failed"};
            }
            continue;
        }
        return ServerError{ErrorCategory::Transport,
                           std::string("Write failed: ") + std::strerror(errno),
                           "write_failed"};
    }
    return core::errors::ok();
}

WakePipe::WakePipe() {
    int fds[2] = {-1, -1};
    if (::pipe2(fds, O_CLOEXEC | O_NONBLOCK) == 0) {
        read_fd_ = fds[0];
        write_fd_ = fds[1];
    }
}

WakePipe::~WakePipe() {
    close_fd(read_fd_);
    close_fd(write_fd_);
}

void WakePipe::notify() {
    if (write_fd_ < 0) {
        return;
    }
    const char byte = 'x';
    ssize_t n = 0;
    do {
        n = ::write(write_fd_, &byte, 1);
    } while (n < 0 && errno == EINTR);
}

// The wake byte is never drained, so every later wait also reports Woken.
ReadReady WakePipe::wait_readable(const int fd) const {
    return wait_for(fd, POLLIN);
}

ReadReady WakePipe::wait_writable(const int fd) const {
    return wait_for(fd, POLLOUT);
}

ReadReady WakePipe::wait_for(const int fd, const short events) const {
    pollfd fds[2] = {{fd, events, 0}, {read_fd_, POLLIN, 0}};
    const nfds_t nfds = read_fd_ >= 0 ? 2 : 1;
    while (true) {
        const int rc = ::poll(fds, nfds, -1);
        if (rc < 0 && errno == EINTR) {
            continue;
        }
        if (rc < 0) {
            return ReadReady::Error;
        }
        if (nfds == 2 && (fds[1].revents & POLLIN) != 0) {
            return ReadReady::Woken;
        }
        if ((fds[0].revents & POLLNVAL) != 0) {
            return ReadReady::Error;
        }
        if ((fds[0].revents & (events | POLLHUP | POLLERR)) != 0) {
            return ReadReady::Data;
        }
    }
}

}  // namespace rustmcp::transport
