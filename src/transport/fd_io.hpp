#pragma once

#include <cstddef>
#include <string>
#include "core/errors/server_errors.hpp"

namespace rustmcp::transport {

void close_fd(int& fd);

// Switches `fd` to O_NONBLOCK. Returns false when fcntl fails.
bool set_nonblocking(int fd);

enum class ReadReady {
    Data,
    Woken,
    Error
};

class WakePipe;

// Writes the whole buffer, retrying on EINTR and short writes.
// Sockets are written with MSG_NOSIGNAL so a vanished peer is an error, not SIGPIPE.
// With `wake`, a write waiting on a full non-blocking fd gives up once the pipe
// is notified and returns "transport_closed".
core::errors::Status write_all(int fd, const char* data, std::size_t size, bool is_socket,
                               const WakePipe* wake = nullptr);

// Self-pipe used to interrupt a reader blocked in poll().
class WakePipe {
public:
    WakePipe();
    ~WakePipe();
    WakePipe(const WakePipe&) = delete;
    WakePipe& operator=(const WakePipe&) = delete;

    bool valid() const { return read_fd_ >= 0 && write_fd_ >= 0; }
    void notify();

    // Blocks until `fd` is readable (or hung up) or notify() was called.
    ReadReady wait_readable(int fd) const;

    // Same for writability.
    ReadReady wait_writable(int fd) const;

private:
    ReadReady wait_for(int fd, short events) const;

    int read_fd_ = -1;
    int write_fd_ = -1;
};

}  // namespace rustmcp::transport
