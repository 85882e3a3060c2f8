#pragma once

#include <atomic>
#include <cstddef>
#include <mutex>
#include <string>
#include <thread>
#include "transport/fd_io.hpp"
#include "transport/transport.hpp"

namespace rustmcp::transport {

inline constexpr std::size_t kMaxLineBytes = 16u * 1024u * 1024u;

// Newline-delimited JSON over a pair of file descriptors (stdin/stdout in
// production, pipes in tests). Blank lines are skipped; a trailing '\r' is dropped.
// A line longer than `max_line_bytes` is reported as FrameTooLarge and dropped up
// to its newline; the stream stays open.
class StreamTransport : public Transport {
public:
    // With `owns_fds` the descriptors are closed by close(). The output fd is
    // switched to non-blocking so close() can interrupt a stalled write.
    StreamTransport(int input_fd, int output_fd, bool owns_fds = false,
                    std::size_t max_line_bytes = kMaxLineBytes);
    ~StreamTransport() override;

    StreamTransport(const StreamTransport&) = delete;
    StreamTransport& operator=(const StreamTransport&) = delete;

    core::errors::Status start(EventChannel& channel) override;
    core::errors::Status send(const nlohmann::json& message) override;
    void close() override;
    std::string describe() const override;

private:
    void read_loop(EventChannel& channel);
    void publish_lines(EventChannel& channel, std::string& buffer, bool flush);
    void report_oversized(EventChannel& channel, std::size_t size) const;

    int input_fd_;
    int output_fd_;
    bool owns_fds_;
    std::size_t max_line_bytes_;
    std::string label_;

    // Reader thread only: set while skipping the rest of an oversized line.
    bool discarding_ = false;

    WakePipe wake_;
    std::thread reader_;
    std::atomic<bool> closing_{false};
    bool closed_ = false;

    std::mutex send_mutex_;
    std::mutex close_mutex_;
};

}  // namespace rustmcp::transport
