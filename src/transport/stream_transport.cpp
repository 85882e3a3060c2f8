#include "transport/stream_transport.hpp"

#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"

namespace rustmcp::transport {

using core::errors::ErrorCategory;
using core::errors::ServerError;
using protocol::ClosedEvent;
using protocol::ErrorEvent;
using protocol::MessageEvent;
using protocol::TransportErrorKind;

namespace {

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

}  // namespace

StreamTransport::StreamTransport(const int input_fd, const int output_fd, const bool owns_fds,
                                 const std::size_t max_line_bytes)
    : input_fd_(input_fd),
      output_fd_(output_fd),
      owns_fds_(owns_fds),
      max_line_bytes_(max_line_bytes),
      label_("stream(fd " + std::to_string(input_fd) + "->" + std::to_string(output_fd) + ")") {
    if (!set_nonblocking(output_fd_)) {
        LOG_WARN("Cannot make " + label_ +
                 " output non-blocking; close() may wait on a stalled reader");
    }
}

StreamTransport::~StreamTransport() {
    close();
}

core::errors::Status StreamTransport::start(EventChannel& channel) {
    std::lock_guard<std::mutex> lock(close_mutex_);
    if (closed_ || reader_.joinable()) {
        return ServerError{ErrorCategory::Transport, "Stream transport already started or closed",
                           "invalid_state"};
    }
    if (!wake_.valid()) {
        return ServerError{ErrorCategory::Internal, "Failed to create wake pipe",
                           "pipe_creation_failed"};
    }
    reader_ = std::thread([this, &channel]() { read_loop(channel); });
    return core::errors::ok();
}

void StreamTransport::report_oversized(EventChannel& channel, const std::size_t size) const {
    channel.push(ErrorEvent{TransportErrorKind::FrameTooLarge,
                            "line of at least " + std::to_string(size) + " bytes exceeds the " +
                                std::to_string(max_line_bytes_) + " byte limit"});
}

void StreamTransport::publish_lines(EventChannel& channel, std::string& buffer,
                                    const bool flush) {
    std::size_t start = 0;
    std::size_t newline = buffer.find('\n');
    while (newline != std::string::npos) {
        if (discarding_) {
            // Tail of a line that was already reported.
            discarding_ = false;
        } else {
            std::string line = buffer.substr(start, newline - start);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.size() > max_line_bytes_) {
                report_oversized(channel, line.size());
            } else if (!is_blank(line)) {
                channel.push(MessageEvent{std::move(line)});
            }
        }
        start = newline + 1;
        newline = buffer.find('\n', start);
    }
    buffer.erase(0, start);

    if (discarding_) {
        buffer.clear();
        return;
    }
    if (buffer.size() > max_line_bytes_) {
        report_oversized(channel, buffer.size());
        discarding_ = true;
        buffer.clear();
        return;
    }

    // An unterminated last line still counts at end of input.
    if (flush && !is_blank(buffer)) {
        channel.push(MessageEvent{buffer});
        buffer.clear();
    }
}

void StreamTransport::read_loop(EventChannel& channel) {
    std::string buffer;
    char chunk[4096];
    std::string reason = "end of input";

    while (true) {
        const ReadReady ready = wake_.wait_readable(input_fd_);
        if (ready == ReadReady::Woken || closing_.load()) {
            reason = "closed";
            break;
        }
        if (ready == ReadReady::Error) {
            channel.push(ErrorEvent{TransportErrorKind::Io, "input descriptor is not pollable"});
            reason = "input error";
            break;
        }

        const ssize_t n = ::read(input_fd_, chunk, sizeof(chunk));
        if (n > 0) {
            buffer.append(chunk, static_cast<std::size_t>(n));
            publish_lines(channel, buffer, false);
            continue;
        }
        if (n == 0) {
            publish_lines(channel, buffer, true);
            break;
        }
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
            continue;
        }
        channel.push(ErrorEvent{TransportErrorKind::Io,
                                std::string("read failed: ") + std::strerror(errno)});
        reason = "input error";
        break;
    }

    channel.push(ClosedEvent{reason});
}

core::errors::Status StreamTransport::send(const nlohmann::json& message) {
    std::string frame = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    frame.push_back('\n');

    std::lock_guard<std::mutex> lock(send_mutex_);
    return write_all(output_fd_, frame.data(), frame.size(), false, &wake_);
}

void StreamTransport::close() {
    std::lock_guard<std::mutex> lock(close_mutex_);
    if (closed_) {
        return;
    }
    closed_ = true;
    closing_.store(true);
    wake_.notify();

    if (reader_.joinable()) {
        if (reader_.get_id() == std::this_thread::get_id()) {
            reader_.detach();
        } else {
            reader_.join();
        }
    }

    std::lock_guard<std::mutex> send_lock(send_mutex_);
    if (owns_fds_) {
        close_fd(input_fd_);
        close_fd(output_fd_);
    } else {
        output_fd_ = -1;
    }
    LOG_DEBUG("Stream transport closed");
}

std::string StreamTransport::describe() const {
    return label_;
}

}  // namespace rustmcp::transport
