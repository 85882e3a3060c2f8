#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include "transport/fd_io.hpp"
#include "transport/transport.hpp"

namespace rustmcp::transport {

inline constexpr std::size_t kMaxMessageBytes = 16u * 1024u * 1024u;

// One accepted TCP connection speaking WebSocket: every text or binary message
// carries one JSON value and replies go back on this connection only. All
// socket work runs on a private io thread; send() hands the frame to it and
// waits for the outcome, so close() can abort a write to a stalled peer.
class SocketConnection : public Transport {
public:
    // Takes ownership of `fd`. Messages above `max_message_bytes` are reported
    // as FrameTooLarge and close the connection.
    SocketConnection(int fd, std::string peer, std::size_t max_message_bytes = kMaxMessageBytes);
    ~SocketConnection() override;

    SocketConnection(const SocketConnection&) = delete;
    SocketConnection& operator=(const SocketConnection&) = delete;

    core::errors::Status start(EventChannel& channel) override;
    core::errors::Status send(const nlohmann::json& message) override;
    void close() override;
    std::string describe() const override;

private:
    struct PendingWrite {
        std::string text;
        std::shared_ptr<std::promise<core::errors::Status>> done;
    };

    // Io thread only.
    void on_handshake(EventChannel& channel, boost::beast::error_code ec);
    void read_next(EventChannel& channel);
    void on_read(EventChannel& channel, boost::beast::error_code ec);
    void enqueue(PendingWrite write);
    void write_next();
    void on_write(boost::beast::error_code ec);
    void finish(EventChannel& channel, const std::string& reason);

    std::string peer_;
    std::size_t max_message_bytes_;
    bool assigned_ = false;

    boost::asio::io_context io_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
    boost::beast::flat_buffer read_buffer_;
    std::deque<PendingWrite> writes_;
    bool broken_ = false;

    std::thread io_thread_;
    std::atomic<bool> closing_{false};
    bool started_ = false;
    bool closed_ = false;
    std::mutex close_mutex_;
};

using AcceptHandler = std::function<void(std::unique_ptr<SocketConnection>)>;

// TCP listener. Every accepted connection is handed to the AcceptHandler
// on the accept thread; the WebSocket handshake runs once the connection starts.
class SocketListener {
public:
    SocketListener(std::string host, std::uint16_t port);
    ~SocketListener();

    SocketListener(const SocketListener&) = delete;
    SocketListener& operator=(const SocketListener&) = delete;

    // Binds and listens. Port 0 picks an ephemeral port; see bound_port().
    core::errors::Status listen();
    core::errors::Status start(AcceptHandler on_accept);
    void close();

    std::uint16_t bound_port() const { return bound_port_; }
    const std::string& host() const { return host_; }

private:
    void accept_loop(AcceptHandler on_accept);

    std::string host_;
    std::uint16_t port_;
    std::uint16_t bound_port_ = 0;
    int listen_fd_ = -1;

    WakePipe wake_;
    std::thread acceptor_;
    std::atomic<bool> closing_{false};
    std::mutex close_mutex_;
};

}  // namespace rustmcp::transport
