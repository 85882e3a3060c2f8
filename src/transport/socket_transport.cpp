#include "transport/socket_transport.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <exception>
#include <utility>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/http.hpp>
#include "core/logging/logger.hpp"

namespace rustmcp::transport {

using core::errors::ErrorCategory;
using core::errors::ServerError;
using protocol::ClosedEvent;
using protocol::ErrorEvent;
using protocol::MessageEvent;
using protocol::TransportErrorKind;

namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;

namespace {

constexpr int kListenBacklog = 64;

tcp protocol_of(const int fd) {
    sockaddr_storage address{};
    socklen_t length = sizeof(address);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&address), &length) == 0 &&
        address.ss_family == AF_INET6) {
        return tcp::v6();
    }
    return tcp::v4();
}

std::string describe_peer(const sockaddr_storage& address) {
    char host[NI_MAXHOST] = {0};
    char service[NI_MAXSERV] = {0};
    if (getnameinfo(reinterpret_cast<const sockaddr*>(&address), sizeof(address), host,
                    sizeof(host), service, sizeof(service),
                    NI_NUMERICHOST | NI_NUMERICSERV) != 0) {
        return "unknown";
    }
    return std::string(host) + ":" + service;
}

std::uint16_t local_port(const int fd) {
    sockaddr_storage address{};
    socklen_t length = sizeof(address);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&address), &length) != 0) {
        return 0;
    }
    if (address.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<const sockaddr_in6*>(&address)->sin6_port);
    }
    return ntohs(reinterpret_cast<const sockaddr_in*>(&address)->sin_port);
}

}  // namespace

// ---------------------------------------------------------------------------
// SocketConnection

SocketConnection::SocketConnection(const int fd, std::string peer,
                                   const std::size_t max_message_bytes)
    : peer_(std::move(peer)),
      max_message_bytes_(max_message_bytes),
      work_(boost::asio::make_work_guard(io_)),
      ws_(io_) {
    boost::beast::error_code ec;
    boost::beast::get_lowest_layer(ws_).socket().assign(protocol_of(fd), fd, ec);
    if (ec) {
        LOG_WARN("Cannot adopt connection " + peer_ + ": " + ec.message());
        int owned = fd;
        close_fd(owned);
        return;
    }
    assigned_ = true;

    ws_.read_message_max(max_message_bytes_);
    ws_.set_option(websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
    ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& response) {
        response.set(boost::beast::http::field::server, "rustmcp");
    }));
}

SocketConnection::~SocketConnection() {
    close();
}

core::errors::Status SocketConnection::start(EventChannel& channel) {
    std::lock_guard<std::mutex> lock(close_mutex_);
    if (closed_ || started_) {
        return ServerError{ErrorCategory::Transport, "Connection already started or closed",
                           "invalid_state"};
    }
    if (!assigned_) {
        return ServerError{ErrorCategory::Transport, "Connection " + peer_ + " has no socket",
                           "invalid_state"};
    }

    ws_.async_accept([this, &channel](boost::beast::error_code ec) { on_handshake(channel, ec); });
    io_thread_ = std::thread([this]() {
        try {
            io_.run();
        } catch (const std::exception& e) {
            LOG_ERROR("Connection " + peer_ + " io loop failed: " + e.what());
        }
    });
    started_ = true;
    return core::errors::ok();
}

void SocketConnection::on_handshake(EventChannel& channel, const boost::beast::error_code ec) {
    if (ec) {
        if (!closing_.load()) {
            channel.push(ErrorEvent{TransportErrorKind::Io,
                                    "websocket handshake failed: " + ec.message()});
        }
        finish(channel, closing_.load() ? "closed" : "handshake failed");
        return;
    }
    LOG_DEBUG("WebSocket handshake completed with " + peer_);
    read_next(channel);
}

void SocketConnection::read_next(EventChannel& channel) {
    ws_.async_read(read_buffer_, [this, &channel](boost::beast::error_code ec, std::size_t) {
        on_read(channel, ec);
    });
}

void SocketConnection::on_read(EventChannel& channel, const boost::beast::error_code ec) {
    if (!ec) {
        channel.push(MessageEvent{boost::beast::buffers_to_string(read_buffer_.data())});
        read_buffer_.consume(read_buffer_.size());
        read_next(channel);
        return;
    }

    if (closing_.load()) {
        finish(channel, "closed");
    } else if (ec == websocket::error::closed || ec == boost::asio::error::eof ||
               ec == boost::asio::error::connection_reset) {
        finish(channel, "peer closed");
    } else if (ec == websocket::error::message_too_big) {
        channel.push(ErrorEvent{TransportErrorKind::FrameTooLarge,
                                "message exceeds the " + std::to_string(max_message_bytes_) +
                                    " byte limit"});
        finish(channel, "frame too large");
    } else {
        channel.push(ErrorEvent{TransportErrorKind::Io, "read failed: " + ec.message()});
        finish(channel, "socket error");
    }
}

// Aborts queued writes and lets the peer see the connection go away.
void SocketConnection::finish(EventChannel& channel, const std::string& reason) {
    broken_ = true;
    boost::beast::error_code ignored;
    boost::beast::get_lowest_layer(ws_).socket().shutdown(tcp::socket::shutdown_both, ignored);
    channel.push(ClosedEvent{reason});
}

core::errors::Status SocketConnection::send(const nlohmann::json& message) {
    PendingWrite write{message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                       std::make_shared<std::promise<core::errors::Status>>()};
    std::future<core::errors::Status> result = write.done->get_future();
    {
        std::lock_guard<std::mutex> lock(close_mutex_);
        if (closed_ || !started_) {
            return ServerError{ErrorCategory::Transport, "Transport is closed",
                               "transport_closed"};
        }
        // Posted while the work guard is held, so the io thread runs it before exiting.
        boost::asio::post(io_, [this, write = std::move(write)]() mutable {
            enqueue(std::move(write));
        });
    }
    return result.get();
}

void SocketConnection::enqueue(PendingWrite write) {
    if (broken_) {
        write.done->set_value(ServerError{ErrorCategory::Transport,
                                          "Connection " + peer_ + " is closed",
                                          "transport_closed"});
        return;
    }
    writes_.push_back(std::move(write));
    if (writes_.size() == 1) {
        write_next();
    }
}

void SocketConnection::write_next() {
    ws_.text(true);
    ws_.async_write(boost::asio::buffer(writes_.front().text),
                    [this](boost::beast::error_code ec, std::size_t) { on_write(ec); });
}

void SocketConnection::on_write(const boost::beast::error_code ec) {
    if (!ec) {
        writes_.front().done->set_value(core::errors::ok());
        writes_.pop_front();
        if (!writes_.empty()) {
            write_next();
        }
        return;
    }

    broken_ = true;
    const std::string code = closing_.load() ? "transport_closed" : "write_failed";
    for (auto& pending : writes_) {
        pending.done->set_value(
            ServerError{ErrorCategory::Transport, "Write failed: " + ec.message(), code});
    }
    writes_.clear();
}

void SocketConnection::close() {
    std::lock_guard<std::mutex> lock(close_mutex_);
    if (closed_) {
        return;
    }
    closed_ = true;
    closing_.store(true);

    // Closing the socket on its own thread aborts any pending read, write or handshake.
    boost::asio::post(io_, [this]() {
        boost::beast::error_code ignored;
        boost::beast::get_lowest_layer(ws_).socket().close(ignored);
    });
    work_.reset();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }

    boost::beast::error_code ignored;
    boost::beast::get_lowest_layer(ws_).socket().close(ignored);
    LOG_DEBUG("Connection " + peer_ + " closed");
}

std::string SocketConnection::describe() const {
    return "socket(" + peer_ + ")";
}

// ---------------------------------------------------------------------------
// SocketListener

SocketListener::SocketListener(std::string host, const std::uint16_t port)
    : host_(std::move(host)), port_(port) {}

SocketListener::~SocketListener() {
    close();
}

core::errors::Status SocketListener::listen() {
    if (listen_fd_ >= 0) {
        return core::errors::ok();
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE | AI_NUMERICSERV;

    addrinfo* results = nullptr;
    const std::string service = std::to_string(port_);
    const int rc = getaddrinfo(host_.c_str(), service.c_str(), &hints, &results);
    if (rc != 0) {
        return ServerError{ErrorCategory::Transport,
                           "Cannot resolve " + host_ + ": " + gai_strerror(rc),
                           "resolve_failed"};
    }

    std::string last_error = "no usable address";
    for (addrinfo* candidate = results; candidate != nullptr; candidate = candidate->ai_next) {
        int fd = ::socket(candidate->ai_family, candidate->ai_socktype | SOCK_CLOEXEC,
                          candidate->ai_protocol);
        if (fd < 0) {
            last_error = std::strerror(errno);
            continue;
        }
        const int reuse = 1;
        static_cast<void>(::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)));
        if (::bind(fd, candidate->ai_addr, candidate->ai_addrlen) != 0 ||
            ::listen(fd, kListenBacklog) != 0) {
            last_error = std::strerror(errno);
            close_fd(fd);
            continue;
        }
        listen_fd_ = fd;
        break;
    }
    freeaddrinfo(results);

    if (listen_fd_ < 0) {
        return ServerError{ErrorCategory::Transport,
                           "Cannot listen on " + host_ + ":" + service + ": " + last_error,
                           "listen_failed",
                           "Another process may already use this port; try --port"};
    }

    bound_port_ = local_port(listen_fd_);
    LOG_INFO("Listening on " + host_ + ":" + std::to_string(bound_port_));
    return core::errors::ok();
}

core::errors::Status SocketListener::start(AcceptHandler on_accept) {
    std::lock_guard<std::mutex> lock(close_mutex_);
    if (listen_fd_ < 0) {
        return ServerError{ErrorCategory::Transport, "Listener is not bound", "invalid_state"};
    }
    if (acceptor_.joinable()) {
        return ServerError{ErrorCategory::Transport, "Listener already started", "invalid_state"};
    }
    if (!wake_.valid()) {
        return ServerError{ErrorCategory::Internal, "Failed to create wake pipe",
                           "pipe_creation_failed"};
    }
    acceptor_ = std::thread([this, handler = std::move(on_accept)]() { accept_loop(handler); });
    return core::errors::ok();
}

void SocketListener::accept_loop(AcceptHandler on_accept) {
    while (!closing_.load()) {
        const ReadReady ready = wake_.wait_readable(listen_fd_);
        if (ready != ReadReady::Data || closing_.load()) {
            break;
        }

        sockaddr_storage address{};
        socklen_t length = sizeof(address);
        const int fd = ::accept4(listen_fd_, reinterpret_cast<sockaddr*>(&address), &length,
                                 SOCK_CLOEXEC);
        if (fd < 0) {
            if (errno != EINTR && errno != EAGAIN && errno != ECONNABORTED) {
                LOG_WARN(std::string("accept failed: ") + std::strerror(errno));
            }
            continue;
        }

        const std::string peer = describe_peer(address);
        LOG_INFO("Accepted connection from " + peer);
        on_accept(std::make_unique<SocketConnection>(fd, peer));
    }
}

void SocketListener::close() {
    std::lock_guard<std::mutex> lock(close_mutex_);
    if (closing_.exchange(true)) {
        return;
    }
    wake_.notify();
    if (acceptor_.joinable()) {
        acceptor_.join();
    }
    close_fd(listen_fd_);
}

}  // namespace rustmcp::transport
