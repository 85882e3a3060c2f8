#include "session/server.hpp"

#include <algorithm>
#include <chrono>
#include <utility>
#include <unistd.h>
#include "core/logging/logger.hpp"
#include "transport/stream_transport.hpp"

namespace rustmcp::session {

using core::errors::ErrorCategory;
using core::errors::ServerError;

namespace {

constexpr auto kStdioPollInterval = std::chrono::milliseconds(100);

}  // namespace

Server::Server(core::config::ServerConfig config, const dispatch::Dispatcher& dispatcher)
    : config_(std::move(config)), dispatcher_(dispatcher) {}

Server::~Server() {
    stop();
}

core::errors::Status Server::start() {
    if (!config_.enable_stdio && !config_.enable_socket) {
        return ServerError{ErrorCategory::Input, "No transport enabled", "no_transport"};
    }

    if (config_.enable_socket) {
        listener_ = std::make_unique<transport::SocketListener>(config_.host, config_.port);
        auto bound = listener_->listen();
        if (core::errors::is_error(bound)) {
            return bound;
        }
        auto accepting = listener_->start(
            [this](std::unique_ptr<transport::SocketConnection> connection) {
                accept(std::move(connection));
            });
        if (core::errors::is_error(accepting)) {
            return accepting;
        }
    }

    if (config_.enable_stdio) {
        stdio_session_ = std::make_unique<Session>(
            std::make_unique<transport::StreamTransport>(STDIN_FILENO, STDOUT_FILENO), dispatcher_);
        auto started = stdio_session_->start();
        if (core::errors::is_error(started)) {
            return started;
        }
    }

    LOG_INFO(std::string("Server ready (stdio: ") + (config_.enable_stdio ? "on" : "off") +
             ", socket: " + (config_.enable_socket ? "on" : "off") + ")");
    return core::errors::ok();
}

void Server::accept(std::unique_ptr<transport::SocketConnection> connection) {
    auto session = std::make_unique<Session>(std::move(connection), dispatcher_);

    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_ || stop_requested_) {
        return;
    }
    reap_finished_locked();

    auto started = session->start();
    if (core::errors::is_error(started)) {
        LOG_WARN("Failed to start session " + session->name() + ": " +
                 core::errors::get_error(started).message);
        return;
    }
    socket_sessions_.push_back(std::move(session));
}

void Server::reap_finished_locked() {
    auto finished = std::partition(
        socket_sessions_.begin(), socket_sessions_.end(),
        [](const std::unique_ptr<Session>& session) { return !session->finished(); });
    for (auto it = finished; it != socket_sessions_.end(); ++it) {
        (*it)->wait();
        LOG_DEBUG("Reaped session " + (*it)->name() + " after " +
                  std::to_string((*it)->handled()) + " messages");
    }
    socket_sessions_.erase(finished, socket_sessions_.end());
}

void Server::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
        // Without a listener, the end of the stream ends the server.
        if (!config_.enable_socket && stdio_session_ != nullptr && stdio_session_->finished()) {
            break;
        }
        stop_requested_cv_.wait_for(lock, kStdioPollInterval);
    }
}

void Server::request_stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    stop_requested_cv_.notify_all();
}

void Server::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }
        stopped_ = true;
        stop_requested_ = true;
    }
    stop_requested_cv_.notify_all();

    // The accept thread may be waiting on mutex_, so close the listener unlocked.
    if (listener_ != nullptr) {
        listener_->close();
    }

    std::vector<std::unique_ptr<Session>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions.swap(socket_sessions_);
    }
    for (auto& session : sessions) {
        session->stop();
    }
    if (stdio_session_ != nullptr) {
        stdio_session_->stop();
    }
    LOG_INFO("Server stopped");
}

std::uint16_t Server::socket_port() const {
    return listener_ != nullptr ? listener_->bound_port() : 0;
}

std::size_t Server::live_sessions() {
    std::lock_guard<std::mutex> lock(mutex_);
    reap_finished_locked();
    return socket_sessions_.size();
}

}  // namespace rustmcp::session
