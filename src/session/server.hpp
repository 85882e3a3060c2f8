#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>
#include "core/config/server_config.hpp"
#include "dispatch/dispatcher.hpp"
#include "session/session.hpp"
#include "transport/socket_transport.hpp"

namespace rustmcp::session {

// Owns the socket listener and every live session.
class Server {
public:
    Server(core::config::ServerConfig config, const dispatch::Dispatcher& dispatcher);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Starts the enabled transports. Fails if none could be started.
    core::errors::Status start();

    // Blocks until stop() is requested or, in stdio-only mode, the stream ends.
    void wait();

    // Safe to call from any thread, including repeatedly.
    void request_stop();

    // Closes the listener and every session.
    void stop();

    std::uint16_t socket_port() const;
    std::size_t live_sessions();

private:
    void accept(std::unique_ptr<transport::SocketConnection> connection);
    void reap_finished_locked();

    core::config::ServerConfig config_;
    const dispatch::Dispatcher& dispatcher_;

    std::unique_ptr<transport::SocketListener> listener_;
    std::unique_ptr<Session> stdio_session_;

    std::mutex mutex_;
    std::condition_variable stop_requested_cv_;
    bool stop_requested_ = false;
    bool stopped_ = false;
    std::vector<std::unique_ptr<Session>> socket_sessions_;
};

}  // namespace rustmcp::session
