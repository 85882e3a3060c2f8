#pragma once

#include <atomic>
#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "dispatch/dispatcher.hpp"
#include "transport/event_channel.hpp"
#include "transport/transport.hpp"

namespace rustmcp::session {

inline constexpr std::size_t kDefaultMaxWorkers = 64;

// Wires one transport to the dispatcher. A dedicated thread consumes the
// transport's events; every message is handled on its own worker so slow
// tool calls never hold up the rest of the connection. With `max_workers`
// messages already in flight, or when no thread can be created, a message is
// answered at once with an internal error instead.
class Session {
public:
    Session(std::unique_ptr<transport::Transport> transport,
            const dispatch::Dispatcher& dispatcher,
            std::size_t max_workers = kDefaultMaxWorkers);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    core::errors::Status start();

    // Closes the transport, then waits for the event loop and all workers.
    void stop();

    // Blocks until the transport closed and every worker finished.
    void wait();

    bool finished() const { return finished_.load(); }
    std::size_t handled() const { return handled_.load(); }
    std::size_t rejected() const { return rejected_.load(); }
    const std::string& name() const { return name_; }

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void run();
    void spawn_worker(std::string raw);
    void handle_message(const std::string& raw);
    void send_reply(const dispatch::DispatchReply& reply);
    void reject(const std::string& raw, const std::string& reason);
    void reap_workers(bool all);

    std::unique_ptr<transport::Transport> transport_;
    const dispatch::Dispatcher& dispatcher_;
    std::size_t max_workers_;
    std::string name_;

    transport::EventChannel channel_;
    std::thread loop_;
    std::mutex loop_mutex_;

    std::mutex workers_mutex_;
    std::list<Worker> workers_;

    std::atomic<bool> finished_{false};
    std::atomic<std::size_t> handled_{0};
    std::atomic<std::size_t> rejected_{0};
};

}  // namespace rustmcp::session
