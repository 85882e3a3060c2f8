#include "session/session.hpp"

#include <exception>
#include <system_error>
#include <utility>
#include <variant>
#include "core/logging/logger.hpp"

namespace rustmcp::session {

using protocol::ClosedEvent;
using protocol::ErrorEvent;
using protocol::MessageEvent;

Session::Session(std::unique_ptr<transport::Transport> transport,
                 const dispatch::Dispatcher& dispatcher, const std::size_t max_workers)
    : transport_(std::move(transport)),
      dispatcher_(dispatcher),
      max_workers_(max_workers == 0 ? 1 : max_workers),
      name_(transport_->describe()) {}

Session::~Session() {
    stop();
}

core::errors::Status Session::start() {
    std::lock_guard<std::mutex> lock(loop_mutex_);
    if (loop_.joinable()) {
        return core::errors::ServerError{core::errors::ErrorCategory::Transport,
                                         "Session " + name_ + " already started",
                                         "invalid_state"};
    }

    auto started = transport_->start(channel_);
    if (core::errors::is_error(started)) {
        finished_.store(true);
        return started;
    }

    loop_ = std::thread([this]() { run(); });
    LOG_INFO("Session started on " + name_);
    return core::errors::ok();
}

void Session::run() {
    while (true) {
        auto event = channel_.pop();
        if (!event.has_value()) {
            break;
        }

        if (auto* message = std::get_if<MessageEvent>(&event.value())) {
            spawn_worker(std::move(message->raw));
        } else if (const auto* error = std::get_if<ErrorEvent>(&event.value())) {
            LOG_WARN("Transport error on " + name_ + " [" + protocol::to_string(error->kind) +
                     "]: " + error->detail);
        } else if (const auto* closed = std::get_if<ClosedEvent>(&event.value())) {
            LOG_INFO("Session " + name_ + " closed: " + closed->reason);
            break;
        }
    }

    // In-flight replies still go out before the transport is released.
    reap_workers(true);
    channel_.close();
    transport_->close();
    finished_.store(true);
}

void Session::spawn_worker(std::string raw) {
    reap_workers(false);

    std::unique_lock<std::mutex> lock(workers_mutex_);
    if (workers_.size() >= max_workers_) {
        lock.unlock();
        reject(raw, "Server busy: " + std::to_string(max_workers_) +
                        " requests already in progress on this connection");
        return;
    }

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread thread;
    try {
        thread = std::thread([this, done, raw]() {
            handle_message(raw);
            done->store(true);
        });
    } catch (const std::system_error& e) {
        lock.unlock();
        LOG_ERROR("Cannot start a worker on " + name_ + ": " + e.what());
        reject(raw, "Server busy: cannot start a worker");
        return;
    }
    workers_.push_back(Worker{std::move(thread), done});
}

void Session::handle_message(const std::string& raw) {
    try {
        send_reply(dispatcher_.handle_raw(raw));
        handled_.fetch_add(1);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to handle message on " + name_ + ": " + e.what());
    }
}

// Runs on the event loop thread, so it must not throw.
void Session::reject(const std::string& raw, const std::string& reason) {
    rejected_.fetch_add(1);
    try {
        send_reply(dispatcher_.reject_raw(raw, protocol::internal_error(reason)));
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to reject message on " + name_ + ": " + e.what());
    }
}

void Session::send_reply(const dispatch::DispatchReply& reply) {
    if (reply.rejected.has_value() &&
        reply.rejected->code == protocol::RpcErrorCode::ParseError) {
        LOG_WARN("Transport error on " + name_ + " [" +
                 protocol::to_string(protocol::TransportErrorKind::Parse) +
                 "]: " + reply.rejected->message);
    }

    auto sent = transport_->send(reply.message);
    if (core::errors::is_error(sent)) {
        LOG_WARN("Dropped reply on " + name_ + ": " + core::errors::get_error(sent).message);
    }
}

void Session::reap_workers(const bool all) {
    std::list<Worker> finished;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (all || it->done->load()) {
                finished.splice(finished.end(), workers_, it++);
            } else {
                ++it;
            }
        }
    }
    for (auto& worker : finished) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

void Session::stop() {
    transport_->close();

    std::lock_guard<std::mutex> lock(loop_mutex_);
    if (loop_.joinable()) {
        loop_.join();
    }
}

void Session::wait() {
    std::lock_guard<std::mutex> lock(loop_mutex_);
    if (loop_.joinable()) {
        loop_.join();
    }
}

}  // namespace rustmcp::session
