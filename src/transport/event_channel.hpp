#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>
#include "protocol/transport_events.hpp"

namespace rustmcp::transport {

// Unbounded queue between a transport's reader thread and its session.
// push never blocks; pop blocks until an event arrives or the channel is closed.
class EventChannel {
public:
    void push(protocol::TransportEvent event) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            events_.push_back(std::move(event));
        }
        ready_.notify_one();
    }

    // Returns nullopt once the channel is closed and drained.
    std::optional<protocol::TransportEvent> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        ready_.wait(lock, [this]() { return closed_ || !events_.empty(); });
        return take_locked();
    }

    std::optional<protocol::TransportEvent> pop_for(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        ready_.wait_for(lock, timeout, [this]() { return closed_ || !events_.empty(); });
        return take_locked();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        ready_.notify_all();
    }

private:
    std::optional<protocol::TransportEvent> take_locked() {
        if (events_.empty()) {
            return std::nullopt;
        }
        protocol::TransportEvent event = std::move(events_.front());
        events_.pop_front();
        return event;
    }

    std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<protocol::TransportEvent> events_;
    bool closed_ = false;
};

}  // namespace rustmcp::transport
