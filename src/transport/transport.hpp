#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/server_errors.hpp"
#include "transport/event_channel.hpp"

namespace rustmcp::transport {

// One bidirectional message stream. Implementations publish every inbound
// frame, error and the final close to the channel given to start(), and
// publish exactly one ClosedEvent.
class Transport {
public:
    virtual ~Transport() = default;

    // Begins reading on a background thread. `channel` must outlive the transport.
    virtual core::errors::Status start(EventChannel& channel) = 0;

    // Writes one JSON value as one frame. Safe to call from any thread.
    virtual core::errors::Status send(const nlohmann::json& message) = 0;

    // Stops reading and releases the descriptors. Idempotent.
    virtual void close() = 0;

    virtual std::string describe() const = 0;
};

}  // namespace rustmcp::transport
