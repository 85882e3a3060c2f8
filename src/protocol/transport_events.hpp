#pragma once
#include <cstdint>
#include <string>
#include <variant>

namespace rustmcp::protocol {

    enum class TransportErrorKind {
        Parse,          // A message did not hold one JSON value
        Io,             // read/write failed but the descriptor is still usable
        FrameTooLarge   // A socket message or stream line exceeded the size limit
    };

    // The three things a transport can report to its session.
    struct MessageEvent { std::string raw; };
    struct ErrorEvent { TransportErrorKind kind; std::string detail; };
    struct ClosedEvent { std::string reason; };

    // A transport publishes exactly ONE of these per channel slot.
    using TransportEvent = std::variant<
        MessageEvent,
        ErrorEvent,
        ClosedEvent
    >;

    inline std::string to_string(const TransportErrorKind kind) {
        switch (kind) {
            case TransportErrorKind::Parse:         return "parse";
            case TransportErrorKind::Io:            return "io";
            case TransportErrorKind::FrameTooLarge: return "frame_too_large";
            default: return "unknown";
        }
    }

} // namespace rustmcp::protocol
