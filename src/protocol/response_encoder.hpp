#pragma once

#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "protocol/envelope.hpp"
#include "protocol/rpc_errors.hpp"

namespace rustmcp::protocol {

// Captured once at decode time; the encoder never looks at the payload to pick a shape.
struct DialectTag {
    Dialect dialect = Dialect::Rpc;
    std::string version_key = kVersionKey;
    nlohmann::json id = nullptr;
    bool echo_id = true;
};

struct DispatchSuccess {
    nlohmann::json payload;
    std::string legacy_type;  // Only used for the legacy dialect
};

using DispatchOutcome = std::variant<DispatchSuccess, RpcError>;

DialectTag tag_of(const RpcEnvelope& envelope);
DialectTag tag_of(const LegacyEnvelope& envelope);
DialectTag tag_of(const MalformedMessage& message);

nlohmann::json encode_response(const DialectTag& tag, const DispatchOutcome& outcome);

}  // namespace rustmcp::protocol
