#pragma once

#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "protocol/rpc_errors.hpp"

namespace rustmcp::protocol {

inline constexpr const char* kVersionKey = "version";
inline constexpr const char* kJsonRpcKey = "jsonrpc";
inline constexpr const char* kRpcVersion = "2.0";

enum class Dialect {
    Rpc,
    Legacy
};

// {version|jsonrpc: "2.0", id, method, params?}
struct RpcEnvelope {
    std::string version_key = kVersionKey;
    nlohmann::json id = nullptr;
    std::string method;
    nlohmann::json params = nlohmann::json::object();
};

// {type, data, id?}
struct LegacyEnvelope {
    std::string type;
    nlohmann::json data = nlohmann::json::object();
    std::optional<nlohmann::json> id;
};

// Valid JSON that is not a usable request. Always answered in RPC shape.
struct MalformedMessage {
    RpcError error;
    nlohmann::json id = nullptr;
    std::string version_key = kVersionKey;
};

using Envelope = std::variant<RpcEnvelope, LegacyEnvelope>;
using DecodedMessage = std::variant<RpcEnvelope, LegacyEnvelope, MalformedMessage>;

// Parses raw text and classifies it. Invalid JSON yields a ParseError MalformedMessage.
DecodedMessage decode(const std::string& raw);

// Classifies an already-parsed JSON value.
DecodedMessage classify(const nlohmann::json& value);

}  // namespace rustmcp::protocol
