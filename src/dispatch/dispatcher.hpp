#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "protocol/envelope.hpp"
#include "protocol/response_encoder.hpp"
#include "protocol/rpc_errors.hpp"
#include "tools/tool_registry.hpp"

namespace rustmcp::dispatch {

inline constexpr const char* kProtocolVersion = "0.1.0";
inline constexpr const char* kSchemaType = "mcp.schema";

struct ServerInfo {
    std::string name = "rustmcp";
    std::string version = "0.1.0";
};

struct DispatchReply {
    nlohmann::json message;
    // Set when the raw text was rejected before any method was resolved.
    std::optional<protocol::RpcError> rejected;
};

// Turns one raw message into exactly one response. Holds no per-message state,
// so one instance serves every session and worker thread concurrently.
class Dispatcher {
public:
    Dispatcher(const tools::ToolRegistry& registry, const tools::ResourceTable& resources,
               ServerInfo info = {});

    DispatchReply handle_raw(const std::string& raw) const;

    // Answers `raw` with `error` in the request's dialect without running anything.
    // Unparsable or malformed text gets the same rejection handle_raw would give.
    DispatchReply reject_raw(const std::string& raw, const protocol::RpcError& error) const;

    protocol::DispatchOutcome handle_rpc(const protocol::RpcEnvelope& envelope) const;
    protocol::DispatchOutcome handle_legacy(const protocol::LegacyEnvelope& envelope) const;

private:
    protocol::DispatchOutcome initialize() const;
    protocol::DispatchOutcome list_tools() const;
    protocol::DispatchOutcome list_resources() const;
    protocol::DispatchOutcome read_resource(const nlohmann::json& params) const;
    protocol::DispatchOutcome call_tool(const nlohmann::json& params) const;
    protocol::DispatchOutcome schema() const;

    // Validates arguments against the tool's schema, then runs its handler.
    protocol::DispatchOutcome invoke(const tools::ToolDescriptor& tool,
                                     const nlohmann::json& arguments) const;

    const tools::ToolRegistry& registry_;
    const tools::ResourceTable& resources_;
    ServerInfo info_;
};

}  // namespace rustmcp::dispatch
