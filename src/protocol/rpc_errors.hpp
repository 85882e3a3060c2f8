#pragma once

#include <string>

namespace rustmcp::protocol {

enum class RpcErrorCode : int {
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603
};

// Protocol-level failure surfaced to the client as an `error` object.
struct RpcError {
    RpcErrorCode code = RpcErrorCode::InternalError;
    std::string message;
};

inline int to_int(const RpcErrorCode code) {
    return static_cast<int>(code);
}

inline RpcError parse_error(const std::string& detail) {
    return RpcError{RpcErrorCode::ParseError, "Parse error: " + detail};
}

inline RpcError invalid_request(const std::string& detail) {
    return RpcError{RpcErrorCode::InvalidRequest, "Invalid Request: " + detail};
}

inline RpcError method_not_found(const std::string& name) {
    return RpcError{RpcErrorCode::MethodNotFound, "Method not found: " + name};
}

inline RpcError invalid_params(const std::string& detail) {
    return RpcError{RpcErrorCode::InvalidParams, "Invalid params: " + detail};
}

inline RpcError internal_error(const std::string& detail) {
    return RpcError{RpcErrorCode::InternalError, detail.empty() ? "Internal error" : detail};
}

}  // namespace rustmcp::protocol
