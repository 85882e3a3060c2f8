#pragma once
#include <string>
#include <variant>

namespace rustmcp::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,      // E.g., an invalid CLI flag or malformed tool params
        Protocol,   // E.g., a message that is not a valid envelope
        Transport,  // E.g., a socket read failed or a frame was oversized
        Execution,  // E.g., a tool handler could not complete
        Internal    // E.g., a pipe or fork failure
    };

    // The standardized error payload
    struct ServerError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    // 2. Propagation strategy: a Result holds either a value of type T, OR a ServerError.
    template <typename T>
    using Result = std::variant<T, ServerError>;

    // Result for operations that produce no value.
    using Status = Result<std::monostate>;

    inline Status ok() {
        return std::monostate{};
    }

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<ServerError>(result);
    }

    template <typename T>
    const ServerError& get_error(const Result<T>& result) {
        return std::get<ServerError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:     return "input";
            case ErrorCategory::Protocol:  return "protocol";
            case ErrorCategory::Transport: return "transport";
            case ErrorCategory::Execution: return "execution";
            case ErrorCategory::Internal:  return "internal";
            default: return "unknown";
        }
    }

} // namespace rustmcp::core::errors
