#include "core/config/server_config.hpp"

#include <charconv>
#include <cstdlib>
#include <system_error>

namespace rustmcp::core::config {

using errors::ErrorCategory;
using errors::ServerError;

namespace {

std::string get_env(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

}  // namespace

errors::Result<std::uint32_t> parse_bounded_uint(const std::string& text,
                                                const std::string& what,
                                                const std::uint32_t min_value,
                                                const std::uint32_t max_value) {
    std::uint32_t value = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (text.empty() || ec != std::errc() || ptr != end) {
        return ServerError{ErrorCategory::Input, "Invalid number for " + what,
                           "invalid_integer", "Provide a positive integer."};
    }
    if (value < min_value || value > max_value) {
        return ServerError{ErrorCategory::Input, what + " out of bounds", "bounds_error",
                           "Must be between " + std::to_string(min_value) + " and " +
                               std::to_string(max_value) + "."};
    }
    return value;
}

errors::Status apply_environment(ServerConfig& config) {
    const std::string binary = get_env("RUST_BINARY_PATH");
    if (!binary.empty()) {
        config.analyzer_path = binary;
    }

    const std::string port = get_env("RUST_MCP_PORT");
    if (!port.empty()) {
        auto parsed = parse_bounded_uint(port, "RUST_MCP_PORT", 1, 65535);
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        config.port = static_cast<std::uint16_t>(errors::get_value(parsed));
    }

    const std::string timeout = get_env("RUST_MCP_TIMEOUT_MS");
    if (!timeout.empty()) {
        auto parsed = parse_bounded_uint(timeout, "RUST_MCP_TIMEOUT_MS", 1, kMaxTimeoutMs);
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        config.timeout_ms = errors::get_value(parsed);
    }

    return errors::ok();
}

}  // namespace rustmcp::core::config
