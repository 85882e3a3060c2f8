#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include "core/errors/server_errors.hpp"

namespace rustmcp::core::config {

    constexpr std::uint32_t kDefaultTimeoutMs = 10000;
    constexpr std::uint32_t kMaxTimeoutMs = 600000;
    constexpr std::uint16_t kDefaultPort = 3000;

    // Validated settings the server is started with
    struct ServerConfig {
        std::filesystem::path analyzer_path;  // Empty means "no analyzer installed"
        std::uint32_t timeout_ms = kDefaultTimeoutMs;
        bool enable_stdio = false;
        bool enable_socket = true;
        std::string host = "127.0.0.1";
        std::uint16_t port = kDefaultPort;
        bool verbose = false;
    };

    // Overlays RUST_BINARY_PATH, RUST_MCP_PORT and RUST_MCP_TIMEOUT_MS onto config.
    errors::Status apply_environment(ServerConfig& config);

    // Shared integer parsing for env and CLI values; rejects trailing characters.
    errors::Result<std::uint32_t> parse_bounded_uint(const std::string& text,
                                                    const std::string& what,
                                                    std::uint32_t min_value,
                                                    std::uint32_t max_value);

} // namespace rustmcp::core::config
