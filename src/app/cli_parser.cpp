#include "cli_parser.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace rustmcp::app::cli {

    using namespace rustmcp::core::errors;
    using rustmcp::core::config::ServerConfig;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> host;
        std::optional<std::string> port;
        std::optional<std::string> analyzer;
        std::optional<std::string> timeout_ms;
        bool stdio = false;
        bool no_socket = false;
        bool verbose = false;
    };

    Result<ServerConfig> parse_and_validate(int argc, char* argv[], ServerConfig defaults) {
        if (argc < 2) {
            return ServerError{ErrorCategory::Input, "No command provided.", "missing_command", "Usage: rustmcp serve [--stdio] [--no-socket] [--port N]"};
        }

        std::string command = argv[1];
        if (command != "serve") {
            return ServerError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Currently only the 'serve' command is supported."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and 'serve' command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--host") {
                if (i + 1 < args.size()) raw.host = args[++i];
                else return ServerError{ErrorCategory::Input, "Missing value for --host", "missing_value"};
            } else if (args[i] == "--port" || args[i] == "-p") {
                if (i + 1 < args.size()) raw.port = args[++i];
                else return ServerError{ErrorCategory::Input, "Missing value for --port", "missing_value"};
            } else if (args[i] == "--analyzer") {
                if (i + 1 < args.size()) raw.analyzer = args[++i];
                else return ServerError{ErrorCategory::Input, "Missing value for --analyzer", "missing_value"};
            } else if (args[i] == "--timeout-ms") {
                if (i + 1 < args.size()) raw.timeout_ms = args[++i];
                else return ServerError{ErrorCategory::Input, "Missing value for --timeout-ms", "missing_value"};
            } else if (args[i] == "--stdio" || args[i] == "-s") {
                raw.stdio = true;
            } else if (args[i] == "--no-socket" || args[i] == "-n") {
                raw.no_socket = true;
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return ServerError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        ServerConfig config = std::move(defaults);
        config.verbose = config.verbose || raw.verbose;
        if (raw.stdio) config.enable_stdio = true;
        if (raw.no_socket) config.enable_socket = false;

        if (!config.enable_stdio && !config.enable_socket) {
            return ServerError{ErrorCategory::Input, "No transport enabled", "no_transport", "Pass --stdio or drop --no-socket."};
        }

        if (raw.host) {
            if (raw.host->empty()) {
                return ServerError{ErrorCategory::Input, "Host cannot be empty", "invalid_host"};
            }
            config.host = raw.host.value();
        }

        if (raw.port) {
            auto port = rustmcp::core::config::parse_bounded_uint(*raw.port, "--port", 0, 65535);
            if (is_error(port)) return get_error(port);
            config.port = static_cast<std::uint16_t>(get_value(port));
        }

        if (raw.timeout_ms) {
            auto timeout = rustmcp::core::config::parse_bounded_uint(
                *raw.timeout_ms, "--timeout-ms", 1, rustmcp::core::config::kMaxTimeoutMs);
            if (is_error(timeout)) return get_error(timeout);
            config.timeout_ms = get_value(timeout);
        }

        // The analyzer may legitimately be missing; only reject a path that names a directory.
        if (raw.analyzer) {
            std::filesystem::path p(raw.analyzer.value());
            std::error_code path_ec;
            if (std::filesystem::is_directory(p, path_ec) && !path_ec) {
                return ServerError{ErrorCategory::Input, "Analyzer path is a directory", "invalid_path"};
            }
            config.analyzer_path = std::move(p);
        }

        return config;
    }

} // namespace rustmcp::app::cli
