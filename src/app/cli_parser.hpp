#pragma once
#include "core/config/server_config.hpp"
#include "core/errors/server_errors.hpp"

namespace rustmcp::app::cli {
    // `defaults` already carries the environment overlay; flags win over it.
    rustmcp::core::errors::Result<rustmcp::core::config::ServerConfig> parse_and_validate(
        int argc, char* argv[], rustmcp::core::config::ServerConfig defaults = {});
}
