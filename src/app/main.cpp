#include <csignal>
#include <pthread.h>
#include <signal.h>
#include <string>
#include <thread>
#include <unistd.h>
#include "app/cli_parser.hpp"
#include "bridge/process_bridge.hpp"
#include "core/config/id_generator.hpp"
#include "core/config/server_config.hpp"
#include "core/errors/server_errors.hpp"
#include "core/logging/logger.hpp"
#include "dispatch/dispatcher.hpp"
#include "session/server.hpp"
#include "tools/analysis_tools.hpp"
#include "tools/history_store.hpp"
#include "tools/tool_registry.hpp"

namespace {

void report(const rustmcp::core::errors::ServerError& err, const std::string& what) {
    LOG_ERROR(what + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace rustmcp;

    // 1. Tag every log line with this server instance
    core::logging::Logger::get().set_tag(core::config::generate_id("rustmcp"));

    // 2. Defaults, then environment, then flags
    core::config::ServerConfig defaults;
    auto env = core::config::apply_environment(defaults);
    if (core::errors::is_error(env)) {
        report(core::errors::get_error(env), "Input error");
        return 2;
    }

    auto parsed = app::cli::parse_and_validate(argc, argv, defaults);
    if (core::errors::is_error(parsed)) {
        report(core::errors::get_error(parsed), "Input error");
        return 2;
    }
    const auto& config = core::errors::get_value(parsed);
    if (config.verbose) {
        core::logging::Logger::get().set_min_level(core::logging::LogLevel::DEBUG);
    }

    // 3. Registry and resources are built once and only read afterwards
    bridge::ProcessBridge bridge(bridge::BridgeConfig{config.analyzer_path, config.timeout_ms});
    if (!bridge.available()) {
        LOG_WARN("Analyzer binary not available (" +
                 (config.analyzer_path.empty() ? std::string("unset")
                                               : config.analyzer_path.string()) +
                 "); analysis results will be degraded");
    }

    tools::HistoryStore history;
    tools::ToolRegistry registry;
    tools::ResourceTable resources;
    auto registered = tools::register_analysis_tools(registry, bridge, history);
    if (core::errors::is_error(registered)) {
        report(core::errors::get_error(registered), "Failed to register tools");
        return 3;
    }
    auto loaded = tools::register_reference_resources(resources);
    if (core::errors::is_error(loaded)) {
        report(core::errors::get_error(loaded), "Failed to register resources");
        return 3;
    }

    dispatch::Dispatcher dispatcher(registry, resources);

    // 4. SIGINT/SIGTERM are taken by a waiter thread; every other thread inherits the mask.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    sigaddset(&signals, SIGUSR1);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    session::Server server(config, dispatcher);
    auto started = server.start();
    if (core::errors::is_error(started)) {
        report(core::errors::get_error(started), "Failed to start server");
        server.stop();
        return 3;
    }

    std::thread signal_waiter([&signals, &server]() {
        int received = 0;
        if (sigwait(&signals, &received) == 0 && received != SIGUSR1) {
            LOG_INFO("Received signal " + std::to_string(received) + ", shutting down");
        }
        server.request_stop();
    });

    server.wait();
    // Wakes the waiter when the server ended without a signal.
    static_cast<void>(kill(getpid(), SIGUSR1));
    signal_waiter.join();

    server.stop();
    return 0;
}
