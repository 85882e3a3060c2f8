#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include "core/config/server_config.hpp"
#include "protocol/analysis_contract.hpp"

namespace rustmcp::bridge {

struct BridgeConfig {
    std::filesystem::path executable;
    std::uint32_t timeout_ms = core::config::kDefaultTimeoutMs;
    std::string capability = "Rust analysis";  // Used in the "service is unavailable" message
};

// Runs one analysis per call in a fresh `<executable> <mode>` process.
// The request goes to stdin as one JSON line; the reply is the first stdout
// line that parses as a JSON object. Every failure comes back as
// AnalysisDegraded, never as an error or exception.
class ProcessBridge {
public:
    explicit ProcessBridge(BridgeConfig config);

    protocol::AnalysisOutcome run(const protocol::AnalysisRequest& request) const;

    // True when the configured executable exists and is executable.
    bool available() const;

    const BridgeConfig& config() const { return config_; }

private:
    BridgeConfig config_;
};

// Scans stdout line by line for the first complete JSON object and checks
// diagnostics/suggestions/explanation. The analyzer has no framing of its own,
// so log noise before the payload is tolerated; anything else is a parse failure.
protocol::AnalysisOutcome parse_analyzer_output(const std::string& stdout_text);

}  // namespace rustmcp::bridge
