#include "bridge/process_bridge.hpp"

#include <unistd.h>

#include <chrono>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>
#include "bridge/process_session.hpp"
#include "core/logging/logger.hpp"

namespace rustmcp::bridge {

using nlohmann::json;
using protocol::AnalysisDegraded;
using protocol::AnalysisOutcome;
using protocol::AnalysisRequest;
using protocol::AnalysisSuccess;
using protocol::DegradedReason;

namespace {

constexpr std::size_t kMaxStderrInMessage = 2000;

std::string trim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

AnalysisDegraded degraded(const DegradedReason reason, std::string message) {
    return AnalysisDegraded{reason, std::move(message)};
}

AnalysisDegraded parse_failure(const std::string& detail) {
    return degraded(DegradedReason::ResponseParseFailure,
                    "Failed to parse analysis response: " + detail);
}

}  // namespace

AnalysisOutcome parse_analyzer_output(const std::string& stdout_text) {
    if (trim(stdout_text).empty()) {
        return parse_failure("empty response from analyzer");
    }

    std::istringstream in(stdout_text);
    std::string line;
    json response;
    bool found = false;
    while (std::getline(in, line)) {
        const std::string candidate = trim(line);
        if (candidate.size() < 2 || candidate.front() != '{' || candidate.back() != '}') {
            continue;
        }
        json parsed = json::parse(candidate, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object()) {
            continue;
        }
        response = std::move(parsed);
        found = true;
        break;
    }

    if (!found) {
        return parse_failure("no valid JSON object found in analyzer output");
    }

    for (const char* field : {"diagnostics", "suggestions", "explanation"}) {
        if (!response.contains(field)) {
            return parse_failure(std::string("missing required field '") + field + "'");
        }
    }
    if (!response["diagnostics"].is_array()) {
        return parse_failure("field 'diagnostics' must be an array");
    }
    if (!response["suggestions"].is_array()) {
        return parse_failure("field 'suggestions' must be an array");
    }
    if (!response["explanation"].is_string()) {
        return parse_failure("field 'explanation' must be a string");
    }

    AnalysisSuccess success;
    success.diagnostics = response["diagnostics"];
    success.suggestions = response["suggestions"];
    success.explanation = response["explanation"].get<std::string>();
    return success;
}

ProcessBridge::ProcessBridge(BridgeConfig config) : config_(std::move(config)) {}

bool ProcessBridge::available() const {
    if (config_.executable.empty()) {
        return false;
    }
    std::error_code ec;
    if (!std::filesystem::is_regular_file(config_.executable, ec) || ec) {
        return false;
    }
    return access(config_.executable.c_str(), X_OK) == 0;
}

AnalysisOutcome ProcessBridge::run(const AnalysisRequest& request) const {
    const std::string unavailable = config_.capability + " service is unavailable";
    if (!available()) {
        LOG_DEBUG("ProcessBridge: analyzer not usable at '" + config_.executable.string() + "'");
        return degraded(DegradedReason::ServiceUnavailable, unavailable);
    }

    auto spawned = ProcessSession::spawn(config_.executable, {request.mode});
    if (core::errors::is_error(spawned)) {
        const auto& err = core::errors::get_error(spawned);
        LOG_WARN("ProcessBridge: spawn failed [" + err.code + "]: " + err.message);
        return degraded(DegradedReason::ServiceUnavailable, unavailable + ": " + err.message);
    }
    // Moved out so the session's destructor runs on every return path below.
    std::unique_ptr<ProcessSession> session =
        std::move(std::get<std::unique_ptr<ProcessSession>>(spawned));

    LOG_DEBUG("ProcessBridge: pid " + std::to_string(session->pid()) + " mode=" + request.mode);
    const std::string payload = protocol::to_json(request).dump() + "\n";
    const ProcessCapture capture =
        session->communicate(payload, std::chrono::milliseconds(config_.timeout_ms));
    session->terminate();

    if (capture.timed_out) {
        LOG_WARN("ProcessBridge: analyzer timed out after " +
                 std::to_string(config_.timeout_ms) + "ms");
        return degraded(DegradedReason::ProcessTimeout, "Analysis timed out");
    }

    if (capture.exit_code != 0) {
        std::string stderr_text = trim(capture.stderr_text);
        if (stderr_text.size() > kMaxStderrInMessage) {
            stderr_text = stderr_text.substr(0, kMaxStderrInMessage) + "...";
        }
        if (stderr_text.empty()) {
            stderr_text = "(no stderr output)";
        }
        LOG_WARN("ProcessBridge: analyzer exited with code " +
                 std::to_string(capture.exit_code));
        return degraded(DegradedReason::ProcessNonZeroExit,
                        "Analysis failed with exit code " +
                            std::to_string(capture.exit_code) + ": " + stderr_text);
    }

    AnalysisOutcome outcome = parse_analyzer_output(capture.stdout_text);
    if (protocol::is_degraded(outcome)) {
        LOG_WARN("ProcessBridge: " + std::get<AnalysisDegraded>(outcome).message);
    }
    return outcome;
}

}  // namespace rustmcp::bridge
