#pragma once

#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace rustmcp::protocol {

// What the bridge sends to the external analyzer on stdin, one JSON line.
struct AnalysisRequest {
    std::string mode;       // "analyze", "suggest" or "explain"
    std::string code;
    std::string file_name;  // Defaults to kDefaultFileName when the client omits it
    nlohmann::json options = nlohmann::json::object();  // e.g. position, focus
};

inline constexpr const char* kDefaultFileName = "unnamed_code.rs";

// The analyzer answered with a well-formed payload.
// Diagnostic and suggestion entries are owned by the analyzer and kept opaque.
struct AnalysisSuccess {
    nlohmann::json diagnostics = nlohmann::json::array();
    nlohmann::json suggestions = nlohmann::json::array();
    std::string explanation;
};

enum class DegradedReason {
    ServiceUnavailable,
    ProcessTimeout,
    ProcessNonZeroExit,
    ResponseParseFailure
};

// A failure carried as content: one synthetic diagnostic describing the cause.
struct AnalysisDegraded {
    DegradedReason reason = DegradedReason::ResponseParseFailure;
    std::string message;
};

using AnalysisOutcome = std::variant<AnalysisSuccess, AnalysisDegraded>;

std::string to_string(DegradedReason reason);

nlohmann::json to_json(const AnalysisRequest& request);

// {message, severity: "error", source: "bridge"}
nlohmann::json make_bridge_diagnostic(const std::string& message);

// {success, diagnostics, suggestions, explanation[, message]}
nlohmann::json to_json(const AnalysisOutcome& outcome);

inline bool is_degraded(const AnalysisOutcome& outcome) {
    return std::holds_alternative<AnalysisDegraded>(outcome);
}

}  // namespace rustmcp::protocol
