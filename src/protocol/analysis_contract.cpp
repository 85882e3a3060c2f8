#include "protocol/analysis_contract.hpp"

namespace rustmcp::protocol {

using nlohmann::json;

std::string to_string(const DegradedReason reason) {
    switch (reason) {
        case DegradedReason::ServiceUnavailable:
            return "service_unavailable";
        case DegradedReason::ProcessTimeout:
            return "process_timeout";
        case DegradedReason::ProcessNonZeroExit:
            return "process_non_zero_exit";
        case DegradedReason::ResponseParseFailure:
            return "response_parse_failure";
        default:
            return "unknown";
    }
}

json to_json(const AnalysisRequest& request) {
    json payload = {{"mode", request.mode},
                    {"code", request.code},
                    {"fileName", request.file_name.empty() ? kDefaultFileName : request.file_name}};
    if (request.options.is_object()) {
        for (auto it = request.options.begin(); it != request.options.end(); ++it) {
            if (!payload.contains(it.key())) {
                payload[it.key()] = it.value();
            }
        }
    }
    return payload;
}

json make_bridge_diagnostic(const std::string& message) {
    return json{{"message", message}, {"severity", "error"}, {"source", "bridge"}};
}

json to_json(const AnalysisOutcome& outcome) {
    json payload;
    if (const auto* success = std::get_if<AnalysisSuccess>(&outcome)) {
        payload["success"] = true;
        payload["diagnostics"] = success->diagnostics;
        payload["suggestions"] = success->suggestions;
        payload["explanation"] = success->explanation;
        return payload;
    }

    const auto& degraded = std::get<AnalysisDegraded>(outcome);
    payload["success"] = false;
    payload["message"] = degraded.message;
    payload["reason"] = to_string(degraded.reason);
    payload["diagnostics"] = json::array({make_bridge_diagnostic(degraded.message)});
    payload["suggestions"] = json::array();
    payload["explanation"] = "Error during analysis: " + degraded.message;
    return payload;
}

}  // namespace rustmcp::protocol
