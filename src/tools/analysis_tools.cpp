#include "tools/analysis_tools.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include "core/config/id_generator.hpp"
#include "core/logging/logger.hpp"

namespace rustmcp::tools {

using nlohmann::json;
using protocol::AnalysisOutcome;
using protocol::AnalysisRequest;
using protocol::AnalysisSuccess;

namespace {

json code_schema(const std::string& code_description, json extra_properties = json::object()) {
    json properties = {
        {"code", {{"type", "string"}, {"description", code_description}}},
        {"fileName", {{"type", "string"}, {"description", "The name of the source file"}}}};
    for (auto it = extra_properties.begin(); it != extra_properties.end(); ++it) {
        properties[it.key()] = it.value();
    }
    return json{{"type", "object"}, {"properties", properties}, {"required", {"code"}}};
}

std::int64_t now_unix_ms() {
    return static_cast<std::int64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
}

struct AnalysisMode {
    const char* mode;
    HistoryKind kind;
};

core::errors::Result<json> run_analysis(const bridge::ProcessBridge& bridge,
                                        HistoryStore& history, const AnalysisMode& mode,
                                        const json& params) {
    AnalysisRequest request;
    request.mode = mode.mode;
    request.code = params.at("code").get<std::string>();
    request.file_name = params.value("fileName", std::string(protocol::kDefaultFileName));
    for (const char* option : {"position", "focus"}) {
        if (params.contains(option)) {
            request.options[option] = params.at(option);
        }
    }

    const AnalysisOutcome outcome = bridge.run(request);
    json result = protocol::to_json(outcome);
    result["fileName"] = request.file_name;

    if (const auto* success = std::get_if<AnalysisSuccess>(&outcome)) {
        HistoryRecord entry;
        entry.file_name = request.file_name;
        entry.kind = mode.kind;
        entry.diagnostic_count = success->diagnostics.size();
        entry.suggestion_count = success->suggestions.size();
        entry.explanation_length = success->explanation.size();
        const HistoryRecord stored = history.record(std::move(entry));
        result["id"] = stored.id;
        result["timestamp"] = stored.timestamp_ms;
    } else {
        result["id"] = core::config::generate_id("analysis");
        result["timestamp"] = now_unix_ms();
    }
    return result;
}

ToolDescriptor analysis_tool(const char* name, const char* description, json schema,
                             const char* legacy_type, AnalysisMode mode,
                             const bridge::ProcessBridge& bridge, HistoryStore& history) {
    ToolDescriptor tool;
    tool.name = name;
    tool.description = description;
    tool.input_schema = std::move(schema);
    tool.legacy_result_type = legacy_type;
    tool.handler = [&bridge, &history, mode](const json& params) {
        return run_analysis(bridge, history, mode, params);
    };
    return tool;
}

}  // namespace

core::errors::Status register_analysis_tools(ToolRegistry& registry,
                                             const bridge::ProcessBridge& bridge,
                                             HistoryStore& history) {
    const json position = {
        {"type", "object"},
        {"properties",
         {{"line", {{"type", "integer"}, {"minimum", 0}}},
          {"character", {{"type", "integer"}, {"minimum", 0}}}}},
        {"required", {"line", "character"}},
        {"description", "Cursor position in the file (for focused analysis)"}};
    const json focus = {{"type", "string"},
                        {"description", "Specific part of the code to focus explanation on"}};

    std::vector<ToolDescriptor> tools;
    tools.push_back(analysis_tool(
        kAnalyzeTool, "Analyzes Rust code for errors, warnings, and potential issues.",
        code_schema("The Rust code to analyze", {{"position", position}}),
        "rust.analysis.result", {"analyze", HistoryKind::Analysis}, bridge, history));
    tools.push_back(analysis_tool(
        kSuggestTool, "Provides recommendations for improving Rust code.",
        code_schema("The Rust code to generate suggestions for"), "rust.suggestion.result",
        {"suggest", HistoryKind::Suggestion}, bridge, history));
    tools.push_back(analysis_tool(
        kExplainTool, "Explains Rust code patterns, errors, and concepts.",
        code_schema("The Rust code to explain", {{"focus", focus}}),
        "rust.explanation.result", {"explain", HistoryKind::Explanation}, bridge, history));

    ToolDescriptor history_tool;
    history_tool.name = kHistoryTool;
    history_tool.description = "Retrieves the history of previous Rust code analyses.";
    history_tool.input_schema = {
        {"type", "object"},
        {"properties",
         {{"limit",
           {{"type", "integer"},
            {"minimum", 1},
            {"maximum", kMaxHistoryLimit},
            {"description", "Maximum number of history entries to retrieve"}}}}}};
    history_tool.legacy_result_type = "rust.history.result";
    history_tool.handler = [&history](const json& params) -> core::errors::Result<json> {
        const int limit = params.value("limit", kDefaultHistoryLimit);
        json analyses = json::array();
        for (const auto& record : history.recent(static_cast<std::size_t>(limit))) {
            analyses.push_back(to_json(record));
        }
        return json{{"analyses", analyses}, {"total", history.total()}};
    };
    tools.push_back(std::move(history_tool));

    for (auto& tool : tools) {
        auto status = registry.register_tool(std::move(tool));
        if (core::errors::is_error(status)) {
            return status;
        }
    }
    LOG_INFO("Registered " + std::to_string(registry.size()) + " analysis tools");
    return core::errors::ok();
}

core::errors::Status register_reference_resources(ResourceTable& resources) {
    std::vector<ResourceDescriptor> table;

    ResourceDescriptor common_errors;
    common_errors.name = "Rust Common Errors";
    common_errors.description = "Reference guide to common Rust compiler errors and how to fix them";
    common_errors.uri = "rust://reference/common-errors";
    common_errors.kind = "reference";
    common_errors.data = {
        {"errors",
         {{{"code", "E0308"},
           {"title", "Mismatched types"},
           {"solution", "Ensure type annotations match the actual types or add conversions."}},
          {{"code", "E0382"},
           {"title", "Use of moved value"},
           {"solution", "Clone the value, borrow it, or restructure code to respect ownership."}},
          {{"code", "E0502"},
           {"title", "Cannot borrow as mutable because it is also borrowed as immutable"},
           {"solution", "Ensure mutable and immutable borrows do not overlap."}},
          {{"code", "E0596"},
           {"title", "Cannot borrow as mutable"},
           {"solution", "Declare the binding with 'let mut'."}}}}};
    table.push_back(std::move(common_errors));

    ResourceDescriptor best_practices;
    best_practices.name = "Rust Best Practices";
    best_practices.description = "Guide to idiomatic Rust coding practices and patterns";
    best_practices.uri = "rust://guide/best-practices";
    best_practices.kind = "guide";
    best_practices.data = {
        {"categories",
         {{{"name", "Error Handling"},
           {"practices",
            {"Return Result<T, E> from fallible functions", "Propagate errors with ?"}}},
          {{"name", "Performance"},
           {"practices",
            {"Prefer iterators over index loops", "Pick data structures by access pattern"}}},
          {{"name", "Safety"},
           {"practices",
            {"Isolate unsafe code behind safe abstractions", "Use newtypes for distinct ids"}}}}}};
    table.push_back(std::move(best_practices));

    ResourceDescriptor lifetimes;
    lifetimes.name = "Rust Lifetime Reference";
    lifetimes.description = "Guide to understanding Rust's lifetime system";
    lifetimes.uri = "rust://reference/lifetimes";
    lifetimes.kind = "reference";
    lifetimes.data = {
        {"sections",
         {{{"title", "What are lifetimes?"},
           {"content", "Lifetimes tell the compiler how long references stay valid."}},
          {{"title", "Lifetime syntax"},
           {"content", "fn longest<'a>(x: &'a str, y: &'a str) -> &'a str"}},
          {{"title", "Lifetime elision"},
           {"content", "The compiler infers lifetimes in common single-input cases."}}}}};
    table.push_back(std::move(lifetimes));

    for (auto& resource : table) {
        auto status = resources.register_resource(std::move(resource));
        if (core::errors::is_error(status)) {
            return status;
        }
    }
    return core::errors::ok();
}

}  // namespace rustmcp::tools
