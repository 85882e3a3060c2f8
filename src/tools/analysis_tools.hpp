#pragma once

#include "bridge/process_bridge.hpp"
#include "core/errors/server_errors.hpp"
#include "tools/history_store.hpp"
#include "tools/tool_registry.hpp"

namespace rustmcp::tools {

inline constexpr const char* kAnalyzeTool = "rust.analyze";
inline constexpr const char* kSuggestTool = "rust.suggest";
inline constexpr const char* kExplainTool = "rust.explain";
inline constexpr const char* kHistoryTool = "rust.history";

inline constexpr int kDefaultHistoryLimit = 10;
inline constexpr int kMaxHistoryLimit = 50;

// Registers rust.analyze, rust.suggest, rust.explain and rust.history.
// Handlers keep references to `bridge` and `history`, which must outlive the registry.
core::errors::Status register_analysis_tools(ToolRegistry& registry,
                                             const bridge::ProcessBridge& bridge,
                                             HistoryStore& history);

// The three static Rust reference resources.
core::errors::Status register_reference_resources(ResourceTable& resources);

}  // namespace rustmcp::tools
