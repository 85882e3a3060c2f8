#include "tools/tool_registry.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace rustmcp::tools {

using core::errors::ErrorCategory;
using core::errors::ServerError;
using nlohmann::json;

core::errors::Status ToolRegistry::register_tool(ToolDescriptor descriptor) {
    if (descriptor.name.empty()) {
        return ServerError{ErrorCategory::Internal, "Tool name cannot be empty.",
                           "invalid_tool"};
    }
    if (!descriptor.handler) {
        return ServerError{ErrorCategory::Internal,
                           "Tool has no handler: " + descriptor.name, "invalid_tool"};
    }
    if (index_.find(descriptor.name) != index_.end()) {
        return ServerError{ErrorCategory::Internal,
                           "Tool already registered: " + descriptor.name, "duplicate_tool"};
    }
    if (descriptor.legacy_result_type.empty()) {
        descriptor.legacy_result_type = descriptor.name + ".result";
    }

    LOG_DEBUG("ToolRegistry: registered tool " + descriptor.name);
    index_.emplace(descriptor.name, tools_.size());
    tools_.push_back(std::move(descriptor));
    return core::errors::ok();
}

const ToolDescriptor* ToolRegistry::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return nullptr;
    }
    return &tools_[it->second];
}

json ToolRegistry::describe() const {
    json list = json::array();
    for (const auto& tool : tools_) {
        list.push_back({{"name", tool.name},
                        {"description", tool.description},
                        {"inputSchema", tool.input_schema}});
    }
    return list;
}

core::errors::Status ResourceTable::register_resource(ResourceDescriptor descriptor) {
    if (descriptor.name.empty()) {
        return ServerError{ErrorCategory::Internal, "Resource name cannot be empty.",
                           "invalid_resource"};
    }
    if (by_name_.find(descriptor.name) != by_name_.end()) {
        return ServerError{ErrorCategory::Internal,
                           "Resource already registered: " + descriptor.name,
                           "duplicate_resource"};
    }
    if (!descriptor.uri.empty() && by_uri_.find(descriptor.uri) != by_uri_.end()) {
        return ServerError{ErrorCategory::Internal,
                           "Resource URI already registered: " + descriptor.uri,
                           "duplicate_resource"};
    }

    const std::size_t slot = resources_.size();
    by_name_.emplace(descriptor.name, slot);
    if (!descriptor.uri.empty()) {
        by_uri_.emplace(descriptor.uri, slot);
    }
    resources_.push_back(std::move(descriptor));
    return core::errors::ok();
}

const ResourceDescriptor* ResourceTable::find(const std::string& name) const {
    auto it = by_name_.find(name);
    return it == by_name_.end() ? nullptr : &resources_[it->second];
}

const ResourceDescriptor* ResourceTable::find_by_uri(const std::string& uri) const {
    auto it = by_uri_.find(uri);
    return it == by_uri_.end() ? nullptr : &resources_[it->second];
}

json to_json(const ResourceDescriptor& resource, const bool full) {
    json entry = {{"name", resource.name},
                  {"description", resource.description},
                  {"uri", resource.uri},
                  {"type", resource.kind}};
    if (full) {
        entry["data"] = resource.data;
    }
    return entry;
}

json ResourceTable::describe(const bool full) const {
    json list = json::array();
    for (const auto& resource : resources_) {
        list.push_back(to_json(resource, full));
    }
    return list;
}

}  // namespace rustmcp::tools
