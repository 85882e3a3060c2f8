#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/server_errors.hpp"

namespace rustmcp::tools {

// Receives params already checked against the descriptor's input schema.
using ToolHandler =
    std::function<core::errors::Result<nlohmann::json>(const nlohmann::json& params)>;

struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json input_schema = nlohmann::json::object();
    ToolHandler handler;
    std::string legacy_result_type;  // "<name>.result" when left empty
};

struct ResourceDescriptor {
    std::string name;
    std::string description;
    std::string uri;
    std::string kind;  // "reference", "guide", ...
    nlohmann::json data = nlohmann::json::object();
};

// Filled during startup, then only read. Lookups return nullptr for unknown names.
class ToolRegistry {
public:
    core::errors::Status register_tool(ToolDescriptor descriptor);

    const ToolDescriptor* find(const std::string& name) const;
    const std::vector<ToolDescriptor>& tools() const { return tools_; }
    std::size_t size() const { return tools_.size(); }

    // [{name, description, inputSchema}] in registration order.
    nlohmann::json describe() const;

private:
    std::vector<ToolDescriptor> tools_;
    std::unordered_map<std::string, std::size_t> index_;
};

class ResourceTable {
public:
    core::errors::Status register_resource(ResourceDescriptor descriptor);

    const ResourceDescriptor* find(const std::string& name) const;
    const ResourceDescriptor* find_by_uri(const std::string& uri) const;
    const std::vector<ResourceDescriptor>& resources() const { return resources_; }
    std::size_t size() const { return resources_.size(); }

    // [{name, description, uri, type}]; `full` adds the data payload.
    nlohmann::json describe(bool full = false) const;

private:
    std::vector<ResourceDescriptor> resources_;
    std::unordered_map<std::string, std::size_t> by_name_;
    std::unordered_map<std::string, std::size_t> by_uri_;
};

nlohmann::json to_json(const ResourceDescriptor& resource, bool full);

}  // namespace rustmcp::tools
