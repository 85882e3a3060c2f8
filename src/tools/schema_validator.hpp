#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/server_errors.hpp"

namespace rustmcp::tools {

// Checks a value against the structural subset of JSON Schema the tool
// descriptors use: type, properties, required, additionalProperties, items,
// enum, minimum, maximum, minLength, maxLength.
// Errors are Input-category with code "invalid_params" and a message naming
// the offending path, e.g. "params.position.line: expected integer".
core::errors::Status validate_against_schema(const nlohmann::json& value,
                                             const nlohmann::json& schema,
                                             const std::string& path = "params");

}  // namespace rustmcp::tools
