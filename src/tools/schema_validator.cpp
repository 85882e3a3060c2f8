#include "tools/schema_validator.hpp"

#include <cmath>

namespace rustmcp::tools {

using core::errors::ErrorCategory;
using core::errors::ServerError;
using nlohmann::json;

namespace {

ServerError invalid(const std::string& path, const std::string& detail) {
    return ServerError{ErrorCategory::Input, path + ": " + detail, "invalid_params"};
}

bool is_integral(const json& value) {
    if (value.is_number_integer() || value.is_number_unsigned()) {
        return true;
    }
    if (value.is_number_float()) {
        const double d = value.get<double>();
        return std::isfinite(d) && std::floor(d) == d;
    }
    return false;
}

bool matches_type(const json& value, const std::string& type) {
    if (type == "object") return value.is_object();
    if (type == "array") return value.is_array();
    if (type == "string") return value.is_string();
    if (type == "integer") return is_integral(value);
    if (type == "number") return value.is_number();
    if (type == "boolean") return value.is_boolean();
    if (type == "null") return value.is_null();
    return true;  // Unknown type keywords do not constrain
}

core::errors::Status check_type(const json& value, const json& schema, const std::string& path) {
    auto type_it = schema.find("type");
    if (type_it == schema.end()) {
        return core::errors::ok();
    }
    if (type_it->is_string()) {
        const auto type = type_it->get<std::string>();
        if (!matches_type(value, type)) {
            return invalid(path, "expected " + type);
        }
        return core::errors::ok();
    }
    if (type_it->is_array()) {
        std::string names;
        for (const auto& candidate : *type_it) {
            if (!candidate.is_string()) {
                continue;
            }
            if (matches_type(value, candidate.get<std::string>())) {
                return core::errors::ok();
            }
            names += names.empty() ? candidate.get<std::string>() : " or " + candidate.get<std::string>();
        }
        return invalid(path, "expected " + names);
    }
    return core::errors::ok();
}

core::errors::Status check_bounds(const json& value, const json& schema, const std::string& path) {
    if (value.is_number()) {
        const double number = value.get<double>();
        auto min_it = schema.find("minimum");
        if (min_it != schema.end() && min_it->is_number() && number < min_it->get<double>()) {
            return invalid(path, "must be >= " + min_it->dump());
        }
        auto max_it = schema.find("maximum");
        if (max_it != schema.end() && max_it->is_number() && number > max_it->get<double>()) {
            return invalid(path, "must be <= " + max_it->dump());
        }
    }
    if (value.is_string()) {
        const auto length = value.get_ref<const json::string_t&>().size();
        auto min_it = schema.find("minLength");
        if (min_it != schema.end() && min_it->is_number_integer() &&
            static_cast<long long>(length) < min_it->get<long long>()) {
            return invalid(path, "must be at least " + min_it->dump() + " characters");
        }
        auto max_it = schema.find("maxLength");
        if (max_it != schema.end() && max_it->is_number_integer() &&
            static_cast<long long>(length) > max_it->get<long long>()) {
            return invalid(path, "must be at most " + max_it->dump() + " characters");
        }
    }
    auto enum_it = schema.find("enum");
    if (enum_it != schema.end() && enum_it->is_array()) {
        for (const auto& allowed : *enum_it) {
            if (allowed == value) {
                return core::errors::ok();
            }
        }
        return invalid(path, "must be one of " + enum_it->dump());
    }
    return core::errors::ok();
}

core::errors::Status check_object(const json& value, const json& schema, const std::string& path) {
    auto required_it = schema.find("required");
    if (required_it != schema.end() && required_it->is_array()) {
        for (const auto& key : *required_it) {
            if (key.is_string() && !value.contains(key.get<std::string>())) {
                return invalid(path, "missing required property '" + key.get<std::string>() + "'");
            }
        }
    }

    const auto properties_it = schema.find("properties");
    const bool has_properties = properties_it != schema.end() && properties_it->is_object();
    auto additional_it = schema.find("additionalProperties");
    const bool closed = additional_it != schema.end() && additional_it->is_boolean() &&
                        !additional_it->get<bool>();

    for (auto it = value.begin(); it != value.end(); ++it) {
        const std::string child_path = path + "." + it.key();
        if (has_properties && properties_it->contains(it.key())) {
            auto status = validate_against_schema(it.value(), properties_it->at(it.key()), child_path);
            if (core::errors::is_error(status)) {
                return status;
            }
        } else if (closed) {
            return invalid(child_path, "unexpected property");
        }
    }
    return core::errors::ok();
}

core::errors::Status check_array(const json& value, const json& schema, const std::string& path) {
    auto items_it = schema.find("items");
    if (items_it == schema.end() || !items_it->is_object()) {
        return core::errors::ok();
    }
    for (std::size_t i = 0; i < value.size(); ++i) {
        auto status = validate_against_schema(value[i], *items_it,
                                              path + "[" + std::to_string(i) + "]");
        if (core::errors::is_error(status)) {
            return status;
        }
    }
    return core::errors::ok();
}

}  // namespace

core::errors::Status validate_against_schema(const json& value, const json& schema,
                                             const std::string& path) {
    if (!schema.is_object()) {
        return core::errors::ok();
    }

    auto status = check_type(value, schema, path);
    if (core::errors::is_error(status)) {
        return status;
    }
    status = check_bounds(value, schema, path);
    if (core::errors::is_error(status)) {
        return status;
    }
    if (value.is_object()) {
        return check_object(value, schema, path);
    }
    if (value.is_array()) {
        return check_array(value, schema, path);
    }
    return core::errors::ok();
}

}  // namespace rustmcp::tools
