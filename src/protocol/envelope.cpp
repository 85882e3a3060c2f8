#include "protocol/envelope.hpp"

namespace rustmcp::protocol {

using nlohmann::json;

namespace {

bool is_valid_id(const json& id) {
    return id.is_null() || id.is_string() || id.is_number_integer() ||
           id.is_number_unsigned() || id.is_number_float();
}

// Returns the key ("version" or "jsonrpc") that carries "2.0", if any.
std::optional<std::string> rpc_version_key(const json& value) {
    for (const char* key : {kVersionKey, kJsonRpcKey}) {
        auto it = value.find(key);
        if (it != value.end() && it->is_string() && it->get<std::string>() == kRpcVersion) {
            return std::string(key);
        }
    }
    return std::nullopt;
}

DecodedMessage classify_rpc(const json& value, const std::string& version_key) {
    MalformedMessage malformed;
    malformed.version_key = version_key;

    json id = nullptr;
    auto id_it = value.find("id");
    if (id_it != value.end()) {
        if (!is_valid_id(*id_it)) {
            malformed.error = invalid_request("id must be a number, string or null");
            return malformed;
        }
        id = *id_it;
    }
    malformed.id = id;

    const auto& method = value.at("method");
    if (!method.is_string()) {
        malformed.error = invalid_request("method must be a string");
        return malformed;
    }

    RpcEnvelope envelope;
    envelope.version_key = version_key;
    envelope.id = std::move(id);
    envelope.method = method.get<std::string>();

    auto params_it = value.find("params");
    if (params_it != value.end() && !params_it->is_null()) {
        if (!params_it->is_object()) {
            malformed.error = invalid_request("params must be an object");
            return malformed;
        }
        envelope.params = *params_it;
    }
    return envelope;
}

DecodedMessage classify_legacy(const json& value) {
    LegacyEnvelope envelope;
    envelope.type = value.at("type").get<std::string>();

    auto data_it = value.find("data");
    if (data_it != value.end() && !data_it->is_null()) {
        envelope.data = *data_it;
    }

    auto id_it = value.find("id");
    if (id_it != value.end()) {
        envelope.id = *id_it;
    }
    return envelope;
}

}  // namespace

DecodedMessage decode(const std::string& raw) {
    json value;
    try {
        value = json::parse(raw);
    } catch (const json::parse_error& e) {
        MalformedMessage malformed;
        malformed.error = parse_error(e.what());
        return malformed;
    }
    return classify(value);
}

DecodedMessage classify(const json& value) {
    if (!value.is_object()) {
        MalformedMessage malformed;
        malformed.error = invalid_request("message must be a JSON object");
        return malformed;
    }

    const auto version_key = rpc_version_key(value);
    if (version_key.has_value() && value.contains("method")) {
        return classify_rpc(value, *version_key);
    }

    auto type_it = value.find("type");
    if (type_it != value.end() && type_it->is_string()) {
        return classify_legacy(value);
    }

    MalformedMessage malformed;
    if (version_key.has_value()) {
        malformed.version_key = *version_key;
        auto id_it = value.find("id");
        if (id_it != value.end() && is_valid_id(*id_it)) {
            malformed.id = *id_it;
        }
        malformed.error = invalid_request("missing method");
    } else {
        malformed.error = invalid_request("expected {version, method} or {type, data}");
    }
    return malformed;
}

}  // namespace rustmcp::protocol
