#include "protocol/response_encoder.hpp"

namespace rustmcp::protocol {

using nlohmann::json;

namespace {

json encode_rpc(const DialectTag& tag, const DispatchOutcome& outcome) {
    json message;
    message[tag.version_key] = kRpcVersion;
    message["id"] = tag.id;
    if (const auto* success = std::get_if<DispatchSuccess>(&outcome)) {
        message["result"] = success->payload;
    } else {
        const auto& error = std::get<RpcError>(outcome);
        message["error"] = {{"code", to_int(error.code)}, {"message", error.message}};
    }
    return message;
}

json encode_legacy(const DialectTag& tag, const DispatchOutcome& outcome) {
    json message;
    if (const auto* success = std::get_if<DispatchSuccess>(&outcome)) {
        message["type"] = success->legacy_type;
        message["data"] = success->payload;
    } else {
        const auto& error = std::get<RpcError>(outcome);
        message["type"] = "error";
        message["data"] = {{"message", error.message}};
    }
    if (tag.echo_id) {
        message["id"] = tag.id;
    }
    return message;
}

}  // namespace

DialectTag tag_of(const RpcEnvelope& envelope) {
    DialectTag tag;
    tag.dialect = Dialect::Rpc;
    tag.version_key = envelope.version_key;
    tag.id = envelope.id;
    return tag;
}

DialectTag tag_of(const LegacyEnvelope& envelope) {
    DialectTag tag;
    tag.dialect = Dialect::Legacy;
    tag.echo_id = envelope.id.has_value();
    if (envelope.id.has_value()) {
        tag.id = envelope.id.value();
    }
    return tag;
}

DialectTag tag_of(const MalformedMessage& message) {
    DialectTag tag;
    tag.dialect = Dialect::Rpc;
    tag.version_key = message.version_key;
    tag.id = message.id;
    return tag;
}

json encode_response(const DialectTag& tag, const DispatchOutcome& outcome) {
    switch (tag.dialect) {
        case Dialect::Legacy:
            return encode_legacy(tag, outcome);
        case Dialect::Rpc:
        default:
            return encode_rpc(tag, outcome);
    }
}

}  // namespace rustmcp::protocol
