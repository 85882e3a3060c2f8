#include "dispatch/dispatcher.hpp"

#include <exception>
#include <string>
#include <utility>
#include <variant>
#include "core/logging/logger.hpp"
#include "tools/schema_validator.hpp"

namespace rustmcp::dispatch {

using nlohmann::json;
using protocol::DispatchOutcome;
using protocol::DispatchSuccess;
using protocol::RpcError;

namespace {

DispatchOutcome success(json payload, std::string legacy_type = {}) {
    return DispatchSuccess{std::move(payload), std::move(legacy_type)};
}

}  // namespace

Dispatcher::Dispatcher(const tools::ToolRegistry& registry,
                       const tools::ResourceTable& resources, ServerInfo info)
    : registry_(registry), resources_(resources), info_(std::move(info)) {}

DispatchReply Dispatcher::handle_raw(const std::string& raw) const {
    const protocol::DecodedMessage decoded = protocol::decode(raw);

    DispatchReply reply;
    if (const auto* malformed = std::get_if<protocol::MalformedMessage>(&decoded)) {
        reply.rejected = malformed->error;
        reply.message = protocol::encode_response(protocol::tag_of(*malformed), malformed->error);
        return reply;
    }

    // Anything thrown past the handlers is still answered in the request's dialect.
    const auto* rpc = std::get_if<protocol::RpcEnvelope>(&decoded);
    const auto* legacy = std::get_if<protocol::LegacyEnvelope>(&decoded);
    const protocol::DialectTag tag = rpc != nullptr ? protocol::tag_of(*rpc)
                                                    : protocol::tag_of(*legacy);
    DispatchOutcome outcome;
    try {
        outcome = rpc != nullptr ? handle_rpc(*rpc) : handle_legacy(*legacy);
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Unhandled exception while dispatching: ") + e.what());
        outcome = protocol::internal_error(e.what());
    }
    reply.message = protocol::encode_response(tag, outcome);
    return reply;
}

DispatchReply Dispatcher::reject_raw(const std::string& raw, const RpcError& error) const {
    const protocol::DecodedMessage decoded = protocol::decode(raw);

    DispatchReply reply;
    if (const auto* malformed = std::get_if<protocol::MalformedMessage>(&decoded)) {
        reply.rejected = malformed->error;
        reply.message = protocol::encode_response(protocol::tag_of(*malformed), malformed->error);
        return reply;
    }
    const auto* rpc = std::get_if<protocol::RpcEnvelope>(&decoded);
    const protocol::DialectTag tag =
        rpc != nullptr ? protocol::tag_of(*rpc)
                       : protocol::tag_of(std::get<protocol::LegacyEnvelope>(decoded));
    reply.message = protocol::encode_response(tag, error);
    return reply;
}

DispatchOutcome Dispatcher::handle_rpc(const protocol::RpcEnvelope& envelope) const {
    const std::string& method = envelope.method;
    LOG_DEBUG("Dispatching method " + method);

    if (method == "initialize") {
        return initialize();
    }
    if (method == "tools/list") {
        return list_tools();
    }
    if (method == "resources/list") {
        return list_resources();
    }
    if (method == "resources/read") {
        return read_resource(envelope.params);
    }
    if (method == "tools/call") {
        return call_tool(envelope.params);
    }
    if (method == "ping") {
        return success(json::object());
    }
    return protocol::method_not_found(method);
}

DispatchOutcome Dispatcher::handle_legacy(const protocol::LegacyEnvelope& envelope) const {
    LOG_DEBUG("Dispatching legacy message " + envelope.type);

    if (envelope.type == kSchemaType) {
        return schema();
    }
    const tools::ToolDescriptor* tool = registry_.find(envelope.type);
    if (tool == nullptr) {
        return RpcError{protocol::RpcErrorCode::MethodNotFound,
                        "Unsupported message type: " + envelope.type};
    }
    return invoke(*tool, envelope.data);
}

DispatchOutcome Dispatcher::initialize() const {
    return success(json{
        {"protocolVersion", kProtocolVersion},
        {"serverInfo", {{"name", info_.name}, {"version", info_.version}}},
        {"capabilities",
         {{"tools", registry_.size() > 0}, {"resources", resources_.size() > 0}}}});
}

DispatchOutcome Dispatcher::list_tools() const {
    return success(json{{"tools", registry_.describe()}});
}

DispatchOutcome Dispatcher::list_resources() const {
    return success(json{{"resources", resources_.describe()}});
}

DispatchOutcome Dispatcher::read_resource(const json& params) const {
    const tools::ResourceDescriptor* resource = nullptr;
    std::string requested;

    auto name_it = params.find("name");
    auto uri_it = params.find("uri");
    if (name_it != params.end() && name_it->is_string()) {
        requested = name_it->get<std::string>();
        resource = resources_.find(requested);
    } else if (uri_it != params.end() && uri_it->is_string()) {
        requested = uri_it->get<std::string>();
        resource = resources_.find_by_uri(requested);
    } else {
        return protocol::invalid_params("resources/read requires a string 'name' or 'uri'");
    }

    if (resource == nullptr) {
        return RpcError{protocol::RpcErrorCode::InvalidParams, "Resource not found: " + requested};
    }
    return success(tools::to_json(*resource, true));
}

DispatchOutcome Dispatcher::call_tool(const json& params) const {
    auto name_it = params.find("name");
    if (name_it == params.end() || !name_it->is_string()) {
        return protocol::invalid_params("tools/call requires a string 'name'");
    }
    const std::string name = name_it->get<std::string>();

    const tools::ToolDescriptor* tool = registry_.find(name);
    if (tool == nullptr) {
        return protocol::method_not_found(name);
    }

    json arguments = json::object();
    for (const char* key : {"params", "arguments"}) {
        auto it = params.find(key);
        if (it != params.end() && !it->is_null()) {
            arguments = *it;
            break;
        }
    }
    return invoke(*tool, arguments);
}

DispatchOutcome Dispatcher::schema() const {
    return success(json{{"version", kProtocolVersion},
                        {"tools", registry_.describe()},
                        {"resources", resources_.describe()}},
                   std::string(kSchemaType) + ".result");
}

DispatchOutcome Dispatcher::invoke(const tools::ToolDescriptor& tool,
                                   const json& arguments) const {
    auto validation = tools::validate_against_schema(arguments, tool.input_schema);
    if (core::errors::is_error(validation)) {
        const auto& error = core::errors::get_error(validation);
        LOG_WARN("Rejected arguments for " + tool.name + ": " + error.message);
        return protocol::invalid_params(error.message);
    }

    auto result = tool.handler(arguments);
    if (core::errors::is_error(result)) {
        const auto& error = core::errors::get_error(result);
        LOG_ERROR("Tool " + tool.name + " failed [" + error.code + "]: " + error.message);
        return protocol::internal_error(error.message);
    }
    return success(core::errors::get_value(result), tool.legacy_result_type);
}

}  // namespace rustmcp::dispatch
