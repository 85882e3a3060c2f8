#include <stdexcept>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "bridge/process_bridge.hpp"
#include "core/errors/server_errors.hpp"
#include "dispatch/dispatcher.hpp"
#include "tools/analysis_tools.hpp"
#include "tools/history_store.hpp"
#include "tools/tool_registry.hpp"

namespace {

using nlohmann::json;
using rustmcp::core::errors::ErrorCategory;
using rustmcp::core::errors::Result;
using rustmcp::core::errors::ServerError;
using rustmcp::dispatch::Dispatcher;
using rustmcp::tools::ResourceDescriptor;
using rustmcp::tools::ResourceTable;
using rustmcp::tools::ToolDescriptor;
using rustmcp::tools::ToolRegistry;

json echo_schema() {
    return json{{"type", "object"},
                {"properties", {{"text", {{"type", "string"}}}}},
                {"required", {"text"}}};
}

class DispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        ToolDescriptor echo;
        echo.name = "echo";
        echo.description = "Echoes text";
        echo.input_schema = echo_schema();
        echo.handler = [this](const json& params) -> Result<json> {
            ++echo_calls;
            return json{{"text", params.at("text")}};
        };
        ASSERT_FALSE(rustmcp::core::errors::is_error(registry.register_tool(echo)));

        ToolDescriptor failing;
        failing.name = "fail";
        failing.handler = [](const json&) -> Result<json> {
            return ServerError{ErrorCategory::Execution, "disk on fire", "disk_on_fire"};
        };
        ASSERT_FALSE(rustmcp::core::errors::is_error(registry.register_tool(failing)));

        ToolDescriptor throwing;
        throwing.name = "throw";
        throwing.handler = [](const json&) -> Result<json> {
            throw std::runtime_error("unexpected");
        };
        ASSERT_FALSE(rustmcp::core::errors::is_error(registry.register_tool(throwing)));

        ResourceDescriptor guide;
        guide.name = "Guide";
        guide.description = "A guide";
        guide.uri = "test://guide";
        guide.kind = "guide";
        guide.data = {{"pages", 3}};
        ASSERT_FALSE(rustmcp::core::errors::is_error(resources.register_resource(guide)));
    }

    json send(const json& message) {
        return dispatcher.handle_raw(message.dump()).message;
    }

    ToolRegistry registry;
    ResourceTable resources;
    Dispatcher dispatcher{registry, resources, {"test-server", "9.9.9"}};
    int echo_calls = 0;
};

TEST_F(DispatcherTest, InitializeReportsServerInfoAndCapabilities) {
    json response = send({{"version", "2.0"}, {"id", 1}, {"method", "initialize"}});
    EXPECT_EQ(response.at("version"), "2.0");
    EXPECT_EQ(response.at("id"), 1);

    const json& result = response.at("result");
    EXPECT_EQ(result.at("protocolVersion"), "0.1.0");
    EXPECT_EQ(result.at("serverInfo"), json({{"name", "test-server"}, {"version", "9.9.9"}}));
    EXPECT_EQ(result.at("capabilities"), json({{"tools", true}, {"resources", true}}));
}

TEST_F(DispatcherTest, PingReturnsEmptyObject) {
    json response = send({{"jsonrpc", "2.0"}, {"id", "p-1"}, {"method", "ping"}});
    EXPECT_EQ(response.at("jsonrpc"), "2.0");
    EXPECT_EQ(response.at("id"), "p-1");
    EXPECT_EQ(response.at("result"), json::object());
}

TEST_F(DispatcherTest, ToolsListDescribesEveryTool) {
    json response = send({{"version", "2.0"}, {"id", 2}, {"method", "tools/list"}});
    const json& tools = response.at("result").at("tools");
    ASSERT_EQ(tools.size(), 3u);
    EXPECT_EQ(tools[0].at("name"), "echo");
    EXPECT_EQ(tools[0].at("description"), "Echoes text");
    EXPECT_EQ(tools[0].at("inputSchema"), echo_schema());
}

TEST_F(DispatcherTest, ResourcesListOmitsData) {
    json response = send({{"version", "2.0"}, {"id", 3}, {"method", "resources/list"}});
    const json& list = response.at("result").at("resources");
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0], json({{"name", "Guide"},
                             {"description", "A guide"},
                             {"uri", "test://guide"},
                             {"type", "guide"}}));
}

TEST_F(DispatcherTest, ResourcesReadByNameOrUri) {
    json by_name = send({{"version", "2.0"},
                         {"id", 4},
                         {"method", "resources/read"},
                         {"params", {{"name", "Guide"}}}});
    EXPECT_EQ(by_name.at("result").at("data"), json({{"pages", 3}}));

    json by_uri = send({{"version", "2.0"},
                        {"id", 5},
                        {"method", "resources/read"},
                        {"params", {{"uri", "test://guide"}}}});
    EXPECT_EQ(by_uri.at("result").at("name"), "Guide");
}

TEST_F(DispatcherTest, ResourcesReadUnknownIsInvalidParams) {
    json response = send({{"version", "2.0"},
                          {"id", 6},
                          {"method", "resources/read"},
                          {"params", {{"name", "Missing"}}}});
    EXPECT_EQ(response.at("error").at("code"), -32602);
    EXPECT_EQ(response.at("error").at("message"), "Resource not found: Missing");
}

TEST_F(DispatcherTest, UnknownMethodIsMethodNotFound) {
    json response = send({{"version", "2.0"}, {"id", 7}, {"method", "tools/destroy"}});
    EXPECT_EQ(response.at("id"), 7);
    EXPECT_EQ(response.at("error").at("code"), -32601);
    EXPECT_EQ(response.at("error").at("message"), "Method not found: tools/destroy");
}

TEST_F(DispatcherTest, ToolsCallRunsHandlerWithParams) {
    json response = send({{"version", "2.0"},
                          {"id", 8},
                          {"method", "tools/call"},
                          {"params", {{"name", "echo"}, {"params", {{"text", "hi"}}}}}});
    EXPECT_EQ(response.at("result"), json({{"text", "hi"}}));
    EXPECT_EQ(echo_calls, 1);
}

TEST_F(DispatcherTest, ToolsCallAcceptsArgumentsKey) {
    json response = send({{"version", "2.0"},
                          {"id", 9},
                          {"method", "tools/call"},
                          {"params", {{"name", "echo"}, {"arguments", {{"text", "yo"}}}}}});
    EXPECT_EQ(response.at("result").at("text"), "yo");
}

TEST_F(DispatcherTest, ToolsCallUnknownToolIsMethodNotFound) {
    json response = send({{"version", "2.0"},
                          {"id", 10},
                          {"method", "tools/call"},
                          {"params", {{"name", "rust.format"}}}});
    EXPECT_EQ(response.at("error").at("code"), -32601);
    EXPECT_EQ(response.at("error").at("message"), "Method not found: rust.format");
}

TEST_F(DispatcherTest, ToolsCallWithoutNameIsInvalidParams) {
    json response = send({{"version", "2.0"}, {"id", 11}, {"method", "tools/call"}});
    EXPECT_EQ(response.at("error").at("code"), -32602);
}

TEST_F(DispatcherTest, InvalidArgumentsNeverReachHandler) {
    json response = send({{"version", "2.0"},
                          {"id", 12},
                          {"method", "tools/call"},
                          {"params", {{"name", "echo"}, {"params", {{"text", 5}}}}}});
    EXPECT_EQ(response.at("error").at("code"), -32602);
    EXPECT_EQ(response.at("error").at("message"), "Invalid params: params.text: expected string");
    EXPECT_EQ(echo_calls, 0);
}

TEST_F(DispatcherTest, HandlerErrorIsInternalError) {
    json response = send({{"version", "2.0"},
                          {"id", 13},
                          {"method", "tools/call"},
                          {"params", {{"name", "fail"}}}});
    EXPECT_EQ(response.at("error").at("code"), -32603);
    EXPECT_EQ(response.at("error").at("message"), "disk on fire");
}

TEST_F(DispatcherTest, HandlerExceptionIsInternalError) {
    json response = send({{"version", "2.0"},
                          {"id", 14},
                          {"method", "tools/call"},
                          {"params", {{"name", "throw"}}}});
    EXPECT_EQ(response.at("id"), 14);
    EXPECT_EQ(response.at("error").at("code"), -32603);
}

TEST_F(DispatcherTest, MalformedJsonIsParseErrorWithNullId) {
    auto reply = dispatcher.handle_raw("{\"version\": \"2.0\", \"id\": ");
    ASSERT_TRUE(reply.rejected.has_value());
    EXPECT_EQ(reply.rejected->code, rustmcp::protocol::RpcErrorCode::ParseError);
    EXPECT_EQ(reply.message.at("version"), "2.0");
    EXPECT_TRUE(reply.message.at("id").is_null());
    EXPECT_EQ(reply.message.at("error").at("code"), -32700);
}

TEST_F(DispatcherTest, UnrecognisedObjectIsInvalidRequest) {
    auto reply = dispatcher.handle_raw(R"({"version":"2.0","id":15})");
    ASSERT_TRUE(reply.rejected.has_value());
    EXPECT_EQ(reply.message.at("id"), 15);
    EXPECT_EQ(reply.message.at("error").at("code"), -32600);
}

TEST_F(DispatcherTest, RejectAnswersInRequestDialectWithoutRunningTool) {
    const auto busy = rustmcp::protocol::internal_error("Server busy");

    auto rpc = dispatcher.reject_raw(
        R"({"jsonrpc":"2.0","id":"r1","method":"tools/call","params":{"name":"echo","params":{"text":"x"}}})",
        busy);
    EXPECT_FALSE(rpc.rejected.has_value());
    EXPECT_EQ(rpc.message.at("jsonrpc"), "2.0");
    EXPECT_EQ(rpc.message.at("id"), "r1");
    EXPECT_EQ(rpc.message.at("error").at("code"), -32603);
    EXPECT_EQ(rpc.message.at("error").at("message"), "Server busy");

    auto legacy = dispatcher.reject_raw(R"({"type":"echo","data":{"text":"x"},"id":7})", busy);
    EXPECT_EQ(legacy.message.at("type"), "error");
    EXPECT_EQ(legacy.message.at("data").at("message"), "Server busy");
    EXPECT_EQ(echo_calls, 0);

    auto garbage = dispatcher.reject_raw("{not json", busy);
    ASSERT_TRUE(garbage.rejected.has_value());
    EXPECT_EQ(garbage.message.at("error").at("code"), -32700);
}

TEST_F(DispatcherTest, LegacyMessageMapsToTool) {
    json response = send({{"type", "echo"}, {"data", {{"text", "legacy"}}}});
    EXPECT_EQ(response, json({{"type", "echo.result"}, {"data", {{"text", "legacy"}}}}));
}

TEST_F(DispatcherTest, LegacyUnknownTypeIsLegacyError) {
    json response = send({{"type", "rust.format"}, {"data", json::object()}, {"id", "x"}});
    EXPECT_EQ(response.at("type"), "error");
    EXPECT_EQ(response.at("data").at("message"), "Unsupported message type: rust.format");
    EXPECT_EQ(response.at("id"), "x");
    EXPECT_FALSE(response.contains("version"));
}

TEST_F(DispatcherTest, LegacyValidationFailureIsLegacyError) {
    json response = send({{"type", "echo"}, {"data", json::object()}});
    EXPECT_EQ(response.at("type"), "error");
    EXPECT_EQ(response.at("data").at("message"),
              "Invalid params: params: missing required property 'text'");
    EXPECT_EQ(echo_calls, 0);
}

TEST_F(DispatcherTest, LegacySchemaListsToolsAndResources) {
    json response = send({{"type", "mcp.schema"}});
    EXPECT_EQ(response.at("type"), "mcp.schema.result");
    EXPECT_EQ(response.at("data").at("version"), "0.1.0");
    EXPECT_EQ(response.at("data").at("tools").size(), 3u);
    EXPECT_EQ(response.at("data").at("resources").size(), 1u);
}

TEST(DispatcherCapabilitiesTest, EmptyRegistryAdvertisesNothing) {
    ToolRegistry registry;
    ResourceTable resources;
    Dispatcher dispatcher(registry, resources);

    auto reply = dispatcher.handle_raw(R"({"version":"2.0","id":1,"method":"initialize"})");
    EXPECT_EQ(reply.message.at("result").at("capabilities"),
              json({{"tools", false}, {"resources", false}}));
    EXPECT_EQ(reply.message.at("result").at("serverInfo").at("name"), "rustmcp");
}

TEST(DispatcherAnalysisTest, AnalyzeWithoutBinaryIsDegradedNotError) {
    rustmcp::bridge::ProcessBridge bridge(rustmcp::bridge::BridgeConfig{});
    rustmcp::tools::HistoryStore history;
    ToolRegistry registry;
    ResourceTable resources;
    ASSERT_FALSE(rustmcp::core::errors::is_error(
        rustmcp::tools::register_analysis_tools(registry, bridge, history)));
    ASSERT_FALSE(rustmcp::core::errors::is_error(
        rustmcp::tools::register_reference_resources(resources)));
    Dispatcher dispatcher(registry, resources);

    auto reply = dispatcher.handle_raw(
        R"({"version":"2.0","id":"a1","method":"tools/call",)"
        R"("params":{"name":"rust.analyze","params":{"code":"fn main() {}"}}})");
    const json& response = reply.message;
    EXPECT_EQ(response.at("id"), "a1");
    ASSERT_TRUE(response.contains("result"));
    EXPECT_FALSE(response.contains("error"));

    const json& result = response.at("result");
    EXPECT_EQ(result.at("success"), false);
    EXPECT_EQ(result.at("fileName"), "unnamed_code.rs");
    ASSERT_EQ(result.at("diagnostics").size(), 1u);
    EXPECT_EQ(result.at("diagnostics")[0].at("severity"), "error");
    EXPECT_EQ(result.at("diagnostics")[0].at("source"), "bridge");
    EXPECT_EQ(result.at("diagnostics")[0].at("message"),
              "Rust analysis service is unavailable");
    EXPECT_EQ(history.total(), 0u);
}

}  // namespace
