#include <arpa/inet.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <netinet/in.h>
#include <optional>
#include <poll.h>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/server_config.hpp"
#include "dispatch/dispatcher.hpp"
#include "session/server.hpp"
#include "tools/tool_registry.hpp"
#include "transport/event_channel.hpp"
#include "transport/socket_transport.hpp"

namespace {

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;

using nlohmann::json;
using rustmcp::core::errors::get_error;
using rustmcp::core::errors::is_error;
using rustmcp::core::errors::Result;
using rustmcp::transport::EventChannel;
using rustmcp::transport::kMaxMessageBytes;
using rustmcp::transport::SocketConnection;
using rustmcp::transport::SocketListener;

constexpr auto kWait = std::chrono::milliseconds(3000);
constexpr auto kLongWait = std::chrono::milliseconds(20000);

// Loopback WebSocket client. Every operation runs under a deadline so a
// misbehaving server fails the test instead of hanging it.
class TestClient {
public:
    explicit TestClient(std::uint16_t port) : ws_(io_) {
        beast::error_code ec;
        beast::get_lowest_layer(ws_).connect(
            tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port), ec);
        if (ec) {
            return;
        }
        const std::string host = "127.0.0.1:" + std::to_string(port);
        ec = run_until([this, &host](auto handler) { ws_.async_handshake(host, "/", handler); },
                       kWait);
        connected_ = !ec;
    }

    bool connected() const { return connected_; }

    bool send_text(const std::string& text,
                   std::chrono::milliseconds timeout = kWait) {
        ws_.text(true);
        return !run_until(
            [this, &text](auto handler) { ws_.async_write(boost::asio::buffer(text), handler); },
            timeout);
    }

    bool send_json(const json& message) { return send_text(message.dump()); }

    // Next message, or nullopt on timeout or when the server closed the connection.
    std::optional<json> receive() {
        beast::flat_buffer buffer;
        const auto ec = run_until(
            [this, &buffer](auto handler) { ws_.async_read(buffer, handler); }, kWait);
        if (ec) {
            return std::nullopt;
        }
        return json::parse(beast::buffers_to_string(buffer.data()));
    }

    // True once the server has closed the connection.
    bool closed_by_peer() {
        const auto deadline = std::chrono::steady_clock::now() + kLongWait;
        while (std::chrono::steady_clock::now() < deadline) {
            beast::flat_buffer buffer;
            const auto ec = run_until(
                [this, &buffer](auto handler) { ws_.async_read(buffer, handler); }, kLongWait);
            if (ec == boost::asio::error::timed_out) {
                return false;
            }
            if (ec) {
                return true;
            }
        }
        return false;
    }

private:
    template <typename Start>
    beast::error_code run_until(Start start, std::chrono::milliseconds timeout) {
        std::optional<beast::error_code> result;
        start([&result](beast::error_code ec, auto&&...) { result = ec; });
        io_.restart();
        io_.run_for(timeout);
        if (!result.has_value()) {
            beast::get_lowest_layer(ws_).close();
            io_.restart();
            io_.run();
            return boost::asio::error::timed_out;
        }
        return *result;
    }

    boost::asio::io_context io_;
    websocket::stream<beast::tcp_stream> ws_;
    bool connected_ = false;
};

// Plain TCP client for peers that never complete a WebSocket handshake.
class RawClient {
public:
    explicit RawClient(std::uint16_t port) {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in address{};
        address.sin_family = AF_INET;
        address.sin_port = htons(port);
        ::inet_pton(AF_INET, "127.0.0.1", &address.sin_addr);
        connected_ = fd_ >= 0 &&
                     ::connect(fd_, reinterpret_cast<sockaddr*>(&address), sizeof(address)) == 0;
    }

    ~RawClient() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    bool connected() const { return connected_; }

    bool send_raw(const std::string& bytes) {
        return ::send(fd_, bytes.data(), bytes.size(), MSG_NOSIGNAL) ==
               static_cast<ssize_t>(bytes.size());
    }

    // Skips whatever the server answers and reports whether it then hung up.
    bool closed_by_peer() {
        const auto deadline = std::chrono::steady_clock::now() + kWait;
        while (true) {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                return false;
            }
            pollfd pfd{fd_, POLLIN, 0};
            if (::poll(&pfd, 1, static_cast<int>(remaining.count())) <= 0) {
                return false;
            }
            char buffer[512];
            if (::recv(fd_, buffer, sizeof(buffer), 0) <= 0) {
                return true;
            }
        }
    }

private:
    int fd_ = -1;
    bool connected_ = false;
};

class SocketServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        rustmcp::tools::ToolDescriptor slow;
        slow.name = "slow";
        slow.handler = [](const json& params) -> Result<json> {
            std::this_thread::sleep_for(std::chrono::milliseconds(params.value("delay_ms", 0)));
            return json{{"done", true}};
        };
        ASSERT_FALSE(is_error(registry.register_tool(slow)));
        dispatcher = std::make_unique<rustmcp::dispatch::Dispatcher>(registry, resources);

        rustmcp::core::config::ServerConfig config;
        config.enable_socket = true;
        config.enable_stdio = false;
        config.host = "127.0.0.1";
        config.port = 0;
        server = std::make_unique<rustmcp::session::Server>(config, *dispatcher);
        ASSERT_FALSE(is_error(server->start()));
        ASSERT_NE(server->socket_port(), 0);
    }

    void TearDown() override {
        server->stop();
    }

    void wait_for_no_sessions() {
        const auto deadline = std::chrono::steady_clock::now() + kWait;
        while (server->live_sessions() > 0 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    }

    rustmcp::tools::ToolRegistry registry;
    rustmcp::tools::ResourceTable resources;
    std::unique_ptr<rustmcp::dispatch::Dispatcher> dispatcher;
    std::unique_ptr<rustmcp::session::Server> server;
};

TEST_F(SocketServerTest, AnswersInitializeOverWebSocket) {
    TestClient client(server->socket_port());
    ASSERT_TRUE(client.connected());
    ASSERT_TRUE(client.send_json({{"version", "2.0"}, {"id", 1}, {"method", "initialize"}}));

    auto response = client.receive();
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->at("id"), 1);
    EXPECT_EQ(response->at("result").at("protocolVersion"), "0.1.0");
    EXPECT_EQ(response->at("result").at("capabilities").at("tools"), true);
}

TEST_F(SocketServerTest, RepliesOnlyToOriginatingConnection) {
    TestClient first(server->socket_port());
    TestClient second(server->socket_port());
    ASSERT_TRUE(first.connected());
    ASSERT_TRUE(second.connected());

    ASSERT_TRUE(first.send_json({{"version", "2.0"}, {"id", "from-first"}, {"method", "ping"}}));
    ASSERT_TRUE(second.send_json({{"version", "2.0"},
                                  {"id", "from-second"},
                                  {"method", "tools/call"},
                                  {"params", {{"name", "slow"}, {"params", {{"delay_ms", 200}}}}}}));

    auto first_reply = first.receive();
    auto second_reply = second.receive();
    ASSERT_TRUE(first_reply.has_value());
    ASSERT_TRUE(second_reply.has_value());
    EXPECT_EQ(first_reply->at("id"), "from-first");
    EXPECT_EQ(second_reply->at("id"), "from-second");
    EXPECT_EQ(second_reply->at("result").at("done"), true);
}

TEST_F(SocketServerTest, InvalidJsonMessageGetsParseError) {
    TestClient client(server->socket_port());
    ASSERT_TRUE(client.connected());
    ASSERT_TRUE(client.send_text("{\"version\":"));

    auto response = client.receive();
    ASSERT_TRUE(response.has_value());
    EXPECT_TRUE(response->at("id").is_null());
    EXPECT_EQ(response->at("error").at("code"), -32700);
}

TEST_F(SocketServerTest, OversizedMessageClosesConnection) {
    TestClient client(server->socket_port());
    ASSERT_TRUE(client.connected());

    // The server may hang up before the whole message is out, so the write result is not checked.
    static_cast<void>(client.send_text(std::string(kMaxMessageBytes + 1, 'x'), kLongWait));
    EXPECT_TRUE(client.closed_by_peer());

    // The listener keeps serving other connections.
    TestClient other(server->socket_port());
    ASSERT_TRUE(other.connected());
    ASSERT_TRUE(other.send_json({{"version", "2.0"}, {"id", 2}, {"method", "ping"}}));
    auto response = other.receive();
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->at("id"), 2);
}

TEST_F(SocketServerTest, NonWebSocketPeerIsDisconnected) {
    RawClient client(server->socket_port());
    ASSERT_TRUE(client.connected());
    ASSERT_TRUE(client.send_raw("hello there\r\n\r\n"));

    EXPECT_TRUE(client.closed_by_peer());
    wait_for_no_sessions();
    EXPECT_EQ(server->live_sessions(), 0u);
}

TEST_F(SocketServerTest, FinishedSessionsAreReaped) {
    {
        TestClient client(server->socket_port());
        ASSERT_TRUE(client.connected());
        ASSERT_TRUE(client.send_json({{"version", "2.0"}, {"id", 3}, {"method", "ping"}}));
        ASSERT_TRUE(client.receive().has_value());
    }

    wait_for_no_sessions();
    EXPECT_EQ(server->live_sessions(), 0u);
}

TEST(SocketConnectionTest, CloseInterruptsWriteToStalledPeer) {
    SocketListener listener("127.0.0.1", 0);
    ASSERT_FALSE(is_error(listener.listen()));

    std::promise<std::unique_ptr<SocketConnection>> accepted;
    auto accepted_future = accepted.get_future();
    ASSERT_FALSE(is_error(listener.start([&accepted](std::unique_ptr<SocketConnection> connection) {
        accepted.set_value(std::move(connection));
    })));

    // The handshake needs the server side running, so the client connects concurrently.
    const std::uint16_t port = listener.bound_port();
    auto client_future = std::async(std::launch::async,
                                    [port]() { return std::make_unique<TestClient>(port); });
    ASSERT_EQ(accepted_future.wait_for(kWait), std::future_status::ready);

    EventChannel channel;
    std::unique_ptr<SocketConnection> connection = accepted_future.get();
    ASSERT_FALSE(is_error(connection->start(channel)));
    auto client = client_future.get();
    ASSERT_TRUE(client->connected());

    // The client never reads, so the socket buffers fill and the writer stalls.
    const json big = {{"payload", std::string(1024 * 1024, 'x')}};
    std::atomic<bool> send_failed{false};
    std::thread writer([&]() {
        while (!is_error(connection->send(big))) {
        }
        send_failed.store(true);
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    auto closing = std::async(std::launch::async, [&connection]() { connection->close(); });
    EXPECT_EQ(closing.wait_for(kWait), std::future_status::ready);

    writer.join();
    EXPECT_TRUE(send_failed.load());
    EXPECT_TRUE(is_error(connection->send(json::object())));
}

TEST(SocketListenerTest, BindFailureIsReported) {
    SocketListener first("127.0.0.1", 0);
    ASSERT_FALSE(is_error(first.listen()));

    SocketListener second("127.0.0.1", first.bound_port());
    auto status = second.listen();
    ASSERT_TRUE(is_error(status));
    EXPECT_EQ(get_error(status).code, "listen_failed");
}

}  // namespace
