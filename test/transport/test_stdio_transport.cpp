#include <catch2/catch_test_macros.hpp>

#include <mcphub/transport/stdio_transport.hpp>

#include "mocks/mock_process_host.hpp"

using namespace mcphub;
using namespace mcphub::testing;
using nlohmann::json;

namespace {

StdioTransportConfig EchoConfig() {
    return StdioTransportConfig{"mcp-server-everything", {"--stdio"}, {{"DEBUG", "1"}}};
}

// Answers every request with {"echo": method} under the same id.
LineResponder EchoResponder() {
    return [](const std::string& line) {
        auto request = json::parse(line);
        json reply = {{"jsonrpc", "2.0"},
                      {"id", request["id"]},
                      {"result", {{"echo", request["method"]}}}};
        return Result<std::string, Error>::Ok(reply.dump());
    };
}

} // anonymous namespace

// ===========================================================================
// Connect
// ===========================================================================

TEST_CASE("StdioTransport: Connect spawns through the host", "[transport][stdio]") {
    MockProcessHost host;
    StdioTransport transport(host, "everything", EchoConfig());

    auto r = transport.Connect();
    REQUIRE(r.IsOk());
    REQUIRE(host.Spawned().size() == 1);
    CHECK(host.Spawned()[0].command == "mcp-server-everything");
    CHECK(host.Spawned()[0].env.at("DEBUG") == "1");
    CHECK(host.IsConnected("everything"));
    CHECK(transport.Kind() == TransportKind::Stdio);
}

TEST_CASE("StdioTransport: spawn failure names the command", "[transport][stdio]") {
    MockProcessHost host;
    host.SetSpawnError(Error{"spawn", "x", std::nullopt, "No such file or directory",
                             std::nullopt, ErrorCategory::Transport});
    StdioTransport transport(host, "everything", EchoConfig());

    auto r = transport.Connect();
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Transport);
    CHECK(r.Error().target == "everything");
    CHECK(r.Error().message.find("mcp-server-everything") != std::string::npos);
    CHECK(r.Error().message.find("No such file") != std::string::npos);
}

// ===========================================================================
// Requests
// ===========================================================================

TEST_CASE("StdioTransport: request line carries id, method and params", "[transport][stdio]") {
    MockProcessHost host;
    host.SetResponder(EchoResponder());
    StdioTransport transport(host, "everything", EchoConfig());
    REQUIRE(transport.Connect().IsOk());

    auto r = transport.SendRequest(5, "tools/list", json{{"cursor", "c1"}});
    REQUIRE(r.IsOk());
    CHECK(r.Value()["echo"] == "tools/list");

    REQUIRE(host.Requests().size() == 1);
    auto sent = json::parse(host.Requests()[0]);
    CHECK(sent["jsonrpc"] == "2.0");
    CHECK(sent["id"] == 5);
    CHECK(sent["params"]["cursor"] == "c1");
}

TEST_CASE("StdioTransport: request timeout is handed to the host", "[transport][stdio]") {
    MockProcessHost host;
    host.SetResponder(EchoResponder());
    TransportOptions options;
    options.request_timeout = std::chrono::milliseconds(1500);
    StdioTransport transport(host, "everything", EchoConfig(), options);
    REQUIRE(transport.Connect().IsOk());

    REQUIRE(transport.SendRequest(1, "ping", json::object()).IsOk());
    CHECK(host.LastTimeout() == std::chrono::milliseconds(1500));
}

TEST_CASE("StdioTransport: JSON-RPC error reply becomes Protocol error", "[transport][stdio]") {
    MockProcessHost host;
    host.SetResponder([](const std::string& line) {
        auto request = json::parse(line);
        json reply = {{"jsonrpc", "2.0"},
                      {"id", request["id"]},
                      {"error", {{"code", -32601}, {"message", "Method not found"}}}};
        return Result<std::string, Error>::Ok(reply.dump());
    });
    StdioTransport transport(host, "everything", EchoConfig());
    REQUIRE(transport.Connect().IsOk());

    auto r = transport.SendRequest(1, "prompts/list", json::object());
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Protocol);
    CHECK(r.Error().rpc_code == -32601);
    CHECK(r.Error().operation == "stdio prompts/list");
}

TEST_CASE("StdioTransport: host failure keeps its category", "[transport][stdio]") {
    MockProcessHost host;
    host.SetResponder([](const std::string&) {
        return Result<std::string, Error>::Err(Error{"ProcessRequest", "everything",
                                                     std::nullopt, "No response within 10 ms",
                                                     std::nullopt, ErrorCategory::Timeout});
    });
    StdioTransport transport(host, "everything", EchoConfig());
    REQUIRE(transport.Connect().IsOk());

    auto r = transport.SendRequest(1, "tools/call", json::object());
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Timeout);
    CHECK(r.Error().operation == "stdio tools/call");
}

TEST_CASE("StdioTransport: malformed reply line", "[transport][stdio]") {
    MockProcessHost host;
    host.SetResponder([](const std::string&) {
        return Result<std::string, Error>::Ok("{truncated");
    });
    StdioTransport transport(host, "everything", EchoConfig());
    REQUIRE(transport.Connect().IsOk());

    auto r = transport.SendRequest(1, "tools/list", json::object());
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Protocol);
}

TEST_CASE("StdioTransport: requests before Connect are refused", "[transport][stdio]") {
    MockProcessHost host;
    StdioTransport transport(host, "everything", EchoConfig());

    auto r = transport.SendRequest(1, "tools/list", json::object());
    REQUIRE(r.IsErr());
    CHECK(r.Error().message == "stdio transport is not connected");
    CHECK(host.Requests().empty());
    CHECK(transport.SendNotification("notifications/initialized", json::object()).IsErr());
}

// ===========================================================================
// Notifications and disconnect
// ===========================================================================

TEST_CASE("StdioTransport: notification line has no id", "[transport][stdio]") {
    MockProcessHost host;
    StdioTransport transport(host, "everything", EchoConfig());
    REQUIRE(transport.Connect().IsOk());

    REQUIRE(transport.SendNotification("notifications/initialized", json::object()).IsOk());
    REQUIRE(host.Notifications().size() == 1);
    auto sent = json::parse(host.Notifications()[0]);
    CHECK_FALSE(sent.contains("id"));
    CHECK(sent["method"] == "notifications/initialized");
}

TEST_CASE("StdioTransport: Disconnect is idempotent", "[transport][stdio]") {
    MockProcessHost host;
    {
        StdioTransport transport(host, "everything", EchoConfig());
        REQUIRE(transport.Connect().IsOk());
        transport.Disconnect();
        transport.Disconnect();
        CHECK_FALSE(host.IsConnected("everything"));
    }
    // Destructor after an explicit Disconnect must not disconnect again.
    CHECK(host.Disconnected().size() == 1);
}
