#pragma once

#include <mcphub/transport/i_transport.hpp>
#include <mcphub/transport/transport_factory.hpp>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcphub {
namespace testing {

// ---------------------------------------------------------------------------
// MockServer: scripted behaviour of one MCP server, shared by every
// MockTransport created for it (a reconnect builds a new transport).
//
// Usage:
//   auto server = std::make_shared<MockServer>();
//   server->SetResult("tools/list", {{"tools", json::array({...})}});
//   MockTransport transport(server);
//
// "initialize" answers with a minimal handshake unless scripted otherwise.
// Unscripted methods fail with a JSON-RPC "Method not found" error.
// ---------------------------------------------------------------------------

struct RecordedRequest {
    jsonrpc::RequestId id = 0;
    std::string method;
    nlohmann::json params;
};

using RequestHandler = std::function<Result<nlohmann::json, Error>(const nlohmann::json& params)>;

class MockServer {
public:
    MockServer() {
        SetResult("initialize", {{"protocolVersion", jsonrpc::kMcpProtocolVersion},
                                 {"serverInfo", {{"name", "mock"}, {"version", "1.0"}}},
                                 {"capabilities", nlohmann::json::object()}});
    }

    void SetResult(const std::string& method, nlohmann::json result) {
        SetHandler(method, [result](const nlohmann::json&) {
            return Result<nlohmann::json, Error>::Ok(result);
        });
    }

    void SetError(const std::string& method, Error error) {
        SetHandler(method, [error](const nlohmann::json&) {
            return Result<nlohmann::json, Error>::Err(error);
        });
    }

    void SetHandler(const std::string& method, RequestHandler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_[method] = std::move(handler);
    }

    void SetConnectError(std::optional<Error> error) {
        std::lock_guard<std::mutex> lock(mutex_);
        connect_error_ = std::move(error);
    }

    // -- Called by MockTransport ---------------------------------------------

    Result<void, Error> OnConnect() {
        std::lock_guard<std::mutex> lock(mutex_);
        ++connect_count_;
        if (connect_error_.has_value()) {
            return Result<void, Error>::Err(*connect_error_);
        }
        return Result<void, Error>::Ok();
    }

    Result<nlohmann::json, Error> OnRequest(jsonrpc::RequestId id, const std::string& method,
                                            const nlohmann::json& params) {
        RequestHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back({id, method, params});
            auto it = handlers_.find(method);
            if (it != handlers_.end()) {
                handler = it->second;
            }
        }
        if (!handler) {
            return Result<nlohmann::json, Error>::Err(Error::FromRpcError(
                method, "mock", jsonrpc::kMethodNotFound, "Method not found: " + method));
        }
        return handler(params);
    }

    void OnNotification(const std::string& method) {
        std::lock_guard<std::mutex> lock(mutex_);
        notifications_.push_back(method);
    }

    void OnDisconnect() {
        std::lock_guard<std::mutex> lock(mutex_);
        ++disconnect_count_;
    }

    // -- Inspection -------------------------------------------------------------

    std::vector<RecordedRequest> Requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    std::vector<RecordedRequest> RequestsFor(const std::string& method) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<RecordedRequest> matching;
        for (const auto& r : requests_) {
            if (r.method == method) {
                matching.push_back(r);
            }
        }
        return matching;
    }

    std::vector<std::string> Notifications() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return notifications_;
    }

    int ConnectCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connect_count_;
    }

    int DisconnectCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return disconnect_count_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, RequestHandler> handlers_;
    std::optional<Error> connect_error_;
    std::vector<RecordedRequest> requests_;
    std::vector<std::string> notifications_;
    int connect_count_ = 0;
    int disconnect_count_ = 0;
};

class MockTransport : public ITransport {
public:
    explicit MockTransport(std::shared_ptr<MockServer> server,
                           TransportKind kind = TransportKind::Stdio)
        : server_(std::move(server)), kind_(kind) {}

    Result<void, Error> Connect() override {
        return server_->OnConnect();
    }

    Result<nlohmann::json, Error> SendRequest(jsonrpc::RequestId id, const std::string& method,
                                              const nlohmann::json& params) override {
        return server_->OnRequest(id, method, params);
    }

    Result<void, Error> SendNotification(const std::string& method,
                                         const nlohmann::json&) override {
        server_->OnNotification(method);
        return Result<void, Error>::Ok();
    }

    void Disconnect() override {
        server_->OnDisconnect();
    }

    [[nodiscard]] TransportKind Kind() const override { return kind_; }

private:
    std::shared_ptr<MockServer> server_;
    TransportKind kind_;
};

// Transport factory over a set of scripted servers keyed by server id.
// Unknown ids get a fresh server with the default handshake only.
class MockServerFarm {
public:
    std::shared_ptr<MockServer> Server(const std::string& server_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& server = servers_[server_id];
        if (!server) {
            server = std::make_shared<MockServer>();
        }
        return server;
    }

    TransportFactory Factory() {
        return [this](const ServerConfig& config) -> std::unique_ptr<ITransport> {
            return std::make_unique<MockTransport>(Server(config.id), KindOf(config.transport));
        };
    }

private:
    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<MockServer>> servers_;
};

// A tools/list entry.
inline nlohmann::json ToolEntry(const std::string& name, const std::string& description = "") {
    return {{"name", name},
            {"description", description},
            {"inputSchema", {{"type", "object"}, {"properties", nlohmann::json::object()}}}};
}

// A tools/call result with one text block.
inline nlohmann::json TextResult(const std::string& text, bool is_error = false) {
    return {{"content", nlohmann::json::array({{{"type", "text"}, {"text", text}}})},
            {"isError", is_error}};
}

} // namespace testing
} // namespace mcphub
