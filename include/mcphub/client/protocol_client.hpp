#pragma once

#include <mcphub/core/result.hpp>
#include <mcphub/protocol/types.hpp>
#include <mcphub/transport/i_transport.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcphub {

struct ClientInfo {
    std::string name = "mcphub";
    std::string version;
};

// What the server reported during the handshake.
struct ServerInfo {
    std::string name;
    std::string version;
    std::string protocol_version;
    nlohmann::json capabilities = nlohmann::json::object();
};

// ---------------------------------------------------------------------------
// ProtocolClient: one MCP session with one server.
//
// Connect() opens the transport and performs the handshake (initialize
// request, then the initialized notification). Discovery and invocation are
// refused until the handshake has completed. Request ids start at 1 and are
// never reused. Safe to call from several threads at once; the transport
// decides whether requests actually overlap on the wire.
// ---------------------------------------------------------------------------
class ProtocolClient {
public:
    ProtocolClient(ServerConfig config, std::unique_ptr<ITransport> transport,
                   ClientInfo client_info = {});
    ~ProtocolClient();

    ProtocolClient(const ProtocolClient&) = delete;
    ProtocolClient& operator=(const ProtocolClient&) = delete;

    Result<void, Error> Connect();

    Result<std::vector<Tool>, Error> ListTools();
    Result<std::vector<Resource>, Error> ListResources();

    // isError replies are returned as values; transport and protocol
    // failures come back as errors unchanged.
    Result<ToolCallResult, Error> CallTool(const ToolCallRequest& request);

    // Text of the first content entry, or "" if the resource has none.
    Result<std::string, Error> ReadResource(const std::string& uri);

    // Idempotent.
    void Disconnect();

    [[nodiscard]] const ServerConfig& Config() const { return config_; }
    [[nodiscard]] bool IsInitialized() const { return initialized_.load(); }
    [[nodiscard]] std::optional<ServerInfo> GetServerInfo() const;

private:
    Result<nlohmann::json, Error> Request(const std::string& method,
                                          const nlohmann::json& params);
    Result<void, Error> RequireInitialized(const std::string& operation) const;

    ServerConfig config_;
    std::unique_ptr<ITransport> transport_;
    ClientInfo client_info_;
    std::atomic<jsonrpc::RequestId> next_id_{0};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> disconnected_{false};

    mutable std::mutex info_mutex_;
    std::optional<ServerInfo> server_info_;
};

} // namespace mcphub
