#pragma once

#include <mcphub/transport/i_process_host.hpp>
#include <mcphub/transport/i_transport.hpp>

#include <atomic>
#include <string>

namespace mcphub {

// ---------------------------------------------------------------------------
// StdioTransport: JSON-RPC over a subprocess owned by an IProcessHost.
//
// Holds a reference to the host, not ownership: the host outlives every
// transport created against it.
// ---------------------------------------------------------------------------
class StdioTransport : public ITransport {
public:
    StdioTransport(IProcessHost& host,
                   std::string server_id,
                   StdioTransportConfig config,
                   TransportOptions options = {});
    ~StdioTransport() override;

    Result<void, Error> Connect() override;

    Result<nlohmann::json, Error> SendRequest(
        jsonrpc::RequestId id,
        const std::string& method,
        const nlohmann::json& params) override;

    Result<void, Error> SendNotification(
        const std::string& method,
        const nlohmann::json& params) override;

    void Disconnect() override;

    [[nodiscard]] TransportKind Kind() const override { return TransportKind::Stdio; }

private:
    IProcessHost& host_;
    std::string server_id_;
    StdioTransportConfig config_;
    TransportOptions options_;
    std::atomic<bool> connected_{false};
};

} // namespace mcphub
