#pragma once

#include <mcphub/protocol/sse_parser.hpp>
#include <mcphub/transport/i_http_client.hpp>
#include <mcphub/transport/i_transport.hpp>

#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace mcphub {

// ---------------------------------------------------------------------------
// SseTransport: legacy MCP HTTP+SSE transport.
//
// Replies arrive on a long-lived event stream; requests are POSTed to a
// companion endpoint. The endpoint is announced by the server's "endpoint"
// event, or derived from the stream URL ("/sse" -> "/message") until one
// arrives. Outstanding requests wait in a pending table keyed by id, so any
// number of requests may be in flight at once.
// ---------------------------------------------------------------------------
class SseTransport : public ITransport {
public:
    SseTransport(IHttpClient& http, SseTransportConfig config, TransportOptions options = {});
    ~SseTransport() override;

    Result<void, Error> Connect() override;

    Result<nlohmann::json, Error> SendRequest(
        jsonrpc::RequestId id,
        const std::string& method,
        const nlohmann::json& params) override;

    Result<void, Error> SendNotification(
        const std::string& method,
        const nlohmann::json& params) override;

    void Disconnect() override;

    [[nodiscard]] TransportKind Kind() const override { return TransportKind::Sse; }

    // POST endpoint currently in use.
    [[nodiscard]] std::string Endpoint() const;

    // "/sse" -> "/message" on the first occurrence; other URLs are used as is.
    static std::string DeriveMessageEndpoint(const std::string& stream_url);

private:
    using Reply = Result<nlohmann::json, Error>;

    void OnChunk(std::string_view chunk);
    void OnEvent(const SseEvent& event);
    void OnClosed(const std::string& reason);
    void FailAllPending(const std::string& message);
    Result<void, Error> PostMessage(const std::string& operation, const nlohmann::json& message);

    IHttpClient& http_;
    SseTransportConfig config_;
    TransportOptions options_;

    mutable std::mutex mutex_;
    std::unique_ptr<IEventStream> stream_;
    SseParser parser_;
    std::string endpoint_;
    std::map<jsonrpc::RequestId, std::promise<Reply>> pending_;
};

} // namespace mcphub
