#pragma once

#include <mcphub/transport/i_http_client.hpp>
#include <mcphub/transport/i_transport.hpp>

#include <mutex>
#include <optional>
#include <string>

namespace mcphub {

// ---------------------------------------------------------------------------
// HttpTransport: plain HTTP and Streamable-HTTP.
//
// Every request is one POST. A JSON body is the reply; a text/event-stream
// body is scanned for the frame answering this request's id. Frames carrying
// other ids are skipped, so concurrent requests on one server never receive
// each other's replies.
// ---------------------------------------------------------------------------
class HttpTransport : public ITransport {
public:
    HttpTransport(IHttpClient& http, HttpTransportConfig config, TransportOptions options = {});

    Result<void, Error> Connect() override;

    Result<nlohmann::json, Error> SendRequest(
        jsonrpc::RequestId id,
        const std::string& method,
        const nlohmann::json& params) override;

    Result<void, Error> SendNotification(
        const std::string& method,
        const nlohmann::json& params) override;

    void Disconnect() override;

    [[nodiscard]] TransportKind Kind() const override { return TransportKind::Http; }

    // Session id assigned by a Streamable-HTTP server, if any.
    [[nodiscard]] std::optional<std::string> SessionId() const;

private:
    Result<HttpResponse, Error> Post(const std::string& operation, const nlohmann::json& message);

    IHttpClient& http_;
    HttpTransportConfig config_;
    TransportOptions options_;

    mutable std::mutex mutex_;
    bool connected_ = false;
    std::optional<std::string> session_id_;
};

// Pick the reply for `id` out of a text/event-stream body.
Result<jsonrpc::Response, Error> FindSseReply(const std::string& body,
                                              jsonrpc::RequestId id,
                                              const std::string& operation,
                                              const std::string& target);

} // namespace mcphub
