#pragma once

#include <mcphub/core/result.hpp>
#include <mcphub/protocol/json_rpc.hpp>
#include <mcphub/protocol/types.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

namespace mcphub {

struct TransportOptions {
    // Upper bound for one request/response round trip. Zero waits indefinitely.
    std::chrono::milliseconds request_timeout{std::chrono::seconds(60)};
    // Upper bound for opening an event stream or establishing a connection.
    std::chrono::milliseconds connect_timeout{std::chrono::seconds(30)};
};

// ---------------------------------------------------------------------------
// ITransport: abstract channel carrying JSON-RPC messages to one server.
//
// One implementation per transport kind (stdio, SSE, HTTP). Request ids are
// allocated by the caller; the transport builds the envelope, correlates the
// reply and returns its `result` member. A JSON-RPC `error` member comes back
// as a Protocol error. Adapters never retry.
// ---------------------------------------------------------------------------
class ITransport {
public:
    virtual ~ITransport() = default;

    // Establish the channel. Failures name the transport kind and target.
    virtual Result<void, Error> Connect() = 0;

    virtual Result<nlohmann::json, Error> SendRequest(
        jsonrpc::RequestId id,
        const std::string& method,
        const nlohmann::json& params) = 0;

    // Fire-and-forget; only delivery failures are reported.
    virtual Result<void, Error> SendNotification(
        const std::string& method,
        const nlohmann::json& params) = 0;

    // Release channel resources. Idempotent.
    virtual void Disconnect() = 0;

    [[nodiscard]] virtual TransportKind Kind() const = 0;

    // Non-copyable, non-movable (interface).
    ITransport(const ITransport&) = delete;
    ITransport& operator=(const ITransport&) = delete;
    ITransport(ITransport&&) = delete;
    ITransport& operator=(ITransport&&) = delete;

protected:
    ITransport() = default;
};

} // namespace mcphub
