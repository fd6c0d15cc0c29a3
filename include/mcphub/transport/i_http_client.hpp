#pragma once

#include <mcphub/core/result.hpp>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mcphub {

// ---------------------------------------------------------------------------
// HttpHeaders: header name to value. Names keep the case they were sent
// with; use FindHeader for case-insensitive lookup.
// ---------------------------------------------------------------------------
using HttpHeaders = std::map<std::string, std::string>;

std::optional<std::string> FindHeader(const HttpHeaders& headers, std::string_view name);

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::string body;

    [[nodiscard]] bool IsSuccess() const { return status_code >= 200 && status_code < 300; }
};

// ---------------------------------------------------------------------------
// IEventStream: handle to a long-lived GET whose body is consumed as it
// arrives (text/event-stream).
// ---------------------------------------------------------------------------
class IEventStream {
public:
    virtual ~IEventStream() = default;

    // Stop receiving and release the connection. Idempotent; the closed
    // handler is not invoked for a local close.
    virtual void Close() = 0;

    [[nodiscard]] virtual bool IsOpen() const = 0;
};

using StreamChunkHandler = std::function<void(std::string_view chunk)>;

// Invoked once when the remote side ends the stream or the connection breaks.
using StreamClosedHandler = std::function<void(const std::string& reason)>;

// ---------------------------------------------------------------------------
// IHttpClient: absolute-URL HTTP operations used by the HTTP and SSE
// transports and by the marketplace adapters.
// ---------------------------------------------------------------------------
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual Result<HttpResponse, Error> Get(const std::string& url,
                                            const HttpHeaders& headers) = 0;

    virtual Result<HttpResponse, Error> Post(const std::string& url,
                                             const HttpHeaders& headers,
                                             const std::string& body,
                                             const std::string& content_type) = 0;

    // Returns once the response headers arrived with a 2xx status; chunks
    // are then delivered on a background thread until Close().
    virtual Result<std::unique_ptr<IEventStream>, Error> OpenEventStream(
        const std::string& url,
        const HttpHeaders& headers,
        StreamChunkHandler on_chunk,
        StreamClosedHandler on_closed) = 0;

    IHttpClient(const IHttpClient&) = delete;
    IHttpClient& operator=(const IHttpClient&) = delete;
    IHttpClient(IHttpClient&&) = delete;
    IHttpClient& operator=(IHttpClient&&) = delete;

protected:
    IHttpClient() = default;
};

} // namespace mcphub
