#pragma once

#include <mcphub/transport/i_http_client.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace mcphub {

// httplib needs finite timeouts; this stands in for "no limit".
inline constexpr std::chrono::seconds kUnboundedTimeout = std::chrono::hours(24);

// A zero timeout means no limit and maps to kUnboundedTimeout.
[[nodiscard]] std::chrono::seconds EffectiveTimeout(std::chrono::seconds configured);

struct HttpClientOptions {
    // Zero for either timeout means no limit.
    std::chrono::seconds connect_timeout{30};
    // Read timeout for ordinary requests. Event streams ignore it and stay
    // open until closed.
    std::chrono::seconds read_timeout{60};
    bool disable_tls_verify = false;
    std::string user_agent = "mcphub";
};

// ---------------------------------------------------------------------------
// HttpClient: concrete IHttpClient using cpp-httplib.
//
// Uses pimpl so httplib stays out of the public header. A fresh
// httplib::Client is created per request, which keeps the class usable from
// any number of threads at once.
// ---------------------------------------------------------------------------
class HttpClient : public IHttpClient {
public:
    explicit HttpClient(const HttpClientOptions& options = {});
    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;
    HttpClient(HttpClient&&) = delete;
    HttpClient& operator=(HttpClient&&) = delete;

    [[nodiscard]] Result<HttpResponse, Error> Get(
        const std::string& url,
        const HttpHeaders& headers) override;

    [[nodiscard]] Result<HttpResponse, Error> Post(
        const std::string& url,
        const HttpHeaders& headers,
        const std::string& body,
        const std::string& content_type) override;

    [[nodiscard]] Result<std::unique_ptr<IEventStream>, Error> OpenEventStream(
        const std::string& url,
        const HttpHeaders& headers,
        StreamChunkHandler on_chunk,
        StreamClosedHandler on_closed) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mcphub
