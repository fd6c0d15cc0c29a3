#include <mcphub/transport/http_client.hpp>

#include <mcphub/core/log.hpp>
#include <mcphub/core/url.hpp>

#include <httplib.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <future>
#include <mutex>
#include <thread>

namespace mcphub {

namespace {

constexpr size_t kMaxBodyLog = 2000;

bool IEquals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

bool IsSensitiveHeader(std::string_view key) {
    std::string lower_key(key);
    std::transform(lower_key.begin(), lower_key.end(), lower_key.begin(), ::tolower);
    return lower_key == "cookie" ||
           lower_key == "set-cookie" ||
           lower_key == "authorization" ||
           lower_key == "x-api-key" ||
           lower_key.find("token") != std::string::npos ||
           lower_key.find("secret") != std::string::npos;
}

ErrorCategory CategoryFromHttpTransportError(httplib::Error error) {
    switch (error) {
        case httplib::Error::Timeout:
        case httplib::Error::ConnectionTimeout:
        case httplib::Error::Read:
            return ErrorCategory::Timeout;
        default:
            return ErrorCategory::Transport;
    }
}

Error MakeHttpError(const std::string& operation, const std::string& url,
                    const std::string& message,
                    ErrorCategory category = ErrorCategory::Transport) {
    return Error{operation, url, std::nullopt, message, std::nullopt, category};
}

HttpHeaders ToHttpHeaders(const httplib::Headers& hdrs) {
    HttpHeaders result;
    for (const auto& [key, value] : hdrs) {
        result[key] = value;
    }
    return result;
}

httplib::Headers ToHttplibHeaders(const HttpHeaders& headers, const std::string& user_agent) {
    httplib::Headers hdrs;
    bool has_user_agent = false;
    for (const auto& [key, value] : headers) {
        has_user_agent = has_user_agent || IEquals(key, "User-Agent");
        hdrs.emplace(key, value);
    }
    if (!has_user_agent) {
        hdrs.emplace("User-Agent", user_agent);
    }
    return hdrs;
}

void LogRequestHeaders(const httplib::Headers& hdrs) {
    if (!GlobalLogger().IsEnabled(LogLevel::Debug)) {
        return;
    }
    for (const auto& [k, v] : hdrs) {
        LogDebug("http", "  > " + k + ": " + (IsSensitiveHeader(k) ? "<redacted>" : v));
    }
}

void LogResponse(int status, const std::string& body) {
    LogInfo("http", "  < " + std::to_string(status));
    if (status >= 400 && !body.empty()) {
        if (body.size() <= kMaxBodyLog) {
            LogDebug("http", "  < body: " + body);
        } else {
            LogDebug("http", "  < body: " + body.substr(0, kMaxBodyLog) + "... (truncated)");
        }
    }
}

// ---------------------------------------------------------------------------
// HttplibEventStream: runs a streaming GET on its own thread.
//
// The worker shares StreamState with the owner. When Close() runs on the
// worker itself (from a stream callback) the thread is detached and may
// outlive the owner, so it must not touch the owner.
// ---------------------------------------------------------------------------
struct StreamState {
    StreamState(std::unique_ptr<httplib::Client> c, std::string u)
        : client(std::move(c)), url(std::move(u)) {}

    void SignalOpen(Result<void, Error> result) {
        std::lock_guard<std::mutex> lock(signal_mutex);
        if (signaled) {
            return;
        }
        signaled = true;
        open_promise.set_value(std::move(result));
    }

    std::unique_ptr<httplib::Client> client;
    std::string url;
    std::atomic<bool> open{false};
    std::atomic<bool> closing{false};
    std::mutex signal_mutex;
    bool signaled = false;
    std::promise<Result<void, Error>> open_promise;
};

class HttplibEventStream : public IEventStream {
public:
    HttplibEventStream(std::unique_ptr<httplib::Client> client, std::string url)
        : state_(std::make_shared<StreamState>(std::move(client), std::move(url))) {}

    ~HttplibEventStream() override { Close(); }

    // Starts the request; the returned future resolves when headers arrive
    // (Ok on 2xx) or the request fails before that.
    std::future<Result<void, Error>> Start(std::string target, httplib::Headers headers,
                                           StreamChunkHandler on_chunk,
                                           StreamClosedHandler on_closed) {
        auto opened = state_->open_promise.get_future();
        worker_ = std::thread([state = state_, target = std::move(target),
                               headers = std::move(headers), on_chunk = std::move(on_chunk),
                               on_closed = std::move(on_closed)]() {
            int status = 0;
            auto res = state->client->Get(
                target, headers,
                [&state, &status](const httplib::Response& response) {
                    status = response.status;
                    if (response.status < 200 || response.status >= 300) {
                        return false;
                    }
                    state->open.store(true);
                    state->SignalOpen(Result<void, Error>::Ok());
                    return true;
                },
                [&state, &on_chunk](const char* data, size_t length) {
                    if (state->closing.load()) {
                        return false;
                    }
                    on_chunk(std::string_view(data, length));
                    return true;
                });

            const bool was_open = state->open.exchange(false);
            if (!was_open) {
                if (status != 0) {
                    state->SignalOpen(Result<void, Error>::Err(
                        Error::FromHttpStatus("OpenEventStream", state->url, status)));
                } else {
                    const auto http_error = res.error();
                    state->SignalOpen(Result<void, Error>::Err(MakeHttpError(
                        "OpenEventStream", state->url,
                        "HTTP request failed: " + httplib::to_string(http_error),
                        CategoryFromHttpTransportError(http_error))));
                }
                return;
            }
            if (!state->closing.load() && on_closed) {
                std::string reason = res ? "stream ended by server"
                                         : "stream broken: " + httplib::to_string(res.error());
                LogInfo("http", "Event stream " + state->url + " closed: " + reason);
                on_closed(reason);
            }
        });
        return opened;
    }

    void Close() override {
        if (state_->closing.exchange(true)) {
            return;
        }
        state_->open.store(false);
        state_->client->stop();
        if (worker_.joinable()) {
            if (worker_.get_id() == std::this_thread::get_id()) {
                worker_.detach();
            } else {
                worker_.join();
            }
        }
    }

    [[nodiscard]] bool IsOpen() const override { return state_->open.load(); }

private:
    std::shared_ptr<StreamState> state_;
    std::thread worker_;
};

} // anonymous namespace

std::chrono::seconds EffectiveTimeout(std::chrono::seconds configured) {
    return configured.count() > 0 ? configured : kUnboundedTimeout;
}

std::optional<std::string> FindHeader(const HttpHeaders& headers, std::string_view name) {
    for (const auto& [key, value] : headers) {
        if (IEquals(key, name)) {
            return value;
        }
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// HttpClient::Impl
// ---------------------------------------------------------------------------
struct HttpClient::Impl {
    HttpClientOptions options;

    explicit Impl(const HttpClientOptions& opts) : options(opts) {}

    Result<std::pair<std::unique_ptr<httplib::Client>, std::string>, Error> MakeClient(
        const std::string& operation, const std::string& url,
        std::chrono::seconds read_timeout) const {
        using ClientAndTarget = std::pair<std::unique_ptr<httplib::Client>, std::string>;
        auto parsed = ParseUrl(url);
        if (!parsed.has_value()) {
            return Result<ClientAndTarget, Error>::Err(MakeHttpError(
                operation, url, "Invalid URL", ErrorCategory::Configuration));
        }
        auto client = std::make_unique<httplib::Client>(parsed->Origin());
        client->set_connection_timeout(EffectiveTimeout(options.connect_timeout));
        client->set_read_timeout(EffectiveTimeout(read_timeout));
        client->set_write_timeout(EffectiveTimeout(options.connect_timeout));
        client->set_follow_location(true);
        if (parsed->scheme == "https" && options.disable_tls_verify) {
            client->enable_server_certificate_verification(false);
        }
        return Result<ClientAndTarget, Error>::Ok(
            ClientAndTarget{std::move(client), parsed->target});
    }
};

HttpClient::HttpClient(const HttpClientOptions& options)
    : impl_(std::make_unique<Impl>(options)) {}

HttpClient::~HttpClient() = default;

Result<HttpResponse, Error> HttpClient::Get(const std::string& url,
                                            const HttpHeaders& headers) {
    auto made = impl_->MakeClient("HttpGet", url, impl_->options.read_timeout);
    if (made.IsErr()) {
        return Result<HttpResponse, Error>::Err(std::move(made).Error());
    }
    auto [client, target] = std::move(made).Value();

    auto hdrs = ToHttplibHeaders(headers, impl_->options.user_agent);
    LogInfo("http", "GET " + url);
    LogRequestHeaders(hdrs);
    auto res = client->Get(target, hdrs);
    if (!res) {
        const auto http_error = res.error();
        return Result<HttpResponse, Error>::Err(MakeHttpError(
            "HttpGet", url, "HTTP request failed: " + httplib::to_string(http_error),
            CategoryFromHttpTransportError(http_error)));
    }
    LogResponse(res->status, res->body);
    return Result<HttpResponse, Error>::Ok(
        HttpResponse{res->status, ToHttpHeaders(res->headers), res->body});
}

Result<HttpResponse, Error> HttpClient::Post(const std::string& url,
                                             const HttpHeaders& headers,
                                             const std::string& body,
                                             const std::string& content_type) {
    auto made = impl_->MakeClient("HttpPost", url, impl_->options.read_timeout);
    if (made.IsErr()) {
        return Result<HttpResponse, Error>::Err(std::move(made).Error());
    }
    auto [client, target] = std::move(made).Value();

    auto hdrs = ToHttplibHeaders(headers, impl_->options.user_agent);
    LogInfo("http", "POST " + url);
    LogRequestHeaders(hdrs);
    auto res = client->Post(target, hdrs, body, content_type);
    if (!res) {
        const auto http_error = res.error();
        return Result<HttpResponse, Error>::Err(MakeHttpError(
            "HttpPost", url, "HTTP request failed: " + httplib::to_string(http_error),
            CategoryFromHttpTransportError(http_error)));
    }
    LogResponse(res->status, res->body);
    return Result<HttpResponse, Error>::Ok(
        HttpResponse{res->status, ToHttpHeaders(res->headers), res->body});
}

Result<std::unique_ptr<IEventStream>, Error> HttpClient::OpenEventStream(
    const std::string& url,
    const HttpHeaders& headers,
    StreamChunkHandler on_chunk,
    StreamClosedHandler on_closed) {
    // Streams stay open for as long as the server keeps them.
    auto made = impl_->MakeClient("OpenEventStream", url, kUnboundedTimeout);
    if (made.IsErr()) {
        return Result<std::unique_ptr<IEventStream>, Error>::Err(std::move(made).Error());
    }
    auto [client, target] = std::move(made).Value();

    auto hdrs = ToHttplibHeaders(headers, impl_->options.user_agent);
    LogInfo("http", "GET (stream) " + url);
    LogRequestHeaders(hdrs);

    auto stream = std::make_unique<HttplibEventStream>(std::move(client), url);
    auto opened = stream->Start(std::move(target), std::move(hdrs), std::move(on_chunk),
                                std::move(on_closed));

    if (opened.wait_for(EffectiveTimeout(impl_->options.connect_timeout)) !=
        std::future_status::ready) {
        stream->Close();
        return Result<std::unique_ptr<IEventStream>, Error>::Err(MakeHttpError(
            "OpenEventStream", url, "Timed out waiting for event stream to open",
            ErrorCategory::Timeout));
    }
    auto result = opened.get();
    if (result.IsErr()) {
        stream->Close();
        return Result<std::unique_ptr<IEventStream>, Error>::Err(std::move(result).Error());
    }
    return Result<std::unique_ptr<IEventStream>, Error>::Ok(std::move(stream));
}

} // namespace mcphub
