#include <catch2/catch_test_macros.hpp>

#include <mcphub/transport/http_client.hpp>

#include <httplib.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

using namespace mcphub;

namespace {

// ---------------------------------------------------------------------------
// LocalServer: httplib::Server on an ephemeral loopback port.
// ---------------------------------------------------------------------------
class LocalServer {
public:
    LocalServer() {
        server_.Get("/json", [](const httplib::Request& req, httplib::Response& res) {
            res.set_header("Mcp-Session-Id", "abc");
            res.set_content(R"({"agent":")" + req.get_header_value("User-Agent") + R"("})",
                            "application/json");
        });
        server_.Post("/echo", [](const httplib::Request& req, httplib::Response& res) {
            res.status = 201;
            res.set_content(req.get_header_value("Content-Type") + "|" + req.body,
                            "text/plain");
        });
        server_.Get("/events", [](const httplib::Request&, httplib::Response& res) {
            res.set_chunked_content_provider(
                "text/event-stream", [](size_t, httplib::DataSink& sink) {
                    const std::string frame = "event: message\ndata: {\"n\":1}\n\n";
                    sink.write(frame.data(), frame.size());
                    sink.done();
                    return true;
                });
        });
        server_.Get("/endless", [this](const httplib::Request&, httplib::Response& res) {
            res.set_chunked_content_provider(
                "text/event-stream", [this](size_t, httplib::DataSink& sink) {
                    const std::string frame = "data: tick\n\n";
                    if (!sink.write(frame.data(), frame.size())) {
                        return false;
                    }
                    for (int i = 0; i < 40 && !stopping_.load(); ++i) {
                        std::this_thread::sleep_for(std::chrono::milliseconds(50));
                    }
                    sink.done();
                    return true;
                });
        });
        server_.Get("/slow", [](const httplib::Request&, httplib::Response& res) {
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
            res.set_content("late", "text/plain");
        });
        server_.Get("/forbidden", [](const httplib::Request&, httplib::Response& res) {
            res.status = 403;
            res.set_content(R"({"message":"token revoked"})", "application/json");
        });

        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this]() { server_.listen_after_bind(); });
        server_.wait_until_ready();
    }

    ~LocalServer() {
        stopping_.store(true);
        server_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    std::string Url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

private:
    httplib::Server server_;
    std::thread thread_;
    std::atomic<bool> stopping_{false};
    int port_ = 0;
};

HttpClientOptions FastOptions() {
    HttpClientOptions options;
    options.connect_timeout = std::chrono::seconds(5);
    options.read_timeout = std::chrono::seconds(5);
    options.user_agent = "mcphub-test";
    return options;
}

} // anonymous namespace

// ===========================================================================
// Plain requests
// ===========================================================================

TEST_CASE("HttpClient: GET returns status, headers and body", "[transport][http_client]") {
    LocalServer server;
    HttpClient client(FastOptions());

    auto r = client.Get(server.Url("/json"), {});
    REQUIRE(r.IsOk());
    CHECK(r.Value().status_code == 200);
    CHECK(r.Value().body == R"({"agent":"mcphub-test"})");
    CHECK(FindHeader(r.Value().headers, "mcp-session-id") == std::optional<std::string>("abc"));
}

TEST_CASE("HttpClient: caller User-Agent wins", "[transport][http_client]") {
    LocalServer server;
    HttpClient client(FastOptions());

    auto r = client.Get(server.Url("/json"), {{"user-agent", "custom/1.0"}});
    REQUIRE(r.IsOk());
    CHECK(r.Value().body == R"({"agent":"custom/1.0"})");
}

TEST_CASE("HttpClient: POST sends body and content type", "[transport][http_client]") {
    LocalServer server;
    HttpClient client(FastOptions());

    auto r = client.Post(server.Url("/echo"), {}, R"({"x":1})", "application/json");
    REQUIRE(r.IsOk());
    CHECK(r.Value().status_code == 201);
    CHECK(r.Value().body == R"(application/json|{"x":1})");
}

TEST_CASE("HttpClient: error statuses are returned, not raised", "[transport][http_client]") {
    LocalServer server;
    HttpClient client(FastOptions());

    auto r = client.Get(server.Url("/forbidden"), {});
    REQUIRE(r.IsOk());
    CHECK(r.Value().status_code == 403);
    CHECK_FALSE(r.Value().IsSuccess());
}

TEST_CASE("HttpClient: invalid URL", "[transport][http_client]") {
    HttpClient client(FastOptions());

    auto r = client.Get("localhost/no-scheme", {});
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Configuration);
    CHECK(r.Error().message == "Invalid URL");
}

TEST_CASE("HttpClient: refused connection", "[transport][http_client]") {
    HttpClient client(FastOptions());

    auto r = client.Post("http://127.0.0.1:1/mcp", {}, "{}", "application/json");
    REQUIRE(r.IsErr());
    CHECK(r.Error().operation == "HttpPost");
    CHECK(r.Error().message.rfind("HTTP request failed: ", 0) == 0);
}

TEST_CASE("EffectiveTimeout: zero means no limit", "[transport][http_client]") {
    CHECK(EffectiveTimeout(std::chrono::seconds(0)) == kUnboundedTimeout);
    CHECK(EffectiveTimeout(std::chrono::seconds(-1)) == kUnboundedTimeout);
    CHECK(EffectiveTimeout(std::chrono::seconds(7)) == std::chrono::seconds(7));
    CHECK(kUnboundedTimeout >= std::chrono::hours(24));
}

TEST_CASE("HttpClient: zero read timeout waits for a slow reply", "[transport][http_client]") {
    LocalServer server;
    auto options = FastOptions();
    options.read_timeout = std::chrono::seconds(0);
    HttpClient client(options);

    auto r = client.Get(server.Url("/slow"), {});
    REQUIRE(r.IsOk());
    CHECK(r.Value().status_code == 200);
    CHECK(r.Value().body == "late");
}

TEST_CASE("HttpClient: zero connect timeout still connects", "[transport][http_client]") {
    LocalServer server;
    auto options = FastOptions();
    options.connect_timeout = std::chrono::seconds(0);
    HttpClient client(options);

    auto r = client.Post(server.Url("/echo"), {}, "{}", "application/json");
    REQUIRE(r.IsOk());
    CHECK(r.Value().status_code == 201);
}

// ===========================================================================
// Event streams
// ===========================================================================

TEST_CASE("HttpClient: event stream delivers chunks then closes", "[transport][http_client]") {
    LocalServer server;
    HttpClient client(FastOptions());

    std::mutex mutex;
    std::condition_variable cv;
    std::string received;
    std::string closed_reason;
    bool closed = false;

    auto stream = client.OpenEventStream(
        server.Url("/events"), {{"Accept", "text/event-stream"}},
        [&](std::string_view chunk) {
            std::lock_guard<std::mutex> lock(mutex);
            received.append(chunk.data(), chunk.size());
        },
        [&](const std::string& reason) {
            std::lock_guard<std::mutex> lock(mutex);
            closed = true;
            closed_reason = reason;
            cv.notify_all();
        });
    REQUIRE(stream.IsOk());

    std::unique_lock<std::mutex> lock(mutex);
    REQUIRE(cv.wait_for(lock, std::chrono::seconds(5), [&] { return closed; }));
    CHECK(received == "event: message\ndata: {\"n\":1}\n\n");
    CHECK(closed_reason == "stream ended by server");
}

TEST_CASE("HttpClient: local Close does not report a closed stream", "[transport][http_client]") {
    LocalServer server;
    HttpClient client(FastOptions());

    std::atomic<int> chunks{0};
    std::atomic<bool> closed{false};
    auto stream = client.OpenEventStream(
        server.Url("/endless"), {},
        [&](std::string_view) { ++chunks; },
        [&](const std::string&) { closed.store(true); });
    REQUIRE(stream.IsOk());
    CHECK(stream.Value()->IsOpen());

    stream.Value()->Close();
    CHECK_FALSE(stream.Value()->IsOpen());
    CHECK_FALSE(closed.load());
    stream.Value()->Close();
}

TEST_CASE("HttpClient: stream destroyed from its own chunk callback", "[transport][http_client]") {
    LocalServer server;
    HttpClient client(FastOptions());

    std::mutex mutex;
    std::condition_variable cv;
    std::unique_ptr<IEventStream> holder;
    bool handed_over = false;
    bool destroyed = false;

    auto stream = client.OpenEventStream(
        server.Url("/endless"), {},
        [&](std::string_view) {
            std::unique_lock<std::mutex> lock(mutex);
            cv.wait(lock, [&] { return handed_over; });
            if (holder) {
                // Runs on the stream's worker thread.
                holder.reset();
                destroyed = true;
                cv.notify_all();
            }
        },
        [](const std::string&) {});
    REQUIRE(stream.IsOk());

    std::unique_lock<std::mutex> lock(mutex);
    holder = std::move(stream).Value();
    handed_over = true;
    cv.notify_all();
    REQUIRE(cv.wait_for(lock, std::chrono::seconds(5), [&] { return destroyed; }));
    CHECK(holder == nullptr);
}

TEST_CASE("HttpClient: event stream rejected by status", "[transport][http_client]") {
    LocalServer server;
    HttpClient client(FastOptions());

    auto stream = client.OpenEventStream(
        server.Url("/forbidden"), {}, [](std::string_view) {}, [](const std::string&) {});
    REQUIRE(stream.IsErr());
    CHECK(stream.Error().http_status == 403);
    CHECK(stream.Error().operation == "OpenEventStream");
}

// ===========================================================================
// FindHeader
// ===========================================================================

TEST_CASE("FindHeader: case-insensitive lookup", "[transport][http_client]") {
    HttpHeaders headers{{"Content-Type", "text/event-stream"}};
    CHECK(FindHeader(headers, "content-type") == std::optional<std::string>("text/event-stream"));
    CHECK_FALSE(FindHeader(headers, "Content-Length").has_value());
}
