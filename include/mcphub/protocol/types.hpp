#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mcphub {

// ---------------------------------------------------------------------------
// Server configuration
// ---------------------------------------------------------------------------

using EnvMap = std::map<std::string, std::string>;
using HeaderMap = std::map<std::string, std::string>;

struct StdioTransportConfig {
    std::string command;
    std::vector<std::string> args;
    EnvMap env;
};

struct SseTransportConfig {
    std::string url;
    HeaderMap headers;
};

// Plain HTTP and Streamable-HTTP share one shape.
struct HttpTransportConfig {
    std::string url;
    HeaderMap headers;
};

using TransportConfig =
    std::variant<StdioTransportConfig, SseTransportConfig, HttpTransportConfig>;

enum class TransportKind {
    Stdio,
    Sse,
    Http,
};

TransportKind KindOf(const TransportConfig& transport);
const char* TransportKindName(TransportKind kind);

// Human-readable target of a transport: the command line or the URL.
std::string TransportTarget(const TransportConfig& transport);

struct ServerConfig {
    std::string id;
    std::string name;
    std::optional<std::string> description;
    TransportConfig transport;
    bool enabled = true;
};

// ---------------------------------------------------------------------------
// Discovered capabilities
// ---------------------------------------------------------------------------

struct Tool {
    std::string name;
    std::string description;
    nlohmann::json input_schema = nlohmann::json::object();
    std::string server_id;
};

struct Resource {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mime_type;
    std::string server_id;
};

// ---------------------------------------------------------------------------
// Tool invocation
// ---------------------------------------------------------------------------

struct ToolCallRequest {
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();
};

struct ContentBlock {
    std::string type;                      // "text", "image", "resource", ...
    std::optional<std::string> text;
    std::optional<std::string> data;
    std::optional<std::string> mime_type;
    std::optional<std::string> uri;
};

struct ToolCallResult {
    std::vector<ContentBlock> content;
    bool is_error = false;

    // Text of the first text block, if any.
    [[nodiscard]] std::optional<std::string> FirstText() const;

    // All text blocks joined with '\n'.
    [[nodiscard]] std::string JoinedText() const;
};

// ---------------------------------------------------------------------------
// Publishing and knowledge-base sync
// ---------------------------------------------------------------------------

struct PublishTarget {
    std::string id;
    std::string name;
    std::string type;              // "blog", "cms", "static-site", "knowledge-base", "custom"
    std::string mcp_server_id;
    std::map<std::string, std::string> config;
};

struct PublishRequest {
    std::string title;
    std::string content;
    std::string format = "markdown";   // "markdown" or "html"
    nlohmann::json metadata = nlohmann::json::object();
    std::string target_id;
};

struct PublishResult {
    bool success = false;
    std::optional<std::string> url;
    std::string message;
};

struct SyncConfig {
    std::string id;
    std::string name;
    std::string mcp_server_id;
    std::string remote_path;
    std::string local_path;
    bool auto_sync = false;
    int64_t sync_interval_ms = 0;
    std::optional<int64_t> last_sync_time;
};

enum class SyncState {
    Idle,
    Syncing,
    Success,
    Error,
};

const char* SyncStateName(SyncState state);

struct SyncStatus {
    std::string config_id;
    SyncState state = SyncState::Idle;
    std::optional<int64_t> last_sync;   // epoch milliseconds
    std::optional<std::string> error;
    int files_changed = 0;
};

struct SyncFile {
    std::string path;
    std::string content;
};

} // namespace mcphub
