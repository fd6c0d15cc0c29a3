#pragma once

#include <mcphub/protocol/types.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcphub {

enum class MarketplaceSource {
    Official,
    Lobehub,
    Smithery,
};

constexpr MarketplaceSource kDefaultMarketplaceSource = MarketplaceSource::Lobehub;

[[nodiscard]] const char* MarketplaceSourceName(MarketplaceSource source);
[[nodiscard]] std::optional<MarketplaceSource> ParseMarketplaceSource(std::string_view name);

struct InstallEnvVar {
    std::string name;
    std::string description;
    bool is_secret = false;
    bool is_required = false;
};

// Enough to synthesize a ServerConfig: a command line for stdio, a URL for
// the remote transports.
struct InstallInfo {
    TransportKind transport = TransportKind::Stdio;
    std::string command;
    std::vector<std::string> args;
    std::string url;
    std::vector<InstallEnvVar> env_vars;
};

// One catalog entry, normalized across registries.
struct MarketplaceServer {
    std::string id;
    std::string name;
    std::string description;
    std::optional<std::string> author;
    std::optional<std::string> icon;
    std::optional<std::string> version;
    std::optional<std::string> homepage;
    std::optional<std::string> repository;
    std::optional<int64_t> popularity;   // install / use count
    std::optional<int64_t> stars;
    std::optional<bool> verified;
    std::vector<std::string> tags;
    std::optional<InstallInfo> install;
};

struct MarketplaceSearchParams {
    std::string query;
    int page = 1;        // 1-based
    int page_size = 20;
};

struct MarketplaceSearchResult {
    std::vector<MarketplaceServer> servers;
    int64_t total_count = 0;
    bool has_more = false;
};

[[nodiscard]] nlohmann::json MarketplaceServerToJson(const MarketplaceServer& server);

} // namespace mcphub
