#include <mcphub/marketplace/marketplace_aggregator.hpp>

#include <mcphub/core/log.hpp>
#include <mcphub/marketplace/lobehub_adapter.hpp>
#include <mcphub/marketplace/official_registry_adapter.hpp>
#include <mcphub/marketplace/smithery_adapter.hpp>

#include <algorithm>
#include <cctype>

namespace mcphub {

namespace {

constexpr const char* kSourceKey = "marketplaceSource";
constexpr const char* kServerIdPrefix = "market-";
constexpr int kMaxPageSize = 100;
constexpr int kFindPageSize = 50;
constexpr int kFindMaxPages = 10;

Error MakeMarketError(const std::string& operation, const std::string& target,
                      const std::string& message) {
    return Error{operation, target, std::nullopt, message, std::nullopt,
                 ErrorCategory::Configuration};
}

std::string UrlOr(const std::string& url, const char* fallback) {
    return url.empty() ? std::string(fallback) : url;
}

// "@scope/Pkg.Name" -> "scope-pkg-name"
std::string SanitizeId(const std::string& id) {
    std::string out;
    for (char c : id) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) {
            out += static_cast<char>(std::tolower(uc));
        } else if (!out.empty() && out.back() != '-') {
            out += '-';
        }
    }
    while (!out.empty() && out.back() == '-') {
        out.pop_back();
    }
    return out;
}

} // anonymous namespace

MarketplaceAggregator::MarketplaceAggregator(IHttpClient& http, const MarketplaceUrls& urls) {
    SetAdapter(std::make_unique<OfficialRegistryAdapter>(
        http, UrlOr(urls.official, kOfficialRegistryUrl)));
    SetAdapter(std::make_unique<LobehubAdapter>(http, UrlOr(urls.lobehub, kLobehubMarketUrl)));
    SetAdapter(std::make_unique<SmitheryAdapter>(
        http, UrlOr(urls.smithery, kSmitheryRegistryUrl)));
}

void MarketplaceAggregator::SetAdapter(std::unique_ptr<IMarketplaceAdapter> adapter) {
    auto source = adapter->Source();
    adapters_[source] = std::move(adapter);
}

Result<MarketplaceSearchResult, Error> MarketplaceAggregator::Search(
    MarketplaceSource source, MarketplaceSearchParams params) {
    auto it = adapters_.find(source);
    if (it == adapters_.end()) {
        return Result<MarketplaceSearchResult, Error>::Err(MakeMarketError(
            "MarketplaceSearch", MarketplaceSourceName(source), "No adapter for source"));
    }
    params.page = std::max(params.page, 1);
    params.page_size = std::clamp(params.page_size, 1, kMaxPageSize);

    LogDebug("marketplace", std::string(MarketplaceSourceName(source)) + " search \"" +
                                params.query + "\" page " + std::to_string(params.page));
    auto result = it->second->Search(params);
    if (result.IsErr()) {
        LogWarn("marketplace", result.Error().ToString());
    }
    return result;
}

Result<MarketplaceServer, Error> MarketplaceAggregator::FindServer(MarketplaceSource source,
                                                                   const std::string& server_id) {
    MarketplaceSearchParams params{server_id, 1, kFindPageSize};
    for (int page = 1; page <= kFindMaxPages; ++page) {
        params.page = page;
        auto result = Search(source, params);
        if (result.IsErr()) {
            return Result<MarketplaceServer, Error>::Err(std::move(result).Error());
        }
        const auto& servers = result.Value().servers;
        auto match = std::find_if(servers.begin(), servers.end(),
                                  [&](const MarketplaceServer& s) { return s.id == server_id; });
        if (match != servers.end()) {
            return Result<MarketplaceServer, Error>::Ok(*match);
        }
        if (!result.Value().has_more) {
            break;
        }
    }
    return Result<MarketplaceServer, Error>::Err(MakeMarketError(
        "FindServer", server_id,
        "Server not found in " + std::string(MarketplaceSourceName(source)) + ": " + server_id));
}

MarketplaceSource MarketplaceAggregator::LoadSource(const IKeyValueStore& store) {
    auto stored = store.Get(kSourceKey);
    if (stored.has_value() && stored->is_string()) {
        if (auto source = ParseMarketplaceSource(stored->get<std::string>())) {
            return *source;
        }
    }
    return kDefaultMarketplaceSource;
}

Result<void, Error> MarketplaceAggregator::SaveSource(IKeyValueStore& store,
                                                      MarketplaceSource source) {
    store.Set(kSourceKey, MarketplaceSourceName(source));
    return store.Save();
}

Result<ServerConfig, Error> MakeServerConfig(const MarketplaceServer& entry, const EnvMap& env) {
    if (!entry.install.has_value()) {
        return Result<ServerConfig, Error>::Err(MakeMarketError(
            "MakeServerConfig", entry.id, "Server has no install information: " + entry.id));
    }
    const auto& install = *entry.install;

    ServerConfig config;
    config.id = kServerIdPrefix + SanitizeId(entry.id);
    config.name = entry.name.empty() ? entry.id : entry.name;
    if (!entry.description.empty()) {
        config.description = entry.description;
    }
    config.enabled = true;

    switch (install.transport) {
        case TransportKind::Stdio: {
            EnvMap server_env;
            for (const auto& var : install.env_vars) {
                auto it = env.find(var.name);
                if (it != env.end()) {
                    server_env[var.name] = it->second;
                } else if (var.is_required) {
                    return Result<ServerConfig, Error>::Err(MakeMarketError(
                        "MakeServerConfig", entry.id,
                        "Missing required environment variable: " + var.name));
                }
            }
            // Extra values the caller passed are forwarded as well.
            for (const auto& [name, value] : env) {
                server_env.emplace(name, value);
            }
            config.transport = StdioTransportConfig{install.command, install.args,
                                                    std::move(server_env)};
            break;
        }
        case TransportKind::Sse:
            config.transport = SseTransportConfig{install.url, {}};
            break;
        case TransportKind::Http:
            config.transport = HttpTransportConfig{install.url, {}};
            break;
    }
    return Result<ServerConfig, Error>::Ok(std::move(config));
}

} // namespace mcphub
