#pragma once

#include <mcphub/core/result.hpp>
#include <mcphub/marketplace/i_marketplace_adapter.hpp>
#include <mcphub/marketplace/marketplace_types.hpp>
#include <mcphub/persistence/i_key_value_store.hpp>
#include <mcphub/protocol/types.hpp>
#include <mcphub/transport/i_http_client.hpp>

#include <map>
#include <memory>
#include <string>

namespace mcphub {

struct MarketplaceUrls {
    std::string official;
    std::string lobehub;
    std::string smithery;
};

// ---------------------------------------------------------------------------
// MarketplaceAggregator: one search entry point over every registry adapter.
//
// Each adapter is constructed once and owns its own pagination state, so
// sequential page requests against one aggregator share cursors.
// ---------------------------------------------------------------------------
class MarketplaceAggregator {
public:
    // Empty URLs select each registry's public endpoint.
    explicit MarketplaceAggregator(IHttpClient& http, const MarketplaceUrls& urls = {});

    // Adapters are installed per source; replaces any existing one.
    void SetAdapter(std::unique_ptr<IMarketplaceAdapter> adapter);

    Result<MarketplaceSearchResult, Error> Search(MarketplaceSource source,
                                                  MarketplaceSearchParams params);

    // Page through `source` looking for an exact id match.
    Result<MarketplaceServer, Error> FindServer(MarketplaceSource source,
                                                const std::string& server_id);

    // Chosen source, stored under "marketplaceSource" in the shared config
    // document. Unknown or missing values read as the default.
    [[nodiscard]] static MarketplaceSource LoadSource(const IKeyValueStore& store);
    static Result<void, Error> SaveSource(IKeyValueStore& store, MarketplaceSource source);

private:
    std::map<MarketplaceSource, std::unique_ptr<IMarketplaceAdapter>> adapters_;
};

// Build a ServerConfig from a catalog entry's install descriptor. `env`
// supplies values for the entry's environment variables; every required one
// must be present.
Result<ServerConfig, Error> MakeServerConfig(const MarketplaceServer& entry,
                                             const EnvMap& env);

} // namespace mcphub
