#pragma once

#include <mcphub/marketplace/i_marketplace_adapter.hpp>
#include <mcphub/transport/i_http_client.hpp>

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace mcphub {

constexpr const char* kOfficialRegistryUrl = "https://registry.modelcontextprotocol.io/v0.1/servers";

// ---------------------------------------------------------------------------
// CursorCache: opaque cursors of a cursor-paginated registry, addressed by
// page number. The cursor returned with page N of a query is stored as the
// cursor for (query, N + 1).
// ---------------------------------------------------------------------------
class CursorCache {
public:
    [[nodiscard]] std::optional<std::string> Find(const std::string& query, int page) const;
    void Store(const std::string& query, int page, std::string cursor);
    [[nodiscard]] size_t Size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::pair<std::string, int>, std::string> cursors_;
};

// ---------------------------------------------------------------------------
// OfficialRegistryAdapter: the MCP project's registry (v0.1 API).
//
// Page numbers are mapped onto the API's cursors through the owned
// CursorCache. A page whose cursor was never seen (skipping ahead, or a
// fresh process) is served as page 1.
// ---------------------------------------------------------------------------
class OfficialRegistryAdapter : public IMarketplaceAdapter {
public:
    explicit OfficialRegistryAdapter(IHttpClient& http,
                                     std::string base_url = kOfficialRegistryUrl);

    Result<MarketplaceSearchResult, Error> Search(const MarketplaceSearchParams& params) override;
    [[nodiscard]] MarketplaceSource Source() const override { return MarketplaceSource::Official; }

    [[nodiscard]] const CursorCache& Cursors() const { return cursors_; }

private:
    IHttpClient& http_;
    std::string base_url_;
    CursorCache cursors_;
};

// Map one element of the registry's `servers` array.
[[nodiscard]] MarketplaceServer OfficialServerFromJson(const nlohmann::json& entry);

} // namespace mcphub
