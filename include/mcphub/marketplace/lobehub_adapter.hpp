#pragma once

#include <mcphub/marketplace/i_marketplace_adapter.hpp>
#include <mcphub/transport/i_http_client.hpp>

#include <string>

namespace mcphub {

constexpr const char* kLobehubMarketUrl = "https://market.lobehub.com/api/v1/plugins";

// LobeHub plugin market, page-numbered and sorted by install count.
class LobehubAdapter : public IMarketplaceAdapter {
public:
    explicit LobehubAdapter(IHttpClient& http, std::string base_url = kLobehubMarketUrl);

    Result<MarketplaceSearchResult, Error> Search(const MarketplaceSearchParams& params) override;
    [[nodiscard]] MarketplaceSource Source() const override { return MarketplaceSource::Lobehub; }

private:
    IHttpClient& http_;
    std::string base_url_;
};

[[nodiscard]] MarketplaceServer LobehubServerFromJson(const nlohmann::json& item);

} // namespace mcphub
