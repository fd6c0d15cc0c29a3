#pragma once

#include <mcphub/marketplace/i_marketplace_adapter.hpp>
#include <mcphub/transport/i_http_client.hpp>

#include <string>

namespace mcphub {

constexpr const char* kSmitheryRegistryUrl = "https://registry.smithery.ai/servers";

// Smithery registry. Entries carry no install descriptor.
class SmitheryAdapter : public IMarketplaceAdapter {
public:
    explicit SmitheryAdapter(IHttpClient& http, std::string base_url = kSmitheryRegistryUrl);

    Result<MarketplaceSearchResult, Error> Search(const MarketplaceSearchParams& params) override;
    [[nodiscard]] MarketplaceSource Source() const override { return MarketplaceSource::Smithery; }

private:
    IHttpClient& http_;
    std::string base_url_;
};

[[nodiscard]] MarketplaceServer SmitheryServerFromJson(const nlohmann::json& entry);

} // namespace mcphub
