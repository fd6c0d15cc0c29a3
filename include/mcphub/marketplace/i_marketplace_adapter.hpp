#pragma once

#include <mcphub/core/result.hpp>
#include <mcphub/marketplace/marketplace_types.hpp>

namespace mcphub {

// ---------------------------------------------------------------------------
// IMarketplaceAdapter: one external server registry behind the common
// paginated search contract.
// ---------------------------------------------------------------------------
class IMarketplaceAdapter {
public:
    virtual ~IMarketplaceAdapter() = default;

    virtual Result<MarketplaceSearchResult, Error> Search(
        const MarketplaceSearchParams& params) = 0;

    [[nodiscard]] virtual MarketplaceSource Source() const = 0;

    IMarketplaceAdapter(const IMarketplaceAdapter&) = delete;
    IMarketplaceAdapter& operator=(const IMarketplaceAdapter&) = delete;
    IMarketplaceAdapter(IMarketplaceAdapter&&) = delete;
    IMarketplaceAdapter& operator=(IMarketplaceAdapter&&) = delete;

protected:
    IMarketplaceAdapter() = default;
};

} // namespace mcphub
