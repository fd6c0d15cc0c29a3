#include <mcphub/marketplace/smithery_adapter.hpp>

#include <mcphub/core/url.hpp>

#include "json_fields.hpp"

namespace mcphub {

using market::Field;
using market::OptString;
using market::String;

SmitheryAdapter::SmitheryAdapter(IHttpClient& http, std::string base_url)
    : http_(http), base_url_(std::move(base_url)) {}

MarketplaceServer SmitheryServerFromJson(const nlohmann::json& entry) {
    MarketplaceServer server;
    server.id = String(entry, "qualifiedName");
    server.name = OptString(entry, "displayName").value_or(server.id);
    server.description = String(entry, "description");
    server.author = OptString(entry, "namespace");
    server.icon = OptString(entry, "iconUrl");
    server.homepage = OptString(entry, "homepage");
    server.popularity = market::OptInt(entry, "useCount");
    server.verified = market::OptBool(entry, "verified");
    return server;
}

Result<MarketplaceSearchResult, Error> SmitheryAdapter::Search(
    const MarketplaceSearchParams& params) {
    const int page = params.page < 1 ? 1 : params.page;
    QueryParams query;
    if (!params.query.empty()) {
        query.emplace_back("q", params.query);
    }
    query.emplace_back("page", std::to_string(page));
    query.emplace_back("pageSize", std::to_string(params.page_size));
    auto url = base_url_ + "?" + BuildQuery(query);

    auto response = http_.Get(url, {{"Accept", "application/json"}});
    if (response.IsErr()) {
        return Result<MarketplaceSearchResult, Error>::Err(std::move(response).Error());
    }
    auto body = market::ParseRegistryReply("MarketplaceSearch", url, "Smithery", response.Value());
    if (body.IsErr()) {
        return Result<MarketplaceSearchResult, Error>::Err(std::move(body).Error());
    }
    const auto& data = body.Value();

    MarketplaceSearchResult result;
    if (const auto* servers = Field(data, "servers"); servers && servers->is_array()) {
        for (const auto& entry : *servers) {
            result.servers.push_back(SmitheryServerFromJson(entry));
        }
    }
    int64_t total_pages = 1;
    if (const auto* pagination = Field(data, "pagination")) {
        result.total_count = market::OptInt(*pagination, "totalCount").value_or(0);
        total_pages = market::OptInt(*pagination, "totalPages").value_or(1);
    }
    result.has_more = page < total_pages;
    return Result<MarketplaceSearchResult, Error>::Ok(std::move(result));
}

} // namespace mcphub
