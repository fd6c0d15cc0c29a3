#include <mcphub/marketplace/lobehub_adapter.hpp>

#include <mcphub/core/url.hpp>

#include "json_fields.hpp"

namespace mcphub {

using market::Field;
using market::OptString;
using market::String;

LobehubAdapter::LobehubAdapter(IHttpClient& http, std::string base_url)
    : http_(http), base_url_(std::move(base_url)) {}

MarketplaceServer LobehubServerFromJson(const nlohmann::json& item) {
    MarketplaceServer server;
    server.id = String(item, "identifier");
    server.name = OptString(item, "name").value_or(server.id);
    server.description = String(item, "description");
    server.author = OptString(item, "author");
    server.icon = OptString(item, "icon");
    server.version = OptString(item, "version");
    server.homepage = OptString(item, "homepage");
    server.popularity = market::OptInt(item, "installCount");
    if (const auto* github = Field(item, "github")) {
        server.repository = OptString(*github, "url");
        server.stars = market::OptInt(*github, "stars");
    }
    auto validated = market::OptBool(item, "isValidated");
    auto official = market::OptBool(item, "isOfficial");
    if (validated.has_value() || official.has_value()) {
        server.verified = validated.value_or(false) || official.value_or(false);
    }
    if (auto category = OptString(item, "category")) {
        server.tags.push_back(*category);
    }
    if (const auto* tags = Field(item, "tags"); tags && tags->is_array()) {
        for (const auto& tag : *tags) {
            if (tag.is_string()) {
                server.tags.push_back(tag.get<std::string>());
            }
        }
    }

    auto connection = String(item, "connectionType");
    if ((connection == "local" || connection == "hybrid") && !server.id.empty()) {
        InstallInfo install;
        install.transport = TransportKind::Stdio;
        install.command = "npx";
        install.args = {"-y", server.id};
        server.install = std::move(install);
    }
    return server;
}

Result<MarketplaceSearchResult, Error> LobehubAdapter::Search(
    const MarketplaceSearchParams& params) {
    const int page = params.page < 1 ? 1 : params.page;
    QueryParams query;
    if (!params.query.empty()) {
        query.emplace_back("search", params.query);
    }
    query.emplace_back("page", std::to_string(page));
    query.emplace_back("pageSize", std::to_string(params.page_size));
    query.emplace_back("sort", "installCount");
    auto url = base_url_ + "?" + BuildQuery(query);

    auto response = http_.Get(url, {{"Accept", "application/json"}});
    if (response.IsErr()) {
        return Result<MarketplaceSearchResult, Error>::Err(std::move(response).Error());
    }
    auto body = market::ParseRegistryReply("MarketplaceSearch", url, "LobeHub", response.Value());
    if (body.IsErr()) {
        return Result<MarketplaceSearchResult, Error>::Err(std::move(body).Error());
    }
    const auto& data = body.Value();

    MarketplaceSearchResult result;
    if (const auto* items = Field(data, "items"); items && items->is_array()) {
        for (const auto& item : *items) {
            result.servers.push_back(LobehubServerFromJson(item));
        }
    }
    result.total_count = market::OptInt(data, "totalCount").value_or(0);
    result.has_more = page < market::OptInt(data, "totalPages").value_or(1);
    return Result<MarketplaceSearchResult, Error>::Ok(std::move(result));
}

} // namespace mcphub
