#include <mcphub/marketplace/official_registry_adapter.hpp>

#include <mcphub/core/log.hpp>
#include <mcphub/core/url.hpp>

#include "json_fields.hpp"

namespace mcphub {

namespace {

using market::Field;
using market::OptString;
using market::String;

std::optional<std::string> AuthorFrom(const std::string& name,
                                      const std::optional<std::string>& repository) {
    // "io.github.acme/weather" -> "acme", "acme/weather" -> "acme"
    auto slash = name.find('/');
    if (slash != std::string::npos && slash > 0) {
        auto ns = name.substr(0, slash);
        auto dot = ns.find_last_of('.');
        return dot == std::string::npos ? ns : ns.substr(dot + 1);
    }
    if (repository.has_value()) {
        const std::string marker = "github.com/";
        auto at = repository->find(marker);
        if (at != std::string::npos) {
            auto owner = repository->substr(at + marker.size());
            owner = owner.substr(0, owner.find('/'));
            if (!owner.empty()) {
                return owner;
            }
        }
    }
    return std::nullopt;
}

std::optional<InstallInfo> NpmInstall(const nlohmann::json& packages) {
    if (!packages.is_array()) {
        return std::nullopt;
    }
    for (const auto& pkg : packages) {
        if (String(pkg, "registryType") != "npm" || String(pkg, "identifier").empty()) {
            continue;
        }
        InstallInfo install;
        install.transport = TransportKind::Stdio;
        install.command = "npx";
        install.args = {"-y", String(pkg, "identifier")};
        if (const auto* vars = Field(pkg, "environmentVariables"); vars && vars->is_array()) {
            for (const auto& var : *vars) {
                InstallEnvVar env;
                env.name = String(var, "name");
                if (env.name.empty()) {
                    continue;
                }
                env.description = String(var, "description");
                env.is_secret = market::OptBool(var, "isSecret").value_or(false);
                env.is_required = market::OptBool(var, "isRequired").value_or(false);
                install.env_vars.push_back(std::move(env));
            }
        }
        return install;
    }
    return std::nullopt;
}

std::optional<InstallInfo> RemoteInstall(const nlohmann::json& remotes) {
    if (!remotes.is_array() || remotes.empty()) {
        return std::nullopt;
    }
    const auto& remote = remotes.front();
    auto url = String(remote, "url");
    if (url.empty()) {
        return std::nullopt;
    }
    InstallInfo install;
    install.transport = String(remote, "type") == "sse" ? TransportKind::Sse : TransportKind::Http;
    install.url = std::move(url);
    return install;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// CursorCache
// ---------------------------------------------------------------------------
std::optional<std::string> CursorCache::Find(const std::string& query, int page) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cursors_.find({query, page});
    if (it == cursors_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void CursorCache::Store(const std::string& query, int page, std::string cursor) {
    std::lock_guard<std::mutex> lock(mutex_);
    cursors_[{query, page}] = std::move(cursor);
}

size_t CursorCache::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cursors_.size();
}

// ---------------------------------------------------------------------------
// OfficialRegistryAdapter
// ---------------------------------------------------------------------------
OfficialRegistryAdapter::OfficialRegistryAdapter(IHttpClient& http, std::string base_url)
    : http_(http), base_url_(std::move(base_url)) {}

MarketplaceServer OfficialServerFromJson(const nlohmann::json& entry) {
    const auto* wrapped = Field(entry, "server");
    const auto& s = wrapped != nullptr && wrapped->is_object() ? *wrapped : entry;

    MarketplaceServer server;
    server.id = String(s, "name");
    auto title = OptString(s, "title");
    if (title.has_value()) {
        server.name = *title;
    } else {
        auto slash = server.id.find_last_of('/');
        server.name = slash == std::string::npos ? server.id : server.id.substr(slash + 1);
    }
    server.description = String(s, "description");
    server.version = OptString(s, "version");
    server.homepage = OptString(s, "websiteUrl");
    if (const auto* repo = Field(s, "repository")) {
        server.repository = OptString(*repo, "url");
    }
    if (const auto* icons = Field(s, "icons"); icons && icons->is_array() && !icons->empty()) {
        server.icon = OptString(icons->front(), "src");
    }
    server.author = AuthorFrom(server.id, server.repository);

    if (const auto* packages = Field(s, "packages")) {
        server.install = NpmInstall(*packages);
    }
    if (const auto* remotes = Field(s, "remotes"); remotes && !server.install.has_value()) {
        server.install = RemoteInstall(*remotes);
    }
    return server;
}

Result<MarketplaceSearchResult, Error> OfficialRegistryAdapter::Search(
    const MarketplaceSearchParams& params) {
    int page = params.page < 1 ? 1 : params.page;
    std::optional<std::string> cursor;
    if (page > 1) {
        cursor = cursors_.Find(params.query, page);
        if (!cursor.has_value()) {
            LogDebug("marketplace", "No cursor for page " + std::to_string(page) +
                                        " of \"" + params.query + "\", serving page 1");
            page = 1;
        }
    }

    QueryParams query;
    if (!params.query.empty()) {
        query.emplace_back("search", params.query);
    }
    query.emplace_back("version", "latest");
    query.emplace_back("limit", std::to_string(params.page_size));
    if (cursor.has_value()) {
        query.emplace_back("cursor", *cursor);
    }
    auto url = base_url_ + "?" + BuildQuery(query);

    auto response = http_.Get(url, {{"Accept", "application/json"}});
    if (response.IsErr()) {
        return Result<MarketplaceSearchResult, Error>::Err(std::move(response).Error());
    }
    auto body = market::ParseRegistryReply("MarketplaceSearch", url, "Registry", response.Value());
    if (body.IsErr()) {
        return Result<MarketplaceSearchResult, Error>::Err(std::move(body).Error());
    }
    const auto& data = body.Value();

    std::optional<std::string> next_cursor;
    if (const auto* metadata = Field(data, "metadata")) {
        next_cursor = OptString(*metadata, "nextCursor");
    }
    if (next_cursor.has_value()) {
        cursors_.Store(params.query, page + 1, *next_cursor);
    }

    MarketplaceSearchResult result;
    if (const auto* servers = Field(data, "servers"); servers && servers->is_array()) {
        for (const auto& entry : *servers) {
            auto server = OfficialServerFromJson(entry);
            if (!server.id.empty()) {
                result.servers.push_back(std::move(server));
            }
        }
    }
    // The API exposes no total.
    result.total_count = static_cast<int64_t>(result.servers.size());
    result.has_more = next_cursor.has_value();
    return Result<MarketplaceSearchResult, Error>::Ok(std::move(result));
}

} // namespace mcphub
