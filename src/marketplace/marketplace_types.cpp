#include <mcphub/marketplace/marketplace_types.hpp>

namespace mcphub {

const char* MarketplaceSourceName(MarketplaceSource source) {
    switch (source) {
        case MarketplaceSource::Official: return "official";
        case MarketplaceSource::Lobehub:  return "lobehub";
        case MarketplaceSource::Smithery: return "smithery";
    }
    return "lobehub";
}

std::optional<MarketplaceSource> ParseMarketplaceSource(std::string_view name) {
    if (name == "official") return MarketplaceSource::Official;
    if (name == "lobehub")  return MarketplaceSource::Lobehub;
    if (name == "smithery") return MarketplaceSource::Smithery;
    return std::nullopt;
}

nlohmann::json MarketplaceServerToJson(const MarketplaceServer& server) {
    nlohmann::json j = {
        {"id", server.id},
        {"name", server.name},
        {"description", server.description},
    };
    auto put = [&j](const char* key, const auto& field) {
        if (field.has_value()) {
            j[key] = *field;
        }
    };
    put("author", server.author);
    put("icon", server.icon);
    put("version", server.version);
    put("homepage", server.homepage);
    put("repository", server.repository);
    put("popularity", server.popularity);
    put("stars", server.stars);
    put("verified", server.verified);
    if (!server.tags.empty()) {
        j["tags"] = server.tags;
    }
    if (server.install.has_value()) {
        const auto& install = *server.install;
        nlohmann::json jinstall = {{"transport", TransportKindName(install.transport)}};
        if (install.transport == TransportKind::Stdio) {
            jinstall["command"] = install.command;
            jinstall["args"] = install.args;
        } else {
            jinstall["url"] = install.url;
        }
        if (!install.env_vars.empty()) {
            auto vars = nlohmann::json::array();
            for (const auto& var : install.env_vars) {
                vars.push_back({{"name", var.name},
                                {"description", var.description},
                                {"isSecret", var.is_secret},
                                {"isRequired", var.is_required}});
            }
            jinstall["envVars"] = std::move(vars);
        }
        j["install"] = std::move(jinstall);
    }
    return j;
}

} // namespace mcphub
