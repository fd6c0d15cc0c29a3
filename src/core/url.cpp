#include <mcphub/core/url.hpp>

#include <cctype>
#include <iomanip>
#include <sstream>

namespace mcphub {

std::string UrlEncode(const std::string& value) {
    std::ostringstream encoded;
    encoded.fill('0');
    encoded << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return encoded.str();
}

std::string ParsedUrl::Origin() const {
    std::string origin = scheme + "://" + host;
    const int default_port = scheme == "https" ? 443 : 80;
    if (port != default_port) {
        origin += ":" + std::to_string(port);
    }
    return origin;
}

std::optional<ParsedUrl> ParseUrl(std::string_view url) {
    ParsedUrl parsed;
    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return std::nullopt;
    }
    parsed.scheme = std::string(url.substr(0, scheme_end));
    for (auto& c : parsed.scheme) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (parsed.scheme != "http" && parsed.scheme != "https") {
        return std::nullopt;
    }

    auto rest = url.substr(scheme_end + 3);
    auto target_start = rest.find_first_of("/?#");
    auto authority = rest.substr(0, target_start);
    if (authority.empty()) {
        return std::nullopt;
    }

    parsed.port = parsed.scheme == "https" ? 443 : 80;
    auto colon = authority.rfind(':');
    if (colon != std::string_view::npos && authority.find(']') == std::string_view::npos) {
        auto port_str = authority.substr(colon + 1);
        if (port_str.empty()) {
            return std::nullopt;
        }
        int port = 0;
        for (char c : port_str) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return std::nullopt;
            }
            port = port * 10 + (c - '0');
            if (port > 65535) {
                return std::nullopt;
            }
        }
        parsed.port = port;
        authority = authority.substr(0, colon);
    }
    parsed.host = std::string(authority);

    if (target_start == std::string_view::npos) {
        parsed.target = "/";
    } else {
        auto target = rest.substr(target_start);
        auto fragment = target.find('#');
        if (fragment != std::string_view::npos) {
            target = target.substr(0, fragment);
        }
        parsed.target = std::string(target);
        if (parsed.target.empty() || parsed.target[0] == '?') {
            parsed.target.insert(0, "/");
        }
    }
    return parsed;
}

std::string ResolveUrl(std::string_view base, std::string_view reference) {
    if (reference.find("://") != std::string_view::npos) {
        return std::string(reference);
    }
    auto parsed = ParseUrl(base);
    if (!parsed.has_value()) {
        return std::string(reference);
    }
    if (!reference.empty() && reference[0] == '/') {
        return parsed->Origin() + std::string(reference);
    }
    auto path = parsed->target.substr(0, parsed->target.find('?'));
    auto last_slash = path.rfind('/');
    return parsed->Origin() + path.substr(0, last_slash + 1) + std::string(reference);
}

std::string BuildQuery(const QueryParams& params) {
    std::string query;
    for (const auto& [key, value] : params) {
        if (!query.empty()) {
            query += '&';
        }
        query += UrlEncode(key);
        query += '=';
        query += UrlEncode(value);
    }
    return query;
}

} // namespace mcphub
