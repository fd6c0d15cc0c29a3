#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mcphub {

// Percent-encode a string per RFC 3986.
// Unreserved characters (alphanumeric, '-', '_', '.', '~') pass through;
// everything else is replaced with %XX (uppercase hex).
std::string UrlEncode(const std::string& value);

// An absolute http(s) URL split into the parts cpp-httplib wants:
// the origin for the client and the path (+ query) for the request.
struct ParsedUrl {
    std::string scheme;   // "http" or "https"
    std::string host;
    int port = 0;         // explicit or scheme default
    std::string target;   // path plus optional "?query", never empty

    // "scheme://host[:port]", port omitted when it is the scheme default.
    [[nodiscard]] std::string Origin() const;
};

std::optional<ParsedUrl> ParseUrl(std::string_view url);

// Resolve `reference` against `base`. Absolute references pass through,
// "/path" keeps only the base origin, anything else replaces the last
// path segment of the base.
std::string ResolveUrl(std::string_view base, std::string_view reference);

using QueryParams = std::vector<std::pair<std::string, std::string>>;

// "k1=v1&k2=v2" with both keys and values percent-encoded.
std::string BuildQuery(const QueryParams& params);

} // namespace mcphub
