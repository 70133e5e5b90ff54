#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace asc_mcp {

// Query parameters in insertion order. Keys may repeat.
using QueryParams = std::vector<std::pair<std::string, std::string>>;

// Percent-encode a string per RFC 3986.
// Unreserved characters (alphanumeric, '-', '_', '.', '~') pass through;
// everything else is replaced with %XX (uppercase hex).
std::string UrlEncode(const std::string& value);

// "k1=v1&k2=v2" with keys and values percent-encoded. Empty for no params.
std::string BuildQueryString(const QueryParams& params);

// path + "?" + query, or just path when there are no params.
std::string BuildRequestTarget(std::string_view path, const QueryParams& params);

// ---------------------------------------------------------------------------
// Origin / request-target split of an absolute http(s) URL.
//   "https://api.example.com:8443/v1/apps?cursor=AB"
//     -> origin "https://api.example.com:8443", target "/v1/apps?cursor=AB"
// ---------------------------------------------------------------------------
struct UrlParts {
    std::string origin;
    std::string target;
};

std::optional<UrlParts> SplitUrl(std::string_view url);

} // namespace asc_mcp
