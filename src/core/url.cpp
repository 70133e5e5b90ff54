#include <asc_mcp/core/url.hpp>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace asc_mcp {

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

std::string BuildQueryString(const QueryParams& params) {
    std::string query;
    for (const auto& [key, value] : params) {
        if (!query.empty()) query += '&';
        query += UrlEncode(key);
        query += '=';
        query += UrlEncode(value);
    }
    return query;
}

std::string BuildRequestTarget(std::string_view path, const QueryParams& params) {
    std::string target(path);
    auto query = BuildQueryString(params);
    if (!query.empty()) {
        target += (target.find('?') == std::string::npos) ? '?' : '&';
        target += query;
    }
    return target;
}

std::optional<UrlParts> SplitUrl(std::string_view url) {
    constexpr std::string_view kHttp = "http://";
    constexpr std::string_view kHttps = "https://";

    size_t scheme_len = 0;
    if (url.substr(0, kHttps.size()) == kHttps) {
        scheme_len = kHttps.size();
    } else if (url.substr(0, kHttp.size()) == kHttp) {
        scheme_len = kHttp.size();
    } else {
        return std::nullopt;
    }

    auto slash = url.find('/', scheme_len);
    auto question = url.find('?', scheme_len);
    auto host_end = std::min(slash, question);
    if (host_end == scheme_len || url.size() == scheme_len) return std::nullopt;

    UrlParts parts;
    if (host_end == std::string_view::npos) {
        parts.origin = std::string(url);
        parts.target = "/";
        return parts;
    }
    parts.origin = std::string(url.substr(0, host_end));
    parts.target = std::string(url.substr(host_end));
    if (parts.target.front() == '?') {
        parts.target.insert(parts.target.begin(), '/');
    }
    return parts;
}

} // namespace asc_mcp
