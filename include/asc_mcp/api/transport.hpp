#pragma once

#include <asc_mcp/api/i_http_client.hpp>
#include <asc_mcp/auth/i_token_provider.hpp>
#include <asc_mcp/core/result.hpp>
#include <asc_mcp/core/url.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace asc_mcp {

enum class HttpMethod {
    Get,
    Post,
    Patch,
    Delete,
};

std::string HttpMethodName(HttpMethod method);

// Upstream page size limit for collection endpoints.
inline constexpr int kMaxPageSize = 200;

// Upper bound on pages followed by one List call.
inline constexpr int kMaxPages = 100;

// ---------------------------------------------------------------------------
// ListPage - items accumulated across one or more upstream pages.
// ---------------------------------------------------------------------------
struct ListPage {
    std::vector<nlohmann::json> data;
    std::vector<nlohmann::json> included;
    std::optional<int64_t> total;  // meta.paging.total of the first page
    int pages_fetched = 0;
};

// ---------------------------------------------------------------------------
// Transport - authenticated JSON:API calls against the upstream.
//
// Every request obtains a token from the ITokenProvider and carries it as
// "Authorization: Bearer". Responses are decoded as JSON; a 2xx response
// with an empty body decodes to null. Non-2xx statuses become Errors with
// http_status set; requests that produced no usable response become Errors
// without one (see Error::IsRejection). Nothing is retried.
// ---------------------------------------------------------------------------
class Transport {
public:
    Transport(IHttpClient& client, ITokenProvider& tokens);

    [[nodiscard]] Result<nlohmann::json, Error> Execute(
        HttpMethod method,
        std::string_view path,
        const QueryParams& query = {},
        const std::optional<nlohmann::json>& body = std::nullopt);

    [[nodiscard]] Result<nlohmann::json, Error> Get(
        std::string_view path, const QueryParams& query = {});

    [[nodiscard]] Result<nlohmann::json, Error> Post(
        std::string_view path, const nlohmann::json& body);

    [[nodiscard]] Result<nlohmann::json, Error> Patch(
        std::string_view path, const nlohmann::json& body);

    [[nodiscard]] Result<void, Error> Delete(std::string_view path);

    // Collect up to max_items items of a collection, following links.next
    // while the upstream reports more pages. Paging stops early at a page
    // with no items, a next link back to the same target, or kMaxPages. max_items <= 0 yields an empty
    // page without contacting the upstream.
    [[nodiscard]] Result<ListPage, Error> List(std::string_view path,
                                               const QueryParams& query,
                                               int max_items);

private:
    Result<nlohmann::json, Error> Send(HttpMethod method,
                                       const std::string& target,
                                       const std::optional<nlohmann::json>& body);

    // Origin-relative target for a links.next value, nullopt if unusable.
    std::optional<std::string> NextTarget(const std::string& link) const;

    IHttpClient& client_;
    ITokenProvider& tokens_;
};

} // namespace asc_mcp
