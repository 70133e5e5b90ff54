#pragma once

#include <asc_mcp/core/result.hpp>

#include <map>
#include <string>
#include <string_view>

namespace asc_mcp {

// ---------------------------------------------------------------------------
// HttpHeaders - header name/value pairs. Names are kept as sent; callers
// normalise case where they compare.
// ---------------------------------------------------------------------------
using HttpHeaders = std::map<std::string, std::string>;

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::string body;
};

// ---------------------------------------------------------------------------
// IHttpClient - abstract HTTP client bound to one origin.
//
// Targets are origin-relative ("/v1/apps?limit=50"). Any HTTP status is a
// successful result; Err is reserved for requests that produced no response
// (connection refused, timeout, TLS failure). Tests use MockHttpClient.
// ---------------------------------------------------------------------------
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    IHttpClient(const IHttpClient&) = delete;
    IHttpClient& operator=(const IHttpClient&) = delete;
    IHttpClient(IHttpClient&&) = delete;
    IHttpClient& operator=(IHttpClient&&) = delete;

    [[nodiscard]] virtual Result<HttpResponse, Error> Get(
        std::string_view target,
        const HttpHeaders& headers = {}) = 0;

    [[nodiscard]] virtual Result<HttpResponse, Error> Post(
        std::string_view target,
        std::string_view body,
        std::string_view content_type,
        const HttpHeaders& headers = {}) = 0;

    [[nodiscard]] virtual Result<HttpResponse, Error> Patch(
        std::string_view target,
        std::string_view body,
        std::string_view content_type,
        const HttpHeaders& headers = {}) = 0;

    [[nodiscard]] virtual Result<HttpResponse, Error> Delete(
        std::string_view target,
        const HttpHeaders& headers = {}) = 0;

    // Scheme, host and port requests are sent to.
    [[nodiscard]] virtual std::string BaseUrl() const = 0;

protected:
    IHttpClient() = default;
};

} // namespace asc_mcp
