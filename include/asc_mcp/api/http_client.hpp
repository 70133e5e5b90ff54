#pragma once

#include <asc_mcp/api/i_http_client.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace asc_mcp {

struct HttpClientOptions {
    std::chrono::seconds connect_timeout{30};
    std::chrono::seconds read_timeout{30};
    std::chrono::seconds write_timeout{30};
};

// ---------------------------------------------------------------------------
// HttplibClient - IHttpClient over cpp-httplib.
//
// Uses pimpl to keep httplib out of the public header. Requests are logged
// at INFO (method and target) and headers at DEBUG, with Authorization
// redacted. BaseUrl() is the origin of the URL given to the constructor.
// ---------------------------------------------------------------------------
class HttplibClient : public IHttpClient {
public:
    explicit HttplibClient(const std::string& base_url,
                           const HttpClientOptions& options = {});
    ~HttplibClient() override;

    HttplibClient(const HttplibClient&) = delete;
    HttplibClient& operator=(const HttplibClient&) = delete;
    HttplibClient(HttplibClient&&) = delete;
    HttplibClient& operator=(HttplibClient&&) = delete;

    [[nodiscard]] Result<HttpResponse, Error> Get(
        std::string_view target,
        const HttpHeaders& headers = {}) override;

    [[nodiscard]] Result<HttpResponse, Error> Post(
        std::string_view target,
        std::string_view body,
        std::string_view content_type,
        const HttpHeaders& headers = {}) override;

    [[nodiscard]] Result<HttpResponse, Error> Patch(
        std::string_view target,
        std::string_view body,
        std::string_view content_type,
        const HttpHeaders& headers = {}) override;

    [[nodiscard]] Result<HttpResponse, Error> Delete(
        std::string_view target,
        const HttpHeaders& headers = {}) override;

    [[nodiscard]] std::string BaseUrl() const override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace asc_mcp
