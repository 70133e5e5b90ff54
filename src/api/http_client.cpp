#include <asc_mcp/api/http_client.hpp>

#include <asc_mcp/core/log.hpp>
#include <asc_mcp/core/url.hpp>

#include <httplib.h>

#include <algorithm>
#include <cctype>

namespace asc_mcp {

namespace {

ErrorCategory CategoryFromHttpTransportError(httplib::Error error) {
    switch (error) {
        case httplib::Error::Timeout:
        case httplib::Error::ConnectionTimeout:
        case httplib::Error::Read:
            return ErrorCategory::Timeout;
        default:
            return ErrorCategory::Connection;
    }
}

Error MakeTransportError(const std::string& operation,
                         std::string_view target,
                         httplib::Error error) {
    return Error{operation, std::string(target), std::nullopt,
                 "HTTP request failed: " + httplib::to_string(error),
                 std::nullopt, CategoryFromHttpTransportError(error)};
}

HttpHeaders ToHttpHeaders(const httplib::Headers& hdrs) {
    HttpHeaders result;
    for (const auto& [key, value] : hdrs) {
        result[key] = value;
    }
    return result;
}

httplib::Headers ToHttplibHeaders(const HttpHeaders& hdrs) {
    httplib::Headers result;
    for (const auto& [key, value] : hdrs) {
        result.emplace(key, value);
    }
    return result;
}

bool IsSensitiveHeader(std::string_view key) {
    std::string lower_key(key);
    std::transform(lower_key.begin(), lower_key.end(), lower_key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower_key == "authorization" || lower_key == "cookie" ||
           lower_key == "set-cookie";
}

void LogRequest(const char* method, std::string_view target,
                const httplib::Headers& hdrs) {
    LogInfo("http", std::string(method) + " " + std::string(target));
    for (const auto& [k, v] : hdrs) {
        LogDebug("http", "  > " + k + ": " + (IsSensitiveHeader(k) ? "<redacted>" : v));
    }
}

void LogResponse(const httplib::Response& res) {
    LogInfo("http", "  < " + std::to_string(res.status));
    for (const auto& [k, v] : res.headers) {
        LogDebug("http", "  < " + k + ": " + (IsSensitiveHeader(k) ? "<redacted>" : v));
    }
    if (res.status >= 400 && !res.body.empty()) {
        constexpr size_t kMaxBodyLog = 2000;
        if (res.body.size() <= kMaxBodyLog) {
            LogDebug("http", "  < body: " + res.body);
        } else {
            LogDebug("http", "  < body: " + res.body.substr(0, kMaxBodyLog) +
                                 "... (truncated)");
        }
    }
}

} // anonymous namespace

struct HttplibClient::Impl {
    std::string base_url;
    std::unique_ptr<httplib::Client> client;

    // httplib::Client takes scheme://host[:port] only; any path or
    // trailing slash on the configured URL is dropped.
    Impl(const std::string& url, const HttpClientOptions& opts) : base_url(url) {
        if (auto parts = SplitUrl(url)) {
            base_url = parts->origin;
        }
        client = std::make_unique<httplib::Client>(base_url);
        client->set_connection_timeout(opts.connect_timeout);
        client->set_read_timeout(opts.read_timeout);
        client->set_write_timeout(opts.write_timeout);
    }

    Result<HttpResponse, Error> Finish(const char* operation,
                                       std::string_view target,
                                       const httplib::Result& res) {
        if (!res) {
            const auto http_error = res.error();
            LogWarn("http", std::string(operation) + " " + std::string(target) +
                                " failed: " + httplib::to_string(http_error));
            return Result<HttpResponse, Error>::Err(
                MakeTransportError(operation, target, http_error));
        }
        LogResponse(*res);
        return Result<HttpResponse, Error>::Ok(HttpResponse{
            res->status, ToHttpHeaders(res->headers), res->body});
    }
};

HttplibClient::HttplibClient(const std::string& base_url,
                             const HttpClientOptions& options)
    : impl_(std::make_unique<Impl>(base_url, options)) {}

HttplibClient::~HttplibClient() = default;

Result<HttpResponse, Error> HttplibClient::Get(std::string_view target,
                                               const HttpHeaders& headers) {
    auto hdrs = ToHttplibHeaders(headers);
    LogRequest("GET", target, hdrs);
    auto res = impl_->client->Get(std::string(target), hdrs);
    return impl_->Finish("Get", target, res);
}

Result<HttpResponse, Error> HttplibClient::Post(std::string_view target,
                                                std::string_view body,
                                                std::string_view content_type,
                                                const HttpHeaders& headers) {
    auto hdrs = ToHttplibHeaders(headers);
    LogRequest("POST", target, hdrs);
    auto res = impl_->client->Post(std::string(target), hdrs,
                                   std::string(body), std::string(content_type));
    return impl_->Finish("Post", target, res);
}

Result<HttpResponse, Error> HttplibClient::Patch(std::string_view target,
                                                 std::string_view body,
                                                 std::string_view content_type,
                                                 const HttpHeaders& headers) {
    auto hdrs = ToHttplibHeaders(headers);
    LogRequest("PATCH", target, hdrs);
    auto res = impl_->client->Patch(std::string(target), hdrs,
                                    std::string(body), std::string(content_type));
    return impl_->Finish("Patch", target, res);
}

Result<HttpResponse, Error> HttplibClient::Delete(std::string_view target,
                                                  const HttpHeaders& headers) {
    auto hdrs = ToHttplibHeaders(headers);
    LogRequest("DELETE", target, hdrs);
    auto res = impl_->client->Delete(std::string(target), hdrs);
    return impl_->Finish("Delete", target, res);
}

std::string HttplibClient::BaseUrl() const {
    return impl_->base_url;
}

} // namespace asc_mcp
