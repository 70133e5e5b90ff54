#include <asc_mcp/core/result.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

namespace asc_mcp {

namespace {

constexpr size_t kMaxRawBodyInError = 500;

// A string member of an error object; null, missing or non-string -> "".
std::string StringMember(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

// Extract "title: detail" pairs from a JSON:API error document:
//   {"errors": [{"status": "404", "code": "NOT_FOUND",
//                "title": "...", "detail": "..."}]}
std::optional<std::string> ExtractJsonApiErrors(const std::string& body) {
    if (body.empty()) return std::nullopt;

    auto doc = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object()) return std::nullopt;

    auto it = doc.find("errors");
    if (it == doc.end() || !it->is_array() || it->empty()) return std::nullopt;

    std::string joined;
    for (const auto& e : *it) {
        if (!e.is_object()) continue;
        const auto title = StringMember(e, "title");
        const auto detail = StringMember(e, "detail");
        if (title.empty() && detail.empty()) continue;
        if (!joined.empty()) joined += "; ";
        if (title.empty() || detail.empty()) {
            joined += title.empty() ? detail : title;
        } else {
            joined += title + ": " + detail;
        }
    }
    if (joined.empty()) return std::nullopt;
    return joined;
}

std::optional<std::string> ExtractUpstreamError(const std::string& body) {
    auto parsed = ExtractJsonApiErrors(body);
    if (parsed.has_value()) return parsed;
    if (body.empty()) return std::nullopt;
    if (body.size() <= kMaxRawBodyInError) return body;
    return body.substr(0, kMaxRawBodyInError) + "... (truncated)";
}

} // anonymous namespace

Error Error::FromHttpStatus(const std::string& operation,
                            const std::string& endpoint,
                            int status_code,
                            const std::string& response_body) {
    auto upstream = ExtractUpstreamError(response_body);

    ErrorCategory category;
    std::string message;

    switch (status_code) {
        case 400:
            category = ErrorCategory::InvalidRequest;
            message = "Bad request";
            break;
        case 401:
            category = ErrorCategory::Authentication;
            message = "Authentication failed - check issuer id, key id and private key";
            break;
        case 403:
            category = ErrorCategory::Forbidden;
            message = "Forbidden - the API key lacks access to this resource";
            break;
        case 404:
            category = ErrorCategory::NotFound;
            message = "Not found";
            break;
        case 409:
            category = ErrorCategory::Conflict;
            message = "Conflict";
            break;
        case 422:
            category = ErrorCategory::InvalidRequest;
            message = "Unprocessable entity";
            break;
        case 429:
            category = ErrorCategory::RateLimited;
            message = "Too many requests - retry later";
            break;
        default:
            if (status_code >= 500) {
                category = ErrorCategory::UpstreamServer;
                message = "App Store Connect server error";
            } else {
                category = ErrorCategory::InvalidRequest;
                message = "Unexpected HTTP " + std::to_string(status_code);
            }
            break;
    }

    return Error{operation, endpoint, status_code, message, upstream, category};
}

std::string Error::UserMessage() const {
    if (http_status.has_value()) {
        std::ostringstream oss;
        oss << "API error (" << *http_status << "): ";
        if (upstream_error.has_value() && !upstream_error->empty()) {
            oss << *upstream_error;
        } else {
            oss << message;
        }
        return oss.str();
    }
    return "request failed: " + message;
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!endpoint.empty()) {
        oss << " [" << endpoint << "]";
    }
    if (http_status.has_value()) {
        oss << " (HTTP " << *http_status << ")";
    }
    oss << ": " << message;
    if (upstream_error.has_value() && !upstream_error->empty()) {
        oss << " (upstream: " << *upstream_error << ")";
    }
    return oss.str();
}

std::string Error::ToJson() const {
    nlohmann::json j;
    j["category"] = CategoryName();
    j["operation"] = operation;
    if (!endpoint.empty()) {
        j["endpoint"] = endpoint;
    }
    if (http_status.has_value()) {
        j["http_status"] = *http_status;
    }
    j["message"] = message;
    if (upstream_error.has_value() && !upstream_error->empty()) {
        j["upstream_error"] = *upstream_error;
    }
    j["exit_code"] = ExitCode();
    return nlohmann::json{{"error", j}}.dump();
}

} // namespace asc_mcp
