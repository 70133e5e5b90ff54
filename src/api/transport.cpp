#include <asc_mcp/api/transport.hpp>

#include <asc_mcp/core/log.hpp>

#include <algorithm>
#include <initializer_list>

namespace asc_mcp {

namespace {

constexpr const char* kJsonContentType = "application/json";

bool IsBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n';
    });
}

// Nested member lookup; nullptr when any step is missing or not an object.
const nlohmann::json* FindPath(const nlohmann::json& doc,
                               std::initializer_list<const char*> keys) {
    const nlohmann::json* node = &doc;
    for (const char* key : keys) {
        if (!node->is_object()) return nullptr;
        auto it = node->find(key);
        if (it == node->end()) return nullptr;
        node = &*it;
    }
    return node;
}

Error MakeDecodeError(const std::string& operation,
                      const std::string& endpoint,
                      const std::string& message) {
    return Error{operation, endpoint, std::nullopt, message, std::nullopt,
                 ErrorCategory::Decode};
}

} // anonymous namespace

std::string HttpMethodName(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:    return "GET";
        case HttpMethod::Post:   return "POST";
        case HttpMethod::Patch:  return "PATCH";
        case HttpMethod::Delete: return "DELETE";
    }
    return "GET";
}

Transport::Transport(IHttpClient& client, ITokenProvider& tokens)
    : client_(client), tokens_(tokens) {}

// ---------------------------------------------------------------------------
// Execute and verbs
// ---------------------------------------------------------------------------
Result<nlohmann::json, Error> Transport::Execute(
    HttpMethod method,
    std::string_view path,
    const QueryParams& query,
    const std::optional<nlohmann::json>& body) {
    return Send(method, BuildRequestTarget(path, query), body);
}

Result<nlohmann::json, Error> Transport::Get(std::string_view path,
                                             const QueryParams& query) {
    return Execute(HttpMethod::Get, path, query);
}

Result<nlohmann::json, Error> Transport::Post(std::string_view path,
                                              const nlohmann::json& body) {
    return Execute(HttpMethod::Post, path, {}, body);
}

Result<nlohmann::json, Error> Transport::Patch(std::string_view path,
                                               const nlohmann::json& body) {
    return Execute(HttpMethod::Patch, path, {}, body);
}

Result<void, Error> Transport::Delete(std::string_view path) {
    auto result = Execute(HttpMethod::Delete, path);
    if (result.IsErr()) {
        return Result<void, Error>::Err(std::move(result).Error());
    }
    return Result<void, Error>::Ok();
}

Result<nlohmann::json, Error> Transport::Send(
    HttpMethod method,
    const std::string& target,
    const std::optional<nlohmann::json>& body) {
    using R = Result<nlohmann::json, Error>;
    const auto operation = HttpMethodName(method);

    auto token = tokens_.GetToken();
    if (token.IsErr()) {
        return R::Err(std::move(token).Error());
    }

    HttpHeaders headers;
    headers["Authorization"] = "Bearer " + token.Value();
    headers["Accept"] = kJsonContentType;

    const std::string payload = body.has_value() ? body->dump() : std::string{};

    Result<HttpResponse, Error> response = [&]() {
        switch (method) {
            case HttpMethod::Post:
                return client_.Post(target, payload, kJsonContentType, headers);
            case HttpMethod::Patch:
                return client_.Patch(target, payload, kJsonContentType, headers);
            case HttpMethod::Delete:
                return client_.Delete(target, headers);
            case HttpMethod::Get:
                break;
        }
        return client_.Get(target, headers);
    }();
    if (response.IsErr()) {
        return R::Err(std::move(response).Error());
    }

    const auto& res = response.Value();
    if (res.status_code < 200 || res.status_code >= 300) {
        auto error = Error::FromHttpStatus(operation, target, res.status_code,
                                           res.body);
        LogWarn("api", operation + " " + target + ": " + error.UserMessage());
        return R::Err(std::move(error));
    }

    if (IsBlank(res.body)) {
        return R::Ok(nlohmann::json(nullptr));
    }

    auto decoded = nlohmann::json::parse(res.body, nullptr, false);
    if (decoded.is_discarded()) {
        return R::Err(MakeDecodeError(
            operation, target,
            "malformed JSON in " + std::to_string(res.status_code) + " response"));
    }
    return R::Ok(std::move(decoded));
}

// ---------------------------------------------------------------------------
// List
// ---------------------------------------------------------------------------
std::optional<std::string> Transport::NextTarget(const std::string& link) const {
    if (link.empty()) return std::nullopt;
    if (link.front() == '/') return link;

    auto parts = SplitUrl(link);
    if (!parts.has_value()) return std::nullopt;
    if (parts->origin != client_.BaseUrl()) {
        LogDebug("api", "next link origin " + parts->origin +
                            " differs from " + client_.BaseUrl());
    }
    return parts->target;
}

Result<ListPage, Error> Transport::List(std::string_view path,
                                        const QueryParams& query,
                                        int max_items) {
    using R = Result<ListPage, Error>;

    ListPage page;
    if (max_items <= 0) {
        return R::Ok(std::move(page));
    }

    auto params = query;
    params.emplace_back("limit", std::to_string(std::min(max_items, kMaxPageSize)));
    std::string target = BuildRequestTarget(path, params);
    const auto wanted = static_cast<size_t>(max_items);

    while (true) {
        auto response = Send(HttpMethod::Get, target, std::nullopt);
        if (response.IsErr()) {
            return R::Err(std::move(response).Error());
        }
        const auto& doc = response.Value();
        ++page.pages_fetched;

        if (!doc.is_object() || !doc.contains("data") || !doc["data"].is_array()) {
            return R::Err(MakeDecodeError("GET", target,
                                          "collection response has no data array"));
        }
        const auto& items = doc["data"];
        for (const auto& item : items) {
            if (page.data.size() >= wanted) break;
            page.data.push_back(item);
        }
        if (doc.contains("included") && doc["included"].is_array()) {
            for (const auto& item : doc["included"]) {
                page.included.push_back(item);
            }
        }
        if (!page.total.has_value()) {
            const auto* total = FindPath(doc, {"meta", "paging", "total"});
            if (total != nullptr && total->is_number_integer()) {
                page.total = total->get<int64_t>();
            }
        }

        if (page.data.size() >= wanted || items.empty()) break;
        if (page.pages_fetched >= kMaxPages) {
            LogWarn("api", "stopped paging " + std::string(path) + " after " +
                               std::to_string(kMaxPages) + " pages");
            break;
        }

        const auto* link = FindPath(doc, {"links", "next"});
        if (link == nullptr || !link->is_string()) break;
        auto next = NextTarget(link->get<std::string>());
        if (!next.has_value() || *next == target) break;
        target = std::move(*next);
    }

    LogDebug("api", "listed " + std::to_string(page.data.size()) + " items from " +
                        std::string(path) + " in " +
                        std::to_string(page.pages_fetched) + " page(s)");
    return R::Ok(std::move(page));
}

} // namespace asc_mcp
