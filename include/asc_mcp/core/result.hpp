#pragma once

#include <cassert>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace asc_mcp {

// ---------------------------------------------------------------------------
// Result<T, E> - a discriminated union that holds either a value or an error.
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    static Result Ok(const T& value) { return Result(OkTag{}, value); }
    static Result Ok(T&& value) { return Result(OkTag{}, std::move(value)); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const T& Value() const& {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(storage_);
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(storage_);
    }

    [[nodiscard]] T Value() && {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(std::move(storage_));
    }

    [[nodiscard]] T ValueOr(T default_value) const& {
        if (IsOk()) {
            return std::get<0>(storage_);
        }
        return default_value;
    }

    // fn: T -> Result<U, E>
    template <typename Fn>
    auto AndThen(Fn&& fn) const& -> std::invoke_result_t<Fn, const T&> {
        using ReturnType = std::invoke_result_t<Fn, const T&>;
        if (IsOk()) {
            return std::forward<Fn>(fn)(std::get<0>(storage_));
        }
        return ReturnType::Err(std::get<1>(storage_));
    }

    // fn: T -> U
    template <typename Fn>
    auto Map(Fn&& fn) const& -> Result<std::invoke_result_t<Fn, const T&>, E> {
        using U = std::invoke_result_t<Fn, const T&>;
        if (IsOk()) {
            return Result<U, E>::Ok(std::forward<Fn>(fn)(std::get<0>(storage_)));
        }
        return Result<U, E>::Err(std::get<1>(storage_));
    }

private:
    struct OkTag {};
    struct ErrTag {};

    Result(OkTag, const T& value) : storage_(std::in_place_index<0>, value) {}
    Result(OkTag, T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}
    Result(ErrTag, const E& error) : storage_(std::in_place_index<1>, error) {}
    Result(ErrTag, E&& error) : storage_(std::in_place_index<1>, std::move(error)) {}

    std::variant<T, E> storage_;
};

// ---------------------------------------------------------------------------
// Result<void, E> - specialization for operations that succeed with no value.
// ---------------------------------------------------------------------------
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(OkTag{}); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return *error_;
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::move(*error_);
    }

private:
    struct OkTag {};
    struct ErrTag {};

    explicit Result(OkTag) : error_(std::nullopt) {}
    Result(ErrTag, const E& error) : error_(error) {}
    Result(ErrTag, E&& error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

// ---------------------------------------------------------------------------
// ErrorCategory - classifies errors for exit codes and user-facing text.
//
// Connection, Timeout and Decode mean the upstream could not be reached or
// did not answer intelligibly. The HTTP-status categories mean the upstream
// answered and rejected the request.
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    Connection,
    Timeout,
    Decode,
    Authentication,
    Forbidden,
    NotFound,
    Conflict,
    RateLimited,
    InvalidRequest,
    UpstreamServer,
    Credential,
    Config,
    Internal,
};

// ---------------------------------------------------------------------------
// Error - structured error type for credential, transport and config failures.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;
    std::string endpoint;
    std::optional<int> http_status;
    std::string message;
    std::optional<std::string> upstream_error;
    ErrorCategory category = ErrorCategory::Internal;

    /// Create an Error from a non-2xx HTTP status. Extracts the JSON:API
    /// `errors[]` detail ("title: detail; ...") from the response body, or a
    /// truncated copy of the body when it is not a JSON:API error document.
    static Error FromHttpStatus(const std::string& operation,
                                const std::string& endpoint,
                                int status_code,
                                const std::string& response_body = "");

    /// True when the upstream answered with an HTTP status; false when it
    /// could not be reached or its answer could not be read.
    [[nodiscard]] bool IsRejection() const noexcept {
        return http_status.has_value();
    }

    [[nodiscard]] int ExitCode() const {
        switch (category) {
            case ErrorCategory::Connection:     return 1;
            case ErrorCategory::Timeout:        return 1;
            case ErrorCategory::Decode:         return 1;
            case ErrorCategory::Authentication: return 2;
            case ErrorCategory::Forbidden:      return 2;
            case ErrorCategory::NotFound:       return 3;
            case ErrorCategory::Conflict:       return 3;
            case ErrorCategory::RateLimited:    return 3;
            case ErrorCategory::InvalidRequest: return 3;
            case ErrorCategory::UpstreamServer: return 4;
            case ErrorCategory::Credential:     return 5;
            case ErrorCategory::Config:         return 6;
            case ErrorCategory::Internal:       return 99;
        }
        return 99;
    }

    [[nodiscard]] std::string CategoryName() const {
        switch (category) {
            case ErrorCategory::Connection:     return "connection";
            case ErrorCategory::Timeout:        return "timeout";
            case ErrorCategory::Decode:         return "decode";
            case ErrorCategory::Authentication: return "authentication";
            case ErrorCategory::Forbidden:      return "forbidden";
            case ErrorCategory::NotFound:       return "not_found";
            case ErrorCategory::Conflict:       return "conflict";
            case ErrorCategory::RateLimited:    return "rate_limited";
            case ErrorCategory::InvalidRequest: return "invalid_request";
            case ErrorCategory::UpstreamServer: return "upstream_server";
            case ErrorCategory::Credential:     return "credential";
            case ErrorCategory::Config:         return "config";
            case ErrorCategory::Internal:       return "internal";
        }
        return "internal";
    }

    /// "API error (404): Not Found: The specified resource does not exist"
    /// for rejections, "request failed: <message>" otherwise. This is the text
    /// surfaced to protocol clients.
    [[nodiscard]] std::string UserMessage() const;

    [[nodiscard]] std::string ToString() const;

    [[nodiscard]] std::string ToJson() const;

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return operation == other.operation &&
               endpoint == other.endpoint &&
               http_status == other.http_status &&
               message == other.message &&
               upstream_error == other.upstream_error &&
               category == other.category;
    }

    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

} // namespace asc_mcp
