#pragma once

#include <asc_mcp/core/result.hpp>

#include <string>

namespace asc_mcp {

// ---------------------------------------------------------------------------
// ITokenProvider - source of the bearer token Transport attaches to requests.
// ---------------------------------------------------------------------------
class ITokenProvider {
public:
    virtual ~ITokenProvider() = default;

    ITokenProvider(const ITokenProvider&) = delete;
    ITokenProvider& operator=(const ITokenProvider&) = delete;
    ITokenProvider(ITokenProvider&&) = delete;
    ITokenProvider& operator=(ITokenProvider&&) = delete;

    [[nodiscard]] virtual Result<std::string, Error> GetToken() = 0;

protected:
    ITokenProvider() = default;
};

} // namespace asc_mcp
