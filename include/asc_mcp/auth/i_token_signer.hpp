#pragma once

#include <asc_mcp/core/result.hpp>

#include <string>
#include <string_view>

namespace asc_mcp {

// ---------------------------------------------------------------------------
// ITokenSigner - produces the JWS signature over "header.claims".
//
// The credential manager depends on this interface rather than on a concrete
// key type, so tests can substitute a deterministic signer without touching
// the caching logic.
// ---------------------------------------------------------------------------
class ITokenSigner {
public:
    virtual ~ITokenSigner() = default;

    ITokenSigner(const ITokenSigner&) = delete;
    ITokenSigner& operator=(const ITokenSigner&) = delete;
    ITokenSigner(ITokenSigner&&) = delete;
    ITokenSigner& operator=(ITokenSigner&&) = delete;

    /// JWS "alg" header value, e.g. "ES256".
    [[nodiscard]] virtual std::string Algorithm() const = 0;

    /// Raw signature bytes (not base64) in the JWS encoding for Algorithm().
    [[nodiscard]] virtual Result<std::string, Error> Sign(
        std::string_view signing_input) = 0;

protected:
    ITokenSigner() = default;
};

} // namespace asc_mcp
