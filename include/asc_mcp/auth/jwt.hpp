#pragma once

#include <asc_mcp/auth/i_token_signer.hpp>
#include <asc_mcp/core/result.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace asc_mcp {

// base64url without padding (RFC 7515 §2).
std::string Base64UrlEncode(std::string_view data);

// Accepts input with or without padding. nullopt on invalid characters.
std::optional<std::string> Base64UrlDecode(std::string_view encoded);

struct JwtClaims {
    std::string issuer;
    std::string audience;
    int64_t issued_at = 0;   // seconds since epoch
    int64_t expires_at = 0;  // seconds since epoch
};

// header.claims.signature, each part base64url, built with jwt::create().
// The header carries {"alg": signer.Algorithm(), "kid": key_id, "typ": "JWT"}.
Result<std::string, Error> EncodeJwt(const std::string& key_id,
                                     const JwtClaims& claims,
                                     ITokenSigner& signer);

struct DecodedJwt {
    nlohmann::json header;
    nlohmann::json claims;
    std::string signing_input;  // "header.claims" as it was signed
    std::string signature;      // raw bytes
};

// Split and decode a compact JWS. Does not verify the signature.
std::optional<DecodedJwt> DecodeJwt(std::string_view token);

} // namespace asc_mcp
