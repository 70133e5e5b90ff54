#include <asc_mcp/auth/jwt.hpp>

#include <jwt-cpp/traits/nlohmann-json/defaults.h>

#include <chrono>
#include <system_error>

namespace asc_mcp {

namespace {

using Base64Url = jwt::alphabet::base64url;

// jwt-cpp signing algorithm over an ITokenSigner. jwt::builder only needs
// name() and sign(data, ec); a failed Sign() is kept so the caller gets the
// signer's own Error rather than a bare error_code.
class SignerAlgorithm {
public:
    explicit SignerAlgorithm(ITokenSigner& signer) : signer_(signer) {}

    std::string name() const { return signer_.Algorithm(); }

    std::string sign(const std::string& data, std::error_code& ec) const {
        auto signature = signer_.Sign(data);
        if (signature.IsErr()) {
            failure_ = std::move(signature).Error();
            ec = jwt::error::signature_generation_error::signfinal_failed;
            return {};
        }
        return std::move(signature).Value();
    }

    const std::optional<Error>& Failure() const { return failure_; }

private:
    ITokenSigner& signer_;
    mutable std::optional<Error> failure_;
};

std::chrono::system_clock::time_point FromEpochSeconds(int64_t seconds) {
    return std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
}

} // anonymous namespace

std::string Base64UrlEncode(std::string_view data) {
    return jwt::base::trim<Base64Url>(jwt::base::encode<Base64Url>(std::string(data)));
}

std::optional<std::string> Base64UrlDecode(std::string_view encoded) {
    std::string unpadded(encoded);
    while (!unpadded.empty() && unpadded.back() == '=') {
        unpadded.pop_back();
    }
    try {
        return jwt::base::decode<Base64Url>(jwt::base::pad<Base64Url>(unpadded));
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }
}

Result<std::string, Error> EncodeJwt(const std::string& key_id,
                                     const JwtClaims& claims,
                                     ITokenSigner& signer) {
    using R = Result<std::string, Error>;

    SignerAlgorithm algorithm(signer);
    std::error_code ec;
    auto token = jwt::create()
                     .set_type("JWT")
                     .set_key_id(key_id)
                     .set_issuer(claims.issuer)
                     .set_issued_at(FromEpochSeconds(claims.issued_at))
                     .set_expires_at(FromEpochSeconds(claims.expires_at))
                     .set_audience(claims.audience)
                     .sign(algorithm, ec);
    if (ec) {
        if (algorithm.Failure().has_value()) {
            return R::Err(*algorithm.Failure());
        }
        return R::Err(Error{"SignToken", "", std::nullopt,
                            "JWT encoding failed: " + ec.message(), std::nullopt,
                            ErrorCategory::Credential});
    }
    return R::Ok(std::move(token));
}

std::optional<DecodedJwt> DecodeJwt(std::string_view token) {
    const auto first = token.find('.');
    if (first == std::string_view::npos) return std::nullopt;
    const auto second = token.find('.', first + 1);
    if (second == std::string_view::npos ||
        token.find('.', second + 1) != std::string_view::npos) {
        return std::nullopt;
    }

    try {
        const auto jws = jwt::decode(std::string(token));
        DecodedJwt decoded;
        decoded.header = jws.get_header_json();
        decoded.claims = jws.get_payload_json();
        decoded.signing_input = jws.get_header_base64() + "." + jws.get_payload_base64();
        decoded.signature = jws.get_signature();
        return decoded;
    } catch (const std::exception&) {
        // Bad base64url, non-JSON or non-object parts.
        return std::nullopt;
    }
}

} // namespace asc_mcp
