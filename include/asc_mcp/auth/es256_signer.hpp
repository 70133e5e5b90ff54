#pragma once

#include <asc_mcp/auth/i_token_signer.hpp>
#include <asc_mcp/core/result.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace asc_mcp {

// ---------------------------------------------------------------------------
// Es256Signer - ECDSA P-256 / SHA-256 signer over jwt::algorithm::es256.
//
// Accepts PKCS#8 ("BEGIN PRIVATE KEY", the .p8 format App Store Connect
// issues) and SEC1 ("BEGIN EC PRIVATE KEY") PEM. Any key that is not an EC
// key on P-256 is rejected (checked with OpenSSL) when the signer is
// created, so Sign() only fails on an OpenSSL-internal error.
//
// Signatures use the JWS encoding: 64 bytes, r || s, each left-padded to 32.
// ---------------------------------------------------------------------------
class Es256Signer : public ITokenSigner {
public:
    static Result<std::unique_ptr<Es256Signer>, Error> FromPem(
        std::string_view pem);

    static Result<std::unique_ptr<Es256Signer>, Error> FromPemFile(
        const std::string& path);

    ~Es256Signer() override;

    [[nodiscard]] std::string Algorithm() const override { return "ES256"; }

    [[nodiscard]] Result<std::string, Error> Sign(
        std::string_view signing_input) override;

    /// Verify a JWS-encoded signature with the public half of the key.
    [[nodiscard]] bool Verify(std::string_view signing_input,
                              std::string_view signature) const;

private:
    struct Impl;
    explicit Es256Signer(std::unique_ptr<Impl> impl);
    std::unique_ptr<Impl> impl_;
};

} // namespace asc_mcp
