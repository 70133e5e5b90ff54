#pragma once

#include <asc_mcp/auth/i_token_provider.hpp>
#include <asc_mcp/auth/i_token_signer.hpp>
#include <asc_mcp/core/result.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace asc_mcp {

inline constexpr const char* kAudience = "appstoreconnect-v1";

// The upstream rejects tokens that live longer than this.
inline constexpr std::chrono::minutes kMaxTokenLifetime{20};

struct Credentials {
    std::string issuer_id;
    std::string key_id;
    std::string private_key_path;
};

struct CredentialOptions {
    std::chrono::seconds lifetime{15 * 60};
    std::chrono::seconds refresh_margin{2 * 60};
};

struct Token {
    std::string value;
    std::chrono::system_clock::time_point issued_at;
    std::chrono::system_clock::time_point expires_at;
};

using Clock = std::function<std::chrono::system_clock::time_point()>;

// ---------------------------------------------------------------------------
// CredentialManager - signs, caches and refreshes the API bearer token.
//
// GetToken() returns the cached token while it is outside the refresh margin
// of its expiry and signs a new one otherwise. The check and the regeneration
// happen under one lock, so concurrent callers never sign twice for the same
// stale token.
// ---------------------------------------------------------------------------
class CredentialManager : public ITokenProvider {
public:
    // Loads the P-256 key from credentials.private_key_path. All key errors
    // surface here.
    static Result<std::unique_ptr<CredentialManager>, Error> Create(
        const Credentials& credentials,
        const CredentialOptions& options = {});

    CredentialManager(std::string issuer_id,
                      std::string key_id,
                      std::unique_ptr<ITokenSigner> signer,
                      const CredentialOptions& options = {},
                      Clock clock = nullptr);

    [[nodiscard]] Result<std::string, Error> GetToken() override;

    // Expiry of the cached token, nullopt before the first GetToken().
    [[nodiscard]] std::optional<std::chrono::system_clock::time_point>
    ExpiresAt() const;

    [[nodiscard]] const std::string& IssuerId() const { return issuer_id_; }
    [[nodiscard]] const std::string& KeyId() const { return key_id_; }
    [[nodiscard]] std::chrono::seconds Lifetime() const { return lifetime_; }
    [[nodiscard]] std::chrono::seconds RefreshMargin() const {
        return refresh_margin_;
    }

private:
    [[nodiscard]] bool IsFresh(std::chrono::system_clock::time_point now) const;
    Result<Token, Error> Generate(std::chrono::system_clock::time_point now);

    std::string issuer_id_;
    std::string key_id_;
    std::unique_ptr<ITokenSigner> signer_;
    std::chrono::seconds lifetime_;
    std::chrono::seconds refresh_margin_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::optional<Token> cached_;
};

} // namespace asc_mcp
