#include <asc_mcp/auth/credential_manager.hpp>

#include <asc_mcp/auth/es256_signer.hpp>
#include <asc_mcp/auth/jwt.hpp>
#include <asc_mcp/core/log.hpp>

namespace asc_mcp {

namespace {

using TimePoint = std::chrono::system_clock::time_point;

int64_t ToEpochSeconds(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(
               tp.time_since_epoch())
        .count();
}

} // anonymous namespace

Result<std::unique_ptr<CredentialManager>, Error> CredentialManager::Create(
    const Credentials& credentials, const CredentialOptions& options) {
    using R = Result<std::unique_ptr<CredentialManager>, Error>;

    auto missing = [](const std::string& field) {
        return Error{"LoadCredentials", "", std::nullopt,
                     field + " is required", std::nullopt,
                     ErrorCategory::Credential};
    };
    if (credentials.issuer_id.empty()) return R::Err(missing("issuer id"));
    if (credentials.key_id.empty()) return R::Err(missing("key id"));
    if (credentials.private_key_path.empty()) {
        return R::Err(missing("private key path"));
    }

    auto signer = Es256Signer::FromPemFile(credentials.private_key_path);
    if (signer.IsErr()) {
        return R::Err(std::move(signer).Error());
    }
    return R::Ok(std::make_unique<CredentialManager>(
        credentials.issuer_id, credentials.key_id, std::move(signer).Value(),
        options));
}

CredentialManager::CredentialManager(std::string issuer_id,
                                     std::string key_id,
                                     std::unique_ptr<ITokenSigner> signer,
                                     const CredentialOptions& options,
                                     Clock clock)
    : issuer_id_(std::move(issuer_id)),
      key_id_(std::move(key_id)),
      signer_(std::move(signer)),
      lifetime_(options.lifetime),
      refresh_margin_(options.refresh_margin),
      clock_(clock ? std::move(clock)
                   : Clock([] { return std::chrono::system_clock::now(); })) {
    const auto max_lifetime =
        std::chrono::duration_cast<std::chrono::seconds>(kMaxTokenLifetime);
    if (lifetime_ > max_lifetime) {
        LogWarn("auth", "token lifetime " + std::to_string(lifetime_.count()) +
                            "s exceeds the upstream maximum, using " +
                            std::to_string(max_lifetime.count()) + "s");
        lifetime_ = max_lifetime;
    }
    if (lifetime_.count() <= 0) {
        lifetime_ = std::chrono::seconds{15 * 60};
    }
    if (refresh_margin_.count() < 0 || refresh_margin_ >= lifetime_) {
        LogWarn("auth", "refresh margin must be shorter than the token "
                        "lifetime, using half the lifetime");
        refresh_margin_ = lifetime_ / 2;
    }
}

bool CredentialManager::IsFresh(TimePoint now) const {
    return cached_.has_value() && now + refresh_margin_ < cached_->expires_at;
}

Result<Token, Error> CredentialManager::Generate(TimePoint now) {
    using R = Result<Token, Error>;

    // Whole seconds, so the cached expiry matches the "exp" claim exactly.
    const TimePoint issued_at{std::chrono::seconds{ToEpochSeconds(now)}};
    const TimePoint expires_at = issued_at + lifetime_;

    JwtClaims claims;
    claims.issuer = issuer_id_;
    claims.audience = kAudience;
    claims.issued_at = ToEpochSeconds(issued_at);
    claims.expires_at = ToEpochSeconds(expires_at);

    auto jwt = EncodeJwt(key_id_, claims, *signer_);
    if (jwt.IsErr()) {
        return R::Err(std::move(jwt).Error());
    }
    return R::Ok(Token{std::move(jwt).Value(), issued_at, expires_at});
}

Result<std::string, Error> CredentialManager::GetToken() {
    using R = Result<std::string, Error>;

    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_();
    if (IsFresh(now)) {
        return R::Ok(cached_->value);
    }

    auto token = Generate(now);
    if (token.IsErr()) {
        LogError("auth", "token signing failed: " + token.Error().message);
        return R::Err(token.Error());
    }
    cached_ = std::move(token).Value();
    LogDebug("auth", "signed new bearer token, expires at " +
                         std::to_string(ToEpochSeconds(cached_->expires_at)));
    return R::Ok(cached_->value);
}

std::optional<TimePoint> CredentialManager::ExpiresAt() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!cached_.has_value()) return std::nullopt;
    return cached_->expires_at;
}

} // namespace asc_mcp
