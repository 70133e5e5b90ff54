#include <asc_mcp/auth/es256_signer.hpp>

#include <asc_mcp/core/log.hpp>

#include <jwt-cpp/traits/nlohmann-json/defaults.h>

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

#include <array>
#include <fstream>
#include <sstream>
#include <system_error>

namespace asc_mcp {

namespace {

struct PkeyDeleter {
    void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); }
};
struct BioDeleter {
    void operator()(BIO* b) const { BIO_free(b); }
};

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

// Drain the thread's OpenSSL error queue into one string.
std::string OpenSslErrors() {
    std::string out;
    unsigned long code = 0;
    while ((code = ERR_get_error()) != 0) {
        std::array<char, 256> buf{};
        ERR_error_string_n(code, buf.data(), buf.size());
        if (!out.empty()) out += "; ";
        out += buf.data();
    }
    return out.empty() ? "unknown OpenSSL error" : out;
}

Error MakeCredentialError(const std::string& operation,
                          const std::string& endpoint,
                          const std::string& message) {
    return Error{operation, endpoint, std::nullopt, message, std::nullopt,
                 ErrorCategory::Credential};
}

bool IsP256(EVP_PKEY* pkey) {
    std::array<char, 64> group{};
    size_t len = 0;
    if (EVP_PKEY_get_group_name(pkey, group.data(), group.size(), &len) != 1) {
        return false;
    }
    const std::string name(group.data(), len);
    return name == "prime256v1" || name == "P-256" || name == "secp256r1";
}

} // anonymous namespace

struct Es256Signer::Impl {
    jwt::algorithm::es256 algorithm;
};

Es256Signer::Es256Signer(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}

Es256Signer::~Es256Signer() = default;

// ---------------------------------------------------------------------------
// FromPem / FromPemFile
// ---------------------------------------------------------------------------
Result<std::unique_ptr<Es256Signer>, Error> Es256Signer::FromPem(
    std::string_view pem) {
    using R = Result<std::unique_ptr<Es256Signer>, Error>;

    ERR_clear_error();
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        return R::Err(MakeCredentialError("LoadPrivateKey", "",
                                          "BIO allocation failed: " + OpenSslErrors()));
    }

    PkeyPtr pkey(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
    if (!pkey) {
        return R::Err(MakeCredentialError(
            "LoadPrivateKey", "",
            "no PEM private key found: " + OpenSslErrors()));
    }

    if (EVP_PKEY_get_base_id(pkey.get()) != EVP_PKEY_EC) {
        return R::Err(MakeCredentialError("LoadPrivateKey", "",
                                          "private key is not an EC key"));
    }
    if (!IsP256(pkey.get())) {
        return R::Err(MakeCredentialError("LoadPrivateKey", "",
                                          "private key is not on curve P-256"));
    }

    std::unique_ptr<Impl> impl;
    try {
        impl.reset(new Impl{jwt::algorithm::es256("", std::string(pem))});
    } catch (const std::exception& e) {
        return R::Err(MakeCredentialError("LoadPrivateKey", "",
                                          std::string("ES256 key rejected: ") + e.what()));
    }
    return R::Ok(std::unique_ptr<Es256Signer>(new Es256Signer(std::move(impl))));
}

Result<std::unique_ptr<Es256Signer>, Error> Es256Signer::FromPemFile(
    const std::string& path) {
    using R = Result<std::unique_ptr<Es256Signer>, Error>;

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        return R::Err(MakeCredentialError("LoadPrivateKey", path,
                                          "failed to read private key file"));
    }
    std::ostringstream contents;
    contents << ifs.rdbuf();

    auto result = FromPem(contents.str());
    if (result.IsErr()) {
        auto error = std::move(result).Error();
        error.endpoint = path;
        return R::Err(std::move(error));
    }
    LogDebug("auth", "loaded ES256 private key from " + path);
    return result;
}

// ---------------------------------------------------------------------------
// Sign / Verify
// ---------------------------------------------------------------------------
Result<std::string, Error> Es256Signer::Sign(std::string_view signing_input) {
    using R = Result<std::string, Error>;

    std::error_code ec;
    auto signature = impl_->algorithm.sign(std::string(signing_input), ec);
    if (ec) {
        return R::Err(MakeCredentialError("SignToken", "",
                                          "signing failed: " + ec.message()));
    }
    return R::Ok(std::move(signature));
}

bool Es256Signer::Verify(std::string_view signing_input,
                         std::string_view signature) const {
    std::error_code ec;
    impl_->algorithm.verify(std::string(signing_input), std::string(signature), ec);
    return !ec;
}

} // namespace asc_mcp
