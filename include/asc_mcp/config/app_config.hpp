#pragma once

#include <optional>
#include <string>

namespace asc_mcp {

inline constexpr const char* kDefaultBaseUrl = "https://api.appstoreconnect.apple.com";
inline constexpr int kDefaultTimeoutSeconds = 30;

struct CredentialConfig {
    std::string issuer_id;
    std::string key_id;
    std::string private_key_path;  // .p8 file
};

struct AppConfig {
    CredentialConfig credentials;
    std::string base_url = kDefaultBaseUrl;
    int timeout_seconds = kDefaultTimeoutSeconds;
    std::optional<std::string> log_file;
    std::optional<std::string> log_level;    // debug | info | warn | error
    std::optional<std::string> config_file;  // YAML file given with --config
    int verbosity = 0;                       // -v = 1, -vv = 2
    bool json_logs = false;
};

} // namespace asc_mcp
