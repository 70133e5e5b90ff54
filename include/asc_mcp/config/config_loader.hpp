#pragma once

#include <asc_mcp/config/app_config.hpp>
#include <asc_mcp/core/log.hpp>
#include <asc_mcp/core/result.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace asc_mcp {

// Environment variable names.
inline constexpr const char* kEnvIssuerId = "ASC_ISSUER_ID";
inline constexpr const char* kEnvKeyId = "ASC_KEY_ID";
inline constexpr const char* kEnvPrivateKeyPath = "ASC_PRIVATE_KEY_PATH";
inline constexpr const char* kEnvBaseUrl = "ASC_API_BASE_URL";

// Returns the value of an environment variable, nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// EnvLookup over the process environment.
std::optional<std::string> ProcessEnv(const std::string& name);

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Read ASC_* environment variables. Unset or empty variables leave the
// corresponding field at its default.
AppConfig LoadFromEnv(const EnvLookup& lookup = ProcessEnv);

// Parse CLI flags (argv without the command word) into an AppConfig.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: fields set in overrides replace those in base.
AppConfig MergeConfigs(const AppConfig& base, const AppConfig& overrides);

// YAML (--config) < environment < CLI.
Result<AppConfig, Error> LoadConfig(int argc, const char* const* argv,
                                    const EnvLookup& lookup = ProcessEnv);

// Credentials present, key file exists, timeout positive, base URL http(s).
Result<void, Error> ValidateConfig(const AppConfig& config);

// Effective log level: -vv > -v > log_level > warn.
LogLevel EffectiveLogLevel(const AppConfig& config);

} // namespace asc_mcp
