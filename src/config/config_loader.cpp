#include <asc_mcp/config/config_loader.hpp>

#include <asc_mcp/core/url.hpp>
#include <asc_mcp/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <vector>

namespace asc_mcp {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Config};
}

// Read the credential fields from a YAML mapping (top level or the
// "credentials" section).
void ReadYamlCredentials(const YAML::Node& node, CredentialConfig& creds) {
    if (node["issuer_id"]) {
        creds.issuer_id = node["issuer_id"].as<std::string>();
    }
    if (node["key_id"]) {
        creds.key_id = node["key_id"].as<std::string>();
    }
    if (node["private_key_path"]) {
        creds.private_key_path = node["private_key_path"].as<std::string>();
    }
}

} // anonymous namespace

std::optional<std::string> ProcessEnv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) return std::nullopt;
    return std::string(value);
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    AppConfig config;
    config.config_file = std::string(file_path);

    try {
        const auto root = YAML::LoadFile(std::string(file_path));
        if (!root.IsMap()) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("YAML config must be a mapping: " +
                                std::string(file_path)));
        }

        ReadYamlCredentials(root, config.credentials);
        if (root["credentials"]) {
            ReadYamlCredentials(root["credentials"], config.credentials);
        }

        if (root["base_url"]) {
            config.base_url = root["base_url"].as<std::string>();
        }
        if (root["timeout"]) {
            config.timeout_seconds = root["timeout"].as<int>();
        }
        if (root["log_file"]) {
            config.log_file = root["log_file"].as<std::string>();
        }
        if (root["log_level"]) {
            config.log_level = root["log_level"].as<std::string>();
        }
        if (root["json_logs"]) {
            config.json_logs = root["json_logs"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromEnv
// ---------------------------------------------------------------------------
AppConfig LoadFromEnv(const EnvLookup& lookup) {
    AppConfig config;
    auto read = [&](const char* name) -> std::string {
        auto value = lookup(name);
        return value.value_or("");
    };

    config.credentials.issuer_id = read(kEnvIssuerId);
    config.credentials.key_id = read(kEnvKeyId);
    config.credentials.private_key_path = read(kEnvPrivateKeyPath);
    const auto base_url = read(kEnvBaseUrl);
    if (!base_url.empty()) {
        config.base_url = base_url;
    }
    return config;
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("asc-mcp", kVersion,
                                     argparse::default_arguments::help);

    // Credentials
    program.add_argument("--issuer-id")
        .help("App Store Connect API issuer ID");
    program.add_argument("--key-id")
        .help("App Store Connect API key ID");
    program.add_argument("--private-key")
        .help("Path to the .p8 private key file");

    // Upstream
    program.add_argument("--base-url")
        .help("API base URL");
    program.add_argument("--timeout")
        .help("HTTP timeout in seconds")
        .scan<'i', int>();

    // Options
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--log-file")
        .help("Write logs to this file instead of stderr");
    program.add_argument("--log-level")
        .help("debug, info, warn or error");
    program.add_argument("--json-logs")
        .help("Emit logs as JSON lines")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-v", "--verbose")
        .help("Info-level logging")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-vv")
        .help("Debug-level logging, including HTTP headers")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;

    if (auto val = program.present("--issuer-id")) {
        config.credentials.issuer_id = *val;
    }
    if (auto val = program.present("--key-id")) {
        config.credentials.key_id = *val;
    }
    if (auto val = program.present("--private-key")) {
        config.credentials.private_key_path = *val;
    }
    if (auto val = program.present("--base-url")) {
        config.base_url = *val;
    }
    if (auto val = program.present<int>("--timeout")) {
        config.timeout_seconds = *val;
    }
    if (auto val = program.present("--config")) {
        config.config_file = *val;
    }
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }
    if (auto val = program.present("--log-level")) {
        config.log_level = *val;
    }
    if (program.get<bool>("--json-logs")) {
        config.json_logs = true;
    }
    if (program.get<bool>("-vv")) {
        config.verbosity = 2;
    } else if (program.get<bool>("--verbose")) {
        config.verbosity = 1;
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& base, const AppConfig& overrides) {
    AppConfig merged = base;

    if (!overrides.credentials.issuer_id.empty()) {
        merged.credentials.issuer_id = overrides.credentials.issuer_id;
    }
    if (!overrides.credentials.key_id.empty()) {
        merged.credentials.key_id = overrides.credentials.key_id;
    }
    if (!overrides.credentials.private_key_path.empty()) {
        merged.credentials.private_key_path = overrides.credentials.private_key_path;
    }
    if (overrides.base_url != kDefaultBaseUrl) {
        merged.base_url = overrides.base_url;
    }
    if (overrides.timeout_seconds != kDefaultTimeoutSeconds) {
        merged.timeout_seconds = overrides.timeout_seconds;
    }
    if (overrides.log_file.has_value()) {
        merged.log_file = overrides.log_file;
    }
    if (overrides.log_level.has_value()) {
        merged.log_level = overrides.log_level;
    }
    if (overrides.config_file.has_value()) {
        merged.config_file = overrides.config_file;
    }
    if (overrides.verbosity > merged.verbosity) {
        merged.verbosity = overrides.verbosity;
    }
    if (overrides.json_logs) {
        merged.json_logs = true;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// LoadConfig
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadConfig(int argc, const char* const* argv,
                                    const EnvLookup& lookup) {
    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) {
        return cli;
    }
    const auto cli_config = std::move(cli).Value();

    AppConfig config;
    if (cli_config.config_file.has_value()) {
        auto yaml = LoadFromYaml(*cli_config.config_file);
        if (yaml.IsErr()) {
            return yaml;
        }
        config = std::move(yaml).Value();
    }

    config = MergeConfigs(config, LoadFromEnv(lookup));
    config = MergeConfigs(config, cli_config);
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    const auto& creds = config.credentials;
    if (creds.issuer_id.empty()) {
        return Result<void, Error>::Err(MakeConfigError(
            "Missing required field: issuer id (ASC_ISSUER_ID or --issuer-id)"));
    }
    if (creds.key_id.empty()) {
        return Result<void, Error>::Err(MakeConfigError(
            "Missing required field: key id (ASC_KEY_ID or --key-id)"));
    }
    if (creds.private_key_path.empty()) {
        return Result<void, Error>::Err(MakeConfigError(
            "Missing required field: private key path "
            "(ASC_PRIVATE_KEY_PATH or --private-key)"));
    }
    std::error_code ec;
    if (!std::filesystem::is_regular_file(creds.private_key_path, ec)) {
        return Result<void, Error>::Err(MakeConfigError(
            "private key file not found: " + creds.private_key_path));
    }
    if (config.timeout_seconds <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Timeout must be positive, got " +
                            std::to_string(config.timeout_seconds)));
    }
    const auto base = SplitUrl(config.base_url);
    if (!base.has_value()) {
        return Result<void, Error>::Err(
            MakeConfigError("Base URL must be an absolute http(s) URL, got '" +
                            config.base_url + "'"));
    }
    if (base->target != "/") {
        return Result<void, Error>::Err(
            MakeConfigError("Base URL must not contain a path or query, got '" +
                            config.base_url + "'"));
    }
    if (config.log_level.has_value() && !ParseLogLevel(*config.log_level)) {
        return Result<void, Error>::Err(
            MakeConfigError("Unknown log level: " + *config.log_level));
    }
    return Result<void, Error>::Ok();
}

LogLevel EffectiveLogLevel(const AppConfig& config) {
    if (config.verbosity >= 2) return LogLevel::Debug;
    if (config.verbosity == 1) return LogLevel::Info;
    if (config.log_level.has_value()) {
        if (auto level = ParseLogLevel(*config.log_level)) {
            return *level;
        }
    }
    return LogLevel::Warn;
}

} // namespace asc_mcp
