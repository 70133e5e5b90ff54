#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <asc_mcp/config/config_loader.hpp>
#include "../../test/mocks/test_keys.hpp"

#include <map>
#include <string>
#include <vector>

using namespace asc_mcp;
using namespace asc_mcp::testing;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;

namespace {

// EnvLookup over a fixed map instead of the process environment.
EnvLookup MapEnv(std::map<std::string, std::string> values) {
    return [values = std::move(values)](const std::string& name)
               -> std::optional<std::string> {
        auto it = values.find(name);
        if (it == values.end()) return std::nullopt;
        return it->second;
    };
}

EnvLookup EmptyEnv() {
    return MapEnv({});
}

Result<AppConfig, Error> ParseCli(std::vector<const char*> args) {
    args.insert(args.begin(), "asc-mcp");
    return LoadFromCli(static_cast<int>(args.size()), args.data());
}

AppConfig ValidConfig(const std::string& key_path) {
    AppConfig config;
    config.credentials.issuer_id = "issuer-1";
    config.credentials.key_id = "KEY123";
    config.credentials.private_key_path = key_path;
    return config;
}

} // anonymous namespace

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: reads credentials section and options", "[config][yaml]") {
    TempFile yaml(
        "credentials:\n"
        "  issuer_id: issuer-yaml\n"
        "  key_id: KEYYAML\n"
        "  private_key_path: /keys/AuthKey.p8\n"
        "base_url: http://localhost:8080\n"
        "timeout: 12\n"
        "log_file: /tmp/asc.log\n"
        "log_level: debug\n"
        "json_logs: true\n",
        ".yaml");

    auto result = LoadFromYaml(yaml.Path());
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    CHECK(config.credentials.issuer_id == "issuer-yaml");
    CHECK(config.credentials.key_id == "KEYYAML");
    CHECK(config.credentials.private_key_path == "/keys/AuthKey.p8");
    CHECK(config.base_url == "http://localhost:8080");
    CHECK(config.timeout_seconds == 12);
    CHECK(config.log_file == std::optional<std::string>("/tmp/asc.log"));
    CHECK(config.log_level == std::optional<std::string>("debug"));
    CHECK(config.json_logs);
    CHECK(config.config_file == std::optional<std::string>(yaml.Path()));
}

TEST_CASE("LoadFromYaml: accepts top-level credential keys", "[config][yaml]") {
    TempFile yaml("issuer_id: top\nkey_id: K\n", ".yaml");

    auto result = LoadFromYaml(yaml.Path());
    REQUIRE(result.IsOk());
    CHECK(result.Value().credentials.issuer_id == "top");
    CHECK(result.Value().credentials.key_id == "K");
    CHECK(result.Value().credentials.private_key_path.empty());
    CHECK(result.Value().base_url == kDefaultBaseUrl);
    CHECK(result.Value().timeout_seconds == kDefaultTimeoutSeconds);
}

TEST_CASE("LoadFromYaml: missing file is a config error", "[config][yaml]") {
    auto result = LoadFromYaml("/nonexistent/asc-mcp/config.yaml");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
    CHECK_THAT(result.Error().message, StartsWith("Failed to parse YAML file: "));
}

TEST_CASE("LoadFromYaml: malformed YAML is a config error", "[config][yaml]") {
    TempFile yaml("credentials: [unterminated\n", ".yaml");
    auto result = LoadFromYaml(yaml.Path());
    REQUIRE(result.IsErr());
    CHECK_THAT(result.Error().message, StartsWith("Failed to parse YAML file: "));
}

TEST_CASE("LoadFromYaml: non-numeric timeout is a config error", "[config][yaml]") {
    TempFile yaml("timeout: soon\n", ".yaml");
    auto result = LoadFromYaml(yaml.Path());
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

TEST_CASE("LoadFromYaml: a scalar document is rejected", "[config][yaml]") {
    TempFile yaml("just a string\n", ".yaml");
    auto result = LoadFromYaml(yaml.Path());
    REQUIRE(result.IsErr());
    CHECK_THAT(result.Error().message, StartsWith("YAML config must be a mapping"));
}

// ===========================================================================
// LoadFromEnv
// ===========================================================================

TEST_CASE("LoadFromEnv: reads ASC variables", "[config][env]") {
    auto config = LoadFromEnv(MapEnv({{"ASC_ISSUER_ID", "iss"},
                                      {"ASC_KEY_ID", "kid"},
                                      {"ASC_PRIVATE_KEY_PATH", "/k.p8"},
                                      {"ASC_API_BASE_URL", "http://127.0.0.1:9"}}));
    CHECK(config.credentials.issuer_id == "iss");
    CHECK(config.credentials.key_id == "kid");
    CHECK(config.credentials.private_key_path == "/k.p8");
    CHECK(config.base_url == "http://127.0.0.1:9");
}

TEST_CASE("LoadFromEnv: unset or empty variables keep defaults", "[config][env]") {
    auto config = LoadFromEnv(MapEnv({{"ASC_API_BASE_URL", ""}}));
    CHECK(config.credentials.issuer_id.empty());
    CHECK(config.credentials.key_id.empty());
    CHECK(config.base_url == kDefaultBaseUrl);
}

// ===========================================================================
// LoadFromCli
// ===========================================================================

TEST_CASE("LoadFromCli: parses all flags", "[config][cli]") {
    auto result = ParseCli({"--issuer-id", "iss", "--key-id", "kid",
                            "--private-key", "/k.p8", "--base-url", "http://h:1",
                            "--timeout", "5", "--config", "/c.yaml",
                            "--log-file", "/l.log", "--log-level", "error",
                            "--json-logs"});
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    CHECK(config.credentials.issuer_id == "iss");
    CHECK(config.credentials.key_id == "kid");
    CHECK(config.credentials.private_key_path == "/k.p8");
    CHECK(config.base_url == "http://h:1");
    CHECK(config.timeout_seconds == 5);
    CHECK(config.config_file == std::optional<std::string>("/c.yaml"));
    CHECK(config.log_file == std::optional<std::string>("/l.log"));
    CHECK(config.log_level == std::optional<std::string>("error"));
    CHECK(config.json_logs);
    CHECK(config.verbosity == 0);
}

TEST_CASE("LoadFromCli: no flags yields defaults", "[config][cli]") {
    auto result = ParseCli({});
    REQUIRE(result.IsOk());
    CHECK(result.Value().base_url == kDefaultBaseUrl);
    CHECK(result.Value().timeout_seconds == kDefaultTimeoutSeconds);
    CHECK_FALSE(result.Value().config_file.has_value());
    CHECK_FALSE(result.Value().json_logs);
}

TEST_CASE("LoadFromCli: verbosity flags", "[config][cli]") {
    auto verbose = ParseCli({"-v"});
    REQUIRE(verbose.IsOk());
    CHECK(verbose.Value().verbosity == 1);

    auto debug = ParseCli({"-vv"});
    REQUIRE(debug.IsOk());
    CHECK(debug.Value().verbosity == 2);
}

TEST_CASE("LoadFromCli: unknown flag is a config error", "[config][cli]") {
    auto result = ParseCli({"--frobnicate"});
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
    CHECK_THAT(result.Error().message, StartsWith("CLI parse error: "));
}

TEST_CASE("LoadFromCli: non-numeric timeout is a config error", "[config][cli]") {
    auto result = ParseCli({"--timeout", "abc"});
    REQUIRE(result.IsErr());
    CHECK_THAT(result.Error().message, StartsWith("CLI parse error: "));
}

// ===========================================================================
// MergeConfigs / LoadConfig
// ===========================================================================

TEST_CASE("MergeConfigs: set override fields win", "[config][merge]") {
    AppConfig base;
    base.credentials.issuer_id = "base-iss";
    base.credentials.key_id = "base-kid";
    base.timeout_seconds = 10;
    base.log_level = "info";

    AppConfig overrides;
    overrides.credentials.key_id = "over-kid";
    overrides.base_url = "http://override:1";

    auto merged = MergeConfigs(base, overrides);
    CHECK(merged.credentials.issuer_id == "base-iss");
    CHECK(merged.credentials.key_id == "over-kid");
    CHECK(merged.base_url == "http://override:1");
    CHECK(merged.timeout_seconds == 10);
    CHECK(merged.log_level == std::optional<std::string>("info"));
}

TEST_CASE("LoadConfig: CLI beats environment beats YAML", "[config][merge]") {
    TempFile yaml(
        "credentials:\n"
        "  issuer_id: yaml-iss\n"
        "  key_id: yaml-kid\n"
        "  private_key_path: /yaml.p8\n"
        "timeout: 7\n",
        ".yaml");
    const std::string config_path = yaml.Path();

    std::vector<const char*> args = {"asc-mcp", "--config", config_path.c_str(),
                                     "--issuer-id", "cli-iss"};
    auto result = LoadConfig(static_cast<int>(args.size()), args.data(),
                             MapEnv({{"ASC_ISSUER_ID", "env-iss"},
                                     {"ASC_KEY_ID", "env-kid"}}));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    CHECK(config.credentials.issuer_id == "cli-iss");
    CHECK(config.credentials.key_id == "env-kid");
    CHECK(config.credentials.private_key_path == "/yaml.p8");
    CHECK(config.timeout_seconds == 7);
}

TEST_CASE("LoadConfig: environment alone is enough", "[config][merge]") {
    std::vector<const char*> args = {"asc-mcp"};
    auto result = LoadConfig(1, args.data(),
                             MapEnv({{"ASC_ISSUER_ID", "iss"},
                                     {"ASC_KEY_ID", "kid"},
                                     {"ASC_PRIVATE_KEY_PATH", "/k.p8"}}));
    REQUIRE(result.IsOk());
    CHECK(result.Value().credentials.issuer_id == "iss");
    CHECK(result.Value().credentials.private_key_path == "/k.p8");
    CHECK_FALSE(result.Value().config_file.has_value());
}

TEST_CASE("LoadConfig: unreadable --config fails", "[config][merge]") {
    std::vector<const char*> args = {"asc-mcp", "--config", "/nonexistent/asc.yaml"};
    auto result = LoadConfig(static_cast<int>(args.size()), args.data(), EmptyEnv());
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

// ===========================================================================
// ValidateConfig
// ===========================================================================

TEST_CASE("ValidateConfig: complete config passes", "[config][validate]") {
    TempFile key("not really a key");
    auto result = ValidateConfig(ValidConfig(key.Path()));
    CHECK(result.IsOk());
}

TEST_CASE("ValidateConfig: reports the first missing credential", "[config][validate]") {
    TempFile key("k");

    auto config = ValidConfig(key.Path());
    config.credentials.issuer_id.clear();
    auto no_issuer = ValidateConfig(config);
    REQUIRE(no_issuer.IsErr());
    CHECK(no_issuer.Error().message ==
          "Missing required field: issuer id (ASC_ISSUER_ID or --issuer-id)");
    CHECK(no_issuer.Error().ExitCode() == 6);

    config = ValidConfig(key.Path());
    config.credentials.key_id.clear();
    auto no_key_id = ValidateConfig(config);
    REQUIRE(no_key_id.IsErr());
    CHECK(no_key_id.Error().message ==
          "Missing required field: key id (ASC_KEY_ID or --key-id)");

    config = ValidConfig("");
    auto no_path = ValidateConfig(config);
    REQUIRE(no_path.IsErr());
    CHECK_THAT(no_path.Error().message,
               ContainsSubstring("private key path (ASC_PRIVATE_KEY_PATH or --private-key)"));
}

TEST_CASE("ValidateConfig: key file must exist", "[config][validate]") {
    auto result = ValidateConfig(ValidConfig("/nonexistent/AuthKey.p8"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "private key file not found: /nonexistent/AuthKey.p8");
}

TEST_CASE("ValidateConfig: timeout, base URL and log level", "[config][validate]") {
    TempFile key("k");

    auto config = ValidConfig(key.Path());
    config.timeout_seconds = 0;
    auto timeout = ValidateConfig(config);
    REQUIRE(timeout.IsErr());
    CHECK(timeout.Error().message == "Timeout must be positive, got 0");

    config = ValidConfig(key.Path());
    config.base_url = "ftp://example.com";
    auto url = ValidateConfig(config);
    REQUIRE(url.IsErr());
    CHECK(url.Error().message ==
          "Base URL must be an absolute http(s) URL, got 'ftp://example.com'");

    config = ValidConfig(key.Path());
    config.log_level = "chatty";
    auto level = ValidateConfig(config);
    REQUIRE(level.IsErr());
    CHECK(level.Error().message == "Unknown log level: chatty");
}

TEST_CASE("ValidateConfig: base URL may end in a slash but carry no path", "[config][validate]") {
    TempFile key("k");

    auto config = ValidConfig(key.Path());
    config.base_url = "https://api.appstoreconnect.apple.com/";
    CHECK(ValidateConfig(config).IsOk());

    config.base_url = "http://localhost:8080/api";
    auto with_path = ValidateConfig(config);
    REQUIRE(with_path.IsErr());
    CHECK(with_path.Error().message ==
          "Base URL must not contain a path or query, got 'http://localhost:8080/api'");

    config.base_url = "http://localhost:8080?x=1";
    CHECK(ValidateConfig(config).IsErr());
}

// ===========================================================================
// EffectiveLogLevel
// ===========================================================================

TEST_CASE("EffectiveLogLevel: verbosity outranks log_level", "[config]") {
    AppConfig config;
    CHECK(EffectiveLogLevel(config) == LogLevel::Warn);

    config.log_level = "error";
    CHECK(EffectiveLogLevel(config) == LogLevel::Error);

    config.verbosity = 1;
    CHECK(EffectiveLogLevel(config) == LogLevel::Info);

    config.verbosity = 2;
    CHECK(EffectiveLogLevel(config) == LogLevel::Debug);
}
