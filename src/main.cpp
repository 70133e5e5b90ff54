#include <asc_mcp/api/http_client.hpp>
#include <asc_mcp/api/transport.hpp>
#include <asc_mcp/auth/credential_manager.hpp>
#include <asc_mcp/config/config_loader.hpp>
#include <asc_mcp/core/log.hpp>
#include <asc_mcp/core/version.hpp>
#include <asc_mcp/mcp/mcp_server.hpp>
#include <asc_mcp/mcp/tool_registry.hpp>
#include <asc_mcp/tools/asc_tools.hpp>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr int kExitSuccess = 0;

enum class Command {
    Serve,
    Validate,
    Tools,
    Version,
};

struct SubcommandParse {
    Command cmd;
    bool found_subcommand;
};

SubcommandParse ParseSubcommand(int argc, const char* const* argv) {
    if (argc < 2) {
        return {Command::Serve, false};
    }
    std::string_view arg1{argv[1]};
    if (arg1 == "serve") {
        return {Command::Serve, true};
    }
    if (arg1 == "validate") {
        return {Command::Validate, true};
    }
    if (arg1 == "tools") {
        return {Command::Tools, true};
    }
    if (arg1 == "version" || arg1 == "--version") {
        return {Command::Version, true};
    }
    // Not a subcommand - flags for the default "serve" command.
    return {Command::Serve, false};
}

// Build argv without the subcommand token, so LoadFromCli sees plain flags.
std::vector<const char*> StripSubcommand(int argc, const char* const* argv,
                                         bool has_subcommand) {
    std::vector<const char*> stripped;
    stripped.push_back(argv[0]);
    for (int i = 1; i < argc; ++i) {
        if (has_subcommand && i == 1) {
            continue;
        }
        stripped.push_back(argv[i]);
    }
    return stripped;
}

void PrintError(const asc_mcp::Error& error, bool json_output) {
    if (json_output) {
        std::cerr << error.ToJson() << "\n";
    } else {
        std::cerr << "Error: " << error.ToString() << "\n";
    }
}

// Token provider for listing the catalog without credentials. Any tool
// invoked through it fails before reaching the network.
class UnconfiguredTokens : public asc_mcp::ITokenProvider {
public:
    asc_mcp::Result<std::string, asc_mcp::Error> GetToken() override {
        return asc_mcp::Result<std::string, asc_mcp::Error>::Err(asc_mcp::Error{
            "GetToken", "", std::nullopt, "credentials are not configured",
            std::nullopt, asc_mcp::ErrorCategory::Credential});
    }
};

// Logs go to --log-file when given, stderr otherwise. stdout carries the
// protocol.
void InitLogging(const asc_mcp::AppConfig& config) {
    using namespace asc_mcp;
    const auto level = EffectiveLogLevel(config);

    if (config.log_file.has_value()) {
        auto sink = std::make_unique<FileSink>(*config.log_file);
        if (sink->IsOpen()) {
            InitGlobalLogger(std::move(sink), level);
            return;
        }
        std::cerr << "Warning: cannot open log file " << *config.log_file
                  << ", logging to stderr\n";
    }
    if (config.json_logs) {
        InitGlobalLogger(std::make_unique<JsonSink>(std::cerr), level);
    } else {
        InitGlobalLogger(std::make_unique<StderrSink>(), level);
    }
}

asc_mcp::HttpClientOptions ClientOptions(const asc_mcp::AppConfig& config) {
    asc_mcp::HttpClientOptions options;
    options.connect_timeout = std::chrono::seconds(config.timeout_seconds);
    options.read_timeout = std::chrono::seconds(config.timeout_seconds);
    options.write_timeout = std::chrono::seconds(config.timeout_seconds);
    return options;
}

asc_mcp::Credentials ToCredentials(const asc_mcp::AppConfig& config) {
    return asc_mcp::Credentials{config.credentials.issuer_id,
                                config.credentials.key_id,
                                config.credentials.private_key_path};
}

int RunServe(const asc_mcp::AppConfig& config) {
    using namespace asc_mcp;

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        PrintError(valid.Error(), config.json_logs);
        return valid.Error().ExitCode();
    }

    auto manager = CredentialManager::Create(ToCredentials(config));
    if (manager.IsErr()) {
        PrintError(manager.Error(), config.json_logs);
        return manager.Error().ExitCode();
    }
    auto credentials = std::move(manager).Value();

    HttplibClient client(config.base_url, ClientOptions(config));
    Transport transport(client, *credentials);

    ToolRegistry registry;
    RegisterAscTools(registry, transport);
    LogInfo("main", "serving " + std::to_string(registry.Tools().size()) +
                        " tools against " + config.base_url);

    // Blocks until EOF on stdin.
    McpServer server(std::move(registry));
    server.Run();
    return kExitSuccess;
}

int RunValidate(const asc_mcp::AppConfig& config) {
    using namespace asc_mcp;

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        std::cout << "[FAIL] configuration: " << valid.Error().message << "\n";
        return valid.Error().ExitCode();
    }
    std::cout << "[OK]   configuration (issuer " << config.credentials.issuer_id
              << ", key " << config.credentials.key_id << ")\n";

    auto manager = CredentialManager::Create(ToCredentials(config));
    if (manager.IsErr()) {
        std::cout << "[FAIL] private key: " << manager.Error().message << "\n";
        return manager.Error().ExitCode();
    }
    std::cout << "[OK]   private key " << config.credentials.private_key_path
              << "\n";

    auto token = manager.Value()->GetToken();
    if (token.IsErr()) {
        std::cout << "[FAIL] token signing: " << token.Error().message << "\n";
        return token.Error().ExitCode();
    }
    std::cout << "[OK]   token signing\n";
    return kExitSuccess;
}

int RunTools(const asc_mcp::AppConfig& config) {
    using namespace asc_mcp;

    UnconfiguredTokens tokens;
    HttplibClient client(config.base_url, ClientOptions(config));
    Transport transport(client, tokens);

    ToolRegistry registry;
    RegisterAscTools(registry, transport);
    for (const auto& tool : registry.Tools()) {
        std::cout << tool.name << "\n    " << tool.description << "\n";
    }
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace asc_mcp;

    const auto parsed = ParseSubcommand(argc, argv);
    if (parsed.cmd == Command::Version) {
        std::cout << "asc-mcp " << kVersion << "\n";
        return kExitSuccess;
    }

    auto args = StripSubcommand(argc, argv, parsed.found_subcommand);
    auto config_result = LoadConfig(static_cast<int>(args.size()), args.data());
    if (config_result.IsErr()) {
        PrintError(config_result.Error(), false);
        return config_result.Error().ExitCode();
    }
    const auto config = std::move(config_result).Value();

    InitLogging(config);
    LogDebug("main", std::string("asc-mcp ") + kVersion);

    switch (parsed.cmd) {
        case Command::Serve:
            return RunServe(config);
        case Command::Validate:
            return RunValidate(config);
        case Command::Tools:
            return RunTools(config);
        case Command::Version:
            break;
    }
    return kExitSuccess;
}
