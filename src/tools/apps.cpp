#include <asc_mcp/tools/asc_tools.hpp>

#include "tool_utils.hpp"

#include <sstream>

namespace asc_mcp {

using namespace tool_utils;

namespace {

// list_apps
ToolResult HandleListApps(Transport& transport, const nlohmann::json& args) {
    const int limit = LimitArg(args, 50);

    auto result = transport.List("/v1/apps", {}, limit);
    if (result.IsErr()) return UpstreamFailure("list apps", result.Error());

    const auto& apps = result.Value().data;
    if (apps.empty()) {
        return ToolResult::Text("No apps found in your App Store Connect account.");
    }

    std::ostringstream out;
    out << "Found " << apps.size() << " apps:\n\n";
    for (const auto& app : apps) {
        out << "**" << Attr(app, "name") << "**\n";
        out << "  - ID: " << ResourceId(app) << "\n";
        out << "  - Bundle ID: " << Attr(app, "bundleId") << "\n";
        out << "  - SKU: " << Attr(app, "sku") << "\n";
        out << "  - Primary Locale: " << Attr(app, "primaryLocale") << "\n\n";
    }
    return ToolResult::Text(out.str());
}

// get_app
ToolResult HandleGetApp(Transport& transport, const nlohmann::json& args) {
    ToolResult err;
    auto app_id = RequireString(args, "app_id", err);
    if (!app_id) return err;

    auto result = transport.Get("/v1/apps/" + Segment(*app_id));
    if (result.IsErr()) return UpstreamFailure("get app", result.Error());

    const auto& app = DataOf(result.Value());
    std::ostringstream out;
    out << "**" << Attr(app, "name") << "**\n\n";
    out << "- ID: " << ResourceId(app) << "\n";
    out << "- Bundle ID: " << Attr(app, "bundleId") << "\n";
    out << "- SKU: " << Attr(app, "sku") << "\n";
    out << "- Primary Locale: " << Attr(app, "primaryLocale") << "\n";
    out << "- Made for Kids: " << Attr(app, "isOrEverWasMadeForKids") << "\n";
    const auto rights = Attr(app, "contentRightsDeclaration");
    if (!rights.empty()) {
        out << "- Content Rights: " << rights << "\n";
    }
    return ToolResult::Text(out.str());
}

// get_app_versions
ToolResult HandleGetAppVersions(Transport& transport, const nlohmann::json& args) {
    ToolResult err;
    auto app_id = RequireString(args, "app_id", err);
    if (!app_id) return err;
    const int limit = LimitArg(args, 20);

    auto result = transport.List("/v1/apps/" + Segment(*app_id) + "/appStoreVersions",
                                 {}, limit);
    if (result.IsErr()) return UpstreamFailure("get app versions", result.Error());

    const auto& versions = result.Value().data;
    if (versions.empty()) {
        return ToolResult::Text("No versions found for this app.");
    }

    std::ostringstream out;
    out << "Found " << versions.size() << " versions:\n\n";
    for (const auto& version : versions) {
        out << "**Version " << Attr(version, "versionString") << "** ("
            << Attr(version, "platform") << ")\n";
        out << "  - ID: " << ResourceId(version) << "\n";
        out << "  - State: " << Attr(version, "appStoreState") << "\n";
        out << "  - Release Type: " << Attr(version, "releaseType") << "\n";
        out << "  - Downloadable: " << Attr(version, "downloadable") << "\n";
        const auto created = Attr(version, "createdDate");
        if (!created.empty()) {
            out << "  - Created: " << FormatDate(created, true) << "\n";
        }
        out << "\n";
    }
    return ToolResult::Text(out.str());
}

} // anonymous namespace

void RegisterAppTools(ToolRegistry& registry, Transport& transport) {
    registry.Register(
        "list_apps",
        "List all apps in your App Store Connect account. Returns app name, "
        "bundle ID, SKU, and primary locale for each app.",
        MakeSchema(
            {{"limit", IntProp("Maximum number of apps to return (default: 50, max: 200)", 50)}}),
        [&transport](const nlohmann::json& args) {
            return HandleListApps(transport, args);
        });

    registry.Register(
        "get_app",
        "Get detailed information about a specific app by its App Store Connect ID.",
        MakeSchema(
            {{"app_id", StringProp("The App Store Connect ID of the app")}},
            {"app_id"}),
        [&transport](const nlohmann::json& args) {
            return HandleGetApp(transport, args);
        });

    registry.Register(
        "get_app_versions",
        "Get all App Store versions for a specific app, including version "
        "string, platform, state, and release information.",
        MakeSchema(
            {{"app_id", StringProp("The App Store Connect ID of the app")},
             {"limit", IntProp("Maximum number of versions to return (default: 20)", 20)}},
            {"app_id"}),
        [&transport](const nlohmann::json& args) {
            return HandleGetAppVersions(transport, args);
        });
}

void RegisterAscTools(ToolRegistry& registry, Transport& transport) {
    RegisterAppTools(registry, transport);
    RegisterBuildTools(registry, transport);
    RegisterTestFlightTools(registry, transport);
    RegisterProvisioningTools(registry, transport);
}

} // namespace asc_mcp
