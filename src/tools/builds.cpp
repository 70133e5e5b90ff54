#include <asc_mcp/tools/asc_tools.hpp>

#include "tool_utils.hpp"

#include <sstream>

namespace asc_mcp {

using namespace tool_utils;

namespace {

// list_builds
ToolResult HandleListBuilds(Transport& transport, const nlohmann::json& args) {
    const int limit = LimitArg(args, 20);
    QueryParams query;
    const auto app_id = OptString(args, "app_id");
    if (!app_id.empty()) {
        query.emplace_back("filter[app]", app_id);
    }

    auto result = transport.List("/v1/builds", query, limit);
    if (result.IsErr()) return UpstreamFailure("list builds", result.Error());

    const auto& builds = result.Value().data;
    if (builds.empty()) {
        return ToolResult::Text("No builds found.");
    }

    std::ostringstream out;
    out << "Found " << builds.size() << " builds:\n\n";
    for (const auto& build : builds) {
        out << "**Build " << Attr(build, "version") << "**\n";
        out << "  - ID: " << ResourceId(build) << "\n";
        out << "  - Processing State: " << Attr(build, "processingState") << "\n";
        out << "  - Min OS Version: " << Attr(build, "minOsVersion") << "\n";
        out << "  - Expired: " << Attr(build, "expired") << "\n";
        const auto uploaded = Attr(build, "uploadedDate");
        if (!uploaded.empty()) {
            out << "  - Uploaded: " << FormatDate(uploaded, true) << "\n";
        }
        const auto expires = Attr(build, "expirationDate");
        if (!expires.empty()) {
            out << "  - Expires: " << FormatDate(expires) << "\n";
        }
        out << "\n";
    }
    return ToolResult::Text(out.str());
}

// get_build
ToolResult HandleGetBuild(Transport& transport, const nlohmann::json& args) {
    ToolResult err;
    auto build_id = RequireString(args, "build_id", err);
    if (!build_id) return err;

    auto result = transport.Get("/v1/builds/" + Segment(*build_id));
    if (result.IsErr()) return UpstreamFailure("get build", result.Error());

    const auto& build = DataOf(result.Value());
    std::ostringstream out;
    out << "**Build " << Attr(build, "version") << "**\n\n";
    out << "- ID: " << ResourceId(build) << "\n";
    out << "- Processing State: " << Attr(build, "processingState") << "\n";
    out << "- Min OS Version: " << Attr(build, "minOsVersion") << "\n";
    out << "- Build Audience Type: " << Attr(build, "buildAudienceType") << "\n";
    out << "- Uses Non-Exempt Encryption: "
        << Attr(build, "usesNonExemptEncryption") << "\n";
    out << "- Expired: " << Attr(build, "expired") << "\n";
    const auto uploaded = Attr(build, "uploadedDate");
    if (!uploaded.empty()) {
        out << "- Uploaded: " << FormatDate(uploaded, true) << "\n";
    }
    const auto expires = Attr(build, "expirationDate");
    if (!expires.empty()) {
        out << "- Expires: " << FormatDate(expires) << "\n";
    }
    return ToolResult::Text(out.str());
}

} // anonymous namespace

void RegisterBuildTools(ToolRegistry& registry, Transport& transport) {
    registry.Register(
        "list_builds",
        "List builds for your apps. Can filter by app ID. Returns version, "
        "processing state, upload date, and expiration information.",
        MakeSchema(
            {{"app_id", StringProp("Optional: Filter builds by app ID")},
             {"limit", IntProp("Maximum number of builds to return (default: 20, max: 200)", 20)}}),
        [&transport](const nlohmann::json& args) {
            return HandleListBuilds(transport, args);
        });

    registry.Register(
        "get_build",
        "Get detailed information about a specific build by its ID, including "
        "version, processing state, and TestFlight information.",
        MakeSchema(
            {{"build_id", StringProp("The App Store Connect ID of the build")}},
            {"build_id"}),
        [&transport](const nlohmann::json& args) {
            return HandleGetBuild(transport, args);
        });
}

} // namespace asc_mcp
