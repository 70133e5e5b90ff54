#include <asc_mcp/tools/asc_tools.hpp>

#include "tool_utils.hpp"

#include <sstream>

namespace asc_mcp {

using namespace tool_utils;

namespace {

// ---------------------------------------------------------------------------
// Beta groups
// ---------------------------------------------------------------------------

ToolResult HandleListBetaGroups(Transport& transport, const nlohmann::json& args) {
    const int limit = LimitArg(args, 50);
    QueryParams query;
    const auto app_id = OptString(args, "app_id");
    if (!app_id.empty()) {
        query.emplace_back("filter[app]", app_id);
    }

    auto result = transport.List("/v1/betaGroups", query, limit);
    if (result.IsErr()) return UpstreamFailure("list beta groups", result.Error());

    const auto& groups = result.Value().data;
    if (groups.empty()) {
        return ToolResult::Text("No beta groups found.");
    }

    std::ostringstream out;
    out << "Found " << groups.size() << " beta groups:\n\n";
    for (const auto& group : groups) {
        out << "**" << Attr(group, "name") << "**\n";
        out << "  - ID: " << ResourceId(group) << "\n";
        out << "  - Internal Group: " << Attr(group, "isInternalGroup") << "\n";
        out << "  - Has Access to All Builds: "
            << Attr(group, "hasAccessToAllBuilds") << "\n";
        out << "  - Feedback Enabled: " << Attr(group, "feedbackEnabled") << "\n";
        out << "  - Public Link Enabled: " << Attr(group, "publicLinkEnabled") << "\n";
        const auto link = Attr(group, "publicLink");
        if (!link.empty()) {
            out << "  - Public Link: " << link << "\n";
        }
        const auto created = Attr(group, "createdDate");
        if (!created.empty()) {
            out << "  - Created: " << FormatDate(created) << "\n";
        }
        out << "\n";
    }
    return ToolResult::Text(out.str());
}

ToolResult HandleCreateBetaGroup(Transport& transport, const nlohmann::json& args) {
    ToolResult err;
    auto app_id = RequireString(args, "app_id", err);
    if (!app_id) return err;
    auto name = RequireString(args, "name", err);
    if (!name) return err;

    const nlohmann::json body = {
        {"data", {
            {"type", "betaGroups"},
            {"attributes", {
                {"name", *name},
                {"publicLinkEnabled", OptBool(args, "public_link_enabled", false)},
                {"feedbackEnabled", OptBool(args, "feedback_enabled", true)},
            }},
            {"relationships", {
                {"app", {{"data", {{"type", "apps"}, {"id", *app_id}}}}},
            }},
        }},
    };

    auto result = transport.Post("/v1/betaGroups", body);
    if (result.IsErr()) return UpstreamFailure("create beta group", result.Error());

    const auto& group = DataOf(result.Value());
    std::ostringstream out;
    out << "Successfully created beta group **" << Attr(group, "name") << "**\n\n";
    out << "- ID: " << ResourceId(group) << "\n";
    out << "- Public Link Enabled: " << Attr(group, "publicLinkEnabled") << "\n";
    out << "- Feedback Enabled: " << Attr(group, "feedbackEnabled") << "\n";
    return ToolResult::Text(out.str());
}

ToolResult HandleDeleteBetaGroup(Transport& transport, const nlohmann::json& args) {
    ToolResult err;
    auto group_id = RequireString(args, "beta_group_id", err);
    if (!group_id) return err;

    auto result = transport.Delete("/v1/betaGroups/" + Segment(*group_id));
    if (result.IsErr()) return UpstreamFailure("delete beta group", result.Error());
    return ToolResult::Text("Successfully deleted beta group " + *group_id);
}

// ---------------------------------------------------------------------------
// Beta testers
// ---------------------------------------------------------------------------

ToolResult HandleListBetaTesters(Transport& transport, const nlohmann::json& args) {
    const int limit = LimitArg(args, 50);
    QueryParams query;
    const auto group_id = OptString(args, "beta_group_id");
    if (!group_id.empty()) {
        query.emplace_back("filter[betaGroups]", group_id);
    }

    auto result = transport.List("/v1/betaTesters", query, limit);
    if (result.IsErr()) return UpstreamFailure("list beta testers", result.Error());

    const auto& testers = result.Value().data;
    if (testers.empty()) {
        return ToolResult::Text("No beta testers found.");
    }

    std::ostringstream out;
    out << "Found " << testers.size() << " beta testers:\n\n";
    for (const auto& tester : testers) {
        const auto first = Attr(tester, "firstName");
        const auto last = Attr(tester, "lastName");
        const auto email = Attr(tester, "email");
        std::string display = email;
        if (!first.empty() || !last.empty()) {
            display = first + " " + last + " (" + email + ")";
        }
        out << "**" << display << "**\n";
        out << "  - ID: " << ResourceId(tester) << "\n";
        out << "  - State: " << Attr(tester, "state") << "\n";
        out << "  - Invite Type: " << Attr(tester, "inviteType") << "\n\n";
    }
    return ToolResult::Text(out.str());
}

ToolResult HandleInviteBetaTester(Transport& transport, const nlohmann::json& args) {
    ToolResult err;
    auto email = RequireString(args, "email", err);
    if (!email) return err;

    nlohmann::json attributes = {{"email", *email}};
    const auto first = OptString(args, "first_name");
    const auto last = OptString(args, "last_name");
    if (!first.empty()) attributes["firstName"] = first;
    if (!last.empty()) attributes["lastName"] = last;

    nlohmann::json data = {{"type", "betaTesters"}, {"attributes", attributes}};
    const auto group_ids = OptStringArray(args, "beta_group_ids");
    if (!group_ids.empty()) {
        nlohmann::json groups = nlohmann::json::array();
        for (const auto& id : group_ids) {
            groups.push_back({{"type", "betaGroups"}, {"id", id}});
        }
        data["relationships"] = {{"betaGroups", {{"data", groups}}}};
    }

    auto result = transport.Post("/v1/betaTesters", nlohmann::json{{"data", data}});
    if (result.IsErr()) return UpstreamFailure("invite beta tester", result.Error());

    const auto& tester = DataOf(result.Value());
    std::ostringstream out;
    out << "Successfully invited beta tester **" << Attr(tester, "email") << "**\n\n";
    out << "- ID: " << ResourceId(tester) << "\n";
    out << "- State: " << Attr(tester, "state") << "\n";
    return ToolResult::Text(out.str());
}

ToolResult HandleRemoveBetaTester(Transport& transport, const nlohmann::json& args) {
    ToolResult err;
    auto tester_id = RequireString(args, "beta_tester_id", err);
    if (!tester_id) return err;

    auto result = transport.Delete("/v1/betaTesters/" + Segment(*tester_id));
    if (result.IsErr()) return UpstreamFailure("remove beta tester", result.Error());
    return ToolResult::Text("Successfully removed beta tester " + *tester_id);
}

ToolResult HandleAddTesterToGroup(Transport& transport, const nlohmann::json& args) {
    ToolResult err;
    auto group_id = RequireString(args, "beta_group_id", err);
    if (!group_id) return err;
    auto tester_id = RequireString(args, "beta_tester_id", err);
    if (!tester_id) return err;

    nlohmann::json body;
    body["data"] = nlohmann::json::array({{{"type", "betaTesters"}, {"id", *tester_id}}});

    auto result = transport.Post(
        "/v1/betaGroups/" + Segment(*group_id) + "/relationships/betaTesters", body);
    if (result.IsErr()) return UpstreamFailure("add tester to group", result.Error());
    return ToolResult::Text("Successfully added beta tester " + *tester_id +
                            " to group " + *group_id);
}

} // anonymous namespace

void RegisterTestFlightTools(ToolRegistry& registry, Transport& transport) {
    registry.Register(
        "list_beta_groups",
        "List TestFlight beta groups. Can filter by app ID. Returns group name, "
        "tester counts, and public link information.",
        MakeSchema(
            {{"app_id", StringProp("Optional: Filter beta groups by app ID")},
             {"limit", IntProp("Maximum number of beta groups to return (default: 50)", 50)}}),
        [&transport](const nlohmann::json& args) {
            return HandleListBetaGroups(transport, args);
        });

    registry.Register(
        "create_beta_group",
        "Create a new TestFlight beta group for an app.",
        MakeSchema(
            {{"app_id", StringProp("The App Store Connect ID of the app")},
             {"name", StringProp("Name for the beta group")},
             {"public_link_enabled",
              BoolProp("Whether to enable public link for the group (default: false)", false)},
             {"feedback_enabled",
              BoolProp("Whether to enable feedback for the group (default: true)", true)}},
            {"app_id", "name"}),
        [&transport](const nlohmann::json& args) {
            return HandleCreateBetaGroup(transport, args);
        });

    registry.Register(
        "delete_beta_group",
        "Delete a TestFlight beta group.",
        MakeSchema(
            {{"beta_group_id",
              StringProp("The App Store Connect ID of the beta group to delete")}},
            {"beta_group_id"}),
        [&transport](const nlohmann::json& args) {
            return HandleDeleteBetaGroup(transport, args);
        });

    registry.Register(
        "list_beta_testers",
        "List TestFlight beta testers. Can filter by beta group ID. Returns "
        "tester email, name, invite status, and state.",
        MakeSchema(
            {{"beta_group_id", StringProp("Optional: Filter testers by beta group ID")},
             {"limit", IntProp("Maximum number of testers to return (default: 50)", 50)}}),
        [&transport](const nlohmann::json& args) {
            return HandleListBetaTesters(transport, args);
        });

    registry.Register(
        "invite_beta_tester",
        "Invite a new beta tester to TestFlight, optionally adding them to "
        "specific beta groups.",
        MakeSchema(
            {{"email", StringProp("Email address of the tester to invite")},
             {"first_name", StringProp("First name of the tester (optional)")},
             {"last_name", StringProp("Last name of the tester (optional)")},
             {"beta_group_ids",
              StringArrayProp("Optional: IDs of beta groups to add the tester to")}},
            {"email"}),
        [&transport](const nlohmann::json& args) {
            return HandleInviteBetaTester(transport, args);
        });

    registry.Register(
        "remove_beta_tester",
        "Remove a beta tester from TestFlight.",
        MakeSchema(
            {{"beta_tester_id",
              StringProp("The App Store Connect ID of the beta tester to remove")}},
            {"beta_tester_id"}),
        [&transport](const nlohmann::json& args) {
            return HandleRemoveBetaTester(transport, args);
        });

    registry.Register(
        "add_tester_to_group",
        "Add an existing beta tester to a beta group.",
        MakeSchema(
            {{"beta_group_id", StringProp("The App Store Connect ID of the beta group")},
             {"beta_tester_id", StringProp("The App Store Connect ID of the beta tester")}},
            {"beta_group_id", "beta_tester_id"}),
        [&transport](const nlohmann::json& args) {
            return HandleAddTesterToGroup(transport, args);
        });
}

} // namespace asc_mcp
