#include <asc_mcp/tools/asc_tools.hpp>

#include "tool_utils.hpp"

#include <algorithm>
#include <sstream>

namespace asc_mcp {

using namespace tool_utils;

namespace {

const std::vector<std::string> kDevicePlatforms = {"IOS", "MAC_OS"};

// list_bundle_ids
ToolResult HandleListBundleIds(Transport& transport, const nlohmann::json& args) {
    auto result = transport.List("/v1/bundleIds", {}, LimitArg(args, 50));
    if (result.IsErr()) return UpstreamFailure("list bundle IDs", result.Error());

    const auto& bundle_ids = result.Value().data;
    if (bundle_ids.empty()) {
        return ToolResult::Text("No bundle IDs found.");
    }

    std::ostringstream out;
    out << "Found " << bundle_ids.size() << " bundle IDs:\n\n";
    for (const auto& bundle : bundle_ids) {
        out << "**" << Attr(bundle, "name") << "**\n";
        out << "  - ID: " << ResourceId(bundle) << "\n";
        out << "  - Identifier: " << Attr(bundle, "identifier") << "\n";
        out << "  - Platform: " << Attr(bundle, "platform") << "\n";
        const auto seed = Attr(bundle, "seedId");
        if (!seed.empty()) {
            out << "  - Seed ID: " << seed << "\n";
        }
        out << "\n";
    }
    return ToolResult::Text(out.str());
}

// get_bundle_id
ToolResult HandleGetBundleId(Transport& transport, const nlohmann::json& args) {
    ToolResult err;
    auto id = RequireString(args, "bundle_id_id", err);
    if (!id) return err;

    auto result = transport.Get("/v1/bundleIds/" + Segment(*id));
    if (result.IsErr()) return UpstreamFailure("get bundle ID", result.Error());

    const auto& bundle = DataOf(result.Value());
    std::ostringstream out;
    out << "**" << Attr(bundle, "name") << "**\n\n";
    out << "- ID: " << ResourceId(bundle) << "\n";
    out << "- Identifier: " << Attr(bundle, "identifier") << "\n";
    out << "- Platform: " << Attr(bundle, "platform") << "\n";
    const auto seed = Attr(bundle, "seedId");
    if (!seed.empty()) {
        out << "- Seed ID: " << seed << "\n";
    }
    return ToolResult::Text(out.str());
}

// list_certificates
ToolResult HandleListCertificates(Transport& transport, const nlohmann::json& args) {
    auto result = transport.List("/v1/certificates", {}, LimitArg(args, 50));
    if (result.IsErr()) return UpstreamFailure("list certificates", result.Error());

    const auto& certificates = result.Value().data;
    if (certificates.empty()) {
        return ToolResult::Text("No certificates found.");
    }

    std::ostringstream out;
    out << "Found " << certificates.size() << " certificates:\n\n";
    for (const auto& cert : certificates) {
        auto display_name = Attr(cert, "displayName");
        if (display_name.empty()) display_name = Attr(cert, "name");
        out << "**" << display_name << "**\n";
        out << "  - ID: " << ResourceId(cert) << "\n";
        out << "  - Type: " << Attr(cert, "certificateType") << "\n";
        out << "  - Serial Number: " << Attr(cert, "serialNumber") << "\n";
        const auto platform = Attr(cert, "platform");
        if (!platform.empty()) {
            out << "  - Platform: " << platform << "\n";
        }
        const auto expires = Attr(cert, "expirationDate");
        if (!expires.empty()) {
            out << "  - Expires: " << FormatDate(expires) << "\n";
        }
        out << "\n";
    }
    return ToolResult::Text(out.str());
}

void AppendProfile(std::ostringstream& out, const nlohmann::json& profile,
                   const std::string& indent) {
    out << indent << "- ID: " << ResourceId(profile) << "\n";
    out << indent << "- UUID: " << Attr(profile, "uuid") << "\n";
    out << indent << "- Type: " << Attr(profile, "profileType") << "\n";
    out << indent << "- State: " << Attr(profile, "profileState") << "\n";
    out << indent << "- Platform: " << Attr(profile, "platform") << "\n";
    const auto created = Attr(profile, "createdDate");
    if (!created.empty()) {
        out << indent << "- Created: " << FormatDate(created) << "\n";
    }
    const auto expires = Attr(profile, "expirationDate");
    if (!expires.empty()) {
        out << indent << "- Expires: " << FormatDate(expires) << "\n";
    }
}

// list_profiles
ToolResult HandleListProfiles(Transport& transport, const nlohmann::json& args) {
    auto result = transport.List("/v1/profiles", {}, LimitArg(args, 50));
    if (result.IsErr()) return UpstreamFailure("list profiles", result.Error());

    const auto& profiles = result.Value().data;
    if (profiles.empty()) {
        return ToolResult::Text("No provisioning profiles found.");
    }

    std::ostringstream out;
    out << "Found " << profiles.size() << " provisioning profiles:\n\n";
    for (const auto& profile : profiles) {
        out << "**" << Attr(profile, "name") << "**\n";
        AppendProfile(out, profile, "  ");
        out << "\n";
    }
    return ToolResult::Text(out.str());
}

// get_profile
ToolResult HandleGetProfile(Transport& transport, const nlohmann::json& args) {
    ToolResult err;
    auto id = RequireString(args, "profile_id", err);
    if (!id) return err;

    auto result = transport.Get("/v1/profiles/" + Segment(*id));
    if (result.IsErr()) return UpstreamFailure("get profile", result.Error());

    const auto& profile = DataOf(result.Value());
    std::ostringstream out;
    out << "**" << Attr(profile, "name") << "**\n\n";
    AppendProfile(out, profile, "");
    return ToolResult::Text(out.str());
}

void AppendDevice(std::ostringstream& out, const nlohmann::json& device,
                  const std::string& indent) {
    out << indent << "- ID: " << ResourceId(device) << "\n";
    out << indent << "- UDID: " << Attr(device, "udid") << "\n";
    out << indent << "- Model: " << Attr(device, "model") << "\n";
    out << indent << "- Device Class: " << Attr(device, "deviceClass") << "\n";
    out << indent << "- Platform: " << Attr(device, "platform") << "\n";
    out << indent << "- Status: " << Attr(device, "status") << "\n";
}

// list_devices
ToolResult HandleListDevices(Transport& transport, const nlohmann::json& args) {
    auto result = transport.List("/v1/devices", {}, LimitArg(args, 50));
    if (result.IsErr()) return UpstreamFailure("list devices", result.Error());

    const auto& devices = result.Value().data;
    if (devices.empty()) {
        return ToolResult::Text("No devices found.");
    }

    std::ostringstream out;
    out << "Found " << devices.size() << " devices:\n\n";
    for (const auto& device : devices) {
        out << "**" << Attr(device, "name") << "**\n";
        AppendDevice(out, device, "  ");
        const auto added = Attr(device, "addedDate");
        if (!added.empty()) {
            out << "  - Added: " << FormatDate(added) << "\n";
        }
        out << "\n";
    }
    return ToolResult::Text(out.str());
}

// register_device
ToolResult HandleRegisterDevice(Transport& transport, const nlohmann::json& args) {
    ToolResult err;
    auto name = RequireString(args, "name", err);
    if (!name) return err;
    auto udid = RequireString(args, "udid", err);
    if (!udid) return err;
    auto platform = RequireString(args, "platform", err);
    if (!platform) return err;
    if (std::find(kDevicePlatforms.begin(), kDevicePlatforms.end(), *platform) ==
        kDevicePlatforms.end()) {
        return ToolResult::Failure("platform must be one of: IOS, MAC_OS");
    }

    const nlohmann::json body = {
        {"data", {
            {"type", "devices"},
            {"attributes", {
                {"name", *name},
                {"udid", *udid},
                {"platform", *platform},
            }},
        }},
    };

    auto result = transport.Post("/v1/devices", body);
    if (result.IsErr()) return UpstreamFailure("register device", result.Error());

    const auto& device = DataOf(result.Value());
    std::ostringstream out;
    out << "Successfully registered device **" << Attr(device, "name") << "**\n\n";
    out << "- ID: " << ResourceId(device) << "\n";
    out << "- UDID: " << Attr(device, "udid") << "\n";
    out << "- Model: " << Attr(device, "model") << "\n";
    out << "- Platform: " << Attr(device, "platform") << "\n";
    out << "- Status: " << Attr(device, "status") << "\n";
    return ToolResult::Text(out.str());
}

} // anonymous namespace

void RegisterProvisioningTools(ToolRegistry& registry, Transport& transport) {
    registry.Register(
        "list_bundle_ids",
        "List all registered bundle IDs in your App Store Connect account. "
        "Returns bundle identifier, name, platform, and seed ID.",
        MakeSchema(
            {{"limit", IntProp("Maximum number of bundle IDs to return (default: 50)", 50)}}),
        [&transport](const nlohmann::json& args) {
            return HandleListBundleIds(transport, args);
        });

    registry.Register(
        "get_bundle_id",
        "Get detailed information about a specific bundle ID.",
        MakeSchema(
            {{"bundle_id_id",
              StringProp("The App Store Connect ID of the bundle ID resource "
                         "(not the bundle identifier string)")}},
            {"bundle_id_id"}),
        [&transport](const nlohmann::json& args) {
            return HandleGetBundleId(transport, args);
        });

    registry.Register(
        "list_certificates",
        "List all signing certificates in your App Store Connect account. "
        "Returns certificate name, type, serial number, and expiration date.",
        MakeSchema(
            {{"limit", IntProp("Maximum number of certificates to return (default: 50)", 50)}}),
        [&transport](const nlohmann::json& args) {
            return HandleListCertificates(transport, args);
        });

    registry.Register(
        "list_profiles",
        "List all provisioning profiles in your App Store Connect account. "
        "Returns profile name, type, state, UUID, and expiration date.",
        MakeSchema(
            {{"limit", IntProp("Maximum number of profiles to return (default: 50)", 50)}}),
        [&transport](const nlohmann::json& args) {
            return HandleListProfiles(transport, args);
        });

    registry.Register(
        "get_profile",
        "Get detailed information about a specific provisioning profile.",
        MakeSchema(
            {{"profile_id", StringProp("The App Store Connect ID of the profile")}},
            {"profile_id"}),
        [&transport](const nlohmann::json& args) {
            return HandleGetProfile(transport, args);
        });

    registry.Register(
        "list_devices",
        "List all registered devices in your App Store Connect account. "
        "Returns device name, UDID, model, platform, and status.",
        MakeSchema(
            {{"limit", IntProp("Maximum number of devices to return (default: 50)", 50)}}),
        [&transport](const nlohmann::json& args) {
            return HandleListDevices(transport, args);
        });

    registry.Register(
        "register_device",
        "Register a new device for development or ad hoc distribution.",
        MakeSchema(
            {{"name", StringProp("A name for the device (e.g., 'John's iPhone 15')")},
             {"udid", StringProp("The device's UDID")},
             {"platform", EnumProp("The device platform", kDevicePlatforms)}},
            {"name", "udid", "platform"}),
        [&transport](const nlohmann::json& args) {
            return HandleRegisterDevice(transport, args);
        });
}

} // namespace asc_mcp
