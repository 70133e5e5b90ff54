#pragma once

#include <asc_mcp/api/transport.hpp>
#include <asc_mcp/mcp/tool_registry.hpp>

namespace asc_mcp {

// Register the full App Store Connect tool catalog. Each handler captures
// &transport by reference; the transport must outlive the registry.
void RegisterAscTools(ToolRegistry& registry, Transport& transport);

// Apps: list_apps, get_app, get_app_versions.
void RegisterAppTools(ToolRegistry& registry, Transport& transport);

// Builds: list_builds, get_build.
void RegisterBuildTools(ToolRegistry& registry, Transport& transport);

// TestFlight: beta groups and beta testers.
void RegisterTestFlightTools(ToolRegistry& registry, Transport& transport);

// Provisioning: bundle ids, certificates, profiles, devices.
void RegisterProvisioningTools(ToolRegistry& registry, Transport& transport);

} // namespace asc_mcp
