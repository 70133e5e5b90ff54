#pragma once

#include <asc_mcp/api/transport.hpp>
#include <asc_mcp/core/result.hpp>
#include <asc_mcp/core/url.hpp>
#include <asc_mcp/mcp/tool_registry.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace asc_mcp::tool_utils {

// ---------------------------------------------------------------------------
// Argument helpers
// ---------------------------------------------------------------------------

// Get a required, non-empty string argument. Returns nullopt and sets
// out_error on failure.
inline std::optional<std::string> RequireString(const nlohmann::json& args,
                                                const std::string& key,
                                                ToolResult& out_error) {
    auto it = args.find(key);
    if (it == args.end() || !it->is_string() || it->get<std::string>().empty()) {
        out_error = ToolResult::Failure(key + " is required");
        return std::nullopt;
    }
    return it->get<std::string>();
}

inline std::string OptString(const nlohmann::json& args, const std::string& key,
                             const std::string& default_val = "") {
    auto it = args.find(key);
    if (it != args.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return default_val;
}

inline bool OptBool(const nlohmann::json& args, const std::string& key,
                    bool default_val) {
    auto it = args.find(key);
    if (it != args.end() && it->is_boolean()) {
        return it->get<bool>();
    }
    return default_val;
}

inline std::vector<std::string> OptStringArray(const nlohmann::json& args,
                                               const std::string& key) {
    std::vector<std::string> out;
    auto it = args.find(key);
    if (it == args.end() || !it->is_array()) return out;
    for (const auto& v : *it) {
        if (v.is_string() && !v.get<std::string>().empty()) {
            out.push_back(v.get<std::string>());
        }
    }
    return out;
}

// "limit" argument: non-positive or missing -> default_val, capped at the
// upstream page size.
inline int LimitArg(const nlohmann::json& args, int default_val) {
    int64_t limit = default_val;
    auto it = args.find("limit");
    if (it != args.end()) {
        if (it->is_number_unsigned()) {
            const auto value = it->get<uint64_t>();
            limit = value > static_cast<uint64_t>(kMaxPageSize)
                        ? kMaxPageSize
                        : static_cast<int64_t>(value);
        } else if (it->is_number_integer()) {
            limit = it->get<int64_t>();
        }
    }
    if (limit <= 0) limit = default_val;
    return static_cast<int>(std::min<int64_t>(limit, kMaxPageSize));
}

// ---------------------------------------------------------------------------
// JSON Schema helpers
// ---------------------------------------------------------------------------

inline nlohmann::json StringProp(const std::string& desc) {
    return {{"type", "string"}, {"description", desc}};
}

inline nlohmann::json IntProp(const std::string& desc, int default_val) {
    return {{"type", "integer"}, {"description", desc}, {"default", default_val}};
}

inline nlohmann::json BoolProp(const std::string& desc, bool default_val) {
    return {{"type", "boolean"}, {"description", desc}, {"default", default_val}};
}

inline nlohmann::json StringArrayProp(const std::string& desc) {
    return {{"type", "array"}, {"description", desc},
            {"items", {{"type", "string"}}}};
}

inline nlohmann::json EnumProp(const std::string& desc,
                               const std::vector<std::string>& values) {
    return {{"type", "string"}, {"description", desc}, {"enum", values}};
}

inline nlohmann::json MakeSchema(const nlohmann::json& properties,
                                 const std::vector<std::string>& required = {}) {
    nlohmann::json schema = {{"type", "object"}, {"properties", properties}};
    if (!required.empty()) {
        schema["required"] = required;
    }
    return schema;
}

// ---------------------------------------------------------------------------
// Resource formatting
// ---------------------------------------------------------------------------

// attributes[key] as display text; empty when absent or null.
inline std::string Attr(const nlohmann::json& resource, const std::string& key) {
    auto attrs = resource.find("attributes");
    if (attrs == resource.end() || !attrs->is_object()) return {};
    auto it = attrs->find(key);
    if (it == attrs->end() || it->is_null()) return {};
    if (it->is_string()) return it->get<std::string>();
    if (it->is_boolean()) return it->get<bool>() ? "true" : "false";
    return it->dump();
}

inline std::string ResourceId(const nlohmann::json& resource) {
    auto it = resource.find("id");
    if (it != resource.end() && it->is_string()) return it->get<std::string>();
    return {};
}

// "2024-03-01T10:15:30.000+0000" -> "2024-03-01" or "2024-03-01 10:15".
inline std::string FormatDate(const std::string& iso, bool with_time = false) {
    if (iso.size() < 10) return iso;
    if (!with_time || iso.size() < 16) return iso.substr(0, 10);
    return iso.substr(0, 10) + " " + iso.substr(11, 5);
}

// The "data" member of a single-resource document.
inline const nlohmann::json& DataOf(const nlohmann::json& doc) {
    static const nlohmann::json kEmpty = nlohmann::json::object();
    if (!doc.is_object()) return kEmpty;
    auto it = doc.find("data");
    if (it == doc.end() || !it->is_object()) return kEmpty;
    return *it;
}

// Escape an id for use as one path segment.
inline std::string Segment(const std::string& id) {
    return UrlEncode(id);
}

inline ToolResult UpstreamFailure(const std::string& action, const Error& error) {
    return ToolResult::Failure("Failed to " + action + ": " + error.UserMessage());
}

} // namespace asc_mcp::tool_utils
