#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace asc_mcp {

// ---------------------------------------------------------------------------
// ToolSchema - descriptor advertised by tools/list.
// ---------------------------------------------------------------------------
struct ToolSchema {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object
};

// ---------------------------------------------------------------------------
// ToolResult - result of executing a tool.
// ---------------------------------------------------------------------------
struct ToolResult {
    bool is_error = false;
    nlohmann::json content;  // array of content blocks

    static ToolResult Text(const std::string& text);
    static ToolResult Failure(const std::string& text);
};

// A tool handler takes the raw "arguments" object and returns a ToolResult.
using ToolHandler = std::function<ToolResult(const nlohmann::json& arguments)>;

// ---------------------------------------------------------------------------
// ToolRegistry - name-indexed table of MCP tools.
//
// Tools() keeps registration order. Registering an existing name replaces
// the descriptor and handler in place.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    void Register(const std::string& name,
                  const std::string& description,
                  const nlohmann::json& input_schema,
                  ToolHandler handler);

    [[nodiscard]] const std::vector<ToolSchema>& Tools() const noexcept {
        return schemas_;
    }

    [[nodiscard]] bool HasTool(const std::string& name) const;

    // Unknown names and exceptions escaping a handler become error results.
    [[nodiscard]] ToolResult Execute(const std::string& name,
                                     const nlohmann::json& arguments) const;

private:
    std::vector<ToolSchema> schemas_;
    std::map<std::string, ToolHandler> handlers_;
};

} // namespace asc_mcp
