#include <asc_mcp/mcp/tool_registry.hpp>

#include <asc_mcp/core/log.hpp>

#include <algorithm>

namespace asc_mcp {

ToolResult ToolResult::Text(const std::string& text) {
    return ToolResult{
        false,
        nlohmann::json::array({{{"type", "text"}, {"text", text}}})
    };
}

ToolResult ToolResult::Failure(const std::string& text) {
    return ToolResult{
        true,
        nlohmann::json::array({{{"type", "text"}, {"text", text}}})
    };
}

void ToolRegistry::Register(const std::string& name,
                            const std::string& description,
                            const nlohmann::json& input_schema,
                            ToolHandler handler) {
    auto it = std::find_if(schemas_.begin(), schemas_.end(),
                           [&](const ToolSchema& s) { return s.name == name; });
    if (it != schemas_.end()) {
        LogWarn("mcp", "tool '" + name + "' registered twice, replacing");
        *it = ToolSchema{name, description, input_schema};
    } else {
        schemas_.push_back({name, description, input_schema});
    }
    handlers_[name] = std::move(handler);
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return handlers_.count(name) > 0;
}

ToolResult ToolRegistry::Execute(const std::string& name,
                                 const nlohmann::json& arguments) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        return ToolResult::Failure("Unknown tool: " + name);
    }

    try {
        return it->second(arguments);
    } catch (const std::exception& e) {
        LogError("mcp", "tool '" + name + "' threw: " + e.what());
        return ToolResult::Failure(std::string("Tool error: ") + e.what());
    }
}

} // namespace asc_mcp
