#include <catch2/catch_test_macros.hpp>

#include <asc_mcp/mcp/tool_registry.hpp>

#include <stdexcept>

using namespace asc_mcp;

TEST_CASE("ToolRegistry: register and execute", "[mcp][registry]") {
    ToolRegistry registry;
    registry.Register("greet", "Say hello", {{"type", "object"}},
        [](const nlohmann::json& args) {
            return ToolResult::Text("Hello, " + args.value("name", "world"));
        });

    CHECK(registry.HasTool("greet"));
    CHECK_FALSE(registry.HasTool("other"));

    auto result = registry.Execute("greet", {{"name", "Ada"}});
    CHECK_FALSE(result.is_error);
    REQUIRE(result.content.is_array());
    CHECK(result.content[0]["type"] == "text");
    CHECK(result.content[0]["text"] == "Hello, Ada");
}

TEST_CASE("ToolRegistry: tools keep registration order", "[mcp][registry]") {
    ToolRegistry registry;
    auto noop = [](const nlohmann::json&) { return ToolResult::Text(""); };
    registry.Register("b", "B", nlohmann::json::object(), noop);
    registry.Register("a", "A", nlohmann::json::object(), noop);
    registry.Register("c", "C", nlohmann::json::object(), noop);

    const auto& tools = registry.Tools();
    REQUIRE(tools.size() == 3);
    CHECK(tools[0].name == "b");
    CHECK(tools[1].name == "a");
    CHECK(tools[2].name == "c");
}

TEST_CASE("ToolRegistry: re-registering replaces in place", "[mcp][registry]") {
    ToolRegistry registry;
    registry.Register("x", "first", nlohmann::json::object(),
        [](const nlohmann::json&) { return ToolResult::Text("one"); });
    registry.Register("y", "other", nlohmann::json::object(),
        [](const nlohmann::json&) { return ToolResult::Text("y"); });
    registry.Register("x", "second", nlohmann::json::object(),
        [](const nlohmann::json&) { return ToolResult::Text("two"); });

    REQUIRE(registry.Tools().size() == 2);
    CHECK(registry.Tools()[0].name == "x");
    CHECK(registry.Tools()[0].description == "second");
    CHECK(registry.Execute("x", {}).content[0]["text"] == "two");
}

TEST_CASE("ToolRegistry: unknown tool is an error result", "[mcp][registry]") {
    ToolRegistry registry;
    auto result = registry.Execute("missing", {});
    CHECK(result.is_error);
    CHECK(result.content[0]["text"] == "Unknown tool: missing");
}

TEST_CASE("ToolRegistry: exceptions become error results", "[mcp][registry]") {
    ToolRegistry registry;
    registry.Register("bad", "throws", nlohmann::json::object(),
        [](const nlohmann::json& args) -> ToolResult {
            // nlohmann throws type_error on a string lookup of a number.
            return ToolResult::Text(args.at("n").get<std::string>());
        });
    auto result = registry.Execute("bad", {{"n", 5}});
    CHECK(result.is_error);
    CHECK(result.content[0]["text"].get<std::string>().rfind("Tool error: ", 0) == 0);
}

TEST_CASE("ToolResult: Failure sets is_error", "[mcp][registry]") {
    auto ok = ToolResult::Text("fine");
    auto bad = ToolResult::Failure("broken");
    CHECK_FALSE(ok.is_error);
    CHECK(bad.is_error);
    CHECK(bad.content[0]["text"] == "broken");
}
