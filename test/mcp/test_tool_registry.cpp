#include <catch2/catch_test_macros.hpp>

#include <kmsg_mcp/mcp/tool_registry.hpp>

#include <stdexcept>

using namespace kmsg_mcp;

namespace {

ToolResult Echo(const nlohmann::json& params) {
    return ToolResultFromEnvelope({{"ok", true}, {"echo", params}});
}

} // anonymous namespace

TEST_CASE("ToolRegistry: keeps registration order", "[mcp][registry]") {
    ToolRegistry registry;
    registry.Register("b_tool", "B", {{"type", "object"}}, Echo);
    registry.Register("a_tool", "A", {{"type", "object"}}, Echo);

    REQUIRE(registry.Tools().size() == 2);
    CHECK(registry.Tools()[0].name == "b_tool");
    CHECK(registry.Tools()[1].name == "a_tool");
    CHECK(registry.HasTool("a_tool"));
    CHECK_FALSE(registry.HasTool("c_tool"));
}

TEST_CASE("ToolRegistry: duplicate registration throws", "[mcp][registry]") {
    ToolRegistry registry;
    registry.Register("echo", "Echo", {{"type", "object"}}, Echo);
    CHECK_THROWS_AS(
        registry.Register("echo", "Echo again", {{"type", "object"}}, Echo),
        std::invalid_argument);
}

TEST_CASE("ToolRegistry: Execute routes to handler", "[mcp][registry]") {
    ToolRegistry registry;
    registry.Register("echo", "Echo", {{"type", "object"}}, Echo);

    auto result = registry.Execute("echo", {{"x", 1}});
    CHECK_FALSE(result.is_error);
    CHECK(result.structured_content["echo"]["x"] == 1);
}

TEST_CASE("ToolRegistry: unknown tool is an error result", "[mcp][registry]") {
    ToolRegistry registry;
    auto result = registry.Execute("nope", nlohmann::json::object());
    CHECK(result.is_error);
    CHECK(result.content[0]["text"] == "Unknown tool: nope");
    CHECK(result.structured_content.is_null());
}

TEST_CASE("ToolRegistry: handler exceptions propagate", "[mcp][registry]") {
    ToolRegistry registry;
    registry.Register("boom", "Throws", {{"type", "object"}},
        [](const nlohmann::json&) -> ToolResult {
            throw std::runtime_error("kaboom");
        });
    CHECK_THROWS_AS(registry.Execute("boom", nlohmann::json::object()),
                    std::runtime_error);
}

TEST_CASE("ToolResultFromEnvelope: text is sorted pretty JSON", "[mcp][registry]") {
    nlohmann::json envelope = {
        {"ok", false},
        {"error", {{"code", "TARGET_NOT_FOUND"}}},
        {"meta", {{"latency_ms", 3}}}
    };
    auto result = ToolResultFromEnvelope(envelope);

    CHECK(result.is_error);
    CHECK(result.structured_content == envelope);
    REQUIRE(result.content.size() == 1);
    CHECK(result.content[0]["type"] == "text");

    const auto text = result.content[0]["text"].get<std::string>();
    CHECK(nlohmann::json::parse(text) == envelope);
    // Keys sorted: error < meta < ok.
    CHECK(text.find("\"error\"") < text.find("\"meta\""));
    CHECK(text.find("\"meta\"") < text.find("\"ok\""));
    CHECK(text.find("\n  \"error\"") != std::string::npos);
}
