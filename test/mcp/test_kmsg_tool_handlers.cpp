#include <catch2/catch_test_macros.hpp>

#include <kmsg_mcp/mcp/kmsg_tool_handlers.hpp>
#include <kmsg_mcp/mcp/mcp_server.hpp>

#include "mocks/mock_process_runner.hpp"

#include <sstream>
#include <string>

using namespace kmsg_mcp;
using namespace kmsg_mcp::testing;

namespace {

const std::string kBin = "/opt/kmsg/bin/kmsg";

nlohmann::json Request(int id, const std::string& method,
                       nlohmann::json params = nlohmann::json::object()) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
}

} // anonymous namespace

// ===========================================================================
// RegisterKmsgTools: catalog
// ===========================================================================

TEST_CASE("RegisterKmsgTools: three tools in fixed order", "[mcp][kmsg]") {
    MockProcessRunner mock;
    KmsgTools tools(mock, kBin);
    ToolRegistry registry;
    RegisterKmsgTools(registry, tools);

    REQUIRE(registry.Tools().size() == 3);
    CHECK(registry.Tools()[0].name == "kmsg_read");
    CHECK(registry.Tools()[1].name == "kmsg_send");
    CHECK(registry.Tools()[2].name == "kmsg_send_image");
}

TEST_CASE("RegisterKmsgTools: read schema", "[mcp][kmsg]") {
    MockProcessRunner mock;
    KmsgTools tools(mock, kBin);
    ToolRegistry registry;
    RegisterKmsgTools(registry, tools);

    const auto& schema = registry.Tools()[0].input_schema;
    CHECK(schema["type"] == "object");
    CHECK(schema["required"] == nlohmann::json::array({"chat"}));
    CHECK(schema["additionalProperties"] == false);
    CHECK(schema["properties"]["limit"]["minimum"] == 1);
    CHECK(schema["properties"]["limit"]["maximum"] == 100);
    CHECK(schema["properties"]["limit"]["default"] == 20);
    CHECK(schema["properties"].contains("keep_window"));
    CHECK_FALSE(schema["properties"].contains("confirm"));
}

TEST_CASE("RegisterKmsgTools: send schemas require payload and advertise defaults", "[mcp][kmsg]") {
    MockProcessRunner mock;
    KmsgTools tools(mock, kBin, KmsgDefaults{true, true});
    ToolRegistry registry;
    RegisterKmsgTools(registry, tools);

    const auto& send = registry.Tools()[1].input_schema;
    CHECK(send["required"] == nlohmann::json::array({"chat", "message"}));
    CHECK(send["properties"]["confirm"]["default"] == false);
    CHECK(send["properties"]["deep_recovery"]["default"] == true);
    CHECK(send["properties"]["trace_ax"]["default"] == true);

    const auto& image = registry.Tools()[2].input_schema;
    CHECK(image["required"] == nlohmann::json::array({"chat", "image_path"}));
    CHECK(image["additionalProperties"] == false);
}

// ===========================================================================
// RegisterKmsgTools: handlers
// ===========================================================================

TEST_CASE("kmsg_read handler: success result", "[mcp][kmsg]") {
    MockProcessRunner mock;
    mock.Enqueue(Exited(0, R"({"chat":"Alice","count":2,"messages":[{"text":"a"},{"text":"b"}]})"));
    KmsgTools tools(mock, kBin);
    ToolRegistry registry;
    RegisterKmsgTools(registry, tools);

    auto result = registry.Execute("kmsg_read", {{"chat", "Alice"}, {"limit", 5}});

    CHECK_FALSE(result.is_error);
    CHECK(result.structured_content["ok"] == true);
    CHECK(result.structured_content["count"] == 2);
    CHECK(result.structured_content["messages"].size() == 2);
    CHECK(nlohmann::json::parse(result.content[0]["text"].get<std::string>()) ==
          result.structured_content);
}

TEST_CASE("kmsg_send handler: failure sets isError", "[mcp][kmsg]") {
    MockProcessRunner mock;
    mock.Enqueue(Exited(1, "", "손쉬운 사용 권한이 필요합니다"));
    KmsgTools tools(mock, kBin);
    ToolRegistry registry;
    RegisterKmsgTools(registry, tools);

    auto result = registry.Execute("kmsg_send", {{"chat", "Alice"}, {"message", "hi"}});

    CHECK(result.is_error);
    CHECK(result.structured_content["error"]["code"] == "PERMISSION_DENIED");
}

// ===========================================================================
// DescribeReadiness
// ===========================================================================

TEST_CASE("DescribeReadiness: ready probe", "[mcp][kmsg]") {
    MockProcessRunner mock;
    mock.Enqueue(Exited(0, "kmsg 1.4.2\n"));
    mock.Enqueue(Exited(0, "ok"));
    KmsgTools tools(mock, kBin);

    auto detail = DescribeReadiness(tools);

    CHECK(detail["ready"] == true);
    CHECK(detail["version"] == "kmsg 1.4.2");
    CHECK_FALSE(detail.contains("note"));
}

TEST_CASE("DescribeReadiness: failed probe carries a note", "[mcp][kmsg]") {
    MockProcessRunner mock;
    mock.Enqueue(Exited(kExitNotStarted, "", "[Errno 2] No such file or directory: '/opt/kmsg/bin/kmsg'"));
    KmsgTools tools(mock, kBin);

    auto detail = DescribeReadiness(tools);

    CHECK(detail["ready"] == false);
    CHECK(detail["stage"] == "version");
    CHECK(detail["kmsg_bin"] == kBin);
    CHECK(detail["note"] == "MCP server started, but kmsg readiness check failed");
}

// ===========================================================================
// SessionDefaultsFor
// ===========================================================================

TEST_CASE("SessionDefaultsFor: mirrors the tool defaults", "[mcp][kmsg]") {
    MockProcessRunner mock;
    KmsgTools tools(mock, kBin, KmsgDefaults{true, false});

    auto defaults = SessionDefaultsFor(tools);

    CHECK(defaults.deep_recovery);
    CHECK_FALSE(defaults.trace_ax);
}

TEST_CASE("kmsg-mcp: initialize reports the same defaults the schemas advertise", "[mcp][kmsg]") {
    MockProcessRunner mock;
    KmsgTools tools(mock, kBin, KmsgDefaults{false, true});
    ToolRegistry registry;
    RegisterKmsgTools(registry, tools);

    McpServerOptions options;
    options.defaults = SessionDefaultsFor(tools);

    std::istringstream in;
    std::ostringstream out;
    McpServer server(std::move(registry), options, in, out);

    auto init = server.HandleMessage(Request(1, "initialize"));
    auto list = server.HandleMessage(Request(2, "tools/list"));
    REQUIRE(init.has_value());
    REQUIRE(list.has_value());

    const auto& meta_defaults = (*init)["result"]["meta"]["defaults"];
    const auto& send_props = (*list)["result"]["tools"][1]["inputSchema"]["properties"];
    CHECK(meta_defaults["deep_recovery"] == false);
    CHECK(meta_defaults["trace_ax"] == true);
    CHECK(send_props["deep_recovery"]["default"] == meta_defaults["deep_recovery"]);
    CHECK(send_props["trace_ax"]["default"] == meta_defaults["trace_ax"]);
}

// ===========================================================================
// End to end through McpServer
// ===========================================================================

TEST_CASE("kmsg-mcp: initialize then tools/list returns the catalog", "[mcp][kmsg]") {
    MockProcessRunner mock;
    mock.Enqueue(Exited(1, "", "not executable"));
    KmsgTools tools(mock, kBin);
    ToolRegistry registry;
    RegisterKmsgTools(registry, tools);

    McpServerOptions options;
    options.server_version = "0.1.0";
    options.instructions = kKmsgInstructions;
    options.startup_check = [&tools]() { return DescribeReadiness(tools); };

    std::istringstream in;
    std::ostringstream out;
    McpServer server(std::move(registry), options, in, out);

    auto init = server.HandleMessage(Request(1, "initialize"));
    REQUIRE(init.has_value());
    CHECK((*init)["result"]["meta"]["startup_check"]["ready"] == false);
    CHECK((*init)["result"]["instructions"].get<std::string>().find("confirm=true") !=
          std::string::npos);

    auto first = server.HandleMessage(Request(2, "tools/list"));
    auto second = server.HandleMessage(Request(3, "tools/list"));
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());

    const auto& listed = (*first)["result"]["tools"];
    REQUIRE(listed.size() == 3);
    CHECK(listed[0]["name"] == "kmsg_read");
    CHECK(listed[1]["name"] == "kmsg_send");
    CHECK(listed[2]["name"] == "kmsg_send_image");
    CHECK(listed == (*second)["result"]["tools"]);
}

TEST_CASE("kmsg-mcp: confirm gate through tools/call", "[mcp][kmsg]") {
    MockProcessRunner mock;
    KmsgTools tools(mock, kBin);
    ToolRegistry registry;
    RegisterKmsgTools(registry, tools);

    std::istringstream in;
    std::ostringstream out;
    McpServer server(std::move(registry), {}, in, out);
    REQUIRE(server.HandleMessage(Request(1, "initialize")).has_value());

    auto response = server.HandleMessage(Request(2, "tools/call",
        {{"name", "kmsg_send"},
         {"arguments", {{"chat", "Alice"}, {"message", "hi"}, {"confirm", true}}}}));
    REQUIRE(response.has_value());

    const auto& result = (*response)["result"];
    CHECK(result["isError"] == true);
    CHECK(result["structuredContent"]["error"]["code"] == "CONFIRMATION_REQUIRED");
    CHECK(mock.RunCount() == 0);
}
