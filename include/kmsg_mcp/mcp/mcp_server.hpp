#pragma once

#include <kmsg_mcp/mcp/framing.hpp>
#include <kmsg_mcp/mcp/tool_registry.hpp>

#include <functional>
#include <iostream>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace kmsg_mcp {

// JSON-RPC error codes used by the dispatcher.
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kServerNotInitialized = -32002;
constexpr int kInternalError = -32000;

// Session-wide fallbacks for the optional tool flags.
struct SessionDefaults {
    bool deep_recovery = false;
    bool trace_ax = false;
};

// Lifecycle state of one stdio session. Owned by McpServer.
struct Session {
    bool initialized = false;
    bool shutdown_requested = false;
    SessionDefaults defaults;
};

struct McpServerOptions {
    std::string server_name = "openclaw-kmsg-mcp";
    std::string server_version;
    std::string instructions;
    SessionDefaults defaults;
    MalformedFramePolicy malformed_frame_policy = MalformedFramePolicy::Skip;
    // Runs on initialize; its result is reported as meta.startup_check.
    std::function<nlohmann::json()> startup_check;
};

// ---------------------------------------------------------------------------
// McpServer — MCP 2024-11-05 server over Content-Length framed stdio.
//
// Before initialize only initialize, ping and notifications/initialized are
// served; after it:
//   - tools/list
//   - tools/call
//   - ping
//   - shutdown
//   - exit (notification, no response)
// Messages without an id (or with a null id) never get a response.
// ---------------------------------------------------------------------------
class McpServer {
public:
    explicit McpServer(ToolRegistry registry,
                       McpServerOptions options = {},
                       std::istream& in = std::cin,
                       std::ostream& out = std::cout);

    // Run the server loop. Returns when input closes, after shutdown/exit,
    // or on a malformed frame under MalformedFramePolicy::Stop.
    void Run();

    // Process a single JSON-RPC message and return the response (if any).
    // Never throws; handler exceptions become -32000 errors.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message);

    [[nodiscard]] const Session& GetSession() const noexcept { return session_; }

private:
    std::optional<nlohmann::json> Dispatch(const std::string& method,
                                           const nlohmann::json& params,
                                           const nlohmann::json& id);
    nlohmann::json HandleInitialize(const nlohmann::json& id);
    nlohmann::json HandleToolsList(const nlohmann::json& id);
    nlohmann::json HandleToolsCall(const nlohmann::json& params,
                                   const nlohmann::json& id);
    static nlohmann::json MakeError(const nlohmann::json& id, int code,
                                    const std::string& message,
                                    const nlohmann::json& data = nullptr);
    static nlohmann::json MakeResult(const nlohmann::json& id,
                                     const nlohmann::json& result);

    ToolRegistry registry_;
    McpServerOptions options_;
    FrameReader reader_;
    FrameWriter writer_;
    Session session_;
};

} // namespace kmsg_mcp
