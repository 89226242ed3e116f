#include <kmsg_mcp/mcp/mcp_server.hpp>

#include <kmsg_mcp/core/log.hpp>

#include <exception>
#include <string>

namespace kmsg_mcp {

namespace {

constexpr const char* kProtocolVersion = "2024-11-05";

bool HasId(const nlohmann::json& message) {
    auto it = message.find("id");
    return it != message.end() && !it->is_null();
}

// Methods served before initialize.
bool AllowedBeforeInitialize(const std::string& method) {
    return method == "initialize" || method == "ping" ||
           method == "notifications/initialized";
}

} // anonymous namespace

McpServer::McpServer(ToolRegistry registry,
                     McpServerOptions options,
                     std::istream& in,
                     std::ostream& out)
    : registry_(std::move(registry)),
      options_(std::move(options)),
      reader_(in),
      writer_(out) {
    session_.defaults = options_.defaults;
}

void McpServer::Run() {
    LogInfo("server", "serving " + options_.server_name + " " +
                          options_.server_version + " on stdio");
    while (!session_.shutdown_requested) {
        auto frame = reader_.Read();
        if (frame.status == FrameStatus::EndOfStream) {
            LogInfo("server", "input closed");
            break;
        }
        if (frame.status == FrameStatus::Malformed) {
            LogWarn("framing", "malformed frame: " + frame.detail);
            if (options_.malformed_frame_policy == MalformedFramePolicy::Stop) {
                break;
            }
            continue;
        }

        auto response = HandleMessage(frame.message);
        if (response && !writer_.Write(*response)) {
            break;
        }
    }
}

std::optional<nlohmann::json> McpServer::HandleMessage(
    const nlohmann::json& message) {
    // Anything without a method is not a request; drop it.
    if (!message.is_object() || !message.contains("method")) {
        LogDebug("server", "discarding message without method");
        return std::nullopt;
    }

    const bool has_id = HasId(message);
    const nlohmann::json id = has_id ? message["id"] : nlohmann::json(nullptr);

    std::optional<nlohmann::json> response;
    try {
        const auto& method_value = message["method"];
        if (!method_value.is_string()) {
            response = MakeError(id, kMethodNotFound,
                                 "Method not found: " + method_value.dump());
        } else {
            auto params = message.value("params", nlohmann::json::object());
            response = Dispatch(method_value.get<std::string>(), params, id);
        }
    } catch (const std::exception& e) {
        LogError("server", std::string("internal error: ") + e.what());
        response = MakeError(id, kInternalError, "Internal server error",
                             {{"detail", e.what()}});
    }

    if (!has_id) {
        return std::nullopt;
    }
    return response;
}

std::optional<nlohmann::json> McpServer::Dispatch(
    const std::string& method,
    const nlohmann::json& params,
    const nlohmann::json& id) {
    LogDebug("server", "dispatching " + method);

    if (!session_.initialized && !AllowedBeforeInitialize(method)) {
        return MakeError(id, kServerNotInitialized, "Server not initialized");
    }

    if (method == "initialize") {
        return HandleInitialize(id);
    }
    if (method == "notifications/initialized") {
        return std::nullopt;
    }
    if (method == "ping") {
        return MakeResult(id, nlohmann::json::object());
    }
    if (method == "tools/list") {
        return HandleToolsList(id);
    }
    if (method == "tools/call") {
        return HandleToolsCall(params, id);
    }
    if (method == "shutdown") {
        session_.shutdown_requested = true;
        return MakeResult(id, nlohmann::json::object());
    }
    if (method == "exit") {
        session_.shutdown_requested = true;
        return std::nullopt;
    }
    return MakeError(id, kMethodNotFound, "Method not found: " + method);
}

nlohmann::json McpServer::HandleInitialize(const nlohmann::json& id) {
    session_.initialized = true;

    nlohmann::json startup_check = nlohmann::json::object();
    if (options_.startup_check) {
        startup_check = options_.startup_check();
    }

    nlohmann::json result;
    result["protocolVersion"] = kProtocolVersion;
    result["capabilities"] = {
        {"tools", nlohmann::json::object()}
    };
    result["serverInfo"] = {
        {"name", options_.server_name},
        {"version", options_.server_version}
    };
    if (!options_.instructions.empty()) {
        result["instructions"] = options_.instructions;
    }
    result["meta"] = {
        {"startup_check", startup_check},
        {"defaults", {
            {"deep_recovery", session_.defaults.deep_recovery},
            {"trace_ax", session_.defaults.trace_ax}
        }}
    };

    return MakeResult(id, result);
}

nlohmann::json McpServer::HandleToolsList(const nlohmann::json& id) {
    nlohmann::json tools = nlohmann::json::array();

    for (const auto& schema : registry_.Tools()) {
        tools.push_back({
            {"name", schema.name},
            {"description", schema.description},
            {"inputSchema", schema.input_schema}
        });
    }

    return MakeResult(id, {{"tools", tools}});
}

nlohmann::json McpServer::HandleToolsCall(
    const nlohmann::json& params, const nlohmann::json& id) {
    if (!params.is_object()) {
        return MakeError(id, kInvalidParams, "tools/call params must be an object");
    }
    auto name_it = params.find("name");
    if (name_it == params.end() || !name_it->is_string()) {
        return MakeError(id, kInvalidParams, "Missing 'name' parameter");
    }
    const auto tool_name = name_it->get<std::string>();

    auto arguments = params.value("arguments", nlohmann::json::object());
    if (!arguments.is_object()) {
        return MakeError(id, kInvalidParams, "tool arguments must be an object");
    }

    if (!registry_.HasTool(tool_name)) {
        return MakeError(id, kMethodNotFound, "Unknown tool: " + tool_name);
    }

    LogInfo("server", "tools/call " + tool_name);
    auto result = registry_.Execute(tool_name, arguments);

    nlohmann::json response_result;
    response_result["content"] = result.content;
    response_result["isError"] = result.is_error;
    if (!result.structured_content.is_null()) {
        response_result["structuredContent"] = result.structured_content;
    }

    return MakeResult(id, response_result);
}

nlohmann::json McpServer::MakeError(const nlohmann::json& id, int code,
                                    const std::string& message,
                                    const nlohmann::json& data) {
    nlohmann::json error = {
        {"code", code},
        {"message", message}
    };
    if (!data.is_null()) {
        error["data"] = data;
    }
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", error}
    };
}

nlohmann::json McpServer::MakeResult(
    const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

} // namespace kmsg_mcp
