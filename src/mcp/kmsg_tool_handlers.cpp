#include <kmsg_mcp/mcp/kmsg_tool_handlers.hpp>

#include <string>

namespace kmsg_mcp {

const char* const kKmsgInstructions =
    "Use kmsg_read for read-only operations. "
    "Use kmsg_send and kmsg_send_image with confirm=false (or omitted) for "
    "sending. Use confirm=true to intentionally require a confirmation step.";

namespace {

// ---------------------------------------------------------------------------
// Schema helpers
// ---------------------------------------------------------------------------

nlohmann::json ChatProperty() {
    return {{"type", "string"}, {"description", "Chat room or user name"}};
}

nlohmann::json ConfirmProperty() {
    return {
        {"type", "boolean"},
        {"default", false},
        {"description", "If true, do not send and return CONFIRMATION_REQUIRED"}
    };
}

// deep_recovery, keep_window and trace_ax, shared by every tool.
void AddRunFlagProperties(nlohmann::json& properties,
                          const KmsgDefaults& defaults) {
    properties["deep_recovery"] = {
        {"type", "boolean"},
        {"default", defaults.deep_recovery},
        {"description", "Enable deep recovery mode for window resolution"}
    };
    properties["keep_window"] = {
        {"type", "boolean"},
        {"default", false},
        {"description", "Keep auto-opened KakaoTalk window"}
    };
    properties["trace_ax"] = {
        {"type", "boolean"},
        {"default", defaults.trace_ax},
        {"description", "Include AX tracing logs"}
    };
}

nlohmann::json ObjectSchema(nlohmann::json properties,
                            nlohmann::json required) {
    return {
        {"type", "object"},
        {"properties", std::move(properties)},
        {"required", std::move(required)},
        {"additionalProperties", false}
    };
}

nlohmann::json ReadSchema(const KmsgDefaults& defaults) {
    nlohmann::json properties = {
        {"chat", ChatProperty()},
        {"limit", {
            {"type", "integer"},
            {"minimum", kMinReadLimit},
            {"maximum", kMaxReadLimit},
            {"default", kDefaultReadLimit}
        }}
    };
    AddRunFlagProperties(properties, defaults);
    return ObjectSchema(std::move(properties), {"chat"});
}

nlohmann::json SendSchema(const KmsgDefaults& defaults,
                          const std::string& payload_key,
                          const std::string& payload_description) {
    nlohmann::json properties = {
        {"chat", ChatProperty()},
        {payload_key, {{"type", "string"}, {"description", payload_description}}},
        {"confirm", ConfirmProperty()}
    };
    AddRunFlagProperties(properties, defaults);
    return ObjectSchema(std::move(properties), {"chat", payload_key});
}

} // anonymous namespace

void RegisterKmsgTools(ToolRegistry& registry, KmsgTools& tools) {
    const auto& defaults = tools.Defaults();

    registry.Register(
        "kmsg_read",
        "Read recent KakaoTalk messages from a chat via kmsg.",
        ReadSchema(defaults),
        [&tools](const nlohmann::json& args) -> ToolResult {
            return ToolResultFromEnvelope(tools.Read(args));
        });

    registry.Register(
        "kmsg_send",
        "Send a KakaoTalk message via kmsg. Default sends immediately; "
        "confirm=true triggers confirmation-required response.",
        SendSchema(defaults, "message", "Message body"),
        [&tools](const nlohmann::json& args) -> ToolResult {
            return ToolResultFromEnvelope(tools.Send(args));
        });

    registry.Register(
        "kmsg_send_image",
        "Send an image to a KakaoTalk chat via kmsg. Default sends "
        "immediately; confirm=true triggers confirmation-required response.",
        SendSchema(defaults, "image_path", "Path to the image file"),
        [&tools](const nlohmann::json& args) -> ToolResult {
            return ToolResultFromEnvelope(tools.SendImage(args));
        });
}

nlohmann::json DescribeReadiness(KmsgTools& tools) {
    auto report = tools.CheckReady();
    nlohmann::json detail = report.detail.is_object()
                                ? report.detail
                                : nlohmann::json::object();
    detail["ready"] = report.ready;
    if (!report.ready) {
        detail["note"] = "MCP server started, but kmsg readiness check failed";
    }
    return detail;
}

SessionDefaults SessionDefaultsFor(const KmsgTools& tools) {
    const auto& defaults = tools.Defaults();
    return SessionDefaults{defaults.deep_recovery, defaults.trace_ax};
}

} // namespace kmsg_mcp
