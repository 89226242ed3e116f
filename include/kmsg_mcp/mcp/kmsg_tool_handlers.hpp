#pragma once

#include <kmsg_mcp/bridge/kmsg_tools.hpp>
#include <kmsg_mcp/mcp/mcp_server.hpp>
#include <kmsg_mcp/mcp/tool_registry.hpp>

#include <nlohmann/json.hpp>

namespace kmsg_mcp {

// Text sent as `instructions` in the initialize result.
extern const char* const kKmsgInstructions;

// Register kmsg_read, kmsg_send and kmsg_send_image, in that order.
// Each handler captures &tools by reference; tools must outlive the registry.
void RegisterKmsgTools(ToolRegistry& registry, KmsgTools& tools);

// Run the readiness probe and shape it for meta.startup_check:
// the probe detail plus `ready`, and a `note` when the probe failed.
[[nodiscard]] nlohmann::json DescribeReadiness(KmsgTools& tools);

// Session defaults reported by initialize, taken from the tools' own defaults.
[[nodiscard]] SessionDefaults SessionDefaultsFor(const KmsgTools& tools);

} // namespace kmsg_mcp
