#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace kmsg_mcp {

// ---------------------------------------------------------------------------
// ToolSchema — catalog entry exposed verbatim by tools/list.
// ---------------------------------------------------------------------------
struct ToolSchema {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object
};

// ---------------------------------------------------------------------------
// ToolResult — result of executing a tool.
// ---------------------------------------------------------------------------
struct ToolResult {
    bool is_error = false;
    nlohmann::json content;             // array of content blocks
    nlohmann::json structured_content;  // null when the tool has none
};

/// Wrap a tool envelope: one text block holding the pretty-printed envelope,
/// is_error = !envelope.ok, and the envelope itself as structured content.
[[nodiscard]] ToolResult ToolResultFromEnvelope(const nlohmann::json& envelope);

// A tool handler takes a JSON arguments object and returns a ToolResult.
// Exceptions are not caught here; the server reports them as internal errors.
using ToolHandler = std::function<ToolResult(const nlohmann::json& arguments)>;

// ---------------------------------------------------------------------------
// ToolRegistry — registry of MCP tools. Registration order is listing order.
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

    [[nodiscard]] ToolResult Execute(const std::string& name,
                                     const nlohmann::json& arguments) const;

private:
    std::vector<ToolSchema> schemas_;
    std::map<std::string, ToolHandler> handlers_;
};

} // namespace kmsg_mcp
