#include <kmsg_mcp/mcp/tool_registry.hpp>

#include <algorithm>
#include <stdexcept>

namespace kmsg_mcp {

ToolResult ToolResultFromEnvelope(const nlohmann::json& envelope) {
    const bool ok = envelope.is_object() && envelope.value("ok", false);
    const auto text = envelope.dump(2, ' ', false,
                                    nlohmann::json::error_handler_t::replace);
    return ToolResult{
        !ok,
        nlohmann::json::array({{{"type", "text"}, {"text", text}}}),
        envelope
    };
}

void ToolRegistry::Register(const std::string& name,
                            const std::string& description,
                            const nlohmann::json& input_schema,
                            ToolHandler handler) {
    auto existing = std::find_if(
        schemas_.begin(), schemas_.end(),
        [&name](const ToolSchema& schema) { return schema.name == name; });
    if (existing != schemas_.end()) {
        throw std::invalid_argument("Tool already registered: " + name);
    }
    schemas_.push_back({name, description, input_schema});
    handlers_[name] = std::move(handler);
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return handlers_.count(name) > 0;
}

ToolResult ToolRegistry::Execute(const std::string& name,
                                 const nlohmann::json& arguments) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        return ToolResult{
            true,
            nlohmann::json::array({
                {{"type", "text"}, {"text", "Unknown tool: " + name}}
            }),
            nullptr
        };
    }
    return it->second(arguments);
}

} // namespace kmsg_mcp
