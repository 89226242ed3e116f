#pragma once

#include <optional>
#include <string>

namespace kmsg_mcp {

// Startup configuration. Optional fields are unset until a layer (YAML file,
// environment, command line) provides them; MergeConfigs lets a higher layer
// override only what it sets.
struct AppConfig {
    std::optional<std::string> kmsg_bin;
    std::optional<bool> deep_recovery_default;
    std::optional<bool> trace_default;
    std::optional<std::string> server_version;
    std::optional<std::string> malformed_frame_policy;  // "skip" or "stop"
    std::optional<std::string> config_file;
    bool log_json = false;
    bool verbose = false;   // -v: info
    bool debug = false;     // -vv: debug
    bool color = false;
    bool no_color = false;
    bool show_version = false;
};

} // namespace kmsg_mcp
