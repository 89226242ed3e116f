#pragma once

#include <kmsg_mcp/config/app_config.hpp>
#include <kmsg_mcp/core/result.hpp>

#include <string>
#include <string_view>

namespace kmsg_mcp {

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Read KMSG_BIN, KMSG_DEFAULT_DEEP_RECOVERY, KMSG_TRACE_DEFAULT and
// KMSG_MCP_VERSION. Booleans are true only for "true" (any case).
AppConfig LoadFromEnv();

// Parse CLI arguments into an AppConfig.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: fields set in overrides replace those in base.
AppConfig MergeConfigs(const AppConfig& base, const AppConfig& overrides);

// kmsg_bin if set, else `kmsg` on PATH, else ~/.local/bin/kmsg.
std::string ResolveKmsgBin(const AppConfig& config);

// server_version if set, else the first non-empty line of VERSION in the
// parent of the executable's directory, else the compiled-in version.
std::string ResolveServerVersion(const AppConfig& config,
                                 std::string_view executable_path);

// Validate that values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

} // namespace kmsg_mcp
