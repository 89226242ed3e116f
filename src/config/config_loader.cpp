#include <kmsg_mcp/config/config_loader.hpp>

#include <kmsg_mcp/core/version.hpp>
#include <kmsg_mcp/mcp/framing.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace kmsg_mcp {

namespace {

namespace fs = std::filesystem;

Error MakeConfigError(const std::string& message) {
    Error error;
    error.operation = "ConfigLoader";
    error.message = message;
    error.kind = ErrorKind::Configuration;
    return error;
}

std::string Trim(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

// Trimmed value of an environment variable; nullopt when unset or blank.
std::optional<std::string> EnvValue(const char* name) {
    const char* raw = std::getenv(name);
    if (raw == nullptr) {
        return std::nullopt;
    }
    auto value = Trim(raw);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

bool IsExecutableFile(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
}

std::optional<std::string> FindOnPath(const std::string& program) {
    const char* path_env = std::getenv("PATH");
    if (path_env == nullptr) {
        return std::nullopt;
    }
    std::istringstream dirs(path_env);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        auto candidate = fs::path(dir) / program;
        if (IsExecutableFile(candidate)) {
            return candidate.string();
        }
    }
    return std::nullopt;
}

std::optional<std::string> FirstNonEmptyLine(const fs::path& file) {
    std::ifstream in(file);
    if (!in) {
        return std::nullopt;
    }
    std::string line;
    while (std::getline(in, line)) {
        auto candidate = Trim(line);
        if (!candidate.empty()) {
            return candidate;
        }
    }
    return std::nullopt;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    AppConfig config;
    config.config_file = std::string(file_path);

    try {
        const YAML::Node root = YAML::LoadFile(std::string(file_path));
        if (!root || root.IsNull()) {
            return Result<AppConfig, Error>::Ok(std::move(config));
        }
        if (!root.IsMap()) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Config root must be a mapping: " +
                                std::string(file_path)));
        }

        // -- kmsg --
        if (root["kmsg_bin"]) {
            config.kmsg_bin = root["kmsg_bin"].as<std::string>();
        }
        if (root["deep_recovery"]) {
            config.deep_recovery_default = root["deep_recovery"].as<bool>();
        }
        if (root["trace_ax"]) {
            config.trace_default = root["trace_ax"].as<bool>();
        }

        // -- Server --
        if (root["server_version"]) {
            config.server_version = root["server_version"].as<std::string>();
        }
        if (root["on_malformed_frame"]) {
            config.malformed_frame_policy =
                root["on_malformed_frame"].as<std::string>();
        }

        // -- Logging --
        if (root["log_json"]) {
            config.log_json = root["log_json"].as<bool>();
        }
        if (root["verbose"]) {
            config.verbose = root["verbose"].as<bool>();
        }
        if (root["debug"]) {
            config.debug = root["debug"].as<bool>();
        }
        if (root["color"]) {
            config.color = root["color"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromEnv
// ---------------------------------------------------------------------------
AppConfig LoadFromEnv() {
    AppConfig config;
    config.kmsg_bin = EnvValue("KMSG_BIN");
    if (auto val = EnvValue("KMSG_DEFAULT_DEEP_RECOVERY")) {
        config.deep_recovery_default = ToLower(*val) == "true";
    }
    if (auto val = EnvValue("KMSG_TRACE_DEFAULT")) {
        config.trace_default = ToLower(*val) == "true";
    }
    config.server_version = EnvValue("KMSG_MCP_VERSION");
    return config;
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("kmsg-mcp", kVersion,
                                     argparse::default_arguments::help);

    // kmsg flags
    program.add_argument("--kmsg-bin")
        .help("Path to the kmsg executable");
    program.add_argument("--deep-recovery")
        .help("Default deep_recovery to true for tool calls")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--trace-ax")
        .help("Default trace_ax to true for tool calls")
        .default_value(false)
        .implicit_value(true);

    // Server flags
    program.add_argument("--server-version")
        .help("Version reported in serverInfo");
    program.add_argument("--on-malformed-frame")
        .help("What to do with an unreadable frame: skip or stop");

    // Options
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("-v", "--verbose")
        .help("Log info messages to stderr")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-vv", "--debug")
        .help("Log debug messages to stderr")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-json")
        .help("Log as JSON lines")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--color")
        .help("Force colored logs")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored logs")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--version")
        .help("Print version and exit")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::runtime_error& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;

    if (auto val = program.present("--kmsg-bin")) {
        config.kmsg_bin = *val;
    }
    if (program.get<bool>("--deep-recovery")) {
        config.deep_recovery_default = true;
    }
    if (program.get<bool>("--trace-ax")) {
        config.trace_default = true;
    }
    if (auto val = program.present("--server-version")) {
        config.server_version = *val;
    }
    if (auto val = program.present("--on-malformed-frame")) {
        config.malformed_frame_policy = *val;
    }
    if (auto val = program.present("--config")) {
        config.config_file = *val;
    }
    config.verbose = program.get<bool>("--verbose");
    config.debug = program.get<bool>("--debug");
    config.log_json = program.get<bool>("--log-json");
    config.color = program.get<bool>("--color");
    config.no_color = program.get<bool>("--no-color");
    config.show_version = program.get<bool>("--version");

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& base, const AppConfig& overrides) {
    AppConfig merged = base;

    if (overrides.kmsg_bin.has_value()) {
        merged.kmsg_bin = overrides.kmsg_bin;
    }
    if (overrides.deep_recovery_default.has_value()) {
        merged.deep_recovery_default = overrides.deep_recovery_default;
    }
    if (overrides.trace_default.has_value()) {
        merged.trace_default = overrides.trace_default;
    }
    if (overrides.server_version.has_value()) {
        merged.server_version = overrides.server_version;
    }
    if (overrides.malformed_frame_policy.has_value()) {
        merged.malformed_frame_policy = overrides.malformed_frame_policy;
    }
    if (overrides.config_file.has_value()) {
        merged.config_file = overrides.config_file;
    }

    // Flags only ever switch on.
    merged.log_json = merged.log_json || overrides.log_json;
    merged.verbose = merged.verbose || overrides.verbose;
    merged.debug = merged.debug || overrides.debug;
    merged.color = merged.color || overrides.color;
    merged.no_color = merged.no_color || overrides.no_color;
    merged.show_version = merged.show_version || overrides.show_version;

    return merged;
}

// ---------------------------------------------------------------------------
// ResolveKmsgBin / ResolveServerVersion
// ---------------------------------------------------------------------------
std::string ResolveKmsgBin(const AppConfig& config) {
    if (config.kmsg_bin.has_value()) {
        auto explicit_bin = Trim(*config.kmsg_bin);
        if (!explicit_bin.empty()) {
            return explicit_bin;
        }
    }
    if (auto found = FindOnPath("kmsg")) {
        return *found;
    }
    const char* home = std::getenv("HOME");
    const fs::path home_dir = home != nullptr ? fs::path(home) : fs::path("~");
    return (home_dir / ".local" / "bin" / "kmsg").string();
}

std::string ResolveServerVersion(const AppConfig& config,
                                 std::string_view executable_path) {
    if (config.server_version.has_value()) {
        auto explicit_version = Trim(*config.server_version);
        if (!explicit_version.empty()) {
            return explicit_version;
        }
    }
    if (!executable_path.empty()) {
        std::error_code ec;
        auto exe = fs::absolute(fs::path(std::string(executable_path)), ec);
        if (!ec) {
            auto version_file = exe.parent_path().parent_path() / "VERSION";
            if (auto line = FirstNonEmptyLine(version_file)) {
                return *line;
            }
        }
    }
    return kVersion;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.kmsg_bin.has_value() && Trim(*config.kmsg_bin).empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("kmsg_bin must not be empty"));
    }
    if (config.malformed_frame_policy.has_value()) {
        MalformedFramePolicy policy = MalformedFramePolicy::Skip;
        if (!ParseMalformedFramePolicy(*config.malformed_frame_policy, policy)) {
            return Result<void, Error>::Err(MakeConfigError(
                "Invalid on_malformed_frame '" +
                *config.malformed_frame_policy + "' (expected skip or stop)"));
        }
    }
    if (config.color && config.no_color) {
        return Result<void, Error>::Err(
            MakeConfigError("--color and --no-color are mutually exclusive"));
    }
    return Result<void, Error>::Ok();
}

} // namespace kmsg_mcp
