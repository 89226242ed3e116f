#include <kmsg_mcp/bridge/kmsg_tools.hpp>
#include <kmsg_mcp/config/config_loader.hpp>
#include <kmsg_mcp/core/log.hpp>
#include <kmsg_mcp/core/terminal.hpp>
#include <kmsg_mcp/mcp/framing.hpp>
#include <kmsg_mcp/mcp/kmsg_tool_handlers.hpp>
#include <kmsg_mcp/mcp/mcp_server.hpp>
#include <kmsg_mcp/process/process_runner.hpp>

#include <csignal>
#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitConfig = 2;

void PrintError(const kmsg_mcp::Error& error) {
    std::cerr << "kmsg-mcp: " << error.message << "\n";
}

// Defaults, then YAML (--config), then environment, then CLI flags.
kmsg_mcp::Result<kmsg_mcp::AppConfig, kmsg_mcp::Error> LoadConfig(
    int argc, const char* const* argv) {
    using namespace kmsg_mcp;
    using ConfigResult = Result<AppConfig, Error>;

    auto cli_result = LoadFromCli(argc, argv);
    return std::move(cli_result).AndThen([](AppConfig cli_config) -> ConfigResult {
        AppConfig config;
        if (cli_config.config_file.has_value()) {
            auto yaml_result = LoadFromYaml(*cli_config.config_file);
            if (yaml_result.IsErr()) {
                return yaml_result;
            }
            config = std::move(yaml_result).Value();
        }
        config = MergeConfigs(config, LoadFromEnv());
        config = MergeConfigs(config, cli_config);

        auto valid = ValidateConfig(config);
        if (valid.IsErr()) {
            return ConfigResult::Err(valid.Error());
        }
        return ConfigResult::Ok(std::move(config));
    });
}

void InitLogging(const kmsg_mcp::AppConfig& config) {
    using namespace kmsg_mcp;

    auto log_level = LogLevel::Warn;
    if (config.debug) {
        log_level = LogLevel::Debug;
    } else if (config.verbose) {
        log_level = LogLevel::Info;
    }

    if (config.log_json) {
        InitGlobalLogger(std::make_unique<JsonSink>(), log_level);
        return;
    }
    bool use_color = ResolveLogColor(config.color, config.no_color);
    InitGlobalLogger(std::make_unique<ConsoleSink>(use_color), log_level);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    using namespace kmsg_mcp;

    auto config_result = LoadConfig(argc, argv);
    if (config_result.IsErr()) {
        PrintError(config_result.Error());
        return kExitConfig;
    }
    const auto config = std::move(config_result).Value();

    const auto server_version =
        ResolveServerVersion(config, argc > 0 ? argv[0] : "");
    if (config.show_version) {
        std::cout << "kmsg-mcp " << server_version << "\n";
        return kExitSuccess;
    }

    InitLogging(config);

    // A peer that hangs up must not kill us mid-write; FrameWriter reports it.
    std::signal(SIGPIPE, SIG_IGN);
    std::ios::sync_with_stdio(false);

    MalformedFramePolicy policy = MalformedFramePolicy::Skip;
    if (config.malformed_frame_policy.has_value() &&
        !ParseMalformedFramePolicy(*config.malformed_frame_policy, policy)) {
        LogWarn("main", "ignoring on_malformed_frame " +
                            *config.malformed_frame_policy);
    }
    LogInfo("main", std::string("malformed frames: ") +
                        MalformedFramePolicyName(policy));

    KmsgDefaults defaults;
    defaults.deep_recovery = config.deep_recovery_default.value_or(false);
    defaults.trace_ax = config.trace_default.value_or(false);

    PosixProcessRunner runner;
    KmsgTools tools(runner, ResolveKmsgBin(config), defaults);
    LogInfo("main", "using kmsg binary " + tools.Binary());

    ToolRegistry registry;
    RegisterKmsgTools(registry, tools);

    McpServerOptions options;
    options.server_version = server_version;
    options.instructions = kKmsgInstructions;
    options.defaults = SessionDefaultsFor(tools);
    options.malformed_frame_policy = policy;
    options.startup_check = [&tools]() { return DescribeReadiness(tools); };

    McpServer server(std::move(registry), std::move(options));
    server.Run();

    return kExitSuccess;
}
