#include <kmsg_mcp/bridge/kmsg_tools.hpp>

#include <kmsg_mcp/bridge/envelope.hpp>
#include <kmsg_mcp/bridge/error_classifier.hpp>
#include <kmsg_mcp/core/log.hpp>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace kmsg_mcp {

namespace {

constexpr std::string_view kComponent = "tools";

std::string Trim(std::string_view text) {
    const auto begin = text.find_first_not_of(" \t\r\n\f\v");
    if (begin == std::string_view::npos) {
        return "";
    }
    const auto end = text.find_last_not_of(" \t\r\n\f\v");
    return std::string(text.substr(begin, end - begin + 1));
}

std::string JoinCommand(const std::vector<std::string>& argv) {
    std::string joined;
    for (const auto& arg : argv) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += arg;
    }
    return joined;
}

void LogCommand(const std::vector<std::string>& argv) {
    if (GlobalLogger().Enabled(LogLevel::Debug)) {
        LogDebug(kComponent, "exec: " + JoinCommand(argv));
    }
}

// ---------------------------------------------------------------------------
// Argument helpers
// ---------------------------------------------------------------------------

Error InvalidArgument(const std::string& operation, std::string message,
                      std::string hint) {
    return RejectedCall(operation, ErrorKind::InvalidArgument,
                        std::move(message), std::move(hint));
}

// Absent or null yields "". Strings are trimmed; other types are rejected.
Result<std::string, Error> OptTrimmedString(const nlohmann::json& arguments,
                                            const std::string& key,
                                            const std::string& operation) {
    if (!arguments.contains(key) || arguments[key].is_null()) {
        return Result<std::string, Error>::Ok("");
    }
    if (!arguments[key].is_string()) {
        return Result<std::string, Error>::Err(InvalidArgument(
            operation, key + " must be a string",
            "Pass " + key + " as a JSON string."));
    }
    return Result<std::string, Error>::Ok(
        Trim(arguments[key].get<std::string>()));
}

// Absent or null yields `fallback`; anything but a JSON boolean is rejected.
Result<bool, Error> OptBool(const nlohmann::json& arguments,
                            const std::string& key, bool fallback,
                            const std::string& operation) {
    if (!arguments.contains(key) || arguments[key].is_null()) {
        return Result<bool, Error>::Ok(fallback);
    }
    if (!arguments[key].is_boolean()) {
        return Result<bool, Error>::Err(InvalidArgument(
            operation, key + " must be a boolean",
            "Pass true or false for " + key + "."));
    }
    return Result<bool, Error>::Ok(arguments[key].get<bool>());
}

// Integer view of a JSON value: integers as-is, floats truncated, decimal
// strings parsed. Out-of-range values saturate so clamping still applies.
std::optional<long long> AsInteger(const nlohmann::json& value) {
    constexpr auto kMax = std::numeric_limits<long long>::max();
    constexpr auto kMin = std::numeric_limits<long long>::min();

    if (value.is_number_unsigned()) {
        const auto u = value.get<std::uint64_t>();
        return u > static_cast<std::uint64_t>(kMax) ? kMax
                                                   : static_cast<long long>(u);
    }
    if (value.is_number_integer()) {
        return value.get<long long>();
    }
    if (value.is_number_float()) {
        const double d = value.get<double>();
        if (!std::isfinite(d)) {
            return std::nullopt;
        }
        return static_cast<long long>(std::clamp(std::trunc(d), -1e18, 1e18));
    }
    if (value.is_string()) {
        const auto text = Trim(value.get<std::string>());
        long long parsed = 0;
        const auto* first = text.data();
        const auto* last = text.data() + text.size();
        const auto [ptr, ec] = std::from_chars(first, last, parsed);
        if (ec == std::errc::result_out_of_range) {
            return (!text.empty() && text.front() == '-') ? kMin : kMax;
        }
        if (ec != std::errc() || ptr != last || text.empty()) {
            return std::nullopt;
        }
        return parsed;
    }
    return std::nullopt;
}

Result<int, Error> ParseLimit(const nlohmann::json& arguments,
                              const std::string& operation) {
    if (!arguments.contains("limit") || arguments["limit"].is_null()) {
        return Result<int, Error>::Ok(kDefaultReadLimit);
    }
    const auto raw = AsInteger(arguments["limit"]);
    if (!raw) {
        return Result<int, Error>::Err(InvalidArgument(
            operation, "limit must be an integer",
            "Use integer range 1..100 for limit."));
    }
    const auto clamped = std::clamp<long long>(*raw, kMinReadLimit, kMaxReadLimit);
    return Result<int, Error>::Ok(static_cast<int>(clamped));
}

Result<RunFlags, Error> ParseRunFlags(const nlohmann::json& arguments,
                                      const KmsgDefaults& defaults,
                                      const std::string& operation) {
    auto deep = OptBool(arguments, "deep_recovery", defaults.deep_recovery, operation);
    if (deep.IsErr()) return Result<RunFlags, Error>::Err(deep.Error());
    auto keep = OptBool(arguments, "keep_window", false, operation);
    if (keep.IsErr()) return Result<RunFlags, Error>::Err(keep.Error());
    auto trace = OptBool(arguments, "trace_ax", defaults.trace_ax, operation);
    if (trace.IsErr()) return Result<RunFlags, Error>::Err(trace.Error());

    return Result<RunFlags, Error>::Ok(
        RunFlags{deep.Value(), keep.Value(), trace.Value()});
}

void AppendRunFlags(std::vector<std::string>& argv, const RunFlags& flags) {
    if (flags.deep_recovery) argv.emplace_back("--deep-recovery");
    if (flags.keep_window) argv.emplace_back("--keep-window");
    if (flags.trace_ax) argv.emplace_back("--trace-ax");
}

bool IsRegularFile(const std::string& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && !ec;
}

// Copy of `payload[key]`, or `fallback` when the key is absent.
nlohmann::json FieldOr(const nlohmann::json& payload, const char* key,
                       nlohmann::json fallback) {
    auto it = payload.find(key);
    return it != payload.end() ? *it : std::move(fallback);
}

void AttachStderrTrace(nlohmann::json& envelope, const RunFlags& flags,
                       const ExecutionResult& run) {
    if (flags.trace_ax && !Trim(run.stderr_text).empty()) {
        envelope["meta"]["stderr_trace"] = run.stderr_text;
    }
}

nlohmann::json FailureEnvelope(const std::string& operation,
                               const std::string& message,
                               const ExecutionResult& run) {
    const auto kind = ClassifyFailure(run.CombinedOutput());
    LogWarn(kComponent, operation + ": " + message + " [" +
                            std::string(ErrorKindName(kind)) + "], exit " +
                            std::to_string(run.exit_code));
    return MakeErrorEnvelope(FailedRun(operation, kind, message,
                                       std::string(HintFor(kind)), run));
}

nlohmann::json TimeoutEnvelope(const std::string& operation,
                               const std::string& message,
                               const std::string& hint,
                               const ExecutionResult& run) {
    LogWarn(kComponent, operation + ": " + message + " after " +
                            std::to_string(run.latency_ms) + "ms");
    return MakeErrorEnvelope(
        FailedRun(operation, ErrorKind::ProcessTimeout, message, hint, run));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Request parsing
// ---------------------------------------------------------------------------

Result<ReadRequest, Error> ParseReadRequest(const nlohmann::json& arguments,
                                            const KmsgDefaults& defaults) {
    const std::string operation = "kmsg_read";
    if (!arguments.is_object()) {
        return Result<ReadRequest, Error>::Err(InvalidArgument(
            operation, "arguments must be an object",
            "Pass tool arguments as a JSON object."));
    }

    auto chat = OptTrimmedString(arguments, "chat", operation);
    if (chat.IsErr()) return Result<ReadRequest, Error>::Err(chat.Error());
    if (chat.Value().empty()) {
        return Result<ReadRequest, Error>::Err(InvalidArgument(
            operation, "chat is required", "Provide a non-empty chat name."));
    }

    auto limit = ParseLimit(arguments, operation);
    if (limit.IsErr()) return Result<ReadRequest, Error>::Err(limit.Error());

    auto flags = ParseRunFlags(arguments, defaults, operation);
    if (flags.IsErr()) return Result<ReadRequest, Error>::Err(flags.Error());

    return Result<ReadRequest, Error>::Ok(
        ReadRequest{std::move(chat).Value(), limit.Value(), flags.Value()});
}

Result<SendRequest, Error> ParseSendRequest(const nlohmann::json& arguments,
                                            const std::string& tool_name,
                                            const std::string& payload_key,
                                            const KmsgDefaults& defaults) {
    if (!arguments.is_object()) {
        return Result<SendRequest, Error>::Err(InvalidArgument(
            tool_name, "arguments must be an object",
            "Pass tool arguments as a JSON object."));
    }

    auto chat = OptTrimmedString(arguments, "chat", tool_name);
    if (chat.IsErr()) return Result<SendRequest, Error>::Err(chat.Error());
    auto payload = OptTrimmedString(arguments, payload_key, tool_name);
    if (payload.IsErr()) return Result<SendRequest, Error>::Err(payload.Error());
    if (chat.Value().empty() || payload.Value().empty()) {
        return Result<SendRequest, Error>::Err(InvalidArgument(
            tool_name, "chat and " + payload_key + " are required",
            "Provide both chat and " + payload_key + "."));
    }

    auto confirm = OptBool(arguments, "confirm", false, tool_name);
    if (confirm.IsErr()) return Result<SendRequest, Error>::Err(confirm.Error());

    auto flags = ParseRunFlags(arguments, defaults, tool_name);
    if (flags.IsErr()) return Result<SendRequest, Error>::Err(flags.Error());

    return Result<SendRequest, Error>::Ok(SendRequest{
        std::move(chat).Value(), std::move(payload).Value(), confirm.Value(),
        flags.Value()});
}

std::vector<std::string> BuildReadCommand(const std::string& kmsg_bin,
                                          const ReadRequest& request) {
    std::vector<std::string> argv = {
        kmsg_bin, "read", request.chat, "--json",
        "--limit", std::to_string(request.limit)};
    AppendRunFlags(argv, request.flags);
    return argv;
}

// ---------------------------------------------------------------------------
// KmsgTools
// ---------------------------------------------------------------------------

KmsgTools::KmsgTools(IProcessRunner& runner, std::string kmsg_bin,
                     KmsgDefaults defaults, KmsgTimeouts timeouts)
    : runner_(runner),
      kmsg_bin_(std::move(kmsg_bin)),
      defaults_(defaults),
      timeouts_(timeouts) {}

nlohmann::json KmsgTools::Read(const nlohmann::json& arguments) {
    const std::string operation = "kmsg_read";
    auto parsed = ParseReadRequest(arguments, defaults_);
    if (parsed.IsErr()) {
        return MakeErrorEnvelope(parsed.Error());
    }
    const ReadRequest request = std::move(parsed).Value();

    const auto argv = BuildReadCommand(kmsg_bin_, request);
    LogCommand(argv);
    auto run = runner_.Run(argv, request.flags.deep_recovery
                                     ? timeouts_.read_deep
                                     : timeouts_.read);

    if (run.timed_out) {
        return TimeoutEnvelope(
            operation, "kmsg read timed out",
            "Increase stability (keep KakaoTalk open/focused) and retry.", run);
    }

    if (run.exit_code != 0) {
        const auto kind = ClassifyFailure(run.CombinedOutput());
        if (kind != ErrorKind::TargetNotFound || request.flags.deep_recovery) {
            return FailureEnvelope(operation, "kmsg read failed", run);
        }

        // One retry in deep-recovery mode; its outcome is final.
        ReadRequest retry_request = request;
        retry_request.flags.deep_recovery = true;
        const auto retry_argv = BuildReadCommand(kmsg_bin_, retry_request);
        LogInfo(kComponent, "chat '" + request.chat +
                                "' not found, retrying with --deep-recovery");
        LogCommand(retry_argv);
        auto retry = runner_.Run(retry_argv, timeouts_.read_deep);

        if (retry.timed_out) {
            return TimeoutEnvelope(
                operation, "kmsg read timed out after deep-recovery retry",
                "Increase stability (keep KakaoTalk open/focused) and retry.",
                retry);
        }
        if (retry.exit_code != 0) {
            return FailureEnvelope(
                operation, "kmsg read failed after deep-recovery retry", retry);
        }
        run = std::move(retry);
    }

    const auto payload =
        nlohmann::json::parse(run.stdout_text, nullptr, /*allow_exceptions=*/false);
    if (payload.is_discarded() || !payload.is_object()) {
        LogWarn(kComponent, "kmsg read produced non-JSON stdout");
        return MakeErrorEnvelope(FailedRun(
            operation, ErrorKind::InvalidJsonOutput,
            "kmsg returned non-JSON output for read --json",
            "Run kmsg read manually and confirm JSON-only stdout.", run));
    }

    auto envelope = MakeSuccessEnvelope(
        {
            {"chat", FieldOr(payload, "chat", request.chat)},
            {"fetched_at", FieldOr(payload, "fetched_at", nullptr)},
            {"count", FieldOr(payload, "count", 0)},
            {"messages", FieldOr(payload, "messages", nlohmann::json::array())},
        },
        run.latency_ms);
    AttachStderrTrace(envelope, request.flags, run);
    return envelope;
}

nlohmann::json KmsgTools::Send(const nlohmann::json& arguments) {
    return RunSend(arguments, /*image=*/false);
}

nlohmann::json KmsgTools::SendImage(const nlohmann::json& arguments) {
    return RunSend(arguments, /*image=*/true);
}

nlohmann::json KmsgTools::RunSend(const nlohmann::json& arguments, bool image) {
    const std::string operation = image ? "kmsg_send_image" : "kmsg_send";
    const std::string subcommand = image ? "send-image" : "send";
    const std::string label = "kmsg " + subcommand;

    auto parsed = ParseSendRequest(arguments, operation,
                                   image ? "image_path" : "message", defaults_);
    if (parsed.IsErr()) {
        return MakeErrorEnvelope(parsed.Error());
    }
    const SendRequest request = std::move(parsed).Value();

    if (request.confirm) {
        return MakeErrorEnvelope(RejectedCall(
            operation, ErrorKind::ConfirmationRequired,
            operation + " blocked because confirm=true requests pre-send confirmation",
            "Ask user for explicit approval, then call again with confirm=false "
            "(or omit confirm)."));
    }

    if (image && !IsRegularFile(request.payload)) {
        return MakeErrorEnvelope(InvalidArgument(
            operation, "image_path must point to an existing file",
            "Provide a valid local image file path."));
    }

    std::vector<std::string> argv = {kmsg_bin_, subcommand, request.chat,
                                     request.payload};
    AppendRunFlags(argv, request.flags);

    std::chrono::milliseconds timeout;
    if (image) {
        timeout = request.flags.deep_recovery ? timeouts_.send_image_deep
                                              : timeouts_.send_image;
    } else {
        timeout = request.flags.deep_recovery ? timeouts_.send_deep
                                              : timeouts_.send;
    }

    LogCommand(argv);
    const auto run = runner_.Run(argv, timeout);

    if (run.timed_out) {
        return TimeoutEnvelope(operation, label + " timed out",
                               "Retry after ensuring KakaoTalk is responsive.",
                               run);
    }
    if (run.exit_code != 0) {
        return FailureEnvelope(operation, label + " failed", run);
    }

    auto envelope = MakeSuccessEnvelope(
        {
            {"chat", request.chat},
            {"sent", true},
            {"meta", {{"stdout", run.stdout_text}}},
        },
        run.latency_ms);
    AttachStderrTrace(envelope, request.flags, run);
    return envelope;
}

ReadinessReport KmsgTools::CheckReady() {
    const auto version = runner_.Run({kmsg_bin_, "--version"},
                                     timeouts_.probe_version);
    if (!version.Succeeded()) {
        return ReadinessReport{false, {
            {"stage", "version"},
            {"message", "kmsg binary not executable"},
            {"stdout", version.stdout_text},
            {"stderr", version.stderr_text},
            {"kmsg_bin", kmsg_bin_},
        }};
    }

    const auto status = runner_.Run({kmsg_bin_, "status"},
                                    timeouts_.probe_status);
    if (!status.Succeeded()) {
        return ReadinessReport{false, {
            {"stage", "status"},
            {"message", "kmsg status check failed"},
            {"stdout", status.stdout_text},
            {"stderr", status.stderr_text},
            {"kmsg_bin", kmsg_bin_},
        }};
    }

    return ReadinessReport{true, {
        {"kmsg_bin", kmsg_bin_},
        {"version", Trim(version.stdout_text)},
    }};
}

} // namespace kmsg_mcp
