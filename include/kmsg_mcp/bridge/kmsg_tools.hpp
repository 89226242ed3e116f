#pragma once

#include <kmsg_mcp/core/result.hpp>
#include <kmsg_mcp/process/i_process_runner.hpp>

#include <chrono>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace kmsg_mcp {

// Defaults applied when a call omits deep_recovery / trace_ax.
struct KmsgDefaults {
    bool deep_recovery = false;
    bool trace_ax = false;
};

// Per-subcommand process timeouts. The deep variants apply when
// --deep-recovery is passed, including the automatic read retry.
struct KmsgTimeouts {
    std::chrono::milliseconds read{8000};
    std::chrono::milliseconds read_deep{15000};
    std::chrono::milliseconds send{10000};
    std::chrono::milliseconds send_deep{18000};
    std::chrono::milliseconds send_image{12000};
    std::chrono::milliseconds send_image_deep{20000};
    std::chrono::milliseconds probe_version{2000};
    std::chrono::milliseconds probe_status{4000};
};

// Optional kmsg flags shared by every capability.
struct RunFlags {
    bool deep_recovery = false;
    bool keep_window = false;
    bool trace_ax = false;
};

// Validated kmsg_read arguments. `limit` is already clamped to [1, 100].
struct ReadRequest {
    std::string chat;
    int limit = 20;
    RunFlags flags;
};

// Validated kmsg_send / kmsg_send_image arguments. `payload` is the message
// text or the image path.
struct SendRequest {
    std::string chat;
    std::string payload;
    bool confirm = false;
    RunFlags flags;
};

// Outcome of the `--version` + `status` probe run on initialize.
struct ReadinessReport {
    bool ready = false;
    nlohmann::json detail;
};

constexpr int kMinReadLimit = 1;
constexpr int kMaxReadLimit = 100;
constexpr int kDefaultReadLimit = 20;

/// Validate kmsg_read arguments. Never starts a process.
[[nodiscard]] Result<ReadRequest, Error> ParseReadRequest(
    const nlohmann::json& arguments, const KmsgDefaults& defaults);

/// Validate kmsg_send (payload_key "message") or kmsg_send_image
/// (payload_key "image_path") arguments. Never starts a process.
[[nodiscard]] Result<SendRequest, Error> ParseSendRequest(
    const nlohmann::json& arguments, const std::string& tool_name,
    const std::string& payload_key, const KmsgDefaults& defaults);

/// `<bin> read <chat> --json --limit <n> [flags]`
[[nodiscard]] std::vector<std::string> BuildReadCommand(
    const std::string& kmsg_bin, const ReadRequest& request);

// ---------------------------------------------------------------------------
// KmsgTools — the three kmsg capabilities on top of an IProcessRunner.
//
// Each capability validates its arguments, builds the kmsg command line,
// runs it with the subcommand's timeout and turns the ExecutionResult into
// an envelope (see envelope.hpp). Read() retries once with --deep-recovery
// when the first attempt fails with TARGET_NOT_FOUND; nothing else retries.
// ---------------------------------------------------------------------------
class KmsgTools {
public:
    KmsgTools(IProcessRunner& runner, std::string kmsg_bin,
              KmsgDefaults defaults = {}, KmsgTimeouts timeouts = {});

    [[nodiscard]] nlohmann::json Read(const nlohmann::json& arguments);
    [[nodiscard]] nlohmann::json Send(const nlohmann::json& arguments);
    [[nodiscard]] nlohmann::json SendImage(const nlohmann::json& arguments);

    /// Run `kmsg --version`, then `kmsg status`; stops at the first failure.
    [[nodiscard]] ReadinessReport CheckReady();

    [[nodiscard]] const std::string& Binary() const noexcept { return kmsg_bin_; }
    [[nodiscard]] const KmsgDefaults& Defaults() const noexcept { return defaults_; }

private:
    // Shared body of Send() and SendImage().
    nlohmann::json RunSend(const nlohmann::json& arguments, bool image);

    IProcessRunner& runner_;
    std::string kmsg_bin_;
    KmsgDefaults defaults_;
    KmsgTimeouts timeouts_;
};

} // namespace kmsg_mcp
