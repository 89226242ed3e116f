#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace kmsg_mcp {

/// Exit code reported when the program could not be started at all.
constexpr int kExitNotStarted = 127;

/// Exit code reported when the program was killed for exceeding its timeout.
constexpr int kExitTimedOut = 124;

// ---------------------------------------------------------------------------
// ExecutionResult — outcome of one external process run.
//
// Produced once per run and consumed immediately by the caller. Both streams
// are valid UTF-8: undecodable bytes have already been replaced with U+FFFD.
// ---------------------------------------------------------------------------
struct ExecutionResult {
    int exit_code = 0;
    std::string stdout_text;
    std::string stderr_text;
    std::int64_t latency_ms = 0;
    bool timed_out = false;

    [[nodiscard]] bool Succeeded() const noexcept {
        return exit_code == 0 && !timed_out;
    }

    /// stdout and stderr joined by a newline, the text the error classifier
    /// scans.
    [[nodiscard]] std::string CombinedOutput() const {
        return stdout_text + "\n" + stderr_text;
    }
};

// ---------------------------------------------------------------------------
// IProcessRunner — abstract process execution interface.
//
// The tool layer depends on this interface rather than on fork/exec directly,
// which enables offline testing via MockProcessRunner.
//
// Run() never throws. Start failures, timeouts and non-zero exits are all
// represented as ExecutionResult values.
// ---------------------------------------------------------------------------
class IProcessRunner {
public:
    virtual ~IProcessRunner() = default;

    // Non-copyable, non-movable (polymorphic base).
    IProcessRunner(const IProcessRunner&) = delete;
    IProcessRunner& operator=(const IProcessRunner&) = delete;
    IProcessRunner(IProcessRunner&&) = delete;
    IProcessRunner& operator=(IProcessRunner&&) = delete;

    /// Run `argv` (argv[0] is the program) without a shell and wait for it
    /// to exit or for `timeout` to elapse.
    [[nodiscard]] virtual ExecutionResult Run(
        const std::vector<std::string>& argv,
        std::chrono::milliseconds timeout) = 0;

protected:
    IProcessRunner() = default;
};

} // namespace kmsg_mcp
