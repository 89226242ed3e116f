#pragma once

#include <kmsg_mcp/process/i_process_runner.hpp>

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace kmsg_mcp {

// ---------------------------------------------------------------------------
// PosixProcessRunner — fork/execvp implementation of IProcessRunner.
//
// The child gets /dev/null as stdin (the bridge's own stdin carries the MCP
// stream) and separate pipes for stdout and stderr. Both pipes are drained
// with poll() while the deadline is checked; on expiry the child is killed
// with SIGKILL, the pipes are drained and the child is reaped before Run()
// returns.
// ---------------------------------------------------------------------------
class PosixProcessRunner : public IProcessRunner {
public:
    PosixProcessRunner() = default;

    [[nodiscard]] ExecutionResult Run(
        const std::vector<std::string>& argv,
        std::chrono::milliseconds timeout) override;
};

/// Decode `bytes` as UTF-8, replacing every byte that is not part of a
/// well-formed sequence with U+FFFD.
[[nodiscard]] std::string SanitizeUtf8(std::string_view bytes);

} // namespace kmsg_mcp
