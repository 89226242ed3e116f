#pragma once

#include <kmsg_mcp/core/result.hpp>
#include <kmsg_mcp/process/i_process_runner.hpp>

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace kmsg_mcp {

// ---------------------------------------------------------------------------
// Tool envelopes: the payload of every tools/call response.
//
//   success: {"ok": true, ...tool fields..., "meta": {"latency_ms": N, ...}}
//   failure: {"ok": false,
//             "error": {"code", "message", "hint", "raw_stdout", "raw_stderr"},
//             "meta": {"latency_ms": N}}
//
// Failures are delivered as a successful JSON-RPC response; the peer branches
// on "ok".
// ---------------------------------------------------------------------------

/// Failure envelope for `error`.
[[nodiscard]] nlohmann::json MakeErrorEnvelope(const Error& error);

/// Success envelope: `fields` plus ok=true and meta.latency_ms.
[[nodiscard]] nlohmann::json MakeSuccessEnvelope(nlohmann::json fields,
                                                 std::int64_t latency_ms);

/// Error for a request rejected before any process was started (latency 0).
[[nodiscard]] Error RejectedCall(std::string operation, ErrorKind kind,
                                 std::string message, std::string hint);

/// Error for a finished run, carrying its raw output and latency.
[[nodiscard]] Error FailedRun(std::string operation, ErrorKind kind,
                              std::string message, std::string hint,
                              const ExecutionResult& run);

} // namespace kmsg_mcp
