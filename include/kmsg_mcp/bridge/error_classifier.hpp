#pragma once

#include <kmsg_mcp/core/result.hpp>

#include <string_view>

namespace kmsg_mcp {

// ---------------------------------------------------------------------------
// Failure classification for kmsg runs.
//
// ClassifyFailure scans the combined stdout/stderr of a failed run against a
// fixed, ordered table of (matcher, kind) pairs; the first match wins:
//
//   1. "no such file or directory", "not found"  (case-insensitive) -> BinaryNotFound
//   2. WINDOW_NOT_READY                          (marker)           -> WindowUnavailable
//   3. SEARCH_MISS                               (marker)           -> TargetNotFound
//   4. "Accessibility", "손쉬운 사용"             (case-sensitive)   -> PermissionDenied
//   5. anything else                                                -> UnknownExecutionFailure
//
// This is a shallow heuristic over opaque program output, not a parser.
// ---------------------------------------------------------------------------
[[nodiscard]] ErrorKind ClassifyFailure(std::string_view combined_output);

/// Fixed remediation hint for a classified kind. Kinds the classifier never
/// produces map to the generic UnknownExecutionFailure hint.
[[nodiscard]] std::string_view HintFor(ErrorKind kind) noexcept;

} // namespace kmsg_mcp
