#include <kmsg_mcp/bridge/error_classifier.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string>

namespace kmsg_mcp {

namespace {

enum class MatchMode {
    CaseInsensitive,
    CaseSensitive,
};

struct FailureMatcher {
    std::string_view needle;
    MatchMode mode;
    ErrorKind kind;
};

// Evaluated top to bottom; order is the priority.
constexpr FailureMatcher kFailureMatchers[] = {
    {"no such file or directory", MatchMode::CaseInsensitive, ErrorKind::BinaryNotFound},
    {"not found",                 MatchMode::CaseInsensitive, ErrorKind::BinaryNotFound},
    {"WINDOW_NOT_READY",          MatchMode::CaseSensitive,   ErrorKind::WindowUnavailable},
    {"SEARCH_MISS",               MatchMode::CaseSensitive,   ErrorKind::TargetNotFound},
    {"Accessibility",             MatchMode::CaseSensitive,   ErrorKind::PermissionDenied},
    {"손쉬운 사용",                MatchMode::CaseSensitive,   ErrorKind::PermissionDenied},
};

struct KindHint {
    ErrorKind kind;
    std::string_view hint;
};

constexpr KindHint kHints[] = {
    {ErrorKind::BinaryNotFound,
     "Set a valid KMSG_BIN path or install kmsg into PATH."},
    {ErrorKind::WindowUnavailable,
     "KakaoTalk window was not ready. Open KakaoTalk and retry (or enable deep_recovery)."},
    {ErrorKind::TargetNotFound,
     "Chat was not found in search results. Verify chat name spacing and visibility."},
    {ErrorKind::PermissionDenied,
     "Grant Accessibility permission in System Settings > Privacy & Security > Accessibility."},
    {ErrorKind::UnknownExecutionFailure,
     "Check raw_stdout/raw_stderr and rerun with trace_ax=true for details."},
};

// ASCII lowering only; the case-insensitive needles are ASCII and multi-byte
// UTF-8 sequences pass through untouched.
std::string AsciiLower(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return lowered;
}

} // anonymous namespace

ErrorKind ClassifyFailure(std::string_view combined_output) {
    const std::string lowered = AsciiLower(combined_output);
    for (const auto& matcher : kFailureMatchers) {
        const std::string_view haystack =
            matcher.mode == MatchMode::CaseInsensitive
                ? std::string_view(lowered)
                : combined_output;
        if (haystack.find(matcher.needle) != std::string_view::npos) {
            return matcher.kind;
        }
    }
    return ErrorKind::UnknownExecutionFailure;
}

std::string_view HintFor(ErrorKind kind) noexcept {
    for (const auto& entry : kHints) {
        if (entry.kind == kind) {
            return entry.hint;
        }
    }
    return kHints[std::size(kHints) - 1].hint;
}

} // namespace kmsg_mcp
