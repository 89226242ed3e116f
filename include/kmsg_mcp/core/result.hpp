#pragma once

#include <cassert>
#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace kmsg_mcp {

// ---------------------------------------------------------------------------
// Result<T, E> — a discriminated union that holds either a value or an error.
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    // -- Factories ----------------------------------------------------------

    static Result Ok(const T& value) { return Result(OkTag{}, value); }
    static Result Ok(T&& value) { return Result(OkTag{}, std::move(value)); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    // -- Query --------------------------------------------------------------

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return IsOk(); }

    // -- Access -------------------------------------------------------------

    [[nodiscard]] const T& Value() const& {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(storage_);
    }

    [[nodiscard]] T Value() && {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(storage_);
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(std::move(storage_));
    }

    // -- Monadic: AndThen ---------------------------------------------------
    // fn: T -> Result<U, E>

    template <typename Fn>
    auto AndThen(Fn&& fn) && -> std::invoke_result_t<Fn, T&&> {
        using ReturnType = std::invoke_result_t<Fn, T&&>;
        if (IsOk()) {
            return std::forward<Fn>(fn)(std::get<0>(std::move(storage_)));
        }
        return ReturnType::Err(std::get<1>(std::move(storage_)));
    }

private:
    struct OkTag {};
    struct ErrTag {};

    Result(OkTag, const T& value) : storage_(std::in_place_index<0>, value) {}
    Result(OkTag, T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}
    Result(ErrTag, const E& error) : storage_(std::in_place_index<1>, error) {}
    Result(ErrTag, E&& error) : storage_(std::in_place_index<1>, std::move(error)) {}

    std::variant<T, E> storage_;
};

// ---------------------------------------------------------------------------
// Result<void, E> — specialization for operations that succeed with no value.
// ---------------------------------------------------------------------------
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(OkTag{}); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return *error_;
    }

private:
    struct OkTag {};
    struct ErrTag {};

    explicit Result(OkTag) : error_(std::nullopt) {}
    Result(ErrTag, const E& error) : error_(error) {}
    Result(ErrTag, E&& error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

// ---------------------------------------------------------------------------
// ErrorKind — tool-level failure taxonomy. Every kind except Configuration is
// reported to the MCP peer as an `ok:false` envelope, never as a JSON-RPC
// error.
// ---------------------------------------------------------------------------
enum class ErrorKind {
    InvalidArgument,
    ConfirmationRequired,
    ProcessTimeout,
    BinaryNotFound,
    WindowUnavailable,
    TargetNotFound,
    PermissionDenied,
    InvalidJsonOutput,
    UnknownExecutionFailure,
    Configuration,
};

/// Wire name of an ErrorKind, e.g. "TARGET_NOT_FOUND".
[[nodiscard]] constexpr std::string_view ErrorKindName(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidArgument:         return "INVALID_ARGUMENT";
        case ErrorKind::ConfirmationRequired:    return "CONFIRMATION_REQUIRED";
        case ErrorKind::ProcessTimeout:          return "PROCESS_TIMEOUT";
        case ErrorKind::BinaryNotFound:          return "BINARY_NOT_FOUND";
        case ErrorKind::WindowUnavailable:       return "WINDOW_UNAVAILABLE";
        case ErrorKind::TargetNotFound:          return "TARGET_NOT_FOUND";
        case ErrorKind::PermissionDenied:        return "PERMISSION_DENIED";
        case ErrorKind::InvalidJsonOutput:       return "INVALID_JSON_OUTPUT";
        case ErrorKind::UnknownExecutionFailure: return "UNKNOWN_EXECUTION_FAILURE";
        case ErrorKind::Configuration:           return "CONFIGURATION_ERROR";
    }
    return "UNKNOWN_EXECUTION_FAILURE";
}

// ---------------------------------------------------------------------------
// Error — structured error for tool invocations and startup configuration.
//
// Failed tool invocations always keep the raw, unmodified process output so
// the caller can diagnose them offline.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;
    std::string message;
    ErrorKind kind = ErrorKind::UnknownExecutionFailure;
    std::string hint;
    std::string raw_stdout;
    std::string raw_stderr;
    std::int64_t latency_ms = 0;

    [[nodiscard]] std::string CodeName() const {
        return std::string(ErrorKindName(kind));
    }

    [[nodiscard]] std::string ToString() const {
        std::ostringstream oss;
        oss << operation << ": " << message << " [" << CodeName() << "]";
        if (!hint.empty()) {
            oss << " (" << hint << ")";
        }
        return oss.str();
    }

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return operation == other.operation &&
               message == other.message &&
               kind == other.kind &&
               hint == other.hint &&
               raw_stdout == other.raw_stdout &&
               raw_stderr == other.raw_stderr &&
               latency_ms == other.latency_ms;
    }

    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

} // namespace kmsg_mcp
