#include <kmsg_mcp/bridge/envelope.hpp>

#include <utility>

namespace kmsg_mcp {

nlohmann::json MakeErrorEnvelope(const Error& error) {
    return {
        {"ok", false},
        {"error", {
            {"code", error.CodeName()},
            {"message", error.message},
            {"hint", error.hint},
            {"raw_stdout", error.raw_stdout},
            {"raw_stderr", error.raw_stderr},
        }},
        {"meta", {{"latency_ms", error.latency_ms}}},
    };
}

nlohmann::json MakeSuccessEnvelope(nlohmann::json fields,
                                   std::int64_t latency_ms) {
    if (!fields.is_object()) {
        fields = nlohmann::json::object();
    }
    fields["ok"] = true;
    if (!fields.contains("meta") || !fields["meta"].is_object()) {
        fields["meta"] = nlohmann::json::object();
    }
    fields["meta"]["latency_ms"] = latency_ms;
    return fields;
}

Error RejectedCall(std::string operation, ErrorKind kind,
                   std::string message, std::string hint) {
    Error error;
    error.operation = std::move(operation);
    error.kind = kind;
    error.message = std::move(message);
    error.hint = std::move(hint);
    return error;
}

Error FailedRun(std::string operation, ErrorKind kind,
                std::string message, std::string hint,
                const ExecutionResult& run) {
    Error error = RejectedCall(std::move(operation), kind, std::move(message),
                               std::move(hint));
    error.raw_stdout = run.stdout_text;
    error.raw_stderr = run.stderr_text;
    error.latency_ms = run.latency_ms;
    return error;
}

} // namespace kmsg_mcp
