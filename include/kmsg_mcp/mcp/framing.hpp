#pragma once

#include <cstddef>
#include <istream>
#include <mutex>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

namespace kmsg_mcp {

// ---------------------------------------------------------------------------
// Content-Length framing.
//
//   Content-Length: <N>\r\n
//   \r\n
//   <N bytes of UTF-8 JSON>
//
// Header names are matched case-insensitively, header lines may end in "\n"
// or "\r\n", and unknown headers are ignored. Bodies larger than
// kMaxFrameBodyBytes are discarded unread.
// ---------------------------------------------------------------------------

constexpr std::size_t kMaxFrameBodyBytes = 64 * 1024 * 1024;

enum class FrameStatus {
    Message,      // a JSON body was decoded
    Malformed,    // zero length, bad Content-Length, oversized or non-JSON body
    EndOfStream,  // input closed before a complete frame
};

// What the server does with a Malformed frame.
enum class MalformedFramePolicy {
    Skip,  // log it and read the next frame
    Stop,  // end the session as if the stream had closed
};

struct Frame {
    FrameStatus status = FrameStatus::EndOfStream;
    nlohmann::json message;  // set for Message
    std::string body;        // raw body bytes as read
    std::string detail;      // reason, for Malformed
};

class FrameReader {
public:
    explicit FrameReader(std::istream& in);

    /// Read the next frame. Blocks until a full frame or end of input.
    [[nodiscard]] Frame Read();

private:
    std::istream& in_;
};

// Serialized writer; a header block and its body are never interleaved with
// another Write().
class FrameWriter {
public:
    explicit FrameWriter(std::ostream& out);

    /// Returns false when the stream is no longer writable.
    bool Write(const nlohmann::json& message);

private:
    std::ostream& out_;
    std::mutex mutex_;
};

/// Compact UTF-8 JSON text of `message`; invalid UTF-8 in strings is replaced.
[[nodiscard]] std::string SerializeMessage(const nlohmann::json& message);

/// Header block plus body for `message`, exactly as FrameWriter emits it.
[[nodiscard]] std::string EncodeFrame(const nlohmann::json& message);

/// Parse "skip" / "stop" (case-insensitive).
[[nodiscard]] bool ParseMalformedFramePolicy(const std::string& text,
                                             MalformedFramePolicy& out);

[[nodiscard]] const char* MalformedFramePolicyName(MalformedFramePolicy policy);

} // namespace kmsg_mcp
