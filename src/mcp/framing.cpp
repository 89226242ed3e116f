#include <kmsg_mcp/mcp/framing.hpp>

#include <kmsg_mcp/core/log.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <optional>

namespace kmsg_mcp {

namespace {

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

std::string Trim(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

Frame Malformed(std::string detail, std::string body = {}) {
    Frame frame;
    frame.status = FrameStatus::Malformed;
    frame.body = std::move(body);
    frame.detail = std::move(detail);
    return frame;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// FrameReader
// ---------------------------------------------------------------------------

FrameReader::FrameReader(std::istream& in) : in_(in) {}

Frame FrameReader::Read() {
    std::optional<std::string> length_text;
    bool saw_header = false;

    std::string line;
    while (true) {
        if (!std::getline(in_, line)) {
            return Frame{};  // EndOfStream
        }
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            if (saw_header) {
                break;
            }
            continue;  // stray separator between frames
        }
        if (Trim(line).empty()) {
            continue;
        }
        saw_header = true;

        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        const auto key = ToLower(Trim(line.substr(0, colon)));
        if (key == "content-length") {
            length_text = Trim(line.substr(colon + 1));
        }
    }

    if (!length_text) {
        return Malformed("missing Content-Length header");
    }

    long long length = 0;
    const auto* first = length_text->data();
    const auto* last = first + length_text->size();
    const auto [ptr, ec] = std::from_chars(first, last, length);
    if (ec != std::errc() || ptr != last) {
        return Malformed("invalid Content-Length: " + *length_text);
    }
    if (length <= 0) {
        return Malformed("empty frame body");
    }
    if (static_cast<unsigned long long>(length) > kMaxFrameBodyBytes) {
        in_.ignore(static_cast<std::streamsize>(length));
        if (!in_) {
            return Frame{};
        }
        return Malformed("frame body of " + std::to_string(length) +
                         " bytes exceeds limit");
    }

    std::string body(static_cast<std::size_t>(length), '\0');
    in_.read(body.data(), static_cast<std::streamsize>(length));
    if (in_.gcount() != static_cast<std::streamsize>(length)) {
        return Frame{};  // stream closed mid-body
    }

    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded()) {
        return Malformed("frame body is not valid JSON", std::move(body));
    }

    Frame frame;
    frame.status = FrameStatus::Message;
    frame.message = std::move(parsed);
    frame.body = std::move(body);
    return frame;
}

// ---------------------------------------------------------------------------
// FrameWriter
// ---------------------------------------------------------------------------

FrameWriter::FrameWriter(std::ostream& out) : out_(out) {}

bool FrameWriter::Write(const nlohmann::json& message) {
    const auto frame = EncodeFrame(message);
    std::lock_guard<std::mutex> lock(mutex_);
    out_.write(frame.data(), static_cast<std::streamsize>(frame.size()));
    out_.flush();
    if (!out_) {
        LogError("framing", "failed to write frame to output");
        return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// Free functions
// ---------------------------------------------------------------------------

std::string SerializeMessage(const nlohmann::json& message) {
    return message.dump(-1, ' ', false,
                        nlohmann::json::error_handler_t::replace);
}

std::string EncodeFrame(const nlohmann::json& message) {
    auto body = SerializeMessage(message);
    return "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" +
           body;
}

bool ParseMalformedFramePolicy(const std::string& text,
                               MalformedFramePolicy& out) {
    const auto lowered = ToLower(Trim(text));
    if (lowered == "skip") {
        out = MalformedFramePolicy::Skip;
        return true;
    }
    if (lowered == "stop") {
        out = MalformedFramePolicy::Stop;
        return true;
    }
    return false;
}

const char* MalformedFramePolicyName(MalformedFramePolicy policy) {
    switch (policy) {
        case MalformedFramePolicy::Skip: return "skip";
        case MalformedFramePolicy::Stop: return "stop";
    }
    return "skip";
}

} // namespace kmsg_mcp
