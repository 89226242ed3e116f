#include <catch2/catch_test_macros.hpp>

#include <kmsg_mcp/mcp/framing.hpp>

#include <sstream>
#include <string>

using namespace kmsg_mcp;

namespace {

std::string Framed(const std::string& body, const std::string& eol = "\r\n") {
    return "Content-Length: " + std::to_string(body.size()) + eol + eol + body;
}

} // anonymous namespace

// ===========================================================================
// FrameReader
// ===========================================================================

TEST_CASE("FrameReader: reads consecutive frames", "[mcp][framing]") {
    std::istringstream in(Framed(R"({"id":1,"method":"ping"})") +
                          Framed(R"({"id":2,"method":"tools/list"})"));
    FrameReader reader(in);

    auto first = reader.Read();
    REQUIRE(first.status == FrameStatus::Message);
    CHECK(first.message["id"] == 1);

    auto second = reader.Read();
    REQUIRE(second.status == FrameStatus::Message);
    CHECK(second.message["method"] == "tools/list");

    CHECK(reader.Read().status == FrameStatus::EndOfStream);
}

TEST_CASE("FrameReader: header name is case-insensitive and LF-only lines work", "[mcp][framing]") {
    const std::string body = R"({"method":"ping"})";
    std::istringstream in("content-LENGTH:   " + std::to_string(body.size()) +
                          "\nX-Trace: abc\n\n" + body);
    FrameReader reader(in);

    auto frame = reader.Read();
    REQUIRE(frame.status == FrameStatus::Message);
    CHECK(frame.message["method"] == "ping");
}

TEST_CASE("FrameReader: UTF-8 body length is counted in bytes", "[mcp][framing]") {
    const std::string body = R"({"chat":"엄마"})";
    std::istringstream in(Framed(body));
    FrameReader reader(in);

    auto frame = reader.Read();
    REQUIRE(frame.status == FrameStatus::Message);
    CHECK(frame.message["chat"] == "엄마");
}

TEST_CASE("FrameReader: zero length is malformed", "[mcp][framing]") {
    std::istringstream in("Content-Length: 0\r\n\r\n" + Framed(R"({"method":"ping"})"));
    FrameReader reader(in);

    CHECK(reader.Read().status == FrameStatus::Malformed);
    // The stream is still positioned at the next frame.
    CHECK(reader.Read().status == FrameStatus::Message);
}

TEST_CASE("FrameReader: missing Content-Length is malformed", "[mcp][framing]") {
    std::istringstream in("X-Other: 1\r\n\r\n");
    FrameReader reader(in);

    auto frame = reader.Read();
    CHECK(frame.status == FrameStatus::Malformed);
    CHECK_FALSE(frame.detail.empty());
}

TEST_CASE("FrameReader: non-numeric Content-Length is malformed", "[mcp][framing]") {
    std::istringstream in("Content-Length: ten\r\n\r\n");
    FrameReader reader(in);

    CHECK(reader.Read().status == FrameStatus::Malformed);
}

TEST_CASE("FrameReader: invalid JSON body is malformed", "[mcp][framing]") {
    std::istringstream in(Framed("{not json}") + Framed(R"({"method":"ping"})"));
    FrameReader reader(in);

    auto bad = reader.Read();
    CHECK(bad.status == FrameStatus::Malformed);
    CHECK(bad.body == "{not json}");
    CHECK(reader.Read().status == FrameStatus::Message);
}

TEST_CASE("FrameReader: truncated body is end of stream", "[mcp][framing]") {
    std::istringstream in("Content-Length: 100\r\n\r\n{\"method\":");
    FrameReader reader(in);

    CHECK(reader.Read().status == FrameStatus::EndOfStream);
}

TEST_CASE("FrameReader: end of stream inside headers", "[mcp][framing]") {
    std::istringstream in("Content-Length: 10\r\n");
    FrameReader reader(in);

    CHECK(reader.Read().status == FrameStatus::EndOfStream);
}

// ===========================================================================
// FrameWriter / EncodeFrame
// ===========================================================================

TEST_CASE("EncodeFrame: header counts body bytes", "[mcp][framing]") {
    nlohmann::json message = {{"text", "안녕"}};
    auto frame = EncodeFrame(message);

    const auto body = SerializeMessage(message);
    CHECK(body == R"({"text":"안녕"})");
    CHECK(frame == "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body);
}

TEST_CASE("FrameWriter: output reads back through FrameReader", "[mcp][framing]") {
    std::ostringstream out;
    FrameWriter writer(out);

    nlohmann::json first = {{"jsonrpc", "2.0"}, {"id", 1}, {"result", nlohmann::json::object()}};
    nlohmann::json second = {{"jsonrpc", "2.0"}, {"id", 2}, {"result", {{"tools", nlohmann::json::array()}}}};
    CHECK(writer.Write(first));
    CHECK(writer.Write(second));

    std::istringstream in(out.str());
    FrameReader reader(in);
    auto a = reader.Read();
    auto b = reader.Read();
    REQUIRE(a.status == FrameStatus::Message);
    REQUIRE(b.status == FrameStatus::Message);
    CHECK(a.message == first);
    CHECK(b.message == second);
    CHECK(a.body == SerializeMessage(first));
    CHECK(b.body == SerializeMessage(second));
}

TEST_CASE("SerializeMessage: invalid UTF-8 is replaced, not thrown", "[mcp][framing]") {
    nlohmann::json message = {{"raw_stderr", std::string("bad \xff byte")}};
    auto text = SerializeMessage(message);
    CHECK(text.find("bad ") != std::string::npos);
    CHECK(text.find("\xEF\xBF\xBD") != std::string::npos);
}

// ===========================================================================
// MalformedFramePolicy
// ===========================================================================

TEST_CASE("ParseMalformedFramePolicy: skip and stop", "[mcp][framing]") {
    MalformedFramePolicy policy = MalformedFramePolicy::Skip;
    CHECK(ParseMalformedFramePolicy("STOP", policy));
    CHECK(policy == MalformedFramePolicy::Stop);
    CHECK(ParseMalformedFramePolicy("skip", policy));
    CHECK(policy == MalformedFramePolicy::Skip);
    CHECK_FALSE(ParseMalformedFramePolicy("ignore", policy));
    CHECK(std::string(MalformedFramePolicyName(MalformedFramePolicy::Stop)) == "stop");
}
