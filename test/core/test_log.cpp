#include <catch2/catch_test_macros.hpp>

#include <kmsg_mcp/core/log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace kmsg_mcp;

// ===========================================================================
// Helper: a sink that captures messages into a vector.
// ===========================================================================

struct CapturedMessage {
    LogLevel level;
    std::string component;
    std::string message;
};

class CaptureSink : public ILogSink {
public:
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override {
        messages.push_back(
            {level, std::string(component), std::string(message)});
    }

    std::vector<CapturedMessage> messages;
};

// ===========================================================================
// ConsoleSink
// ===========================================================================

TEST_CASE("ConsoleSink: plain format has level, component and message", "[log]") {
    std::ostringstream oss;
    ConsoleSink sink(false, oss);

    sink.Write(LogLevel::Info, "tools", "kmsg read chat=Alice");

    auto output = oss.str();
    CHECK(output.find("[INFO]") != std::string::npos);
    CHECK(output.find("[tools]") != std::string::npos);
    CHECK(output.find("kmsg read chat=Alice") != std::string::npos);
    CHECK(output.find("\033[") == std::string::npos);
    CHECK(output.back() == '\n');
}

TEST_CASE("ConsoleSink: color mode uses level colors", "[log]") {
    std::ostringstream warn_oss, error_oss;
    ConsoleSink warn_sink(true, warn_oss);
    ConsoleSink error_sink(true, error_oss);

    warn_sink.Write(LogLevel::Warn, "framing", "malformed frame");
    error_sink.Write(LogLevel::Error, "server", "internal error");

    CHECK(warn_oss.str().find("\033[33m") != std::string::npos);

    // Level tag and message text are both red.
    auto output = error_oss.str();
    auto first = output.find("\033[1;31m");
    REQUIRE(first != std::string::npos);
    CHECK(output.find("\033[1;31m", first + 1) != std::string::npos);
}

TEST_CASE("ConsoleSink: color mode has short timestamp", "[log]") {
    std::ostringstream oss;
    ConsoleSink sink(true, oss);

    sink.Write(LogLevel::Info, "x", "test");

    auto output = oss.str();
    CHECK(output.find('T') == std::string::npos);
    CHECK(output.find('Z') == std::string::npos);
}

// ===========================================================================
// JsonSink
// ===========================================================================

TEST_CASE("JsonSink: writes one parseable JSON object per line", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Debug, "process", "spawned");
    sink.Write(LogLevel::Warn, "framing", "line1\nline2 \"quoted\"");

    auto output = oss.str();
    CHECK(std::count(output.begin(), output.end(), '\n') == 2);

    std::istringstream lines(output);
    std::string line;
    std::vector<nlohmann::json> parsed;
    while (std::getline(lines, line)) {
        parsed.push_back(nlohmann::json::parse(line));
    }
    REQUIRE(parsed.size() == 2);
    CHECK(parsed[0]["level"] == "DEBUG");
    CHECK(parsed[0]["component"] == "process");
    CHECK(parsed[1]["message"] == "line1\nline2 \"quoted\"");
    CHECK(parsed[1]["ts"].is_string());
}

TEST_CASE("JsonSink: invalid UTF-8 in message does not throw", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Warn, "process", std::string("stderr: \xff\xfe"));

    auto parsed = nlohmann::json::parse(oss.str());
    CHECK(parsed["message"].get<std::string>().find("stderr: ") == 0);
}

// ===========================================================================
// Logger: level filtering
// ===========================================================================

TEST_CASE("Logger: respects min_level", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Warn);

    logger.Debug("c", "should be filtered");
    logger.Info("c", "should be filtered");
    logger.Warn("c", "should pass");
    logger.Error("c", "should pass");

    REQUIRE(sink_ptr->messages.size() == 2);
    CHECK(sink_ptr->messages[0].level == LogLevel::Warn);
    CHECK(sink_ptr->messages[1].level == LogLevel::Error);
}

TEST_CASE("Logger: SetLevel and Enabled", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Error);

    CHECK_FALSE(logger.Enabled(LogLevel::Info));
    logger.Info("c", "filtered");
    CHECK(sink_ptr->messages.empty());

    logger.SetLevel(LogLevel::Debug);
    CHECK(logger.Enabled(LogLevel::Debug));
    logger.Debug("tools", "now passes");
    REQUIRE(sink_ptr->messages.size() == 1);
    CHECK(sink_ptr->messages[0].component == "tools");
    CHECK(sink_ptr->messages[0].message == "now passes");
}

TEST_CASE("Logger: concurrent logging does not lose messages", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Debug);

    constexpr int kThreads = 4;
    constexpr int kMessagesPerThread = 50;

    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&logger, t]() {
            for (int i = 0; i < kMessagesPerThread; ++i) {
                logger.Info("thread-" + std::to_string(t),
                            "msg-" + std::to_string(i));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    CHECK(sink_ptr->messages.size() == kThreads * kMessagesPerThread);
}

// ===========================================================================
// Global logger
// ===========================================================================

TEST_CASE("GlobalLogger: free functions route to the installed sink", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    InitGlobalLogger(std::move(sink), LogLevel::Info);

    LogDebug("server", "hidden");
    LogInfo("server", "dispatching tools/list");
    LogWarn("framing", "malformed frame");
    LogError("server", "internal error");

    REQUIRE(sink_ptr->messages.size() == 3);
    CHECK(sink_ptr->messages[0].message == "dispatching tools/list");
    CHECK(sink_ptr->messages[2].level == LogLevel::Error);

    // Leave a quiet logger behind for the other tests.
    InitGlobalLogger(std::make_unique<CaptureSink>(), LogLevel::Error);
}
