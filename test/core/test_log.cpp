#include <catch2/catch_test_macros.hpp>

#include <envsense/core/log.hpp>

#include "../../test/mocks/temp_tree.hpp"

#include <algorithm>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace envsense;

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

TEST_CASE("ConsoleSink: writes without crashing", "[log]") {
    ConsoleSink sink;
    // Just verify it doesn't throw or crash.
    sink.Write(LogLevel::Info, "test", "hello from console sink");
    sink.Write(LogLevel::Error, "test", "error from console sink");
}

TEST_CASE("ConsoleSink: line format", "[log]") {
    std::ostringstream oss;
    ConsoleSink sink(oss);

    sink.Write(LogLevel::Warn, "battery", "no battery present");

    auto line = oss.str();
    CHECK(line.find("Z [WARN] [battery] no battery present\n") != std::string::npos);
    // ISO-8601 date prefix "YYYY-MM-DDT".
    REQUIRE(line.size() > 11);
    CHECK(line[4] == '-');
    CHECK(line[10] == 'T');
}

// ===========================================================================
// JsonSink
// ===========================================================================

TEST_CASE("JsonSink: writes valid JSON lines", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Info, "mcp", "started");

    auto line = oss.str();
    CHECK(line.find("\"level\":\"INFO\"") != std::string::npos);
    CHECK(line.find("\"component\":\"mcp\"") != std::string::npos);
    CHECK(line.find("\"message\":\"started\"") != std::string::npos);
    CHECK(line.find("\"ts\":\"") != std::string::npos);
    // Must end with newline
    REQUIRE(!line.empty());
    CHECK(line.back() == '\n');
}

TEST_CASE("JsonSink: each write produces one line", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Debug, "a", "first");
    sink.Write(LogLevel::Warn, "b", "second");

    auto output = oss.str();
    // Count newlines: should be exactly 2
    auto count = std::count(output.begin(), output.end(), '\n');
    CHECK(count == 2);
}

TEST_CASE("JsonSink: all log levels produce correct names", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Debug, "x", "d");
    sink.Write(LogLevel::Info, "x", "i");
    sink.Write(LogLevel::Warn, "x", "w");
    sink.Write(LogLevel::Error, "x", "e");

    auto output = oss.str();
    CHECK(output.find("\"level\":\"DEBUG\"") != std::string::npos);
    CHECK(output.find("\"level\":\"INFO\"") != std::string::npos);
    CHECK(output.find("\"level\":\"WARN\"") != std::string::npos);
    CHECK(output.find("\"level\":\"ERROR\"") != std::string::npos);
}

TEST_CASE("JsonSink: escapes special characters in message", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Info, "esc", "line1\nline2\ttab \"quoted\" back\\slash");

    auto output = oss.str();
    CHECK(output.find("\\n") != std::string::npos);
    CHECK(output.find("\\t") != std::string::npos);
    CHECK(output.find("\\\"quoted\\\"") != std::string::npos);
    CHECK(output.find("back\\\\slash") != std::string::npos);
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

TEST_CASE("Logger: Debug level passes all messages", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Debug);

    logger.Debug("c", "d");
    logger.Info("c", "i");
    logger.Warn("c", "w");
    logger.Error("c", "e");

    CHECK(sink_ptr->messages.size() == 4);
}

TEST_CASE("Logger: Error level only passes errors", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Error);

    logger.Debug("c", "d");
    logger.Info("c", "i");
    logger.Warn("c", "w");
    logger.Error("c", "e");

    REQUIRE(sink_ptr->messages.size() == 1);
    CHECK(sink_ptr->messages[0].level == LogLevel::Error);
}

TEST_CASE("Logger: SetLevel changes filtering dynamically", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Error);

    logger.Info("c", "filtered");
    CHECK(sink_ptr->messages.empty());

    logger.SetLevel(LogLevel::Info);
    logger.Info("c", "now passes");
    REQUIRE(sink_ptr->messages.size() == 1);
    CHECK(sink_ptr->messages[0].message == "now passes");
}

// ===========================================================================
// Logger: message content
// ===========================================================================

TEST_CASE("Logger: preserves component and message", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Debug);

    logger.Info("router", "get_idle_time ok");

    REQUIRE(sink_ptr->messages.size() == 1);
    CHECK(sink_ptr->messages[0].component == "router");
    CHECK(sink_ptr->messages[0].message == "get_idle_time ok");
    CHECK(sink_ptr->messages[0].level == LogLevel::Info);
}

// ===========================================================================
// Logger: thread safety
// ===========================================================================

TEST_CASE("Logger: concurrent logging does not crash", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Debug);

    constexpr int kThreads = 8;
    constexpr int kMessagesPerThread = 100;

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
// ParseLogLevel
// ===========================================================================

TEST_CASE("ParseLogLevel: known names", "[log]") {
    CHECK(ParseLogLevel("debug").Value() == LogLevel::Debug);
    CHECK(ParseLogLevel("INFO").Value() == LogLevel::Info);
    CHECK(ParseLogLevel("warn").Value() == LogLevel::Warn);
    CHECK(ParseLogLevel("Warning").Value() == LogLevel::Warn);
    CHECK(ParseLogLevel("error").Value() == LogLevel::Error);
}

TEST_CASE("ParseLogLevel: unknown name is a config error", "[log]") {
    auto r = ParseLogLevel("verbose");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Config);
    CHECK(r.Error().message.find("verbose") != std::string::npos);
}

TEST_CASE("LogLevelName: upper-case names", "[log]") {
    CHECK(std::string(LogLevelName(LogLevel::Debug)) == "DEBUG");
    CHECK(std::string(LogLevelName(LogLevel::Error)) == "ERROR");
}

// ===========================================================================
// FileSink
// ===========================================================================

TEST_CASE("FileSink: appends JSON lines", "[log]") {
    envsense::testing::TempTree tmp;
    const auto path = tmp.Path("envsense.log").string();

    {
        auto sink = FileSink::Open(path, true);
        REQUIRE(sink.IsOk());
        auto owned = std::move(sink).Value();
        owned->Write(LogLevel::Info, "main", "first");
        owned->Write(LogLevel::Error, "main", "second");
    }
    {
        auto sink = FileSink::Open(path, true);
        REQUIRE(sink.IsOk());
        std::move(sink).Value()->Write(LogLevel::Warn, "main", "third");
    }

    std::ifstream in(path);
    std::vector<std::string> lines;
    for (std::string line; std::getline(in, line);) lines.push_back(line);
    REQUIRE(lines.size() == 3);
    CHECK(lines[0].find("\"message\":\"first\"") != std::string::npos);
    CHECK(lines[2].find("\"level\":\"WARN\"") != std::string::npos);
}

TEST_CASE("FileSink: plain format", "[log]") {
    envsense::testing::TempTree tmp;
    const auto path = tmp.Path("plain.log").string();
    {
        auto sink = FileSink::Open(path, false);
        REQUIRE(sink.IsOk());
        std::move(sink).Value()->Write(LogLevel::Debug, "git", "status");
    }
    std::ifstream in(path);
    std::string line;
    std::getline(in, line);
    CHECK(line.find("[DEBUG] [git] status") != std::string::npos);
}

TEST_CASE("FileSink: unopenable path fails", "[log]") {
    envsense::testing::TempTree tmp;
    auto sink = FileSink::Open(tmp.Path("missing-dir/x.log").string(), true);
    REQUIRE(sink.IsErr());
    CHECK(sink.Error().category == ErrorCategory::Config);
}

// ===========================================================================
// Global logger
// ===========================================================================

TEST_CASE("Global logger: routes free functions to the installed sink", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    InitGlobalLogger(std::move(sink), LogLevel::Info);

    LogDebug("mcp", "filtered");
    LogInfo("mcp", "info");
    LogWarn("router", "warn");
    LogError("main", "error");

    REQUIRE(sink_ptr->messages.size() == 3);
    CHECK(sink_ptr->messages[0].component == "mcp");
    CHECK(sink_ptr->messages[1].level == LogLevel::Warn);
    CHECK(sink_ptr->messages[2].message == "error");
    CHECK(GlobalLogger().Enabled(LogLevel::Info));
    CHECK_FALSE(GlobalLogger().Enabled(LogLevel::Debug));

    // Leave a quiet logger behind for other tests.
    InitGlobalLogger(std::make_unique<CaptureSink>(), LogLevel::Error);
}
