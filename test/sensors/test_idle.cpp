#include <catch2/catch_test_macros.hpp>

#include <envsense/sensors/idle.hpp>
#include <envsense/core/text_format.hpp>
#include "../../test/mocks/mock_command_runner.hpp"

#include <chrono>

using namespace envsense;
using namespace envsense::testing;
using namespace std::chrono_literals;

namespace {

constexpr int64_t kNowUs = 1714568820LL * 1000000;

LinuxIdleSource MakeSource(MockCommandRunner& runner) {
    return LinuxIdleSource(runner, 2000ms, "c2", [] { return kNowUs; });
}

} // anonymous namespace

// ===========================================================================
// Parsers
// ===========================================================================

TEST_CASE("ParseXprintidleOutput: milliseconds to whole seconds", "[sensors][idle]") {
    CHECK(ParseXprintidleOutput("847000\n") == 847u);
    CHECK(ParseXprintidleOutput("999") == 0u);
    CHECK(ParseXprintidleOutput("  1500 ") == 1u);
    CHECK_FALSE(ParseXprintidleOutput("").has_value());
    CHECK_FALSE(ParseXprintidleOutput("-5").has_value());
    CHECK_FALSE(ParseXprintidleOutput("couldn't open display").has_value());
}

TEST_CASE("ParseLogindIdle: idle session", "[sensors][idle]") {
    const auto since = kNowUs - 90LL * 1000000;
    auto seconds = ParseLogindIdle(
        "IdleHint=yes\nIdleSinceHint=" + std::to_string(since) + "\n", kNowUs);
    REQUIRE(seconds.has_value());
    CHECK(*seconds == 90u);
}

TEST_CASE("ParseLogindIdle: active session reports zero", "[sensors][idle]") {
    auto seconds = ParseLogindIdle("IdleHint=no\nIdleSinceHint=0\n", kNowUs);
    REQUIRE(seconds.has_value());
    CHECK(*seconds == 0u);
}

TEST_CASE("ParseLogindIdle: unusable output", "[sensors][idle]") {
    CHECK_FALSE(ParseLogindIdle("", kNowUs).has_value());
    CHECK_FALSE(ParseLogindIdle("IdleHint=yes\n", kNowUs).has_value());
    // A timestamp in the future is rejected.
    CHECK_FALSE(ParseLogindIdle(
        "IdleHint=yes\nIdleSinceHint=" + std::to_string(kNowUs + 1) + "\n", kNowUs)
                    .has_value());
}

// ===========================================================================
// LinuxIdleSource
// ===========================================================================

TEST_CASE("LinuxIdleSource: xprintidle answer is used directly", "[sensors][idle]") {
    MockCommandRunner runner;
    runner.EnqueueOutput(0, "847000\n");
    auto source = MakeSource(runner);

    auto result = source.ReadIdle();
    REQUIRE(result.IsOk());
    CHECK(result.Value().idle_seconds == 847u);
    CHECK(result.Value().source == "xprintidle");
    CHECK(FormatDuration(result.Value().idle_seconds) == "14m 7s");

    REQUIRE(runner.CallCount() == 1);
    CHECK(runner.Calls()[0].argv == std::vector<std::string>{"xprintidle"});
    CHECK(runner.Calls()[0].timeout == 2000ms);
}

TEST_CASE("LinuxIdleSource: falls back to logind", "[sensors][idle]") {
    MockCommandRunner runner;
    runner.EnqueueMissing("xprintidle");
    runner.EnqueueOutput(0, "IdleHint=yes\nIdleSinceHint=" +
                                std::to_string(kNowUs - 300LL * 1000000) + "\n");
    auto source = MakeSource(runner);

    auto result = source.ReadIdle();
    REQUIRE(result.IsOk());
    CHECK(result.Value().idle_seconds == 300u);
    CHECK(result.Value().source == "logind");

    REQUIRE(runner.CallCount() == 2);
    const auto& argv = runner.Calls()[1].argv;
    REQUIRE(argv.size() >= 3);
    CHECK(argv[0] == "loginctl");
    CHECK(argv[1] == "show-session");
    CHECK(argv[2] == "c2");
}

TEST_CASE("LinuxIdleSource: xprintidle failing without a display falls back", "[sensors][idle]") {
    MockCommandRunner runner;
    runner.EnqueueOutput(1, "", "couldn't open display\n");
    runner.EnqueueOutput(0, "IdleHint=no\nIdleSinceHint=0\n");
    auto source = MakeSource(runner);

    auto result = source.ReadIdle();
    REQUIRE(result.IsOk());
    CHECK(result.Value().idle_seconds == 0u);
    CHECK(result.Value().source == "logind");
}

TEST_CASE("LinuxIdleSource: no source available", "[sensors][idle]") {
    MockCommandRunner runner;
    runner.EnqueueMissing("xprintidle");
    runner.EnqueueMissing("loginctl");
    auto source = MakeSource(runner);

    auto result = source.ReadIdle();
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::PlatformUnsupported);
    CHECK(result.Error().IsProviderError());
}

TEST_CASE("LinuxIdleSource: logind timeout is reported as such", "[sensors][idle]") {
    MockCommandRunner runner;
    runner.EnqueueMissing("xprintidle");
    runner.EnqueueTimeout("loginctl");
    auto source = MakeSource(runner);

    auto result = source.ReadIdle();
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Timeout);
}

TEST_CASE("LinuxIdleSource: unknown session", "[sensors][idle]") {
    MockCommandRunner runner;
    runner.EnqueueMissing("xprintidle");
    runner.EnqueueOutput(1, "", "Failed to get session: No session 'c2' known\n");
    auto source = MakeSource(runner);

    auto result = source.ReadIdle();
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::PlatformUnsupported);
    REQUIRE(result.Error().detail.has_value());
    CHECK(result.Error().detail->find("No session") != std::string::npos);
}
