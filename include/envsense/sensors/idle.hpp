#pragma once

#include <envsense/core/result.hpp>
#include <envsense/platform/command_runner.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace envsense {

struct IdleReading {
    uint64_t idle_seconds = 0;
    std::string source;  // "xprintidle" or "logind"
};

class IIdleSource {
public:
    virtual ~IIdleSource() = default;
    [[nodiscard]] virtual Result<IdleReading, Error> ReadIdle() = 0;
};

// Milliseconds printed by xprintidle -> whole seconds.
[[nodiscard]] std::optional<uint64_t> ParseXprintidleOutput(std::string_view out);

// `loginctl show-session -p IdleHint -p IdleSinceHint` output. `now_us` is
// CLOCK_REALTIME in microseconds. A session that is not idle reports 0.
[[nodiscard]] std::optional<uint64_t> ParseLogindIdle(std::string_view out,
                                                      int64_t now_us);

// ---------------------------------------------------------------------------
// LinuxIdleSource: asks the X server (xprintidle) first, then logind.
// ---------------------------------------------------------------------------
class LinuxIdleSource : public IIdleSource {
public:
    using Clock = std::function<int64_t()>;  // realtime microseconds

    LinuxIdleSource(ICommandRunner& runner, std::chrono::milliseconds timeout,
                    std::string session_id = "", Clock clock = {});

    [[nodiscard]] Result<IdleReading, Error> ReadIdle() override;

private:
    ICommandRunner& runner_;
    std::chrono::milliseconds timeout_;
    std::string session_id_;
    Clock clock_;
};

} // namespace envsense
