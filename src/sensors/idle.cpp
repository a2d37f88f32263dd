#include <envsense/sensors/idle.hpp>

#include <envsense/core/log.hpp>
#include <envsense/platform/file_reader.hpp>

#include <cstdlib>

namespace envsense {

namespace {

std::optional<int64_t> ParseInt64(const std::string& text) {
    try {
        size_t used = 0;
        auto value = std::stoll(text, &used, 10);
        if (used != text.size()) return std::nullopt;
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

int64_t RealtimeMicros() {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // anonymous namespace

std::optional<uint64_t> ParseXprintidleOutput(std::string_view out) {
    auto ms = ParseInt64(Trim(out));
    if (!ms || *ms < 0) return std::nullopt;
    return static_cast<uint64_t>(*ms / 1000);
}

std::optional<uint64_t> ParseLogindIdle(std::string_view out, int64_t now_us) {
    std::optional<bool> idle_hint;
    std::optional<int64_t> since_us;

    for (const auto& line : SplitLines(out)) {
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        auto key = Trim(std::string_view(line).substr(0, eq));
        auto value = Trim(std::string_view(line).substr(eq + 1));
        if (key == "IdleHint") {
            idle_hint = (value == "yes");
        } else if (key == "IdleSinceHint") {
            since_us = ParseInt64(value);
        }
    }

    if (!idle_hint.has_value()) return std::nullopt;
    if (!*idle_hint) return 0;
    if (!since_us || *since_us <= 0 || *since_us > now_us) return std::nullopt;
    return static_cast<uint64_t>((now_us - *since_us) / 1000000);
}

LinuxIdleSource::LinuxIdleSource(ICommandRunner& runner,
                                 std::chrono::milliseconds timeout,
                                 std::string session_id, Clock clock)
    : runner_(runner), timeout_(timeout), session_id_(std::move(session_id)),
      clock_(clock ? std::move(clock) : Clock(RealtimeMicros)) {
    if (session_id_.empty()) {
        const char* env = std::getenv("XDG_SESSION_ID");
        session_id_ = (env != nullptr && *env != '\0') ? env : "self";
    }
}

Result<IdleReading, Error> LinuxIdleSource::ReadIdle() {
    auto x11 = runner_.Run({"xprintidle"}, timeout_);
    if (x11.IsOk() && x11.Value().Succeeded()) {
        if (auto seconds = ParseXprintidleOutput(x11.Value().out)) {
            return Result<IdleReading, Error>::Ok(IdleReading{*seconds, "xprintidle"});
        }
        LogWarn("idle", "Unparseable xprintidle output: " + Trim(x11.Value().out));
    } else if (x11.IsErr()) {
        LogDebug("idle", "xprintidle unavailable: " + x11.Error().message);
    }

    auto logind = runner_.Run({"loginctl", "show-session", session_id_,
                               "-p", "IdleHint", "-p", "IdleSinceHint"},
                              timeout_);
    if (logind.IsErr()) {
        if (logind.Error().category == ErrorCategory::Timeout) {
            return Result<IdleReading, Error>::Err(std::move(logind).Error());
        }
        return Result<IdleReading, Error>::Err(Error{
            "Idle",
            "No idle-time source available (install xprintidle or run under "
            "systemd-logind)",
            ErrorCategory::PlatformUnsupported, logind.Error().message});
    }
    if (!logind.Value().Succeeded()) {
        return Result<IdleReading, Error>::Err(Error{
            "Idle", "logind did not report session " + session_id_,
            ErrorCategory::PlatformUnsupported, Trim(logind.Value().err)});
    }

    auto seconds = ParseLogindIdle(logind.Value().out, clock_());
    if (!seconds) {
        return Result<IdleReading, Error>::Err(Error::Make(
            "Idle", "logind returned no usable idle hint", ErrorCategory::Io));
    }
    return Result<IdleReading, Error>::Ok(IdleReading{*seconds, "logind"});
}

} // namespace envsense
