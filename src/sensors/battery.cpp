#include <envsense/sensors/battery.hpp>

#include <envsense/core/log.hpp>
#include <envsense/platform/file_reader.hpp>

#include <algorithm>
#include <cmath>

namespace envsense {

namespace {

const std::string kNoBatteryMessage =
    "No battery present (this is normal for desktop computers without a UPS)";

std::optional<double> Micro(const std::filesystem::path& path) {
    auto raw = ReadIntAttribute(path);
    if (!raw) return std::nullopt;
    return static_cast<double>(*raw) / 1e6;
}

double RoundTo(double value, double step) {
    return std::round(value / step) * step;
}

} // anonymous namespace

const char* BatteryStateName(BatteryState state) noexcept {
    switch (state) {
        case BatteryState::Charging:    return "charging";
        case BatteryState::Discharging: return "discharging";
        case BatteryState::Full:        return "full";
        case BatteryState::Empty:       return "empty";
        case BatteryState::NotCharging: return "not_charging";
        case BatteryState::Unknown:     return "unknown";
    }
    return "unknown";
}

BatteryState ParseBatteryState(std::string_view status) {
    if (status == "Charging") return BatteryState::Charging;
    if (status == "Discharging") return BatteryState::Discharging;
    if (status == "Full") return BatteryState::Full;
    if (status == "Empty") return BatteryState::Empty;
    if (status == "Not charging") return BatteryState::NotCharging;
    return BatteryState::Unknown;
}

std::optional<double> BatteryStatus::HealthPercent() const {
    if (!energy_full_wh || !energy_full_design_wh || *energy_full_design_wh <= 0.0) {
        return std::nullopt;
    }
    return RoundTo(*energy_full_wh / *energy_full_design_wh * 100.0, 0.1);
}

SysfsBatterySource::SysfsBatterySource(std::filesystem::path sysfs_root)
    : supply_dir_(std::move(sysfs_root) / "class" / "power_supply") {}

BatteryStatus SysfsBatterySource::ReadOne(const std::filesystem::path& dir) {
    BatteryStatus status;
    status.name = dir.filename().string();
    status.state = ParseBatteryState(ReadAttribute(dir / "status").value_or(""));

    // Energy in Wh. Gauges that report charge (uAh) are converted with the
    // design voltage.
    std::optional<double> power_w;
    if (auto now = Micro(dir / "energy_now")) {
        status.energy_wh = now;
        status.energy_full_wh = Micro(dir / "energy_full");
        status.energy_full_design_wh = Micro(dir / "energy_full_design");
        power_w = Micro(dir / "power_now");
    } else if (auto charge = Micro(dir / "charge_now")) {
        auto volts = Micro(dir / "voltage_min_design");
        if (!volts) volts = Micro(dir / "voltage_now");
        if (volts) {
            status.energy_wh = *charge * *volts;
            if (auto full = Micro(dir / "charge_full")) status.energy_full_wh = *full * *volts;
            if (auto design = Micro(dir / "charge_full_design")) {
                status.energy_full_design_wh = *design * *volts;
            }
            auto current = Micro(dir / "current_now");
            auto voltage_now = Micro(dir / "voltage_now");
            if (current && voltage_now) power_w = *current * *voltage_now;
        }
    }

    if (auto capacity = ReadIntAttribute(dir / "capacity")) {
        status.percent = static_cast<double>(*capacity);
    } else if (status.energy_wh && status.energy_full_wh && *status.energy_full_wh > 0.0) {
        status.percent = RoundTo(*status.energy_wh / *status.energy_full_wh * 100.0, 0.1);
    }
    status.percent = std::clamp(status.percent, 0.0, 100.0);

    if (power_w && *power_w > 0.0 && status.energy_wh) {
        const double power = std::fabs(*power_w);
        if (status.state == BatteryState::Discharging) {
            status.time_to_empty_minutes = RoundTo(*status.energy_wh / power * 60.0, 1.0);
        } else if (status.state == BatteryState::Charging && status.energy_full_wh) {
            const double missing = std::max(0.0, *status.energy_full_wh - *status.energy_wh);
            status.time_to_full_minutes = RoundTo(missing / power * 60.0, 1.0);
        }
    }

    if (auto temp = ReadIntAttribute(dir / "temp")) {
        status.temperature_celsius = static_cast<double>(*temp) / 10.0;
    }
    return status;
}

Result<std::vector<BatteryStatus>, Error> SysfsBatterySource::ReadBatteries() {
    std::error_code ec;
    if (!std::filesystem::is_directory(supply_dir_, ec)) {
        return Result<std::vector<BatteryStatus>, Error>::Err(Error{
            "Battery", kNoBatteryMessage, ErrorCategory::DeviceUnavailable,
            supply_dir_.string()});
    }

    auto entries = ListDirectory(supply_dir_, "Battery");
    if (entries.IsErr()) {
        return Result<std::vector<BatteryStatus>, Error>::Err(entries.Error());
    }

    std::vector<BatteryStatus> batteries;
    for (const auto& dir : entries.Value()) {
        if (ReadAttribute(dir / "type").value_or("") != "Battery") continue;
        // Peripheral batteries (mice, keyboards) report scope=Device.
        if (ReadAttribute(dir / "scope").value_or("") == "Device") continue;
        batteries.push_back(ReadOne(dir));
    }

    if (batteries.empty()) {
        LogDebug("battery", "no battery under " + supply_dir_.string());
        return Result<std::vector<BatteryStatus>, Error>::Err(Error::Make(
            "Battery", kNoBatteryMessage, ErrorCategory::DeviceUnavailable));
    }
    return Result<std::vector<BatteryStatus>, Error>::Ok(std::move(batteries));
}

} // namespace envsense
