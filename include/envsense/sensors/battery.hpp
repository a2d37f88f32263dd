#pragma once

#include <envsense/core/result.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace envsense {

enum class BatteryState {
    Charging,
    Discharging,
    Full,
    Empty,
    NotCharging,
    Unknown,
};

// "charging", "discharging", "full", "empty", "not_charging", "unknown".
[[nodiscard]] const char* BatteryStateName(BatteryState state) noexcept;

// Kernel power_supply status text ("Charging", "Not charging", ...).
[[nodiscard]] BatteryState ParseBatteryState(std::string_view status);

struct BatteryStatus {
    std::string name;  // "BAT0"
    double percent = 0.0;
    BatteryState state = BatteryState::Unknown;
    std::optional<double> energy_wh;
    std::optional<double> energy_full_wh;
    std::optional<double> energy_full_design_wh;
    std::optional<double> time_to_full_minutes;
    std::optional<double> time_to_empty_minutes;
    std::optional<double> temperature_celsius;

    // energy_full / energy_full_design, in percent.
    [[nodiscard]] std::optional<double> HealthPercent() const;
};

class IBatterySource {
public:
    virtual ~IBatterySource() = default;

    // Returns DeviceUnavailable when the machine has no battery.
    [[nodiscard]] virtual Result<std::vector<BatteryStatus>, Error> ReadBatteries() = 0;
};

// ---------------------------------------------------------------------------
// SysfsBatterySource: <sysfs>/class/power_supply/* with type == Battery.
// ---------------------------------------------------------------------------
class SysfsBatterySource : public IBatterySource {
public:
    explicit SysfsBatterySource(std::filesystem::path sysfs_root);

    [[nodiscard]] Result<std::vector<BatteryStatus>, Error> ReadBatteries() override;

    // Build a status from one power_supply directory. Exposed for tests.
    [[nodiscard]] static BatteryStatus ReadOne(const std::filesystem::path& dir);

private:
    std::filesystem::path supply_dir_;
};

} // namespace envsense
