#pragma once

#include <envsense/sensors/battery.hpp>
#include <envsense/sensors/bluetooth.hpp>
#include <envsense/sensors/display.hpp>
#include <envsense/sensors/git.hpp>
#include <envsense/sensors/idle.hpp>
#include <envsense/sensors/network.hpp>
#include <envsense/sensors/system.hpp>
#include <envsense/sensors/usb.hpp>
#include <envsense/sensors/weather.hpp>

#include <nlohmann/json.hpp>

namespace envsense {

// ---------------------------------------------------------------------------
// Structured payload converters. Optional fields are emitted as null so every
// object of a kind carries the same keys.
// ---------------------------------------------------------------------------

[[nodiscard]] nlohmann::json ToJson(const IdleReading& reading);
[[nodiscard]] nlohmann::json ToJson(const DisplayInfo& display, size_t index);
[[nodiscard]] nlohmann::json ToJson(const NetworkInterface& iface);
[[nodiscard]] nlohmann::json ToJson(const UsbDevice& device);
[[nodiscard]] nlohmann::json ToJson(const BatteryStatus& battery);
[[nodiscard]] nlohmann::json ToJson(const BleScanResult& scan);
[[nodiscard]] nlohmann::json ToJson(const GitCommit& commit);
[[nodiscard]] nlohmann::json ToJson(const GitStatus& status);
[[nodiscard]] nlohmann::json ToJson(const GitLog& log);
[[nodiscard]] nlohmann::json ToJson(const SystemOverview& overview);
[[nodiscard]] nlohmann::json ToJson(const DiskInfo& disk);
[[nodiscard]] nlohmann::json ToJson(const ProcessInfo& process);
[[nodiscard]] nlohmann::json ToJson(const ProcessDetails& details);
[[nodiscard]] nlohmann::json ToJson(const ForecastDay& day);

// Current conditions of `report` (get_weather payload).
[[nodiscard]] nlohmann::json CurrentWeatherToJson(const WeatherReport& report);

// First `days` days of `report` (get_forecast payload).
[[nodiscard]] nlohmann::json ForecastToJson(const WeatherReport& report, size_t days);

} // namespace envsense
