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

#include <string>
#include <vector>

namespace envsense {

// Human-readable renderings returned as the text content of tool results.

[[nodiscard]] std::string RenderIdle(const IdleReading& reading);
[[nodiscard]] std::string RenderIdleCheck(uint64_t idle_seconds, uint64_t threshold_seconds);
[[nodiscard]] std::string RenderDisplays(const std::vector<DisplayInfo>& displays);
[[nodiscard]] std::string RenderInterfaces(const std::vector<NetworkInterface>& interfaces);
[[nodiscard]] std::string RenderUsbDevices(const std::vector<UsbDevice>& devices);
[[nodiscard]] std::string RenderBatteries(const std::vector<BatteryStatus>& batteries);
[[nodiscard]] std::string RenderBleScan(const BleScanResult& scan);
[[nodiscard]] std::string RenderGitStatus(const GitStatus& status);
[[nodiscard]] std::string RenderGitLog(const GitLog& log);
[[nodiscard]] std::string RenderSystemOverview(const SystemOverview& overview);
[[nodiscard]] std::string RenderDisks(const std::vector<DiskInfo>& disks);

// `rows` is already sorted and truncated to the requested count.
[[nodiscard]] std::string RenderTopProcesses(const std::vector<ProcessInfo>& rows,
                                             int count, const std::string& sort_by);
[[nodiscard]] std::string RenderProcessMatches(const std::string& query,
                                               const std::vector<ProcessInfo>& rows,
                                               size_t total);
[[nodiscard]] std::string RenderProcessList(const std::vector<ProcessInfo>& rows, size_t total);
[[nodiscard]] std::string RenderProcessDetails(const ProcessDetails& details);

[[nodiscard]] std::string RenderWeather(const WeatherReport& report);
[[nodiscard]] std::string RenderForecast(const WeatherReport& report, size_t days);

} // namespace envsense
