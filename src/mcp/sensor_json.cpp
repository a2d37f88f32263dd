#include <envsense/mcp/sensor_json.hpp>

#include <envsense/core/text_format.hpp>

#include <cmath>

namespace envsense {

namespace {

using json = nlohmann::json;

template <typename T>
json OrNull(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

double Round1(double value) {
    return std::round(value * 10.0) / 10.0;
}

json AreaToJson(const WeatherReport& report) {
    if (!report.area) return nullptr;
    return {{"name", report.area->name},
            {"region", report.area->region},
            {"country", report.area->country}};
}

} // anonymous namespace

json ToJson(const IdleReading& reading) {
    return {{"idle_seconds", reading.idle_seconds},
            {"formatted", FormatDuration(reading.idle_seconds)},
            {"source", reading.source}};
}

json ToJson(const DisplayInfo& display, size_t index) {
    const double diagonal = display.DiagonalInches();
    return {{"index", index},
            {"name", display.name},
            {"connector", display.connector},
            {"primary", display.primary},
            {"width", display.width},
            {"height", display.height},
            {"width_mm", display.width_mm},
            {"height_mm", display.height_mm},
            {"diagonal_inches", diagonal > 0.0 ? json(Round1(diagonal)) : json(nullptr)},
            {"refresh_hz", OrNull(display.refresh_hz)},
            {"manufacturer", display.manufacturer.empty() ? json(nullptr)
                                                          : json(display.manufacturer)}};
}

json ToJson(const NetworkInterface& iface) {
    json addresses = json::array();
    for (const auto& addr : iface.addresses) {
        addresses.push_back({{"family", addr.family},
                             {"address", addr.address},
                             {"netmask", OrNull(addr.netmask)}});
    }
    return {{"name", iface.name},
            {"mac", OrNull(iface.mac)},
            {"loopback", iface.loopback},
            {"up", iface.up},
            {"addresses", addresses}};
}

json ToJson(const UsbDevice& device) {
    auto or_null = [](const std::string& s) { return s.empty() ? json(nullptr) : json(s); };
    return {{"bus", device.bus},
            {"device", device.device},
            {"vendor_id", HexId(device.vendor_id, 4)},
            {"product_id", HexId(device.product_id, 4)},
            {"manufacturer", or_null(device.manufacturer)},
            {"product", or_null(device.product)},
            {"serial", or_null(device.serial)}};
}

json ToJson(const BatteryStatus& battery) {
    return {{"name", battery.name},
            {"percent", Round1(battery.percent)},
            {"state", BatteryStateName(battery.state)},
            {"energy_wh", OrNull(battery.energy_wh)},
            {"energy_full_wh", OrNull(battery.energy_full_wh)},
            {"health_percent", OrNull(battery.HealthPercent())},
            {"time_to_full_minutes", OrNull(battery.time_to_full_minutes)},
            {"time_to_empty_minutes", OrNull(battery.time_to_empty_minutes)},
            {"temperature_celsius", OrNull(battery.temperature_celsius)}};
}

json ToJson(const BleScanResult& scan) {
    json devices = json::array();
    for (const auto& device : scan.devices) {
        devices.push_back({{"address", device.address},
                           {"name", device.name.empty() ? json(nullptr) : json(device.name)},
                           {"rssi", OrNull(device.rssi)}});
    }
    return {{"adapter", scan.adapter},
            {"duration_ms", scan.duration_ms},
            {"devices", devices},
            {"count", scan.devices.size()}};
}

json ToJson(const GitCommit& commit) {
    return {{"id", commit.id},
            {"short_id", commit.ShortId()},
            {"author", commit.author},
            {"timestamp", commit.timestamp},
            {"summary", commit.summary}};
}

json ToJson(const GitStatus& status) {
    return {{"repository", status.repository},
            {"branch", OrNull(status.branch)},
            {"head_commit", status.head ? ToJson(*status.head) : json(nullptr)},
            {"staged", status.staged},
            {"modified", status.modified},
            {"untracked", status.untracked},
            {"clean", status.IsClean()}};
}

json ToJson(const GitLog& log) {
    json commits = json::array();
    for (const auto& commit : log.commits) commits.push_back(ToJson(commit));
    return {{"repository", log.repository}, {"commits", commits}};
}

json ToJson(const SystemOverview& overview) {
    return {{"cpu", {{"model", overview.cpu.model},
                     {"cores", overview.cpu.cores},
                     {"usage_percent", overview.cpu.usage_percent}}},
            {"memory", {{"total_bytes", overview.memory.total},
                        {"used_bytes", overview.memory.used},
                        {"swap_total_bytes", overview.memory.swap_total},
                        {"swap_used_bytes", overview.memory.swap_used}}},
            {"disk", {{"total_bytes", overview.disk_total},
                      {"free_bytes", overview.disk_free}}},
            {"uptime_seconds", overview.uptime_seconds},
            {"load_average", overview.load_average}};
}

json ToJson(const DiskInfo& disk) {
    return {{"device", disk.device},
            {"filesystem", disk.filesystem},
            {"mount_point", disk.mount_point},
            {"total_bytes", disk.total},
            {"used_bytes", disk.used},
            {"available_bytes", disk.available},
            {"used_percent", Round1(disk.UsedPercent())}};
}

json ToJson(const ProcessInfo& process) {
    return {{"pid", process.pid},
            {"name", process.name},
            {"cpu_percent", process.cpu_percent},
            {"memory_bytes", process.memory_bytes}};
}

json ToJson(const ProcessDetails& details) {
    return {{"pid", details.process.pid},
            {"name", details.process.name},
            {"state", details.state},
            {"cpu_percent", details.process.cpu_percent},
            {"memory_bytes", details.process.memory_bytes},
            {"virtual_memory_bytes", details.virtual_memory_bytes},
            {"parent_pid", OrNull(details.parent_pid)},
            {"run_time_seconds", details.run_time_seconds},
            {"executable", OrNull(details.executable)},
            {"working_directory", OrNull(details.working_directory)},
            {"command", details.command}};
}

json ToJson(const ForecastDay& day) {
    json hours = json::array();
    for (const auto& hour : day.hours) {
        hours.push_back({{"hour", hour.hour},
                         {"temp_f", hour.temp_f},
                         {"temp_c", hour.temp_c},
                         {"conditions", hour.conditions},
                         {"chance_of_rain", hour.chance_of_rain}});
    }
    return {{"date", day.date},
            {"max_f", day.max_f},
            {"max_c", day.max_c},
            {"min_f", day.min_f},
            {"min_c", day.min_c},
            {"hours", hours}};
}

json CurrentWeatherToJson(const WeatherReport& report) {
    const auto& c = report.current;
    return {{"location", report.location},
            {"area", AreaToJson(report)},
            {"conditions", c.conditions},
            {"temperature_f", c.temperature_f},
            {"temperature_c", c.temperature_c},
            {"feels_like_f", c.feels_like_f},
            {"feels_like_c", c.feels_like_c},
            {"humidity_percent", c.humidity_percent},
            {"wind_mph", c.wind_mph},
            {"wind_kmph", c.wind_kmph},
            {"wind_direction", c.wind_direction},
            {"visibility_miles", c.visibility_miles},
            {"pressure_mb", c.pressure_mb},
            {"uv_index", c.uv_index},
            {"precipitation_mm", c.precipitation_mm}};
}

json ForecastToJson(const WeatherReport& report, size_t days) {
    json out_days = json::array();
    for (size_t i = 0; i < report.days.size() && i < days; ++i) {
        out_days.push_back(ToJson(report.days[i]));
    }
    return {{"location", report.location},
            {"area", AreaToJson(report)},
            {"days", out_days}};
}

} // namespace envsense
