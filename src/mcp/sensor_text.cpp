#include <envsense/mcp/sensor_text.hpp>

#include <envsense/core/text_format.hpp>

#include <algorithm>
#include <cmath>
#include <sstream>

namespace envsense {

namespace {

constexpr size_t kFileListLimit = 5;
constexpr size_t kCommandLimit = 200;

void AppendFileList(std::ostringstream& out, const char* label, char marker,
                    const std::vector<std::string>& files) {
    if (files.empty()) return;
    out << "  " << label << ": " << files.size() << " file(s)\n";
    for (size_t i = 0; i < files.size() && i < kFileListLimit; ++i) {
        out << "    " << marker << ' ' << files[i] << '\n';
    }
    if (files.size() > kFileListLimit) {
        out << "    ... and " << files.size() - kFileListLimit << " more\n";
    }
}

// PID CPU% Memory Name, then one row per process.
void AppendProcessTable(std::ostringstream& out, const std::vector<ProcessInfo>& rows,
                        size_t rule_width) {
    out << PadRight("PID", 8) << ' ' << PadRight("CPU%", 10) << ' '
        << PadRight("Memory", 10) << " Name\n";
    out << std::string(rule_width, '-') << '\n';
    for (const auto& p : rows) {
        out << PadRight(std::to_string(p.pid), 8) << ' '
            << PadRight(FormatFixed(p.cpu_percent, 1), 10) << ' '
            << PadRight(FormatBytes(p.memory_bytes), 10) << ' ' << p.name << '\n';
    }
}

std::string AreaLabel(const WeatherReport& report) {
    if (!report.area) return report.location;
    auto label = report.area->Display();
    return label.empty() ? report.location : label;
}

} // anonymous namespace

std::string RenderIdle(const IdleReading& reading) {
    std::ostringstream out;
    out << "User Idle Time:\n\n"
        << "  Raw: " << reading.idle_seconds << " seconds\n"
        << "  Formatted: " << FormatDuration(reading.idle_seconds) << '\n'
        << "  Source: " << reading.source << '\n';
    return out.str();
}

std::string RenderIdleCheck(uint64_t idle_seconds, uint64_t threshold_seconds) {
    std::ostringstream out;
    out << "Idle Check:\n\n"
        << "  Current idle: " << idle_seconds << " (" << FormatDuration(idle_seconds) << ")\n"
        << "  Threshold: " << threshold_seconds << " (" << FormatDuration(threshold_seconds)
        << ")\n"
        << "  Is idle: " << (idle_seconds >= threshold_seconds ? "YES" : "NO") << '\n';
    return out.str();
}

std::string RenderDisplays(const std::vector<DisplayInfo>& displays) {
    std::ostringstream out;
    out << "Display Information:\n\n";
    if (displays.empty()) {
        out << "No displays detected.\n";
        return out.str();
    }

    for (size_t i = 0; i < displays.size(); ++i) {
        const auto& d = displays[i];
        out << "Display " << i + 1 << ": " << d.name << (d.primary ? " (primary)" : "") << '\n';
        if (d.name != d.connector) out << "  Connector: " << d.connector << '\n';
        out << "  Resolution: " << d.width << 'x' << d.height << '\n';
        if (d.width_mm > 0 && d.height_mm > 0) {
            out << "  Physical: " << d.width_mm << "mm x " << d.height_mm << "mm (~"
                << FormatFixed(d.DiagonalInches(), 1) << "\")\n";
        }
        if (d.refresh_hz && *d.refresh_hz > 0.0) {
            out << "  Refresh: " << FormatFixed(*d.refresh_hz, 0) << "Hz\n";
        }
        out << '\n';
    }
    out << "Total displays: " << displays.size() << '\n';
    return out.str();
}

std::string RenderInterfaces(const std::vector<NetworkInterface>& interfaces) {
    std::ostringstream out;
    out << "Network Interfaces:\n\n";
    if (interfaces.empty()) {
        out << "No network interfaces found.\n";
        return out.str();
    }

    for (const auto& iface : interfaces) {
        out << iface.name;
        if (iface.loopback) out << " (loopback)";
        if (!iface.up) out << " (down)";
        out << '\n';
        if (iface.mac) out << "  MAC: " << *iface.mac << '\n';
        for (const auto& addr : iface.addresses) {
            if (addr.family == "ipv4") {
                out << "  IPv4: " << addr.address;
                if (addr.netmask) out << " / " << *addr.netmask;
                out << '\n';
            } else if (!IsLinkLocalV6(addr.address)) {
                out << "  IPv6: " << addr.address << '\n';
            }
        }
        out << '\n';
    }

    const auto with_addresses = std::count_if(
        interfaces.begin(), interfaces.end(),
        [](const NetworkInterface& i) { return !i.addresses.empty(); });
    out << "Total interfaces: " << interfaces.size() << " (" << with_addresses
        << " with addresses)\n";
    return out.str();
}

std::string RenderUsbDevices(const std::vector<UsbDevice>& devices) {
    std::ostringstream out;
    out << "USB Devices:\n\n";
    size_t count = 0;
    for (const auto& device : devices) {
        ++count;
        out << count << ". " << device.DisplayName() << '\n';
        if (!device.manufacturer.empty()) {
            out << "   Manufacturer: " << device.manufacturer << '\n';
        }
        out << "   Vendor ID: " << HexId(device.vendor_id, 4)
            << ", Product ID: " << HexId(device.product_id, 4) << '\n';
        if (!device.serial.empty()) out << "   Serial: " << device.serial << '\n';
        out << "   Bus: " << device.bus << ", Device: " << device.device << "\n\n";
    }
    if (count == 0) {
        out << "No USB devices found.\n";
    } else {
        out << "Total: " << count << " USB devices\n";
    }
    return out.str();
}

std::string RenderBatteries(const std::vector<BatteryStatus>& batteries) {
    std::ostringstream out;
    out << "Battery Status:\n\n";
    for (size_t i = 0; i < batteries.size(); ++i) {
        const auto& b = batteries[i];
        out << "Battery " << i + 1 << " (" << b.name << "):\n";
        out << "  Charge: " << FormatFixed(b.percent, 1) << "%\n";
        out << "  State: " << BatteryStateName(b.state) << '\n';
        if (b.energy_wh && b.energy_full_wh) {
            out << "  Energy: " << FormatFixed(*b.energy_wh, 1) << " / "
                << FormatFixed(*b.energy_full_wh, 1) << " Wh\n";
        }
        if (b.time_to_full_minutes) {
            out << "  Time to full: " << FormatFixed(*b.time_to_full_minutes, 0) << " minutes\n";
        }
        if (b.time_to_empty_minutes) {
            out << "  Time to empty: " << FormatFixed(*b.time_to_empty_minutes, 0)
                << " minutes\n";
        }
        if (auto health = b.HealthPercent()) {
            out << "  Health: " << FormatFixed(*health, 1) << "%\n";
        }
        if (b.temperature_celsius) {
            out << "  Temperature: " << FormatFixed(*b.temperature_celsius, 1) << "°C\n";
        }
        out << '\n';
    }
    out << "Total batteries: " << batteries.size() << '\n';
    return out.str();
}

std::string RenderBleScan(const BleScanResult& scan) {
    std::ostringstream out;
    out << "Bluetooth Devices:\n\n";
    out << "Adapter: " << scan.adapter << "\n\n";
    if (scan.devices.empty()) {
        out << "  No BLE devices found nearby.\n";
        return out.str();
    }
    size_t count = 0;
    for (const auto& device : scan.devices) {
        ++count;
        out << "  " << count << ". " << (device.name.empty() ? "Unknown" : device.name);
        if (device.rssi) out << " (" << *device.rssi << "dBm)";
        out << '\n';
        out << "     Address: " << device.address << '\n';
    }
    out << "\n  Total: " << count << " BLE devices\n";
    return out.str();
}

std::string RenderGitStatus(const GitStatus& status) {
    std::ostringstream out;
    out << "Git Repository Status:\n\n";
    out << "Repository: " << status.repository << '\n';

    if (!status.head) {
        out << "Branch: " << status.branch.value_or("(unknown)") << " (no commits yet)\n";
    } else {
        out << "Branch: " << status.branch.value_or("HEAD (detached)") << '\n';
        out << "\nLast Commit:\n";
        out << "  " << status.head->ShortId() << " - " << status.head->summary << '\n';
        out << "  Author: " << status.head->author << '\n';
        out << "  Date: " << FormatTimestampUtc(status.head->timestamp) << '\n';
    }

    out << "\nWorking Tree:\n";
    if (status.IsClean()) {
        out << "  Clean - nothing to commit\n";
    } else {
        AppendFileList(out, "Staged", '+', status.staged);
        AppendFileList(out, "Modified", 'M', status.modified);
        AppendFileList(out, "Untracked", '?', status.untracked);
    }
    return out.str();
}

std::string RenderGitLog(const GitLog& log) {
    std::ostringstream out;
    out << "Recent Commits (" << log.repository << "):\n\n";
    if (log.commits.empty()) {
        out << "No commits found.\n";
        return out.str();
    }
    for (const auto& commit : log.commits) {
        out << commit.ShortId() << ' ' << commit.author << " - " << commit.summary << '\n';
    }
    return out.str();
}

std::string RenderSystemOverview(const SystemOverview& o) {
    const double mem_percent =
        o.memory.total == 0 ? 0.0
                            : static_cast<double>(o.memory.used) * 100.0 /
                                  static_cast<double>(o.memory.total);
    std::ostringstream out;
    out << "System Information:\n\n"
        << "CPU: " << o.cpu.model << " (" << o.cpu.cores << " cores)\n"
        << "CPU Usage: " << FormatPercent(o.cpu.usage_percent) << "\n\n"
        << "Memory: " << FormatBytes(o.memory.used) << " / " << FormatBytes(o.memory.total)
        << " (" << FormatFixed(std::floor(mem_percent), 0) << "%)\n"
        << "Swap: " << FormatBytes(o.memory.swap_used) << " / "
        << FormatBytes(o.memory.swap_total) << "\n\n"
        << "Disk: " << FormatBytes(o.disk_free) << " / " << FormatBytes(o.disk_total)
        << " free\n\n"
        << "Uptime: " << o.uptime_seconds / 3600 << "h " << (o.uptime_seconds % 3600) / 60
        << "m\n"
        << "Load Average: " << FormatFixed(o.load_average[0], 2) << ' '
        << FormatFixed(o.load_average[1], 2) << ' ' << FormatFixed(o.load_average[2], 2)
        << " (1m 5m 15m)";
    return out.str();
}

std::string RenderDisks(const std::vector<DiskInfo>& disks) {
    std::ostringstream out;
    out << "Disk Usage:\n\n";
    if (disks.empty()) {
        out << "No mounted disks found.\n";
        return out.str();
    }
    for (const auto& disk : disks) {
        out << disk.device << " (" << disk.filesystem << ")\n"
            << "  " << FormatBytes(disk.used) << " / " << FormatBytes(disk.total) << " ("
            << FormatFixed(std::floor(disk.UsedPercent()), 0) << "% used)\n"
            << "  Mount: " << disk.mount_point << "\n\n";
    }
    return out.str();
}

std::string RenderTopProcesses(const std::vector<ProcessInfo>& rows, int count,
                               const std::string& sort_by) {
    std::ostringstream out;
    out << "Top " << count << " processes by " << sort_by << ":\n\n";
    AppendProcessTable(out, rows, 50);
    return out.str();
}

std::string RenderProcessMatches(const std::string& query, const std::vector<ProcessInfo>& rows,
                                 size_t total) {
    std::ostringstream out;
    out << "Processes matching '" << query << "':\n\n";
    if (total == 0) {
        out << "No matching processes found.\n";
        return out.str();
    }
    AppendProcessTable(out, rows, 50);
    if (total > rows.size()) {
        out << "\n... and " << total - rows.size() << " more matches\n";
    }
    out << "\nTotal matches: " << total << '\n';
    return out.str();
}

std::string RenderProcessList(const std::vector<ProcessInfo>& rows, size_t total) {
    std::ostringstream out;
    out << "All Running Processes:\n\n";
    AppendProcessTable(out, rows, 60);
    if (total > rows.size()) {
        out << "\n... and " << total - rows.size() << " more processes\n";
    }
    out << "\nTotal processes: " << total << '\n';
    return out.str();
}

std::string RenderProcessDetails(const ProcessDetails& d) {
    std::ostringstream out;
    out << "Process Details (PID " << d.process.pid << "):\n\n";
    out << "Name: " << d.process.name << '\n';
    out << "Status: " << d.state << '\n';
    out << "CPU Usage: " << FormatPercent(d.process.cpu_percent) << '\n';
    out << "Memory: " << FormatBytes(d.process.memory_bytes) << '\n';
    out << "Virtual Memory: " << FormatBytes(d.virtual_memory_bytes) << '\n';
    if (d.parent_pid) out << "Parent PID: " << *d.parent_pid << '\n';
    out << "Running for: " << FormatDuration(d.run_time_seconds) << '\n';
    if (d.executable) out << "Executable: " << *d.executable << '\n';
    if (d.working_directory) out << "Working Dir: " << *d.working_directory << '\n';
    if (!d.command.empty()) {
        if (d.command.size() > kCommandLimit) {
            out << "Command: " << d.command.substr(0, kCommandLimit) << "...\n";
        } else {
            out << "Command: " << d.command << '\n';
        }
    }
    return out.str();
}

std::string RenderWeather(const WeatherReport& report) {
    const auto& c = report.current;
    std::ostringstream out;
    out << "Weather for " << AreaLabel(report) << ":\n"
        << "Conditions: " << (c.conditions.empty() ? "Unknown" : c.conditions) << '\n'
        << "Temperature: " << c.temperature_f << "°F / " << c.temperature_c << "°C\n"
        << "Feels like: " << c.feels_like_f << "°F / " << c.feels_like_c << "°C\n"
        << "Humidity: " << c.humidity_percent << "%\n"
        << "Wind: " << c.wind_mph << " mph " << c.wind_direction << " (" << c.wind_kmph
        << " km/h)\n"
        << "Visibility: " << c.visibility_miles << " miles\n"
        << "Pressure: " << c.pressure_mb << " mb\n"
        << "UV Index: " << c.uv_index;
    return out.str();
}

std::string RenderForecast(const WeatherReport& report, size_t days) {
    const size_t shown = std::min(days, report.days.size());
    std::ostringstream out;
    out << "Forecast for " << AreaLabel(report) << " (" << shown << " days):\n\n";
    for (size_t i = 0; i < shown; ++i) {
        const auto& day = report.days[i];
        out << day.date << ":\n"
            << "  High: " << day.max_f << "°F / " << day.max_c << "°C | Low: "
            << day.min_f << "°F / " << day.min_c << "°C\n";
        for (const auto& hour : day.hours) {
            out << "  " << (hour.hour < 10 ? "0" : "") << hour.hour << ":00 - " << hour.temp_f
                << "°F, " << (hour.conditions.empty() ? "?" : hour.conditions) << ", "
                << hour.chance_of_rain << "% rain\n";
        }
        out << '\n';
    }
    return out.str();
}

} // namespace envsense
