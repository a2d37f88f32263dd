#include <catch2/catch_test_macros.hpp>

#include <envsense/mcp/sensor_text.hpp>

#include <string>

using namespace envsense;

namespace {

bool Contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

constexpr uint64_t kGiB = 1024ULL * 1024 * 1024;

} // anonymous namespace

TEST_CASE("RenderIdle: raw, formatted and source", "[mcp][text]") {
    CHECK(RenderIdle(IdleReading{847, "xprintidle"}) ==
          "User Idle Time:\n\n"
          "  Raw: 847 seconds\n"
          "  Formatted: 14m 7s\n"
          "  Source: xprintidle\n");
}

TEST_CASE("RenderIdleCheck: threshold is inclusive", "[mcp][text]") {
    CHECK(Contains(RenderIdleCheck(847, 600), "Is idle: YES"));
    CHECK(Contains(RenderIdleCheck(600, 600), "Is idle: YES"));
    CHECK(Contains(RenderIdleCheck(30, 600), "Is idle: NO"));
    CHECK(Contains(RenderIdleCheck(30, 600), "Threshold: 600 (10m)"));
}

TEST_CASE("RenderDisplays: details and empty list", "[mcp][text]") {
    DisplayInfo d;
    d.name = "DELL U2720Q";
    d.connector = "HDMI-A-1";
    d.primary = true;
    d.width = 2560;
    d.height = 1440;
    d.width_mm = 527;
    d.height_mm = 296;
    d.refresh_hz = 59.95;

    auto text = RenderDisplays({d});
    CHECK(Contains(text, "Display 1: DELL U2720Q (primary)\n"));
    CHECK(Contains(text, "  Connector: HDMI-A-1\n"));
    CHECK(Contains(text, "  Resolution: 2560x1440\n"));
    CHECK(Contains(text, "  Physical: 527mm x 296mm (~23.8\")\n"));
    CHECK(Contains(text, "  Refresh: 60Hz\n"));
    CHECK(Contains(text, "Total displays: 1\n"));

    CHECK(RenderDisplays({}) == "Display Information:\n\nNo displays detected.\n");
}

TEST_CASE("RenderInterfaces: hides link-local IPv6 and marks down links", "[mcp][text]") {
    NetworkInterface lo{"lo", std::nullopt, true, true,
                        {{"ipv4", "127.0.0.1", std::string("255.0.0.0")}, {"ipv6", "::1", {}}}};
    NetworkInterface wlan{"wlan0", std::string("3c:22:fb:0a:1b:2c"), false, true,
                          {{"ipv4", "192.168.1.20", std::string("255.255.255.0")},
                           {"ipv6", "fe80::1c2d:3e4f", {}}}};
    NetworkInterface eth{"eth0", std::string("00:11:22:33:44:55"), false, false, {}};

    auto text = RenderInterfaces({lo, wlan, eth});
    CHECK(Contains(text, "lo (loopback)\n"));
    CHECK(Contains(text, "  IPv4: 127.0.0.1 / 255.0.0.0\n"));
    CHECK(Contains(text, "  IPv6: ::1\n"));
    CHECK(Contains(text, "  MAC: 3c:22:fb:0a:1b:2c\n"));
    CHECK_FALSE(Contains(text, "fe80::1c2d:3e4f"));
    CHECK(Contains(text, "eth0 (down)\n"));
    CHECK(Contains(text, "Total interfaces: 3 (2 with addresses)\n"));
}

TEST_CASE("RenderUsbDevices: numbered list", "[mcp][text]") {
    UsbDevice receiver;
    receiver.bus = 1;
    receiver.device = 4;
    receiver.vendor_id = 0x046d;
    receiver.product_id = 0xc52b;
    receiver.product = "USB Receiver";
    receiver.manufacturer = "Logitech";

    auto text = RenderUsbDevices({receiver});
    CHECK(Contains(text, "1. USB Receiver\n"));
    CHECK(Contains(text, "   Manufacturer: Logitech\n"));
    CHECK(Contains(text, "   Vendor ID: 046d, Product ID: c52b\n"));
    CHECK(Contains(text, "   Bus: 1, Device: 4\n"));
    CHECK(Contains(text, "Total: 1 USB devices\n"));

    CHECK(Contains(RenderUsbDevices({}), "No USB devices found.\n"));
}

TEST_CASE("RenderBatteries: optional lines only when known", "[mcp][text]") {
    BatteryStatus b;
    b.name = "BAT0";
    b.percent = 87.0;
    b.state = BatteryState::Discharging;
    b.energy_wh = 43.5;
    b.energy_full_wh = 50.0;
    b.energy_full_design_wh = 57.0;
    b.time_to_empty_minutes = 210.0;

    auto text = RenderBatteries({b});
    CHECK(Contains(text, "Battery Status:\n\nBattery 1 (BAT0):\n"));
    CHECK(Contains(text, "  Charge: 87.0%\n"));
    CHECK(Contains(text, "  State: discharging\n"));
    CHECK(Contains(text, "  Energy: 43.5 / 50.0 Wh\n"));
    CHECK(Contains(text, "  Time to empty: 210 minutes\n"));
    CHECK(Contains(text, "  Health: 87.7%\n"));
    CHECK_FALSE(Contains(text, "Time to full"));
    CHECK_FALSE(Contains(text, "Temperature"));
    CHECK(Contains(text, "Total batteries: 1\n"));
}

TEST_CASE("RenderBleScan: devices and empty scan", "[mcp][text]") {
    BleScanResult scan{"00:1A:7D:DA:71:13", 3000,
                       {{"C4:7C:8D:6A:12:34", "Flower care", -67},
                        {"5E:11:22:33:44:55", "", std::nullopt}}};
    auto text = RenderBleScan(scan);
    CHECK(Contains(text, "Adapter: 00:1A:7D:DA:71:13\n"));
    CHECK(Contains(text, "  1. Flower care (-67dBm)\n     Address: C4:7C:8D:6A:12:34\n"));
    CHECK(Contains(text, "  2. Unknown\n"));
    CHECK(Contains(text, "  Total: 2 BLE devices\n"));

    scan.devices.clear();
    CHECK(Contains(RenderBleScan(scan), "  No BLE devices found nearby.\n"));
}

TEST_CASE("RenderGitStatus: last commit and capped file lists", "[mcp][text]") {
    GitStatus status;
    status.repository = "/srv/repo";
    status.branch = "main";
    status.head = GitCommit{"3f2a9c1d8e7b", "Ada Lovelace", 1714568820, "Initial import"};
    status.modified = {"a", "b", "c", "d", "e", "f", "g"};

    auto text = RenderGitStatus(status);
    CHECK(Contains(text, "Repository: /srv/repo\nBranch: main\n"));
    CHECK(Contains(text, "  3f2a9c1 - Initial import\n"));
    CHECK(Contains(text, "  Author: Ada Lovelace\n"));
    CHECK(Contains(text, "  Date: 2024-05-01 13:07\n"));
    CHECK(Contains(text, "  Modified: 7 file(s)\n    M a\n"));
    CHECK(Contains(text, "    M e\n    ... and 2 more\n"));
    CHECK_FALSE(Contains(text, "    M f\n"));
}

TEST_CASE("RenderGitStatus: fresh clean repository", "[mcp][text]") {
    GitStatus status;
    status.repository = "/srv/fresh";
    status.branch = "main";

    auto text = RenderGitStatus(status);
    CHECK(Contains(text, "Branch: main (no commits yet)\n"));
    CHECK(Contains(text, "  Clean - nothing to commit\n"));
    CHECK_FALSE(Contains(text, "Last Commit"));
}

TEST_CASE("RenderGitLog: one line per commit", "[mcp][text]") {
    GitLog log{"/srv/repo",
               {{"3f2a9c1d8e7b", "Ada", 1714568820, "Second"},
                {"0123456789ab", "Grace", 1714500000, "First"}}};
    CHECK(RenderGitLog(log) ==
          "Recent Commits (/srv/repo):\n\n"
          "3f2a9c1 Ada - Second\n"
          "0123456 Grace - First\n");
    CHECK(RenderGitLog(GitLog{"/srv/fresh", {}}) ==
          "Recent Commits (/srv/fresh):\n\nNo commits found.\n");
}

TEST_CASE("RenderSystemOverview: summary lines", "[mcp][text]") {
    SystemOverview o;
    o.cpu = CpuInfo{"Intel(R) Core(TM) i7-8650U", 8, 12.34};
    o.memory.total = 16 * kGiB;
    o.memory.used = 8 * kGiB;
    o.memory.swap_total = 2 * kGiB;
    o.memory.swap_used = 0;
    o.disk_total = 512 * kGiB;
    o.disk_free = 256 * kGiB;
    o.uptime_seconds = 12345;
    o.load_average = {0.52, 0.58, 0.59};

    auto text = RenderSystemOverview(o);
    CHECK(Contains(text, "CPU: Intel(R) Core(TM) i7-8650U (8 cores)\n"));
    CHECK(Contains(text, "CPU Usage: 12.3%\n"));
    CHECK(Contains(text, "Memory: 8.0 GB / 16.0 GB (50%)\n"));
    CHECK(Contains(text, "Swap: 0 B / 2.0 GB\n"));
    CHECK(Contains(text, "Disk: 256.0 GB / 512.0 GB free\n"));
    CHECK(Contains(text, "Uptime: 3h 25m\n"));
    CHECK(Contains(text, "Load Average: 0.52 0.58 0.59 (1m 5m 15m)"));
}

TEST_CASE("RenderDisks: usage per filesystem", "[mcp][text]") {
    DiskInfo disk{"/dev/sda1", "ext4", "/", 100 * kGiB, 40 * kGiB, 55 * kGiB};
    CHECK(RenderDisks({disk}) ==
          "Disk Usage:\n\n"
          "/dev/sda1 (ext4)\n"
          "  55.0 GB / 100.0 GB (55% used)\n"
          "  Mount: /\n\n");
    CHECK(RenderDisks({}) == "Disk Usage:\n\nNo mounted disks found.\n");
}

TEST_CASE("RenderTopProcesses: fixed-width table", "[mcp][text]") {
    std::vector<ProcessInfo> rows{{1234, "python3", 12.5, 10485760}};
    CHECK(RenderTopProcesses(rows, 1, "cpu") ==
          "Top 1 processes by cpu:\n\n"
          "PID      CPU%       Memory     Name\n" +
              std::string(50, '-') + "\n" +
              "1234     12.5       10.0 MB    python3\n");
}

TEST_CASE("RenderProcessMatches: overflow and no match", "[mcp][text]") {
    std::vector<ProcessInfo> rows{{1, "chrome", 5.0, 1024}};
    auto text = RenderProcessMatches("chrome", rows, 3);
    CHECK(Contains(text, "Processes matching 'chrome':\n\n"));
    CHECK(Contains(text, "\n... and 2 more matches\n"));
    CHECK(Contains(text, "\nTotal matches: 3\n"));

    CHECK(RenderProcessMatches("nope", {}, 0) ==
          "Processes matching 'nope':\n\nNo matching processes found.\n");
}

TEST_CASE("RenderProcessList: wider rule and remainder", "[mcp][text]") {
    std::vector<ProcessInfo> rows{{1, "init", 0.0, 4096}};
    auto text = RenderProcessList(rows, 120);
    CHECK(Contains(text, "All Running Processes:\n\n"));
    CHECK(Contains(text, std::string(60, '-') + "\n"));
    CHECK(Contains(text, "\n... and 119 more processes\n"));
    CHECK(Contains(text, "\nTotal processes: 120\n"));
}

TEST_CASE("RenderProcessDetails: long command lines are cut", "[mcp][text]") {
    ProcessDetails d;
    d.process = ProcessInfo{1234, "java", 3.0, 512ULL * 1024 * 1024};
    d.state = "Sleeping";
    d.virtual_memory_bytes = 4 * kGiB;
    d.parent_pid = 1;
    d.run_time_seconds = 7260;
    d.executable = "/usr/bin/java";
    d.command = std::string(250, 'x');

    auto text = RenderProcessDetails(d);
    CHECK(Contains(text, "Process Details (PID 1234):\n\n"));
    CHECK(Contains(text, "Status: Sleeping\n"));
    CHECK(Contains(text, "CPU Usage: 3.0%\n"));
    CHECK(Contains(text, "Memory: 512.0 MB\n"));
    CHECK(Contains(text, "Virtual Memory: 4.0 GB\n"));
    CHECK(Contains(text, "Parent PID: 1\n"));
    CHECK(Contains(text, "Running for: 2h 1m\n"));
    CHECK(Contains(text, "Executable: /usr/bin/java\n"));
    CHECK_FALSE(Contains(text, "Working Dir"));
    CHECK(Contains(text, "Command: " + std::string(200, 'x') + "...\n"));
}

TEST_CASE("RenderWeather and RenderForecast", "[mcp][text]") {
    WeatherReport report;
    report.location = "berlin";
    report.area = WeatherArea{"Berlin", "Berlin", "Germany"};
    report.current.conditions = "Light rain shower";
    report.current.temperature_f = 55;
    report.current.temperature_c = 13;
    report.current.wind_mph = 11;
    report.current.wind_kmph = 17;
    report.current.wind_direction = "WSW";

    ForecastDay day;
    day.date = "2024-05-01";
    day.max_f = 64;
    day.max_c = 18;
    day.min_f = 46;
    day.min_c = 8;
    day.hours = {{0, 50, 10, "Clear", 0}, {9, 53, 13, "Partly cloudy", 30}};
    report.days = {day, day, day};

    auto now = RenderWeather(report);
    CHECK(Contains(now, "Weather for Berlin, Berlin, Germany:\n"));
    CHECK(Contains(now, "Conditions: Light rain shower\n"));
    CHECK(Contains(now, "Temperature: 55°F / 13°C\n"));
    CHECK(Contains(now, "Wind: 11 mph WSW (17 km/h)\n"));

    auto forecast = RenderForecast(report, 2);
    CHECK(Contains(forecast, "Forecast for Berlin, Berlin, Germany (2 days):\n\n"));
    CHECK(Contains(forecast, "2024-05-01:\n  High: 64°F / 18°C | Low: 46°F / 8°C\n"));
    CHECK(Contains(forecast, "  00:00 - 50°F, Clear, 0% rain\n"));
    CHECK(Contains(forecast, "  09:00 - 53°F, Partly cloudy, 30% rain\n"));

    report.area.reset();
    CHECK(Contains(RenderWeather(report), "Weather for berlin:\n"));
    CHECK(Contains(RenderForecast(report, 5), "(3 days)"));
}
