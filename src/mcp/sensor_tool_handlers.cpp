#include <envsense/mcp/sensor_tool_handlers.hpp>

#include <envsense/mcp/sensor_json.hpp>
#include <envsense/mcp/sensor_text.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <limits>
#include <string>

namespace envsense {

namespace {

using json = nlohmann::json;

constexpr size_t kFindProcessLimit = 20;
constexpr size_t kListProcessLimit = 50;

// ---------------------------------------------------------------------------
// Output schema helpers
// ---------------------------------------------------------------------------

json Prop(const char* type) {
    return {{"type", type}};
}

json Nullable(const char* type) {
    return {{"type", json::array({type, "null"})}};
}

json ArrayOf(json items) {
    return {{"type", "array"}, {"items", std::move(items)}};
}

// Every listed property is present in the payload (possibly null).
json ObjectOf(json properties) {
    json required = json::array();
    for (auto it = properties.begin(); it != properties.end(); ++it) {
        required.push_back(it.key());
    }
    return {{"type", "object"},
            {"properties", std::move(properties)},
            {"required", std::move(required)}};
}

json ProcessRowSchema() {
    return ObjectOf({{"pid", Prop("integer")},
                     {"name", Prop("string")},
                     {"cpu_percent", Prop("number")},
                     {"memory_bytes", Prop("integer")}});
}

json AreaSchema() {
    return {{"type", json::array({"object", "null"})},
            {"properties", {{"name", Prop("string")},
                            {"region", Prop("string")},
                            {"country", Prop("string")}}}};
}

// ---------------------------------------------------------------------------
// Result helpers
// ---------------------------------------------------------------------------

ToolOutcome MakeOk(json structured, std::string text) {
    return ToolOutcome::Ok(ToolOutput{std::move(structured), std::move(text)});
}

ToolOutcome MakeArgError(const std::string& message) {
    return ToolOutcome::Err(
        Error::Make("ToolRegistry", message, ErrorCategory::InvalidArguments));
}

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

json ProcessRows(const std::vector<ProcessInfo>& rows) {
    json out = json::array();
    for (const auto& row : rows) out.push_back(ToJson(row));
    return out;
}

std::vector<ProcessInfo> Head(const std::vector<ProcessInfo>& rows, size_t limit) {
    const auto n = std::min(limit, rows.size());
    return std::vector<ProcessInfo>(rows.begin(), rows.begin() + static_cast<long>(n));
}

// Requested location, falling back to the configured default.
Result<std::string, Error> ResolveLocation(const json& args, const AppConfig& config) {
    if (args.contains("location")) {
        auto location = args["location"].get<std::string>();
        if (location.empty()) {
            return Result<std::string, Error>::Err(Error::Make(
                "ToolRegistry", "location: must not be empty",
                ErrorCategory::InvalidArguments));
        }
        return Result<std::string, Error>::Ok(std::move(location));
    }
    if (config.weather.default_location) {
        return Result<std::string, Error>::Ok(*config.weather.default_location);
    }
    return Result<std::string, Error>::Err(Error::Make(
        "ToolRegistry",
        "location: required argument is missing (no default location configured)",
        ErrorCategory::InvalidArguments));
}

InputSchema LocationSchema(const AppConfig& config) {
    InputSchema schema;
    if (config.weather.default_location) {
        schema.String("location", "City name, airport code or coordinates (default: " +
                                      *config.weather.default_location + ")");
    } else {
        schema.String("location", "City name, airport code or coordinates").Required();
    }
    return schema;
}

// ---------------------------------------------------------------------------
// Per-domain registration
// ---------------------------------------------------------------------------

void RegisterIdleTools(ToolRegistry& registry, IIdleSource& idle) {
    registry.Register(
        ToolDescriptor{"get_idle_time",
                       "Seconds since the last keyboard or mouse input.",
                       InputSchema(),
                       ObjectOf({{"idle_seconds", Prop("integer")},
                                 {"formatted", Prop("string")},
                                 {"source", Prop("string")}})},
        [&idle](const json&) -> ToolOutcome {
            auto reading = idle.ReadIdle();
            if (reading.IsErr()) return ToolOutcome::Err(reading.Error());
            return MakeOk(ToJson(reading.Value()), RenderIdle(reading.Value()));
        });

    registry.Register(
        ToolDescriptor{"is_idle_for",
                       "Check whether the user has been idle for at least the given "
                       "number of seconds.",
                       InputSchema()
                           .Integer("threshold_seconds", "Idle threshold in seconds")
                           .Min(0)
                           .Required(),
                       ObjectOf({{"idle_seconds", Prop("integer")},
                                 {"threshold_seconds", Prop("integer")},
                                 {"is_idle", Prop("boolean")}})},
        [&idle](const json& args) -> ToolOutcome {
            const auto threshold = args["threshold_seconds"].get<uint64_t>();
            auto reading = idle.ReadIdle();
            if (reading.IsErr()) return ToolOutcome::Err(reading.Error());
            const auto seconds = reading.Value().idle_seconds;
            json structured = {{"idle_seconds", seconds},
                               {"threshold_seconds", threshold},
                               {"is_idle", seconds >= threshold}};
            return MakeOk(std::move(structured), RenderIdleCheck(seconds, threshold));
        });
}

void RegisterDeviceTools(ToolRegistry& registry, SensorSuite& suite) {
    IDisplaySource& display = *suite.display;
    registry.Register(
        ToolDescriptor{"get_display_info",
                       "Connected displays with resolution, physical size and refresh rate.",
                       InputSchema(),
                       ObjectOf({{"displays", ArrayOf(ObjectOf({
                                      {"index", Prop("integer")},
                                      {"name", Prop("string")},
                                      {"connector", Prop("string")},
                                      {"primary", Prop("boolean")},
                                      {"width", Prop("integer")},
                                      {"height", Prop("integer")},
                                      {"width_mm", Prop("integer")},
                                      {"height_mm", Prop("integer")},
                                      {"diagonal_inches", Nullable("number")},
                                      {"refresh_hz", Nullable("number")},
                                      {"manufacturer", Nullable("string")}}))},
                                 {"count", Prop("integer")}})},
        [&display](const json&) -> ToolOutcome {
            auto displays = display.ReadDisplays();
            if (displays.IsErr()) return ToolOutcome::Err(displays.Error());
            const auto& list = displays.Value();
            json rows = json::array();
            for (size_t i = 0; i < list.size(); ++i) rows.push_back(ToJson(list[i], i));
            return MakeOk({{"displays", rows}, {"count", list.size()}},
                          RenderDisplays(list));
        });

    INetworkSource& network = *suite.network;
    registry.Register(
        ToolDescriptor{"get_interfaces",
                       "Network interfaces with MAC, IPv4 and IPv6 addresses.",
                       InputSchema(),
                       ObjectOf({{"interfaces", ArrayOf(ObjectOf({
                                      {"name", Prop("string")},
                                      {"mac", Nullable("string")},
                                      {"loopback", Prop("boolean")},
                                      {"up", Prop("boolean")},
                                      {"addresses", ArrayOf(ObjectOf({
                                           {"family", Prop("string")},
                                           {"address", Prop("string")},
                                           {"netmask", Nullable("string")}}))}}))},
                                 {"count", Prop("integer")},
                                 {"with_addresses", Prop("integer")}})},
        [&network](const json&) -> ToolOutcome {
            auto interfaces = network.ReadInterfaces();
            if (interfaces.IsErr()) return ToolOutcome::Err(interfaces.Error());
            const auto& list = interfaces.Value();
            json rows = json::array();
            size_t with_addresses = 0;
            for (const auto& iface : list) {
                rows.push_back(ToJson(iface));
                if (!iface.addresses.empty()) ++with_addresses;
            }
            return MakeOk({{"interfaces", rows},
                           {"count", list.size()},
                           {"with_addresses", with_addresses}},
                          RenderInterfaces(list));
        });

    IUsbSource& usb = *suite.usb;
    registry.Register(
        ToolDescriptor{"get_usb_devices",
                       "Connected USB devices with vendor/product ids and strings.",
                       InputSchema(),
                       ObjectOf({{"devices", ArrayOf(ObjectOf({
                                      {"bus", Prop("integer")},
                                      {"device", Prop("integer")},
                                      {"vendor_id", Prop("string")},
                                      {"product_id", Prop("string")},
                                      {"manufacturer", Nullable("string")},
                                      {"product", Nullable("string")},
                                      {"serial", Nullable("string")}}))},
                                 {"count", Prop("integer")}})},
        [&usb](const json&) -> ToolOutcome {
            auto devices = usb.ReadDevices();
            if (devices.IsErr()) return ToolOutcome::Err(devices.Error());
            const auto& list = devices.Value();
            json rows = json::array();
            for (const auto& device : list) rows.push_back(ToJson(device));
            return MakeOk({{"devices", rows}, {"count", list.size()}},
                          RenderUsbDevices(list));
        });

    IBatterySource& battery = *suite.battery;
    registry.Register(
        ToolDescriptor{"get_battery_status",
                       "Charge, state, energy, health and time estimates of each battery.",
                       InputSchema(),
                       ObjectOf({{"batteries", ArrayOf(ObjectOf({
                                      {"name", Prop("string")},
                                      {"percent", Prop("number")},
                                      {"state", Prop("string")},
                                      {"energy_wh", Nullable("number")},
                                      {"energy_full_wh", Nullable("number")},
                                      {"health_percent", Nullable("number")},
                                      {"time_to_full_minutes", Nullable("number")},
                                      {"time_to_empty_minutes", Nullable("number")},
                                      {"temperature_celsius", Nullable("number")}}))},
                                 {"count", Prop("integer")}})},
        [&battery](const json&) -> ToolOutcome {
            auto batteries = battery.ReadBatteries();
            if (batteries.IsErr()) return ToolOutcome::Err(batteries.Error());
            const auto& list = batteries.Value();
            json rows = json::array();
            for (const auto& b : list) rows.push_back(ToJson(b));
            return MakeOk({{"batteries", rows}, {"count", list.size()}},
                          RenderBatteries(list));
        });
}

void RegisterBluetoothTools(ToolRegistry& registry, IBleScanner& scanner,
                            const BluetoothConfig& config) {
    registry.Register(
        ToolDescriptor{"scan_ble_devices",
                       "Scan for nearby Bluetooth Low Energy devices.",
                       InputSchema()
                           .Integer("duration_ms", "Scan duration in milliseconds")
                           .Min(0)
                           .Max(config.max_scan_ms)
                           .Default(config.default_scan_ms),
                       ObjectOf({{"adapter", Prop("string")},
                                 {"duration_ms", Prop("integer")},
                                 {"devices", ArrayOf(ObjectOf({
                                      {"address", Prop("string")},
                                      {"name", Nullable("string")},
                                      {"rssi", Nullable("integer")}}))},
                                 {"count", Prop("integer")}})},
        [&scanner](const json& args) -> ToolOutcome {
            const std::chrono::milliseconds duration(args["duration_ms"].get<int64_t>());
            auto scan = scanner.Scan(duration);
            if (scan.IsErr()) return ToolOutcome::Err(scan.Error());
            return MakeOk(ToJson(scan.Value()), RenderBleScan(scan.Value()));
        });
}

void RegisterGitTools(ToolRegistry& registry, IGitSource& git, const GitConfig& config) {
    const json commit_schema = ObjectOf({{"id", Prop("string")},
                                         {"short_id", Prop("string")},
                                         {"author", Prop("string")},
                                         {"timestamp", Prop("integer")},
                                         {"summary", Prop("string")}});
    const std::string default_path = config.default_path;

    registry.Register(
        ToolDescriptor{"get_status",
                       "Branch, last commit and working tree changes of a git repository.",
                       InputSchema().String("path", "Repository path").Default(default_path),
                       ObjectOf({{"repository", Prop("string")},
                                 {"branch", Nullable("string")},
                                 {"head_commit",
                                  {{"type", json::array({"object", "null"})},
                                   {"properties", commit_schema["properties"]}}},
                                 {"staged", ArrayOf(Prop("string"))},
                                 {"modified", ArrayOf(Prop("string"))},
                                 {"untracked", ArrayOf(Prop("string"))},
                                 {"clean", Prop("boolean")}})},
        [&git](const json& args) -> ToolOutcome {
            auto status = git.ReadStatus(args["path"].get<std::string>());
            if (status.IsErr()) return ToolOutcome::Err(status.Error());
            return MakeOk(ToJson(status.Value()), RenderGitStatus(status.Value()));
        });

    registry.Register(
        ToolDescriptor{"get_log",
                       "Recent commits of a git repository, newest first.",
                       InputSchema()
                           .String("path", "Repository path")
                           .Default(default_path)
                           .Integer("count", "Number of commits")
                           .Min(1)
                           .Max(100)
                           .Default(10),
                       ObjectOf({{"repository", Prop("string")},
                                 {"commits", ArrayOf(commit_schema)}})},
        [&git](const json& args) -> ToolOutcome {
            auto log = git.ReadLog(args["path"].get<std::string>(),
                                   args["count"].get<int>());
            if (log.IsErr()) return ToolOutcome::Err(log.Error());
            return MakeOk(ToJson(log.Value()), RenderGitLog(log.Value()));
        });
}

void RegisterSystemTools(ToolRegistry& registry, ISystemSource& system) {
    registry.Register(
        ToolDescriptor{"get_system_info",
                       "CPU, memory, disk, uptime and load average overview.",
                       InputSchema(),
                       ObjectOf({{"cpu", ObjectOf({{"model", Prop("string")},
                                                   {"cores", Prop("integer")},
                                                   {"usage_percent", Prop("number")}})},
                                 {"memory", ObjectOf({{"total_bytes", Prop("integer")},
                                                      {"used_bytes", Prop("integer")},
                                                      {"swap_total_bytes", Prop("integer")},
                                                      {"swap_used_bytes", Prop("integer")}})},
                                 {"disk", ObjectOf({{"total_bytes", Prop("integer")},
                                                    {"free_bytes", Prop("integer")}})},
                                 {"uptime_seconds", Prop("integer")},
                                 {"load_average", ArrayOf(Prop("number"))}})},
        [&system](const json&) -> ToolOutcome {
            auto overview = system.ReadOverview();
            if (overview.IsErr()) return ToolOutcome::Err(overview.Error());
            return MakeOk(ToJson(overview.Value()), RenderSystemOverview(overview.Value()));
        });

    registry.Register(
        ToolDescriptor{"get_disk_info",
                       "Usage of every mounted block-device filesystem.",
                       InputSchema(),
                       ObjectOf({{"disks", ArrayOf(ObjectOf({
                                      {"device", Prop("string")},
                                      {"filesystem", Prop("string")},
                                      {"mount_point", Prop("string")},
                                      {"total_bytes", Prop("integer")},
                                      {"used_bytes", Prop("integer")},
                                      {"available_bytes", Prop("integer")},
                                      {"used_percent", Prop("number")}}))},
                                 {"count", Prop("integer")}})},
        [&system](const json&) -> ToolOutcome {
            auto disks = system.ReadDisks();
            if (disks.IsErr()) return ToolOutcome::Err(disks.Error());
            const auto& list = disks.Value();
            json rows = json::array();
            for (const auto& disk : list) rows.push_back(ToJson(disk));
            return MakeOk({{"disks", rows}, {"count", list.size()}}, RenderDisks(list));
        });

    registry.Register(
        ToolDescriptor{"get_top_processes",
                       "Processes using the most CPU or memory.",
                       InputSchema()
                           .Integer("count", "Number of processes")
                           .Min(1)
                           .Max(500)
                           .Default(10)
                           .Enum("sort_by", "Sort key", {"cpu", "memory"})
                           .Default("cpu"),
                       ObjectOf({{"sort_by", Prop("string")},
                                 {"processes", ArrayOf(ProcessRowSchema())},
                                 {"total", Prop("integer")}})},
        [&system](const json& args) -> ToolOutcome {
            const int count = args["count"].get<int>();
            const auto sort_by = args["sort_by"].get<std::string>();
            auto processes = system.ListProcesses();
            if (processes.IsErr()) return ToolOutcome::Err(processes.Error());
            auto list = std::move(processes).Value();
            SortProcesses(list, sort_by == "memory" ? ProcessSort::Memory : ProcessSort::Cpu);
            const auto rows = Head(list, static_cast<size_t>(count));
            return MakeOk({{"sort_by", sort_by},
                           {"processes", ProcessRows(rows)},
                           {"total", list.size()}},
                          RenderTopProcesses(rows, count, sort_by));
        });

    registry.Register(
        ToolDescriptor{"find_process",
                       "Processes whose name contains the given text (case-insensitive).",
                       InputSchema().String("name", "Text to look for").Required(),
                       ObjectOf({{"query", Prop("string")},
                                 {"processes", ArrayOf(ProcessRowSchema())},
                                 {"total", Prop("integer")}})},
        [&system](const json& args) -> ToolOutcome {
            const auto query = args["name"].get<std::string>();
            if (query.empty()) return MakeArgError("name: must not be empty");
            auto processes = system.ListProcesses();
            if (processes.IsErr()) return ToolOutcome::Err(processes.Error());

            const auto needle = ToLower(query);
            std::vector<ProcessInfo> matches;
            for (const auto& p : processes.Value()) {
                if (ToLower(p.name).find(needle) != std::string::npos) matches.push_back(p);
            }
            SortProcesses(matches, ProcessSort::Cpu);
            const auto rows = Head(matches, kFindProcessLimit);
            return MakeOk({{"query", query},
                           {"processes", ProcessRows(rows)},
                           {"total", matches.size()}},
                          RenderProcessMatches(query, rows, matches.size()));
        });

    registry.Register(
        ToolDescriptor{"get_process_details",
                       "Detailed information about one process.",
                       InputSchema()
                           .Integer("pid", "Process id")
                           .Min(1)
                           .Max(std::numeric_limits<int>::max())
                           .Required(),
                       ObjectOf({{"pid", Prop("integer")},
                                 {"name", Prop("string")},
                                 {"state", Prop("string")},
                                 {"cpu_percent", Prop("number")},
                                 {"memory_bytes", Prop("integer")},
                                 {"virtual_memory_bytes", Prop("integer")},
                                 {"parent_pid", Nullable("integer")},
                                 {"run_time_seconds", Prop("integer")},
                                 {"executable", Nullable("string")},
                                 {"working_directory", Nullable("string")},
                                 {"command", Prop("string")}})},
        [&system](const json& args) -> ToolOutcome {
            auto details = system.ReadProcess(args["pid"].get<int>());
            if (details.IsErr()) return ToolOutcome::Err(details.Error());
            return MakeOk(ToJson(details.Value()), RenderProcessDetails(details.Value()));
        });

    registry.Register(
        ToolDescriptor{"list_processes",
                       "All running processes (the 50 busiest are listed).",
                       InputSchema(),
                       ObjectOf({{"processes", ArrayOf(ProcessRowSchema())},
                                 {"total", Prop("integer")}})},
        [&system](const json&) -> ToolOutcome {
            auto processes = system.ListProcesses();
            if (processes.IsErr()) return ToolOutcome::Err(processes.Error());
            auto list = std::move(processes).Value();
            SortProcesses(list, ProcessSort::Cpu);
            const auto rows = Head(list, kListProcessLimit);
            return MakeOk({{"processes", ProcessRows(rows)}, {"total", list.size()}},
                          RenderProcessList(rows, list.size()));
        });
}

void RegisterWeatherTools(ToolRegistry& registry, IWeatherSource& weather,
                          const AppConfig& config) {
    registry.Register(
        ToolDescriptor{"get_weather",
                       "Current weather conditions for a location.",
                       LocationSchema(config),
                       ObjectOf({{"location", Prop("string")},
                                 {"area", AreaSchema()},
                                 {"conditions", Prop("string")},
                                 {"temperature_f", Prop("integer")},
                                 {"temperature_c", Prop("integer")},
                                 {"feels_like_f", Prop("integer")},
                                 {"feels_like_c", Prop("integer")},
                                 {"humidity_percent", Prop("integer")},
                                 {"wind_mph", Prop("integer")},
                                 {"wind_kmph", Prop("integer")},
                                 {"wind_direction", Prop("string")},
                                 {"visibility_miles", Prop("integer")},
                                 {"pressure_mb", Prop("integer")},
                                 {"uv_index", Prop("integer")},
                                 {"precipitation_mm", Prop("number")}})},
        [&weather, &config](const json& args) -> ToolOutcome {
            auto location = ResolveLocation(args, config);
            if (location.IsErr()) return ToolOutcome::Err(location.Error());
            auto report = weather.Fetch(location.Value());
            if (report.IsErr()) return ToolOutcome::Err(report.Error());
            return MakeOk(CurrentWeatherToJson(report.Value()), RenderWeather(report.Value()));
        });

    registry.Register(
        ToolDescriptor{"get_forecast",
                       "Daily forecast with 3-hourly detail for a location.",
                       LocationSchema(config)
                           .Integer("days", "Number of days")
                           .Min(1)
                           .Max(3)
                           .Default(3),
                       ObjectOf({{"location", Prop("string")},
                                 {"area", AreaSchema()},
                                 {"days", ArrayOf(ObjectOf({
                                      {"date", Prop("string")},
                                      {"max_f", Prop("integer")},
                                      {"max_c", Prop("integer")},
                                      {"min_f", Prop("integer")},
                                      {"min_c", Prop("integer")},
                                      {"hours", ArrayOf(ObjectOf({
                                           {"hour", Prop("integer")},
                                           {"temp_f", Prop("integer")},
                                           {"temp_c", Prop("integer")},
                                           {"conditions", Prop("string")},
                                           {"chance_of_rain", Prop("integer")}}))}}))}})},
        [&weather, &config](const json& args) -> ToolOutcome {
            auto location = ResolveLocation(args, config);
            if (location.IsErr()) return ToolOutcome::Err(location.Error());
            const auto days = args["days"].get<size_t>();
            auto report = weather.Fetch(location.Value());
            if (report.IsErr()) return ToolOutcome::Err(report.Error());
            return MakeOk(ForecastToJson(report.Value(), days),
                          RenderForecast(report.Value(), days));
        });
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// RegisterSensorTools
// ---------------------------------------------------------------------------

void RegisterSensorTools(ToolRegistry& registry, SensorSuite& suite,
                         const AppConfig& config) {
    RegisterIdleTools(registry, *suite.idle);
    RegisterDeviceTools(registry, suite);
    RegisterBluetoothTools(registry, *suite.bluetooth, config.bluetooth);
    RegisterGitTools(registry, *suite.git, config.git);
    RegisterSystemTools(registry, *suite.system);
    RegisterWeatherTools(registry, *suite.weather, config);
}

} // namespace envsense
