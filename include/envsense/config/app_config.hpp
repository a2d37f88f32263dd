#pragma once

#include <optional>
#include <string>

namespace envsense {

struct CommandsConfig {
    int timeout_ms = 10000;  // per external command
};

struct WeatherConfig {
    std::optional<std::string> default_location;
    std::string base_url = "https://wttr.in";
    int connect_timeout_seconds = 5;
    int read_timeout_seconds = 10;
};

struct BluetoothConfig {
    int default_scan_ms = 3000;
    int max_scan_ms = 30000;
};

struct GitConfig {
    std::string default_path = ".";
};

struct AppConfig {
    std::string log_level = "info";
    std::optional<std::string> log_file;
    bool log_json = false;
    std::string procfs_root = "/proc";
    std::string sysfs_root = "/sys";
    CommandsConfig commands;
    WeatherConfig weather;
    BluetoothConfig bluetooth;
    GitConfig git;
};

// Flags from the command line. Unset optionals leave the YAML value alone.
struct CliOptions {
    std::optional<std::string> config_path;
    std::optional<std::string> location;
    std::optional<std::string> log_file;
    bool log_json = false;
    int verbosity = 0;  // -v -> debug
    bool list_tools = false;
    bool show_version = false;
};

} // namespace envsense
