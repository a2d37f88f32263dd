#include <envsense/config/config_loader.hpp>

#include <envsense/core/log.hpp>
#include <envsense/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <string>

namespace envsense {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error::Make("ConfigLoader", message, ErrorCategory::Config);
}

template <typename T>
void ReadScalar(const YAML::Node& node, const char* key, T& target) {
    if (node[key]) {
        target = node[key].as<T>();
    }
}

void ReadOptionalString(const YAML::Node& node, const char* key,
                        std::optional<std::string>& target) {
    if (node[key] && !node[key].IsNull()) {
        target = node[key].as<std::string>();
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    AppConfig config;
    if (root.IsNull()) {
        return Result<AppConfig, Error>::Ok(std::move(config));
    }
    if (!root.IsMap()) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Config root must be a mapping: " + std::string(file_path)));
    }

    try {
        // -- Logging --
        ReadScalar(root, "log_level", config.log_level);
        ReadOptionalString(root, "log_file", config.log_file);
        ReadScalar(root, "log_json", config.log_json);

        // -- Filesystem roots --
        ReadScalar(root, "procfs_root", config.procfs_root);
        ReadScalar(root, "sysfs_root", config.sysfs_root);

        if (const auto& commands = root["commands"]) {
            ReadScalar(commands, "timeout_ms", config.commands.timeout_ms);
        }

        if (const auto& weather = root["weather"]) {
            ReadOptionalString(weather, "default_location", config.weather.default_location);
            ReadScalar(weather, "base_url", config.weather.base_url);
            ReadScalar(weather, "connect_timeout_seconds",
                       config.weather.connect_timeout_seconds);
            ReadScalar(weather, "read_timeout_seconds", config.weather.read_timeout_seconds);
        }

        if (const auto& bluetooth = root["bluetooth"]) {
            ReadScalar(bluetooth, "default_scan_ms", config.bluetooth.default_scan_ms);
            ReadScalar(bluetooth, "max_scan_ms", config.bluetooth.max_scan_ms);
        }

        if (const auto& git = root["git"]) {
            ReadScalar(git, "default_path", config.git.default_path);
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Invalid value in " + std::string(file_path) + ": " +
                            std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("envsense", kVersion,
                                     argparse::default_arguments::help);
    program.add_description(
        "MCP server over stdio exposing local environment sensors.");

    CliOptions options;

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--location")
        .help("Default location for weather tools");
    program.add_argument("--log-file")
        .help("Write logs to this file (JSON lines) instead of stderr");
    program.add_argument("--log-json")
        .help("Log as JSON lines")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-v", "--verbose")
        .help("Debug logging (repeatable)")
        .action([&options](const auto&) { ++options.verbosity; })
        .append()
        .default_value(false)
        .implicit_value(true)
        .nargs(0);
    program.add_argument("--list-tools")
        .help("Print the tool table as JSON and exit")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--version")
        .help("Print version and exit")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliOptions, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    if (auto val = program.present("--config")) {
        options.config_path = *val;
    }
    if (auto val = program.present("--location")) {
        options.location = *val;
    }
    if (auto val = program.present("--log-file")) {
        options.log_file = *val;
    }
    options.log_json = program.get<bool>("--log-json");
    options.list_tools = program.get<bool>("--list-tools");
    options.show_version = program.get<bool>("--version");

    return Result<CliOptions, Error>::Ok(std::move(options));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const CliOptions& cli) {
    AppConfig merged = yaml_base;

    if (cli.location.has_value()) {
        merged.weather.default_location = cli.location;
    }
    if (cli.log_file.has_value()) {
        merged.log_file = cli.log_file;
    }
    if (cli.log_json) {
        merged.log_json = true;
    }
    if (cli.verbosity > 0) {
        merged.log_level = "debug";
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (auto level = ParseLogLevel(config.log_level); level.IsErr()) {
        return Result<void, Error>::Err(
            MakeConfigError("Unknown log_level '" + config.log_level +
                            "' (expected debug, info, warn or error)"));
    }
    if (config.commands.timeout_ms <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("commands.timeout_ms must be positive, got " +
                            std::to_string(config.commands.timeout_ms)));
    }
    if (config.weather.base_url.empty()) {
        return Result<void, Error>::Err(MakeConfigError("weather.base_url must not be empty"));
    }
    if (config.weather.connect_timeout_seconds <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("weather.connect_timeout_seconds must be positive, got " +
                            std::to_string(config.weather.connect_timeout_seconds)));
    }
    if (config.weather.read_timeout_seconds <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("weather.read_timeout_seconds must be positive, got " +
                            std::to_string(config.weather.read_timeout_seconds)));
    }
    if (config.bluetooth.max_scan_ms <= 0 || config.bluetooth.max_scan_ms > 30000) {
        return Result<void, Error>::Err(
            MakeConfigError("bluetooth.max_scan_ms must be in 1..30000, got " +
                            std::to_string(config.bluetooth.max_scan_ms)));
    }
    if (config.bluetooth.default_scan_ms < 0 ||
        config.bluetooth.default_scan_ms > config.bluetooth.max_scan_ms) {
        return Result<void, Error>::Err(
            MakeConfigError("bluetooth.default_scan_ms must be in 0..max_scan_ms, got " +
                            std::to_string(config.bluetooth.default_scan_ms)));
    }
    if (config.weather.default_location.has_value() &&
        config.weather.default_location->empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("weather.default_location must not be empty when set"));
    }
    if (config.procfs_root.empty() || config.sysfs_root.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("procfs_root and sysfs_root must not be empty"));
    }
    return Result<void, Error>::Ok();
}

} // namespace envsense
