#include <envsense/config/config_loader.hpp>
#include <envsense/core/log.hpp>
#include <envsense/core/version.hpp>
#include <envsense/mcp/mcp_server.hpp>
#include <envsense/mcp/sensor_tool_handlers.hpp>
#include <envsense/sensors/sensor_suite.hpp>

#include <nlohmann/json.hpp>

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;

// Resolve CLI + YAML into a validated config.
envsense::Result<envsense::AppConfig, envsense::Error> ResolveConfig(
    const envsense::CliOptions& cli) {
    using namespace envsense;
    using ConfigResult = Result<AppConfig, Error>;

    AppConfig base;
    if (cli.config_path) {
        auto yaml = LoadFromYaml(*cli.config_path);
        if (yaml.IsErr()) return yaml;
        base = std::move(yaml).Value();
    }

    auto merged = MergeConfigs(base, cli);
    auto valid = ValidateConfig(merged);
    if (valid.IsErr()) return ConfigResult::Err(valid.Error());
    return ConfigResult::Ok(std::move(merged));
}

// Install the process-wide logger described by `config`. Stdout stays free
// for protocol traffic.
envsense::Result<void, envsense::Error> InitLogging(const envsense::AppConfig& config) {
    using namespace envsense;

    auto level = ParseLogLevel(config.log_level);
    if (level.IsErr()) return Result<void, Error>::Err(level.Error());

    std::unique_ptr<ILogSink> sink;
    if (config.log_file) {
        auto file = FileSink::Open(*config.log_file, true);
        if (file.IsErr()) return Result<void, Error>::Err(file.Error());
        sink = std::move(file).Value();
    } else if (config.log_json) {
        sink = std::make_unique<JsonSink>(std::cerr);
    } else {
        sink = std::make_unique<ConsoleSink>(std::cerr);
    }
    InitGlobalLogger(std::move(sink), level.Value());
    return Result<void, Error>::Ok();
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace envsense;

    // Until the config is known only warnings and errors reach stderr.
    InitGlobalLogger(std::make_unique<ConsoleSink>(std::cerr), LogLevel::Warn);

    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) {
        LogError("main", cli.Error().ToString());
        return kExitFailure;
    }

    if (cli.Value().show_version) {
        std::cout << kServerName << " " << kVersion << "\n";
        return kExitSuccess;
    }

    auto config_result = ResolveConfig(cli.Value());
    if (config_result.IsErr()) {
        LogError("config", config_result.Error().ToString());
        return kExitFailure;
    }
    const AppConfig config = std::move(config_result).Value();

    auto logging = InitLogging(config);
    if (logging.IsErr()) {
        LogError("main", logging.Error().ToString());
        return kExitFailure;
    }

    // The suite outlives the server: tool handlers borrow its sources.
    SensorSuite suite = CreateLinuxSensorSuite(config);
    ToolRegistry registry;
    try {
        RegisterSensorTools(registry, suite, config);
    } catch (const std::logic_error& e) {
        LogError("main", std::string("tool registration failed: ") + e.what());
        return kExitFailure;
    }
    registry.Freeze();

    if (cli.Value().list_tools) {
        nlohmann::json tools = nlohmann::json::array();
        for (const auto& descriptor : registry.Tools()) {
            tools.push_back(descriptor.ToJson());
        }
        std::cout << tools.dump(2) << "\n";
        return kExitSuccess;
    }

    LogInfo("main", std::string(kServerName) + " " + kVersion + " starting");
    McpServer server(std::move(registry));
    server.Run();

    return kExitSuccess;
}
