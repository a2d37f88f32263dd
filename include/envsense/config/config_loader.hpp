#pragma once

#include <envsense/config/app_config.hpp>
#include <envsense/core/result.hpp>

#include <string_view>

namespace envsense {

// Parse a YAML config file into an AppConfig. Every key is optional.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI arguments.
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv);

// Flags given on the command line take precedence over the YAML base.
AppConfig MergeConfigs(const AppConfig& yaml_base, const CliOptions& cli);

// Reject timeouts <= 0, inconsistent scan limits, unknown log levels and an
// empty weather base URL.
Result<void, Error> ValidateConfig(const AppConfig& config);

} // namespace envsense
