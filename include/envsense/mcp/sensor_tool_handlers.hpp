#pragma once

#include <envsense/config/app_config.hpp>
#include <envsense/mcp/tool_registry.hpp>
#include <envsense/sensors/sensor_suite.hpp>

namespace envsense {

// Register every sensor tool. The suite must outlive the registry: handlers
// keep references to its sources.
void RegisterSensorTools(ToolRegistry& registry, SensorSuite& suite,
                         const AppConfig& config);

} // namespace envsense
