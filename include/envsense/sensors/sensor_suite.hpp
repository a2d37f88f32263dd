#pragma once

#include <envsense/config/app_config.hpp>
#include <envsense/platform/command_runner.hpp>
#include <envsense/platform/http_client.hpp>
#include <envsense/sensors/battery.hpp>
#include <envsense/sensors/bluetooth.hpp>
#include <envsense/sensors/display.hpp>
#include <envsense/sensors/git.hpp>
#include <envsense/sensors/idle.hpp>
#include <envsense/sensors/network.hpp>
#include <envsense/sensors/system.hpp>
#include <envsense/sensors/usb.hpp>
#include <envsense/sensors/weather.hpp>

#include <memory>

namespace envsense {

// ---------------------------------------------------------------------------
// SensorSuite: one source per sensor domain.
//
// The runner and HTTP client are declared first so that the sources that
// borrow them are destroyed before them.
// ---------------------------------------------------------------------------
struct SensorSuite {
    std::unique_ptr<ICommandRunner> runner;
    std::unique_ptr<IHttpClient> http;

    std::unique_ptr<IIdleSource> idle;
    std::unique_ptr<IDisplaySource> display;
    std::unique_ptr<INetworkSource> network;
    std::unique_ptr<IUsbSource> usb;
    std::unique_ptr<IBatterySource> battery;
    std::unique_ptr<IBleScanner> bluetooth;
    std::unique_ptr<IGitSource> git;
    std::unique_ptr<ISystemSource> system;
    std::unique_ptr<IWeatherSource> weather;
};

// Build the Linux implementations configured by `config`.
[[nodiscard]] SensorSuite CreateLinuxSensorSuite(const AppConfig& config);

} // namespace envsense
