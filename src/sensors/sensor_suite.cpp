#include <envsense/sensors/sensor_suite.hpp>

#include <envsense/core/log.hpp>
#include <envsense/core/version.hpp>

namespace envsense {

SensorSuite CreateLinuxSensorSuite(const AppConfig& config) {
    const std::chrono::milliseconds timeout(config.commands.timeout_ms);

    SensorSuite suite;
    suite.runner = std::make_unique<PosixCommandRunner>();

    HttpClientOptions http_options;
    http_options.connect_timeout = std::chrono::seconds(config.weather.connect_timeout_seconds);
    http_options.read_timeout = std::chrono::seconds(config.weather.read_timeout_seconds);
    http_options.user_agent = std::string(kServerName) + "/" + kVersion;
    suite.http = std::make_unique<HttplibClient>(config.weather.base_url, http_options);

    suite.idle = std::make_unique<LinuxIdleSource>(*suite.runner, timeout);
    suite.display = std::make_unique<DrmDisplaySource>(config.sysfs_root);
    suite.network = std::make_unique<IfaddrsNetworkSource>();
    suite.usb = std::make_unique<SysfsUsbSource>(config.sysfs_root);
    suite.battery = std::make_unique<SysfsBatterySource>(config.sysfs_root);
    suite.bluetooth = std::make_unique<BluetoothctlScanner>(*suite.runner, timeout);
    suite.git = std::make_unique<GitCliSource>(*suite.runner, timeout);

    ProcfsOptions procfs;
    procfs.procfs_root = config.procfs_root;
    suite.system = std::make_unique<ProcfsSystemSource>(std::move(procfs));

    suite.weather = std::make_unique<WttrWeatherSource>(*suite.http);

    LogDebug("main", "sensor suite ready (procfs=" + config.procfs_root +
                         ", sysfs=" + config.sysfs_root + ", weather=" +
                         config.weather.base_url + ")");
    return suite;
}

} // namespace envsense
