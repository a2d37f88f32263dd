#pragma once

#include <envsense/core/result.hpp>
#include <envsense/platform/command_runner.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace envsense {

struct BleDevice {
    std::string address;
    std::string name;  // empty when the device did not advertise one
    std::optional<int> rssi;
};

struct BleScanResult {
    std::string adapter;
    uint32_t duration_ms = 0;
    std::vector<BleDevice> devices;
};

class IBleScanner {
public:
    virtual ~IBleScanner() = default;

    // A zero duration skips the active scan and reports cached devices.
    [[nodiscard]] virtual Result<BleScanResult, Error> Scan(
        std::chrono::milliseconds duration) = 0;
};

// Remove ANSI colour sequences bluetoothctl emits even when not on a tty.
[[nodiscard]] std::string StripAnsi(std::string_view text);

// First "Controller <addr> <name> [default]" line of `bluetoothctl list`.
[[nodiscard]] std::optional<std::string> ParseControllerList(std::string_view out);

// Merge "[NEW] Device", "[CHG] Device ... RSSI" and plain "Device" lines into
// `devices`, keyed by address. "[DEL]" lines are ignored.
void MergeDeviceLines(std::string_view out, std::vector<BleDevice>& devices);

// ---------------------------------------------------------------------------
// BluetoothctlScanner: drives BlueZ through the bluetoothctl CLI.
// ---------------------------------------------------------------------------
class BluetoothctlScanner : public IBleScanner {
public:
    BluetoothctlScanner(ICommandRunner& runner, std::chrono::milliseconds timeout);

    [[nodiscard]] Result<BleScanResult, Error> Scan(
        std::chrono::milliseconds duration) override;

private:
    ICommandRunner& runner_;
    std::chrono::milliseconds timeout_;
};

} // namespace envsense
