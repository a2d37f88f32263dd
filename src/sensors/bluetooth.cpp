#include <envsense/sensors/bluetooth.hpp>

#include <envsense/core/log.hpp>
#include <envsense/platform/file_reader.hpp>

#include <algorithm>
#include <cctype>

namespace envsense {

namespace {

bool LooksLikeAddress(std::string_view text) {
    if (text.size() != 17) return false;
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (i % 3 == 2) {
            if (c != ':') return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

// "-67" or "0xffffffbd (-67)".
std::optional<int> ParseRssi(std::string_view text) {
    auto open = text.find('(');
    if (open != std::string_view::npos) {
        auto close = text.find(')', open);
        if (close == std::string_view::npos) return std::nullopt;
        text = text.substr(open + 1, close - open - 1);
    }
    try {
        size_t used = 0;
        std::string value(text);
        int rssi = std::stoi(value, &used, 10);
        if (used != value.size()) return std::nullopt;
        return rssi;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

BleDevice& FindOrAdd(std::vector<BleDevice>& devices, const std::string& address) {
    auto it = std::find_if(devices.begin(), devices.end(),
                           [&](const BleDevice& d) { return d.address == address; });
    if (it != devices.end()) return *it;
    devices.push_back(BleDevice{address, "", std::nullopt});
    return devices.back();
}

Result<CommandOutput, Error> RequireSuccess(Result<CommandOutput, Error> result,
                                            const std::string& what) {
    if (result.IsErr()) return result;
    if (!result.Value().Succeeded()) {
        auto stderr_text = Trim(result.Value().err);
        return Result<CommandOutput, Error>::Err(Error{
            "Bluetooth", what + " failed (exit " +
                             std::to_string(result.Value().exit_code) + ")",
            ErrorCategory::Io,
            stderr_text.empty() ? std::nullopt : std::optional<std::string>(stderr_text)});
    }
    return result;
}

} // anonymous namespace

std::string StripAnsi(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\x1b' && i + 1 < text.size() && text[i + 1] == '[') {
            i += 2;
            while (i < text.size() && !(text[i] >= '@' && text[i] <= '~')) ++i;
            continue;
        }
        // bluetoothctl marks prompt redraws with \x01 / \x02 around colour codes.
        if (text[i] == '\x01' || text[i] == '\x02') continue;
        out.push_back(text[i]);
    }
    return out;
}

std::optional<std::string> ParseControllerList(std::string_view out) {
    for (const auto& line : SplitLines(StripAnsi(out))) {
        auto fields = SplitFields(line);
        if (fields.size() >= 2 && fields[0] == "Controller" && LooksLikeAddress(fields[1])) {
            return fields[1];
        }
    }
    return std::nullopt;
}

void MergeDeviceLines(std::string_view out, std::vector<BleDevice>& devices) {
    for (const auto& raw : SplitLines(StripAnsi(out))) {
        std::string_view line = raw;
        const auto tag_end = line.find(']');
        std::string tag;
        if (!line.empty() && line.front() == '[' && tag_end != std::string_view::npos) {
            tag = std::string(line.substr(1, tag_end - 1));
            line.remove_prefix(tag_end + 1);
        }
        if (tag == "DEL") continue;

        auto trimmed = Trim(line);
        if (trimmed.rfind("Device ", 0) != 0) continue;
        std::string_view rest = std::string_view(trimmed).substr(7);
        if (rest.size() < 17 || !LooksLikeAddress(rest.substr(0, 17))) continue;

        const std::string address(rest.substr(0, 17));
        auto tail = Trim(rest.substr(17));

        if (tag == "CHG") {
            if (tail.rfind("RSSI:", 0) == 0) {
                auto rssi = ParseRssi(Trim(std::string_view(tail).substr(5)));
                if (rssi) FindOrAdd(devices, address).rssi = rssi;
            } else if (tail.rfind("Name:", 0) == 0) {
                FindOrAdd(devices, address).name = Trim(std::string_view(tail).substr(5));
            }
            continue;
        }

        auto& device = FindOrAdd(devices, address);
        // bluetoothctl repeats the address with dashes when there is no name.
        std::string dashed = address;
        std::replace(dashed.begin(), dashed.end(), ':', '-');
        if (!tail.empty() && tail != dashed && device.name.empty()) {
            device.name = tail;
        }
    }
}

BluetoothctlScanner::BluetoothctlScanner(ICommandRunner& runner,
                                         std::chrono::milliseconds timeout)
    : runner_(runner), timeout_(timeout) {}

Result<BleScanResult, Error> BluetoothctlScanner::Scan(std::chrono::milliseconds duration) {
    auto list = RequireSuccess(runner_.Run({"bluetoothctl", "list"}, timeout_),
                               "bluetoothctl list");
    if (list.IsErr()) return Result<BleScanResult, Error>::Err(std::move(list).Error());

    auto adapter = ParseControllerList(list.Value().out);
    if (!adapter) {
        return Result<BleScanResult, Error>::Err(Error::Make(
            "Bluetooth", "No Bluetooth adapters found", ErrorCategory::DeviceUnavailable));
    }

    BleScanResult result;
    result.adapter = *adapter;
    result.duration_ms = static_cast<uint32_t>(duration.count());

    if (duration.count() > 0) {
        // bluetoothctl takes whole seconds.
        const auto seconds = std::max<long long>(1, (duration.count() + 999) / 1000);
        LogDebug("bluetooth", "scanning on " + *adapter + " for " +
                                  std::to_string(seconds) + "s");
        auto scan = RequireSuccess(
            runner_.Run({"bluetoothctl", "--timeout", std::to_string(seconds), "scan", "on"},
                        std::chrono::seconds(seconds) + timeout_),
            "bluetoothctl scan");
        if (scan.IsErr()) return Result<BleScanResult, Error>::Err(std::move(scan).Error());
        MergeDeviceLines(scan.Value().out, result.devices);
    }

    auto known = RequireSuccess(runner_.Run({"bluetoothctl", "devices"}, timeout_),
                                "bluetoothctl devices");
    if (known.IsErr()) return Result<BleScanResult, Error>::Err(std::move(known).Error());
    MergeDeviceLines(known.Value().out, result.devices);

    // Strongest signal first; devices without RSSI last.
    std::stable_sort(result.devices.begin(), result.devices.end(),
                     [](const BleDevice& a, const BleDevice& b) {
                         if (a.rssi.has_value() != b.rssi.has_value()) return a.rssi.has_value();
                         return a.rssi.value_or(0) > b.rssi.value_or(0);
                     });
    return Result<BleScanResult, Error>::Ok(std::move(result));
}

} // namespace envsense
