#include <envsense/sensors/usb.hpp>

#include <envsense/core/log.hpp>
#include <envsense/core/text_format.hpp>
#include <envsense/platform/file_reader.hpp>

#include <algorithm>
#include <tuple>

namespace envsense {

std::string UsbDevice::DisplayName() const {
    if (!product.empty()) return product;
    return "Device " + HexId(vendor_id, 4) + ":" + HexId(product_id, 4);
}

SysfsUsbSource::SysfsUsbSource(std::filesystem::path sysfs_root)
    : devices_dir_(std::move(sysfs_root) / "bus" / "usb" / "devices") {}

Result<std::vector<UsbDevice>, Error> SysfsUsbSource::ReadDevices() {
    std::error_code ec;
    if (!std::filesystem::is_directory(devices_dir_, ec)) {
        return Result<std::vector<UsbDevice>, Error>::Err(Error{
            "Usb", "USB subsystem not present", ErrorCategory::PlatformUnsupported,
            devices_dir_.string()});
    }

    auto entries = ListDirectory(devices_dir_, "Usb");
    if (entries.IsErr()) {
        return Result<std::vector<UsbDevice>, Error>::Err(entries.Error());
    }

    std::vector<UsbDevice> devices;
    for (const auto& dir : entries.Value()) {
        if (dir.filename().string().find(':') != std::string::npos) continue;

        auto vendor = ReadHexAttribute(dir / "idVendor");
        auto product = ReadHexAttribute(dir / "idProduct");
        if (!vendor || !product) continue;

        UsbDevice device;
        device.vendor_id = static_cast<uint16_t>(*vendor);
        device.product_id = static_cast<uint16_t>(*product);
        device.bus = static_cast<uint32_t>(ReadIntAttribute(dir / "busnum").value_or(0));
        device.device = static_cast<uint32_t>(ReadIntAttribute(dir / "devnum").value_or(0));
        device.manufacturer = ReadAttribute(dir / "manufacturer").value_or("");
        device.product = ReadAttribute(dir / "product").value_or("");
        device.serial = ReadAttribute(dir / "serial").value_or("");
        devices.push_back(std::move(device));
    }

    std::sort(devices.begin(), devices.end(), [](const UsbDevice& a, const UsbDevice& b) {
        return std::tie(a.bus, a.device) < std::tie(b.bus, b.device);
    });

    LogDebug("usb", std::to_string(devices.size()) + " device(s)");
    return Result<std::vector<UsbDevice>, Error>::Ok(std::move(devices));
}

} // namespace envsense
