#pragma once

#include <envsense/core/result.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace envsense {

struct UsbDevice {
    uint32_t bus = 0;
    uint32_t device = 0;
    uint16_t vendor_id = 0;
    uint16_t product_id = 0;
    std::string manufacturer;
    std::string product;
    std::string serial;

    // Product string, or "Device vvvv:pppp" when the device reports none.
    [[nodiscard]] std::string DisplayName() const;
};

class IUsbSource {
public:
    virtual ~IUsbSource() = default;
    [[nodiscard]] virtual Result<std::vector<UsbDevice>, Error> ReadDevices() = 0;
};

// ---------------------------------------------------------------------------
// SysfsUsbSource: device nodes under <sysfs>/bus/usb/devices (interfaces,
// whose names contain ':', are skipped). Sorted by bus then address.
// ---------------------------------------------------------------------------
class SysfsUsbSource : public IUsbSource {
public:
    explicit SysfsUsbSource(std::filesystem::path sysfs_root);

    [[nodiscard]] Result<std::vector<UsbDevice>, Error> ReadDevices() override;

private:
    std::filesystem::path devices_dir_;
};

} // namespace envsense
