#include <catch2/catch_test_macros.hpp>

#include <envsense/sensors/usb.hpp>
#include "../../test/mocks/temp_tree.hpp"

using namespace envsense;
using namespace envsense::testing;

namespace {

void AddDevice(const TempTree& sys, const std::string& node, int bus, int dev,
               const std::string& vendor, const std::string& product_id,
               const std::string& product = "", const std::string& manufacturer = "") {
    const std::string base = "bus/usb/devices/" + node + "/";
    sys.Write(base + "busnum", std::to_string(bus) + "\n");
    sys.Write(base + "devnum", std::to_string(dev) + "\n");
    sys.Write(base + "idVendor", vendor + "\n");
    sys.Write(base + "idProduct", product_id + "\n");
    if (!product.empty()) sys.Write(base + "product", product + "\n");
    if (!manufacturer.empty()) sys.Write(base + "manufacturer", manufacturer + "\n");
}

} // anonymous namespace

TEST_CASE("UsbDevice: display name falls back to ids", "[sensors][usb]") {
    UsbDevice device;
    device.vendor_id = 0x046d;
    device.product_id = 0xc52b;
    CHECK(device.DisplayName() == "Device 046d:c52b");
    device.product = "USB Receiver";
    CHECK(device.DisplayName() == "USB Receiver");
}

TEST_CASE("SysfsUsbSource: devices sorted by bus and address", "[sensors][usb]") {
    TempTree sys;
    AddDevice(sys, "usb1", 1, 1, "1d6b", "0002", "xHCI Host Controller", "Linux Foundation");
    AddDevice(sys, "2-1", 2, 3, "0bda", "8153");
    AddDevice(sys, "1-2", 1, 4, "046d", "c52b", "USB Receiver", "Logitech");
    // Interface directories carry no device attributes of their own.
    sys.Write("bus/usb/devices/1-2:1.0/bInterfaceClass", "03\n");
    // Nodes without ids are skipped.
    sys.Write("bus/usb/devices/1-3/busnum", "1\n");

    SysfsUsbSource source(sys.Root());
    auto result = source.ReadDevices();
    REQUIRE(result.IsOk());
    const auto& devices = result.Value();
    REQUIRE(devices.size() == 3);

    CHECK(devices[0].bus == 1u);
    CHECK(devices[0].device == 1u);
    CHECK(devices[0].manufacturer == "Linux Foundation");

    CHECK(devices[1].bus == 1u);
    CHECK(devices[1].device == 4u);
    CHECK(devices[1].vendor_id == 0x046d);
    CHECK(devices[1].product_id == 0xc52b);
    CHECK(devices[1].DisplayName() == "USB Receiver");

    CHECK(devices[2].bus == 2u);
    CHECK(devices[2].DisplayName() == "Device 0bda:8153");
    CHECK(devices[2].manufacturer.empty());
}

TEST_CASE("SysfsUsbSource: empty bus", "[sensors][usb]") {
    TempTree sys;
    sys.MakeDir("bus/usb/devices");
    SysfsUsbSource source(sys.Root());
    auto result = source.ReadDevices();
    REQUIRE(result.IsOk());
    CHECK(result.Value().empty());
}

TEST_CASE("SysfsUsbSource: no USB subsystem", "[sensors][usb]") {
    TempTree sys;
    SysfsUsbSource source(sys.Root());
    auto result = source.ReadDevices();
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::PlatformUnsupported);
}
