#include <catch2/catch_test_macros.hpp>

#include <envsense/sensors/bluetooth.hpp>
#include "../../test/mocks/mock_command_runner.hpp"

#include <chrono>

using namespace envsense;
using namespace envsense::testing;
using namespace std::chrono_literals;

namespace {

const char* kControllerList = "Controller 00:1A:7D:DA:71:13 laptop [default]\n";

} // anonymous namespace

// ===========================================================================
// Parsers
// ===========================================================================

TEST_CASE("StripAnsi: removes colour sequences and prompt markers", "[sensors][bluetooth]") {
    CHECK(StripAnsi("\x1b[0;92m[NEW]\x1b[0m Device") == "[NEW] Device");
    CHECK(StripAnsi("\x01\x1b[0;94m\x02[bluetooth]\x01\x1b[0m\x02# ") == "[bluetooth]# ");
    CHECK(StripAnsi("plain") == "plain");
}

TEST_CASE("ParseControllerList: first controller", "[sensors][bluetooth]") {
    auto adapter = ParseControllerList(
        "Controller 00:1A:7D:DA:71:13 laptop [default]\n"
        "Controller 11:22:33:44:55:66 dongle\n");
    REQUIRE(adapter.has_value());
    CHECK(*adapter == "00:1A:7D:DA:71:13");

    CHECK_FALSE(ParseControllerList("").has_value());
    CHECK_FALSE(ParseControllerList("No default controller available\n").has_value());
}

TEST_CASE("MergeDeviceLines: names, RSSI and deletions", "[sensors][bluetooth]") {
    std::vector<BleDevice> devices;
    MergeDeviceLines(
        "Discovery started\n"
        "[CHG] Controller 00:1A:7D:DA:71:13 Discovering: yes\n"
        "\x1b[0;92m[NEW]\x1b[0m Device C4:7C:8D:6A:12:34 Flower care\n"
        "[NEW] Device 5E:11:22:33:44:55 5E-11-22-33-44-55\n"
        "[CHG] Device C4:7C:8D:6A:12:34 RSSI: -67\n"
        "[CHG] Device 5E:11:22:33:44:55 RSSI: 0xffffffa6 (-90)\n"
        "[CHG] Device 5E:11:22:33:44:55 Name: Tile\n"
        "[DEL] Device AA:BB:CC:DD:EE:FF Gone\n",
        devices);

    REQUIRE(devices.size() == 2);
    CHECK(devices[0].address == "C4:7C:8D:6A:12:34");
    CHECK(devices[0].name == "Flower care");
    REQUIRE(devices[0].rssi.has_value());
    CHECK(*devices[0].rssi == -67);

    CHECK(devices[1].address == "5E:11:22:33:44:55");
    CHECK(devices[1].name == "Tile");
    REQUIRE(devices[1].rssi.has_value());
    CHECK(*devices[1].rssi == -90);
}

TEST_CASE("MergeDeviceLines: cached devices keep scanned names", "[sensors][bluetooth]") {
    std::vector<BleDevice> devices{{"C4:7C:8D:6A:12:34", "Flower care", -60}};
    MergeDeviceLines("Device C4:7C:8D:6A:12:34 Other name\n"
                     "Device 00:11:22:33:44:55 Headphones\n",
                     devices);
    REQUIRE(devices.size() == 2);
    CHECK(devices[0].name == "Flower care");
    CHECK(devices[1].name == "Headphones");
    CHECK_FALSE(devices[1].rssi.has_value());
}

// ===========================================================================
// BluetoothctlScanner
// ===========================================================================

TEST_CASE("BluetoothctlScanner: active scan merges with cached devices", "[sensors][bluetooth]") {
    MockCommandRunner runner;
    runner.EnqueueOutput(0, kControllerList);
    runner.EnqueueOutput(0,
                         "[NEW] Device C4:7C:8D:6A:12:34 Flower care\n"
                         "[CHG] Device C4:7C:8D:6A:12:34 RSSI: -70\n"
                         "[NEW] Device 5E:11:22:33:44:55 Tile\n"
                         "[CHG] Device 5E:11:22:33:44:55 RSSI: -48\n");
    runner.EnqueueOutput(0, "Device 00:11:22:33:44:55 Headphones\n");

    BluetoothctlScanner scanner(runner, 1000ms);
    auto result = scanner.Scan(2500ms);
    REQUIRE(result.IsOk());
    const auto& scan = result.Value();
    CHECK(scan.adapter == "00:1A:7D:DA:71:13");
    CHECK(scan.duration_ms == 2500u);

    // Strongest first, devices without RSSI last.
    REQUIRE(scan.devices.size() == 3);
    CHECK(scan.devices[0].name == "Tile");
    CHECK(scan.devices[1].name == "Flower care");
    CHECK(scan.devices[2].name == "Headphones");

    REQUIRE(runner.CallCount() == 3);
    const auto& scan_call = runner.Calls()[1];
    CHECK(scan_call.argv == std::vector<std::string>{"bluetoothctl", "--timeout", "3",
                                                     "scan", "on"});
    CHECK(scan_call.timeout == 4000ms);
}

TEST_CASE("BluetoothctlScanner: zero duration lists cached devices only", "[sensors][bluetooth]") {
    MockCommandRunner runner;
    runner.EnqueueOutput(0, kControllerList);
    runner.EnqueueOutput(0, "Device 00:11:22:33:44:55 Headphones\n");

    BluetoothctlScanner scanner(runner, 1000ms);
    auto result = scanner.Scan(0ms);
    REQUIRE(result.IsOk());
    CHECK(result.Value().duration_ms == 0u);
    REQUIRE(result.Value().devices.size() == 1);
    REQUIRE(runner.CallCount() == 2);
    CHECK(runner.Calls()[1].argv.back() == "devices");
}

TEST_CASE("BluetoothctlScanner: no adapter", "[sensors][bluetooth]") {
    MockCommandRunner runner;
    runner.EnqueueOutput(0, "");

    BluetoothctlScanner scanner(runner, 1000ms);
    auto result = scanner.Scan(1000ms);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::DeviceUnavailable);
    CHECK(result.Error().message == "No Bluetooth adapters found");
    CHECK(runner.CallCount() == 1);
}

TEST_CASE("BluetoothctlScanner: bluetoothctl not installed", "[sensors][bluetooth]") {
    MockCommandRunner runner;
    runner.EnqueueMissing("bluetoothctl");

    BluetoothctlScanner scanner(runner, 1000ms);
    auto result = scanner.Scan(1000ms);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::PlatformUnsupported);
}

TEST_CASE("BluetoothctlScanner: failing scan is an Io error", "[sensors][bluetooth]") {
    MockCommandRunner runner;
    runner.EnqueueOutput(0, kControllerList);
    runner.EnqueueOutput(1, "", "Failed to start discovery: org.bluez.Error.NotReady\n");

    BluetoothctlScanner scanner(runner, 1000ms);
    auto result = scanner.Scan(1000ms);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Io);
    REQUIRE(result.Error().detail.has_value());
    CHECK(result.Error().detail->find("NotReady") != std::string::npos);
}
