#include <catch2/catch_test_macros.hpp>

#include <envsense/sensors/display.hpp>
#include "../../test/mocks/temp_tree.hpp"

#include <cmath>
#include <string>

using namespace envsense;
using namespace envsense::testing;

namespace {

void Put(std::string& blob, size_t offset, std::initializer_list<unsigned char> bytes) {
    for (auto b : bytes) blob[offset++] = static_cast<char>(b);
}

// 128-byte EDID base block for a 27" 1920x1080@60 Dell panel.
std::string DellEdid() {
    std::string blob(128, '\0');
    Put(blob, 0, {0x00, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0x00});
    Put(blob, 8, {0x10, 0xAC});     // "DEL"
    Put(blob, 21, {60, 34});        // cm
    // Detailed timing: 148.5 MHz, 1920+280 x 1080+45, 527x296 mm.
    Put(blob, 54, {0x02, 0x3A, 0x80, 0x18, 0x71, 0x38, 0x2D, 0x40});
    Put(blob, 54 + 12, {0x0F, 0x28, 0x21});
    // Monitor name descriptor.
    Put(blob, 72, {0x00, 0x00, 0x00, 0xFC, 0x00});
    const std::string name = "DELL U2720Q\n";
    blob.replace(72 + 5, name.size(), name);
    return blob;
}

} // anonymous namespace

// ===========================================================================
// ParseEdid
// ===========================================================================

TEST_CASE("ParseEdid: decodes manufacturer, name, size and timing", "[sensors][display]") {
    auto result = ParseEdid(DellEdid());
    REQUIRE(result.IsOk());
    const auto& edid = result.Value();
    CHECK(edid.manufacturer == "DEL");
    CHECK(edid.monitor_name == "DELL U2720Q");
    CHECK(edid.h_active == 1920u);
    CHECK(edid.v_active == 1080u);
    CHECK(edid.width_mm == 527u);
    CHECK(edid.height_mm == 296u);
    REQUIRE(edid.refresh_hz.has_value());
    CHECK(std::fabs(*edid.refresh_hz - 60.0) < 0.01);
}

TEST_CASE("ParseEdid: rejects short or corrupt blobs", "[sensors][display]") {
    auto short_blob = ParseEdid(std::string(64, '\0'));
    REQUIRE(short_blob.IsErr());
    CHECK(short_blob.Error().message.find("too short") != std::string::npos);

    auto blob = DellEdid();
    blob[0] = 0x01;
    auto corrupt = ParseEdid(blob);
    REQUIRE(corrupt.IsErr());
    CHECK(corrupt.Error().category == ErrorCategory::Io);
}

TEST_CASE("ParseModeLine: width and height", "[sensors][display]") {
    auto mode = ParseModeLine("2560x1440");
    REQUIRE(mode.has_value());
    CHECK(mode->first == 2560u);
    CHECK(mode->second == 1440u);

    auto interlaced = ParseModeLine("1920x1080i");
    REQUIRE(interlaced.has_value());
    CHECK(interlaced->second == 1080u);

    CHECK_FALSE(ParseModeLine("").has_value());
    CHECK_FALSE(ParseModeLine("x1080").has_value());
    CHECK_FALSE(ParseModeLine("wide").has_value());
}

TEST_CASE("DisplayInfo: diagonal from physical size", "[sensors][display]") {
    DisplayInfo info;
    CHECK(info.DiagonalInches() == 0.0);
    info.width_mm = 527;
    info.height_mm = 296;
    CHECK(std::fabs(info.DiagonalInches() - 23.8) < 0.05);
}

// ===========================================================================
// DrmDisplaySource
// ===========================================================================

TEST_CASE("DrmDisplaySource: connected connectors only", "[sensors][display]") {
    TempTree sys;
    sys.Write("class/drm/card0-HDMI-A-1/status", "connected\n");
    sys.Write("class/drm/card0-HDMI-A-1/modes", "2560x1440\n1920x1080\n");
    sys.Write("class/drm/card0-HDMI-A-1/edid", DellEdid());
    sys.Write("class/drm/card0-DP-1/status", "disconnected\n");
    sys.Write("class/drm/card0-eDP-1/status", "connected\n");
    sys.Write("class/drm/card0-eDP-1/modes", "1920x1200\n");
    sys.Write("class/drm/card0-eDP-1/edid", "");
    sys.MakeDir("class/drm/card0");
    sys.Write("class/drm/version", "drm 1.1.0\n");

    DrmDisplaySource source(sys.Root());
    auto result = source.ReadDisplays();
    REQUIRE(result.IsOk());
    const auto& displays = result.Value();
    REQUIRE(displays.size() == 2);

    // Directory order: card0-HDMI-A-1 sorts before card0-eDP-1.
    CHECK(displays[0].connector == "HDMI-A-1");
    CHECK(displays[0].name == "DELL U2720Q");
    CHECK(displays[0].manufacturer == "DEL");
    CHECK(displays[0].width == 2560u);
    CHECK(displays[0].height == 1440u);
    CHECK(displays[0].primary);

    CHECK(displays[1].connector == "eDP-1");
    CHECK(displays[1].name == "eDP-1");
    CHECK(displays[1].width == 1920u);
    CHECK(displays[1].height == 1200u);
    CHECK_FALSE(displays[1].primary);
    CHECK_FALSE(displays[1].refresh_hz.has_value());
}

TEST_CASE("DrmDisplaySource: nothing connected is an empty list", "[sensors][display]") {
    TempTree sys;
    sys.Write("class/drm/card0-DP-1/status", "disconnected\n");
    DrmDisplaySource source(sys.Root());
    auto result = source.ReadDisplays();
    REQUIRE(result.IsOk());
    CHECK(result.Value().empty());
}

TEST_CASE("DrmDisplaySource: missing DRM subsystem", "[sensors][display]") {
    TempTree sys;
    DrmDisplaySource source(sys.Root());
    auto result = source.ReadDisplays();
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::PlatformUnsupported);
}
