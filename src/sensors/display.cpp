#include <envsense/sensors/display.hpp>

#include <envsense/core/log.hpp>
#include <envsense/platform/file_reader.hpp>

#include <cmath>

namespace envsense {

namespace {

constexpr size_t kEdidBlockSize = 128;
constexpr size_t kDescriptorOffsets[] = {54, 72, 90, 108};
constexpr uint8_t kMonitorNameTag = 0xFC;

uint8_t Byte(std::string_view blob, size_t index) {
    return static_cast<uint8_t>(blob[index]);
}

std::string DecodeManufacturer(uint8_t hi, uint8_t lo) {
    const uint16_t packed = static_cast<uint16_t>((hi << 8) | lo);
    std::string id;
    for (int shift : {10, 5, 0}) {
        int letter = (packed >> shift) & 0x1F;
        if (letter < 1 || letter > 26) return "";
        id.push_back(static_cast<char>('A' + letter - 1));
    }
    return id;
}

std::string DecodeDescriptorText(std::string_view blob, size_t offset) {
    std::string text;
    for (size_t i = offset + 5; i < offset + 18; ++i) {
        char c = blob[i];
        if (c == '\n' || c == '\0') break;
        text.push_back(c);
    }
    return Trim(text);
}

// Connector directory names look like "card0-HDMI-A-1".
std::optional<std::string> ConnectorName(const std::string& dirname) {
    if (dirname.rfind("card", 0) != 0) return std::nullopt;
    auto dash = dirname.find('-');
    if (dash == std::string::npos || dash + 1 >= dirname.size()) return std::nullopt;
    return dirname.substr(dash + 1);
}

} // anonymous namespace

double DisplayInfo::DiagonalInches() const {
    if (width_mm == 0 || height_mm == 0) return 0.0;
    const double w = static_cast<double>(width_mm);
    const double h = static_cast<double>(height_mm);
    return std::sqrt(w * w + h * h) / 25.4;
}

Result<EdidInfo, Error> ParseEdid(std::string_view blob) {
    static constexpr unsigned char kHeader[] = {0x00, 0xFF, 0xFF, 0xFF,
                                                0xFF, 0xFF, 0xFF, 0x00};
    if (blob.size() < kEdidBlockSize) {
        return Result<EdidInfo, Error>::Err(Error::Make(
            "Display", "EDID blob too short (" + std::to_string(blob.size()) +
                           " bytes)", ErrorCategory::Io));
    }
    for (size_t i = 0; i < sizeof(kHeader); ++i) {
        if (Byte(blob, i) != kHeader[i]) {
            return Result<EdidInfo, Error>::Err(Error::Make(
                "Display", "EDID header mismatch", ErrorCategory::Io));
        }
    }

    EdidInfo info;
    info.manufacturer = DecodeManufacturer(Byte(blob, 8), Byte(blob, 9));
    // Basic display parameters carry the size in centimetres.
    info.width_mm = Byte(blob, 21) * 10u;
    info.height_mm = Byte(blob, 22) * 10u;

    bool have_timing = false;
    for (size_t offset : kDescriptorOffsets) {
        const uint16_t pixel_clock =
            static_cast<uint16_t>(Byte(blob, offset) | (Byte(blob, offset + 1) << 8));

        if (pixel_clock != 0) {
            if (have_timing) continue;
            have_timing = true;

            const uint32_t h_active = Byte(blob, offset + 2) |
                                      ((Byte(blob, offset + 4) & 0xF0u) << 4);
            const uint32_t h_blank = Byte(blob, offset + 3) |
                                     ((Byte(blob, offset + 4) & 0x0Fu) << 8);
            const uint32_t v_active = Byte(blob, offset + 5) |
                                      ((Byte(blob, offset + 7) & 0xF0u) << 4);
            const uint32_t v_blank = Byte(blob, offset + 6) |
                                     ((Byte(blob, offset + 7) & 0x0Fu) << 8);
            const uint32_t size_w = Byte(blob, offset + 12) |
                                    ((Byte(blob, offset + 14) & 0xF0u) << 4);
            const uint32_t size_h = Byte(blob, offset + 13) |
                                    ((Byte(blob, offset + 14) & 0x0Fu) << 8);

            info.h_active = h_active;
            info.v_active = v_active;
            if (size_w != 0 && size_h != 0) {
                info.width_mm = size_w;
                info.height_mm = size_h;
            }
            const double total = static_cast<double>(h_active + h_blank) *
                                 static_cast<double>(v_active + v_blank);
            if (total > 0) {
                const double hz = pixel_clock * 10000.0 / total;
                info.refresh_hz = std::round(hz * 100.0) / 100.0;
            }
        } else if (Byte(blob, offset + 3) == kMonitorNameTag) {
            info.monitor_name = DecodeDescriptorText(blob, offset);
        }
    }

    return Result<EdidInfo, Error>::Ok(std::move(info));
}

std::optional<std::pair<uint32_t, uint32_t>> ParseModeLine(std::string_view line) {
    auto x = line.find('x');
    if (x == std::string_view::npos || x == 0) return std::nullopt;

    auto parse = [](std::string_view digits) -> std::optional<uint32_t> {
        if (digits.empty()) return std::nullopt;
        uint32_t value = 0;
        for (char c : digits) {
            if (c < '0' || c > '9') return std::nullopt;
            value = value * 10 + static_cast<uint32_t>(c - '0');
        }
        return value;
    };

    auto width = parse(line.substr(0, x));
    auto rest = line.substr(x + 1);
    size_t end = 0;
    while (end < rest.size() && rest[end] >= '0' && rest[end] <= '9') ++end;
    auto height = parse(rest.substr(0, end));
    if (!width || !height) return std::nullopt;
    return std::make_pair(*width, *height);
}

DrmDisplaySource::DrmDisplaySource(std::filesystem::path sysfs_root)
    : drm_dir_(std::move(sysfs_root) / "class" / "drm") {}

Result<std::vector<DisplayInfo>, Error> DrmDisplaySource::ReadDisplays() {
    std::error_code ec;
    if (!std::filesystem::is_directory(drm_dir_, ec)) {
        return Result<std::vector<DisplayInfo>, Error>::Err(Error{
            "Display", "No DRM subsystem found; display enumeration is not "
                       "available on this system",
            ErrorCategory::PlatformUnsupported, drm_dir_.string()});
    }

    auto entries = ListDirectory(drm_dir_, "Display");
    if (entries.IsErr()) {
        return Result<std::vector<DisplayInfo>, Error>::Err(entries.Error());
    }

    std::vector<DisplayInfo> displays;
    for (const auto& dir : entries.Value()) {
        auto connector = ConnectorName(dir.filename().string());
        if (!connector) continue;
        if (ReadAttribute(dir / "status").value_or("") != "connected") continue;

        DisplayInfo display;
        display.connector = *connector;
        display.name = *connector;

        if (auto modes = ReadWholeFile(dir / "modes", "Display"); modes.IsOk()) {
            auto lines = SplitLines(modes.Value());
            if (!lines.empty()) {
                if (auto mode = ParseModeLine(lines.front())) {
                    display.width = mode->first;
                    display.height = mode->second;
                }
            }
        }

        auto blob = ReadWholeFile(dir / "edid", "Display");
        if (blob.IsOk() && !blob.Value().empty()) {
            auto edid = ParseEdid(blob.Value());
            if (edid.IsOk()) {
                const auto& e = edid.Value();
                if (!e.monitor_name.empty()) display.name = e.monitor_name;
                display.manufacturer = e.manufacturer;
                display.width_mm = e.width_mm;
                display.height_mm = e.height_mm;
                display.refresh_hz = e.refresh_hz;
                if (display.width == 0) {
                    display.width = e.h_active;
                    display.height = e.v_active;
                }
            } else {
                LogDebug("display", display.connector + ": " + edid.Error().message);
            }
        }

        display.primary = displays.empty();
        displays.push_back(std::move(display));
    }

    LogDebug("display", std::to_string(displays.size()) + " connected display(s)");
    return Result<std::vector<DisplayInfo>, Error>::Ok(std::move(displays));
}

} // namespace envsense
