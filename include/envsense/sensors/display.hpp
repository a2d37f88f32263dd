#pragma once

#include <envsense/core/result.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace envsense {

struct DisplayInfo {
    std::string name;       // monitor name from EDID, or the connector name
    std::string connector;  // "HDMI-A-1", "eDP-1"
    bool primary = false;
    uint32_t width = 0;
    uint32_t height = 0;
    uint32_t width_mm = 0;
    uint32_t height_mm = 0;
    std::optional<double> refresh_hz;
    std::string manufacturer;  // three-letter PNP id

    [[nodiscard]] double DiagonalInches() const;
};

// ---------------------------------------------------------------------------
// EDID 1.x base block
// ---------------------------------------------------------------------------
struct EdidInfo {
    std::string manufacturer;
    std::string monitor_name;
    uint32_t width_mm = 0;
    uint32_t height_mm = 0;
    uint32_t h_active = 0;
    uint32_t v_active = 0;
    std::optional<double> refresh_hz;
};

[[nodiscard]] Result<EdidInfo, Error> ParseEdid(std::string_view blob);

// "1920x1080" (optionally followed by 'i' or other suffixes).
[[nodiscard]] std::optional<std::pair<uint32_t, uint32_t>> ParseModeLine(
    std::string_view line);

class IDisplaySource {
public:
    virtual ~IDisplaySource() = default;
    [[nodiscard]] virtual Result<std::vector<DisplayInfo>, Error> ReadDisplays() = 0;
};

// ---------------------------------------------------------------------------
// DrmDisplaySource: connected connectors under <sysfs>/class/drm.
// ---------------------------------------------------------------------------
class DrmDisplaySource : public IDisplaySource {
public:
    explicit DrmDisplaySource(std::filesystem::path sysfs_root);

    [[nodiscard]] Result<std::vector<DisplayInfo>, Error> ReadDisplays() override;

private:
    std::filesystem::path drm_dir_;
};

} // namespace envsense
