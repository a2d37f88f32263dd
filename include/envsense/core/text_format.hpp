#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace envsense {

// "47s", "5m", "14m 7s", "2h", "3h 5m".
[[nodiscard]] std::string FormatDuration(uint64_t seconds);

// Binary units with one decimal: "512 B", "1.5 KB", "3.2 GB", "1.1 TB".
[[nodiscard]] std::string FormatBytes(uint64_t bytes);

// Fixed-point rendering without locale influence.
[[nodiscard]] std::string FormatFixed(double value, int precision);

// One decimal followed by '%': "42.5%".
[[nodiscard]] std::string FormatPercent(double percent);

// Left-align `text` in a column of `width` characters (no truncation).
[[nodiscard]] std::string PadRight(std::string_view text, size_t width);

// Lowercase hex with zero padding: HexId(0x46d, 4) == "046d".
[[nodiscard]] std::string HexId(uint32_t value, int width);

// "2024-05-01 13:07" in UTC.
[[nodiscard]] std::string FormatTimestampUtc(int64_t epoch_seconds);

} // namespace envsense
