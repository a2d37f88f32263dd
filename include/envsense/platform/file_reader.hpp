#pragma once

#include <envsense/core/result.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace envsense {

// ---------------------------------------------------------------------------
// Helpers for /proc and /sys style files. Readers that return optional treat
// a missing or unreadable attribute as "absent"; readers that return Result
// translate errno into a categorised Error.
// ---------------------------------------------------------------------------

[[nodiscard]] Result<std::string, Error> ReadWholeFile(
    const std::filesystem::path& path, std::string_view operation);

// First line with surrounding whitespace removed.
[[nodiscard]] std::optional<std::string> ReadAttribute(
    const std::filesystem::path& path);

[[nodiscard]] std::optional<int64_t> ReadIntAttribute(
    const std::filesystem::path& path);

// Hex attribute such as idVendor ("046d").
[[nodiscard]] std::optional<uint32_t> ReadHexAttribute(
    const std::filesystem::path& path);

// Directory entries sorted by name. A missing directory yields
// DeviceUnavailable.
[[nodiscard]] Result<std::vector<std::filesystem::path>, Error> ListDirectory(
    const std::filesystem::path& dir, std::string_view operation);

[[nodiscard]] std::string Trim(std::string_view text);

[[nodiscard]] std::vector<std::string> SplitLines(std::string_view text);

// Split on runs of whitespace.
[[nodiscard]] std::vector<std::string> SplitFields(std::string_view text);

} // namespace envsense
