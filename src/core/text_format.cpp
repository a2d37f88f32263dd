#include <envsense/core/text_format.hpp>

#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>

namespace envsense {

std::string FormatDuration(uint64_t seconds) {
    if (seconds < 60) {
        return std::to_string(seconds) + "s";
    }
    if (seconds < 3600) {
        const auto mins = seconds / 60;
        const auto secs = seconds % 60;
        if (secs == 0) return std::to_string(mins) + "m";
        return std::to_string(mins) + "m " + std::to_string(secs) + "s";
    }
    const auto hours = seconds / 3600;
    const auto mins = (seconds % 3600) / 60;
    if (mins == 0) return std::to_string(hours) + "h";
    return std::to_string(hours) + "h " + std::to_string(mins) + "m";
}

std::string FormatBytes(uint64_t bytes) {
    constexpr uint64_t kKb = 1024;
    constexpr uint64_t kMb = kKb * 1024;
    constexpr uint64_t kGb = kMb * 1024;
    constexpr uint64_t kTb = kGb * 1024;

    const auto value = static_cast<double>(bytes);
    if (bytes >= kTb) return FormatFixed(value / static_cast<double>(kTb), 1) + " TB";
    if (bytes >= kGb) return FormatFixed(value / static_cast<double>(kGb), 1) + " GB";
    if (bytes >= kMb) return FormatFixed(value / static_cast<double>(kMb), 1) + " MB";
    if (bytes >= kKb) return FormatFixed(value / static_cast<double>(kKb), 1) + " KB";
    return std::to_string(bytes) + " B";
}

std::string FormatFixed(double value, int precision) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

std::string FormatPercent(double percent) {
    return FormatFixed(percent, 1) + "%";
}

std::string PadRight(std::string_view text, size_t width) {
    std::string out(text);
    if (out.size() < width) {
        out.append(width - out.size(), ' ');
    }
    return out;
}

std::string HexId(uint32_t value, int width) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(width) << value;
    return oss.str();
}

std::string FormatTimestampUtc(int64_t epoch_seconds) {
    std::time_t t = static_cast<std::time_t>(epoch_seconds);
    std::tm tm{};
    if (gmtime_r(&t, &tm) == nullptr) return "unknown";
    char buf[32];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tm) == 0) return "unknown";
    return buf;
}

} // namespace envsense
