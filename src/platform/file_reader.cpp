#include <envsense/platform/file_reader.hpp>

#include <algorithm>
#include <cerrno>
#include <cctype>
#include <fstream>
#include <sstream>
#include <system_error>

namespace envsense {

Result<std::string, Error> ReadWholeFile(const std::filesystem::path& path,
                                         std::string_view operation) {
    errno = 0;
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        int err = errno != 0 ? errno : ENOENT;
        return Result<std::string, Error>::Err(
            Error::FromErrno(std::string(operation), err, path.string()));
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return Result<std::string, Error>::Ok(ss.str());
}

std::optional<std::string> ReadAttribute(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) return std::nullopt;
    std::string line;
    if (!std::getline(in, line)) return std::string();
    return Trim(line);
}

std::optional<int64_t> ReadIntAttribute(const std::filesystem::path& path) {
    auto text = ReadAttribute(path);
    if (!text || text->empty()) return std::nullopt;
    try {
        size_t used = 0;
        auto value = std::stoll(*text, &used, 10);
        if (used != text->size()) return std::nullopt;
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<uint32_t> ReadHexAttribute(const std::filesystem::path& path) {
    auto text = ReadAttribute(path);
    if (!text || text->empty()) return std::nullopt;
    try {
        size_t used = 0;
        auto value = std::stoul(*text, &used, 16);
        if (used != text->size()) return std::nullopt;
        return static_cast<uint32_t>(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

Result<std::vector<std::filesystem::path>, Error> ListDirectory(
    const std::filesystem::path& dir, std::string_view operation) {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        return Result<std::vector<std::filesystem::path>, Error>::Err(
            Error::FromErrno(std::string(operation), ec.value(), dir.string()));
    }

    std::vector<std::filesystem::path> entries;
    for (const auto& entry : it) {
        entries.push_back(entry.path());
    }
    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) {
                  return a.filename().string() < b.filename().string();
              });
    return Result<std::vector<std::filesystem::path>, Error>::Ok(std::move(entries));
}

std::string Trim(std::string_view text) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && is_space(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && is_space(static_cast<unsigned char>(text[end - 1]))) --end;
    return std::string(text.substr(begin, end - begin));
}

std::vector<std::string> SplitLines(std::string_view text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        auto nl = text.find('\n', start);
        if (nl == std::string_view::npos) nl = text.size();
        auto line = text.substr(start, nl - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        lines.emplace_back(line);
        start = nl + 1;
    }
    return lines;
}

std::vector<std::string> SplitFields(std::string_view text) {
    std::vector<std::string> fields;
    std::istringstream in{std::string(text)};
    std::string field;
    while (in >> field) {
        fields.push_back(field);
    }
    return fields;
}

} // namespace envsense
