#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include <unistd.h>

namespace envsense {
namespace testing {

// ---------------------------------------------------------------------------
// TempTree: a scratch directory removed on destruction. Used to lay out
// fake /proc and /sys hierarchies.
//
//   TempTree sys;
//   sys.Write("class/power_supply/BAT0/type", "Battery\n");
//   SysfsBatterySource source(sys.Root());
// ---------------------------------------------------------------------------
class TempTree {
public:
    TempTree() {
        static std::atomic<int> counter{0};
        root_ = std::filesystem::temp_directory_path() /
                ("envsense-test-" + std::to_string(::getpid()) + "-" +
                 std::to_string(counter++));
        std::filesystem::remove_all(root_);
        std::filesystem::create_directories(root_);
    }

    ~TempTree() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    TempTree(const TempTree&) = delete;
    TempTree& operator=(const TempTree&) = delete;

    [[nodiscard]] const std::filesystem::path& Root() const noexcept { return root_; }

    [[nodiscard]] std::filesystem::path Path(const std::string& relative) const {
        return root_ / relative;
    }

    // Create parent directories as needed and write `content` verbatim.
    void Write(const std::string& relative, const std::string& content) const {
        const auto path = root_ / relative;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    void MakeDir(const std::string& relative) const {
        std::filesystem::create_directories(root_ / relative);
    }

private:
    std::filesystem::path root_;
};

} // namespace testing
} // namespace envsense
