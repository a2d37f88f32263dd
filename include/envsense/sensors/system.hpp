#pragma once

#include <envsense/core/result.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace envsense {

// ---------------------------------------------------------------------------
// Snapshots
// ---------------------------------------------------------------------------

struct CpuInfo {
    std::string model;
    uint32_t cores = 0;
    double usage_percent = 0.0;
};

struct MemoryInfo {
    uint64_t total = 0;
    uint64_t available = 0;
    uint64_t used = 0;
    uint64_t swap_total = 0;
    uint64_t swap_used = 0;
};

struct DiskInfo {
    std::string device;
    std::string filesystem;
    std::string mount_point;
    uint64_t total = 0;
    uint64_t available = 0;
    uint64_t used = 0;

    [[nodiscard]] double UsedPercent() const noexcept {
        return total == 0 ? 0.0 : static_cast<double>(used) * 100.0 / static_cast<double>(total);
    }
};

struct SystemOverview {
    CpuInfo cpu;
    MemoryInfo memory;
    uint64_t disk_total = 0;
    uint64_t disk_free = 0;
    uint64_t uptime_seconds = 0;
    std::array<double, 3> load_average{};
};

struct ProcessInfo {
    int pid = 0;
    std::string name;
    double cpu_percent = 0.0;
    uint64_t memory_bytes = 0;
};

struct ProcessDetails {
    ProcessInfo process;
    std::string state;
    uint64_t virtual_memory_bytes = 0;
    std::optional<int> parent_pid;
    uint64_t run_time_seconds = 0;
    std::optional<std::string> executable;
    std::optional<std::string> working_directory;
    std::string command;
};

enum class ProcessSort { Cpu, Memory };

// Stable sort: descending by the key, ties broken by pid.
void SortProcesses(std::vector<ProcessInfo>& processes, ProcessSort sort);

// ---------------------------------------------------------------------------
// /proc parsers
// ---------------------------------------------------------------------------

struct CpuTimes {
    uint64_t idle = 0;
    uint64_t total = 0;
};

// Aggregate "cpu" line of /proc/stat.
[[nodiscard]] std::optional<CpuTimes> ParseCpuTimes(std::string_view proc_stat);

// Number of "cpuN" lines in /proc/stat.
[[nodiscard]] uint32_t CountCpus(std::string_view proc_stat);

// Busy share between two samples, in percent.
[[nodiscard]] double CpuUsageBetween(const CpuTimes& before, const CpuTimes& after);

// "model name" (x86) or "Hardware"/"Model" (ARM) of /proc/cpuinfo.
[[nodiscard]] std::string ParseCpuModel(std::string_view cpuinfo);

[[nodiscard]] std::optional<MemoryInfo> ParseMeminfo(std::string_view meminfo);

struct MountEntry {
    std::string device;
    std::string mount_point;
    std::string filesystem;
};

// Block-device backed mounts only; one entry per device (first mount wins).
[[nodiscard]] std::vector<MountEntry> ParseMounts(std::string_view mounts);

[[nodiscard]] std::optional<std::array<double, 3>> ParseLoadavg(std::string_view loadavg);

[[nodiscard]] std::optional<double> ParseUptime(std::string_view uptime);

struct ProcStat {
    int pid = 0;
    std::string comm;
    char state = '?';
    int ppid = 0;
    uint64_t utime = 0;
    uint64_t stime = 0;
    uint64_t start_time = 0;  // clock ticks after boot
    uint64_t vsize = 0;       // bytes
    int64_t rss_pages = 0;
};

// /proc/<pid>/stat. The comm field may contain spaces and parentheses.
[[nodiscard]] std::optional<ProcStat> ParseProcStat(std::string_view stat);

// "R" -> "Running", "S" -> "Sleeping", ...
[[nodiscard]] std::string ProcessStateName(char state);

// NUL-separated /proc/<pid>/cmdline joined with spaces.
[[nodiscard]] std::string JoinCmdline(std::string_view cmdline);

// ---------------------------------------------------------------------------
// ISystemSource
// ---------------------------------------------------------------------------
class ISystemSource {
public:
    virtual ~ISystemSource() = default;

    [[nodiscard]] virtual Result<SystemOverview, Error> ReadOverview() = 0;
    [[nodiscard]] virtual Result<std::vector<DiskInfo>, Error> ReadDisks() = 0;
    // Every visible process with CPU usage sampled over a short interval.
    [[nodiscard]] virtual Result<std::vector<ProcessInfo>, Error> ListProcesses() = 0;
    // NotFound when the pid does not exist.
    [[nodiscard]] virtual Result<ProcessDetails, Error> ReadProcess(int pid) = 0;
};

struct FsUsage {
    uint64_t total = 0;
    uint64_t available = 0;
    uint64_t free = 0;
};

struct ProcfsOptions {
    std::filesystem::path procfs_root = "/proc";
    std::chrono::milliseconds sample_interval{200};
    // 0 selects sysconf(_SC_CLK_TCK) / sysconf(_SC_PAGESIZE).
    long clock_ticks = 0;
    long page_size = 0;
    // Defaults to statvfs(3).
    std::function<std::optional<FsUsage>(const std::string& mount_point)> statfs;
};

// ---------------------------------------------------------------------------
// ProcfsSystemSource: everything comes from procfs plus statvfs.
// ---------------------------------------------------------------------------
class ProcfsSystemSource : public ISystemSource {
public:
    explicit ProcfsSystemSource(ProcfsOptions options);

    [[nodiscard]] Result<SystemOverview, Error> ReadOverview() override;
    [[nodiscard]] Result<std::vector<DiskInfo>, Error> ReadDisks() override;
    [[nodiscard]] Result<std::vector<ProcessInfo>, Error> ListProcesses() override;
    [[nodiscard]] Result<ProcessDetails, Error> ReadProcess(int pid) override;

private:
    struct ProcessSample {
        ProcStat stat;
        uint64_t ticks = 0;
    };

    [[nodiscard]] Result<CpuTimes, Error> SampleCpu();
    [[nodiscard]] std::vector<ProcessSample> SampleProcesses();
    void Pause() const;
    [[nodiscard]] uint64_t RssBytes(const ProcStat& stat) const;

    ProcfsOptions options_;
};

} // namespace envsense
