#include <envsense/sensors/system.hpp>

#include <envsense/core/log.hpp>
#include <envsense/platform/file_reader.hpp>

#include <sys/statvfs.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>
#include <thread>
#include <unordered_map>

namespace envsense {

namespace {

std::optional<uint64_t> ToU64(const std::string& text) {
    if (text.empty()) return std::nullopt;
    try {
        size_t used = 0;
        auto value = std::stoull(text, &used, 10);
        if (used != text.size()) return std::nullopt;
        return static_cast<uint64_t>(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<int64_t> ToI64(const std::string& text) {
    if (text.empty()) return std::nullopt;
    try {
        size_t used = 0;
        auto value = std::stoll(text, &used, 10);
        if (used != text.size()) return std::nullopt;
        return static_cast<int64_t>(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<double> ToDouble(const std::string& text) {
    if (text.empty()) return std::nullopt;
    try {
        size_t used = 0;
        auto value = std::stod(text, &used);
        if (used != text.size()) return std::nullopt;
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

double RoundTenth(double value) {
    return std::round(value * 10.0) / 10.0;
}

// Mount table fields escape space, tab, newline and backslash as \ooo.
std::string DecodeMountField(std::string_view field) {
    std::string out;
    for (size_t i = 0; i < field.size(); ++i) {
        if (field[i] == '\\' && i + 3 < field.size()) {
            auto digits = field.substr(i + 1, 3);
            if (std::all_of(digits.begin(), digits.end(),
                            [](char c) { return c >= '0' && c <= '7'; })) {
                out.push_back(static_cast<char>((digits[0] - '0') * 64 +
                                                (digits[1] - '0') * 8 + (digits[2] - '0')));
                i += 3;
                continue;
            }
        }
        out.push_back(field[i]);
    }
    return out;
}

std::optional<FsUsage> StatVfs(const std::string& mount_point) {
    struct statvfs vfs {};
    if (statvfs(mount_point.c_str(), &vfs) != 0) return std::nullopt;
    FsUsage usage;
    usage.total = static_cast<uint64_t>(vfs.f_blocks) * vfs.f_frsize;
    usage.available = static_cast<uint64_t>(vfs.f_bavail) * vfs.f_frsize;
    usage.free = static_cast<uint64_t>(vfs.f_bfree) * vfs.f_frsize;
    return usage;
}

bool IsPidDirectory(const std::string& name) {
    return !name.empty() &&
           std::all_of(name.begin(), name.end(),
                       [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
}

Error ProcessNotFound(int pid) {
    return Error::Make("System", "Process with PID " + std::to_string(pid) + " not found",
                       ErrorCategory::NotFound);
}

} // anonymous namespace

void SortProcesses(std::vector<ProcessInfo>& processes, ProcessSort sort) {
    std::stable_sort(processes.begin(), processes.end(),
                     [sort](const ProcessInfo& a, const ProcessInfo& b) {
                         if (sort == ProcessSort::Memory) {
                             if (a.memory_bytes != b.memory_bytes) {
                                 return a.memory_bytes > b.memory_bytes;
                             }
                         } else if (a.cpu_percent != b.cpu_percent) {
                             return a.cpu_percent > b.cpu_percent;
                         }
                         return a.pid < b.pid;
                     });
}

// ---------------------------------------------------------------------------
// Parsers
// ---------------------------------------------------------------------------

std::optional<CpuTimes> ParseCpuTimes(std::string_view proc_stat) {
    for (const auto& line : SplitLines(proc_stat)) {
        auto fields = SplitFields(line);
        if (fields.empty() || fields[0] != "cpu") continue;
        if (fields.size() < 5) return std::nullopt;

        CpuTimes times;
        for (size_t i = 1; i < fields.size(); ++i) {
            auto value = ToU64(fields[i]);
            if (!value) return std::nullopt;
            // guest and guest_nice are already included in user and nice.
            if (i <= 8) times.total += *value;
            // idle + iowait
            if (i == 4 || i == 5) times.idle += *value;
        }
        return times;
    }
    return std::nullopt;
}

uint32_t CountCpus(std::string_view proc_stat) {
    uint32_t count = 0;
    for (const auto& line : SplitLines(proc_stat)) {
        if (line.size() > 3 && line.compare(0, 3, "cpu") == 0 &&
            std::isdigit(static_cast<unsigned char>(line[3]))) {
            ++count;
        }
    }
    return count;
}

double CpuUsageBetween(const CpuTimes& before, const CpuTimes& after) {
    if (after.total <= before.total) return 0.0;
    const double total = static_cast<double>(after.total - before.total);
    const double idle = after.idle >= before.idle
                            ? static_cast<double>(after.idle - before.idle)
                            : 0.0;
    return RoundTenth(std::clamp((total - idle) / total * 100.0, 0.0, 100.0));
}

std::string ParseCpuModel(std::string_view cpuinfo) {
    std::string fallback;
    for (const auto& line : SplitLines(cpuinfo)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        auto key = Trim(std::string_view(line).substr(0, colon));
        auto value = Trim(std::string_view(line).substr(colon + 1));
        if (value.empty()) continue;
        if (key == "model name") return value;
        if ((key == "Hardware" || key == "Model" || key == "cpu model") && fallback.empty()) {
            fallback = value;
        }
    }
    return fallback;
}

std::optional<MemoryInfo> ParseMeminfo(std::string_view meminfo) {
    std::unordered_map<std::string, uint64_t> kb;
    for (const auto& line : SplitLines(meminfo)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        auto fields = SplitFields(std::string_view(line).substr(colon + 1));
        if (fields.empty()) continue;
        if (auto value = ToU64(fields[0])) kb[line.substr(0, colon)] = *value;
    }

    auto total = kb.find("MemTotal");
    if (total == kb.end()) return std::nullopt;

    MemoryInfo info;
    info.total = total->second * 1024;
    if (auto avail = kb.find("MemAvailable"); avail != kb.end()) {
        info.available = avail->second * 1024;
    } else {
        // Kernels before 3.14 lack MemAvailable.
        uint64_t sum = 0;
        for (const char* key : {"MemFree", "Buffers", "Cached"}) {
            if (auto it = kb.find(key); it != kb.end()) sum += it->second;
        }
        info.available = sum * 1024;
    }
    info.available = std::min(info.available, info.total);
    info.used = info.total - info.available;

    auto swap_total = kb.find("SwapTotal");
    auto swap_free = kb.find("SwapFree");
    if (swap_total != kb.end()) {
        info.swap_total = swap_total->second * 1024;
        const uint64_t free = swap_free != kb.end() ? swap_free->second * 1024 : 0;
        info.swap_used = info.swap_total > free ? info.swap_total - free : 0;
    }
    return info;
}

std::vector<MountEntry> ParseMounts(std::string_view mounts) {
    static const std::set<std::string> kSkippedFilesystems = {"squashfs", "iso9660",
                                                              "udf"};
    std::vector<MountEntry> entries;
    std::set<std::string> seen;
    for (const auto& line : SplitLines(mounts)) {
        auto fields = SplitFields(line);
        if (fields.size() < 3) continue;

        MountEntry entry{DecodeMountField(fields[0]), DecodeMountField(fields[1]), fields[2]};
        const bool block_device = entry.device.rfind("/dev/", 0) == 0 &&
                                  entry.device.rfind("/dev/loop", 0) != 0;
        const bool pooled = entry.filesystem == "zfs";
        if (!block_device && !pooled) continue;
        if (kSkippedFilesystems.count(entry.filesystem) != 0) continue;
        if (!seen.insert(entry.device).second) continue;
        entries.push_back(std::move(entry));
    }
    return entries;
}

std::optional<std::array<double, 3>> ParseLoadavg(std::string_view loadavg) {
    auto fields = SplitFields(loadavg);
    if (fields.size() < 3) return std::nullopt;
    std::array<double, 3> load{};
    for (size_t i = 0; i < 3; ++i) {
        auto value = ToDouble(fields[i]);
        if (!value) return std::nullopt;
        load[i] = *value;
    }
    return load;
}

std::optional<double> ParseUptime(std::string_view uptime) {
    auto fields = SplitFields(uptime);
    if (fields.empty()) return std::nullopt;
    return ToDouble(fields[0]);
}

std::optional<ProcStat> ParseProcStat(std::string_view stat) {
    auto open = stat.find('(');
    auto close = stat.rfind(')');
    if (open == std::string_view::npos || close == std::string_view::npos || close < open) {
        return std::nullopt;
    }

    ProcStat out;
    auto pid = ToI64(Trim(stat.substr(0, open)));
    if (!pid) return std::nullopt;
    out.pid = static_cast<int>(*pid);
    out.comm = std::string(stat.substr(open + 1, close - open - 1));

    // Fields after comm, numbered from 3 (state) as in proc(5).
    auto rest = SplitFields(stat.substr(close + 1));
    auto field = [&rest](size_t number) -> const std::string& {
        static const std::string kEmpty;
        const size_t index = number - 3;
        return index < rest.size() ? rest[index] : kEmpty;
    };
    if (rest.size() < 22) return std::nullopt;

    out.state = field(3).empty() ? '?' : field(3)[0];
    out.ppid = static_cast<int>(ToI64(field(4)).value_or(0));
    out.utime = ToU64(field(14)).value_or(0);
    out.stime = ToU64(field(15)).value_or(0);
    out.start_time = ToU64(field(22)).value_or(0);
    out.vsize = ToU64(field(23)).value_or(0);
    out.rss_pages = ToI64(field(24)).value_or(0);
    return out;
}

std::string ProcessStateName(char state) {
    switch (state) {
        case 'R': return "Running";
        case 'S': return "Sleeping";
        case 'D': return "Disk Sleep";
        case 'Z': return "Zombie";
        case 'T': return "Stopped";
        case 't': return "Tracing Stop";
        case 'X':
        case 'x': return "Dead";
        case 'I': return "Idle";
        case 'K': return "Wakekill";
        case 'W': return "Waking";
        case 'P': return "Parked";
        default:  return "Unknown";
    }
}

std::string JoinCmdline(std::string_view cmdline) {
    std::string joined;
    size_t start = 0;
    while (start < cmdline.size()) {
        auto end = cmdline.find('\0', start);
        if (end == std::string_view::npos) end = cmdline.size();
        if (end > start) {
            if (!joined.empty()) joined.push_back(' ');
            joined.append(cmdline.substr(start, end - start));
        }
        start = end + 1;
    }
    return joined;
}

// ---------------------------------------------------------------------------
// ProcfsSystemSource
// ---------------------------------------------------------------------------

ProcfsSystemSource::ProcfsSystemSource(ProcfsOptions options)
    : options_(std::move(options)) {
    if (options_.clock_ticks <= 0) {
        options_.clock_ticks = sysconf(_SC_CLK_TCK);
        if (options_.clock_ticks <= 0) options_.clock_ticks = 100;
    }
    if (options_.page_size <= 0) {
        options_.page_size = sysconf(_SC_PAGESIZE);
        if (options_.page_size <= 0) options_.page_size = 4096;
    }
    if (!options_.statfs) options_.statfs = StatVfs;
}

void ProcfsSystemSource::Pause() const {
    if (options_.sample_interval.count() > 0) {
        std::this_thread::sleep_for(options_.sample_interval);
    }
}

uint64_t ProcfsSystemSource::RssBytes(const ProcStat& stat) const {
    if (stat.rss_pages <= 0) return 0;
    return static_cast<uint64_t>(stat.rss_pages) * static_cast<uint64_t>(options_.page_size);
}

Result<CpuTimes, Error> ProcfsSystemSource::SampleCpu() {
    auto text = ReadWholeFile(options_.procfs_root / "stat", "System");
    if (text.IsErr()) return Result<CpuTimes, Error>::Err(std::move(text).Error());
    auto times = ParseCpuTimes(text.Value());
    if (!times) {
        return Result<CpuTimes, Error>::Err(Error::Make(
            "System", "Unrecognised /proc/stat format", ErrorCategory::Io));
    }
    return Result<CpuTimes, Error>::Ok(*times);
}

std::vector<ProcfsSystemSource::ProcessSample> ProcfsSystemSource::SampleProcesses() {
    std::vector<ProcessSample> samples;
    std::error_code ec;
    std::filesystem::directory_iterator it(options_.procfs_root, ec);
    if (ec) return samples;

    for (const auto& entry : it) {
        const auto name = entry.path().filename().string();
        if (!IsPidDirectory(name)) continue;
        // Processes may exit between listing and reading.
        auto text = ReadWholeFile(entry.path() / "stat", "System");
        if (text.IsErr()) continue;
        auto stat = ParseProcStat(text.Value());
        if (!stat) continue;
        const uint64_t ticks = stat->utime + stat->stime;
        samples.push_back(ProcessSample{std::move(*stat), ticks});
    }
    return samples;
}

Result<SystemOverview, Error> ProcfsSystemSource::ReadOverview() {
    SystemOverview overview;

    auto stat_text = ReadWholeFile(options_.procfs_root / "stat", "System");
    if (stat_text.IsErr()) return Result<SystemOverview, Error>::Err(std::move(stat_text).Error());
    auto before = ParseCpuTimes(stat_text.Value());
    overview.cpu.cores = CountCpus(stat_text.Value());

    auto cpuinfo = ReadWholeFile(options_.procfs_root / "cpuinfo", "System");
    if (cpuinfo.IsOk()) overview.cpu.model = ParseCpuModel(cpuinfo.Value());
    if (overview.cpu.model.empty()) overview.cpu.model = "Unknown";
    if (overview.cpu.cores == 0) overview.cpu.cores = 1;

    if (before) {
        Pause();
        auto after = SampleCpu();
        if (after.IsOk()) overview.cpu.usage_percent = CpuUsageBetween(*before, after.Value());
    }

    auto meminfo = ReadWholeFile(options_.procfs_root / "meminfo", "System");
    if (meminfo.IsErr()) return Result<SystemOverview, Error>::Err(std::move(meminfo).Error());
    auto memory = ParseMeminfo(meminfo.Value());
    if (!memory) {
        return Result<SystemOverview, Error>::Err(Error::Make(
            "System", "Unrecognised /proc/meminfo format", ErrorCategory::Io));
    }
    overview.memory = *memory;

    auto disks = ReadDisks();
    if (disks.IsOk()) {
        for (const auto& disk : disks.Value()) {
            overview.disk_total += disk.total;
            overview.disk_free += disk.available;
        }
    } else {
        LogWarn("system", "disk totals unavailable: " + disks.Error().message);
    }

    if (auto uptime = ReadWholeFile(options_.procfs_root / "uptime", "System"); uptime.IsOk()) {
        if (auto seconds = ParseUptime(uptime.Value())) {
            overview.uptime_seconds = static_cast<uint64_t>(*seconds);
        }
    }
    if (auto load = ReadWholeFile(options_.procfs_root / "loadavg", "System"); load.IsOk()) {
        if (auto parsed = ParseLoadavg(load.Value())) overview.load_average = *parsed;
    }

    return Result<SystemOverview, Error>::Ok(std::move(overview));
}

Result<std::vector<DiskInfo>, Error> ProcfsSystemSource::ReadDisks() {
    auto mounts = ReadWholeFile(options_.procfs_root / "mounts", "System");
    if (mounts.IsErr()) {
        return Result<std::vector<DiskInfo>, Error>::Err(std::move(mounts).Error());
    }

    std::vector<DiskInfo> disks;
    for (const auto& entry : ParseMounts(mounts.Value())) {
        auto usage = options_.statfs(entry.mount_point);
        if (!usage || usage->total == 0) continue;

        DiskInfo disk;
        disk.device = entry.device;
        disk.filesystem = entry.filesystem;
        disk.mount_point = entry.mount_point;
        disk.total = usage->total;
        disk.available = usage->available;
        disk.used = usage->total > usage->free ? usage->total - usage->free : 0;
        disks.push_back(std::move(disk));
    }
    return Result<std::vector<DiskInfo>, Error>::Ok(std::move(disks));
}

Result<std::vector<ProcessInfo>, Error> ProcfsSystemSource::ListProcesses() {
    auto total_before = SampleCpu();
    if (total_before.IsErr()) {
        return Result<std::vector<ProcessInfo>, Error>::Err(std::move(total_before).Error());
    }
    auto first = SampleProcesses();
    Pause();
    auto total_after = SampleCpu();
    if (total_after.IsErr()) {
        return Result<std::vector<ProcessInfo>, Error>::Err(std::move(total_after).Error());
    }
    auto second = SampleProcesses();

    uint32_t cores = 1;
    if (auto stat = ReadWholeFile(options_.procfs_root / "stat", "System"); stat.IsOk()) {
        cores = std::max<uint32_t>(1, CountCpus(stat.Value()));
    }

    std::unordered_map<int, const ProcessSample*> earlier;
    for (const auto& sample : first) earlier[sample.stat.pid] = &sample;

    const uint64_t elapsed = total_after.Value().total > total_before.Value().total
                                 ? total_after.Value().total - total_before.Value().total
                                 : 0;

    std::vector<ProcessInfo> processes;
    processes.reserve(second.size());
    for (const auto& sample : second) {
        ProcessInfo info;
        info.pid = sample.stat.pid;
        info.name = sample.stat.comm;
        info.memory_bytes = RssBytes(sample.stat);

        auto prev = earlier.find(sample.stat.pid);
        if (elapsed > 0 && prev != earlier.end() &&
            prev->second->stat.start_time == sample.stat.start_time &&
            sample.ticks >= prev->second->ticks) {
            const double share = static_cast<double>(sample.ticks - prev->second->ticks) /
                                 static_cast<double>(elapsed);
            info.cpu_percent = RoundTenth(share * 100.0 * cores);
        }
        processes.push_back(std::move(info));
    }

    LogDebug("system", std::to_string(processes.size()) + " process(es)");
    return Result<std::vector<ProcessInfo>, Error>::Ok(std::move(processes));
}

Result<ProcessDetails, Error> ProcfsSystemSource::ReadProcess(int pid) {
    const auto dir = options_.procfs_root / std::to_string(pid);

    auto read_stat = [&dir]() -> std::optional<ProcStat> {
        auto text = ReadWholeFile(dir / "stat", "System");
        if (text.IsErr()) return std::nullopt;
        return ParseProcStat(text.Value());
    };

    auto total_before = SampleCpu();
    auto first = read_stat();
    if (!first) return Result<ProcessDetails, Error>::Err(ProcessNotFound(pid));

    Pause();
    auto total_after = SampleCpu();
    auto second = read_stat();
    if (!second) return Result<ProcessDetails, Error>::Err(ProcessNotFound(pid));

    ProcessDetails details;
    details.process.pid = pid;
    details.process.name = second->comm;
    details.process.memory_bytes = RssBytes(*second);
    details.state = ProcessStateName(second->state);
    details.virtual_memory_bytes = second->vsize;
    if (second->ppid > 0) details.parent_pid = second->ppid;

    if (total_before.IsOk() && total_after.IsOk() &&
        total_after.Value().total > total_before.Value().total) {
        uint32_t cores = 1;
        if (auto stat = ReadWholeFile(options_.procfs_root / "stat", "System"); stat.IsOk()) {
            cores = std::max<uint32_t>(1, CountCpus(stat.Value()));
        }
        const uint64_t before_ticks = first->utime + first->stime;
        const uint64_t after_ticks = second->utime + second->stime;
        if (after_ticks >= before_ticks) {
            const double share =
                static_cast<double>(after_ticks - before_ticks) /
                static_cast<double>(total_after.Value().total - total_before.Value().total);
            details.process.cpu_percent = RoundTenth(share * 100.0 * cores);
        }
    }

    if (auto uptime = ReadWholeFile(options_.procfs_root / "uptime", "System"); uptime.IsOk()) {
        if (auto seconds = ParseUptime(uptime.Value())) {
            const double started =
                static_cast<double>(second->start_time) / static_cast<double>(options_.clock_ticks);
            if (*seconds > started) {
                details.run_time_seconds = static_cast<uint64_t>(*seconds - started);
            }
        }
    }

    std::error_code ec;
    auto exe = std::filesystem::read_symlink(dir / "exe", ec);
    if (!ec) details.executable = exe.string();
    auto cwd = std::filesystem::read_symlink(dir / "cwd", ec);
    if (!ec) details.working_directory = cwd.string();

    if (auto cmdline = ReadWholeFile(dir / "cmdline", "System"); cmdline.IsOk()) {
        details.command = JoinCmdline(cmdline.Value());
    }

    return Result<ProcessDetails, Error>::Ok(std::move(details));
}

} // namespace envsense
