#include <envsense/sensors/git.hpp>

#include <envsense/core/log.hpp>
#include <envsense/platform/file_reader.hpp>

#include <filesystem>

namespace envsense {

namespace {

constexpr char kFieldSep = '\x1f';
constexpr char kRecordSep = '\x1e';
constexpr const char* kLogFormat = "--format=%H%x1f%an%x1f%at%x1f%s%x1e";

std::vector<std::string> Split(std::string_view text, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        auto pos = text.find(sep, start);
        if (pos == std::string_view::npos) {
            parts.emplace_back(text.substr(start));
            break;
        }
        parts.emplace_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

bool MentionsNoCommits(const CommandOutput& out) {
    return out.err.find("does not have any commits") != std::string::npos ||
           out.err.find("unknown revision") != std::string::npos ||
           out.err.find("bad default revision") != std::string::npos;
}

} // anonymous namespace

void ParsePorcelainStatus(std::string_view out, GitStatus& status) {
    for (const auto& line : SplitLines(out)) {
        if (line.size() < 3) continue;

        if (line.rfind("## ", 0) == 0) {
            std::string header = line.substr(3);
            if (header.rfind("No commits yet on ", 0) == 0) {
                status.branch = header.substr(18);
            } else if (header.rfind("Initial commit on ", 0) == 0) {
                status.branch = header.substr(18);
            } else if (header.rfind("HEAD (no branch)", 0) == 0) {
                status.branch.reset();
            } else {
                auto end = header.find("...");
                if (end == std::string::npos) end = header.find(' ');
                status.branch = header.substr(0, end);
            }
            continue;
        }

        const char x = line[0];
        const char y = line[1];
        std::string path = line.substr(3);
        // Renames and copies are reported as "old -> new".
        if (auto arrow = path.find(" -> "); arrow != std::string::npos) {
            path = path.substr(arrow + 4);
        }

        if (x == '?' && y == '?') {
            status.untracked.push_back(path);
            continue;
        }
        if (x == '!') continue;
        if (x != ' ') status.staged.push_back(path);
        if (y != ' ') status.modified.push_back(path);
    }
}

std::vector<GitCommit> ParseLogRecords(std::string_view out) {
    std::vector<GitCommit> commits;
    for (auto& record : Split(out, kRecordSep)) {
        auto trimmed = Trim(record);
        if (trimmed.empty()) continue;
        auto fields = Split(trimmed, kFieldSep);
        if (fields.size() < 4) continue;

        GitCommit commit;
        commit.id = fields[0];
        commit.author = fields[1];
        try {
            commit.timestamp = std::stoll(fields[2]);
        } catch (const std::exception&) {
            commit.timestamp = 0;
        }
        commit.summary = fields[3];
        commits.push_back(std::move(commit));
    }
    return commits;
}

GitCliSource::GitCliSource(ICommandRunner& runner, std::chrono::milliseconds timeout)
    : runner_(runner), timeout_(timeout) {}

Result<std::string, Error> GitCliSource::ResolveRoot(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_directory(path, ec)) {
        return Result<std::string, Error>::Err(Error::Make(
            "Git", "Path does not exist or is not a directory: " + path,
            ErrorCategory::NotFound));
    }

    auto out = runner_.Run({"git", "-C", path, "rev-parse", "--show-toplevel"}, timeout_);
    if (out.IsErr()) return Result<std::string, Error>::Err(std::move(out).Error());
    if (!out.Value().Succeeded()) {
        return Result<std::string, Error>::Err(Error{
            "Git", "Not a git repository: " + path, ErrorCategory::NotFound,
            Trim(out.Value().err)});
    }
    return Result<std::string, Error>::Ok(Trim(out.Value().out));
}

Result<std::vector<GitCommit>, Error> GitCliSource::Commits(const std::string& root,
                                                            int count) {
    auto out = runner_.Run({"git", "-C", root, "log", "-n", std::to_string(count), kLogFormat},
                           timeout_);
    if (out.IsErr()) return Result<std::vector<GitCommit>, Error>::Err(std::move(out).Error());
    if (!out.Value().Succeeded()) {
        if (MentionsNoCommits(out.Value())) {
            return Result<std::vector<GitCommit>, Error>::Ok(std::vector<GitCommit>{});
        }
        return Result<std::vector<GitCommit>, Error>::Err(Error{
            "Git", "git log failed", ErrorCategory::Io, Trim(out.Value().err)});
    }
    return Result<std::vector<GitCommit>, Error>::Ok(ParseLogRecords(out.Value().out));
}

Result<GitStatus, Error> GitCliSource::ReadStatus(const std::string& path) {
    auto root = ResolveRoot(path);
    if (root.IsErr()) return Result<GitStatus, Error>::Err(std::move(root).Error());

    GitStatus status;
    status.repository = root.Value();

    auto out = runner_.Run({"git", "-C", status.repository, "status", "--porcelain=v1",
                            "--branch", "--untracked-files=all"},
                           timeout_);
    if (out.IsErr()) return Result<GitStatus, Error>::Err(std::move(out).Error());
    if (!out.Value().Succeeded()) {
        return Result<GitStatus, Error>::Err(Error{
            "Git", "git status failed", ErrorCategory::Io, Trim(out.Value().err)});
    }
    ParsePorcelainStatus(out.Value().out, status);

    auto head = Commits(status.repository, 1);
    if (head.IsErr()) return Result<GitStatus, Error>::Err(std::move(head).Error());
    if (!head.Value().empty()) status.head = head.Value().front();

    LogDebug("git", status.repository + ": " + std::to_string(status.staged.size()) +
                        " staged, " + std::to_string(status.modified.size()) +
                        " modified, " + std::to_string(status.untracked.size()) +
                        " untracked");
    return Result<GitStatus, Error>::Ok(std::move(status));
}

Result<GitLog, Error> GitCliSource::ReadLog(const std::string& path, int count) {
    auto root = ResolveRoot(path);
    if (root.IsErr()) return Result<GitLog, Error>::Err(std::move(root).Error());

    auto commits = Commits(root.Value(), count);
    if (commits.IsErr()) return Result<GitLog, Error>::Err(std::move(commits).Error());
    return Result<GitLog, Error>::Ok(GitLog{root.Value(), std::move(commits).Value()});
}

} // namespace envsense
