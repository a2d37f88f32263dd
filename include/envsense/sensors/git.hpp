#pragma once

#include <envsense/core/result.hpp>
#include <envsense/platform/command_runner.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace envsense {

struct GitCommit {
    std::string id;
    std::string author;
    int64_t timestamp = 0;  // seconds since the epoch
    std::string summary;

    [[nodiscard]] std::string ShortId() const { return id.substr(0, 7); }
};

struct GitStatus {
    std::string repository;             // work tree root
    std::optional<std::string> branch;  // nullopt when HEAD is detached
    std::optional<GitCommit> head;      // nullopt in a repository without commits
    std::vector<std::string> staged;
    std::vector<std::string> modified;
    std::vector<std::string> untracked;

    [[nodiscard]] bool IsClean() const noexcept {
        return staged.empty() && modified.empty() && untracked.empty();
    }
};

struct GitLog {
    std::string repository;
    std::vector<GitCommit> commits;
};

// `git status --porcelain=v1 --branch` output into branch + file lists.
void ParsePorcelainStatus(std::string_view out, GitStatus& status);

// `git log --format=%H%x1f%an%x1f%at%x1f%s%x1e` records.
[[nodiscard]] std::vector<GitCommit> ParseLogRecords(std::string_view out);

class IGitSource {
public:
    virtual ~IGitSource() = default;

    [[nodiscard]] virtual Result<GitStatus, Error> ReadStatus(const std::string& path) = 0;
    [[nodiscard]] virtual Result<GitLog, Error> ReadLog(const std::string& path,
                                                        int count) = 0;
};

// ---------------------------------------------------------------------------
// GitCliSource: shells out to git with `-C <path>`.
// ---------------------------------------------------------------------------
class GitCliSource : public IGitSource {
public:
    GitCliSource(ICommandRunner& runner, std::chrono::milliseconds timeout);

    [[nodiscard]] Result<GitStatus, Error> ReadStatus(const std::string& path) override;
    [[nodiscard]] Result<GitLog, Error> ReadLog(const std::string& path, int count) override;

private:
    [[nodiscard]] Result<std::string, Error> ResolveRoot(const std::string& path);
    [[nodiscard]] Result<std::vector<GitCommit>, Error> Commits(const std::string& root,
                                                                int count);

    ICommandRunner& runner_;
    std::chrono::milliseconds timeout_;
};

} // namespace envsense
