#pragma once

#include <envsense/core/result.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace envsense {

// ---------------------------------------------------------------------------
// CommandOutput: what a finished child process produced.
// ---------------------------------------------------------------------------
struct CommandOutput {
    int exit_code = 0;
    std::string out;
    std::string err;

    [[nodiscard]] bool Succeeded() const noexcept { return exit_code == 0; }
};

// ---------------------------------------------------------------------------
// ICommandRunner: runs an external program without a shell.
//
// Implementations must:
//   - return PlatformUnsupported when argv[0] cannot be executed,
//   - return Timeout (after killing the child) when `timeout` elapses,
//   - return the exit code and captured output otherwise, even when the
//     exit code is non-zero.
// ---------------------------------------------------------------------------
class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;

    ICommandRunner(const ICommandRunner&) = delete;
    ICommandRunner& operator=(const ICommandRunner&) = delete;

    [[nodiscard]] virtual Result<CommandOutput, Error> Run(
        const std::vector<std::string>& argv,
        std::chrono::milliseconds timeout) = 0;

protected:
    ICommandRunner() = default;
};

// fork/execvp implementation. Output of each stream is capped at 4 MiB.
class PosixCommandRunner : public ICommandRunner {
public:
    PosixCommandRunner() = default;

    [[nodiscard]] Result<CommandOutput, Error> Run(
        const std::vector<std::string>& argv,
        std::chrono::milliseconds timeout) override;
};

} // namespace envsense
