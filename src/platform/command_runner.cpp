#include <envsense/platform/command_runner.hpp>

#include <envsense/core/log.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace envsense {

namespace {

constexpr size_t kMaxCapture = 4 * 1024 * 1024;

class Fd {
public:
    Fd() = default;
    explicit Fd(int fd) : fd_(fd) {}
    ~Fd() { Close(); }
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    [[nodiscard]] int Get() const noexcept { return fd_; }
    void Reset(int fd) { Close(); fd_ = fd; }
    void Close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_ = -1;
};

struct Pipe {
    Fd read;
    Fd write;

    bool Open() {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) return false;
        read.Reset(fds[0]);
        write.Reset(fds[1]);
        return true;
    }
};

int DecodeWaitStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// Read whatever is available; returns false on EOF.
bool Drain(int fd, std::string& sink) {
    std::array<char, 4096> buffer{};
    ssize_t n = ::read(fd, buffer.data(), buffer.size());
    if (n < 0) {
        return errno == EINTR || errno == EAGAIN;
    }
    if (n == 0) return false;
    if (sink.size() < kMaxCapture) {
        sink.append(buffer.data(),
                    std::min(static_cast<size_t>(n), kMaxCapture - sink.size()));
    }
    return true;
}

[[noreturn]] void ExecChild(const std::vector<std::string>& argv,
                            int out_fd, int err_fd, int status_fd) {
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
        ::dup2(devnull, STDIN_FILENO);
        ::close(devnull);
    }
    ::dup2(out_fd, STDOUT_FILENO);
    ::dup2(err_fd, STDERR_FILENO);

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) {
        args.push_back(const_cast<char*>(a.c_str()));
    }
    args.push_back(nullptr);

    ::execvp(args[0], args.data());

    int err = errno;
    ssize_t ignored = ::write(status_fd, &err, sizeof(err));
    (void)ignored;
    ::_exit(127);
}

} // anonymous namespace

Result<CommandOutput, Error> PosixCommandRunner::Run(
    const std::vector<std::string>& argv,
    std::chrono::milliseconds timeout) {
    if (argv.empty()) {
        return Result<CommandOutput, Error>::Err(Error::Make(
            "Command", "Empty command line", ErrorCategory::Internal));
    }
    const std::string& program = argv.front();

    Pipe out_pipe;
    Pipe err_pipe;
    Pipe status_pipe;
    if (!out_pipe.Open() || !err_pipe.Open() || !status_pipe.Open()) {
        return Result<CommandOutput, Error>::Err(
            Error::FromErrno("Command", errno, program));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        return Result<CommandOutput, Error>::Err(
            Error::FromErrno("Command", errno, program));
    }
    if (pid == 0) {
        ExecChild(argv, out_pipe.write.Get(), err_pipe.write.Get(),
                  status_pipe.write.Get());
    }

    out_pipe.write.Close();
    err_pipe.write.Close();
    status_pipe.write.Close();

    // The status pipe is close-on-exec: EOF means the exec succeeded.
    int exec_errno = 0;
    ssize_t got = 0;
    do {
        got = ::read(status_pipe.read.Get(), &exec_errno, sizeof(exec_errno));
    } while (got < 0 && errno == EINTR);

    if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        if (exec_errno == ENOENT) {
            return Result<CommandOutput, Error>::Err(Error{
                "Command", "'" + program + "' is not installed or not on PATH",
                ErrorCategory::PlatformUnsupported, std::nullopt});
        }
        return Result<CommandOutput, Error>::Err(
            Error::FromErrno("Command", exec_errno, program));
    }

    LogDebug("command", "spawned " + program + " (pid " + std::to_string(pid) + ")");

    CommandOutput output;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    bool out_open = true;
    bool err_open = true;

    auto kill_on_timeout = [&]() {
        ::kill(pid, SIGKILL);
        int status = 0;
        ::waitpid(pid, &status, 0);
        return Result<CommandOutput, Error>::Err(Error{
            "Command",
            "'" + program + "' did not finish within " +
                std::to_string(timeout.count()) + " ms",
            ErrorCategory::Timeout, std::nullopt});
    };

    while (out_open || err_open) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return kill_on_timeout();
        }

        std::array<pollfd, 2> fds{};
        nfds_t count = 0;
        if (out_open) fds[count++] = {out_pipe.read.Get(), POLLIN, 0};
        if (err_open) fds[count++] = {err_pipe.read.Get(), POLLIN, 0};

        int ready = ::poll(fds.data(), count, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::kill(pid, SIGKILL);
            int status = 0;
            ::waitpid(pid, &status, 0);
            return Result<CommandOutput, Error>::Err(
                Error::FromErrno("Command", err, program));
        }

        for (nfds_t i = 0; i < count; ++i) {
            if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;
            if (fds[i].fd == out_pipe.read.Get()) {
                out_open = Drain(fds[i].fd, output.out);
            } else {
                err_open = Drain(fds[i].fd, output.err);
            }
        }
    }

    // Both pipes are closed, but the child may still be running.
    int status = 0;
    for (;;) {
        const pid_t reaped = ::waitpid(pid, &status, WNOHANG);
        if (reaped == pid) break;
        if (reaped < 0) {
            if (errno == EINTR) continue;
            return Result<CommandOutput, Error>::Err(
                Error::FromErrno("Command", errno, program));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return kill_on_timeout();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    output.exit_code = DecodeWaitStatus(status);
    return Result<CommandOutput, Error>::Ok(std::move(output));
}

} // namespace envsense
