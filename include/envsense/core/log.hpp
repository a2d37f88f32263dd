#pragma once

#include <envsense/core/result.hpp>

#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>

namespace envsense {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

// "debug" / "info" / "warn" / "error" (case-insensitive, "warning" accepted).
[[nodiscard]] Result<LogLevel, Error> ParseLogLevel(std::string_view text);
[[nodiscard]] const char* LogLevelName(LogLevel level) noexcept;

// Abstract log sink. Implementations never write to stdout: stdout carries
// the MCP protocol stream.
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(LogLevel level, std::string_view component,
                       std::string_view message) = 0;
};

// Human-readable lines: "<ISO-8601> [LEVEL] [component] message".
class ConsoleSink : public ILogSink {
public:
    explicit ConsoleSink(std::ostream& out = std::cerr) : out_(out) {}
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::ostream& out_;
};

// One JSON object per line: {"ts":..,"level":..,"component":..,"message":..}.
class JsonSink : public ILogSink {
public:
    explicit JsonSink(std::ostream& out) : out_(out) {}
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::ostream& out_;
};

// Appends to a file, in plain or JSON line format.
class FileSink : public ILogSink {
public:
    // Fails when the file cannot be opened for appending.
    static Result<std::unique_ptr<FileSink>, Error> Open(const std::string& path,
                                                         bool json);

    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;

private:
    FileSink(std::ofstream file, bool json);

    std::ofstream file_;
    std::unique_ptr<ILogSink> format_;
};

// Thread-safe logger that dispatches to a sink.
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info);

    void SetLevel(LogLevel level);
    [[nodiscard]] bool Enabled(LogLevel level) const;

    void Debug(std::string_view component, std::string_view message);
    void Info(std::string_view component, std::string_view message);
    void Warn(std::string_view component, std::string_view message);
    void Error(std::string_view component, std::string_view message);

private:
    void Log(LogLevel level, std::string_view component,
             std::string_view message);

    std::unique_ptr<ILogSink> sink_;
    LogLevel min_level_;
    mutable std::mutex mutex_;
};

// ---------------------------------------------------------------------------
// Global logger: installed once in main(), used by every component.
// ---------------------------------------------------------------------------

/// Replace the global logger. Before the first call, messages are dropped.
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level);

Logger& GlobalLogger();

void LogDebug(std::string_view component, std::string_view message);
void LogInfo(std::string_view component, std::string_view message);
void LogWarn(std::string_view component, std::string_view message);
void LogError(std::string_view component, std::string_view message);

} // namespace envsense
