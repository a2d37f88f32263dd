#include <envsense/core/log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace envsense {

namespace {

std::string Iso8601Now() {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

class NullSink : public ILogSink {
public:
    void Write(LogLevel, std::string_view, std::string_view) override {}
};

std::unique_ptr<Logger>& GlobalLoggerInstance() {
    static auto instance = std::make_unique<Logger>(
        std::make_unique<NullSink>(), LogLevel::Error);
    return instance;
}

} // anonymous namespace

Result<LogLevel, Error> ParseLogLevel(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return Result<LogLevel, Error>::Ok(LogLevel::Debug);
    if (lower == "info") return Result<LogLevel, Error>::Ok(LogLevel::Info);
    if (lower == "warn" || lower == "warning") {
        return Result<LogLevel, Error>::Ok(LogLevel::Warn);
    }
    if (lower == "error") return Result<LogLevel, Error>::Ok(LogLevel::Error);

    return Result<LogLevel, Error>::Err(Error::Make(
        "Logger", "Unknown log level '" + std::string(text) +
                      "' (expected debug, info, warn or error)",
        ErrorCategory::Config));
}

const char* LogLevelName(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

// ---------------------------------------------------------------------------
// ConsoleSink
// ---------------------------------------------------------------------------
void ConsoleSink::Write(LogLevel level, std::string_view component,
                        std::string_view message) {
    out_ << Iso8601Now()
         << " [" << LogLevelName(level) << "] "
         << "[" << component << "] "
         << message << '\n';
    out_.flush();
}

// ---------------------------------------------------------------------------
// JsonSink
// ---------------------------------------------------------------------------
void JsonSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    nlohmann::json line = {
        {"ts", Iso8601Now()},
        {"level", LogLevelName(level)},
        {"component", std::string(component)},
        {"message", std::string(message)},
    };
    // Replace invalid UTF-8 rather than throwing from a log call.
    out_ << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
         << '\n';
    out_.flush();
}

// ---------------------------------------------------------------------------
// FileSink
// ---------------------------------------------------------------------------
Result<std::unique_ptr<FileSink>, Error> FileSink::Open(const std::string& path,
                                                        bool json) {
    std::ofstream file(path, std::ios::app);
    if (!file) {
        return Result<std::unique_ptr<FileSink>, Error>::Err(Error::Make(
            "Logger", "Cannot open log file: " + path, ErrorCategory::Config));
    }
    return Result<std::unique_ptr<FileSink>, Error>::Ok(
        std::unique_ptr<FileSink>(new FileSink(std::move(file), json)));
}

FileSink::FileSink(std::ofstream file, bool json) : file_(std::move(file)) {
    if (json) {
        format_ = std::make_unique<JsonSink>(file_);
    } else {
        format_ = std::make_unique<ConsoleSink>(file_);
    }
}

void FileSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    format_->Write(level, component, message);
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------
Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

bool Logger::Enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(level) >= static_cast<int>(min_level_);
}

void Logger::Debug(std::string_view component, std::string_view message) {
    Log(LogLevel::Debug, component, message);
}

void Logger::Info(std::string_view component, std::string_view message) {
    Log(LogLevel::Info, component, message);
}

void Logger::Warn(std::string_view component, std::string_view message) {
    Log(LogLevel::Warn, component, message);
}

void Logger::Error(std::string_view component, std::string_view message) {
    Log(LogLevel::Error, component, message);
}

void Logger::Log(LogLevel level, std::string_view component,
                 std::string_view message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(level) >= static_cast<int>(min_level_)) {
        sink_->Write(level, component, message);
    }
}

// ---------------------------------------------------------------------------
// Global logger
// ---------------------------------------------------------------------------
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    GlobalLoggerInstance() = std::make_unique<Logger>(std::move(sink), min_level);
}

Logger& GlobalLogger() {
    return *GlobalLoggerInstance();
}

void LogDebug(std::string_view component, std::string_view message) {
    GlobalLogger().Debug(component, message);
}

void LogInfo(std::string_view component, std::string_view message) {
    GlobalLogger().Info(component, message);
}

void LogWarn(std::string_view component, std::string_view message) {
    GlobalLogger().Warn(component, message);
}

void LogError(std::string_view component, std::string_view message) {
    GlobalLogger().Error(component, message);
}

} // namespace envsense
