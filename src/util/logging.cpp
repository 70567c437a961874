// SECPCORE - Logging Implementation
// Copyright (c) 2024 SECPCORE Developers
// MIT License

#include "secpcore/util/logging.h"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>

#include <unistd.h>

namespace secpcore {
namespace util {

namespace {

std::string FormatTimestamp(std::chrono::system_clock::time_point tp) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;

    std::tm local;
    localtime_r(&seconds, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis;
    return oss.str();
}

const char* Basename(const std::string& path) {
    size_t slash = path.find_last_of('/');
    return path.c_str() + (slash == std::string::npos ? 0 : slash + 1);
}

const char* ColorFor(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        default:              return "";
    }
}

} // anonymous namespace

// ============================================================================
// Levels
// ============================================================================

const char* LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

LogLevel LogLevelFromString(const std::string& str) {
    std::string name;
    for (char c : str) {
        name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    static const std::pair<const char*, LogLevel> names[] = {
        {"trace", LogLevel::Trace}, {"debug", LogLevel::Debug},
        {"info", LogLevel::Info},   {"warn", LogLevel::Warn},
        {"warning", LogLevel::Warn}, {"error", LogLevel::Error},
        {"off", LogLevel::Off},
    };
    for (const auto& [key, level] : names) {
        if (name == key) {
            return level;
        }
    }
    return LogLevel::Info;
}

std::string FormatLogEntry(const LogEntry& entry, const LogFormat& format) {
    std::ostringstream oss;

    if (format.showTimestamp) {
        oss << FormatTimestamp(entry.timestamp) << ' ';
    }
    if (format.showLevel) {
        oss << '[' << std::left << std::setw(5) << LogLevelToString(entry.level) << "] ";
    }
    if (format.showCategory && !entry.category.empty() &&
        entry.category != LogCategory::DEFAULT) {
        oss << '[' << entry.category << "] ";
    }
    if (format.showLocation && !entry.file.empty()) {
        oss << Basename(entry.file) << ':' << entry.line << ' ';
    }

    oss << entry.message;
    return oss.str();
}

// ============================================================================
// Sinks
// ============================================================================

void LogSink::Submit(const LogEntry& entry) {
    if (entry.level >= GetLevel()) {
        Write(entry);
    }
}

ConsoleSink::ConsoleSink(const Config& config)
    : LogSink(config.level), config_(config) {}

void ConsoleSink::Write(const LogEntry& entry) {
    std::string line = FormatLogEntry(entry, config_.format);

    std::lock_guard<std::mutex> lock(mutex_);
    FILE* out = (config_.useStderr && entry.level >= LogLevel::Error) ? stderr : stdout;
    const char* color = config_.useColors && isatty(fileno(out)) ? ColorFor(entry.level) : "";

    if (*color) {
        std::fprintf(out, "%s%s\033[0m\n", color, line.c_str());
    } else {
        std::fprintf(out, "%s\n", line.c_str());
    }
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(stdout);
    std::fflush(stderr);
}

FileSink::FileSink(const Config& config)
    : LogSink(config.level)
    , config_(config)
    , file_(config.path, config.append ? std::ios::out | std::ios::app : std::ios::out) {}

void FileSink::Write(const LogEntry& entry) {
    std::string line = FormatLogEntry(entry, config_.format);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_.is_open()) {
        return;
    }
    file_ << line << '\n';
    if (config_.autoFlush) {
        file_.flush();
    }
}

void FileSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    file_.flush();
}

CallbackSink::CallbackSink(Callback callback, LogLevel level)
    : LogSink(level), callback_(std::move(callback)) {}

void CallbackSink::Write(const LogEntry& entry) {
    if (callback_) {
        callback_(entry);
    }
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

void Logger::AddSink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::ClearSinks() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.clear();
}

std::vector<std::shared_ptr<LogSink>> Logger::Snapshot() const {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    return sinks_;
}

void Logger::Log(LogLevel level, const std::string& category, const std::string& message,
                 const char* file, int line) {
    if (!WillLog(level)) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.category = category;
    entry.message = message;
    entry.file = file ? file : "";
    entry.line = line;
    entry.timestamp = std::chrono::system_clock::now();

    for (const auto& sink : Snapshot()) {
        sink->Submit(entry);
    }
}

void Logger::Flush() {
    for (const auto& sink : Snapshot()) {
        sink->Flush();
    }
}

void Logger::Shutdown() {
    Flush();
    ClearSinks();
}

// ============================================================================
// Stream Logging and Timers
// ============================================================================

LogStream::~LogStream() {
    Logger::Instance().Log(level_, category_, stream_.str(), file_, line_);
}

ScopedLogTimer::~ScopedLogTimer() {
    Logger& logger = Logger::Instance();
    if (!logger.WillLog(LogLevel::Debug)) {
        return;
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start_);

    std::ostringstream oss;
    oss << "Completed: " << operation_ << " in " << elapsed.count() << "us";
    logger.Log(LogLevel::Debug, category_, oss.str());
}

} // namespace util
} // namespace secpcore
