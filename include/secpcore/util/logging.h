// SECPCORE - Logging System
// Copyright (c) 2024 SECPCORE Developers
// MIT License
//
// Leveled logging with per-subsystem categories. The core only emits
// Trace/Debug diagnostics; the CLI decides where they go.

#ifndef SECPCORE_UTIL_LOGGING_H
#define SECPCORE_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace secpcore {
namespace util {

// ============================================================================
// Levels and Categories
// ============================================================================

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Off = 5
};

const char* LogLevelToString(LogLevel level);

/// Case-insensitive; "warning" is accepted, anything unknown maps to Info
LogLevel LogLevelFromString(const std::string& str);

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* FIELD = "field";
    constexpr const char* CURVE = "curve";
    constexpr const char* CLI = "cli";
    constexpr const char* BENCH = "bench";
}

// ============================================================================
// Entries and Formatting
// ============================================================================

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    std::string file;
    int line{0};
    std::chrono::system_clock::time_point timestamp;
};

struct LogFormat {
    bool showTimestamp{true};
    bool showLevel{true};
    bool showCategory{true};
    bool showLocation{false};
};

/// "<time> [LEVEL] [category] file:line message"; the default category is omitted
std::string FormatLogEntry(const LogEntry& entry, const LogFormat& format);

// ============================================================================
// Sinks
// ============================================================================

/// Destination for log entries. Each sink has its own threshold.
class LogSink {
public:
    explicit LogSink(LogLevel level) : level_(level) {}
    virtual ~LogSink() = default;

    LogSink(const LogSink&) = delete;
    LogSink& operator=(const LogSink&) = delete;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Drop entries below the threshold, then Write
    void Submit(const LogEntry& entry);

    virtual void Flush() {}

protected:
    virtual void Write(const LogEntry& entry) = 0;

private:
    std::atomic<LogLevel> level_;
};

/// stdout, with Error entries sent to stderr when useStderr is set
class ConsoleSink : public LogSink {
public:
    struct Config {
        bool useColors{true};
        bool useStderr{true};
        LogFormat format;
        LogLevel level{LogLevel::Info};
    };

    explicit ConsoleSink(const Config& config);

    const Config& GetConfig() const { return config_; }
    void Flush() override;

protected:
    void Write(const LogEntry& entry) override;

private:
    Config config_;
    std::mutex mutex_;
};

/// Single log file, appended to or truncated on open
class FileSink : public LogSink {
public:
    struct Config {
        std::string path;
        bool append{true};
        bool autoFlush{false};
        LogFormat format{true, true, true, true};
        LogLevel level{LogLevel::Debug};
    };

    explicit FileSink(const Config& config);

    bool IsOpen() const { return file_.is_open(); }
    void Flush() override;

protected:
    void Write(const LogEntry& entry) override;

private:
    Config config_;
    std::ofstream file_;
    std::mutex mutex_;
};

/// Hands each entry to a function
class CallbackSink : public LogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    CallbackSink(Callback callback, LogLevel level);

protected:
    void Write(const LogEntry& entry) override;

private:
    Callback callback_;
};

// ============================================================================
// Logger
// ============================================================================

/// Process-wide dispatcher. Sinks are invoked without the registry lock held,
/// so a sink may itself log.
class Logger {
public:
    static Logger& Instance();

    void AddSink(std::shared_ptr<LogSink> sink);
    void ClearSinks();

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    bool WillLog(LogLevel level) const {
        return level != LogLevel::Off && level >= level_.load();
    }

    void Log(LogLevel level, const std::string& category, const std::string& message,
             const char* file = nullptr, int line = 0);

    void Flush();

    /// Flush, then drop every sink
    void Shutdown();

private:
    Logger() = default;

    std::vector<std::shared_ptr<LogSink>> Snapshot() const;

    std::vector<std::shared_ptr<LogSink>> sinks_;
    mutable std::mutex sinksMutex_;
    std::atomic<LogLevel> level_{LogLevel::Info};
};

// ============================================================================
// Stream Logging
// ============================================================================

/// Collects a streamed message and logs it on destruction
class LogStream {
public:
    LogStream(LogLevel level, const char* category, const char* file, int line)
        : level_(level), category_(category), file_(file), line_(line) {}
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    std::ostringstream stream_;
    LogLevel level_;
    const char* category_;
    const char* file_;
    int line_;
};

#define SECPCORE_LOG(level, category) \
    if (::secpcore::util::Logger::Instance().WillLog(::secpcore::util::LogLevel::level)) \
        ::secpcore::util::LogStream(::secpcore::util::LogLevel::level, category, \
                                    __FILE__, __LINE__)

#define LOG_TRACE(category)   SECPCORE_LOG(Trace, category)
#define LOG_DEBUG(category)   SECPCORE_LOG(Debug, category)
#define LOG_INFO(category)    SECPCORE_LOG(Info, category)
#define LOG_WARN(category)    SECPCORE_LOG(Warn, category)
#define LOG_ERROR(category)   SECPCORE_LOG(Error, category)

// ============================================================================
// Scoped Timer
// ============================================================================

/// Logs "Completed: <operation> in <N>us" at Debug when it goes out of scope
class ScopedLogTimer {
public:
    ScopedLogTimer(const char* category, std::string operation)
        : category_(category)
        , operation_(std::move(operation))
        , start_(std::chrono::steady_clock::now()) {}
    ~ScopedLogTimer();

private:
    const char* category_;
    std::string operation_;
    std::chrono::steady_clock::time_point start_;
};

#define SECPCORE_LOG_TIMER_CAT2(a, b) a##b
#define SECPCORE_LOG_TIMER_CAT(a, b) SECPCORE_LOG_TIMER_CAT2(a, b)
#define SECPCORE_LOG_TIMER(category, operation) \
    ::secpcore::util::ScopedLogTimer SECPCORE_LOG_TIMER_CAT(_secpcore_timer_, __LINE__)(category, operation)

} // namespace util
} // namespace secpcore

#endif // SECPCORE_UTIL_LOGGING_H
