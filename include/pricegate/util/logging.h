// PRICEGATE - Logging System
// Copyright (c) 2024 PRICEGATE Developers
// MIT License
//
// A process-wide Logger fans entries out to pluggable sinks. The minimum
// level is decided once, by the Logger; sinks only format and deliver.
//
// Usage:
//   LOG_WARN(util::LogCategory::RECEIVER) << "price rejected: " << reason;

#ifndef PRICEGATE_UTIL_LOGGING_H
#define PRICEGATE_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace pricegate {
namespace util {

// ============================================================================
// Log Levels and Categories
// ============================================================================

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

const char* LogLevelToString(LogLevel level);

namespace LogCategory {
    constexpr const char* RECEIVER = "receiver";
    constexpr const char* CONFIG = "config";
    constexpr const char* CLI = "cli";
}

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
};

// ============================================================================
// Sinks
// ============================================================================

class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;
};

/// Writes to stderr; stdout is reserved for tool output
class ConsoleSink : public ILogSink {
public:
    struct Options {
        bool showTimestamp{true};
        bool useColors{true};   // only when stderr is a terminal
    };

    ConsoleSink() = default;
    explicit ConsoleSink(const Options& options) : options_(options) {}

    void Write(const LogEntry& entry) override;
    void Flush() override;

    /// "[time ][LEVEL] [category] message"
    std::string Format(const LogEntry& entry) const;

private:
    Options options_;
    std::mutex mutex_;
};

/// Hands every entry to a callback (tests, embedding applications)
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback) : callback_(std::move(callback)) {}

    void Write(const LogEntry& entry) override;
    void Flush() override {}

private:
    Callback callback_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void ClearSinks();

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    bool WillLog(LogLevel level) const {
        return level != LogLevel::Off && level >= level_.load();
    }

    void Log(LogLevel level, const std::string& category, const std::string& message);

    void Flush();

private:
    Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    std::mutex sinksMutex_;
    std::atomic<LogLevel> level_{LogLevel::Info};
};

/// Collects one message and hands it to the Logger on destruction
class LogStream {
public:
    LogStream(LogLevel level, const char* category)
        : level_(level), category_(category) {}
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    LogLevel level_;
    const char* category_;
    std::ostringstream stream_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define PRICEGATE_LOG(level, category) \
    if (!::pricegate::util::Logger::Instance().WillLog(::pricegate::util::LogLevel::level)) {} \
    else ::pricegate::util::LogStream(::pricegate::util::LogLevel::level, category)

#define LOG_DEBUG(category) PRICEGATE_LOG(Debug, category)
#define LOG_INFO(category)  PRICEGATE_LOG(Info, category)
#define LOG_WARN(category)  PRICEGATE_LOG(Warn, category)
#define LOG_ERROR(category) PRICEGATE_LOG(Error, category)

} // namespace util
} // namespace pricegate

#endif // PRICEGATE_UTIL_LOGGING_H
