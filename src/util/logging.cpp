// PRICEGATE - Logging Implementation
// Copyright (c) 2024 PRICEGATE Developers
// MIT License

#include "pricegate/util/logging.h"

#include <cstdio>
#include <ctime>
#include <iomanip>

#include <unistd.h>

namespace pricegate {
namespace util {

const char* LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
        default:              return "UNKNOWN";
    }
}

// ============================================================================
// ConsoleSink
// ============================================================================

namespace {

const char* ColorCode(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        default:              return "";
    }
}

} // namespace

std::string ConsoleSink::Format(const LogEntry& entry) const {
    std::ostringstream oss;

    if (options_.showTimestamp) {
        std::time_t time = std::chrono::system_clock::to_time_t(entry.timestamp);
        std::tm tm_buf{};
        if (localtime_r(&time, &tm_buf) != nullptr) {
            oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << " ";
        }
    }

    oss << "[" << LogLevelToString(entry.level) << "] ";
    if (!entry.category.empty()) {
        oss << "[" << entry.category << "] ";
    }
    oss << entry.message;
    return oss.str();
}

void ConsoleSink::Write(const LogEntry& entry) {
    std::string line = Format(entry);
    const char* color = ColorCode(entry.level);

    std::lock_guard<std::mutex> lock(mutex_);
    if (options_.useColors && *color != '\0' && isatty(fileno(stderr))) {
        std::fprintf(stderr, "%s%s\033[0m\n", color, line.c_str());
    } else {
        std::fprintf(stderr, "%s\n", line.c_str());
    }
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(stderr);
}

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

void Logger::AddSink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::ClearSinks() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.clear();
}

void Logger::Log(LogLevel level, const std::string& category, const std::string& message) {
    if (!WillLog(level)) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.category = category;
    entry.message = message;
    entry.timestamp = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Write(entry);
    }
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Flush();
    }
}

LogStream::~LogStream() {
    Logger::Instance().Log(level_, category_, stream_.str());
}

} // namespace util
} // namespace pricegate
