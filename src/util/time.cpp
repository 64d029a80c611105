// PRICEGATE - Time Utilities Implementation
// Copyright (c) 2024 PRICEGATE Developers
// MIT License

#include "pricegate/util/time.h"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace pricegate {
namespace util {

namespace {

std::atomic<bool> g_mockTimeEnabled{false};
std::atomic<int64_t> g_mockTime{0};

} // namespace

int64_t GetTime() {
    if (g_mockTimeEnabled.load()) {
        return g_mockTime.load();
    }
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string FormatISO8601(int64_t timestamp) {
    std::time_t time = static_cast<std::time_t>(timestamp);
    std::tm tm_buf{};
#ifdef _WIN32
    bool converted = gmtime_s(&tm_buf, &time) == 0;
#else
    bool converted = gmtime_r(&time, &tm_buf) != nullptr;
#endif
    if (!converted || static_cast<int64_t>(time) != timestamp) {
        return std::to_string(timestamp);
    }

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

void EnableMockTime() {
    g_mockTimeEnabled.store(true);
}

void DisableMockTime() {
    g_mockTimeEnabled.store(false);
}

void SetMockTime(int64_t timestamp) {
    g_mockTime.store(timestamp);
}

} // namespace util
} // namespace pricegate
