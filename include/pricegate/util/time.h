// PRICEGATE - Time Utilities
// Copyright (c) 2024 PRICEGATE Developers
// MIT License
//
// Current Unix time, clock sources for price freshness checks, and mock
// time for tests.

#ifndef PRICEGATE_UTIL_TIME_H
#define PRICEGATE_UTIL_TIME_H

#include <cstdint>
#include <string>

namespace pricegate {
namespace util {

// ============================================================================
// Unix Timestamps
// ============================================================================

/// Current Unix timestamp in seconds (mock time if enabled)
int64_t GetTime();

/// Format as ISO 8601 UTC (e.g., "2024-01-15T10:30:00Z"). Timestamps outside
/// the calendar range of the platform come back as plain decimal seconds.
std::string FormatISO8601(int64_t timestamp);

// ============================================================================
// Mock Time (for testing)
// ============================================================================

/// Make GetTime() return the mock timestamp
void EnableMockTime();

void DisableMockTime();

void SetMockTime(int64_t timestamp);

// ============================================================================
// Clock Sources
// ============================================================================

/// Source of the current Unix time in seconds
class IClock {
public:
    virtual ~IClock() = default;

    virtual int64_t Now() const = 0;
};

/// System wall clock (honours mock time)
class WallClock : public IClock {
public:
    int64_t Now() const override { return GetTime(); }
};

/// Clock pinned to a single instant
class FixedClock : public IClock {
public:
    explicit FixedClock(int64_t timestamp) : timestamp_(timestamp) {}

    int64_t Now() const override { return timestamp_; }

private:
    int64_t timestamp_;
};

} // namespace util
} // namespace pricegate

#endif // PRICEGATE_UTIL_TIME_H
