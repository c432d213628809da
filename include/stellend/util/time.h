// STELLEND - Time Utilities
// Copyright (c) 2024 STELLEND Developers
// MIT License
//
// Wall-clock access with mock time for tests and replay tools.

#ifndef STELLEND_UTIL_TIME_H
#define STELLEND_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <string>

namespace stellend {
namespace util {

using SystemClock = std::chrono::system_clock;
using SystemTimePoint = SystemClock::time_point;
using Seconds = std::chrono::seconds;

// ============================================================================
// Current Time
// ============================================================================

/// Get current Unix timestamp in seconds (mock time when enabled)
int64_t GetTime();

/// Convert Unix timestamp to time point
SystemTimePoint FromUnixTime(int64_t timestamp);

/// Convert time point to Unix timestamp
int64_t ToUnixTime(SystemTimePoint tp);

// ============================================================================
// Formatting
// ============================================================================

/// Format as ISO 8601 in UTC (2024-01-15T10:30:00Z)
std::string FormatISO8601(SystemTimePoint tp);

/// Format a duration as "1d 2h 3m 4s"
std::string FormatDuration(Seconds duration);

// ============================================================================
// Mock Time (for testing)
// ============================================================================

/// Enable mock time (GetTime returns the mock value)
void EnableMockTime();

/// Disable mock time
void DisableMockTime();

/// Check if mock time is enabled
bool IsMockTimeEnabled();

/// Set mock time (Unix timestamp)
void SetMockTime(int64_t timestamp);

/// Advance mock time by duration
void AdvanceMockTime(Seconds duration);

} // namespace util
} // namespace stellend

#endif // STELLEND_UTIL_TIME_H
