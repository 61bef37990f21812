// FIXEDRATE - Time Utilities
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License
//
// Provides time-related utilities:
// - Unix timestamps
// - Time and duration formatting
// - Duration parsing ("90", "15m", "6h", "7d")
// - Mock time for testing

#ifndef FIXEDRATE_UTIL_TIME_H
#define FIXEDRATE_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace fixedrate {
namespace util {

using SystemClock = std::chrono::system_clock;
using SystemTimePoint = std::chrono::system_clock::time_point;

// ============================================================================
// Constants
// ============================================================================

constexpr int64_t SECONDS_PER_MINUTE = 60;
constexpr int64_t SECONDS_PER_HOUR = 3600;
constexpr int64_t SECONDS_PER_DAY = 86400;
constexpr int64_t SECONDS_PER_WEEK = 604800;
constexpr int64_t SECONDS_PER_YEAR = 365 * SECONDS_PER_DAY;

// ============================================================================
// Unix Timestamps
// ============================================================================

/// Get current Unix timestamp in seconds (mock time when enabled)
int64_t GetTime();

/// Get system time point for current time (mock time when enabled)
SystemTimePoint GetSystemTime();

/// Convert Unix timestamp to system time point
SystemTimePoint FromUnixTime(int64_t timestamp);

/// Convert system time point to Unix timestamp
int64_t ToUnixTime(SystemTimePoint tp);

// ============================================================================
// Formatting and Parsing
// ============================================================================

/// Format Unix timestamp as ISO 8601 (e.g., "2024-01-15T10:30:00Z")
std::string FormatISO8601(int64_t timestamp);

/// Format a duration as "1d 2h 3m 4s"
std::string FormatDuration(int64_t seconds);

/// Parse a duration: plain seconds or a number with one of s/m/h/d/w
std::optional<int64_t> ParseDuration(const std::string& str);

// ============================================================================
// Mock Time (for testing)
// ============================================================================

/// Enable mock time mode
void EnableMockTime();

/// Disable mock time mode
void DisableMockTime();

/// Check if mock time is enabled
bool IsMockTimeEnabled();

/// Set mock time
void SetMockTime(int64_t timestamp);

/// Advance mock time by seconds
void AdvanceMockTime(int64_t seconds);

/// Get mock time
int64_t GetMockTime();

} // namespace util
} // namespace fixedrate

#endif // FIXEDRATE_UTIL_TIME_H
