// NeuroShield - Time Utilities
// Copyright (c) 2024 NeuroShield Developers
// MIT License
//
// Wall-clock access with a process-wide mock clock. Everything that stamps
// ledger commands or judges staleness reads time through GetTime() so that
// tests and regtest sessions can drive the clock explicitly.

#ifndef NEUROSHIELD_UTIL_TIME_H
#define NEUROSHIELD_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <string>

namespace neuroshield {
namespace util {

using Seconds = std::chrono::seconds;
using Milliseconds = std::chrono::milliseconds;

// ============================================================================
// Unix Timestamps
// ============================================================================

/// Current Unix time in seconds (mock time if enabled)
int64_t GetTime();

/// Current Unix time in milliseconds (mock time if enabled)
int64_t GetTimeMillis();

// ============================================================================
// Formatting
// ============================================================================

/// "2024-01-15T10:30:00Z"
std::string FormatISO8601(int64_t timestamp);

/// "2d 23h 59m 10s"; negative durations are prefixed with '-'
std::string FormatDuration(int64_t seconds);

// ============================================================================
// Mock Time (for testing and regtest)
// ============================================================================

/// Freeze the clock at the current time (or at the last SetMockTime value)
void EnableMockTime();

void DisableMockTime();

bool IsMockTimeEnabled();

void SetMockTime(int64_t timestamp);

void AdvanceMockTime(Seconds duration);

/// Mock clock value (0 if never set)
int64_t GetMockTime();

} // namespace util
} // namespace neuroshield

#endif // NEUROSHIELD_UTIL_TIME_H
