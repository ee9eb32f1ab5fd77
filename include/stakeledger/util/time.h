// STAKELEDGER - Time Utilities
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License
//
// The ledger clock. Positions are stamped with GetTime() when staked, reward
// accrual measures elapsed seconds against it, and pending claims unlock once
// it reaches their deadline. Tests pin and advance the clock with the mock
// functions to land exactly on accrual and cooldown boundaries.

#ifndef STAKELEDGER_UTIL_TIME_H
#define STAKELEDGER_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <string>

namespace stakeledger {
namespace util {

using Seconds = std::chrono::seconds;
using SystemClock = std::chrono::system_clock;
using SystemTimePoint = std::chrono::system_clock::time_point;

// ============================================================================
// Unix Timestamps
// ============================================================================

/// Ledger "now" in Unix seconds; the mock clock when it is enabled
int64_t GetTime();

/// Convert Unix timestamp to system time point
SystemTimePoint FromUnixTime(int64_t timestamp);

// ============================================================================
// Time Formatting
// ============================================================================

/// Format as ISO 8601 UTC (e.g., "2024-01-15T10:30:00Z")
std::string FormatISO8601(int64_t timestamp);

/// Cooldowns and ages as "7d 2h 5s"; zero units are left out
std::string FormatDuration(Seconds duration);

// ============================================================================
// Mock Clock
// ============================================================================

/// Freeze the ledger clock. Starts at the wall clock unless already pinned.
void EnableMockTime();

/// Return to the wall clock; the pinned value is kept for the next enable
void DisableMockTime();

bool IsMockTimeEnabled();

/// Pin the mock clock, e.g. to a position's creation time
void SetMockTime(int64_t timestamp);

/// Move the mock clock, e.g. across a cooldown
void AdvanceMockTime(Seconds duration);

} // namespace util
} // namespace stakeledger

#endif // STAKELEDGER_UTIL_TIME_H
