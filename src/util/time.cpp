// STAKELEDGER - Time Utilities Implementation
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include "stakeledger/util/time.h"

#include <atomic>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <vector>

namespace stakeledger {
namespace util {

namespace {

/// Process-wide pinned clock shared by the ledger and its tests
struct MockClock {
    std::atomic<bool> enabled{false};
    std::atomic<int64_t> now{0};
};

MockClock& GetMockClock() {
    static MockClock clock;
    return clock;
}

int64_t WallClockSeconds() {
    return std::chrono::duration_cast<Seconds>(
        SystemClock::now().time_since_epoch()).count();
}

struct DurationUnit {
    int64_t seconds;
    const char* suffix;
};

constexpr DurationUnit DURATION_UNITS[] = {
    {86400, "d"},
    {3600, "h"},
    {60, "m"},
    {1, "s"},
};

} // namespace

// ============================================================================
// Unix Timestamps
// ============================================================================

int64_t GetTime() {
    const MockClock& clock = GetMockClock();
    return clock.enabled.load() ? clock.now.load() : WallClockSeconds();
}

SystemTimePoint FromUnixTime(int64_t timestamp) {
    return SystemTimePoint{Seconds{timestamp}};
}

// ============================================================================
// Time Formatting
// ============================================================================

std::string FormatISO8601(int64_t timestamp) {
    auto time = static_cast<std::time_t>(timestamp);
    std::tm utc;
    gmtime_r(&time, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string FormatDuration(Seconds duration) {
    int64_t remaining = duration.count();
    if (remaining < 0) {
        return "-" + FormatDuration(Seconds{-remaining});
    }
    if (remaining == 0) {
        return "0s";
    }

    std::vector<std::string> parts;
    for (const auto& unit : DURATION_UNITS) {
        int64_t count = remaining / unit.seconds;
        remaining %= unit.seconds;
        if (count > 0) {
            parts.push_back(std::to_string(count) + unit.suffix);
        }
    }

    std::string result = parts.front();
    for (size_t i = 1; i < parts.size(); ++i) {
        result += " " + parts[i];
    }
    return result;
}

// ============================================================================
// Mock Clock
// ============================================================================

void EnableMockTime() {
    MockClock& clock = GetMockClock();
    if (clock.now.load() == 0) {
        clock.now.store(WallClockSeconds());
    }
    clock.enabled.store(true);
}

void DisableMockTime() {
    GetMockClock().enabled.store(false);
}

bool IsMockTimeEnabled() {
    return GetMockClock().enabled.load();
}

void SetMockTime(int64_t timestamp) {
    GetMockClock().now.store(timestamp);
}

void AdvanceMockTime(Seconds duration) {
    GetMockClock().now.fetch_add(duration.count());
}

} // namespace util
} // namespace stakeledger
