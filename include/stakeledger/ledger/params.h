// STAKELEDGER - Ledger Parameters
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License
//
// The mutable configuration record read by every accrual computation.

#ifndef STAKELEDGER_LEDGER_PARAMS_H
#define STAKELEDGER_LEDGER_PARAMS_H

#include "stakeledger/core/serialize.h"
#include "stakeledger/core/types.h"
#include "stakeledger/ledger/error.h"

#include <cstdint>
#include <string>

namespace stakeledger {

namespace util {
class ConfigManager;
}

namespace ledger {

// ============================================================================
// Parameter Constants
// ============================================================================

/// Annual rate bounds (percent per year)
constexpr uint32_t MAX_ANNUAL_RATE = 100;
constexpr uint32_t DEFAULT_ANNUAL_RATE = 10;

/// Cooldown bounds (seconds)
constexpr int64_t MAX_COOLDOWN = 365 * SECONDS_PER_DAY;
constexpr int64_t DEFAULT_COOLDOWN = 7 * SECONDS_PER_DAY;

/// Longest accepted token symbol
constexpr size_t MAX_SYMBOL_LENGTH = 12;

// ============================================================================
// Ledger Parameters
// ============================================================================

struct LedgerParameters {
    /// Interest rate in percent per year
    uint32_t annualRatePercent{DEFAULT_ANNUAL_RATE};

    /// Delay between applying for a claim and being able to claim
    int64_t cooldownSeconds{DEFAULT_COOLDOWN};

    /// Symbol of the base (staked) token, empty if not set
    std::string baseToken;

    /// Symbol of the reward token, empty if not set
    std::string rewardToken;

    bool operator==(const LedgerParameters& other) const {
        return annualRatePercent == other.annualRatePercent &&
               cooldownSeconds == other.cooldownSeconds &&
               baseToken == other.baseToken &&
               rewardToken == other.rewardToken;
    }

    bool operator!=(const LedgerParameters& other) const {
        return !(*this == other);
    }

    std::string ToString() const;
};

/// Rate within [0, MAX_ANNUAL_RATE]
inline bool IsValidAnnualRate(uint64_t rate) {
    return rate <= MAX_ANNUAL_RATE;
}

/// Cooldown within [0, MAX_COOLDOWN]
inline bool IsValidCooldown(int64_t seconds) {
    return seconds >= 0 && seconds <= MAX_COOLDOWN;
}

/// Symbol of 1..MAX_SYMBOL_LENGTH characters from [A-Za-z0-9]
bool IsValidSymbol(const std::string& symbol);

/// Check every field, returning the first violation
LedgerResult ValidateParameters(const LedgerParameters& params);

/**
 * Build genesis parameters from configuration.
 *
 * Reads "annualrate", "cooldown", "basetoken" and "rewardtoken"; missing keys
 * keep the defaults. Malformed or out-of-range values are rejected.
 */
LedgerResult LoadParametersFromConfig(const util::ConfigManager& config,
                                      LedgerParameters& out);

// ============================================================================
// Serialization
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const LedgerParameters& params) {
    ::stakeledger::Serialize(s, params.annualRatePercent);
    ::stakeledger::Serialize(s, params.cooldownSeconds);
    ::stakeledger::Serialize(s, params.baseToken);
    ::stakeledger::Serialize(s, params.rewardToken);
}

template<typename Stream>
void Unserialize(Stream& s, LedgerParameters& params) {
    ::stakeledger::Unserialize(s, params.annualRatePercent);
    ::stakeledger::Unserialize(s, params.cooldownSeconds);
    ::stakeledger::Unserialize(s, params.baseToken);
    ::stakeledger::Unserialize(s, params.rewardToken);
}

} // namespace ledger
} // namespace stakeledger

#endif // STAKELEDGER_LEDGER_PARAMS_H
