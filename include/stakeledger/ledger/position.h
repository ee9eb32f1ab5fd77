// STAKELEDGER - Ledger Records
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License
//
// Deposit positions and pending claims, the two per-participant records
// held by the staking ledger.

#ifndef STAKELEDGER_LEDGER_POSITION_H
#define STAKELEDGER_LEDGER_POSITION_H

#include "stakeledger/core/serialize.h"
#include "stakeledger/core/types.h"

#include <cstdint>
#include <string>

namespace stakeledger {
namespace ledger {

/// A single deposit. Immutable once recorded.
struct Position {
    Amount amount{0};
    Timestamp createdAt{0};

    bool operator==(const Position& other) const {
        return amount == other.amount && createdAt == other.createdAt;
    }
};

/**
 * Frozen snapshot of a participant's positions, written by ApplyClaim.
 * At most one exists per participant.
 */
struct PendingClaim {
    Amount principal{0};
    Amount reward{0};
    Timestamp unlockAt{0};

    /// True once the cooldown has elapsed (unlock time inclusive)
    bool IsUnlocked(Timestamp now) const { return now >= unlockAt; }

    bool operator==(const PendingClaim& other) const {
        return principal == other.principal && reward == other.reward &&
               unlockAt == other.unlockAt;
    }

    std::string ToString() const;
};

template<typename Stream>
void Serialize(Stream& s, const Position& pos) {
    ::stakeledger::Serialize(s, pos.amount);
    ::stakeledger::Serialize(s, pos.createdAt);
}

template<typename Stream>
void Unserialize(Stream& s, Position& pos) {
    ::stakeledger::Unserialize(s, pos.amount);
    ::stakeledger::Unserialize(s, pos.createdAt);
}

template<typename Stream>
void Serialize(Stream& s, const PendingClaim& claim) {
    ::stakeledger::Serialize(s, claim.principal);
    ::stakeledger::Serialize(s, claim.reward);
    ::stakeledger::Serialize(s, claim.unlockAt);
}

template<typename Stream>
void Unserialize(Stream& s, PendingClaim& claim) {
    ::stakeledger::Unserialize(s, claim.principal);
    ::stakeledger::Unserialize(s, claim.reward);
    ::stakeledger::Unserialize(s, claim.unlockAt);
}

} // namespace ledger
} // namespace stakeledger

#endif // STAKELEDGER_LEDGER_POSITION_H
