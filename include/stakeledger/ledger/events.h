// STAKELEDGER - Ledger Events
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#ifndef STAKELEDGER_LEDGER_EVENTS_H
#define STAKELEDGER_LEDGER_EVENTS_H

#include "stakeledger/core/types.h"

#include <functional>
#include <string>

namespace stakeledger {
namespace ledger {

enum class EventType {
    /// Deposit recorded (principal = staked amount)
    Staked,

    /// Positions frozen into a pending claim
    ClaimApplied,

    /// Pending claim paid out
    Claimed,

    /// Privileged identity changed (null new owner = renounced)
    OwnershipTransferred
};

/// Convert event type to string
const char* EventTypeToString(EventType type);

struct LedgerEvent {
    EventType type{EventType::Staked};
    Address participant;
    Amount principal{0};
    Amount reward{0};
    Address previousOwner;
    Address newOwner;
    Timestamp timestamp{0};

    std::string ToString() const;
};

/// Callback for ledger events
using EventCallback = std::function<void(const LedgerEvent&)>;

} // namespace ledger
} // namespace stakeledger

#endif // STAKELEDGER_LEDGER_EVENTS_H
