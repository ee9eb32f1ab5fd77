// STAKELEDGER - Ledger Events Implementation
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include "stakeledger/ledger/events.h"

#include <sstream>

namespace stakeledger {
namespace ledger {

const char* EventTypeToString(EventType type) {
    switch (type) {
        case EventType::Staked: return "Staked";
        case EventType::ClaimApplied: return "ClaimApplied";
        case EventType::Claimed: return "Claimed";
        case EventType::OwnershipTransferred: return "OwnershipTransferred";
        default: return "Unknown";
    }
}

std::string LedgerEvent::ToString() const {
    std::ostringstream ss;
    ss << EventTypeToString(type) << "(";
    switch (type) {
        case EventType::Staked:
            ss << participant.ToHex() << ", " << principal;
            break;
        case EventType::ClaimApplied:
        case EventType::Claimed:
            ss << participant.ToHex() << ", " << principal << ", " << reward;
            break;
        case EventType::OwnershipTransferred:
            ss << previousOwner.ToHex() << ", " << newOwner.ToHex();
            break;
    }
    ss << ")";
    return ss.str();
}

} // namespace ledger
} // namespace stakeledger
