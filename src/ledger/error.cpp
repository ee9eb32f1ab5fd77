// STAKELEDGER - Ledger Error Codes Implementation
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include "stakeledger/ledger/error.h"

namespace stakeledger {
namespace ledger {

const char* LedgerErrorToString(LedgerError error) {
    switch (error) {
        case LedgerError::OK: return "ok";
        case LedgerError::INVALID_PARTICIPANT: return "invalid participant";
        case LedgerError::INVALID_AMOUNT: return "invalid amount";
        case LedgerError::AMOUNT_OVERFLOW: return "amount overflow";
        case LedgerError::POSITION_LIMIT_REACHED: return "position limit reached";
        case LedgerError::CLAIM_PENDING: return "claim pending";
        case LedgerError::NO_STAKING: return "no staking";
        case LedgerError::NO_REWARDS: return "no rewards";
        case LedgerError::NO_CLAIM: return "no claim";
        case LedgerError::CLAIM_TOO_EARLY: return "claim too early";
        case LedgerError::UNAUTHORIZED: return "unauthorized";
        case LedgerError::RATE_OUT_OF_RANGE: return "annual rate out of range";
        case LedgerError::COOLDOWN_OUT_OF_RANGE: return "cooldown out of range";
        case LedgerError::INVALID_OWNER: return "invalid owner";
        case LedgerError::TOKEN_NOT_SET: return "token not set";
        case LedgerError::TRANSFER_FAILED: return "transfer failed";
        case LedgerError::ISSUE_FAILED: return "issue failed";
        case LedgerError::STORAGE_ERROR: return "storage error";
        default: return "unknown";
    }
}

} // namespace ledger
} // namespace stakeledger
