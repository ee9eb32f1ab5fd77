// STAKELEDGER - Ledger Error Codes
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#ifndef STAKELEDGER_LEDGER_ERROR_H
#define STAKELEDGER_LEDGER_ERROR_H

#include <stdexcept>
#include <string>

namespace stakeledger {
namespace ledger {

// ============================================================================
// Ledger Error Codes
// ============================================================================

/// Reason a ledger operation was rejected
enum class LedgerError {
    OK = 0,

    // Input
    INVALID_PARTICIPANT,
    INVALID_AMOUNT,
    AMOUNT_OVERFLOW,
    POSITION_LIMIT_REACHED,

    // Claim state machine
    CLAIM_PENDING,
    NO_STAKING,
    NO_REWARDS,
    NO_CLAIM,
    CLAIM_TOO_EARLY,

    // Privileged operations
    UNAUTHORIZED,
    RATE_OUT_OF_RANGE,
    COOLDOWN_OUT_OF_RANGE,
    INVALID_OWNER,

    // Collaborators and storage
    TOKEN_NOT_SET,
    TRANSFER_FAILED,
    ISSUE_FAILED,
    STORAGE_ERROR,
};

/// Convert error to string
const char* LedgerErrorToString(LedgerError error);

// ============================================================================
// Ledger Result
// ============================================================================

struct LedgerResult {
    LedgerError error{LedgerError::OK};
    std::string message;

    bool ok() const { return error == LedgerError::OK; }

    static LedgerResult Ok() { return {}; }

    static LedgerResult Error(LedgerError err, const std::string& msg = "") {
        return {err, msg.empty() ? LedgerErrorToString(err) : msg};
    }
};

/**
 * Thrown when a claim could not be rolled back after a collaborator failure.
 * The ledger state and the token balances may then disagree.
 */
class LedgerIntegrityError : public std::runtime_error {
public:
    explicit LedgerIntegrityError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace ledger
} // namespace stakeledger

#endif // STAKELEDGER_LEDGER_ERROR_H
