// STAKELEDGER - Access Control
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License
//
// Single privileged identity, stored as data. It may be transferred or
// renounced by its current holder; once renounced no caller is privileged.

#ifndef STAKELEDGER_LEDGER_ACCESS_H
#define STAKELEDGER_LEDGER_ACCESS_H

#include "stakeledger/core/types.h"
#include "stakeledger/ledger/error.h"

namespace stakeledger {
namespace ledger {

class AccessControl {
public:
    AccessControl() = default;
    explicit AccessControl(const Address& owner) : owner_(owner) {}

    /// Current privileged identity (null if renounced)
    const Address& GetOwner() const { return owner_; }

    /// True if caller holds the privileged role. Never true once renounced.
    bool IsOwner(const Address& caller) const;

    /// OK if caller is the owner, UNAUTHORIZED otherwise
    LedgerResult CheckOwner(const Address& caller) const;

    /**
     * Hand the role to a new identity.
     * @return UNAUTHORIZED if caller is not the owner,
     *         INVALID_OWNER if newOwner is null
     */
    LedgerResult TransferOwnership(const Address& caller, const Address& newOwner);

    /// Give up the role permanently
    LedgerResult RenounceOwnership(const Address& caller);

    /// Replace the owner without checks (loading persisted state)
    void Restore(const Address& owner) { owner_ = owner; }

private:
    Address owner_;
};

} // namespace ledger
} // namespace stakeledger

#endif // STAKELEDGER_LEDGER_ACCESS_H
