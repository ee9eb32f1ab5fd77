// STAKELEDGER - Access Control Implementation
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include "stakeledger/ledger/access.h"

namespace stakeledger {
namespace ledger {

bool AccessControl::IsOwner(const Address& caller) const {
    return !owner_.IsNull() && caller == owner_;
}

LedgerResult AccessControl::CheckOwner(const Address& caller) const {
    if (!IsOwner(caller)) {
        return LedgerResult::Error(LedgerError::UNAUTHORIZED,
            "caller " + caller.ToHex() + " is not the owner");
    }
    return LedgerResult::Ok();
}

LedgerResult AccessControl::TransferOwnership(const Address& caller, const Address& newOwner) {
    auto check = CheckOwner(caller);
    if (!check.ok()) {
        return check;
    }
    if (newOwner.IsNull()) {
        return LedgerResult::Error(LedgerError::INVALID_OWNER,
            "new owner is the null identity");
    }
    owner_ = newOwner;
    return LedgerResult::Ok();
}

LedgerResult AccessControl::RenounceOwnership(const Address& caller) {
    auto check = CheckOwner(caller);
    if (!check.ok()) {
        return check;
    }
    owner_.SetNull();
    return LedgerResult::Ok();
}

} // namespace ledger
} // namespace stakeledger
