// STAKELEDGER - Token Collaborators
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License
//
// Interfaces the staking ledger uses to move the base token and to issue the
// reward token, plus TokenBook, a simple fungible token implementing both.

#ifndef STAKELEDGER_LEDGER_TOKEN_H
#define STAKELEDGER_LEDGER_TOKEN_H

#include "stakeledger/core/types.h"
#include "stakeledger/db/database.h"

#include <map>
#include <memory>
#include <string>

namespace stakeledger {
namespace ledger {

// ============================================================================
// Collaborator Interfaces
// ============================================================================

/// Token that participants stake and get back as principal
class IBaseToken {
public:
    virtual ~IBaseToken() = default;

    virtual const std::string& GetSymbol() const = 0;

    /// Move amount from a participant into ledger custody
    virtual bool TransferIn(const Address& from, Amount amount) = 0;

    /// Move amount from ledger custody to a participant
    virtual bool TransferOut(const Address& to, Amount amount) = 0;
};

/// Token minted to pay rewards
class IRewardIssuer {
public:
    virtual ~IRewardIssuer() = default;

    virtual const std::string& GetSymbol() const = 0;

    /// Mint amount to a participant
    virtual bool Issue(const Address& to, Amount amount) = 0;
};

// ============================================================================
// Token Book
// ============================================================================

/**
 * Fungible token ledger with a custody account.
 *
 * TransferIn/TransferOut move funds between holders and the custody account,
 * Issue mints. With a database attached, every change is written as one batch
 * under the balance and supply prefixes; a failed write leaves the book
 * unchanged and the operation returns false.
 */
class TokenBook : public IBaseToken, public IRewardIssuer {
public:
    /**
     * @param symbol Token symbol
     * @param custody Account holding staked funds
     * @param db Optional backing store; existing balances are loaded.
     *           Throws std::runtime_error on unreadable records.
     */
    TokenBook(const std::string& symbol, const Address& custody,
              std::shared_ptr<db::Database> db = nullptr);

    const std::string& GetSymbol() const override { return symbol_; }
    const Address& GetCustody() const { return custody_; }

    Amount BalanceOf(const Address& holder) const;
    Amount TotalSupply() const { return supply_; }

    /// Create new tokens; fails on supply overflow or null recipient
    bool Mint(const Address& to, Amount amount);

    /// Move tokens between holders; fails on insufficient balance
    bool Transfer(const Address& from, const Address& to, Amount amount);

    // IBaseToken
    bool TransferIn(const Address& from, Amount amount) override;
    bool TransferOut(const Address& to, Amount amount) override;

    // IRewardIssuer
    bool Issue(const Address& to, Amount amount) override;

    /// Number of holders with a non-zero balance
    size_t HolderCount() const { return balances_.size(); }

private:
    std::string BalanceKey(const Address& holder) const;
    void Load();
    bool Persist(const std::map<Address, Amount>& changed, Amount supply);

    std::string symbol_;
    Address custody_;
    std::shared_ptr<db::Database> db_;

    std::map<Address, Amount> balances_;
    Amount supply_{0};
};

} // namespace ledger
} // namespace stakeledger

#endif // STAKELEDGER_LEDGER_TOKEN_H
