// STAKELEDGER - Token Collaborators Implementation
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include "stakeledger/ledger/token.h"
#include "stakeledger/util/logging.h"

#include <stdexcept>

namespace stakeledger {
namespace ledger {

TokenBook::TokenBook(const std::string& symbol, const Address& custody,
                     std::shared_ptr<db::Database> db)
    : symbol_(symbol), custody_(custody), db_(std::move(db)) {
    if (db_) {
        Load();
    }
}

std::string TokenBook::BalanceKey(const Address& holder) const {
    std::string key = db::MakeKey(db::prefix::BALANCE, symbol_);
    key.append(reinterpret_cast<const char*>(holder.data()), Address::SIZE);
    return key;
}

void TokenBook::Load() {
    std::string supplyValue;
    db::Status s = db_->Get(db::MakeKey(db::prefix::SUPPLY, symbol_), &supplyValue);
    if (s.IsNotFound()) {
        return;
    }
    if (!s.ok() || !db::DeserializeFromString(supplyValue, supply_)) {
        throw std::runtime_error("Unreadable supply record for token " + symbol_);
    }

    const std::string keyPrefix = db::MakeKey(db::prefix::BALANCE, symbol_);
    Amount sum = 0;
    auto it = db_->NewIterator();
    for (it->Seek(keyPrefix); it->Valid() && it->key().starts_with(keyPrefix); it->Next()) {
        db::Slice key = it->key();
        Amount balance = 0;
        if (key.size() != keyPrefix.size() + Address::SIZE ||
            !db::DeserializeFromString(it->value().ToString(), balance) ||
            !CheckedAdd(sum, balance, sum)) {
            throw std::runtime_error("Unreadable balance record for token " + symbol_);
        }
        Address holder(reinterpret_cast<const Byte*>(key.data() + keyPrefix.size()),
                       Address::SIZE);
        balances_[holder] = balance;
    }
    if (!it->status().ok()) {
        throw std::runtime_error("Failed to scan balances for token " + symbol_ +
                                 ": " + it->status().ToString());
    }
    if (sum != supply_) {
        throw std::runtime_error("Balances of token " + symbol_ +
                                 " do not add up to its supply");
    }

    LOG_DEBUG(util::LogCategory::TOKEN) << "Loaded " << symbol_ << ": "
                                        << balances_.size() << " holders, supply "
                                        << supply_;
}

bool TokenBook::Persist(const std::map<Address, Amount>& changed, Amount supply) {
    if (!db_) {
        return true;
    }
    db::WriteBatch batch;
    for (const auto& [holder, balance] : changed) {
        if (balance == 0) {
            batch.Delete(BalanceKey(holder));
        } else {
            batch.Put(BalanceKey(holder), db::SerializeToString(balance));
        }
    }
    batch.Put(db::MakeKey(db::prefix::SUPPLY, symbol_), db::SerializeToString(supply));

    db::Status s = db_->Write(&batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::TOKEN) << symbol_ << " write failed: " << s.ToString();
        return false;
    }
    return true;
}

Amount TokenBook::BalanceOf(const Address& holder) const {
    auto it = balances_.find(holder);
    return it != balances_.end() ? it->second : 0;
}

bool TokenBook::Mint(const Address& to, Amount amount) {
    if (to.IsNull()) {
        return false;
    }
    Amount newSupply = 0;
    Amount newBalance = 0;
    if (!CheckedAdd(supply_, amount, newSupply) ||
        !CheckedAdd(BalanceOf(to), amount, newBalance)) {
        LOG_WARN(util::LogCategory::TOKEN) << symbol_ << " mint of " << amount
                                           << " would overflow";
        return false;
    }
    if (amount == 0) {
        return true;
    }
    if (!Persist({{to, newBalance}}, newSupply)) {
        return false;
    }
    balances_[to] = newBalance;
    supply_ = newSupply;

    LOG_DEBUG(util::LogCategory::TOKEN) << symbol_ << " minted " << amount
                                        << " to " << to.ToHex();
    return true;
}

bool TokenBook::Transfer(const Address& from, const Address& to, Amount amount) {
    if (to.IsNull()) {
        return false;
    }
    Amount fromBalance = BalanceOf(from);
    if (fromBalance < amount) {
        LOG_DEBUG(util::LogCategory::TOKEN) << symbol_ << " transfer of " << amount
                                            << " from " << from.ToHex()
                                            << " exceeds balance " << fromBalance;
        return false;
    }
    if (amount == 0 || from == to) {
        return true;
    }
    // Cannot overflow: the sum of all balances equals the supply
    Amount toBalance = BalanceOf(to) + amount;
    fromBalance -= amount;

    if (!Persist({{from, fromBalance}, {to, toBalance}}, supply_)) {
        return false;
    }
    if (fromBalance == 0) {
        balances_.erase(from);
    } else {
        balances_[from] = fromBalance;
    }
    balances_[to] = toBalance;

    LOG_DEBUG(util::LogCategory::TOKEN) << symbol_ << " moved " << amount << " "
                                        << from.ToHex() << " -> " << to.ToHex();
    return true;
}

bool TokenBook::TransferIn(const Address& from, Amount amount) {
    return Transfer(from, custody_, amount);
}

bool TokenBook::TransferOut(const Address& to, Amount amount) {
    return Transfer(custody_, to, amount);
}

bool TokenBook::Issue(const Address& to, Amount amount) {
    return Mint(to, amount);
}

} // namespace ledger
} // namespace stakeledger
