// STAKELEDGER - Ledger Store
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License
//
// Typed persistence for the staking ledger on top of db::Database.
//
// Schema:
//   'V'                 -> schema version
//   'P'                 -> LedgerParameters
//   'T'                 -> aggregate outstanding principal
//   'O'                 -> privileged identity
//   'p' + participant   -> std::vector<Position>
//   'c' + participant   -> PendingClaim

#ifndef STAKELEDGER_LEDGER_LEDGERDB_H
#define STAKELEDGER_LEDGER_LEDGERDB_H

#include "stakeledger/core/types.h"
#include "stakeledger/db/database.h"
#include "stakeledger/ledger/params.h"
#include "stakeledger/ledger/position.h"

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <vector>

namespace stakeledger {
namespace ledger {

/// Current on-disk schema version
constexpr uint32_t LEDGER_SCHEMA_VERSION = 1;

/// Everything the ledger persists
struct LedgerState {
    LedgerParameters params;
    Address owner;
    Amount totalStaked{0};
    std::map<Address, std::vector<Position>> positions;
    std::map<Address, PendingClaim> claims;
};

class LedgerStore {
public:
    explicit LedgerStore(std::shared_ptr<db::Database> db);

    /**
     * Open a LevelDB-backed store.
     * @throws std::runtime_error if the database cannot be opened
     */
    static std::shared_ptr<LedgerStore> Open(const std::filesystem::path& path);

    /// In-memory store (tests, volatile ledgers)
    static std::shared_ptr<LedgerStore> OpenInMemory();

    /// True once genesis state has been written
    bool IsInitialized() const;

    /**
     * Read the full ledger state.
     * @throws std::runtime_error on unreadable records, an unknown schema
     *         version, invalid parameters or an aggregate total that does not
     *         match the positions and claims
     */
    LedgerState Load() const;

    /// Write genesis state, marking the store initialized
    db::Status WriteGenesis(const LedgerState& state);

    // === Batch staging ===

    void StageParameters(db::WriteBatch& batch, const LedgerParameters& params) const;
    void StageTotal(db::WriteBatch& batch, Amount total) const;
    void StageOwner(db::WriteBatch& batch, const Address& owner) const;

    /// Empty list deletes the record
    void StagePositions(db::WriteBatch& batch, const Address& participant,
                        const std::vector<Position>& positions) const;

    void StageClaim(db::WriteBatch& batch, const Address& participant,
                    const PendingClaim& claim) const;
    void StageClaimErase(db::WriteBatch& batch, const Address& participant) const;

    /// Apply a staged batch atomically
    db::Status Commit(db::WriteBatch& batch);

    const std::shared_ptr<db::Database>& GetDatabase() const { return db_; }

private:
    template<typename T>
    bool ReadRecord(const std::string& key, T& out) const;

    template<typename T>
    void ForEachParticipant(char prefix, const std::function<void(const Address&, const T&)>& func) const;

    std::shared_ptr<db::Database> db_;
};

} // namespace ledger
} // namespace stakeledger

#endif // STAKELEDGER_LEDGER_LEDGERDB_H
