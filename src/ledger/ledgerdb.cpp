// STAKELEDGER - Ledger Store Implementation
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include "stakeledger/ledger/ledgerdb.h"
#include "stakeledger/util/logging.h"

#include <stdexcept>

namespace stakeledger {
namespace ledger {

LedgerStore::LedgerStore(std::shared_ptr<db::Database> db) : db_(std::move(db)) {
    if (!db_) {
        throw std::invalid_argument("LedgerStore requires a database");
    }
}

std::shared_ptr<LedgerStore> LedgerStore::Open(const std::filesystem::path& path) {
    auto [status, database] = db::OpenDatabase(path);
    if (!status.ok()) {
        throw std::runtime_error("Failed to open ledger database at " + path.string() +
                                 ": " + status.ToString());
    }
    return std::make_shared<LedgerStore>(std::shared_ptr<db::Database>(std::move(database)));
}

std::shared_ptr<LedgerStore> LedgerStore::OpenInMemory() {
    return std::make_shared<LedgerStore>(
        std::shared_ptr<db::Database>(db::OpenMemoryDatabase()));
}

// ============================================================================
// Reading
// ============================================================================

template<typename T>
bool LedgerStore::ReadRecord(const std::string& key, T& out) const {
    std::string value;
    db::Status s = db_->Get(key, &value);
    if (s.IsNotFound()) {
        return false;
    }
    if (!s.ok()) {
        throw std::runtime_error("Ledger read failed: " + s.ToString());
    }
    if (!db::DeserializeFromString(value, out)) {
        throw std::runtime_error("Corrupt ledger record under prefix '" +
                                 std::string(1, key[0]) + "'");
    }
    return true;
}

template<typename T>
void LedgerStore::ForEachParticipant(
        char prefix, const std::function<void(const Address&, const T&)>& func) const {
    const std::string keyPrefix = db::MakeKey(prefix);
    auto it = db_->NewIterator();
    for (it->Seek(keyPrefix); it->Valid() && it->key().starts_with(keyPrefix); it->Next()) {
        db::Slice key = it->key();
        T record;
        if (key.size() != 1 + Address::SIZE ||
            !db::DeserializeFromString(it->value().ToString(), record)) {
            throw std::runtime_error("Corrupt ledger record under prefix '" +
                                     std::string(1, prefix) + "'");
        }
        Address participant(reinterpret_cast<const Byte*>(key.data() + 1), Address::SIZE);
        func(participant, record);
    }
    if (!it->status().ok()) {
        throw std::runtime_error("Ledger scan failed: " + it->status().ToString());
    }
}

bool LedgerStore::IsInitialized() const {
    return db_->Exists(db::MakeKey(db::prefix::VERSION));
}

LedgerState LedgerStore::Load() const {
    uint32_t version = 0;
    if (!ReadRecord(db::MakeKey(db::prefix::VERSION), version)) {
        throw std::runtime_error("Ledger store is not initialized");
    }
    if (version != LEDGER_SCHEMA_VERSION) {
        throw std::runtime_error("Unsupported ledger schema version " +
                                 std::to_string(version));
    }

    LedgerState state;
    if (!ReadRecord(db::MakeKey(db::prefix::PARAMS), state.params) ||
        !ReadRecord(db::MakeKey(db::prefix::TOTAL), state.totalStaked) ||
        !ReadRecord(db::MakeKey(db::prefix::OWNER), state.owner)) {
        throw std::runtime_error("Ledger store is missing genesis records");
    }

    auto valid = ValidateParameters(state.params);
    if (!valid.ok()) {
        throw std::runtime_error("Persisted parameters are invalid: " + valid.message);
    }

    Amount outstanding = 0;
    bool overflow = false;

    ForEachParticipant<std::vector<Position>>(db::prefix::POSITIONS,
        [&](const Address& participant, const std::vector<Position>& positions) {
            for (const auto& pos : positions) {
                overflow |= !CheckedAdd(outstanding, pos.amount, outstanding);
            }
            if (!positions.empty()) {
                state.positions[participant] = positions;
            }
        });

    ForEachParticipant<PendingClaim>(db::prefix::CLAIM,
        [&](const Address& participant, const PendingClaim& claim) {
            overflow |= !CheckedAdd(outstanding, claim.principal, outstanding);
            state.claims[participant] = claim;
        });

    if (overflow || outstanding != state.totalStaked) {
        throw std::runtime_error("Ledger total " + std::to_string(state.totalStaked) +
                                 " does not match outstanding principal");
    }

    LOG_DEBUG(util::LogCategory::DB) << "Loaded ledger: " << state.positions.size()
                                     << " staked participants, " << state.claims.size()
                                     << " pending claims, total " << state.totalStaked;
    return state;
}

// ============================================================================
// Writing
// ============================================================================

db::Status LedgerStore::WriteGenesis(const LedgerState& state) {
    db::WriteBatch batch;
    batch.Put(db::MakeKey(db::prefix::VERSION), db::SerializeToString(LEDGER_SCHEMA_VERSION));
    StageParameters(batch, state.params);
    StageTotal(batch, state.totalStaked);
    StageOwner(batch, state.owner);
    for (const auto& [participant, positions] : state.positions) {
        StagePositions(batch, participant, positions);
    }
    for (const auto& [participant, claim] : state.claims) {
        StageClaim(batch, participant, claim);
    }
    return Commit(batch);
}

void LedgerStore::StageParameters(db::WriteBatch& batch, const LedgerParameters& params) const {
    batch.Put(db::MakeKey(db::prefix::PARAMS), db::SerializeToString(params));
}

void LedgerStore::StageTotal(db::WriteBatch& batch, Amount total) const {
    batch.Put(db::MakeKey(db::prefix::TOTAL), db::SerializeToString(total));
}

void LedgerStore::StageOwner(db::WriteBatch& batch, const Address& owner) const {
    batch.Put(db::MakeKey(db::prefix::OWNER), db::SerializeToString(owner));
}

void LedgerStore::StagePositions(db::WriteBatch& batch, const Address& participant,
                                 const std::vector<Position>& positions) const {
    std::string key = db::MakeKey(db::prefix::POSITIONS, participant);
    if (positions.empty()) {
        batch.Delete(key);
    } else {
        batch.Put(key, db::SerializeToString(positions));
    }
}

void LedgerStore::StageClaim(db::WriteBatch& batch, const Address& participant,
                             const PendingClaim& claim) const {
    batch.Put(db::MakeKey(db::prefix::CLAIM, participant), db::SerializeToString(claim));
}

void LedgerStore::StageClaimErase(db::WriteBatch& batch, const Address& participant) const {
    batch.Delete(db::MakeKey(db::prefix::CLAIM, participant));
}

db::Status LedgerStore::Commit(db::WriteBatch& batch) {
    if (batch.Empty()) {
        return db::Status::Ok();
    }
    db::Status s = db_->Write(&batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Ledger batch of " << batch.Count()
                                         << " writes failed: " << s.ToString();
    }
    return s;
}

} // namespace ledger
} // namespace stakeledger
