// STAKELEDGER - Ledger Store Tests
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include "stakeledger/db/leveldb.h"
#include "stakeledger/ledger/ledger.h"
#include "stakeledger/ledger/ledgerdb.h"
#include "stakeledger/util/time.h"

#include <filesystem>
#include <random>

using namespace stakeledger;
using namespace stakeledger::ledger;

namespace {

Address MakeAddress(uint8_t fill) {
    std::array<Byte, Address::SIZE> bytes;
    bytes.fill(fill);
    return Address(bytes);
}

} // namespace

class LedgerStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        database_ = std::make_shared<db::MemoryDatabase>();
        store_ = std::make_shared<LedgerStore>(database_);
        owner_ = MakeAddress(0x01);
        alice_ = MakeAddress(0xA1);
        bob_ = MakeAddress(0xB0);
    }

    LedgerState MakeState() {
        LedgerState state;
        state.params.annualRatePercent = 15;
        state.params.cooldownSeconds = SECONDS_PER_DAY;
        state.params.baseToken = "STK";
        state.params.rewardToken = "RWD";
        state.owner = owner_;
        state.positions[alice_] = {{100, 1700000000}, {200, 1700000100}};
        state.claims[bob_] = PendingClaim{500, 7, 1700086400};
        state.totalStaked = 800;
        return state;
    }

    std::shared_ptr<db::MemoryDatabase> database_;
    std::shared_ptr<LedgerStore> store_;
    Address owner_;
    Address alice_;
    Address bob_;
};

TEST_F(LedgerStoreTest, RequiresDatabase) {
    EXPECT_THROW(LedgerStore store(nullptr), std::invalid_argument);
}

TEST_F(LedgerStoreTest, FreshStoreIsUninitialized) {
    EXPECT_FALSE(store_->IsInitialized());
    EXPECT_THROW(store_->Load(), std::runtime_error);
}

TEST_F(LedgerStoreTest, GenesisRoundTrip) {
    LedgerState state = MakeState();
    ASSERT_TRUE(store_->WriteGenesis(state).ok());
    EXPECT_TRUE(store_->IsInitialized());

    LedgerState loaded = store_->Load();
    EXPECT_EQ(loaded.params, state.params);
    EXPECT_EQ(loaded.owner, owner_);
    EXPECT_EQ(loaded.totalStaked, 800u);
    EXPECT_EQ(loaded.positions, state.positions);
    EXPECT_EQ(loaded.claims, state.claims);
}

TEST_F(LedgerStoreTest, EmptyPositionsAreDeleted) {
    ASSERT_TRUE(store_->WriteGenesis(MakeState()).ok());

    db::WriteBatch batch;
    store_->StagePositions(batch, alice_, {});
    store_->StageClaim(batch, alice_, PendingClaim{300, 3, 1700090000});
    store_->StageTotal(batch, 800);
    ASSERT_TRUE(store_->Commit(batch).ok());

    LedgerState loaded = store_->Load();
    EXPECT_EQ(loaded.positions.count(alice_), 0u);
    ASSERT_EQ(loaded.claims.count(alice_), 1u);
    EXPECT_EQ(loaded.claims[alice_].principal, 300u);
}

TEST_F(LedgerStoreTest, ClaimErase) {
    ASSERT_TRUE(store_->WriteGenesis(MakeState()).ok());

    db::WriteBatch batch;
    store_->StageClaimErase(batch, bob_);
    store_->StageTotal(batch, 300);
    ASSERT_TRUE(store_->Commit(batch).ok());

    LedgerState loaded = store_->Load();
    EXPECT_TRUE(loaded.claims.empty());
    EXPECT_EQ(loaded.totalStaked, 300u);
}

TEST_F(LedgerStoreTest, EmptyCommitSucceedsWithoutWriting) {
    database_->SetFailWrites(true);
    db::WriteBatch batch;
    EXPECT_TRUE(store_->Commit(batch).ok());
}

TEST_F(LedgerStoreTest, CommitReportsFailure) {
    database_->SetFailWrites(true);
    EXPECT_FALSE(store_->WriteGenesis(MakeState()).ok());
    EXPECT_FALSE(store_->IsInitialized());
}

TEST_F(LedgerStoreTest, TotalMismatchIsDetected) {
    LedgerState state = MakeState();
    state.totalStaked = 801;
    ASSERT_TRUE(store_->WriteGenesis(state).ok());
    EXPECT_THROW(store_->Load(), std::runtime_error);
}

TEST_F(LedgerStoreTest, UnknownVersionIsRejected) {
    ASSERT_TRUE(store_->WriteGenesis(MakeState()).ok());
    ASSERT_TRUE(database_->Put(db::MakeKey(db::prefix::VERSION),
                               db::SerializeToString(uint32_t{99})).ok());
    EXPECT_THROW(store_->Load(), std::runtime_error);
}

TEST_F(LedgerStoreTest, CorruptRecordIsRejected) {
    ASSERT_TRUE(store_->WriteGenesis(MakeState()).ok());
    ASSERT_TRUE(database_->Put(db::MakeKey(db::prefix::CLAIM, bob_), "xx").ok());
    EXPECT_THROW(store_->Load(), std::runtime_error);
}

TEST_F(LedgerStoreTest, InvalidParametersAreRejected) {
    LedgerState state = MakeState();
    state.params.annualRatePercent = 500;
    ASSERT_TRUE(store_->WriteGenesis(state).ok());
    EXPECT_THROW(store_->Load(), std::runtime_error);
}

// ============================================================================
// On-Disk Ledger
// ============================================================================

class LevelDBLedgerTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 999999);

        testDir_ = std::filesystem::temp_directory_path() /
                   ("stakeledger_ledger_test_" + std::to_string(dis(gen)));
        std::filesystem::create_directories(testDir_);

        util::EnableMockTime();
        util::SetMockTime(1700000000);
    }

    void TearDown() override {
        util::DisableMockTime();
        std::error_code ec;
        std::filesystem::remove_all(testDir_, ec);
    }

    std::filesystem::path testDir_;
};

TEST_F(LevelDBLedgerTest, LedgerSurvivesReopen) {
    Address owner = MakeAddress(0x01);
    Address alice = MakeAddress(0xA1);
    Address custody = MakeAddress(0xCC);

    LedgerParameters genesis;
    genesis.annualRatePercent = 12;

    {
        auto store = LedgerStore::Open(testDir_ / "ledger");
        auto book = std::make_shared<TokenBook>("STK", custody, store->GetDatabase());
        ASSERT_TRUE(book->Mint(alice, 1000000));

        StakingLedger ledger(genesis, owner, store);
        ASSERT_TRUE(ledger.SetBaseToken(owner, book).ok());
        ASSERT_TRUE(ledger.Stake(alice, 1000000).ok());
    }

    util::AdvanceMockTime(util::Seconds{SECONDS_PER_YEAR});

    auto store = LedgerStore::Open(testDir_ / "ledger");
    auto book = std::make_shared<TokenBook>("STK", custody, store->GetDatabase());
    StakingLedger ledger(LedgerParameters(), MakeAddress(0x02), store);

    EXPECT_EQ(ledger.GetOwner(), owner);
    EXPECT_EQ(ledger.GetParameters().annualRatePercent, 12u);
    EXPECT_EQ(ledger.GetTotalStaked(), 1000000u);
    EXPECT_EQ(*ledger.CalculateReward(alice), 120000u);
    EXPECT_EQ(book->BalanceOf(custody), 1000000u);

    EXPECT_EQ(ledger.Stake(alice, 1).error, LedgerError::TOKEN_NOT_SET);
    ASSERT_TRUE(ledger.AttachBaseToken(book));
    EXPECT_EQ(ledger.Stake(alice, 1).error, LedgerError::TRANSFER_FAILED);
}
