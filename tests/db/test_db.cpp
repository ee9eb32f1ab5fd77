// STAKELEDGER - Database Tests
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include "stakeledger/db/database.h"
#include "stakeledger/db/leveldb.h"
#include <filesystem>
#include <random>

using namespace stakeledger;
using namespace stakeledger::db;

// ============================================================================
// Test Utilities
// ============================================================================

class DatabaseTest : public ::testing::Test {
protected:
    std::filesystem::path testDir_;

    void SetUp() override {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 999999);

        testDir_ = std::filesystem::temp_directory_path() /
                   ("stakeledger_db_test_" + std::to_string(dis(gen)));
        std::filesystem::create_directories(testDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(testDir_, ec);
    }

    std::unique_ptr<Database> OpenTestDatabase(const std::string& name = "test_db") {
        auto [status, database] = OpenDatabase(testDir_ / name);
        EXPECT_TRUE(status.ok()) << status.ToString();
        return std::move(database);
    }
};

// ============================================================================
// Status Tests
// ============================================================================

TEST(StatusTest, Codes) {
    EXPECT_TRUE(Status::Ok().ok());
    EXPECT_EQ(Status::Ok().ToString(), "OK");
    EXPECT_TRUE(Status::NotFound().IsNotFound());
    EXPECT_TRUE(Status::Corruption("bad").IsCorruption());
    EXPECT_EQ(Status::IOError("disk").ToString(), "IOError: disk");
    EXPECT_FALSE(Status::InvalidArgument().ok());
}

TEST(SliceTest, StartsWith) {
    std::string key = "pABC";
    Slice slice(key);
    EXPECT_TRUE(slice.starts_with(Slice("p")));
    EXPECT_TRUE(slice.starts_with(Slice("pABC")));
    EXPECT_FALSE(slice.starts_with(Slice("pABCD")));
    EXPECT_FALSE(slice.starts_with(Slice("c")));
}

// ============================================================================
// LevelDB Tests
// ============================================================================

TEST_F(DatabaseTest, OpenAndClose) {
    auto database = OpenTestDatabase();
    ASSERT_NE(database, nullptr);
}

TEST_F(DatabaseTest, PutGetDelete) {
    auto database = OpenTestDatabase();
    ASSERT_NE(database, nullptr);

    ASSERT_TRUE(database->Put(Slice("key1"), Slice("value1")).ok());

    std::string value;
    ASSERT_TRUE(database->Get(Slice("key1"), &value).ok());
    EXPECT_EQ(value, "value1");
    EXPECT_TRUE(database->Exists(Slice("key1")));

    ASSERT_TRUE(database->Delete(Slice("key1")).ok());
    EXPECT_TRUE(database->Get(Slice("key1"), &value).IsNotFound());
    EXPECT_FALSE(database->Exists(Slice("key1")));
}

TEST_F(DatabaseTest, BatchIsApplied) {
    auto database = OpenTestDatabase();
    ASSERT_NE(database, nullptr);
    ASSERT_TRUE(database->Put(Slice("gone"), Slice("x")).ok());

    WriteBatch batch;
    batch.Put(Slice("a"), Slice("1"));
    batch.Put(Slice("b"), Slice("2"));
    batch.Delete(Slice("gone"));
    EXPECT_EQ(batch.Count(), 3u);
    ASSERT_TRUE(database->Write(&batch).ok());

    std::string value;
    ASSERT_TRUE(database->Get(Slice("b"), &value).ok());
    EXPECT_EQ(value, "2");
    EXPECT_FALSE(database->Exists(Slice("gone")));
}

TEST_F(DatabaseTest, DataSurvivesReopen) {
    {
        auto database = OpenTestDatabase();
        ASSERT_NE(database, nullptr);
        ASSERT_TRUE(database->Put(Slice("persist"), Slice("yes")).ok());
    }

    auto database = OpenTestDatabase();
    ASSERT_NE(database, nullptr);
    std::string value;
    ASSERT_TRUE(database->Get(Slice("persist"), &value).ok());
    EXPECT_EQ(value, "yes");
}

TEST_F(DatabaseTest, PrefixIteration) {
    auto database = OpenTestDatabase();
    ASSERT_NE(database, nullptr);

    ASSERT_TRUE(database->Put(Slice("c1"), Slice("claim")).ok());
    ASSERT_TRUE(database->Put(Slice("p1"), Slice("a")).ok());
    ASSERT_TRUE(database->Put(Slice("p2"), Slice("b")).ok());
    ASSERT_TRUE(database->Put(Slice("s1"), Slice("supply")).ok());

    std::vector<std::string> keys;
    auto it = database->NewIterator();
    for (it->Seek(Slice("p")); it->Valid() && it->key().starts_with(Slice("p")); it->Next()) {
        keys.push_back(it->key().ToString());
    }
    EXPECT_TRUE(it->status().ok());
    ASSERT_EQ(keys.size(), 2u);
    EXPECT_EQ(keys[0], "p1");
    EXPECT_EQ(keys[1], "p2");
}

TEST_F(DatabaseTest, ErrorIfExists) {
    {
        auto database = OpenTestDatabase();
        ASSERT_NE(database, nullptr);
    }

    Options opts;
    opts.error_if_exists = true;
    auto [status, database] = OpenDatabase(testDir_ / "test_db", opts);
    EXPECT_FALSE(status.ok());
    EXPECT_EQ(database, nullptr);
}

TEST_F(DatabaseTest, Destroy) {
    {
        auto database = OpenTestDatabase();
        ASSERT_NE(database, nullptr);
        ASSERT_TRUE(database->Put(Slice("k"), Slice("v")).ok());
    }
    ASSERT_TRUE(DestroyDatabase(testDir_ / "test_db").ok());

    auto database = OpenTestDatabase();
    ASSERT_NE(database, nullptr);
    EXPECT_FALSE(database->Exists(Slice("k")));
}

// ============================================================================
// Memory Database Tests
// ============================================================================

TEST(MemoryDatabaseTest, BasicOperations) {
    MemoryDatabase database;
    ASSERT_TRUE(database.Put(Slice("k"), Slice("v")).ok());
    EXPECT_EQ(database.Size(), 1u);

    std::string value;
    ASSERT_TRUE(database.Get(Slice("k"), &value).ok());
    EXPECT_EQ(value, "v");

    ASSERT_TRUE(database.Delete(Slice("k")).ok());
    EXPECT_EQ(database.Size(), 0u);
    EXPECT_TRUE(database.Get(Slice("k"), &value).IsNotFound());
}

TEST(MemoryDatabaseTest, BatchAppliesInOrder) {
    MemoryDatabase database;
    WriteBatch batch;
    batch.Put(Slice("k"), Slice("first"));
    batch.Delete(Slice("k"));
    batch.Put(Slice("k"), Slice("second"));
    ASSERT_TRUE(database.Write(&batch).ok());

    std::string value;
    ASSERT_TRUE(database.Get(Slice("k"), &value).ok());
    EXPECT_EQ(value, "second");
}

TEST(MemoryDatabaseTest, FailedWritesChangeNothing) {
    MemoryDatabase database;
    ASSERT_TRUE(database.Put(Slice("k"), Slice("v")).ok());
    database.SetFailWrites(true);

    EXPECT_TRUE(database.Put(Slice("k"), Slice("w")).IsIOError());
    EXPECT_TRUE(database.Delete(Slice("k")).IsIOError());

    WriteBatch batch;
    batch.Put(Slice("other"), Slice("x"));
    EXPECT_TRUE(database.Write(&batch).IsIOError());

    std::string value;
    ASSERT_TRUE(database.Get(Slice("k"), &value).ok());
    EXPECT_EQ(value, "v");
    EXPECT_EQ(database.Size(), 1u);

    database.SetFailWrites(false);
    EXPECT_TRUE(database.Write(&batch).ok());
}

TEST(MemoryDatabaseTest, IteratorIsOrdered) {
    auto database = OpenMemoryDatabase();
    ASSERT_TRUE(database->Put(Slice("b"), Slice("2")).ok());
    ASSERT_TRUE(database->Put(Slice("a"), Slice("1")).ok());
    ASSERT_TRUE(database->Put(Slice("c"), Slice("3")).ok());

    std::string joined;
    auto it = database->NewIterator();
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        joined += it->value().ToString();
    }
    EXPECT_EQ(joined, "123");

    it->Seek(Slice("bb"));
    ASSERT_TRUE(it->Valid());
    EXPECT_EQ(it->key().ToString(), "c");
}

// ============================================================================
// Serialization Helper Tests
// ============================================================================

TEST(SerializationHelperTest, RoundTrip) {
    std::vector<uint64_t> values = {5, 10, 15};
    std::string data = SerializeToString(values);

    std::vector<uint64_t> decoded;
    ASSERT_TRUE(DeserializeFromString(data, decoded));
    EXPECT_EQ(decoded, values);
}

TEST(SerializationHelperTest, RejectsTrailingAndTruncatedBytes) {
    std::string data = SerializeToString(uint64_t{42});

    uint64_t value = 0;
    EXPECT_FALSE(DeserializeFromString(data + "x", value));
    EXPECT_FALSE(DeserializeFromString(data.substr(0, 7), value));
    EXPECT_TRUE(DeserializeFromString(data, value));
    EXPECT_EQ(value, 42u);
}

TEST(SerializationHelperTest, KeysCarryPrefix) {
    Address addr = Address::FromHex("a1a1a1a1a1a1a1a1a1a1a1a1a1a1a1a1a1a1a1a1");
    std::string key = MakeKey(prefix::POSITIONS, addr);
    ASSERT_EQ(key.size(), 1 + Address::SIZE);
    EXPECT_EQ(key[0], 'p');
    EXPECT_EQ(static_cast<uint8_t>(key[1]), 0xa1);

    EXPECT_EQ(MakeKey(prefix::TOTAL), "T");
    std::string symbolKey = MakeKey(prefix::SUPPLY, std::string("RWD"));
    EXPECT_EQ(symbolKey, std::string("s\x03RWD"));
}
