// STAKELEDGER - LevelDB and In-Memory Database Implementations
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#ifndef STAKELEDGER_DB_LEVELDB_H
#define STAKELEDGER_DB_LEVELDB_H

#include "stakeledger/db/database.h"

#include <leveldb/cache.h>
#include <leveldb/db.h>
#include <leveldb/filter_policy.h>
#include <leveldb/write_batch.h>

#include <filesystem>
#include <map>
#include <memory>
#include <string>

namespace stakeledger {
namespace db {

// ============================================================================
// LevelDB Iterator Wrapper
// ============================================================================

class LevelDBIterator : public Iterator {
public:
    explicit LevelDBIterator(leveldb::Iterator* iter) : iter_(iter) {}

    bool Valid() const override { return iter_->Valid(); }
    void SeekToFirst() override { iter_->SeekToFirst(); }
    void Seek(const Slice& target) override {
        iter_->Seek(leveldb::Slice(target.data(), target.size()));
    }
    void Next() override { iter_->Next(); }

    Slice key() const override {
        leveldb::Slice k = iter_->key();
        return Slice(k.data(), k.size());
    }

    Slice value() const override {
        leveldb::Slice v = iter_->value();
        return Slice(v.data(), v.size());
    }

    Status status() const override;

private:
    std::unique_ptr<leveldb::Iterator> iter_;
};

// ============================================================================
// LevelDB Database Implementation
// ============================================================================

class LevelDBDatabase : public Database {
public:
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                    const leveldb::FilterPolicy* filter,
                    const std::filesystem::path& path)
        : db_(db), cache_(cache), filterPolicy_(filter), path_(path) {}

    ~LevelDBDatabase() override {
        // The DB must close before its cache and filter policy go away
        db_.reset();
        cache_.reset();
        filterPolicy_.reset();
    }

    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

    const std::filesystem::path& GetPath() const { return path_; }

    static Status ConvertStatus(const leveldb::Status& s);

private:
    std::unique_ptr<leveldb::DB> db_;
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<const leveldb::FilterPolicy> filterPolicy_;
    std::filesystem::path path_;
};

// ============================================================================
// In-Memory Database
// ============================================================================

/**
 * Ordered in-memory database for tests and volatile ledgers.
 */
class MemoryDatabase : public Database {
public:
    MemoryDatabase() = default;

    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

    size_t Size() const { return data_.size(); }

    /// Make every subsequent write fail with an IO error
    void SetFailWrites(bool fail) { failWrites_ = fail; }

private:
    std::map<std::string, std::string> data_;
    bool failWrites_{false};
};

/**
 * Iterator for MemoryDatabase. Invalidated by writes to the database.
 */
class MemoryIterator : public Iterator {
public:
    explicit MemoryIterator(const std::map<std::string, std::string>& data)
        : data_(data), iter_(data_.end()) {}

    bool Valid() const override { return iter_ != data_.end(); }
    void SeekToFirst() override { iter_ = data_.begin(); }
    void Seek(const Slice& target) override { iter_ = data_.lower_bound(target.ToString()); }
    void Next() override {
        if (iter_ != data_.end()) ++iter_;
    }

    Slice key() const override { return Slice(iter_->first); }
    Slice value() const override { return Slice(iter_->second); }
    Status status() const override { return Status::Ok(); }

private:
    const std::map<std::string, std::string>& data_;
    std::map<std::string, std::string>::const_iterator iter_;
};

} // namespace db
} // namespace stakeledger

#endif // STAKELEDGER_DB_LEVELDB_H
