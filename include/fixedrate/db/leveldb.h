// FIXEDRATE - Database Backends
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License

#ifndef FIXEDRATE_DB_LEVELDB_H
#define FIXEDRATE_DB_LEVELDB_H

#include "fixedrate/db/database.h"

#include <map>
#include <mutex>

#ifdef FIXEDRATE_USE_LEVELDB
#include <leveldb/db.h>
#include <leveldb/write_batch.h>
#endif

namespace fixedrate {
namespace db {

#ifdef FIXEDRATE_USE_LEVELDB

// ============================================================================
// LevelDB Backend
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

class LevelDBDatabase : public Database {
public:
    LevelDBDatabase(leveldb::DB* db, const std::filesystem::path& path)
        : db_(db), path_(path) {}

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

    const char* Backend() const override { return "leveldb"; }

    /// Translate a LevelDB status
    static Status FromLevelDB(const leveldb::Status& s);

private:
    std::unique_ptr<leveldb::DB> db_;
    std::filesystem::path path_;
};

#endif // FIXEDRATE_USE_LEVELDB

// ============================================================================
// In-Memory Backend
// ============================================================================

/**
 * Ordered map behind a mutex. Used by tests and when LevelDB is not
 * available; nothing survives the process.
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

    /// The iterator reads the live map; do not write while iterating
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

    const char* Backend() const override { return "memory"; }

    size_t Size() const;
    void Clear();

private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;
};

class MemoryIterator : public Iterator {
public:
    explicit MemoryIterator(const std::map<std::string, std::string>& data)
        : data_(data), iter_(data.end()) {}

    bool Valid() const override { return iter_ != data_.end(); }
    void SeekToFirst() override { iter_ = data_.begin(); }
    void Seek(const Slice& target) override { iter_ = data_.lower_bound(target.ToString()); }
    void Next() override {
        if (iter_ != data_.end()) {
            ++iter_;
        }
    }

    Slice key() const override { return Slice(iter_->first); }
    Slice value() const override { return Slice(iter_->second); }
    Status status() const override { return Status::Ok(); }

private:
    const std::map<std::string, std::string>& data_;
    std::map<std::string, std::string>::const_iterator iter_;
};

} // namespace db
} // namespace fixedrate

#endif // FIXEDRATE_DB_LEVELDB_H
