// STELLEND - LevelDB Wrapper
// Copyright (c) 2024 STELLEND Developers
// MIT License
//
// This file provides the LevelDB and in-memory implementations of the
// database interface.

#ifndef STELLEND_DB_LEVELDB_H
#define STELLEND_DB_LEVELDB_H

#include "stellend/db/database.h"
#include <map>
#include <mutex>

#include <leveldb/db.h>
#include <leveldb/write_batch.h>
#include <leveldb/cache.h>
#include <leveldb/filter_policy.h>

namespace stellend {
namespace db {

// ============================================================================
// LevelDB Database Implementation
// ============================================================================

class LevelDBDatabase : public Database {
private:
    std::unique_ptr<leveldb::DB> db_;
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<const leveldb::FilterPolicy> filter_policy_;
    std::filesystem::path path_;

    static Status ConvertStatus(const leveldb::Status& s) {
        if (s.ok()) return Status::Ok();
        if (s.IsNotFound()) return Status::NotFound(s.ToString());
        if (s.IsCorruption()) return Status::Corruption(s.ToString());
        if (s.IsIOError()) return Status::IOError(s.ToString());
        if (s.IsNotSupportedError()) return Status::NotSupported(s.ToString());
        if (s.IsInvalidArgument()) return Status::InvalidArgument(s.ToString());
        return Status::IOError(s.ToString());
    }

    static leveldb::WriteOptions MakeWriteOptions(const WriteOptions& opts) {
        leveldb::WriteOptions lo;
        lo.sync = opts.sync;
        return lo;
    }

public:
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                    const leveldb::FilterPolicy* filter,
                    const std::filesystem::path& path)
        : db_(db), cache_(cache), filter_policy_(filter), path_(path) {}

    ~LevelDBDatabase() override {
        // The DB references the cache and filter, close it first
        db_.reset();
        cache_.reset();
        filter_policy_.reset();
    }

    Status Get(const Slice& key, std::string* value) override {
        leveldb::Slice lkey(key.data(), key.size());
        return ConvertStatus(db_->Get(leveldb::ReadOptions(), lkey, value));
    }

    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override {
        leveldb::Slice lkey(key.data(), key.size());
        leveldb::Slice lval(value.data(), value.size());
        return ConvertStatus(db_->Put(MakeWriteOptions(options), lkey, lval));
    }

    Status Delete(const WriteOptions& options, const Slice& key) override {
        leveldb::Slice lkey(key.data(), key.size());
        return ConvertStatus(db_->Delete(MakeWriteOptions(options), lkey));
    }

    Status Write(const WriteOptions& options, WriteBatch* batch) override {
        leveldb::WriteBatch lb;
        batch->Iterate([&lb](const std::string& key, const std::optional<std::string>& value) {
            if (value) {
                lb.Put(key, *value);
            } else {
                lb.Delete(key);
            }
        });
        return ConvertStatus(db_->Write(MakeWriteOptions(options), &lb));
    }

    std::string GetStats() const override {
        std::string stats;
        db_->GetProperty("leveldb.stats", &stats);
        return stats;
    }
};

// ============================================================================
// In-Memory Database
// ============================================================================

/**
 * Simple in-memory database for tests and ephemeral runs.
 */
class MemoryDatabase : public Database {
private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;

public:
    MemoryDatabase() = default;

    Status Get(const Slice& key, std::string* value) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = data_.find(key.ToString());
        if (it == data_.end()) {
            return Status::NotFound();
        }
        *value = it->second;
        return Status::Ok();
    }

    Status Put(const WriteOptions&, const Slice& key, const Slice& value) override {
        std::lock_guard<std::mutex> lock(mutex_);
        data_[key.ToString()] = value.ToString();
        return Status::Ok();
    }

    Status Delete(const WriteOptions&, const Slice& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        data_.erase(key.ToString());
        return Status::Ok();
    }

    Status Write(const WriteOptions&, WriteBatch* batch) override {
        std::lock_guard<std::mutex> lock(mutex_);
        batch->Iterate([this](const std::string& key, const std::optional<std::string>& value) {
            if (value) {
                data_[key] = *value;
            } else {
                data_.erase(key);
            }
        });
        return Status::Ok();
    }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return data_.size();
    }
};

} // namespace db
} // namespace stellend

#endif // STELLEND_DB_LEVELDB_H
