// STELLEND - Key-Value Store Implementation
// Copyright (c) 2024 STELLEND Developers
// MIT License

#include "stellend/storage/kvstore.h"
#include "stellend/util/logging.h"

#include <utility>

namespace stellend {
namespace storage {

// ============================================================================
// KVStore
// ============================================================================

KVStore::KVStore(db::Database& db) : db_(db) {}

Status KVStore::ReadRaw(const StorageKey& key, std::optional<std::string>* out) const {
    auto it = pending_.find(key.str());
    if (it != pending_.end()) {
        *out = it->second;
        return Status::Ok();
    }

    std::string value;
    db::Status s = db_.Get(key.str(), &value);
    if (s.IsNotFound()) {
        out->reset();
        return Status::Ok();
    }
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Read of " << key.str()
                                         << " failed: " << s.ToString();
        return Status::StorageError(s.ToString());
    }
    *out = std::move(value);
    return Status::Ok();
}

void KVStore::WriteRaw(const StorageKey& key, const std::string& value) {
    pending_[key.str()] = value;
}

void KVStore::Erase(const StorageKey& key) {
    pending_[key.str()] = std::nullopt;
}

Status KVStore::Commit() {
    if (pending_.empty()) {
        return Status::Ok();
    }

    db::WriteBatch batch;
    for (const auto& [key, value] : pending_) {
        if (value) {
            batch.Put(key, *value);
        } else {
            batch.Delete(key);
        }
    }
    pending_.clear();

    db::Status s = db_.Write(&batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Commit of " << batch.Count()
                                         << " writes failed: " << s.ToString();
        return Status::StorageError(s.ToString());
    }

    LOG_TRACE(util::LogCategory::DB) << "Committed " << batch.Count() << " writes";
    return Status::Ok();
}

void KVStore::Discard() {
    if (!pending_.empty()) {
        LOG_DEBUG(util::LogCategory::DB) << "Discarding " << pending_.size()
                                         << " buffered writes";
    }
    pending_.clear();
}

// ============================================================================
// Invocation
// ============================================================================

Invocation::Invocation(KVStore& store)
    : store_(store), outermost_(store.depth_ == 0) {
    if (!outermost_) {
        savepoint_ = store_.pending_;
    }
    ++store_.depth_;
}

Invocation::~Invocation() {
    --store_.depth_;
    if (!finished_) {
        Rollback();
    }
}

void Invocation::Rollback() {
    if (outermost_) {
        store_.Discard();
    } else {
        store_.pending_ = std::move(savepoint_);
    }
}

Status Invocation::Commit() {
    finished_ = true;
    if (!outermost_) {
        return Status::Ok();
    }
    return store_.Commit();
}

Status Invocation::Finish(const Status& result) {
    if (!result.ok()) {
        finished_ = true;
        Rollback();
        return result;
    }
    return Commit();
}

} // namespace storage
} // namespace stellend
