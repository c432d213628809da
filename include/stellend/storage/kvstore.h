// STELLEND - Key-Value Store
// Copyright (c) 2024 STELLEND Developers
// MIT License
//
// Typed access to the protocol database with a per-invocation write buffer.
// Reads see buffered writes first. Commit() applies the buffer as a single
// database batch; Discard() drops it.

#ifndef STELLEND_STORAGE_KVSTORE_H
#define STELLEND_STORAGE_KVSTORE_H

#include "stellend/core/serialize.h"
#include "stellend/core/status.h"
#include "stellend/db/database.h"
#include "stellend/storage/keys.h"

#include <ios>
#include <map>
#include <optional>
#include <string>

namespace stellend {
namespace storage {

// ============================================================================
// KVStore
// ============================================================================

class KVStore {
public:
    explicit KVStore(db::Database& db);

    KVStore(const KVStore&) = delete;
    KVStore& operator=(const KVStore&) = delete;

    // ========================================================================
    // Raw Access
    // ========================================================================

    /**
     * Read the encoded value of a key.
     * @param out Set to the value, or nullopt when the key is absent
     * @return STORAGE_ERROR when the database read fails
     */
    Status ReadRaw(const StorageKey& key, std::optional<std::string>* out) const;

    /// Buffer a write
    void WriteRaw(const StorageKey& key, const std::string& value);

    /// Buffer a delete
    void Erase(const StorageKey& key);

    // ========================================================================
    // Typed Access
    // ========================================================================

    /// Read and decode a value; absent keys give nullopt
    template<typename T>
    Status Read(const StorageKey& key, std::optional<T>* out) const {
        std::optional<std::string> raw;
        Status s = ReadRaw(key, &raw);
        if (!s.ok()) {
            return s;
        }
        if (!raw) {
            out->reset();
            return Status::Ok();
        }

        DataStream stream(*raw);
        T value;
        try {
            stream >> value;
        } catch (const std::ios_base::failure& e) {
            return Status::StorageError("Cannot decode " + key.str() + ": " + e.what());
        }
        if (!stream.empty()) {
            return Status::StorageError("Trailing bytes in " + key.str());
        }
        *out = std::move(value);
        return Status::Ok();
    }

    /// Read and decode a value, falling back to a default when absent
    template<typename T>
    Status ReadOr(const StorageKey& key, const T& defaultValue, T* out) const {
        std::optional<T> value;
        Status s = Read(key, &value);
        if (!s.ok()) {
            return s;
        }
        *out = value ? std::move(*value) : defaultValue;
        return Status::Ok();
    }

    /// Encode and buffer a value
    template<typename T>
    void Write(const StorageKey& key, const T& value) {
        DataStream stream;
        stream << value;
        WriteRaw(key, stream.str());
    }

    // ========================================================================
    // Invocation Control
    // ========================================================================

    /// Apply all buffered writes atomically
    Status Commit();

    /// Drop all buffered writes
    void Discard();

    /// Number of buffered operations
    size_t PendingWrites() const { return pending_.size(); }

    db::Database& GetDatabase() { return db_; }

private:
    friend class Invocation;

    db::Database& db_;

    /// Buffered writes; nullopt marks a delete
    using PendingMap = std::map<std::string, std::optional<std::string>>;
    PendingMap pending_;

    /// Number of open invocations
    int depth_{0};
};

// ============================================================================
// Invocation
// ============================================================================

/**
 * Scope of one protocol entry point.
 *
 * The outermost invocation owns the write buffer: Commit() flushes it and
 * leaving the scope without a commit discards it. Invocations opened while
 * another is active (for example by a flash-loan receiver calling back into
 * the protocol) join the outer one and leave the decision to it. A nested
 * invocation that fails, or ends without a commit, restores the buffer it
 * found on entry.
 */
class Invocation {
public:
    explicit Invocation(KVStore& store);
    ~Invocation();

    Invocation(const Invocation&) = delete;
    Invocation& operator=(const Invocation&) = delete;

    /// Commit the buffered writes (a no-op for a nested invocation)
    Status Commit();

    /**
     * Commit when the operation succeeded, otherwise discard.
     * @return The operation status, or the commit failure
     */
    Status Finish(const Status& result);

    bool IsOutermost() const { return outermost_; }

private:
    /// Drop the buffered writes made since this invocation opened
    void Rollback();

    KVStore& store_;
    bool outermost_;
    bool finished_{false};

    /// Buffer on entry, kept by nested invocations only
    KVStore::PendingMap savepoint_;
};

} // namespace storage
} // namespace stellend

#endif // STELLEND_STORAGE_KVSTORE_H
