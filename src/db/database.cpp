// STELLEND - Database Implementation
// Copyright (c) 2024 STELLEND Developers
// MIT License

#include "stellend/db/database.h"
#include "stellend/db/leveldb.h"
#include "stellend/util/logging.h"

namespace stellend {
namespace db {

// ============================================================================
// Database Factory Functions
// ============================================================================

std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options)
{
    leveldb::Options lo;
    lo.create_if_missing = options.create_if_missing;
    lo.error_if_exists = options.error_if_exists;
    lo.paranoid_checks = options.paranoid_checks;
    lo.write_buffer_size = options.write_buffer_size;
    lo.max_open_files = options.max_open_files;

    leveldb::Cache* cache = nullptr;
    if (options.block_cache_size > 0) {
        cache = leveldb::NewLRUCache(options.block_cache_size);
        lo.block_cache = cache;
    }

    const leveldb::FilterPolicy* filter = nullptr;
    if (options.bloom_filter_bits > 0) {
        filter = leveldb::NewBloomFilterPolicy(options.bloom_filter_bits);
        lo.filter_policy = filter;
    }

    if (options.create_if_missing) {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec) {
            delete cache;
            delete filter;
            return {Status::IOError(ec.message()), nullptr};
        }
    }

    leveldb::DB* ldb = nullptr;
    leveldb::Status s = leveldb::DB::Open(lo, path.string(), &ldb);

    if (!s.ok()) {
        delete cache;
        delete filter;

        LOG_ERROR(util::LogCategory::DB) << "Failed to open database at "
                                         << path.string() << ": " << s.ToString();
        if (s.IsCorruption()) {
            return {Status::Corruption(s.ToString()), nullptr};
        } else if (s.IsInvalidArgument()) {
            return {Status::InvalidArgument(s.ToString()), nullptr};
        }
        return {Status::IOError(s.ToString()), nullptr};
    }

    LOG_DEBUG(util::LogCategory::DB) << "Opened database at " << path.string();
    return {Status::Ok(),
            std::make_unique<LevelDBDatabase>(ldb, cache, filter, path)};
}

std::unique_ptr<Database> OpenMemoryDatabase() {
    return std::make_unique<MemoryDatabase>();
}

Status DestroyDatabase(const std::filesystem::path& path) {
    leveldb::Status s = leveldb::DestroyDB(path.string(), leveldb::Options());
    if (!s.ok()) {
        return Status::IOError(s.ToString());
    }
    return Status::Ok();
}

} // namespace db
} // namespace stellend
