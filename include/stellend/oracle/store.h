// STELLEND - Oracle Store
// Copyright (c) 2024 STELLEND Developers
// MIT License

#ifndef STELLEND_ORACLE_STORE_H
#define STELLEND_ORACLE_STORE_H

#include "stellend/oracle/oracle.h"
#include "stellend/storage/kvstore.h"

#include <vector>

namespace stellend {
namespace oracle {

/**
 * Persistent oracle state: per-asset source lists, heartbeat TTL,
 * aggregation mode and the performance counter.
 */
class OracleStore {
public:
    explicit OracleStore(storage::KVStore& kv);

    storage::KVStore& GetKVStore() { return kv_; }

    /// Sources of asset in registration order; empty when none
    Status GetSources(const Address& asset, std::vector<OracleSource>* out) const;
    void PutSources(const Address& asset, const std::vector<OracleSource>& sources);

    Status GetHeartbeatTtl(uint64_t* out) const;
    void SetHeartbeatTtl(uint64_t ttl);

    Status GetMode(int64_t* out) const;
    void SetMode(int64_t mode);

    Status GetPerformanceCount(int64_t* out) const;

    /// Increment the performance counter and return the new value
    Status IncrementPerformanceCount(int64_t* out);

    /// Write the parameters that are not stored yet
    Status SeedParameters(uint64_t heartbeatTtl, int64_t mode);

private:
    storage::KVStore& kv_;
};

} // namespace oracle
} // namespace stellend

#endif // STELLEND_ORACLE_STORE_H
