// STELLEND - Oracle Store Implementation
// Copyright (c) 2024 STELLEND Developers
// MIT License

#include "stellend/oracle/store.h"

namespace stellend {
namespace oracle {

OracleStore::OracleStore(storage::KVStore& kv) : kv_(kv) {}

Status OracleStore::GetSources(const Address& asset, std::vector<OracleSource>* out) const {
    return kv_.ReadOr<std::vector<OracleSource>>(storage::keys::OracleSources(asset), {}, out);
}

void OracleStore::PutSources(const Address& asset, const std::vector<OracleSource>& sources) {
    kv_.Write(storage::keys::OracleSources(asset), sources);
}

Status OracleStore::GetHeartbeatTtl(uint64_t* out) const {
    return kv_.ReadOr<uint64_t>(storage::keys::HeartbeatTtl(), DEFAULT_HEARTBEAT_TTL, out);
}

void OracleStore::SetHeartbeatTtl(uint64_t ttl) {
    kv_.Write(storage::keys::HeartbeatTtl(), ttl);
}

Status OracleStore::GetMode(int64_t* out) const {
    return kv_.ReadOr<int64_t>(storage::keys::AggregationMode(),
                               static_cast<int64_t>(AggregationMode::MedianTrim), out);
}

void OracleStore::SetMode(int64_t mode) {
    kv_.Write(storage::keys::AggregationMode(), mode);
}

Status OracleStore::GetPerformanceCount(int64_t* out) const {
    return kv_.ReadOr<int64_t>(storage::keys::PerformanceCount(), 0, out);
}

Status OracleStore::IncrementPerformanceCount(int64_t* out) {
    int64_t count = 0;
    Status s = GetPerformanceCount(&count);
    if (!s.ok()) {
        return s;
    }
    if (!CheckedAdd(count, 1, &count)) {
        return Status::InvalidAmount("performance counter overflows");
    }
    kv_.Write(storage::keys::PerformanceCount(), count);
    *out = count;
    return Status::Ok();
}

Status OracleStore::SeedParameters(uint64_t heartbeatTtl, int64_t mode) {
    std::optional<uint64_t> storedTtl;
    Status s = kv_.Read(storage::keys::HeartbeatTtl(), &storedTtl);
    if (!s.ok()) {
        return s;
    }
    std::optional<int64_t> storedMode;
    s = kv_.Read(storage::keys::AggregationMode(), &storedMode);
    if (!s.ok()) {
        return s;
    }

    if (!storedTtl) {
        SetHeartbeatTtl(heartbeatTtl);
    }
    if (!storedMode) {
        SetMode(mode);
    }
    return Status::Ok();
}

} // namespace oracle
} // namespace stellend
