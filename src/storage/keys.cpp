// STELLEND - Storage Keys Implementation
// Copyright (c) 2024 STELLEND Developers
// MIT License

#include "stellend/storage/keys.h"
#include "stellend/core/hex.h"

namespace stellend {
namespace storage {

// ============================================================================
// StorageKey
// ============================================================================

StorageKey& StorageKey::With(uint64_t id) {
    key_ += KEY_SEPARATOR;
    key_ += U64ToHex(id);
    return *this;
}

StorageKey& StorageKey::With(const Address& addr) {
    key_ += KEY_SEPARATOR;
    key_ += addr.ToHex();
    return *this;
}

// ============================================================================
// Key Constructors
// ============================================================================

namespace keys {

StorageKey ProposalCounter() {
    return StorageKey(Namespace::GOV_COUNTER);
}

StorageKey Proposal(ProposalId id) {
    return StorageKey(Namespace::GOV_PROPOSALS).With(id);
}

StorageKey Receipt(ProposalId id, const Address& voter) {
    return StorageKey(Namespace::GOV_RECEIPTS).With(id).With(voter);
}

StorageKey QuorumBps() {
    return StorageKey(Namespace::GOV_QUORUM_BPS);
}

StorageKey Timelock() {
    return StorageKey(Namespace::GOV_TIMELOCK);
}

StorageKey Delegation(const Address& delegator) {
    return StorageKey(Namespace::GOV_DELEGATION).With(delegator);
}

StorageKey OracleSources(const Address& asset) {
    return StorageKey(Namespace::ORACLE_SOURCES).With(asset);
}

StorageKey HeartbeatTtl() {
    return StorageKey(Namespace::ORACLE_HEARTBEAT_TTL);
}

StorageKey AggregationMode() {
    return StorageKey(Namespace::ORACLE_MODE);
}

StorageKey PerformanceCount() {
    return StorageKey(Namespace::ORACLE_PERF_COUNT);
}

StorageKey Admin() {
    return StorageKey(Namespace::ADMIN);
}

StorageKey FlashFeeBps() {
    return StorageKey(Namespace::FLASH_FEE_BPS);
}

} // namespace keys

} // namespace storage
} // namespace stellend
