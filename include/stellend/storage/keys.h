// STELLEND - Storage Keys
// Copyright (c) 2024 STELLEND Developers
// MIT License
//
// Structured builder for persistent storage keys. Every key is a namespace,
// optionally followed by entity ids: "namespace" or "namespace:id[:id...]".
// Ids are fixed-width hex, so two different entities never share a key.

#ifndef STELLEND_STORAGE_KEYS_H
#define STELLEND_STORAGE_KEYS_H

#include "stellend/core/types.h"

#include <string>

namespace stellend {
namespace storage {

// ============================================================================
// Key Namespaces
// ============================================================================

namespace Namespace {
    // Governance
    constexpr const char* GOV_COUNTER = "gov_counter";
    constexpr const char* GOV_PROPOSALS = "gov_proposals";
    constexpr const char* GOV_RECEIPTS = "gov_receipts";
    constexpr const char* GOV_QUORUM_BPS = "gov_quorum_bps";
    constexpr const char* GOV_TIMELOCK = "gov_timelock";
    constexpr const char* GOV_DELEGATION = "gov_delegation";

    // Oracle
    constexpr const char* ORACLE_SOURCES = "oracle_sources";
    constexpr const char* ORACLE_HEARTBEAT_TTL = "oracle_heartbeat_ttl";
    constexpr const char* ORACLE_MODE = "oracle_mode";
    constexpr const char* ORACLE_PERF_COUNT = "oracle_perf_count";

    // Protocol
    constexpr const char* ADMIN = "admin";
    constexpr const char* FLASH_FEE_BPS = "flash_fee_bps";
}

/// Separator between a namespace and its entity ids
constexpr char KEY_SEPARATOR = ':';

// ============================================================================
// StorageKey
// ============================================================================

/**
 * A fully qualified storage key.
 *
 * Built from a namespace and zero or more entity ids:
 * @code
 *   StorageKey(Namespace::GOV_RECEIPTS).With(id).With(voter)
 * @endcode
 */
class StorageKey {
public:
    explicit StorageKey(const char* ns) : key_(ns) {}

    /// Append a numeric entity id (16 hex digits)
    StorageKey& With(uint64_t id);

    /// Append an address entity id (64 hex digits)
    StorageKey& With(const Address& addr);

    const std::string& str() const { return key_; }

    bool operator==(const StorageKey& other) const { return key_ == other.key_; }
    bool operator!=(const StorageKey& other) const { return key_ != other.key_; }
    bool operator<(const StorageKey& other) const { return key_ < other.key_; }

private:
    std::string key_;
};

// ============================================================================
// Key Constructors
// ============================================================================

namespace keys {

StorageKey ProposalCounter();
StorageKey Proposal(ProposalId id);
StorageKey Receipt(ProposalId id, const Address& voter);
StorageKey QuorumBps();
StorageKey Timelock();
StorageKey Delegation(const Address& delegator);

StorageKey OracleSources(const Address& asset);
StorageKey HeartbeatTtl();
StorageKey AggregationMode();
StorageKey PerformanceCount();

StorageKey Admin();
StorageKey FlashFeeBps();

} // namespace keys

} // namespace storage
} // namespace stellend

#endif // STELLEND_STORAGE_KEYS_H
