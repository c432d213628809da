// STELLEND - Oracle Price Aggregator
// Copyright (c) 2024 STELLEND Developers
// MIT License
//
// Multi-source price oracle.
//
// Key features:
// - Per-asset registry of price sources
// - Heartbeat-based staleness filtering
// - Median with outlier trimming, or a plain mean
// - Configurable isolation of failing sources
// - Reentrancy protection around external price calls

#ifndef STELLEND_ORACLE_ORACLE_H
#define STELLEND_ORACLE_ORACLE_H

#include "stellend/core/serialize.h"
#include "stellend/core/status.h"
#include "stellend/core/types.h"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace stellend {

namespace protocol {
class AdminGate;
class Clock;
class ReentrancyGuard;
}

namespace oracle {

class OracleStore;

// ============================================================================
// Oracle Constants
// ============================================================================

/// Default maximum age of a source heartbeat (seconds)
constexpr uint64_t DEFAULT_HEARTBEAT_TTL = 300;

/// Minimum number of prices before the lowest and highest are dropped
constexpr size_t MIN_PRICES_FOR_TRIM = 3;

// ============================================================================
// Aggregation Mode
// ============================================================================

enum class AggregationMode : int64_t {
    /// Median after dropping one lowest and one highest price
    MedianTrim = 0,
    /// Truncating arithmetic mean
    Mean = 1,
};

const char* AggregationModeToString(AggregationMode mode);

/// Map a stored mode value to a mode; anything but 1 is MedianTrim
AggregationMode AggregationModeFromValue(int64_t value);

/// True for the values SetMode accepts
bool IsValidAggregationMode(int64_t value);

// ============================================================================
// Failure Policy
// ============================================================================

/// What a fetch does when one source fails
enum class FailurePolicy {
    /// The whole fetch fails with EXTERNAL_CALL_FAILED
    Abort,
    /// The failing source is logged and left out
    Skip,
};

const char* FailurePolicyToString(FailurePolicy policy);

// ============================================================================
// Oracle Source
// ============================================================================

/**
 * A registered price source for one asset.
 * The weight is stored but not used by aggregation.
 */
struct OracleSource {
    Address address;
    Amount weight{0};
    Timestamp lastHeartbeat{0};

    OracleSource() = default;
    OracleSource(const Address& addr, Amount w, Timestamp heartbeat)
        : address(addr), weight(w), lastHeartbeat(heartbeat) {}

    /// A source is stale when its heartbeat is more than ttl seconds old
    bool IsStale(Timestamp now, uint64_t ttl) const {
        return SaturatingSub(now, lastHeartbeat) > ttl;
    }

    bool operator==(const OracleSource& other) const {
        return address == other.address && weight == other.weight &&
               lastHeartbeat == other.lastHeartbeat;
    }
    bool operator!=(const OracleSource& other) const { return !(*this == other); }

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::stellend::Serialize(s, address);
        ::stellend::Serialize(s, weight);
        ::stellend::Serialize(s, lastHeartbeat);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        ::stellend::Unserialize(s, address);
        ::stellend::Unserialize(s, weight);
        ::stellend::Unserialize(s, lastHeartbeat);
    }
};

template<typename Stream>
void Serialize(Stream& s, const OracleSource& src) {
    src.Serialize(s);
}

template<typename Stream>
void Unserialize(Stream& s, OracleSource& src) {
    src.Unserialize(s);
}

// ============================================================================
// Price Source Capability
// ============================================================================

/**
 * External price feed. Implementations are untrusted: they may fail, return
 * nonsense or call back into the protocol.
 */
class PriceSource {
public:
    virtual ~PriceSource() = default;

    /// Quote the price of asset; a non-OK status is a failed call
    virtual Status GetPrice(const Address& asset, Amount* price) = 0;
};

/// Maps a registered source address to its feed
class PriceSourceResolver {
public:
    virtual ~PriceSourceResolver() = default;

    /// The feed behind addr, or nullptr when unknown
    virtual PriceSource* Resolve(const Address& addr) = 0;
};

/// Feed that always quotes the same price
class FixedPriceSource : public PriceSource {
public:
    explicit FixedPriceSource(Amount price) : price_(price) {}

    Status GetPrice(const Address& asset, Amount* price) override;

    void SetPrice(Amount price) { price_ = price; }

private:
    Amount price_;
};

/// Resolver backed by an address-to-feed table
class PriceSourceRegistry : public PriceSourceResolver {
public:
    PriceSource* Resolve(const Address& addr) override;

    void Register(const Address& addr, std::shared_ptr<PriceSource> source);
    void Unregister(const Address& addr);
    size_t Size() const { return sources_.size(); }

private:
    std::map<Address, std::shared_ptr<PriceSource>> sources_;
};

// ============================================================================
// Aggregation Algorithms
// ============================================================================

/**
 * Median with outlier trim. Sorts ascending; with at least three prices the
 * lowest and highest are dropped. An even span averages its two middle
 * values, truncating.
 * @return INVALID_AMOUNT on an empty list
 */
Status MedianWithTrim(std::vector<Amount> prices, Amount* out);

/**
 * Truncating arithmetic mean.
 * @return INVALID_AMOUNT on an empty list or when the sum overflows
 */
Status MeanPrice(const std::vector<Amount>& prices, Amount* out);

// ============================================================================
// Oracle Aggregator
// ============================================================================

class OracleAggregator {
public:
    OracleAggregator(OracleStore& store,
                     const protocol::Clock& clock,
                     const protocol::AdminGate& admin,
                     PriceSourceResolver& resolver,
                     protocol::ReentrancyGuard& guard,
                     FailurePolicy policy = FailurePolicy::Abort);

    OracleAggregator(const OracleAggregator&) = delete;
    OracleAggregator& operator=(const OracleAggregator&) = delete;

    // === Source Registry (admin only) ===

    /// Replace the source with the same address in place, or append it
    Status SetSource(const Address& caller, const Address& asset,
                     const OracleSource& source);

    /// Drop every source with this address; no match is not an error
    Status RemoveSource(const Address& caller, const Address& asset,
                        const Address& addr);

    Status GetSources(const Address& asset, std::vector<OracleSource>* out) const;

    // === Prices ===

    /**
     * Quote every fresh source for asset, in registry order.
     * Stale sources are not called. Non-positive quotes are dropped.
     */
    Status FetchPrices(const Address& asset, std::vector<Amount>* out);

    /**
     * Aggregate the fetched prices with the stored mode.
     * Counts the call in the performance counter. out is nullopt when no
     * usable price was fetched.
     */
    Status AggregatePrice(const Address& asset, std::optional<Amount>* out);

    // === Parameters ===

    Status SetHeartbeatTtl(const Address& caller, uint64_t ttl);
    Status SetMode(const Address& caller, int64_t mode);

    Status GetHeartbeatTtl(uint64_t* out) const;
    Status GetMode(AggregationMode* out) const;
    Status GetPerformanceCount(int64_t* out) const;

    void SetFailurePolicy(FailurePolicy policy) { policy_ = policy; }
    FailurePolicy GetFailurePolicy() const { return policy_; }

private:
    /// Fetch with the reentrancy guard already held
    Status FetchPricesLocked(const Address& asset, std::vector<Amount>* out);

    OracleStore& store_;
    const protocol::Clock& clock_;
    const protocol::AdminGate& admin_;
    PriceSourceResolver& resolver_;
    protocol::ReentrancyGuard& guard_;
    FailurePolicy policy_;
};

} // namespace oracle
} // namespace stellend

#endif // STELLEND_ORACLE_ORACLE_H
