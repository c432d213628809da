// STELLEND - Oracle Price Aggregator Implementation
// Copyright (c) 2024 STELLEND Developers
// MIT License

#include "stellend/oracle/oracle.h"
#include "stellend/oracle/store.h"
#include "stellend/protocol/admin.h"
#include "stellend/protocol/clock.h"
#include "stellend/protocol/reentrancy.h"
#include "stellend/storage/kvstore.h"
#include "stellend/util/logging.h"

#include <algorithm>

namespace stellend {
namespace oracle {

// ============================================================================
// Enumerations
// ============================================================================

const char* AggregationModeToString(AggregationMode mode) {
    switch (mode) {
        case AggregationMode::MedianTrim: return "MedianTrim";
        case AggregationMode::Mean:       return "Mean";
        default:                          return "Unknown";
    }
}

AggregationMode AggregationModeFromValue(int64_t value) {
    return value == static_cast<int64_t>(AggregationMode::Mean)
        ? AggregationMode::Mean
        : AggregationMode::MedianTrim;
}

bool IsValidAggregationMode(int64_t value) {
    return value == static_cast<int64_t>(AggregationMode::MedianTrim) ||
           value == static_cast<int64_t>(AggregationMode::Mean);
}

const char* FailurePolicyToString(FailurePolicy policy) {
    switch (policy) {
        case FailurePolicy::Abort: return "Abort";
        case FailurePolicy::Skip:  return "Skip";
        default:                   return "Unknown";
    }
}

// ============================================================================
// Price Sources
// ============================================================================

Status FixedPriceSource::GetPrice(const Address& /*asset*/, Amount* price) {
    *price = price_;
    return Status::Ok();
}

PriceSource* PriceSourceRegistry::Resolve(const Address& addr) {
    auto it = sources_.find(addr);
    if (it == sources_.end()) {
        return nullptr;
    }
    return it->second.get();
}

void PriceSourceRegistry::Register(const Address& addr, std::shared_ptr<PriceSource> source) {
    sources_[addr] = std::move(source);
}

void PriceSourceRegistry::Unregister(const Address& addr) {
    sources_.erase(addr);
}

// ============================================================================
// Aggregation Algorithms
// ============================================================================

Status MedianWithTrim(std::vector<Amount> prices, Amount* out) {
    if (prices.empty()) {
        return Status::InvalidAmount("median of no prices");
    }
    std::sort(prices.begin(), prices.end());

    size_t start = 0;
    size_t end = prices.size();
    if (prices.size() >= MIN_PRICES_FOR_TRIM) {
        start = 1;
        end = prices.size() - 1;
    }

    size_t span = end - start;
    size_t mid = start + span / 2;
    if (span % 2 == 1) {
        *out = prices[mid];
        return Status::Ok();
    }

    // Sorted, so lo <= hi and the difference cannot overflow for prices > 0
    Amount lo = prices[mid - 1];
    Amount hi = prices[mid];
    *out = lo + (hi - lo) / 2;
    return Status::Ok();
}

Status MeanPrice(const std::vector<Amount>& prices, Amount* out) {
    if (prices.empty()) {
        return Status::InvalidAmount("mean of no prices");
    }
    Amount sum = 0;
    for (Amount price : prices) {
        if (!CheckedAdd(sum, price, &sum)) {
            return Status::InvalidAmount("price sum overflows");
        }
    }
    *out = sum / static_cast<Amount>(prices.size());
    return Status::Ok();
}

// ============================================================================
// Oracle Aggregator
// ============================================================================

OracleAggregator::OracleAggregator(OracleStore& store,
                                   const protocol::Clock& clock,
                                   const protocol::AdminGate& admin,
                                   PriceSourceResolver& resolver,
                                   protocol::ReentrancyGuard& guard,
                                   FailurePolicy policy)
    : store_(store)
    , clock_(clock)
    , admin_(admin)
    , resolver_(resolver)
    , guard_(guard)
    , policy_(policy) {}

Status OracleAggregator::SetSource(const Address& caller, const Address& asset,
                                   const OracleSource& source) {
    storage::Invocation inv(store_.GetKVStore());

    Status s = admin_.RequireAdmin(caller);
    if (!s.ok()) {
        return inv.Finish(s);
    }

    std::vector<OracleSource> sources;
    s = store_.GetSources(asset, &sources);
    if (!s.ok()) {
        return inv.Finish(s);
    }

    bool replaced = false;
    for (auto& existing : sources) {
        if (existing.address == source.address) {
            existing = source;
            replaced = true;
        }
    }
    if (!replaced) {
        sources.push_back(source);
    }

    store_.PutSources(asset, sources);
    s = inv.Commit();
    if (s.ok()) {
        LOG_INFO(util::LogCategory::ORACLE) << (replaced ? "Updated" : "Added")
                                            << " source " << source.address.ToShortString()
                                            << " for asset " << asset.ToShortString()
                                            << " (" << sources.size() << " sources)";
    }
    return s;
}

Status OracleAggregator::RemoveSource(const Address& caller, const Address& asset,
                                      const Address& addr) {
    storage::Invocation inv(store_.GetKVStore());

    Status s = admin_.RequireAdmin(caller);
    if (!s.ok()) {
        return inv.Finish(s);
    }

    std::vector<OracleSource> sources;
    s = store_.GetSources(asset, &sources);
    if (!s.ok()) {
        return inv.Finish(s);
    }

    size_t before = sources.size();
    sources.erase(std::remove_if(sources.begin(), sources.end(),
                                 [&addr](const OracleSource& src) {
                                     return src.address == addr;
                                 }),
                  sources.end());

    store_.PutSources(asset, sources);
    s = inv.Commit();
    if (s.ok()) {
        LOG_INFO(util::LogCategory::ORACLE) << "Removed " << (before - sources.size())
                                            << " source(s) " << addr.ToShortString()
                                            << " for asset " << asset.ToShortString();
    }
    return s;
}

Status OracleAggregator::GetSources(const Address& asset,
                                    std::vector<OracleSource>* out) const {
    return store_.GetSources(asset, out);
}

Status OracleAggregator::FetchPrices(const Address& asset, std::vector<Amount>* out) {
    protocol::ReentrancyGuard::Scope scope(guard_);
    if (!scope.Entered()) {
        LOG_WARN(util::LogCategory::ORACLE) << "Reentrant price fetch for asset "
                                            << asset.ToShortString() << " rejected";
        return Status::ReentrantCall("price fetch already in progress");
    }
    return FetchPricesLocked(asset, out);
}

Status OracleAggregator::FetchPricesLocked(const Address& asset, std::vector<Amount>* out) {
    std::vector<OracleSource> sources;
    Status s = store_.GetSources(asset, &sources);
    if (!s.ok()) {
        return s;
    }

    uint64_t ttl = 0;
    s = store_.GetHeartbeatTtl(&ttl);
    if (!s.ok()) {
        return s;
    }

    Timestamp now = clock_.Now();
    std::vector<Amount> prices;
    prices.reserve(sources.size());

    for (const auto& src : sources) {
        if (src.IsStale(now, ttl)) {
            LOG_DEBUG(util::LogCategory::ORACLE) << "Skipping stale source "
                                                 << src.address.ToShortString()
                                                 << " (heartbeat " << src.lastHeartbeat << ")";
            continue;
        }

        Status callStatus;
        Amount price = 0;
        PriceSource* feed = resolver_.Resolve(src.address);
        if (feed == nullptr) {
            callStatus = Status::ExternalCallFailed("no price feed at " + src.address.ToHex());
        } else {
            callStatus = feed->GetPrice(asset, &price);
        }

        if (!callStatus.ok()) {
            if (policy_ == FailurePolicy::Abort) {
                LOG_ERROR(util::LogCategory::ORACLE) << "Source " << src.address.ToShortString()
                                                     << " failed: " << callStatus.ToString();
                return Status::ExternalCallFailed(callStatus.ToString());
            }
            LOG_WARN(util::LogCategory::ORACLE) << "Skipping failed source "
                                                << src.address.ToShortString() << ": "
                                                << callStatus.ToString();
            continue;
        }

        if (price > 0) {
            prices.push_back(price);
        } else {
            LOG_DEBUG(util::LogCategory::ORACLE) << "Dropping non-positive price " << price
                                                 << " from " << src.address.ToShortString();
        }
    }

    *out = std::move(prices);
    return Status::Ok();
}

Status OracleAggregator::AggregatePrice(const Address& asset, std::optional<Amount>* out) {
    storage::Invocation inv(store_.GetKVStore());

    protocol::ReentrancyGuard::Scope scope(guard_);
    if (!scope.Entered()) {
        LOG_WARN(util::LogCategory::ORACLE) << "Reentrant aggregation for asset "
                                            << asset.ToShortString() << " rejected";
        return inv.Finish(Status::ReentrantCall("price aggregation already in progress"));
    }

    std::vector<Amount> prices;
    Status s = FetchPricesLocked(asset, &prices);
    if (!s.ok()) {
        return inv.Finish(s);
    }

    int64_t count = 0;
    s = store_.IncrementPerformanceCount(&count);
    if (!s.ok()) {
        return inv.Finish(s);
    }

    std::optional<Amount> result;
    if (!prices.empty()) {
        int64_t modeValue = 0;
        s = store_.GetMode(&modeValue);
        if (!s.ok()) {
            return inv.Finish(s);
        }

        Amount price = 0;
        if (AggregationModeFromValue(modeValue) == AggregationMode::Mean) {
            s = MeanPrice(prices, &price);
        } else {
            s = MedianWithTrim(prices, &price);
        }
        if (!s.ok()) {
            return inv.Finish(s);
        }
        result = price;
    }

    s = inv.Commit();
    if (!s.ok()) {
        return s;
    }

    if (result) {
        LOG_DEBUG(util::LogCategory::ORACLE) << "Aggregated " << prices.size()
                                             << " prices for " << asset.ToShortString()
                                             << ": " << *result;
    } else {
        LOG_INFO(util::LogCategory::ORACLE) << "No usable price for asset "
                                            << asset.ToShortString();
    }
    *out = result;
    return Status::Ok();
}

Status OracleAggregator::SetHeartbeatTtl(const Address& caller, uint64_t ttl) {
    storage::Invocation inv(store_.GetKVStore());

    Status s = admin_.RequireAdmin(caller);
    if (!s.ok()) {
        return inv.Finish(s);
    }

    store_.SetHeartbeatTtl(ttl);
    s = inv.Commit();
    if (s.ok()) {
        LOG_INFO(util::LogCategory::ORACLE) << "Heartbeat TTL set to " << ttl << "s";
    }
    return s;
}

Status OracleAggregator::SetMode(const Address& caller, int64_t mode) {
    storage::Invocation inv(store_.GetKVStore());

    Status s = admin_.RequireAdmin(caller);
    if (!s.ok()) {
        return inv.Finish(s);
    }
    if (!IsValidAggregationMode(mode)) {
        LOG_WARN(util::LogCategory::ORACLE) << "Rejected aggregation mode " << mode;
        return inv.Finish(Status::InvalidAmount("aggregation mode must be 0 or 1"));
    }

    store_.SetMode(mode);
    s = inv.Commit();
    if (s.ok()) {
        LOG_INFO(util::LogCategory::ORACLE) << "Aggregation mode set to "
                                            << AggregationModeToString(AggregationModeFromValue(mode));
    }
    return s;
}

Status OracleAggregator::GetHeartbeatTtl(uint64_t* out) const {
    return store_.GetHeartbeatTtl(out);
}

Status OracleAggregator::GetMode(AggregationMode* out) const {
    int64_t value = 0;
    Status s = store_.GetMode(&value);
    if (!s.ok()) {
        return s;
    }
    *out = AggregationModeFromValue(value);
    return Status::Ok();
}

Status OracleAggregator::GetPerformanceCount(int64_t* out) const {
    return store_.GetPerformanceCount(out);
}

} // namespace oracle
} // namespace stellend
