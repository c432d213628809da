// STELLEND - Oracle Aggregator Tests
// Copyright (c) 2024 STELLEND Developers
// MIT License

#include <gtest/gtest.h>
#include "stellend/oracle/oracle.h"
#include "stellend/oracle/store.h"
#include "stellend/protocol/admin.h"
#include "stellend/protocol/clock.h"
#include "stellend/protocol/reentrancy.h"
#include "stellend/storage/kvstore.h"
#include "stellend/db/database.h"

#include <memory>
#include <vector>

namespace stellend {
namespace oracle {
namespace test {

// ============================================================================
// Test Price Sources
// ============================================================================

class FailingPriceSource : public PriceSource {
public:
    Status GetPrice(const Address& /*asset*/, Amount* /*price*/) override {
        ++calls;
        return Status::ExternalCallFailed("feed offline");
    }
    int calls{0};
};

/// Calls back into the aggregator while quoting
class ReentrantPriceSource : public PriceSource {
public:
    Status GetPrice(const Address& asset, Amount* price) override {
        std::vector<Amount> inner;
        innerFetch = aggregator->FetchPrices(asset, &inner);
        std::optional<Amount> aggregated;
        innerAggregate = aggregator->AggregatePrice(asset, &aggregated);
        *price = 100;
        return Status::Ok();
    }

    OracleAggregator* aggregator{nullptr};
    Status innerFetch;
    Status innerAggregate;
};

// ============================================================================
// Test Fixture
// ============================================================================

class OracleTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_ = db::OpenMemoryDatabase();
        kv_ = std::make_unique<storage::KVStore>(*db_);
        admin_ = std::make_unique<protocol::StoredAdminGate>(*kv_);
        store_ = std::make_unique<OracleStore>(*kv_);
        oracle_ = std::make_unique<OracleAggregator>(*store_, clock_, *admin_, registry_, guard_);

        storage::Invocation inv(*kv_);
        ASSERT_TRUE(admin_->InitializeAdmin(Admin()).ok());
        ASSERT_TRUE(inv.Commit().ok());
    }

    static Address TestAddress(uint8_t id) {
        std::array<Byte, 32> data{};
        data[0] = id;
        return Address(data);
    }

    static Address Admin() { return TestAddress(0xAD); }
    static Address Asset() { return TestAddress(0xA1); }
    static Address Feed(uint8_t n) { return TestAddress(0x10 + n); }

    /// Register a fixed feed and add it as a fresh source
    void AddFixedSource(uint8_t n, Amount price) {
        registry_.Register(Feed(n), std::make_shared<FixedPriceSource>(price));
        ASSERT_TRUE(oracle_->SetSource(Admin(), Asset(),
                                       OracleSource(Feed(n), 1, clock_.Now())).ok());
    }

    std::optional<Amount> Aggregate() {
        std::optional<Amount> price;
        EXPECT_TRUE(oracle_->AggregatePrice(Asset(), &price).ok());
        return price;
    }

    int64_t PerformanceCount() {
        int64_t count = -1;
        EXPECT_TRUE(oracle_->GetPerformanceCount(&count).ok());
        return count;
    }

    std::unique_ptr<db::Database> db_;
    std::unique_ptr<storage::KVStore> kv_;
    std::unique_ptr<protocol::StoredAdminGate> admin_;
    std::unique_ptr<OracleStore> store_;
    std::unique_ptr<OracleAggregator> oracle_;
    protocol::ManualClock clock_{10000};
    protocol::ReentrancyGuard guard_;
    PriceSourceRegistry registry_;
};

// ============================================================================
// Source Registry Tests
// ============================================================================

TEST_F(OracleTest, SetSourceAppends) {
    AddFixedSource(1, 100);
    AddFixedSource(2, 200);

    std::vector<OracleSource> sources;
    ASSERT_TRUE(oracle_->GetSources(Asset(), &sources).ok());
    ASSERT_EQ(sources.size(), 2u);
    EXPECT_EQ(sources[0].address, Feed(1));
    EXPECT_EQ(sources[1].address, Feed(2));
}

TEST_F(OracleTest, SetSourceTwiceReplacesInPlace) {
    AddFixedSource(1, 100);
    AddFixedSource(2, 200);
    ASSERT_TRUE(oracle_->SetSource(Admin(), Asset(), OracleSource(Feed(1), 9, 12345)).ok());

    std::vector<OracleSource> sources;
    ASSERT_TRUE(oracle_->GetSources(Asset(), &sources).ok());
    ASSERT_EQ(sources.size(), 2u);
    EXPECT_EQ(sources[0], OracleSource(Feed(1), 9, 12345));
    EXPECT_EQ(sources[1].address, Feed(2));
}

TEST_F(OracleTest, SourcesArePerAsset) {
    AddFixedSource(1, 100);
    std::vector<OracleSource> sources;
    ASSERT_TRUE(oracle_->GetSources(TestAddress(0xB2), &sources).ok());
    EXPECT_TRUE(sources.empty());
}

TEST_F(OracleTest, RemoveSource) {
    AddFixedSource(1, 100);
    AddFixedSource(2, 200);
    ASSERT_TRUE(oracle_->RemoveSource(Admin(), Asset(), Feed(1)).ok());

    std::vector<OracleSource> sources;
    ASSERT_TRUE(oracle_->GetSources(Asset(), &sources).ok());
    ASSERT_EQ(sources.size(), 1u);
    EXPECT_EQ(sources[0].address, Feed(2));

    // Removing an unknown source is not an error
    EXPECT_TRUE(oracle_->RemoveSource(Admin(), Asset(), Feed(7)).ok());
    ASSERT_TRUE(oracle_->GetSources(Asset(), &sources).ok());
    EXPECT_EQ(sources.size(), 1u);
}

TEST_F(OracleTest, NonAdminCannotManageSources) {
    Address stranger = TestAddress(0x55);
    EXPECT_TRUE(oracle_->SetSource(stranger, Asset(), OracleSource(Feed(1), 1, 0))
                    .IsUnauthorized());
    AddFixedSource(1, 100);
    EXPECT_TRUE(oracle_->RemoveSource(stranger, Asset(), Feed(1)).IsUnauthorized());

    std::vector<OracleSource> sources;
    ASSERT_TRUE(oracle_->GetSources(Asset(), &sources).ok());
    EXPECT_EQ(sources.size(), 1u);
}

// ============================================================================
// Fetch Tests
// ============================================================================

TEST_F(OracleTest, FetchInRegistryOrder) {
    AddFixedSource(1, 300);
    AddFixedSource(2, 100);
    AddFixedSource(3, 200);

    std::vector<Amount> prices;
    ASSERT_TRUE(oracle_->FetchPrices(Asset(), &prices).ok());
    EXPECT_EQ(prices, (std::vector<Amount>{300, 100, 200}));
}

TEST_F(OracleTest, StaleSourcesExcluded) {
    AddFixedSource(1, 100);
    registry_.Register(Feed(2), std::make_shared<FixedPriceSource>(999));
    ASSERT_TRUE(oracle_->SetSource(Admin(), Asset(),
                                   OracleSource(Feed(2), 1, clock_.Now() - 301)).ok());
    registry_.Register(Feed(3), std::make_shared<FixedPriceSource>(102));
    ASSERT_TRUE(oracle_->SetSource(Admin(), Asset(),
                                   OracleSource(Feed(3), 1, clock_.Now() - 300)).ok());

    std::vector<Amount> prices;
    ASSERT_TRUE(oracle_->FetchPrices(Asset(), &prices).ok());
    EXPECT_EQ(prices, (std::vector<Amount>{100, 102}));
}

TEST_F(OracleTest, NonPositivePricesDropped) {
    AddFixedSource(1, 0);
    AddFixedSource(2, -5);
    AddFixedSource(3, 50);

    std::vector<Amount> prices;
    ASSERT_TRUE(oracle_->FetchPrices(Asset(), &prices).ok());
    EXPECT_EQ(prices, (std::vector<Amount>{50}));
}

TEST_F(OracleTest, HeartbeatTtlIsConfigurable) {
    AddFixedSource(1, 100);
    clock_.Advance(100);

    ASSERT_TRUE(oracle_->SetHeartbeatTtl(Admin(), 50).ok());
    std::vector<Amount> prices;
    ASSERT_TRUE(oracle_->FetchPrices(Asset(), &prices).ok());
    EXPECT_TRUE(prices.empty());

    EXPECT_TRUE(oracle_->SetHeartbeatTtl(TestAddress(0x55), 500).IsUnauthorized());
    uint64_t ttl = 0;
    ASSERT_TRUE(oracle_->GetHeartbeatTtl(&ttl).ok());
    EXPECT_EQ(ttl, 50u);
}

// ============================================================================
// Aggregation Tests
// ============================================================================

TEST_F(OracleTest, MedianAggregation) {
    AddFixedSource(1, 100);
    AddFixedSource(2, 102);
    AddFixedSource(3, 98);
    AddFixedSource(4, 1000);

    auto price = Aggregate();
    ASSERT_TRUE(price.has_value());
    EXPECT_EQ(*price, 101);
}

TEST_F(OracleTest, MeanAggregation) {
    AddFixedSource(1, 100);
    AddFixedSource(2, 102);
    AddFixedSource(3, 98);
    AddFixedSource(4, 1000);
    ASSERT_TRUE(oracle_->SetMode(Admin(), 1).ok());

    auto price = Aggregate();
    ASSERT_TRUE(price.has_value());
    EXPECT_EQ(*price, 325);

    AggregationMode mode;
    ASSERT_TRUE(oracle_->GetMode(&mode).ok());
    EXPECT_EQ(mode, AggregationMode::Mean);
}

TEST_F(OracleTest, NoUsablePriceGivesNothing) {
    EXPECT_FALSE(Aggregate().has_value());

    AddFixedSource(1, 0);
    registry_.Register(Feed(2), std::make_shared<FixedPriceSource>(100));
    ASSERT_TRUE(oracle_->SetSource(Admin(), Asset(), OracleSource(Feed(2), 1, 0)).ok());
    EXPECT_FALSE(Aggregate().has_value());
}

TEST_F(OracleTest, PerformanceCountIncludesEmptyResults) {
    EXPECT_EQ(PerformanceCount(), 0);
    Aggregate();
    AddFixedSource(1, 100);
    Aggregate();
    EXPECT_EQ(PerformanceCount(), 2);

    // Fetching alone does not count
    std::vector<Amount> prices;
    ASSERT_TRUE(oracle_->FetchPrices(Asset(), &prices).ok());
    EXPECT_EQ(PerformanceCount(), 2);
}

TEST_F(OracleTest, InvalidModeRejected) {
    EXPECT_TRUE(oracle_->SetMode(Admin(), 2).IsInvalidAmount());
    EXPECT_TRUE(oracle_->SetMode(Admin(), -1).IsInvalidAmount());
    EXPECT_TRUE(oracle_->SetMode(TestAddress(0x55), 1).IsUnauthorized());

    AggregationMode mode;
    ASSERT_TRUE(oracle_->GetMode(&mode).ok());
    EXPECT_EQ(mode, AggregationMode::MedianTrim);
}

// ============================================================================
// Failure Policy Tests
// ============================================================================

TEST_F(OracleTest, AbortPolicyFailsWholeFetch) {
    AddFixedSource(1, 100);
    auto failing = std::make_shared<FailingPriceSource>();
    registry_.Register(Feed(2), failing);
    ASSERT_TRUE(oracle_->SetSource(Admin(), Asset(), OracleSource(Feed(2), 1, clock_.Now())).ok());

    EXPECT_EQ(oracle_->GetFailurePolicy(), FailurePolicy::Abort);
    std::vector<Amount> prices;
    EXPECT_TRUE(oracle_->FetchPrices(Asset(), &prices).IsExternalCallFailed());

    std::optional<Amount> price;
    EXPECT_TRUE(oracle_->AggregatePrice(Asset(), &price).IsExternalCallFailed());
    EXPECT_EQ(PerformanceCount(), 0);
    EXPECT_EQ(failing->calls, 2);
}

TEST_F(OracleTest, SkipPolicyLeavesFailingSourceOut) {
    oracle_->SetFailurePolicy(FailurePolicy::Skip);
    AddFixedSource(1, 100);
    registry_.Register(Feed(2), std::make_shared<FailingPriceSource>());
    ASSERT_TRUE(oracle_->SetSource(Admin(), Asset(), OracleSource(Feed(2), 1, clock_.Now())).ok());
    AddFixedSource(3, 104);

    std::vector<Amount> prices;
    ASSERT_TRUE(oracle_->FetchPrices(Asset(), &prices).ok());
    EXPECT_EQ(prices, (std::vector<Amount>{100, 104}));

    auto price = Aggregate();
    ASSERT_TRUE(price.has_value());
    EXPECT_EQ(*price, 102);
}

TEST_F(OracleTest, UnresolvableSourceIsFailedCall) {
    ASSERT_TRUE(oracle_->SetSource(Admin(), Asset(), OracleSource(Feed(9), 1, clock_.Now())).ok());
    std::vector<Amount> prices;
    EXPECT_TRUE(oracle_->FetchPrices(Asset(), &prices).IsExternalCallFailed());

    oracle_->SetFailurePolicy(FailurePolicy::Skip);
    ASSERT_TRUE(oracle_->FetchPrices(Asset(), &prices).ok());
    EXPECT_TRUE(prices.empty());
}

TEST_F(OracleTest, StaleFailingSourceIsNotCalled) {
    auto failing = std::make_shared<FailingPriceSource>();
    registry_.Register(Feed(2), failing);
    ASSERT_TRUE(oracle_->SetSource(Admin(), Asset(), OracleSource(Feed(2), 1, 0)).ok());
    AddFixedSource(1, 100);

    std::vector<Amount> prices;
    ASSERT_TRUE(oracle_->FetchPrices(Asset(), &prices).ok());
    EXPECT_EQ(failing->calls, 0);
}

// ============================================================================
// Reentrancy Tests
// ============================================================================

TEST_F(OracleTest, SourceCannotReenter) {
    auto reentrant = std::make_shared<ReentrantPriceSource>();
    reentrant->aggregator = oracle_.get();
    registry_.Register(Feed(1), reentrant);
    ASSERT_TRUE(oracle_->SetSource(Admin(), Asset(), OracleSource(Feed(1), 1, clock_.Now())).ok());

    auto price = Aggregate();
    ASSERT_TRUE(price.has_value());
    EXPECT_EQ(*price, 100);
    EXPECT_TRUE(reentrant->innerFetch.IsReentrantCall());
    EXPECT_TRUE(reentrant->innerAggregate.IsReentrantCall());

    // Only the outer aggregation counted
    EXPECT_EQ(PerformanceCount(), 1);
    EXPECT_FALSE(guard_.IsEntered());
}

TEST_F(OracleTest, HeldGuardBlocksFetch) {
    AddFixedSource(1, 100);
    {
        protocol::ReentrancyGuard::Scope scope(guard_);
        ASSERT_TRUE(scope.Entered());

        std::vector<Amount> prices;
        EXPECT_TRUE(oracle_->FetchPrices(Asset(), &prices).IsReentrantCall());
        std::optional<Amount> price;
        EXPECT_TRUE(oracle_->AggregatePrice(Asset(), &price).IsReentrantCall());
    }
    std::vector<Amount> prices;
    EXPECT_TRUE(oracle_->FetchPrices(Asset(), &prices).ok());
}

} // namespace test
} // namespace oracle
} // namespace stellend
