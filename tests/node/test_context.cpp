// STELLEND - Protocol Context Tests
// Copyright (c) 2024 STELLEND Developers
// MIT License

#include <gtest/gtest.h>
#include "stellend/node/context.h"
#include "stellend/util/config.h"

#include <array>
#include <filesystem>
#include <memory>
#include <optional>
#include <random>

namespace stellend {
namespace test {

// ============================================================================
// Test Utilities
// ============================================================================

namespace {

Address TestAddress(uint8_t id) {
    std::array<Byte, 32> data{};
    data[0] = id;
    return Address(data);
}

ProtocolOptions MemoryOptions() {
    ProtocolOptions options;
    options.inMemory = true;
    options.fixedTime = 1000;
    options.recordEvents = true;
    return options;
}

class AcceptAll : public flashloan::FlashLoanReceiver {
public:
    Status OnFlashLoan(const Address&, Amount, Amount, const Address&) override {
        return Status::Ok();
    }
};

} // namespace

class ContextTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 999999);
        testDir_ = std::filesystem::temp_directory_path() /
                   ("stellend_context_test_" + std::to_string(dis(gen)));
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(testDir_, ec);
    }

    std::filesystem::path testDir_;
};

// ============================================================================
// Options Tests
// ============================================================================

TEST(ProtocolOptionsTest, Defaults) {
    ProtocolOptions options;
    EXPECT_EQ(options.quorumBps, governance::DEFAULT_QUORUM_BPS);
    EXPECT_EQ(options.timelock, governance::DEFAULT_TIMELOCK);
    EXPECT_EQ(options.heartbeatTtl, oracle::DEFAULT_HEARTBEAT_TTL);
    EXPECT_EQ(options.mode, 0);
    EXPECT_FALSE(options.isolateFailures);
    EXPECT_EQ(options.flashFeeBps, flashloan::DEFAULT_FLASH_FEE_BPS);
}

TEST(ProtocolOptionsTest, FromConfig) {
    util::ConfigManager config;
    ASSERT_TRUE(config.ParseString(R"(
datadir=/tmp/stellend-data
[governance]
quorum_bps=2500
timelock=90
[oracle]
heartbeat_ttl=120
mode=1
isolate_failures=1
[flashloan]
fee_bps=30
)").success);

    ProtocolOptions options = ProtocolOptions::FromConfig(config);
    EXPECT_EQ(options.dataDir, std::filesystem::path("/tmp/stellend-data"));
    EXPECT_EQ(options.quorumBps, 2500);
    EXPECT_EQ(options.timelock, 90u);
    EXPECT_EQ(options.heartbeatTtl, 120u);
    EXPECT_EQ(options.mode, 1);
    EXPECT_TRUE(options.isolateFailures);
    EXPECT_EQ(options.flashFeeBps, 30);
}

TEST(ProtocolOptionsTest, Validate) {
    std::string error;
    ProtocolOptions options = MemoryOptions();
    EXPECT_TRUE(options.Validate(&error));

    options.quorumBps = 10001;
    EXPECT_FALSE(options.Validate(&error));
    EXPECT_NE(error.find("quorum_bps"), std::string::npos);

    options = MemoryOptions();
    options.mode = 2;
    EXPECT_FALSE(options.Validate(&error));

    options = MemoryOptions();
    options.flashFeeBps = -1;
    EXPECT_FALSE(options.Validate(&error));

    options = MemoryOptions();
    options.inMemory = false;
    EXPECT_FALSE(options.Validate(&error));
}

// ============================================================================
// Initialization Tests
// ============================================================================

TEST(ContextInitTest, InMemory) {
    ProtocolContext ctx;
    ASSERT_TRUE(InitializeProtocol(ctx, MemoryOptions()));
    EXPECT_TRUE(ctx.IsReady());
    ASSERT_NE(ctx.manualClock, nullptr);
    EXPECT_EQ(ctx.clock->Now(), 1000u);
    ASSERT_NE(ctx.recordedEvents, nullptr);
    EXPECT_EQ(ctx.oracle->GetFailurePolicy(), oracle::FailurePolicy::Abort);

    // Second initialization is refused
    EXPECT_FALSE(InitializeProtocol(ctx, MemoryOptions()));

    ShutdownProtocol(ctx);
    EXPECT_FALSE(ctx.IsReady());
}

TEST(ContextInitTest, InvalidOptionsRefused) {
    ProtocolOptions options = MemoryOptions();
    options.mode = 7;
    ProtocolContext ctx;
    EXPECT_FALSE(InitializeProtocol(ctx, options));
    EXPECT_FALSE(ctx.IsReady());
}

TEST(ContextInitTest, OptionsAreSeeded) {
    ProtocolOptions options = MemoryOptions();
    options.quorumBps = 2500;
    options.timelock = 90;
    options.heartbeatTtl = 120;
    options.mode = 1;
    options.flashFeeBps = 30;
    options.isolateFailures = true;

    ProtocolContext ctx;
    ASSERT_TRUE(InitializeProtocol(ctx, options));

    int64_t quorum = 0;
    uint64_t timelock = 0;
    uint64_t ttl = 0;
    oracle::AggregationMode mode;
    int64_t fee = 0;
    ASSERT_TRUE(ctx.governance->GetQuorumBps(&quorum).ok());
    ASSERT_TRUE(ctx.governance->GetTimelock(&timelock).ok());
    ASSERT_TRUE(ctx.oracle->GetHeartbeatTtl(&ttl).ok());
    ASSERT_TRUE(ctx.oracle->GetMode(&mode).ok());
    ASSERT_TRUE(ctx.flashLoans->GetFeeBps(&fee).ok());
    EXPECT_EQ(quorum, 2500);
    EXPECT_EQ(timelock, 90u);
    EXPECT_EQ(ttl, 120u);
    EXPECT_EQ(mode, oracle::AggregationMode::Mean);
    EXPECT_EQ(fee, 30);
    EXPECT_EQ(ctx.oracle->GetFailurePolicy(), oracle::FailurePolicy::Skip);
    EXPECT_EQ(ctx.kv->PendingWrites(), 0u);
}

// ============================================================================
// End-to-End Tests
// ============================================================================

TEST(ContextInitTest, EndToEnd) {
    ProtocolContext ctx;
    ASSERT_TRUE(InitializeProtocol(ctx, MemoryOptions()));

    Address admin = TestAddress(0xAD);
    Address asset = TestAddress(0xA1);
    {
        storage::Invocation inv(*ctx.kv);
        ASSERT_TRUE(ctx.admin->InitializeAdmin(admin).ok());
        ASSERT_TRUE(inv.Commit().ok());
    }

    // Governance
    governance::Proposal p;
    ASSERT_TRUE(ctx.governance->Propose(TestAddress(1), "list asset", 100, &p).ok());
    ASSERT_TRUE(ctx.governance->Vote(p.id, TestAddress(1), true, 700, &p).ok());
    ASSERT_TRUE(ctx.governance->Vote(p.id, TestAddress(2), false, 300, &p).ok());
    ctx.manualClock->Advance(100);
    ASSERT_TRUE(ctx.governance->Queue(p.id, &p).ok());
    ASSERT_TRUE(p.IsQueued());
    ctx.manualClock->Advance(governance::DEFAULT_TIMELOCK);
    ASSERT_TRUE(ctx.governance->Execute(p.id, &p).ok());
    EXPECT_TRUE(p.executed);

    // Oracle
    const Amount quotes[] = {100, 102, 98, 1000};
    for (uint8_t i = 0; i < 4; ++i) {
        Address feed = TestAddress(0x10 + i);
        ctx.priceSources->Register(feed, std::make_shared<oracle::FixedPriceSource>(quotes[i]));
        ASSERT_TRUE(ctx.oracle->SetSource(admin, asset,
                                          oracle::OracleSource(feed, 1, ctx.clock->Now())).ok());
    }
    std::optional<Amount> price;
    ASSERT_TRUE(ctx.oracle->AggregatePrice(asset, &price).ok());
    ASSERT_TRUE(price.has_value());
    EXPECT_EQ(*price, 101);

    // Flash loan
    AcceptAll receiver;
    ASSERT_TRUE(ctx.flashLoans->Execute(TestAddress(3), asset, 1000000, receiver).ok());
    auto events = ctx.recordedEvents->GetEvents();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[1].fee, 900);

    ShutdownProtocol(ctx);
}

TEST(ContextInitTest, LoanReceiverCanUseOracle) {
    ProtocolContext ctx;
    ASSERT_TRUE(InitializeProtocol(ctx, MemoryOptions()));

    Address admin = TestAddress(0xAD);
    Address asset = TestAddress(0xA1);
    Address feed = TestAddress(0x10);
    {
        storage::Invocation inv(*ctx.kv);
        ASSERT_TRUE(ctx.admin->InitializeAdmin(admin).ok());
        ASSERT_TRUE(inv.Commit().ok());
    }
    ctx.priceSources->Register(feed, std::make_shared<oracle::FixedPriceSource>(250));
    ASSERT_TRUE(ctx.oracle->SetSource(admin, asset,
                                      oracle::OracleSource(feed, 1, ctx.clock->Now())).ok());

    class PricingReceiver : public flashloan::FlashLoanReceiver {
    public:
        explicit PricingReceiver(oracle::OracleAggregator& oracle) : oracle_(oracle) {}

        Status OnFlashLoan(const Address& asset, Amount, Amount, const Address&) override {
            return oracle_.AggregatePrice(asset, &price);
        }

        std::optional<Amount> price;

    private:
        oracle::OracleAggregator& oracle_;
    };

    PricingReceiver receiver(*ctx.oracle);
    ASSERT_TRUE(ctx.flashLoans->Execute(TestAddress(3), asset, 1000, receiver).ok());
    ASSERT_TRUE(receiver.price.has_value());
    EXPECT_EQ(*receiver.price, 250);
    EXPECT_FALSE(ctx.flashLoanGuard.IsEntered());
    EXPECT_FALSE(ctx.oracleGuard.IsEntered());

    ShutdownProtocol(ctx);
}

TEST_F(ContextTest, StatePersistsAcrossRestart) {
    Address admin = TestAddress(0xAD);

    ProtocolOptions options;
    options.dataDir = testDir_;
    options.fixedTime = 5000;
    {
        ProtocolContext ctx;
        ASSERT_TRUE(InitializeProtocol(ctx, options));
        storage::Invocation inv(*ctx.kv);
        ASSERT_TRUE(ctx.admin->InitializeAdmin(admin).ok());
        ASSERT_TRUE(inv.Commit().ok());

        ASSERT_TRUE(ctx.governance->SetQuorumBps(admin, 4000).ok());
        governance::Proposal p;
        ASSERT_TRUE(ctx.governance->Propose(admin, "persisted", 60, &p).ok());
        ShutdownProtocol(ctx);
    }
    EXPECT_TRUE(std::filesystem::exists(testDir_ / "state"));

    // Seeds from options do not overwrite governed values
    options.quorumBps = 1000;
    ProtocolContext ctx;
    ASSERT_TRUE(InitializeProtocol(ctx, options));

    int64_t quorum = 0;
    ASSERT_TRUE(ctx.governance->GetQuorumBps(&quorum).ok());
    EXPECT_EQ(quorum, 4000);

    governance::Proposal p;
    ASSERT_TRUE(ctx.governance->GetProposal(1, &p).ok());
    EXPECT_EQ(p.title, "persisted");

    std::optional<Address> stored;
    ASSERT_TRUE(ctx.admin->GetAdmin(&stored).ok());
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(*stored, admin);

    {
        storage::Invocation inv(*ctx.kv);
        EXPECT_TRUE(ctx.admin->InitializeAdmin(TestAddress(1)).IsUnauthorized());
    }
    ShutdownProtocol(ctx);
}

} // namespace test
} // namespace stellend
