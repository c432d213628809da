// STELLEND - Storage Key Tests
// Copyright (c) 2024 STELLEND Developers
// MIT License

#include <gtest/gtest.h>
#include "stellend/storage/keys.h"

#include <set>
#include <string>

namespace stellend {
namespace storage {
namespace test {

TEST(StorageKeyTest, SingletonKeysAreBareNamespaces) {
    EXPECT_EQ(keys::ProposalCounter().str(), "gov_counter");
    EXPECT_EQ(keys::QuorumBps().str(), "gov_quorum_bps");
    EXPECT_EQ(keys::Timelock().str(), "gov_timelock");
    EXPECT_EQ(keys::HeartbeatTtl().str(), "oracle_heartbeat_ttl");
    EXPECT_EQ(keys::AggregationMode().str(), "oracle_mode");
    EXPECT_EQ(keys::PerformanceCount().str(), "oracle_perf_count");
    EXPECT_EQ(keys::Admin().str(), "admin");
    EXPECT_EQ(keys::FlashFeeBps().str(), "flash_fee_bps");
}

TEST(StorageKeyTest, ProposalKeyEncodesId) {
    EXPECT_EQ(keys::Proposal(1).str(), "gov_proposals:0000000000000001");
    EXPECT_EQ(keys::Proposal(0xabc).str(), "gov_proposals:0000000000000abc");
}

TEST(StorageKeyTest, ReceiptKeyHasIdAndVoter) {
    Address voter = Address::FromHex(std::string(64, 'e'));
    EXPECT_EQ(keys::Receipt(2, voter).str(),
              "gov_receipts:0000000000000002:" + std::string(64, 'e'));
}

TEST(StorageKeyTest, AddressKeys) {
    Address a = Address::FromHex(std::string(64, '1'));
    EXPECT_EQ(keys::Delegation(a).str(), "gov_delegation:" + a.ToHex());
    EXPECT_EQ(keys::OracleSources(a).str(), "oracle_sources:" + a.ToHex());
}

TEST(StorageKeyTest, DistinctEntitiesGiveDistinctKeys) {
    Address a = Address::FromHex(std::string(64, '1'));
    Address b = Address::FromHex(std::string(64, '2'));

    std::set<std::string> all = {
        keys::Proposal(1).str(),
        keys::Proposal(2).str(),
        keys::Receipt(1, a).str(),
        keys::Receipt(1, b).str(),
        keys::Receipt(2, a).str(),
        keys::Delegation(a).str(),
        keys::OracleSources(a).str(),
        keys::OracleSources(b).str(),
    };
    EXPECT_EQ(all.size(), 8u);
}

TEST(StorageKeyTest, Comparison) {
    EXPECT_EQ(keys::Proposal(5), keys::Proposal(5));
    EXPECT_NE(keys::Proposal(5), keys::Proposal(6));
    EXPECT_LT(keys::Proposal(5), keys::Proposal(6));
}

} // namespace test
} // namespace storage
} // namespace stellend
