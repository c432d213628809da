// STELLEND - Governance Store Tests
// Copyright (c) 2024 STELLEND Developers
// MIT License

#include <gtest/gtest.h>
#include "stellend/governance/store.h"
#include "stellend/storage/kvstore.h"
#include "stellend/db/database.h"

#include <memory>

using namespace stellend;
using namespace stellend::governance;

class GovernanceStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_ = db::OpenMemoryDatabase();
        kv_ = std::make_unique<storage::KVStore>(*db_);
        store_ = std::make_unique<GovernanceStore>(*kv_);
    }

    std::unique_ptr<db::Database> db_;
    std::unique_ptr<storage::KVStore> kv_;
    std::unique_ptr<GovernanceStore> store_;
};

TEST_F(GovernanceStoreTest, IdsAreSequential) {
    ProposalId id = 0;
    ASSERT_TRUE(store_->AllocateProposalId(&id).ok());
    EXPECT_EQ(id, 1u);
    ASSERT_TRUE(store_->AllocateProposalId(&id).ok());
    EXPECT_EQ(id, 2u);

    uint64_t count = 0;
    ASSERT_TRUE(store_->GetProposalCount(&count).ok());
    EXPECT_EQ(count, 2u);
}

TEST_F(GovernanceStoreTest, ProposalPersistsAfterCommit) {
    Proposal p;
    p.id = 7;
    p.title = "t";
    p.votingEnds = 50;
    store_->PutProposal(p);
    ASSERT_TRUE(kv_->Commit().ok());

    // A fresh store over the same database sees it
    storage::KVStore kv(*db_);
    GovernanceStore reopened(kv);
    std::optional<Proposal> loaded;
    ASSERT_TRUE(reopened.GetProposal(7, &loaded).ok());
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, p);

    ASSERT_TRUE(reopened.GetProposal(8, &loaded).ok());
    EXPECT_FALSE(loaded.has_value());
}

TEST_F(GovernanceStoreTest, ReceiptsArePerVoter) {
    VoteReceipt a;
    a.voter = Address::FromHex(std::string(64, 'a'));
    a.support = true;
    a.weight = 3;
    store_->PutReceipt(1, a);

    std::optional<VoteReceipt> loaded;
    ASSERT_TRUE(store_->GetReceipt(1, a.voter, &loaded).ok());
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->weight, 3);

    ASSERT_TRUE(store_->GetReceipt(2, a.voter, &loaded).ok());
    EXPECT_FALSE(loaded.has_value());
    ASSERT_TRUE(store_->GetReceipt(1, Address::FromHex(std::string(64, 'b')), &loaded).ok());
    EXPECT_FALSE(loaded.has_value());
}

TEST_F(GovernanceStoreTest, SeedKeepsStoredParameters) {
    store_->SetQuorumBps(2500);
    ASSERT_TRUE(store_->SeedParameters(1000, 90).ok());

    int64_t quorum = 0;
    uint64_t timelock = 0;
    ASSERT_TRUE(store_->GetQuorumBps(&quorum).ok());
    ASSERT_TRUE(store_->GetTimelock(&timelock).ok());
    EXPECT_EQ(quorum, 2500);
    EXPECT_EQ(timelock, 90u);
}

TEST_F(GovernanceStoreTest, CorruptProposalIsStorageError) {
    ASSERT_TRUE(db_->Put(storage::keys::Proposal(1).str(), "x").ok());
    std::optional<Proposal> loaded;
    EXPECT_TRUE(store_->GetProposal(1, &loaded).IsStorageError());
}
