// STELLEND - Governance Store
// Copyright (c) 2024 STELLEND Developers
// MIT License

#ifndef STELLEND_GOVERNANCE_STORE_H
#define STELLEND_GOVERNANCE_STORE_H

#include "stellend/governance/governance.h"
#include "stellend/storage/kvstore.h"

#include <optional>

namespace stellend {
namespace governance {

/**
 * Persistent governance state: proposals, receipts, delegations and the
 * quorum and timelock parameters.
 *
 * Writes go to the KVStore buffer and are committed by the caller's
 * invocation.
 */
class GovernanceStore {
public:
    explicit GovernanceStore(storage::KVStore& kv);

    storage::KVStore& GetKVStore() { return kv_; }

    // === Proposals ===

    /// Advance the proposal counter and return the new id (first id is 1)
    Status AllocateProposalId(ProposalId* out);

    /// Highest allocated id, 0 when none
    Status GetProposalCount(uint64_t* out) const;

    Status GetProposal(ProposalId id, std::optional<Proposal>* out) const;
    void PutProposal(const Proposal& proposal);

    // === Vote Receipts ===

    Status GetReceipt(ProposalId id, const Address& voter,
                      std::optional<VoteReceipt>* out) const;
    void PutReceipt(ProposalId id, const VoteReceipt& receipt);

    // === Delegation ===

    Status GetDelegate(const Address& from, std::optional<Address>* out) const;
    void PutDelegate(const Address& from, const Address& to);

    // === Parameters ===

    Status GetQuorumBps(int64_t* out) const;
    void SetQuorumBps(int64_t bps);

    Status GetTimelock(uint64_t* out) const;
    void SetTimelock(uint64_t seconds);

    /// Write the parameters that are not stored yet
    Status SeedParameters(int64_t quorumBps, uint64_t timelock);

private:
    storage::KVStore& kv_;
};

} // namespace governance
} // namespace stellend

#endif // STELLEND_GOVERNANCE_STORE_H
