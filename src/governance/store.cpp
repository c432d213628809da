// STELLEND - Governance Store Implementation
// Copyright (c) 2024 STELLEND Developers
// MIT License

#include "stellend/governance/store.h"

namespace stellend {
namespace governance {

GovernanceStore::GovernanceStore(storage::KVStore& kv) : kv_(kv) {}

// ============================================================================
// Proposals
// ============================================================================

Status GovernanceStore::AllocateProposalId(ProposalId* out) {
    uint64_t count = 0;
    Status s = GetProposalCount(&count);
    if (!s.ok()) {
        return s;
    }
    ProposalId next = count + 1;
    kv_.Write(storage::keys::ProposalCounter(), next);
    *out = next;
    return Status::Ok();
}

Status GovernanceStore::GetProposalCount(uint64_t* out) const {
    return kv_.ReadOr<uint64_t>(storage::keys::ProposalCounter(), 0, out);
}

Status GovernanceStore::GetProposal(ProposalId id, std::optional<Proposal>* out) const {
    return kv_.Read(storage::keys::Proposal(id), out);
}

void GovernanceStore::PutProposal(const Proposal& proposal) {
    kv_.Write(storage::keys::Proposal(proposal.id), proposal);
}

// ============================================================================
// Vote Receipts
// ============================================================================

Status GovernanceStore::GetReceipt(ProposalId id, const Address& voter,
                                   std::optional<VoteReceipt>* out) const {
    return kv_.Read(storage::keys::Receipt(id, voter), out);
}

void GovernanceStore::PutReceipt(ProposalId id, const VoteReceipt& receipt) {
    kv_.Write(storage::keys::Receipt(id, receipt.voter), receipt);
}

// ============================================================================
// Delegation
// ============================================================================

Status GovernanceStore::GetDelegate(const Address& from, std::optional<Address>* out) const {
    return kv_.Read(storage::keys::Delegation(from), out);
}

void GovernanceStore::PutDelegate(const Address& from, const Address& to) {
    kv_.Write(storage::keys::Delegation(from), to);
}

// ============================================================================
// Parameters
// ============================================================================

Status GovernanceStore::GetQuorumBps(int64_t* out) const {
    return kv_.ReadOr<int64_t>(storage::keys::QuorumBps(), DEFAULT_QUORUM_BPS, out);
}

void GovernanceStore::SetQuorumBps(int64_t bps) {
    kv_.Write(storage::keys::QuorumBps(), bps);
}

Status GovernanceStore::GetTimelock(uint64_t* out) const {
    return kv_.ReadOr<uint64_t>(storage::keys::Timelock(), DEFAULT_TIMELOCK, out);
}

void GovernanceStore::SetTimelock(uint64_t seconds) {
    kv_.Write(storage::keys::Timelock(), seconds);
}

Status GovernanceStore::SeedParameters(int64_t quorumBps, uint64_t timelock) {
    std::optional<int64_t> storedQuorum;
    Status s = kv_.Read(storage::keys::QuorumBps(), &storedQuorum);
    if (!s.ok()) {
        return s;
    }
    std::optional<uint64_t> storedTimelock;
    s = kv_.Read(storage::keys::Timelock(), &storedTimelock);
    if (!s.ok()) {
        return s;
    }

    if (!storedQuorum) {
        SetQuorumBps(quorumBps);
    }
    if (!storedTimelock) {
        SetTimelock(timelock);
    }
    return Status::Ok();
}

} // namespace governance
} // namespace stellend
