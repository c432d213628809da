// STELLEND - Governance Module Implementation
// Copyright (c) 2024 STELLEND Developers
// MIT License

#include "stellend/governance/governance.h"
#include "stellend/governance/store.h"
#include "stellend/protocol/admin.h"
#include "stellend/protocol/clock.h"
#include "stellend/storage/kvstore.h"
#include "stellend/util/logging.h"

#include <sstream>

namespace stellend {
namespace governance {

// ============================================================================
// Proposal State
// ============================================================================

const char* ProposalStateToString(ProposalState state) {
    switch (state) {
        case ProposalState::Pending:      return "Pending";
        case ProposalState::VotingClosed: return "VotingClosed";
        case ProposalState::Queued:       return "Queued";
        case ProposalState::Executed:     return "Executed";
        default:                          return "Unknown";
    }
}

// ============================================================================
// Proposal
// ============================================================================

ProposalState Proposal::GetState(Timestamp now) const {
    if (executed) {
        return ProposalState::Executed;
    }
    if (IsQueued()) {
        return ProposalState::Queued;
    }
    if (now >= votingEnds) {
        return ProposalState::VotingClosed;
    }
    return ProposalState::Pending;
}

std::string Proposal::ToString() const {
    std::ostringstream oss;
    oss << "Proposal #" << id
        << " \"" << title << "\""
        << " proposer=" << proposer.ToShortString()
        << " for=" << forVotes
        << " against=" << againstVotes
        << " votingEnds=" << votingEnds
        << " queuedUntil=" << queuedUntil
        << " executed=" << (executed ? "yes" : "no");
    return oss.str();
}

bool Proposal::operator==(const Proposal& other) const {
    return id == other.id &&
           proposer == other.proposer &&
           title == other.title &&
           created == other.created &&
           votingEnds == other.votingEnds &&
           queuedUntil == other.queuedUntil &&
           forVotes == other.forVotes &&
           againstVotes == other.againstVotes &&
           executed == other.executed;
}

// ============================================================================
// Quorum
// ============================================================================

Status CheckQuorum(Amount forVotes, Amount againstVotes, int64_t quorumBps,
                   bool* reached) {
    // Widened so every pair of stored tallies has an exact ratio
    WideAmount total = static_cast<WideAmount>(forVotes) + againstVotes;
    if (total <= 0) {
        *reached = false;
        return Status::Ok();
    }

    WideAmount share = static_cast<WideAmount>(forVotes) * BPS_DENOMINATOR / total;
    *reached = share >= quorumBps;
    return Status::Ok();
}

// ============================================================================
// Governance Engine
// ============================================================================

GovernanceEngine::GovernanceEngine(GovernanceStore& store,
                                   const protocol::Clock& clock,
                                   const protocol::AdminGate& admin)
    : store_(store), clock_(clock), admin_(admin) {}

Status GovernanceEngine::LoadProposal(ProposalId id, Proposal* out) const {
    std::optional<Proposal> proposal;
    Status s = store_.GetProposal(id, &proposal);
    if (!s.ok()) {
        return s;
    }
    if (!proposal) {
        return Status::NotFound("proposal " + std::to_string(id));
    }
    *out = std::move(*proposal);
    return Status::Ok();
}

Status GovernanceEngine::Propose(const Address& proposer, const std::string& title,
                                 uint64_t votingPeriod, Proposal* out) {
    storage::Invocation inv(store_.GetKVStore());

    Proposal proposal;
    proposal.proposer = proposer;
    proposal.title = title;
    proposal.created = clock_.Now();
    if (!CheckedAddTime(proposal.created, votingPeriod, &proposal.votingEnds)) {
        return inv.Finish(Status::InvalidAmount("voting period overflows"));
    }

    Status s = store_.AllocateProposalId(&proposal.id);
    if (!s.ok()) {
        return inv.Finish(s);
    }
    store_.PutProposal(proposal);

    s = inv.Commit();
    if (!s.ok()) {
        return s;
    }

    LOG_INFO(util::LogCategory::GOV) << "Created proposal #" << proposal.id
                                     << " by " << proposal.proposer.ToShortString()
                                     << ", voting ends at " << proposal.votingEnds;
    *out = std::move(proposal);
    return Status::Ok();
}

Status GovernanceEngine::Vote(ProposalId id, const Address& voter, bool support,
                              Amount weight, Proposal* out) {
    storage::Invocation inv(store_.GetKVStore());

    Proposal proposal;
    Status s = LoadProposal(id, &proposal);
    if (!s.ok()) {
        return inv.Finish(s);
    }

    Timestamp now = clock_.Now();
    if (now > proposal.votingEnds) {
        LOG_DEBUG(util::LogCategory::GOV) << "Vote on proposal #" << id
                                          << " ignored, voting closed at "
                                          << proposal.votingEnds;
        *out = std::move(proposal);
        return inv.Finish(Status::Ok());
    }

    Amount& tally = support ? proposal.forVotes : proposal.againstVotes;
    if (!CheckedAdd(tally, weight, &tally)) {
        return inv.Finish(Status::InvalidAmount("vote tally overflows"));
    }

    VoteReceipt receipt;
    receipt.voter = voter;
    receipt.support = support;
    receipt.weight = weight;

    store_.PutReceipt(id, receipt);
    store_.PutProposal(proposal);

    s = inv.Commit();
    if (!s.ok()) {
        return s;
    }

    LOG_DEBUG(util::LogCategory::GOV) << voter.ToShortString() << " voted "
                                      << (support ? "for" : "against")
                                      << " proposal #" << id << " with weight " << weight;
    *out = std::move(proposal);
    return Status::Ok();
}

Status GovernanceEngine::Queue(ProposalId id, Proposal* out) {
    storage::Invocation inv(store_.GetKVStore());

    Proposal proposal;
    Status s = LoadProposal(id, &proposal);
    if (!s.ok()) {
        return inv.Finish(s);
    }

    int64_t quorumBps = 0;
    s = store_.GetQuorumBps(&quorumBps);
    if (!s.ok()) {
        return inv.Finish(s);
    }

    bool quorum = false;
    s = CheckQuorum(proposal.forVotes, proposal.againstVotes, quorumBps, &quorum);
    if (!s.ok()) {
        return inv.Finish(s);
    }

    Timestamp now = clock_.Now();
    if (!quorum || now < proposal.votingEnds) {
        LOG_DEBUG(util::LogCategory::GOV) << "Proposal #" << id << " not queued"
                                          << (quorum ? ", voting still open" : ", no quorum");
        *out = std::move(proposal);
        return inv.Finish(Status::Ok());
    }

    uint64_t timelock = 0;
    s = store_.GetTimelock(&timelock);
    if (!s.ok()) {
        return inv.Finish(s);
    }
    if (!CheckedAddTime(now, timelock, &proposal.queuedUntil)) {
        return inv.Finish(Status::InvalidAmount("timelock overflows"));
    }

    store_.PutProposal(proposal);
    s = inv.Commit();
    if (!s.ok()) {
        return s;
    }

    LOG_INFO(util::LogCategory::GOV) << "Queued proposal #" << id
                                     << " until " << proposal.queuedUntil;
    *out = std::move(proposal);
    return Status::Ok();
}

Status GovernanceEngine::Execute(ProposalId id, Proposal* out) {
    storage::Invocation inv(store_.GetKVStore());

    Proposal proposal;
    Status s = LoadProposal(id, &proposal);
    if (!s.ok()) {
        return inv.Finish(s);
    }

    Timestamp now = clock_.Now();
    if (proposal.executed || !proposal.IsQueued() || now < proposal.queuedUntil) {
        *out = std::move(proposal);
        return inv.Finish(Status::Ok());
    }

    proposal.executed = true;
    store_.PutProposal(proposal);
    s = inv.Commit();
    if (!s.ok()) {
        return s;
    }

    LOG_INFO(util::LogCategory::GOV) << "Executed proposal #" << id;
    *out = std::move(proposal);
    return Status::Ok();
}

Status GovernanceEngine::Delegate(const Address& from, const Address& to) {
    storage::Invocation inv(store_.GetKVStore());
    store_.PutDelegate(from, to);
    Status s = inv.Commit();
    if (s.ok()) {
        LOG_DEBUG(util::LogCategory::GOV) << from.ToShortString() << " delegated to "
                                          << to.ToShortString();
    }
    return s;
}

Status GovernanceEngine::GetDelegate(const Address& from, std::optional<Address>* out) const {
    return store_.GetDelegate(from, out);
}

Status GovernanceEngine::GetProposal(ProposalId id, Proposal* out) const {
    return LoadProposal(id, out);
}

Status GovernanceEngine::GetReceipt(ProposalId id, const Address& voter,
                                    std::optional<VoteReceipt>* out) const {
    return store_.GetReceipt(id, voter, out);
}

Status GovernanceEngine::GetProposalCount(uint64_t* out) const {
    return store_.GetProposalCount(out);
}

Status GovernanceEngine::GetProposalState(ProposalId id, ProposalState* out) const {
    Proposal proposal;
    Status s = LoadProposal(id, &proposal);
    if (!s.ok()) {
        return s;
    }
    *out = proposal.GetState(clock_.Now());
    return Status::Ok();
}

Status GovernanceEngine::SetQuorumBps(const Address& caller, int64_t bps) {
    storage::Invocation inv(store_.GetKVStore());

    Status s = admin_.RequireAdmin(caller);
    if (!s.ok()) {
        return inv.Finish(s);
    }
    if (bps < 0 || bps > MAX_QUORUM_BPS) {
        LOG_WARN(util::LogCategory::GOV) << "Rejected quorum " << bps << " bps";
        return inv.Finish(Status::InvalidAmount("quorum must be within 0..10000 bps"));
    }

    store_.SetQuorumBps(bps);
    s = inv.Commit();
    if (s.ok()) {
        LOG_INFO(util::LogCategory::GOV) << "Quorum set to " << bps << " bps";
    }
    return s;
}

Status GovernanceEngine::SetTimelock(const Address& caller, uint64_t seconds) {
    storage::Invocation inv(store_.GetKVStore());

    Status s = admin_.RequireAdmin(caller);
    if (!s.ok()) {
        return inv.Finish(s);
    }

    store_.SetTimelock(seconds);
    s = inv.Commit();
    if (s.ok()) {
        LOG_INFO(util::LogCategory::GOV) << "Timelock set to " << seconds << "s";
    }
    return s;
}

Status GovernanceEngine::GetQuorumBps(int64_t* out) const {
    return store_.GetQuorumBps(out);
}

Status GovernanceEngine::GetTimelock(uint64_t* out) const {
    return store_.GetTimelock(out);
}

} // namespace governance
} // namespace stellend
