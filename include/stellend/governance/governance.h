// STELLEND - Governance Module
// Copyright (c) 2024 STELLEND Developers
// MIT License
//
// Proposal governance for the lending protocol.
//
// Lifecycle:
// - Propose: allocate an id and open voting for a fixed period
// - Vote: add weight to the for or against tally while voting is open
// - Queue: once voting has closed with quorum, start the timelock
// - Execute: after the timelock, mark the proposal executed (once)

#ifndef STELLEND_GOVERNANCE_GOVERNANCE_H
#define STELLEND_GOVERNANCE_GOVERNANCE_H

#include "stellend/core/serialize.h"
#include "stellend/core/status.h"
#include "stellend/core/types.h"

#include <optional>
#include <string>

namespace stellend {

namespace protocol {
class AdminGate;
class Clock;
}

namespace governance {

class GovernanceStore;

// ============================================================================
// Governance Constants
// ============================================================================

/// Default quorum: share of for-votes in the total, in basis points (10%)
constexpr int64_t DEFAULT_QUORUM_BPS = 1000;

/// Default delay between queueing and execution (seconds)
constexpr uint64_t DEFAULT_TIMELOCK = 60;

/// Upper bound for the quorum setting (100%)
constexpr int64_t MAX_QUORUM_BPS = BPS_DENOMINATOR;

// ============================================================================
// Proposal State
// ============================================================================

/**
 * Lifecycle stage of a proposal, derived from its fields and the clock.
 */
enum class ProposalState {
    Pending,        // Voting open, now < votingEnds
    VotingClosed,   // Voting period over, not queued
    Queued,         // Timelock started
    Executed,       // Executed
};

const char* ProposalStateToString(ProposalState state);

// ============================================================================
// Proposal
// ============================================================================

/**
 * A governance proposal.
 *
 * queued_until == 0 means the proposal has not been queued.
 */
struct Proposal {
    ProposalId id{0};
    Address proposer;
    std::string title;

    /// Creation time
    Timestamp created{0};

    /// created + voting period; votes after this time are ignored
    Timestamp votingEnds{0};

    /// Earliest execution time, 0 when not queued
    Timestamp queuedUntil{0};

    Amount forVotes{0};
    Amount againstVotes{0};

    bool executed{false};

    bool IsQueued() const { return queuedUntil != 0; }

    /// Derive the lifecycle stage at the given time
    ProposalState GetState(Timestamp now) const;

    std::string ToString() const;

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::stellend::Serialize(s, id);
        ::stellend::Serialize(s, proposer);
        ::stellend::Serialize(s, title);
        ::stellend::Serialize(s, created);
        ::stellend::Serialize(s, votingEnds);
        ::stellend::Serialize(s, queuedUntil);
        ::stellend::Serialize(s, forVotes);
        ::stellend::Serialize(s, againstVotes);
        ::stellend::Serialize(s, executed);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        ::stellend::Unserialize(s, id);
        ::stellend::Unserialize(s, proposer);
        ::stellend::Unserialize(s, title);
        ::stellend::Unserialize(s, created);
        ::stellend::Unserialize(s, votingEnds);
        ::stellend::Unserialize(s, queuedUntil);
        ::stellend::Unserialize(s, forVotes);
        ::stellend::Unserialize(s, againstVotes);
        ::stellend::Unserialize(s, executed);
    }

    bool operator==(const Proposal& other) const;
    bool operator!=(const Proposal& other) const { return !(*this == other); }
};

template<typename Stream>
void Serialize(Stream& s, const Proposal& p) {
    p.Serialize(s);
}

template<typename Stream>
void Unserialize(Stream& s, Proposal& p) {
    p.Unserialize(s);
}

// ============================================================================
// Vote Receipt
// ============================================================================

/**
 * Record of the latest vote of one voter on one proposal.
 * Kept for auditing; tallies live on the proposal.
 */
struct VoteReceipt {
    Address voter;
    bool support{false};
    Amount weight{0};

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::stellend::Serialize(s, voter);
        ::stellend::Serialize(s, support);
        ::stellend::Serialize(s, weight);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        ::stellend::Unserialize(s, voter);
        ::stellend::Unserialize(s, support);
        ::stellend::Unserialize(s, weight);
    }
};

template<typename Stream>
void Serialize(Stream& s, const VoteReceipt& r) {
    r.Serialize(s);
}

template<typename Stream>
void Unserialize(Stream& s, VoteReceipt& r) {
    r.Unserialize(s);
}

// ============================================================================
// Quorum
// ============================================================================

/**
 * Quorum check: total votes must be positive and the for-share, truncated
 * to whole basis points, must reach quorumBps. The ratio is computed in
 * 128 bits, so any pair of tallies is accepted.
 */
Status CheckQuorum(Amount forVotes, Amount againstVotes, int64_t quorumBps,
                   bool* reached);

// ============================================================================
// Governance Engine
// ============================================================================

/**
 * Proposal lifecycle state machine.
 *
 * Each mutating call runs as one storage invocation: it commits all of its
 * writes when it returns OK and none of them otherwise.
 */
class GovernanceEngine {
public:
    GovernanceEngine(GovernanceStore& store,
                     const protocol::Clock& clock,
                     const protocol::AdminGate& admin);

    GovernanceEngine(const GovernanceEngine&) = delete;
    GovernanceEngine& operator=(const GovernanceEngine&) = delete;

    // === Proposal Lifecycle ===

    /// Create a proposal; voting closes votingPeriod seconds from now
    Status Propose(const Address& proposer, const std::string& title,
                   uint64_t votingPeriod, Proposal* out);

    /**
     * Add weight to a proposal tally and record the voter's receipt.
     * After voting has closed the proposal is returned unchanged.
     * Repeat votes from one voter add to the tallies again. Weights are
     * signed and taken as given; a negative weight lowers the tally.
     */
    Status Vote(ProposalId id, const Address& voter, bool support,
                Amount weight, Proposal* out);

    /**
     * Start the timelock once voting has closed with quorum.
     * Each successful call sets queuedUntil to now + timelock, so queueing
     * again later restarts the timelock.
     */
    Status Queue(ProposalId id, Proposal* out);

    /// Mark the proposal executed once its timelock has passed
    Status Execute(ProposalId id, Proposal* out);

    // === Delegation ===

    /// Record that from delegates to to (informational only)
    Status Delegate(const Address& from, const Address& to);

    Status GetDelegate(const Address& from, std::optional<Address>* out) const;

    // === Queries ===

    Status GetProposal(ProposalId id, Proposal* out) const;

    Status GetReceipt(ProposalId id, const Address& voter,
                      std::optional<VoteReceipt>* out) const;

    /// Number of proposals created so far (also the highest id)
    Status GetProposalCount(uint64_t* out) const;

    Status GetProposalState(ProposalId id, ProposalState* out) const;

    // === Parameters (admin only) ===

    Status SetQuorumBps(const Address& caller, int64_t bps);
    Status SetTimelock(const Address& caller, uint64_t seconds);

    Status GetQuorumBps(int64_t* out) const;
    Status GetTimelock(uint64_t* out) const;

private:
    /// Load a proposal or fail with NOT_FOUND
    Status LoadProposal(ProposalId id, Proposal* out) const;

    GovernanceStore& store_;
    const protocol::Clock& clock_;
    const protocol::AdminGate& admin_;
};

} // namespace governance
} // namespace stellend

#endif // STELLEND_GOVERNANCE_GOVERNANCE_H
