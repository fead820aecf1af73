// NeuroShield - Scam Adjudication Governance
// Copyright (c) 2024 NeuroShield Developers
// MIT License
//
// Quadratic-voting proposal state machine. Participants open proposals
// accusing an address, stake tokens to vote, and settle the proposal after
// its deadline. Settlement commits the verdict to the trust registry,
// updates voter reputation and refunds every stake.

#ifndef NEUROSHIELD_GOVERNANCE_GOVERNANCE_H
#define NEUROSHIELD_GOVERNANCE_GOVERNANCE_H

#include "neuroshield/core/address.h"
#include "neuroshield/core/types.h"
#include "neuroshield/governance/escrow.h"
#include "neuroshield/governance/reputation.h"
#include "neuroshield/trust/trust_registry.h"

#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <variant>
#include <vector>

namespace neuroshield {
namespace governance {

// ============================================================================
// Governance Constants
// ============================================================================

/// Production voting window (3 days)
constexpr int64_t DEFAULT_VOTING_PERIOD = 3 * 24 * 60 * 60;

/// Voting window used in regression-test mode
constexpr int64_t REGTEST_VOTING_PERIOD = 60;

/// For-side share (%) required to pass
constexpr uint64_t APPROVAL_THRESHOLD_PERCENT = 60;

/// Maximum description length (bytes)
constexpr size_t MAX_DESCRIPTION_LENGTH = 1024;

/// Maximum evidence reference length (bytes)
constexpr size_t MAX_EVIDENCE_LENGTH = 512;

// ============================================================================
// Enumerations
// ============================================================================

/// Proposal lifecycle. Transitions only move forward.
enum class ProposalStatus : uint8_t {
    Active = 0,
    Passed = 1,
    Rejected = 2,
    Executed = 3,
};

const char* ProposalStatusToString(ProposalStatus status);

/// Reason a governance operation was refused
enum class GovernanceError : uint8_t {
    OK = 0,
    InvalidTarget,
    InvalidDescription,
    Unauthenticated,
    ProposalNotFound,
    ProposalClosed,
    DuplicateVote,
    InvalidStake,
    InsufficientTokens,
    VotingStillOpen,
    AlreadyExecuted,
    MalformedCommand,
    /// The token bank refused to return a stake; settlement did not happen
    RefundFailed,
};

/// Stable name, e.g. "DuplicateVote"
const char* GovernanceErrorToString(GovernanceError error);

/// Inverse of GovernanceErrorToString
std::optional<GovernanceError> ParseGovernanceError(const std::string& name);

/// Broad category of a failure
enum class ErrorClass : uint8_t {
    None,
    /// Caller input was wrong; fix the request
    Validation,
    /// Caller's view of state was stale; re-read before retrying
    StateConflict,
};

ErrorClass GetErrorClass(GovernanceError error);

const char* ErrorClassToString(ErrorClass cls);

// ============================================================================
// Proposal
// ============================================================================

struct Proposal {
    ProposalId id{0};

    /// Address under investigation
    Address target;

    std::string description;

    /// Opaque evidence reference (URL, content hash, ...)
    std::string evidence;

    Address proposer;
    Timestamp createdAt{0};

    /// createdAt + voting period, never changed afterwards
    Timestamp deadline{0};

    uint64_t forPower{0};
    uint64_t againstPower{0};

    ProposalStatus status{ProposalStatus::Active};

    /// Outcome recorded at settlement; kept after the move to Executed
    bool passed{false};

    Timestamp executedAt{0};

    uint64_t TotalPower() const { return forPower + againstPower; }

    /// For-side share in percent, 0 with no votes
    uint32_t ApprovalPercent() const;

    /// Whether the tally as it stands meets the approval threshold
    bool MeetsThreshold() const;

    bool IsVotingOpen(Timestamp now) const {
        return status == ProposalStatus::Active && now < deadline;
    }

    /// Status as observed at now. An Active proposal past its deadline
    /// reports the outcome it would settle with.
    ProposalStatus StatusAt(Timestamp now) const;

    std::string ToString() const;
};

// ============================================================================
// Vote
// ============================================================================

struct Vote {
    ProposalId proposalId{0};
    Address voter;
    bool support{false};
    TokenAmount tokens{0};
    uint64_t power{0};
    Timestamp castAt{0};

    std::string ToString() const;
};

/// Aggregated community verdict on one address
struct DAOConfidence {
    uint64_t forPower{0};
    uint64_t againstPower{0};
    uint32_t totalVoters{0};

    /// forPower * 100 / (forPower + againstPower), 0 with no votes
    uint32_t confidencePercent{0};
};

// ============================================================================
// Events
// ============================================================================

/// Emitted when a proposal opens so readers can flag the target as under review
struct ProposalOpenedEvent {
    ProposalId proposalId{0};
    Address target;
    Timestamp deadline{0};
};

/// Emitted once per proposal when it settles
struct SettlementEvent {
    ProposalId proposalId{0};
    bool passed{false};
    Address target;

    /// Registry score after settlement (unchanged if rejected)
    uint32_t newScamScore{0};
    bool confirmed{false};

    std::vector<Address> affectedVoters;
    std::vector<Refund> refunds;

    TokenAmount TotalRefunded() const;
};

using GovernanceEvent = std::variant<ProposalOpenedEvent, SettlementEvent>;

/// "ProposalOpened" or "ProposalSettled"
const char* GovernanceEventName(const GovernanceEvent& event);

/// Proposal an event refers to
ProposalId GovernanceEventProposal(const GovernanceEvent& event);

// ============================================================================
// Operation Result
// ============================================================================

/**
 * Outcome of a governance operation. Domain failures are returned, never
 * thrown.
 */
template<typename T>
struct GovernanceResult {
    GovernanceError error{GovernanceError::OK};
    std::optional<T> value;

    bool ok() const { return error == GovernanceError::OK; }

    static GovernanceResult Success(T v) {
        GovernanceResult r;
        r.value = std::move(v);
        return r;
    }

    static GovernanceResult Failure(GovernanceError e) {
        GovernanceResult r;
        r.error = e;
        return r;
    }
};

// ============================================================================
// Governance Engine
// ============================================================================

struct GovernanceConfig {
    /// Voting window in seconds
    int64_t votingPeriod{DEFAULT_VOTING_PERIOD};
};

/**
 * Proposal state machine and sole writer of reputation and trust state.
 *
 * Write operations expect to be called from a single serializing executor
 * (the Ledger) and take the current time as an argument so that replay is
 * deterministic. Each write validates completely before changing anything.
 * Reads take a shared lock and may run on any thread.
 */
class GovernanceEngine {
public:
    GovernanceEngine(const GovernanceConfig& config,
                     trust::TrustRegistry& registry,
                     TokenBank& bank);

    GovernanceEngine(const GovernanceEngine&) = delete;
    GovernanceEngine& operator=(const GovernanceEngine&) = delete;

    // === Write Operations ===

    /// Open a proposal against target. Deadline = now + voting period.
    GovernanceResult<ProposalId> SubmitProposal(const Address& caller,
                                                const Address& target,
                                                const std::string& description,
                                                const std::string& evidence,
                                                Timestamp now);

    /// Stake tokens for or against a proposal
    GovernanceResult<Vote> CastVote(const Address& caller,
                                    ProposalId id,
                                    bool support,
                                    TokenAmount tokens,
                                    Timestamp now);

    /// Settle a proposal whose deadline has passed. Callable by anyone, once.
    GovernanceResult<SettlementEvent> ExecuteProposal(const Address& caller,
                                                      ProposalId id,
                                                      Timestamp now);

    // === Proposal Queries ===

    GovernanceResult<Proposal> GetProposal(ProposalId id) const;

    std::optional<Vote> GetVote(ProposalId id, const Address& voter) const;

    /// All votes on a proposal, ordered by voter
    std::vector<Vote> GetVotes(ProposalId id) const;

    size_t GetProposalVoterCount(ProposalId id) const;

    std::vector<Proposal> GetProposalsByTarget(const Address& target) const;

    /// Proposals still in the Active state (including ones past deadline
    /// that nobody executed yet)
    std::vector<Proposal> GetActiveProposals() const;

    /// Whether an Active proposal exists for target
    bool HasActiveProposal(const Address& target) const;

    size_t GetProposalCount() const;

    // === Trust and Reputation Queries ===

    uint32_t GetThreatScore(const Address& target) const;
    bool IsConfirmedScam(const Address& target) const;
    std::optional<trust::TrustRecord> GetTrustRecord(const Address& target) const;

    /// Sum over every proposal ever submitted against target
    DAOConfidence GetDAOConfidence(const Address& target) const;

    /// (0, 0) for an unknown voter
    VoterProfile GetVoterStats(const Address& voter) const;

    /// Tokens currently held in escrow for a proposal
    TokenAmount GetEscrowed(ProposalId id) const;

    const GovernanceConfig& GetConfig() const { return config_; }

private:
    const Proposal* FindProposal(ProposalId id) const;

    GovernanceConfig config_;
    trust::TrustRegistry& registry_;
    TokenBank& bank_;

    mutable std::shared_mutex mutex_;
    ProposalId nextProposalId_{0};
    std::map<ProposalId, Proposal> proposals_;
    std::map<ProposalId, std::map<Address, Vote>> votes_;
    std::map<Address, std::vector<ProposalId>> proposalsByTarget_;
    ReputationLedger reputation_;
    EscrowBook escrow_;
};

} // namespace governance
} // namespace neuroshield

#endif // NEUROSHIELD_GOVERNANCE_GOVERNANCE_H
