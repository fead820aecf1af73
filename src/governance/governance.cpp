// NeuroShield - Governance Module Implementation
// Copyright (c) 2024 NeuroShield Developers
// MIT License

#include "neuroshield/governance/governance.h"
#include "neuroshield/governance/voting_power.h"
#include "neuroshield/util/logging.h"

#include <mutex>
#include <sstream>

namespace neuroshield {
namespace governance {

// ============================================================================
// String Conversion Functions
// ============================================================================

const char* ProposalStatusToString(ProposalStatus status) {
    switch (status) {
        case ProposalStatus::Active: return "Active";
        case ProposalStatus::Passed: return "Passed";
        case ProposalStatus::Rejected: return "Rejected";
        case ProposalStatus::Executed: return "Executed";
        default: return "Unknown";
    }
}

const char* GovernanceErrorToString(GovernanceError error) {
    switch (error) {
        case GovernanceError::OK: return "OK";
        case GovernanceError::InvalidTarget: return "InvalidTarget";
        case GovernanceError::InvalidDescription: return "InvalidDescription";
        case GovernanceError::Unauthenticated: return "Unauthenticated";
        case GovernanceError::ProposalNotFound: return "ProposalNotFound";
        case GovernanceError::ProposalClosed: return "ProposalClosed";
        case GovernanceError::DuplicateVote: return "DuplicateVote";
        case GovernanceError::InvalidStake: return "InvalidStake";
        case GovernanceError::InsufficientTokens: return "InsufficientTokens";
        case GovernanceError::VotingStillOpen: return "VotingStillOpen";
        case GovernanceError::AlreadyExecuted: return "AlreadyExecuted";
        case GovernanceError::MalformedCommand: return "MalformedCommand";
        case GovernanceError::RefundFailed: return "RefundFailed";
        default: return "Unknown";
    }
}

std::optional<GovernanceError> ParseGovernanceError(const std::string& name) {
    for (uint8_t i = 0; i <= static_cast<uint8_t>(GovernanceError::RefundFailed); ++i) {
        auto error = static_cast<GovernanceError>(i);
        if (name == GovernanceErrorToString(error)) {
            return error;
        }
    }
    return std::nullopt;
}

ErrorClass GetErrorClass(GovernanceError error) {
    switch (error) {
        case GovernanceError::OK:
            return ErrorClass::None;
        case GovernanceError::ProposalClosed:
        case GovernanceError::DuplicateVote:
        case GovernanceError::VotingStillOpen:
        case GovernanceError::AlreadyExecuted:
        case GovernanceError::RefundFailed:
            return ErrorClass::StateConflict;
        default:
            return ErrorClass::Validation;
    }
}

const char* ErrorClassToString(ErrorClass cls) {
    switch (cls) {
        case ErrorClass::None: return "None";
        case ErrorClass::Validation: return "Validation";
        case ErrorClass::StateConflict: return "StateConflict";
        default: return "Unknown";
    }
}

// ============================================================================
// Proposal
// ============================================================================

uint32_t Proposal::ApprovalPercent() const {
    uint64_t total = TotalPower();
    if (total == 0) {
        return 0;
    }
    return static_cast<uint32_t>(forPower * 100 / total);
}

bool Proposal::MeetsThreshold() const {
    return TotalPower() > 0 && ApprovalPercent() >= APPROVAL_THRESHOLD_PERCENT;
}

ProposalStatus Proposal::StatusAt(Timestamp now) const {
    if (status == ProposalStatus::Active && now >= deadline) {
        return MeetsThreshold() ? ProposalStatus::Passed : ProposalStatus::Rejected;
    }
    return status;
}

std::string Proposal::ToString() const {
    std::ostringstream ss;
    ss << "Proposal(id=" << id
       << ", target=" << target.ToString()
       << ", status=" << ProposalStatusToString(status)
       << ", for=" << forPower
       << ", against=" << againstPower
       << ", deadline=" << deadline << ")";
    return ss.str();
}

std::string Vote::ToString() const {
    std::ostringstream ss;
    ss << "Vote(proposal=" << proposalId
       << ", voter=" << voter.ToShortString()
       << ", " << (support ? "for" : "against")
       << ", tokens=" << tokens
       << ", power=" << power << ")";
    return ss.str();
}

// ============================================================================
// Events
// ============================================================================

TokenAmount SettlementEvent::TotalRefunded() const {
    TokenAmount total = 0;
    for (const auto& refund : refunds) {
        total += refund.amount;
    }
    return total;
}

const char* GovernanceEventName(const GovernanceEvent& event) {
    if (std::holds_alternative<ProposalOpenedEvent>(event)) {
        return "ProposalOpened";
    }
    return "ProposalSettled";
}

ProposalId GovernanceEventProposal(const GovernanceEvent& event) {
    return std::visit([](const auto& e) { return e.proposalId; }, event);
}

// ============================================================================
// GovernanceEngine
// ============================================================================

namespace {

template<typename T>
GovernanceResult<T> Reject(const char* operation, GovernanceError error) {
    LOG_DEBUG(util::LogCategory::GOVERNANCE) << operation << " rejected: "
                                             << GovernanceErrorToString(error);
    return GovernanceResult<T>::Failure(error);
}

} // anonymous namespace

GovernanceEngine::GovernanceEngine(const GovernanceConfig& config,
                                   trust::TrustRegistry& registry,
                                   TokenBank& bank)
    : config_(config), registry_(registry), bank_(bank) {}

const Proposal* GovernanceEngine::FindProposal(ProposalId id) const {
    auto it = proposals_.find(id);
    return it == proposals_.end() ? nullptr : &it->second;
}

GovernanceResult<ProposalId> GovernanceEngine::SubmitProposal(
    const Address& caller,
    const Address& target,
    const std::string& description,
    const std::string& evidence,
    Timestamp now)
{
    if (caller.IsNull()) {
        return Reject<ProposalId>("SubmitProposal", GovernanceError::Unauthenticated);
    }
    if (target.IsNull()) {
        return Reject<ProposalId>("SubmitProposal", GovernanceError::InvalidTarget);
    }
    if (description.empty() || description.size() > MAX_DESCRIPTION_LENGTH ||
        evidence.size() > MAX_EVIDENCE_LENGTH) {
        return Reject<ProposalId>("SubmitProposal", GovernanceError::InvalidDescription);
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    Proposal proposal;
    proposal.id = nextProposalId_++;
    proposal.target = target;
    proposal.description = description;
    proposal.evidence = evidence;
    proposal.proposer = caller;
    proposal.createdAt = now;
    proposal.deadline = now + config_.votingPeriod;

    const ProposalId id = proposal.id;
    proposalsByTarget_[target].push_back(id);
    proposals_.emplace(id, std::move(proposal));

    LOG_INFO(util::LogCategory::GOVERNANCE) << "Opened proposal " << id
                                            << " against " << target.ToString();
    return GovernanceResult<ProposalId>::Success(id);
}

GovernanceResult<Vote> GovernanceEngine::CastVote(const Address& caller,
                                                  ProposalId id,
                                                  bool support,
                                                  TokenAmount tokens,
                                                  Timestamp now) {
    if (caller.IsNull()) {
        return Reject<Vote>("CastVote", GovernanceError::Unauthenticated);
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto pit = proposals_.find(id);
    if (pit == proposals_.end()) {
        return Reject<Vote>("CastVote", GovernanceError::ProposalNotFound);
    }
    Proposal& proposal = pit->second;

    if (!proposal.IsVotingOpen(now)) {
        return Reject<Vote>("CastVote", GovernanceError::ProposalClosed);
    }

    auto bit = votes_.find(id);
    if (bit != votes_.end() && bit->second.count(caller) > 0) {
        return Reject<Vote>("CastVote", GovernanceError::DuplicateVote);
    }
    if (tokens == 0) {
        return Reject<Vote>("CastVote", GovernanceError::InvalidStake);
    }

    // Last check that can fail; nothing has been modified before it
    if (!bank_.Lock(caller, tokens)) {
        return Reject<Vote>("CastVote", GovernanceError::InsufficientTokens);
    }

    escrow_.Hold(id, caller, tokens);

    Vote vote;
    vote.proposalId = id;
    vote.voter = caller;
    vote.support = support;
    vote.tokens = tokens;
    vote.power = CalculateVotingPower(tokens, reputation_.GetProfile(caller));
    vote.castAt = now;

    if (support) {
        proposal.forPower += vote.power;
    } else {
        proposal.againstPower += vote.power;
    }
    votes_[id].emplace(caller, vote);
    reputation_.EnsureProfile(caller);

    LOG_DEBUG(util::LogCategory::GOVERNANCE) << "Recorded " << vote.ToString();
    return GovernanceResult<Vote>::Success(vote);
}

GovernanceResult<SettlementEvent> GovernanceEngine::ExecuteProposal(const Address& caller,
                                                                    ProposalId id,
                                                                    Timestamp now) {
    if (caller.IsNull()) {
        return Reject<SettlementEvent>("ExecuteProposal", GovernanceError::Unauthenticated);
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto pit = proposals_.find(id);
    if (pit == proposals_.end()) {
        return Reject<SettlementEvent>("ExecuteProposal", GovernanceError::ProposalNotFound);
    }
    Proposal& proposal = pit->second;

    if (proposal.status == ProposalStatus::Executed) {
        return Reject<SettlementEvent>("ExecuteProposal", GovernanceError::AlreadyExecuted);
    }
    if (now < proposal.deadline) {
        return Reject<SettlementEvent>("ExecuteProposal", GovernanceError::VotingStillOpen);
    }

    // Return every stake before touching the verdict. A refusal rolls back
    // the refunds already made, so a failed settlement leaves no trace.
    std::vector<Refund> refunds = escrow_.PendingRefunds(id);
    for (size_t i = 0; i < refunds.size(); ++i) {
        if (bank_.Unlock(refunds[i].voter, refunds[i].amount)) {
            continue;
        }
        for (size_t j = 0; j < i; ++j) {
            if (!bank_.Lock(refunds[j].voter, refunds[j].amount)) {
                LOG_ERROR(util::LogCategory::GOVERNANCE)
                    << "Could not re-lock " << refunds[j].amount << " for "
                    << refunds[j].voter.ToString() << " after failed settlement of " << id;
            }
        }
        LOG_WARN(util::LogCategory::GOVERNANCE)
            << "Settlement of proposal " << id << " aborted: bank refused refund of "
            << refunds[i].amount << " to " << refunds[i].voter.ToString();
        return Reject<SettlementEvent>("ExecuteProposal", GovernanceError::RefundFailed);
    }
    escrow_.ReleaseAll(id);

    // Decide the outcome
    proposal.passed = proposal.MeetsThreshold();

    SettlementEvent event;
    event.proposalId = id;
    event.passed = proposal.passed;
    event.target = proposal.target;
    event.refunds = std::move(refunds);

    // Commit the verdict. A rejected proposal leaves the registry untouched.
    if (proposal.passed) {
        trust::TrustRecord record = registry_.RecordConfirmation(proposal.target);
        event.newScamScore = record.scamScore;
        event.confirmed = record.isConfirmedScam;
    } else {
        auto record = registry_.GetRecord(proposal.target);
        if (record) {
            event.newScamScore = record->scamScore;
            event.confirmed = record->isConfirmedScam;
        }
    }

    // Reputation for every voter
    for (const auto& [voter, vote] : votes_[id]) {
        reputation_.RecordSettlement(voter, vote.support == proposal.passed);
        event.affectedVoters.push_back(voter);
    }

    proposal.status = ProposalStatus::Executed;
    proposal.executedAt = now;

    LOG_INFO(util::LogCategory::GOVERNANCE)
        << "Settled proposal " << id << " " << (proposal.passed ? "PASSED" : "REJECTED")
        << " (for=" << proposal.forPower << ", against=" << proposal.againstPower
        << ", voters=" << event.affectedVoters.size()
        << ", score=" << event.newScamScore << ")";

    return GovernanceResult<SettlementEvent>::Success(std::move(event));
}

// ============================================================================
// Queries
// ============================================================================

GovernanceResult<Proposal> GovernanceEngine::GetProposal(ProposalId id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const Proposal* proposal = FindProposal(id);
    if (!proposal) {
        return GovernanceResult<Proposal>::Failure(GovernanceError::ProposalNotFound);
    }
    return GovernanceResult<Proposal>::Success(*proposal);
}

std::optional<Vote> GovernanceEngine::GetVote(ProposalId id, const Address& voter) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = votes_.find(id);
    if (it == votes_.end()) {
        return std::nullopt;
    }
    auto vit = it->second.find(voter);
    if (vit == it->second.end()) {
        return std::nullopt;
    }
    return vit->second;
}

std::vector<Vote> GovernanceEngine::GetVotes(ProposalId id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Vote> result;
    auto it = votes_.find(id);
    if (it != votes_.end()) {
        for (const auto& [voter, vote] : it->second) {
            result.push_back(vote);
        }
    }
    return result;
}

size_t GovernanceEngine::GetProposalVoterCount(ProposalId id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = votes_.find(id);
    return it == votes_.end() ? 0 : it->second.size();
}

std::vector<Proposal> GovernanceEngine::GetProposalsByTarget(const Address& target) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Proposal> result;
    auto it = proposalsByTarget_.find(target);
    if (it != proposalsByTarget_.end()) {
        for (ProposalId id : it->second) {
            result.push_back(proposals_.at(id));
        }
    }
    return result;
}

std::vector<Proposal> GovernanceEngine::GetActiveProposals() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Proposal> result;
    for (const auto& [id, proposal] : proposals_) {
        if (proposal.status == ProposalStatus::Active) {
            result.push_back(proposal);
        }
    }
    return result;
}

bool GovernanceEngine::HasActiveProposal(const Address& target) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = proposalsByTarget_.find(target);
    if (it == proposalsByTarget_.end()) {
        return false;
    }
    for (ProposalId id : it->second) {
        if (proposals_.at(id).status == ProposalStatus::Active) {
            return true;
        }
    }
    return false;
}

size_t GovernanceEngine::GetProposalCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return proposals_.size();
}

uint32_t GovernanceEngine::GetThreatScore(const Address& target) const {
    return registry_.GetThreatScore(target);
}

bool GovernanceEngine::IsConfirmedScam(const Address& target) const {
    return registry_.IsConfirmedScam(target);
}

std::optional<trust::TrustRecord> GovernanceEngine::GetTrustRecord(const Address& target) const {
    return registry_.GetRecord(target);
}

DAOConfidence GovernanceEngine::GetDAOConfidence(const Address& target) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    DAOConfidence confidence;

    auto it = proposalsByTarget_.find(target);
    if (it == proposalsByTarget_.end()) {
        return confidence;
    }

    for (ProposalId id : it->second) {
        const Proposal& proposal = proposals_.at(id);
        confidence.forPower += proposal.forPower;
        confidence.againstPower += proposal.againstPower;

        auto vit = votes_.find(id);
        if (vit != votes_.end()) {
            confidence.totalVoters += static_cast<uint32_t>(vit->second.size());
        }
    }

    uint64_t total = confidence.forPower + confidence.againstPower;
    if (total > 0) {
        confidence.confidencePercent = static_cast<uint32_t>(confidence.forPower * 100 / total);
    }
    return confidence;
}

VoterProfile GovernanceEngine::GetVoterStats(const Address& voter) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return reputation_.GetProfile(voter);
}

TokenAmount GovernanceEngine::GetEscrowed(ProposalId id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return escrow_.TotalHeld(id);
}

} // namespace governance
} // namespace neuroshield
