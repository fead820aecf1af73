// NeuroShield - Governance Tests
// Copyright (c) 2024 NeuroShield Developers
// MIT License

#include <gtest/gtest.h>

#include "neuroshield/governance/governance.h"
#include "neuroshield/trust/trust_registry.h"

#include <string>

namespace neuroshield {
namespace governance {
namespace test {

/// Vault whose refunds can be refused for one account
class RefusingVault : public TokenVault {
public:
    bool Unlock(const Address& owner, TokenAmount amount) override {
        if (refuse && owner == refused) {
            return false;
        }
        return TokenVault::Unlock(owner, amount);
    }

    bool refuse{false};
    Address refused;
};

// ============================================================================
// Test Fixture
// ============================================================================

class GovernanceTest : public ::testing::Test {
protected:
    static constexpr int64_t PERIOD = 100;
    static constexpr Timestamp T0 = 1700000000;

    void SetUp() override {
        GovernanceConfig config;
        config.votingPeriod = PERIOD;
        engine_ = std::make_unique<GovernanceEngine>(config, registry_, vault_);

        proposer_ = MakeAddress(0x01);
        target_ = MakeAddress(0xee);
        for (uint8_t i = 0x10; i < 0x20; ++i) {
            vault_.Credit(MakeAddress(i), 1000000);
        }
    }

    static Address MakeAddress(uint8_t fill) {
        std::array<Byte, Address::SIZE> bytes;
        bytes.fill(fill);
        return Address(bytes);
    }

    static Address Voter(int n) {
        return MakeAddress(static_cast<uint8_t>(0x10 + n));
    }

    ProposalId Submit(const Address& target, Timestamp now = T0) {
        auto result = engine_->SubmitProposal(proposer_, target, "phishing contract",
                                              "ipfs://evidence", now);
        EXPECT_TRUE(result.ok()) << GovernanceErrorToString(result.error);
        return result.value.value_or(0);
    }

    void MustVote(ProposalId id, int voter, bool support, TokenAmount tokens,
                  Timestamp now = T0 + 1) {
        auto result = engine_->CastVote(Voter(voter), id, support, tokens, now);
        ASSERT_TRUE(result.ok()) << GovernanceErrorToString(result.error);
    }

    SettlementEvent MustExecute(ProposalId id, Timestamp now = T0 + PERIOD) {
        auto result = engine_->ExecuteProposal(proposer_, id, now);
        EXPECT_TRUE(result.ok()) << GovernanceErrorToString(result.error);
        return result.value.value_or(SettlementEvent{});
    }

    /// Open a proposal against target, vote it through and settle it
    SettlementEvent PassOne(const Address& target, Timestamp start) {
        ProposalId id = Submit(target, start);
        MustVote(id, 0, true, 100, start + 1);
        return MustExecute(id, start + PERIOD);
    }

    trust::TrustRegistry registry_;
    TokenVault vault_;
    std::unique_ptr<GovernanceEngine> engine_;
    Address proposer_;
    Address target_;
};

// ============================================================================
// Submission
// ============================================================================

TEST_F(GovernanceTest, SubmitAssignsSequentialIds) {
    EXPECT_EQ(Submit(target_), 0u);
    EXPECT_EQ(Submit(MakeAddress(0xef)), 1u);
    EXPECT_EQ(engine_->GetProposalCount(), 2u);

    auto proposal = engine_->GetProposal(0);
    ASSERT_TRUE(proposal.ok());
    EXPECT_EQ(proposal.value->target, target_);
    EXPECT_EQ(proposal.value->proposer, proposer_);
    EXPECT_EQ(proposal.value->createdAt, T0);
    EXPECT_EQ(proposal.value->deadline, T0 + PERIOD);
    EXPECT_EQ(proposal.value->status, ProposalStatus::Active);
    EXPECT_EQ(proposal.value->evidence, "ipfs://evidence");
    EXPECT_TRUE(engine_->HasActiveProposal(target_));
}

TEST_F(GovernanceTest, SubmitValidationOrder) {
    Address null;
    auto r = engine_->SubmitProposal(null, null, "", "", T0);
    EXPECT_EQ(r.error, GovernanceError::Unauthenticated);

    r = engine_->SubmitProposal(proposer_, null, "", "", T0);
    EXPECT_EQ(r.error, GovernanceError::InvalidTarget);

    r = engine_->SubmitProposal(proposer_, target_, "", "", T0);
    EXPECT_EQ(r.error, GovernanceError::InvalidDescription);

    EXPECT_EQ(engine_->GetProposalCount(), 0u);
}

TEST_F(GovernanceTest, DescriptionAndEvidenceLimits) {
    std::string maxDesc(MAX_DESCRIPTION_LENGTH, 'd');
    std::string maxEvidence(MAX_EVIDENCE_LENGTH, 'e');

    EXPECT_TRUE(engine_->SubmitProposal(proposer_, target_, maxDesc, maxEvidence, T0).ok());
    EXPECT_EQ(engine_->SubmitProposal(proposer_, target_, maxDesc + "d", "", T0).error,
              GovernanceError::InvalidDescription);
    EXPECT_EQ(engine_->SubmitProposal(proposer_, target_, "x", maxEvidence + "e", T0).error,
              GovernanceError::InvalidDescription);
    EXPECT_TRUE(engine_->SubmitProposal(proposer_, target_, "x", "", T0).ok());
}

TEST_F(GovernanceTest, SeveralProposalsAgainstSameTarget) {
    Submit(target_);
    Submit(target_);
    EXPECT_EQ(engine_->GetProposalsByTarget(target_).size(), 2u);
    EXPECT_EQ(engine_->GetActiveProposals().size(), 2u);
}

TEST_F(GovernanceTest, UnknownProposal) {
    auto proposal = engine_->GetProposal(42);
    EXPECT_FALSE(proposal.ok());
    EXPECT_EQ(proposal.error, GovernanceError::ProposalNotFound);
    EXPECT_FALSE(proposal.value.has_value());
}

// ============================================================================
// Voting
// ============================================================================

TEST_F(GovernanceTest, VoteLocksStakeAndAddsQuadraticPower) {
    ProposalId id = Submit(target_);

    auto result = engine_->CastVote(Voter(0), id, true, 10000, T0 + 5);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value->power, 100u);
    EXPECT_EQ(result.value->castAt, T0 + 5);

    MustVote(id, 1, false, 2500);

    auto proposal = engine_->GetProposal(id);
    EXPECT_EQ(proposal.value->forPower, 100u);
    EXPECT_EQ(proposal.value->againstPower, 50u);
    EXPECT_EQ(proposal.value->ApprovalPercent(), 66u);

    EXPECT_EQ(vault_.SpendableBalance(Voter(0)), 990000u);
    EXPECT_EQ(vault_.LockedBalance(Voter(0)), 10000u);
    EXPECT_EQ(engine_->GetEscrowed(id), 12500u);
    EXPECT_EQ(engine_->GetProposalVoterCount(id), 2u);

    auto vote = engine_->GetVote(id, Voter(1));
    ASSERT_TRUE(vote.has_value());
    EXPECT_FALSE(vote->support);
    EXPECT_EQ(vote->tokens, 2500u);
}

TEST_F(GovernanceTest, VoteErrors) {
    ProposalId id = Submit(target_);

    EXPECT_EQ(engine_->CastVote(Address(), id, true, 100, T0).error,
              GovernanceError::Unauthenticated);
    EXPECT_EQ(engine_->CastVote(Voter(0), 99, true, 100, T0).error,
              GovernanceError::ProposalNotFound);
    EXPECT_EQ(engine_->CastVote(Voter(0), id, true, 0, T0).error,
              GovernanceError::InvalidStake);
    EXPECT_EQ(engine_->CastVote(MakeAddress(0x77), id, true, 100, T0).error,
              GovernanceError::InsufficientTokens);
    EXPECT_EQ(engine_->CastVote(Voter(0), id, true, 1000001, T0).error,
              GovernanceError::InsufficientTokens);

    MustVote(id, 0, true, 100);
    EXPECT_EQ(engine_->CastVote(Voter(0), id, false, 100, T0 + 2).error,
              GovernanceError::DuplicateVote);
}

TEST_F(GovernanceTest, RejectedVoteLeavesNoTrace) {
    ProposalId id = Submit(target_);
    EXPECT_FALSE(engine_->CastVote(Voter(0), id, true, 2000000, T0).ok());

    EXPECT_EQ(vault_.SpendableBalance(Voter(0)), 1000000u);
    EXPECT_EQ(engine_->GetProposalVoterCount(id), 0u);
    EXPECT_EQ(engine_->GetEscrowed(id), 0u);
    EXPECT_EQ(engine_->GetProposal(id).value->TotalPower(), 0u);

    // Still allowed to vote afterwards
    MustVote(id, 0, true, 100);
}

TEST_F(GovernanceTest, VotingClosesAtDeadline) {
    ProposalId id = Submit(target_);
    MustVote(id, 0, true, 100, T0 + PERIOD - 1);
    EXPECT_EQ(engine_->CastVote(Voter(1), id, true, 100, T0 + PERIOD).error,
              GovernanceError::ProposalClosed);
}

TEST_F(GovernanceTest, ExecutedProposalIsClosed) {
    ProposalId id = Submit(target_);
    MustVote(id, 0, true, 100);
    MustExecute(id);
    EXPECT_EQ(engine_->CastVote(Voter(1), id, true, 100, T0 + PERIOD + 1).error,
              GovernanceError::ProposalClosed);
}

// ============================================================================
// Settlement
// ============================================================================

TEST_F(GovernanceTest, ExecuteBeforeDeadline) {
    ProposalId id = Submit(target_);
    EXPECT_EQ(engine_->ExecuteProposal(proposer_, id, T0 + PERIOD - 1).error,
              GovernanceError::VotingStillOpen);
    EXPECT_EQ(engine_->ExecuteProposal(proposer_, 7, T0 + PERIOD).error,
              GovernanceError::ProposalNotFound);
    EXPECT_EQ(engine_->ExecuteProposal(Address(), id, T0 + PERIOD).error,
              GovernanceError::Unauthenticated);
}

TEST_F(GovernanceTest, PassedProposalConfirmsTarget) {
    ProposalId id = Submit(target_);
    MustVote(id, 0, true, 3600);
    MustVote(id, 1, false, 1600);

    SettlementEvent event = MustExecute(id);
    EXPECT_TRUE(event.passed);
    EXPECT_EQ(event.target, target_);
    EXPECT_EQ(event.newScamScore, 25u);
    EXPECT_TRUE(event.confirmed);
    EXPECT_EQ(event.affectedVoters.size(), 2u);

    EXPECT_TRUE(engine_->IsConfirmedScam(target_));
    EXPECT_EQ(engine_->GetThreatScore(target_), 25u);
    EXPECT_FALSE(engine_->HasActiveProposal(target_));

    auto proposal = engine_->GetProposal(id);
    EXPECT_EQ(proposal.value->status, ProposalStatus::Executed);
    EXPECT_TRUE(proposal.value->passed);
    EXPECT_EQ(proposal.value->executedAt, T0 + PERIOD);
}

TEST_F(GovernanceTest, BelowThresholdIsRejected) {
    ProposalId id = Submit(target_);
    MustVote(id, 0, true, 3481);   // power 59
    MustVote(id, 1, false, 1681);  // power 41

    SettlementEvent event = MustExecute(id);
    EXPECT_FALSE(event.passed);
    EXPECT_EQ(event.newScamScore, 0u);
    EXPECT_FALSE(event.confirmed);
    EXPECT_FALSE(registry_.GetRecord(target_).has_value());
}

TEST_F(GovernanceTest, ProposalWithoutVotesIsRejected) {
    ProposalId id = Submit(target_);
    SettlementEvent event = MustExecute(id);
    EXPECT_FALSE(event.passed);
    EXPECT_TRUE(event.affectedVoters.empty());
    EXPECT_TRUE(event.refunds.empty());
    EXPECT_EQ(registry_.Size(), 0u);
}

TEST_F(GovernanceTest, ExecuteOnlyOnce) {
    ProposalId id = Submit(target_);
    MustVote(id, 0, true, 100);
    MustExecute(id);
    auto again = engine_->ExecuteProposal(proposer_, id, T0 + PERIOD + 10);
    EXPECT_EQ(again.error, GovernanceError::AlreadyExecuted);
    EXPECT_EQ(engine_->GetThreatScore(target_), 25u);
}

TEST(SettlementRefundTest, RefusedRefundChangesNothing) {
    trust::TrustRegistry registry;
    RefusingVault vault;
    GovernanceConfig config;
    config.votingPeriod = 100;
    GovernanceEngine engine(config, registry, vault);

    std::array<Byte, Address::SIZE> bytes;
    bytes.fill(0x10);
    Address first(bytes);
    bytes.fill(0x11);
    Address second(bytes);
    bytes.fill(0xee);
    Address target(bytes);
    vault.Credit(first, 1000);
    vault.Credit(second, 1000);

    const Timestamp t0 = 1700000000;
    auto id = engine.SubmitProposal(first, target, "drainer", "", t0);
    ASSERT_TRUE(id.ok());
    ASSERT_TRUE(engine.CastVote(first, *id.value, true, 400, t0 + 1).ok());
    ASSERT_TRUE(engine.CastVote(second, *id.value, true, 300, t0 + 1).ok());

    // The first refund succeeds and must be rolled back
    vault.refuse = true;
    vault.refused = second;
    auto failed = engine.ExecuteProposal(first, *id.value, t0 + 100);
    EXPECT_EQ(failed.error, GovernanceError::RefundFailed);
    EXPECT_FALSE(failed.value.has_value());

    EXPECT_EQ(engine.GetThreatScore(target), 0u);
    EXPECT_FALSE(registry.GetRecord(target).has_value());
    EXPECT_EQ(engine.GetVoterStats(first).participation, 0u);
    EXPECT_EQ(engine.GetEscrowed(*id.value), 700u);
    EXPECT_EQ(vault.LockedBalance(first), 400u);
    EXPECT_EQ(vault.SpendableBalance(first), 600u);
    EXPECT_EQ(vault.LockedBalance(second), 300u);
    EXPECT_EQ(engine.GetProposal(*id.value).value->status, ProposalStatus::Active);

    // Once the bank recovers the proposal settles exactly once
    vault.refuse = false;
    auto settled = engine.ExecuteProposal(first, *id.value, t0 + 101);
    ASSERT_TRUE(settled.ok());
    EXPECT_EQ(settled.value->newScamScore, 25u);
    EXPECT_EQ(settled.value->TotalRefunded(), 700u);
    EXPECT_EQ(engine.GetEscrowed(*id.value), 0u);
    EXPECT_EQ(vault.SpendableBalance(first), 1000u);
    EXPECT_EQ(engine.GetVoterStats(first).participation, 1u);

    EXPECT_EQ(engine.ExecuteProposal(first, *id.value, t0 + 102).error,
              GovernanceError::AlreadyExecuted);
    EXPECT_EQ(engine.GetThreatScore(target), 25u);
}

TEST_F(GovernanceTest, RefundsEqualStakes) {
    ProposalId id = Submit(target_);
    MustVote(id, 0, true, 400);
    MustVote(id, 1, true, 900);
    MustVote(id, 2, false, 50);
    TokenAmount supplyBefore = vault_.TotalSupply();

    SettlementEvent event = MustExecute(id);
    EXPECT_EQ(event.TotalRefunded(), 1350u);
    ASSERT_EQ(event.refunds.size(), 3u);
    EXPECT_EQ(event.refunds[0], (Refund{Voter(0), 400}));
    EXPECT_EQ(event.refunds[2], (Refund{Voter(2), 50}));

    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(vault_.SpendableBalance(Voter(i)), 1000000u);
        EXPECT_EQ(vault_.LockedBalance(Voter(i)), 0u);
    }
    EXPECT_EQ(engine_->GetEscrowed(id), 0u);
    EXPECT_EQ(vault_.TotalSupply(), supplyBefore);
}

TEST_F(GovernanceTest, SettlementUpdatesReputation) {
    ProposalId id = Submit(target_);
    MustVote(id, 0, true, 10000);
    MustVote(id, 1, false, 100);
    MustExecute(id);

    EXPECT_EQ(engine_->GetVoterStats(Voter(0)), (VoterProfile{5, 1}));
    EXPECT_EQ(engine_->GetVoterStats(Voter(1)), (VoterProfile{0, 1}));
    EXPECT_EQ(engine_->GetVoterStats(Voter(9)), (VoterProfile{0, 0}));
}

TEST_F(GovernanceTest, ScoreSaturatesAtHundred) {
    const uint32_t expected[] = {25, 50, 75, 100, 100};
    Timestamp start = T0;
    for (uint32_t score : expected) {
        SettlementEvent event = PassOne(target_, start);
        EXPECT_EQ(event.newScamScore, score);
        EXPECT_EQ(engine_->GetThreatScore(target_), score);
        start += PERIOD + 1;
    }
    EXPECT_TRUE(engine_->IsConfirmedScam(target_));
}

TEST_F(GovernanceTest, RejectionNeverClearsConfirmation) {
    PassOne(target_, T0);

    ProposalId id = Submit(target_, T0 + 200);
    MustVote(id, 1, false, 100, T0 + 201);
    SettlementEvent event = MustExecute(id, T0 + 200 + PERIOD);

    EXPECT_FALSE(event.passed);
    EXPECT_EQ(event.newScamScore, 25u);
    EXPECT_TRUE(event.confirmed);
    EXPECT_TRUE(engine_->IsConfirmedScam(target_));
}

TEST_F(GovernanceTest, StatusAtDeadlineReflectsTally) {
    ProposalId id = Submit(target_);
    MustVote(id, 0, true, 100);
    auto proposal = *engine_->GetProposal(id).value;

    EXPECT_EQ(proposal.StatusAt(T0 + 1), ProposalStatus::Active);
    EXPECT_EQ(proposal.StatusAt(T0 + PERIOD), ProposalStatus::Passed);
    EXPECT_TRUE(proposal.IsVotingOpen(T0 + PERIOD - 1));
    EXPECT_FALSE(proposal.IsVotingOpen(T0 + PERIOD));
}

// ============================================================================
// DAO Confidence
// ============================================================================

TEST_F(GovernanceTest, ConfidenceAggregatesAllProposals) {
    ProposalId first = Submit(target_);
    MustVote(first, 0, true, 900);   // 30
    MustVote(first, 1, false, 100);  // 10
    ProposalId second = Submit(target_);
    MustVote(second, 2, true, 400);  // 20
    MustExecute(first);

    DAOConfidence confidence = engine_->GetDAOConfidence(target_);
    EXPECT_EQ(confidence.forPower, 50u);
    EXPECT_EQ(confidence.againstPower, 10u);
    EXPECT_EQ(confidence.totalVoters, 3u);
    EXPECT_EQ(confidence.confidencePercent, 83u);

    DAOConfidence none = engine_->GetDAOConfidence(MakeAddress(0x55));
    EXPECT_EQ(none.totalVoters, 0u);
    EXPECT_EQ(none.confidencePercent, 0u);
}

// ============================================================================
// Names and Classes
// ============================================================================

TEST(GovernanceNamesTest, ErrorNamesRoundTrip) {
    for (uint8_t i = 0; i <= static_cast<uint8_t>(GovernanceError::RefundFailed); ++i) {
        auto error = static_cast<GovernanceError>(i);
        EXPECT_EQ(ParseGovernanceError(GovernanceErrorToString(error)), error);
    }
    EXPECT_FALSE(ParseGovernanceError("Nope").has_value());
}

TEST(GovernanceNamesTest, ErrorClasses) {
    EXPECT_EQ(GetErrorClass(GovernanceError::OK), ErrorClass::None);
    EXPECT_EQ(GetErrorClass(GovernanceError::DuplicateVote), ErrorClass::StateConflict);
    EXPECT_EQ(GetErrorClass(GovernanceError::VotingStillOpen), ErrorClass::StateConflict);
    EXPECT_EQ(GetErrorClass(GovernanceError::InvalidStake), ErrorClass::Validation);
    EXPECT_EQ(GetErrorClass(GovernanceError::InsufficientTokens), ErrorClass::Validation);
    EXPECT_EQ(GetErrorClass(GovernanceError::RefundFailed), ErrorClass::StateConflict);
    EXPECT_STREQ(GovernanceErrorToString(GovernanceError::RefundFailed), "RefundFailed");
    EXPECT_STREQ(ErrorClassToString(ErrorClass::StateConflict), "StateConflict");
}

TEST(GovernanceNamesTest, EventAccessors) {
    GovernanceEvent opened = ProposalOpenedEvent{3, Address(), 0};
    SettlementEvent settled;
    settled.proposalId = 4;
    GovernanceEvent done = settled;

    EXPECT_STREQ(GovernanceEventName(opened), "ProposalOpened");
    EXPECT_STREQ(GovernanceEventName(done), "ProposalSettled");
    EXPECT_EQ(GovernanceEventProposal(opened), 3u);
    EXPECT_EQ(GovernanceEventProposal(done), 4u);
    EXPECT_STREQ(ProposalStatusToString(ProposalStatus::Rejected), "Rejected");
}

} // namespace test
} // namespace governance
} // namespace neuroshield
