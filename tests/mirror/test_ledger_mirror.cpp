// NeuroShield - Ledger Mirror Tests
// Copyright (c) 2024 NeuroShield Developers
// MIT License

#include <gtest/gtest.h>

#include "neuroshield/mirror/ledger_mirror.h"

#include <map>

namespace neuroshield {
namespace mirror {
namespace test {

namespace {

Address MakeAddress(uint8_t fill) {
    std::array<Byte, Address::SIZE> bytes;
    bytes.fill(fill);
    return Address(bytes);
}

ledger::LedgerEvent Opened(uint64_t seq, ProposalId id, const Address& target, Timestamp at) {
    ledger::LedgerEvent event;
    event.sequence = seq;
    event.committedAt = at;
    event.event = governance::ProposalOpenedEvent{id, target, at + 60};
    return event;
}

ledger::LedgerEvent Settled(uint64_t seq, ProposalId id, const Address& target, bool passed,
                            uint32_t score, Timestamp at) {
    governance::SettlementEvent settlement;
    settlement.proposalId = id;
    settlement.passed = passed;
    settlement.target = target;
    settlement.newScamScore = score;
    settlement.confirmed = score > 0;

    ledger::LedgerEvent event;
    event.sequence = seq;
    event.committedAt = at;
    event.event = settlement;
    return event;
}

/// Event stream with hand-set head and commit times
class FakeEventSource : public ledger::EventSource {
public:
    uint64_t HeadEventSequence() const override { return head; }

    std::optional<Timestamp> EventCommitTime(uint64_t sequence) const override {
        auto it = times.find(sequence);
        if (it == times.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    uint64_t head{0};
    std::map<uint64_t, Timestamp> times;
};

} // namespace

// ============================================================================
// Applying Events
// ============================================================================

class LedgerMirrorTest : public ::testing::Test {
protected:
    LedgerMirror mirror_;
    Address target_{MakeAddress(0xab)};
};

TEST_F(LedgerMirrorTest, EmptyMirror) {
    MirrorSnapshot snapshot = mirror_.Snapshot(target_);
    EXPECT_FALSE(snapshot.hasRecord);
    EXPECT_FALSE(snapshot.underReview);
    EXPECT_EQ(snapshot.appliedSequence, 0u);
    EXPECT_EQ(mirror_.RecordCount(), 0u);
    EXPECT_EQ(mirror_.GetConfig().stalenessBound, DEFAULT_STALENESS_BOUND);
}

TEST_F(LedgerMirrorTest, OpenThenConfirm) {
    EXPECT_TRUE(mirror_.Apply(Opened(1, 0, target_, 1000)));
    EXPECT_TRUE(mirror_.Snapshot(target_).underReview);
    EXPECT_FALSE(mirror_.Snapshot(target_).hasRecord);

    EXPECT_TRUE(mirror_.Apply(Settled(2, 0, target_, true, 25, 1060)));
    MirrorSnapshot snapshot = mirror_.Snapshot(target_);
    EXPECT_FALSE(snapshot.underReview);
    ASSERT_TRUE(snapshot.hasRecord);
    EXPECT_EQ(snapshot.record.scamScore, 25u);
    EXPECT_TRUE(snapshot.record.isConfirmedScam);
    EXPECT_EQ(snapshot.appliedSequence, 2u);
    EXPECT_EQ(mirror_.LastCommitTime(), 1060);
}

TEST_F(LedgerMirrorTest, ReviewStaysWhileAnyProposalIsOpen) {
    mirror_.Apply(Opened(1, 0, target_, 1000));
    mirror_.Apply(Opened(2, 1, target_, 1001));
    mirror_.Apply(Settled(3, 0, target_, false, 0, 1060));
    EXPECT_TRUE(mirror_.Snapshot(target_).underReview);

    mirror_.Apply(Settled(4, 1, target_, false, 0, 1061));
    EXPECT_FALSE(mirror_.Snapshot(target_).underReview);
}

TEST_F(LedgerMirrorTest, RejectionCreatesNoRecord) {
    mirror_.Apply(Opened(1, 0, target_, 1000));
    mirror_.Apply(Settled(2, 0, target_, false, 0, 1060));
    EXPECT_FALSE(mirror_.Snapshot(target_).hasRecord);
    EXPECT_EQ(mirror_.RecordCount(), 0u);
}

TEST_F(LedgerMirrorTest, RejectionKeepsEarlierConfirmation) {
    mirror_.Apply(Opened(1, 0, target_, 1000));
    mirror_.Apply(Settled(2, 0, target_, true, 25, 1060));
    mirror_.Apply(Opened(3, 1, target_, 1070));
    mirror_.Apply(Settled(4, 1, target_, false, 25, 1130));

    MirrorSnapshot snapshot = mirror_.Snapshot(target_);
    EXPECT_EQ(snapshot.record.scamScore, 25u);
    EXPECT_TRUE(snapshot.record.isConfirmedScam);
}

TEST_F(LedgerMirrorTest, RedeliveredSequenceIsIgnored) {
    auto event = Settled(1, 0, target_, true, 25, 1000);
    EXPECT_TRUE(mirror_.Apply(event));
    EXPECT_FALSE(mirror_.Apply(event));
    EXPECT_EQ(mirror_.AppliedSequence(), 1u);
    EXPECT_EQ(mirror_.Snapshot(target_).record.scamScore, 25u);
}

TEST_F(LedgerMirrorTest, SameProposalEventAppliesOnce) {
    // Replayed under a new sequence number
    EXPECT_TRUE(mirror_.Apply(Settled(1, 7, target_, true, 25, 1000)));
    EXPECT_FALSE(mirror_.Apply(Settled(2, 7, target_, true, 50, 1001)));

    EXPECT_EQ(mirror_.Snapshot(target_).record.scamScore, 25u);
    EXPECT_EQ(mirror_.AppliedSequence(), 2u);
}

TEST_F(LedgerMirrorTest, AddressesAreIndependent) {
    Address other = MakeAddress(0xcd);
    mirror_.Apply(Settled(1, 0, target_, true, 25, 1000));
    mirror_.Apply(Opened(2, 1, other, 1001));

    EXPECT_TRUE(mirror_.Snapshot(target_).hasRecord);
    EXPECT_FALSE(mirror_.Snapshot(target_).underReview);
    EXPECT_FALSE(mirror_.Snapshot(other).hasRecord);
    EXPECT_TRUE(mirror_.Snapshot(other).underReview);
}

// ============================================================================
// Consumer Thread
// ============================================================================

TEST_F(LedgerMirrorTest, ConsumesFromChannel) {
    auto channel = std::make_shared<ledger::EventChannel>();
    ASSERT_TRUE(mirror_.Start(channel));
    EXPECT_TRUE(mirror_.IsRunning());
    EXPECT_FALSE(mirror_.Start(channel));

    channel->Send(Opened(1, 0, target_, 1000));
    channel->Send(Settled(2, 0, target_, true, 25, 1060));

    ASSERT_TRUE(mirror_.WaitForSequence(2, std::chrono::seconds(5)));
    EXPECT_TRUE(mirror_.Snapshot(target_).record.isConfirmedScam);

    mirror_.Stop();
    EXPECT_FALSE(mirror_.IsRunning());
}

TEST_F(LedgerMirrorTest, StartRequiresChannel) {
    EXPECT_FALSE(mirror_.Start(nullptr));
    EXPECT_FALSE(mirror_.IsRunning());
}

TEST_F(LedgerMirrorTest, ClosedChannelDrainsBeforeExit) {
    auto channel = std::make_shared<ledger::EventChannel>();
    channel->Send(Opened(1, 0, target_, 1000));
    channel->Close();

    ASSERT_TRUE(mirror_.Start(channel));
    EXPECT_TRUE(mirror_.WaitForSequence(1, std::chrono::seconds(5)));
    mirror_.Stop();
}

TEST_F(LedgerMirrorTest, WaitTimesOut) {
    EXPECT_FALSE(mirror_.WaitForSequence(1, std::chrono::milliseconds(20)));
    EXPECT_TRUE(mirror_.WaitForSequence(0, std::chrono::milliseconds(0)));
}

// ============================================================================
// Freshness
// ============================================================================

TEST_F(LedgerMirrorTest, CaughtUpIsFresh) {
    FakeEventSource source;
    FreshnessReport report = mirror_.CheckFreshness(source, 5000);
    EXPECT_FALSE(report.stale);
    EXPECT_EQ(report.lagEvents, 0u);

    mirror_.Apply(Opened(1, 0, target_, 1000));
    source.head = 1;
    source.times[1] = 1000;
    report = mirror_.CheckFreshness(source, 5000);
    EXPECT_FALSE(report.stale);
    EXPECT_EQ(report.lagSeconds, 0);
}

TEST_F(LedgerMirrorTest, LagWithinBound) {
    FakeEventSource source;
    source.head = 3;
    source.times = {{1, 1000}, {2, 1010}, {3, 1020}};
    mirror_.Apply(Opened(1, 0, target_, 1000));

    FreshnessReport report = mirror_.CheckFreshness(source, 1010 + DEFAULT_STALENESS_BOUND);
    EXPECT_FALSE(report.stale);
    EXPECT_EQ(report.lagEvents, 2u);
    EXPECT_EQ(report.lagSeconds, DEFAULT_STALENESS_BOUND);
}

TEST_F(LedgerMirrorTest, LagBeyondBoundIsStale) {
    FakeEventSource source;
    source.head = 2;
    source.times = {{1, 1000}, {2, 1010}};
    mirror_.Apply(Opened(1, 0, target_, 1000));

    FreshnessReport report = mirror_.CheckFreshness(source, 1011 + DEFAULT_STALENESS_BOUND);
    EXPECT_TRUE(report.stale);
    EXPECT_EQ(report.lagEvents, 1u);
}

TEST_F(LedgerMirrorTest, UndatedBacklogIsStale) {
    FakeEventSource source;
    source.head = 4;
    EXPECT_TRUE(mirror_.CheckFreshness(source, 1000).stale);
}

TEST(LedgerMirrorConfigTest, CustomBound) {
    MirrorConfig config;
    config.stalenessBound = 5;
    LedgerMirror mirror(config);

    FakeEventSource source;
    source.head = 1;
    source.times[1] = 100;
    EXPECT_FALSE(mirror.CheckFreshness(source, 105).stale);
    EXPECT_TRUE(mirror.CheckFreshness(source, 106).stale);
}

} // namespace test
} // namespace mirror
} // namespace neuroshield
