// NeuroShield - Trust Registry Tests
// Copyright (c) 2024 NeuroShield Developers
// MIT License

#include <gtest/gtest.h>

#include "neuroshield/governance/governance.h"
#include "neuroshield/trust/trust_registry.h"

#include <atomic>
#include <thread>
#include <vector>

namespace neuroshield {
namespace trust {
namespace test {

// The registry is written only through proposal settlement, so these tests
// drive it with a GovernanceEngine.
class TrustRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        governance::GovernanceConfig config;
        config.votingPeriod = 10;
        engine_ = std::make_unique<governance::GovernanceEngine>(config, registry_, vault_);
        voter_ = MakeAddress(0x21);
        vault_.Credit(voter_, 1000);
    }

    static Address MakeAddress(uint8_t fill) {
        std::array<Byte, Address::SIZE> bytes;
        bytes.fill(fill);
        return Address(bytes);
    }

    void Settle(const Address& target, bool support) {
        auto id = engine_->SubmitProposal(voter_, target, "report", "", now_);
        ASSERT_TRUE(id.ok());
        ASSERT_TRUE(engine_->CastVote(voter_, *id.value, support, 100, now_ + 1).ok());
        now_ += 10;
        ASSERT_TRUE(engine_->ExecuteProposal(voter_, *id.value, now_).ok());
    }

    TrustRegistry registry_;
    governance::TokenVault vault_;
    std::unique_ptr<governance::GovernanceEngine> engine_;
    Address voter_;
    Timestamp now_{1000};
};

TEST_F(TrustRegistryTest, UnknownAddressIsClean) {
    Address stranger = MakeAddress(0x99);
    EXPECT_FALSE(registry_.GetRecord(stranger).has_value());
    EXPECT_EQ(registry_.GetThreatScore(stranger), 0u);
    EXPECT_FALSE(registry_.IsConfirmedScam(stranger));
    EXPECT_EQ(registry_.Size(), 0u);
}

TEST_F(TrustRegistryTest, ConfirmationCreatesRecord) {
    Address target = MakeAddress(0x31);
    Settle(target, true);

    auto record = registry_.GetRecord(target);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(*record, (TrustRecord{SCAM_SCORE_STEP, true}));
    EXPECT_EQ(record->ToString(), "TrustRecord(score=25, confirmed=true)");
    EXPECT_EQ(registry_.Size(), 1u);
}

TEST_F(TrustRegistryTest, ScoreIsMonotonicAndBounded) {
    Address target = MakeAddress(0x32);
    uint32_t previous = 0;
    for (int i = 0; i < 6; ++i) {
        Settle(target, i % 2 == 0);
        uint32_t score = registry_.GetThreatScore(target);
        EXPECT_GE(score, previous);
        EXPECT_LE(score, MAX_SCAM_SCORE);
        previous = score;
    }
    // Three passed proposals
    EXPECT_EQ(previous, 75u);
    EXPECT_TRUE(registry_.IsConfirmedScam(target));
}

TEST_F(TrustRegistryTest, RecordsAreIndependent) {
    Settle(MakeAddress(0x41), true);
    Settle(MakeAddress(0x42), false);
    EXPECT_TRUE(registry_.IsConfirmedScam(MakeAddress(0x41)));
    EXPECT_FALSE(registry_.GetRecord(MakeAddress(0x42)).has_value());
}

TEST_F(TrustRegistryTest, ConcurrentReadsDuringSettlement) {
    Address target = MakeAddress(0x51);
    std::atomic<bool> done{false};
    std::atomic<bool> sawDecrease{false};

    std::thread reader([&] {
        uint32_t last = 0;
        while (!done.load()) {
            uint32_t score = registry_.GetThreatScore(target);
            if (score < last) {
                sawDecrease = true;
            }
            last = score;
        }
    });

    for (int i = 0; i < 4; ++i) {
        Settle(target, true);
    }
    done = true;
    reader.join();

    EXPECT_FALSE(sawDecrease.load());
    EXPECT_EQ(registry_.GetThreatScore(target), MAX_SCAM_SCORE);
}

} // namespace test
} // namespace trust
} // namespace neuroshield
