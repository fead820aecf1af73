// NeuroShield - Quadratic Voting Power Implementation
// Copyright (c) 2024 NeuroShield Developers
// MIT License

#include "neuroshield/governance/voting_power.h"

namespace neuroshield {
namespace governance {

uint64_t IntegerSqrt(uint64_t value) {
    if (value < 2) {
        return value;
    }

    // Newton iteration from an upper bound; converges monotonically downward
    uint64_t x = value;
    uint64_t y = x / 2 + 1;
    while (y < x) {
        x = y;
        y = (x + value / x) / 2;
    }
    return x;
}

uint64_t CalculateVotingPower(TokenAmount tokensStaked, const VoterProfile& profile) {
    uint64_t base = IntegerSqrt(tokensStaked);
    if (base == 0) {
        return 0;
    }

    if (profile.QualifiesForBonus()) {
        return base * REPUTATION_BONUS_PERCENT / 100;
    }
    return base;
}

} // namespace governance
} // namespace neuroshield
