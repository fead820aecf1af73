// NeuroShield - Quadratic Voting Power
// Copyright (c) 2024 NeuroShield Developers
// MIT License
//
// Maps a token stake and voter reputation to voting influence.
// Power grows with the square root of the stake so that large holders
// cannot dominate a vote.

#ifndef NEUROSHIELD_GOVERNANCE_VOTING_POWER_H
#define NEUROSHIELD_GOVERNANCE_VOTING_POWER_H

#include "neuroshield/core/types.h"
#include "neuroshield/governance/reputation.h"

#include <cstdint>

namespace neuroshield {
namespace governance {

/// Reputation multiplier, as a percentage applied to the base power
constexpr uint64_t REPUTATION_BONUS_PERCENT = 120;

/// floor(sqrt(value)), exact for the full 64-bit range
uint64_t IntegerSqrt(uint64_t value);

/**
 * Voting power for a stake.
 *
 * base = floor(sqrt(tokensStaked)); if the profile qualifies for the
 * reputation bonus the result is floor(base * 1.2). A zero stake has zero
 * power.
 */
uint64_t CalculateVotingPower(TokenAmount tokensStaked, const VoterProfile& profile);

/// Power without any reputation bonus
inline uint64_t CalculateVotingPower(TokenAmount tokensStaked) {
    return CalculateVotingPower(tokensStaked, VoterProfile{});
}

} // namespace governance
} // namespace neuroshield

#endif // NEUROSHIELD_GOVERNANCE_VOTING_POWER_H
