// NeuroShield - Reputation Ledger
// Copyright (c) 2024 NeuroShield Developers
// MIT License
//
// Per-voter accuracy and participation counters. Profiles are created
// lazily on a voter's first vote and adjusted only by proposal settlement.

#ifndef NEUROSHIELD_GOVERNANCE_REPUTATION_H
#define NEUROSHIELD_GOVERNANCE_REPUTATION_H

#include "neuroshield/core/address.h"

#include <cstdint>
#include <map>
#include <string>

namespace neuroshield {
namespace governance {

// ============================================================================
// Reputation Constants
// ============================================================================

/// Upper bound of the accuracy score
constexpr uint32_t MAX_ACCURACY = 100;

/// Accuracy gained when a vote matches the outcome
constexpr uint32_t ACCURACY_REWARD = 5;

/// Accuracy lost when a vote disagrees with the outcome
constexpr uint32_t ACCURACY_PENALTY = 10;

/// Accuracy must exceed this for the reputation bonus
constexpr uint32_t BONUS_ACCURACY_THRESHOLD = 80;

/// Settled votes required for the reputation bonus
constexpr uint32_t BONUS_MIN_PARTICIPATION = 5;

// ============================================================================
// Voter Profile
// ============================================================================

struct VoterProfile {
    /// Accuracy score in [0, MAX_ACCURACY]
    uint32_t accuracy{0};

    /// Number of settled proposals this voter took part in
    uint32_t participation{0};

    /// Whether voting power gets the reputation multiplier
    bool QualifiesForBonus() const {
        return accuracy > BONUS_ACCURACY_THRESHOLD &&
               participation >= BONUS_MIN_PARTICIPATION;
    }

    bool operator==(const VoterProfile& other) const {
        return accuracy == other.accuracy && participation == other.participation;
    }

    std::string ToString() const;
};

// ============================================================================
// Reputation Ledger
// ============================================================================

/**
 * Store of voter profiles. Not synchronized; the owning GovernanceEngine
 * guards every access with its own lock.
 */
class ReputationLedger {
public:
    /// Profile for voter, all zeros if the voter is unknown
    VoterProfile GetProfile(const Address& voter) const;

    bool HasProfile(const Address& voter) const;

    /// Create a zero profile if none exists
    void EnsureProfile(const Address& voter);

    /**
     * Credit one settled vote.
     * @param matched Whether the vote agreed with the final outcome
     * @return The updated profile
     */
    VoterProfile RecordSettlement(const Address& voter, bool matched);

    size_t Size() const { return profiles_.size(); }

private:
    std::map<Address, VoterProfile> profiles_;
};

} // namespace governance
} // namespace neuroshield

#endif // NEUROSHIELD_GOVERNANCE_REPUTATION_H
