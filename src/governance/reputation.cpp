// NeuroShield - Reputation Ledger Implementation
// Copyright (c) 2024 NeuroShield Developers
// MIT License

#include "neuroshield/governance/reputation.h"

#include <algorithm>
#include <sstream>

namespace neuroshield {
namespace governance {

std::string VoterProfile::ToString() const {
    std::ostringstream ss;
    ss << "VoterProfile(accuracy=" << accuracy
       << ", participation=" << participation << ")";
    return ss.str();
}

VoterProfile ReputationLedger::GetProfile(const Address& voter) const {
    auto it = profiles_.find(voter);
    if (it == profiles_.end()) {
        return VoterProfile{};
    }
    return it->second;
}

bool ReputationLedger::HasProfile(const Address& voter) const {
    return profiles_.count(voter) > 0;
}

void ReputationLedger::EnsureProfile(const Address& voter) {
    profiles_.emplace(voter, VoterProfile{});
}

VoterProfile ReputationLedger::RecordSettlement(const Address& voter, bool matched) {
    VoterProfile& profile = profiles_[voter];

    if (matched) {
        profile.accuracy = std::min(MAX_ACCURACY, profile.accuracy + ACCURACY_REWARD);
    } else {
        profile.accuracy = profile.accuracy > ACCURACY_PENALTY
                               ? profile.accuracy - ACCURACY_PENALTY
                               : 0;
    }
    ++profile.participation;

    return profile;
}

} // namespace governance
} // namespace neuroshield
