// NeuroShield - Trust Registry
// Copyright (c) 2024 NeuroShield Developers
// MIT License
//
// Per-address scam score and confirmation flag. Written only by proposal
// settlement; read by the oracle, the risk service and the ledger mirror.

#ifndef NEUROSHIELD_TRUST_TRUST_REGISTRY_H
#define NEUROSHIELD_TRUST_TRUST_REGISTRY_H

#include "neuroshield/core/address.h"

#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>

namespace neuroshield {

namespace governance {
class GovernanceEngine;
}

namespace trust {

/// Highest possible scam score
constexpr uint32_t MAX_SCAM_SCORE = 100;

/// Score added by each passed proposal
constexpr uint32_t SCAM_SCORE_STEP = 25;

/// Trust state of one address
struct TrustRecord {
    /// 0..100, a multiple of SCAM_SCORE_STEP until saturation
    uint32_t scamScore{0};

    /// Set by the first passed proposal and never cleared
    bool isConfirmedScam{false};

    bool operator==(const TrustRecord& other) const {
        return scamScore == other.scamScore && isConfirmedScam == other.isConfirmedScam;
    }

    std::string ToString() const;
};

/**
 * Authoritative trust store.
 *
 * Scores only grow and the scam flag is permanent; there is no API that
 * lowers either. Mutation is reserved to GovernanceEngine settlement.
 */
class TrustRegistry {
public:
    TrustRegistry() = default;

    TrustRegistry(const TrustRegistry&) = delete;
    TrustRegistry& operator=(const TrustRegistry&) = delete;

    /// Record for address, nullopt if no proposal against it ever passed
    std::optional<TrustRecord> GetRecord(const Address& target) const;

    /// 0..100
    uint32_t GetThreatScore(const Address& target) const;

    bool IsConfirmedScam(const Address& target) const;

    /// Number of addresses with a record
    size_t Size() const;

private:
    friend class governance::GovernanceEngine;

    /// Apply one passed proposal: +25 saturating at 100, flag set.
    /// @return The updated record
    TrustRecord RecordConfirmation(const Address& target);

    mutable std::shared_mutex mutex_;
    std::map<Address, TrustRecord> records_;
};

} // namespace trust
} // namespace neuroshield

#endif // NEUROSHIELD_TRUST_TRUST_REGISTRY_H
