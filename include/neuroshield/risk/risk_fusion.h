// NeuroShield - Risk Fusion Engine
// Copyright (c) 2024 NeuroShield Developers
// MIT License
//
// Merges the ML verdict for a transfer with the governance trust state of
// the recipient into one score in [0, 1] and an actionable band. Pure:
// identical inputs always give identical output.

#ifndef NEUROSHIELD_RISK_RISK_FUSION_H
#define NEUROSHIELD_RISK_RISK_FUSION_H

#include "neuroshield/core/types.h"
#include "neuroshield/risk/classifier.h"
#include "neuroshield/trust/trust_registry.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace neuroshield {
namespace risk {

// ============================================================================
// Constants
// ============================================================================

/// Ceiling on ML risk for a wallet with no history and no DAO evidence
constexpr double BRAND_NEW_RISK_CAP = 0.45;

/// Maximum boost from a confirmed scam
constexpr double MAX_CONFIRMED_BOOST = 0.5;

/// Boost while a proposal against the address is open
constexpr double UNDER_REVIEW_BOOST = 0.15;

/// Above this the transfer is blocked
constexpr double BLOCKED_THRESHOLD = 0.7;

/// Above this the transfer is suspicious
constexpr double SUSPICIOUS_THRESHOLD = 0.3;

// ============================================================================
// Bands
// ============================================================================

enum class RiskBand : uint8_t {
    Safe,
    Suspicious,
    Blocked,
};

const char* RiskBandToString(RiskBand band);

/// > 0.7 Blocked, > 0.3 Suspicious, otherwise Safe
RiskBand BandForRisk(double risk);

// ============================================================================
// Inputs and Output
// ============================================================================

/// Governance state of the recipient, evaluated by the caller
struct TrustSnapshot {
    trust::TrustRecord record;
    bool hasRecord{false};
    bool hasActiveProposal{false};
};

/// On-chain history of the recipient
struct WalletActivity {
    TokenAmount balance{0};
    uint64_t txCount{0};

    bool IsBrandNew() const { return balance == 0 && txCount == 0; }
};

struct RiskInputs {
    MlSignal ml = MlSignal::Unavailable("not provided");
    TrustSnapshot trust;
    WalletActivity activity;

    /// Caller-maintained allow-list hit
    bool allowListed{false};
};

struct RiskAssessment {
    double combinedRisk{0};
    RiskBand band{RiskBand::Safe};

    /// ML risk after fallback and dampening
    double mlRisk{0};

    /// combinedRisk - mlRisk before clamping
    double boost{0};

    bool dampened{false};
    bool allowListed{false};
    bool mlFallbackUsed{false};

    /// Name of the fusion policy that produced the score
    std::string policy;

    std::vector<std::string> explanation;

    std::string ToString() const;
};

// ============================================================================
// Fusion Policies
// ============================================================================

/// Result of a policy applied to ML risk and trust state
struct FusionStep {
    double combined{0};
    double boost{0};

    /// Human-readable rule that fired, empty if none
    std::string rule;
};

class FusionPolicy {
public:
    virtual ~FusionPolicy() = default;

    virtual const char* Name() const = 0;

    virtual FusionStep Fuse(double mlRisk, const TrustSnapshot& trust) const = 0;
};

/**
 * Canonical policy. boost = min(0.5, score/100 * 0.5) for a confirmed
 * scam, 0.15 for an address under review, else 0; combined = min(1, ml + boost).
 */
class AdditiveFusionPolicy : public FusionPolicy {
public:
    const char* Name() const override { return "additive"; }
    FusionStep Fuse(double mlRisk, const TrustSnapshot& trust) const override;
};

/**
 * Alternative rule set, first match wins:
 *   1. confirmed scam: 0.95
 *   2. ml > 0.60 and score > 30: min(1, ml*0.5 + score/100*0.5 + 0.15)
 *   3. score > 0 and ml < 0.30: max(0.40, score/100)
 *   4. under review and ml < 0.30: 0.30
 *   otherwise ml
 */
class LayeredFusionPolicy : public FusionPolicy {
public:
    const char* Name() const override { return "layered"; }
    FusionStep Fuse(double mlRisk, const TrustSnapshot& trust) const override;
};

/// "additive" or "layered"; nullptr for anything else
std::unique_ptr<FusionPolicy> MakeFusionPolicy(const std::string& name);

// ============================================================================
// Risk Fusion Engine
// ============================================================================

class RiskFusionEngine {
public:
    /**
     * @param policy Fusion policy; additive if null
     * @param fallback Label assumed when the ML signal is unavailable
     */
    explicit RiskFusionEngine(std::unique_ptr<FusionPolicy> policy = nullptr,
                              MlLabel fallback = MlLabel::Suspicious);

    /// Never throws for any input
    RiskAssessment Assess(const RiskInputs& inputs) const;

    const FusionPolicy& GetPolicy() const { return *policy_; }
    MlLabel GetFallbackLabel() const { return fallback_; }

private:
    std::unique_ptr<FusionPolicy> policy_;
    MlLabel fallback_;
};

} // namespace risk
} // namespace neuroshield

#endif // NEUROSHIELD_RISK_RISK_FUSION_H
