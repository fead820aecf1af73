// NeuroShield - Risk Fusion Engine Implementation
// Copyright (c) 2024 NeuroShield Developers
// MIT License

#include "neuroshield/risk/risk_fusion.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace neuroshield {
namespace risk {

namespace {

std::string FormatRisk(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << value;
    return ss.str();
}

double ScoreFraction(const TrustSnapshot& trust) {
    return trust.hasRecord ? trust.record.scamScore / 100.0 : 0.0;
}

} // anonymous namespace

// ============================================================================
// Bands
// ============================================================================

const char* RiskBandToString(RiskBand band) {
    switch (band) {
        case RiskBand::Safe: return "Safe";
        case RiskBand::Suspicious: return "Suspicious";
        case RiskBand::Blocked: return "Blocked";
        default: return "Unknown";
    }
}

RiskBand BandForRisk(double risk) {
    if (risk > BLOCKED_THRESHOLD) return RiskBand::Blocked;
    if (risk > SUSPICIOUS_THRESHOLD) return RiskBand::Suspicious;
    return RiskBand::Safe;
}

std::string RiskAssessment::ToString() const {
    std::ostringstream ss;
    ss << "risk=" << FormatRisk(combinedRisk)
       << " band=" << RiskBandToString(band)
       << " ml=" << FormatRisk(mlRisk)
       << " boost=" << FormatRisk(boost)
       << " policy=" << policy;
    if (dampened) ss << " dampened";
    if (mlFallbackUsed) ss << " ml-fallback";
    if (allowListed) ss << " allow-listed";
    return ss.str();
}

// ============================================================================
// Policies
// ============================================================================

FusionStep AdditiveFusionPolicy::Fuse(double mlRisk, const TrustSnapshot& trust) const {
    FusionStep step;

    if (trust.hasRecord && trust.record.isConfirmedScam) {
        step.boost = std::min(MAX_CONFIRMED_BOOST, ScoreFraction(trust) * 0.5);
        step.rule = "DAO confirmed scam (score " + std::to_string(trust.record.scamScore) +
                    "): +" + FormatRisk(step.boost);
    } else if (trust.hasActiveProposal) {
        step.boost = UNDER_REVIEW_BOOST;
        step.rule = "Address under community review: +" + FormatRisk(step.boost);
    }

    step.combined = std::min(1.0, mlRisk + step.boost);
    return step;
}

FusionStep LayeredFusionPolicy::Fuse(double mlRisk, const TrustSnapshot& trust) const {
    FusionStep step;
    const double score = ScoreFraction(trust);
    const bool confirmed = trust.hasRecord && trust.record.isConfirmedScam;

    if (confirmed) {
        step.combined = 0.95;
        step.rule = "DAO confirmed scam: fixed 0.95";
    } else if (mlRisk > 0.60 && score > 0.30) {
        step.combined = std::min(1.0, mlRisk * 0.5 + score * 0.5 + 0.15);
        step.rule = "High ML risk corroborated by DAO score";
    } else if (score > 0 && mlRisk < 0.30) {
        step.combined = std::max(0.40, score);
        step.rule = "DAO score overrides low ML risk";
    } else if (trust.hasActiveProposal && mlRisk < 0.30) {
        step.combined = 0.30;
        step.rule = "Address under community review: floor 0.30";
    } else {
        step.combined = mlRisk;
    }

    step.boost = step.combined - mlRisk;
    return step;
}

std::unique_ptr<FusionPolicy> MakeFusionPolicy(const std::string& name) {
    if (name == "additive") {
        return std::make_unique<AdditiveFusionPolicy>();
    }
    if (name == "layered") {
        return std::make_unique<LayeredFusionPolicy>();
    }
    return nullptr;
}

// ============================================================================
// RiskFusionEngine
// ============================================================================

RiskFusionEngine::RiskFusionEngine(std::unique_ptr<FusionPolicy> policy, MlLabel fallback)
    : policy_(std::move(policy)), fallback_(fallback) {
    if (!policy_) {
        policy_ = std::make_unique<AdditiveFusionPolicy>();
    }
}

RiskAssessment RiskFusionEngine::Assess(const RiskInputs& inputs) const {
    RiskAssessment result;
    result.policy = policy_->Name();

    // Step 1: base ML risk
    MlLabel label = fallback_;
    if (inputs.ml.IsAvailable()) {
        label = inputs.ml.GetLabel();
        result.explanation.push_back(std::string("ML label ") + MlLabelToString(label) +
                                     " (base risk " + FormatRisk(BaseRiskForLabel(label)) + ")");
    } else {
        result.mlFallbackUsed = true;
        result.explanation.push_back("ML unavailable (" + inputs.ml.GetReason() +
                                     "); assuming " + MlLabelToString(label) +
                                     " (base risk " + FormatRisk(BaseRiskForLabel(label)) + ")");
    }
    result.mlRisk = BaseRiskForLabel(label);

    // Step 2: brand-new wallet dampening
    const TrustSnapshot& trust = inputs.trust;
    if (inputs.activity.IsBrandNew() && !trust.hasRecord && !trust.hasActiveProposal &&
        result.mlRisk > BRAND_NEW_RISK_CAP) {
        result.mlRisk = BRAND_NEW_RISK_CAP;
        result.dampened = true;
        result.explanation.push_back("Brand-new wallet with no DAO evidence: ML risk capped at " +
                                     FormatRisk(BRAND_NEW_RISK_CAP));
    }

    // Steps 3-4: DAO adjustment
    FusionStep step = policy_->Fuse(result.mlRisk, trust);
    if (!step.rule.empty()) {
        result.explanation.push_back(step.rule);
    }
    result.boost = step.boost;
    result.combinedRisk = std::clamp(step.combined, 0.0, 1.0);

    // Step 5: band
    result.band = BandForRisk(result.combinedRisk);

    if (inputs.allowListed) {
        result.allowListed = true;
        if (result.band != RiskBand::Safe) {
            result.explanation.push_back(std::string("Allow-listed: ") +
                                         RiskBandToString(result.band) + " overridden to Safe");
        }
        result.band = RiskBand::Safe;
    }

    return result;
}

} // namespace risk
} // namespace neuroshield
