// NeuroShield - Threat Oracle Implementation
// Copyright (c) 2024 NeuroShield Developers
// MIT License

#include "neuroshield/oracle/threat_oracle.h"

#include "neuroshield/util/logging.h"
#include "neuroshield/util/time.h"

#include <algorithm>
#include <exception>
#include <sstream>

namespace neuroshield {
namespace oracle {

// ============================================================================
// Threat Oracle
// ============================================================================

const char* RiskLabelForScore(uint32_t threatScore) {
    if (threatScore >= 75) return "CRITICAL";
    if (threatScore >= 50) return "HIGH RISK";
    if (threatScore >= 20) return "UNDER REVIEW";
    return "CLEAN";
}

ThreatOracle::ThreatOracle(const governance::GovernanceEngine& engine) : engine_(engine) {}

OracleReport ThreatOracle::Query(const Address& address) const {
    OracleReport report;
    report.address = address;
    report.threatScore = engine_.GetThreatScore(address);
    report.isConfirmedScam = engine_.IsConfirmedScam(address);

    governance::DAOConfidence confidence = engine_.GetDAOConfidence(address);
    report.forPower = confidence.forPower;
    report.againstPower = confidence.againstPower;
    report.totalVoters = confidence.totalVoters;
    report.confidencePercent = confidence.confidencePercent;
    report.riskLabel = RiskLabelForScore(report.threatScore);

    if (report.isConfirmedScam) {
        report.explanation.push_back("DAO community confirmed this address as scammer");
    }
    if (report.totalVoters > 0) {
        report.explanation.push_back(std::to_string(report.totalVoters) + " voters reached " +
                                     std::to_string(report.confidencePercent) + "% consensus");
    }

    if (report.threatScore >= 75) {
        report.explanation.push_back("Threat level CRITICAL: avoid all interaction");
    } else if (report.threatScore >= 50) {
        report.explanation.push_back("Threat level HIGH: exercise extreme caution");
    } else if (report.threatScore >= 20 || engine_.HasActiveProposal(address)) {
        report.explanation.push_back("Address is currently under community review");
    } else {
        report.explanation.push_back("No threats detected by the DAO oracle");
    }

    if (report.isConfirmedScam || report.totalVoters > 0) {
        report.explanation.push_back("Verdict recorded in the governance ledger");
    }

    return report;
}

// ============================================================================
// Risk Service
// ============================================================================

RiskService::RiskService(const governance::GovernanceEngine& engine,
                         const mirror::LedgerMirror& mirror,
                         const ledger::EventSource& events,
                         const risk::RiskFusionEngine& fusion,
                         risk::FraudClassifier* classifier,
                         std::set<Address> allowlist,
                         size_t logCapacity)
    : engine_(engine),
      mirror_(mirror),
      events_(events),
      fusion_(fusion),
      classifier_(classifier),
      allowlist_(std::move(allowlist)),
      logCapacity_(std::max<size_t>(logCapacity, 1)) {}

bool RiskService::IsAllowListed(const Address& address) const {
    return allowlist_.count(address) > 0;
}

risk::TrustSnapshot RiskService::ReadTrust(const Address& target, bool* fromMirror) const {
    risk::TrustSnapshot snapshot;

    mirror::FreshnessReport freshness = mirror_.CheckFreshness(events_, util::GetTime());
    if (!freshness.stale) {
        mirror::MirrorSnapshot cached = mirror_.Snapshot(target);
        snapshot.record = cached.record;
        snapshot.hasRecord = cached.hasRecord;
        snapshot.hasActiveProposal = cached.underReview;
        if (fromMirror) *fromMirror = true;
        return snapshot;
    }

    LOG_WARN(util::LogCategory::MIRROR) << "Mirror stale (" << freshness.lagEvents
                                        << " events, " << freshness.lagSeconds
                                        << "s behind); reading trust state from ledger";

    auto record = engine_.GetTrustRecord(target);
    if (record) {
        snapshot.record = *record;
        snapshot.hasRecord = true;
    }
    snapshot.hasActiveProposal = engine_.HasActiveProposal(target);
    if (fromMirror) *fromMirror = false;
    return snapshot;
}

risk::RiskAssessment RiskService::AssessTransfer(const TransferCandidate& candidate) {
    risk::MlSignal signal = risk::MlSignal::Unavailable("no classifier configured");

    if (classifier_) {
        try {
            signal = classifier_->Predict(candidate.to, candidate.features);
        } catch (const std::exception& e) {
            LOG_WARN(util::LogCategory::RISK) << "Classifier failed for "
                                              << candidate.to.ToShortString() << ": " << e.what();
            signal = risk::MlSignal::Unavailable(e.what());
        } catch (...) {
            LOG_WARN(util::LogCategory::RISK) << "Classifier failed for "
                                              << candidate.to.ToShortString()
                                              << " with a non-standard exception";
            signal = risk::MlSignal::Unavailable("unknown classifier error");
        }
    }

    return AssessTransfer(candidate, signal);
}

risk::RiskAssessment RiskService::AssessTransfer(const TransferCandidate& candidate,
                                                 const risk::MlSignal& signal) const {
    risk::RiskInputs inputs;
    inputs.ml = signal;
    inputs.trust = ReadTrust(candidate.to);
    inputs.activity = candidate.recipientActivity;
    inputs.allowListed = candidate.allowListed || IsAllowListed(candidate.to);

    risk::RiskAssessment assessment = fusion_.Assess(inputs);

    LOG_DEBUG(util::LogCategory::RISK) << "Assessed transfer to " << candidate.to.ToShortString()
                                       << ": " << assessment.ToString();
    Record(candidate, assessment);
    return assessment;
}

// ============================================================================
// Assessment Log
// ============================================================================

std::string AssessmentRecord::ToString() const {
    std::ostringstream ss;
    ss << "Assessment(from=" << from.ToShortString()
       << ", to=" << to.ToShortString()
       << ", value=" << value
       << ", risk=" << combinedRisk
       << ", band=" << risk::RiskBandToString(band)
       << ", at=" << assessedAt << ")";
    return ss.str();
}

void RiskService::Record(const TransferCandidate& candidate,
                         const risk::RiskAssessment& assessment) const {
    AssessmentRecord record;
    record.from = candidate.from;
    record.to = candidate.to;
    record.value = candidate.value;
    record.combinedRisk = assessment.combinedRisk;
    record.band = assessment.band;
    record.assessedAt = util::GetTime();

    std::lock_guard<std::mutex> lock(logMutex_);
    switch (record.band) {
        case risk::RiskBand::Safe: ++stats_.safe; break;
        case risk::RiskBand::Suspicious: ++stats_.suspicious; break;
        case risk::RiskBand::Blocked: ++stats_.blocked; break;
    }
    log_.push_back(std::move(record));
    while (log_.size() > logCapacity_) {
        log_.pop_front();
    }
}

FirewallStats RiskService::GetStats() const {
    std::lock_guard<std::mutex> lock(logMutex_);
    return stats_;
}

std::vector<AssessmentRecord> RiskService::GetHistory(const Address& address,
                                                      size_t limit) const {
    limit = std::min(limit, MAX_HISTORY_RESULTS);

    std::lock_guard<std::mutex> lock(logMutex_);
    std::vector<AssessmentRecord> result;
    for (auto it = log_.rbegin(); it != log_.rend() && result.size() < limit; ++it) {
        if (it->from == address || it->to == address) {
            result.push_back(*it);
        }
    }
    return result;
}

size_t RiskService::LogSize() const {
    std::lock_guard<std::mutex> lock(logMutex_);
    return log_.size();
}

} // namespace oracle
} // namespace neuroshield
