// NeuroShield - Threat Oracle
// Copyright (c) 2024 NeuroShield Developers
// MIT License
//
// Query surface other protocols rely on: the community verdict on an
// address, and the fused risk of a candidate transfer.

#ifndef NEUROSHIELD_ORACLE_THREAT_ORACLE_H
#define NEUROSHIELD_ORACLE_THREAT_ORACLE_H

#include "neuroshield/core/address.h"
#include "neuroshield/governance/governance.h"
#include "neuroshield/ledger/ledger.h"
#include "neuroshield/mirror/ledger_mirror.h"
#include "neuroshield/risk/classifier.h"
#include "neuroshield/risk/risk_fusion.h"

#include <cstdint>
#include <deque>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace neuroshield {
namespace oracle {

// ============================================================================
// Threat Oracle
// ============================================================================

/// Community verdict on one address
struct OracleReport {
    Address address;
    uint32_t threatScore{0};
    bool isConfirmedScam{false};
    uint64_t forPower{0};
    uint64_t againstPower{0};
    uint32_t totalVoters{0};
    uint32_t confidencePercent{0};

    /// CRITICAL, HIGH RISK, UNDER REVIEW or CLEAN
    std::string riskLabel;

    std::vector<std::string> explanation;
};

/// >=75 CRITICAL, >=50 HIGH RISK, >=20 UNDER REVIEW, else CLEAN
const char* RiskLabelForScore(uint32_t threatScore);

/**
 * Authoritative oracle reads, served straight from the governance engine
 * and trust registry.
 */
class ThreatOracle {
public:
    explicit ThreatOracle(const governance::GovernanceEngine& engine);

    OracleReport Query(const Address& address) const;

private:
    const governance::GovernanceEngine& engine_;
};

// ============================================================================
// Risk Service
// ============================================================================

/// A transfer awaiting a risk decision
struct TransferCandidate {
    Address from;
    Address to;
    TokenAmount value{0};

    /// History of the recipient
    risk::WalletActivity recipientActivity;
    risk::TransactionFeatures features;

    /// Caller-side allow-list hit
    bool allowListed{false};
};

/// Assessments kept for history reads
constexpr size_t DEFAULT_ASSESSMENT_LOG_CAPACITY = 1000;

/// Most entries one history read returns
constexpr size_t MAX_HISTORY_RESULTS = 50;

/// One analysed transfer, as kept in the assessment log
struct AssessmentRecord {
    Address from;
    Address to;
    TokenAmount value{0};
    double combinedRisk{0};
    risk::RiskBand band{risk::RiskBand::Safe};
    Timestamp assessedAt{0};

    std::string ToString() const;
};

/// Assessment counts by band since the service started
struct FirewallStats {
    uint64_t safe{0};
    uint64_t suspicious{0};
    uint64_t blocked{0};

    uint64_t Total() const { return safe + suspicious + blocked; }
};

/**
 * Composes the ML collaborator, the ledger mirror and the fusion engine.
 *
 * Trust state comes from the mirror while it is within its staleness
 * bound; otherwise the service reads the engine directly so that a
 * freshly confirmed scam is never scored as clean.
 */
class RiskService {
public:
    RiskService(const governance::GovernanceEngine& engine,
                const mirror::LedgerMirror& mirror,
                const ledger::EventSource& events,
                const risk::RiskFusionEngine& fusion,
                risk::FraudClassifier* classifier,
                std::set<Address> allowlist = {},
                size_t logCapacity = DEFAULT_ASSESSMENT_LOG_CAPACITY);

    /// Ask the classifier, then fuse. Never throws on classifier failure.
    risk::RiskAssessment AssessTransfer(const TransferCandidate& candidate);

    /// Fuse a signal obtained elsewhere
    risk::RiskAssessment AssessTransfer(const TransferCandidate& candidate,
                                        const risk::MlSignal& signal) const;

    /**
     * Trust state of target.
     * @param[out] fromMirror Set to whether the mirror answered
     */
    risk::TrustSnapshot ReadTrust(const Address& target, bool* fromMirror = nullptr) const;

    bool IsAllowListed(const Address& address) const;

    // === Assessment Log ===

    /// Counts cover every assessment, including ones evicted from the log
    FirewallStats GetStats() const;

    /**
     * Logged assessments where address is sender or recipient, newest
     * first, at most limit entries (capped at MAX_HISTORY_RESULTS).
     */
    std::vector<AssessmentRecord> GetHistory(const Address& address,
                                             size_t limit = MAX_HISTORY_RESULTS) const;

    size_t LogSize() const;

private:
    void Record(const TransferCandidate& candidate, const risk::RiskAssessment& assessment) const;

    const governance::GovernanceEngine& engine_;
    const mirror::LedgerMirror& mirror_;
    const ledger::EventSource& events_;
    const risk::RiskFusionEngine& fusion_;
    risk::FraudClassifier* classifier_;
    std::set<Address> allowlist_;

    mutable std::mutex logMutex_;
    mutable std::deque<AssessmentRecord> log_;
    mutable FirewallStats stats_;
    size_t logCapacity_;
};

} // namespace oracle
} // namespace neuroshield

#endif // NEUROSHIELD_ORACLE_THREAT_ORACLE_H
