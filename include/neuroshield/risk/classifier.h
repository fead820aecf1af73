// NeuroShield - Fraud Classifier Interface
// Copyright (c) 2024 NeuroShield Developers
// MIT License
//
// The ML model is an external collaborator. The core only consumes its
// categorical verdict, and treats an unreachable model as an explicit
// input rather than an error.

#ifndef NEUROSHIELD_RISK_CLASSIFIER_H
#define NEUROSHIELD_RISK_CLASSIFIER_H

#include "neuroshield/core/address.h"
#include "neuroshield/core/types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace neuroshield {
namespace risk {

// ============================================================================
// Labels
// ============================================================================

enum class MlLabel : uint8_t {
    Fraud,
    Suspicious,
    NonFraud,
};

/// "Fraud", "Suspicious" or "Non-Fraud"
const char* MlLabelToString(MlLabel label);

/// Accepts Fraud, Suspicious, Non-Fraud, NonFraud and Safe in any case
std::optional<MlLabel> ParseMlLabel(const std::string& text);

/// Fixed base probability of a label: 0.85, 0.50 or 0.10
double BaseRiskForLabel(MlLabel label);

// ============================================================================
// Signal
// ============================================================================

/// Classifier output: a label, or the reason none is available
class MlSignal {
public:
    static MlSignal Label(MlLabel label) {
        MlSignal s;
        s.label_ = label;
        return s;
    }

    static MlSignal Unavailable(const std::string& reason) {
        MlSignal s;
        s.reason_ = reason;
        return s;
    }

    bool IsAvailable() const { return label_.has_value(); }

    /// Only meaningful if IsAvailable()
    MlLabel GetLabel() const { return label_.value_or(MlLabel::Suspicious); }

    const std::string& GetReason() const { return reason_; }

    std::string ToString() const;

private:
    MlSignal() = default;

    std::optional<MlLabel> label_;
    std::string reason_;
};

// ============================================================================
// Features
// ============================================================================

/// Behavioral summary of the recipient wallet sent to the model
struct TransactionFeatures {
    double avgMinutesBetweenSent{0};
    double avgMinutesBetweenReceived{0};
    double minutesFirstToLast{0};
    uint64_t sentTxCount{0};
    uint64_t receivedTxCount{0};
    uint64_t createdContracts{0};
    double maxValueReceived{0};
    double avgValueReceived{0};
    double avgValueSent{0};
    double totalValueSent{0};
    double balance{0};
    double transactionValue{0};

    /// Numeric feature vector in model input order
    std::vector<double> ToVector() const;
};

// ============================================================================
// Classifier Interface
// ============================================================================

class FraudClassifier {
public:
    virtual ~FraudClassifier() = default;

    /**
     * Classify a transfer to recipient. Implementations enforce their own
     * timeout and may return Unavailable or throw; callers convert both
     * into an unavailable signal.
     */
    virtual MlSignal Predict(const Address& recipient, const TransactionFeatures& features) = 0;
};

/// Classifier returning a preset signal; used by the command-line front end
/// when verdicts arrive precomputed.
class StaticClassifier : public FraudClassifier {
public:
    explicit StaticClassifier(MlSignal signal) : signal_(std::move(signal)) {}

    MlSignal Predict(const Address&, const TransactionFeatures&) override { return signal_; }

    void SetSignal(MlSignal signal) { signal_ = std::move(signal); }

private:
    MlSignal signal_;
};

} // namespace risk
} // namespace neuroshield

#endif // NEUROSHIELD_RISK_CLASSIFIER_H
