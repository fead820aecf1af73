// NeuroShield - Fraud Classifier Helpers
// Copyright (c) 2024 NeuroShield Developers
// MIT License

#include "neuroshield/risk/classifier.h"

#include <algorithm>
#include <cctype>

namespace neuroshield {
namespace risk {

const char* MlLabelToString(MlLabel label) {
    switch (label) {
        case MlLabel::Fraud: return "Fraud";
        case MlLabel::Suspicious: return "Suspicious";
        case MlLabel::NonFraud: return "Non-Fraud";
        default: return "Unknown";
    }
}

std::optional<MlLabel> ParseMlLabel(const std::string& text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "fraud") return MlLabel::Fraud;
    if (lower == "suspicious") return MlLabel::Suspicious;
    if (lower == "non-fraud" || lower == "nonfraud" || lower == "safe") return MlLabel::NonFraud;
    return std::nullopt;
}

double BaseRiskForLabel(MlLabel label) {
    switch (label) {
        case MlLabel::Fraud: return 0.85;
        case MlLabel::Suspicious: return 0.50;
        case MlLabel::NonFraud: return 0.10;
    }
    return 0.50;
}

std::string MlSignal::ToString() const {
    if (label_) {
        return MlLabelToString(*label_);
    }
    return "unavailable (" + reason_ + ")";
}

std::vector<double> TransactionFeatures::ToVector() const {
    return {
        avgMinutesBetweenSent,
        avgMinutesBetweenReceived,
        minutesFirstToLast,
        static_cast<double>(sentTxCount),
        static_cast<double>(receivedTxCount),
        static_cast<double>(createdContracts),
        maxValueReceived,
        avgValueReceived,
        avgValueSent,
        totalValueSent,
        balance,
        transactionValue,
    };
}

} // namespace risk
} // namespace neuroshield
