// NeuroShield - Trust Registry Implementation
// Copyright (c) 2024 NeuroShield Developers
// MIT License

#include "neuroshield/trust/trust_registry.h"

#include "neuroshield/util/logging.h"

#include <algorithm>
#include <mutex>
#include <sstream>

namespace neuroshield {
namespace trust {

std::string TrustRecord::ToString() const {
    std::ostringstream ss;
    ss << "TrustRecord(score=" << scamScore
       << ", confirmed=" << (isConfirmedScam ? "true" : "false") << ")";
    return ss.str();
}

std::optional<TrustRecord> TrustRegistry::GetRecord(const Address& target) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = records_.find(target);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

uint32_t TrustRegistry::GetThreatScore(const Address& target) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = records_.find(target);
    return it == records_.end() ? 0 : it->second.scamScore;
}

bool TrustRegistry::IsConfirmedScam(const Address& target) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = records_.find(target);
    return it != records_.end() && it->second.isConfirmedScam;
}

size_t TrustRegistry::Size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return records_.size();
}

TrustRecord TrustRegistry::RecordConfirmation(const Address& target) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    TrustRecord& record = records_[target];
    record.scamScore = std::min(MAX_SCAM_SCORE, record.scamScore + SCAM_SCORE_STEP);
    record.isConfirmedScam = true;

    LOG_DEBUG(util::LogCategory::TRUST) << "Confirmed " << target.ToShortString()
                                        << " score=" << record.scamScore;
    return record;
}

} // namespace trust
} // namespace neuroshield
