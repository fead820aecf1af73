// NeuroShield - Ledger Mirror Implementation
// Copyright (c) 2024 NeuroShield Developers
// MIT License

#include "neuroshield/mirror/ledger_mirror.h"

#include "neuroshield/util/logging.h"

#include <algorithm>

namespace neuroshield {
namespace mirror {

namespace {

/// Receive poll interval of the consumer thread
constexpr std::chrono::milliseconds POLL_INTERVAL{100};

} // anonymous namespace

LedgerMirror::LedgerMirror(const MirrorConfig& config) : config_(config) {}

LedgerMirror::~LedgerMirror() {
    Stop();
}

bool LedgerMirror::Start(std::shared_ptr<ledger::EventChannel> channel) {
    if (running_.load() || !channel) {
        return false;
    }

    channel_ = std::move(channel);
    shouldStop_.store(false);
    running_.store(true);
    thread_ = std::thread(&LedgerMirror::ConsumerThread, this);

    LOG_INFO(util::LogCategory::MIRROR) << "Mirror started (staleness bound "
                                        << config_.stalenessBound << "s)";
    return true;
}

void LedgerMirror::Stop() {
    if (!running_.load()) {
        return;
    }

    shouldStop_.store(true);
    if (thread_.joinable()) {
        thread_.join();
    }
    running_.store(false);

    LOG_INFO(util::LogCategory::MIRROR) << "Mirror stopped at sequence " << AppliedSequence();
}

void LedgerMirror::ConsumerThread() {
    while (!shouldStop_.load()) {
        auto event = channel_->ReceiveFor(POLL_INTERVAL);
        if (!event) {
            if (channel_->IsClosed()) {
                break;
            }
            continue;
        }
        Apply(*event);
    }
}

bool LedgerMirror::Apply(const ledger::LedgerEvent& event) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (event.sequence != 0 && event.sequence <= appliedSequence_) {
        return false;
    }

    const ProposalId proposal = governance::GovernanceEventProposal(event.event);
    const uint8_t kind = static_cast<uint8_t>(event.event.index());
    bool changed = appliedKeys_.emplace(proposal, kind).second;

    if (changed) {
        if (const auto* opened = std::get_if<governance::ProposalOpenedEvent>(&event.event)) {
            openProposals_[opened->target].insert(opened->proposalId);
        } else if (const auto* settled = std::get_if<governance::SettlementEvent>(&event.event)) {
            auto oit = openProposals_.find(settled->target);
            if (oit != openProposals_.end()) {
                oit->second.erase(settled->proposalId);
                if (oit->second.empty()) {
                    openProposals_.erase(oit);
                }
            }

            if (settled->passed || settled->newScamScore > 0) {
                trust::TrustRecord& record = records_[settled->target];
                record.scamScore = std::max(record.scamScore, settled->newScamScore);
                record.isConfirmedScam = record.isConfirmedScam || settled->passed ||
                                         settled->confirmed;
            }
        }
    }

    appliedSequence_ = std::max(appliedSequence_, event.sequence);
    lastCommitTime_ = std::max(lastCommitTime_, event.committedAt);
    lock.unlock();
    appliedCv_.notify_all();

    if (changed) {
        LOG_TRACE(util::LogCategory::MIRROR) << "Applied "
                                             << governance::GovernanceEventName(event.event)
                                             << " for proposal " << proposal
                                             << " (seq " << event.sequence << ")";
    }
    return changed;
}

MirrorSnapshot LedgerMirror::Snapshot(const Address& target) const {
    std::lock_guard<std::mutex> lock(mutex_);
    MirrorSnapshot snapshot;

    auto it = records_.find(target);
    if (it != records_.end()) {
        snapshot.record = it->second;
        snapshot.hasRecord = true;
    }
    snapshot.underReview = openProposals_.count(target) > 0;
    snapshot.appliedSequence = appliedSequence_;
    return snapshot;
}

uint64_t LedgerMirror::AppliedSequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return appliedSequence_;
}

Timestamp LedgerMirror::LastCommitTime() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastCommitTime_;
}

bool LedgerMirror::WaitForSequence(uint64_t sequence, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return appliedCv_.wait_for(lock, timeout, [&] { return appliedSequence_ >= sequence; });
}

FreshnessReport LedgerMirror::CheckFreshness(const ledger::EventSource& source,
                                             Timestamp now) const {
    FreshnessReport report;

    const uint64_t head = source.HeadEventSequence();
    const uint64_t applied = AppliedSequence();
    if (head <= applied) {
        return report;
    }

    report.lagEvents = head - applied;

    auto oldest = source.EventCommitTime(applied + 1);
    if (!oldest) {
        // Cannot date the backlog
        report.stale = true;
        return report;
    }

    report.lagSeconds = std::max<int64_t>(0, now - *oldest);
    report.stale = report.lagSeconds > config_.stalenessBound;
    return report;
}

size_t LedgerMirror::RecordCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

} // namespace mirror
} // namespace neuroshield
