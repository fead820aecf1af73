// NeuroShield - Ledger Mirror
// Copyright (c) 2024 NeuroShield Developers
// MIT License
//
// Eventually consistent read cache of trust state. A consumer thread
// drains ledger events from a channel and applies idempotent upserts;
// readers never touch the ledger.

#ifndef NEUROSHIELD_MIRROR_LEDGER_MIRROR_H
#define NEUROSHIELD_MIRROR_LEDGER_MIRROR_H

#include "neuroshield/core/address.h"
#include "neuroshield/ledger/ledger.h"
#include "neuroshield/trust/trust_registry.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <utility>

namespace neuroshield {
namespace mirror {

/// Production staleness bound in seconds
constexpr int64_t DEFAULT_STALENESS_BOUND = 120;

struct MirrorConfig {
    /// Maximum age (seconds) of the oldest unapplied event before the
    /// mirror is considered stale
    int64_t stalenessBound{DEFAULT_STALENESS_BOUND};
};

/// Cached view of one address
struct MirrorSnapshot {
    trust::TrustRecord record;
    bool hasRecord{false};

    /// At least one proposal against the address is still open
    bool underReview{false};

    /// Event sequence the snapshot reflects
    uint64_t appliedSequence{0};
};

/// How far the mirror trails the ledger
struct FreshnessReport {
    bool stale{false};

    /// Published events not yet applied
    uint64_t lagEvents{0};

    /// Seconds since the oldest unapplied event committed, 0 if none
    int64_t lagSeconds{0};
};

class LedgerMirror {
public:
    explicit LedgerMirror(const MirrorConfig& config = MirrorConfig());
    ~LedgerMirror();

    LedgerMirror(const LedgerMirror&) = delete;
    LedgerMirror& operator=(const LedgerMirror&) = delete;

    /// Start the consumer thread on channel. False if already running.
    bool Start(std::shared_ptr<ledger::EventChannel> channel);

    /// Stop and join the consumer thread
    void Stop();

    bool IsRunning() const { return running_.load(); }

    /**
     * Apply one event. Events already applied (by sequence, or by
     * proposal and event kind) are ignored.
     * @return true if the event changed the mirror
     */
    bool Apply(const ledger::LedgerEvent& event);

    MirrorSnapshot Snapshot(const Address& target) const;

    uint64_t AppliedSequence() const;

    /// Commit time of the newest applied event
    Timestamp LastCommitTime() const;

    /// Block until sequence has been applied or timeout elapses
    bool WaitForSequence(uint64_t sequence, std::chrono::milliseconds timeout) const;

    FreshnessReport CheckFreshness(const ledger::EventSource& source, Timestamp now) const;

    /// Number of addresses with a cached record
    size_t RecordCount() const;

    const MirrorConfig& GetConfig() const { return config_; }

private:
    void ConsumerThread();

    MirrorConfig config_;

    mutable std::mutex mutex_;
    mutable std::condition_variable appliedCv_;
    std::map<Address, trust::TrustRecord> records_;
    std::map<Address, std::set<ProposalId>> openProposals_;
    std::set<std::pair<ProposalId, uint8_t>> appliedKeys_;
    uint64_t appliedSequence_{0};
    Timestamp lastCommitTime_{0};

    std::shared_ptr<ledger::EventChannel> channel_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> shouldStop_{false};
};

} // namespace mirror
} // namespace neuroshield

#endif // NEUROSHIELD_MIRROR_LEDGER_MIRROR_H
