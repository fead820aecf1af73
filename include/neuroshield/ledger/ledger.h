// NeuroShield - Governance Ledger
// Copyright (c) 2024 NeuroShield Developers
// MIT License
//
// Serializing executor for governance commands. Every accepted command is
// applied in a single total order, appended to a hash-chained journal in
// the key-value store, and its events are published to subscribers.

#ifndef NEUROSHIELD_LEDGER_LEDGER_H
#define NEUROSHIELD_LEDGER_LEDGER_H

#include "neuroshield/core/types.h"
#include "neuroshield/db/database.h"
#include "neuroshield/governance/commands.h"
#include "neuroshield/governance/escrow.h"
#include "neuroshield/governance/governance.h"
#include "neuroshield/util/channel.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace neuroshield {
namespace ledger {

/// Journal schema version stored under prefix::VERSION
constexpr uint32_t JOURNAL_VERSION = 1;

// ============================================================================
// Journal Entry
// ============================================================================

struct JournalEntry {
    /// 1-based position in the journal
    uint64_t sequence{0};

    /// Ledger clock when the command was applied
    Timestamp timestamp{0};

    /// SerializeCommand() output
    std::vector<uint8_t> command;

    /// Hash of the previous entry, null for the first
    Hash256 prevHash;

    Hash256 hash;

    /// SHA256(prevHash || sequence || timestamp || command)
    Hash256 ComputeHash() const;
};

template<typename Stream>
void Serialize(Stream& s, const JournalEntry& entry) {
    Serialize(s, entry.sequence);
    Serialize(s, entry.timestamp);
    Serialize(s, entry.command);
    Serialize(s, entry.prevHash);
    Serialize(s, entry.hash);
}

template<typename Stream>
void Unserialize(Stream& s, JournalEntry& entry) {
    Unserialize(s, entry.sequence);
    Unserialize(s, entry.timestamp);
    Unserialize(s, entry.command);
    Unserialize(s, entry.prevHash);
    Unserialize(s, entry.hash);
}

// ============================================================================
// Events
// ============================================================================

/// A governance event tagged with its position in the event stream
struct LedgerEvent {
    /// 1-based, contiguous across all events
    uint64_t sequence{0};

    /// Commit time of the command that produced the event
    Timestamp committedAt{0};

    governance::GovernanceEvent event;
};

/**
 * Read-only view of the published event stream, used by consumers to
 * judge how far behind they are.
 */
class EventSource {
public:
    virtual ~EventSource() = default;

    /// Sequence of the newest published event, 0 if none
    virtual uint64_t HeadEventSequence() const = 0;

    /// Commit time of event sequence, nullopt if it does not exist
    virtual std::optional<Timestamp> EventCommitTime(uint64_t sequence) const = 0;
};

using EventChannel = util::Channel<LedgerEvent>;

// ============================================================================
// Command Receipt
// ============================================================================

struct CommandReceipt {
    governance::GovernanceError error{governance::GovernanceError::OK};

    /// Journal sequence, 0 if the command was rejected
    uint64_t sequence{0};
    Timestamp timestamp{0};

    std::optional<ProposalId> proposalId;
    std::optional<governance::Vote> vote;
    std::optional<governance::SettlementEvent> settlement;

    /// Non-OK if the journal write failed
    db::Status storage;

    bool ok() const { return error == governance::GovernanceError::OK && storage.ok(); }
};

// ============================================================================
// Ledger
// ============================================================================

class Ledger : public EventSource {
public:
    Ledger(db::Database& db,
           governance::GovernanceEngine& engine,
           governance::TokenVault& vault);

    Ledger(const Ledger&) = delete;
    Ledger& operator=(const Ledger&) = delete;

    /**
     * Replay the persisted journal into the (fresh) engine and vault,
     * verifying the hash chain. Replayed events are published to current
     * subscribers. Must be called once before Submit().
     * @return Corruption if the chain or an entry is invalid
     */
    db::Status Open();

    /**
     * Apply one command. Validation runs first and a rejected command
     * leaves no trace. An accepted command is journaled before its events
     * are published. If the journal write fails the ledger halts and
     * refuses further commands.
     */
    CommandReceipt Submit(const governance::LedgerCommand& cmd);

    /// Receive every event published from now on
    void Subscribe(std::shared_ptr<EventChannel> channel);

    uint64_t HeadSequence() const;
    Hash256 HeadHash() const;
    bool IsHalted() const;
    bool IsOpen() const;

    // === EventSource ===

    uint64_t HeadEventSequence() const override;
    std::optional<Timestamp> EventCommitTime(uint64_t sequence) const override;

private:
    struct Applied {
        CommandReceipt receipt;
        std::vector<governance::GovernanceEvent> events;
    };

    /// Run a command against the engine at time now
    Applied Apply(const governance::LedgerCommand& cmd, Timestamp now);

    /// Tag events, record their commit time and send them to subscribers
    void Publish(std::vector<governance::GovernanceEvent> events, Timestamp committedAt);

    db::Status CheckVersion();

    db::Database& db_;
    governance::GovernanceEngine& engine_;
    governance::TokenVault& vault_;

    /// Serializes Open() and Submit()
    std::mutex submitMutex_;

    /// Guards the fields below, which readers may inspect concurrently
    mutable std::mutex stateMutex_;
    bool opened_{false};
    bool halted_{false};
    uint64_t headSequence_{0};
    Hash256 headHash_;
    Timestamp lastTimestamp_{0};
    std::vector<Timestamp> eventTimes_;
    std::vector<std::shared_ptr<EventChannel>> subscribers_;
};

} // namespace ledger
} // namespace neuroshield

#endif // NEUROSHIELD_LEDGER_LEDGER_H
