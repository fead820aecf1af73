// NeuroShield - Governance Ledger Implementation
// Copyright (c) 2024 NeuroShield Developers
// MIT License

#include "neuroshield/ledger/ledger.h"

#include "neuroshield/core/serialize.h"
#include "neuroshield/crypto/sha256.h"
#include "neuroshield/util/logging.h"
#include "neuroshield/util/time.h"

#include <algorithm>

namespace neuroshield {
namespace ledger {

using governance::GovernanceError;
using governance::GovernanceErrorToString;

namespace {

struct JournalHead {
    uint64_t sequence{0};
    Hash256 hash;
};

template<typename Stream>
void Serialize(Stream& s, const JournalHead& head) {
    s << head.sequence << head.hash;
}

template<typename Stream>
void Unserialize(Stream& s, JournalHead& head) {
    s >> head.sequence >> head.hash;
}

template<typename... Ts>
struct Overloaded : Ts... { using Ts::operator()...; };
template<typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // anonymous namespace

// ============================================================================
// JournalEntry
// ============================================================================

Hash256 JournalEntry::ComputeHash() const {
    DataStream s;
    s << prevHash << sequence << timestamp;
    s.Write(command.data(), command.size());
    return SHA256Hash(s.Data());
}

// ============================================================================
// Ledger
// ============================================================================

Ledger::Ledger(db::Database& db,
               governance::GovernanceEngine& engine,
               governance::TokenVault& vault)
    : db_(db), engine_(engine), vault_(vault) {}

void Ledger::Subscribe(std::shared_ptr<EventChannel> channel) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    subscribers_.push_back(std::move(channel));
}

uint64_t Ledger::HeadSequence() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return headSequence_;
}

Hash256 Ledger::HeadHash() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return headHash_;
}

bool Ledger::IsHalted() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return halted_;
}

bool Ledger::IsOpen() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return opened_;
}

uint64_t Ledger::HeadEventSequence() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return eventTimes_.size();
}

std::optional<Timestamp> Ledger::EventCommitTime(uint64_t sequence) const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    if (sequence == 0 || sequence > eventTimes_.size()) {
        return std::nullopt;
    }
    return eventTimes_[sequence - 1];
}

db::Status Ledger::CheckVersion() {
    const std::string key = db::MakeKey(db::prefix::VERSION);
    std::string value;
    db::Status s = db_.Get(key, &value);
    if (s.IsNotFound()) {
        return db_.Put(key, db::SerializeToString(JOURNAL_VERSION));
    }
    if (!s.ok()) {
        return s;
    }

    uint32_t version = 0;
    if (!db::DeserializeFromString(value, version)) {
        return db::Status::Corruption("unreadable journal version");
    }
    if (version != JOURNAL_VERSION) {
        return db::Status::NotSupported("journal version " + std::to_string(version));
    }
    return db::Status::Ok();
}

db::Status Ledger::Open() {
    std::lock_guard<std::mutex> submitLock(submitMutex_);
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (opened_) {
            return db::Status::InvalidArgument("ledger already open");
        }
    }

    db::Status status = CheckVersion();
    if (!status.ok()) {
        return status;
    }

    util::ScopedLogTimer timer(util::LogCategory::LEDGER, "journal replay");

    uint64_t expected = 1;
    Hash256 runningHash;
    Timestamp lastTimestamp = 0;

    const std::string journalPrefix = db::MakeKey(db::prefix::JOURNAL);
    auto it = db_.NewIterator();
    for (it->Seek(journalPrefix); it->Valid() && it->key().starts_with(journalPrefix); it->Next()) {
        JournalEntry entry;
        if (!db::DeserializeFromString(it->value().ToString(), entry)) {
            return db::Status::Corruption("undecodable journal entry " + std::to_string(expected));
        }
        if (entry.sequence != expected || it->key().ToString() != db::MakeKey(db::prefix::JOURNAL, expected)) {
            return db::Status::Corruption("journal gap at " + std::to_string(expected));
        }
        if (entry.prevHash != runningHash || entry.hash != entry.ComputeHash()) {
            return db::Status::Corruption("journal hash chain broken at " + std::to_string(expected));
        }

        auto cmd = governance::DeserializeCommand(entry.command);
        if (!cmd) {
            return db::Status::Corruption("undecodable command at " + std::to_string(expected));
        }

        Applied applied = Apply(*cmd, entry.timestamp);
        if (applied.receipt.error != GovernanceError::OK) {
            return db::Status::Corruption("journaled command " + std::to_string(expected) +
                                          " rejected on replay: " +
                                          GovernanceErrorToString(applied.receipt.error));
        }
        Publish(std::move(applied.events), entry.timestamp);

        runningHash = entry.hash;
        lastTimestamp = std::max(lastTimestamp, entry.timestamp);
        ++expected;
    }
    if (!it->status().ok()) {
        return it->status();
    }

    // The head record is written in the same batch as the newest entry
    std::string headValue;
    status = db_.Get(db::MakeKey(db::prefix::JOURNAL_HEAD), &headValue);
    if (status.ok()) {
        JournalHead head;
        if (!db::DeserializeFromString(headValue, head) ||
            head.sequence != expected - 1 || head.hash != runningHash) {
            return db::Status::Corruption("journal head does not match entries");
        }
    } else if (!status.IsNotFound()) {
        return status;
    } else if (expected != 1) {
        return db::Status::Corruption("journal head missing");
    }

    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        headSequence_ = expected - 1;
        headHash_ = runningHash;
        lastTimestamp_ = lastTimestamp;
        opened_ = true;
    }

    LOG_INFO(util::LogCategory::LEDGER) << "Replayed " << (expected - 1)
                                        << " journal entries from " << db_.Name()
                                        << " store";
    return db::Status::Ok();
}

Ledger::Applied Ledger::Apply(const governance::LedgerCommand& cmd, Timestamp now) {
    Applied applied;
    CommandReceipt& receipt = applied.receipt;
    receipt.timestamp = now;

    std::visit(Overloaded{
        [&](const governance::SubmitProposalCmd& c) {
            auto result = engine_.SubmitProposal(c.caller, c.target, c.description, c.evidence, now);
            receipt.error = result.error;
            if (result.ok()) {
                receipt.proposalId = *result.value;
                auto proposal = engine_.GetProposal(*result.value);
                applied.events.emplace_back(governance::ProposalOpenedEvent{
                    proposal.value->id, proposal.value->target, proposal.value->deadline});
            }
        },
        [&](const governance::CastVoteCmd& c) {
            auto result = engine_.CastVote(c.caller, c.proposalId, c.support, c.tokens, now);
            receipt.error = result.error;
            if (result.ok()) {
                receipt.proposalId = c.proposalId;
                receipt.vote = *result.value;
            }
        },
        [&](const governance::ExecuteProposalCmd& c) {
            auto result = engine_.ExecuteProposal(c.caller, c.proposalId, now);
            receipt.error = result.error;
            if (result.ok()) {
                receipt.proposalId = c.proposalId;
                receipt.settlement = *result.value;
                applied.events.emplace_back(std::move(*result.value));
            }
        },
        [&](const governance::CreditTokensCmd& c) {
            if (!vault_.Credit(c.account, c.amount)) {
                receipt.error = GovernanceError::MalformedCommand;
            }
        },
    }, cmd);

    return applied;
}

void Ledger::Publish(std::vector<governance::GovernanceEvent> events, Timestamp committedAt) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    for (auto& event : events) {
        eventTimes_.push_back(committedAt);

        LedgerEvent published;
        published.sequence = eventTimes_.size();
        published.committedAt = committedAt;
        published.event = std::move(event);

        for (const auto& channel : subscribers_) {
            if (!channel->Send(published)) {
                LOG_DEBUG(util::LogCategory::LEDGER) << "Subscriber closed, event "
                                                     << published.sequence << " dropped";
            }
        }
    }
}

CommandReceipt Ledger::Submit(const governance::LedgerCommand& cmd) {
    std::lock_guard<std::mutex> submitLock(submitMutex_);

    CommandReceipt rejected;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (!opened_) {
            rejected.storage = db::Status::InvalidArgument("ledger not open");
            return rejected;
        }
        if (halted_) {
            rejected.storage = db::Status::IOError("ledger halted after storage failure");
            return rejected;
        }
    }

    GovernanceError error = governance::ValidateCommand(cmd);
    if (error != GovernanceError::OK) {
        LOG_DEBUG(util::LogCategory::LEDGER) << governance::CommandName(cmd)
                                             << " rejected at boundary: "
                                             << GovernanceErrorToString(error);
        rejected.error = error;
        return rejected;
    }

    // Ledger time never runs backwards
    Timestamp now = std::max(util::GetTime(), lastTimestamp_);

    Applied applied = Apply(cmd, now);
    if (applied.receipt.error != GovernanceError::OK) {
        return applied.receipt;
    }

    JournalEntry entry;
    entry.timestamp = now;
    entry.command = governance::SerializeCommand(cmd);
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        entry.sequence = headSequence_ + 1;
        entry.prevHash = headHash_;
    }
    entry.hash = entry.ComputeHash();

    JournalHead head{entry.sequence, entry.hash};

    db::WriteBatch batch;
    batch.Put(db::MakeKey(db::prefix::JOURNAL, entry.sequence), db::SerializeToString(entry));
    batch.Put(db::MakeKey(db::prefix::JOURNAL_HEAD), db::SerializeToString(head));

    db::WriteOptions options;
    options.sync = true;
    db::Status status = db_.Write(options, &batch);
    if (!status.ok()) {
        // Memory state is ahead of the journal now; stop accepting commands
        std::lock_guard<std::mutex> lock(stateMutex_);
        halted_ = true;
        LOG_ERROR(util::LogCategory::LEDGER) << "Journal write failed at sequence "
                                             << entry.sequence << ": " << status.ToString()
                                             << "; ledger halted";
        applied.receipt.storage = status;
        return applied.receipt;
    }

    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        headSequence_ = entry.sequence;
        headHash_ = entry.hash;
        lastTimestamp_ = now;
    }

    applied.receipt.sequence = entry.sequence;
    Publish(std::move(applied.events), now);

    LOG_DEBUG(util::LogCategory::LEDGER) << "Committed " << governance::CommandName(cmd)
                                         << " as entry " << entry.sequence;
    return applied.receipt;
}

} // namespace ledger
} // namespace neuroshield
