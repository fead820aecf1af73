// NeuroShield - Token Escrow Implementation
// Copyright (c) 2024 NeuroShield Developers
// MIT License

#include "neuroshield/governance/escrow.h"

namespace neuroshield {
namespace governance {

// ============================================================================
// TokenVault
// ============================================================================

TokenAmount TokenVault::SpendableBalance(const Address& owner) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = spendable_.find(owner);
    return it == spendable_.end() ? 0 : it->second;
}

TokenAmount TokenVault::LockedBalance(const Address& owner) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = locked_.find(owner);
    return it == locked_.end() ? 0 : it->second;
}

bool TokenVault::Lock(const Address& owner, TokenAmount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = spendable_.find(owner);
    if (it == spendable_.end() || it->second < amount) {
        return false;
    }
    it->second -= amount;
    locked_[owner] += amount;
    return true;
}

bool TokenVault::Unlock(const Address& owner, TokenAmount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = locked_.find(owner);
    if (it == locked_.end() || it->second < amount) {
        return false;
    }
    it->second -= amount;
    if (it->second == 0) {
        locked_.erase(it);
    }
    spendable_[owner] += amount;
    return true;
}

bool TokenVault::Credit(const Address& owner, TokenAmount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    TokenAmount& balance = spendable_[owner];
    if (!TokenRange(amount) || balance > MAX_TOKENS - amount) {
        return false;
    }
    balance += amount;
    return true;
}

TokenAmount TokenVault::TotalSupply() const {
    std::lock_guard<std::mutex> lock(mutex_);
    TokenAmount total = 0;
    for (const auto& [owner, amount] : spendable_) {
        total += amount;
    }
    for (const auto& [owner, amount] : locked_) {
        total += amount;
    }
    return total;
}

// ============================================================================
// EscrowBook
// ============================================================================

void EscrowBook::Hold(ProposalId proposal, const Address& voter, TokenAmount amount) {
    holds_[proposal][voter] += amount;
}

std::vector<Refund> EscrowBook::PendingRefunds(ProposalId proposal) const {
    std::vector<Refund> refunds;
    auto it = holds_.find(proposal);
    if (it == holds_.end()) {
        return refunds;
    }

    refunds.reserve(it->second.size());
    for (const auto& [voter, amount] : it->second) {
        refunds.push_back(Refund{voter, amount});
    }
    return refunds;
}

std::vector<Refund> EscrowBook::ReleaseAll(ProposalId proposal) {
    std::vector<Refund> refunds = PendingRefunds(proposal);
    holds_.erase(proposal);
    return refunds;
}

TokenAmount EscrowBook::TotalHeld(ProposalId proposal) const {
    auto it = holds_.find(proposal);
    if (it == holds_.end()) {
        return 0;
    }
    TokenAmount total = 0;
    for (const auto& [voter, amount] : it->second) {
        total += amount;
    }
    return total;
}

TokenAmount EscrowBook::HeldBy(ProposalId proposal, const Address& voter) const {
    auto it = holds_.find(proposal);
    if (it == holds_.end()) {
        return 0;
    }
    auto vit = it->second.find(voter);
    return vit == it->second.end() ? 0 : vit->second;
}

} // namespace governance
} // namespace neuroshield
