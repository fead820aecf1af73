// NeuroShield - Token Escrow
// Copyright (c) 2024 NeuroShield Developers
// MIT License
//
// Boundary between governance and token custody. Staked tokens leave the
// voter's spendable balance on cast and come back in full on settlement.

#ifndef NEUROSHIELD_GOVERNANCE_ESCROW_H
#define NEUROSHIELD_GOVERNANCE_ESCROW_H

#include "neuroshield/core/address.h"
#include "neuroshield/core/types.h"

#include <map>
#include <mutex>
#include <vector>

namespace neuroshield {
namespace governance {

// ============================================================================
// Token Bank Interface
// ============================================================================

/**
 * Custody of transferable tokens. Implementations must be safe to call
 * from the ledger thread while readers query balances.
 */
class TokenBank {
public:
    virtual ~TokenBank() = default;

    /// Tokens available for staking
    virtual TokenAmount SpendableBalance(const Address& owner) const = 0;

    /// Move amount from spendable to locked. False if the balance is too low.
    virtual bool Lock(const Address& owner, TokenAmount amount) = 0;

    /// Move amount from locked back to spendable. False if not enough is locked.
    virtual bool Unlock(const Address& owner, TokenAmount amount) = 0;
};

// ============================================================================
// Token Vault
// ============================================================================

/**
 * In-process TokenBank. Balances are seeded with Credit() from genesis
 * allocation or ledger credit commands.
 */
class TokenVault : public TokenBank {
public:
    TokenAmount SpendableBalance(const Address& owner) const override;
    bool Lock(const Address& owner, TokenAmount amount) override;
    bool Unlock(const Address& owner, TokenAmount amount) override;

    /// Add to the spendable balance. False if it would exceed MAX_TOKENS.
    bool Credit(const Address& owner, TokenAmount amount);

    TokenAmount LockedBalance(const Address& owner) const;

    /// Sum of all spendable and locked tokens
    TokenAmount TotalSupply() const;

private:
    mutable std::mutex mutex_;
    std::map<Address, TokenAmount> spendable_;
    std::map<Address, TokenAmount> locked_;
};

// ============================================================================
// Escrow Book
// ============================================================================

/// Tokens returned to one voter on settlement
struct Refund {
    Address voter;
    TokenAmount amount{0};

    bool operator==(const Refund& other) const {
        return voter == other.voter && amount == other.amount;
    }
};

/**
 * Per-proposal record of held stakes. Not synchronized; owned and locked
 * by the GovernanceEngine.
 */
class EscrowBook {
public:
    /// Record a stake held for proposal
    void Hold(ProposalId proposal, const Address& voter, TokenAmount amount);

    /// Every stake held for proposal, ordered by voter, without releasing it
    std::vector<Refund> PendingRefunds(ProposalId proposal) const;

    /// Remove and return every stake held for proposal, ordered by voter
    std::vector<Refund> ReleaseAll(ProposalId proposal);

    /// Sum currently held for proposal
    TokenAmount TotalHeld(ProposalId proposal) const;

    /// Stake held for one voter, 0 if none
    TokenAmount HeldBy(ProposalId proposal, const Address& voter) const;

private:
    std::map<ProposalId, std::map<Address, TokenAmount>> holds_;
};

} // namespace governance
} // namespace neuroshield

#endif // NEUROSHIELD_GOVERNANCE_ESCROW_H
