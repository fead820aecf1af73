// NeuroShield - Ledger Commands
// Copyright (c) 2024 NeuroShield Developers
// MIT License
//
// Typed representation of every state-mutating operation. Commands are
// validated at the boundary, encoded into the ledger journal and decoded
// again on replay.

#ifndef NEUROSHIELD_GOVERNANCE_COMMANDS_H
#define NEUROSHIELD_GOVERNANCE_COMMANDS_H

#include "neuroshield/core/address.h"
#include "neuroshield/core/types.h"
#include "neuroshield/governance/governance.h"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace neuroshield {
namespace governance {

// ============================================================================
// Command Types
// ============================================================================

/// Wire tag preceding each encoded command
enum class CommandTag : uint8_t {
    SubmitProposal = 1,
    CastVote = 2,
    ExecuteProposal = 3,
    CreditTokens = 4,
};

struct SubmitProposalCmd {
    Address caller;
    Address target;
    std::string description;
    std::string evidence;
};

struct CastVoteCmd {
    Address caller;
    ProposalId proposalId{0};
    bool support{false};
    TokenAmount tokens{0};
};

struct ExecuteProposalCmd {
    Address caller;
    ProposalId proposalId{0};
};

/// Token allocation; journaled so that replay rebuilds balances
struct CreditTokensCmd {
    Address account;
    TokenAmount amount{0};
};

using LedgerCommand = std::variant<SubmitProposalCmd,
                                   CastVoteCmd,
                                   ExecuteProposalCmd,
                                   CreditTokensCmd>;

/// "submit", "vote", "execute" or "credit"
const char* CommandName(const LedgerCommand& cmd);

CommandTag GetCommandTag(const LedgerCommand& cmd);

// ============================================================================
// Validation and Encoding
// ============================================================================

/**
 * Stateless checks that do not need engine state: identities present,
 * target well-formed, description length, non-zero stake.
 * @return GovernanceError::OK if the command may be submitted
 */
GovernanceError ValidateCommand(const LedgerCommand& cmd);

/// Tag byte followed by the command fields
std::vector<uint8_t> SerializeCommand(const LedgerCommand& cmd);

/// Decode a journaled command. Unknown tags, truncation and trailing
/// bytes yield nullopt.
std::optional<LedgerCommand> DeserializeCommand(const std::vector<uint8_t>& data);

// ============================================================================
// Text Parsing
// ============================================================================

/// Split a command line on whitespace. Double quotes group words and
/// backslash escapes the next character. nullopt on an unterminated quote.
std::optional<std::vector<std::string>> TokenizeCommandLine(const std::string& line);

/**
 * Build a command from tokens:
 *
 *   submit <caller> <target> <description> [evidence]
 *   vote <caller> <proposalId> for|against <tokens>
 *   execute <caller> <proposalId>
 *   credit <address> <tokens>
 *
 * A target that is not a valid address yields InvalidTarget; any other
 * malformed input yields MalformedCommand.
 */
GovernanceResult<LedgerCommand> ParseLedgerCommand(const std::vector<std::string>& tokens);

/// Parse an unsigned decimal with no sign, spaces or trailing characters
std::optional<uint64_t> ParseUnsigned(const std::string& text);

} // namespace governance
} // namespace neuroshield

#endif // NEUROSHIELD_GOVERNANCE_COMMANDS_H
