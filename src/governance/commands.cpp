// NeuroShield - Ledger Commands Implementation
// Copyright (c) 2024 NeuroShield Developers
// MIT License

#include "neuroshield/governance/commands.h"

#include "neuroshield/core/serialize.h"

#include <cctype>
#include <ios>
#include <limits>

namespace neuroshield {
namespace governance {

namespace {

template<typename... Ts>
struct Overloaded : Ts... { using Ts::operator()...; };
template<typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

void WriteCommand(DataStream& s, const SubmitProposalCmd& cmd) {
    s << cmd.caller << cmd.target << cmd.description << cmd.evidence;
}

void WriteCommand(DataStream& s, const CastVoteCmd& cmd) {
    s << cmd.caller << cmd.proposalId << cmd.support << cmd.tokens;
}

void WriteCommand(DataStream& s, const ExecuteProposalCmd& cmd) {
    s << cmd.caller << cmd.proposalId;
}

void WriteCommand(DataStream& s, const CreditTokensCmd& cmd) {
    s << cmd.account << cmd.amount;
}

} // anonymous namespace

// ============================================================================
// Command Names
// ============================================================================

const char* CommandName(const LedgerCommand& cmd) {
    return std::visit(Overloaded{
        [](const SubmitProposalCmd&) { return "submit"; },
        [](const CastVoteCmd&) { return "vote"; },
        [](const ExecuteProposalCmd&) { return "execute"; },
        [](const CreditTokensCmd&) { return "credit"; },
    }, cmd);
}

CommandTag GetCommandTag(const LedgerCommand& cmd) {
    return std::visit(Overloaded{
        [](const SubmitProposalCmd&) { return CommandTag::SubmitProposal; },
        [](const CastVoteCmd&) { return CommandTag::CastVote; },
        [](const ExecuteProposalCmd&) { return CommandTag::ExecuteProposal; },
        [](const CreditTokensCmd&) { return CommandTag::CreditTokens; },
    }, cmd);
}

// ============================================================================
// Validation
// ============================================================================

GovernanceError ValidateCommand(const LedgerCommand& cmd) {
    return std::visit(Overloaded{
        [](const SubmitProposalCmd& c) {
            if (c.caller.IsNull()) return GovernanceError::Unauthenticated;
            if (c.target.IsNull()) return GovernanceError::InvalidTarget;
            if (c.description.empty() || c.description.size() > MAX_DESCRIPTION_LENGTH ||
                c.evidence.size() > MAX_EVIDENCE_LENGTH) {
                return GovernanceError::InvalidDescription;
            }
            return GovernanceError::OK;
        },
        [](const CastVoteCmd& c) {
            // Stake checks depend on proposal state and the bank, so the engine owns them
            if (c.caller.IsNull()) return GovernanceError::Unauthenticated;
            return GovernanceError::OK;
        },
        [](const ExecuteProposalCmd& c) {
            if (c.caller.IsNull()) return GovernanceError::Unauthenticated;
            return GovernanceError::OK;
        },
        [](const CreditTokensCmd& c) {
            if (c.account.IsNull()) return GovernanceError::InvalidTarget;
            if (c.amount == 0 || !TokenRange(c.amount)) return GovernanceError::MalformedCommand;
            return GovernanceError::OK;
        },
    }, cmd);
}

// ============================================================================
// Encoding
// ============================================================================

std::vector<uint8_t> SerializeCommand(const LedgerCommand& cmd) {
    DataStream s;
    s << static_cast<uint8_t>(GetCommandTag(cmd));
    std::visit([&s](const auto& c) { WriteCommand(s, c); }, cmd);
    return s.Data();
}

std::optional<LedgerCommand> DeserializeCommand(const std::vector<uint8_t>& data) {
    try {
        DataStream s(data);
        uint8_t tag = 0;
        s >> tag;

        LedgerCommand cmd;
        switch (static_cast<CommandTag>(tag)) {
            case CommandTag::SubmitProposal: {
                SubmitProposalCmd c;
                s >> c.caller >> c.target >> c.description >> c.evidence;
                cmd = std::move(c);
                break;
            }
            case CommandTag::CastVote: {
                CastVoteCmd c;
                s >> c.caller >> c.proposalId >> c.support >> c.tokens;
                cmd = c;
                break;
            }
            case CommandTag::ExecuteProposal: {
                ExecuteProposalCmd c;
                s >> c.caller >> c.proposalId;
                cmd = c;
                break;
            }
            case CommandTag::CreditTokens: {
                CreditTokensCmd c;
                s >> c.account >> c.amount;
                cmd = c;
                break;
            }
            default:
                return std::nullopt;
        }

        if (!s.empty()) {
            return std::nullopt;
        }
        return cmd;
    } catch (const std::ios_base::failure&) {
        return std::nullopt;
    }
}

// ============================================================================
// Text Parsing
// ============================================================================

std::optional<std::vector<std::string>> TokenizeCommandLine(const std::string& line) {
    std::vector<std::string> tokens;
    std::string current;
    bool inToken = false;
    bool inQuotes = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];

        if (c == '\\' && i + 1 < line.size()) {
            current.push_back(line[++i]);
            inToken = true;
        } else if (c == '"') {
            inQuotes = !inQuotes;
            inToken = true;
        } else if (!inQuotes && std::isspace(static_cast<unsigned char>(c))) {
            if (inToken) {
                tokens.push_back(std::move(current));
                current.clear();
                inToken = false;
            }
        } else {
            current.push_back(c);
            inToken = true;
        }
    }

    if (inQuotes) {
        return std::nullopt;
    }
    if (inToken) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

std::optional<uint64_t> ParseUnsigned(const std::string& text) {
    if (text.empty() || text.size() > 20) {
        return std::nullopt;
    }

    uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
    }
    return value;
}

GovernanceResult<LedgerCommand> ParseLedgerCommand(const std::vector<std::string>& tokens) {
    using Result = GovernanceResult<LedgerCommand>;

    if (tokens.empty()) {
        return Result::Failure(GovernanceError::MalformedCommand);
    }

    const std::string& verb = tokens[0];

    if (verb == "submit") {
        if (tokens.size() != 4 && tokens.size() != 5) {
            return Result::Failure(GovernanceError::MalformedCommand);
        }
        auto caller = Address::Parse(tokens[1]);
        if (!caller) {
            return Result::Failure(GovernanceError::MalformedCommand);
        }
        auto target = Address::Parse(tokens[2]);
        if (!target) {
            return Result::Failure(GovernanceError::InvalidTarget);
        }
        SubmitProposalCmd cmd;
        cmd.caller = *caller;
        cmd.target = *target;
        cmd.description = tokens[3];
        if (tokens.size() == 5) {
            cmd.evidence = tokens[4];
        }
        return Result::Success(std::move(cmd));
    }

    if (verb == "vote") {
        if (tokens.size() != 5) {
            return Result::Failure(GovernanceError::MalformedCommand);
        }
        auto caller = Address::Parse(tokens[1]);
        auto id = ParseUnsigned(tokens[2]);
        auto amount = ParseUnsigned(tokens[4]);
        const std::string& side = tokens[3];
        if (!caller || !id || !amount || (side != "for" && side != "against")) {
            return Result::Failure(GovernanceError::MalformedCommand);
        }
        CastVoteCmd cmd;
        cmd.caller = *caller;
        cmd.proposalId = *id;
        cmd.support = (side == "for");
        cmd.tokens = *amount;
        return Result::Success(cmd);
    }

    if (verb == "execute") {
        if (tokens.size() != 3) {
            return Result::Failure(GovernanceError::MalformedCommand);
        }
        auto caller = Address::Parse(tokens[1]);
        auto id = ParseUnsigned(tokens[2]);
        if (!caller || !id) {
            return Result::Failure(GovernanceError::MalformedCommand);
        }
        return Result::Success(ExecuteProposalCmd{*caller, *id});
    }

    if (verb == "credit") {
        if (tokens.size() != 3) {
            return Result::Failure(GovernanceError::MalformedCommand);
        }
        auto account = Address::Parse(tokens[1]);
        auto amount = ParseUnsigned(tokens[2]);
        if (!account || !amount) {
            return Result::Failure(GovernanceError::MalformedCommand);
        }
        return Result::Success(CreditTokensCmd{*account, *amount});
    }

    return Result::Failure(GovernanceError::MalformedCommand);
}

} // namespace governance
} // namespace neuroshield
