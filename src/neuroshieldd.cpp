// NeuroShield - Daemon
// Copyright (c) 2024 NeuroShield Developers
// MIT License
//
// Command-line front end. Loads configuration, wires the node and executes
// governance commands and risk queries read from a script or stdin, one per
// line, printing one result line for each.

#include "neuroshield/governance/commands.h"
#include "neuroshield/node/context.h"
#include "neuroshield/util/config.h"
#include "neuroshield/util/logging.h"
#include "neuroshield/util/time.h"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace neuroshield {

namespace {

constexpr const char* VERSION = "0.1.0";
constexpr const char* LOG_FILENAME = "debug.log";

/// How long read commands wait for the mirror to catch up
constexpr std::chrono::milliseconds MIRROR_SYNC_TIMEOUT{1000};

void PrintUsage() {
    std::cout << "NeuroShield Daemon v" << VERSION << "\n\n"
              << "Usage: neuroshieldd [-conf=FILE] [-key=value ...] [SCRIPT]\n\n"
              << "Options:\n"
              << "  -conf=<file>            Configuration file (default: <datadir>/neuroshield.conf)\n"
              << "  -datadir=<dir>          Data directory\n"
              << "  -db=<leveldb|memory>    Journal backend\n"
              << "  -regtest                Regression-test mode (60s voting, mock clock)\n"
              << "  -votingperiod=<sec>     Voting window\n"
              << "  -mirrorstaleness=<sec>  Mirror staleness bound\n"
              << "  -mlfallback=<label>     Label assumed when ML is unavailable\n"
              << "  -fusionpolicy=<name>    additive or layered\n"
              << "  -allowlist=<address>    Always score address Safe (repeatable)\n"
              << "  -genesis=<addr:amount>  Initial token credit (repeatable)\n"
              << "  -loglevel=<level>       trace, debug, info, warn, error\n"
              << "  -printtoconsole=<0|1>   Log to console\n"
              << "  -logfile=<0|1>          Log to <datadir>/debug.log\n\n"
              << "Commands:\n"
              << "  submit <caller> <target> \"<description>\" [\"<evidence>\"]\n"
              << "  vote <caller> <proposalId> for|against <tokens>\n"
              << "  execute <caller> <proposalId>\n"
              << "  credit <address> <tokens>\n"
              << "  advance <seconds>\n"
              << "  proposal <id>\n"
              << "  score <address>\n"
              << "  voter <address>\n"
              << "  oracle <address>\n"
              << "  assess <to> <label|unavailable> <balance> <txcount> [allow]\n"
              << "  stats\n"
              << "  history <address>\n";
}

void SignalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        RequestShutdown();
    }
}

bool SetupLogging(const util::ConfigManager& config, const NodeInitOptions& options,
                  std::string& error) {
    auto& logger = util::Logger::Instance();
    logger.Initialize();

    // Clear default sinks added by Initialize() to prevent duplicates
    logger.ClearSinks();

    const std::string levelName = config.GetString(util::ConfigKeys::LOGLEVEL, "info");
    auto level = util::ParseLogLevel(levelName);
    if (!level) {
        error = "unknown -loglevel: " + levelName;
        return false;
    }
    logger.SetLevel(*level);

    if (config.GetBool(util::ConfigKeys::PRINTTOCONSOLE, true)) {
        util::ConsoleSink::Config consoleConfig;
        consoleConfig.level = *level;
        consoleConfig.useStderr = true;
        logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));
    }

    if (config.GetBool(util::ConfigKeys::LOGFILE, false)) {
        util::FileSink::Config fileConfig;
        fileConfig.path = (options.dataDir / LOG_FILENAME).string();
        fileConfig.level = util::LogLevel::Debug;
        auto fileSink = std::make_shared<util::FileSink>(fileConfig);
        if (!fileSink->IsOpen()) {
            error = "cannot open log file " + fileConfig.path;
            return false;
        }
        logger.AddSink(fileSink);
    }
    return true;
}

std::string FormatError(governance::GovernanceError error) {
    return std::string("error ") + governance::GovernanceErrorToString(error);
}

std::string FormatReceipt(const governance::LedgerCommand& cmd,
                          const ledger::CommandReceipt& receipt,
                          const NodeContext& node) {
    if (receipt.error != governance::GovernanceError::OK) {
        return FormatError(receipt.error);
    }
    if (!receipt.storage.ok()) {
        return "error StorageFailure " + receipt.storage.ToString();
    }

    std::ostringstream out;
    out << "ok ";
    if (std::holds_alternative<governance::SubmitProposalCmd>(cmd)) {
        auto proposal = node.engine->GetProposal(*receipt.proposalId);
        out << "proposal " << *receipt.proposalId
            << " deadline " << util::FormatISO8601(proposal.value->deadline);
    } else if (receipt.vote) {
        out << "vote proposal " << receipt.vote->proposalId
            << " " << (receipt.vote->support ? "for" : "against")
            << " power " << receipt.vote->power;
    } else if (receipt.settlement) {
        const auto& s = *receipt.settlement;
        out << "settled " << s.proposalId << " " << (s.passed ? "PASSED" : "REJECTED")
            << " score " << s.newScamScore
            << " voters " << s.affectedVoters.size()
            << " refunded " << s.TotalRefunded();
    } else if (const auto* credit = std::get_if<governance::CreditTokensCmd>(&cmd)) {
        out << "credit " << credit->account.ToString()
            << " balance " << node.vault->SpendableBalance(credit->account);
    }
    out << " seq " << receipt.sequence;
    return out.str();
}

std::string RunCommand(NodeContext& node, const std::vector<std::string>& tokens) {
    const std::string& verb = tokens[0];

    if (verb == "submit" || verb == "vote" || verb == "execute" || verb == "credit") {
        auto parsed = governance::ParseLedgerCommand(tokens);
        if (!parsed.ok()) {
            return FormatError(parsed.error);
        }
        auto receipt = node.ledger->Submit(*parsed.value);
        return FormatReceipt(*parsed.value, receipt, node);
    }

    if (verb == "advance") {
        if (!node.regtest || !util::IsMockTimeEnabled()) {
            return "error NotRegtest";
        }
        auto seconds = tokens.size() == 2 ? governance::ParseUnsigned(tokens[1]) : std::nullopt;
        if (!seconds) {
            return FormatError(governance::GovernanceError::MalformedCommand);
        }
        util::AdvanceMockTime(util::Seconds(static_cast<int64_t>(*seconds)));
        return "ok time " + util::FormatISO8601(util::GetTime());
    }

    if (verb == "proposal") {
        auto id = tokens.size() == 2 ? governance::ParseUnsigned(tokens[1]) : std::nullopt;
        if (!id) {
            return FormatError(governance::GovernanceError::MalformedCommand);
        }
        auto result = node.engine->GetProposal(*id);
        if (!result.ok()) {
            return FormatError(result.error);
        }
        const auto& p = *result.value;
        std::ostringstream out;
        out << "ok proposal " << p.id
            << " target " << p.target.ToString()
            << " status " << governance::ProposalStatusToString(p.StatusAt(util::GetTime()))
            << " for " << p.forPower
            << " against " << p.againstPower
            << " voters " << node.engine->GetProposalVoterCount(p.id)
            << " deadline " << util::FormatISO8601(p.deadline);
        return out.str();
    }

    if (verb == "stats" && tokens.size() == 1) {
        oracle::FirewallStats stats = node.riskService->GetStats();
        std::ostringstream out;
        out << "ok stats safe " << stats.safe
            << " suspicious " << stats.suspicious
            << " blocked " << stats.blocked
            << " total " << stats.Total();
        return out.str();
    }

    // Remaining commands take a single address, except assess
    if (tokens.size() < 2) {
        return FormatError(governance::GovernanceError::MalformedCommand);
    }
    auto address = Address::Parse(tokens[1]);
    if (!address) {
        return FormatError(governance::GovernanceError::InvalidTarget);
    }

    if (verb == "score" && tokens.size() == 2) {
        std::ostringstream out;
        out << "ok score " << address->ToString()
            << " " << node.engine->GetThreatScore(*address)
            << " confirmed " << (node.engine->IsConfirmedScam(*address) ? "true" : "false");
        return out.str();
    }

    if (verb == "voter" && tokens.size() == 2) {
        auto stats = node.engine->GetVoterStats(*address);
        std::ostringstream out;
        out << "ok voter " << address->ToString()
            << " accuracy " << stats.accuracy
            << " participation " << stats.participation;
        return out.str();
    }

    if (verb == "oracle" && tokens.size() == 2) {
        auto report = node.oracle->Query(*address);
        std::ostringstream out;
        out << "ok oracle " << report.address.ToString()
            << " " << report.riskLabel
            << " score " << report.threatScore
            << " confirmed " << (report.isConfirmedScam ? "true" : "false")
            << " confidence " << report.confidencePercent << "%"
            << " voters " << report.totalVoters;
        for (size_t i = 0; i < report.explanation.size(); ++i) {
            out << (i == 0 ? " | " : "; ") << report.explanation[i];
        }
        return out.str();
    }

    if (verb == "history" && tokens.size() == 2) {
        auto history = node.riskService->GetHistory(*address);
        std::ostringstream out;
        out << "ok history " << address->ToString() << " " << history.size();
        for (size_t i = 0; i < history.size(); ++i) {
            out << (i == 0 ? " | " : "; ") << history[i].ToString();
        }
        return out.str();
    }

    if (verb == "assess" && (tokens.size() == 5 || tokens.size() == 6)) {
        auto balance = governance::ParseUnsigned(tokens[3]);
        auto txCount = governance::ParseUnsigned(tokens[4]);
        bool allow = tokens.size() == 6 && tokens[5] == "allow";
        if (!balance || !txCount || (tokens.size() == 6 && !allow)) {
            return FormatError(governance::GovernanceError::MalformedCommand);
        }

        risk::MlSignal signal = risk::MlSignal::Unavailable("classifier unreachable");
        if (tokens[2] != "unavailable") {
            auto label = risk::ParseMlLabel(tokens[2]);
            if (!label) {
                return FormatError(governance::GovernanceError::MalformedCommand);
            }
            signal = risk::MlSignal::Label(*label);
        }

        oracle::TransferCandidate candidate;
        candidate.to = *address;
        candidate.recipientActivity.balance = *balance;
        candidate.recipientActivity.txCount = *txCount;
        candidate.allowListed = allow;

        // Give the mirror a moment to apply what this session just committed
        node.mirror->WaitForSequence(node.ledger->HeadEventSequence(), MIRROR_SYNC_TIMEOUT);

        auto assessment = node.riskService->AssessTransfer(candidate, signal);
        return "ok assess " + address->ToString() + " " + assessment.ToString();
    }

    return FormatError(governance::GovernanceError::MalformedCommand);
}

int RunScript(NodeContext& node, std::istream& input) {
    std::string line;
    while (!ShutdownRequested() && std::getline(input, line)) {
        auto tokens = governance::TokenizeCommandLine(line);
        if (!tokens) {
            std::cout << FormatError(governance::GovernanceError::MalformedCommand) << std::endl;
            continue;
        }
        if (tokens->empty() || (!(*tokens)[0].empty() && (*tokens)[0].front() == '#')) {
            continue;
        }
        std::cout << RunCommand(node, *tokens) << std::endl;

        if (node.ledger->IsHalted()) {
            LOG_ERROR(util::LogCategory::LEDGER) << "Ledger halted; stopping";
            return 1;
        }
    }
    return 0;
}

int AppMain(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "-help" || arg == "--help" || arg == "-?") {
            PrintUsage();
            return 0;
        }
    }

    util::ConfigManager config;
    auto parsed = config.ParseCommandLine(argc, argv);
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.ToString() << std::endl;
        return 1;
    }

    // Config file: explicit -conf must exist, the default one is optional
    std::string confPath = config.GetPath(util::ConfigKeys::CONF, "");
    bool explicitConf = !confPath.empty();
    if (!explicitConf) {
        std::filesystem::path dataDir =
            config.GetPath(util::ConfigKeys::DATADIR, util::ConfigManager::GetDefaultDataDir());
        confPath = (dataDir / util::DEFAULT_CONFIG_FILENAME).string();
    }
    if (explicitConf || std::filesystem::exists(confPath)) {
        util::ConfigManager fileConfig;
        auto fileResult = fileConfig.ParseFile(confPath);
        if (!fileResult.success) {
            std::cerr << "Error: " << fileResult.ToString() << std::endl;
            return 1;
        }
        // Command line wins over the file
        fileResult = fileConfig.ParseCommandLine(argc, argv);
        if (!fileResult.success) {
            std::cerr << "Error: " << fileResult.ToString() << std::endl;
            return 1;
        }
        config = std::move(fileConfig);
    }

    NodeInitOptions options;
    std::string error;
    if (!LoadNodeOptions(config, options, error)) {
        std::cerr << "Error: " << error << std::endl;
        return 1;
    }
    if (!SetupLogging(config, options, error)) {
        std::cerr << "Error: " << error << std::endl;
        return 1;
    }

    LOG_INFO(util::LogCategory::DEFAULT) << "NeuroShield Daemon v" << VERSION << " starting...";
    LOG_INFO(util::LogCategory::DEFAULT) << "Data directory: " << options.dataDir.string();

    if (options.regtest) {
        util::EnableMockTime();
        util::SetMockTime(util::GetTime());
    }

    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);

    NodeContext node;
    if (!InitializeNode(node, options)) {
        ShutdownNode(node);
        util::Logger::Instance().Shutdown();
        return 1;
    }

    int rc = 0;
    const auto& positional = config.GetPositionalArgs();
    if (!positional.empty()) {
        std::ifstream script(positional[0]);
        if (!script) {
            LOG_ERROR(util::LogCategory::DEFAULT) << "Cannot open script " << positional[0];
            rc = 1;
        } else {
            rc = RunScript(node, script);
        }
    } else {
        rc = RunScript(node, std::cin);
    }

    ShutdownNode(node);
    util::Logger::Instance().Shutdown();
    return rc;
}

} // anonymous namespace

} // namespace neuroshield

int main(int argc, char* argv[]) {
    try {
        return neuroshield::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
