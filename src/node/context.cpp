// NeuroShield - Node Context Implementation
// Copyright (c) 2024 NeuroShield Developers
// MIT License

#include "neuroshield/node/context.h"

#include "neuroshield/governance/commands.h"
#include "neuroshield/util/logging.h"

namespace neuroshield {

namespace {

bool ReadPositiveInt(const util::ConfigManager& config, const char* key, int64_t& value,
                     bool allowZero, std::string& error) {
    if (!config.HasKey(key)) {
        return true;
    }
    auto parsed = config.TryGetInt(key);
    if (!parsed || *parsed < 0 || (!allowZero && *parsed == 0)) {
        error = std::string("invalid value for -") + key + ": " + config.GetString(key, "");
        return false;
    }
    value = *parsed;
    return true;
}

} // anonymous namespace

// ============================================================================
// LoadNodeOptions
// ============================================================================

bool LoadNodeOptions(const util::ConfigManager& config, NodeInitOptions& options,
                     std::string& error) {
    using namespace util::ConfigKeys;

    options.dataDir = config.GetPath(DATADIR, util::ConfigManager::GetDefaultDataDir());

    const std::string backend = config.GetString(DB, "leveldb");
    if (backend == "memory") {
        options.memoryDb = true;
    } else if (backend != "leveldb") {
        error = "unknown -db backend: " + backend;
        return false;
    }

    options.regtest = config.GetBool(REGTEST, false);
    options.votingPeriod = options.regtest ? governance::REGTEST_VOTING_PERIOD
                                           : governance::DEFAULT_VOTING_PERIOD;
    if (!ReadPositiveInt(config, VOTINGPERIOD, options.votingPeriod, false, error) ||
        !ReadPositiveInt(config, MIRRORSTALENESS, options.mirrorStaleness, true, error)) {
        return false;
    }

    const std::string fallback = config.GetString(MLFALLBACK, "Suspicious");
    auto label = risk::ParseMlLabel(fallback);
    if (!label) {
        error = "unknown -mlfallback label: " + fallback;
        return false;
    }
    options.mlFallback = *label;

    options.fusionPolicy = config.GetString(FUSIONPOLICY, "additive");
    if (!risk::MakeFusionPolicy(options.fusionPolicy)) {
        error = "unknown -fusionpolicy: " + options.fusionPolicy;
        return false;
    }

    for (const auto& entry : config.GetList(ALLOWLIST)) {
        auto address = Address::Parse(entry);
        if (!address) {
            error = "invalid -allowlist address: " + entry;
            return false;
        }
        options.allowlist.insert(*address);
    }

    for (const auto& entry : config.GetList(GENESIS)) {
        size_t colon = entry.find(':');
        std::optional<Address> address;
        std::optional<uint64_t> amount;
        if (colon != std::string::npos) {
            address = Address::Parse(entry.substr(0, colon));
            amount = governance::ParseUnsigned(entry.substr(colon + 1));
        }
        if (!address || !amount || *amount == 0 || !TokenRange(*amount)) {
            error = "invalid -genesis entry (expected address:amount): " + entry;
            return false;
        }
        options.genesis.emplace_back(*address, *amount);
    }

    return true;
}

// ============================================================================
// InitializeNode - Main initialization function
// ============================================================================

bool InitializeNode(NodeContext& node, const NodeInitOptions& options) {
    LOG_INFO(util::LogCategory::DEFAULT) << "Initializing node...";

    node.dataDir = options.dataDir;
    node.regtest = options.regtest;

    // ========================================================================
    // Step 1: Open the journal store
    // ========================================================================

    if (options.memoryDb) {
        node.database = db::OpenMemoryDatabase();
        LOG_INFO(util::LogCategory::DB) << "Using in-memory journal";
    } else {
        const auto journalDir = node.dataDir / "journal";
        auto [status, database] = db::OpenDatabase(journalDir);
        if (!status.ok()) {
            LOG_ERROR(util::LogCategory::DB) << "Failed to open journal at "
                                             << journalDir.string() << ": " << status.ToString();
            return false;
        }
        node.database = std::move(database);
        LOG_INFO(util::LogCategory::DB) << "Journal directory: " << journalDir.string();
    }

    // ========================================================================
    // Step 2: Governance state
    // ========================================================================

    governance::GovernanceConfig govConfig;
    govConfig.votingPeriod = options.votingPeriod;

    node.registry = std::make_unique<trust::TrustRegistry>();
    node.vault = std::make_unique<governance::TokenVault>();
    node.engine = std::make_unique<governance::GovernanceEngine>(govConfig, *node.registry,
                                                                 *node.vault);

    LOG_INFO(util::LogCategory::GOVERNANCE) << "Voting period: " << options.votingPeriod << "s";

    // ========================================================================
    // Step 3: Ledger and mirror. The mirror subscribes before replay so it
    // sees the replayed history.
    // ========================================================================

    node.events = std::make_shared<ledger::EventChannel>();
    node.ledger = std::make_unique<ledger::Ledger>(*node.database, *node.engine, *node.vault);
    node.ledger->Subscribe(node.events);

    mirror::MirrorConfig mirrorConfig;
    mirrorConfig.stalenessBound = options.mirrorStaleness;
    node.mirror = std::make_unique<mirror::LedgerMirror>(mirrorConfig);
    node.mirror->Start(node.events);

    // ========================================================================
    // Step 4: Replay
    // ========================================================================

    db::Status status = node.ledger->Open();
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::LEDGER) << "Failed to open ledger: " << status.ToString();
        return false;
    }

    // ========================================================================
    // Step 5: Genesis allocation
    // ========================================================================

    if (node.ledger->HeadSequence() == 0) {
        for (const auto& [account, amount] : options.genesis) {
            auto receipt = node.ledger->Submit(governance::CreditTokensCmd{account, amount});
            if (!receipt.ok()) {
                LOG_ERROR(util::LogCategory::LEDGER)
                    << "Genesis credit to " << account.ToString() << " failed: "
                    << governance::GovernanceErrorToString(receipt.error) << " "
                    << receipt.storage.ToString();
                return false;
            }
        }
        if (!options.genesis.empty()) {
            LOG_INFO(util::LogCategory::LEDGER) << "Applied " << options.genesis.size()
                                                << " genesis credit(s)";
        }
    }

    // ========================================================================
    // Step 6: Read side
    // ========================================================================

    node.fusion = std::make_unique<risk::RiskFusionEngine>(
        risk::MakeFusionPolicy(options.fusionPolicy), options.mlFallback);
    node.oracle = std::make_unique<oracle::ThreatOracle>(*node.engine);
    node.riskService = std::make_unique<oracle::RiskService>(
        *node.engine, *node.mirror, *node.ledger, *node.fusion, node.classifier.get(),
        options.allowlist);

    LOG_INFO(util::LogCategory::RISK) << "Fusion policy: " << node.fusion->GetPolicy().Name()
                                      << ", ML fallback: "
                                      << risk::MlLabelToString(options.mlFallback);

    node.initialized.store(true);
    LOG_INFO(util::LogCategory::DEFAULT) << "Node initialized";
    return true;
}

// ============================================================================
// ShutdownNode - Clean shutdown
// ============================================================================

void ShutdownNode(NodeContext& node) {
    LOG_INFO(util::LogCategory::DEFAULT) << "Shutting down node...";

    node.initialized.store(false);

    node.riskService.reset();
    node.oracle.reset();
    node.fusion.reset();

    if (node.mirror) {
        node.mirror->Stop();
    }
    if (node.events) {
        node.events->Close();
    }
    node.mirror.reset();

    node.ledger.reset();
    node.events.reset();
    node.database.reset();

    node.engine.reset();
    node.vault.reset();
    node.registry.reset();

    LOG_INFO(util::LogCategory::DEFAULT) << "Shutdown complete";
}

// ============================================================================
// Shutdown Control
// ============================================================================

static std::atomic<bool> g_shutdownRequested{false};

void RequestShutdown() {
    g_shutdownRequested.store(true);
}

bool ShutdownRequested() {
    return g_shutdownRequested.load();
}

} // namespace neuroshield
