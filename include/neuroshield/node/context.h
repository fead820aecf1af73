// NeuroShield - Node Context
// Copyright (c) 2024 NeuroShield Developers
// MIT License
//
// This file defines the NodeContext structure that owns every service of
// the NeuroShield daemon for the lifetime of the process.

#ifndef NEUROSHIELD_NODE_CONTEXT_H
#define NEUROSHIELD_NODE_CONTEXT_H

#include "neuroshield/core/address.h"
#include "neuroshield/db/database.h"
#include "neuroshield/governance/escrow.h"
#include "neuroshield/governance/governance.h"
#include "neuroshield/ledger/ledger.h"
#include "neuroshield/mirror/ledger_mirror.h"
#include "neuroshield/oracle/threat_oracle.h"
#include "neuroshield/risk/classifier.h"
#include "neuroshield/risk/risk_fusion.h"
#include "neuroshield/trust/trust_registry.h"
#include "neuroshield/util/config.h"

#include <atomic>
#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace neuroshield {

// ============================================================================
// Node Initialization Options
// ============================================================================

/**
 * Options for node initialization.
 * Populated from the config file and command line.
 */
struct NodeInitOptions {
    /// Data directory path
    std::filesystem::path dataDir;

    /// Keep the journal in memory instead of LevelDB
    bool memoryDb{false};

    /// Regression-test mode (short voting window, mock clock allowed)
    bool regtest{false};

    /// Voting window in seconds
    int64_t votingPeriod{governance::DEFAULT_VOTING_PERIOD};

    /// Mirror staleness bound in seconds
    int64_t mirrorStaleness{mirror::DEFAULT_STALENESS_BOUND};

    /// Label assumed when the classifier is unreachable
    risk::MlLabel mlFallback{risk::MlLabel::Suspicious};

    /// "additive" or "layered"
    std::string fusionPolicy{"additive"};

    /// Recipients always scored Safe
    std::set<Address> allowlist;

    /// Token credits applied to an empty ledger
    std::vector<std::pair<Address, TokenAmount>> genesis;
};

/**
 * Read node options from configuration.
 * @param[out] error Description of the first invalid value
 * @return false if any value is invalid
 */
bool LoadNodeOptions(const util::ConfigManager& config, NodeInitOptions& options,
                     std::string& error);

// ============================================================================
// Node Context - Holds all node state
// ============================================================================

/**
 * NodeContext owns the subsystems of a running node. Members are declared
 * in dependency order so that destruction tears down consumers first.
 */
struct NodeContext {
    // ========================================================================
    // Governance State
    // ========================================================================

    std::unique_ptr<trust::TrustRegistry> registry;
    std::unique_ptr<governance::TokenVault> vault;
    std::unique_ptr<governance::GovernanceEngine> engine;

    // ========================================================================
    // Ledger
    // ========================================================================

    /// Journal store
    std::unique_ptr<db::Database> database;

    /// Event stream from the ledger to the mirror
    std::shared_ptr<ledger::EventChannel> events;

    std::unique_ptr<ledger::Ledger> ledger;

    // ========================================================================
    // Read Side
    // ========================================================================

    std::unique_ptr<mirror::LedgerMirror> mirror;
    std::unique_ptr<risk::RiskFusionEngine> fusion;

    /// Optional ML collaborator, may be nullptr
    std::unique_ptr<risk::FraudClassifier> classifier;

    std::unique_ptr<oracle::ThreatOracle> oracle;
    std::unique_ptr<oracle::RiskService> riskService;

    // ========================================================================
    // State
    // ========================================================================

    std::atomic<bool> initialized{false};
    bool regtest{false};
    std::filesystem::path dataDir;

    NodeContext() = default;
    ~NodeContext() = default;

    NodeContext(const NodeContext&) = delete;
    NodeContext& operator=(const NodeContext&) = delete;

    /// Check if node is ready for operations
    bool IsReady() const {
        return initialized.load() && ledger != nullptr;
    }
};

// ============================================================================
// Node Initialization Functions
// ============================================================================

/**
 * Initialize the node with all subsystems.
 *
 * This function:
 * 1. Opens the journal store (LevelDB under dataDir, or memory)
 * 2. Builds the trust registry, token vault and governance engine
 * 3. Starts the ledger mirror on the event channel
 * 4. Replays the journal
 * 5. Applies genesis credits if the journal is empty
 * 6. Builds the fusion engine, oracle and risk service
 *
 * @param node The node context to initialize
 * @param options Initialization options
 * @return true if initialization succeeded
 */
bool InitializeNode(NodeContext& node, const NodeInitOptions& options);

/**
 * Shutdown the node: stop the mirror, close the event stream and release
 * subsystems in reverse order.
 */
void ShutdownNode(NodeContext& node);

/// Request a graceful shutdown. Thread-safe.
void RequestShutdown();

/// Whether shutdown has been requested
bool ShutdownRequested();

} // namespace neuroshield

#endif // NEUROSHIELD_NODE_CONTEXT_H
