// STELLEND - Protocol Context
// Copyright (c) 2024 STELLEND Developers
// MIT License
//
// This file defines the ProtocolContext structure that owns the protocol
// database and every subsystem built on it.

#ifndef STELLEND_NODE_CONTEXT_H
#define STELLEND_NODE_CONTEXT_H

#include "stellend/db/database.h"
#include "stellend/flashloan/flashloan.h"
#include "stellend/governance/governance.h"
#include "stellend/governance/store.h"
#include "stellend/oracle/oracle.h"
#include "stellend/oracle/store.h"
#include "stellend/protocol/admin.h"
#include "stellend/protocol/clock.h"
#include "stellend/protocol/events.h"
#include "stellend/protocol/reentrancy.h"
#include "stellend/storage/kvstore.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace stellend {

namespace util {
class ConfigManager;
}

// ============================================================================
// Protocol Options
// ============================================================================

/**
 * Options for protocol initialization.
 * Populated from the config file and command line.
 */
struct ProtocolOptions {
    /// Data directory path; the state database lives in <dataDir>/state
    std::filesystem::path dataDir;

    /// Keep state in memory only (dataDir is ignored)
    bool inMemory{false};

    /// Database block cache size in MB
    int dbCacheMB{8};

    /// Fixed ledger time; the system clock is used when unset
    std::optional<Timestamp> fixedTime;

    /// Record events in memory instead of logging them
    bool recordEvents{false};

    /// Governance parameters seeded on first start
    int64_t quorumBps{governance::DEFAULT_QUORUM_BPS};
    uint64_t timelock{governance::DEFAULT_TIMELOCK};

    /// Oracle parameters seeded on first start
    uint64_t heartbeatTtl{oracle::DEFAULT_HEARTBEAT_TTL};
    int64_t mode{static_cast<int64_t>(oracle::AggregationMode::MedianTrim)};

    /// Skip failing price sources instead of failing the fetch
    bool isolateFailures{false};

    /// Flash-loan fee seeded on first start
    int64_t flashFeeBps{flashloan::DEFAULT_FLASH_FEE_BPS};

    /// Build options from a parsed configuration
    static ProtocolOptions FromConfig(const util::ConfigManager& config);

    /// Check value ranges; on failure error names the offending option
    bool Validate(std::string* error) const;
};

// ============================================================================
// Protocol Context - Holds all protocol state
// ============================================================================

/**
 * ProtocolContext owns the components of an open protocol instance:
 * - State database and its KV store
 * - Clock, admin gate, event sink and reentrancy guards
 * - Governance, oracle and flash-loan subsystems
 *
 * Members are declared in dependency order, so destruction tears down the
 * engines before the stores and the database.
 */
struct ProtocolContext {
    // ========================================================================
    // Storage
    // ========================================================================

    std::unique_ptr<db::Database> database;
    std::unique_ptr<storage::KVStore> kv;

    // ========================================================================
    // Capabilities
    // ========================================================================

    std::unique_ptr<protocol::Clock> clock;

    /// Set when the context runs on a fixed clock
    protocol::ManualClock* manualClock{nullptr};

    std::unique_ptr<protocol::StoredAdminGate> admin;
    std::unique_ptr<protocol::EventSink> events;

    /// Set when events are recorded in memory
    protocol::RecordingEventSink* recordedEvents{nullptr};

    /// Held while a flash-loan receiver runs
    protocol::ReentrancyGuard flashLoanGuard;

    /// Held while the oracle calls price sources
    protocol::ReentrancyGuard oracleGuard;

    /// Price feeds the oracle can call, by source address
    std::unique_ptr<oracle::PriceSourceRegistry> priceSources;

    // ========================================================================
    // Subsystems
    // ========================================================================

    std::unique_ptr<governance::GovernanceStore> govStore;
    std::unique_ptr<governance::GovernanceEngine> governance;

    std::unique_ptr<oracle::OracleStore> oracleStore;
    std::unique_ptr<oracle::OracleAggregator> oracle;

    std::unique_ptr<flashloan::FlashLoanExecutor> flashLoans;

    // ========================================================================
    // State
    // ========================================================================

    std::filesystem::path dataDir;
    bool initialized{false};

    ProtocolContext() = default;
    ~ProtocolContext() = default;

    ProtocolContext(const ProtocolContext&) = delete;
    ProtocolContext& operator=(const ProtocolContext&) = delete;

    bool IsReady() const { return initialized && governance && oracle; }
};

// ============================================================================
// Initialization Functions
// ============================================================================

/**
 * Open the state database and build every subsystem.
 *
 * Parameters from options are written only when the database does not
 * hold them yet, so an existing deployment keeps its governed values.
 *
 * @return true if initialization succeeded
 */
bool InitializeProtocol(ProtocolContext& ctx, const ProtocolOptions& options);

/// Tear down every subsystem and close the database
void ShutdownProtocol(ProtocolContext& ctx);

} // namespace stellend

#endif // STELLEND_NODE_CONTEXT_H
