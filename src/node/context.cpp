// STELLEND - Protocol Context Implementation
// Copyright (c) 2024 STELLEND Developers
// MIT License

#include "stellend/node/context.h"
#include "stellend/util/config.h"
#include "stellend/util/logging.h"

namespace stellend {

// ============================================================================
// Protocol Options
// ============================================================================

ProtocolOptions ProtocolOptions::FromConfig(const util::ConfigManager& config) {
    namespace Keys = util::ConfigKeys;

    ProtocolOptions options;
    options.dataDir = config.GetPath(Keys::DATADIR, util::ConfigManager::GetDefaultDataDir());

    options.quorumBps = config.GetInt(Keys::QUORUM_BPS, options.quorumBps,
                                      Keys::SECTION_GOVERNANCE);
    options.timelock = config.GetUInt(Keys::TIMELOCK, options.timelock,
                                      Keys::SECTION_GOVERNANCE);

    options.heartbeatTtl = config.GetUInt(Keys::HEARTBEAT_TTL, options.heartbeatTtl,
                                          Keys::SECTION_ORACLE);
    options.mode = config.GetInt(Keys::MODE, options.mode, Keys::SECTION_ORACLE);
    options.isolateFailures = config.GetBool(Keys::ISOLATE_FAILURES, options.isolateFailures,
                                             Keys::SECTION_ORACLE);

    options.flashFeeBps = config.GetInt(Keys::FEE_BPS, options.flashFeeBps,
                                        Keys::SECTION_FLASHLOAN);
    return options;
}

bool ProtocolOptions::Validate(std::string* error) const {
    if (quorumBps < 0 || quorumBps > governance::MAX_QUORUM_BPS) {
        *error = "quorum_bps must be within 0..10000";
        return false;
    }
    if (!oracle::IsValidAggregationMode(mode)) {
        *error = "mode must be 0 (median) or 1 (mean)";
        return false;
    }
    if (flashFeeBps < 0 || flashFeeBps > BPS_DENOMINATOR) {
        *error = "fee_bps must be within 0..10000";
        return false;
    }
    if (!inMemory && dataDir.empty()) {
        *error = "datadir is required";
        return false;
    }
    return true;
}

// ============================================================================
// Initialization
// ============================================================================

namespace {

Status SeedParameters(ProtocolContext& ctx, const ProtocolOptions& options) {
    storage::Invocation inv(*ctx.kv);

    Status s = ctx.govStore->SeedParameters(options.quorumBps, options.timelock);
    if (!s.ok()) {
        return inv.Finish(s);
    }
    s = ctx.oracleStore->SeedParameters(options.heartbeatTtl, options.mode);
    if (!s.ok()) {
        return inv.Finish(s);
    }
    s = ctx.flashLoans->SeedFeeBps(options.flashFeeBps);
    if (!s.ok()) {
        return inv.Finish(s);
    }
    return inv.Commit();
}

} // namespace

bool InitializeProtocol(ProtocolContext& ctx, const ProtocolOptions& options) {
    if (ctx.initialized) {
        LOG_WARN(util::LogCategory::DEFAULT) << "Protocol already initialized";
        return false;
    }

    std::string error;
    if (!options.Validate(&error)) {
        LOG_ERROR(util::LogCategory::CONFIG) << "Invalid options: " << error;
        return false;
    }

    // Storage
    if (options.inMemory) {
        ctx.database = db::OpenMemoryDatabase();
        LOG_DEBUG(util::LogCategory::DB) << "Using in-memory state";
    } else {
        ctx.dataDir = options.dataDir;
        db::Options dbOptions;
        dbOptions.block_cache_size = static_cast<size_t>(options.dbCacheMB) * 1024 * 1024;

        auto [status, database] = db::OpenDatabase(options.dataDir / "state", dbOptions);
        if (!status.ok()) {
            LOG_ERROR(util::LogCategory::DB) << "Cannot open state database: "
                                             << status.ToString();
            return false;
        }
        ctx.database = std::move(database);
    }
    ctx.kv = std::make_unique<storage::KVStore>(*ctx.database);

    // Capabilities
    if (options.fixedTime) {
        auto manual = std::make_unique<protocol::ManualClock>(*options.fixedTime);
        ctx.manualClock = manual.get();
        ctx.clock = std::move(manual);
    } else {
        ctx.clock = std::make_unique<protocol::SystemClock>();
    }

    ctx.admin = std::make_unique<protocol::StoredAdminGate>(*ctx.kv);

    if (options.recordEvents) {
        auto recording = std::make_unique<protocol::RecordingEventSink>();
        ctx.recordedEvents = recording.get();
        ctx.events = std::move(recording);
    } else {
        ctx.events = std::make_unique<protocol::LoggingEventSink>();
    }

    ctx.priceSources = std::make_unique<oracle::PriceSourceRegistry>();

    // Subsystems
    ctx.govStore = std::make_unique<governance::GovernanceStore>(*ctx.kv);
    ctx.governance = std::make_unique<governance::GovernanceEngine>(
        *ctx.govStore, *ctx.clock, *ctx.admin);

    ctx.oracleStore = std::make_unique<oracle::OracleStore>(*ctx.kv);
    ctx.oracle = std::make_unique<oracle::OracleAggregator>(
        *ctx.oracleStore, *ctx.clock, *ctx.admin, *ctx.priceSources, ctx.oracleGuard,
        options.isolateFailures ? oracle::FailurePolicy::Skip : oracle::FailurePolicy::Abort);

    ctx.flashLoans = std::make_unique<flashloan::FlashLoanExecutor>(
        *ctx.kv, *ctx.admin, ctx.flashLoanGuard, *ctx.events);

    Status s = SeedParameters(ctx, options);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DEFAULT) << "Cannot seed parameters: " << s.ToString();
        ShutdownProtocol(ctx);
        return false;
    }

    ctx.initialized = true;
    LOG_INFO(util::LogCategory::DEFAULT) << "Protocol initialized"
                                         << (options.inMemory ? " (in-memory)" : "")
                                         << ", failure policy "
                                         << oracle::FailurePolicyToString(
                                                ctx.oracle->GetFailurePolicy());
    return true;
}

void ShutdownProtocol(ProtocolContext& ctx) {
    ctx.initialized = false;

    ctx.flashLoans.reset();
    ctx.oracle.reset();
    ctx.oracleStore.reset();
    ctx.governance.reset();
    ctx.govStore.reset();

    ctx.priceSources.reset();
    ctx.recordedEvents = nullptr;
    ctx.events.reset();
    ctx.admin.reset();
    ctx.manualClock = nullptr;
    ctx.clock.reset();

    ctx.kv.reset();
    ctx.database.reset();
}

} // namespace stellend
