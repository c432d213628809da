// STELLEND CLI - Command Line Interface
// Copyright (c) 2024 STELLEND Developers
// MIT License
//
// The stellend-cli tool opens a protocol data directory and runs one
// governance, oracle or flash-loan operation against it.

#include "stellend/node/context.h"
#include "stellend/util/config.h"
#include "stellend/util/logging.h"
#include "stellend/util/time.h"

#include <cstdlib>
#include <filesystem>
#include <functional>
#include <getopt.h>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stellend {
namespace cli {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "STELLEND CLI";

// ============================================================================
// CLI Configuration
// ============================================================================

struct CLIConfig {
    // Paths
    std::string dataDir;
    std::string configFile;

    // Runtime
    std::optional<Timestamp> fixedTime;
    std::string logLevel;
    bool isolateFailures{false};

    // Command
    std::string method;
    std::vector<std::string> args;

    // Flags
    bool showHelp{false};
    bool showVersion{false};
};

// ============================================================================
// Help
// ============================================================================

void PrintVersion() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n";
}

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: stellend-cli [options] <command> [params]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  -v, --version              Show version information\n";
    std::cout << "  -c, --conf=FILE            Config file path\n";
    std::cout << "  -d, --datadir=DIR          Data directory path\n";
    std::cout << "  --time=SECONDS             Run with a fixed ledger time\n";
    std::cout << "  --loglevel=LEVEL           trace, debug, info, warn, error\n";
    std::cout << "  --isolate-failures         Skip failing price sources\n";
    std::cout << "\nAdmin:\n";
    std::cout << "  init-admin <admin>\n";
    std::cout << "\nGovernance:\n";
    std::cout << "  propose <proposer> <title> <voting_period>\n";
    std::cout << "  vote <id> <voter> <for|against> <weight>\n";
    std::cout << "  queue <id>\n";
    std::cout << "  execute <id>\n";
    std::cout << "  delegate <from> <to>\n";
    std::cout << "  get-delegate <from>\n";
    std::cout << "  get-proposal <id>\n";
    std::cout << "  get-receipt <id> <voter>\n";
    std::cout << "  proposal-count\n";
    std::cout << "  proposal-state <id>\n";
    std::cout << "  set-quorum <caller> <bps>\n";
    std::cout << "  set-timelock <caller> <seconds>\n";
    std::cout << "\nOracle:\n";
    std::cout << "  set-source <caller> <asset> <source> <weight> [heartbeat]\n";
    std::cout << "  remove-source <caller> <asset> <source>\n";
    std::cout << "  get-sources <asset>\n";
    std::cout << "  fetch-prices <asset>\n";
    std::cout << "  aggregate-price <asset>\n";
    std::cout << "  set-heartbeat-ttl <caller> <seconds>\n";
    std::cout << "  set-mode <caller> <0|1>\n";
    std::cout << "  oracle-info\n";
    std::cout << "\nFlash loans:\n";
    std::cout << "  flash-loan <initiator> <asset> <amount> [fee_bps]\n";
    std::cout << "  set-flash-fee <caller> <bps>\n";
    std::cout << "\nAddresses are 64 hex characters. Price feeds are read from the\n";
    std::cout << "[prices] section of the config file: <source>=<price>\n";
    std::cout << "\n";
}

// ============================================================================
// Command Line Parsing
// ============================================================================

bool ParseCommandLine(int argc, char* argv[], CLIConfig& config) {
    static struct option longOptions[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'v'},
        {"conf", required_argument, nullptr, 'c'},
        {"datadir", required_argument, nullptr, 'd'},
        {"time", required_argument, nullptr, 1001},
        {"loglevel", required_argument, nullptr, 1002},
        {"isolate-failures", no_argument, nullptr, 1003},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int optionIndex = 0;

    // Reset getopt
    optind = 1;

    // '+' stops at the command, so negative numbers after it stay arguments
    while ((opt = getopt_long(argc, argv, "+hvc:d:", longOptions, &optionIndex)) != -1) {
        switch (opt) {
            case 'h':
                config.showHelp = true;
                return true;
            case 'v':
                config.showVersion = true;
                return true;
            case 'c':
                config.configFile = optarg;
                break;
            case 'd':
                config.dataDir = optarg;
                break;
            case 1001:  // --time
                config.fixedTime = static_cast<Timestamp>(std::stoull(optarg));
                break;
            case 1002:  // --loglevel
                config.logLevel = optarg;
                break;
            case 1003:  // --isolate-failures
                config.isolateFailures = true;
                break;
            case '?':
            default:
                return false;
        }
    }

    // Remaining arguments are command and params
    for (int i = optind; i < argc; ++i) {
        if (config.method.empty()) {
            config.method = argv[i];
        } else {
            config.args.push_back(argv[i]);
        }
    }

    return true;
}

/// Load the config file; an explicit --conf must exist, the default may not
bool LoadConfigFile(const CLIConfig& cli, util::ConfigManager& config) {
    std::string path = cli.configFile;
    bool required = !path.empty();
    if (!required) {
        std::string dataDir = cli.dataDir.empty()
            ? util::ConfigManager::GetDefaultDataDir()
            : cli.dataDir;
        path = dataDir + "/" + util::DEFAULT_CONFIG_FILENAME;
        if (!std::filesystem::exists(path)) {
            return true;
        }
    }

    auto result = config.ParseFile(path);
    if (!result.success) {
        std::cerr << "Error reading config file " << path << ": " << result.errorMessage;
        if (result.errorLine > 0) {
            std::cerr << " (line " << result.errorLine << ")";
        }
        std::cerr << "\n";
        return false;
    }
    return true;
}

/// Register a fixed price feed for each [prices] entry
bool LoadPriceFeeds(const util::ConfigManager& config, oracle::PriceSourceRegistry& registry) {
    const char* section = util::ConfigKeys::SECTION_PRICES;
    for (const auto& key : config.GetKeys(section)) {
        auto price = config.TryGetInt(key, section);
        if (!price) {
            std::cerr << "Error: invalid price for source " << key << "\n";
            return false;
        }
        registry.Register(Address::FromHex(key),
                          std::make_shared<oracle::FixedPriceSource>(*price));
    }
    return true;
}

// ============================================================================
// Argument Helpers
// ============================================================================

Address ParseAddress(const std::string& str) {
    return Address::FromHex(str);
}

int64_t ParseInt(const std::string& str) {
    size_t pos = 0;
    int64_t value = std::stoll(str, &pos);
    if (pos != str.size()) {
        throw std::invalid_argument("not an integer: " + str);
    }
    return value;
}

uint64_t ParseUInt(const std::string& str) {
    int64_t value = ParseInt(str);
    if (value < 0) {
        throw std::invalid_argument("must not be negative: " + str);
    }
    return static_cast<uint64_t>(value);
}

bool ParseSupport(const std::string& str) {
    if (str == "for" || str == "yes" || str == "true" || str == "1") {
        return true;
    }
    if (str == "against" || str == "no" || str == "false" || str == "0") {
        return false;
    }
    throw std::invalid_argument("expected for or against: " + str);
}

std::string FormatTime(Timestamp t) {
    if (t == 0) {
        return "0";
    }
    return std::to_string(t) + " (" +
           util::FormatISO8601(util::FromUnixTime(static_cast<int64_t>(t))) + ")";
}

void PrintProposal(const governance::Proposal& p, Timestamp now) {
    std::cout << "id:            " << p.id << "\n";
    std::cout << "title:         " << p.title << "\n";
    std::cout << "proposer:      " << p.proposer.ToHex() << "\n";
    std::cout << "created:       " << FormatTime(p.created) << "\n";
    std::cout << "voting_ends:   " << FormatTime(p.votingEnds) << "\n";
    std::cout << "queued_until:  " << FormatTime(p.queuedUntil) << "\n";
    std::cout << "for_votes:     " << p.forVotes << "\n";
    std::cout << "against_votes: " << p.againstVotes << "\n";
    std::cout << "executed:      " << (p.executed ? "true" : "false") << "\n";
    std::cout << "state:         "
              << governance::ProposalStateToString(p.GetState(now)) << "\n";
}

/// Flash-loan receiver that accepts every loan
class AcceptingReceiver : public flashloan::FlashLoanReceiver {
public:
    Status OnFlashLoan(const Address& asset, Amount amount, Amount fee,
                       const Address& initiator) override {
        std::cout << "receiver: got " << amount << " of " << asset.ToShortString()
                  << " for " << initiator.ToShortString() << ", fee " << fee << "\n";
        return Status::Ok();
    }
};

// ============================================================================
// Commands
// ============================================================================

using Args = std::vector<std::string>;

struct Command {
    size_t minArgs;
    size_t maxArgs;
    std::function<Status(ProtocolContext&, const Args&)> run;
};

std::map<std::string, Command> BuildCommands() {
    std::map<std::string, Command> commands;

    commands["init-admin"] = {1, 1, [](ProtocolContext& ctx, const Args& a) {
        storage::Invocation inv(*ctx.kv);
        Status s = ctx.admin->InitializeAdmin(ParseAddress(a[0]));
        s = inv.Finish(s);
        if (s.ok()) {
            std::cout << "admin: " << a[0] << "\n";
        }
        return s;
    }};

    // Governance

    commands["propose"] = {3, 3, [](ProtocolContext& ctx, const Args& a) {
        governance::Proposal p;
        Status s = ctx.governance->Propose(ParseAddress(a[0]), a[1], ParseUInt(a[2]), &p);
        if (s.ok()) {
            PrintProposal(p, ctx.clock->Now());
        }
        return s;
    }};

    commands["vote"] = {4, 4, [](ProtocolContext& ctx, const Args& a) {
        governance::Proposal p;
        Status s = ctx.governance->Vote(ParseUInt(a[0]), ParseAddress(a[1]),
                                        ParseSupport(a[2]), ParseInt(a[3]), &p);
        if (s.ok()) {
            PrintProposal(p, ctx.clock->Now());
        }
        return s;
    }};

    commands["queue"] = {1, 1, [](ProtocolContext& ctx, const Args& a) {
        governance::Proposal p;
        Status s = ctx.governance->Queue(ParseUInt(a[0]), &p);
        if (s.ok()) {
            PrintProposal(p, ctx.clock->Now());
        }
        return s;
    }};

    commands["execute"] = {1, 1, [](ProtocolContext& ctx, const Args& a) {
        governance::Proposal p;
        Status s = ctx.governance->Execute(ParseUInt(a[0]), &p);
        if (s.ok()) {
            PrintProposal(p, ctx.clock->Now());
        }
        return s;
    }};

    commands["delegate"] = {2, 2, [](ProtocolContext& ctx, const Args& a) {
        return ctx.governance->Delegate(ParseAddress(a[0]), ParseAddress(a[1]));
    }};

    commands["get-delegate"] = {1, 1, [](ProtocolContext& ctx, const Args& a) {
        std::optional<Address> to;
        Status s = ctx.governance->GetDelegate(ParseAddress(a[0]), &to);
        if (s.ok()) {
            std::cout << (to ? to->ToHex() : "none") << "\n";
        }
        return s;
    }};

    commands["get-proposal"] = {1, 1, [](ProtocolContext& ctx, const Args& a) {
        governance::Proposal p;
        Status s = ctx.governance->GetProposal(ParseUInt(a[0]), &p);
        if (s.ok()) {
            PrintProposal(p, ctx.clock->Now());
        }
        return s;
    }};

    commands["get-receipt"] = {2, 2, [](ProtocolContext& ctx, const Args& a) {
        std::optional<governance::VoteReceipt> receipt;
        Status s = ctx.governance->GetReceipt(ParseUInt(a[0]), ParseAddress(a[1]), &receipt);
        if (s.ok()) {
            if (receipt) {
                std::cout << "voter:   " << receipt->voter.ToHex() << "\n";
                std::cout << "support: " << (receipt->support ? "for" : "against") << "\n";
                std::cout << "weight:  " << receipt->weight << "\n";
            } else {
                std::cout << "none\n";
            }
        }
        return s;
    }};

    commands["proposal-count"] = {0, 0, [](ProtocolContext& ctx, const Args&) {
        uint64_t count = 0;
        Status s = ctx.governance->GetProposalCount(&count);
        if (s.ok()) {
            std::cout << count << "\n";
        }
        return s;
    }};

    commands["proposal-state"] = {1, 1, [](ProtocolContext& ctx, const Args& a) {
        governance::ProposalState state;
        Status s = ctx.governance->GetProposalState(ParseUInt(a[0]), &state);
        if (s.ok()) {
            std::cout << governance::ProposalStateToString(state) << "\n";
        }
        return s;
    }};

    commands["set-quorum"] = {2, 2, [](ProtocolContext& ctx, const Args& a) {
        return ctx.governance->SetQuorumBps(ParseAddress(a[0]), ParseInt(a[1]));
    }};

    commands["set-timelock"] = {2, 2, [](ProtocolContext& ctx, const Args& a) {
        return ctx.governance->SetTimelock(ParseAddress(a[0]), ParseUInt(a[1]));
    }};

    // Oracle

    commands["set-source"] = {4, 5, [](ProtocolContext& ctx, const Args& a) {
        Timestamp heartbeat = a.size() > 4 ? ParseUInt(a[4]) : ctx.clock->Now();
        oracle::OracleSource source(ParseAddress(a[2]), ParseInt(a[3]), heartbeat);
        return ctx.oracle->SetSource(ParseAddress(a[0]), ParseAddress(a[1]), source);
    }};

    commands["remove-source"] = {3, 3, [](ProtocolContext& ctx, const Args& a) {
        return ctx.oracle->RemoveSource(ParseAddress(a[0]), ParseAddress(a[1]),
                                        ParseAddress(a[2]));
    }};

    commands["get-sources"] = {1, 1, [](ProtocolContext& ctx, const Args& a) {
        std::vector<oracle::OracleSource> sources;
        Status s = ctx.oracle->GetSources(ParseAddress(a[0]), &sources);
        if (s.ok()) {
            for (const auto& src : sources) {
                std::cout << src.address.ToHex() << " weight=" << src.weight
                          << " heartbeat=" << FormatTime(src.lastHeartbeat) << "\n";
            }
        }
        return s;
    }};

    commands["fetch-prices"] = {1, 1, [](ProtocolContext& ctx, const Args& a) {
        std::vector<Amount> prices;
        Status s = ctx.oracle->FetchPrices(ParseAddress(a[0]), &prices);
        if (s.ok()) {
            for (Amount price : prices) {
                std::cout << price << "\n";
            }
        }
        return s;
    }};

    commands["aggregate-price"] = {1, 1, [](ProtocolContext& ctx, const Args& a) {
        std::optional<Amount> price;
        Status s = ctx.oracle->AggregatePrice(ParseAddress(a[0]), &price);
        if (s.ok()) {
            std::cout << (price ? std::to_string(*price) : "none") << "\n";
        }
        return s;
    }};

    commands["set-heartbeat-ttl"] = {2, 2, [](ProtocolContext& ctx, const Args& a) {
        return ctx.oracle->SetHeartbeatTtl(ParseAddress(a[0]), ParseUInt(a[1]));
    }};

    commands["set-mode"] = {2, 2, [](ProtocolContext& ctx, const Args& a) {
        return ctx.oracle->SetMode(ParseAddress(a[0]), ParseInt(a[1]));
    }};

    commands["oracle-info"] = {0, 0, [](ProtocolContext& ctx, const Args&) {
        uint64_t ttl = 0;
        oracle::AggregationMode mode;
        int64_t perf = 0;
        Status s = ctx.oracle->GetHeartbeatTtl(&ttl);
        if (s.ok()) s = ctx.oracle->GetMode(&mode);
        if (s.ok()) s = ctx.oracle->GetPerformanceCount(&perf);
        if (s.ok()) {
            std::cout << "heartbeat_ttl:  " << util::FormatDuration(util::Seconds(ttl)) << "\n";
            std::cout << "mode:           " << oracle::AggregationModeToString(mode) << "\n";
            std::cout << "failure_policy: "
                      << oracle::FailurePolicyToString(ctx.oracle->GetFailurePolicy()) << "\n";
            std::cout << "aggregations:   " << perf << "\n";
        }
        return s;
    }};

    // Flash loans

    commands["flash-loan"] = {3, 4, [](ProtocolContext& ctx, const Args& a) {
        AcceptingReceiver receiver;
        if (a.size() > 3) {
            return ctx.flashLoans->Execute(ParseAddress(a[0]), ParseAddress(a[1]),
                                           ParseInt(a[2]), ParseInt(a[3]), receiver);
        }
        return ctx.flashLoans->Execute(ParseAddress(a[0]), ParseAddress(a[1]),
                                       ParseInt(a[2]), receiver);
    }};

    commands["set-flash-fee"] = {2, 2, [](ProtocolContext& ctx, const Args& a) {
        return ctx.flashLoans->SetFeeBps(ParseAddress(a[0]), ParseInt(a[1]));
    }};

    return commands;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int AppMain(int argc, char* argv[]) {
    CLIConfig cli;

    if (!ParseCommandLine(argc, argv, cli)) {
        std::cerr << "Error parsing command line. Use --help for usage.\n";
        return 1;
    }

    if (cli.showHelp) {
        PrintHelp();
        return 0;
    }

    if (cli.showVersion) {
        PrintVersion();
        return 0;
    }

    if (cli.method.empty()) {
        std::cerr << "Error: No command specified.\n";
        std::cerr << "Use 'stellend-cli --help' for usage information.\n";
        return 1;
    }

    auto commands = BuildCommands();
    auto it = commands.find(cli.method);
    if (it == commands.end()) {
        std::cerr << "Error: Unknown command '" << cli.method << "'\n";
        return 1;
    }
    const Command& command = it->second;
    if (cli.args.size() < command.minArgs || cli.args.size() > command.maxArgs) {
        std::cerr << "Error: Wrong number of parameters for '" << cli.method << "'\n";
        return 1;
    }

    util::ConfigManager config;
    if (!LoadConfigFile(cli, config)) {
        return 1;
    }

    // Logging goes to stderr so command output stays clean
    util::Logger& logger = util::Logger::Instance();
    std::string level = cli.logLevel.empty()
        ? config.GetString(util::ConfigKeys::LOGLEVEL, "warn")
        : cli.logLevel;
    logger.SetLevel(util::LogLevelFromString(level));
    if (config.GetBool(util::ConfigKeys::PRINTTOCONSOLE, true)) {
        util::ConsoleSink::Config sinkConfig;
        sinkConfig.level = util::LogLevel::Trace;
        logger.AddSink(std::make_shared<util::ConsoleSink>(sinkConfig));
    }
    std::string logFile = config.GetPath(util::ConfigKeys::LOGFILE, "");
    if (!logFile.empty()) {
        logger.AddSink(std::make_shared<util::FileSink>(logFile));
    }

    ProtocolOptions options = ProtocolOptions::FromConfig(config);
    if (!cli.dataDir.empty()) {
        options.dataDir = util::ConfigManager::ExpandTilde(cli.dataDir);
    }
    options.fixedTime = cli.fixedTime;
    if (cli.isolateFailures) {
        options.isolateFailures = true;
    }

    ProtocolContext ctx;
    if (!InitializeProtocol(ctx, options)) {
        std::cerr << "Error: cannot open protocol state in " << options.dataDir.string() << "\n";
        return 1;
    }

    if (!LoadPriceFeeds(config, *ctx.priceSources)) {
        ShutdownProtocol(ctx);
        return 1;
    }

    Status s = command.run(ctx, cli.args);
    ShutdownProtocol(ctx);
    logger.Flush();

    if (!s.ok()) {
        std::cerr << "Error: " << s.ToString() << "\n";
        return 2;
    }
    return 0;
}

} // namespace cli
} // namespace stellend

int main(int argc, char* argv[]) {
    try {
        return stellend::cli::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
