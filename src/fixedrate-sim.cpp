// FIXEDRATE Simulator
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License
//
// Runs a fixed-rate vault against an in-memory token and yield venue.
// Supports:
// - Configuration from file and command line ([vault] and [sim] sections)
// - A line-oriented scenario script read from a file or stdin
// - Event tracing and a final state report
// - Saving the resulting vault snapshot under -datadir

#include "fixedrate/access/policy.h"
#include "fixedrate/core/errors.h"
#include "fixedrate/crypto/hash.h"
#include "fixedrate/db/vaultdb.h"
#include "fixedrate/sim/world.h"
#include "fixedrate/util/config.h"
#include "fixedrate/util/logging.h"
#include "fixedrate/util/time.h"
#include "fixedrate/vault/params.h"
#include "fixedrate/vault/vault.h"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace fixedrate {

// ============================================================================
// Constants
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* VAULT_DB_DIR = "vaults";

// ============================================================================
// Options
// ============================================================================

struct SimOptions {
    std::string configFile;
    std::string scriptPath;
    std::string dataDir;
    std::string logLevel{"warn"};
    std::string logFile;
    bool printEvents{false};
    bool strict{false};
    bool help{false};
    bool version{false};
    bool sampleConfig{false};
};

void PrintUsage() {
    std::cout << "FIXEDRATE Simulator v" << VERSION << "\n";
    std::cout << "\n";
    std::cout << "Usage: fixedrate-sim [options] [script]\n";
    std::cout << "\n";
    std::cout << "Reads the scenario from script, or stdin when omitted.\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  -conf=<file>        Configuration file (default: " << util::DEFAULT_CONFIG_FILENAME
              << " if present)\n";
    std::cout << "  -datadir=<dir>      Save the final vault snapshot under <dir>\n";
    std::cout << "  -loglevel=<level>   trace, debug, info, warn, error, off (default: warn)\n";
    std::cout << "  -logfile=<file>     Also write the log to <file>\n";
    std::cout << "  -events             Print every committed vault event\n";
    std::cout << "  -strict             Stop at the first failed command\n";
    std::cout << "  -vault.<key>=<v>    Override a [vault] setting\n";
    std::cout << "  -sim.<key>=<v>      Override a [sim] setting\n";
    std::cout << "  -sampleconfig       Print a sample configuration file\n";
    std::cout << "  -help               Show this help message\n";
    std::cout << "  -version            Show version\n";
    std::cout << "\n";
    std::cout << "Script commands (amounts are integers, durations take s/m/h/d):\n";
    std::cout << "  init [caller]                       Initialize the vault\n";
    std::cout << "  mint <account> <amount>             Give account tokens\n";
    std::cout << "  deposit <account> <amount>          Approve and deposit\n";
    std::cout << "  withdraw <account> <amount>         Withdraw to account\n";
    std::cout << "  harvest [caller]                    Run a harvest\n";
    std::cout << "  claim [caller]                      Claim protocol profit\n";
    std::cout << "  accrue <amount>                     Venue earns yield\n";
    std::cout << "  loss <amount>                       Venue loses assets\n";
    std::cout << "  shortpay <bps>                      Venue pays out less on redemption\n";
    std::cout << "  advance <duration>                  Move the clock forward\n";
    std::cout << "  set-withdrawal-delay <dur> [caller]\n";
    std::cout << "  set-harvest-delay <dur> [caller]\n";
    std::cout << "  set-fixed-rate <rate> [caller]\n";
    std::cout << "  grant <account> <operation>         Let account call a privileged operation\n";
    std::cout << "  revoke <account> <operation>\n";
    std::cout << "  show [account]                      Print vault or account state\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  fixedrate-sim -vault.fixedrate=3170979198 scenario.txt\n";
    std::cout << "  echo 'init' | fixedrate-sim -events\n";
    std::cout << "\n";
}

void PrintVersion() {
    std::cout << "FIXEDRATE Simulator v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 FIXEDRATE Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Configuration
// ============================================================================

/// Parse the command line into config (overriding file values) and opts
bool LoadConfiguration(int argc, char* argv[], util::ConfigManager& config, SimOptions& opts) {
    using namespace util::ConfigKeys;

    // First pass only to find -conf
    util::ConfigManager cmdline;
    std::vector<std::string> positional;
    auto result = cmdline.ParseCommandLine(argc, argv, &positional);
    if (!result.success) {
        std::cerr << "Error: " << result.errorMessage << "\n";
        return false;
    }

    opts.help = cmdline.GetBool("help", false) || cmdline.GetBool("h", false);
    opts.version = cmdline.GetBool("version", false);
    opts.sampleConfig = cmdline.GetBool("sampleconfig", false);

    std::string confPath = cmdline.GetPath(CONF, "");
    if (!confPath.empty()) {
        result = config.ParseFile(confPath);
        if (!result.success) {
            std::cerr << "Error reading " << confPath << ":" << result.errorLine << ": "
                      << result.errorMessage << "\n";
            return false;
        }
        opts.configFile = confPath;
    } else if (fs::exists(util::DEFAULT_CONFIG_FILENAME)) {
        result = config.ParseFile(util::DEFAULT_CONFIG_FILENAME);
        if (!result.success) {
            std::cerr << "Error reading " << util::DEFAULT_CONFIG_FILENAME << ":"
                      << result.errorLine << ": " << result.errorMessage << "\n";
            return false;
        }
        opts.configFile = util::DEFAULT_CONFIG_FILENAME;
    }

    // Second pass so the command line wins
    result = config.ParseCommandLine(argc, argv);
    if (!result.success) {
        std::cerr << "Error: " << result.errorMessage << "\n";
        return false;
    }

    opts.dataDir = config.GetPath(DATADIR, "");
    opts.logLevel = config.GetString(LOGLEVEL, opts.logLevel);
    opts.logFile = config.GetPath(LOGFILE, "");
    opts.printEvents = config.GetBool("events", false);
    opts.strict = config.GetBool("strict", false);
    if (!positional.empty()) {
        opts.scriptPath = positional.front();
    }
    return true;
}

void SetupLogging(const SimOptions& opts) {
    auto& logger = util::Logger::Instance();
    logger.ClearSinks();

    util::LogLevel level = util::LogLevelFromString(opts.logLevel);
    logger.SetLevel(level);

    util::ConsoleSink::Config consoleConfig;
    consoleConfig.level = level;
    consoleConfig.showTimestamp = false;
    logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));

    if (!opts.logFile.empty()) {
        util::FileSink::Config fileConfig;
        fileConfig.path = opts.logFile;
        fileConfig.level = util::LogLevel::Debug;
        auto fileSink = std::make_shared<util::FileSink>(fileConfig);
        if (!fileSink->IsOpen()) {
            std::cerr << "Warning: cannot open log file " << opts.logFile << "\n";
        } else {
            logger.AddSink(fileSink);
            if (level > util::LogLevel::Debug) {
                logger.SetLevel(util::LogLevel::Debug);
            }
        }
    }
}

// ============================================================================
// Simulation
// ============================================================================

/**
 * The world, the policy and the vault, plus names for the accounts the
 * script mentions.
 */
class Simulation {
public:
    Simulation(const util::ConfigManager& config, const vault::VaultParams& params)
        : world_(config.GetString(util::ConfigKeys::ASSET, "USDC", util::ConfigKeys::SIM_SECTION),
                 config.GetString(util::ConfigKeys::VENUE, "venue", util::ConfigKeys::SIM_SECTION),
                 config.GetInt(util::ConfigKeys::STARTTIME, sim::SimulationWorld::DEFAULT_START_TIME,
                               util::ConfigKeys::SIM_SECTION)),
          ownerName_(config.GetString(util::ConfigKeys::OWNER, "owner", util::ConfigKeys::SIM_SECTION)),
          policy_(Account(ownerName_)),
          vault_(world_.Token(), world_.Venue(), policy_, world_) {
        names_[vault_.Id()] = "vault";
        vault::ApplyVaultParams(vault_, policy_.Owner(), params);
    }

    vault::FixedRateVault& Vault() { return vault_; }
    sim::SimulationWorld& World() { return world_; }

    /// Id of a named account, remembering the name for reports
    AccountId Account(const std::string& name) {
        AccountId id = DeriveAccountId(name);
        names_.emplace(id, name);
        return id;
    }

    std::string NameOf(const AccountId& id) const {
        auto it = names_.find(id);
        return it == names_.end() ? ShortId(id) : it->second;
    }

    /// Execute one script line. Throws on any failure.
    void Run(const std::vector<std::string>& args);

    void PrintReport(std::ostream& out) const;

private:
    AccountId CallerArg(const std::vector<std::string>& args, size_t index) {
        return args.size() > index ? Account(args[index]) : policy_.Owner();
    }

    sim::SimulationWorld world_;
    std::map<AccountId, std::string> names_;
    std::string ownerName_;
    access::AccessPolicy policy_;
    vault::FixedRateVault vault_;
};

namespace {

uint64_t ParseAmount(const std::string& str) {
    if (str.empty() || str.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("not an amount: " + str);
    }
    try {
        return std::stoull(str);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("amount out of range: " + str);
    }
}

Seconds ParseDelay(const std::string& str) {
    auto seconds = util::ParseDuration(str);
    if (!seconds || *seconds < 0) {
        throw std::invalid_argument("not a duration: " + str);
    }
    return static_cast<Seconds>(*seconds);
}

void RequireArgs(const std::vector<std::string>& args, size_t count, const char* usage) {
    if (args.size() < count) {
        throw std::invalid_argument(std::string("usage: ") + usage);
    }
}

Operation ParseOperationArg(const std::string& str) {
    auto op = ParseOperation(str);
    if (!op) {
        throw std::invalid_argument("unknown operation: " + str);
    }
    return *op;
}

} // namespace

void Simulation::Run(const std::vector<std::string>& args) {
    const std::string& cmd = args[0];

    if (cmd == "init") {
        vault_.Initialize(CallerArg(args, 1));
    } else if (cmd == "mint") {
        RequireArgs(args, 3, "mint <account> <amount>");
        world_.Token().Mint(Account(args[1]), ParseAmount(args[2]));
    } else if (cmd == "deposit") {
        RequireArgs(args, 3, "deposit <account> <amount>");
        AccountId who = Account(args[1]);
        Amount amount = ParseAmount(args[2]);
        if (!world_.Token().Approve(who, vault_.Id(), amount)) {
            throw TransferFailedError("approve of " + args[2] + " by " + args[1] + " failed");
        }
        ShareAmount shares = vault_.Deposit(who, amount);
        std::cout << args[1] << " deposited " << amount << " for " << shares << " shares\n";
    } else if (cmd == "withdraw") {
        RequireArgs(args, 3, "withdraw <account> <amount>");
        Amount paid = vault_.Withdraw(Account(args[1]), ParseAmount(args[2]));
        std::cout << args[1] << " withdrew " << paid << "\n";
    } else if (cmd == "harvest") {
        vault::HarvestReport report = vault_.Harvest(CallerArg(args, 1));
        std::cout << "harvest: profit " << report.realProfit << ", expected "
                  << report.expectedProfit << ", fee shares " << report.feeShares;
        if (report.loss > 0) {
            std::cout << ", loss " << report.loss;
        }
        std::cout << "\n";
    } else if (cmd == "claim") {
        Amount paid = vault_.ClaimProfit(CallerArg(args, 1));
        std::cout << "claimed " << paid << "\n";
    } else if (cmd == "accrue") {
        RequireArgs(args, 2, "accrue <amount>");
        world_.Venue().Accrue(ParseAmount(args[1]));
    } else if (cmd == "loss") {
        RequireArgs(args, 2, "loss <amount>");
        world_.Venue().Loss(ParseAmount(args[1]));
    } else if (cmd == "shortpay") {
        RequireArgs(args, 2, "shortpay <bps>");
        world_.Venue().SetShortPayBps(ParseAmount(args[1]));
    } else if (cmd == "advance") {
        RequireArgs(args, 2, "advance <duration>");
        world_.Advance(ParseDelay(args[1]));
    } else if (cmd == "set-withdrawal-delay") {
        RequireArgs(args, 2, "set-withdrawal-delay <duration> [caller]");
        vault_.SetWithdrawalDelay(CallerArg(args, 2), ParseDelay(args[1]));
    } else if (cmd == "set-harvest-delay") {
        RequireArgs(args, 2, "set-harvest-delay <duration> [caller]");
        bool immediate = vault_.SetHarvestDelay(CallerArg(args, 2), ParseDelay(args[1]));
        if (!immediate) {
            std::cout << "harvest delay staged until the next harvest\n";
        }
    } else if (cmd == "set-fixed-rate") {
        RequireArgs(args, 2, "set-fixed-rate <rate> [caller]");
        vault_.SetFixedRate(CallerArg(args, 2), ParseAmount(args[1]));
    } else if (cmd == "grant") {
        RequireArgs(args, 3, "grant <account> <operation>");
        policy_.Grant(Account(args[1]), ParseOperationArg(args[2]));
    } else if (cmd == "revoke") {
        RequireArgs(args, 3, "revoke <account> <operation>");
        policy_.Revoke(Account(args[1]), ParseOperationArg(args[2]));
    } else if (cmd == "show") {
        if (args.size() > 1) {
            AccountId who = Account(args[1]);
            std::cout << args[1] << ": shares " << vault_.BalanceOf(who)
                      << ", underlying " << vault_.BalanceOfUnderlying(who)
                      << ", tokens " << world_.Token().BalanceOf(who)
                      << ", withdrawable at " << util::FormatISO8601(vault_.WithdrawableAt(who))
                      << "\n";
        } else {
            PrintReport(std::cout);
        }
    } else {
        throw std::invalid_argument("unknown command: " + cmd);
    }
}

void Simulation::PrintReport(std::ostream& out) const {
    const vault::FixedRateVault& v = vault_;

    out << std::string(60, '=') << "\n";
    out << "Vault " << v.Id().ToHex() << "\n";
    out << std::string(60, '=') << "\n";
    out << std::left;
    out << std::setw(24) << "Time:" << util::FormatISO8601(world_.Now()) << "\n";
    out << std::setw(24) << "Initialized:" << (v.IsInitialized() ? "yes" : "no") << "\n";
    if (v.IsInitialized()) {
        out << std::setw(24) << "Total shares:" << v.TotalShares() << "\n";
    }
    out << std::setw(24) << "Total holdings:" << v.TotalHoldings() << "\n";
    out << std::setw(24) << "  float:" << v.TotalFloat() << "\n";
    out << std::setw(24) << "  delegated:" << v.TotalDelegatedHoldings() << "\n";
    out << std::setw(24) << "Venue value:" << v.GetVenueBalanceOfUnderlying() << "\n";
    out << std::setw(24) << "Fixed rate (per s):" << v.FixedRatePerSecond() << "\n";
    out << std::setw(24) << "Withdrawal delay:"
        << util::FormatDuration(static_cast<int64_t>(v.WithdrawalDelay())) << "\n";
    out << std::setw(24) << "Harvest delay:"
        << util::FormatDuration(static_cast<int64_t>(v.HarvestDelay()));
    if (v.PendingHarvestDelay() != 0) {
        out << " (pending "
            << util::FormatDuration(static_cast<int64_t>(v.PendingHarvestDelay())) << ")";
    }
    out << "\n";
    if (v.IsInitialized()) {
        out << std::setw(24) << "Last harvest:" << util::FormatISO8601(v.LastHarvest()) << "\n";
        out << std::setw(24) << "Next harvest:" << util::FormatISO8601(v.NextHarvestTime()) << "\n";
    }

    if (v.Ledger().AccountCount() > 0) {
        out << std::string(60, '-') << "\n";
        out << std::setw(16) << "Account" << std::setw(22) << "Shares" << "Underlying\n";
        for (const auto& [account, record] : v.Ledger().Accounts()) {
            out << std::setw(16) << NameOf(account) << std::setw(22) << record.shares
                << v.BalanceOfUnderlying(account) << "\n";
        }
    }
    out << std::string(60, '=') << "\n";
}

// ============================================================================
// Script
// ============================================================================

std::vector<std::string> Tokenize(const std::string& line) {
    std::vector<std::string> args;
    std::istringstream iss(line.substr(0, line.find('#')));
    std::string word;
    while (iss >> word) {
        args.push_back(word);
    }
    return args;
}

/// Run every line of in; returns the number of failed commands
int RunScript(Simulation& sim, std::istream& in, const std::string& source, bool strict) {
    int failures = 0;
    int lineNum = 0;
    std::string line;

    while (std::getline(in, line)) {
        ++lineNum;
        auto args = Tokenize(line);
        if (args.empty()) {
            continue;
        }

        try {
            sim.Run(args);
        } catch (const VaultError& e) {
            ++failures;
            std::cout << source << ":" << lineNum << ": " << args[0] << " failed: "
                      << VaultErrorCodeToString(e.Code()) << ": " << e.what() << "\n";
        } catch (const std::invalid_argument& e) {
            ++failures;
            std::cout << source << ":" << lineNum << ": " << e.what() << "\n";
        }

        if (failures > 0 && strict) {
            break;
        }
    }

    return failures;
}

// ============================================================================
// Main
// ============================================================================

int AppMain(int argc, char* argv[]) {
    util::ConfigManager config;
    SimOptions opts;

    if (!LoadConfiguration(argc, argv, config, opts)) {
        return 1;
    }
    if (opts.version) {
        PrintVersion();
        return 0;
    }
    if (opts.help) {
        PrintUsage();
        return 0;
    }
    if (opts.sampleConfig) {
        std::cout << util::ConfigManager::GenerateSampleConfig();
        return 0;
    }

    SetupLogging(opts);
    if (!opts.configFile.empty()) {
        LOG_INFO(util::LogCategory::SIM) << "using configuration " << opts.configFile;
    }

    vault::VaultParams params;
    try {
        params = vault::LoadVaultParams(config);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    LOG_INFO(util::LogCategory::SIM) << "vault params: " << params.ToString();

    Simulation sim(config, params);

    for (const auto& grant : config.GetList(util::ConfigKeys::MINT, util::ConfigKeys::SIM_SECTION)) {
        auto colon = grant.find(':');
        if (colon == std::string::npos) {
            std::cerr << "Error: [sim] mint entry must be account:amount, got " << grant << "\n";
            return 1;
        }
        try {
            sim.World().Token().Mint(sim.Account(grant.substr(0, colon)),
                                     ParseAmount(grant.substr(colon + 1)));
        } catch (const std::invalid_argument& e) {
            std::cerr << "Error: [sim] mint " << grant << ": " << e.what() << "\n";
            return 1;
        }
    }

    if (opts.printEvents) {
        sim.Vault().Events().Subscribe([](const vault::VaultEvent& event) {
            std::cout << "  event: " << event.ToString() << "\n";
        });
    }

    int failures = 0;
    if (opts.scriptPath.empty()) {
        failures = RunScript(sim, std::cin, "<stdin>", opts.strict);
    } else {
        std::ifstream script(opts.scriptPath);
        if (!script) {
            std::cerr << "Error: cannot open script " << opts.scriptPath << "\n";
            return 1;
        }
        failures = RunScript(sim, script, opts.scriptPath, opts.strict);
    }

    sim.PrintReport(std::cout);

    if (!opts.dataDir.empty()) {
        db::VaultStore store(fs::path(opts.dataDir) / VAULT_DB_DIR);
        db::Status s = store.Save(sim.Vault().ExportSnapshot());
        if (!s.ok()) {
            std::cerr << "Error: saving snapshot: " << s.ToString() << "\n";
            return 1;
        }
        std::cout << "Snapshot saved to " << opts.dataDir << "\n";
    }

    util::Logger::Instance().Flush();

    if (failures > 0) {
        std::cout << failures << " command(s) failed\n";
    }
    return (opts.strict && failures > 0) ? 1 : 0;
}

} // namespace fixedrate

int main(int argc, char* argv[]) {
    try {
        return fixedrate::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
