// STAKELEDGER CLI - Command Line Interface
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License
//
// stakeledger-cli opens (or creates) a staking ledger in a data directory and
// runs a single command against it as the identity given by -caller.

#include "stakeledger/core/types.h"
#include "stakeledger/ledger/ledger.h"
#include "stakeledger/ledger/ledgerdb.h"
#include "stakeledger/ledger/params.h"
#include "stakeledger/ledger/token.h"
#include "stakeledger/util/config.h"
#include "stakeledger/util/logging.h"
#include "stakeledger/util/time.h"

#include <cctype>
#include <filesystem>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace stakeledger {
namespace cli {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "STAKELEDGER CLI";

namespace defaults {
    constexpr const char* LEDGER_SUBDIR = "ledger";
    constexpr const char* LOG_LEVEL = "warn";
    /// Account holding staked base tokens unless -custody is given
    constexpr const char* CUSTODY = "ffffffffffffffffffffffffffffffffffffffff";
}

// ============================================================================
// CLI Configuration
// ============================================================================

struct CLIConfig {
    // Paths
    std::string dataDir;
    std::string configFile;

    // Logging
    std::string logLevel{defaults::LOG_LEVEL};
    std::string logFile;
    bool printToConsole{true};

    // Identities
    Address caller;
    Address custody;

    // Operational guard
    size_t maxPositions{0};

    // Command
    std::string command;
    std::vector<std::string> args;

    bool showHelp{false};
};

/// Ledger and token books opened for one command
struct LedgerContext {
    std::shared_ptr<ledger::LedgerStore> store;
    std::unique_ptr<ledger::StakingLedger> ledger;
    std::map<std::string, std::shared_ptr<ledger::TokenBook>> books;
    Address custody;

    std::shared_ptr<ledger::TokenBook> GetBook(const std::string& symbol) {
        auto it = books.find(symbol);
        if (it != books.end()) {
            return it->second;
        }
        auto book = std::make_shared<ledger::TokenBook>(symbol, custody,
                                                        store->GetDatabase());
        books[symbol] = book;
        return book;
    }
};

// ============================================================================
// Help
// ============================================================================

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n"
              << "Usage: stakeledger-cli [options] <command> [args]\n\n"
              << "Options:\n"
              << "  -datadir=<dir>        Data directory (default: ~/.stakeledger)\n"
              << "  -conf=<file>          Config file (default: <datadir>/stakeledger.conf)\n"
              << "  -caller=<address>     Identity running the command (40 hex chars)\n"
              << "  -owner=<address>      Privileged identity of a new ledger (default: caller)\n"
              << "  -custody=<address>    Account holding staked funds\n"
              << "  -annualrate=<n>       Annual rate of a new ledger, percent (default: 10)\n"
              << "  -cooldown=<seconds>   Cooldown of a new ledger (default: 604800)\n"
              << "  -basetoken=<symbol>   Base token of a new ledger\n"
              << "  -rewardtoken=<symbol> Reward token of a new ledger\n"
              << "  -maxpositions=<n>     Positions per participant, 0 = unlimited\n"
              << "  -loglevel=<level>     trace, debug, info, warn, error (default: warn)\n"
              << "  -logfile=<file>       Also write the log to a file\n"
              << "  -noprinttoconsole     Do not log to the console\n\n"
              << "Commands:\n"
              << "  info                      Ledger parameters and totals\n"
              << "  stake <amount>            Deposit base tokens\n"
              << "  applyclaim                Freeze positions into a pending claim\n"
              << "  claim                     Withdraw an unlocked claim\n"
              << "  stakes [address]          Staked total (positions + pending claim)\n"
              << "  rewards [address]         Pending and accruing reward\n"
              << "  positions [address]       List positions and pending claim\n"
              << "  state [address]           Participant state\n"
              << "  setrate <percent>         Set the annual rate (owner)\n"
              << "  setcooldown <seconds>     Set the cooldown (owner)\n"
              << "  setbasetoken <symbol>     Set the base token (owner)\n"
              << "  setrewardtoken <symbol>   Set the reward token (owner)\n"
              << "  transferowner <address>   Hand over the owner role (owner)\n"
              << "  renounceowner             Give up the owner role (owner)\n"
              << "  mint <amount> [address]   Mint base tokens (owner)\n"
              << "  balance <symbol> [address] Token balance\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

bool ParseAmount(const std::string& str, Amount& out) {
    if (str.empty() || str.size() > 20) {
        return false;
    }
    for (char c : str) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    try {
        out = std::stoull(str);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

bool ParseSigned(const std::string& str, int64_t& out) {
    try {
        size_t pos = 0;
        out = std::stoll(str, &pos);
        return pos == str.size();
    } catch (const std::exception&) {
        return false;
    }
}

bool LoadConfig(int argc, char* argv[], util::ConfigManager& config, CLIConfig& cli) {
    auto result = config.ParseCommandLine(argc, argv);
    if (!result.success) {
        std::cerr << "Error: " << result.errorMessage << "\n";
        return false;
    }

    cli.dataDir = config.GetDataDir();
    bool explicitConf = config.HasKey(util::ConfigKeys::CONF);
    cli.configFile = config.GetPath(util::ConfigKeys::CONF,
        (std::filesystem::path(cli.dataDir) / util::DEFAULT_CONFIG_FILENAME).string());

    if (explicitConf || std::filesystem::exists(cli.configFile)) {
        result = config.ParseFile(cli.configFile);
        if (!result.success) {
            std::cerr << "Error: " << result.errorMessage;
            if (result.errorLine > 0) {
                std::cerr << " (" << result.errorFile << ":" << result.errorLine << ")";
            }
            std::cerr << "\n";
            return false;
        }
        // The config file may move the data directory
        cli.dataDir = config.GetDataDir();
    }

    cli.showHelp = config.GetBool(util::ConfigKeys::HELP, false);
    cli.logLevel = config.GetString(util::ConfigKeys::LOGLEVEL, defaults::LOG_LEVEL);
    cli.logFile = config.GetPath(util::ConfigKeys::LOGFILE);
    cli.printToConsole = config.GetBool(util::ConfigKeys::PRINTTOCONSOLE, true);

    if (auto caller = config.TryGetString(util::ConfigKeys::CALLER)) {
        if (!ParseAddress(*caller, cli.caller)) {
            std::cerr << "Error: invalid -caller address '" << *caller << "'\n";
            return false;
        }
    }

    std::string custody = config.GetString(util::ConfigKeys::CUSTODY, defaults::CUSTODY);
    if (!ParseAddress(custody, cli.custody) || cli.custody.IsNull()) {
        std::cerr << "Error: invalid -custody address '" << custody << "'\n";
        return false;
    }

    if (config.HasKey(util::ConfigKeys::MAXPOSITIONS)) {
        auto maxPositions = config.TryGetUInt(util::ConfigKeys::MAXPOSITIONS);
        if (!maxPositions) {
            std::cerr << "Error: -maxpositions must be a non-negative integer\n";
            return false;
        }
        cli.maxPositions = static_cast<size_t>(*maxPositions);
    }

    const auto& args = config.GetArgs();
    if (!args.empty()) {
        cli.command = args[0];
        cli.args.assign(args.begin() + 1, args.end());
    }
    return true;
}

void SetupLogging(const CLIConfig& cli) {
    auto& logger = util::Logger::Instance();
    logger.ClearSinks();

    util::LogLevel level = util::LogLevelFromString(cli.logLevel);
    logger.SetLevel(level);

    if (cli.printToConsole) {
        util::ConsoleSink::Config consoleConfig;
        consoleConfig.level = level;
        consoleConfig.showTimestamp = false;
        logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));
    }

    if (!cli.logFile.empty()) {
        auto fileSink = std::make_shared<util::FileSink>(cli.logFile, level);
        if (fileSink->IsOpen()) {
            logger.AddSink(fileSink);
        } else {
            std::cerr << "Warning: cannot open log file " << cli.logFile << "\n";
        }
    }
}

// ============================================================================
// Ledger Setup
// ============================================================================

/// Open the ledger; returns false after printing an error
bool OpenLedger(const util::ConfigManager& config, const CLIConfig& cli, LedgerContext& ctx) {
    ledger::LedgerParameters genesis;
    auto result = ledger::LoadParametersFromConfig(config, genesis);
    if (!result.ok()) {
        std::cerr << "Error: " << result.message << "\n";
        return false;
    }

    Address owner = cli.caller;
    if (auto ownerStr = config.TryGetString(util::ConfigKeys::OWNER)) {
        if (!ParseAddress(*ownerStr, owner)) {
            std::cerr << "Error: invalid -owner address '" << *ownerStr << "'\n";
            return false;
        }
    }

    std::filesystem::path path = std::filesystem::path(cli.dataDir) / defaults::LEDGER_SUBDIR;
    ctx.store = ledger::LedgerStore::Open(path);
    ctx.custody = cli.custody;
    ctx.ledger = std::make_unique<ledger::StakingLedger>(genesis, owner, ctx.store);
    ctx.ledger->SetMaxPositions(cli.maxPositions);

    const auto& params = ctx.ledger->GetParameters();
    if (!params.baseToken.empty() &&
        !ctx.ledger->AttachBaseToken(ctx.GetBook(params.baseToken))) {
        std::cerr << "Error: cannot attach base token " << params.baseToken << "\n";
        return false;
    }
    if (!params.rewardToken.empty() &&
        !ctx.ledger->AttachRewardIssuer(ctx.GetBook(params.rewardToken))) {
        std::cerr << "Error: cannot attach reward token " << params.rewardToken << "\n";
        return false;
    }

    LOG_DEBUG(util::LogCategory::CLI) << "Opened ledger at " << path.string();
    return true;
}

// ============================================================================
// Commands
// ============================================================================

struct CommandContext {
    const CLIConfig& cli;
    LedgerContext& ctx;
    const std::vector<std::string>& args;
};

int Report(const ledger::LedgerResult& result) {
    if (result.ok()) {
        std::cout << "ok\n";
        return 0;
    }
    std::cerr << "Error: " << ledger::LedgerErrorToString(result.error);
    if (!result.message.empty() && result.message != ledger::LedgerErrorToString(result.error)) {
        std::cerr << ": " << result.message;
    }
    std::cerr << "\n";
    return 1;
}

bool RequireCaller(const CLIConfig& cli) {
    if (cli.caller.IsNull()) {
        std::cerr << "Error: this command needs -caller=<address>\n";
        return false;
    }
    return true;
}

/// Optional address argument at index, defaulting to the caller
bool TargetAddress(const CommandContext& c, size_t index, Address& out) {
    if (c.args.size() > index) {
        if (!ParseAddress(c.args[index], out)) {
            std::cerr << "Error: invalid address '" << c.args[index] << "'\n";
            return false;
        }
        return true;
    }
    if (!RequireCaller(c.cli)) {
        return false;
    }
    out = c.cli.caller;
    return true;
}

int CmdInfo(const CommandContext& c) {
    const auto& staking = *c.ctx.ledger;
    const auto& params = staking.GetParameters();
    std::cout << "Annual rate:    " << params.annualRatePercent << "%\n"
              << "Cooldown:       " << util::FormatDuration(util::Seconds{params.cooldownSeconds})
              << " (" << params.cooldownSeconds << "s)\n"
              << "Base token:     " << (params.baseToken.empty() ? "<unset>" : params.baseToken) << "\n"
              << "Reward token:   " << (params.rewardToken.empty() ? "<unset>" : params.rewardToken) << "\n"
              << "Owner:          " << (staking.GetOwner().IsNull() ? "<renounced>" : staking.GetOwner().ToHex()) << "\n"
              << "Custody:        " << c.ctx.custody.ToHex() << "\n"
              << "Total staked:   " << staking.GetTotalStaked() << "\n"
              << "Participants:   " << staking.GetParticipantCount() << "\n";
    return 0;
}

int CmdStake(const CommandContext& c) {
    Amount amount = 0;
    if (!ParseAmount(c.args[0], amount)) {
        std::cerr << "Error: invalid amount '" << c.args[0] << "'\n";
        return 1;
    }
    if (!RequireCaller(c.cli)) return 1;
    return Report(c.ctx.ledger->Stake(c.cli.caller, amount));
}

int CmdApplyClaim(const CommandContext& c) {
    if (!RequireCaller(c.cli)) return 1;
    return Report(c.ctx.ledger->ApplyClaim(c.cli.caller));
}

int CmdClaim(const CommandContext& c) {
    if (!RequireCaller(c.cli)) return 1;
    return Report(c.ctx.ledger->Claim(c.cli.caller));
}

int CmdStakes(const CommandContext& c) {
    Address target;
    if (!TargetAddress(c, 0, target)) return 1;
    std::cout << c.ctx.ledger->GetStakedTotal(target) << "\n";
    return 0;
}

int CmdRewards(const CommandContext& c) {
    Address target;
    if (!TargetAddress(c, 0, target)) return 1;
    auto view = c.ctx.ledger->GetRewards(target);
    if (!view) {
        return Report(ledger::LedgerResult::Error(ledger::LedgerError::AMOUNT_OVERFLOW));
    }
    std::cout << "Pending:  " << view->pendingReward << "\n"
              << "Accruing: " << view->accruingReward << "\n";
    return 0;
}

int CmdPositions(const CommandContext& c) {
    Address target;
    if (!TargetAddress(c, 0, target)) return 1;
    auto positions = c.ctx.ledger->GetPositions(target);
    for (size_t i = 0; i < positions.size(); ++i) {
        std::cout << "#" << i << "  " << positions[i].amount << "  staked "
                  << util::FormatISO8601(positions[i].createdAt) << "\n";
    }
    if (auto claim = c.ctx.ledger->GetPendingClaim(target)) {
        std::cout << "Pending claim: principal " << claim->principal << ", reward "
                  << claim->reward << ", unlocks " << util::FormatISO8601(claim->unlockAt)
                  << "\n";
    } else if (positions.empty()) {
        std::cout << "No positions\n";
    }
    return 0;
}

int CmdState(const CommandContext& c) {
    Address target;
    if (!TargetAddress(c, 0, target)) return 1;
    std::cout << ledger::ParticipantStateToString(c.ctx.ledger->GetParticipantState(target)) << "\n";
    return 0;
}

int CmdSetRate(const CommandContext& c) {
    Amount rate = 0;
    if (!ParseAmount(c.args[0], rate)) {
        std::cerr << "Error: invalid rate '" << c.args[0] << "'\n";
        return 1;
    }
    if (!RequireCaller(c.cli)) return 1;
    return Report(c.ctx.ledger->SetAnnualRate(c.cli.caller, rate));
}

int CmdSetCooldown(const CommandContext& c) {
    int64_t seconds = 0;
    if (!ParseSigned(c.args[0], seconds)) {
        std::cerr << "Error: invalid cooldown '" << c.args[0] << "'\n";
        return 1;
    }
    if (!RequireCaller(c.cli)) return 1;
    return Report(c.ctx.ledger->SetCooldown(c.cli.caller, seconds));
}

int CmdSetBaseToken(const CommandContext& c) {
    if (!RequireCaller(c.cli)) return 1;
    if (!ledger::IsValidSymbol(c.args[0])) {
        std::cerr << "Error: invalid symbol '" << c.args[0] << "'\n";
        return 1;
    }
    return Report(c.ctx.ledger->SetBaseToken(c.cli.caller, c.ctx.GetBook(c.args[0])));
}

int CmdSetRewardToken(const CommandContext& c) {
    if (!RequireCaller(c.cli)) return 1;
    if (!ledger::IsValidSymbol(c.args[0])) {
        std::cerr << "Error: invalid symbol '" << c.args[0] << "'\n";
        return 1;
    }
    return Report(c.ctx.ledger->SetRewardToken(c.cli.caller, c.ctx.GetBook(c.args[0])));
}

int CmdTransferOwner(const CommandContext& c) {
    Address newOwner;
    if (!ParseAddress(c.args[0], newOwner)) {
        std::cerr << "Error: invalid address '" << c.args[0] << "'\n";
        return 1;
    }
    if (!RequireCaller(c.cli)) return 1;
    return Report(c.ctx.ledger->TransferOwnership(c.cli.caller, newOwner));
}

int CmdRenounceOwner(const CommandContext& c) {
    if (!RequireCaller(c.cli)) return 1;
    return Report(c.ctx.ledger->RenounceOwnership(c.cli.caller));
}

int CmdMint(const CommandContext& c) {
    Amount amount = 0;
    if (!ParseAmount(c.args[0], amount)) {
        std::cerr << "Error: invalid amount '" << c.args[0] << "'\n";
        return 1;
    }
    Address target;
    if (!TargetAddress(c, 1, target)) return 1;
    if (!RequireCaller(c.cli)) return 1;

    if (c.ctx.ledger->GetOwner().IsNull() || c.ctx.ledger->GetOwner() != c.cli.caller) {
        return Report(ledger::LedgerResult::Error(ledger::LedgerError::UNAUTHORIZED));
    }
    const std::string& symbol = c.ctx.ledger->GetParameters().baseToken;
    if (symbol.empty()) {
        return Report(ledger::LedgerResult::Error(ledger::LedgerError::TOKEN_NOT_SET));
    }
    if (!c.ctx.GetBook(symbol)->Mint(target, amount)) {
        return Report(ledger::LedgerResult::Error(ledger::LedgerError::ISSUE_FAILED,
            "mint of " + std::to_string(amount) + " " + symbol + " failed"));
    }
    LOG_INFO(util::LogCategory::CLI) << "Minted " << amount << " " << symbol
                                     << " to " << target.ToHex();
    return Report(ledger::LedgerResult::Ok());
}

int CmdBalance(const CommandContext& c) {
    if (!ledger::IsValidSymbol(c.args[0])) {
        std::cerr << "Error: invalid symbol '" << c.args[0] << "'\n";
        return 1;
    }
    Address target;
    if (!TargetAddress(c, 1, target)) return 1;
    std::cout << c.ctx.GetBook(c.args[0])->BalanceOf(target) << "\n";
    return 0;
}

struct CommandInfo {
    size_t minArgs;
    size_t maxArgs;
    std::function<int(const CommandContext&)> handler;
};

const std::map<std::string, CommandInfo>& GetCommands() {
    static const std::map<std::string, CommandInfo> commands = {
        {"info",           {0, 0, CmdInfo}},
        {"stake",          {1, 1, CmdStake}},
        {"applyclaim",     {0, 0, CmdApplyClaim}},
        {"claim",          {0, 0, CmdClaim}},
        {"stakes",         {0, 1, CmdStakes}},
        {"rewards",        {0, 1, CmdRewards}},
        {"positions",      {0, 1, CmdPositions}},
        {"state",          {0, 1, CmdState}},
        {"setrate",        {1, 1, CmdSetRate}},
        {"setcooldown",    {1, 1, CmdSetCooldown}},
        {"setbasetoken",   {1, 1, CmdSetBaseToken}},
        {"setrewardtoken", {1, 1, CmdSetRewardToken}},
        {"transferowner",  {1, 1, CmdTransferOwner}},
        {"renounceowner",  {0, 0, CmdRenounceOwner}},
        {"mint",           {1, 2, CmdMint}},
        {"balance",        {1, 2, CmdBalance}},
    };
    return commands;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int AppMain(int argc, char* argv[]) {
    util::ConfigManager config;
    CLIConfig cli;

    if (!LoadConfig(argc, argv, config, cli)) {
        return 1;
    }
    if (cli.showHelp) {
        PrintHelp();
        return 0;
    }
    if (cli.command.empty()) {
        std::cerr << "Error: No command specified.\n"
                  << "Use 'stakeledger-cli -help' for usage information.\n";
        return 1;
    }

    const auto& commands = GetCommands();
    auto it = commands.find(cli.command);
    if (it == commands.end()) {
        std::cerr << "Error: unknown command '" << cli.command << "'\n";
        return 1;
    }
    if (cli.args.size() < it->second.minArgs || cli.args.size() > it->second.maxArgs) {
        std::cerr << "Error: wrong number of arguments for '" << cli.command << "'\n";
        return 1;
    }

    SetupLogging(cli);

    LedgerContext ctx;
    if (!OpenLedger(config, cli, ctx)) {
        return 1;
    }

    CommandContext c{cli, ctx, cli.args};
    int rc = it->second.handler(c);
    util::Logger::Instance().Flush();
    return rc;
}

} // namespace cli
} // namespace stakeledger

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        return stakeledger::cli::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
