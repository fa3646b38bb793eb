#pragma once

/**
 * CLI utilities for the trade finder
 *
 * Without a command flag the process runs as a daemon: it seeds the default
 * schedules, starts the scheduler and runs until SIGINT/SIGTERM.
 * Command flags run one administrative action and exit.
 */

#include "string_utils.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace tradefinder {
namespace util {

enum class CliCommand : uint8_t {
    Daemon,
    Trigger,
    ListSchedules,
    EnableSchedule,
    DisableSchedule,
    DeleteSchedule,
    SchedulerStats,
    ListTrades,
    SetTradeStatus,
    TradeStats,
    Sweep,
};

/**
 * Command-line arguments for the trade_finder application.
 */
struct CLIArgs {
    bool help = false;
    bool verbose = false;
    std::string config_file;              // empty = built-in defaults
    std::string data_dir;                 // overrides store.data_dir
    std::vector<std::string> symbols;     // overrides trade_finder.symbols
    CliCommand command = CliCommand::Daemon;
    std::string target;                   // symbol, schedule name or trade id
    std::string status;                   // --set-status
    int hours = 24;                       // --trades / --stats window
};

inline void print_help() {
    std::cout << R"(
Trade Finder
============

Usage: trade_finder [options] [command]

Options:
  -c, --config FILE        JSON config file
  --data-dir DIR           Record store directory (overrides config)
  -s, --symbols SYMS       Symbols (comma-separated, overrides config)
  -v, --verbose            Debug logging
  -h, --help               Show this help

Commands (default: run the scheduler until interrupted):
  --trigger SYM|all        Run the trade finder once and print a summary
  --list-schedules         List schedule configs
  --enable NAME            Enable a schedule
  --disable NAME           Disable a schedule
  --delete NAME            Delete a schedule
  --scheduler-stats        Scheduler statistics
  --trades [HOURS]         Trades identified in the last HOURS (default 24)
  --set-status ID STATUS   Set a trade to TAKEN, INVALIDATED or CANCELLED
  --stats [HOURS]          Trade statistics (default 24)
  --sweep                  Expire stale trades now

Environment:
  ANTHROPIC_API_KEY        AI collaborator key (or CLAUDE_API_KEY)
  TRADE_FINDER_MODEL       Model override
  TRADE_FINDER_ALERT_WEBHOOK  Alert webhook URL

Examples:
  trade_finder -c config/trade_finder.json
  trade_finder -c config/trade_finder.json --trigger NQ
  trade_finder --data-dir data --set-status trd_000042 TAKEN
)";
}

namespace detail {

inline bool parse_hours(const char* text, int& out) {
    int64_t v = 0;
    if (!parse_positive_ms(text, v) || v > 24 * 365) {
        return false;
    }
    out = static_cast<int>(v);
    return true;
}

}  // namespace detail

/**
 * Parse command-line arguments into CLIArgs struct.
 *
 * @return true if parsing succeeded, false on error
 */
inline bool parse_args(int argc, char* argv[], CLIArgs& args) {
    int commands = 0;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
        }
        else if (arg == "--verbose" || arg == "-v") {
            args.verbose = true;
        }
        else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            args.config_file = argv[++i];
        }
        else if (arg == "--data-dir" && i + 1 < argc) {
            args.data_dir = argv[++i];
        }
        else if ((arg == "--symbols" || arg == "-s") && i + 1 < argc) {
            args.symbols = split_symbols(argv[++i]);
        }
        else if (arg == "--trigger" && i + 1 < argc) {
            args.command = CliCommand::Trigger;
            args.target = argv[++i];
            ++commands;
        }
        else if (arg == "--list-schedules") {
            args.command = CliCommand::ListSchedules;
            ++commands;
        }
        else if (arg == "--enable" && i + 1 < argc) {
            args.command = CliCommand::EnableSchedule;
            args.target = argv[++i];
            ++commands;
        }
        else if (arg == "--disable" && i + 1 < argc) {
            args.command = CliCommand::DisableSchedule;
            args.target = argv[++i];
            ++commands;
        }
        else if (arg == "--delete" && i + 1 < argc) {
            args.command = CliCommand::DeleteSchedule;
            args.target = argv[++i];
            ++commands;
        }
        else if (arg == "--scheduler-stats") {
            args.command = CliCommand::SchedulerStats;
            ++commands;
        }
        else if (arg == "--trades" || arg == "--stats") {
            args.command = arg == "--trades" ? CliCommand::ListTrades : CliCommand::TradeStats;
            ++commands;
            // Optional window
            if (i + 1 < argc && argv[i + 1][0] != '-') {
                if (!detail::parse_hours(argv[++i], args.hours)) {
                    std::cerr << "Invalid hours for " << arg << ": " << argv[i] << "\n";
                    return false;
                }
            }
        }
        else if (arg == "--set-status" && i + 2 < argc) {
            args.command = CliCommand::SetTradeStatus;
            args.target = argv[++i];
            args.status = to_upper(argv[++i]);
            ++commands;
        }
        else if (arg == "--sweep") {
            args.command = CliCommand::Sweep;
            ++commands;
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::cerr << "Use --help for usage information.\n";
            return false;
        }
    }

    if (commands > 1) {
        std::cerr << "Only one command may be given\n";
        return false;
    }
    return true;
}

}  // namespace util
}  // namespace tradefinder
