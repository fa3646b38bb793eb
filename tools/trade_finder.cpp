/**
 * Trade Finder - scheduled AI trade identification daemon and admin CLI
 *
 * Daemon mode (default):
 *   - seeds the default schedules if absent
 *   - makes every enabled schedule live
 *   - runs until SIGINT / SIGTERM, then lets in-flight runs finish
 *
 * Command mode runs one administrative action against the same stores.
 * Schedule edits made here are picked up by a running daemon on restart.
 *
 * Usage:
 *   trade_finder -c config/trade_finder.json
 *   trade_finder -c config/trade_finder.json --trigger all
 *   trade_finder --trades 48
 */

#include "../include/admin/schedule_admin.hpp"
#include "../include/ai/claude_reasoning_client.hpp"
#include "../include/alert/webhook_alert_dispatcher.hpp"
#include "../include/config/app_config.hpp"
#include "../include/errors.hpp"
#include "../include/lifecycle/trade_lifecycle_manager.hpp"
#include "../include/logging/async_logger.hpp"
#include "../include/market/file_market_data.hpp"
#include "../include/observability/event_journal.hpp"
#include "../include/scheduler/handler_dispatcher.hpp"
#include "../include/scheduler/schedule_seeder.hpp"
#include "../include/scheduler/task_scheduler.hpp"
#include "../include/signal/trade_signal_pipeline.hpp"
#include "../include/store/schedule_store.hpp"
#include "../include/store/trade_store.hpp"
#include "../include/util/cli.hpp"
#include "../include/util/system.hpp"
#include "../include/util/time_utils.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <map>
#include <memory>
#include <thread>

namespace tf = tradefinder;

using tf::util::CliCommand;
using tf::util::CLIArgs;

// ============================================================================
// Global State
// ============================================================================

std::atomic<bool> g_running{true};

// ============================================================================
// Application wiring
// ============================================================================

struct App {
    tf::config::AppConfig config;
    tf::observability::EventJournal journal;

    std::unique_ptr<tf::store::JsonScheduleConfigStore> schedules;
    std::unique_ptr<tf::store::JsonTradeStore> trades;
    std::unique_ptr<tf::market::FileMarketData> market;
    std::unique_ptr<tf::ai::ClaudeReasoningClient> reasoner;
    std::unique_ptr<tf::alert::WebhookAlertDispatcher> alerts;

    std::unique_ptr<tf::signal::TradeSignalPipeline> pipeline;
    std::unique_ptr<tf::lifecycle::TradeLifecycleManager> lifecycle;

    tf::scheduler::HandlerDispatcher dispatcher;
    std::unique_ptr<tf::scheduler::TaskScheduler> scheduler;
    std::unique_ptr<tf::admin::ScheduleAdmin> admin;

    App(tf::config::AppConfig cfg, bool daemon) : config(std::move(cfg)) {
        schedules = std::make_unique<tf::store::JsonScheduleConfigStore>(config.store.data_dir);
        trades = std::make_unique<tf::store::JsonTradeStore>(config.store.data_dir);
        market = std::make_unique<tf::market::FileMarketData>(config.market_data_dir());

        tf::ai::ClaudeClientConfig ai_cfg;
        ai_cfg.api_key = config.ai.api_key;
        ai_cfg.api_url = config.ai.api_url;
        ai_cfg.model = config.ai.model;
        reasoner = std::make_unique<tf::ai::ClaudeReasoningClient>(ai_cfg);

        if (!config.alert.webhook_url.empty()) {
            alerts = std::make_unique<tf::alert::WebhookAlertDispatcher>(config.alert.webhook_url,
                                                                          config.alert.timeout_ms);
        }

        pipeline = std::make_unique<tf::signal::TradeSignalPipeline>(config.trade_finder, config.ai, *market,
                                                                      *reasoner, *trades, alerts.get(), &journal);
        lifecycle = std::make_unique<tf::lifecycle::TradeLifecycleManager>(*trades, &journal);

        dispatcher.register_handler(tf::scheduler::HANDLER_FIND_TRADES,
                                    [this](const tf::scheduler::ParameterBag& p) { pipeline->find_trades(p); });
        dispatcher.register_nullary(tf::scheduler::HANDLER_EXPIRE_TRADES, [this] { lifecycle->sweep_expired(); });
        dispatcher.register_nullary(tf::scheduler::HANDLER_LOG_STATISTICS, [this] { lifecycle->log_statistics(); });

        tf::scheduler::TaskSchedulerConfig sched_cfg;
        sched_cfg.worker_threads = static_cast<size_t>(config.scheduler.worker_threads);
        sched_cfg.fire_immediately = daemon && config.scheduler.fire_immediately;
        scheduler = std::make_unique<tf::scheduler::TaskScheduler>(dispatcher, *schedules, sched_cfg);
        scheduler->set_journal(&journal);

        // Command mode only edits the store; nothing may fire in this process
        admin = std::make_unique<tf::admin::ScheduleAdmin>(*schedules, *scheduler, tf::util::wall_clock_ms, daemon);
    }
};

// ============================================================================
// Output helpers
// ============================================================================

void print_schedule(const tf::scheduler::ScheduleConfig& c, bool live) {
    std::printf("  %-28s %-3s %-11s %-10s %-30s prio=%d runs=%lld fails=%lld last=%s%s\n", c.name.c_str(),
                c.enabled ? "on" : "off", tf::scheduler::schedule_type_to_string(c.schedule_type),
                c.schedule_expression.c_str(), c.handler_ref.c_str(), c.priority,
                static_cast<long long>(c.execution_count), static_cast<long long>(c.failure_count),
                tf::scheduler::execution_status_to_string(c.last_status), live ? " [live]" : "");
    if (!c.last_error.empty()) {
        std::printf("      last error: %s\n", c.last_error.c_str());
    }
}

void print_trade(const tf::signal::IdentifiedTrade& t) {
    std::printf("  %-11s %s %-4s %-5s conf=%3d %-11s zone=%-18s stop=%.2f expires=%s%s\n", t.id.c_str(),
                tf::util::format_iso8601_utc(t.identified_at).c_str(), t.symbol.c_str(), t.direction.c_str(),
                t.confidence, tf::signal::trade_status_to_string(t.status), t.entry_zone.c_str(), t.stop_price,
                tf::util::format_iso8601_utc(t.expires_at).c_str(), t.alert_sent ? " [alerted]" : "");
}

void print_counts(const char* title, const std::map<std::string, size_t>& counts) {
    std::printf("  %s:", title);
    for (const auto& [k, n] : counts) {
        std::printf(" %s=%zu", k.c_str(), n);
    }
    std::printf("\n");
}

int report(const tf::admin::AdminResult<tf::scheduler::ScheduleConfig>& r, const char* action) {
    if (!r.ok()) {
        std::cerr << action << " failed (" << tf::admin::admin_outcome_to_string(r.outcome) << "): " << r.message
                  << "\n";
        return 1;
    }
    std::cout << action << ": " << r.value->name << "\n";
    return 0;
}

// ============================================================================
// Modes
// ============================================================================

int run_daemon(App& app) {
    if (!app.reasoner->is_valid()) {
        std::cerr << "No AI API key: set ANTHROPIC_API_KEY or CLAUDE_API_KEY\n";
        return 1;
    }
    if (!app.alerts) {
        LOG_INFO(System, "No alert webhook configured, alerts are logged only");
    }

    if (app.config.scheduler.seed_defaults) {
        tf::scheduler::seed_default_schedules(*app.schedules, app.config.trade_finder.symbols,
                                              tf::util::wall_clock_ms());
    }

    size_t live = app.scheduler->initialize();
    LOGF_INFO(System, "Trade finder started: %zu schedules live, symbols=%zu", live,
              app.config.trade_finder.symbols.size());

    tf::util::install_shutdown_handler(g_running);
    while (g_running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    LOGF_INFO(System, "Received signal %d, stopping (in flight: %zu)", tf::util::last_shutdown_signal(),
              app.scheduler->in_flight());
    app.scheduler->shutdown();

    LOGF_INFO(System, "Stopped. runs ok=%llu failed=%llu trades=%llu duplicates=%llu alerts=%llu",
              static_cast<unsigned long long>(app.journal.count(tf::observability::JournalEventType::RunSucceeded)),
              static_cast<unsigned long long>(app.journal.count(tf::observability::JournalEventType::RunFailed)),
              static_cast<unsigned long long>(app.journal.count(tf::observability::JournalEventType::TradePersisted)),
              static_cast<unsigned long long>(app.journal.count(tf::observability::JournalEventType::DuplicateSignal)),
              static_cast<unsigned long long>(app.journal.count(tf::observability::JournalEventType::AlertSent)));
    return 0;
}

int run_trigger(App& app, const std::string& target) {
    if (!app.reasoner->is_valid()) {
        std::cerr << "No AI API key: set ANTHROPIC_API_KEY or CLAUDE_API_KEY\n";
        return 1;
    }

    tf::signal::TriggerSummary s = app.pipeline->trigger(target);
    std::printf("Trade finder run: %zu symbols in %lld ms\n", s.symbols_analyzed, static_cast<long long>(s.duration_ms));
    std::printf("  persisted=%zu duplicates=%zu no_setup=%zu errors=%zu\n", s.trades_persisted, s.duplicates,
                s.no_setup, s.errors.size());
    for (const auto& r : s.results) {
        std::printf("  %-5s %-15s %s%s\n", r.symbol.c_str(), tf::signal::run_outcome_to_string(r.outcome),
                    r.trade_id.empty() ? r.error.c_str() : r.trade_id.c_str(), r.alert_sent ? " [alerted]" : "");
    }
    return s.errors.empty() ? 0 : 2;
}

int run_command(App& app, const CLIArgs& args) {
    switch (args.command) {
    case CliCommand::Daemon:
        return run_daemon(app);

    case CliCommand::Trigger:
        return run_trigger(app, args.target);

    case CliCommand::ListSchedules: {
        auto configs = app.admin->list();
        std::printf("Schedules (%zu):\n", configs.size());
        for (const auto& c : configs) {
            print_schedule(c, app.scheduler->is_running(c.name));
        }
        return 0;
    }

    case CliCommand::EnableSchedule:
        return report(app.admin->enable(args.target), "Enabled");

    case CliCommand::DisableSchedule:
        return report(app.admin->disable(args.target), "Disabled");

    case CliCommand::DeleteSchedule:
        return report(app.admin->remove(args.target), "Deleted");

    case CliCommand::SchedulerStats: {
        auto s = app.admin->statistics();
        std::printf("Schedules: total=%zu enabled=%zu live=%zu executions=%lld failures=%lld\n", s.total_configs,
                    s.enabled_configs, s.active_tasks, static_cast<long long>(s.total_executions),
                    static_cast<long long>(s.total_failures));
        return 0;
    }

    case CliCommand::ListTrades: {
        auto list = app.lifecycle->recent(args.hours);
        std::printf("Trades in the last %dh (%zu):\n", args.hours, list.size());
        for (const auto& t : list) {
            print_trade(t);
        }
        return 0;
    }

    case CliCommand::SetTradeStatus: {
        auto r = app.lifecycle->update_status(args.target, args.status);
        if (!r.ok()) {
            std::cerr << "Status update failed (" << tf::admin::admin_outcome_to_string(r.outcome)
                      << "): " << r.message << "\n";
            return 1;
        }
        print_trade(*r.value);
        return 0;
    }

    case CliCommand::TradeStats: {
        auto s = app.lifecycle->report_statistics(args.hours);
        std::printf("Trade statistics, last %dh: total=%zu alerted=%zu avg_confidence=%.1f\n", s.window_hours,
                    s.total, s.alerted, s.avg_confidence);
        print_counts("by status", s.by_status);
        print_counts("by symbol", s.by_symbol);
        print_counts("by direction", s.by_direction);
        return 0;
    }

    case CliCommand::Sweep:
        std::printf("Expired %zu trades\n", app.lifecycle->sweep_expired());
        return 0;
    }
    return 1;
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    CLIArgs args;
    if (!tf::util::parse_args(argc, argv, args))
        return 1;

    if (args.help) {
        tf::util::print_help();
        return 0;
    }

    auto& logger = tf::logging::default_logger();

    int rc = 1;
    try {
        tf::config::AppConfig config =
            args.config_file.empty() ? tf::config::AppConfig{} : tf::config::AppConfig::load(args.config_file);
        config.apply_env();
        if (!args.data_dir.empty()) {
            config.store.data_dir = args.data_dir;
        }
        if (!args.symbols.empty()) {
            config.trade_finder.symbols = args.symbols;
        }
        config.validate();

        logger.set_min_level(args.verbose ? tf::logging::LogLevel::Debug
                                          : tf::logging::level_from_string(config.logging.min_level.c_str()));

        App app(std::move(config), args.command == CliCommand::Daemon);
        rc = run_command(app, args);
        app.scheduler->shutdown();
    } catch (const tf::ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        rc = 1;
    } catch (const tf::TransientCollaboratorError& e) {
        std::cerr << "Store unavailable: " << e.what() << "\n";
        rc = 1;
    }

    logger.stop();
    return rc;
}
