#pragma once

/**
 * TradeSignalPipeline - one trade-finding pass per symbol
 *
 *   market data -> payload -> AI verdict -> validate -> dedupe/persist -> alert
 *
 * run() is safe under concurrent invocation for the same symbol; duplicate
 * suppression relies on the store's atomic unique insert.
 *
 * Failure mapping (run() throws, nothing persisted):
 *   AI timeout / rate limit / unavailable   TransientCollaboratorError
 *   malformed output, invalid verdict       ParseError
 * A verdict other than TRADE_IDENTIFIED is a normal, successful run.
 * Alert delivery failures are logged and never fail the run.
 */

#include "dedupe.hpp"
#include "payload_builder.hpp"
#include "trade_signal.hpp"
#include "../ai/reasoning_client.hpp"
#include "../alert/alert_dispatcher.hpp"
#include "../config/app_config.hpp"
#include "../market/market_data.hpp"
#include "../observability/event_journal.hpp"
#include "../store/trade_store.hpp"
#include "../util/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

namespace tradefinder {
namespace signal {

enum class RunOutcome : uint8_t { TradePersisted, Duplicate, NoSetup, Failed };

inline const char* run_outcome_to_string(RunOutcome o) {
    switch (o) {
    case RunOutcome::TradePersisted:
        return "TRADE_PERSISTED";
    case RunOutcome::Duplicate:
        return "DUPLICATE";
    case RunOutcome::NoSetup:
        return "NO_SETUP";
    case RunOutcome::Failed:
        return "FAILED";
    }
    return "FAILED";
}

struct SymbolRunResult {
    std::string symbol;
    RunOutcome outcome = RunOutcome::NoSetup;
    SignalStatus signal_status = SignalStatus::NoSetup;
    std::string trade_id;
    std::string dedupe_key;
    alert::AlertTier tier = alert::AlertTier::LogOnly;
    bool alert_sent = false;
    std::string error;
};

struct TriggerSummary {
    int64_t duration_ms = 0;
    size_t symbols_analyzed = 0;
    size_t trades_persisted = 0;
    size_t duplicates = 0;
    size_t no_setup = 0;
    std::map<std::string, std::string> errors; // symbol -> message
    std::vector<SymbolRunResult> results;
};

class TradeSignalPipeline {
public:
    TradeSignalPipeline(config::TradeFinderSettings settings, config::AiSettings ai_settings,
                        market::MarketDataSource& market, ai::ReasoningClient& reasoner, store::TradeStore& trades,
                        alert::AlertDispatcher* alerts = nullptr, observability::EventJournal* journal = nullptr,
                        util::WallClock clock = util::wall_clock_ms);

    TradeSignalPipeline(const TradeSignalPipeline&) = delete;
    TradeSignalPipeline& operator=(const TradeSignalPipeline&) = delete;

    /**
     * Analyze one symbol. Throws on a failed run (see above).
     */
    SymbolRunResult run(const std::string& symbol, const std::string& run_context = RUN_CONTEXT_SCHEDULED);

    /**
     * Scheduled handler body. Symbols come from parameters["symbols"]
     * (array or comma-separated string) or the configured list. Every
     * symbol is attempted; if one failed its error is rethrown as is,
     * if several failed an aggregate error is thrown.
     */
    void find_trades(const nlohmann::json& parameters);

    /**
     * Manual run for one symbol or "all". Never throws; per-symbol errors
     * are in the summary.
     */
    TriggerSummary trigger(const std::string& symbol_or_all);

    const DeduplicationGate& dedupe_gate() const { return gate_; }
    const config::TradeFinderSettings& settings() const { return settings_; }
    const std::string& system_prompt() const { return system_prompt_; }

private:
    config::TradeFinderSettings settings_;
    config::AiSettings ai_settings_;
    market::MarketDataSource& market_;
    ai::ReasoningClient& reasoner_;
    store::TradeStore& trades_;
    alert::AlertDispatcher* alerts_;
    observability::EventJournal* journal_;
    util::WallClock clock_;
    DeduplicationGate gate_;
    std::string system_prompt_;

    PayloadInput gather(const std::string& symbol, const std::string& run_context, int64_t now_ms);
    TradeSignal ask(const std::string& symbol, const nlohmann::json& payload, int64_t now_ms,
                    std::string& raw_output, std::string& request_id);
    IdentifiedTrade to_trade(const std::string& symbol, const TradeSignal& sig, const std::string& raw_output,
                             const std::string& request_id, int64_t now_ms) const;
    void send_alert(IdentifiedTrade& trade, SymbolRunResult& result);

    void journal(observability::JournalEventType type, const std::string& source, const std::string& message);
};

}  // namespace signal
}  // namespace tradefinder
