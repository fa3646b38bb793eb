#include "../../include/signal/trade_signal_pipeline.hpp"

#include "../../include/ai/prompt_loader.hpp"
#include "../../include/errors.hpp"
#include "../../include/logging/async_logger.hpp"
#include "../../include/market/market_data.hpp"
#include "../../include/signal/signal_parser.hpp"
#include "../../include/util/string_utils.hpp"

#include <cstdio>
#include <exception>

using json = nlohmann::json;

namespace tradefinder::signal {

using observability::JournalEventType;

namespace {

std::string target_text(const TargetInfo& t) {
    if (!t.level.empty())
        return t.level;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", t.price);
    return buf;
}

TransientCollaboratorError::Kind transient_kind(ai::ReasoningError e) {
    switch (e) {
    case ai::ReasoningError::Timeout:
        return TransientCollaboratorError::Kind::Timeout;
    case ai::ReasoningError::RateLimited:
        return TransientCollaboratorError::Kind::RateLimited;
    default:
        return TransientCollaboratorError::Kind::Unavailable;
    }
}

std::vector<std::string> symbols_from(const json& parameters, const std::vector<std::string>& fallback) {
    if (parameters.is_object()) {
        auto it = parameters.find("symbols");
        if (it != parameters.end()) {
            std::vector<std::string> out;
            if (it->is_string()) {
                out = util::split_symbols(it->get<std::string>());
            } else if (it->is_array()) {
                for (const auto& item : *it) {
                    if (!item.is_string())
                        continue;
                    std::string s = util::to_upper(util::trim(item.get<std::string>()));
                    if (!s.empty())
                        out.push_back(s);
                }
            }
            if (!out.empty())
                return out;
        }
    }
    return fallback;
}

}  // namespace

TradeSignalPipeline::TradeSignalPipeline(config::TradeFinderSettings settings, config::AiSettings ai_settings,
                                         market::MarketDataSource& market, ai::ReasoningClient& reasoner,
                                         store::TradeStore& trades, alert::AlertDispatcher* alerts,
                                         observability::EventJournal* journal, util::WallClock clock)
    : settings_(std::move(settings)), ai_settings_(std::move(ai_settings)), market_(market), reasoner_(reasoner),
      trades_(trades), alerts_(alerts), journal_(journal), clock_(std::move(clock)), gate_(trades, journal) {
    system_prompt_ = ai::load_prompt_with_fallback(settings_.system_prompt_file, ai::DEFAULT_TRADE_FINDER_PROMPT);
}

// ============================================================================
// Single symbol run
// ============================================================================

SymbolRunResult TradeSignalPipeline::run(const std::string& symbol, const std::string& run_context) {
    SymbolRunResult result;
    result.symbol = util::to_upper(util::trim(symbol));
    if (result.symbol.empty()) {
        throw ConfigurationError("trade finder run needs a symbol");
    }

    const int64_t now = clock_();
    LOGF_DEBUG(Pipeline, "Analyzing %s (%s)", result.symbol.c_str(), run_context.c_str());

    PayloadInput input = gather(result.symbol, run_context, now);
    json payload = build_payload(input);

    std::string raw_output;
    std::string request_id;
    TradeSignal sig = ask(result.symbol, payload, now, raw_output, request_id);
    result.signal_status = sig.status;

    if (sig.status != SignalStatus::TradeIdentified) {
        if (sig.status == SignalStatus::Error) {
            LOGF_WARN(Pipeline, "%s: AI reported an analysis error: %s", result.symbol.c_str(), sig.notes.c_str());
        } else {
            LOGF_INFO(Pipeline, "%s: %s", result.symbol.c_str(), signal_status_to_string(sig.status));
        }
        result.outcome = RunOutcome::NoSetup;
        return result;
    }

    validate_identified(sig);

    IdentifiedTrade trade = to_trade(result.symbol, sig, raw_output, request_id, now);
    result.dedupe_key = trade.dedupe_key;

    if (!gate_.admit(trade)) {
        result.outcome = RunOutcome::Duplicate;
        return result;
    }

    result.outcome = RunOutcome::TradePersisted;
    result.trade_id = trade.id;
    LOGF_INFO(Pipeline, "Trade %s persisted: %s %s conf=%d zone=%s", trade.id.c_str(), trade.symbol.c_str(),
              trade.direction.c_str(), trade.confidence, trade.entry_zone.c_str());
    journal(JournalEventType::TradePersisted, trade.symbol, trade.id + " " + trade.dedupe_key);

    send_alert(trade, result);
    return result;
}

PayloadInput TradeSignalPipeline::gather(const std::string& symbol, const std::string& run_context, int64_t now_ms) {
    PayloadInput input;
    input.symbol = symbol;
    input.now_ms = now_ms;
    input.run_context = run_context;
    input.analysis_profile = settings_.analysis_profile;
    input.timeframes = settings_.timeframes;

    // Market data failures propagate as TransientCollaboratorError
    input.events = market_.recent_events(symbol, settings_.event_lookback_minutes, now_ms);
    for (const auto& tf : settings_.timeframes) {
        input.ohlc[tf] = market_.recent_candles(symbol, tf, settings_.ohlc_candle_count, now_ms);
    }

    if (settings_.manual_levels.is_object()) {
        auto it = settings_.manual_levels.find(symbol);
        if (it != settings_.manual_levels.end() && !it->is_null()) {
            input.manual_levels = *it;
        }
    }

    LOGF_DEBUG(Pipeline, "%s: %zu events in last %d min", symbol.c_str(), input.events.size(),
               settings_.event_lookback_minutes);
    return input;
}

TradeSignal TradeSignalPipeline::ask(const std::string& symbol, const json& payload, int64_t now_ms,
                                     std::string& raw_output, std::string& request_id) {
    ai::ReasoningRequest request;
    request.request_id = "TRADE_FINDER_" + symbol + "_" + std::to_string(now_ms);
    request.system_instructions = system_prompt_;
    request.input = payload.dump(-1, ' ', false, json::error_handler_t::replace);
    request.max_tokens = ai_settings_.max_tokens;
    request.temperature = ai_settings_.temperature;
    request.timeout_ms = settings_.ai_timeout_ms;
    request_id = request.request_id;

    ai::ReasoningResponse response = reasoner_.invoke(request);
    if (!response.request_id.empty()) {
        request_id = response.request_id;
    }

    if (!response.success) {
        if (response.error_kind == ai::ReasoningError::MalformedOutput) {
            throw ParseError(symbol + ": malformed AI response: " + response.error);
        }
        auto kind = transient_kind(response.error_kind);
        LOGF_WARN(Ai, "%s: AI call failed (%s): %s", symbol.c_str(), TransientCollaboratorError::kind_name(kind),
                  response.error.c_str());
        throw TransientCollaboratorError(kind, symbol + ": AI call failed: " + response.error);
    }

    LOGF_DEBUG(Ai, "%s: AI responded in %u ms (%u in / %u out tokens)", symbol.c_str(), response.latency_ms,
               response.input_tokens, response.output_tokens);

    if (util::trim(response.output).empty()) {
        throw ParseError(symbol + ": empty AI response");
    }
    raw_output = response.output;
    return parse_trade_signal(response.output);
}

IdentifiedTrade TradeSignalPipeline::to_trade(const std::string& symbol, const TradeSignal& sig,
                                              const std::string& raw_output, const std::string& request_id,
                                              int64_t now_ms) const {
    IdentifiedTrade trade;
    trade.symbol = symbol;
    trade.direction = direction_to_string(sig.direction);
    trade.identified_at = now_ms;
    trade.confidence = sig.confidence;
    trade.status = TradeStatus::Identified;

    trade.entry_zone_type = sig.entry.zone_type;
    trade.entry_zone = sig.entry.zone;
    trade.entry_price = sig.entry.price;
    trade.stop_placement = sig.stop.placement;
    trade.stop_price = sig.stop.price;
    for (const auto& t : sig.targets) {
        trade.targets.push_back(target_text(t));
    }
    trade.rr_hint = sig.risk_reward;

    trade.narrative = sig.narrative;
    trade.trigger_conditions = sig.trigger_conditions;
    trade.invalidations = sig.invalidations;
    trade.session_label = sig.session_label.empty() ? util::session_label(now_ms) : sig.session_label;
    trade.timeframe = sig.timeframe;

    trade.dedupe_key = make_dedupe_key(symbol, trade.direction, sig.entry.zone, now_ms);

    trade.created_at = now_ms;
    trade.updated_at = now_ms;
    trade.expires_at = now_ms + static_cast<int64_t>(settings_.trade_expiry_hours) * util::MS_PER_HOUR;

    trade.ai_request_id = request_id;
    trade.ai_full_response = raw_output;
    return trade;
}

void TradeSignalPipeline::send_alert(IdentifiedTrade& trade, SymbolRunResult& result) {
    alert::ConfidenceThresholds thresholds{settings_.confidence_threshold_high, settings_.confidence_threshold_medium};
    result.tier = alert::classify_confidence(trade.confidence, thresholds);
    const char* tier_name = alert::alert_tier_to_string(result.tier);

    if (result.tier == alert::AlertTier::LogOnly) {
        LOGF_INFO(Alert, "Trade %s below alert threshold (conf=%d), logged only", trade.id.c_str(), trade.confidence);
        return;
    }

    if (!alerts_) {
        LOGF_WARN(Alert, "No alert channel configured, %s alert for %s not sent", tier_name, trade.id.c_str());
        journal(JournalEventType::AlertFailed, trade.symbol, trade.id + " no alert channel");
        return;
    }

    try {
        alerts_->dispatch(result.tier, trade);
    } catch (const std::exception& e) {
        // Trade stays IDENTIFIED; no retry
        LOGF_ERROR(Alert, "%s alert for %s failed: %s", tier_name, trade.id.c_str(), e.what());
        journal(JournalEventType::AlertFailed, trade.symbol, trade.id + " " + e.what());
        return;
    }

    store::TransitionOutcome outcome;
    try {
        outcome = trades_.mark_alerted(trade.id, tier_name, clock_());
    } catch (const std::exception& e) {
        LOGF_ERROR(Alert, "Alert sent but trade %s could not be marked ALERTED: %s", trade.id.c_str(), e.what());
        return;
    }
    if (outcome != store::TransitionOutcome::Ok) {
        LOGF_WARN(Alert, "Alert sent but trade %s could not be marked ALERTED", trade.id.c_str());
        return;
    }
    result.alert_sent = true;
    LOGF_INFO(Alert, "%s alert sent for %s", tier_name, trade.id.c_str());
    journal(JournalEventType::AlertSent, trade.symbol, trade.id + " " + tier_name);
}

// ============================================================================
// Scheduled and manual entry points
// ============================================================================

void TradeSignalPipeline::find_trades(const json& parameters) {
    if (!settings_.enabled) {
        LOG_INFO(Pipeline, "Trade finder disabled, skipping run");
        return;
    }

    std::vector<std::string> symbols = symbols_from(parameters, settings_.symbols);
    std::vector<std::pair<std::string, std::exception_ptr>> failures;
    size_t persisted = 0;

    for (const auto& symbol : symbols) {
        try {
            if (run(symbol, RUN_CONTEXT_SCHEDULED).outcome == RunOutcome::TradePersisted) {
                ++persisted;
            }
        } catch (const std::exception& e) {
            LOGF_ERROR(Pipeline, "%s: run failed: %s", symbol.c_str(), e.what());
            failures.emplace_back(symbol, std::current_exception());
        }
    }

    LOGF_INFO(Pipeline, "Trade finder pass done: %zu symbols, %zu new trades, %zu failed", symbols.size(), persisted,
              failures.size());

    if (failures.size() == 1) {
        std::rethrow_exception(failures.front().second);
    }
    if (failures.size() > 1) {
        std::string message = std::to_string(failures.size()) + " of " + std::to_string(symbols.size()) +
                              " symbols failed:";
        for (const auto& [symbol, ptr] : failures) {
            try {
                std::rethrow_exception(ptr);
            } catch (const std::exception& e) {
                message += " " + symbol + ": " + e.what() + ";";
            }
        }
        throw std::runtime_error(message);
    }
}

TriggerSummary TradeSignalPipeline::trigger(const std::string& symbol_or_all) {
    TriggerSummary summary;
    const int64_t started = clock_();

    std::string target = util::to_upper(util::trim(symbol_or_all));
    std::vector<std::string> symbols;
    if (target.empty() || target == "ALL") {
        symbols = settings_.symbols;
    } else {
        symbols = util::split_symbols(target);
    }

    for (const auto& symbol : symbols) {
        ++summary.symbols_analyzed;
        try {
            SymbolRunResult r = run(symbol, RUN_CONTEXT_MANUAL);
            switch (r.outcome) {
            case RunOutcome::TradePersisted:
                ++summary.trades_persisted;
                break;
            case RunOutcome::Duplicate:
                ++summary.duplicates;
                break;
            case RunOutcome::NoSetup:
                ++summary.no_setup;
                break;
            case RunOutcome::Failed:
                break;
            }
            summary.results.push_back(std::move(r));
        } catch (const std::exception& e) {
            LOGF_ERROR(Pipeline, "%s: manual run failed: %s", symbol.c_str(), e.what());
            summary.errors[symbol] = e.what();
            SymbolRunResult failed;
            failed.symbol = symbol;
            failed.outcome = RunOutcome::Failed;
            failed.error = e.what();
            summary.results.push_back(std::move(failed));
        }
    }

    summary.duration_ms = clock_() - started;
    return summary;
}

void TradeSignalPipeline::journal(JournalEventType type, const std::string& source, const std::string& message) {
    if (journal_) {
        journal_->record(type, clock_(), source, message);
    }
}

}  // namespace tradefinder::signal
