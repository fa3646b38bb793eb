#pragma once

/**
 * Analysis payload for the AI collaborator
 *
 * {
 *   "meta": {"symbol","date","now_ts","session_label","run_context","requested_timeframes"},
 *   "analysis_profile": "SILVER_BULLET_WINDOW",
 *   "task": "...",
 *   "event_stream": [{"ts","indicator","category","direction","timeframe","price",...}],
 *   "ohlc_context": {"5m": [{"timestamp","open","high","low","close","volume"}], ...},
 *   "manual_levels": {...}          // only when configured for the symbol
 * }
 */

#include "../market/market_data.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

namespace tradefinder {
namespace signal {

constexpr const char* RUN_CONTEXT_SCHEDULED = "SCHEDULED_TRADE_FINDER";
constexpr const char* RUN_CONTEXT_MANUAL = "MANUAL_TRIGGER";

struct PayloadInput {
    std::string symbol;
    int64_t now_ms = 0;
    std::string run_context = RUN_CONTEXT_SCHEDULED;
    std::string analysis_profile;
    std::vector<std::string> timeframes;
    std::vector<market::MarketEvent> events;                  // newest first
    std::map<std::string, std::vector<market::Candle>> ohlc;  // timeframe -> candles
    nlohmann::json manual_levels;                             // null = omitted
};

// cisd, smt, fvg, sweep, oscillator, other (unknown for empty codes)
std::string event_category(const std::string& indicator);

// B (bullish), S (bearish) or N
std::string direction_code(const std::string& source_direction);

nlohmann::json build_payload(const PayloadInput& input);

}  // namespace signal
}  // namespace tradefinder
