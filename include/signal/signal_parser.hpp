#pragma once

/**
 * AI verdict parsing
 *
 * parse_trade_signal() turns the raw AI output (optionally wrapped in a
 * markdown code fence) into a TradeSignal. Anything that is not a JSON
 * object with a known status is a ParseError.
 *
 * validate_identified() applies the extra checks a TRADE_IDENTIFIED verdict
 * must pass before it may be persisted.
 */

#include "trade_signal.hpp"

#include <string>

namespace tradefinder {
namespace signal {

// Throws ParseError
TradeSignal parse_trade_signal(const std::string& ai_output);

// Throws ParseError: missing/unknown direction, confidence outside [0,100], missing entry zone
void validate_identified(const TradeSignal& signal);

/**
 * "{symbol}_{direction}_{zone}_{yyyyMMdd_HH}" with the hour bucket in
 * New York local time. In the zone '-' becomes '_' and spaces are dropped;
 * an empty zone is written as NONE.
 */
std::string make_dedupe_key(const std::string& symbol, const std::string& direction, const std::string& zone,
                            int64_t now_ms);

}  // namespace signal
}  // namespace tradefinder
