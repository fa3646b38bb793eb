#pragma once

/**
 * Market data collaborators for the trade signal pipeline
 *
 * MarketEvent: one transformed indicator event (CISD, SMT, FVG, sweep...)
 * Candle:      one OHLC bar for a timeframe
 *
 * Implementations throw TransientCollaboratorError(Unavailable) when the
 * backing source cannot be read. An unknown symbol is not an error and
 * yields an empty result.
 */

#include <cstdint>
#include <string>
#include <vector>

namespace tradefinder {
namespace market {

struct MarketEvent {
    int64_t event_ts = 0; // epoch ms
    std::string symbol;
    std::string indicator;      // short code, e.g. "CISD_BULL", "FVG"
    std::string direction_code; // free-form source direction, e.g. "BULLISH"
    std::string timeframe;
    double price = 0.0; // approximate price at event, 0 = unknown
    std::string details;
    std::string action_code;
    std::string uec; // unique event code
    bool trigger_reasoner = false;
};

struct Candle {
    int64_t timestamp = 0; // bar open, epoch ms
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    int64_t volume = 0;
};

class MarketDataSource {
public:
    virtual ~MarketDataSource() = default;

    /**
     * Events for `symbol` with event_ts >= now - lookback, newest first.
     */
    virtual std::vector<MarketEvent> recent_events(const std::string& symbol, int lookback_minutes,
                                                   int64_t now_ms) = 0;

    /**
     * At most `count` most recent candles, oldest first.
     */
    virtual std::vector<Candle> recent_candles(const std::string& symbol, const std::string& timeframe, int count,
                                               int64_t now_ms) = 0;
};

/**
 * Minutes per bar for a timeframe label ("5m", "1h", "4h", "1d").
 * Unknown labels count as 5 minutes.
 */
inline int timeframe_minutes(const std::string& timeframe) {
    if (timeframe == "1m")
        return 1;
    if (timeframe == "5m")
        return 5;
    if (timeframe == "15m")
        return 15;
    if (timeframe == "30m")
        return 30;
    if (timeframe == "1h" || timeframe == "60m")
        return 60;
    if (timeframe == "4h")
        return 240;
    if (timeframe == "1d")
        return 1440;
    return 5;
}

}  // namespace market
}  // namespace tradefinder
