#pragma once

/**
 * FileMarketData - market data read from JSON-lines files
 *
 * Layout under the data directory (written by the ingest side):
 *   events/<SYMBOL>.jsonl              one MarketEvent per line
 *   candles/<SYMBOL>_<timeframe>.jsonl one Candle per line, ascending time
 *
 * Event line:  {"ts":1760000000000,"indicator":"CISD","direction":"BULLISH",
 *               "timeframe":"5m","price":21450.25,"details":"...","action":"...",
 *               "uec":"...","trigger":true}
 * Candle line: {"ts":1760000000000,"o":1,"h":2,"l":0.5,"c":1.5,"v":1200}
 *
 * A missing file is an empty result; malformed lines are skipped.
 */

#include "market_data.hpp"

#include <string>

namespace tradefinder {
namespace market {

class FileMarketData : public MarketDataSource {
public:
    explicit FileMarketData(std::string data_dir) : data_dir_(std::move(data_dir)) {}

    std::vector<MarketEvent> recent_events(const std::string& symbol, int lookback_minutes, int64_t now_ms) override;

    std::vector<Candle> recent_candles(const std::string& symbol, const std::string& timeframe, int count,
                                       int64_t now_ms) override;

private:
    std::string data_dir_;
};

}  // namespace market
}  // namespace tradefinder
