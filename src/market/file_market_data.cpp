#include "../../include/market/file_market_data.hpp"

#include "../../include/errors.hpp"
#include "../../include/logging/async_logger.hpp"
#include "../../include/util/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <deque>
#include <filesystem>
#include <fstream>

using json = nlohmann::json;

namespace tradefinder::market {

namespace {

// Opens `path` for reading. Returns false if it does not exist,
// throws if it exists but cannot be opened.
bool open_lines(const std::string& path, std::ifstream& in) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return false;
    }
    in.open(path);
    if (!in.is_open()) {
        throw TransientCollaboratorError(TransientCollaboratorError::Kind::Unavailable,
                                         "cannot read market data file " + path);
    }
    return true;
}

}  // namespace

std::vector<MarketEvent> FileMarketData::recent_events(const std::string& symbol, int lookback_minutes,
                                                       int64_t now_ms) {
    std::vector<MarketEvent> events;
    std::string path = data_dir_ + "/events/" + symbol + ".jsonl";
    std::ifstream in;
    if (!open_lines(path, in))
        return events;

    int64_t cutoff = now_ms - static_cast<int64_t>(lookback_minutes) * util::MS_PER_MINUTE;
    size_t skipped = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty())
            continue;
        json j = json::parse(line, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            ++skipped;
            continue;
        }

        MarketEvent e;
        try {
            e.event_ts = j.value("ts", int64_t{0});
            if (e.event_ts < cutoff || e.event_ts > now_ms)
                continue;
            e.symbol = symbol;
            e.indicator = j.value("indicator", std::string());
            e.direction_code = j.value("direction", std::string());
            e.timeframe = j.value("timeframe", std::string());
            e.price = j.value("price", 0.0);
            e.details = j.value("details", std::string());
            e.action_code = j.value("action", std::string());
            e.uec = j.value("uec", std::string());
            e.trigger_reasoner = j.value("trigger", false);
        } catch (const json::type_error&) {
            ++skipped;
            continue;
        }
        events.push_back(std::move(e));
    }

    if (skipped > 0) {
        LOGF_WARN(Pipeline, "Skipped %zu malformed event lines in %s", skipped, path.c_str());
    }

    std::stable_sort(events.begin(), events.end(),
                     [](const MarketEvent& a, const MarketEvent& b) { return a.event_ts > b.event_ts; });
    return events;
}

std::vector<Candle> FileMarketData::recent_candles(const std::string& symbol, const std::string& timeframe, int count,
                                                   int64_t now_ms) {
    std::vector<Candle> result;
    if (count <= 0)
        return result;

    std::string path = data_dir_ + "/candles/" + symbol + "_" + timeframe + ".jsonl";
    std::ifstream in;
    if (!open_lines(path, in))
        return result;

    // Bounded window: candles older than count bars are irrelevant
    int64_t cutoff = now_ms - static_cast<int64_t>(count) * timeframe_minutes(timeframe) * util::MS_PER_MINUTE;
    std::deque<Candle> window;
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty())
            continue;
        json j = json::parse(line, nullptr, false);
        if (j.is_discarded() || !j.is_object())
            continue;

        Candle c;
        try {
            c.timestamp = j.value("ts", int64_t{0});
            if (c.timestamp < cutoff || c.timestamp > now_ms)
                continue;
            c.open = j.value("o", 0.0);
            c.high = j.value("h", 0.0);
            c.low = j.value("l", 0.0);
            c.close = j.value("c", 0.0);
            c.volume = j.value("v", int64_t{0});
        } catch (const json::type_error&) {
            continue;
        }
        window.push_back(c);
        if (window.size() > static_cast<size_t>(count)) {
            window.pop_front();
        }
    }

    result.assign(window.begin(), window.end());
    std::stable_sort(result.begin(), result.end(),
                     [](const Candle& a, const Candle& b) { return a.timestamp < b.timestamp; });
    return result;
}

}  // namespace tradefinder::market
