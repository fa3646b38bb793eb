#include "../../include/signal/payload_builder.hpp"

#include "../../include/util/string_utils.hpp"
#include "../../include/util/time_utils.hpp"

using json = nlohmann::json;

namespace tradefinder::signal {

namespace {

constexpr const char* TASK_TEXT =
    "Analyze recent market events and identify high-confluence trade setup with entry, stop, and targets.";

bool contains(const std::string& haystack, const char* needle) { return haystack.find(needle) != std::string::npos; }

json event_to_json(const market::MarketEvent& e) {
    json j = {{"ts", util::format_iso8601_utc(e.event_ts)},
              {"indicator", e.indicator},
              {"category", event_category(e.indicator)},
              {"direction", direction_code(e.direction_code)},
              {"timeframe", e.timeframe},
              {"is_trigger_reasoner", e.trigger_reasoner}};
    if (e.price != 0.0)
        j["price"] = e.price;
    if (!e.details.empty())
        j["details"] = e.details;
    if (!e.action_code.empty())
        j["action_code"] = e.action_code;
    if (!e.uec.empty())
        j["uec"] = e.uec;
    return j;
}

json candle_to_json(const market::Candle& c) {
    return json{{"timestamp", util::format_iso8601_utc(c.timestamp)},
                {"open", c.open},
                {"high", c.high},
                {"low", c.low},
                {"close", c.close},
                {"volume", c.volume}};
}

}  // namespace

std::string event_category(const std::string& indicator) {
    if (indicator.empty())
        return "unknown";

    std::string code = util::to_lower(indicator);
    if (contains(code, "cisd"))
        return "cisd";
    if (contains(code, "smt"))
        return "smt";
    if (contains(code, "fvg") || contains(code, "imbalance"))
        return "fvg";
    if (contains(code, "sweep") || contains(code, "liquidity"))
        return "sweep";
    if (contains(code, "rsi") || contains(code, "macd"))
        return "oscillator";
    return "other";
}

std::string direction_code(const std::string& source_direction) {
    std::string code = util::to_upper(util::trim(source_direction));
    if (code.empty())
        return "N";
    // Words first: "BEARISH" starts with B
    if (contains(code, "BULL") || contains(code, "UP") || code == "LONG")
        return "B";
    if (contains(code, "BEAR") || contains(code, "DOWN") || code == "SHORT")
        return "S";
    if (code[0] == 'B')
        return "B";
    if (code[0] == 'S')
        return "S";
    return "N";
}

json build_payload(const PayloadInput& input) {
    json meta = {{"symbol", input.symbol},
                 {"date", util::format_date_new_york(input.now_ms)},
                 {"now_ts", util::format_iso8601_utc(input.now_ms)},
                 {"session_label", util::session_label(input.now_ms)},
                 {"run_context", input.run_context},
                 {"requested_timeframes", input.timeframes}};

    json events = json::array();
    for (const auto& e : input.events) {
        events.push_back(event_to_json(e));
    }

    json ohlc = json::object();
    for (const auto& tf : input.timeframes) {
        json candles = json::array();
        auto it = input.ohlc.find(tf);
        if (it != input.ohlc.end()) {
            for (const auto& c : it->second) {
                candles.push_back(candle_to_json(c));
            }
        }
        ohlc[tf] = std::move(candles);
    }

    json payload = {{"meta", std::move(meta)},
                    {"analysis_profile", input.analysis_profile},
                    {"task", TASK_TEXT},
                    {"event_stream", std::move(events)},
                    {"ohlc_context", std::move(ohlc)}};
    if (!input.manual_levels.is_null()) {
        payload["manual_levels"] = input.manual_levels;
    }
    return payload;
}

}  // namespace tradefinder::signal
