#include "../../include/signal/signal_parser.hpp"

#include "../../include/errors.hpp"
#include "../../include/util/string_utils.hpp"
#include "../../include/util/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>

using json = nlohmann::json;

namespace tradefinder::signal {

namespace {

std::string string_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return "";
    if (it->is_string())
        return it->get<std::string>();
    return it->dump();
}

// Prices arrive as numbers or numeric strings
double price_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return 0.0;
    if (it->is_number())
        return it->get<double>();
    if (it->is_string()) {
        const std::string& s = it->get_ref<const std::string&>();
        char* end = nullptr;
        double v = std::strtod(s.c_str(), &end);
        return end != s.c_str() ? v : 0.0;
    }
    return 0.0;
}

std::vector<std::string> string_list(const json& j, const char* key) {
    std::vector<std::string> out;
    auto it = j.find(key);
    if (it == j.end() || !it->is_array())
        return out;
    for (const auto& item : *it) {
        out.push_back(item.is_string() ? item.get<std::string>() : item.dump());
    }
    return out;
}

}  // namespace

TradeSignal parse_trade_signal(const std::string& ai_output) {
    std::string clean = util::strip_code_fence(ai_output);
    if (clean.empty()) {
        throw ParseError("empty AI output");
    }

    json doc;
    try {
        doc = json::parse(clean);
    } catch (const json::parse_error& e) {
        throw ParseError(std::string("AI output is not valid JSON: ") + e.what());
    }
    if (!doc.is_object()) {
        throw ParseError("AI output is not a JSON object");
    }

    TradeSignal result;
    std::string status = string_field(doc, "status");
    if (!signal_status_from_string(status, result.status)) {
        throw ParseError("unknown signal status '" + status + "'");
    }

    std::string direction = string_field(doc, "direction");
    result.has_direction = direction_from_string(util::to_upper(direction), result.direction);

    auto conf = doc.find("confidence");
    if (conf != doc.end() && conf->is_number()) {
        // Fractional confidences are truncated
        double value = conf->get<double>();
        result.confidence = value > 1e6 ? 1000000 : (value < -1e6 ? -1000000 : static_cast<int>(value));
        result.has_confidence = true;
    } else if (conf != doc.end() && !conf->is_null()) {
        throw ParseError("confidence is not a number");
    }

    result.symbol = string_field(doc, "symbol");
    result.timeframe = string_field(doc, "timeframe");

    auto entry = doc.find("entry");
    if (entry != doc.end() && entry->is_object()) {
        result.has_entry = true;
        result.entry.zone_type = string_field(*entry, "zone_type");
        result.entry.zone = string_field(*entry, "zone");
        result.entry.price = price_field(*entry, "price");
        result.entry.method = string_field(*entry, "method");
    }

    auto stop = doc.find("stop");
    if (stop != doc.end() && stop->is_object()) {
        result.stop.placement = string_field(*stop, "placement");
        result.stop.price = price_field(*stop, "price");
        result.stop.reasoning = string_field(*stop, "reasoning");
    }

    auto targets = doc.find("targets");
    if (targets != doc.end() && targets->is_array()) {
        for (const auto& t : *targets) {
            if (!t.is_object())
                continue;
            TargetInfo target;
            target.level = string_field(t, "level");
            target.price = price_field(t, "price");
            target.description = string_field(t, "description");
            result.targets.push_back(target);
        }
    }

    result.risk_reward = string_field(doc, "risk_reward");
    result.narrative = string_field(doc, "narrative");
    result.trigger_conditions = string_list(doc, "trigger_conditions");
    result.invalidations = string_list(doc, "invalidations");
    result.session_label = string_field(doc, "session_label");
    result.notes = string_field(doc, "notes");
    return result;
}

void validate_identified(const TradeSignal& sig) {
    if (!sig.has_direction) {
        throw ParseError("TRADE_IDENTIFIED verdict without LONG/SHORT direction");
    }
    if (!sig.has_confidence) {
        throw ParseError("TRADE_IDENTIFIED verdict without confidence");
    }
    if (sig.confidence < 0 || sig.confidence > 100) {
        throw ParseError("confidence " + std::to_string(sig.confidence) + " outside [0,100]");
    }
    if (!sig.has_entry || util::trim(sig.entry.zone).empty()) {
        throw ParseError("TRADE_IDENTIFIED verdict without entry zone");
    }
}

std::string make_dedupe_key(const std::string& symbol, const std::string& direction, const std::string& zone,
                            int64_t now_ms) {
    std::string clean_zone = zone.empty() ? "NONE" : util::replace_all(util::replace_all(zone, "-", "_"), " ", "");
    return symbol + "_" + direction + "_" + clean_zone + "_" + util::hour_bucket_new_york(now_ms);
}

}  // namespace tradefinder::signal
