#pragma once

/**
 * IdentifiedTrade - persisted trade record and its lifecycle state machine
 *
 *   IDENTIFIED -> ALERTED                       (alert dispatch succeeded)
 *   IDENTIFIED | ALERTED -> EXPIRED             (sweep, now >= expires_at)
 *   IDENTIFIED | ALERTED -> TAKEN | INVALIDATED | CANCELLED   (manual)
 *   EXPIRED, TAKEN, INVALIDATED, CANCELLED are terminal.
 *
 * Records are never deleted. dedupe_key is unique across the collection.
 */

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace tradefinder {
namespace signal {

enum class TradeStatus : uint8_t { Identified, Alerted, Expired, Cancelled, Taken, Invalidated };

inline const char* trade_status_to_string(TradeStatus status) {
    switch (status) {
    case TradeStatus::Identified:
        return "IDENTIFIED";
    case TradeStatus::Alerted:
        return "ALERTED";
    case TradeStatus::Expired:
        return "EXPIRED";
    case TradeStatus::Cancelled:
        return "CANCELLED";
    case TradeStatus::Taken:
        return "TAKEN";
    case TradeStatus::Invalidated:
        return "INVALIDATED";
    }
    return "IDENTIFIED";
}

inline bool trade_status_from_string(const std::string& name, TradeStatus& out) {
    static constexpr TradeStatus ALL[] = {TradeStatus::Identified, TradeStatus::Alerted, TradeStatus::Expired,
                                          TradeStatus::Cancelled,  TradeStatus::Taken,   TradeStatus::Invalidated};
    for (TradeStatus s : ALL) {
        if (name == trade_status_to_string(s)) {
            out = s;
            return true;
        }
    }
    return false;
}

inline bool is_open(TradeStatus status) { return status == TradeStatus::Identified || status == TradeStatus::Alerted; }

inline bool is_terminal(TradeStatus status) { return !is_open(status); }

inline bool can_transition(TradeStatus from, TradeStatus to) {
    switch (to) {
    case TradeStatus::Alerted:
        return from == TradeStatus::Identified;
    case TradeStatus::Expired:
    case TradeStatus::Taken:
    case TradeStatus::Invalidated:
    case TradeStatus::Cancelled:
        return is_open(from);
    case TradeStatus::Identified:
        return false;
    }
    return false;
}

// Targets a manual status update may request
inline bool is_manual_target(TradeStatus to) {
    return to == TradeStatus::Taken || to == TradeStatus::Invalidated || to == TradeStatus::Cancelled;
}

struct IdentifiedTrade {
    std::string id;
    std::string symbol;
    std::string direction; // LONG / SHORT
    int64_t identified_at = 0;
    int confidence = 0;
    TradeStatus status = TradeStatus::Identified;

    // Entry / stop / targets snapshot
    std::string entry_zone_type;
    std::string entry_zone;
    double entry_price = 0.0;
    std::string stop_placement;
    double stop_price = 0.0;
    std::vector<std::string> targets;
    std::string rr_hint;

    // Context
    std::string narrative;
    std::vector<std::string> trigger_conditions;
    std::vector<std::string> invalidations;
    std::string session_label;
    std::string timeframe;

    std::string dedupe_key;

    bool alert_sent = false;
    int64_t alert_sent_at = 0;
    std::string alert_type;

    int64_t created_at = 0;
    int64_t expires_at = 0;
    int64_t updated_at = 0;

    std::string ai_request_id;
    std::string ai_full_response;
};

inline void to_json(nlohmann::json& j, const IdentifiedTrade& t) {
    j = nlohmann::json{{"id", t.id},
                       {"symbol", t.symbol},
                       {"direction", t.direction},
                       {"identified_at", t.identified_at},
                       {"confidence", t.confidence},
                       {"status", trade_status_to_string(t.status)},
                       {"entry_zone_type", t.entry_zone_type},
                       {"entry_zone", t.entry_zone},
                       {"entry_price", t.entry_price},
                       {"stop_placement", t.stop_placement},
                       {"stop_price", t.stop_price},
                       {"targets", t.targets},
                       {"rr_hint", t.rr_hint},
                       {"narrative", t.narrative},
                       {"trigger_conditions", t.trigger_conditions},
                       {"invalidations", t.invalidations},
                       {"session_label", t.session_label},
                       {"timeframe", t.timeframe},
                       {"dedupe_key", t.dedupe_key},
                       {"alert_sent", t.alert_sent},
                       {"alert_sent_at", t.alert_sent_at},
                       {"alert_type", t.alert_type},
                       {"created_at", t.created_at},
                       {"expires_at", t.expires_at},
                       {"updated_at", t.updated_at},
                       {"ai_request_id", t.ai_request_id},
                       {"ai_full_response", t.ai_full_response}};
}

inline void from_json(const nlohmann::json& j, IdentifiedTrade& t) {
    t.id = j.value("id", std::string());
    t.symbol = j.value("symbol", std::string());
    t.direction = j.value("direction", std::string());
    t.identified_at = j.value("identified_at", int64_t{0});
    t.confidence = j.value("confidence", 0);
    if (!trade_status_from_string(j.value("status", std::string("IDENTIFIED")), t.status)) {
        t.status = TradeStatus::Identified;
    }
    t.entry_zone_type = j.value("entry_zone_type", std::string());
    t.entry_zone = j.value("entry_zone", std::string());
    t.entry_price = j.value("entry_price", 0.0);
    t.stop_placement = j.value("stop_placement", std::string());
    t.stop_price = j.value("stop_price", 0.0);
    t.targets = j.value("targets", std::vector<std::string>());
    t.rr_hint = j.value("rr_hint", std::string());
    t.narrative = j.value("narrative", std::string());
    t.trigger_conditions = j.value("trigger_conditions", std::vector<std::string>());
    t.invalidations = j.value("invalidations", std::vector<std::string>());
    t.session_label = j.value("session_label", std::string());
    t.timeframe = j.value("timeframe", std::string());
    t.dedupe_key = j.value("dedupe_key", std::string());
    t.alert_sent = j.value("alert_sent", false);
    t.alert_sent_at = j.value("alert_sent_at", int64_t{0});
    t.alert_type = j.value("alert_type", std::string());
    t.created_at = j.value("created_at", int64_t{0});
    t.expires_at = j.value("expires_at", int64_t{0});
    t.updated_at = j.value("updated_at", int64_t{0});
    t.ai_request_id = j.value("ai_request_id", std::string());
    t.ai_full_response = j.value("ai_full_response", std::string());
}

}  // namespace signal
}  // namespace tradefinder
