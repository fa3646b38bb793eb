#pragma once

/**
 * TradeSignal - structured verdict returned by the AI collaborator
 *
 * Ephemeral: only a unique TRADE_IDENTIFIED verdict is ever persisted,
 * as an IdentifiedTrade.
 */

#include <cstdint>
#include <string>
#include <vector>

namespace tradefinder {
namespace signal {

enum class SignalStatus : uint8_t { TradeIdentified, NoSetup, InsufficientData, Error };

enum class Direction : uint8_t { Long, Short };

inline const char* signal_status_to_string(SignalStatus status) {
    switch (status) {
    case SignalStatus::TradeIdentified:
        return "TRADE_IDENTIFIED";
    case SignalStatus::NoSetup:
        return "NO_SETUP";
    case SignalStatus::InsufficientData:
        return "INSUFFICIENT_DATA";
    case SignalStatus::Error:
        return "ERROR";
    }
    return "ERROR";
}

inline bool signal_status_from_string(const std::string& name, SignalStatus& out) {
    if (name == "TRADE_IDENTIFIED") {
        out = SignalStatus::TradeIdentified;
    } else if (name == "NO_SETUP") {
        out = SignalStatus::NoSetup;
    } else if (name == "INSUFFICIENT_DATA") {
        out = SignalStatus::InsufficientData;
    } else if (name == "ERROR") {
        out = SignalStatus::Error;
    } else {
        return false;
    }
    return true;
}

inline const char* direction_to_string(Direction d) { return d == Direction::Long ? "LONG" : "SHORT"; }

inline bool direction_from_string(const std::string& name, Direction& out) {
    if (name == "LONG") {
        out = Direction::Long;
    } else if (name == "SHORT") {
        out = Direction::Short;
    } else {
        return false;
    }
    return true;
}

struct EntryInfo {
    std::string zone_type; // e.g. "FVG", "OB"
    std::string zone;      // e.g. "21450-21460"
    double price = 0.0;    // 0 = not given
    std::string method;
};

struct StopInfo {
    std::string placement;
    double price = 0.0;
    std::string reasoning;
};

struct TargetInfo {
    std::string level;
    double price = 0.0;
    std::string description;
};

struct TradeSignal {
    SignalStatus status = SignalStatus::Error;
    Direction direction = Direction::Long;
    bool has_direction = false;
    std::string symbol;
    std::string timeframe;
    int confidence = 0;
    bool has_confidence = false;
    EntryInfo entry;
    bool has_entry = false;
    StopInfo stop;
    std::vector<TargetInfo> targets;
    std::string risk_reward;
    std::string narrative;
    std::vector<std::string> trigger_conditions;
    std::vector<std::string> invalidations;
    std::string session_label;
    std::string notes;
};

}  // namespace signal
}  // namespace tradefinder
