#pragma once

/**
 * Alert tiers and the AlertDispatcher collaborator
 *
 * Tier by confidence (lower bounds inclusive):
 *   confidence >= high             CALL_SMS_TELEGRAM
 *   medium <= confidence < high    SMS_TELEGRAM
 *   confidence < medium            LOG_ONLY (never dispatched)
 */

#include "../signal/identified_trade.hpp"

#include <cstdint>

namespace tradefinder {
namespace alert {

enum class AlertTier : uint8_t { LogOnly, SmsTelegram, CallSmsTelegram };

inline const char* alert_tier_to_string(AlertTier tier) {
    switch (tier) {
    case AlertTier::LogOnly:
        return "LOG_ONLY";
    case AlertTier::SmsTelegram:
        return "SMS_TELEGRAM";
    case AlertTier::CallSmsTelegram:
        return "CALL_SMS_TELEGRAM";
    }
    return "LOG_ONLY";
}

struct ConfidenceThresholds {
    int high = 80;
    int medium = 60;
};

inline AlertTier classify_confidence(int confidence, const ConfidenceThresholds& t = {}) {
    if (confidence >= t.high)
        return AlertTier::CallSmsTelegram;
    if (confidence >= t.medium)
        return AlertTier::SmsTelegram;
    return AlertTier::LogOnly;
}

/**
 * Best-effort delivery; no retries. Throws AlertDeliveryError on failure.
 */
class AlertDispatcher {
public:
    virtual ~AlertDispatcher() = default;

    virtual void dispatch(AlertTier tier, const signal::IdentifiedTrade& trade) = 0;
};

}  // namespace alert
}  // namespace tradefinder
