#pragma once

/**
 * WebhookAlertDispatcher - posts trade alerts as JSON to an HTTP endpoint
 *
 * The receiving side (SMS / Telegram / voice bridge) decides which channels
 * a tier maps to. Any non-2xx reply or transport error is an
 * AlertDeliveryError.
 *
 * Body:
 *   {"tier":"CALL_SMS_TELEGRAM","trade_id":"trd_000001","symbol":"NQ",
 *    "direction":"LONG","confidence":85,"entry_zone":"21450-21460",
 *    "entry_price":21455.0,"stop_price":21430.0,"targets":[...],
 *    "narrative":"...","expires_at":"2026-03-09T18:30:00Z","text":"..."}
 */

#include "alert_dispatcher.hpp"

#include <string>

namespace tradefinder {
namespace alert {

class WebhookAlertDispatcher : public AlertDispatcher {
public:
    WebhookAlertDispatcher(std::string url, long timeout_ms);

    void dispatch(AlertTier tier, const signal::IdentifiedTrade& trade) override;

    // Exposed for tests
    static std::string build_body(AlertTier tier, const signal::IdentifiedTrade& trade);
    static std::string summary_text(AlertTier tier, const signal::IdentifiedTrade& trade);

private:
    std::string url_;
    long timeout_ms_;
};

}  // namespace alert
}  // namespace tradefinder
