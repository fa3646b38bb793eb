/**
 * Test alert tier classification and the webhook alert body
 */

#include "test_macros.hpp"

#include "../include/alert/webhook_alert_dispatcher.hpp"

#include <nlohmann/json.hpp>

using namespace tradefinder;
using namespace tradefinder::alert;

namespace {

signal::IdentifiedTrade sample_trade() {
    signal::IdentifiedTrade t;
    t.id = "trd_000001";
    t.symbol = "NQ";
    t.direction = "LONG";
    t.confidence = 85;
    t.entry_zone_type = "FVG";
    t.entry_zone = "21450-21460";
    t.entry_price = 21455.0;
    t.stop_placement = "below sweep low";
    t.stop_price = 21430.0;
    t.targets = {"PDH", "21580.50"};
    t.narrative = "Sweep then CISD";
    t.session_label = "NY_AM";
    t.expires_at = 1773081000000LL; // 2026-03-09T18:30:00Z
    return t;
}

}  // namespace

TEST(tier_boundaries) {
    ASSERT_TRUE(classify_confidence(100) == AlertTier::CallSmsTelegram);
    ASSERT_TRUE(classify_confidence(80) == AlertTier::CallSmsTelegram);
    ASSERT_TRUE(classify_confidence(79) == AlertTier::SmsTelegram);
    ASSERT_TRUE(classify_confidence(60) == AlertTier::SmsTelegram);
    ASSERT_TRUE(classify_confidence(59) == AlertTier::LogOnly);
    ASSERT_TRUE(classify_confidence(0) == AlertTier::LogOnly);

    ConfidenceThresholds strict{90, 75};
    ASSERT_TRUE(classify_confidence(85, strict) == AlertTier::SmsTelegram);
    ASSERT_TRUE(classify_confidence(74, strict) == AlertTier::LogOnly);
}

TEST(webhook_body_fields) {
    auto body = nlohmann::json::parse(WebhookAlertDispatcher::build_body(AlertTier::CallSmsTelegram, sample_trade()));
    ASSERT_EQ(body["tier"].get<std::string>(), std::string("CALL_SMS_TELEGRAM"));
    ASSERT_EQ(body["trade_id"].get<std::string>(), std::string("trd_000001"));
    ASSERT_EQ(body["confidence"].get<int>(), 85);
    ASSERT_EQ(body["targets"].size(), 2u);
    ASSERT_EQ(body["expires_at"].get<std::string>(), std::string("2026-03-09T18:30:00Z"));
    ASSERT_TRUE(body["text"].get<std::string>().find("NQ LONG 85%") != std::string::npos);
}

TEST(summary_text_names_tier) {
    auto text = WebhookAlertDispatcher::summary_text(AlertTier::SmsTelegram, sample_trade());
    ASSERT_EQ(text.rfind("[SMS_TELEGRAM]", 0), 0u);
    ASSERT_TRUE(text.find("21450-21460") != std::string::npos);
}

TEST(log_only_is_never_sent) {
    // No endpoint is listening; LOG_ONLY must return before any transport
    WebhookAlertDispatcher d("http://127.0.0.1:9/unused", 100);
    d.dispatch(AlertTier::LogOnly, sample_trade());
}

int main() {
    std::cout << "\n=== Alert Tests ===\n\n";

    RUN_TEST(tier_boundaries);
    RUN_TEST(webhook_body_fields);
    RUN_TEST(summary_text_names_tier);
    RUN_TEST(log_only_is_never_sent);

    std::cout << "\n=== All tests passed! ===\n\n";
    return 0;
}
