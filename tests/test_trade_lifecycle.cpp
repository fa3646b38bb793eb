/**
 * Test TradeLifecycleManager - expiry sweep, trailing statistics and
 * manual status updates
 */

#include "test_macros.hpp"

#include "../include/lifecycle/trade_lifecycle_manager.hpp"
#include "../include/store/trade_store.hpp"

#include <atomic>

using namespace tradefinder;
using namespace tradefinder::lifecycle;
using signal::IdentifiedTrade;
using signal::TradeStatus;

namespace {

constexpr int64_t T0 = 1768489200000LL;
constexpr int64_t HOUR = 3'600'000LL;

IdentifiedTrade make_trade(const std::string& symbol, const std::string& key, int64_t at, int confidence,
                           const std::string& direction = "LONG") {
    IdentifiedTrade t;
    t.symbol = symbol;
    t.direction = direction;
    t.identified_at = at;
    t.created_at = at;
    t.expires_at = at + 4 * HOUR;
    t.confidence = confidence;
    t.dedupe_key = key;
    return t;
}

struct Fixture {
    std::atomic<int64_t> now{T0};
    store::JsonTradeStore store;
    observability::EventJournal journal;
    TradeLifecycleManager manager{store, &journal, [this] { return now.load(); }};

    std::string add(const std::string& symbol, const std::string& key, int64_t at, int confidence,
                    const std::string& direction = "LONG") {
        auto t = make_trade(symbol, key, at, confidence, direction);
        store.insert_unique(t);
        return t.id;
    }
};

}  // namespace

// =============================================================================
// Expiry sweep
// =============================================================================

TEST(sweep_expires_due_trades) {
    Fixture f;
    auto early = f.add("NQ", "early", T0 - 5 * HOUR, 70);
    auto alerted = f.add("ES", "alerted", T0 - 4 * HOUR, 85);
    auto fresh = f.add("NQ", "fresh", T0 - HOUR, 65);
    f.store.mark_alerted(alerted, "CALL_SMS_TELEGRAM", T0 - 4 * HOUR);

    ASSERT_EQ(f.manager.sweep_expired(), 2u);
    ASSERT_TRUE(f.store.find(early)->status == TradeStatus::Expired);
    ASSERT_TRUE(f.store.find(alerted)->status == TradeStatus::Expired);
    ASSERT_TRUE(f.store.find(fresh)->status == TradeStatus::Identified);
    ASSERT_EQ(f.journal.count(observability::JournalEventType::TradeExpired), 2u);

    // Nothing left to do until the fresh trade comes due
    ASSERT_EQ(f.manager.sweep_expired(), 0u);
    f.now = T0 + 3 * HOUR;
    ASSERT_EQ(f.manager.sweep_expired(), 1u);
}

TEST(sweep_leaves_terminal_trades_alone) {
    Fixture f;
    auto taken = f.add("NQ", "taken", T0 - 6 * HOUR, 70);
    f.store.transition(taken, TradeStatus::Taken, T0 - 5 * HOUR);

    ASSERT_EQ(f.manager.sweep_expired(), 0u);
    ASSERT_TRUE(f.store.find(taken)->status == TradeStatus::Taken);
}

// =============================================================================
// Statistics
// =============================================================================

TEST(statistics_over_trailing_window) {
    Fixture f;
    auto a = f.add("NQ", "a", T0 - HOUR, 80, "LONG");
    f.add("NQ", "b", T0 - 2 * HOUR, 65, "SHORT");
    f.add("ES", "c", T0 - 3 * HOUR, 72, "LONG");
    f.add("ES", "old", T0 - 30 * HOUR, 99, "LONG"); // outside 24h
    f.store.mark_alerted(a, "CALL_SMS_TELEGRAM", T0 - HOUR);

    auto s = f.manager.report_statistics(24);
    ASSERT_EQ(s.window_hours, 24);
    ASSERT_EQ(s.total, 3u);
    ASSERT_EQ(s.alerted, 1u);
    ASSERT_NEAR(s.avg_confidence, 72.3, 1e-9);
    ASSERT_EQ(s.by_symbol["NQ"], 2u);
    ASSERT_EQ(s.by_symbol["ES"], 1u);
    ASSERT_EQ(s.by_direction["LONG"], 2u);
    ASSERT_EQ(s.by_status["ALERTED"], 1u);
    ASSERT_EQ(s.by_status["IDENTIFIED"], 2u);

    ASSERT_EQ(f.manager.report_statistics(48).total, 4u);
    f.manager.log_statistics();
}

TEST(statistics_empty_window) {
    Fixture f;
    auto s = f.manager.report_statistics(24);
    ASSERT_EQ(s.total, 0u);
    ASSERT_NEAR(s.avg_confidence, 0.0, 1e-9);
    ASSERT_TRUE(s.by_status.empty());
    f.manager.log_statistics();
}

TEST(recent_lists_newest_first) {
    Fixture f;
    f.add("NQ", "a", T0 - 3 * HOUR, 70);
    f.add("NQ", "b", T0 - HOUR, 70);
    f.add("NQ", "old", T0 - 30 * HOUR, 70);

    auto r = f.manager.recent(24);
    ASSERT_EQ(r.size(), 2u);
    ASSERT_EQ(r[0].dedupe_key, std::string("b"));
    ASSERT_EQ(f.manager.recent(24, 1).size(), 1u);
}

// =============================================================================
// Manual status updates
// =============================================================================

TEST(update_status_to_manual_targets) {
    Fixture f;
    auto id = f.add("NQ", "a", T0, 70);

    auto r = f.manager.update_status(id, "taken");
    ASSERT_TRUE(r.ok());
    ASSERT_TRUE(r.outcome == admin::AdminOutcome::Ok);
    ASSERT_TRUE(r.value->status == TradeStatus::Taken);
    ASSERT_EQ(r.value->updated_at, T0);

    auto other = f.add("ES", "b", T0, 70);
    auto inv = f.manager.update_status(other, "INVALIDATED", false, std::string("NONE"));
    ASSERT_TRUE(inv.ok());
    ASSERT_EQ(inv.value->alert_type, std::string("NONE"));
}

TEST(update_status_rejections) {
    Fixture f;
    auto id = f.add("NQ", "a", T0, 70);

    ASSERT_TRUE(f.manager.update_status(id, "WON").outcome == admin::AdminOutcome::Validation);
    ASSERT_TRUE(f.manager.update_status(id, "ALERTED").outcome == admin::AdminOutcome::Validation);
    ASSERT_TRUE(f.manager.update_status(id, "EXPIRED").outcome == admin::AdminOutcome::Validation);
    ASSERT_TRUE(f.manager.update_status("trd_424242", "TAKEN").outcome == admin::AdminOutcome::NotFound);

    ASSERT_TRUE(f.manager.update_status(id, "CANCELLED").ok());
    auto again = f.manager.update_status(id, "TAKEN");
    ASSERT_TRUE(again.outcome == admin::AdminOutcome::Validation);
    ASSERT_FALSE(again.value.has_value());
    ASSERT_TRUE(again.message.find("CANCELLED") != std::string::npos);
    ASSERT_TRUE(f.store.find(id)->status == TradeStatus::Cancelled);
}

int main() {
    std::cout << "\n=== TradeLifecycleManager Tests ===\n\n";

    RUN_TEST(sweep_expires_due_trades);
    RUN_TEST(sweep_leaves_terminal_trades_alone);

    std::cout << "\n--- Statistics ---\n";
    RUN_TEST(statistics_over_trailing_window);
    RUN_TEST(statistics_empty_window);
    RUN_TEST(recent_lists_newest_first);

    std::cout << "\n--- Status Updates ---\n";
    RUN_TEST(update_status_to_manual_targets);
    RUN_TEST(update_status_rejections);

    std::cout << "\n=== All tests passed! ===\n\n";
    return 0;
}
