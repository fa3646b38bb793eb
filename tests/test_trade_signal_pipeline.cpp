/**
 * Test TradeSignalPipeline end to end with in-process collaborators:
 * verdict handling, validation, dedupe, alert tiers, failure mapping
 */

#include "test_macros.hpp"

#include "../include/errors.hpp"
#include "../include/signal/trade_signal_pipeline.hpp"
#include "../include/store/trade_store.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace tradefinder;
using namespace tradefinder::signal;

namespace {

// 2026-01-15 15:00:00 UTC = 10:00 New York
constexpr int64_t T0 = 1768489200000LL;

std::string verdict(int confidence, const std::string& direction = "LONG", const std::string& zone = "21450-21460") {
    nlohmann::json j = {{"status", "TRADE_IDENTIFIED"},
                        {"direction", direction},
                        {"timeframe", "5m"},
                        {"confidence", confidence},
                        {"entry", {{"zone_type", "FVG"}, {"zone", zone}, {"price", 21455.0}}},
                        {"stop", {{"placement", "below sweep"}, {"price", 21420.0}}},
                        {"targets", nlohmann::json::array({{{"level", "PDH"}, {"price", 21520.0}}})},
                        {"risk_reward", "1:2"},
                        {"narrative", "sweep then CISD"}};
    return "```json\n" + j.dump() + "\n```";
}

ai::ReasoningResponse ok_response(const std::string& output) {
    ai::ReasoningResponse r;
    r.success = true;
    r.http_code = 200;
    r.output = output;
    return r;
}

ai::ReasoningResponse failed_response(ai::ReasoningError kind) {
    ai::ReasoningResponse r;
    r.success = false;
    r.error_kind = kind;
    r.error = ai::reasoning_error_to_string(kind);
    return r;
}

class FakeReasoner : public ai::ReasoningClient {
public:
    ai::ReasoningResponse default_response = ok_response(R"({"status":"NO_SETUP"})");
    std::map<std::string, ai::ReasoningResponse> per_symbol;

    ai::ReasoningResponse invoke(const ai::ReasoningRequest& request) override {
        auto payload = nlohmann::json::parse(request.input);
        std::string symbol = payload["meta"]["symbol"].get<std::string>();

        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(request);
        auto it = per_symbol.find(symbol);
        return it != per_symbol.end() ? it->second : default_response;
    }

    size_t calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    ai::ReasoningRequest last() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.back();
    }

private:
    mutable std::mutex mutex_;
    std::vector<ai::ReasoningRequest> requests_;
};

class FakeMarket : public market::MarketDataSource {
public:
    bool unavailable = false;

    std::vector<market::MarketEvent> recent_events(const std::string& symbol, int, int64_t now_ms) override {
        if (unavailable) {
            throw TransientCollaboratorError(TransientCollaboratorError::Kind::Unavailable, "event feed down");
        }
        market::MarketEvent e;
        e.event_ts = now_ms - 120'000;
        e.symbol = symbol;
        e.indicator = "CISD_BULL";
        e.direction_code = "BULLISH";
        e.timeframe = "5m";
        return {e};
    }

    std::vector<market::Candle> recent_candles(const std::string&, const std::string&, int count,
                                               int64_t now_ms) override {
        std::vector<market::Candle> out;
        for (int i = 0; i < count && i < 3; ++i) {
            market::Candle c;
            c.timestamp = now_ms - (3 - i) * 300'000;
            c.open = c.high = c.low = c.close = 21450.0;
            out.push_back(c);
        }
        return out;
    }
};

class FakeAlerts : public alert::AlertDispatcher {
public:
    bool fail = false;
    bool crash = false;
    std::atomic<int> sent{0};
    alert::AlertTier last_tier = alert::AlertTier::LogOnly;

    void dispatch(alert::AlertTier tier, const IdentifiedTrade&) override {
        if (fail) {
            throw AlertDeliveryError("webhook returned 503");
        }
        if (crash) {
            throw std::logic_error("formatter bug");
        }
        last_tier = tier;
        sent.fetch_add(1);
    }
};

// Persists normally but cannot record the alert
class UnmarkableTradeStore : public store::JsonTradeStore {
public:
    store::TransitionOutcome mark_alerted(const std::string&, const std::string&, int64_t) override {
        throw TransientCollaboratorError(TransientCollaboratorError::Kind::Unavailable, "trade store offline");
    }
};

struct Harness {
    std::atomic<int64_t> now{T0};
    FakeReasoner ai;
    FakeMarket market;
    FakeAlerts alerts;
    store::JsonTradeStore trades;
    observability::EventJournal journal;
    TradeSignalPipeline pipeline;

    static config::TradeFinderSettings settings() {
        config::TradeFinderSettings s;
        s.symbols = {"NQ", "ES"};
        s.system_prompt_file = "";
        s.ai_timeout_ms = 5000;
        s.manual_levels = {{"NQ", {{"pdh", 21500.0}}}};
        return s;
    }

    Harness()
        : pipeline(settings(), config::AiSettings{}, market, ai, trades, &alerts, &journal,
                   [this] { return now.load(); }) {}
};

}  // namespace

// =============================================================================
// Verdicts
// =============================================================================

TEST(no_setup_is_success_with_zero_trades) {
    Harness h;
    auto r = h.pipeline.run("NQ");
    ASSERT_TRUE(r.outcome == RunOutcome::NoSetup);
    ASSERT_EQ(h.trades.size(), 0u);
    ASSERT_EQ(h.alerts.sent.load(), 0);

    h.pipeline.find_trades(nlohmann::json::object());
    ASSERT_EQ(h.trades.size(), 0u);
}

TEST(identified_trade_persisted_and_alerted) {
    Harness h;
    h.ai.default_response = ok_response(verdict(82));

    auto r = h.pipeline.run("nq");
    ASSERT_TRUE(r.outcome == RunOutcome::TradePersisted);
    ASSERT_TRUE(r.tier == alert::AlertTier::CallSmsTelegram);
    ASSERT_TRUE(r.alert_sent);
    ASSERT_TRUE(h.alerts.last_tier == alert::AlertTier::CallSmsTelegram);

    auto t = h.trades.find(r.trade_id);
    ASSERT_TRUE(t.has_value());
    ASSERT_EQ(t->symbol, std::string("NQ"));
    ASSERT_EQ(t->direction, std::string("LONG"));
    ASSERT_EQ(t->confidence, 82);
    ASSERT_TRUE(t->status == TradeStatus::Alerted);
    ASSERT_TRUE(t->alert_sent);
    ASSERT_EQ(t->alert_type, std::string("CALL_SMS_TELEGRAM"));
    ASSERT_EQ(t->identified_at, T0);
    ASSERT_EQ(t->expires_at, T0 + 4 * util::MS_PER_HOUR);
    ASSERT_EQ(t->dedupe_key, std::string("NQ_LONG_21450_21460_20260115_10"));
    ASSERT_EQ(t->entry_zone_type, std::string("FVG"));
    ASSERT_NEAR(t->stop_price, 21420.0, 1e-9);
    ASSERT_EQ(t->targets.size(), 1u);
    ASSERT_EQ(t->session_label, std::string("NY_AM"));
    ASSERT_EQ(t->ai_request_id, std::string("TRADE_FINDER_NQ_") + std::to_string(T0));
    ASSERT_TRUE(t->ai_full_response.find("TRADE_IDENTIFIED") != std::string::npos);
    ASSERT_EQ(h.journal.count(observability::JournalEventType::TradePersisted), 1u);
    ASSERT_EQ(h.journal.count(observability::JournalEventType::AlertSent), 1u);
}

TEST(request_carries_payload_and_timeout) {
    Harness h;
    h.pipeline.run("NQ", RUN_CONTEXT_MANUAL);

    auto req = h.ai.last();
    ASSERT_EQ(req.timeout_ms, 5000);
    ASSERT_FALSE(req.system_instructions.empty());

    auto payload = nlohmann::json::parse(req.input);
    ASSERT_EQ(payload["meta"]["run_context"].get<std::string>(), std::string("MANUAL_TRIGGER"));
    ASSERT_EQ(payload["event_stream"].size(), 1u);
    ASSERT_EQ(payload["ohlc_context"].size(), 4u);
    ASSERT_TRUE(payload.contains("manual_levels"));

    h.pipeline.run("ES");
    ASSERT_FALSE(nlohmann::json::parse(h.ai.last().input).contains("manual_levels"));
}

TEST(confidence_out_of_range_persists_nothing) {
    Harness h;
    h.ai.default_response = ok_response(verdict(150));
    ASSERT_THROWS(h.pipeline.run("NQ"), ParseError);
    ASSERT_EQ(h.trades.size(), 0u);
    ASSERT_EQ(h.alerts.sent.load(), 0);
}

TEST(malformed_output_persists_nothing) {
    Harness h;
    h.ai.default_response = ok_response("Looks bullish to me.");
    ASSERT_THROWS(h.pipeline.run("NQ"), ParseError);

    h.ai.default_response = ok_response("   ");
    ASSERT_THROWS(h.pipeline.run("NQ"), ParseError);

    h.ai.default_response = failed_response(ai::ReasoningError::MalformedOutput);
    ASSERT_THROWS(h.pipeline.run("NQ"), ParseError);
    ASSERT_EQ(h.trades.size(), 0u);
}

// =============================================================================
// Alert tiers
// =============================================================================

TEST(alert_tier_boundaries) {
    struct Case {
        int confidence;
        alert::AlertTier tier;
        bool dispatched;
    };
    const Case cases[] = {{80, alert::AlertTier::CallSmsTelegram, true},
                          {79, alert::AlertTier::SmsTelegram, true},
                          {60, alert::AlertTier::SmsTelegram, true},
                          {59, alert::AlertTier::LogOnly, false}};

    for (const auto& c : cases) {
        Harness h;
        h.ai.default_response = ok_response(verdict(c.confidence));
        auto r = h.pipeline.run("NQ");
        ASSERT_TRUE(r.tier == c.tier);
        ASSERT_EQ(h.alerts.sent.load(), c.dispatched ? 1 : 0);

        auto t = h.trades.find(r.trade_id);
        ASSERT_TRUE(t->status == (c.dispatched ? TradeStatus::Alerted : TradeStatus::Identified));
        ASSERT_EQ(t->alert_sent, c.dispatched);
    }
}

TEST(alert_failure_leaves_trade_identified) {
    Harness h;
    h.alerts.fail = true;
    h.ai.default_response = ok_response(verdict(90));

    auto r = h.pipeline.run("NQ");
    ASSERT_TRUE(r.outcome == RunOutcome::TradePersisted);
    ASSERT_FALSE(r.alert_sent);

    auto t = h.trades.find(r.trade_id);
    ASSERT_TRUE(t->status == TradeStatus::Identified);
    ASSERT_FALSE(t->alert_sent);
    ASSERT_EQ(h.journal.count(observability::JournalEventType::AlertFailed), 1u);
}

TEST(unexpected_alert_error_is_not_fatal) {
    Harness h;
    h.alerts.crash = true;
    h.ai.default_response = ok_response(verdict(70));

    auto r = h.pipeline.run("NQ");
    ASSERT_TRUE(r.outcome == RunOutcome::TradePersisted);
    ASSERT_FALSE(r.alert_sent);
    ASSERT_TRUE(h.trades.find(r.trade_id)->status == TradeStatus::Identified);
    ASSERT_EQ(h.journal.count(observability::JournalEventType::AlertFailed), 1u);

    // A scheduled pass over the same verdict is a duplicate, not a failure
    h.pipeline.find_trades(nlohmann::json{{"symbols", "NQ"}});
}

TEST(alert_sent_but_mark_fails_is_not_fatal) {
    FakeReasoner ai;
    ai.default_response = ok_response(verdict(88));
    FakeMarket market;
    FakeAlerts alerts;
    UnmarkableTradeStore trades;
    config::TradeFinderSettings s;
    s.system_prompt_file = "";
    TradeSignalPipeline p(s, config::AiSettings{}, market, ai, trades, &alerts, nullptr, [] { return T0; });

    auto r = p.run("NQ");
    ASSERT_TRUE(r.outcome == RunOutcome::TradePersisted);
    ASSERT_EQ(alerts.sent.load(), 1);
    ASSERT_FALSE(r.alert_sent);
    ASSERT_TRUE(trades.find(r.trade_id)->status == TradeStatus::Identified);
}

TEST(no_alert_channel_keeps_trade_identified) {
    FakeReasoner ai;
    ai.default_response = ok_response(verdict(95));
    FakeMarket market;
    store::JsonTradeStore trades;
    config::TradeFinderSettings s;
    s.system_prompt_file = "";
    TradeSignalPipeline p(s, config::AiSettings{}, market, ai, trades, nullptr, nullptr, [] { return T0; });

    auto r = p.run("NQ");
    ASSERT_TRUE(r.outcome == RunOutcome::TradePersisted);
    ASSERT_TRUE(trades.find(r.trade_id)->status == TradeStatus::Identified);
}

// =============================================================================
// Dedupe
// =============================================================================

TEST(same_setup_same_hour_persists_once) {
    Harness h;
    h.ai.default_response = ok_response(verdict(85));

    ASSERT_TRUE(h.pipeline.run("NQ").outcome == RunOutcome::TradePersisted);
    h.now = T0 + 20 * util::MS_PER_MINUTE;
    ASSERT_TRUE(h.pipeline.run("NQ").outcome == RunOutcome::Duplicate);
    ASSERT_EQ(h.trades.size(), 1u);
    ASSERT_EQ(h.alerts.sent.load(), 1);
    ASSERT_EQ(h.pipeline.dedupe_gate().suppressed(), 1u);
    ASSERT_EQ(h.journal.count(observability::JournalEventType::DuplicateSignal), 1u);

    // Next New York hour: new candidate
    h.now = T0 + 61 * util::MS_PER_MINUTE;
    ASSERT_TRUE(h.pipeline.run("NQ").outcome == RunOutcome::TradePersisted);
    ASSERT_EQ(h.trades.size(), 2u);
}

TEST(concurrent_identical_runs_persist_once) {
    Harness h;
    h.ai.default_response = ok_response(verdict(70));

    std::atomic<int> persisted{0};
    std::atomic<int> duplicates{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            auto r = h.pipeline.run("NQ");
            if (r.outcome == RunOutcome::TradePersisted)
                persisted.fetch_add(1);
            else if (r.outcome == RunOutcome::Duplicate)
                duplicates.fetch_add(1);
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    ASSERT_EQ(persisted.load(), 1);
    ASSERT_EQ(duplicates.load(), 7);
    ASSERT_EQ(h.trades.size(), 1u);
    ASSERT_EQ(h.alerts.sent.load(), 1);
}

// =============================================================================
// Collaborator failures
// =============================================================================

TEST(ai_failures_map_to_transient_errors) {
    const std::pair<ai::ReasoningError, TransientCollaboratorError::Kind> cases[] = {
        {ai::ReasoningError::Timeout, TransientCollaboratorError::Kind::Timeout},
        {ai::ReasoningError::RateLimited, TransientCollaboratorError::Kind::RateLimited},
        {ai::ReasoningError::Unavailable, TransientCollaboratorError::Kind::Unavailable}};

    for (const auto& [error, kind] : cases) {
        Harness h;
        h.ai.default_response = failed_response(error);
        bool caught = false;
        try {
            h.pipeline.run("NQ");
        } catch (const TransientCollaboratorError& e) {
            caught = true;
            ASSERT_TRUE(e.kind() == kind);
        }
        ASSERT_TRUE(caught);
        ASSERT_EQ(h.trades.size(), 0u);
    }
}

TEST(market_data_outage_aborts_run) {
    Harness h;
    h.market.unavailable = true;
    h.ai.default_response = ok_response(verdict(90));
    ASSERT_THROWS(h.pipeline.run("NQ"), TransientCollaboratorError);
    ASSERT_EQ(h.ai.calls(), 0u);
    ASSERT_EQ(h.trades.size(), 0u);
}

// =============================================================================
// Scheduled and manual entry points
// =============================================================================

TEST(find_trades_attempts_every_symbol) {
    Harness h;
    h.ai.per_symbol["NQ"] = ok_response(verdict(65));
    h.ai.per_symbol["ES"] = failed_response(ai::ReasoningError::Timeout);

    // Single failure is rethrown as is
    ASSERT_THROWS(h.pipeline.find_trades({{"symbols", nlohmann::json::array({"NQ", "ES"})}}), TransientCollaboratorError);
    ASSERT_EQ(h.ai.calls(), 2u);
    ASSERT_EQ(h.trades.size(), 1u);
}

TEST(find_trades_aggregates_multiple_failures) {
    Harness h;
    h.ai.default_response = failed_response(ai::ReasoningError::Unavailable);

    bool caught = false;
    try {
        h.pipeline.find_trades(nlohmann::json::object()); // configured NQ, ES
    } catch (const std::runtime_error& e) {
        caught = true;
        ASSERT_TRUE(dynamic_cast<const TransientCollaboratorError*>(&e) == nullptr);
        std::string msg = e.what();
        ASSERT_TRUE(msg.find("NQ") != std::string::npos);
        ASSERT_TRUE(msg.find("ES") != std::string::npos);
    }
    ASSERT_TRUE(caught);
    ASSERT_EQ(h.ai.calls(), 2u);
}

TEST(find_trades_accepts_comma_separated_symbols) {
    Harness h;
    h.pipeline.find_trades({{"symbols", "ym, gc"}});
    ASSERT_EQ(h.ai.calls(), 2u);
    auto payload = nlohmann::json::parse(h.ai.last().input);
    ASSERT_EQ(payload["meta"]["symbol"].get<std::string>(), std::string("GC"));
}

TEST(trigger_summarizes_all_symbols) {
    Harness h;
    h.ai.per_symbol["NQ"] = ok_response(verdict(75));
    h.ai.per_symbol["ES"] = failed_response(ai::ReasoningError::RateLimited);

    auto s = h.pipeline.trigger("all");
    ASSERT_EQ(s.symbols_analyzed, 2u);
    ASSERT_EQ(s.trades_persisted, 1u);
    ASSERT_EQ(s.no_setup, 0u);
    ASSERT_EQ(s.errors.size(), 1u);
    ASSERT_TRUE(s.errors.count("ES") == 1);
    ASSERT_EQ(s.results.size(), 2u);

    auto again = h.pipeline.trigger("nq");
    ASSERT_EQ(again.symbols_analyzed, 1u);
    ASSERT_EQ(again.duplicates, 1u);
}

int main() {
    std::cout << "\n=== TradeSignalPipeline Tests ===\n\n";

    RUN_TEST(no_setup_is_success_with_zero_trades);
    RUN_TEST(identified_trade_persisted_and_alerted);
    RUN_TEST(request_carries_payload_and_timeout);
    RUN_TEST(confidence_out_of_range_persists_nothing);
    RUN_TEST(malformed_output_persists_nothing);

    std::cout << "\n--- Alerts ---\n";
    RUN_TEST(alert_tier_boundaries);
    RUN_TEST(alert_failure_leaves_trade_identified);
    RUN_TEST(unexpected_alert_error_is_not_fatal);
    RUN_TEST(alert_sent_but_mark_fails_is_not_fatal);
    RUN_TEST(no_alert_channel_keeps_trade_identified);

    std::cout << "\n--- Dedupe ---\n";
    RUN_TEST(same_setup_same_hour_persists_once);
    RUN_TEST(concurrent_identical_runs_persist_once);

    std::cout << "\n--- Collaborator Failures ---\n";
    RUN_TEST(ai_failures_map_to_transient_errors);
    RUN_TEST(market_data_outage_aborts_run);

    std::cout << "\n--- Entry Points ---\n";
    RUN_TEST(find_trades_attempts_every_symbol);
    RUN_TEST(find_trades_aggregates_multiple_failures);
    RUN_TEST(find_trades_accepts_comma_separated_symbols);
    RUN_TEST(trigger_summarizes_all_symbols);

    std::cout << "\n=== All tests passed! ===\n\n";
    return 0;
}
