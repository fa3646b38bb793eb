/**
 * Test TaskScheduler - FIXED_RATE / FIXED_DELAY / CRON timing, overlap
 * rules, failure isolation, cancellation and desired-state reconcile.
 *
 * Periods are short (tens to hundreds of ms); assertions use ranges.
 */

#include "test_macros.hpp"

#include "../include/errors.hpp"
#include "../include/scheduler/cron_evaluator.hpp"
#include "../include/scheduler/handler_dispatcher.hpp"
#include "../include/scheduler/task_scheduler.hpp"
#include "../include/store/schedule_store.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace tradefinder;
using namespace tradefinder::scheduler;

namespace {

void sleep_ms(int ms) { std::this_thread::sleep_for(std::chrono::milliseconds(ms)); }

ScheduleConfig make_config(const std::string& name, ScheduleType type, const std::string& expr,
                           const std::string& handler) {
    ScheduleConfig c;
    c.name = name;
    c.schedule_type = type;
    c.schedule_expression = expr;
    c.handler_ref = handler;
    return c;
}

// Tracks concurrent executions of one handler
struct OverlapProbe {
    std::atomic<int> runs{0};
    std::atomic<int> active{0};
    std::atomic<int> max_active{0};

    void enter() {
        int now = active.fetch_add(1) + 1;
        int prev = max_active.load();
        while (now > prev && !max_active.compare_exchange_weak(prev, now)) {
        }
    }
    void leave() {
        active.fetch_sub(1);
        runs.fetch_add(1);
    }
};

// Fires every 100 ms for "every-100ms", rejects everything else
class StubCron : public CronEvaluator {
public:
    bool is_valid(const std::string& expression) const override { return expression == "every-100ms"; }
    int64_t next_after(const std::string& expression, int64_t after_ms) const override {
        return is_valid(expression) ? after_ms + 100 : 0;
    }
};

}  // namespace

// =============================================================================
// Timing
// =============================================================================

TEST(fixed_rate_fires_on_period) {
    HandlerDispatcher d;
    std::atomic<int> runs{0};
    d.register_nullary("tick", [&] { runs.fetch_add(1); });
    store::JsonScheduleConfigStore store;

    TaskScheduler s(d, store, {2, true});
    ASSERT_TRUE(s.schedule(make_config("rate", ScheduleType::FixedRate, "200", "tick")));
    sleep_ms(700); // fires at ~0, 200, 400, 600
    s.shutdown();

    ASSERT_GT(runs.load(), 2);
    ASSERT_LT(runs.load(), 6);
}

TEST(fire_immediately_off_waits_one_period) {
    HandlerDispatcher d;
    std::atomic<int> runs{0};
    d.register_nullary("tick", [&] { runs.fetch_add(1); });
    store::JsonScheduleConfigStore store;

    TaskScheduler s(d, store, {2, false});
    s.schedule(make_config("late", ScheduleType::FixedRate, "300", "tick"));
    sleep_ms(150);
    ASSERT_EQ(runs.load(), 0);
    sleep_ms(300);
    s.shutdown();
    ASSERT_GT(runs.load(), 0);
}

TEST(fixed_delay_never_overlaps) {
    HandlerDispatcher d;
    OverlapProbe probe;
    d.register_nullary("slow", [&] {
        probe.enter();
        sleep_ms(120);
        probe.leave();
    });
    store::JsonScheduleConfigStore store;

    TaskScheduler s(d, store, {4, true});
    s.schedule(make_config("delay", ScheduleType::FixedDelay, "20", "slow"));
    sleep_ms(700);
    s.shutdown();

    ASSERT_EQ(probe.max_active.load(), 1);
    ASSERT_GT(probe.runs.load(), 2);
}

TEST(fixed_delay_never_overlaps_across_reschedule) {
    HandlerDispatcher d;
    OverlapProbe probe;
    d.register_nullary("slow", [&] {
        probe.enter();
        sleep_ms(300);
        probe.leave();
    });
    store::JsonScheduleConfigStore store;
    store.insert(make_config("delay", ScheduleType::FixedDelay, "50", "slow"));

    TaskScheduler s(d, store, {4, true});
    ASSERT_TRUE(s.reconcile("delay"));
    sleep_ms(100); // first run in flight

    store.set_enabled("delay", false, 1);
    ASSERT_FALSE(s.reconcile("delay"));
    store.set_enabled("delay", true, 2);
    ASSERT_TRUE(s.reconcile("delay"));
    ASSERT_TRUE(s.is_running("delay"));

    sleep_ms(800); // first run ends ~300, next starts ~350 and ends ~650
    s.shutdown();

    ASSERT_EQ(probe.max_active.load(), 1);
    ASSERT_GT(probe.runs.load(), 1);
}

TEST(fixed_rate_runs_may_overlap) {
    HandlerDispatcher d;
    OverlapProbe probe;
    d.register_nullary("slow", [&] {
        probe.enter();
        sleep_ms(300);
        probe.leave();
    });
    store::JsonScheduleConfigStore store;

    TaskScheduler s(d, store, {4, true});
    s.schedule(make_config("rate", ScheduleType::FixedRate, "100", "slow"));
    sleep_ms(450);
    s.shutdown();

    ASSERT_GT(probe.max_active.load(), 1);
}

TEST(cron_uses_injected_evaluator) {
    HandlerDispatcher d;
    std::atomic<int> runs{0};
    d.register_nullary("tick", [&] { runs.fetch_add(1); });
    store::JsonScheduleConfigStore store;
    StubCron cron;

    TaskScheduler s(d, store, {2, true}, &cron);
    ASSERT_TRUE(s.schedule(make_config("cron", ScheduleType::Cron, "every-100ms", "tick")));
    sleep_ms(450);
    s.shutdown();

    ASSERT_GT(runs.load(), 1);
}

// =============================================================================
// Validation
// =============================================================================

TEST(invalid_configs_rejected) {
    HandlerDispatcher d;
    d.register_nullary("tick", [] {});
    store::JsonScheduleConfigStore store;
    StubCron cron;

    TaskScheduler no_cron(d, store);
    ASSERT_THROWS(no_cron.schedule(make_config("c", ScheduleType::Cron, "every-100ms", "tick")), ConfigurationError);
    ASSERT_THROWS(no_cron.schedule(make_config("r", ScheduleType::FixedRate, "5m", "tick")), ConfigurationError);
    ASSERT_THROWS(no_cron.schedule(make_config("z", ScheduleType::FixedDelay, "0", "tick")), ConfigurationError);
    ASSERT_THROWS(no_cron.schedule(make_config("h", ScheduleType::FixedRate, "1000", "missing.handler")),
                  ConfigurationError);
    ASSERT_EQ(no_cron.active_count(), 0u);

    TaskScheduler with_cron(d, store, {}, &cron);
    ASSERT_THROWS(with_cron.validate(make_config("c", ScheduleType::Cron, "61 * * * *", "tick")), ConfigurationError);
    with_cron.validate(make_config("c", ScheduleType::Cron, "every-100ms", "tick"));
}

TEST(disabled_config_not_scheduled) {
    HandlerDispatcher d;
    d.register_nullary("tick", [] {});
    store::JsonScheduleConfigStore store;

    TaskScheduler s(d, store);
    auto c = make_config("off", ScheduleType::FixedRate, "1000", "tick");
    c.enabled = false;
    ASSERT_FALSE(s.schedule(c));
    ASSERT_FALSE(s.is_running("off"));
}

TEST(duplicate_schedule_rejected) {
    HandlerDispatcher d;
    d.register_nullary("tick", [] {});
    store::JsonScheduleConfigStore store;

    TaskScheduler s(d, store, {1, false});
    s.schedule(make_config("one", ScheduleType::FixedRate, "10000", "tick"));
    ASSERT_THROWS(s.schedule(make_config("one", ScheduleType::FixedRate, "10000", "tick")), ConfigurationError);
    ASSERT_EQ(s.active_count(), 1u);
}

// =============================================================================
// Failures and statistics
// =============================================================================

TEST(failure_recorded_and_task_keeps_running) {
    HandlerDispatcher d;
    d.register_nullary("fail", [] { throw std::runtime_error("collaborator down"); });
    store::JsonScheduleConfigStore store;
    auto c = make_config("flaky", ScheduleType::FixedRate, "100", "fail");
    store.insert(c);

    TaskScheduler s(d, store, {2, true});
    s.schedule(c);
    sleep_ms(450);
    ASSERT_TRUE(s.is_running("flaky"));
    s.shutdown();

    auto stored = store.find("flaky");
    ASSERT_TRUE(stored.has_value());
    ASSERT_GT(stored->failure_count, 1);
    ASSERT_EQ(stored->execution_count, 0);
    ASSERT_TRUE(stored->last_status == ExecutionStatus::Failed);
    ASSERT_EQ(stored->last_error, std::string("collaborator down"));
    ASSERT_GT(stored->last_execution_at, 0);
}

TEST(non_std_throw_does_not_stop_scheduler) {
    HandlerDispatcher d;
    std::atomic<int> healthy{0};
    d.register_nullary("raw", [] { throw 42; });
    d.register_nullary("tick", [&] { healthy.fetch_add(1); });
    store::JsonScheduleConfigStore store;
    auto bad = make_config("raw-thrower", ScheduleType::FixedRate, "50", "raw");
    auto good = make_config("healthy", ScheduleType::FixedRate, "50", "tick");
    store.insert(bad);
    store.insert(good);

    TaskScheduler s(d, store, {2, true});
    ASSERT_EQ(s.initialize(), 2u);
    sleep_ms(300);
    ASSERT_TRUE(s.is_running("raw-thrower"));
    s.shutdown();

    auto stored = store.find("raw-thrower");
    ASSERT_GT(stored->failure_count, 1);
    ASSERT_EQ(stored->last_error, std::string("unknown exception"));
    ASSERT_GT(healthy.load(), 1);
}

TEST(success_clears_last_error) {
    HandlerDispatcher d;
    std::atomic<int> calls{0};
    d.register_nullary("once_bad", [&] {
        if (calls.fetch_add(1) == 0)
            throw std::runtime_error("first run fails");
    });
    store::JsonScheduleConfigStore store;
    auto c = make_config("recovering", ScheduleType::FixedDelay, "50", "once_bad");
    store.insert(c);

    TaskScheduler s(d, store, {1, true});
    s.schedule(c);
    sleep_ms(300);
    s.shutdown();

    auto stored = store.find("recovering");
    ASSERT_EQ(stored->failure_count, 1);
    ASSERT_GT(stored->execution_count, 0);
    ASSERT_TRUE(stored->last_status == ExecutionStatus::Success);
    ASSERT_TRUE(stored->last_error.empty());
}

// =============================================================================
// Cancel / reschedule / reconcile
// =============================================================================

TEST(cancel_lets_in_flight_run_finish) {
    HandlerDispatcher d;
    std::atomic<bool> started{false};
    std::atomic<bool> finished{false};
    d.register_nullary("slow", [&] {
        started = true;
        sleep_ms(200);
        finished = true;
    });
    store::JsonScheduleConfigStore store;
    auto c = make_config("slow-task", ScheduleType::FixedRate, "10000", "slow");
    store.insert(c);

    TaskScheduler s(d, store, {1, true});
    s.schedule(c);
    while (!started.load()) {
        sleep_ms(5);
    }

    ASSERT_TRUE(s.cancel("slow-task"));
    ASSERT_FALSE(s.cancel("slow-task")); // idempotent
    ASSERT_FALSE(s.is_running("slow-task"));

    sleep_ms(300);
    ASSERT_TRUE(finished.load());
    ASSERT_EQ(store.find("slow-task")->execution_count, 1);
    s.shutdown();
}

TEST(cancel_stops_new_starts) {
    HandlerDispatcher d;
    std::atomic<int> runs{0};
    d.register_nullary("tick", [&] { runs.fetch_add(1); });
    store::JsonScheduleConfigStore store;

    TaskScheduler s(d, store, {2, true});
    s.schedule(make_config("rate", ScheduleType::FixedRate, "50", "tick"));
    sleep_ms(200);
    s.cancel("rate");
    sleep_ms(50);
    int after_cancel = runs.load();
    sleep_ms(200);
    ASSERT_EQ(runs.load(), after_cancel);
}

TEST(reschedule_with_invalid_config_keeps_old_task) {
    HandlerDispatcher d;
    std::atomic<int> runs{0};
    d.register_nullary("tick", [&] { runs.fetch_add(1); });
    store::JsonScheduleConfigStore store;

    TaskScheduler s(d, store, {2, true});
    s.schedule(make_config("rate", ScheduleType::FixedRate, "100", "tick"));

    ASSERT_THROWS(s.reschedule(make_config("rate", ScheduleType::FixedRate, "soon", "tick")), ConfigurationError);
    ASSERT_TRUE(s.is_running("rate"));

    int before = runs.load();
    sleep_ms(350);
    ASSERT_GT(runs.load(), before);
}

TEST(reschedule_swaps_definition) {
    HandlerDispatcher d;
    std::atomic<int> old_runs{0};
    std::atomic<int> new_runs{0};
    d.register_nullary("old", [&] { old_runs.fetch_add(1); });
    d.register_nullary("new", [&] { new_runs.fetch_add(1); });
    store::JsonScheduleConfigStore store;

    TaskScheduler s(d, store, {2, true});
    s.schedule(make_config("task", ScheduleType::FixedRate, "100", "old"));
    sleep_ms(150);
    ASSERT_TRUE(s.reschedule(make_config("task", ScheduleType::FixedRate, "100", "new")));
    sleep_ms(50);
    int old_after = old_runs.load();
    sleep_ms(250);
    s.shutdown();

    ASSERT_EQ(old_runs.load(), old_after);
    ASSERT_GT(new_runs.load(), 0);
    ASSERT_EQ(s.active_count(), 0u);
}

TEST(reconcile_follows_store_and_keeps_counters) {
    HandlerDispatcher d;
    std::atomic<int> runs{0};
    d.register_nullary("tick", [&] { runs.fetch_add(1); });
    store::JsonScheduleConfigStore store;
    store.insert(make_config("job", ScheduleType::FixedRate, "100", "tick"));

    TaskScheduler s(d, store, {2, true});
    ASSERT_EQ(s.initialize(), 1u);
    sleep_ms(250);

    // Unchanged definition: no-op
    ASSERT_TRUE(s.reconcile("job"));

    store.set_enabled("job", false, 1);
    ASSERT_FALSE(s.reconcile("job"));
    ASSERT_FALSE(s.is_running("job"));
    sleep_ms(50);
    int64_t count_disabled = store.find("job")->execution_count;
    ASSERT_GT(count_disabled, 0);
    sleep_ms(250);
    ASSERT_EQ(store.find("job")->execution_count, count_disabled);

    store.set_enabled("job", true, 2);
    ASSERT_TRUE(s.reconcile("job"));
    sleep_ms(250);
    s.shutdown();
    ASSERT_GT(store.find("job")->execution_count, count_disabled);

    // Deleted from the store: cancelled
    TaskScheduler s2(d, store, {1, false});
    s2.initialize();
    store.remove("job");
    ASSERT_FALSE(s2.reconcile("job"));
    ASSERT_EQ(s2.active_count(), 0u);
}

TEST(initialize_skips_invalid_configs) {
    HandlerDispatcher d;
    d.register_nullary("tick", [] {});
    store::JsonScheduleConfigStore store;
    store.insert(make_config("good", ScheduleType::FixedRate, "10000", "tick"));
    store.insert(make_config("bad-handler", ScheduleType::FixedRate, "10000", "nope"));
    store.insert(make_config("bad-cron", ScheduleType::Cron, "* * * * *", "tick"));
    auto off = make_config("off", ScheduleType::FixedRate, "10000", "tick");
    off.enabled = false;
    store.insert(off);

    TaskScheduler s(d, store, {1, false});
    ASSERT_EQ(s.initialize(), 1u);
    ASSERT_TRUE(s.is_running("good"));
    ASSERT_EQ(s.active_tasks().size(), 1u);
    ASSERT_GT(store.find("good")->next_execution_at, 0);
}

TEST(shutdown_is_idempotent) {
    HandlerDispatcher d;
    d.register_nullary("tick", [] {});
    store::JsonScheduleConfigStore store;

    TaskScheduler s(d, store, {1, true});
    s.schedule(make_config("a", ScheduleType::FixedRate, "50", "tick"));
    s.shutdown();
    s.shutdown();
    ASSERT_EQ(s.active_count(), 0u);
    ASSERT_THROWS(s.schedule(make_config("b", ScheduleType::FixedRate, "50", "tick")), ConfigurationError);
}

int main() {
    std::cout << "\n=== TaskScheduler Tests ===\n\n";

    RUN_TEST(fixed_rate_fires_on_period);
    RUN_TEST(fire_immediately_off_waits_one_period);
    RUN_TEST(fixed_delay_never_overlaps);
    RUN_TEST(fixed_delay_never_overlaps_across_reschedule);
    RUN_TEST(fixed_rate_runs_may_overlap);
    RUN_TEST(cron_uses_injected_evaluator);

    std::cout << "\n--- Validation ---\n";
    RUN_TEST(invalid_configs_rejected);
    RUN_TEST(disabled_config_not_scheduled);
    RUN_TEST(duplicate_schedule_rejected);

    std::cout << "\n--- Failures ---\n";
    RUN_TEST(failure_recorded_and_task_keeps_running);
    RUN_TEST(non_std_throw_does_not_stop_scheduler);
    RUN_TEST(success_clears_last_error);

    std::cout << "\n--- Cancel / Reconcile ---\n";
    RUN_TEST(cancel_lets_in_flight_run_finish);
    RUN_TEST(cancel_stops_new_starts);
    RUN_TEST(reschedule_with_invalid_config_keeps_old_task);
    RUN_TEST(reschedule_swaps_definition);
    RUN_TEST(reconcile_follows_store_and_keeps_counters);
    RUN_TEST(initialize_skips_invalid_configs);
    RUN_TEST(shutdown_is_idempotent);

    std::cout << "\n=== All tests passed! ===\n\n";
    return 0;
}
