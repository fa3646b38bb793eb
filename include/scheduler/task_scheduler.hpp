#pragma once

/**
 * TaskScheduler - live set of named scheduled jobs
 *
 * One timer thread pops due fires from a min-heap and hands them to a
 * WorkerPool; handlers never run on the timer thread. All mutations of the
 * running-task map and the fire queue happen under a single mutex.
 *
 * Next fire by schedule type:
 *   FIXED_RATE   every N ms from the scheduling moment, runs may overlap
 *   FIXED_DELAY  N ms after the previous run completes, never overlaps;
 *                after a reschedule the first fire waits for runs of the
 *                replaced definition to finish
 *   CRON         from the injected CronEvaluator, runs may overlap
 *
 * Cancellation means "no new starts after return". A run already handed to
 * the pool completes and its statistics are still recorded.
 *
 * Usage:
 *   TaskScheduler scheduler(dispatcher, store, {4, true});
 *   scheduler.initialize();          // every enabled config in the store
 *   scheduler.reconcile("nq-finder"); // after an admin edit
 *   scheduler.shutdown();
 */

#include "cron_evaluator.hpp"
#include "handler_dispatcher.hpp"
#include "schedule_config.hpp"
#include "worker_pool.hpp"
#include "../observability/event_journal.hpp"
#include "../store/schedule_store.hpp"
#include "../util/time_utils.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace tradefinder {
namespace scheduler {

struct TaskSchedulerConfig {
    size_t worker_threads = 4;
    bool fire_immediately = true; // first FIXED_RATE/FIXED_DELAY fire at schedule time
};

class TaskScheduler {
public:
    using SteadyClock = std::chrono::steady_clock;

    TaskScheduler(HandlerDispatcher& dispatcher, store::ScheduleConfigStore& store, TaskSchedulerConfig config = {},
                  const CronEvaluator* cron = nullptr, util::WallClock wall_clock = util::wall_clock_ms);
    ~TaskScheduler();

    TaskScheduler(const TaskScheduler&) = delete;
    TaskScheduler& operator=(const TaskScheduler&) = delete;

    void set_journal(observability::EventJournal* journal) { journal_ = journal; }

    /**
     * Schedule every enabled config in the store.
     * Configs that fail validation are logged and skipped.
     * @return number of tasks made live
     */
    size_t initialize();

    /**
     * Expression and handler checks performed by schedule(), without side effects.
     * Throws ConfigurationError.
     */
    void validate(const ScheduleConfig& config) const;

    /**
     * Make a config live.
     * Throws ConfigurationError if invalid or if a task with that name is running.
     * @return false if the config is disabled (nothing scheduled)
     */
    bool schedule(const ScheduleConfig& config);

    // Idempotent. @return true if a task was running
    bool cancel(const std::string& name);

    /**
     * Atomically replace the running task for config.name.
     * Validation happens first: on ConfigurationError the old task keeps running.
     * Counters are untouched.
     * @return true if the task is live afterwards
     */
    bool reschedule(const ScheduleConfig& config);

    /**
     * Bring the running task for `name` in line with the store (desired-state diff).
     * Missing or disabled -> cancelled; changed definition -> rescheduled;
     * unchanged -> no-op.
     * @return true if the task is live afterwards
     */
    bool reconcile(const std::string& name);

    // Cancel everything, stop the timer, wait for in-flight runs
    void shutdown();

    bool is_running(const std::string& name) const;
    std::map<std::string, bool> active_tasks() const;
    size_t active_count() const;
    size_t in_flight() const;

private:
    struct RunningTask {
        uint64_t generation = 0;
        ScheduleConfig snapshot; // last applied definition
        int64_t period_ms = 0;   // FIXED_RATE / FIXED_DELAY
        bool awaiting_idle = false; // FIXED_DELAY first fire queued when busy_ drains
    };

    struct FireEntry {
        SteadyClock::time_point due;
        std::string name;
        uint64_t generation;

        bool operator>(const FireEntry& other) const { return due > other.due; }
    };

    HandlerDispatcher& dispatcher_;
    store::ScheduleConfigStore& store_;
    TaskSchedulerConfig config_;
    const CronEvaluator* cron_;
    util::WallClock wall_clock_;
    observability::EventJournal* journal_ = nullptr;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, RunningTask> running_;
    std::map<std::string, size_t> busy_; // runs handed to the pool, any generation
    std::priority_queue<FireEntry, std::vector<FireEntry>, std::greater<FireEntry>> queue_;
    uint64_t next_generation_ = 0;
    size_t in_flight_ = 0;
    bool stopping_ = false;

    WorkerPool pool_;
    std::thread timer_thread_;

    void timer_loop();
    void execute(const ScheduleConfig& snapshot, uint64_t generation, int64_t next_wall_ms);

    // Caller holds mutex_. Returns the wall time of the first fire.
    int64_t insert_locked(const ScheduleConfig& config);

    // Caller holds mutex_
    void release_busy_locked(const std::string& name);

    // Wall-clock time of the next CRON fire, steady deadline in `due`
    int64_t next_cron_fire(const std::string& expression, SteadyClock::time_point& due) const;

    int64_t to_wall_ms(SteadyClock::time_point tp) const;

    void journal(observability::JournalEventType type, const std::string& source, const std::string& message);
};

}  // namespace scheduler
}  // namespace tradefinder
