#include "../../include/scheduler/task_scheduler.hpp"

#include "../../include/errors.hpp"
#include "../../include/logging/async_logger.hpp"
#include "../../include/util/string_utils.hpp"

namespace tradefinder::scheduler {

using observability::JournalEventType;

TaskScheduler::TaskScheduler(HandlerDispatcher& dispatcher, store::ScheduleConfigStore& store,
                             TaskSchedulerConfig config, const CronEvaluator* cron, util::WallClock wall_clock)
    : dispatcher_(dispatcher), store_(store), config_(config), cron_(cron), wall_clock_(std::move(wall_clock)),
      pool_(config.worker_threads) {
    if (!wall_clock_) {
        wall_clock_ = util::wall_clock_ms;
    }
    timer_thread_ = std::thread([this]() { timer_loop(); });
}

TaskScheduler::~TaskScheduler() { shutdown(); }

// ============================================================================
// Validation
// ============================================================================

void TaskScheduler::validate(const ScheduleConfig& config) const {
    if (config.name.empty()) {
        throw ConfigurationError("schedule name must not be empty");
    }

    switch (config.schedule_type) {
    case ScheduleType::FixedRate:
    case ScheduleType::FixedDelay: {
        int64_t period = 0;
        if (!util::parse_positive_ms(config.schedule_expression, period)) {
            throw ConfigurationError("schedule '" + config.name + "': " +
                                     schedule_type_to_string(config.schedule_type) +
                                     " expression must be a positive millisecond duration, got '" +
                                     config.schedule_expression + "'");
        }
        break;
    }
    case ScheduleType::Cron:
        if (cron_ == nullptr) {
            throw ConfigurationError("schedule '" + config.name + "': CRON schedules need a cron evaluator");
        }
        if (!cron_->is_valid(config.schedule_expression)) {
            throw ConfigurationError("schedule '" + config.name + "': invalid cron expression '" +
                                     config.schedule_expression + "'");
        }
        if (cron_->next_after(config.schedule_expression, wall_clock_()) <= 0) {
            throw ConfigurationError("schedule '" + config.name + "': cron expression never fires");
        }
        break;
    }

    // Throws ConfigurationError for unknown references
    dispatcher_.resolve(config.handler_ref);
}

// ============================================================================
// Task lifecycle
// ============================================================================

size_t TaskScheduler::initialize() {
    size_t scheduled = 0;
    for (const auto& config : store_.list()) {
        if (!config.enabled) {
            LOGF_DEBUG(Scheduler, "Skipping disabled schedule %s", config.name.c_str());
            continue;
        }
        try {
            if (schedule(config))
                ++scheduled;
        } catch (const ConfigurationError& e) {
            LOGF_ERROR(Scheduler, "Not scheduling %s: %s", config.name.c_str(), e.what());
        }
    }
    LOGF_INFO(Scheduler, "Initialized %zu scheduled tasks", scheduled);
    return scheduled;
}

bool TaskScheduler::schedule(const ScheduleConfig& config) {
    validate(config);

    if (!config.enabled) {
        LOGF_INFO(Scheduler, "Schedule %s is disabled, not scheduling", config.name.c_str());
        return false;
    }

    int64_t first_fire;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw ConfigurationError("scheduler is shut down");
        }
        if (running_.count(config.name)) {
            throw ConfigurationError("schedule '" + config.name + "' is already running");
        }
        first_fire = insert_locked(config);
    }
    cv_.notify_all();

    store_.record_next_fire(config.name, first_fire);
    LOGF_INFO(Scheduler, "Scheduled %s (%s %s) -> %s", config.name.c_str(),
              schedule_type_to_string(config.schedule_type), config.schedule_expression.c_str(),
              config.handler_ref.c_str());
    journal(JournalEventType::ScheduleChanged, config.name, "scheduled");
    return true;
}

bool TaskScheduler::cancel(const std::string& name) {
    bool was_running;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Queued fires for this name become stale and are dropped by the timer
        was_running = running_.erase(name) > 0;
    }
    if (was_running) {
        store_.record_next_fire(name, 0);
        LOGF_INFO(Scheduler, "Cancelled %s", name.c_str());
        journal(JournalEventType::ScheduleChanged, name, "cancelled");
    }
    return was_running;
}

bool TaskScheduler::reschedule(const ScheduleConfig& config) {
    validate(config);

    int64_t first_fire = 0;
    bool live = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw ConfigurationError("scheduler is shut down");
        }
        running_.erase(config.name);
        if (config.enabled) {
            first_fire = insert_locked(config);
            live = true;
        }
    }
    cv_.notify_all();

    store_.record_next_fire(config.name, first_fire);
    LOGF_INFO(Scheduler, "Rescheduled %s (%s)", config.name.c_str(), live ? "live" : "disabled");
    journal(JournalEventType::ScheduleChanged, config.name, live ? "rescheduled" : "rescheduled disabled");
    return live;
}

bool TaskScheduler::reconcile(const std::string& name) {
    auto desired = store_.find(name);
    if (!desired || !desired->enabled) {
        cancel(name);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = running_.find(name);
        if (it != running_.end() && it->second.snapshot.same_definition(*desired)) {
            return true;
        }
    }
    return reschedule(*desired);
}

void TaskScheduler::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && !timer_thread_.joinable())
            return;
        stopping_ = true;
        running_.clear();
        queue_ = {};
    }
    cv_.notify_all();

    if (timer_thread_.joinable()) {
        timer_thread_.join();
    }
    // Lets in-flight runs complete
    pool_.shutdown();
    LOG_INFO(Scheduler, "Scheduler stopped");
}

bool TaskScheduler::is_running(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_.count(name) > 0;
}

std::map<std::string, bool> TaskScheduler::active_tasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, bool> result;
    for (const auto& [name, task] : running_) {
        result[name] = true;
    }
    return result;
}

size_t TaskScheduler::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_.size();
}

size_t TaskScheduler::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

// ============================================================================
// Timer and execution
// ============================================================================

int64_t TaskScheduler::insert_locked(const ScheduleConfig& config) {
    RunningTask task;
    task.generation = ++next_generation_;
    task.snapshot = config;

    auto now = SteadyClock::now();
    SteadyClock::time_point due;
    int64_t first_wall;

    if (config.schedule_type == ScheduleType::Cron) {
        first_wall = next_cron_fire(config.schedule_expression, due);
    } else {
        if (!util::parse_positive_ms(config.schedule_expression, task.period_ms)) {
            throw ConfigurationError("schedule '" + config.name + "': bad period '" + config.schedule_expression + "'");
        }
        due = config_.fire_immediately ? now : now + std::chrono::milliseconds(task.period_ms);

        if (config.schedule_type == ScheduleType::FixedDelay && busy_.count(config.name)) {
            // A run of the replaced definition is still in flight; execute() queues
            // the first fire one period after the last of those runs completes
            task.awaiting_idle = true;
            first_wall = to_wall_ms(now + std::chrono::milliseconds(task.period_ms));
            running_[config.name] = std::move(task);
            return first_wall;
        }
        first_wall = to_wall_ms(due);
    }

    queue_.push(FireEntry{due, config.name, task.generation});
    running_[config.name] = std::move(task);
    return first_wall;
}

void TaskScheduler::release_busy_locked(const std::string& name) {
    auto it = busy_.find(name);
    if (it != busy_.end() && --it->second == 0) {
        busy_.erase(it);
    }
}

int64_t TaskScheduler::next_cron_fire(const std::string& expression, SteadyClock::time_point& due) const {
    int64_t wall_now = wall_clock_();
    int64_t next = cron_->next_after(expression, wall_now);
    int64_t wait = next > wall_now ? next - wall_now : 0;
    due = SteadyClock::now() + std::chrono::milliseconds(wait);
    return next;
}

int64_t TaskScheduler::to_wall_ms(SteadyClock::time_point tp) const {
    auto delta = std::chrono::duration_cast<std::chrono::milliseconds>(tp - SteadyClock::now()).count();
    return wall_clock_() + delta;
}

void TaskScheduler::timer_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (queue_.empty()) {
            cv_.wait(lock);
            continue;
        }

        auto due = queue_.top().due;
        if (SteadyClock::now() < due) {
            cv_.wait_until(lock, due);
            continue;
        }

        FireEntry entry = queue_.top();
        queue_.pop();

        auto it = running_.find(entry.name);
        if (it == running_.end() || it->second.generation != entry.generation) {
            continue; // cancelled or replaced
        }
        RunningTask& task = it->second;

        // Rate-based types queue their next fire now so runs may overlap;
        // FIXED_DELAY queues it when the run completes.
        int64_t next_wall = 0;
        if (task.snapshot.schedule_type == ScheduleType::FixedRate) {
            auto period = std::chrono::milliseconds(task.period_ms);
            auto next = entry.due + period;
            auto now = SteadyClock::now();
            while (next <= now) {
                next += period; // skip fires missed while the pool was saturated
            }
            queue_.push(FireEntry{next, entry.name, entry.generation});
            next_wall = to_wall_ms(next);
        } else if (task.snapshot.schedule_type == ScheduleType::Cron) {
            SteadyClock::time_point next;
            next_wall = next_cron_fire(task.snapshot.schedule_expression, next);
            if (next_wall > 0) {
                queue_.push(FireEntry{next, entry.name, entry.generation});
            } else {
                LOGF_WARN(Scheduler, "Cron schedule %s has no further fire times", entry.name.c_str());
            }
        }

        ScheduleConfig snapshot = task.snapshot;
        uint64_t generation = entry.generation;
        ++in_flight_;
        ++busy_[entry.name];

        lock.unlock();
        bool submitted = pool_.submit(
            [this, snapshot, generation, next_wall]() { execute(snapshot, generation, next_wall); });
        lock.lock();

        if (!submitted) {
            --in_flight_;
            release_busy_locked(entry.name);
        }
    }
}

void TaskScheduler::execute(const ScheduleConfig& snapshot, uint64_t generation, int64_t next_wall_ms) {
    const std::string& name = snapshot.name;
    int64_t started_at = wall_clock_();
    LOGF_DEBUG(Scheduler, "Running %s", name.c_str());
    journal(JournalEventType::RunStarted, name, snapshot.handler_ref);

    DispatchOutcome outcome = dispatcher_.invoke(snapshot.handler_ref, snapshot.parameters);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        release_busy_locked(name);

        auto it = running_.find(name);
        if (!stopping_ && it != running_.end()) {
            RunningTask& task = it->second;
            bool own_delay = snapshot.schedule_type == ScheduleType::FixedDelay && task.generation == generation;
            bool deferred_start = task.awaiting_idle && busy_.count(name) == 0;
            if (own_delay || deferred_start) {
                task.awaiting_idle = false;
                auto next = SteadyClock::now() + std::chrono::milliseconds(task.period_ms);
                queue_.push(FireEntry{next, name, task.generation});
                next_wall_ms = wall_clock_() + task.period_ms;
            }
        }
    }
    cv_.notify_all();

    try {
        if (outcome.success) {
            store_.record_success(name, started_at, next_wall_ms);
            LOGF_INFO(Scheduler, "%s completed in %llu ms", name.c_str(),
                      static_cast<unsigned long long>(outcome.duration_ms));
            journal(JournalEventType::RunSucceeded, name, "ok");
        } else {
            store_.record_failure(name, outcome.error, started_at, next_wall_ms);
            LOGF_ERROR(Scheduler, "%s failed after %llu ms: %s", name.c_str(),
                       static_cast<unsigned long long>(outcome.duration_ms), outcome.error.c_str());
            journal(JournalEventType::RunFailed, name, outcome.error);
        }
    } catch (const std::exception& e) {
        LOGF_ERROR(Scheduler, "Could not record statistics for %s: %s", name.c_str(), e.what());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        --in_flight_;
    }
}

void TaskScheduler::journal(JournalEventType type, const std::string& source, const std::string& message) {
    if (journal_) {
        journal_->record(type, wall_clock_(), source, message);
    }
}

}  // namespace tradefinder::scheduler
