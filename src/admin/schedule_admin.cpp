#include "../../include/admin/schedule_admin.hpp"

#include "../../include/errors.hpp"
#include "../../include/logging/async_logger.hpp"
#include "../../include/util/string_utils.hpp"

namespace tradefinder::admin {

using scheduler::ScheduleConfig;
using Result = AdminResult<ScheduleConfig>;

ScheduleAdmin::ScheduleAdmin(store::ScheduleConfigStore& store, scheduler::TaskScheduler& scheduler,
                             util::WallClock clock, bool apply_live)
    : store_(store), scheduler_(scheduler), clock_(std::move(clock)), apply_live_(apply_live) {}

void ScheduleAdmin::sync_live(const std::string& name) {
    if (apply_live_) {
        scheduler_.reconcile(name);
    } else {
        LOGF_DEBUG(Admin, "Store-only edit of %s, live scheduler untouched", name.c_str());
    }
}

// Empty string = valid
std::string ScheduleAdmin::check(const ScheduleConfig& config) const {
    if (util::trim(config.name).empty()) {
        return "name is required";
    }
    try {
        scheduler_.validate(config);
    } catch (const ConfigurationError& e) {
        return e.what();
    }
    return {};
}

Result ScheduleAdmin::create(ScheduleConfig config) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string problem = check(config);
    if (!problem.empty()) {
        return Result::failure(AdminOutcome::Validation, problem);
    }

    const int64_t now = clock_();
    config.execution_count = 0;
    config.failure_count = 0;
    config.last_status = scheduler::ExecutionStatus::None;
    config.last_error.clear();
    config.last_execution_at = 0;
    config.next_execution_at = 0;
    config.created_at = now;
    config.updated_at = now;

    if (!store_.insert(config)) {
        return Result::failure(AdminOutcome::Conflict, "Schedule already exists: " + config.name);
    }
    LOGF_INFO(Admin, "Created schedule %s (%s %s -> %s)", config.name.c_str(),
              scheduler::schedule_type_to_string(config.schedule_type), config.schedule_expression.c_str(),
              config.handler_ref.c_str());

    sync_live(config.name);
    return Result::success(store_.find(config.name).value_or(config), AdminOutcome::Created);
}

Result ScheduleAdmin::get(const std::string& name) const {
    auto config = store_.find(name);
    if (!config) {
        return Result::failure(AdminOutcome::NotFound, "Schedule not found: " + name);
    }
    return Result::success(std::move(*config));
}

std::vector<ScheduleConfig> ScheduleAdmin::list() const { return store_.list(); }

Result ScheduleAdmin::update(const std::string& name, ScheduleConfig config) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!store_.find(name)) {
        return Result::failure(AdminOutcome::NotFound, "Schedule not found: " + name);
    }
    config.name = name;

    std::string problem = check(config);
    if (!problem.empty()) {
        return Result::failure(AdminOutcome::Validation, problem);
    }

    config.updated_at = clock_();
    if (!store_.update_definition(config)) {
        return Result::failure(AdminOutcome::NotFound, "Schedule not found: " + name);
    }
    LOGF_INFO(Admin, "Updated schedule %s", name.c_str());

    sync_live(name);
    return Result::success(store_.find(name).value_or(config));
}

Result ScheduleAdmin::enable(const std::string& name) { return set_enabled(name, true); }

Result ScheduleAdmin::disable(const std::string& name) { return set_enabled(name, false); }

Result ScheduleAdmin::set_enabled(const std::string& name, bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto current = store_.find(name);
    if (!current) {
        return Result::failure(AdminOutcome::NotFound, "Schedule not found: " + name);
    }

    if (enabled) {
        // A config stored disabled may reference a handler that no longer exists
        ScheduleConfig candidate = *current;
        candidate.enabled = true;
        std::string problem = check(candidate);
        if (!problem.empty()) {
            return Result::failure(AdminOutcome::Validation, problem);
        }
    }

    if (!store_.set_enabled(name, enabled, clock_())) {
        return Result::failure(AdminOutcome::NotFound, "Schedule not found: " + name);
    }
    LOGF_INFO(Admin, "%s schedule %s", enabled ? "Enabled" : "Disabled", name.c_str());

    sync_live(name);
    return Result::success(store_.find(name).value_or(*current));
}

Result ScheduleAdmin::remove(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto current = store_.find(name);
    if (!current || !store_.remove(name)) {
        return Result::failure(AdminOutcome::NotFound, "Schedule not found: " + name);
    }
    if (apply_live_) {
        scheduler_.cancel(name);
    }
    LOGF_INFO(Admin, "Deleted schedule %s", name.c_str());
    return Result::success(std::move(*current));
}

SchedulerStatistics ScheduleAdmin::statistics() const {
    SchedulerStatistics stats;
    for (const auto& c : store_.list()) {
        ++stats.total_configs;
        if (c.enabled)
            ++stats.enabled_configs;
        stats.total_executions += c.execution_count;
        stats.total_failures += c.failure_count;
    }
    for (const auto& [name, live] : scheduler_.active_tasks()) {
        if (live) {
            ++stats.active_tasks;
            stats.active_names.push_back(name);
        }
    }
    return stats;
}

}  // namespace tradefinder::admin
