#pragma once

/**
 * ScheduleAdmin - create/read/update/enable/disable/delete of ScheduleConfigs
 *
 * The store is the source of truth. Every mutation persists first and then
 * reconciles the live scheduler for that name. Mutations are serialized by
 * one admin mutex so a persist and its reconcile are never interleaved with
 * another edit of the same config.
 *
 * A store-only admin (apply_live = false) persists and validates but never
 * touches the live scheduler; a separate daemon picks the edits up on restart.
 */

#include "admin_result.hpp"
#include "../scheduler/schedule_config.hpp"
#include "../scheduler/task_scheduler.hpp"
#include "../store/schedule_store.hpp"
#include "../util/time_utils.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace tradefinder {
namespace admin {

struct SchedulerStatistics {
    size_t total_configs = 0;
    size_t enabled_configs = 0;
    size_t active_tasks = 0;
    int64_t total_executions = 0;
    int64_t total_failures = 0;
    std::vector<std::string> active_names;
};

class ScheduleAdmin {
public:
    ScheduleAdmin(store::ScheduleConfigStore& store, scheduler::TaskScheduler& scheduler,
                  util::WallClock clock = util::wall_clock_ms, bool apply_live = true);

    // Created, Conflict (name taken) or Validation
    AdminResult<scheduler::ScheduleConfig> create(scheduler::ScheduleConfig config);

    AdminResult<scheduler::ScheduleConfig> get(const std::string& name) const;
    std::vector<scheduler::ScheduleConfig> list() const;

    // Replaces the definition; counters and created_at are kept
    AdminResult<scheduler::ScheduleConfig> update(const std::string& name, scheduler::ScheduleConfig config);

    AdminResult<scheduler::ScheduleConfig> enable(const std::string& name);
    AdminResult<scheduler::ScheduleConfig> disable(const std::string& name);

    // Ok with the removed config, or NotFound
    AdminResult<scheduler::ScheduleConfig> remove(const std::string& name);

    SchedulerStatistics statistics() const;

private:
    store::ScheduleConfigStore& store_;
    scheduler::TaskScheduler& scheduler_;
    util::WallClock clock_;
    bool apply_live_;
    std::mutex mutex_;

    void sync_live(const std::string& name);

    AdminResult<scheduler::ScheduleConfig> set_enabled(const std::string& name, bool enabled);
    std::string check(const scheduler::ScheduleConfig& config) const;
};

}  // namespace admin
}  // namespace tradefinder
