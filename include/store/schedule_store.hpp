#pragma once

/**
 * ScheduleConfigStore - durable store of ScheduleConfig records
 *
 * Single source of truth for schedule definitions. Names are unique.
 * Counter updates (record_success/record_failure) are atomic increments
 * inside the store, never read-modify-write in the caller, so overlapping
 * runs of the same task cannot lose updates.
 *
 * Mutations that cannot be persisted are rolled back and reported as
 * TransientCollaboratorError(Unavailable).
 */

#include "../scheduler/schedule_config.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tradefinder {
namespace store {

class ScheduleConfigStore {
public:
    virtual ~ScheduleConfigStore() = default;

    virtual std::optional<scheduler::ScheduleConfig> find(const std::string& name) const = 0;

    // Ordered by priority (lower first), then name
    virtual std::vector<scheduler::ScheduleConfig> list() const = 0;

    // False if a config with that name already exists
    virtual bool insert(const scheduler::ScheduleConfig& config) = 0;

    /**
     * Replace the definition fields (description, enabled, type, expression,
     * parameters, handler, priority) and updated_at. Counters, status and
     * created_at are kept. False if the name is unknown.
     */
    virtual bool update_definition(const scheduler::ScheduleConfig& config) = 0;

    virtual bool set_enabled(const std::string& name, bool enabled, int64_t now_ms) = 0;

    virtual bool remove(const std::string& name) = 0;

    // execution_count += 1, last_status = SUCCESS, last_error cleared
    virtual void record_success(const std::string& name, int64_t at_ms, int64_t next_ms) = 0;

    // failure_count += 1, last_status = FAILED, last_error = error
    virtual void record_failure(const std::string& name, const std::string& error, int64_t at_ms,
                                int64_t next_ms) = 0;

    virtual void record_next_fire(const std::string& name, int64_t next_ms) = 0;
};

/**
 * Map-backed store persisted to "<data_dir>/schedules.json".
 * An empty data_dir keeps everything in memory.
 */
class JsonScheduleConfigStore : public ScheduleConfigStore {
public:
    explicit JsonScheduleConfigStore(std::string data_dir = "");

    std::optional<scheduler::ScheduleConfig> find(const std::string& name) const override;
    std::vector<scheduler::ScheduleConfig> list() const override;
    bool insert(const scheduler::ScheduleConfig& config) override;
    bool update_definition(const scheduler::ScheduleConfig& config) override;
    bool set_enabled(const std::string& name, bool enabled, int64_t now_ms) override;
    bool remove(const std::string& name) override;
    void record_success(const std::string& name, int64_t at_ms, int64_t next_ms) override;
    void record_failure(const std::string& name, const std::string& error, int64_t at_ms, int64_t next_ms) override;
    void record_next_fire(const std::string& name, int64_t next_ms) override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    mutable std::mutex mutex_;
    std::map<std::string, scheduler::ScheduleConfig> configs_;

    void load();

    // Caller holds mutex_
    bool persist_locked() const;
};

}  // namespace store
}  // namespace tradefinder
