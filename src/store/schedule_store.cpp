#include "../../include/store/schedule_store.hpp"

#include "../../include/errors.hpp"
#include "../../include/logging/async_logger.hpp"
#include "../../include/store/json_file.hpp"

#include <algorithm>

namespace tradefinder::store {

using scheduler::ExecutionStatus;
using scheduler::ScheduleConfig;

JsonScheduleConfigStore::JsonScheduleConfigStore(std::string data_dir) {
    if (!data_dir.empty()) {
        path_ = data_dir + "/schedules.json";
        load();
    }
}

void JsonScheduleConfigStore::load() {
    nlohmann::json doc;
    if (!read_json_file(path_, doc))
        return;

    if (!doc.is_array()) {
        throw ConfigurationError("schedule store " + path_ + " is not a JSON array");
    }

    for (const auto& item : doc) {
        ScheduleConfig config = item.get<ScheduleConfig>();
        if (config.name.empty()) {
            LOGF_WARN(Store, "Skipping unnamed schedule in %s", path_.c_str());
            continue;
        }
        configs_[config.name] = std::move(config);
    }
    LOGF_INFO(Store, "Loaded %zu schedule configs from %s", configs_.size(), path_.c_str());
}

bool JsonScheduleConfigStore::persist_locked() const {
    if (path_.empty())
        return true;

    nlohmann::json doc = nlohmann::json::array();
    for (const auto& [name, config] : configs_) {
        doc.push_back(config);
    }
    if (!write_json_atomic(path_, doc)) {
        LOGF_ERROR(Store, "Failed to write %s", path_.c_str());
        return false;
    }
    return true;
}

std::optional<ScheduleConfig> JsonScheduleConfigStore::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = configs_.find(name);
    if (it == configs_.end())
        return std::nullopt;
    return it->second;
}

std::vector<ScheduleConfig> JsonScheduleConfigStore::list() const {
    std::vector<ScheduleConfig> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result.reserve(configs_.size());
        for (const auto& [name, config] : configs_) {
            result.push_back(config);
        }
    }
    std::stable_sort(result.begin(), result.end(),
                     [](const ScheduleConfig& a, const ScheduleConfig& b) { return a.priority < b.priority; });
    return result;
}

bool JsonScheduleConfigStore::insert(const ScheduleConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!configs_.emplace(config.name, config).second)
        return false;

    if (!persist_locked()) {
        configs_.erase(config.name);
        throw TransientCollaboratorError(TransientCollaboratorError::Kind::Unavailable,
                                         "schedule store unavailable: " + path_);
    }
    return true;
}

bool JsonScheduleConfigStore::update_definition(const ScheduleConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = configs_.find(config.name);
    if (it == configs_.end())
        return false;

    ScheduleConfig previous = it->second;
    ScheduleConfig& stored = it->second;
    stored.description = config.description;
    stored.enabled = config.enabled;
    stored.schedule_type = config.schedule_type;
    stored.schedule_expression = config.schedule_expression;
    stored.parameters = config.parameters;
    stored.handler_ref = config.handler_ref;
    stored.priority = config.priority;
    stored.updated_at = config.updated_at;

    if (!persist_locked()) {
        stored = std::move(previous);
        throw TransientCollaboratorError(TransientCollaboratorError::Kind::Unavailable,
                                         "schedule store unavailable: " + path_);
    }
    return true;
}

bool JsonScheduleConfigStore::set_enabled(const std::string& name, bool enabled, int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = configs_.find(name);
    if (it == configs_.end())
        return false;

    ScheduleConfig previous = it->second;
    it->second.enabled = enabled;
    it->second.updated_at = now_ms;

    if (!persist_locked()) {
        it->second = std::move(previous);
        throw TransientCollaboratorError(TransientCollaboratorError::Kind::Unavailable,
                                         "schedule store unavailable: " + path_);
    }
    return true;
}

bool JsonScheduleConfigStore::remove(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = configs_.find(name);
    if (it == configs_.end())
        return false;

    ScheduleConfig previous = std::move(it->second);
    configs_.erase(it);

    if (!persist_locked()) {
        configs_.emplace(name, std::move(previous));
        throw TransientCollaboratorError(TransientCollaboratorError::Kind::Unavailable,
                                         "schedule store unavailable: " + path_);
    }
    return true;
}

// Statistics writes are best-effort: the in-memory counters stay correct
// and the next successful write carries them to disk.

void JsonScheduleConfigStore::record_success(const std::string& name, int64_t at_ms, int64_t next_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = configs_.find(name);
    if (it == configs_.end())
        return; // deleted while the run was in flight

    ScheduleConfig& c = it->second;
    c.execution_count += 1;
    c.last_status = ExecutionStatus::Success;
    c.last_error.clear();
    c.last_execution_at = at_ms;
    c.next_execution_at = next_ms;
    if (!persist_locked()) {
        LOGF_WARN(Store, "Statistics for %s kept in memory only", name.c_str());
    }
}

void JsonScheduleConfigStore::record_failure(const std::string& name, const std::string& error, int64_t at_ms,
                                             int64_t next_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = configs_.find(name);
    if (it == configs_.end())
        return;

    ScheduleConfig& c = it->second;
    c.failure_count += 1;
    c.last_status = ExecutionStatus::Failed;
    c.last_error = error;
    c.last_execution_at = at_ms;
    c.next_execution_at = next_ms;
    if (!persist_locked()) {
        LOGF_WARN(Store, "Statistics for %s kept in memory only", name.c_str());
    }
}

void JsonScheduleConfigStore::record_next_fire(const std::string& name, int64_t next_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = configs_.find(name);
    if (it == configs_.end())
        return;
    it->second.next_execution_at = next_ms;
    if (!persist_locked()) {
        LOGF_WARN(Store, "Statistics for %s kept in memory only", name.c_str());
    }
}

}  // namespace tradefinder::store
