#pragma once

/**
 * ScheduleConfig - durable definition of a named scheduled job
 *
 * The record store is the single source of truth for these. The scheduler
 * keeps only a snapshot of the last applied definition per running task.
 *
 * Execution counters live here but are only ever changed through the
 * store's atomic record_success/record_failure operations.
 */

#include "../errors.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace tradefinder {
namespace scheduler {

// Opaque string-keyed value bag passed untouched to handlers
using ParameterBag = nlohmann::json;

enum class ScheduleType : uint8_t { Cron, FixedRate, FixedDelay };

enum class ExecutionStatus : uint8_t { None, Success, Failed };

inline const char* schedule_type_to_string(ScheduleType type) {
    switch (type) {
    case ScheduleType::Cron:
        return "CRON";
    case ScheduleType::FixedRate:
        return "FIXED_RATE";
    case ScheduleType::FixedDelay:
        return "FIXED_DELAY";
    }
    return "UNKNOWN";
}

inline bool schedule_type_from_string(const std::string& name, ScheduleType& out) {
    if (name == "CRON") {
        out = ScheduleType::Cron;
    } else if (name == "FIXED_RATE") {
        out = ScheduleType::FixedRate;
    } else if (name == "FIXED_DELAY") {
        out = ScheduleType::FixedDelay;
    } else {
        return false;
    }
    return true;
}

inline const char* execution_status_to_string(ExecutionStatus status) {
    switch (status) {
    case ExecutionStatus::None:
        return "";
    case ExecutionStatus::Success:
        return "SUCCESS";
    case ExecutionStatus::Failed:
        return "FAILED";
    }
    return "";
}

inline ExecutionStatus execution_status_from_string(const std::string& name) {
    if (name == "SUCCESS")
        return ExecutionStatus::Success;
    if (name == "FAILED")
        return ExecutionStatus::Failed;
    return ExecutionStatus::None;
}

struct ScheduleConfig {
    std::string name; // unique, immutable key
    std::string description;
    bool enabled = true;
    ScheduleType schedule_type = ScheduleType::FixedRate;
    std::string schedule_expression; // cron string or millisecond duration
    ParameterBag parameters = ParameterBag::object();
    std::string handler_ref;
    int priority = 5;

    // Execution statistics
    int64_t execution_count = 0;
    int64_t failure_count = 0;
    ExecutionStatus last_status = ExecutionStatus::None;
    std::string last_error;
    int64_t last_execution_at = 0; // epoch ms, 0 = never
    int64_t next_execution_at = 0;

    int64_t created_at = 0;
    int64_t updated_at = 0;

    /**
     * True if the parts that drive scheduling are equal
     * (type, expression, handler, parameters, enabled).
     * Statistics and timestamps are ignored.
     */
    bool same_definition(const ScheduleConfig& other) const {
        return enabled == other.enabled && schedule_type == other.schedule_type &&
               schedule_expression == other.schedule_expression && handler_ref == other.handler_ref &&
               parameters == other.parameters;
    }
};

// ============================================================================
// JSON mapping (persisted field names)
// ============================================================================

inline void to_json(nlohmann::json& j, const ScheduleConfig& c) {
    j = nlohmann::json{{"name", c.name},
                       {"description", c.description},
                       {"enabled", c.enabled},
                       {"scheduleType", schedule_type_to_string(c.schedule_type)},
                       {"scheduleExpression", c.schedule_expression},
                       {"parameters", c.parameters},
                       {"handlerRef", c.handler_ref},
                       {"priority", c.priority},
                       {"executionCount", c.execution_count},
                       {"failureCount", c.failure_count},
                       {"lastStatus", execution_status_to_string(c.last_status)},
                       {"lastError", c.last_error},
                       {"lastExecutionAt", c.last_execution_at},
                       {"nextExecutionAt", c.next_execution_at},
                       {"createdAt", c.created_at},
                       {"updatedAt", c.updated_at}};
}

/**
 * Missing fields keep their defaults; an unknown scheduleType throws
 * ConfigurationError so a corrupt record is never silently rescheduled.
 */
inline void from_json(const nlohmann::json& j, ScheduleConfig& c) {
    c.name = j.value("name", std::string());
    c.description = j.value("description", std::string());
    c.enabled = j.value("enabled", true);
    std::string type = j.value("scheduleType", std::string("FIXED_RATE"));
    if (!schedule_type_from_string(type, c.schedule_type)) {
        throw ConfigurationError("unknown scheduleType '" + type + "'");
    }
    c.schedule_expression = j.value("scheduleExpression", std::string());
    c.parameters = j.contains("parameters") && j["parameters"].is_object() ? j["parameters"] : ParameterBag::object();
    c.handler_ref = j.value("handlerRef", std::string());
    c.priority = j.value("priority", 5);
    c.execution_count = j.value("executionCount", int64_t{0});
    c.failure_count = j.value("failureCount", int64_t{0});
    c.last_status = execution_status_from_string(j.value("lastStatus", std::string()));
    c.last_error = j.value("lastError", std::string());
    c.last_execution_at = j.value("lastExecutionAt", int64_t{0});
    c.next_execution_at = j.value("nextExecutionAt", int64_t{0});
    c.created_at = j.value("createdAt", int64_t{0});
    c.updated_at = j.value("updatedAt", int64_t{0});
}

}  // namespace scheduler
}  // namespace tradefinder
