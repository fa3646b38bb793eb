#pragma once

/**
 * Default schedule seeding
 *
 * Creates the standard trade finder and maintenance schedules when they are
 * absent from the store. Existing configs are left untouched, so operator
 * edits survive restarts.
 */

#include "schedule_config.hpp"
#include "../logging/async_logger.hpp"
#include "../store/schedule_store.hpp"

#include <string>
#include <vector>

namespace tradefinder {
namespace scheduler {

// Handler references registered by the trade_finder daemon
constexpr const char* HANDLER_FIND_TRADES = "tradeFinder.findTrades";
constexpr const char* HANDLER_EXPIRE_TRADES = "tradeLifecycle.expireTrades";
constexpr const char* HANDLER_LOG_STATISTICS = "tradeLifecycle.logStatistics";

inline std::vector<ScheduleConfig> default_schedules(const std::vector<std::string>& symbols, int64_t now_ms) {
    std::vector<ScheduleConfig> defaults;

    ScheduleConfig finder;
    finder.name = "trade-finder-main";
    finder.description = "Primary trade finder - every 5 minutes";
    finder.schedule_type = ScheduleType::FixedRate;
    finder.schedule_expression = "300000";
    finder.parameters = ParameterBag{{"symbols", symbols}};
    finder.handler_ref = HANDLER_FIND_TRADES;
    finder.priority = 10;
    defaults.push_back(finder);

    ScheduleConfig expiry;
    expiry.name = "trade-expiration-checker";
    expiry.description = "Marks expired trades - every 15 minutes";
    expiry.schedule_type = ScheduleType::FixedRate;
    expiry.schedule_expression = "900000";
    expiry.handler_ref = HANDLER_EXPIRE_TRADES;
    expiry.priority = 5;
    defaults.push_back(expiry);

    ScheduleConfig stats;
    stats.name = "statistics-logger";
    stats.description = "Logs trade statistics - every hour";
    stats.schedule_type = ScheduleType::FixedRate;
    stats.schedule_expression = "3600000";
    stats.handler_ref = HANDLER_LOG_STATISTICS;
    stats.priority = 3;
    defaults.push_back(stats);

    for (auto& c : defaults) {
        c.created_at = now_ms;
        c.updated_at = now_ms;
    }
    return defaults;
}

/**
 * Insert each default config whose name is not yet in the store.
 * @return number of configs created
 */
inline size_t seed_default_schedules(store::ScheduleConfigStore& store, const std::vector<std::string>& symbols,
                                     int64_t now_ms) {
    size_t created = 0;
    for (const auto& config : default_schedules(symbols, now_ms)) {
        if (store.insert(config)) {
            LOGF_INFO(Scheduler, "Seeded schedule %s", config.name.c_str());
            ++created;
        } else {
            LOGF_DEBUG(Scheduler, "Schedule %s already exists, skipping", config.name.c_str());
        }
    }
    return created;
}

}  // namespace scheduler
}  // namespace tradefinder
