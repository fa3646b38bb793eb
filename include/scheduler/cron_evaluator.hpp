#pragma once

#include <cstdint>
#include <string>

namespace tradefinder {
namespace scheduler {

/**
 * CronEvaluator - external cron expression evaluator
 *
 * The scheduler does not parse cron syntax itself. Deployments that use
 * CRON schedules inject an implementation; without one every CRON config
 * is rejected with ConfigurationError.
 */
class CronEvaluator {
public:
    virtual ~CronEvaluator() = default;

    virtual bool is_valid(const std::string& expression) const = 0;

    /**
     * Next fire time strictly after `after_ms` (epoch ms).
     * Returns 0 if the expression never fires again.
     */
    virtual int64_t next_after(const std::string& expression, int64_t after_ms) const = 0;
};

}  // namespace scheduler
}  // namespace tradefinder
