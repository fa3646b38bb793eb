#pragma once

/**
 * TradeLifecycleManager - expiry sweep, statistics and manual status updates
 *
 * sweep_expired() and log_statistics() are the bodies of the
 * tradeLifecycle.expireTrades / tradeLifecycle.logStatistics handlers and
 * are scheduled independently of trade finding.
 */

#include "../admin/admin_result.hpp"
#include "../observability/event_journal.hpp"
#include "../signal/identified_trade.hpp"
#include "../store/trade_store.hpp"
#include "../util/time_utils.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tradefinder {
namespace lifecycle {

struct TradeStatistics {
    int window_hours = 24;
    size_t total = 0;
    size_t alerted = 0; // alert_sent == true
    double avg_confidence = 0.0; // one decimal
    std::map<std::string, size_t> by_status;
    std::map<std::string, size_t> by_symbol;
    std::map<std::string, size_t> by_direction;
};

class TradeLifecycleManager {
public:
    explicit TradeLifecycleManager(store::TradeStore& trades, observability::EventJournal* journal = nullptr,
                                   util::WallClock clock = util::wall_clock_ms);

    /**
     * Expire every open trade whose expires_at has passed.
     * @return number of trades expired
     */
    size_t sweep_expired();

    // Read-only aggregate over the trailing window
    TradeStatistics report_statistics(int window_hours) const;

    void log_statistics() const;

    /**
     * Manual status change (TAKEN, INVALIDATED, CANCELLED).
     * NotFound for an unknown id; Validation for an unknown status name,
     * a status that cannot be set manually, or a transition out of a
     * terminal state.
     */
    admin::AdminResult<signal::IdentifiedTrade> update_status(const std::string& id, const std::string& status,
                                                              std::optional<bool> alert_sent = std::nullopt,
                                                              std::optional<std::string> alert_type = std::nullopt);

    std::optional<signal::IdentifiedTrade> find(const std::string& id) const { return trades_.find(id); }
    std::vector<signal::IdentifiedTrade> query(const store::TradeQuery& q) const { return trades_.query(q); }

    // Trades identified in the last `hours`, newest first
    std::vector<signal::IdentifiedTrade> recent(int hours, size_t limit = 0) const;

private:
    store::TradeStore& trades_;
    observability::EventJournal* journal_;
    util::WallClock clock_;
};

}  // namespace lifecycle
}  // namespace tradefinder
