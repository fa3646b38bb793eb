#include "../../include/lifecycle/trade_lifecycle_manager.hpp"

#include "../../include/logging/async_logger.hpp"
#include "../../include/util/string_utils.hpp"

#include <cmath>

namespace tradefinder::lifecycle {

using admin::AdminOutcome;
using admin::AdminResult;
using signal::IdentifiedTrade;
using signal::TradeStatus;

TradeLifecycleManager::TradeLifecycleManager(store::TradeStore& trades, observability::EventJournal* journal,
                                             util::WallClock clock)
    : trades_(trades), journal_(journal), clock_(std::move(clock)) {}

size_t TradeLifecycleManager::sweep_expired() {
    const int64_t now = clock_();
    std::vector<IdentifiedTrade> expired = trades_.expire_due(now);

    for (const auto& t : expired) {
        LOGF_INFO(Lifecycle, "Trade %s expired (%s %s, identified %s)", t.id.c_str(), t.symbol.c_str(),
                  t.direction.c_str(), util::format_iso8601_utc(t.identified_at).c_str());
        if (journal_) {
            journal_->record(observability::JournalEventType::TradeExpired, now, t.symbol, t.id);
        }
    }

    if (!expired.empty()) {
        LOGF_INFO(Lifecycle, "Expiry sweep: %zu trades expired", expired.size());
    }
    return expired.size();
}

TradeStatistics TradeLifecycleManager::report_statistics(int window_hours) const {
    TradeStatistics stats;
    stats.window_hours = window_hours;

    store::TradeQuery q;
    q.since_ms = clock_() - static_cast<int64_t>(window_hours) * util::MS_PER_HOUR;
    std::vector<IdentifiedTrade> window = trades_.query(q);

    int64_t confidence_sum = 0;
    for (const auto& t : window) {
        ++stats.total;
        ++stats.by_status[signal::trade_status_to_string(t.status)];
        ++stats.by_symbol[t.symbol];
        ++stats.by_direction[t.direction];
        if (t.alert_sent)
            ++stats.alerted;
        confidence_sum += t.confidence;
    }

    if (stats.total > 0) {
        double avg = static_cast<double>(confidence_sum) / static_cast<double>(stats.total);
        stats.avg_confidence = std::round(avg * 10.0) / 10.0;
    }
    return stats;
}

void TradeLifecycleManager::log_statistics() const {
    TradeStatistics s = report_statistics(24);

    std::string statuses;
    for (const auto& [name, n] : s.by_status) {
        statuses += name + "=" + std::to_string(n) + " ";
    }
    std::string symbols;
    for (const auto& [name, n] : s.by_symbol) {
        symbols += name + "=" + std::to_string(n) + " ";
    }

    LOGF_INFO(Lifecycle, "24h trades: total=%zu alerted=%zu avg_conf=%.1f", s.total, s.alerted, s.avg_confidence);
    if (s.total > 0) {
        LOGF_INFO(Lifecycle, "  by status: %s", statuses.c_str());
        LOGF_INFO(Lifecycle, "  by symbol: %s", symbols.c_str());
    }
}

AdminResult<IdentifiedTrade> TradeLifecycleManager::update_status(const std::string& id, const std::string& status,
                                                                  std::optional<bool> alert_sent,
                                                                  std::optional<std::string> alert_type) {
    using Result = AdminResult<IdentifiedTrade>;

    TradeStatus target;
    if (!signal::trade_status_from_string(util::to_upper(util::trim(status)), target)) {
        return Result::failure(AdminOutcome::Validation, "Unknown trade status: " + status);
    }
    if (!signal::is_manual_target(target)) {
        return Result::failure(AdminOutcome::Validation,
                               std::string("Status cannot be set manually: ") + signal::trade_status_to_string(target));
    }

    auto current = trades_.find(id);
    if (!current) {
        return Result::failure(AdminOutcome::NotFound, "Trade not found: " + id);
    }

    switch (trades_.transition(id, target, clock_(), alert_sent, std::move(alert_type))) {
    case store::TransitionOutcome::NotFound:
        return Result::failure(AdminOutcome::NotFound, "Trade not found: " + id);
    case store::TransitionOutcome::IllegalTransition:
        return Result::failure(AdminOutcome::Validation,
                               std::string("Illegal transition ") + signal::trade_status_to_string(current->status) +
                                   " -> " + signal::trade_status_to_string(target));
    case store::TransitionOutcome::Ok:
        break;
    }

    LOGF_INFO(Lifecycle, "Trade %s: %s -> %s", id.c_str(), signal::trade_status_to_string(current->status),
              signal::trade_status_to_string(target));

    auto updated = trades_.find(id);
    if (!updated) {
        return Result::failure(AdminOutcome::NotFound, "Trade not found: " + id);
    }
    return Result::success(std::move(*updated));
}

std::vector<IdentifiedTrade> TradeLifecycleManager::recent(int hours, size_t limit) const {
    store::TradeQuery q;
    q.since_ms = clock_() - static_cast<int64_t>(hours) * util::MS_PER_HOUR;
    q.limit = limit;
    return trades_.query(q);
}

}  // namespace tradefinder::lifecycle
