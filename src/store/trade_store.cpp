#include "../../include/store/trade_store.hpp"

#include "../../include/errors.hpp"
#include "../../include/logging/async_logger.hpp"
#include "../../include/store/json_file.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>

namespace tradefinder::store {

using signal::IdentifiedTrade;
using signal::TradeStatus;

namespace {

constexpr const char* ID_PREFIX = "trd_";

uint64_t id_number(const std::string& id) {
    if (id.rfind(ID_PREFIX, 0) != 0)
        return 0;
    return std::strtoull(id.c_str() + 4, nullptr, 10);
}

}  // namespace

JsonTradeStore::JsonTradeStore(std::string data_dir) {
    if (!data_dir.empty()) {
        path_ = data_dir + "/identified_trades.json";
        load();
    }
}

void JsonTradeStore::load() {
    nlohmann::json doc;
    if (!read_json_file(path_, doc))
        return;

    if (!doc.is_array()) {
        throw ConfigurationError("trade store " + path_ + " is not a JSON array");
    }

    for (const auto& item : doc) {
        IdentifiedTrade trade = item.get<IdentifiedTrade>();
        if (trade.id.empty() || trade.dedupe_key.empty()) {
            LOGF_WARN(Store, "Skipping trade without id or dedupe key in %s", path_.c_str());
            continue;
        }
        if (!by_dedupe_key_.emplace(trade.dedupe_key, trade.id).second) {
            LOGF_WARN(Store, "Skipping duplicate dedupe key %s in %s", trade.dedupe_key.c_str(), path_.c_str());
            continue;
        }
        next_id_ = std::max(next_id_, id_number(trade.id) + 1);
        trades_[trade.id] = std::move(trade);
    }
    LOGF_INFO(Store, "Loaded %zu identified trades from %s", trades_.size(), path_.c_str());
}

bool JsonTradeStore::persist_locked() const {
    if (path_.empty())
        return true;

    nlohmann::json doc = nlohmann::json::array();
    for (const auto& [id, trade] : trades_) {
        doc.push_back(trade);
    }
    if (!write_json_atomic(path_, doc)) {
        LOGF_ERROR(Store, "Failed to write %s", path_.c_str());
        return false;
    }
    return true;
}

std::string JsonTradeStore::next_id_locked() {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%s%06llu", ID_PREFIX, static_cast<unsigned long long>(next_id_++));
    return buf;
}

InsertOutcome JsonTradeStore::insert_unique(IdentifiedTrade& trade) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (by_dedupe_key_.count(trade.dedupe_key)) {
        return InsertOutcome::Duplicate;
    }

    std::string id = next_id_locked();
    trade.id = id;
    trades_[id] = trade;
    by_dedupe_key_[trade.dedupe_key] = id;

    if (!persist_locked()) {
        trades_.erase(id);
        by_dedupe_key_.erase(trade.dedupe_key);
        trade.id.clear();
        throw TransientCollaboratorError(TransientCollaboratorError::Kind::Unavailable,
                                         "trade store unavailable: " + path_);
    }
    return InsertOutcome::Inserted;
}

std::optional<IdentifiedTrade> JsonTradeStore::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = trades_.find(id);
    if (it == trades_.end())
        return std::nullopt;
    return it->second;
}

std::vector<IdentifiedTrade> JsonTradeStore::query(const TradeQuery& q) const {
    std::vector<IdentifiedTrade> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, t] : trades_) {
            if (q.symbol && t.symbol != *q.symbol)
                continue;
            if (q.status && t.status != *q.status)
                continue;
            if (q.direction && t.direction != *q.direction)
                continue;
            if (q.min_confidence && t.confidence < *q.min_confidence)
                continue;
            if (t.identified_at < q.since_ms)
                continue;
            if (q.until_ms != 0 && t.identified_at >= q.until_ms)
                continue;
            result.push_back(t);
        }
    }

    std::stable_sort(result.begin(), result.end(), [](const IdentifiedTrade& a, const IdentifiedTrade& b) {
        return a.identified_at > b.identified_at;
    });
    if (q.limit != 0 && result.size() > q.limit) {
        result.resize(q.limit);
    }
    return result;
}

TransitionOutcome JsonTradeStore::mark_alerted(const std::string& id, const std::string& alert_type, int64_t at_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = trades_.find(id);
    if (it == trades_.end())
        return TransitionOutcome::NotFound;

    IdentifiedTrade& t = it->second;
    if (!signal::can_transition(t.status, TradeStatus::Alerted))
        return TransitionOutcome::IllegalTransition;

    IdentifiedTrade previous = t;
    t.status = TradeStatus::Alerted;
    t.alert_sent = true;
    t.alert_sent_at = at_ms;
    t.alert_type = alert_type;
    t.updated_at = at_ms;

    if (!persist_locked()) {
        t = std::move(previous);
        throw TransientCollaboratorError(TransientCollaboratorError::Kind::Unavailable,
                                         "trade store unavailable: " + path_);
    }
    return TransitionOutcome::Ok;
}

TransitionOutcome JsonTradeStore::transition(const std::string& id, TradeStatus to, int64_t now_ms,
                                             std::optional<bool> alert_sent, std::optional<std::string> alert_type) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = trades_.find(id);
    if (it == trades_.end())
        return TransitionOutcome::NotFound;

    IdentifiedTrade& t = it->second;
    if (!signal::can_transition(t.status, to))
        return TransitionOutcome::IllegalTransition;

    IdentifiedTrade previous = t;
    t.status = to;
    t.updated_at = now_ms;
    if (alert_sent) {
        t.alert_sent = *alert_sent;
    }
    if (alert_type) {
        t.alert_type = *alert_type;
    }

    if (!persist_locked()) {
        t = std::move(previous);
        throw TransientCollaboratorError(TransientCollaboratorError::Kind::Unavailable,
                                         "trade store unavailable: " + path_);
    }
    return TransitionOutcome::Ok;
}

std::vector<IdentifiedTrade> JsonTradeStore::expire_due(int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<IdentifiedTrade> expired;
    std::vector<IdentifiedTrade> previous;

    for (auto& [id, t] : trades_) {
        if (!signal::is_open(t.status) || t.expires_at == 0 || t.expires_at > now_ms)
            continue;
        previous.push_back(t);
        t.status = TradeStatus::Expired;
        t.updated_at = now_ms;
        expired.push_back(t);
    }

    if (!expired.empty() && !persist_locked()) {
        for (auto& p : previous) {
            trades_[p.id] = std::move(p);
        }
        throw TransientCollaboratorError(TransientCollaboratorError::Kind::Unavailable,
                                         "trade store unavailable: " + path_);
    }
    return expired;
}

size_t JsonTradeStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trades_.size();
}

}  // namespace tradefinder::store
