#pragma once

/**
 * TradeStore - durable store of IdentifiedTrade records
 *
 * dedupe_key uniqueness is enforced inside insert_unique(), under the same
 * lock as the insert itself. Callers never check-then-insert.
 * Status changes go through the IdentifiedTrade state machine; an illegal
 * transition leaves the record untouched.
 */

#include "../signal/identified_trade.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tradefinder {
namespace store {

enum class InsertOutcome : uint8_t { Inserted, Duplicate };

enum class TransitionOutcome : uint8_t { Ok, NotFound, IllegalTransition };

/**
 * Trade query filter; unset fields match everything.
 * Results are newest first (identified_at descending).
 */
struct TradeQuery {
    std::optional<std::string> symbol;
    std::optional<signal::TradeStatus> status;
    std::optional<std::string> direction;
    std::optional<int> min_confidence;
    int64_t since_ms = 0; // identified_at >= since_ms
    int64_t until_ms = 0; // identified_at < until_ms, 0 = open-ended
    size_t limit = 0;     // 0 = unlimited
};

class TradeStore {
public:
    virtual ~TradeStore() = default;

    /**
     * Insert if no record has trade.dedupe_key. Assigns trade.id on success.
     * Throws TransientCollaboratorError if the record cannot be persisted.
     */
    virtual InsertOutcome insert_unique(signal::IdentifiedTrade& trade) = 0;

    virtual std::optional<signal::IdentifiedTrade> find(const std::string& id) const = 0;
    virtual std::vector<signal::IdentifiedTrade> query(const TradeQuery& q) const = 0;

    /**
     * IDENTIFIED -> ALERTED with alert_sent, alert_sent_at and alert_type set.
     */
    virtual TransitionOutcome mark_alerted(const std::string& id, const std::string& alert_type, int64_t at_ms) = 0;

    /**
     * Apply a status change if the state machine allows it.
     * alert_sent / alert_type are updated when given.
     */
    virtual TransitionOutcome transition(const std::string& id, signal::TradeStatus to, int64_t now_ms,
                                         std::optional<bool> alert_sent = std::nullopt,
                                         std::optional<std::string> alert_type = std::nullopt) = 0;

    /**
     * Move every open trade with expires_at <= now to EXPIRED.
     * @return the expired records (after the update)
     */
    virtual std::vector<signal::IdentifiedTrade> expire_due(int64_t now_ms) = 0;

    virtual size_t size() const = 0;
};

/**
 * Map-backed store persisted to "<data_dir>/identified_trades.json".
 * An empty data_dir keeps everything in memory.
 */
class JsonTradeStore : public TradeStore {
public:
    explicit JsonTradeStore(std::string data_dir = "");

    InsertOutcome insert_unique(signal::IdentifiedTrade& trade) override;
    std::optional<signal::IdentifiedTrade> find(const std::string& id) const override;
    std::vector<signal::IdentifiedTrade> query(const TradeQuery& q) const override;
    TransitionOutcome mark_alerted(const std::string& id, const std::string& alert_type, int64_t at_ms) override;
    TransitionOutcome transition(const std::string& id, signal::TradeStatus to, int64_t now_ms,
                                 std::optional<bool> alert_sent = std::nullopt,
                                 std::optional<std::string> alert_type = std::nullopt) override;
    std::vector<signal::IdentifiedTrade> expire_due(int64_t now_ms) override;
    size_t size() const override;

private:
    std::string path_;
    mutable std::mutex mutex_;
    std::map<std::string, signal::IdentifiedTrade> trades_;         // id -> trade
    std::unordered_map<std::string, std::string> by_dedupe_key_;    // dedupe_key -> id
    uint64_t next_id_ = 1;

    void load();
    bool persist_locked() const;
    std::string next_id_locked();
};

}  // namespace store
}  // namespace tradefinder
