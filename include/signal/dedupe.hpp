#pragma once

/**
 * DeduplicationGate - suppresses repeated signals for the same setup
 *
 * The existence check IS the atomic unique insert: two overlapping runs
 * that produce the same key race inside the store and exactly one wins.
 * A separate read-then-write check would let both through.
 */

#include "identified_trade.hpp"
#include "../logging/async_logger.hpp"
#include "../observability/event_journal.hpp"
#include "../store/trade_store.hpp"

#include <atomic>

namespace tradefinder {
namespace signal {

class DeduplicationGate {
public:
    explicit DeduplicationGate(store::TradeStore& store, observability::EventJournal* journal = nullptr)
        : store_(store), journal_(journal) {}

    /**
     * Persist `trade` unless its dedupe_key is already taken.
     * @return true if inserted (trade.id assigned), false if a duplicate was discarded
     */
    bool admit(IdentifiedTrade& trade) {
        if (store_.insert_unique(trade) == store::InsertOutcome::Inserted) {
            admitted_.fetch_add(1, std::memory_order_relaxed);
            return true;
        }

        suppressed_.fetch_add(1, std::memory_order_relaxed);
        LOGF_INFO(Pipeline, "Duplicate setup suppressed: %s", trade.dedupe_key.c_str());
        if (journal_) {
            journal_->record(observability::JournalEventType::DuplicateSignal, trade.identified_at, trade.symbol,
                             trade.dedupe_key);
        }
        return false;
    }

    uint64_t admitted() const { return admitted_.load(); }
    uint64_t suppressed() const { return suppressed_.load(); }

private:
    store::TradeStore& store_;
    observability::EventJournal* journal_;
    std::atomic<uint64_t> admitted_{0};
    std::atomic<uint64_t> suppressed_{0};
};

}  // namespace signal
}  // namespace tradefinder
