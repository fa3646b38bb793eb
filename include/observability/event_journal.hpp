#pragma once

/**
 * Event Journal
 *
 * Bounded in-process ring of operational events for the trade finder.
 * Writers: task scheduler, trade signal pipeline, lifecycle manager
 * Readers: admin CLI, tests
 *
 * Design:
 * - Single ring of fixed-size events (oldest overwritten)
 * - Monotonic sequence numbers (never wrap)
 * - Per-type counters, readable without the ring lock
 */

#include <array>
#include <atomic>
#include <cstdint>
#include <cstring>
#include <mutex>
#include <string>
#include <vector>

namespace tradefinder {
namespace observability {

constexpr size_t JOURNAL_RING_SIZE = 1024; // Power of 2 for fast modulo

enum class JournalEventType : uint8_t {
    RunStarted = 0,
    RunSucceeded,
    RunFailed,
    DuplicateSignal,
    TradePersisted,
    AlertSent,
    AlertFailed,
    TradeExpired,
    ScheduleChanged,
    Count // keep last
};

inline const char* journal_event_type_to_string(JournalEventType type) {
    switch (type) {
    case JournalEventType::RunStarted:
        return "RUN_STARTED";
    case JournalEventType::RunSucceeded:
        return "RUN_SUCCEEDED";
    case JournalEventType::RunFailed:
        return "RUN_FAILED";
    case JournalEventType::DuplicateSignal:
        return "DUPLICATE_SIGNAL";
    case JournalEventType::TradePersisted:
        return "TRADE_PERSISTED";
    case JournalEventType::AlertSent:
        return "ALERT_SENT";
    case JournalEventType::AlertFailed:
        return "ALERT_FAILED";
    case JournalEventType::TradeExpired:
        return "TRADE_EXPIRED";
    case JournalEventType::ScheduleChanged:
        return "SCHEDULE_CHANGED";
    case JournalEventType::Count:
        break;
    }
    return "UNKNOWN";
}

struct JournalEvent {
    uint64_t sequence;
    int64_t timestamp_ms;
    JournalEventType type;
    char source[48];   // task name, symbol or component
    char message[160]; // truncated

    void set_source(const std::string& s) { copy_text(source, sizeof(source), s); }
    void set_message(const std::string& s) { copy_text(message, sizeof(message), s); }

private:
    static void copy_text(char* dst, size_t cap, const std::string& s) {
        size_t len = s.size() < cap - 1 ? s.size() : cap - 1;
        std::memcpy(dst, s.data(), len);
        dst[len] = '\0';
    }
};

class EventJournal {
public:
    EventJournal() {
        for (auto& c : counters_) {
            c.store(0);
        }
    }

    EventJournal(const EventJournal&) = delete;
    EventJournal& operator=(const EventJournal&) = delete;

    void record(JournalEventType type, int64_t timestamp_ms, const std::string& source, const std::string& message) {
        JournalEvent event{};
        event.timestamp_ms = timestamp_ms;
        event.type = type;
        event.set_source(source);
        event.set_message(message);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            event.sequence = write_pos_;
            events_[write_pos_ & (JOURNAL_RING_SIZE - 1)] = event;
            ++write_pos_;
        }
        counters_[static_cast<size_t>(type)].fetch_add(1, std::memory_order_relaxed);
    }

    uint64_t count(JournalEventType type) const {
        return counters_[static_cast<size_t>(type)].load(std::memory_order_relaxed);
    }

    uint64_t total() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return write_pos_;
    }

    /**
     * Up to max_count most recent events, oldest first.
     */
    std::vector<JournalEvent> recent(size_t max_count) const {
        std::lock_guard<std::mutex> lock(mutex_);
        uint64_t available = write_pos_ < JOURNAL_RING_SIZE ? write_pos_ : JOURNAL_RING_SIZE;
        uint64_t n = max_count < available ? max_count : available;

        std::vector<JournalEvent> out;
        out.reserve(n);
        for (uint64_t seq = write_pos_ - n; seq < write_pos_; ++seq) {
            out.push_back(events_[seq & (JOURNAL_RING_SIZE - 1)]);
        }
        return out;
    }

private:
    mutable std::mutex mutex_;
    uint64_t write_pos_ = 0; // next sequence number
    std::array<JournalEvent, JOURNAL_RING_SIZE> events_{};
    std::array<std::atomic<uint64_t>, static_cast<size_t>(JournalEventType::Count)> counters_;
};

}  // namespace observability
}  // namespace tradefinder
