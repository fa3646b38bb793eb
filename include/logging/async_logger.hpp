#pragma once

#include "../util/time_utils.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <functional>
#include <mutex>
#include <thread>

namespace tradefinder {
namespace logging {

/**
 * Log Level
 */
enum class LogLevel : uint8_t { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Fatal = 5 };

inline const char* level_to_string(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO ";
    case LogLevel::Warn:
        return "WARN ";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    default:
        return "?????";
    }
}

inline LogLevel level_from_string(const char* name, LogLevel fallback = LogLevel::Info) {
    if (std::strcmp(name, "trace") == 0 || std::strcmp(name, "TRACE") == 0)
        return LogLevel::Trace;
    if (std::strcmp(name, "debug") == 0 || std::strcmp(name, "DEBUG") == 0)
        return LogLevel::Debug;
    if (std::strcmp(name, "info") == 0 || std::strcmp(name, "INFO") == 0)
        return LogLevel::Info;
    if (std::strcmp(name, "warn") == 0 || std::strcmp(name, "WARN") == 0)
        return LogLevel::Warn;
    if (std::strcmp(name, "error") == 0 || std::strcmp(name, "ERROR") == 0)
        return LogLevel::Error;
    return fallback;
}

// Category constants for the trade finder
namespace LogCategory {
constexpr uint8_t System = 0;
constexpr uint8_t Scheduler = 1;
constexpr uint8_t Dispatch = 2;
constexpr uint8_t Pipeline = 3;
constexpr uint8_t Store = 4;
constexpr uint8_t Lifecycle = 5;
constexpr uint8_t Alert = 6;
constexpr uint8_t Ai = 7;
constexpr uint8_t Admin = 8;
}  // namespace LogCategory

inline const char* category_to_string(uint8_t category) {
    static constexpr const char* NAMES[] = {"system", "scheduler", "dispatch", "pipeline", "store",
                                            "lifecycle", "alert", "ai", "admin"};
    return category < sizeof(NAMES) / sizeof(NAMES[0]) ? NAMES[category] : "other";
}

/**
 * Log Entry - Fixed size for predictable latency
 */
struct alignas(64) LogEntry {
    int64_t timestamp_ms; // 8 bytes (wall clock)
    LogLevel level;       // 1 byte
    uint8_t category;     // 1 byte
    uint16_t reserved;    // 2 bytes padding
    uint32_t thread_id;   // 4 bytes
    char message[240];    // 240 bytes (null-terminated)
    // Total: 256 bytes (four cache lines)

    void set_message(const char* msg) {
        size_t len = std::strlen(msg);
        if (len >= sizeof(message))
            len = sizeof(message) - 1;
        std::memcpy(message, msg, len);
        message[len] = '\0';
    }
};
static_assert(sizeof(LogEntry) == 256, "LogEntry must be 256 bytes");

/**
 * Bounded ring buffer of log entries
 *
 * Single consumer. Producers are serialized by the owning AsyncLogger,
 * so the ring itself only sees one writer at a time.
 */
template <size_t Capacity = 4096> // 4K entries = 1MB buffer
class alignas(64) LogRingBuffer {
public:
    static_assert((Capacity & (Capacity - 1)) == 0, "Capacity must be power of 2");

    LogRingBuffer() : head_(0), tail_(0) {}

    /**
     * Try to push a log entry (producer side)
     * Returns true if successful, false if buffer is full.
     */
    bool try_push(const LogEntry& entry) {
        size_t head = head_.load(std::memory_order_relaxed);
        size_t next_head = (head + 1) & (Capacity - 1);

        if (next_head == tail_.load(std::memory_order_acquire)) {
            return false; // Buffer full
        }

        buffer_[head] = entry;
        head_.store(next_head, std::memory_order_release);
        return true;
    }

    /**
     * Try to pop a log entry (consumer side)
     * Returns true if entry was available, false if empty.
     */
    bool try_pop(LogEntry& entry) {
        size_t tail = tail_.load(std::memory_order_relaxed);

        if (tail == head_.load(std::memory_order_acquire)) {
            return false; // Buffer empty
        }

        entry = buffer_[tail];
        tail_.store((tail + 1) & (Capacity - 1), std::memory_order_release);
        return true;
    }

    size_t size() const {
        size_t head = head_.load(std::memory_order_acquire);
        size_t tail = tail_.load(std::memory_order_acquire);
        return (head - tail + Capacity) & (Capacity - 1);
    }

    bool empty() const { return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire); }

private:
    alignas(64) std::atomic<size_t> head_;
    alignas(64) std::atomic<size_t> tail_;
    alignas(64) std::array<LogEntry, Capacity> buffer_{};
};

/**
 * Async Logger
 *
 * Callers format into a fixed-size entry and enqueue it; a background
 * thread performs the actual I/O. Scheduler workers, the timer thread and
 * admin callers all log concurrently, so producers take a short lock
 * around the enqueue. The consumer drains without locking.
 *
 * Usage:
 *   AsyncLogger logger;
 *   logger.start();
 *   logger.logf(LogLevel::Info, LogCategory::Scheduler, "Scheduled %s", name.c_str());
 *   logger.stop();
 */
class AsyncLogger {
public:
    using OutputCallback = std::function<void(const LogEntry&)>;

    AsyncLogger() : running_(false), min_level_(LogLevel::Info), dropped_count_(0), total_logged_(0) {}

    ~AsyncLogger() { stop(); }

    // Non-copyable
    AsyncLogger(const AsyncLogger&) = delete;
    AsyncLogger& operator=(const AsyncLogger&) = delete;

    /**
     * Start the background consumer thread
     */
    void start() {
        if (running_.exchange(true))
            return; // Already running

        consumer_thread_ = std::thread([this]() { consume_loop(); });
    }

    /**
     * Stop the consumer (if running) and flush remaining entries
     */
    void stop() {
        if (running_.exchange(false)) {
            if (consumer_thread_.joinable()) {
                consumer_thread_.join();
            }
        }

        LogEntry entry;
        while (buffer_.try_pop(entry)) {
            output_entry(entry);
        }
    }

    void log(LogLevel level, uint8_t category, const char* message) {
        if (level < min_level_.load(std::memory_order_relaxed))
            return;

        LogEntry entry;
        entry.timestamp_ms = util::wall_clock_ms();
        entry.level = level;
        entry.category = category;
        entry.reserved = 0;
        entry.thread_id = get_thread_id();
        entry.set_message(message);

        bool pushed;
        {
            std::lock_guard<std::mutex> lock(producer_mutex_);
            pushed = buffer_.try_push(entry);
        }
        if (!pushed) {
            dropped_count_.fetch_add(1, std::memory_order_relaxed);
        } else {
            total_logged_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    /**
     * Log with printf-style formatting (std::string arguments need .c_str())
     */
    template <typename... Args>
    void logf(LogLevel level, uint8_t category, const char* fmt, Args... args) {
        if (level < min_level_.load(std::memory_order_relaxed))
            return;

        char buffer[sizeof(LogEntry::message)];
        if constexpr (sizeof...(Args) == 0) {
            std::snprintf(buffer, sizeof(buffer), "%s", fmt);
        } else {
            std::snprintf(buffer, sizeof(buffer), fmt, args...);
        }
        log(level, category, buffer);
    }

    void set_min_level(LogLevel level) { min_level_.store(level, std::memory_order_relaxed); }
    LogLevel min_level() const { return min_level_.load(std::memory_order_relaxed); }
    void set_output_callback(OutputCallback cb) { output_callback_ = std::move(cb); }

    // Statistics
    uint64_t dropped_count() const { return dropped_count_.load(); }
    uint64_t total_logged() const { return total_logged_.load(); }
    size_t pending_count() const { return buffer_.size(); }

private:
    LogRingBuffer<4096> buffer_;
    std::mutex producer_mutex_;
    std::atomic<bool> running_;
    std::thread consumer_thread_;
    std::atomic<LogLevel> min_level_;
    OutputCallback output_callback_;

    std::atomic<uint64_t> dropped_count_;
    std::atomic<uint64_t> total_logged_;

    void consume_loop() {
        LogEntry entry;
        while (running_.load(std::memory_order_relaxed)) {
            while (buffer_.try_pop(entry)) {
                output_entry(entry);
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    void output_entry(const LogEntry& entry) {
        if (output_callback_) {
            output_callback_(entry);
        } else {
            std::string ts = util::format_iso8601_utc(entry.timestamp_ms);
            std::fprintf(stderr, "[%s] [%s] [%s] %s\n", ts.c_str(), level_to_string(entry.level),
                         category_to_string(entry.category), entry.message);
        }
    }

    static uint32_t get_thread_id() {
        static thread_local uint32_t id = 0;
        if (id == 0) {
            std::hash<std::thread::id> hasher;
            id = static_cast<uint32_t>(hasher(std::this_thread::get_id()));
        }
        return id;
    }
};

/**
 * Process-wide logger, started on first use and flushed at exit.
 */
inline AsyncLogger& default_logger() {
    static AsyncLogger logger;
    static std::once_flag started;
    std::call_once(started, [] { logger.start(); });
    return logger;
}

// Convenience macros (category is a LogCategory member name)
#define LOG_TRACE(cat, msg) \
    ::tradefinder::logging::default_logger().log(::tradefinder::logging::LogLevel::Trace, \
                                                 ::tradefinder::logging::LogCategory::cat, msg)
#define LOG_INFO(cat, msg) \
    ::tradefinder::logging::default_logger().log(::tradefinder::logging::LogLevel::Info, \
                                                 ::tradefinder::logging::LogCategory::cat, msg)

// Printf-style variants
#define LOGF_DEBUG(cat, fmt, ...)                                                                          \
    ::tradefinder::logging::default_logger().logf(::tradefinder::logging::LogLevel::Debug,                \
                                                  ::tradefinder::logging::LogCategory::cat, fmt, ##__VA_ARGS__)
#define LOGF_INFO(cat, fmt, ...)                                                                           \
    ::tradefinder::logging::default_logger().logf(::tradefinder::logging::LogLevel::Info,                 \
                                                  ::tradefinder::logging::LogCategory::cat, fmt, ##__VA_ARGS__)
#define LOGF_WARN(cat, fmt, ...)                                                                           \
    ::tradefinder::logging::default_logger().logf(::tradefinder::logging::LogLevel::Warn,                 \
                                                  ::tradefinder::logging::LogCategory::cat, fmt, ##__VA_ARGS__)
#define LOGF_ERROR(cat, fmt, ...)                                                                          \
    ::tradefinder::logging::default_logger().logf(::tradefinder::logging::LogLevel::Error,                \
                                                  ::tradefinder::logging::LogCategory::cat, fmt, ##__VA_ARGS__)

}  // namespace logging
}  // namespace tradefinder
