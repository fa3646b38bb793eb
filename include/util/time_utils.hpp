#pragma once

/**
 * Time utilities for the trade finder
 *
 * Provides consistent timestamp generation across all components.
 * Wall-clock values are epoch milliseconds (int64_t, 0 = unset).
 * Session labels and dedupe hour buckets use New York local time,
 * computed from the US Eastern DST rules without touching the process TZ.
 */

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <string>

namespace tradefinder {
namespace util {

/**
 * Injectable wall clock (epoch milliseconds).
 * Components take one so tests can pin "now".
 */
using WallClock = std::function<int64_t()>;

/**
 * Returns current time in nanoseconds since steady_clock epoch.
 * Monotonic, for measuring elapsed time only.
 */
inline uint64_t now_ns() {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();
}

/**
 * Returns current wall-clock time in milliseconds since Unix epoch.
 */
inline int64_t wall_clock_ms() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

constexpr int64_t MS_PER_MINUTE = 60'000;
constexpr int64_t MS_PER_HOUR = 3'600'000;

/**
 * Broken-down civil time (no timezone attached)
 */
struct CivilTime {
    int year = 1970;
    unsigned month = 1;
    unsigned day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;
    int millis = 0;
};

inline CivilTime to_civil(int64_t epoch_ms) {
    using namespace std::chrono;
    sys_time<milliseconds> tp{milliseconds{epoch_ms}};
    auto day_point = floor<days>(tp);
    year_month_day ymd{day_point};
    auto in_day = tp - day_point;

    CivilTime ct;
    ct.year = static_cast<int>(ymd.year());
    ct.month = static_cast<unsigned>(ymd.month());
    ct.day = static_cast<unsigned>(ymd.day());
    ct.hour = static_cast<int>(duration_cast<hours>(in_day).count());
    ct.minute = static_cast<int>(duration_cast<minutes>(in_day).count() % 60);
    ct.second = static_cast<int>(duration_cast<seconds>(in_day).count() % 60);
    ct.millis = static_cast<int>(in_day.count() % 1000);
    return ct;
}

/**
 * UTC offset of America/New_York at the given instant, in hours (-4 or -5).
 *
 * DST runs from the second Sunday of March 02:00 EST (07:00 UTC)
 * to the first Sunday of November 02:00 EDT (06:00 UTC).
 */
inline int eastern_utc_offset_hours(int64_t epoch_ms) {
    using namespace std::chrono;
    sys_time<milliseconds> tp{milliseconds{epoch_ms}};
    year y = year_month_day{floor<days>(tp)}.year();

    sys_time<milliseconds> dst_start = sys_days{y / March / Sunday[2]} + hours{7};
    sys_time<milliseconds> dst_end = sys_days{y / November / Sunday[1]} + hours{6};

    return (tp >= dst_start && tp < dst_end) ? -4 : -5;
}

inline CivilTime to_new_york(int64_t epoch_ms) {
    return to_civil(epoch_ms + eastern_utc_offset_hours(epoch_ms) * MS_PER_HOUR);
}

/**
 * ISO-8601 instant in UTC, e.g. "2026-03-09T14:30:00Z".
 * Milliseconds are printed only when non-zero.
 */
inline std::string format_iso8601_utc(int64_t epoch_ms) {
    CivilTime ct = to_civil(epoch_ms);
    char buf[32];
    if (ct.millis != 0) {
        std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d.%03dZ", ct.year, ct.month, ct.day, ct.hour,
                      ct.minute, ct.second, ct.millis);
    } else {
        std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02dZ", ct.year, ct.month, ct.day, ct.hour,
                      ct.minute, ct.second);
    }
    return buf;
}

/**
 * New York calendar date, "yyyy-MM-dd".
 */
inline std::string format_date_new_york(int64_t epoch_ms) {
    CivilTime ct = to_new_york(epoch_ms);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", ct.year, ct.month, ct.day);
    return buf;
}

/**
 * New York calendar-hour bucket, "yyyyMMdd_HH".
 * Two instants share a bucket iff they fall in the same clock hour.
 */
inline std::string hour_bucket_new_york(int64_t epoch_ms) {
    CivilTime ct = to_new_york(epoch_ms);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d%02u%02u_%02d", ct.year, ct.month, ct.day, ct.hour);
    return buf;
}

/**
 * Trading session for the New York hour:
 *   ASIA [18,03)  LONDON [03,08)  NY_AM [08,12)  NY_LUNCH [12,14)  NY_PM [14,18)
 */
inline const char* session_label(int64_t epoch_ms) {
    int hour = to_new_york(epoch_ms).hour;
    if (hour >= 18 || hour < 3)
        return "ASIA";
    if (hour < 8)
        return "LONDON";
    if (hour < 12)
        return "NY_AM";
    if (hour < 14)
        return "NY_LUNCH";
    return "NY_PM";
}

}  // namespace util
}  // namespace tradefinder
