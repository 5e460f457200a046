#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace chronicle {

using Millis = std::chrono::milliseconds;
using Instant = std::chrono::time_point<std::chrono::system_clock, Millis>;

constexpr int64_t kMillisPerSecond = 1000;
constexpr int64_t kMillisPerDay = 86400000;

inline Instant instant_from_millis(int64_t epoch_millis) {
    return Instant(Millis(epoch_millis));
}

inline int64_t to_epoch_millis(Instant t) {
    return t.time_since_epoch().count();
}

Instant now_instant();

// ISO-8601 in UTC, e.g. 2024-03-01T10:15:00.000Z
std::string format_instant(Instant t);

/**
 * Fixed offset from UTC, in seconds. Range is +/-18 hours.
 */
struct ZoneOffset {
    static constexpr int32_t kMaxSeconds = 18 * 3600;

    int32_t total_seconds = 0;

    static ZoneOffset utc() { return ZoneOffset{}; }
    static ZoneOffset of_hours(int hours);
    static ZoneOffset of_hours_minutes(int hours, int minutes);

    // Throws InvalidArgumentError when outside +/-18h
    static ZoneOffset of_total_seconds(int64_t seconds);

    Millis as_millis() const { return Millis(static_cast<int64_t>(total_seconds) * kMillisPerSecond); }

    // "Z" for UTC, otherwise "+HH:MM" / "-HH:MM"
    std::string to_string() const;

    bool operator==(const ZoneOffset& other) const { return total_seconds == other.total_seconds; }
    bool operator!=(const ZoneOffset& other) const { return total_seconds != other.total_seconds; }
};

/**
 * Calendar period. Years are folded into months.
 */
struct Period {
    int64_t months = 0;
    int64_t days = 0;

    static Period of_days(int64_t days) { return Period{0, days}; }
    static Period of_months(int64_t months) { return Period{months, 0}; }

    Period multiplied_by(int64_t factor) const { return Period{months * factor, days * factor}; }
    bool is_zero() const { return months == 0 && days == 0; }

    bool operator==(const Period& other) const { return months == other.months && days == other.days; }
};

struct CivilDateTime {
    int64_t year = 1970;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;
    int millisecond = 0;
};

/**
 * Wall-clock date-time without a zone. Stored as milliseconds since
 * 1970-01-01T00:00 on the local timeline.
 */
class LocalDateTime {
public:
    LocalDateTime() = default;

    // Throws InvalidArgumentError for out-of-range fields
    static LocalDateTime of(int64_t year, int month, int day,
                            int hour = 0, int minute = 0, int second = 0, int millisecond = 0);
    static LocalDateTime from_local_millis(Millis local_millis) { return LocalDateTime(local_millis); }

    Instant to_instant(ZoneOffset offset) const { return Instant(local_millis_ - offset.as_millis()); }
    Millis local_millis() const { return local_millis_; }
    CivilDateTime civil() const;

    // Months first (clamping the day of month), then days. Time of day is kept.
    LocalDateTime plus(const Period& period) const;

    // 2024-03-01T10:15:00.000
    std::string to_string() const;

    bool operator==(const LocalDateTime& o) const { return local_millis_ == o.local_millis_; }
    bool operator!=(const LocalDateTime& o) const { return local_millis_ != o.local_millis_; }
    bool operator<(const LocalDateTime& o) const { return local_millis_ < o.local_millis_; }
    bool operator<=(const LocalDateTime& o) const { return local_millis_ <= o.local_millis_; }

private:
    explicit LocalDateTime(Millis local_millis) : local_millis_(local_millis) {}

    Millis local_millis_{0};
};

/**
 * Either an absolute [start, end) range of instants or a wall-clock range
 * interpreted against each record's own zone offset.
 *
 * Both are kept as positions on a "timeline" in milliseconds: epoch millis for
 * instant filters, local millis for local filters.
 */
class TimeRangeFilter {
public:
    TimeRangeFilter() = default;

    // Throws InvalidArgumentError if end < start
    static TimeRangeFilter between(Instant start, Instant end);
    static TimeRangeFilter between_local(const LocalDateTime& start, const LocalDateTime& end);

    bool is_local() const { return local_; }

    Millis timeline_start() const { return start_; }
    Millis timeline_end() const { return end_; }

    Instant start_instant() const { return Instant(start_); }
    Instant end_instant() const { return Instant(end_); }
    LocalDateTime local_start() const { return LocalDateTime::from_local_millis(start_); }
    LocalDateTime local_end() const { return LocalDateTime::from_local_millis(end_); }

    std::string to_string() const;

private:
    TimeRangeFilter(bool local, Millis start, Millis end) : local_(local), start_(start), end_(end) {}

    bool local_ = false;
    Millis start_{0};
    Millis end_{0};
};

// Civil calendar helpers (proleptic Gregorian)
int64_t days_from_civil(int64_t year, int month, int day);
void civil_from_days(int64_t days, int64_t& year, int& month, int& day);
int days_in_month(int64_t year, int month);

} // namespace chronicle
