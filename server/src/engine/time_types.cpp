#include "chronicle/time_types.hpp"
#include "chronicle/errors.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace chronicle {

namespace {

int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

void write_civil(std::ostringstream& oss, const CivilDateTime& c) {
    oss << std::setfill('0')
        << std::setw(4) << c.year << '-'
        << std::setw(2) << c.month << '-'
        << std::setw(2) << c.day << 'T'
        << std::setw(2) << c.hour << ':'
        << std::setw(2) << c.minute << ':'
        << std::setw(2) << c.second << '.'
        << std::setw(3) << c.millisecond;
}

CivilDateTime civil_from_millis(int64_t millis) {
    CivilDateTime c;
    int64_t days = floor_div(millis, kMillisPerDay);
    int64_t ms_of_day = millis - days * kMillisPerDay;
    civil_from_days(days, c.year, c.month, c.day);
    c.hour = static_cast<int>(ms_of_day / 3600000);
    c.minute = static_cast<int>((ms_of_day / 60000) % 60);
    c.second = static_cast<int>((ms_of_day / 1000) % 60);
    c.millisecond = static_cast<int>(ms_of_day % 1000);
    return c;
}

} // namespace

// Howard Hinnant's days_from_civil / civil_from_days
int64_t days_from_civil(int64_t year, int month, int day) {
    year -= month <= 2 ? 1 : 0;
    const int64_t era = floor_div(year, 400);
    const int64_t yoe = year - era * 400;
    const int64_t mp = (month + 9) % 12;
    const int64_t doy = (153 * mp + 2) / 5 + day - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

void civil_from_days(int64_t days, int64_t& year, int& month, int& day) {
    days += 719468;
    const int64_t era = floor_div(days, 146097);
    const int64_t doe = days - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    year = yoe + era * 400 + (month <= 2 ? 1 : 0);
}

int days_in_month(int64_t year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2) {
        bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        return leap ? 29 : 28;
    }
    return kDays[month - 1];
}

Instant now_instant() {
    return std::chrono::time_point_cast<Millis>(std::chrono::system_clock::now());
}

std::string format_instant(Instant t) {
    std::ostringstream oss;
    write_civil(oss, civil_from_millis(to_epoch_millis(t)));
    oss << 'Z';
    return oss.str();
}

// ---------------------------------------------------------------------------
// ZoneOffset
// ---------------------------------------------------------------------------

ZoneOffset ZoneOffset::of_hours(int hours) {
    return of_total_seconds(static_cast<int64_t>(hours) * 3600);
}

ZoneOffset ZoneOffset::of_hours_minutes(int hours, int minutes) {
    if ((hours > 0 && minutes < 0) || (hours < 0 && minutes > 0)) {
        throw InvalidArgumentError("Zone offset hours and minutes must have the same sign");
    }
    return of_total_seconds(static_cast<int64_t>(hours) * 3600 + static_cast<int64_t>(minutes) * 60);
}

ZoneOffset ZoneOffset::of_total_seconds(int64_t seconds) {
    if (seconds > kMaxSeconds || seconds < -kMaxSeconds) {
        throw InvalidArgumentError("Zone offset not in valid range: -18:00 to +18:00, got " +
                                   std::to_string(seconds) + "s");
    }
    ZoneOffset offset;
    offset.total_seconds = static_cast<int32_t>(seconds);
    return offset;
}

std::string ZoneOffset::to_string() const {
    if (total_seconds == 0) return "Z";
    int32_t abs_seconds = total_seconds < 0 ? -total_seconds : total_seconds;
    std::ostringstream oss;
    oss << (total_seconds < 0 ? '-' : '+')
        << std::setfill('0') << std::setw(2) << abs_seconds / 3600 << ':'
        << std::setw(2) << (abs_seconds / 60) % 60;
    if (abs_seconds % 60 != 0) {
        oss << ':' << std::setw(2) << abs_seconds % 60;
    }
    return oss.str();
}

// ---------------------------------------------------------------------------
// LocalDateTime
// ---------------------------------------------------------------------------

LocalDateTime LocalDateTime::of(int64_t year, int month, int day,
                                int hour, int minute, int second, int millisecond) {
    if (month < 1 || month > 12) {
        throw InvalidArgumentError("Invalid month: " + std::to_string(month));
    }
    if (day < 1 || day > days_in_month(year, month)) {
        throw InvalidArgumentError("Invalid day of month: " + std::to_string(day));
    }
    if (hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 59 ||
        millisecond < 0 || millisecond > 999) {
        throw InvalidArgumentError("Invalid time of day");
    }
    int64_t days = days_from_civil(year, month, day);
    int64_t millis = days * kMillisPerDay +
                     static_cast<int64_t>(hour) * 3600000 +
                     static_cast<int64_t>(minute) * 60000 +
                     static_cast<int64_t>(second) * 1000 + millisecond;
    return LocalDateTime(Millis(millis));
}

CivilDateTime LocalDateTime::civil() const {
    return civil_from_millis(local_millis_.count());
}

LocalDateTime LocalDateTime::plus(const Period& period) const {
    int64_t days = floor_div(local_millis_.count(), kMillisPerDay);
    int64_t ms_of_day = local_millis_.count() - days * kMillisPerDay;

    if (period.months != 0) {
        int64_t year;
        int month;
        int day;
        civil_from_days(days, year, month, day);
        int64_t total_months = year * 12 + (month - 1) + period.months;
        int64_t new_year = floor_div(total_months, 12);
        int new_month = static_cast<int>(total_months - new_year * 12) + 1;
        int new_day = std::min(day, days_in_month(new_year, new_month));
        days = days_from_civil(new_year, new_month, new_day);
    }
    days += period.days;
    return LocalDateTime(Millis(days * kMillisPerDay + ms_of_day));
}

std::string LocalDateTime::to_string() const {
    std::ostringstream oss;
    write_civil(oss, civil());
    return oss.str();
}

// ---------------------------------------------------------------------------
// TimeRangeFilter
// ---------------------------------------------------------------------------

TimeRangeFilter TimeRangeFilter::between(Instant start, Instant end) {
    if (end < start) {
        throw InvalidArgumentError("end time must not be before start time");
    }
    return TimeRangeFilter(false, start.time_since_epoch(), end.time_since_epoch());
}

TimeRangeFilter TimeRangeFilter::between_local(const LocalDateTime& start, const LocalDateTime& end) {
    if (end < start) {
        throw InvalidArgumentError("end time must not be before start time");
    }
    return TimeRangeFilter(true, start.local_millis(), end.local_millis());
}

std::string TimeRangeFilter::to_string() const {
    if (local_) {
        return "local[" + local_start().to_string() + ", " + local_end().to_string() + ")";
    }
    return "instant[" + format_instant(start_instant()) + ", " + format_instant(end_instant()) + ")";
}

} // namespace chronicle
