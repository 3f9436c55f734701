#pragma once

#include "quotawatch/types.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace quotawatch {

struct CivilDate {
    int year{1970};
    int month{1};   // 1..12
    int day{1};     // 1..31
};

inline bool operator==(const CivilDate& a, const CivilDate& b) noexcept {
    return a.year == b.year && a.month == b.month && a.day == b.day;
}
inline bool operator!=(const CivilDate& a, const CivilDate& b) noexcept {
    return !(a == b);
}

// Day of week, 0 = Sunday
enum class Weekday {
    Sunday, Monday, Tuesday, Wednesday, Thursday, Friday, Saturday
};

const char* to_string(Weekday w);

// ==================== Construction ====================

Timestamp make_timestamp(int year, int month, int day,
                         int hour = 0, int minute = 0, int second = 0);
Timestamp to_timestamp(const CivilDate& date, int hour = 0);

// Converts a UTC instant to local wall-clock time using the process zone.
Timestamp from_system(std::chrono::system_clock::time_point tp);

// ==================== Decomposition ====================

CivilDate civil_date(Timestamp ts);
int hour_of_day(Timestamp ts);
Weekday weekday(Timestamp ts);
Weekday weekday(const CivilDate& date);

Timestamp start_of_hour(Timestamp ts);
Timestamp start_of_day(Timestamp ts);

// Fractional hours from a to b (negative when b precedes a)
double hours_between(Timestamp a, Timestamp b);

// Most recent point at or before `now` of the form origin + k * period
// (k may be negative). Boundaries at exactly `now` belong to the new period.
Timestamp aligned_period_start(Timestamp now, Timestamp origin, Duration period);

// ==================== Text ====================

std::string format_date(Timestamp ts);      // YYYY-MM-DD
std::string format_date(const CivilDate& date);
std::string format_datetime(Timestamp ts);  // YYYY-MM-DD HH:MM

// Accepts YYYY-MM-DD and YYYYMMDD
std::optional<CivilDate> parse_date(const std::string& text);

// Parses ISO-8601 instants such as 2026-02-20T18:03:11.123Z or
// 2026-02-20T10:03:11-08:00. Fractional seconds are dropped.
std::optional<std::chrono::system_clock::time_point>
parse_iso8601(const std::string& text);

} // namespace quotawatch
