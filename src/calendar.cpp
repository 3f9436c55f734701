#include "quotawatch/calendar.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>

namespace quotawatch {

namespace {

constexpr std::int64_t SECONDS_PER_DAY = 24 * 3600;

std::int64_t floor_div(std::int64_t a, std::int64_t b) {
    std::int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

std::tm to_tm(Timestamp ts) {
    std::time_t t = static_cast<std::time_t>(ts.time_since_epoch().count());
    std::tm out{};
    gmtime_r(&t, &out);
    return out;
}

bool all_digits(const std::string& s, std::size_t pos, std::size_t len) {
    if (pos + len > s.size()) return false;
    for (std::size_t i = pos; i < pos + len; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

int to_int(const std::string& s, std::size_t pos, std::size_t len) {
    return std::stoi(s.substr(pos, len));
}

bool valid_civil(int year, int month, int day) {
    if (month < 1 || month > 12 || day < 1) return false;
    static const int days_in_month[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    bool leap = (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
    int limit = days_in_month[month - 1] + ((month == 2 && leap) ? 1 : 0);
    return day <= limit;
}

} // anonymous namespace

LocalClock::time_point LocalClock::now() {
    return from_system(std::chrono::system_clock::now());
}

const char* to_string(Weekday w) {
    switch (w) {
        case Weekday::Sunday:    return "Sunday";
        case Weekday::Monday:    return "Monday";
        case Weekday::Tuesday:   return "Tuesday";
        case Weekday::Wednesday: return "Wednesday";
        case Weekday::Thursday:  return "Thursday";
        case Weekday::Friday:    return "Friday";
        case Weekday::Saturday:  return "Saturday";
    }
    return "Unknown";
}

// ==================== Construction ====================

Timestamp make_timestamp(int year, int month, int day,
                         int hour, int minute, int second) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    // The local epoch is laid out like UTC, so timegm gives local seconds.
    std::time_t t = timegm(&tm);
    return Timestamp(Duration(static_cast<Duration::rep>(t)));
}

Timestamp to_timestamp(const CivilDate& date, int hour) {
    return make_timestamp(date.year, date.month, date.day, hour);
}

Timestamp from_system(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm local{};
    localtime_r(&t, &local);
    auto secs = static_cast<Duration::rep>(t) + static_cast<Duration::rep>(local.tm_gmtoff);
    return Timestamp(Duration(secs));
}

// ==================== Decomposition ====================

CivilDate civil_date(Timestamp ts) {
    std::tm tm = to_tm(ts);
    return CivilDate{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
}

int hour_of_day(Timestamp ts) {
    std::int64_t secs = ts.time_since_epoch().count();
    std::int64_t into_day = secs - floor_div(secs, SECONDS_PER_DAY) * SECONDS_PER_DAY;
    return static_cast<int>(into_day / 3600);
}

Weekday weekday(Timestamp ts) {
    // 1970-01-01 was a Thursday
    std::int64_t days = floor_div(ts.time_since_epoch().count(), SECONDS_PER_DAY);
    std::int64_t w = (days + 4) % 7;
    if (w < 0) w += 7;
    return static_cast<Weekday>(w);
}

Weekday weekday(const CivilDate& date) {
    return weekday(to_timestamp(date));
}

Timestamp start_of_hour(Timestamp ts) {
    std::int64_t secs = ts.time_since_epoch().count();
    return Timestamp(Duration(floor_div(secs, 3600) * 3600));
}

Timestamp start_of_day(Timestamp ts) {
    std::int64_t secs = ts.time_since_epoch().count();
    return Timestamp(Duration(floor_div(secs, SECONDS_PER_DAY) * SECONDS_PER_DAY));
}

double hours_between(Timestamp a, Timestamp b) {
    return static_cast<double>((b - a).count()) / 3600.0;
}

Timestamp aligned_period_start(Timestamp now, Timestamp origin, Duration period) {
    std::int64_t offset = (now - origin).count();
    std::int64_t k = floor_div(offset, period.count());
    return origin + period * k;
}

// ==================== Text ====================

std::string format_date(Timestamp ts) {
    return format_date(civil_date(ts));
}

std::string format_date(const CivilDate& date) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", date.year, date.month, date.day);
    return buf;
}

std::string format_datetime(Timestamp ts) {
    std::tm tm = to_tm(ts);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min);
    return buf;
}

std::optional<CivilDate> parse_date(const std::string& text) {
    CivilDate d;
    if (text.size() == 10 && text[4] == '-' && text[7] == '-' &&
        all_digits(text, 0, 4) && all_digits(text, 5, 2) && all_digits(text, 8, 2)) {
        d.year = to_int(text, 0, 4);
        d.month = to_int(text, 5, 2);
        d.day = to_int(text, 8, 2);
    } else if (text.size() == 8 && all_digits(text, 0, 8)) {
        d.year = to_int(text, 0, 4);
        d.month = to_int(text, 4, 2);
        d.day = to_int(text, 6, 2);
    } else {
        return std::nullopt;
    }
    if (!valid_civil(d.year, d.month, d.day)) return std::nullopt;
    return d;
}

std::optional<std::chrono::system_clock::time_point>
parse_iso8601(const std::string& text) {
    // YYYY-MM-DDTHH:MM:SS
    if (text.size() < 19) return std::nullopt;
    auto date = parse_date(text.substr(0, 10));
    if (!date) return std::nullopt;
    if (text[10] != 'T' && text[10] != ' ') return std::nullopt;
    if (!all_digits(text, 11, 2) || text[13] != ':' ||
        !all_digits(text, 14, 2) || text[16] != ':' || !all_digits(text, 17, 2)) {
        return std::nullopt;
    }
    int hour = to_int(text, 11, 2);
    int minute = to_int(text, 14, 2);
    int second = to_int(text, 17, 2);
    if (hour > 23 || minute > 59 || second > 60) return std::nullopt;

    std::size_t pos = 19;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) ++pos;
    }

    std::int64_t offset_secs = 0;
    if (pos < text.size()) {
        char c = text[pos];
        if (c == 'Z' || c == 'z') {
            ++pos;
        } else if (c == '+' || c == '-') {
            if (!all_digits(text, pos + 1, 2) || pos + 3 >= text.size() ||
                text[pos + 3] != ':' || !all_digits(text, pos + 4, 2)) {
                return std::nullopt;
            }
            int oh = to_int(text, pos + 1, 2);
            int om = to_int(text, pos + 4, 2);
            offset_secs = (oh * 3600 + om * 60) * (c == '-' ? -1 : 1);
            pos += 6;
        } else {
            return std::nullopt;
        }
    }
    if (pos != text.size()) return std::nullopt;

    Timestamp wall = make_timestamp(date->year, date->month, date->day, hour, minute, second);
    std::int64_t utc = wall.time_since_epoch().count() - offset_secs;
    return std::chrono::system_clock::from_time_t(static_cast<std::time_t>(utc));
}

} // namespace quotawatch
