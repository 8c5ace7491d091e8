#pragma once
#include <optional>
#include <string>

namespace ht {

// A proleptic Gregorian calendar date.
struct CalendarDate {
    int year = 1970;
    unsigned month = 1;
    unsigned day = 1;

    // Days since 1970-01-01 (negative before).
    long days_since_epoch() const;
    static CalendarDate from_days(long days);

    std::string to_iso() const;
};

inline bool operator==(const CalendarDate& a, const CalendarDate& b) {
    return a.year == b.year && a.month == b.month && a.day == b.day;
}
inline bool operator!=(const CalendarDate& a, const CalendarDate& b) { return !(a == b); }
inline bool operator<(const CalendarDate& a, const CalendarDate& b) {
    return a.days_since_epoch() < b.days_since_epoch();
}

bool is_leap_year(int year);
unsigned days_in_month(int year, unsigned month);

// Strict ISO 8601 parse: exactly four year digits, two month digits, two day
// digits, separated by '-', forming a real calendar date. Surrounding
// whitespace is not accepted; callers trim first.
std::optional<CalendarDate> parse_iso_date(const std::string& text);

// Local date of the host clock.
CalendarDate today_local();

} // namespace ht
