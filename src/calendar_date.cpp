#include "calendar_date.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>

namespace ht {

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned days_in_month(int year, unsigned month) {
    static const unsigned kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2 && is_leap_year(year)) return 29;
    return kDays[month - 1];
}

// Civil-to-serial conversion on 400-year eras (shifted so March is the first
// month and the leap day falls at the end of the year).
long CalendarDate::days_since_epoch() const {
    long y = static_cast<long>(year) - (month <= 2 ? 1 : 0);
    long era = (y >= 0 ? y : y - 399) / 400;
    long yoe = y - era * 400;
    long mp = month > 2 ? static_cast<long>(month) - 3 : static_cast<long>(month) + 9;
    long doy = (153 * mp + 2) / 5 + static_cast<long>(day) - 1;
    long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

CalendarDate CalendarDate::from_days(long days) {
    long z = days + 719468;
    long era = (z >= 0 ? z : z - 146096) / 146097;
    long doe = z - era * 146097;
    long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    long y = yoe + era * 400;
    long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    long mp = (5 * doy + 2) / 153;
    CalendarDate out;
    out.day = static_cast<unsigned>(doy - (153 * mp + 2) / 5 + 1);
    out.month = static_cast<unsigned>(mp < 10 ? mp + 3 : mp - 9);
    out.year = static_cast<int>(y + (out.month <= 2 ? 1 : 0));
    return out;
}

std::string CalendarDate::to_iso() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", year, month, day);
    return buf;
}

std::optional<CalendarDate> parse_iso_date(const std::string& text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') return std::nullopt;
    auto number = [&](size_t pos, size_t len, int& out) {
        int v = 0;
        for (size_t i = pos; i < pos + len; ++i) {
            if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
            v = v * 10 + (text[i] - '0');
        }
        out = v;
        return true;
    };
    int y = 0, m = 0, d = 0;
    if (!number(0, 4, y) || !number(5, 2, m) || !number(8, 2, d)) return std::nullopt;
    if (y < 1 || m < 1 || m > 12 || d < 1) return std::nullopt;
    if (static_cast<unsigned>(d) > days_in_month(y, static_cast<unsigned>(m))) return std::nullopt;
    CalendarDate date;
    date.year = y;
    date.month = static_cast<unsigned>(m);
    date.day = static_cast<unsigned>(d);
    return date;
}

CalendarDate today_local() {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    CalendarDate date;
    date.year = local.tm_year + 1900;
    date.month = static_cast<unsigned>(local.tm_mon + 1);
    date.day = static_cast<unsigned>(local.tm_mday);
    return date;
}

} // namespace ht
