#pragma once
#include <cstdio>
#include <string>

namespace ledgerflow {

inline bool is_leap_year(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

inline int days_in_month(int y, int m) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m < 1 || m > 12) return 0;
    return (m == 2 && is_leap_year(y)) ? 29 : days[m - 1];
}

// Calendar date without time zone; transactions carry day precision only
struct Date {
    int year = 0;
    int month = 0;
    int day = 0;

    [[nodiscard]] bool valid() const {
        return year >= 1900 && year <= 2200 && month >= 1 && month <= 12 &&
               day >= 1 && day <= days_in_month(year, month);
    }

    // YYYY-MM-DD
    [[nodiscard]] std::string iso() const {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
        return buf;
    }

    // YYYY-MM
    [[nodiscard]] std::string month_key() const {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%04d-%02d", year, month);
        return buf;
    }

    // Days since 1970-01-01 (proleptic Gregorian)
    [[nodiscard]] long days_since_epoch() const {
        int y = year - (month <= 2 ? 1 : 0);
        long era = (y >= 0 ? y : y - 399) / 400;
        long yoe = y - era * 400;
        long doy = (153L * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
        long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + doe - 719468;
    }

    // 0 = Monday ... 6 = Sunday
    [[nodiscard]] int weekday() const {
        long d = days_since_epoch();
        // 1970-01-01 was a Thursday
        long w = (d + 3) % 7;
        return static_cast<int>(w < 0 ? w + 7 : w);
    }

    bool operator==(const Date& o) const {
        return year == o.year && month == o.month && day == o.day;
    }
    bool operator!=(const Date& o) const { return !(*this == o); }
    bool operator<(const Date& o) const {
        if (year != o.year) return year < o.year;
        if (month != o.month) return month < o.month;
        return day < o.day;
    }
};

inline const char* weekday_str(int w) {
    static const char* names[] = {"Monday", "Tuesday", "Wednesday", "Thursday",
                                  "Friday", "Saturday", "Sunday"};
    return (w >= 0 && w < 7) ? names[w] : "??";
}

} // namespace ledgerflow
