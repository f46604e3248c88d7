#include "field_parsers.hpp"
#include "../utils/text_utils.hpp"
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <vector>

namespace ledgerflow {

namespace {

struct DateFormat {
    const char* fmt;
    bool four_digit_year;  // %Y: reject short years so the %y row can match
    bool has_year;
};

// Order matters: ISO, US, EU, month names, then year-less
const DateFormat kDateFormats[] = {
    {"%Y-%m-%d", true, true},
    {"%Y/%m/%d", true, true},
    {"%Y-%m-%d %H:%M:%S", true, true},
    {"%Y-%m-%dT%H:%M:%S", true, true},
    {"%Y-%m-%d %H:%M", true, true},
    {"%m/%d/%Y", true, true},
    {"%m-%d-%Y", true, true},
    {"%m/%d/%Y %H:%M:%S", true, true},
    {"%m/%d/%Y %H:%M", true, true},
    {"%m/%d/%y", false, true},
    {"%d/%m/%Y", true, true},
    {"%d-%m-%Y", true, true},
    {"%d.%m.%Y", true, true},
    {"%d/%m/%Y %H:%M:%S", true, true},
    {"%d/%m/%y", false, true},
    {"%d.%m.%y", false, true},
    {"%d %b %Y", true, true},
    {"%d-%b-%Y", true, true},
    {"%b %d, %Y", true, true},
    {"%b %d %Y", true, true},
    {"%d %B %Y", true, true},
    {"%B %d, %Y", true, true},
    {"%m/%d", false, false},
    {"%d %b", false, false},
};

bool only_space(const char* p) {
    while (*p) {
        if (*p != ' ' && *p != '\t' && *p != '\r' && *p != '\n') return false;
        ++p;
    }
    return true;
}

// "1,234,567" style: first group 1-3 digits, the rest exactly 3
bool is_grouped(const std::string& num, char sep) {
    size_t start = 0;
    bool first = true;
    while (true) {
        size_t pos = num.find(sep, start);
        size_t len = (pos == std::string::npos ? num.size() : pos) - start;
        if (first) {
            if (len < 1 || len > 3) return false;
            first = false;
        } else if (len != 3) {
            return false;
        }
        if (pos == std::string::npos) return true;
        start = pos + 1;
    }
}

size_t count_char(const std::string& s, char c) {
    size_t n = 0;
    for (char x : s) if (x == c) n++;
    return n;
}

void remove_char(std::string& s, char c) {
    std::string out;
    out.reserve(s.size());
    for (char x : s) if (x != c) out += x;
    s = std::move(out);
}

} // namespace

bool parse_date(const std::string& text, Date& out, int fallback_year) {
    std::string s = trim(text);
    if (s.empty()) return false;

    for (const auto& f : kDateFormats) {
        if (!f.has_year && fallback_year <= 0) continue;

        struct tm tm_buf{};
        const char* rest = strptime(s.c_str(), f.fmt, &tm_buf);
        if (!rest || !only_space(rest)) continue;

        Date d;
        d.year = f.has_year ? tm_buf.tm_year + 1900 : fallback_year;
        d.month = tm_buf.tm_mon + 1;
        d.day = tm_buf.tm_mday;
        if (f.four_digit_year && d.year < 1000) continue;
        if (!d.valid()) continue;

        out = d;
        return true;
    }
    return false;
}

bool parse_amount(const std::string& text, double& out) {
    std::string s = trim(text);
    if (s.empty()) return false;

    bool negative = false;
    std::string upper = to_upper(s);
    if (ends_with(upper, "DR")) {
        negative = true;
        s = trim(s.substr(0, s.size() - 2));
    } else if (ends_with(upper, "CR")) {
        s = trim(s.substr(0, s.size() - 2));
    }
    if (s.size() >= 2 && s.front() == '(' && s.back() == ')') {
        negative = true;
        s = trim(s.substr(1, s.size() - 2));
    }
    if (!s.empty() && s.back() == '-') {
        negative = true;
        s = trim(s.substr(0, s.size() - 1));
    }

    std::string num;
    bool seen_digit = false;
    for (char c : s) {
        if (c >= '0' && c <= '9') {
            num += c;
            seen_digit = true;
        } else if (c == ',' || c == '.') {
            if (seen_digit) num += c;
        } else if (c == '-' && !seen_digit) {
            negative = true;
        }
    }
    if (!seen_digit) return false;
    while (!num.empty() && (num.back() == ',' || num.back() == '.')) num.pop_back();

    size_t commas = count_char(num, ',');
    size_t dots = count_char(num, '.');

    if (commas > 0 && dots > 0) {
        bool comma_is_decimal = num.rfind(',') > num.rfind('.');
        char decimal = comma_is_decimal ? ',' : '.';
        char grouping = comma_is_decimal ? '.' : ',';
        if (count_char(num, decimal) != 1) return false;
        remove_char(num, grouping);
        if (comma_is_decimal) num[num.find(',')] = '.';
    } else if (commas > 0) {
        if (is_grouped(num, ',')) {
            remove_char(num, ',');
        } else if (commas == 1) {
            num[num.find(',')] = '.';
        } else {
            return false;
        }
    } else if (dots > 1) {
        if (!is_grouped(num, '.')) return false;
        remove_char(num, '.');
    }

    char* end = nullptr;
    double v = std::strtod(num.c_str(), &end);
    if (end == num.c_str() || *end != '\0') return false;
    if (!std::isfinite(v) || std::fabs(v) > kMaxAbsAmount) return false;

    out = negative ? -std::fabs(v) : std::fabs(v);
    return true;
}

} // namespace ledgerflow
