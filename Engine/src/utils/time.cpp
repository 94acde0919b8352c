#include <utils/time.hpp>
#include <cctype>
#include <cstdio>
#include <limits>

namespace Sessionizer {
namespace TimeUtil {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date (H. Hinnant's algorithm)
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civil_from_days(int64_t z, int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y += m <= 2;
}

bool is_leap(int64_t y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned days_in_month(int64_t y, unsigned m) {
    static constexpr unsigned k_days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap(y)) return 29;
    return k_days[m - 1];
}

// Reads exactly n digits starting at pos
bool read_digits(std::string_view s, size_t pos, size_t n, int64_t& out) {
    if (pos + n > s.size()) return false;
    int64_t v = 0;
    for (size_t i = pos; i < pos + n; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
        v = v * 10 + (s[i] - '0');
    }
    out = v;
    return true;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::optional<Date> parse_date_prefix(std::string_view s) {
    int64_t y, mo, d;
    if (s.size() < 10 || s[4] != '-' || s[7] != '-') return std::nullopt;
    if (!read_digits(s, 0, 4, y) || !read_digits(s, 5, 2, mo) || !read_digits(s, 8, 2, d)) {
        return std::nullopt;
    }
    if (mo < 1 || mo > 12) return std::nullopt;
    if (d < 1 || d > static_cast<int64_t>(days_in_month(y, static_cast<unsigned>(mo)))) return std::nullopt;
    return make_date(static_cast<int>(y), static_cast<unsigned>(mo), static_cast<unsigned>(d));
}

} // namespace

Date make_date(int year, unsigned month, unsigned day) {
    return Date(Days(static_cast<int32_t>(days_from_civil(year, month, day))));
}

Date to_date(Timestamp ts) {
    return std::chrono::floor<Days>(ts);
}

Timestamp start_of(Date d) {
    return std::chrono::time_point_cast<Duration>(d);
}

std::optional<Date> parse_date(std::string_view text) {
    std::string_view s = trim(text);
    if (s.size() != 10) return std::nullopt;
    return parse_date_prefix(s);
}

std::optional<Timestamp> parse_timestamp(std::string_view text) {
    std::string_view s = trim(text);
    auto date = parse_date_prefix(s);
    if (!date) return std::nullopt;

    if (s.size() == 10) return start_of(*date);
    if (s[10] != ' ' && s[10] != 'T') return std::nullopt;

    int64_t hh, mm, ss;
    if (s.size() < 19 || s[13] != ':' || s[16] != ':') return std::nullopt;
    if (!read_digits(s, 11, 2, hh) || !read_digits(s, 14, 2, mm) || !read_digits(s, 17, 2, ss)) {
        return std::nullopt;
    }
    if (hh > 23 || mm > 59 || ss > 59) return std::nullopt;

    size_t pos = 19;
    int64_t micros = 0;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        size_t digits = 0;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
            if (digits == 6) return std::nullopt;
            micros = micros * 10 + (s[pos] - '0');
            ++digits;
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (; digits < 6; ++digits) micros *= 10;
    }
    if (pos < s.size() && s[pos] == 'Z') ++pos;
    if (pos != s.size()) return std::nullopt;

    return start_of(*date) + std::chrono::hours(hh) + std::chrono::minutes(mm) +
           std::chrono::seconds(ss) + Duration(micros);
}

std::optional<Duration> parse_duration(std::string_view text) {
    std::string_view s = trim(text);
    if (s.empty()) return std::nullopt;

    int64_t unit = 1000000;
    switch (s.back()) {
        case 's': unit = 1000000LL;        s.remove_suffix(1); break;
        case 'm': unit = 60000000LL;       s.remove_suffix(1); break;
        case 'h': unit = 3600000000LL;     s.remove_suffix(1); break;
        case 'd': unit = 86400000000LL;    s.remove_suffix(1); break;
        default: break;
    }
    if (s.empty() || s.size() > 12) return std::nullopt;

    int64_t value;
    if (!read_digits(s, 0, s.size(), value)) return std::nullopt;
    if (value > std::numeric_limits<int64_t>::max() / unit) return std::nullopt;
    return Duration(value * unit);
}

std::string format_date(Date d) {
    int64_t y;
    unsigned m, day;
    civil_from_days(d.time_since_epoch().count(), y, m, day);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u", static_cast<long long>(y), m, day);
    return buf;
}

std::string format_timestamp(Timestamp ts) {
    const Date d = to_date(ts);
    int64_t micros = (ts - start_of(d)).count();

    const int64_t hh = micros / 3600000000LL; micros %= 3600000000LL;
    const int64_t mm = micros / 60000000LL;   micros %= 60000000LL;
    const int64_t ss = micros / 1000000LL;    micros %= 1000000LL;

    char buf[48];
    if (micros == 0) {
        std::snprintf(buf, sizeof(buf), "%s %02lld:%02lld:%02lld", format_date(d).c_str(),
                      static_cast<long long>(hh), static_cast<long long>(mm), static_cast<long long>(ss));
    } else {
        std::snprintf(buf, sizeof(buf), "%s %02lld:%02lld:%02lld.%06lld", format_date(d).c_str(),
                      static_cast<long long>(hh), static_cast<long long>(mm), static_cast<long long>(ss),
                      static_cast<long long>(micros));
    }
    return buf;
}

std::string format_duration(Duration d) {
    const int64_t us = d.count();
    if (us % 86400000000LL == 0 && us != 0) return std::to_string(us / 86400000000LL) + "d";
    if (us % 3600000000LL == 0 && us != 0)  return std::to_string(us / 3600000000LL) + "h";
    if (us % 60000000LL == 0 && us != 0)    return std::to_string(us / 60000000LL) + "m";
    if (us % 1000000LL == 0)                return std::to_string(us / 1000000LL) + "s";
    return std::to_string(us) + "us";
}

} // namespace TimeUtil
} // namespace Sessionizer
