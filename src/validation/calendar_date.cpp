#include "validation/calendar_date.hpp"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <tuple>

namespace regdesk::validation {

namespace {

bool is_leap_year(const int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(const int year, const int month) {
    static constexpr int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return kDays[month - 1];
}

bool all_digits(const std::string& text, const std::size_t begin,
                const std::size_t count) {
    for (std::size_t i = begin; i < begin + count; ++i) {
        if (std::isdigit(static_cast<unsigned char>(text[i])) == 0) {
            return false;
        }
    }
    return true;
}

int to_int(const std::string& text, const std::size_t begin, const std::size_t count) {
    int value = 0;
    for (std::size_t i = begin; i < begin + count; ++i) {
        value = value * 10 + (text[i] - '0');
    }
    return value;
}

std::tm local_tm(const std::time_t when) {
    std::tm out{};
    localtime_r(&when, &out);
    return out;
}

}  // namespace

bool operator==(const CalendarDate& lhs, const CalendarDate& rhs) {
    return lhs.year == rhs.year && lhs.month == rhs.month && lhs.day == rhs.day;
}

bool operator<(const CalendarDate& lhs, const CalendarDate& rhs) {
    return std::tie(lhs.year, lhs.month, lhs.day) <
           std::tie(rhs.year, rhs.month, rhs.day);
}

std::optional<CalendarDate> parse_iso_date(const std::string& text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    if (!all_digits(text, 0, 4) || !all_digits(text, 5, 2) || !all_digits(text, 8, 2)) {
        return std::nullopt;
    }

    CalendarDate date;
    date.year = to_int(text, 0, 4);
    date.month = to_int(text, 5, 2);
    date.day = to_int(text, 8, 2);
    if (date.year < 1 || date.month < 1 || date.month > 12 || date.day < 1 ||
        date.day > days_in_month(date.year, date.month)) {
        return std::nullopt;
    }
    return date;
}

std::string format_iso_date(const CalendarDate& date) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", date.year, date.month,
                  date.day);
    return buffer;
}

// Civil-from-days / days-from-civil after H. Hinnant's date algorithms.
std::int64_t days_since_epoch(const CalendarDate& date) {
    const std::int64_t y = date.month <= 2 ? date.year - 1 : date.year;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const std::int64_t yoe = y - era * 400;
    const std::int64_t mp = date.month > 2 ? date.month - 3 : date.month + 9;
    const std::int64_t doy = (153 * mp + 2) / 5 + date.day - 1;
    const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

CalendarDate add_days(const CalendarDate& date, const std::int64_t days) {
    const std::int64_t z = days_since_epoch(date) + days + 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const std::int64_t doe = z - era * 146097;
    const std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const std::int64_t mp = (5 * doy + 2) / 153;

    CalendarDate out;
    out.day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    out.month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    out.year = static_cast<int>(yoe + era * 400 + (out.month <= 2 ? 1 : 0));
    return out;
}

std::int64_t age_in_years(const CalendarDate& birth, const CalendarDate& today) {
    const std::int64_t elapsed = days_since_epoch(today) - days_since_epoch(birth);
    // Floor division, so a birth date in the future yields a negative age.
    return elapsed >= 0 ? elapsed / 365 : -((-elapsed + 364) / 365);
}

CalendarDate today_local() {
    const std::tm now = local_tm(std::time(nullptr));
    return CalendarDate{now.tm_year + 1900, now.tm_mon + 1, now.tm_mday};
}

std::string now_local_timestamp() {
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    const std::tm tm = local_tm(now);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm);
    return buffer;
}

bool is_valid_timestamp(const std::string& text) {
    if (text.size() != 19 || text[10] != ' ' || text[13] != ':' || text[16] != ':') {
        return false;
    }
    if (!parse_iso_date(text.substr(0, 10)).has_value()) {
        return false;
    }
    if (!all_digits(text, 11, 2) || !all_digits(text, 14, 2) || !all_digits(text, 17, 2)) {
        return false;
    }
    return to_int(text, 11, 2) < 24 && to_int(text, 14, 2) < 60 &&
           to_int(text, 17, 2) < 61;
}

}  // namespace regdesk::validation
