#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace regdesk::validation {

struct CalendarDate {
    int year = 1970;
    int month = 1;
    int day = 1;
};

bool operator==(const CalendarDate& lhs, const CalendarDate& rhs);
bool operator<(const CalendarDate& lhs, const CalendarDate& rhs);

// Strict "YYYY-MM-DD"; rejects impossible days such as 2023-02-29.
std::optional<CalendarDate> parse_iso_date(const std::string& text);

std::string format_iso_date(const CalendarDate& date);

// Days since 1970-01-01 in the proleptic Gregorian calendar.
std::int64_t days_since_epoch(const CalendarDate& date);

CalendarDate add_days(const CalendarDate& date, std::int64_t days);

// Age rule shared by validation and statistics: floor(elapsed days / 365).
std::int64_t age_in_years(const CalendarDate& birth, const CalendarDate& today);

CalendarDate today_local();

// "YYYY-MM-DD HH:MM:SS" in local time.
std::string now_local_timestamp();

bool is_valid_timestamp(const std::string& text);

}  // namespace regdesk::validation
