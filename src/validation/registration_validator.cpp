#include "validation/registration_validator.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace regdesk::validation {

namespace {

const std::string kFailMark = "\xE2\x9C\x97 ";  // "✗ "

FieldCheck ok() { return FieldCheck{true, kValidMark}; }

FieldCheck fail(const std::string& message) { return FieldCheck{false, kFailMark + message}; }

}  // namespace

std::string trim(const std::string& value) {
    const auto is_space = [](const char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    };
    const auto begin = std::find_if_not(value.begin(), value.end(), is_space);
    const auto end = std::find_if_not(value.rbegin(), value.rend(), is_space).base();
    if (begin >= end) {
        return "";
    }
    return std::string(begin, end);
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::size_t utf8_length(const std::string& value) {
    std::size_t count = 0;
    for (const char c : value) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

bool is_email_format(const std::string& email) {
    static const std::regex kPattern(R"(^[a-zA-Z0-9._%+-]+@[a-zA-Z0-9.-]+\.[a-zA-Z]{2,}$)");
    return std::regex_match(email, kPattern);
}

bool is_date_format(const std::string& dob) { return parse_iso_date(dob).has_value(); }

FieldCheck validate_name(const std::string& name) {
    const std::size_t length = utf8_length(trim(name));
    if (length < kMinNameLength) {
        return fail("Name must be at least 2 characters long");
    }
    if (length > kMaxNameLength) {
        return fail("Name must be at most 100 characters long");
    }
    return ok();
}

FieldCheck validate_email(const std::string& email) {
    if (email.empty()) {
        return fail("Email is required");
    }
    if (!is_email_format(email)) {
        return fail("Invalid email format");
    }
    return ok();
}

FieldCheck validate_date_of_birth(const std::string& dob) {
    return validate_date_of_birth(dob, today_local());
}

FieldCheck validate_date_of_birth(const std::string& dob, const CalendarDate& today) {
    if (dob.empty()) {
        return fail("Date of birth is required");
    }
    const auto birth = parse_iso_date(dob);
    if (!birth) {
        return fail("Invalid date format. Use YYYY-MM-DD");
    }
    if (today < *birth) {
        return fail("Date of birth cannot be in the future");
    }
    if (age_in_years(*birth, today) > kMaxAgeYears) {
        return fail("Invalid birth date (too old)");
    }
    return ok();
}

RegistrationCheck validate_registration(const std::string& name, const std::string& email,
                                        const std::string& dob) {
    RegistrationCheck check;
    check.name = validate_name(name);
    check.email = validate_email(email);
    check.date_of_birth = validate_date_of_birth(dob);
    return check;
}

}  // namespace regdesk::validation
