#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include "validation/calendar_date.hpp"

namespace regdesk::validation {

inline constexpr std::size_t kMinNameLength = 2;
inline constexpr std::size_t kMaxNameLength = 100;
inline constexpr std::int64_t kMaxAgeYears = 150;

inline constexpr const char* kValidMark = "\xE2\x9C\x93 Valid";  // "✓ Valid"

struct FieldCheck {
    bool valid = false;
    std::string message;
};

struct RegistrationCheck {
    FieldCheck name;
    FieldCheck email;
    FieldCheck date_of_birth;

    bool all_valid() const { return name.valid && email.valid && date_of_birth.valid; }
};

// Stateless field checks. None of them consult the ledger; duplicate
// detection is composed by the caller.
FieldCheck validate_name(const std::string& name);
FieldCheck validate_email(const std::string& email);
FieldCheck validate_date_of_birth(const std::string& dob);
FieldCheck validate_date_of_birth(const std::string& dob, const CalendarDate& today);

RegistrationCheck validate_registration(const std::string& name, const std::string& email,
                                        const std::string& dob);

// Format-only checks used by the conversation steps.
bool is_email_format(const std::string& email);
bool is_date_format(const std::string& dob);

std::string trim(const std::string& value);
std::string lowercase(std::string value);

// Length in code points, so accented names are not penalised.
std::size_t utf8_length(const std::string& value);

}  // namespace regdesk::validation
