#include "server/registration_tools.hpp"

#include <iomanip>
#include <optional>
#include <sstream>
#include <utility>
#include "core/logging/logger.hpp"
#include "validation/calendar_date.hpp"
#include "validation/registration_validator.hpp"

namespace regdesk::server {

using core::errors::DeskError;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::ToolDescriptor;
using protocol::ToolOutcome;
using protocol::ToolStatus;
using storage::RegistrationRecord;

namespace {

const char* const kDuplicateMark = "\xE2\x9C\x97 Email already registered";

std::string string_argument(const json& arguments, const char* key) {
    if (!arguments.is_object()) {
        return "";
    }
    const auto it = arguments.find(key);
    if (it == arguments.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

json string_property(const std::string& description) {
    return {{"type", "string"}, {"description", description}};
}

json object_schema(json properties, const std::vector<std::string>& required) {
    json schema;
    schema["type"] = "object";
    schema["properties"] = std::move(properties);
    schema["required"] = required;
    return schema;
}

void render_record(std::ostringstream& out, const RegistrationRecord& record) {
    out << "**" << record.ordinal << ". " << record.name << "**\n"
        << "   Email: " << record.email << "\n"
        << "   Date of Birth: " << record.date_of_birth << "\n"
        << "   Registered: " << record.registered_at << "\n\n";
}

ToolOutcome io_failure(const std::string& prefix, const DeskError& error) {
    LOG_ERROR("RegistrationTools: " + prefix + ": " + error.message);
    ToolOutcome outcome;
    outcome.status = ToolStatus::IoError;
    outcome.fields["error"] = error.message;
    outcome.text = "ERROR: " + prefix + ": " + error.message;
    return outcome;
}

std::string available_tools_text() {
    std::string text = "Available tools:\n";
    for (const auto* name : protocol::tool::kAll) {
        text += "\xE2\x80\xA2 ";
        text += name;
        text += "\n";
    }
    return text;
}

}  // namespace

RegistrationTools::RegistrationTools(storage::RegistrationStore store)
    : store_(std::move(store)) {}

std::vector<ToolDescriptor> RegistrationTools::list_tools() const {
    const json registration_properties = {
        {"name", string_property("Full name of the user (2-100 characters)")},
        {"email", string_property("Valid email address")},
        {"dob", string_property("Date of birth in YYYY-MM-DD format")}};

    return {
        {protocol::tool::kAddRegistration,
         "Add a new user registration with name, email, and date of birth",
         object_schema(registration_properties, {"name", "email", "dob"})},
        {protocol::tool::kGetAllRegistrations,
         "Retrieve all user registrations from the CSV file",
         object_schema(json::object(), {})},
        {protocol::tool::kSearchRegistrations, "Search registrations by name or email",
         object_schema({{"query", string_property("Search query (name or email)")}},
                       {"query"})},
        {protocol::tool::kGetStatistics,
         "Get statistics about registrations (count, age demographics, etc.)",
         object_schema(json::object(), {})},
        {protocol::tool::kValidateRegistration, "Validate registration data without saving",
         object_schema(registration_properties, {"name", "email", "dob"})},
    };
}

core::errors::Result<ToolOutcome> RegistrationTools::call_tool(const std::string& name,
                                                               const json& arguments) const {
    LOG_DEBUG("RegistrationTools: call " + name + " " + arguments.dump());
    if (name == protocol::tool::kAddRegistration) {
        return add_registration(string_argument(arguments, "name"),
                                string_argument(arguments, "email"),
                                string_argument(arguments, "dob"));
    }
    if (name == protocol::tool::kGetAllRegistrations) {
        return get_all_registrations();
    }
    if (name == protocol::tool::kSearchRegistrations) {
        return search_registrations(string_argument(arguments, "query"));
    }
    if (name == protocol::tool::kGetStatistics) {
        return get_statistics();
    }
    if (name == protocol::tool::kValidateRegistration) {
        return validate_registration(string_argument(arguments, "name"),
                                     string_argument(arguments, "email"),
                                     string_argument(arguments, "dob"));
    }

    LOG_WARN("RegistrationTools: unknown tool " + name);
    return DeskError{ErrorCategory::InvalidArgument,
                     "ERROR: Unknown tool: " + name + "\n\n" + available_tools_text(),
                     "unknown_tool"};
}

ToolOutcome RegistrationTools::validate_registration(const std::string& name,
                                                     const std::string& email,
                                                     const std::string& dob) const {
    const auto check = validation::validate_registration(name, email, dob);

    ToolOutcome outcome;
    outcome.fields["name"] = check.name.message;
    outcome.fields["email"] = check.email.message;
    outcome.fields["dob"] = check.date_of_birth.message;

    bool duplicate = false;
    std::optional<DeskError> lookup_error;
    if (check.email.valid) {
        auto found = store_.find_email(email);
        if (core::errors::is_error(found)) {
            lookup_error = core::errors::get_error(found);
            outcome.fields["email"] = "\xE2\x9C\x97 Could not check for duplicates: " +
                                      lookup_error->message;
        } else if (core::errors::get_value(found)) {
            duplicate = true;
            outcome.fields["email"] = kDuplicateMark;
        }
    }

    if (!check.all_valid()) {
        outcome.status = ToolStatus::ValidationFailed;
    } else if (duplicate) {
        outcome.status = ToolStatus::Duplicate;
    } else if (lookup_error) {
        outcome.status = ToolStatus::IoError;
    } else {
        outcome.status = ToolStatus::Success;
    }

    std::ostringstream out;
    out << "**Validation Results:**\n\n"
        << "**Name:** " << outcome.fields["name"] << "\n"
        << "**Email:** " << outcome.fields["email"] << "\n"
        << "**Date of Birth:** " << outcome.fields["dob"] << "\n\n"
        << "**Overall Status:** "
        << (outcome.status == ToolStatus::Success ? "Ready for registration!"
                                                  : "Fix validation errors before registering");
    outcome.text = out.str();
    return outcome;
}

ToolOutcome RegistrationTools::add_registration(const std::string& name,
                                                const std::string& email,
                                                const std::string& dob) const {
    const auto check = validation::validate_registration(name, email, dob);
    if (!check.all_valid()) {
        ToolOutcome outcome;
        outcome.status = ToolStatus::ValidationFailed;
        std::ostringstream out;
        out << "ERROR: Registration failed: Validation failed\n\nValidation errors:\n";
        if (!check.name.valid) {
            outcome.fields["name"] = check.name.message;
            out << "- Name: " << check.name.message << "\n";
        }
        if (!check.email.valid) {
            outcome.fields["email"] = check.email.message;
            out << "- Email: " << check.email.message << "\n";
        }
        if (!check.date_of_birth.valid) {
            outcome.fields["dob"] = check.date_of_birth.message;
            out << "- Date of Birth: " << check.date_of_birth.message << "\n";
        }
        outcome.text = out.str();
        return outcome;
    }

    auto existing = store_.all();
    if (core::errors::is_error(existing)) {
        return io_failure("Registration failed", core::errors::get_error(existing));
    }

    RegistrationRecord record;
    record.name = validation::trim(name);
    record.email = validation::trim(email);
    record.date_of_birth = dob;
    record.registered_at = validation::now_local_timestamp();

    const std::string needle = validation::lowercase(record.email);
    for (const auto& other : core::errors::get_value(existing)) {
        if (validation::lowercase(other.email) == needle) {
            ToolOutcome outcome;
            outcome.status = ToolStatus::Duplicate;
            outcome.fields["email"] = kDuplicateMark;
            outcome.text = "ERROR: Registration failed: Email already registered\n\n"
                           "Validation errors:\n- The email " +
                           record.email + " is already registered\n";
            return outcome;
        }
        // Keep the ledger ordered even if the wall clock stepped backwards.
        if (validation::is_valid_timestamp(other.registered_at) &&
            record.registered_at < other.registered_at) {
            record.registered_at = other.registered_at;
        }
    }

    auto appended = store_.append(record);
    if (core::errors::is_error(appended)) {
        return io_failure("Registration failed", core::errors::get_error(appended));
    }
    LOG_INFO("RegistrationTools: registered " + record.email);

    ToolOutcome outcome;
    outcome.status = ToolStatus::Success;
    outcome.fields = {{"name", record.name},
                      {"email", record.email},
                      {"dob", record.date_of_birth},
                      {"registered_at", record.registered_at}};
    outcome.text = "SUCCESS: Successfully registered " + record.name +
                   "\n\nRegistration Details:\n- Name: " + record.name +
                   "\n- Email: " + record.email + "\n- Date of Birth: " +
                   record.date_of_birth + "\n- Registered: " + record.registered_at;
    return outcome;
}

ToolOutcome RegistrationTools::get_all_registrations() const {
    auto records = store_.all();
    if (core::errors::is_error(records)) {
        return io_failure("Failed to retrieve registrations", core::errors::get_error(records));
    }
    const auto& list = core::errors::get_value(records);

    ToolOutcome outcome;
    outcome.status = ToolStatus::Success;
    outcome.fields["count"] = std::to_string(list.size());
    if (list.empty()) {
        outcome.text =
            "No registrations found yet.\n\nThe registration system is ready to accept new "
            "registrations!";
        return outcome;
    }

    std::ostringstream out;
    out << "**All Registrations (" << list.size() << " total):**\n\n";
    for (const auto& record : list) {
        render_record(out, record);
    }
    outcome.text = out.str();
    return outcome;
}

ToolOutcome RegistrationTools::search_registrations(const std::string& query) const {
    const std::string trimmed = validation::trim(query);
    if (trimmed.empty()) {
        ToolOutcome outcome;
        outcome.status = ToolStatus::InvalidArgument;
        outcome.fields["query"] = "";
        outcome.text = "ERROR: Search query cannot be empty.";
        return outcome;
    }

    auto matches = store_.search(trimmed);
    if (core::errors::is_error(matches)) {
        return io_failure("Search failed", core::errors::get_error(matches));
    }
    const auto& list = core::errors::get_value(matches);

    ToolOutcome outcome;
    outcome.status = ToolStatus::Success;
    outcome.fields["query"] = trimmed;
    outcome.fields["count"] = std::to_string(list.size());
    if (list.empty()) {
        outcome.text = "No matches found for '" + trimmed +
                       "'\n\nTry searching with a different name or email.";
        return outcome;
    }

    std::ostringstream out;
    out << "**Search Results for '" << trimmed << "' (" << list.size() << " matches):**\n\n";
    for (const auto& record : list) {
        render_record(out, record);
    }
    outcome.text = out.str();
    return outcome;
}

ToolOutcome RegistrationTools::get_statistics() const {
    auto stats_result = store_.statistics();
    if (core::errors::is_error(stats_result)) {
        return io_failure("Failed to get statistics", core::errors::get_error(stats_result));
    }
    const auto& stats = core::errors::get_value(stats_result);

    ToolOutcome outcome;
    outcome.status = ToolStatus::Success;
    outcome.fields["total"] = std::to_string(stats.total);
    outcome.fields["file_exists"] = stats.file_exists ? "true" : "false";
    outcome.fields["file_path"] = stats.file_path;

    if (!stats.file_exists) {
        outcome.text = "No statistics available - the registration file does not exist yet.\n"
                       "\nData File: " + stats.file_path;
        return outcome;
    }

    std::ostringstream out;
    out << "**Registration Statistics:**\n\n"
        << "Total Registrations: " << stats.total << "\n";
    if (stats.total > 0) {
        outcome.fields["unique_email_domains"] = std::to_string(stats.unique_email_domains);
        out << "Unique Email Domains: " << stats.unique_email_domains << "\n";
        if (stats.oldest_registration && stats.newest_registration) {
            outcome.fields["oldest_registration"] = *stats.oldest_registration;
            outcome.fields["newest_registration"] = *stats.newest_registration;
            out << "First Registration: " << *stats.oldest_registration << "\n"
                << "Latest Registration: " << *stats.newest_registration << "\n";
        }
        out << "File Size: " << stats.file_size_bytes << " bytes\n";

        if (stats.ages) {
            std::ostringstream average;
            average << std::fixed << std::setprecision(1) << stats.ages->average_years;
            outcome.fields["average_age"] = average.str();
            outcome.fields["youngest_user"] = std::to_string(stats.ages->youngest_years);
            outcome.fields["oldest_user"] = std::to_string(stats.ages->oldest_years);
            out << "\n**Age Demographics:**\n"
                << "   Average Age: " << average.str() << " years\n"
                << "   Youngest User: " << stats.ages->youngest_years << " years\n"
                << "   Oldest User: " << stats.ages->oldest_years << " years\n";
        }
    } else {
        out << "\nNo demographic data available yet.";
    }
    out << "\nData File: " << stats.file_path;
    outcome.text = out.str();
    return outcome;
}

std::string RegistrationTools::ledger_uri() const {
    return "file://" + store_.ledger_path().filename().string();
}

std::vector<ResourceDescriptor> RegistrationTools::list_resources() const {
    return {{ledger_uri(), "User Registrations", "CSV file containing all user registrations",
             "text/csv"}};
}

core::errors::Result<std::string> RegistrationTools::read_resource(const std::string& uri) const {
    if (uri != ledger_uri()) {
        return DeskError{ErrorCategory::InvalidArgument, "Unknown resource: " + uri,
                         "unknown_resource"};
    }
    auto raw = store_.read_raw();
    if (core::errors::is_error(raw)) {
        return core::errors::get_error(raw);
    }
    const auto& text = core::errors::get_value(raw);
    if (!text) {
        return std::string("CSV file doesn't exist yet. No registrations found.");
    }
    return *text;
}

}  // namespace regdesk::server
