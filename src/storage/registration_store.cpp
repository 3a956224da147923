#include "storage/registration_store.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <set>
#include <sstream>
#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"
#include "validation/registration_validator.hpp"

namespace regdesk::storage {

using core::errors::DeskError;
using core::errors::Done;
using core::errors::ErrorCategory;
using validation::lowercase;

namespace {

const std::vector<std::string> kHeaderFields = {"Name", "Email", "Date_of_Birth",
                                                "Registration_Date"};

bool needs_quoting(const std::string& field) {
    return field.find_first_of(",\"\r\n") != std::string::npos;
}

std::string email_domain(const std::string& email) {
    const auto at = email.find('@');
    if (at == std::string::npos) {
        return "";
    }
    const auto next_at = email.find('@', at + 1);
    return lowercase(email.substr(at + 1, next_at == std::string::npos
                                              ? std::string::npos
                                              : next_at - at - 1));
}

}  // namespace

std::string encode_csv_row(const std::vector<std::string>& fields) {
    std::string line;
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            line.push_back(',');
        }
        if (!needs_quoting(fields[i])) {
            line += fields[i];
            continue;
        }
        line.push_back('"');
        for (const char c : fields[i]) {
            if (c == '"') {
                line.push_back('"');
            }
            line.push_back(c);
        }
        line.push_back('"');
    }
    return line;
}

core::errors::Result<std::vector<std::vector<std::string>>> parse_csv(
    const std::string& text) {
    std::vector<std::vector<std::string>> rows;
    std::vector<std::string> row;
    std::string field;
    bool in_quotes = false;
    bool row_has_content = false;

    const auto finish_row = [&]() {
        if (row_has_content || !field.empty() || !row.empty()) {
            row.push_back(std::move(field));
            rows.push_back(std::move(row));
        }
        row.clear();
        field.clear();
        row_has_content = false;
    };

    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field.push_back(c);
            }
            continue;
        }

        if (c == '"') {
            in_quotes = true;
            row_has_content = true;
        } else if (c == ',') {
            row.push_back(std::move(field));
            field.clear();
            row_has_content = true;
        } else if (c == '\r') {
            continue;
        } else if (c == '\n') {
            finish_row();
        } else {
            field.push_back(c);
        }
    }

    if (in_quotes) {
        return DeskError{ErrorCategory::IOFailure, "Ledger ends inside a quoted field.",
                         "malformed_ledger"};
    }
    finish_row();
    return rows;
}

RegistrationStore::RegistrationStore(std::filesystem::path ledger_path)
    : ledger_path_(std::move(ledger_path)) {}

core::errors::Result<Done> RegistrationStore::ensure_initialized() const {
    std::error_code ec;
    if (std::filesystem::exists(ledger_path_, ec)) {
        return Done{};
    }
    if (ec) {
        return DeskError{ErrorCategory::IOFailure,
                         "Unable to stat ledger: " + ledger_path_.string(),
                         "ledger_stat_failed"};
    }

    std::ofstream out(ledger_path_);
    if (!out.is_open()) {
        return DeskError{ErrorCategory::IOFailure,
                         "Unable to create ledger: " + ledger_path_.string(),
                         "ledger_create_failed"};
    }
    out << kLedgerHeader << "\n";
    if (!out.good()) {
        return DeskError{ErrorCategory::IOFailure,
                         "Unable to write ledger header: " + ledger_path_.string(),
                         "ledger_write_failed"};
    }
    LOG_INFO("RegistrationStore: created ledger " + ledger_path_.string());
    return Done{};
}

core::errors::Result<Done> RegistrationStore::append(const RegistrationRecord& record) const {
    auto initialized = ensure_initialized();
    if (core::errors::is_error(initialized)) {
        return core::errors::get_error(initialized);
    }

    std::ofstream out(ledger_path_, std::ios::app);
    if (!out.is_open()) {
        return DeskError{ErrorCategory::IOFailure,
                         "Unable to open ledger for writing: " + ledger_path_.string(),
                         "ledger_open_failed"};
    }

    out << encode_csv_row({record.name, record.email, record.date_of_birth,
                           record.registered_at})
        << "\n";
    out.flush();
    if (!out.good()) {
        return DeskError{ErrorCategory::IOFailure,
                         "Unable to append to ledger: " + ledger_path_.string(),
                         "ledger_write_failed"};
    }
    return Done{};
}

core::errors::Result<std::optional<std::string>> RegistrationStore::read_raw() const {
    std::error_code ec;
    if (!std::filesystem::exists(ledger_path_, ec) || ec) {
        return std::optional<std::string>{};
    }

    std::ifstream in(ledger_path_, std::ios::binary);
    if (!in.is_open()) {
        return DeskError{ErrorCategory::IOFailure,
                         "Unable to open ledger for reading: " + ledger_path_.string(),
                         "ledger_open_failed"};
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (!in.good() && !in.eof()) {
        return DeskError{ErrorCategory::IOFailure,
                         "I/O error while reading ledger: " + ledger_path_.string(),
                         "ledger_read_failed"};
    }
    return std::optional<std::string>(buffer.str());
}

core::errors::Result<std::vector<RegistrationRecord>> RegistrationStore::all() const {
    auto raw = read_raw();
    if (core::errors::is_error(raw)) {
        return core::errors::get_error(raw);
    }
    const auto& text = core::errors::get_value(raw);
    if (!text.has_value()) {
        return std::vector<RegistrationRecord>{};
    }

    auto parsed = parse_csv(*text);
    if (core::errors::is_error(parsed)) {
        return core::errors::get_error(parsed);
    }
    const auto& rows = core::errors::get_value(parsed);

    std::vector<RegistrationRecord> records;
    if (rows.empty()) {
        return records;
    }
    if (rows.front() != kHeaderFields) {
        return DeskError{ErrorCategory::IOFailure,
                         "Unexpected ledger header in " + ledger_path_.string(),
                         "malformed_ledger",
                         std::string("Expected: ") + kLedgerHeader};
    }

    records.reserve(rows.size() - 1);
    for (std::size_t i = 1; i < rows.size(); ++i) {
        const auto& row = rows[i];
        if (row.size() < kHeaderFields.size()) {
            return DeskError{ErrorCategory::IOFailure,
                             "Ledger row " + std::to_string(i) + " has " +
                                 std::to_string(row.size()) + " fields.",
                             "malformed_ledger"};
        }
        RegistrationRecord record;
        record.name = row[0];
        record.email = row[1];
        record.date_of_birth = row[2];
        record.registered_at = row[3];
        record.ordinal = records.size() + 1;
        records.push_back(std::move(record));
    }
    return records;
}

core::errors::Result<bool> RegistrationStore::find_email(const std::string& email) const {
    auto records = all();
    if (core::errors::is_error(records)) {
        return core::errors::get_error(records);
    }

    const std::string needle = lowercase(validation::trim(email));
    const auto& list = core::errors::get_value(records);
    return std::any_of(list.begin(), list.end(), [&needle](const RegistrationRecord& r) {
        return lowercase(r.email) == needle;
    });
}

bool RegistrationStore::exists(const std::string& email) const {
    auto found = find_email(email);
    if (core::errors::is_error(found)) {
        LOG_WARN("RegistrationStore: duplicate check treated unreadable ledger as empty: " +
                 core::errors::get_error(found).message);
        return false;
    }
    return core::errors::get_value(found);
}

core::errors::Result<std::vector<RegistrationRecord>> RegistrationStore::search(
    const std::string& query) const {
    auto records = all();
    if (core::errors::is_error(records)) {
        return core::errors::get_error(records);
    }

    const std::string needle = lowercase(validation::trim(query));
    std::vector<RegistrationRecord> matches;
    for (const auto& record : core::errors::get_value(records)) {
        if (lowercase(record.name).find(needle) != std::string::npos ||
            lowercase(record.email).find(needle) != std::string::npos) {
            matches.push_back(record);
        }
    }
    return matches;
}

core::errors::Result<LedgerStatistics> RegistrationStore::statistics() const {
    return statistics(validation::today_local());
}

core::errors::Result<LedgerStatistics> RegistrationStore::statistics(
    const validation::CalendarDate& today) const {
    auto records_result = all();
    if (core::errors::is_error(records_result)) {
        return core::errors::get_error(records_result);
    }
    const auto& records = core::errors::get_value(records_result);

    LedgerStatistics stats;
    stats.file_path = ledger_path_.string();
    std::error_code ec;
    stats.file_exists = std::filesystem::exists(ledger_path_, ec) && !ec;
    if (stats.file_exists) {
        const auto size = std::filesystem::file_size(ledger_path_, ec);
        stats.file_size_bytes = ec ? 0 : size;
    }
    stats.total = records.size();

    std::set<std::string> domains;
    std::vector<std::int64_t> ages;
    for (const auto& record : records) {
        const auto domain = email_domain(record.email);
        if (!domain.empty()) {
            domains.insert(domain);
        }

        if (validation::is_valid_timestamp(record.registered_at)) {
            if (!stats.oldest_registration || record.registered_at < *stats.oldest_registration) {
                stats.oldest_registration = record.registered_at;
            }
            if (!stats.newest_registration || *stats.newest_registration < record.registered_at) {
                stats.newest_registration = record.registered_at;
            }
        }

        const auto birth = validation::parse_iso_date(record.date_of_birth);
        if (birth) {
            ages.push_back(validation::age_in_years(*birth, today));
        }
    }
    stats.unique_email_domains = domains.size();

    if (!ages.empty()) {
        double sum = 0.0;
        for (const auto age : ages) {
            sum += static_cast<double>(age);
        }
        AgeSummary summary;
        summary.average_years = std::round(sum / static_cast<double>(ages.size()) * 10.0) / 10.0;
        summary.youngest_years = *std::min_element(ages.begin(), ages.end());
        summary.oldest_years = *std::max_element(ages.begin(), ages.end());
        stats.ages = summary;
    }
    return stats;
}

}  // namespace regdesk::storage
