#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/desk_errors.hpp"
#include "validation/calendar_date.hpp"

namespace regdesk::storage {

inline constexpr const char* kLedgerHeader = "Name,Email,Date_of_Birth,Registration_Date";

struct RegistrationRecord {
    std::string name;
    std::string email;
    std::string date_of_birth;
    std::string registered_at;
    // 1-based read position; a display ordinal, not a key.
    std::size_t ordinal = 0;
};

struct AgeSummary {
    double average_years = 0.0;
    std::int64_t youngest_years = 0;
    std::int64_t oldest_years = 0;
};

struct LedgerStatistics {
    std::size_t total = 0;
    bool file_exists = false;
    std::uintmax_t file_size_bytes = 0;
    std::string file_path;
    std::size_t unique_email_domains = 0;
    std::optional<std::string> oldest_registration;
    std::optional<std::string> newest_registration;
    std::optional<AgeSummary> ages;
};

// Owns the append-only CSV ledger. Single writer is assumed; uniqueness is
// the caller's job.
class RegistrationStore {
public:
    explicit RegistrationStore(std::filesystem::path ledger_path);

    core::errors::Result<core::errors::Done> ensure_initialized() const;

    core::errors::Result<core::errors::Done> append(const RegistrationRecord& record) const;

    // Empty (success) when the ledger file does not exist.
    core::errors::Result<std::vector<RegistrationRecord>> all() const;

    // Fail-open: a read failure is logged and reported as "not found".
    bool exists(const std::string& email) const;

    // Fail-closed variant of exists().
    core::errors::Result<bool> find_email(const std::string& email) const;

    core::errors::Result<std::vector<RegistrationRecord>> search(const std::string& query) const;

    core::errors::Result<LedgerStatistics> statistics() const;
    core::errors::Result<LedgerStatistics> statistics(const validation::CalendarDate& today) const;

    // Raw file text, or nullopt when the ledger does not exist yet.
    core::errors::Result<std::optional<std::string>> read_raw() const;

    const std::filesystem::path& ledger_path() const { return ledger_path_; }

private:
    std::filesystem::path ledger_path_;
};

// CSV helpers (minimal quoting; quoted fields may span lines).
std::string encode_csv_row(const std::vector<std::string>& fields);
core::errors::Result<std::vector<std::vector<std::string>>> parse_csv(const std::string& text);

}  // namespace regdesk::storage
