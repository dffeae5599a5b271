/**
 * @file audit_ledger.cpp
 * @brief CSV audit ledger
 */

#include "kcenon/blob_migration/migration/audit_ledger.h"
#include "kcenon/blob_migration/core/logging.h"

#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace kcenon::blob_migration {

auto format_ledger_time(std::chrono::system_clock::time_point when) -> std::string {
    auto time_t_val = std::chrono::system_clock::to_time_t(when);
    std::tm tm_buf{};
    localtime_r(&time_t_val, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

audit_ledger::audit_ledger(std::filesystem::path path)
    : path_(std::move(path)) {}

auto audit_ledger::escape_field(const std::string& value) -> std::string {
    if (value.find_first_of(",\"\r\n") == std::string::npos) {
        return value;
    }

    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

auto audit_ledger::append(const ledger_entry& entry) -> result<void> {
    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            return unexpected{error{error_code::ledger_write_error,
                "Cannot create ledger directory " + path_.parent_path().string() +
                ": " + ec.message()}};
        }
    }

    bool needs_header = !std::filesystem::exists(path_, ec) ||
                        std::filesystem::file_size(path_, ec) == 0;
    if (ec) {
        needs_header = true;
    }

    std::ofstream out(path_, std::ios::out | std::ios::app | std::ios::binary);
    if (!out) {
        return unexpected{error{error_code::ledger_write_error,
            "Cannot open ledger " + path_.string()}};
    }

    if (needs_header) {
        out << header << "\n";
    }

    out << escape_field(entry.file_name) << ','
        << escape_field(entry.file_path) << ','
        << escape_field(entry.size) << ','
        << escape_field(entry.upload_time) << ','
        << to_string(entry.status) << "\n";
    out.flush();

    if (!out) {
        return unexpected{error{error_code::ledger_write_error,
            "Failed to write ledger row for " + entry.file_name}};
    }

    BM_LOG_TRACE(log_category::ledger,
        "Recorded " + entry.file_name + " as " + std::string(to_string(entry.status)));
    return result<void>{};
}

}  // namespace kcenon::blob_migration
