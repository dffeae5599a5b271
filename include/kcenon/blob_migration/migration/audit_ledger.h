/**
 * @file audit_ledger.h
 * @brief Append-only CSV record of every attempted transfer
 */

#ifndef KCENON_BLOB_MIGRATION_MIGRATION_AUDIT_LEDGER_H
#define KCENON_BLOB_MIGRATION_MIGRATION_AUDIT_LEDGER_H

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>

#include "kcenon/blob_migration/core/types.h"

namespace kcenon::blob_migration {

/**
 * @brief Terminal status of a transfer attempt
 */
enum class ledger_status {
    uploaded,
    failed,
    download_failed
};

[[nodiscard]] constexpr auto to_string(ledger_status status) -> std::string_view {
    switch (status) {
        case ledger_status::uploaded: return "Uploaded";
        case ledger_status::failed: return "Failed";
        case ledger_status::download_failed: return "DownloadFailed";
        default: return "Unknown";
    }
}

/**
 * @brief One ledger row
 */
struct ledger_entry {
    std::string file_name;

    /// Relative path used as the blob key
    std::string file_path;

    /// Human-readable size, e.g. "1.50 GB"
    std::string size;

    /// "YYYY-MM-DD HH:MM:SS", local time
    std::string upload_time;

    ledger_status status = ledger_status::failed;
};

/**
 * @brief Format a timestamp the way the ledger stores it
 */
[[nodiscard]] auto format_ledger_time(std::chrono::system_clock::time_point when)
    -> std::string;

/**
 * @brief Audit ledger
 *
 * The first append to a missing or empty file writes the header
 * FileName,FilePath,Size,UploadTime,Status. Every append opens the file in
 * append mode and flushes before returning, so rows written before a crash
 * survive it.
 */
class audit_ledger {
public:
    explicit audit_ledger(std::filesystem::path path);

    /**
     * @brief Append one row
     * @return error_code::ledger_write_error when the row could not be written
     */
    [[nodiscard]] auto append(const ledger_entry& entry) -> result<void>;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

    static constexpr std::string_view header = "FileName,FilePath,Size,UploadTime,Status";

    /**
     * @brief Quote a CSV field when it contains a separator, quote or line break
     */
    [[nodiscard]] static auto escape_field(const std::string& value) -> std::string;

private:
    std::filesystem::path path_;
};

}  // namespace kcenon::blob_migration

#endif  // KCENON_BLOB_MIGRATION_MIGRATION_AUDIT_LEDGER_H
