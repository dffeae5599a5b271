/**
 * @file transfer.h
 * @brief Download, upload, record and clean up one inventory record
 */

#ifndef KCENON_BLOB_MIGRATION_MIGRATION_TRANSFER_H
#define KCENON_BLOB_MIGRATION_MIGRATION_TRANSFER_H

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "audit_ledger.h"
#include "kcenon/blob_migration/cloud/azure_blob_storage.h"
#include "kcenon/blob_migration/core/types.h"
#include "kcenon/blob_migration/inventory/file_record.h"
#include "kcenon/blob_migration/source/endpoint_session.h"

namespace kcenon::blob_migration {

/**
 * @brief How a transfer attempt ended
 */
enum class transfer_outcome {
    uploaded,
    upload_failed,
    download_failed,
    staging_failed
};

[[nodiscard]] constexpr auto to_string(transfer_outcome outcome) -> std::string_view {
    switch (outcome) {
        case transfer_outcome::uploaded: return "uploaded";
        case transfer_outcome::upload_failed: return "upload_failed";
        case transfer_outcome::download_failed: return "download_failed";
        case transfer_outcome::staging_failed: return "staging_failed";
        default: return "unknown";
    }
}

/**
 * @brief Result of one transfer attempt
 */
struct transfer_report {
    transfer_outcome outcome = transfer_outcome::staging_failed;

    /// Row appended to the ledger, if one was written
    std::optional<ledger_entry> entry;

    /// Set when a row was due but the ledger rejected it
    std::optional<error> ledger_error;

    /// Failure detail for anything other than transfer_outcome::uploaded
    std::string message;

    std::string blob_key;
    uint64_t bytes = 0;
};

/**
 * @brief Where a record lands locally and in the store
 */
struct staging_location {
    /// Server-relative path passed to the source connector
    std::string remote_path;

    /// Local staging file under the destination root
    std::filesystem::path local_path;
};

/**
 * @brief Map a record's location onto the destination root
 *
 * The URI path is percent-decoded, the endpoint's site path is stripped
 * from its front, and the rest is joined to @p destination_root.
 * Intermediate directories are not created here.
 *
 * @return error_code::invalid_remote_path when the location has no file
 *         component or escapes the destination root
 */
[[nodiscard]] auto resolve_local_path(const file_record& record,
                                      const std::string& endpoint_address,
                                      const std::filesystem::path& destination_root)
    -> result<staging_location>;

/**
 * @brief Blob key for a staged file: its path below the destination root,
 *        '/' separated
 */
[[nodiscard]] auto derive_blob_key(const std::filesystem::path& local_path,
                                   const std::filesystem::path& destination_root)
    -> std::string;

/**
 * @brief Human-readable byte count ("512 B", "1.50 KB", "2.25 GB")
 */
[[nodiscard]] auto format_size(uint64_t bytes) -> std::string;

/**
 * @brief Declared inventory size in bytes
 * @return nullopt when the cell is not a finite size that fits in 64 bits
 */
[[nodiscard]] auto declared_size_bytes(const file_record& record) -> std::optional<uint64_t>;

/**
 * @brief Options shared by every transfer in a run
 */
struct transfer_options {
    std::filesystem::path destination_root;
    std::string container;

    /// Append a DownloadFailed row when the download step fails
    bool record_download_failures = false;
};

/**
 * @brief Moves one record from the source endpoint to the blob store
 *
 * When the download succeeds exactly one ledger row is appended, whatever
 * the upload does. The staged copy is removed before run() returns, on
 * every path.
 */
class record_transfer {
public:
    record_transfer(blob_store& store, audit_ledger& ledger, transfer_options options);

    [[nodiscard]] auto run(endpoint_session& session, const file_record& record)
        -> transfer_report;

private:
    void write_ledger(transfer_report& report, ledger_entry entry);

    blob_store& store_;
    audit_ledger& ledger_;
    transfer_options options_;
};

}  // namespace kcenon::blob_migration

#endif  // KCENON_BLOB_MIGRATION_MIGRATION_TRANSFER_H
