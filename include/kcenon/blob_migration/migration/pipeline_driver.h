/**
 * @file pipeline_driver.h
 * @brief Sequences endpoint groups, sessions and transfers
 */

#ifndef KCENON_BLOB_MIGRATION_MIGRATION_PIPELINE_DRIVER_H
#define KCENON_BLOB_MIGRATION_MIGRATION_PIPELINE_DRIVER_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <vector>

#include "audit_ledger.h"
#include "transfer.h"
#include "kcenon/blob_migration/cloud/azure_blob_storage.h"
#include "kcenon/blob_migration/inventory/file_record.h"
#include "kcenon/blob_migration/inventory/inventory_loader.h"
#include "kcenon/blob_migration/inventory/site_grouper.h"
#include "kcenon/blob_migration/source/source_connector.h"

namespace kcenon::blob_migration {

/**
 * @brief Counters for one migration run
 */
struct run_summary {
    std::size_t records = 0;
    std::size_t groups = 0;
    std::size_t groups_skipped = 0;
    std::size_t sessions_opened = 0;
    std::size_t transfers_attempted = 0;
    std::size_t uploaded = 0;
    std::size_t upload_failures = 0;
    std::size_t download_failures = 0;
    std::size_t staging_failures = 0;
    std::size_t ledger_entries = 0;
    std::size_t ledger_failures = 0;

    /// Transfers abandoned because of an exception
    std::size_t unexpected_errors = 0;

    uint64_t bytes_uploaded = 0;
    std::chrono::milliseconds elapsed{0};

    /**
     * @brief True when every attempted transfer was uploaded and recorded
     */
    [[nodiscard]] auto clean() const -> bool {
        return groups_skipped == 0 && uploaded == transfers_attempted && ledger_failures == 0;
    }
};

/**
 * @brief Pipeline driver
 *
 * For each endpoint address in sorted order: open a session (a failure
 * skips the group), run every record of the group through
 * record_transfer, then close the session before moving on. Failures of
 * a single transfer never stop the loop.
 *
 * @code
 * pipeline_driver driver(connector, store, ledger, credentials, options);
 * auto summary = driver.run(loader, "inventory.csv");
 * @endcode
 */
class pipeline_driver {
public:
    pipeline_driver(source_connector& connector,
                    blob_store& store,
                    audit_ledger& ledger,
                    source_credentials credentials,
                    transfer_options options);

    /**
     * @brief Load the inventory, then migrate it
     * @return The loader's error when the inventory is missing, locked or
     *         fails schema validation; no session is opened in that case
     */
    [[nodiscard]] auto run(inventory_loader& loader, const std::filesystem::path& inventory)
        -> result<run_summary>;

    /**
     * @brief Migrate already loaded records
     */
    [[nodiscard]] auto run(const std::vector<file_record>& records) -> run_summary;

private:
    void run_group(const endpoint_group& group, std::size_t index, std::size_t total,
                   run_summary& summary);

    source_connector& connector_;
    source_credentials credentials_;
    record_transfer transfer_;
};

}  // namespace kcenon::blob_migration

#endif  // KCENON_BLOB_MIGRATION_MIGRATION_PIPELINE_DRIVER_H
