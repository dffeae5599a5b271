/**
 * @file blob_migration.h
 * @brief Main header for the blob_migration library
 * @version 0.1.0
 *
 * Include this header to access the whole migration pipeline.
 *
 * @code
 * #include <kcenon/blob_migration/blob_migration.h>
 *
 * using namespace kcenon::blob_migration;
 *
 * auto reader = std::make_shared<delimited_sheet_reader>();
 * auto breaker = std::make_shared<posix_lock_breaker>();
 * inventory_loader loader(reader, breaker);
 *
 * pipeline_driver driver(connector, *store, ledger, credentials, options);
 * auto summary = driver.run(loader, "inventory.csv");
 * @endcode
 */

#ifndef KCENON_BLOB_MIGRATION_BLOB_MIGRATION_H
#define KCENON_BLOB_MIGRATION_BLOB_MIGRATION_H

#include <string>

// Core
#include "kcenon/blob_migration/core/types.h"
#include "kcenon/blob_migration/core/logging.h"
#include "kcenon/blob_migration/core/config.h"

// Inventory
#include "kcenon/blob_migration/inventory/file_record.h"
#include "kcenon/blob_migration/inventory/file_lock.h"
#include "kcenon/blob_migration/inventory/sheet_reader.h"
#include "kcenon/blob_migration/inventory/inventory_loader.h"
#include "kcenon/blob_migration/inventory/site_grouper.h"

// Source
#include "kcenon/blob_migration/source/source_connector.h"
#include "kcenon/blob_migration/source/token_provider.h"
#include "kcenon/blob_migration/source/endpoint_session.h"
#include "kcenon/blob_migration/source/sharepoint_connector.h"

// Destination
#include "kcenon/blob_migration/cloud/cloud_config.h"
#include "kcenon/blob_migration/cloud/http_client.h"
#include "kcenon/blob_migration/cloud/azure_blob_storage.h"

// Migration
#include "kcenon/blob_migration/migration/audit_ledger.h"
#include "kcenon/blob_migration/migration/staged_file.h"
#include "kcenon/blob_migration/migration/transfer.h"
#include "kcenon/blob_migration/migration/pipeline_driver.h"

namespace kcenon::blob_migration {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::blob_migration

#endif  // KCENON_BLOB_MIGRATION_BLOB_MIGRATION_H
