/**
 * @file config.h
 * @brief Run configuration for a migration
 */

#ifndef KCENON_BLOB_MIGRATION_CORE_CONFIG_H
#define KCENON_BLOB_MIGRATION_CORE_CONFIG_H

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include "logging.h"
#include "types.h"
#include "kcenon/blob_migration/cloud/cloud_config.h"
#include "kcenon/blob_migration/inventory/file_record.h"
#include "kcenon/blob_migration/source/source_connector.h"

namespace kcenon::blob_migration {

/**
 * @brief Everything one migration run needs
 *
 * The destination root is carried here and handed to every component;
 * nothing in the pipeline reads the process working directory.
 */
struct migration_config {
    /// Inventory spreadsheet (delimited text)
    std::filesystem::path inventory_path;

    column_schema columns;

    /// Field separator of the inventory
    char delimiter = ',';

    /// Local staging root; blob keys are paths below it
    std::filesystem::path destination_root;

    /// Audit ledger; defaults to destination_root / "upload_log.csv"
    std::filesystem::path ledger_path;

    azure_blob_config blob;
    azure_credentials blob_credentials;

    source_credentials credentials = delegated_credentials{};

    /// Write a DownloadFailed ledger row when a download fails
    bool record_download_failures = false;

    /// Treat an inventory without records as an error
    bool fail_on_empty = false;

    /// How long the lock breaker waits for the holder to exit
    std::chrono::milliseconds lock_grace_period{2000};

    log_level level = log_level::info;
    bool json_logs = false;

    /**
     * @brief Ledger path with the default applied
     */
    [[nodiscard]] auto effective_ledger_path() const -> std::filesystem::path {
        return ledger_path.empty() ? destination_root / "upload_log.csv" : ledger_path;
    }

    /**
     * @brief Check that the configuration can drive a run
     * @return error_code::invalid_configuration naming the first problem
     */
    [[nodiscard]] auto validate() const -> result<void>;

    class builder;
};

/**
 * @brief Builder for migration_config
 *
 * @code
 * auto config = migration_config::builder()
 *     .with_inventory("inventory.csv")
 *     .with_destination_root("/data/staging")
 *     .with_container("archives")
 *     .with_storage_account("archiveaccount")
 *     .with_environment()
 *     .build();
 * @endcode
 */
class migration_config::builder {
public:
    builder();

    auto with_inventory(std::filesystem::path path) -> builder&;
    auto with_columns(column_schema columns) -> builder&;
    auto with_delimiter(char delimiter) -> builder&;
    auto with_destination_root(std::filesystem::path root) -> builder&;
    auto with_ledger_path(std::filesystem::path path) -> builder&;

    auto with_container(std::string container) -> builder&;
    auto with_storage_account(std::string account) -> builder&;

    /**
     * @brief Use a custom blob endpoint (e.g. Azurite)
     */
    auto with_blob_endpoint(std::string endpoint) -> builder&;
    auto with_account_key(std::string key) -> builder&;
    auto with_sas_token(std::string token) -> builder&;

    /**
     * @brief Take account, key or SAS and endpoint from a connection string
     *
     * An unparsable string is reported by build().
     */
    auto with_connection_string(const std::string& connection_string) -> builder&;
    auto with_access_tier(std::string tier) -> builder&;
    auto with_block_upload(uint64_t single_put_threshold, uint64_t block_size) -> builder&;
    auto with_retry_policy(cloud_retry_policy policy) -> builder&;

    auto with_certificate_credentials(certificate_credentials creds) -> builder&;
    auto with_delegated_credentials(delegated_credentials creds) -> builder&;

    auto with_download_failure_entries(bool enable) -> builder&;
    auto with_fail_on_empty(bool enable) -> builder&;
    auto with_lock_grace_period(std::chrono::milliseconds grace) -> builder&;
    auto with_log_level(log_level level) -> builder&;
    auto with_json_logs(bool enable) -> builder&;

    /**
     * @brief Fill unset storage and token settings from the environment
     */
    auto with_environment() -> builder&;

    /**
     * @brief Validate and return the configuration
     */
    [[nodiscard]] auto build() -> result<migration_config>;

private:
    migration_config config_;
    std::optional<std::string> pending_error_;
    bool use_environment_ = false;
};

/**
 * @brief Parse a non-negative decimal integer option value
 * @return error_code::invalid_configuration for signs, garbage or overflow
 */
[[nodiscard]] auto parse_unsigned(const std::string& text) -> result<uint64_t>;

/**
 * @brief Parse a whole number of megabytes into bytes
 */
[[nodiscard]] auto parse_megabytes(const std::string& text) -> result<uint64_t>;

/**
 * @brief Environment lookup used by apply_environment
 */
using environment_lookup = std::function<std::optional<std::string>(const char*)>;

/**
 * @brief Lookup backed by std::getenv
 */
[[nodiscard]] auto process_environment() -> environment_lookup;

/**
 * @brief Overlay settings from the environment onto @p config
 *
 * Only settings that are still unset are filled. Recognized variables:
 * AZURE_STORAGE_CONNECTION_STRING, AZURE_STORAGE_ACCOUNT, AZURE_STORAGE_KEY,
 * AZURE_STORAGE_SAS_TOKEN and BLOB_MIGRATION_SOURCE_TOKEN.
 *
 * @return error_code::invalid_configuration for an unparsable connection string
 */
[[nodiscard]] auto apply_environment(migration_config& config,
                                     const environment_lookup& lookup = process_environment())
    -> result<void>;

}  // namespace kcenon::blob_migration

#endif  // KCENON_BLOB_MIGRATION_CORE_CONFIG_H
