/**
 * @file inventory_loader.h
 * @brief Loads and validates the migration inventory
 */

#ifndef KCENON_BLOB_MIGRATION_INVENTORY_INVENTORY_LOADER_H
#define KCENON_BLOB_MIGRATION_INVENTORY_INVENTORY_LOADER_H

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "file_lock.h"
#include "file_record.h"
#include "sheet_reader.h"
#include "kcenon/blob_migration/core/types.h"

namespace kcenon::blob_migration {

/**
 * @brief Positions of the required columns in the header
 */
struct column_indices {
    std::size_t name = 0;
    std::size_t location = 0;
    std::size_t size = 0;
    std::size_t site_address = 0;
};

/**
 * @brief Inventory loader
 *
 * Reads the sheet, checks the header against the column schema, and turns
 * each data row into a file_record. An inventory without data rows loads as
 * an empty sequence.
 *
 * When the reader reports error_code::inventory_locked, the loader asks the
 * lock_breaker to release the file once and retries the read exactly once.
 */
class inventory_loader {
public:
    inventory_loader(std::shared_ptr<sheet_reader> reader,
                     std::shared_ptr<lock_breaker> breaker,
                     column_schema schema = {});

    /**
     * @brief Load all records, in inventory order
     * @return error_code::file_not_found, error_code::schema_error or the
     *         reader's error after the single lock retry
     */
    [[nodiscard]] auto load(const std::filesystem::path& path)
        -> result<std::vector<file_record>>;

    /**
     * @brief Locate every required column in the header
     *
     * Names are compared case-insensitively after trimming whitespace.
     * @return error_code::schema_error naming every missing column
     */
    [[nodiscard]] static auto validate_schema(const std::vector<std::string>& header,
                                              const column_schema& schema)
        -> result<column_indices>;

private:
    auto read_with_retry(const std::filesystem::path& path) -> result<sheet>;

    std::shared_ptr<sheet_reader> reader_;
    std::shared_ptr<lock_breaker> breaker_;
    column_schema schema_;
};

}  // namespace kcenon::blob_migration

#endif  // KCENON_BLOB_MIGRATION_INVENTORY_INVENTORY_LOADER_H
