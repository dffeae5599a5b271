/**
 * @file file_record.h
 * @brief Inventory record and column schema
 */

#ifndef KCENON_BLOB_MIGRATION_INVENTORY_FILE_RECORD_H
#define KCENON_BLOB_MIGRATION_INVENTORY_FILE_RECORD_H

#include <optional>
#include <string>
#include <vector>

namespace kcenon::blob_migration {

/**
 * @brief One validated inventory row
 *
 * Built only after every required column has been found in the header,
 * and never modified afterwards.
 */
struct file_record {
    /// Display name of the file
    std::string name;

    /// Absolute URI of the file on the source endpoint
    std::string location;

    /// Declared size as written in the inventory
    std::string declared_size;

    /// Declared size in megabytes, when the cell is numeric
    std::optional<double> declared_size_mb;

    /// Address of the endpoint (site) that owns the file
    std::string site_address;

    /// 1-based row number in the inventory, header excluded
    std::size_t row_number = 0;
};

/**
 * @brief Names of the inventory columns the loader requires
 */
struct column_schema {
    std::string name = "Name";
    std::string location = "Location";
    std::string size = "Size (MB)";
    std::string site_address = "Site Address";

    [[nodiscard]] auto required() const -> std::vector<std::string> {
        return {name, location, size, site_address};
    }
};

}  // namespace kcenon::blob_migration

#endif  // KCENON_BLOB_MIGRATION_INVENTORY_FILE_RECORD_H
