/**
 * @file site_grouper.h
 * @brief Partitioning of inventory records by source endpoint
 */

#ifndef KCENON_BLOB_MIGRATION_INVENTORY_SITE_GROUPER_H
#define KCENON_BLOB_MIGRATION_INVENTORY_SITE_GROUPER_H

#include <string>
#include <vector>

#include "file_record.h"

namespace kcenon::blob_migration {

/**
 * @brief Records that share one endpoint and are processed under one session
 */
struct endpoint_group {
    std::string address;
    std::vector<file_record> records;
};

/**
 * @brief Reduce an endpoint address to its site root
 *
 * Trims whitespace, drops trailing '/' and cuts everything after
 * "/sites/<name>" or "/teams/<name>" when present.
 */
[[nodiscard]] auto normalize_endpoint_address(const std::string& address) -> std::string;

/**
 * @brief Distinct normalized endpoint addresses, sorted
 *
 * Addresses differing only in case are treated as one.
 */
[[nodiscard]] auto endpoint_addresses(const std::vector<file_record>& records)
    -> std::vector<std::string>;

/**
 * @brief Records whose site address contains @p address, case-insensitively,
 *        in inventory order
 */
[[nodiscard]] auto records_for(const std::vector<file_record>& records,
                               const std::string& address)
    -> std::vector<file_record>;

/**
 * @brief Partition records into endpoint groups, ordered by address
 *
 * A record goes to the longest endpoint address its site address contains,
 * so every record lands in exactly one group even when one address is a
 * prefix of another.
 */
[[nodiscard]] auto group_by_endpoint(const std::vector<file_record>& records)
    -> std::vector<endpoint_group>;

}  // namespace kcenon::blob_migration

#endif  // KCENON_BLOB_MIGRATION_INVENTORY_SITE_GROUPER_H
