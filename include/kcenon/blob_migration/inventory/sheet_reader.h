/**
 * @file sheet_reader.h
 * @brief Tabular inventory readers
 */

#ifndef KCENON_BLOB_MIGRATION_INVENTORY_SHEET_READER_H
#define KCENON_BLOB_MIGRATION_INVENTORY_SHEET_READER_H

#include <filesystem>
#include <istream>
#include <string>
#include <vector>

#include "kcenon/blob_migration/core/types.h"

namespace kcenon::blob_migration {

/**
 * @brief Raw table: the first record as header, then data rows
 *
 * Rows are not normalized; a row may have fewer or more cells than the
 * header.
 */
struct sheet {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;
};

/**
 * @brief Reads a tabular inventory file
 *
 * Implementations report error_code::file_not_found when the path does not
 * exist and error_code::inventory_locked when another process holds a
 * conflicting lock on the file.
 */
class sheet_reader {
public:
    virtual ~sheet_reader() = default;

    [[nodiscard]] virtual auto read(const std::filesystem::path& path) -> result<sheet> = 0;
};

/**
 * @brief Delimited text reader (CSV, TSV)
 *
 * Quoted fields may contain the delimiter, doubled quotes and line breaks.
 * A UTF-8 byte order mark at the start of the file is skipped.
 */
class delimited_sheet_reader : public sheet_reader {
public:
    explicit delimited_sheet_reader(char delimiter = ',');

    [[nodiscard]] auto read(const std::filesystem::path& path) -> result<sheet> override;

    /**
     * @brief Parse already-opened content
     */
    [[nodiscard]] auto parse(std::istream& input) const -> result<sheet>;

    [[nodiscard]] auto delimiter() const noexcept -> char { return delimiter_; }

private:
    char delimiter_;
};

}  // namespace kcenon::blob_migration

#endif  // KCENON_BLOB_MIGRATION_INVENTORY_SHEET_READER_H
