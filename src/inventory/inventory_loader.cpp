/**
 * @file inventory_loader.cpp
 * @brief Inventory loading and schema validation
 */

#include "kcenon/blob_migration/inventory/inventory_loader.h"
#include "kcenon/blob_migration/core/logging.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>

namespace kcenon::blob_migration {

namespace {

auto trim(const std::string& value) -> std::string {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

auto iequals(const std::string& a, const std::string& b) -> bool {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

auto find_column(const std::vector<std::string>& header, const std::string& name)
    -> std::optional<std::size_t> {
    auto wanted = trim(name);
    for (std::size_t i = 0; i < header.size(); ++i) {
        if (iequals(trim(header[i]), wanted)) {
            return i;
        }
    }
    return std::nullopt;
}

auto cell(const std::vector<std::string>& row, std::size_t index) -> std::string {
    return index < row.size() ? trim(row[index]) : std::string{};
}

auto is_blank(const std::vector<std::string>& row) -> bool {
    return std::all_of(row.begin(), row.end(),
                       [](const std::string& value) { return trim(value).empty(); });
}

auto parse_size_cell(const std::string& text) -> std::optional<double> {
    if (text.empty()) {
        return std::nullopt;
    }

    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() ||
        !std::isfinite(value) || value < 0.0) {
        return std::nullopt;
    }
    return value;
}

auto last_path_segment(const std::string& location) -> std::string {
    auto without_query = location.substr(0, location.find_first_of("?#"));
    auto slash = without_query.find_last_of('/');
    return slash == std::string::npos ? without_query : without_query.substr(slash + 1);
}

}  // namespace

inventory_loader::inventory_loader(std::shared_ptr<sheet_reader> reader,
                                   std::shared_ptr<lock_breaker> breaker,
                                   column_schema schema)
    : reader_(std::move(reader)), breaker_(std::move(breaker)), schema_(std::move(schema)) {}

auto inventory_loader::validate_schema(const std::vector<std::string>& header,
                                       const column_schema& schema)
    -> result<column_indices> {
    column_indices indices;
    std::vector<std::string> missing;

    auto locate = [&](const std::string& name, std::size_t& slot) {
        if (auto index = find_column(header, name)) {
            slot = *index;
        } else {
            missing.push_back(name);
        }
    };

    locate(schema.name, indices.name);
    locate(schema.location, indices.location);
    locate(schema.size, indices.size);
    locate(schema.site_address, indices.site_address);

    if (!missing.empty()) {
        std::string message = "Inventory is missing required column(s):";
        for (const auto& name : missing) {
            message += " '" + name + "'";
        }
        return unexpected{error{error_code::schema_error, message}};
    }

    return indices;
}

auto inventory_loader::read_with_retry(const std::filesystem::path& path) -> result<sheet> {
    auto table = reader_->read(path);
    if (table.has_value() || table.error().code != error_code::inventory_locked || !breaker_) {
        return table;
    }

    BM_LOG_WARN(log_category::inventory, table.error().message + "; releasing lock and retrying");

    auto released = breaker_->release(path);
    if (!released.has_value()) {
        BM_LOG_WARN(log_category::inventory,
            "Could not release inventory lock: " + released.error().message);
    }

    return reader_->read(path);
}

auto inventory_loader::load(const std::filesystem::path& path)
    -> result<std::vector<file_record>> {
    auto table = read_with_retry(path);
    if (!table.has_value()) {
        return unexpected{table.error()};
    }

    const auto& content = table.value();
    if (content.header.empty() && content.rows.empty()) {
        BM_LOG_INFO(log_category::inventory, "Inventory " + path.string() + " is empty");
        return std::vector<file_record>{};
    }

    auto indices = validate_schema(content.header, schema_);
    if (!indices.has_value()) {
        return unexpected{indices.error()};
    }
    const auto& columns = indices.value();

    std::vector<file_record> records;
    records.reserve(content.rows.size());

    for (std::size_t i = 0; i < content.rows.size(); ++i) {
        const auto& row = content.rows[i];
        if (is_blank(row)) {
            continue;
        }

        file_record record;
        record.row_number = i + 1;
        record.name = cell(row, columns.name);
        record.location = cell(row, columns.location);
        record.declared_size = cell(row, columns.size);
        record.declared_size_mb = parse_size_cell(record.declared_size);
        record.site_address = cell(row, columns.site_address);

        if (record.location.empty() || record.site_address.empty()) {
            BM_LOG_WARN(log_category::inventory,
                "Skipping inventory row " + std::to_string(record.row_number) +
                ": '" + schema_.location + "' and '" + schema_.site_address +
                "' must not be empty");
            continue;
        }

        if (record.name.empty()) {
            record.name = last_path_segment(record.location);
        }

        records.push_back(std::move(record));
    }

    BM_LOG_INFO(log_category::inventory,
        "Loaded " + std::to_string(records.size()) + " record(s) from " + path.string());
    return records;
}

}  // namespace kcenon::blob_migration
