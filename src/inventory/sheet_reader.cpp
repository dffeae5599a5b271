/**
 * @file sheet_reader.cpp
 * @brief Delimited text inventory reader
 */

#include "kcenon/blob_migration/inventory/sheet_reader.h"
#include "kcenon/blob_migration/inventory/file_lock.h"

#include <fstream>
#include <iterator>

namespace kcenon::blob_migration {

delimited_sheet_reader::delimited_sheet_reader(char delimiter)
    : delimiter_(delimiter) {}

auto delimited_sheet_reader::read(const std::filesystem::path& path) -> result<sheet> {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return unexpected{error{error_code::file_not_found,
            "Inventory not found: " + path.string()}};
    }

    if (auto holder = find_lock_holder(path)) {
        return unexpected{error{error_code::inventory_locked,
            "Inventory " + path.string() + " is locked by process " +
            std::to_string(*holder)}};
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return unexpected{error{error_code::file_access_denied,
            "Cannot open inventory: " + path.string()}};
    }

    return parse(input);
}

auto delimited_sheet_reader::parse(std::istream& input) const -> result<sheet> {
    std::string content((std::istreambuf_iterator<char>(input)),
                        std::istreambuf_iterator<char>());
    if (input.bad()) {
        return unexpected{error{error_code::file_read_error, "Failed to read inventory"}};
    }

    std::size_t pos = 0;
    if (content.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        pos = 3;
    }

    std::vector<std::vector<std::string>> records;
    std::vector<std::string> current;
    std::string field;
    bool in_quotes = false;
    bool record_started = false;

    auto end_field = [&]() {
        current.push_back(std::move(field));
        field.clear();
    };
    auto end_record = [&]() {
        end_field();
        records.push_back(std::move(current));
        current.clear();
        record_started = false;
    };

    for (; pos < content.size(); ++pos) {
        char c = content[pos];

        if (in_quotes) {
            if (c == '"') {
                if (pos + 1 < content.size() && content[pos + 1] == '"') {
                    field += '"';
                    ++pos;
                } else {
                    in_quotes = false;
                }
            } else {
                field += c;
            }
            continue;
        }

        if (c == '"') {
            in_quotes = true;
            record_started = true;
        } else if (c == delimiter_) {
            end_field();
            record_started = true;
        } else if (c == '\r') {
            if (pos + 1 < content.size() && content[pos + 1] == '\n') {
                ++pos;
            }
            end_record();
        } else if (c == '\n') {
            end_record();
        } else {
            field += c;
            record_started = true;
        }
    }

    if (in_quotes) {
        return unexpected{error{error_code::file_read_error,
            "Unterminated quoted field in inventory"}};
    }

    if (record_started || !field.empty() || !current.empty()) {
        end_record();
    }

    sheet table;
    if (records.empty()) {
        return table;
    }

    table.header = std::move(records.front());
    table.rows.assign(std::make_move_iterator(records.begin() + 1),
                      std::make_move_iterator(records.end()));
    return table;
}

}  // namespace kcenon::blob_migration
