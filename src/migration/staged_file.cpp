/**
 * @file staged_file.cpp
 * @brief Staged file cleanup
 */

#include "kcenon/blob_migration/migration/staged_file.h"
#include "kcenon/blob_migration/core/logging.h"

#include <cstdio>
#include <exception>

namespace kcenon::blob_migration {

staged_file::staged_file(std::filesystem::path path)
    : path_(std::move(path)) {}

staged_file::~staged_file() {
    remove();
}

staged_file::staged_file(staged_file&& other) noexcept
    : path_(std::move(other.path_)), owned_(other.owned_) {
    other.owned_ = false;
}

auto staged_file::operator=(staged_file&& other) noexcept -> staged_file& {
    if (this != &other) {
        remove();
        path_ = std::move(other.path_);
        owned_ = other.owned_;
        other.owned_ = false;
    }
    return *this;
}

auto staged_file::remove() noexcept -> bool {
    if (!owned_) {
        return true;
    }

    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        // Runs from the destructor; a failure to log must not escape.
        try {
            BM_LOG_WARN(log_category::transfer,
                "Could not remove staged file " + path_.string() + ": " + ec.message());
        } catch (const std::exception& e) {
            std::fputs("blob_migration: staged file cleanup warning lost: ", stderr);
            std::fputs(e.what(), stderr);
            std::fputc('\n', stderr);
        }
        return false;
    }

    owned_ = false;
    return true;
}

}  // namespace kcenon::blob_migration
