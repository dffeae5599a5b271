/**
 * @file staged_file.h
 * @brief Scoped ownership of a file staged on local disk
 */

#ifndef KCENON_BLOB_MIGRATION_MIGRATION_STAGED_FILE_H
#define KCENON_BLOB_MIGRATION_MIGRATION_STAGED_FILE_H

#include <filesystem>

namespace kcenon::blob_migration {

/**
 * @brief Removes the staged copy when it goes out of scope
 *
 * Removal is idempotent: a file that was never written, or was already
 * removed, is not an error.
 */
class staged_file {
public:
    explicit staged_file(std::filesystem::path path);
    ~staged_file();

    staged_file(const staged_file&) = delete;
    auto operator=(const staged_file&) -> staged_file& = delete;
    staged_file(staged_file&& other) noexcept;
    auto operator=(staged_file&& other) noexcept -> staged_file&;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

    /**
     * @brief Delete the staged file now
     * @return true when no file remains at the path
     */
    auto remove() noexcept -> bool;

private:
    std::filesystem::path path_;
    bool owned_ = true;
};

}  // namespace kcenon::blob_migration

#endif  // KCENON_BLOB_MIGRATION_MIGRATION_STAGED_FILE_H
