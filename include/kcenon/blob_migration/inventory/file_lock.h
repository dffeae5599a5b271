/**
 * @file file_lock.h
 * @brief Detection and release of foreign locks on the inventory file
 */

#ifndef KCENON_BLOB_MIGRATION_INVENTORY_FILE_LOCK_H
#define KCENON_BLOB_MIGRATION_INVENTORY_FILE_LOCK_H

#include <chrono>
#include <filesystem>
#include <optional>

#include "kcenon/blob_migration/core/types.h"

namespace kcenon::blob_migration {

/**
 * @brief Find the process holding a lock that would block a reader
 * @return Process id of the holder, or std::nullopt when the file is free
 *         or cannot be inspected
 */
[[nodiscard]] auto find_lock_holder(const std::filesystem::path& path) -> std::optional<int>;

/**
 * @brief Releases a lock another process holds on a file
 */
class lock_breaker {
public:
    virtual ~lock_breaker() = default;

    /**
     * @brief Attempt once to make the file readable again
     */
    [[nodiscard]] virtual auto release(const std::filesystem::path& path) -> result<void> = 0;
};

/**
 * @brief Sends SIGTERM to the process holding the lock and waits for it
 *        to let go
 */
class posix_lock_breaker : public lock_breaker {
public:
    explicit posix_lock_breaker(
        std::chrono::milliseconds grace_period = std::chrono::milliseconds(2000));

    [[nodiscard]] auto release(const std::filesystem::path& path) -> result<void> override;

private:
    std::chrono::milliseconds grace_period_;
};

}  // namespace kcenon::blob_migration

#endif  // KCENON_BLOB_MIGRATION_INVENTORY_FILE_LOCK_H
