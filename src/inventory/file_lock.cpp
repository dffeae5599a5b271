/**
 * @file file_lock.cpp
 * @brief POSIX record-lock inspection and release
 */

#include "kcenon/blob_migration/inventory/file_lock.h"
#include "kcenon/blob_migration/core/logging.h"

#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>

namespace kcenon::blob_migration {

auto find_lock_holder(const std::filesystem::path& path) -> std::optional<int> {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        return std::nullopt;
    }

    struct flock probe {};
    probe.l_type = F_RDLCK;
    probe.l_whence = SEEK_SET;
    probe.l_start = 0;
    probe.l_len = 0;

    std::optional<int> holder;
    if (::fcntl(fd, F_GETLK, &probe) == 0 && probe.l_type != F_UNLCK) {
        holder = static_cast<int>(probe.l_pid);
    }

    ::close(fd);
    return holder;
}

posix_lock_breaker::posix_lock_breaker(std::chrono::milliseconds grace_period)
    : grace_period_(grace_period) {}

auto posix_lock_breaker::release(const std::filesystem::path& path) -> result<void> {
    auto holder = find_lock_holder(path);
    if (!holder) {
        return result<void>{};
    }

    if (*holder <= 0 || *holder == static_cast<int>(::getpid())) {
        return unexpected{error{error_code::inventory_locked,
            "Lock on " + path.string() + " cannot be released by this process"}};
    }

    BM_LOG_WARN(log_category::inventory,
        "Inventory " + path.string() + " is locked by process " +
        std::to_string(*holder) + "; sending SIGTERM");

    if (::kill(static_cast<pid_t>(*holder), SIGTERM) != 0) {
        return unexpected{error{error_code::file_access_denied,
            "Cannot signal process " + std::to_string(*holder) + ": " +
            std::strerror(errno)}};
    }

    const auto poll_interval = std::chrono::milliseconds(50);
    auto deadline = std::chrono::steady_clock::now() + grace_period_;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!find_lock_holder(path)) {
            return result<void>{};
        }
        std::this_thread::sleep_for(poll_interval);
    }

    if (!find_lock_holder(path)) {
        return result<void>{};
    }

    return unexpected{error{error_code::inventory_locked,
        "Process " + std::to_string(*holder) + " still holds the lock on " + path.string()}};
}

}  // namespace kcenon::blob_migration
