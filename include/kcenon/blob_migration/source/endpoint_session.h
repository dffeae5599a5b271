/**
 * @file endpoint_session.h
 * @brief Scoped authenticated session against one source endpoint
 */

#ifndef KCENON_BLOB_MIGRATION_SOURCE_ENDPOINT_SESSION_H
#define KCENON_BLOB_MIGRATION_SOURCE_ENDPOINT_SESSION_H

#include <filesystem>
#include <string>

#include "source_connector.h"

namespace kcenon::blob_migration {

/**
 * @brief Open session on a source endpoint
 *
 * Move-only. The session is closed by close() or, failing that, by the
 * destructor. Closing is best-effort: failures are logged at debug level
 * and never reported to the caller.
 */
class endpoint_session {
public:
    /**
     * @brief Connect and authenticate
     * @return error_code::connection_failed or error_code::authentication_failed
     */
    [[nodiscard]] static auto open(source_connector& connector,
                                   const std::string& address,
                                   const source_credentials& credentials)
        -> result<endpoint_session>;

    ~endpoint_session();

    endpoint_session(const endpoint_session&) = delete;
    auto operator=(const endpoint_session&) -> endpoint_session& = delete;
    endpoint_session(endpoint_session&& other) noexcept;
    auto operator=(endpoint_session&& other) noexcept -> endpoint_session&;

    /**
     * @brief Download a remote file through this session
     */
    [[nodiscard]] auto fetch(const std::string& remote_path,
                             const std::filesystem::path& local_dir,
                             const std::string& local_name) -> result<void>;

    void close() noexcept;

    [[nodiscard]] auto is_open() const noexcept -> bool { return connector_ != nullptr; }
    [[nodiscard]] auto address() const -> const std::string& { return handle_.address; }

private:
    endpoint_session(source_connector& connector, session_handle handle);

    source_connector* connector_ = nullptr;
    session_handle handle_;
};

}  // namespace kcenon::blob_migration

#endif  // KCENON_BLOB_MIGRATION_SOURCE_ENDPOINT_SESSION_H
