/**
 * @file source_connector.h
 * @brief Source endpoint connector interface and credential variants
 */

#ifndef KCENON_BLOB_MIGRATION_SOURCE_SOURCE_CONNECTOR_H
#define KCENON_BLOB_MIGRATION_SOURCE_SOURCE_CONNECTOR_H

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>

#include "kcenon/blob_migration/core/types.h"

namespace kcenon::blob_migration {

/**
 * @brief App-only authentication with a client certificate
 */
struct certificate_credentials {
    std::string tenant_id;
    std::string client_id;
    std::filesystem::path certificate_path;
    std::optional<std::string> certificate_password;
};

/**
 * @brief Interactive (delegated) authentication as a user
 *
 * access_token carries a token obtained out of band, when there is one.
 */
struct delegated_credentials {
    std::string user_name;
    std::optional<std::string> access_token;
};

/**
 * @brief Exactly one credential variant is selected per run
 */
using source_credentials = std::variant<certificate_credentials, delegated_credentials>;

/**
 * @brief Name of the selected credential variant, for logging
 */
[[nodiscard]] inline auto credential_kind(const source_credentials& creds) -> const char* {
    return std::holds_alternative<certificate_credentials>(creds) ? "certificate" : "delegated";
}

/**
 * @brief Opaque handle of an open session
 */
struct session_handle {
    uint64_t id = 0;
    std::string address;
};

/**
 * @brief Connection to a document-library source endpoint
 */
class source_connector {
public:
    virtual ~source_connector() = default;

    /**
     * @brief Open an authenticated session against @p address
     * @return error_code::authentication_failed or error_code::connection_failed
     */
    [[nodiscard]] virtual auto connect(const std::string& address,
                                       const source_credentials& credentials)
        -> result<session_handle> = 0;

    [[nodiscard]] virtual auto disconnect(const session_handle& handle) -> result<void> = 0;

    /**
     * @brief Download a server-relative file to local_dir / local_name
     * @return error_code::download_failed when the file could not be fetched
     */
    [[nodiscard]] virtual auto fetch(const session_handle& handle,
                                     const std::string& remote_path,
                                     const std::filesystem::path& local_dir,
                                     const std::string& local_name) -> result<void> = 0;
};

}  // namespace kcenon::blob_migration

#endif  // KCENON_BLOB_MIGRATION_SOURCE_SOURCE_CONNECTOR_H
