/**
 * @file sharepoint_connector.h
 * @brief Document-library connector over the SharePoint REST API
 */

#ifndef KCENON_BLOB_MIGRATION_SOURCE_SHAREPOINT_CONNECTOR_H
#define KCENON_BLOB_MIGRATION_SOURCE_SHAREPOINT_CONNECTOR_H

#include <memory>
#include <string>

#include "source_connector.h"
#include "token_provider.h"
#include "kcenon/blob_migration/cloud/http_client.h"

namespace kcenon::blob_migration {

/**
 * @brief source_connector speaking the SharePoint REST API
 *
 * connect() obtains a bearer token and probes the site with
 * GET {address}/_api/web. fetch() downloads
 * GetFileByServerRelativePath(decodedurl='...')/$value and writes the body
 * to the staging path; a partially written file is removed on failure.
 */
class sharepoint_connector : public source_connector {
public:
    sharepoint_connector(std::shared_ptr<http_client_interface> http_client,
                         std::shared_ptr<token_provider> tokens);

    ~sharepoint_connector() override;

    sharepoint_connector(const sharepoint_connector&) = delete;
    auto operator=(const sharepoint_connector&) -> sharepoint_connector& = delete;

    [[nodiscard]] auto connect(const std::string& address,
                               const source_credentials& credentials)
        -> result<session_handle> override;

    [[nodiscard]] auto disconnect(const session_handle& handle) -> result<void> override;

    [[nodiscard]] auto fetch(const session_handle& handle,
                             const std::string& remote_path,
                             const std::filesystem::path& local_dir,
                             const std::string& local_name) -> result<void> override;

    /**
     * @brief REST URL that returns the content of a server-relative file
     */
    [[nodiscard]] static auto file_content_url(const std::string& address,
                                               const std::string& server_relative_path)
        -> std::string;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::blob_migration

#endif  // KCENON_BLOB_MIGRATION_SOURCE_SHAREPOINT_CONNECTOR_H
