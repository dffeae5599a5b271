/**
 * @file azure_blob_storage.h
 * @brief Blob storage destination and its Azure Blob Storage backend
 */

#ifndef KCENON_BLOB_MIGRATION_CLOUD_AZURE_BLOB_STORAGE_H
#define KCENON_BLOB_MIGRATION_CLOUD_AZURE_BLOB_STORAGE_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>

#include "cloud_config.h"
#include "http_client.h"
#include "kcenon/blob_migration/core/types.h"

namespace kcenon::blob_migration {

/**
 * @brief Outcome of a successful blob upload
 */
struct blob_put_result {
    std::string container;
    std::string key;
    std::string etag;
    uint64_t bytes_uploaded = 0;

    /// 0 when the blob was sent in a single request
    std::size_t block_count = 0;

    std::chrono::milliseconds duration{0};
};

/**
 * @brief Upload counters
 */
struct blob_storage_statistics {
    uint64_t bytes_uploaded = 0;
    uint64_t upload_count = 0;
    uint64_t errors = 0;
};

/**
 * @brief Destination blob store
 *
 * Authentication is configured on the store itself; callers only name the
 * container, the key and the local file.
 */
class blob_store {
public:
    virtual ~blob_store() = default;

    /**
     * @brief Upload a local file as a blob, replacing any existing blob
     * @param container Destination container
     * @param blob_key Blob name, '/' separated
     * @param local_file File to upload
     */
    [[nodiscard]] virtual auto put_blob(
        const std::string& container,
        const std::string& blob_key,
        const std::filesystem::path& local_file) -> result<blob_put_result> = 0;

    /**
     * @brief Container used when the caller has no override
     */
    [[nodiscard]] virtual auto default_container() const -> std::string_view = 0;
};

/**
 * @brief Azure Blob Storage backend
 *
 * Small files go up with a single Put Blob request. Files above
 * block_upload_config::single_put_threshold are read one block at a time
 * and sent with Put Block, then committed with Put Block List, so memory
 * use stays at one block regardless of file size.
 *
 * @code
 * azure_blob_config config;
 * config.account_name = "archiveaccount";
 * config.container = "archives";
 *
 * azure_credentials creds;
 * creds.account_name = "archiveaccount";
 * creds.account_key = "...";
 *
 * auto storage = azure_blob_storage::create(config, creds);
 * auto uploaded = storage->put_blob("archives", "2019/q1.zip", "/stage/2019/q1.zip");
 * @endcode
 */
class azure_blob_storage : public blob_store {
public:
    /**
     * @brief Create the backend
     * @param http_client Injected client; the network_system client is used when null
     * @return nullptr when the account, container or credentials are missing
     */
    [[nodiscard]] static auto create(
        const azure_blob_config& config,
        const azure_credentials& credentials,
        std::shared_ptr<http_client_interface> http_client = nullptr)
        -> std::unique_ptr<azure_blob_storage>;

    ~azure_blob_storage() override;

    azure_blob_storage(const azure_blob_storage&) = delete;
    auto operator=(const azure_blob_storage&) -> azure_blob_storage& = delete;
    azure_blob_storage(azure_blob_storage&&) noexcept;
    auto operator=(azure_blob_storage&&) noexcept -> azure_blob_storage&;

    [[nodiscard]] auto put_blob(
        const std::string& container,
        const std::string& blob_key,
        const std::filesystem::path& local_file) -> result<blob_put_result> override;

    [[nodiscard]] auto default_container() const -> std::string_view override;

    /**
     * @brief Blob service endpoint, without trailing slash
     */
    [[nodiscard]] auto endpoint_url() const -> std::string;

    /**
     * @brief Full blob URL without query string
     */
    [[nodiscard]] auto blob_url(const std::string& container,
                                const std::string& blob_key) const -> std::string;

    /**
     * @brief Build the SharedKey Authorization header value
     * @param query Request query parameters (decoded values)
     * @return Empty string when the store authenticates with a SAS token
     */
    [[nodiscard]] auto sign_request(
        const std::string& method,
        const std::string& container,
        const std::string& blob_key,
        const std::map<std::string, std::string>& query,
        const std::map<std::string, std::string>& headers,
        uint64_t content_length) const -> std::string;

    [[nodiscard]] auto get_statistics() const -> blob_storage_statistics;

    [[nodiscard]] auto config() const -> const azure_blob_config&;

private:
    azure_blob_storage(const azure_blob_config& config,
                       const azure_credentials& credentials,
                       std::shared_ptr<http_client_interface> http_client);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::blob_migration

#endif  // KCENON_BLOB_MIGRATION_CLOUD_AZURE_BLOB_STORAGE_H
