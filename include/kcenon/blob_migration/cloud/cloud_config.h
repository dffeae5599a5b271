/**
 * @file cloud_config.h
 * @brief Blob storage configuration types
 *
 * This file defines configuration and credential structures for the
 * Azure Blob Storage destination.
 */

#ifndef KCENON_BLOB_MIGRATION_CLOUD_CLOUD_CONFIG_H
#define KCENON_BLOB_MIGRATION_CLOUD_CLOUD_CONFIG_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace kcenon::blob_migration {

/**
 * @brief Retry policy for blob requests
 *
 * The default is a single attempt; the pipeline does not retry uploads
 * unless the operator asks for it.
 */
struct cloud_retry_policy {
    /// Maximum number of attempts per request (1 = no retry)
    std::size_t max_attempts = 1;

    /// Initial delay between retries
    std::chrono::milliseconds initial_delay{1000};

    /// Maximum delay between retries
    std::chrono::milliseconds max_delay{30000};

    /// Multiplier for exponential backoff
    double backoff_multiplier = 2.0;

    /// Add jitter to retry delays
    bool use_jitter = true;

    /// Retry on rate limiting (429, 503)
    bool retry_on_rate_limit = true;

    /// Retry on server errors (5xx)
    bool retry_on_server_error = true;
};

/**
 * @brief Block upload configuration
 *
 * Files at or below @c single_put_threshold are sent with one Put Blob
 * request. Larger files are streamed as Put Block requests of
 * @c block_size bytes and committed with Put Block List.
 */
struct block_upload_config {
    /// Largest file sent in a single request (default: 32MB)
    uint64_t single_put_threshold = 32ULL * 1024 * 1024;

    /// Block size for staged uploads (default: 8MB)
    uint64_t block_size = 8ULL * 1024 * 1024;

    /// Azure limit on committed blocks per blob
    static constexpr uint64_t max_blocks = 50000;
};

/**
 * @brief Azure Blob Storage configuration
 */
struct azure_blob_config {
    /// Default container name
    std::string container;

    /// Azure storage account name
    std::string account_name;

    /// Custom endpoint (Azurite, sovereign clouds)
    std::optional<std::string> endpoint;

    /// Endpoint suffix used when no custom endpoint is set
    std::string endpoint_suffix = "core.windows.net";

    /// Use HTTPS
    bool use_ssl = true;

    /// Blob service version
    std::string api_version = "2023-11-03";

    /// Block blob tier (Hot, Cool, Cold, Archive)
    std::optional<std::string> access_tier;

    /// Request timeout
    std::chrono::milliseconds request_timeout{300000};

    block_upload_config blocks;
    cloud_retry_policy retry;
};

/**
 * @brief Pre-shared credentials for the storage account
 *
 * Exactly one of @c account_key or @c sas_token is used; the account key
 * takes precedence when both are set.
 */
struct azure_credentials {
    std::string account_name;

    /// Base64 account key for SharedKey signing
    std::optional<std::string> account_key;

    /// SAS token appended to every request URL
    std::optional<std::string> sas_token;

    [[nodiscard]] auto is_valid() const -> bool {
        return !account_name.empty() &&
               ((account_key.has_value() && !account_key->empty()) ||
                (sas_token.has_value() && !sas_token->empty()));
    }
};

/**
 * @brief Parse an Azure storage connection string
 *
 * Recognizes AccountName, AccountKey, SharedAccessSignature,
 * EndpointSuffix, DefaultEndpointsProtocol and BlobEndpoint.
 * @return Credentials, or std::nullopt when the string names no account
 *         or carries neither a key nor a SAS token
 */
[[nodiscard]] auto parse_connection_string(
    const std::string& connection_string,
    azure_blob_config* config = nullptr) -> std::optional<azure_credentials>;

}  // namespace kcenon::blob_migration

#endif  // KCENON_BLOB_MIGRATION_CLOUD_CLOUD_CONFIG_H
