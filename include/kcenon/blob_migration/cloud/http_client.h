/**
 * @file http_client.h
 * @brief HTTP client abstraction for the blob and source backends
 *
 * The blob store and the document-library connector both talk HTTP through
 * http_client_interface so tests can inject a scripted client. The
 * production implementation wraps the network_system HTTP client.
 */

#ifndef KCENON_BLOB_MIGRATION_CLOUD_HTTP_CLIENT_H
#define KCENON_BLOB_MIGRATION_CLOUD_HTTP_CLIENT_H

#include "kcenon/blob_migration/core/types.h"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Forward declaration for network_system HTTP client
namespace kcenon::network::core {
class http_client;
}

namespace kcenon::blob_migration {

/**
 * @brief HTTP response
 */
struct http_response {
    int status_code = 0;
    std::map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    /**
     * @brief Case-insensitive header lookup
     */
    [[nodiscard]] auto get_header(const std::string& name) const -> std::optional<std::string>;
};

/**
 * @brief HTTP client interface
 *
 * A returned error means the request never produced a response (DNS,
 * connect, TLS, timeout). HTTP error statuses are returned as values.
 */
class http_client_interface {
public:
    virtual ~http_client_interface() = default;

    [[nodiscard]] virtual auto get(
        const std::string& url,
        const std::map<std::string, std::string>& headers)
        -> result<http_response> = 0;

    [[nodiscard]] virtual auto put(
        const std::string& url,
        const std::string& body,
        const std::map<std::string, std::string>& headers)
        -> result<http_response> = 0;

    [[nodiscard]] virtual auto head(
        const std::string& url,
        const std::map<std::string, std::string>& headers)
        -> result<http_response> = 0;
};

/**
 * @brief network_system backed HTTP client
 *
 * Without BUILD_WITH_NETWORK_SYSTEM every request fails with
 * error_code::not_initialized.
 */
class cloud_http_client : public http_client_interface {
public:
    explicit cloud_http_client(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

    ~cloud_http_client() override;

    cloud_http_client(const cloud_http_client&) = delete;
    auto operator=(const cloud_http_client&) -> cloud_http_client& = delete;
    cloud_http_client(cloud_http_client&&) noexcept;
    auto operator=(cloud_http_client&&) noexcept -> cloud_http_client&;

    [[nodiscard]] auto get(
        const std::string& url,
        const std::map<std::string, std::string>& headers)
        -> result<http_response> override;

    [[nodiscard]] auto put(
        const std::string& url,
        const std::string& body,
        const std::map<std::string, std::string>& headers)
        -> result<http_response> override;

    [[nodiscard]] auto head(
        const std::string& url,
        const std::map<std::string, std::string>& headers)
        -> result<http_response> override;

    /**
     * @brief Check if the network system is available
     */
    [[nodiscard]] auto is_available() const noexcept -> bool;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Factory function to create the production HTTP client
 */
[[nodiscard]] auto make_cloud_http_client(
    std::chrono::milliseconds timeout = std::chrono::milliseconds(30000))
    -> std::shared_ptr<cloud_http_client>;

}  // namespace kcenon::blob_migration

#endif  // KCENON_BLOB_MIGRATION_CLOUD_HTTP_CLIENT_H
