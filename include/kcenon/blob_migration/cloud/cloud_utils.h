/**
 * @file cloud_utils.h
 * @brief Utility functions shared by the blob and source HTTP clients
 */

#ifndef KCENON_BLOB_MIGRATION_CLOUD_CLOUD_UTILS_H
#define KCENON_BLOB_MIGRATION_CLOUD_CLOUD_UTILS_H

#include "cloud_config.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace kcenon::blob_migration::cloud_utils {

// ============================================================================
// Encoding Utilities
// ============================================================================

/**
 * @brief Base64 encode bytes
 */
auto base64_encode(const std::vector<uint8_t>& data) -> std::string;

/**
 * @brief Base64 encode string
 */
auto base64_encode(const std::string& data) -> std::string;

/**
 * @brief Base64 decode string (invalid characters are skipped)
 */
auto base64_decode(const std::string& encoded) -> std::vector<uint8_t>;

/**
 * @brief URL encode a string (RFC 3986)
 * @param value String to encode
 * @param encode_slash Whether to encode forward slashes (default: true)
 */
auto url_encode(const std::string& value, bool encode_slash = true) -> std::string;

/**
 * @brief Decode %XX escapes; malformed escapes are kept verbatim
 */
auto url_decode(const std::string& value) -> std::string;

// ============================================================================
// Cryptographic Utilities
// ============================================================================

/**
 * @brief HMAC-SHA256
 * @param key Key bytes
 * @param data Data to sign
 * @return 32-byte MAC
 */
auto hmac_sha256(const std::vector<uint8_t>& key,
                 const std::string& data) -> std::vector<uint8_t>;

// ============================================================================
// Time Utilities
// ============================================================================

/**
 * @brief Current UTC time as RFC 1123 string (x-ms-date format)
 */
auto get_rfc1123_time() -> std::string;

// ============================================================================
// HTTP Utilities
// ============================================================================

/**
 * @brief Guess a Content-Type from the key's extension
 */
auto detect_content_type(const std::string& key) -> std::string;

/**
 * @brief Delay before the given attempt, with exponential backoff
 * @param attempt 1-based number of the attempt that just failed
 */
auto calculate_retry_delay(const cloud_retry_policy& policy,
                           std::size_t attempt) -> std::chrono::milliseconds;

/**
 * @brief Whether an HTTP status is worth retrying under the policy
 */
auto is_retryable_status(int status_code,
                         const cloud_retry_policy& policy) -> bool;

}  // namespace kcenon::blob_migration::cloud_utils

#endif  // KCENON_BLOB_MIGRATION_CLOUD_CLOUD_UTILS_H
