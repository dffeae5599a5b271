/**
 * @file azure_blob_storage.cpp
 * @brief Azure Blob Storage backend implementation
 */

#include "kcenon/blob_migration/cloud/azure_blob_storage.h"
#include "kcenon/blob_migration/cloud/cloud_utils.h"
#include "kcenon/blob_migration/core/logging.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <thread>
#include <vector>

namespace kcenon::blob_migration {

using cloud_utils::base64_decode;
using cloud_utils::base64_encode;
using cloud_utils::calculate_retry_delay;
using cloud_utils::detect_content_type;
using cloud_utils::get_rfc1123_time;
using cloud_utils::hmac_sha256;
using cloud_utils::is_retryable_status;
using cloud_utils::url_encode;

namespace {

/**
 * @brief Generate block ID for Azure Block Blob
 *
 * All IDs of one blob must have the same length before encoding.
 */
auto generate_block_id(std::size_t block_number) -> std::string {
    std::ostringstream oss;
    oss << "block-" << std::setfill('0') << std::setw(6) << block_number;
    return base64_encode(oss.str());
}

auto to_lower(std::string value) -> std::string {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

}  // namespace

// ============================================================================
// Azure Blob Storage Implementation
// ============================================================================

struct azure_blob_storage::impl {
    azure_blob_config config_;
    azure_credentials credentials_;
    std::shared_ptr<http_client_interface> http_client_;
    blob_storage_statistics stats_;

    impl(const azure_blob_config& config,
         const azure_credentials& credentials,
         std::shared_ptr<http_client_interface> http_client)
        : config_(config), credentials_(credentials), http_client_(std::move(http_client)) {
        if (!http_client_) {
            http_client_ = make_cloud_http_client(config_.request_timeout);
        }
    }

    [[nodiscard]] auto uses_shared_key() const -> bool {
        return credentials_.account_key.has_value() && !credentials_.account_key->empty();
    }

    auto get_blob_endpoint() const -> std::string {
        if (config_.endpoint.has_value()) {
            auto endpoint = config_.endpoint.value();
            while (!endpoint.empty() && endpoint.back() == '/') {
                endpoint.pop_back();
            }
            return endpoint;
        }

        std::string protocol = config_.use_ssl ? "https" : "http";
        return protocol + "://" + config_.account_name + ".blob." + config_.endpoint_suffix;
    }

    auto get_blob_path(const std::string& container, const std::string& key) const
        -> std::string {
        return "/" + container + "/" + url_encode(key, false);
    }

    auto build_url(const std::string& container,
                   const std::string& key,
                   const std::map<std::string, std::string>& query) const -> std::string {
        std::string url = get_blob_endpoint() + get_blob_path(container, key);

        char separator = '?';
        for (const auto& [name, value] : query) {
            url += separator;
            url += name + "=" + url_encode(value);
            separator = '&';
        }

        if (!uses_shared_key() && credentials_.sas_token.has_value()) {
            auto sas = credentials_.sas_token.value();
            if (!sas.empty() && sas.front() == '?') {
                sas.erase(0, 1);
            }
            url += separator;
            url += sas;
        }

        return url;
    }

    auto create_authorization_header(
        const std::string& method,
        const std::string& container,
        const std::string& key,
        const std::map<std::string, std::string>& query,
        const std::map<std::string, std::string>& headers,
        uint64_t content_length) const -> std::string {
        if (!uses_shared_key()) {
            return "";
        }

        std::ostringstream string_to_sign;
        string_to_sign << method << "\n";

        auto get_header = [&headers](const std::string& name) -> std::string {
            auto it = headers.find(name);
            return (it != headers.end()) ? it->second : "";
        };

        string_to_sign << get_header("Content-Encoding") << "\n";
        string_to_sign << get_header("Content-Language") << "\n";
        // Version 2015-02-21 and later sign an empty length for zero-byte bodies.
        string_to_sign << (content_length > 0 ? std::to_string(content_length) : "") << "\n";
        string_to_sign << get_header("Content-MD5") << "\n";
        string_to_sign << get_header("Content-Type") << "\n";
        string_to_sign << get_header("Date") << "\n";
        string_to_sign << get_header("If-Modified-Since") << "\n";
        string_to_sign << get_header("If-Match") << "\n";
        string_to_sign << get_header("If-None-Match") << "\n";
        string_to_sign << get_header("If-Unmodified-Since") << "\n";
        string_to_sign << get_header("Range") << "\n";

        // Canonicalized headers (x-ms-*)
        std::map<std::string, std::string> ms_headers;
        for (const auto& [name, value] : headers) {
            auto lower_name = to_lower(name);
            if (lower_name.starts_with("x-ms-")) {
                ms_headers[lower_name] = value;
            }
        }

        for (const auto& [name, value] : ms_headers) {
            string_to_sign << name << ":" << value << "\n";
        }

        // Canonicalized resource
        string_to_sign << "/" << config_.account_name << get_blob_path(container, key);
        std::map<std::string, std::string> canonical_query;
        for (const auto& [name, value] : query) {
            canonical_query[to_lower(name)] = value;
        }
        for (const auto& [name, value] : canonical_query) {
            string_to_sign << "\n" << name << ":" << value;
        }

        auto key_bytes = base64_decode(credentials_.account_key.value());
        auto signature = hmac_sha256(key_bytes, string_to_sign.str());

        return "SharedKey " + config_.account_name + ":" + base64_encode(signature);
    }

    /**
     * @brief Send a signed PUT, retrying under the configured policy
     */
    auto send_put(const std::string& container,
                  const std::string& key,
                  const std::map<std::string, std::string>& query,
                  const std::string& body,
                  const std::map<std::string, std::string>& extra_headers,
                  int expected_status) -> result<http_response> {
        const auto& policy = config_.retry;
        const std::size_t max_attempts = std::max<std::size_t>(policy.max_attempts, 1);
        const auto url = build_url(container, key, query);

        std::size_t attempt = 0;
        while (true) {
            ++attempt;

            std::map<std::string, std::string> headers = extra_headers;
            headers["x-ms-version"] = config_.api_version;
            headers["x-ms-date"] = get_rfc1123_time();
            headers["Content-Length"] = std::to_string(body.size());

            auto auth = create_authorization_header("PUT", container, key, query, headers,
                                                    body.size());
            if (!auth.empty()) {
                headers["Authorization"] = auth;
            }

            auto response = http_client_->put(url, body, headers);

            bool retryable = false;
            error failure;
            if (!response.has_value()) {
                failure = error{error_code::upload_failed, response.error().message};
                retryable = true;
            } else if (response.value().status_code != expected_status) {
                auto status = response.value().status_code;
                failure = error{error_code::upload_failed,
                    "Blob service returned status " + std::to_string(status) +
                    " for " + container + "/" + key};
                retryable = is_retryable_status(status, policy);
            } else {
                return response;
            }

            if (!retryable || attempt >= max_attempts) {
                return unexpected{failure};
            }

            auto delay = calculate_retry_delay(policy, attempt);
            BM_LOG_DEBUG(log_category::cloud,
                "Retrying blob request in " + std::to_string(delay.count()) +
                "ms: " + failure.message);
            std::this_thread::sleep_for(delay);
        }
    }

    auto put_single(const std::string& container,
                    const std::string& key,
                    const std::filesystem::path& local_file,
                    uint64_t file_size) -> result<blob_put_result> {
        std::ifstream file(local_file, std::ios::binary);
        if (!file) {
            return unexpected{error{error_code::file_access_denied,
                "Cannot open file: " + local_file.string()}};
        }

        std::string body(static_cast<std::size_t>(file_size), '\0');
        if (file_size > 0) {
            file.read(body.data(), static_cast<std::streamsize>(file_size));
            if (!file) {
                return unexpected{error{error_code::file_read_error,
                    "Failed to read file: " + local_file.string()}};
            }
        }

        std::map<std::string, std::string> headers;
        headers["x-ms-blob-type"] = "BlockBlob";
        headers["Content-Type"] = detect_content_type(key);
        if (config_.access_tier.has_value()) {
            headers["x-ms-access-tier"] = config_.access_tier.value();
        }

        auto response = send_put(container, key, {}, body, headers, 201);
        if (!response.has_value()) {
            return unexpected{response.error()};
        }

        blob_put_result uploaded;
        uploaded.container = container;
        uploaded.key = key;
        uploaded.etag = response.value().get_header("ETag").value_or("");
        uploaded.bytes_uploaded = file_size;
        return uploaded;
    }

    auto put_blocks(const std::string& container,
                    const std::string& key,
                    const std::filesystem::path& local_file,
                    uint64_t file_size) -> result<blob_put_result> {
        const uint64_t block_size = config_.blocks.block_size;
        const uint64_t block_total = (file_size + block_size - 1) / block_size;
        if (block_total > block_upload_config::max_blocks) {
            return unexpected{error{error_code::upload_failed,
                "File needs " + std::to_string(block_total) +
                " blocks, above the service limit; increase the block size"}};
        }

        std::ifstream file(local_file, std::ios::binary);
        if (!file) {
            return unexpected{error{error_code::file_access_denied,
                "Cannot open file: " + local_file.string()}};
        }

        std::vector<std::string> block_ids;
        block_ids.reserve(static_cast<std::size_t>(block_total));

        std::string buffer(static_cast<std::size_t>(block_size), '\0');
        uint64_t sent = 0;

        while (sent < file_size) {
            auto want = static_cast<std::size_t>(std::min(block_size, file_size - sent));
            buffer.resize(want);
            file.read(buffer.data(), static_cast<std::streamsize>(want));
            if (static_cast<std::size_t>(file.gcount()) != want) {
                return unexpected{error{error_code::file_read_error,
                    "Short read from " + local_file.string()}};
            }

            auto block_id = generate_block_id(block_ids.size());
            std::map<std::string, std::string> query{{"comp", "block"}, {"blockid", block_id}};
            std::map<std::string, std::string> headers{
                {"Content-Type", "application/octet-stream"}};

            auto response = send_put(container, key, query, buffer, headers, 201);
            if (!response.has_value()) {
                return unexpected{error{error_code::upload_failed,
                    "Put Block " + std::to_string(block_ids.size() + 1) + "/" +
                    std::to_string(block_total) + " failed: " + response.error().message}};
            }

            block_ids.push_back(block_id);
            sent += want;

            BM_LOG_DEBUG(log_category::cloud,
                "Uploaded block " + std::to_string(block_ids.size()) + "/" +
                std::to_string(block_total) + " of " + key);
        }

        std::ostringstream xml_body;
        xml_body << "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n";
        xml_body << "<BlockList>\n";
        for (const auto& block_id : block_ids) {
            xml_body << "  <Latest>" << block_id << "</Latest>\n";
        }
        xml_body << "</BlockList>";

        std::map<std::string, std::string> headers;
        headers["Content-Type"] = "application/xml";
        headers["x-ms-blob-content-type"] = detect_content_type(key);
        if (config_.access_tier.has_value()) {
            headers["x-ms-access-tier"] = config_.access_tier.value();
        }

        auto response = send_put(container, key, {{"comp", "blocklist"}}, xml_body.str(),
                                 headers, 201);
        if (!response.has_value()) {
            return unexpected{error{error_code::upload_failed,
                "Put Block List failed: " + response.error().message}};
        }

        blob_put_result uploaded;
        uploaded.container = container;
        uploaded.key = key;
        uploaded.etag = response.value().get_header("ETag").value_or("");
        uploaded.bytes_uploaded = file_size;
        uploaded.block_count = block_ids.size();
        return uploaded;
    }
};

azure_blob_storage::azure_blob_storage(
    const azure_blob_config& config,
    const azure_credentials& credentials,
    std::shared_ptr<http_client_interface> http_client)
    : impl_(std::make_unique<impl>(config, credentials, std::move(http_client))) {}

azure_blob_storage::~azure_blob_storage() = default;

azure_blob_storage::azure_blob_storage(azure_blob_storage&&) noexcept = default;
auto azure_blob_storage::operator=(azure_blob_storage&&) noexcept
    -> azure_blob_storage& = default;

auto azure_blob_storage::create(
    const azure_blob_config& config,
    const azure_credentials& credentials,
    std::shared_ptr<http_client_interface> http_client) -> std::unique_ptr<azure_blob_storage> {
    if (config.container.empty()) {
        return nullptr;
    }

    if (config.account_name.empty()) {
        return nullptr;
    }

    if (!credentials.is_valid()) {
        return nullptr;
    }

    if (config.blocks.block_size == 0) {
        return nullptr;
    }

    return std::unique_ptr<azure_blob_storage>(
        new azure_blob_storage(config, credentials, std::move(http_client)));
}

auto azure_blob_storage::put_blob(
    const std::string& container,
    const std::string& blob_key,
    const std::filesystem::path& local_file) -> result<blob_put_result> {
    if (container.empty() || blob_key.empty()) {
        return unexpected{error{error_code::upload_failed,
            "Container and blob key must not be empty"}};
    }

    std::error_code ec;
    auto file_size = std::filesystem::file_size(local_file, ec);
    if (ec) {
        impl_->stats_.errors++;
        return unexpected{error{error_code::file_not_found,
            "Cannot stat " + local_file.string() + ": " + ec.message()}};
    }

    auto start_time = std::chrono::steady_clock::now();

    auto uploaded = (file_size <= impl_->config_.blocks.single_put_threshold)
        ? impl_->put_single(container, blob_key, local_file, file_size)
        : impl_->put_blocks(container, blob_key, local_file, file_size);

    if (!uploaded.has_value()) {
        impl_->stats_.errors++;
        return uploaded;
    }

    uploaded.value().duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    impl_->stats_.bytes_uploaded += file_size;
    impl_->stats_.upload_count++;
    return uploaded;
}

auto azure_blob_storage::default_container() const -> std::string_view {
    return impl_->config_.container;
}

auto azure_blob_storage::endpoint_url() const -> std::string {
    return impl_->get_blob_endpoint();
}

auto azure_blob_storage::blob_url(const std::string& container,
                                  const std::string& blob_key) const -> std::string {
    return impl_->get_blob_endpoint() + impl_->get_blob_path(container, blob_key);
}

auto azure_blob_storage::sign_request(
    const std::string& method,
    const std::string& container,
    const std::string& blob_key,
    const std::map<std::string, std::string>& query,
    const std::map<std::string, std::string>& headers,
    uint64_t content_length) const -> std::string {
    return impl_->create_authorization_header(method, container, blob_key, query, headers,
                                              content_length);
}

auto azure_blob_storage::get_statistics() const -> blob_storage_statistics {
    return impl_->stats_;
}

auto azure_blob_storage::config() const -> const azure_blob_config& {
    return impl_->config_;
}

}  // namespace kcenon::blob_migration
