/**
 * @file http_client.cpp
 * @brief network_system backed HTTP client
 */

#include "kcenon/blob_migration/cloud/http_client.h"

#include <algorithm>
#include <cctype>

#ifdef BUILD_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

namespace kcenon::blob_migration {

namespace {

auto iequals(const std::string& a, const std::string& b) -> bool {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

}  // namespace

auto http_response::get_header(const std::string& name) const -> std::optional<std::string> {
    auto it = headers.find(name);
    if (it != headers.end()) {
        return it->second;
    }
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) {
            return value;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Implementation
// ============================================================================

struct cloud_http_client::impl {
#ifdef BUILD_WITH_NETWORK_SYSTEM
    std::shared_ptr<kcenon::network::core::http_client> client;
#endif
    bool available = false;

    explicit impl(std::chrono::milliseconds timeout) {
#ifdef BUILD_WITH_NETWORK_SYSTEM
        client = std::make_shared<kcenon::network::core::http_client>(timeout);
        available = true;
#else
        (void)timeout;
#endif
    }

#ifdef BUILD_WITH_NETWORK_SYSTEM
    static auto convert_response(
        const kcenon::network::internal::http_response& resp) -> http_response {
        http_response converted;
        converted.status_code = resp.status_code;
        for (const auto& [key, value] : resp.headers) {
            converted.headers[key] = value;
        }
        converted.body = std::vector<uint8_t>(resp.body.begin(), resp.body.end());
        return converted;
    }
#endif

    static auto unavailable() -> result<http_response> {
        return unexpected{error{error_code::not_initialized,
            "HTTP client not available (BUILD_WITH_NETWORK_SYSTEM not defined)"}};
    }
};

cloud_http_client::cloud_http_client(std::chrono::milliseconds timeout)
    : impl_(std::make_unique<impl>(timeout)) {}

cloud_http_client::~cloud_http_client() = default;

cloud_http_client::cloud_http_client(cloud_http_client&&) noexcept = default;
auto cloud_http_client::operator=(cloud_http_client&&) noexcept
    -> cloud_http_client& = default;

auto cloud_http_client::get(
    const std::string& url,
    const std::map<std::string, std::string>& headers)
    -> result<http_response> {
#ifdef BUILD_WITH_NETWORK_SYSTEM
    auto response = impl_->client->get(url, {}, headers);
    if (response.is_err()) {
        return unexpected{error{error_code::connection_failed,
            "HTTP GET request failed: " + url}};
    }
    return impl_->convert_response(response.value());
#else
    (void)url;
    (void)headers;
    return impl::unavailable();
#endif
}

auto cloud_http_client::put(
    const std::string& url,
    const std::string& body,
    const std::map<std::string, std::string>& headers)
    -> result<http_response> {
#ifdef BUILD_WITH_NETWORK_SYSTEM
    auto response = impl_->client->put(url, body, headers);
    if (response.is_err()) {
        return unexpected{error{error_code::connection_failed,
            "HTTP PUT request failed: " + url}};
    }
    return impl_->convert_response(response.value());
#else
    (void)url;
    (void)body;
    (void)headers;
    return impl::unavailable();
#endif
}

auto cloud_http_client::head(
    const std::string& url,
    const std::map<std::string, std::string>& headers)
    -> result<http_response> {
#ifdef BUILD_WITH_NETWORK_SYSTEM
    auto response = impl_->client->head(url, headers);
    if (response.is_err()) {
        return unexpected{error{error_code::connection_failed,
            "HTTP HEAD request failed: " + url}};
    }
    return impl_->convert_response(response.value());
#else
    (void)url;
    (void)headers;
    return impl::unavailable();
#endif
}

auto cloud_http_client::is_available() const noexcept -> bool {
    return impl_ && impl_->available;
}

auto make_cloud_http_client(std::chrono::milliseconds timeout)
    -> std::shared_ptr<cloud_http_client> {
    return std::make_shared<cloud_http_client>(timeout);
}

}  // namespace kcenon::blob_migration
