/**
 * @file sharepoint_connector.cpp
 * @brief SharePoint REST connector implementation
 */

#include "kcenon/blob_migration/source/sharepoint_connector.h"
#include "kcenon/blob_migration/cloud/cloud_utils.h"
#include "kcenon/blob_migration/core/logging.h"

#include <fstream>
#include <map>

namespace kcenon::blob_migration {

namespace {

auto strip_trailing_slash(std::string value) -> std::string {
    while (!value.empty() && value.back() == '/') {
        value.pop_back();
    }
    return value;
}

}  // namespace

struct sharepoint_connector::impl {
    std::shared_ptr<http_client_interface> http_client;
    std::shared_ptr<token_provider> tokens;

    uint64_t next_id = 1;
    std::map<uint64_t, std::string> session_tokens;

    auto request_headers(const std::string& token) const
        -> std::map<std::string, std::string> {
        return {
            {"Authorization", "Bearer " + token},
            {"Accept", "application/json;odata=nometadata"},
        };
    }
};

sharepoint_connector::sharepoint_connector(std::shared_ptr<http_client_interface> http_client,
                                           std::shared_ptr<token_provider> tokens)
    : impl_(std::make_unique<impl>()) {
    impl_->http_client = std::move(http_client);
    impl_->tokens = std::move(tokens);
}

sharepoint_connector::~sharepoint_connector() = default;

auto sharepoint_connector::file_content_url(const std::string& address,
                                            const std::string& server_relative_path)
    -> std::string {
    std::string quoted;
    quoted.reserve(server_relative_path.size());
    for (char c : server_relative_path) {
        quoted += c;
        if (c == '\'') {
            quoted += '\'';
        }
    }

    return strip_trailing_slash(address) +
           "/_api/web/GetFileByServerRelativePath(decodedurl='" +
           cloud_utils::url_encode(quoted, false) + "')/$value";
}

auto sharepoint_connector::connect(const std::string& address,
                                   const source_credentials& credentials)
    -> result<session_handle> {
    if (!impl_->http_client || !impl_->tokens) {
        return unexpected{error{error_code::not_initialized,
            "SharePoint connector has no HTTP client or token provider"}};
    }

    auto token = impl_->tokens->acquire(address, credentials);
    if (!token.has_value()) {
        return unexpected{token.error()};
    }

    auto url = strip_trailing_slash(address) + "/_api/web?$select=Title";
    auto response = impl_->http_client->get(url, impl_->request_headers(token.value()));
    if (!response.has_value()) {
        return unexpected{error{error_code::connection_failed,
            "Cannot reach " + address + ": " + response.error().message}};
    }

    int status = response.value().status_code;
    if (status == 401 || status == 403) {
        return unexpected{error{error_code::authentication_failed,
            "Access to " + address + " denied (HTTP " + std::to_string(status) + ")"}};
    }
    if (status < 200 || status >= 300) {
        return unexpected{error{error_code::connection_failed,
            "Site probe for " + address + " failed (HTTP " + std::to_string(status) + ")"}};
    }

    session_handle handle;
    handle.id = impl_->next_id++;
    handle.address = strip_trailing_slash(address);
    impl_->session_tokens[handle.id] = token.value();
    return handle;
}

auto sharepoint_connector::disconnect(const session_handle& handle) -> result<void> {
    if (impl_->session_tokens.erase(handle.id) == 0) {
        return unexpected{error{error_code::session_closed,
            "No open session " + std::to_string(handle.id) + " for " + handle.address}};
    }
    return result<void>{};
}

auto sharepoint_connector::fetch(const session_handle& handle,
                                 const std::string& remote_path,
                                 const std::filesystem::path& local_dir,
                                 const std::string& local_name) -> result<void> {
    auto it = impl_->session_tokens.find(handle.id);
    if (it == impl_->session_tokens.end()) {
        return unexpected{error{error_code::session_closed,
            "Session for " + handle.address + " is not open"}};
    }

    auto url = file_content_url(handle.address, remote_path);
    auto response = impl_->http_client->get(url, impl_->request_headers(it->second));
    if (!response.has_value()) {
        return unexpected{error{error_code::download_failed,
            "Download of " + remote_path + " failed: " + response.error().message}};
    }

    const auto& reply = response.value();
    if (reply.status_code < 200 || reply.status_code >= 300) {
        return unexpected{error{error_code::download_failed,
            "Download of " + remote_path + " failed (HTTP " +
            std::to_string(reply.status_code) + ")"}};
    }

    std::error_code ec;
    std::filesystem::create_directories(local_dir, ec);
    if (ec) {
        return unexpected{error{error_code::staging_failed,
            "Cannot create " + local_dir.string() + ": " + ec.message()}};
    }

    auto target = local_dir / local_name;
    {
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (out) {
            out.write(reinterpret_cast<const char*>(reply.body.data()),
                      static_cast<std::streamsize>(reply.body.size()));
            out.flush();
        }
        if (out) {
            BM_LOG_DEBUG(log_category::session,
                "Fetched " + remote_path + " (" + std::to_string(reply.body.size()) + " bytes)");
            return result<void>{};
        }
    }

    std::filesystem::remove(target, ec);
    return unexpected{error{error_code::download_failed,
        "Cannot write " + target.string()}};
}

}  // namespace kcenon::blob_migration
