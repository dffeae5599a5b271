/**
 * @file endpoint_session.cpp
 * @brief Endpoint session lifecycle
 */

#include "kcenon/blob_migration/source/endpoint_session.h"
#include "kcenon/blob_migration/core/logging.h"

#include <exception>

namespace kcenon::blob_migration {

auto endpoint_session::open(source_connector& connector,
                            const std::string& address,
                            const source_credentials& credentials)
    -> result<endpoint_session> {
    BM_LOG_DEBUG(log_category::session,
        "Connecting to " + address + " with " + credential_kind(credentials) + " credentials");

    auto handle = connector.connect(address, credentials);
    if (!handle.has_value()) {
        return unexpected{handle.error()};
    }

    BM_LOG_INFO(log_category::session, "Connected to " + address);
    return endpoint_session(connector, std::move(handle.value()));
}

endpoint_session::endpoint_session(source_connector& connector, session_handle handle)
    : connector_(&connector), handle_(std::move(handle)) {}

endpoint_session::~endpoint_session() {
    close();
}

endpoint_session::endpoint_session(endpoint_session&& other) noexcept
    : connector_(other.connector_), handle_(std::move(other.handle_)) {
    other.connector_ = nullptr;
}

auto endpoint_session::operator=(endpoint_session&& other) noexcept -> endpoint_session& {
    if (this != &other) {
        close();
        connector_ = other.connector_;
        handle_ = std::move(other.handle_);
        other.connector_ = nullptr;
    }
    return *this;
}

auto endpoint_session::fetch(const std::string& remote_path,
                             const std::filesystem::path& local_dir,
                             const std::string& local_name) -> result<void> {
    if (!connector_) {
        return unexpected{error{error_code::session_closed,
            "Session for " + handle_.address + " is closed"}};
    }
    return connector_->fetch(handle_, remote_path, local_dir, local_name);
}

void endpoint_session::close() noexcept {
    if (!connector_) {
        return;
    }

    auto* connector = connector_;
    connector_ = nullptr;

    try {
        auto closed = connector->disconnect(handle_);
        if (!closed.has_value()) {
            BM_LOG_DEBUG(log_category::session,
                "Disconnect from " + handle_.address + " failed: " + closed.error().message);
        } else {
            BM_LOG_DEBUG(log_category::session, "Disconnected from " + handle_.address);
        }
    } catch (const std::exception& e) {
        BM_LOG_DEBUG(log_category::session,
            "Disconnect from " + handle_.address + " threw: " + e.what());
    }
}

}  // namespace kcenon::blob_migration
