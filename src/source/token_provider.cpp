/**
 * @file token_provider.cpp
 * @brief Static token provider
 */

#include "kcenon/blob_migration/source/token_provider.h"

#include <cstdlib>
#include <memory>

namespace kcenon::blob_migration {

static_token_provider::static_token_provider(std::string token)
    : token_(std::move(token)) {}

auto static_token_provider::acquire(const std::string& address,
                                    const source_credentials& credentials)
    -> result<std::string> {
    if (const auto* delegated = std::get_if<delegated_credentials>(&credentials)) {
        if (delegated->access_token && !delegated->access_token->empty()) {
            return *delegated->access_token;
        }
    }

    if (token_.empty()) {
        return unexpected{error{error_code::authentication_failed,
            std::string("No access token available for ") + address + " (" +
            credential_kind(credentials) + " credentials)"}};
    }
    return token_;
}

auto make_environment_token_provider() -> std::shared_ptr<token_provider> {
    const char* token = std::getenv("BLOB_MIGRATION_SOURCE_TOKEN");
    return std::make_shared<static_token_provider>(token ? token : "");
}

}  // namespace kcenon::blob_migration
