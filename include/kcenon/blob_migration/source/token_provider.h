/**
 * @file token_provider.h
 * @brief Access token acquisition for the source endpoint
 */

#ifndef KCENON_BLOB_MIGRATION_SOURCE_TOKEN_PROVIDER_H
#define KCENON_BLOB_MIGRATION_SOURCE_TOKEN_PROVIDER_H

#include <memory>
#include <string>

#include "source_connector.h"

namespace kcenon::blob_migration {

/**
 * @brief Obtains a bearer token for one endpoint
 *
 * The identity-provider exchange itself happens outside this project;
 * implementations hand back a token that is already valid.
 */
class token_provider {
public:
    virtual ~token_provider() = default;

    [[nodiscard]] virtual auto acquire(const std::string& address,
                                       const source_credentials& credentials)
        -> result<std::string> = 0;
};

/**
 * @brief Returns a fixed token, or the one carried by delegated credentials
 *
 * A token inside delegated_credentials takes precedence over the fixed one.
 */
class static_token_provider : public token_provider {
public:
    explicit static_token_provider(std::string token = {});

    [[nodiscard]] auto acquire(const std::string& address,
                               const source_credentials& credentials)
        -> result<std::string> override;

private:
    std::string token_;
};

/**
 * @brief Build a static provider from BLOB_MIGRATION_SOURCE_TOKEN
 */
[[nodiscard]] auto make_environment_token_provider() -> std::shared_ptr<token_provider>;

}  // namespace kcenon::blob_migration

#endif  // KCENON_BLOB_MIGRATION_SOURCE_TOKEN_PROVIDER_H
