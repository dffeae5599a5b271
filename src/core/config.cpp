/**
 * @file config.cpp
 * @brief Migration configuration validation and builder
 */

#include "kcenon/blob_migration/core/config.h"

#include <charconv>
#include <cstdlib>
#include <limits>

namespace kcenon::blob_migration {

namespace {

auto invalid(const std::string& message) -> unexpected {
    return unexpected{error{error_code::invalid_configuration, message}};
}

auto is_unset(const std::optional<std::string>& value) -> bool {
    return !value.has_value() || value->empty();
}

auto merge_connection_string(migration_config& config, const std::string& connection_string)
    -> result<void> {
    auto creds = parse_connection_string(connection_string, &config.blob);
    if (!creds) {
        return invalid("Connection string must name an account and carry a key or SAS token");
    }

    if (config.blob.account_name.empty()) {
        config.blob.account_name = creds->account_name;
    }
    if (config.blob_credentials.account_name.empty()) {
        config.blob_credentials.account_name = creds->account_name;
    }
    if (is_unset(config.blob_credentials.account_key) && !is_unset(creds->account_key)) {
        config.blob_credentials.account_key = creds->account_key;
    }
    if (is_unset(config.blob_credentials.sas_token) && !is_unset(creds->sas_token)) {
        config.blob_credentials.sas_token = creds->sas_token;
    }
    return result<void>{};
}

}  // namespace

auto migration_config::validate() const -> result<void> {
    if (inventory_path.empty()) {
        return invalid("Inventory path is required");
    }
    if (destination_root.empty()) {
        return invalid("Destination root is required");
    }
    if (delimiter == '"' || delimiter == '\n' || delimiter == '\r') {
        return invalid("Inventory delimiter cannot be a quote or line break");
    }
    for (const auto& name : columns.required()) {
        if (name.empty()) {
            return invalid("Inventory column names cannot be empty");
        }
    }

    if (blob.container.empty()) {
        return invalid("Blob container is required");
    }
    if (blob.account_name.empty()) {
        return invalid("Storage account name is required");
    }
    if (!blob_credentials.is_valid()) {
        return invalid("Storage account key or SAS token is required");
    }
    if (blob.blocks.block_size == 0 || blob.blocks.block_size > 4000ULL * 1024 * 1024) {
        return invalid("Block size must be between 1 byte and 4000 MB");
    }
    if (blob.retry.max_attempts == 0) {
        return invalid("Retry policy needs at least one attempt");
    }

    if (const auto* cert = std::get_if<certificate_credentials>(&credentials)) {
        if (cert->tenant_id.empty() || cert->client_id.empty() ||
            cert->certificate_path.empty()) {
            return invalid("Certificate credentials need tenant, client id and certificate");
        }
    } else if (const auto* delegated = std::get_if<delegated_credentials>(&credentials)) {
        if (delegated->user_name.empty() && is_unset(delegated->access_token)) {
            return invalid("Delegated credentials need a user name or an access token");
        }
    }

    return result<void>{};
}

auto parse_unsigned(const std::string& text) -> result<uint64_t> {
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        return invalid("Expected a non-negative whole number, got '" + text + "'");
    }
    return value;
}

auto parse_megabytes(const std::string& text) -> result<uint64_t> {
    constexpr uint64_t megabyte = 1024ULL * 1024ULL;

    auto value = parse_unsigned(text);
    if (!value.has_value()) {
        return value;
    }
    if (value.value() > std::numeric_limits<uint64_t>::max() / megabyte) {
        return invalid("Size of " + text + " MB is too large");
    }
    return value.value() * megabyte;
}

auto process_environment() -> environment_lookup {
    return [](const char* name) -> std::optional<std::string> {
        const char* value = std::getenv(name);
        if (value == nullptr || *value == '\0') {
            return std::nullopt;
        }
        return std::string(value);
    };
}

auto apply_environment(migration_config& config, const environment_lookup& lookup)
    -> result<void> {
    if (auto conn = lookup("AZURE_STORAGE_CONNECTION_STRING")) {
        auto merged = merge_connection_string(config, *conn);
        if (!merged.has_value()) {
            return merged;
        }
    }

    if (auto account = lookup("AZURE_STORAGE_ACCOUNT")) {
        if (config.blob.account_name.empty()) {
            config.blob.account_name = *account;
        }
    }
    if (config.blob_credentials.account_name.empty()) {
        config.blob_credentials.account_name = config.blob.account_name;
    }

    if (auto key = lookup("AZURE_STORAGE_KEY")) {
        if (is_unset(config.blob_credentials.account_key)) {
            config.blob_credentials.account_key = *key;
        }
    }
    if (auto sas = lookup("AZURE_STORAGE_SAS_TOKEN")) {
        if (is_unset(config.blob_credentials.sas_token)) {
            config.blob_credentials.sas_token = *sas;
        }
    }

    if (auto token = lookup("BLOB_MIGRATION_SOURCE_TOKEN")) {
        if (auto* delegated = std::get_if<delegated_credentials>(&config.credentials)) {
            if (is_unset(delegated->access_token)) {
                delegated->access_token = *token;
            }
        }
    }

    return result<void>{};
}

migration_config::builder::builder() = default;

auto migration_config::builder::with_inventory(std::filesystem::path path) -> builder& {
    config_.inventory_path = std::move(path);
    return *this;
}

auto migration_config::builder::with_columns(column_schema columns) -> builder& {
    config_.columns = std::move(columns);
    return *this;
}

auto migration_config::builder::with_delimiter(char delimiter) -> builder& {
    config_.delimiter = delimiter;
    return *this;
}

auto migration_config::builder::with_destination_root(std::filesystem::path root) -> builder& {
    config_.destination_root = std::move(root);
    return *this;
}

auto migration_config::builder::with_ledger_path(std::filesystem::path path) -> builder& {
    config_.ledger_path = std::move(path);
    return *this;
}

auto migration_config::builder::with_container(std::string container) -> builder& {
    config_.blob.container = std::move(container);
    return *this;
}

auto migration_config::builder::with_storage_account(std::string account) -> builder& {
    config_.blob.account_name = account;
    config_.blob_credentials.account_name = std::move(account);
    return *this;
}

auto migration_config::builder::with_blob_endpoint(std::string endpoint) -> builder& {
    config_.blob.endpoint = std::move(endpoint);
    return *this;
}

auto migration_config::builder::with_account_key(std::string key) -> builder& {
    config_.blob_credentials.account_key = std::move(key);
    return *this;
}

auto migration_config::builder::with_sas_token(std::string token) -> builder& {
    config_.blob_credentials.sas_token = std::move(token);
    return *this;
}

auto migration_config::builder::with_connection_string(const std::string& connection_string)
    -> builder& {
    auto merged = merge_connection_string(config_, connection_string);
    if (!merged.has_value() && !pending_error_) {
        pending_error_ = merged.error().message;
    }
    return *this;
}

auto migration_config::builder::with_access_tier(std::string tier) -> builder& {
    config_.blob.access_tier = std::move(tier);
    return *this;
}

auto migration_config::builder::with_block_upload(uint64_t single_put_threshold,
                                                  uint64_t block_size) -> builder& {
    config_.blob.blocks.single_put_threshold = single_put_threshold;
    config_.blob.blocks.block_size = block_size;
    return *this;
}

auto migration_config::builder::with_retry_policy(cloud_retry_policy policy) -> builder& {
    config_.blob.retry = policy;
    return *this;
}

auto migration_config::builder::with_certificate_credentials(certificate_credentials creds)
    -> builder& {
    config_.credentials = std::move(creds);
    return *this;
}

auto migration_config::builder::with_delegated_credentials(delegated_credentials creds)
    -> builder& {
    config_.credentials = std::move(creds);
    return *this;
}

auto migration_config::builder::with_download_failure_entries(bool enable) -> builder& {
    config_.record_download_failures = enable;
    return *this;
}

auto migration_config::builder::with_fail_on_empty(bool enable) -> builder& {
    config_.fail_on_empty = enable;
    return *this;
}

auto migration_config::builder::with_lock_grace_period(std::chrono::milliseconds grace)
    -> builder& {
    config_.lock_grace_period = grace;
    return *this;
}

auto migration_config::builder::with_log_level(log_level level) -> builder& {
    config_.level = level;
    return *this;
}

auto migration_config::builder::with_json_logs(bool enable) -> builder& {
    config_.json_logs = enable;
    return *this;
}

auto migration_config::builder::with_environment() -> builder& {
    use_environment_ = true;
    return *this;
}

auto migration_config::builder::build() -> result<migration_config> {
    if (pending_error_) {
        return invalid(*pending_error_);
    }

    if (use_environment_) {
        auto applied = apply_environment(config_);
        if (!applied.has_value()) {
            return unexpected{applied.error()};
        }
    }

    auto valid = config_.validate();
    if (!valid.has_value()) {
        return unexpected{valid.error()};
    }
    return config_;
}

}  // namespace kcenon::blob_migration
