/**
 * @file types.h
 * @brief Core type definitions for blob_migration
 */

#ifndef KCENON_BLOB_MIGRATION_CORE_TYPES_H
#define KCENON_BLOB_MIGRATION_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::blob_migration {

/**
 * @brief Error codes for migration operations
 */
enum class error_code {
    success = 0,

    // Inventory errors (-100 to -119)
    file_not_found = -100,
    file_access_denied = -101,
    file_read_error = -102,
    schema_error = -103,
    inventory_locked = -104,
    invalid_record = -105,

    // Session errors (-120 to -139)
    connection_failed = -120,
    authentication_failed = -121,
    session_closed = -122,

    // Transfer errors (-140 to -159)
    download_failed = -140,
    upload_failed = -141,
    staging_failed = -142,
    invalid_remote_path = -143,

    // Ledger errors (-160 to -169)
    ledger_write_error = -160,

    // Configuration errors (-180 to -199)
    invalid_configuration = -180,

    // Internal errors (-200 to -219)
    internal_error = -200,
    not_initialized = -201,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_access_denied:
            return "file access denied";
        case error_code::file_read_error:
            return "file read error";
        case error_code::schema_error:
            return "schema error";
        case error_code::inventory_locked:
            return "inventory locked";
        case error_code::invalid_record:
            return "invalid record";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::authentication_failed:
            return "authentication failed";
        case error_code::session_closed:
            return "session closed";
        case error_code::download_failed:
            return "download failed";
        case error_code::upload_failed:
            return "upload failed";
        case error_code::staging_failed:
            return "staging failed";
        case error_code::invalid_remote_path:
            return "invalid remote path";
        case error_code::ledger_write_error:
            return "ledger write error";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::internal_error:
            return "internal error";
        case error_code::not_initialized:
            return "not initialized";
        default:
            return "unknown error";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * A simple Result type similar to std::expected (C++23).
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace kcenon::blob_migration

#endif  // KCENON_BLOB_MIGRATION_CORE_TYPES_H
