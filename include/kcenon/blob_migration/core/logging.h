// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

// logger_system integration requires common_system
#if defined(BUILD_WITH_LOGGER_SYSTEM) && defined(BUILD_WITH_COMMON_SYSTEM)
#define BLOB_MIGRATION_USE_LOGGER_SYSTEM 1
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::blob_migration {

/**
 * @brief Log categories for the migration pipeline
 */
struct log_category {
    static constexpr std::string_view inventory = "blob_migration.inventory";
    static constexpr std::string_view grouping = "blob_migration.grouping";
    static constexpr std::string_view session = "blob_migration.session";
    static constexpr std::string_view transfer = "blob_migration.transfer";
    static constexpr std::string_view ledger = "blob_migration.ledger";
    static constexpr std::string_view pipeline = "blob_migration.pipeline";
    static constexpr std::string_view cloud = "blob_migration.cloud";
};

/**
 * @brief Log levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

/**
 * @brief Convert log level to string
 */
inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse a log level name (case-sensitive, lower case)
 */
inline auto log_level_from_string(std::string_view name) -> std::optional<log_level> {
    if (name == "trace") return log_level::trace;
    if (name == "debug") return log_level::debug;
    if (name == "info") return log_level::info;
    if (name == "warn") return log_level::warn;
    if (name == "error") return log_level::error;
    if (name == "fatal") return log_level::fatal;
    return std::nullopt;
}

namespace detail {

[[nodiscard]] inline auto escape_json_string(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

}  // namespace detail

/**
 * @brief Structured log context for one record moving through the pipeline
 */
struct migration_log_context {
    std::string file_name;
    std::optional<std::string> endpoint;
    std::optional<std::string> remote_path;
    std::optional<std::string> local_path;
    std::optional<std::string> blob_key;
    std::optional<uint64_t> bytes;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;

    /**
     * @brief Convert context to JSON string
     */
    [[nodiscard]] auto to_json() const -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_json_string(value) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!file_name.empty()) add_field("file", file_name);
        if (endpoint) add_field("endpoint", *endpoint);
        if (remote_path) add_field("remote_path", *remote_path);
        if (local_path) add_field("local_path", *local_path);
        if (blob_key) add_field("blob_key", *blob_key);
        if (bytes) add_uint("bytes", *bytes);
        if (duration_ms) add_uint("duration_ms", *duration_ms);
        if (error_message) add_field("error_message", *error_message);

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete structured log entry
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<migration_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;

    [[nodiscard]] auto to_json() const -> std::string {
        std::ostringstream oss;
        oss << "{";
        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";
        oss << ",\"message\":\"" << detail::escape_json_string(message) << "\"";

        if (context) {
            std::string ctx_json = context->to_json();
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source\":{\"file\":\"" << detail::escape_json_string(*source_file) << "\"";
            if (source_line) {
                oss << ",\"line\":" << *source_line;
            }
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,   ///< Traditional text format
    json    ///< JSON format for structured logging
};

/**
 * @brief Migration logger
 *
 * Writes to logger_system when it is linked in, otherwise to stderr.
 * A callback can be installed to observe every accepted message, which
 * the pipeline tests use to count warnings.
 */
class migration_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const migration_log_context*)>;

    migration_logger() = default;
    ~migration_logger() = default;

    migration_logger(const migration_logger&) = delete;
    migration_logger& operator=(const migration_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times - subsequent calls are no-ops.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#ifdef BLOB_MIGRATION_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(false)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    /**
     * @brief Flush and release the backend
     */
    void shutdown() {
#ifdef BLOB_MIGRATION_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#ifdef BLOB_MIGRATION_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    /**
     * @brief Set custom log callback (pass an empty function to clear)
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    /**
     * @brief Log a message
     */
    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const migration_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0) {
        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        std::string rendered;
        if (get_output_format() == log_output_format::json) {
            structured_log_entry entry;
            entry.timestamp = get_timestamp();
            entry.level = level;
            entry.category = std::string(category);
            entry.message = std::string(message);
            if (context) entry.context = *context;
            if (file) entry.source_file = file;
            if (line > 0) entry.source_line = line;
            rendered = entry.to_json();
        } else {
            std::ostringstream oss;
            oss << "[" << category << "] " << message;
            if (context) {
                oss << " " << context->to_json();
            }
            rendered = oss.str();
        }

#ifdef BLOB_MIGRATION_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0) {
                logger_->log(to_logger_level(level), rendered, file, line, "");
            } else {
                logger_->log(to_logger_level(level), rendered);
            }
            return;
        }
#endif
        if (get_output_format() == log_output_format::json) {
            output_to_stderr(rendered);
        } else {
            output_to_stderr(get_timestamp() + " [" +
                             std::string(log_level_to_string(level)) + "] " + rendered);
        }
    }

    void flush() {
#ifdef BLOB_MIGRATION_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
        std::cerr.flush();
    }

private:
    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

#ifdef BLOB_MIGRATION_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        localtime_s(&tm_buf, &time_t_val);
#else
        localtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    log_callback callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline migration_logger& get_logger() {
    static migration_logger instance;
    return instance;
}

// Logging macros for convenience
#define BM_LOG(level, category, message) \
    kcenon::blob_migration::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__)

#define BM_LOG_CTX(level, category, message, context) \
    kcenon::blob_migration::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__)

#define BM_LOG_TRACE(category, message) \
    BM_LOG(kcenon::blob_migration::log_level::trace, category, message)

#define BM_LOG_DEBUG(category, message) \
    BM_LOG(kcenon::blob_migration::log_level::debug, category, message)

#define BM_LOG_INFO(category, message) \
    BM_LOG(kcenon::blob_migration::log_level::info, category, message)

#define BM_LOG_WARN(category, message) \
    BM_LOG(kcenon::blob_migration::log_level::warn, category, message)

#define BM_LOG_ERROR(category, message) \
    BM_LOG(kcenon::blob_migration::log_level::error, category, message)

#define BM_LOG_FATAL(category, message) \
    BM_LOG(kcenon::blob_migration::log_level::fatal, category, message)

#define BM_LOG_DEBUG_CTX(category, message, ctx) \
    BM_LOG_CTX(kcenon::blob_migration::log_level::debug, category, message, ctx)

#define BM_LOG_INFO_CTX(category, message, ctx) \
    BM_LOG_CTX(kcenon::blob_migration::log_level::info, category, message, ctx)

#define BM_LOG_WARN_CTX(category, message, ctx) \
    BM_LOG_CTX(kcenon::blob_migration::log_level::warn, category, message, ctx)

#define BM_LOG_ERROR_CTX(category, message, ctx) \
    BM_LOG_CTX(kcenon::blob_migration::log_level::error, category, message, ctx)

} // namespace kcenon::blob_migration
