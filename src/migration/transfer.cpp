/**
 * @file transfer.cpp
 * @brief Single-record transfer
 */

#include "kcenon/blob_migration/migration/transfer.h"
#include "kcenon/blob_migration/cloud/cloud_utils.h"
#include "kcenon/blob_migration/core/logging.h"
#include "kcenon/blob_migration/inventory/site_grouper.h"
#include "kcenon/blob_migration/migration/staged_file.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <iterator>

namespace kcenon::blob_migration {

namespace {

auto uri_path(const std::string& uri) -> std::string {
    std::string path = uri;
    auto scheme = uri.find("://");
    if (scheme != std::string::npos) {
        auto slash = uri.find('/', scheme + 3);
        path = slash == std::string::npos ? std::string("/") : uri.substr(slash);
    }
    return path.substr(0, path.find_first_of("?#"));
}

auto starts_with_ci(const std::string& value, const std::string& prefix) -> bool {
    if (prefix.size() > value.size()) {
        return false;
    }
    return std::equal(prefix.begin(), prefix.end(), value.begin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) ==
               std::tolower(static_cast<unsigned char>(b));
    });
}

auto trimmed(const std::string& value) -> std::string {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

}  // namespace

auto resolve_local_path(const file_record& record,
                        const std::string& endpoint_address,
                        const std::filesystem::path& destination_root)
    -> result<staging_location> {
    auto remote = cloud_utils::url_decode(uri_path(trimmed(record.location)));
    if (remote.empty() || remote.front() != '/') {
        remote.insert(remote.begin(), '/');
    }

    auto site_path = cloud_utils::url_decode(
        uri_path(normalize_endpoint_address(endpoint_address)));
    while (!site_path.empty() && site_path.back() == '/') {
        site_path.pop_back();
    }

    std::string relative = remote;
    if (!site_path.empty() && starts_with_ci(remote, site_path) &&
        (remote.size() == site_path.size() || remote[site_path.size()] == '/')) {
        relative = remote.substr(site_path.size());
    }

    auto first = relative.find_first_not_of('/');
    relative = first == std::string::npos ? std::string{} : relative.substr(first);

    if (relative.empty() || relative.back() == '/') {
        return unexpected{error{error_code::invalid_remote_path,
            "Location has no file name: " + record.location}};
    }

    auto normalized = std::filesystem::path(relative).lexically_normal();
    if (normalized.is_absolute() || normalized.empty() ||
        *normalized.begin() == std::filesystem::path("..")) {
        return unexpected{error{error_code::invalid_remote_path,
            "Location escapes the destination root: " + record.location}};
    }

    staging_location location;
    location.remote_path = remote;
    location.local_path = destination_root / normalized;
    return location;
}

auto derive_blob_key(const std::filesystem::path& local_path,
                     const std::filesystem::path& destination_root) -> std::string {
    auto relative = local_path.lexically_normal().lexically_relative(
        destination_root.lexically_normal());
    if (relative.empty()) {
        return local_path.filename().generic_string();
    }
    return relative.generic_string();
}

auto format_size(uint64_t bytes) -> std::string {
    static constexpr const char* units[] = {"KB", "MB", "GB", "TB"};

    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }

    double value = static_cast<double>(bytes) / 1024.0;
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(units)) {
        value /= 1024.0;
        ++unit;
    }

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.2f %s", value, units[unit]);
    return buffer;
}

auto declared_size_bytes(const file_record& record) -> std::optional<uint64_t> {
    if (!record.declared_size_mb) {
        return std::nullopt;
    }

    // 2^64 is exactly representable; anything at or above it does not fit.
    constexpr double limit = 18446744073709551616.0;
    const double bytes = *record.declared_size_mb * 1024.0 * 1024.0;
    if (!std::isfinite(bytes) || bytes < 0.0 || bytes >= limit) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(bytes);
}

record_transfer::record_transfer(blob_store& store, audit_ledger& ledger,
                                 transfer_options options)
    : store_(store), ledger_(ledger), options_(std::move(options)) {}

void record_transfer::write_ledger(transfer_report& report, ledger_entry entry) {
    auto written = ledger_.append(entry);
    if (!written.has_value()) {
        BM_LOG_ERROR(log_category::ledger,
            "Ledger entry for " + entry.file_name + " was not written: " +
            written.error().message);
        report.ledger_error = written.error();
        return;
    }
    report.entry = std::move(entry);
}

auto record_transfer::run(endpoint_session& session, const file_record& record)
    -> transfer_report {
    transfer_report report;

    migration_log_context ctx;
    ctx.file_name = record.name;
    ctx.endpoint = session.address();
    ctx.remote_path = record.location;

    auto location = resolve_local_path(record, session.address(), options_.destination_root);
    if (!location.has_value()) {
        report.outcome = transfer_outcome::staging_failed;
        report.message = location.error().message;
        ctx.error_message = report.message;
        BM_LOG_WARN_CTX(log_category::transfer, "Cannot stage " + record.name, ctx);
        return report;
    }

    const auto& local_path = location.value().local_path;
    report.blob_key = derive_blob_key(local_path, options_.destination_root);
    ctx.local_path = local_path.string();
    ctx.blob_key = report.blob_key;

    std::error_code ec;
    std::filesystem::create_directories(local_path.parent_path(), ec);
    if (ec) {
        report.outcome = transfer_outcome::staging_failed;
        report.message = "Cannot create " + local_path.parent_path().string() + ": " +
                         ec.message();
        ctx.error_message = report.message;
        BM_LOG_WARN_CTX(log_category::transfer, "Cannot stage " + record.name, ctx);
        return report;
    }

    staged_file staged(local_path);

    auto fetched = session.fetch(location.value().remote_path, local_path.parent_path(),
                                 local_path.filename().string());
    if (fetched.has_value() && !std::filesystem::is_regular_file(local_path, ec)) {
        fetched = unexpected{error{error_code::download_failed,
            "Download produced no file at " + local_path.string()}};
    }

    if (!fetched.has_value()) {
        report.outcome = transfer_outcome::download_failed;
        report.message = fetched.error().message;
        ctx.error_message = report.message;
        BM_LOG_WARN_CTX(log_category::transfer, "Failed to download " + record.name, ctx);

        if (options_.record_download_failures) {
            ledger_entry entry;
            entry.file_name = record.name;
            entry.file_path = report.blob_key;
            auto declared_bytes = declared_size_bytes(record);
            entry.size = declared_bytes ? format_size(*declared_bytes) : record.declared_size;
            entry.upload_time = format_ledger_time(std::chrono::system_clock::now());
            entry.status = ledger_status::download_failed;
            write_ledger(report, std::move(entry));
        }
        return report;
    }

    report.bytes = static_cast<uint64_t>(std::filesystem::file_size(local_path, ec));
    if (ec) {
        report.bytes = 0;
    }
    ctx.bytes = report.bytes;

    result<blob_put_result> uploaded = unexpected{error{error_code::upload_failed}};
    try {
        uploaded = store_.put_blob(options_.container, report.blob_key, local_path);
    } catch (const std::exception& e) {
        uploaded = unexpected{error{error_code::upload_failed,
            std::string("Blob store threw: ") + e.what()}};
    }

    ledger_entry entry;
    entry.file_name = record.name;
    entry.file_path = report.blob_key;
    entry.size = format_size(report.bytes);
    entry.upload_time = format_ledger_time(std::chrono::system_clock::now());

    if (uploaded.has_value()) {
        report.outcome = transfer_outcome::uploaded;
        entry.status = ledger_status::uploaded;
        ctx.duration_ms = static_cast<uint64_t>(uploaded.value().duration.count());
        BM_LOG_INFO_CTX(log_category::transfer, "Uploaded " + record.name, ctx);
    } else {
        report.outcome = transfer_outcome::upload_failed;
        report.message = uploaded.error().message;
        entry.status = ledger_status::failed;
        ctx.error_message = report.message;
        BM_LOG_WARN_CTX(log_category::transfer, "Failed to upload " + record.name, ctx);
    }

    write_ledger(report, std::move(entry));

    if (!staged.remove()) {
        BM_LOG_WARN(log_category::transfer,
            "Staged copy of " + record.name + " left at " + local_path.string());
    }
    return report;
}

}  // namespace kcenon::blob_migration
