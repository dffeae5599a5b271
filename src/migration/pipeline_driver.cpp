/**
 * @file pipeline_driver.cpp
 * @brief Migration pipeline
 */

#include "kcenon/blob_migration/migration/pipeline_driver.h"
#include "kcenon/blob_migration/core/logging.h"
#include "kcenon/blob_migration/inventory/site_grouper.h"
#include "kcenon/blob_migration/source/endpoint_session.h"

#include <exception>

namespace kcenon::blob_migration {

namespace {

auto progress(std::size_t index, std::size_t total) -> std::string {
    return "[" + std::to_string(index) + "/" + std::to_string(total) + "] ";
}

}  // namespace

pipeline_driver::pipeline_driver(source_connector& connector,
                                 blob_store& store,
                                 audit_ledger& ledger,
                                 source_credentials credentials,
                                 transfer_options options)
    : connector_(connector),
      credentials_(std::move(credentials)),
      transfer_(store, ledger, std::move(options)) {}

auto pipeline_driver::run(inventory_loader& loader, const std::filesystem::path& inventory)
    -> result<run_summary> {
    auto records = loader.load(inventory);
    if (!records.has_value()) {
        BM_LOG_ERROR(log_category::pipeline,
            "Aborting run: " + records.error().message);
        return unexpected{records.error()};
    }
    return run(records.value());
}

auto pipeline_driver::run(const std::vector<file_record>& records) -> run_summary {
    auto started = std::chrono::steady_clock::now();

    run_summary summary;
    summary.records = records.size();

    if (records.empty()) {
        BM_LOG_INFO(log_category::pipeline, "Inventory has no records; nothing to migrate");
        return summary;
    }

    auto groups = group_by_endpoint(records);
    summary.groups = groups.size();

    BM_LOG_INFO(log_category::pipeline,
        "Migrating " + std::to_string(records.size()) + " file(s) from " +
        std::to_string(groups.size()) + " endpoint(s)");

    for (std::size_t i = 0; i < groups.size(); ++i) {
        run_group(groups[i], i + 1, groups.size(), summary);
    }

    summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    BM_LOG_INFO(log_category::pipeline,
        "Run finished: " + std::to_string(summary.uploaded) + " uploaded, " +
        std::to_string(summary.upload_failures) + " upload failure(s), " +
        std::to_string(summary.download_failures) + " download failure(s), " +
        std::to_string(summary.groups_skipped) + " endpoint(s) skipped in " +
        std::to_string(summary.elapsed.count()) + " ms");
    return summary;
}

void pipeline_driver::run_group(const endpoint_group& group, std::size_t index,
                                std::size_t total, run_summary& summary) {
    BM_LOG_INFO(log_category::pipeline,
        progress(index, total) + "Endpoint " + group.address + " (" +
        std::to_string(group.records.size()) + " file(s))");

    auto session = endpoint_session::open(connector_, group.address, credentials_);
    if (!session.has_value()) {
        ++summary.groups_skipped;
        BM_LOG_WARN(log_category::session,
            "Skipping endpoint " + group.address + ": " + session.error().message);
        return;
    }
    ++summary.sessions_opened;

    auto& open_session = session.value();
    const auto count = group.records.size();
    for (std::size_t i = 0; i < count; ++i) {
        const auto& record = group.records[i];
        ++summary.transfers_attempted;

        BM_LOG_INFO(log_category::transfer, progress(i + 1, count) + record.name);

        try {
            auto report = transfer_.run(open_session, record);

            switch (report.outcome) {
                case transfer_outcome::uploaded:
                    ++summary.uploaded;
                    summary.bytes_uploaded += report.bytes;
                    break;
                case transfer_outcome::upload_failed:
                    ++summary.upload_failures;
                    break;
                case transfer_outcome::download_failed:
                    ++summary.download_failures;
                    break;
                case transfer_outcome::staging_failed:
                    ++summary.staging_failures;
                    break;
            }

            if (report.entry) {
                ++summary.ledger_entries;
            }
            if (report.ledger_error) {
                ++summary.ledger_failures;
            }
        } catch (const std::exception& e) {
            ++summary.unexpected_errors;
            BM_LOG_WARN(log_category::transfer,
                "Transfer of " + record.name + " aborted: " + e.what());
        }
    }

    open_session.close();
}

}  // namespace kcenon::blob_migration
