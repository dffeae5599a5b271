/**
 * @file migrate_main.cpp
 * @brief Command-line entry point for the archive migration
 *
 * Exit codes:
 * - 0: run completed (individual transfer failures are warnings)
 * - 1: invalid usage or configuration
 * - 2: inventory missing, locked or failing schema validation
 * - 3: inventory without records and --fail-on-empty given
 */

#include <kcenon/blob_migration/blob_migration.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

using namespace kcenon::blob_migration;

namespace {

constexpr int exit_ok = 0;
constexpr int exit_usage = 1;
constexpr int exit_inventory = 2;
constexpr int exit_empty = 3;

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Migrates the files listed in an inventory from their source sites" << std::endl;
    std::cout << "into Azure Blob Storage and records every attempt in a CSV ledger." << std::endl;
    std::cout << std::endl;
    std::cout << "Inventory:" << std::endl;
    std::cout << "  --inventory <path>          Inventory file (required)" << std::endl;
    std::cout << "  --delimiter <char|tab>      Field separator (default: ,)" << std::endl;
    std::cout << "  --name-column <name>        Default: Name" << std::endl;
    std::cout << "  --location-column <name>    Default: Location" << std::endl;
    std::cout << "  --size-column <name>        Default: Size (MB)" << std::endl;
    std::cout << "  --site-column <name>        Default: Site Address" << std::endl;
    std::cout << "  --fail-on-empty             Exit 3 when the inventory has no records" << std::endl;
    std::cout << std::endl;
    std::cout << "Staging and ledger:" << std::endl;
    std::cout << "  --destination <dir>         Local staging root (required)" << std::endl;
    std::cout << "  --ledger <path>             Default: <destination>/upload_log.csv" << std::endl;
    std::cout << "  --record-download-failures  Write DownloadFailed ledger rows" << std::endl;
    std::cout << std::endl;
    std::cout << "Source authentication (one of):" << std::endl;
    std::cout << "  --user <name>               Delegated sign-in; token from" << std::endl;
    std::cout << "                              BLOB_MIGRATION_SOURCE_TOKEN" << std::endl;
    std::cout << "  --tenant <id> --client-id <id> --certificate <path>" << std::endl;
    std::cout << "      [--certificate-password <pw>]  App-only sign-in" << std::endl;
    std::cout << std::endl;
    std::cout << "Destination:" << std::endl;
    std::cout << "  --container <name>          Blob container (required)" << std::endl;
    std::cout << "  --account <name>            Storage account (or AZURE_STORAGE_ACCOUNT)" << std::endl;
    std::cout << "  --account-key <key>         Or AZURE_STORAGE_KEY" << std::endl;
    std::cout << "  --sas-token <token>         Or AZURE_STORAGE_SAS_TOKEN" << std::endl;
    std::cout << "  --connection-string <str>   Or AZURE_STORAGE_CONNECTION_STRING" << std::endl;
    std::cout << "  --blob-endpoint <url>       Custom endpoint (e.g. Azurite)" << std::endl;
    std::cout << "  --access-tier <tier>        Hot, Cool, Cold or Archive" << std::endl;
    std::cout << "  --block-size <MB>           Block size for large files (default: 8)" << std::endl;
    std::cout << "  --single-put-limit <MB>     Largest single-request upload (default: 32)" << std::endl;
    std::cout << "  --retries <n>               Attempts per blob request (default: 1)" << std::endl;
    std::cout << std::endl;
    std::cout << "Logging:" << std::endl;
    std::cout << "  --log-level <level>         trace, debug, info, warn, error (default: info)" << std::endl;
    std::cout << "  --json-logs                 Emit structured JSON log lines" << std::endl;
    std::cout << "  --help                      Show this help message" << std::endl;
}

auto require(const result<uint64_t>& parsed, const std::string& option) -> uint64_t {
    if (!parsed.has_value()) {
        throw std::invalid_argument(option + ": " + parsed.error().message);
    }
    return parsed.value();
}

}  // namespace

int main(int argc, char* argv[]) {
    migration_config::builder config_builder;
    column_schema columns;

    std::optional<std::string> user;
    certificate_credentials cert;
    bool use_certificate = false;
    uint64_t block_size = block_upload_config{}.block_size;
    uint64_t single_put_limit = block_upload_config{}.single_put_threshold;
    cloud_retry_policy retry;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help") {
                print_usage(argv[0]);
                return exit_ok;
            }

            auto flag = [&](const char* name) { return arg == name; };
            auto value = [&]() -> std::string {
                if (++i >= argc) {
                    throw std::invalid_argument(arg + " requires an argument");
                }
                return argv[i];
            };

            if (flag("--inventory")) {
                config_builder.with_inventory(value());
            } else if (flag("--delimiter")) {
                auto d = value();
                if (d == "tab" || d == "\\t") {
                    config_builder.with_delimiter('\t');
                } else if (d.size() == 1) {
                    config_builder.with_delimiter(d[0]);
                } else {
                    throw std::invalid_argument("--delimiter takes a single character or 'tab'");
                }
            } else if (flag("--name-column")) {
                columns.name = value();
            } else if (flag("--location-column")) {
                columns.location = value();
            } else if (flag("--size-column")) {
                columns.size = value();
            } else if (flag("--site-column")) {
                columns.site_address = value();
            } else if (flag("--fail-on-empty")) {
                config_builder.with_fail_on_empty(true);
            } else if (flag("--destination")) {
                config_builder.with_destination_root(value());
            } else if (flag("--ledger")) {
                config_builder.with_ledger_path(value());
            } else if (flag("--record-download-failures")) {
                config_builder.with_download_failure_entries(true);
            } else if (flag("--user")) {
                user = value();
            } else if (flag("--tenant")) {
                cert.tenant_id = value();
                use_certificate = true;
            } else if (flag("--client-id")) {
                cert.client_id = value();
                use_certificate = true;
            } else if (flag("--certificate")) {
                cert.certificate_path = value();
                use_certificate = true;
            } else if (flag("--certificate-password")) {
                cert.certificate_password = value();
            } else if (flag("--container")) {
                config_builder.with_container(value());
            } else if (flag("--account")) {
                config_builder.with_storage_account(value());
            } else if (flag("--account-key")) {
                config_builder.with_account_key(value());
            } else if (flag("--sas-token")) {
                config_builder.with_sas_token(value());
            } else if (flag("--connection-string")) {
                config_builder.with_connection_string(value());
            } else if (flag("--blob-endpoint")) {
                config_builder.with_blob_endpoint(value());
            } else if (flag("--access-tier")) {
                config_builder.with_access_tier(value());
            } else if (flag("--block-size")) {
                block_size = require(parse_megabytes(value()), arg);
            } else if (flag("--single-put-limit")) {
                single_put_limit = require(parse_megabytes(value()), arg);
            } else if (flag("--retries")) {
                retry.max_attempts = static_cast<std::size_t>(require(parse_unsigned(value()), arg));
            } else if (flag("--log-level")) {
                auto name = value();
                auto level = log_level_from_string(name);
                if (!level) {
                    throw std::invalid_argument("Unknown log level: " + name);
                }
                config_builder.with_log_level(*level);
            } else if (flag("--json-logs")) {
                config_builder.with_json_logs(true);
            } else {
                throw std::invalid_argument("Unknown option: " + arg);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << "Use --help for usage information" << std::endl;
        return exit_usage;
    }

    if (use_certificate && user) {
        std::cerr << "Error: choose either --user or certificate sign-in, not both" << std::endl;
        return exit_usage;
    }
    if (use_certificate) {
        config_builder.with_certificate_credentials(cert);
    } else {
        config_builder.with_delegated_credentials(delegated_credentials{user.value_or(""), std::nullopt});
    }

    config_builder.with_columns(columns)
           .with_block_upload(single_put_limit, block_size)
           .with_retry_policy(retry)
           .with_environment();

    auto built = config_builder.build();
    if (!built.has_value()) {
        std::cerr << "Error: " << built.error().message << std::endl;
        std::cerr << "Use --help for usage information" << std::endl;
        return exit_usage;
    }
    const auto& config = built.value();

    auto& logger = get_logger();
    logger.initialize();
    logger.set_level(config.level);
    logger.set_output_format(config.json_logs ? log_output_format::json : log_output_format::text);

    auto http = make_cloud_http_client(config.blob.request_timeout);
    if (!http->is_available()) {
        BM_LOG_WARN(log_category::pipeline,
            "Built without network_system; every remote request will fail");
    }

    auto store = azure_blob_storage::create(config.blob, config.blob_credentials, http);
    if (!store) {
        std::cerr << "Error: invalid blob storage configuration" << std::endl;
        return exit_usage;
    }

    sharepoint_connector connector(http, make_environment_token_provider());
    audit_ledger ledger(config.effective_ledger_path());

    inventory_loader loader(std::make_shared<delimited_sheet_reader>(config.delimiter),
                            std::make_shared<posix_lock_breaker>(config.lock_grace_period),
                            config.columns);

    transfer_options options;
    options.destination_root = config.destination_root;
    options.container = config.blob.container;
    options.record_download_failures = config.record_download_failures;

    pipeline_driver driver(connector, *store, ledger, config.credentials, options);

    auto summary = driver.run(loader, config.inventory_path);
    if (!summary.has_value()) {
        std::cerr << "Error: " << summary.error().message << std::endl;
        logger.shutdown();
        return exit_inventory;
    }

    const auto& totals = summary.value();
    std::cout << "Uploaded " << totals.uploaded << " of " << totals.transfers_attempted
              << " file(s) (" << format_size(totals.bytes_uploaded) << "), "
              << totals.upload_failures << " upload failure(s), "
              << totals.download_failures << " download failure(s), "
              << totals.groups_skipped << " endpoint(s) skipped" << std::endl;
    std::cout << "Ledger: " << ledger.path().string() << std::endl;

    logger.shutdown();

    if (totals.records == 0 && config.fail_on_empty) {
        std::cerr << "Error: inventory contains no records" << std::endl;
        return exit_empty;
    }
    return exit_ok;
}
