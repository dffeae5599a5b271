/**
 * @file test_config.cpp
 * @brief Unit tests for migration_config, its builder and the environment overlay
 */

#include <gtest/gtest.h>

#include <kcenon/blob_migration/core/config.h>

#include <map>
#include <string>

namespace kcenon::blob_migration::test {
namespace {

auto fake_environment(std::map<std::string, std::string> values) -> environment_lookup {
    return [values = std::move(values)](const char* name) -> std::optional<std::string> {
        auto it = values.find(name);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

class MigrationConfigTest : public ::testing::Test {
protected:
    static auto complete_builder() -> migration_config::builder {
        migration_config::builder builder;
        builder.with_inventory("inventory.csv")
               .with_destination_root("/stage")
               .with_container("archives")
               .with_storage_account("archiveaccount")
               .with_account_key("a2V5")
               .with_delegated_credentials(delegated_credentials{"archivist", std::nullopt});
        return builder;
    }
};

TEST_F(MigrationConfigTest, Defaults) {
    migration_config config;
    EXPECT_EQ(config.delimiter, ',');
    EXPECT_EQ(config.columns.site_address, "Site Address");
    EXPECT_FALSE(config.record_download_failures);
    EXPECT_FALSE(config.fail_on_empty);
    EXPECT_EQ(config.blob.retry.max_attempts, 1u);
    EXPECT_EQ(config.level, log_level::info);
}

TEST_F(MigrationConfigTest, BuildsCompleteConfig) {
    auto config = complete_builder().build();
    ASSERT_TRUE(config.has_value()) << config.error().message;
    EXPECT_EQ(config.value().blob.account_name, "archiveaccount");
    EXPECT_EQ(config.value().blob_credentials.account_name, "archiveaccount");
    EXPECT_EQ(config.value().effective_ledger_path(),
              std::filesystem::path("/stage/upload_log.csv"));
}

TEST_F(MigrationConfigTest, ExplicitLedgerPathWins) {
    auto config = complete_builder().with_ledger_path("/audit/ledger.csv").build();
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config.value().effective_ledger_path(), std::filesystem::path("/audit/ledger.csv"));
}

TEST_F(MigrationConfigTest, MissingInventoryIsRejected) {
    auto config = complete_builder().with_inventory("").build();
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, error_code::invalid_configuration);
}

TEST_F(MigrationConfigTest, MissingBlobCredentialIsRejected) {
    migration_config::builder builder;
    builder.with_inventory("inventory.csv")
           .with_destination_root("/stage")
           .with_container("archives")
           .with_storage_account("archiveaccount")
           .with_delegated_credentials(delegated_credentials{"archivist", std::nullopt});

    auto config = builder.build();
    ASSERT_FALSE(config.has_value());
    EXPECT_NE(config.error().message.find("SAS"), std::string::npos);
}

TEST_F(MigrationConfigTest, IncompleteCertificateIsRejected) {
    auto config = complete_builder()
        .with_certificate_credentials(certificate_credentials{"tenant", "", "/cert.pfx", std::nullopt})
        .build();
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, error_code::invalid_configuration);
}

TEST_F(MigrationConfigTest, QuoteDelimiterIsRejected) {
    auto config = complete_builder().with_delimiter('"').build();
    ASSERT_FALSE(config.has_value());
}

TEST_F(MigrationConfigTest, ConnectionStringFillsAccount) {
    migration_config::builder builder;
    builder.with_inventory("inventory.csv")
           .with_destination_root("/stage")
           .with_container("archives")
           .with_connection_string(
               "DefaultEndpointsProtocol=http;AccountName=devstoreaccount1;"
               "AccountKey=a2V5PT0=;BlobEndpoint=http://127.0.0.1:10000/devstoreaccount1")
           .with_delegated_credentials(delegated_credentials{"archivist", std::nullopt});

    auto config = builder.build();
    ASSERT_TRUE(config.has_value()) << config.error().message;
    EXPECT_EQ(config.value().blob.account_name, "devstoreaccount1");
    EXPECT_EQ(config.value().blob_credentials.account_key.value(), "a2V5PT0=");
    EXPECT_EQ(config.value().blob.endpoint.value(), "http://127.0.0.1:10000/devstoreaccount1");
    EXPECT_FALSE(config.value().blob.use_ssl);
}

TEST_F(MigrationConfigTest, BadConnectionStringIsReported) {
    auto config = complete_builder().with_connection_string("nonsense").build();
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, error_code::invalid_configuration);
}

class OptionValueTest : public ::testing::Test {};

TEST_F(OptionValueTest, ParsesMegabytes) {
    auto bytes = parse_megabytes("8");
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(bytes.value(), 8ULL * 1024 * 1024);
}

TEST_F(OptionValueTest, RejectsNegativeAndMalformedValues) {
    EXPECT_FALSE(parse_megabytes("-1").has_value());
    EXPECT_FALSE(parse_megabytes("").has_value());
    EXPECT_FALSE(parse_megabytes("8MB").has_value());
    EXPECT_FALSE(parse_unsigned("-3").has_value());
    EXPECT_EQ(parse_unsigned("-3").error().code, error_code::invalid_configuration);
}

TEST_F(OptionValueTest, RejectsOverflow) {
    // Fits in 64 bits as megabytes, but not once converted to bytes
    EXPECT_FALSE(parse_megabytes("17592186044416").has_value());
    EXPECT_TRUE(parse_megabytes("17592186044415").has_value());
    EXPECT_FALSE(parse_unsigned("18446744073709551616").has_value());
}

class EnvironmentOverlayTest : public ::testing::Test {};

TEST_F(EnvironmentOverlayTest, FillsUnsetStorageSettings) {
    migration_config config;
    auto applied = apply_environment(config, fake_environment({
        {"AZURE_STORAGE_ACCOUNT", "envaccount"},
        {"AZURE_STORAGE_SAS_TOKEN", "sv=2023&sig=abc"},
    }));
    ASSERT_TRUE(applied.has_value());
    EXPECT_EQ(config.blob.account_name, "envaccount");
    EXPECT_EQ(config.blob_credentials.account_name, "envaccount");
    EXPECT_EQ(config.blob_credentials.sas_token.value(), "sv=2023&sig=abc");
}

TEST_F(EnvironmentOverlayTest, ExplicitSettingsWin) {
    migration_config config;
    config.blob.account_name = "cliaccount";
    config.blob_credentials.account_key = "clikey";

    auto applied = apply_environment(config, fake_environment({
        {"AZURE_STORAGE_ACCOUNT", "envaccount"},
        {"AZURE_STORAGE_KEY", "envkey"},
    }));
    ASSERT_TRUE(applied.has_value());
    EXPECT_EQ(config.blob.account_name, "cliaccount");
    EXPECT_EQ(config.blob_credentials.account_key.value(), "clikey");
}

TEST_F(EnvironmentOverlayTest, SourceTokenGoesToDelegatedCredentials) {
    migration_config config;
    config.credentials = delegated_credentials{"archivist", std::nullopt};

    auto applied = apply_environment(config, fake_environment({
        {"BLOB_MIGRATION_SOURCE_TOKEN", "bearer-token"},
    }));
    ASSERT_TRUE(applied.has_value());
    const auto& delegated = std::get<delegated_credentials>(config.credentials);
    EXPECT_EQ(delegated.access_token.value(), "bearer-token");
}

TEST_F(EnvironmentOverlayTest, UnparsableConnectionStringFails) {
    migration_config config;
    auto applied = apply_environment(config, fake_environment({
        {"AZURE_STORAGE_CONNECTION_STRING", "AccountName=only"},
    }));
    ASSERT_FALSE(applied.has_value());
    EXPECT_EQ(applied.error().code, error_code::invalid_configuration);
}

}  // namespace
}  // namespace kcenon::blob_migration::test
