/**
 * @file test_transfer.cpp
 * @brief Unit tests for single-record transfers
 */

#include "../test_fakes.h"

#include <limits>
#include <stdexcept>

namespace kcenon::blob_migration::test {
namespace {

constexpr const char* site = "https://contoso.sharepoint.com/sites/Fin";

// ============================================================================
// Path helpers
// ============================================================================

class TransferPathTest : public ::testing::Test {};

TEST_F(TransferPathTest, ResolvesBelowDestinationRoot) {
    auto record = make_record("q1 2019.zip",
        "https://contoso.sharepoint.com/sites/Fin/Shared%20Documents/2019/q1%202019.zip", site);

    auto location = resolve_local_path(record, site, "/stage");
    ASSERT_TRUE(location.has_value()) << location.error().message;
    EXPECT_EQ(location.value().remote_path, "/sites/Fin/Shared Documents/2019/q1 2019.zip");
    EXPECT_EQ(location.value().local_path,
              std::filesystem::path("/stage/Shared Documents/2019/q1 2019.zip"));
}

TEST_F(TransferPathTest, SitePrefixIsMatchedCaseInsensitively) {
    auto record = make_record("a.zip", "https://contoso.sharepoint.com/SITES/fin/Docs/a.zip", site);

    auto location = resolve_local_path(record, site, "/stage");
    ASSERT_TRUE(location.has_value());
    EXPECT_EQ(location.value().local_path, std::filesystem::path("/stage/Docs/a.zip"));
}

TEST_F(TransferPathTest, ForeignPathKeepsFullPath) {
    auto record = make_record("a.zip", "https://contoso.sharepoint.com/sites/Other/a.zip", site);

    auto location = resolve_local_path(record, site, "/stage");
    ASSERT_TRUE(location.has_value());
    EXPECT_EQ(location.value().local_path, std::filesystem::path("/stage/sites/Other/a.zip"));
}

TEST_F(TransferPathTest, QueryStringIsIgnored) {
    auto record = make_record("a.zip",
        "https://contoso.sharepoint.com/sites/Fin/Docs/a.zip?web=1", site);

    auto location = resolve_local_path(record, site, "/stage");
    ASSERT_TRUE(location.has_value());
    EXPECT_EQ(location.value().local_path, std::filesystem::path("/stage/Docs/a.zip"));
}

TEST_F(TransferPathTest, RejectsLocationWithoutFile) {
    auto record = make_record("x", "https://contoso.sharepoint.com/sites/Fin/", site);
    auto location = resolve_local_path(record, site, "/stage");
    ASSERT_FALSE(location.has_value());
    EXPECT_EQ(location.error().code, error_code::invalid_remote_path);
}

TEST_F(TransferPathTest, RejectsTraversal) {
    auto record = make_record("x", "https://contoso.sharepoint.com/sites/Fin/%2E%2E/%2E%2E/etc/passwd",
                              site);
    auto location = resolve_local_path(record, site, "/stage");
    ASSERT_FALSE(location.has_value());
    EXPECT_EQ(location.error().code, error_code::invalid_remote_path);
}

TEST_F(TransferPathTest, BlobKeyIsRelativeWithForwardSlashes) {
    EXPECT_EQ(derive_blob_key("/stage/Docs/2019/a.zip", "/stage"), "Docs/2019/a.zip");
    EXPECT_EQ(derive_blob_key("/stage/a.zip", "/stage/"), "a.zip");
}

TEST_F(TransferPathTest, FormatsSizes) {
    EXPECT_EQ(format_size(0), "0 B");
    EXPECT_EQ(format_size(512), "512 B");
    EXPECT_EQ(format_size(1536), "1.50 KB");
    EXPECT_EQ(format_size(5ULL * 1024 * 1024), "5.00 MB");
    EXPECT_EQ(format_size(3ULL * 1024 * 1024 * 1024 / 2), "1.50 GB");
}

TEST_F(TransferPathTest, DeclaredSizeInBytes) {
    auto record = make_record("a.zip", std::string(site) + "/Docs/a.zip", site);
    record.declared_size_mb = 1.5;
    EXPECT_EQ(declared_size_bytes(record), std::optional<uint64_t>(1572864));

    record.declared_size_mb = 1e30;
    EXPECT_FALSE(declared_size_bytes(record).has_value());

    record.declared_size_mb = std::numeric_limits<double>::quiet_NaN();
    EXPECT_FALSE(declared_size_bytes(record).has_value());

    record.declared_size_mb = std::nullopt;
    EXPECT_FALSE(declared_size_bytes(record).has_value());
}

// ============================================================================
// record_transfer
// ============================================================================

class RecordTransferTest : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();
        stage_ = test_dir_ / "stage";
        ledger_ = std::make_unique<audit_ledger>(test_dir_ / "upload_log.csv");

        transfer_options options;
        options.destination_root = stage_;
        options.container = "archives";
        transfer_ = std::make_unique<record_transfer>(store_, *ledger_, options);

        auto opened = endpoint_session::open(connector_, site, creds_);
        ASSERT_TRUE(opened.has_value());
        session_ = std::make_unique<endpoint_session>(std::move(opened.value()));
    }

    void TearDown() override {
        session_.reset();
        TempDirectoryFixture::TearDown();
    }

    auto ledger_rows() -> std::vector<std::string> {
        auto lines = read_lines(ledger_->path());
        if (!lines.empty()) {
            lines.erase(lines.begin());
        }
        return lines;
    }

    fake_source_connector connector_;
    fake_blob_store store_;
    source_credentials creds_ = delegated_credentials{"archivist", std::string("token")};
    std::filesystem::path stage_;
    std::unique_ptr<audit_ledger> ledger_;
    std::unique_ptr<record_transfer> transfer_;
    std::unique_ptr<endpoint_session> session_;
};

TEST_F(RecordTransferTest, UploadsRecordsAndCleansUp) {
    auto record = make_record("a.zip", std::string(site) + "/Docs/a.zip", site);

    auto report = transfer_->run(*session_, record);
    EXPECT_EQ(report.outcome, transfer_outcome::uploaded);
    EXPECT_EQ(report.blob_key, "Docs/a.zip");

    ASSERT_EQ(store_.uploads.size(), 1u);
    EXPECT_EQ(store_.uploads[0].container, "archives");
    EXPECT_EQ(store_.uploads[0].key, "Docs/a.zip");
    EXPECT_EQ(store_.uploads[0].content,
              fake_source_connector::content_for("/sites/Fin/Docs/a.zip"));

    ASSERT_TRUE(report.entry.has_value());
    EXPECT_EQ(report.entry->status, ledger_status::uploaded);
    EXPECT_EQ(report.entry->file_path, "Docs/a.zip");
    EXPECT_EQ(report.bytes, store_.uploads[0].content.size());

    auto rows = ledger_rows();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].rfind("a.zip,Docs/a.zip,", 0), 0u);
    EXPECT_NE(rows[0].find(",Uploaded"), std::string::npos);

    EXPECT_EQ(count_regular_files(stage_), 0u);
}

TEST_F(RecordTransferTest, UploadFailureIsRecordedAsFailed) {
    store_.failing_keys.insert("Docs/a.zip");
    auto record = make_record("a.zip", std::string(site) + "/Docs/a.zip", site);

    auto report = transfer_->run(*session_, record);
    EXPECT_EQ(report.outcome, transfer_outcome::upload_failed);
    EXPECT_FALSE(report.message.empty());

    auto rows = ledger_rows();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_NE(rows[0].find(",Failed"), std::string::npos);
    EXPECT_EQ(count_regular_files(stage_), 0u);
}

TEST_F(RecordTransferTest, DownloadFailureWritesNoEntry) {
    connector_.failing_paths.insert("/sites/Fin/Docs/a.zip");
    auto record = make_record("a.zip", std::string(site) + "/Docs/a.zip", site);
    log_capture logs;

    auto report = transfer_->run(*session_, record);
    EXPECT_EQ(report.outcome, transfer_outcome::download_failed);
    EXPECT_FALSE(report.entry.has_value());
    EXPECT_TRUE(store_.uploads.empty());
    EXPECT_FALSE(std::filesystem::exists(ledger_->path()));
    EXPECT_TRUE(logs.contains("Failed to download a.zip"));

    // The connector left a partial file behind; it must be gone.
    EXPECT_EQ(count_regular_files(stage_), 0u);
}

TEST_F(RecordTransferTest, DownloadFailureIsRecordedWhenEnabled) {
    transfer_options options;
    options.destination_root = stage_;
    options.container = "archives";
    options.record_download_failures = true;
    record_transfer recording(store_, *ledger_, options);

    connector_.failing_paths.insert("/sites/Fin/Docs/a.zip");
    auto record = make_record("a.zip", std::string(site) + "/Docs/a.zip", site);

    auto report = recording.run(*session_, record);
    EXPECT_EQ(report.outcome, transfer_outcome::download_failed);
    ASSERT_TRUE(report.entry.has_value());
    EXPECT_EQ(report.entry->status, ledger_status::download_failed);
    EXPECT_EQ(report.entry->size, "1.00 MB");

    auto rows = ledger_rows();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_NE(rows[0].find(",DownloadFailed"), std::string::npos);
}

TEST_F(RecordTransferTest, OversizedDeclaredSizeFallsBackToCellText) {
    transfer_options options;
    options.destination_root = stage_;
    options.container = "archives";
    options.record_download_failures = true;
    record_transfer recording(store_, *ledger_, options);

    connector_.failing_paths.insert("/sites/Fin/Docs/a.zip");
    auto record = make_record("a.zip", std::string(site) + "/Docs/a.zip", site);
    record.declared_size = "1e30";
    record.declared_size_mb = 1e30;

    auto report = recording.run(*session_, record);
    EXPECT_EQ(report.outcome, transfer_outcome::download_failed);
    ASSERT_TRUE(report.entry.has_value());
    EXPECT_EQ(report.entry->size, "1e30");

    auto rows = ledger_rows();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].rfind("a.zip,Docs/a.zip,1e30,", 0), 0u);
}

TEST_F(RecordTransferTest, ThrowingBlobStoreIsRecordedAsFailed) {
    class throwing_store : public fake_blob_store {
    public:
        auto put_blob(const std::string&, const std::string&,
                      const std::filesystem::path&) -> result<blob_put_result> override {
            throw std::runtime_error("socket reset");
        }
    };

    throwing_store store;
    transfer_options options;
    options.destination_root = stage_;
    options.container = "archives";
    record_transfer transfer(store, *ledger_, options);

    auto record = make_record("a.zip", std::string(site) + "/Docs/a.zip", site);
    auto report = transfer.run(*session_, record);

    EXPECT_EQ(report.outcome, transfer_outcome::upload_failed);
    EXPECT_NE(report.message.find("socket reset"), std::string::npos);
    ASSERT_TRUE(report.entry.has_value());
    EXPECT_EQ(report.entry->status, ledger_status::failed);

    auto rows = ledger_rows();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_NE(rows[0].find(",Failed"), std::string::npos);
    EXPECT_EQ(count_regular_files(stage_), 0u);
}

TEST_F(RecordTransferTest, BadLocationIsStagingFailure) {
    auto record = make_record("x", std::string(site) + "/", site);

    auto report = transfer_->run(*session_, record);
    EXPECT_EQ(report.outcome, transfer_outcome::staging_failed);
    EXPECT_TRUE(connector_.fetched.empty());
    EXPECT_FALSE(std::filesystem::exists(ledger_->path()));
}

TEST_F(RecordTransferTest, LedgerFailureDoesNotChangeOutcome) {
    auto blocker = write_file("blocker", "file");
    audit_ledger broken(blocker / "upload_log.csv");

    transfer_options options;
    options.destination_root = stage_;
    options.container = "archives";
    record_transfer transfer(store_, broken, options);

    auto record = make_record("a.zip", std::string(site) + "/Docs/a.zip", site);
    auto report = transfer.run(*session_, record);

    EXPECT_EQ(report.outcome, transfer_outcome::uploaded);
    EXPECT_FALSE(report.entry.has_value());
    ASSERT_TRUE(report.ledger_error.has_value());
    EXPECT_EQ(report.ledger_error->code, error_code::ledger_write_error);
    EXPECT_EQ(count_regular_files(stage_), 0u);
}

// ============================================================================
// staged_file
// ============================================================================

class StagedFileTest : public TempDirectoryFixture {};

TEST_F(StagedFileTest, RemovesFileOnScopeExit) {
    auto path = write_file("staged.bin", "data");
    {
        staged_file staged(path);
        EXPECT_TRUE(std::filesystem::exists(staged.path()));
    }
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(StagedFileTest, MissingFileIsNotAnError) {
    staged_file staged(test_dir_ / "never-written.bin");
    EXPECT_TRUE(staged.remove());
    EXPECT_TRUE(staged.remove());
}

TEST_F(StagedFileTest, UnremovablePathReportsFailure) {
    // A non-empty directory cannot be removed by std::filesystem::remove.
    auto blocker = test_dir_ / "occupied";
    std::filesystem::create_directories(blocker);
    write_file("occupied/inner.txt", "x");

    log_capture logs;
    staged_file staged(blocker);
    bool removed = true;
    EXPECT_NO_THROW(removed = staged.remove());
    EXPECT_FALSE(removed);
    EXPECT_TRUE(logs.contains("Could not remove staged file"));

    std::filesystem::remove(blocker / "inner.txt");
    EXPECT_TRUE(staged.remove());
}

TEST_F(StagedFileTest, MoveTransfersOwnership) {
    auto path = write_file("staged.bin", "data");
    staged_file outer(test_dir_ / "other.bin");
    {
        staged_file inner(path);
        outer = std::move(inner);
    }
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_TRUE(outer.remove());
    EXPECT_FALSE(std::filesystem::exists(path));
}

}  // namespace
}  // namespace kcenon::blob_migration::test
