/**
 * @file test_inventory_loader.cpp
 * @brief Unit tests for inventory loading, schema validation and lock retry
 */

#include "../test_fakes.h"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace kcenon::blob_migration::test {
namespace {

/**
 * @brief Reader that reports a lock for the first N reads
 */
class scripted_reader : public sheet_reader {
public:
    int locked_reads = 0;
    int reads = 0;
    sheet content;

    auto read(const std::filesystem::path& path) -> result<sheet> override {
        ++reads;
        if (reads <= locked_reads) {
            return unexpected{error{error_code::inventory_locked,
                path.string() + " is locked"}};
        }
        return content;
    }
};

class counting_breaker : public lock_breaker {
public:
    int releases = 0;
    bool succeed = true;

    auto release(const std::filesystem::path& /*path*/) -> result<void> override {
        ++releases;
        if (!succeed) {
            return unexpected{error{error_code::inventory_locked, "still locked"}};
        }
        return result<void>{};
    }
};

class InventoryLoaderTest : public TempDirectoryFixture {
protected:
    auto load(const std::string& text) -> result<std::vector<file_record>> {
        auto path = write_file("inventory.csv", text);
        inventory_loader loader(std::make_shared<delimited_sheet_reader>(),
                                std::make_shared<counting_breaker>());
        return loader.load(path);
    }
};

TEST_F(InventoryLoaderTest, LoadsRecordsInOrder) {
    auto records = load(
        "Name,Location,Size (MB),Site Address\n"
        "q1.zip,https://contoso.sharepoint.com/sites/Fin/Docs/q1.zip,12.5,"
        "https://contoso.sharepoint.com/sites/Fin\n"
        "q2.zip,https://contoso.sharepoint.com/sites/Fin/Docs/q2.zip,n/a,"
        "https://contoso.sharepoint.com/sites/Fin\n");
    ASSERT_TRUE(records.has_value()) << records.error().message;
    ASSERT_EQ(records.value().size(), 2u);

    const auto& first = records.value()[0];
    EXPECT_EQ(first.name, "q1.zip");
    EXPECT_EQ(first.site_address, "https://contoso.sharepoint.com/sites/Fin");
    ASSERT_TRUE(first.declared_size_mb.has_value());
    EXPECT_DOUBLE_EQ(*first.declared_size_mb, 12.5);
    EXPECT_EQ(first.row_number, 1u);

    const auto& second = records.value()[1];
    EXPECT_EQ(second.declared_size, "n/a");
    EXPECT_FALSE(second.declared_size_mb.has_value());
}

TEST_F(InventoryLoaderTest, NonFiniteSizesAreKeptAsText) {
    auto records = load(
        "Name,Location,Size (MB),Site Address\n"
        "a.zip,https://contoso.sharepoint.com/sites/Fin/Docs/a.zip,nan,"
        "https://contoso.sharepoint.com/sites/Fin\n"
        "b.zip,https://contoso.sharepoint.com/sites/Fin/Docs/b.zip,inf,"
        "https://contoso.sharepoint.com/sites/Fin\n"
        "c.zip,https://contoso.sharepoint.com/sites/Fin/Docs/c.zip,1e30,"
        "https://contoso.sharepoint.com/sites/Fin\n");
    ASSERT_TRUE(records.has_value()) << records.error().message;
    ASSERT_EQ(records.value().size(), 3u);

    EXPECT_EQ(records.value()[0].declared_size, "nan");
    EXPECT_FALSE(records.value()[0].declared_size_mb.has_value());
    EXPECT_FALSE(records.value()[1].declared_size_mb.has_value());

    // Finite but huge values parse; the ledger decides how to show them.
    ASSERT_TRUE(records.value()[2].declared_size_mb.has_value());
    EXPECT_DOUBLE_EQ(*records.value()[2].declared_size_mb, 1e30);
}

TEST_F(InventoryLoaderTest, MatchesHeadersLooselyAndIgnoresExtraColumns) {
    auto records = load(
        "\xEF\xBB\xBF Owner , site address ,NAME,Location ,Size (MB)\n"
        "bob,https://h/sites/A,a.zip,https://h/sites/A/a.zip,1\n");
    ASSERT_TRUE(records.has_value()) << records.error().message;
    ASSERT_EQ(records.value().size(), 1u);
    EXPECT_EQ(records.value()[0].name, "a.zip");
    EXPECT_EQ(records.value()[0].site_address, "https://h/sites/A");
}

TEST_F(InventoryLoaderTest, MissingSiteAddressColumnIsSchemaError) {
    auto records = load("Name,Location,Size (MB)\na.zip,https://h/sites/A/a.zip,1\n");
    ASSERT_FALSE(records.has_value());
    EXPECT_EQ(records.error().code, error_code::schema_error);
    EXPECT_NE(records.error().message.find("Site Address"), std::string::npos);
}

TEST_F(InventoryLoaderTest, SchemaErrorNamesEveryMissingColumn) {
    auto result = inventory_loader::validate_schema({"Name"}, column_schema{});
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("Location"), std::string::npos);
    EXPECT_NE(result.error().message.find("Size (MB)"), std::string::npos);
    EXPECT_NE(result.error().message.find("Site Address"), std::string::npos);
}

TEST_F(InventoryLoaderTest, HeaderOnlyInventoryIsEmpty) {
    auto records = load("Name,Location,Size (MB),Site Address\n");
    ASSERT_TRUE(records.has_value());
    EXPECT_TRUE(records.value().empty());
}

TEST_F(InventoryLoaderTest, EmptyFileIsEmptyInventory) {
    auto records = load("");
    ASSERT_TRUE(records.has_value());
    EXPECT_TRUE(records.value().empty());
}

TEST_F(InventoryLoaderTest, SkipsBlankRows) {
    auto records = load(
        "Name,Location,Size (MB),Site Address\n"
        ",,,\n"
        "\n"
        "a.zip,https://h/sites/A/a.zip,1,https://h/sites/A\n");
    ASSERT_TRUE(records.has_value());
    ASSERT_EQ(records.value().size(), 1u);
    EXPECT_EQ(records.value()[0].row_number, 3u);
}

TEST_F(InventoryLoaderTest, SkipsRowsWithoutLocation) {
    log_capture logs;
    auto records = load(
        "Name,Location,Size (MB),Site Address\n"
        "a.zip,,1,https://h/sites/A\n");
    ASSERT_TRUE(records.has_value());
    EXPECT_TRUE(records.value().empty());
    EXPECT_TRUE(logs.contains("Skipping inventory row 1"));
}

TEST_F(InventoryLoaderTest, DerivesMissingNameFromLocation) {
    auto records = load(
        "Name,Location,Size (MB),Site Address\n"
        ",https://h/sites/A/Docs/report.zip?web=1,1,https://h/sites/A\n");
    ASSERT_TRUE(records.has_value());
    ASSERT_EQ(records.value().size(), 1u);
    EXPECT_EQ(records.value()[0].name, "report.zip");
}

TEST_F(InventoryLoaderTest, HonorsCustomColumnNames) {
    auto path = write_file("custom.csv",
        "File;Url;MB;Site\n"
        "a.zip;https://h/sites/A/a.zip;3;https://h/sites/A\n");

    column_schema columns;
    columns.name = "File";
    columns.location = "Url";
    columns.size = "MB";
    columns.site_address = "Site";

    inventory_loader loader(std::make_shared<delimited_sheet_reader>(';'),
                            std::make_shared<counting_breaker>(), columns);
    auto records = loader.load(path);
    ASSERT_TRUE(records.has_value()) << records.error().message;
    ASSERT_EQ(records.value().size(), 1u);
    EXPECT_EQ(records.value()[0].declared_size, "3");
}

TEST_F(InventoryLoaderTest, MissingInventoryIsNotFound) {
    inventory_loader loader(std::make_shared<delimited_sheet_reader>(),
                            std::make_shared<counting_breaker>());
    auto records = loader.load(test_dir_ / "missing.csv");
    ASSERT_FALSE(records.has_value());
    EXPECT_EQ(records.error().code, error_code::file_not_found);
}

// ============================================================================
// Lock handling
// ============================================================================

class InventoryLockTest : public ::testing::Test {
protected:
    void SetUp() override {
        reader_ = std::make_shared<scripted_reader>();
        reader_->content.header = {"Name", "Location", "Size (MB)", "Site Address"};
        reader_->content.rows = {{"a.zip", "https://h/sites/A/a.zip", "1", "https://h/sites/A"}};
        breaker_ = std::make_shared<counting_breaker>();
    }

    std::shared_ptr<scripted_reader> reader_;
    std::shared_ptr<counting_breaker> breaker_;
};

TEST_F(InventoryLockTest, ReleasesLockAndRetriesOnce) {
    reader_->locked_reads = 1;
    inventory_loader loader(reader_, breaker_);

    auto records = loader.load("inventory.csv");
    ASSERT_TRUE(records.has_value());
    EXPECT_EQ(records.value().size(), 1u);
    EXPECT_EQ(breaker_->releases, 1);
    EXPECT_EQ(reader_->reads, 2);
}

TEST_F(InventoryLockTest, GivesUpAfterSingleRetry) {
    reader_->locked_reads = 5;
    breaker_->succeed = false;
    inventory_loader loader(reader_, breaker_);

    auto records = loader.load("inventory.csv");
    ASSERT_FALSE(records.has_value());
    EXPECT_EQ(records.error().code, error_code::inventory_locked);
    EXPECT_EQ(breaker_->releases, 1);
    EXPECT_EQ(reader_->reads, 2);
}

TEST_F(InventoryLockTest, UnlockedReadNeverCallsBreaker) {
    inventory_loader loader(reader_, breaker_);

    auto records = loader.load("inventory.csv");
    ASSERT_TRUE(records.has_value());
    EXPECT_EQ(breaker_->releases, 0);
    EXPECT_EQ(reader_->reads, 1);
}

class PosixLockBreakerTest : public TempDirectoryFixture {};

TEST_F(PosixLockBreakerTest, UnlockedFileHasNoHolder) {
    auto path = write_file("inventory.csv", "Name\n");
    EXPECT_FALSE(find_lock_holder(path).has_value());

    posix_lock_breaker breaker;
    EXPECT_TRUE(breaker.release(path).has_value());
}

TEST_F(PosixLockBreakerTest, TerminatesForeignHolder) {
    auto path = write_file("inventory.csv",
        "Name,Location,Size (MB),Site Address\n"
        "a.zip,https://h/sites/A/a.zip,1,https://h/sites/A\n");

    int ready[2];
    ASSERT_EQ(::pipe(ready), 0);

    pid_t child = ::fork();
    ASSERT_GE(child, 0);
    if (child == 0) {
        ::close(ready[0]);
        int fd = ::open(path.c_str(), O_RDWR);
        struct flock lock {};
        lock.l_type = F_WRLCK;
        lock.l_whence = SEEK_SET;
        if (fd < 0 || ::fcntl(fd, F_SETLK, &lock) != 0) {
            ::_exit(1);
        }
        char byte = 1;
        if (::write(ready[1], &byte, 1) != 1) {
            ::_exit(1);
        }
        while (true) {
            ::pause();
        }
    }

    ::close(ready[1]);
    char byte = 0;
    ASSERT_EQ(::read(ready[0], &byte, 1), 1);
    ::close(ready[0]);

    auto holder = find_lock_holder(path);
    ASSERT_TRUE(holder.has_value());
    EXPECT_EQ(*holder, static_cast<int>(child));

    inventory_loader loader(std::make_shared<delimited_sheet_reader>(),
                            std::make_shared<posix_lock_breaker>(std::chrono::milliseconds(5000)));
    auto records = loader.load(path);

    int status = 0;
    ::waitpid(child, &status, 0);

    ASSERT_TRUE(records.has_value()) << records.error().message;
    EXPECT_EQ(records.value().size(), 1u);
    EXPECT_TRUE(WIFSIGNALED(status));
}

}  // namespace
}  // namespace kcenon::blob_migration::test
