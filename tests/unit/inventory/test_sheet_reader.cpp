/**
 * @file test_sheet_reader.cpp
 * @brief Unit tests for the delimited inventory reader
 */

#include "../test_fakes.h"

#include <sstream>

namespace kcenon::blob_migration::test {
namespace {

class DelimitedSheetReaderTest : public ::testing::Test {
protected:
    auto parse(const std::string& text, char delimiter = ',') -> result<sheet> {
        std::istringstream input(text);
        return delimited_sheet_reader(delimiter).parse(input);
    }
};

TEST_F(DelimitedSheetReaderTest, SplitsHeaderAndRows) {
    auto table = parse("Name,Location\na.zip,/x/a.zip\nb.zip,/x/b.zip\n");
    ASSERT_TRUE(table.has_value());

    ASSERT_EQ(table.value().header.size(), 2u);
    EXPECT_EQ(table.value().header[0], "Name");
    ASSERT_EQ(table.value().rows.size(), 2u);
    EXPECT_EQ(table.value().rows[1][1], "/x/b.zip");
}

TEST_F(DelimitedSheetReaderTest, HandlesQuotedFields) {
    auto table = parse("Name,Note\n\"a, b.zip\",\"say \"\"hi\"\"\"\n");
    ASSERT_TRUE(table.has_value());
    ASSERT_EQ(table.value().rows.size(), 1u);
    EXPECT_EQ(table.value().rows[0][0], "a, b.zip");
    EXPECT_EQ(table.value().rows[0][1], "say \"hi\"");
}

TEST_F(DelimitedSheetReaderTest, KeepsEmbeddedLineBreaks) {
    auto table = parse("Name,Note\na.zip,\"line1\nline2\"\n");
    ASSERT_TRUE(table.has_value());
    ASSERT_EQ(table.value().rows.size(), 1u);
    EXPECT_EQ(table.value().rows[0][1], "line1\nline2");
}

TEST_F(DelimitedSheetReaderTest, AcceptsCrLfAndMissingFinalNewline) {
    auto table = parse("Name,Size\r\na.zip,10\r\nb.zip,20");
    ASSERT_TRUE(table.has_value());
    ASSERT_EQ(table.value().rows.size(), 2u);
    EXPECT_EQ(table.value().rows[0][1], "10");
    EXPECT_EQ(table.value().rows[1][1], "20");
}

TEST_F(DelimitedSheetReaderTest, StripsByteOrderMark) {
    auto table = parse("\xEF\xBB\xBFName,Location\na,b\n");
    ASSERT_TRUE(table.has_value());
    EXPECT_EQ(table.value().header[0], "Name");
}

TEST_F(DelimitedSheetReaderTest, UsesConfiguredDelimiter) {
    auto table = parse("Name\tSize (MB)\na,b.zip\t12\n", '\t');
    ASSERT_TRUE(table.has_value());
    ASSERT_EQ(table.value().header.size(), 2u);
    EXPECT_EQ(table.value().header[1], "Size (MB)");
    EXPECT_EQ(table.value().rows[0][0], "a,b.zip");
}

TEST_F(DelimitedSheetReaderTest, EmptyInputHasNoHeader) {
    auto table = parse("");
    ASSERT_TRUE(table.has_value());
    EXPECT_TRUE(table.value().header.empty());
    EXPECT_TRUE(table.value().rows.empty());
}

TEST_F(DelimitedSheetReaderTest, UnterminatedQuoteIsAnError) {
    auto table = parse("Name\n\"open");
    ASSERT_FALSE(table.has_value());
    EXPECT_EQ(table.error().code, error_code::file_read_error);
}

class DelimitedSheetReaderFileTest : public TempDirectoryFixture {};

TEST_F(DelimitedSheetReaderFileTest, MissingFileIsNotFound) {
    delimited_sheet_reader reader;
    auto table = reader.read(test_dir_ / "absent.csv");
    ASSERT_FALSE(table.has_value());
    EXPECT_EQ(table.error().code, error_code::file_not_found);
}

TEST_F(DelimitedSheetReaderFileTest, ReadsFromDisk) {
    auto path = write_file("inventory.csv", "Name\na.zip\n");
    delimited_sheet_reader reader;
    auto table = reader.read(path);
    ASSERT_TRUE(table.has_value());
    EXPECT_EQ(table.value().rows.size(), 1u);
}

}  // namespace
}  // namespace kcenon::blob_migration::test
