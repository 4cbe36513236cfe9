#include "cleansheet/core/CSVProcessor.hpp"
#include "cleansheet/utils/Logger.hpp"
#include "support/ArchiveFixtures.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <string>

namespace cleansheet {
namespace core {

class CSVProcessorTest : public ::testing::Test {
protected:
    void SetUp() override {
        cleansheet::Logger::getInstance().initialize("logs/CSVProcessor_test.log",
                                                    cleansheet::Logger::Level::DEBUG,
                                                    false);
        test_dir_ = "test_csv_processor";
        std::filesystem::create_directories(test_dir_);
        input_ = Path(test_dir_ + "/input.csv");
        output_ = Path(test_dir_ + "/output.csv");
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
        cleansheet::Logger::getInstance().shutdown();
    }

    std::string filter(const std::string& content) {
        std::string out;
        auto stats = processor_.filterIncompleteRows(content, out);
        EXPECT_TRUE(stats) << (stats ? std::string() : stats.error().message);
        return out;
    }

    CSVProcessor processor_;
    std::string test_dir_;
    Path input_;
    Path output_;
};

TEST_F(CSVProcessorTest, DropsRowsWithMissingFields) {
    const std::string content =
        "id,name,score\n"
        "1,Alice,90\n"
        "2,Bob,\n"
        "3,Carol,85\n"
        "4,Dan,NA\n"
        "5,Eve,70\n";

    std::string out;
    auto stats = processor_.filterIncompleteRows(content, out);
    ASSERT_TRUE(stats);
    EXPECT_EQ(stats->rows_read, 5u);
    EXPECT_EQ(stats->rows_kept, 3u);
    EXPECT_EQ(stats->rows_dropped, 2u);
    EXPECT_EQ(out,
              "id,name,score\n"
              "1,Alice,90\n"
              "3,Carol,85\n"
              "5,Eve,70\n");
}

TEST_F(CSVProcessorTest, ShortRowsAreIncomplete) {
    EXPECT_EQ(filter("a,b,c\n1,2\n1,2,3\n"), "a,b,c\n1,2,3\n");
}

TEST_F(CSVProcessorTest, RecognisesNAMarkers) {
    for (const char* marker : {"NA", "N/A", "NaN", "nan", "NULL", "null", "None", "#N/A", "<NA>", "n/a"}) {
        EXPECT_TRUE(processor_.isMissing(marker)) << marker;
    }
    EXPECT_TRUE(processor_.isMissing(""));
    EXPECT_FALSE(processor_.isMissing("0"));
    EXPECT_FALSE(processor_.isMissing("na"));
    EXPECT_FALSE(processor_.isMissing(" "));
}

TEST_F(CSVProcessorTest, QuotedFieldsKeepDelimitersAndNewlines) {
    const std::string content =
        "id,comment\n"
        "1,\"hello, world\"\n"
        "2,\"multi\nline \"\"quoted\"\"\"\n"
        "3,\"\"\n";

    auto records = processor_.parseRecords(content);
    ASSERT_TRUE(records);
    ASSERT_EQ(records->size(), 4u);
    EXPECT_EQ(records.value()[1].fields[1], "hello, world");
    EXPECT_EQ(records.value()[2].fields[1], "multi\nline \"quoted\"");
    EXPECT_EQ(records.value()[2].line, 3u);
    EXPECT_EQ(records.value()[3].line, 5u);

    // 空的引号字段同样视为缺失，保留行按原始字节写出
    EXPECT_EQ(filter(content),
              "id,comment\n"
              "1,\"hello, world\"\n"
              "2,\"multi\nline \"\"quoted\"\"\"\n");
}

TEST_F(CSVProcessorTest, PreservesLineEndings) {
    EXPECT_EQ(filter("a,b\r\n1,2\r\n3,\r\n4,5"), "a,b\r\n1,2\r\n4,5");
}

TEST_F(CSVProcessorTest, SkipsBlankLines) {
    std::string out;
    auto stats = processor_.filterIncompleteRows("a,b\n\n1,2\n\n\n3,4\n", out);
    ASSERT_TRUE(stats);
    EXPECT_EQ(stats->rows_read, 2u);
    EXPECT_EQ(out, "a,b\n1,2\n3,4\n");
}

TEST_F(CSVProcessorTest, ExtraFieldsAreCorrupt) {
    std::string out;
    auto stats = processor_.filterIncompleteRows("a,b\n1,2\n1,2,3\n", out);
    ASSERT_FALSE(stats);
    EXPECT_EQ(stats.error().code, ErrorCode::Corrupt);
    EXPECT_EQ(stats.error().message, "Expected 2 fields in line 3, saw 3");
}

TEST_F(CSVProcessorTest, EmptyInputIsCorrupt) {
    std::string out;
    auto stats = processor_.filterIncompleteRows("", out);
    ASSERT_FALSE(stats);
    EXPECT_EQ(stats.error().code, ErrorCode::Corrupt);

    auto blank = processor_.filterIncompleteRows("\n\n", out);
    ASSERT_FALSE(blank);
    EXPECT_EQ(blank.error().code, ErrorCode::Corrupt);
}

TEST_F(CSVProcessorTest, UnterminatedQuoteIsCorrupt) {
    auto records = processor_.parseRecords("a,b\n1,\"open\n");
    ASSERT_FALSE(records);
    EXPECT_EQ(records.error().code, ErrorCode::Corrupt);
}

TEST_F(CSVProcessorTest, HeaderOnlyFileIsKept) {
    std::string out;
    auto stats = processor_.filterIncompleteRows("a,b,c\n", out);
    ASSERT_TRUE(stats);
    EXPECT_EQ(stats->rows_read, 0u);
    EXPECT_EQ(out, "a,b,c\n");
}

TEST_F(CSVProcessorTest, SanitizesFileThroughTemporary) {
    ASSERT_TRUE(input_.writeAll("x,y\n1,\n2,3\n"));

    auto stats = sanitizeCSVFile(input_, output_, CSVOptions::standard(), false);
    ASSERT_TRUE(stats);
    EXPECT_EQ(stats->rows_kept, 1u);
    EXPECT_EQ(test_support::readFile(output_.string()), "x,y\n2,3\n");

    size_t files = 0;
    for (const auto& entry : std::filesystem::directory_iterator(test_dir_)) {
        (void)entry;
        ++files;
    }
    EXPECT_EQ(files, 2u);
}

TEST_F(CSVProcessorTest, RefusesExistingOutputWithoutOverwrite) {
    ASSERT_TRUE(input_.writeAll("x,y\n1,2\n"));
    ASSERT_TRUE(output_.writeAll("keep me"));

    auto stats = sanitizeCSVFile(input_, output_, CSVOptions::standard(), false);
    ASSERT_FALSE(stats);
    EXPECT_EQ(stats.error().code, ErrorCode::AlreadyExists);
    EXPECT_EQ(test_support::readFile(output_.string()), "keep me");

    auto replaced = sanitizeCSVFile(input_, output_, CSVOptions::standard(), true);
    ASSERT_TRUE(replaced);
    EXPECT_EQ(test_support::readFile(output_.string()), "x,y\n1,2\n");
}

TEST_F(CSVProcessorTest, MissingInputIsNotFound) {
    auto stats = sanitizeCSVFile(Path(test_dir_ + "/absent.csv"), output_, CSVOptions::standard(), false);
    ASSERT_FALSE(stats);
    EXPECT_EQ(stats.error().code, ErrorCode::NotFound);
    EXPECT_FALSE(output_.exists());
}

TEST_F(CSVProcessorTest, CorruptInputLeavesNoOutput) {
    ASSERT_TRUE(input_.writeAll("a\n1,2\n"));
    auto stats = sanitizeCSVFile(input_, output_, CSVOptions::standard(), false);
    ASSERT_FALSE(stats);
    EXPECT_EQ(stats.error().code, ErrorCode::Corrupt);
    EXPECT_FALSE(output_.exists());
}

}} // namespace cleansheet::core
