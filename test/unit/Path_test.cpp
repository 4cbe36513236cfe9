#include "cleansheet/core/Path.hpp"
#include "cleansheet/utils/TempFile.hpp"
#include "cleansheet/utils/Logger.hpp"
#include <gtest/gtest.h>
#include <filesystem>

namespace cleansheet {
namespace core {

class PathTest : public ::testing::Test {
protected:
    void SetUp() override {
        cleansheet::Logger::getInstance().initialize("logs/Path_test.log",
                                                    cleansheet::Logger::Level::DEBUG,
                                                    false);
        test_dir_ = "test_path";
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
        cleansheet::Logger::getInstance().shutdown();
    }

    std::string test_dir_;
};

TEST_F(PathTest, ExtensionIsLowercaseWithoutDot) {
    EXPECT_EQ(Path("Book.XLSX").extension(), "xlsx");
    EXPECT_EQ(Path("dir.d/report.Ods").extension(), "ods");
    EXPECT_EQ(Path("archive.tar.csv").extension(), "csv");
    EXPECT_EQ(Path("noext").extension(), "");
    EXPECT_EQ(Path(".hidden").extension(), "");
    EXPECT_EQ(Path("trailing.").extension(), "");
}

TEST_F(PathTest, FilenameStripsDirectories) {
    EXPECT_EQ(Path("a/b/c.xlsx").filename(), "c.xlsx");
    EXPECT_EQ(Path("plain.csv").filename(), "plain.csv");
}

TEST_F(PathTest, SiblingTempKeepsDirectory) {
    Path temp = Path(test_dir_ + "/out.xlsx").siblingTemp("42");
    EXPECT_EQ(temp.string(), test_dir_ + "/out.xlsx.tmp_42");
}

TEST_F(PathTest, WriteReadAndRemove) {
    Path file(test_dir_ + "/data.bin");
    std::string payload("a\0b\r\n", 5);
    ASSERT_TRUE(file.writeAll(payload));
    EXPECT_TRUE(file.exists());
    EXPECT_TRUE(file.isFile());
    EXPECT_EQ(file.fileSize(), payload.size());

    std::string read_back;
    ASSERT_TRUE(file.readAll(read_back));
    EXPECT_EQ(read_back, payload);

    EXPECT_TRUE(file.remove());
    EXPECT_FALSE(file.exists());
    EXPECT_FALSE(file.remove());
}

TEST_F(PathTest, MoveToReplacesTarget) {
    Path source(test_dir_ + "/source.txt");
    Path target(test_dir_ + "/target.txt");
    ASSERT_TRUE(source.writeAll("new"));
    ASSERT_TRUE(target.writeAll("old"));

    ASSERT_TRUE(source.moveTo(target));
    EXPECT_FALSE(source.exists());

    std::string content;
    ASSERT_TRUE(target.readAll(content));
    EXPECT_EQ(content, "new");
}

TEST_F(PathTest, TempFileRemovedUnlessCommitted) {
    Path target(test_dir_ + "/result.csv");
    Path abandoned;
    {
        utils::TempFile temp(target);
        abandoned = temp.path();
        ASSERT_TRUE(temp.path().writeAll("partial"));
        EXPECT_TRUE(abandoned.exists());
    }
    EXPECT_FALSE(abandoned.exists());
    EXPECT_FALSE(target.exists());

    {
        utils::TempFile temp(target);
        ASSERT_TRUE(temp.path().writeAll("complete"));
        ASSERT_TRUE(temp.commitTo(target));
        EXPECT_TRUE(temp.isCommitted());
    }
    std::string content;
    ASSERT_TRUE(target.readAll(content));
    EXPECT_EQ(content, "complete");
}

}} // namespace cleansheet::core
