#include "cleansheet/archive/ZipReader.hpp"
#include "cleansheet/archive/ZipWriter.hpp"
#include "cleansheet/utils/Logger.hpp"
#include "support/ArchiveFixtures.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <string>
#include <vector>

namespace cleansheet {
namespace archive {

using test_support::EntryList;

class ZipReaderWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        cleansheet::Logger::getInstance().initialize("logs/ZipReaderWriter_test.log",
                                                    cleansheet::Logger::Level::DEBUG,
                                                    false);
        test_dir_ = "test_zip_reader_writer";
        std::filesystem::create_directories(test_dir_);
        source_path_ = test_dir_ + "/source.zip";
        copy_path_ = test_dir_ + "/copy.zip";
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
        cleansheet::Logger::getInstance().shutdown();
    }

    std::string test_dir_;
    std::string source_path_;
    std::string copy_path_;
};

TEST_F(ZipReaderWriterTest, EntriesKeepInsertionOrder) {
    EntryList entries = {
        {"z_last_name_first.xml", "<z/>"},
        {"a/nested/entry.txt", "nested"},
        {"m.bin", std::string("\x01\x02\x03", 3)}
    };
    ASSERT_TRUE(test_support::writeArchive(source_path_, entries));

    ZipReader reader{core::Path(source_path_)};
    ASSERT_EQ(reader.open(), ZipError::Ok);
    std::vector<std::string> names = reader.listFiles();
    ASSERT_EQ(names.size(), 3u);
    EXPECT_EQ(names[0], "z_last_name_first.xml");
    EXPECT_EQ(names[1], "a/nested/entry.txt");
    EXPECT_EQ(names[2], "m.bin");

    EXPECT_EQ(test_support::readArchive(source_path_), entries);
}

TEST_F(ZipReaderWriterTest, ExtractByName) {
    const std::string binary("\x00\x01\x7F\x80\xFF\x00tail", 10);
    ASSERT_TRUE(test_support::writeArchive(source_path_,
        {{"one.txt", "first"}, {"two.txt", "second"}, {"bytes.bin", binary}}));

    ZipReader reader{core::Path(source_path_)};
    ASSERT_EQ(reader.open(), ZipError::Ok);

    std::string content;
    EXPECT_EQ(reader.extractFile("two.txt", content), ZipError::Ok);
    EXPECT_EQ(content, "second");
    EXPECT_EQ(reader.extractFile("bytes.bin", content), ZipError::Ok);
    EXPECT_EQ(content, binary);
    EXPECT_EQ(reader.fileExists("one.txt"), ZipError::Ok);
    EXPECT_EQ(reader.fileExists("three.txt"), ZipError::FileNotFound);
}

TEST_F(ZipReaderWriterTest, EmptyArchiveHasNoEntries) {
    ASSERT_TRUE(test_support::writeArchive(source_path_, {}));

    ZipReader reader{core::Path(source_path_)};
    ASSERT_EQ(reader.open(), ZipError::Ok);
    EXPECT_EQ(reader.gotoFirstEntry(), ZipError::EndOfEntries);
}

TEST_F(ZipReaderWriterTest, OpenMissingAndInvalidFiles) {
    ZipReader missing{core::Path(test_dir_ + "/missing.zip")};
    EXPECT_EQ(missing.open(), ZipError::FileNotFound);

    std::string garbage_path = test_dir_ + "/garbage.zip";
    ASSERT_TRUE(core::Path(garbage_path).writeAll("this is not a zip archive at all"));
    ZipReader garbage{core::Path(garbage_path)};
    EXPECT_EQ(garbage.open(), ZipError::BadFormat);
}

TEST_F(ZipReaderWriterTest, RawCopyPreservesCompressedPayloadAndMetadata) {
    // 源文件用 STORE 写出，而目标写入器使用默认压缩级别；
    // 若条目被重新压缩，方法会变成 DEFLATE，压缩大小也会缩小
    std::string big(4096, 'x');
    ASSERT_TRUE(test_support::writeArchive(source_path_, {{"small.txt", "plain"}, {"big.txt", big}}, 0));

    {
        ZipReader reader{core::Path(source_path_)};
        ASSERT_EQ(reader.open(), ZipError::Ok);
        ZipWriter writer{core::Path(copy_path_)};
        ASSERT_TRUE(writer.open());

        ZipError err = reader.gotoFirstEntry();
        while (err == ZipError::Ok) {
            ASSERT_EQ(reader.verifyCurrentEntry(), ZipError::Ok);
            ASSERT_EQ(writer.copyFromReader(reader), ZipError::Ok);
            err = reader.gotoNextEntry();
        }
        EXPECT_EQ(err, ZipError::EndOfEntries);
        EXPECT_EQ(writer.getStats().entries_copied, 2u);
        ASSERT_TRUE(writer.close());
    }

    auto source_infos = test_support::readEntryInfos(source_path_);
    auto copy_infos = test_support::readEntryInfos(copy_path_);
    ASSERT_EQ(source_infos.size(), copy_infos.size());
    ASSERT_EQ(source_infos[1].compression_method, test_support::ZIP_METHOD_STORE);
    ASSERT_EQ(source_infos[1].compressed_size, static_cast<uint64_t>(big.size()));
    for (size_t i = 0; i < source_infos.size(); ++i) {
        EXPECT_EQ(copy_infos[i].path, source_infos[i].path);
        EXPECT_EQ(copy_infos[i].compression_method, test_support::ZIP_METHOD_STORE);
        EXPECT_EQ(copy_infos[i].compression_method, source_infos[i].compression_method);
        EXPECT_EQ(copy_infos[i].compressed_size, source_infos[i].compressed_size);
        EXPECT_EQ(copy_infos[i].uncompressed_size, source_infos[i].uncompressed_size);
        EXPECT_EQ(copy_infos[i].crc32, source_infos[i].crc32);
        EXPECT_EQ(copy_infos[i].modified_date, source_infos[i].modified_date);
        EXPECT_EQ(copy_infos[i].external_fa, source_infos[i].external_fa);
    }

    EXPECT_EQ(test_support::readArchive(copy_path_), test_support::readArchive(source_path_));
}

TEST_F(ZipReaderWriterTest, AddEntryKeepsSourceTimestamps) {
    ASSERT_TRUE(test_support::writeArchive(source_path_, {{"xl/workbook.xml", "<workbook/>"}}));
    auto infos = test_support::readEntryInfos(source_path_);
    ASSERT_EQ(infos.size(), 1u);

    {
        ZipWriter writer{core::Path(copy_path_)};
        ASSERT_TRUE(writer.open());
        const std::string replacement = "<workbook><sheets/></workbook>";
        ASSERT_EQ(writer.addEntry(infos[0], replacement.data(), replacement.size()), ZipError::Ok);
        ASSERT_TRUE(writer.close());
    }

    auto copied = test_support::readEntryInfos(copy_path_);
    ASSERT_EQ(copied.size(), 1u);
    EXPECT_EQ(copied[0].path, "xl/workbook.xml");
    EXPECT_EQ(copied[0].modified_date, infos[0].modified_date);
    EXPECT_EQ(copied[0].compression_method, infos[0].compression_method);
    EXPECT_EQ(test_support::entryContent(test_support::readArchive(copy_path_), "xl/workbook.xml"),
              "<workbook><sheets/></workbook>");
}

TEST_F(ZipReaderWriterTest, CorruptedPayloadFailsCrcCheck) {
    const std::string payload = "UNIQUE-PAYLOAD-0123456789-UNIQUE";
    ASSERT_TRUE(test_support::writeArchive(source_path_, {{"data.txt", payload}}, 0));

    std::string bytes = test_support::readFile(source_path_);
    size_t pos = bytes.find(payload);
    ASSERT_NE(pos, std::string::npos);
    bytes[pos + 7] = 'X';
    ASSERT_TRUE(core::Path(source_path_).writeAll(bytes));

    ZipReader reader{core::Path(source_path_)};
    ASSERT_EQ(reader.open(), ZipError::Ok);
    ASSERT_EQ(reader.gotoFirstEntry(), ZipError::Ok);
    EXPECT_EQ(reader.verifyCurrentEntry(), ZipError::CrcMismatch);

    std::vector<uint8_t> data;
    EXPECT_EQ(reader.readCurrentEntry(data), ZipError::CrcMismatch);
}

TEST_F(ZipReaderWriterTest, WriterRejectsInvalidUse) {
    ZipWriter writer{core::Path(copy_path_)};
    EXPECT_EQ(writer.addFile("a.txt", "content"), ZipError::NotOpen);
    EXPECT_EQ(writer.setCompressionLevel(10), ZipError::InvalidParameter);

    ASSERT_TRUE(writer.open());
    EXPECT_EQ(writer.addFile("", "content"), ZipError::InvalidParameter);
    EXPECT_EQ(writer.addFile("a.txt", "content"), ZipError::Ok);
    ASSERT_EQ(writer.getWrittenPaths().size(), 1u);
    EXPECT_EQ(writer.getWrittenPaths()[0], "a.txt");
    EXPECT_TRUE(writer.close());
}

}} // namespace cleansheet::archive
