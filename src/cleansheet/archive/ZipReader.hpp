#pragma once

#include "cleansheet/archive/ZipError.hpp"
#include "cleansheet/core/Path.hpp"
#include <cstdint>
#include <ctime>
#include <string>
#include <string_view>
#include <vector>

namespace cleansheet {
namespace archive {

class ZipWriter;

/**
 * @brief ZIP读取器
 *
 * 按中央目录顺序遍历条目（游标式），同名条目不合并。
 * 读取内容时用 zlib 校验 CRC-32，原样复制时由 ZipWriter::copyFromReader
 * 直接搬运当前条目的压缩数据。
 */
class ZipReader {
public:
    // ========== 条目信息结构 ==========
    struct EntryInfo {
        std::string path;
        uint64_t compressed_size = 0;
        uint64_t uncompressed_size = 0;
        uint32_t crc32 = 0;
        uint16_t compression_method = 0;
        time_t modified_date = 0;
        time_t accessed_date = 0;
        time_t creation_date = 0;
        uint16_t flag = 0;
        uint16_t version_madeby = 0;
        uint16_t internal_fa = 0;
        uint32_t external_fa = 0;
        std::string comment;
        bool is_directory = false;
    };

    // ========== 构造/析构 ==========
    explicit ZipReader(const core::Path& path);
    ~ZipReader();

    ZipReader(const ZipReader&) = delete;
    ZipReader& operator=(const ZipReader&) = delete;

    ZipReader(ZipReader&& other) noexcept;
    ZipReader& operator=(ZipReader&& other) noexcept;

    // ========== 文件操作 ==========

    /**
     * 打开ZIP文件进行读取
     * @return FileNotFound 文件不存在；BadFormat 不是有效的ZIP
     */
    ZipError open();

    void close();

    bool isOpen() const { return is_open_; }

    // ========== 顺序遍历 ==========

    /**
     * 定位到第一个条目
     * @return 空归档时返回 EndOfEntries
     */
    ZipError gotoFirstEntry();

    /**
     * 定位到下一个条目
     * @return 遍历结束时返回 EndOfEntries
     */
    ZipError gotoNextEntry();

    /**
     * 当前条目的元数据
     */
    ZipError currentEntryInfo(EntryInfo& info) const;

    /**
     * 解压当前条目并校验 CRC-32
     * @return CrcMismatch 内容与记录不符；BadFormat 数据截断或无法解压
     */
    ZipError readCurrentEntry(std::vector<uint8_t>& data);

    /**
     * 流式解压当前条目只做 CRC-32 校验，不保留内容
     */
    ZipError verifyCurrentEntry();

    // ========== 条目查询 ==========

    /**
     * 所有条目的详细信息（中央目录顺序）
     */
    std::vector<EntryInfo> listEntriesInfo();

    /**
     * 所有条目名称（中央目录顺序）
     */
    std::vector<std::string> listFiles();

    /**
     * 检查条目是否存在
     */
    ZipError fileExists(std::string_view internal_path);

    /**
     * 按名称提取条目（同名时取第一个）
     */
    ZipError extractFile(std::string_view internal_path, std::vector<uint8_t>& data);
    ZipError extractFile(std::string_view internal_path, std::string& content);

    const core::Path& getPath() const { return filepath_; }

private:
    friend class ZipWriter;

    void* unzip_handle_ = nullptr;
    core::Path filepath_;
    std::string filename_;  // UTF-8 filename for logging
    bool is_open_ = false;

    void cleanup();
    ZipError locateByName(std::string_view internal_path);
    // 逐块解压当前条目；sink 为空时只计算 CRC
    ZipError drainCurrentEntry(std::vector<uint8_t>* sink);
};

}} // namespace cleansheet::archive
