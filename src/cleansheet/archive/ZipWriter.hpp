#pragma once

#include "cleansheet/archive/ZipError.hpp"
#include "cleansheet/archive/ZipReader.hpp"
#include "cleansheet/core/Path.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace cleansheet {
namespace archive {

/**
 * @brief ZIP写入器
 *
 * 条目按调用顺序写入，不做去重。close() 成功后才会写出中央目录，
 * 在此之前目标文件不是有效的ZIP。
 */
class ZipWriter {
public:
    explicit ZipWriter(const core::Path& path);
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    ZipWriter(ZipWriter&& other) noexcept;
    ZipWriter& operator=(ZipWriter&& other) noexcept;

    // 文件操作

    /**
     * 创建ZIP文件进行写入（已存在的文件会被截断）
     * @return 是否成功
     */
    bool open();

    /**
     * 写出中央目录并关闭文件
     * @return 是否成功
     */
    bool close();

    /**
     * 放弃写入：释放句柄，不保证文件有效
     */
    void abandon();

    bool isOpen() const { return is_open_; }

    // 写入操作

    /**
     * 添加新条目，时间戳取当前时间
     * @param internal_path ZIP内部路径
     * @param content 文件内容
     * @return 错误码
     */
    ZipError addFile(std::string_view internal_path, std::string_view content);
    ZipError addFile(std::string_view internal_path, const void* data, size_t size);

    /**
     * 以源条目的元数据写入新内容
     *
     * 保留名称、时间戳、属性、注释和压缩方法（STORE 或 DEFLATE，其他方法改为 DEFLATE），
     * CRC 与大小由写入器重新计算。
     */
    ZipError addEntry(const ZipReader::EntryInfo& source, const void* data, size_t size);

    /**
     * 原样复制读取器的当前条目（压缩数据、CRC、元数据均不变）
     */
    ZipError copyFromReader(ZipReader& reader);

    /**
     * 设置新条目的压缩级别
     * @param level 压缩级别（0-9，0=STORE）
     */
    ZipError setCompressionLevel(int level);

    int getCompressionLevel() const { return compression_level_; }

    // 状态查询

    /**
     * 已写入的条目名称（写入顺序）
     */
    const std::vector<std::string>& getWrittenPaths() const { return written_paths_; }

    struct Stats {
        size_t entries_written = 0;  // 写入的条目数
        size_t entries_copied = 0;   // 其中原样复制的条目数
        size_t bytes_written = 0;    // 新写入内容的未压缩字节数
    };
    Stats getStats() const { return stats_; }

    const core::Path& getPath() const { return filepath_; }

private:
    void* zip_handle_ = nullptr;
    core::Path filepath_;
    std::string filename_;  // UTF-8 filename for logging
    bool is_open_ = false;
    int compression_level_ = 6;
    std::vector<std::string> written_paths_;
    Stats stats_;

    void cleanup();
    ZipError writeEntry(void* file_info, const void* data, size_t size);
};

}} // namespace cleansheet::archive
