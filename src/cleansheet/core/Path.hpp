#pragma once

#include <cstdint>
#include <cstdio>
#include <string>
#include <ostream>

namespace cleansheet {
namespace core {

/**
 * @brief UTF-8路径处理类，封装跨平台文件路径操作
 *
 * Windows 下通过 utf8cpp 转换为 UTF-16 调用宽字符 API，其他平台直接使用 UTF-8。
 */
class Path {
private:
    std::string utf8_path_;

public:
    explicit Path(const std::string& path);
    explicit Path(const char* path);
    Path() = default;

    const std::string& string() const { return utf8_path_; }
    const char* c_str() const { return utf8_path_.c_str(); }
    bool empty() const { return utf8_path_.empty(); }

    /**
     * @brief 文件名部分（不含目录）
     */
    std::string filename() const;

    /**
     * @brief 小写扩展名，不含点；没有扩展名时返回空串
     *
     * "Book.XLSX" -> "xlsx"，".hidden" -> ""
     */
    std::string extension() const;

    /**
     * @brief 同目录下的临时兄弟路径，形如 "<path>.tmp_<tag>"
     */
    Path siblingTemp(const std::string& tag) const;

    // 文件操作
    bool exists() const;
    bool isFile() const;

    /**
     * @brief 获取文件大小
     * @return 文件大小（字节），失败返回0
     */
    uintmax_t fileSize() const;

    /**
     * @brief 删除文件
     * @return 是否删除成功（文件不存在时返回false）
     */
    bool remove() const;

    /**
     * @brief 移动文件到目标路径，目标存在时被替换
     * @return 是否移动成功
     */
    bool moveTo(const Path& target) const;

    // 文件流操作
    FILE* openForRead(bool binary = true) const;
    FILE* openForWrite(bool binary = true) const;

    /**
     * @brief 读取整个文件
     * @return 是否读取成功
     */
    bool readAll(std::string& content) const;

    /**
     * @brief 写入整个文件（覆盖）
     * @return 是否写入成功
     */
    bool writeAll(const std::string& content) const;

#ifdef _WIN32
    std::wstring getWidePath() const;
#endif

    bool operator==(const Path& other) const { return utf8_path_ == other.utf8_path_; }
    bool operator!=(const Path& other) const { return utf8_path_ != other.utf8_path_; }
    bool operator<(const Path& other) const { return utf8_path_ < other.utf8_path_; }

    friend std::ostream& operator<<(std::ostream& os, const Path& path) {
        return os << path.utf8_path_;
    }
};

}} // namespace cleansheet::core
