#pragma once

#include "cleansheet/core/Expected.hpp"
#include "cleansheet/core/Path.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace cleansheet {
namespace core {

/**
 * @brief 视为缺失值的字段内容（与 pandas 默认的 NA 标记一致）
 */
const std::vector<std::string>& defaultNAValues();

struct CSVOptions {
    char delimiter = ',';
    char quote_char = '"';
    bool skip_empty_lines = true;
    std::vector<std::string> na_values = defaultNAValues();

    static CSVOptions standard() {
        return CSVOptions{};
    }
};

// 一条 CSV 记录：原始文本（含行结束符）和解析后的字段
struct CSVRecord {
    std::string raw;
    std::vector<std::string> fields;
    size_t line = 0;   // 记录起始行号，从 1 开始
};

struct CSVSanitizeStats {
    size_t rows_read = 0;     // 数据行（不含表头和空行）
    size_t rows_kept = 0;
    size_t rows_dropped = 0;
};

/**
 * @brief CSV 缺失字段过滤
 *
 * 按 RFC 4180 切分记录：引号字段内可以包含分隔符、成对的引号和换行。
 * 第一条非空记录是表头；数据行字段数少于表头、存在空字段或 NA 标记时整行丢弃，
 * 保留的行按原始字节写出。
 */
class CSVProcessor {
public:
    explicit CSVProcessor(CSVOptions options = CSVOptions::standard())
        : options_(std::move(options)) {}

    const CSVOptions& options() const { return options_; }

    /**
     * @brief 切分记录
     * @return 引号未闭合时返回 Corrupt
     */
    Result<std::vector<CSVRecord>> parseRecords(std::string_view content) const;

    /**
     * @brief 字段是否视为缺失（空串或 NA 标记）
     */
    bool isMissing(std::string_view field) const;

    /**
     * @brief 数据行是否完整
     */
    bool isComplete(const CSVRecord& record, size_t header_fields) const;

    /**
     * @brief 过滤缺失字段的行，结果追加到 output
     * @return Corrupt：没有表头，或某行字段多于表头
     */
    Result<CSVSanitizeStats> filterIncompleteRows(std::string_view content, std::string& output) const;

private:
    CSVOptions options_;
};

/**
 * @brief 过滤 CSV 文件中缺失字段的行
 *
 * 输出先写入同目录临时文件，成功后改名为 output。
 * @return NotFound、AlreadyExists、Corrupt 或 IoFailure
 */
Result<CSVSanitizeStats> sanitizeCSVFile(const Path& input, const Path& output,
                                         const CSVOptions& options, bool overwrite);

}} // namespace cleansheet::core
