#pragma once

#include "cleansheet/core/Path.hpp"
#include <string>
#include <utility>
#include <vector>

namespace cleansheet {
namespace opc {

/**
 * @brief 输入文件族，由扩展名确定，每次运行只确定一次
 */
enum class FileFamily {
    SpreadsheetML,   // .xlsx / .xlsm
    OpenDocument,    // .ods
    Tabular,         // .csv
    Unsupported
};

const char* toString(FileFamily family) noexcept;

/**
 * @brief 按扩展名（不区分大小写）判定文件族
 */
FileFamily classify(const core::Path& path);

/**
 * @brief 容器格式描述：哪个条目需要改写、隐藏节点如何识别
 */
struct FormatProfile {
    FileFamily family = FileFamily::Unsupported;

    // 描述工作表/表格及其可见性的 XML 条目
    std::string trigger_entry_name;
    // 宏二进制条目，格式不支持删除宏时为空
    std::string macro_entry_name;

    // 候选元素
    std::string element_namespace;
    std::string element_local_name;

    // 可见性属性；命名空间为空表示不带前缀的属性
    std::string hidden_attribute_namespace;
    std::string hidden_attribute_name;
    std::vector<std::string> hidden_attribute_values;
    std::string hidden_attribute_default;

    // 用于诊断信息的标识属性，按顺序取第一个存在的 {namespace, local name}
    std::vector<std::pair<std::string, std::string>> identity_attributes;

    bool supportsMacroRemoval() const { return !macro_entry_name.empty(); }

    static const FormatProfile& spreadsheetML();
    static const FormatProfile& openDocument();
};

namespace ns {
    constexpr const char* SPREADSHEETML_MAIN = "http://schemas.openxmlformats.org/spreadsheetml/2006/main";
    constexpr const char* ODF_TABLE = "urn:oasis:names:tc:opendocument:xmlns:table:1.0";
}

}} // namespace cleansheet::opc
