#pragma once

namespace cleansheet {
namespace core {

/**
 * @brief 一次清理运行的选项
 *
 * 运行开始前确定，之后只以 const 引用传递。
 */
struct SanitizeOptions {
    bool remove_macros = false;
    bool remove_hidden_sheets = false;
    bool overwrite = false;

    // 原样复制的条目是否先解压校验 CRC-32
    bool verify_entries = true;
};

}} // namespace cleansheet::core
