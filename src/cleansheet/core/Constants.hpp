#pragma once

#include <cstddef>

namespace cleansheet {
namespace core {

// 通用常量集中定义，便于统一调整与复用
struct Constants {
    // I/O 缓冲区大小
    static constexpr size_t kIOBufferSize = 8192;

    // 单个条目解压到内存的上限（超过时视为损坏的容器）
    static constexpr size_t kMaxEntryInMemory = 512u * 1024u * 1024u;
};

}} // namespace cleansheet::core
