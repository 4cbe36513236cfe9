/**
 * @file SafeBuffer.hpp
 * @brief 带边界检查的固定大小输出缓冲区
 */

#pragma once

#include <array>
#include <cstring>
#include <functional>
#include <string>
#include <string_view>
#include "cleansheet/core/Constants.hpp"
#include "cleansheet/core/Exception.hpp"

namespace cleansheet {
namespace utils {

/**
 * @brief 固定大小缓冲区，写满时通过回调刷新
 * @tparam BufferSize 缓冲区大小
 */
template<size_t BufferSize = cleansheet::core::Constants::kIOBufferSize>
class SafeBuffer {
public:
    using FlushCallback = std::function<void(const char* data, size_t length)>;

    explicit SafeBuffer(FlushCallback flush_callback = nullptr)
        : flush_callback_(std::move(flush_callback)) {}

    SafeBuffer(const SafeBuffer&) = delete;
    SafeBuffer& operator=(const SafeBuffer&) = delete;

    /**
     * @brief 追加数据；没有刷新回调且空间不足时抛出 OperationException
     */
    void append(const char* data, size_t length) {
        if (!data || length == 0) {
            return;
        }

        if (pos_ + length > BufferSize) {
            requireCallback();
            flush();
            if (length > BufferSize) {
                // 大块数据直接交给回调
                flush_callback_(data, length);
                return;
            }
        }

        std::memcpy(buffer_.data() + pos_, data, length);
        pos_ += length;
    }

    void append(std::string_view str) {
        append(str.data(), str.size());
    }

    void append(char c) {
        append(&c, 1);
    }

    void flush() {
        if (pos_ > 0 && flush_callback_) {
            flush_callback_(buffer_.data(), pos_);
            pos_ = 0;
        }
    }

    void clear() noexcept { pos_ = 0; }

    size_t size() const noexcept { return pos_; }
    bool empty() const noexcept { return pos_ == 0; }
    static constexpr size_t capacity() noexcept { return BufferSize; }

    void setFlushCallback(FlushCallback callback) {
        flush_callback_ = std::move(callback);
    }

private:
    void requireCallback() const {
        if (!flush_callback_) {
            throw core::OperationException("Buffer capacity exceeded without flush callback",
                                           "SafeBuffer::append");
        }
    }

    std::array<char, BufferSize> buffer_;
    size_t pos_ = 0;
    FlushCallback flush_callback_;
};

}} // namespace cleansheet::utils
