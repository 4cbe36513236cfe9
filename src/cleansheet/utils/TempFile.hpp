#pragma once

#include "cleansheet/core/Path.hpp"
#include <chrono>
#include <string>
#include <utility>

namespace cleansheet {
namespace utils {

/**
 * @brief 目标文件旁的临时输出文件
 *
 * 路径形如 "<target>.tmp_<微秒时间戳>"。commit() 之前析构时删除该文件，
 * 因此失败路径上不会留下半成品。
 */
class TempFile {
public:
    explicit TempFile(const core::Path& target)
        : path_(target.siblingTemp(timestampTag())) {}

    ~TempFile() {
        if (!committed_ && path_.exists()) {
            path_.remove();
        }
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const core::Path& path() const { return path_; }

    /**
     * @brief 改名为目标路径（目标存在时被替换），成功后不再删除
     */
    bool commitTo(const core::Path& target) {
        if (!path_.moveTo(target)) {
            return false;
        }
        committed_ = true;
        return true;
    }

    bool isCommitted() const { return committed_; }

    static std::string timestampTag() {
        auto now = std::chrono::system_clock::now().time_since_epoch();
        return std::to_string(std::chrono::duration_cast<std::chrono::microseconds>(now).count());
    }

private:
    core::Path path_;
    bool committed_ = false;
};

}} // namespace cleansheet::utils
