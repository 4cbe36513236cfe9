#include "cleansheet/core/Path.hpp"
#include "cleansheet/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <memory>
#include "cleansheet/core/Constants.hpp"

#ifdef _WIN32
#include <windows.h>
#include <utf8.h>
#ifdef ERROR
#undef ERROR
#endif
#else
#include <filesystem>
#endif

namespace cleansheet {
namespace core {

namespace {

struct FileCloser {
    void operator()(FILE* file) const {
        if (file) {
            std::fclose(file);
        }
    }
};

using FilePtr = std::unique_ptr<FILE, FileCloser>;

} // namespace

Path::Path(const std::string& path) : utf8_path_(path) {}

Path::Path(const char* path) : utf8_path_(path ? path : "") {}

#ifdef _WIN32
std::wstring Path::getWidePath() const {
    if (utf8_path_.empty()) return std::wstring();

    try {
        std::wstring result;
        utf8::utf8to16(utf8_path_.begin(), utf8_path_.end(), std::back_inserter(result));
        return result;
    } catch (const utf8::exception&) {
        // 非法 UTF-8 时交给系统按本地代码页转换
        int size_needed = MultiByteToWideChar(CP_ACP, 0, utf8_path_.c_str(), -1, NULL, 0);
        if (size_needed == 0) return std::wstring();

        std::wstring result(size_needed - 1, 0);
        MultiByteToWideChar(CP_ACP, 0, utf8_path_.c_str(), -1, &result[0], size_needed);
        return result;
    }
}
#endif

std::string Path::filename() const {
    size_t pos = utf8_path_.find_last_of("/\\");
    return pos == std::string::npos ? utf8_path_ : utf8_path_.substr(pos + 1);
}

std::string Path::extension() const {
    std::string name = filename();
    size_t dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == name.size()) {
        return std::string();
    }
    std::string ext = name.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

Path Path::siblingTemp(const std::string& tag) const {
    return Path(fmt::format("{}.tmp_{}", utf8_path_, tag));
}

bool Path::exists() const {
    if (utf8_path_.empty()) return false;

#ifdef _WIN32
    std::wstring wide_path = getWidePath();
    DWORD attributes = GetFileAttributesW(wide_path.c_str());
    return attributes != INVALID_FILE_ATTRIBUTES;
#else
    std::error_code ec;
    return std::filesystem::exists(utf8_path_, ec);
#endif
}

bool Path::isFile() const {
    if (utf8_path_.empty()) return false;

#ifdef _WIN32
    std::wstring wide_path = getWidePath();
    DWORD attributes = GetFileAttributesW(wide_path.c_str());
    return (attributes != INVALID_FILE_ATTRIBUTES && !(attributes & FILE_ATTRIBUTE_DIRECTORY));
#else
    std::error_code ec;
    return std::filesystem::is_regular_file(utf8_path_, ec);
#endif
}

uintmax_t Path::fileSize() const {
    if (utf8_path_.empty()) return 0;

#ifdef _WIN32
    std::wstring wide_path = getWidePath();
    WIN32_FILE_ATTRIBUTE_DATA file_data;
    if (GetFileAttributesExW(wide_path.c_str(), GetFileExInfoStandard, &file_data)) {
        ULARGE_INTEGER size;
        size.HighPart = file_data.nFileSizeHigh;
        size.LowPart = file_data.nFileSizeLow;
        return size.QuadPart;
    }
    return 0;
#else
    std::error_code ec;
    uintmax_t size = std::filesystem::file_size(utf8_path_, ec);
    if (ec) {
        CORE_DEBUG("Cannot get file size of '{}': {}", utf8_path_, ec.message());
        return 0;
    }
    return size;
#endif
}

bool Path::remove() const {
    if (utf8_path_.empty()) return false;

#ifdef _WIN32
    std::wstring wide_path = getWidePath();
    return DeleteFileW(wide_path.c_str()) != 0;
#else
    std::error_code ec;
    bool removed = std::filesystem::remove(utf8_path_, ec);
    if (ec) {
        CORE_DEBUG("Cannot remove '{}': {}", utf8_path_, ec.message());
        return false;
    }
    return removed;
#endif
}

bool Path::moveTo(const Path& target) const {
    if (utf8_path_.empty() || target.utf8_path_.empty()) return false;

#ifdef _WIN32
    std::wstring src_wide = getWidePath();
    std::wstring dst_wide = target.getWidePath();
    return MoveFileExW(src_wide.c_str(), dst_wide.c_str(),
                       MOVEFILE_REPLACE_EXISTING | MOVEFILE_COPY_ALLOWED) != 0;
#else
    std::error_code ec;
    std::filesystem::rename(utf8_path_, target.utf8_path_, ec);
    if (ec) {
        CORE_DEBUG("Cannot move '{}' to '{}': {}", utf8_path_, target.utf8_path_, ec.message());
        return false;
    }
    return true;
#endif
}

FILE* Path::openForRead(bool binary) const {
    if (utf8_path_.empty()) return nullptr;

#ifdef _WIN32
    std::wstring wide_path = getWidePath();
    FILE* file = nullptr;
    errno_t err = _wfopen_s(&file, wide_path.c_str(), binary ? L"rb" : L"r");
    return (err == 0) ? file : nullptr;
#else
    return std::fopen(utf8_path_.c_str(), binary ? "rb" : "r");
#endif
}

FILE* Path::openForWrite(bool binary) const {
    if (utf8_path_.empty()) return nullptr;

#ifdef _WIN32
    std::wstring wide_path = getWidePath();
    FILE* file = nullptr;
    errno_t err = _wfopen_s(&file, wide_path.c_str(), binary ? L"wb" : L"w");
    return (err == 0) ? file : nullptr;
#else
    return std::fopen(utf8_path_.c_str(), binary ? "wb" : "w");
#endif
}

bool Path::readAll(std::string& content) const {
    FilePtr file(openForRead(true));
    if (!file) {
        return false;
    }

    content.clear();
    char buffer[Constants::kIOBufferSize];
    size_t n = 0;
    while ((n = std::fread(buffer, 1, sizeof(buffer), file.get())) > 0) {
        content.append(buffer, n);
    }
    return std::ferror(file.get()) == 0;
}

bool Path::writeAll(const std::string& content) const {
    FilePtr file(openForWrite(true));
    if (!file) {
        return false;
    }

    if (!content.empty() &&
        std::fwrite(content.data(), 1, content.size(), file.get()) != content.size()) {
        return false;
    }
    return std::fclose(file.release()) == 0;
}

}} // namespace cleansheet::core
