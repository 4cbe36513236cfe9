#include "cleansheet/archive/ZipWriter.hpp"
#include "cleansheet/utils/ModuleLoggers.hpp"
#include <mz.h>
#include <mz_strm.h>
#include <mz_zip.h>
#include <mz_zip_rw.h>
#include <climits>
#include <ctime>

namespace cleansheet {
namespace archive {

// 构造/析构

ZipWriter::ZipWriter(const core::Path& path)
    : filepath_(path), filename_(path.string()) {
}

ZipWriter::~ZipWriter() {
    cleanup();
}

ZipWriter::ZipWriter(ZipWriter&& other) noexcept
    : zip_handle_(other.zip_handle_),
      filepath_(std::move(other.filepath_)),
      filename_(std::move(other.filename_)),
      is_open_(other.is_open_),
      compression_level_(other.compression_level_),
      written_paths_(std::move(other.written_paths_)),
      stats_(other.stats_) {
    other.zip_handle_ = nullptr;
    other.is_open_ = false;
}

ZipWriter& ZipWriter::operator=(ZipWriter&& other) noexcept {
    if (this != &other) {
        cleanup();
        zip_handle_ = other.zip_handle_;
        filepath_ = std::move(other.filepath_);
        filename_ = std::move(other.filename_);
        is_open_ = other.is_open_;
        compression_level_ = other.compression_level_;
        written_paths_ = std::move(other.written_paths_);
        stats_ = other.stats_;

        other.zip_handle_ = nullptr;
        other.is_open_ = false;
    }
    return *this;
}

// 文件操作

bool ZipWriter::open() {
    cleanup();

    ARCHIVE_DEBUG("Initializing ZIP writer for file: {}", filename_);

    zip_handle_ = mz_zip_writer_create();
    if (!zip_handle_) {
        ARCHIVE_ERROR("Failed to create zip writer");
        return false;
    }

    mz_zip_writer_set_compress_method(zip_handle_, MZ_COMPRESS_METHOD_DEFLATE);
    mz_zip_writer_set_compress_level(zip_handle_, static_cast<int16_t>(compression_level_));

    if (filepath_.exists()) {
        filepath_.remove();
        ARCHIVE_DEBUG("Removed existing zip file: {}", filename_);
    }

    int32_t result = mz_zip_writer_open_file(zip_handle_, filepath_.c_str(), 0, 0);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to open zip file for writing: {}, error: {}", filename_, result);
        mz_zip_writer_delete(&zip_handle_);
        zip_handle_ = nullptr;
        return false;
    }

    // 新写入的条目不使用 Data Descriptor
    void* zip_handle = nullptr;
    if (mz_zip_writer_get_zip_handle(zip_handle_, &zip_handle) == MZ_OK && zip_handle) {
        mz_zip_set_data_descriptor(zip_handle, 0);
    }

    is_open_ = true;
    written_paths_.clear();
    stats_ = Stats{};
    ARCHIVE_DEBUG("ZIP archive opened for writing: {}", filename_);
    return true;
}

bool ZipWriter::close() {
    if (!is_open_ || !zip_handle_) {
        return true;
    }

    bool success = true;

    // 中央目录在这里写出，返回值必须检查
    int32_t result = mz_zip_writer_close(zip_handle_);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to finalize ZIP file: {}, error code: {}", filename_, result);
        success = false;
    } else {
        ARCHIVE_DEBUG("ZIP file finalized: {} ({} entries)", filename_, stats_.entries_written);
    }

    mz_zip_writer_delete(&zip_handle_);
    zip_handle_ = nullptr;
    is_open_ = false;

    return success;
}

void ZipWriter::abandon() {
    if (zip_handle_) {
        mz_zip_writer_delete(&zip_handle_);
        zip_handle_ = nullptr;
    }
    is_open_ = false;
}

void ZipWriter::cleanup() {
    if (is_open_ && zip_handle_) {
        close();
    } else if (zip_handle_) {
        mz_zip_writer_delete(&zip_handle_);
        zip_handle_ = nullptr;
    }
    is_open_ = false;
}

// 写入操作

ZipError ZipWriter::addFile(std::string_view internal_path, std::string_view content) {
    return addFile(internal_path, content.data(), content.size());
}

ZipError ZipWriter::addFile(std::string_view internal_path, const void* data, size_t size) {
    if (!is_open_ || !zip_handle_) {
        return ZipError::NotOpen;
    }
    if (internal_path.empty()) {
        return ZipError::InvalidParameter;
    }

    std::string path(internal_path);
    std::time_t now = std::time(nullptr);

    mz_zip_file file_info = {};
    file_info.filename = path.c_str();
    file_info.uncompressed_size = static_cast<int64_t>(size);
    file_info.compression_method = compression_level_ == 0
        ? MZ_COMPRESS_METHOD_STORE : MZ_COMPRESS_METHOD_DEFLATE;
    file_info.modified_date = now;
    file_info.creation_date = now;
    file_info.flag = MZ_ZIP_FLAG_UTF8;
#ifdef _WIN32
    file_info.version_madeby = (MZ_HOST_SYSTEM_WINDOWS_NTFS << 8) | 20;
#else
    file_info.version_madeby = (MZ_HOST_SYSTEM_UNIX << 8) | 20;
#endif

    return writeEntry(&file_info, data, size);
}

ZipError ZipWriter::addEntry(const ZipReader::EntryInfo& source, const void* data, size_t size) {
    if (!is_open_ || !zip_handle_) {
        return ZipError::NotOpen;
    }
    if (source.path.empty()) {
        return ZipError::InvalidParameter;
    }

    mz_zip_file file_info = {};
    file_info.filename = source.path.c_str();
    file_info.uncompressed_size = static_cast<int64_t>(size);
    file_info.compression_method =
        (source.compression_method == MZ_COMPRESS_METHOD_STORE ||
         source.compression_method == MZ_COMPRESS_METHOD_DEFLATE)
            ? source.compression_method
            : static_cast<uint16_t>(MZ_COMPRESS_METHOD_DEFLATE);
    file_info.modified_date = source.modified_date;
    file_info.accessed_date = source.accessed_date;
    file_info.creation_date = source.creation_date;
    // 只保留 UTF-8 标志，加密和 Data Descriptor 标志由写入器决定
    file_info.flag = static_cast<uint16_t>(source.flag & MZ_ZIP_FLAG_UTF8);
    file_info.version_madeby = source.version_madeby;
    file_info.internal_fa = source.internal_fa;
    file_info.external_fa = source.external_fa;
    if (!source.comment.empty()) {
        file_info.comment = source.comment.c_str();
        file_info.comment_size = static_cast<uint16_t>(source.comment.size());
    }

    return writeEntry(&file_info, data, size);
}

ZipError ZipWriter::writeEntry(void* file_info_ptr, const void* data, size_t size) {
    mz_zip_file& file_info = *static_cast<mz_zip_file*>(file_info_ptr);
    const std::string path = file_info.filename;

    if (size > INT32_MAX) {
        ARCHIVE_ERROR("File {} is too large ({} bytes)", path, size);
        return ZipError::TooLarge;
    }

    int32_t result = mz_zip_writer_entry_open(zip_handle_, &file_info);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to open entry for file {} in zip, error: {}", path, result);
        return ZipError::IoFail;
    }

    if (size > 0) {
        int32_t bytes_written = mz_zip_writer_entry_write(zip_handle_, data, static_cast<int32_t>(size));
        if (bytes_written != static_cast<int32_t>(size)) {
            ARCHIVE_ERROR("Failed to write complete data for file {} to zip", path);
            mz_zip_writer_entry_close(zip_handle_);
            return ZipError::IoFail;
        }
    }

    result = mz_zip_writer_entry_close(zip_handle_);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to close entry for file {} in zip, error: {}", path, result);
        return ZipError::IoFail;
    }

    written_paths_.push_back(path);
    stats_.entries_written++;
    stats_.bytes_written += size;

    ARCHIVE_DEBUG("Added file {} to zip, size: {} bytes", path, size);
    return ZipError::Ok;
}

ZipError ZipWriter::copyFromReader(ZipReader& reader) {
    if (!is_open_ || !zip_handle_) {
        return ZipError::NotOpen;
    }
    if (!reader.isOpen() || !reader.unzip_handle_) {
        return ZipError::InvalidParameter;
    }

    ZipReader::EntryInfo info;
    ZipError err = reader.currentEntryInfo(info);
    if (err != ZipError::Ok) {
        return err;
    }

    int32_t result = mz_zip_writer_copy_from_reader(zip_handle_, reader.unzip_handle_);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to copy entry {} into {}, error: {}", info.path, filename_, result);
        return (result == MZ_FORMAT_ERROR || result == MZ_DATA_ERROR || result == MZ_CRC_ERROR)
            ? ZipError::BadFormat : ZipError::IoFail;
    }

    written_paths_.push_back(info.path);
    stats_.entries_written++;
    stats_.entries_copied++;

    ARCHIVE_DEBUG("Copied entry {} verbatim ({} compressed bytes)", info.path, info.compressed_size);
    return ZipError::Ok;
}

ZipError ZipWriter::setCompressionLevel(int level) {
    if (level < 0 || level > 9) {
        ARCHIVE_ERROR("Invalid compression level: {}. Valid range: 0 to 9", level);
        return ZipError::InvalidParameter;
    }

    compression_level_ = level;
    if (is_open_ && zip_handle_) {
        mz_zip_writer_set_compress_level(zip_handle_, static_cast<int16_t>(compression_level_));
    }

    ARCHIVE_DEBUG("Set compression level to {}", level);
    return ZipError::Ok;
}

}} // namespace cleansheet::archive
