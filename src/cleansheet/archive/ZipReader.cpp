#include "cleansheet/archive/ZipReader.hpp"
#include "cleansheet/core/Constants.hpp"
#include "cleansheet/utils/ModuleLoggers.hpp"
#include <mz.h>
#include <mz_strm.h>
#include <mz_zip.h>
#include <mz_zip_rw.h>
#include <zlib.h>
#include <array>

namespace cleansheet {
namespace archive {

// 构造/析构

ZipReader::ZipReader(const core::Path& path)
    : filepath_(path), filename_(path.string()) {
}

ZipReader::~ZipReader() {
    cleanup();
}

ZipReader::ZipReader(ZipReader&& other) noexcept
    : unzip_handle_(other.unzip_handle_),
      filepath_(std::move(other.filepath_)),
      filename_(std::move(other.filename_)),
      is_open_(other.is_open_) {
    other.unzip_handle_ = nullptr;
    other.is_open_ = false;
}

ZipReader& ZipReader::operator=(ZipReader&& other) noexcept {
    if (this != &other) {
        cleanup();
        unzip_handle_ = other.unzip_handle_;
        filepath_ = std::move(other.filepath_);
        filename_ = std::move(other.filename_);
        is_open_ = other.is_open_;

        other.unzip_handle_ = nullptr;
        other.is_open_ = false;
    }
    return *this;
}

// 文件操作

ZipError ZipReader::open() {
    cleanup();

    if (!filepath_.exists()) {
        ARCHIVE_ERROR("Zip file does not exist: {}", filename_);
        return ZipError::FileNotFound;
    }

    unzip_handle_ = mz_zip_reader_create();
    if (!unzip_handle_) {
        ARCHIVE_ERROR("Failed to create zip reader");
        return ZipError::InternalError;
    }

    int32_t result = mz_zip_reader_open_file(unzip_handle_, filepath_.c_str());
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to open zip file for reading: {}, error: {}", filename_, result);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
        return result == MZ_OPEN_ERROR ? ZipError::IoFail : ZipError::BadFormat;
    }

    is_open_ = true;
    ARCHIVE_DEBUG("Zip archive opened for reading: {}", filename_);
    return ZipError::Ok;
}

void ZipReader::close() {
    cleanup();
}

void ZipReader::cleanup() {
    if (unzip_handle_) {
        mz_zip_reader_close(unzip_handle_);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
    }
    is_open_ = false;
}

// 顺序遍历

ZipError ZipReader::gotoFirstEntry() {
    if (!is_open_ || !unzip_handle_) {
        return ZipError::NotOpen;
    }

    int32_t result = mz_zip_reader_goto_first_entry(unzip_handle_);
    if (result == MZ_END_OF_LIST) {
        return ZipError::EndOfEntries;
    }
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Cannot read central directory of {}, error: {}", filename_, result);
        return ZipError::BadFormat;
    }
    return ZipError::Ok;
}

ZipError ZipReader::gotoNextEntry() {
    if (!is_open_ || !unzip_handle_) {
        return ZipError::NotOpen;
    }

    int32_t result = mz_zip_reader_goto_next_entry(unzip_handle_);
    if (result == MZ_END_OF_LIST) {
        return ZipError::EndOfEntries;
    }
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Truncated central directory in {}, error: {}", filename_, result);
        return ZipError::BadFormat;
    }
    return ZipError::Ok;
}

ZipError ZipReader::currentEntryInfo(EntryInfo& info) const {
    if (!is_open_ || !unzip_handle_) {
        return ZipError::NotOpen;
    }

    mz_zip_file* file_info = nullptr;
    if (mz_zip_reader_entry_get_info(unzip_handle_, &file_info) != MZ_OK || !file_info) {
        return ZipError::BadFormat;
    }

    info = EntryInfo{};
    info.path = file_info->filename ? file_info->filename : "";
    info.compressed_size = static_cast<uint64_t>(file_info->compressed_size);
    info.uncompressed_size = static_cast<uint64_t>(file_info->uncompressed_size);
    info.crc32 = file_info->crc;
    info.compression_method = file_info->compression_method;
    info.modified_date = file_info->modified_date;
    info.accessed_date = file_info->accessed_date;
    info.creation_date = file_info->creation_date;
    info.flag = file_info->flag;
    info.version_madeby = file_info->version_madeby;
    info.internal_fa = file_info->internal_fa;
    info.external_fa = file_info->external_fa;
    if (file_info->comment) {
        info.comment = file_info->comment;
    }
    info.is_directory = mz_zip_reader_entry_is_dir(unzip_handle_) == MZ_OK;
    return ZipError::Ok;
}

ZipError ZipReader::readCurrentEntry(std::vector<uint8_t>& data) {
    data.clear();
    return drainCurrentEntry(&data);
}

ZipError ZipReader::verifyCurrentEntry() {
    return drainCurrentEntry(nullptr);
}

ZipError ZipReader::drainCurrentEntry(std::vector<uint8_t>* sink) {
    EntryInfo info;
    ZipError err = currentEntryInfo(info);
    if (err != ZipError::Ok) {
        return err;
    }
    if (info.is_directory) {
        return ZipError::Ok;
    }
    if (sink && info.uncompressed_size > core::Constants::kMaxEntryInMemory) {
        ARCHIVE_ERROR("Entry {} is too large to load ({} bytes)", info.path, info.uncompressed_size);
        return ZipError::TooLarge;
    }

    int32_t result = mz_zip_reader_entry_open(unzip_handle_);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to open entry {} in {}, error: {}", info.path, filename_, result);
        return ZipError::BadFormat;
    }

    if (sink) {
        sink->reserve(static_cast<size_t>(info.uncompressed_size));
    }

    std::array<uint8_t, core::Constants::kIOBufferSize> buffer;
    uLong crc = crc32(0L, Z_NULL, 0);
    uint64_t total = 0;
    ZipError status = ZipError::Ok;

    for (;;) {
        int32_t read = mz_zip_reader_entry_read(unzip_handle_, buffer.data(),
                                                static_cast<int32_t>(buffer.size()));
        if (read == 0) {
            break;
        }
        if (read < 0) {
            ARCHIVE_ERROR("Failed to inflate entry {}, error: {}", info.path, read);
            status = read == MZ_CRC_ERROR ? ZipError::CrcMismatch : ZipError::BadFormat;
            break;
        }
        crc = crc32(crc, buffer.data(), static_cast<uInt>(read));
        total += static_cast<uint64_t>(read);
        if (sink) {
            if (sink->size() + static_cast<size_t>(read) > core::Constants::kMaxEntryInMemory) {
                status = ZipError::TooLarge;
                break;
            }
            sink->insert(sink->end(), buffer.data(), buffer.data() + read);
        }
    }

    int32_t close_result = mz_zip_reader_entry_close(unzip_handle_);
    if (status != ZipError::Ok) {
        return status;
    }
    if (close_result == MZ_CRC_ERROR) {
        status = ZipError::CrcMismatch;
    } else if (close_result != MZ_OK) {
        status = ZipError::BadFormat;
    } else if (total != info.uncompressed_size) {
        ARCHIVE_ERROR("Entry {} is truncated: expected {} bytes, got {}",
                      info.path, info.uncompressed_size, total);
        status = ZipError::BadFormat;
    } else if (static_cast<uint32_t>(crc) != info.crc32) {
        status = ZipError::CrcMismatch;
    }

    if (status == ZipError::CrcMismatch) {
        ARCHIVE_ERROR("CRC mismatch in entry {}: expected {:08x}, computed {:08x}",
                      info.path, info.crc32, static_cast<uint32_t>(crc));
    }
    return status;
}

// 条目查询

std::vector<ZipReader::EntryInfo> ZipReader::listEntriesInfo() {
    std::vector<EntryInfo> entries;

    ZipError err = gotoFirstEntry();
    while (err == ZipError::Ok) {
        EntryInfo info;
        if (currentEntryInfo(info) != ZipError::Ok) {
            break;
        }
        entries.push_back(std::move(info));
        err = gotoNextEntry();
    }

    ARCHIVE_DEBUG("Listed {} entries in {}", entries.size(), filename_);
    return entries;
}

std::vector<std::string> ZipReader::listFiles() {
    std::vector<std::string> files;
    for (auto& info : listEntriesInfo()) {
        files.push_back(std::move(info.path));
    }
    return files;
}

ZipError ZipReader::fileExists(std::string_view internal_path) {
    return locateByName(internal_path);
}

ZipError ZipReader::locateByName(std::string_view internal_path) {
    ZipError err = gotoFirstEntry();
    while (err == ZipError::Ok) {
        EntryInfo info;
        err = currentEntryInfo(info);
        if (err != ZipError::Ok) {
            return err;
        }
        if (info.path == internal_path) {
            return ZipError::Ok;
        }
        err = gotoNextEntry();
    }
    return err == ZipError::EndOfEntries ? ZipError::FileNotFound : err;
}

ZipError ZipReader::extractFile(std::string_view internal_path, std::vector<uint8_t>& data) {
    ZipError err = locateByName(internal_path);
    if (err != ZipError::Ok) {
        if (err == ZipError::FileNotFound) {
            ARCHIVE_DEBUG("File {} not found in zip archive", internal_path);
        }
        return err;
    }

    err = readCurrentEntry(data);
    if (err == ZipError::Ok) {
        ARCHIVE_DEBUG("Extracted file {} from zip, size: {} bytes", internal_path, data.size());
    }
    return err;
}

ZipError ZipReader::extractFile(std::string_view internal_path, std::string& content) {
    std::vector<uint8_t> data;
    ZipError result = extractFile(internal_path, data);
    if (result != ZipError::Ok) {
        return result;
    }

    content.assign(data.begin(), data.end());
    return ZipError::Ok;
}

}} // namespace cleansheet::archive
