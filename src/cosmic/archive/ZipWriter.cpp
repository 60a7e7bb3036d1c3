#include "cosmic/archive/ZipWriter.hpp"
#include "cosmic/utils/ModuleLoggers.hpp"

#include <mz.h>
#include <mz_strm.h>
#include <mz_zip.h>
#include <mz_zip_rw.h>

#include <climits>
#include <cstring>

namespace cosmic {
namespace archive {

ZipWriter::ZipWriter(const core::Path& path)
    : filepath_(path) {
    entry_time_ = toLocalTime(core::ArchiveTimestamp());
}

ZipWriter::~ZipWriter() {
    cleanup();
}

bool ZipWriter::open() {
    cleanup();
    stats_ = Stats();
    return initializeWriter();
}

bool ZipWriter::close() {
    // 已关闭时直接返回成功
    if (!is_open_ || !zip_handle_) {
        return true;
    }

    bool success = true;

    // 中央目录在此写出，失败意味着归档不可用
    int32_t result = mz_zip_writer_close(zip_handle_);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to finalize ZIP file: {}, error code: {}", filepath_.string(), result);
        success = false;
    } else {
        ARCHIVE_DEBUG("ZIP file finalized: {} ({} entries, {} bytes)",
                      filepath_.string(), stats_.entries_written, stats_.bytes_written);
    }

    mz_zip_writer_delete(&zip_handle_);
    zip_handle_ = nullptr;

    is_open_ = false;
    written_paths_.clear();

    return success;
}

ZipError ZipWriter::addFile(std::string_view internal_path, std::string_view content) {
    if (!is_open_ || !zip_handle_) {
        ARCHIVE_ERROR("Zip archive not opened for writing");
        return ZipError::NotOpen;
    }
    return writeFileEntry(internal_path, content.data(), content.size());
}

ZipError ZipWriter::addFiles(std::vector<FileEntry>&& files) {
    if (!is_open_ || !zip_handle_) {
        ARCHIVE_ERROR("Zip archive not opened for writing");
        return ZipError::NotOpen;
    }

    for (auto& file : files) {
        ZipError result = writeFileEntry(file.internal_path, file.content.data(), file.content.size());
        if (result != ZipError::Ok) {
            return result;
        }
        // 写入后立即释放内容
        std::string().swap(file.content);
    }

    ARCHIVE_DEBUG("Batch wrote {} files to {}", files.size(), filepath_.string());
    return ZipError::Ok;
}

ZipError ZipWriter::setCompressionLevel(int level) {
    if (level < 0 || level > 9) {
        ARCHIVE_ERROR("Invalid compression level: {}", level);
        return ZipError::InvalidParameter;
    }

    compression_level_ = level;
    if (zip_handle_) {
        mz_zip_writer_set_compress_level(zip_handle_, static_cast<int16_t>(level));
        mz_zip_writer_set_compress_method(zip_handle_,
            level == 0 ? MZ_COMPRESS_METHOD_STORE : MZ_COMPRESS_METHOD_DEFLATE);
    }
    return ZipError::Ok;
}

ZipError ZipWriter::setEntryTimestamp(const core::ArchiveTimestamp& timestamp) {
    // DOS 日期只能表示 1980-2107
    if (timestamp.year < 1980 || timestamp.year > 2107 ||
        timestamp.month < 1 || timestamp.month > 12 ||
        timestamp.day < 1 || timestamp.day > 31 ||
        timestamp.hour < 0 || timestamp.hour > 23 ||
        timestamp.minute < 0 || timestamp.minute > 59 ||
        timestamp.second < 0 || timestamp.second > 59) {
        ARCHIVE_ERROR("Invalid entry timestamp {}-{}-{} {}:{}:{}",
                      timestamp.year, timestamp.month, timestamp.day,
                      timestamp.hour, timestamp.minute, timestamp.second);
        return ZipError::InvalidParameter;
    }

    entry_time_ = toLocalTime(timestamp);
    return ZipError::Ok;
}

// 内部辅助方法

bool ZipWriter::initializeWriter() {
    ARCHIVE_DEBUG("Initializing ZIP writer for file: {}", filepath_.string());

    zip_handle_ = mz_zip_writer_create();
    if (!zip_handle_) {
        ARCHIVE_ERROR("Failed to create zip writer");
        return false;
    }

    mz_zip_writer_set_compress_method(zip_handle_,
        compression_level_ == 0 ? MZ_COMPRESS_METHOD_STORE : MZ_COMPRESS_METHOD_DEFLATE);
    mz_zip_writer_set_compress_level(zip_handle_, static_cast<int16_t>(compression_level_));

    if (filepath_.exists()) {
        if (!filepath_.remove()) {
            ARCHIVE_ERROR("Failed to remove existing file: {}", filepath_.string());
            mz_zip_writer_delete(&zip_handle_);
            zip_handle_ = nullptr;
            return false;
        }
        ARCHIVE_DEBUG("Removed existing zip file: {}", filepath_.string());
    }

    int32_t result = mz_zip_writer_open_file(zip_handle_, filepath_.c_str(), 0, 0);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to open zip file for writing: {}, error: {}", filepath_.string(), result);
        mz_zip_writer_delete(&zip_handle_);
        zip_handle_ = nullptr;
        return false;
    }

    // 禁用 Data Descriptor，尺寸与 CRC 写在本地文件头中
    void* zip_handle = nullptr;
    if (mz_zip_writer_get_zip_handle(zip_handle_, &zip_handle) == MZ_OK && zip_handle) {
        mz_zip_set_data_descriptor(zip_handle, 0);
    }

    is_open_ = true;
    return true;
}

void ZipWriter::cleanup() {
    if (is_open_ && zip_handle_) {
        if (!close()) {
            ARCHIVE_WARN("ZIP writer for {} was not finalized cleanly", filepath_.string());
        }
    } else if (zip_handle_) {
        mz_zip_writer_delete(&zip_handle_);
        zip_handle_ = nullptr;
    }

    is_open_ = false;
    written_paths_.clear();
}

std::time_t ZipWriter::toLocalTime(const core::ArchiveTimestamp& timestamp) {
    std::tm local{};
    local.tm_year = timestamp.year - 1900;
    local.tm_mon = timestamp.month - 1;
    local.tm_mday = timestamp.day;
    local.tm_hour = timestamp.hour;
    local.tm_min = timestamp.minute;
    local.tm_sec = timestamp.second;
    local.tm_isdst = -1;
    return std::mktime(&local);
}

ZipError ZipWriter::writeFileEntry(std::string_view internal_path, const void* data, size_t size) {
    std::string path_str(internal_path);

    if (path_str.empty()) {
        ARCHIVE_ERROR("Empty entry path");
        return ZipError::InvalidParameter;
    }

    if (written_paths_.count(path_str) > 0) {
        ARCHIVE_ERROR("Entry {} already written to {}", path_str, filepath_.string());
        return ZipError::DuplicateEntry;
    }

    if (size > static_cast<size_t>(INT32_MAX)) {
        ARCHIVE_ERROR("Entry {} is too large ({} bytes)", path_str, size);
        return ZipError::InvalidParameter;
    }

    mz_zip_file file_info;
    std::memset(&file_info, 0, sizeof(file_info));
    file_info.filename = path_str.c_str();
    file_info.uncompressed_size = static_cast<int64_t>(size);
    file_info.compression_method = compression_level_ == 0
        ? MZ_COMPRESS_METHOD_STORE : MZ_COMPRESS_METHOD_DEFLATE;
    file_info.modified_date = entry_time_;
    file_info.flag = MZ_ZIP_FLAG_UTF8;
    file_info.version_madeby = (MZ_HOST_SYSTEM_UNIX << 8) | 20;

    int32_t result = mz_zip_writer_entry_open(zip_handle_, &file_info);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to open entry {} in zip, error: {}", path_str, result);
        return ZipError::IoFail;
    }

    if (size > 0) {
        int32_t written = mz_zip_writer_entry_write(zip_handle_, data, static_cast<int32_t>(size));
        if (written != static_cast<int32_t>(size)) {
            ARCHIVE_ERROR("Failed to write complete data for {} ({} of {} bytes)", path_str, written, size);
            mz_zip_writer_entry_close(zip_handle_);
            return ZipError::CompressionFail;
        }
    }

    result = mz_zip_writer_entry_close(zip_handle_);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to close entry {} in zip, error: {}", path_str, result);
        return ZipError::IoFail;
    }

    written_paths_.insert(path_str);
    stats_.entries_written++;
    stats_.bytes_written += size;

    ARCHIVE_DEBUG("Added {} to zip, size: {} bytes", path_str, size);
    return ZipError::Ok;
}

}} // namespace cosmic::archive
