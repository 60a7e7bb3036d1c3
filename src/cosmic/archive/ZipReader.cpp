#include "cosmic/archive/ZipReader.hpp"
#include "cosmic/utils/ModuleLoggers.hpp"

#include <mz.h>
#include <mz_strm.h>
#include <mz_zip.h>
#include <mz_zip_rw.h>

namespace cosmic {
namespace archive {

ZipReader::ZipReader(const core::Path& path)
    : filepath_(path) {
}

ZipReader::~ZipReader() {
    cleanup();
}

bool ZipReader::open() {
    cleanup();
    return initializeReader();
}

void ZipReader::close() {
    cleanup();
}

std::vector<std::string> ZipReader::listFiles() const {
    std::vector<std::string> files;
    files.reserve(entries_.size());
    for (const auto& entry : entries_) {
        files.push_back(entry.path);
    }
    return files;
}

ZipError ZipReader::fileExists(std::string_view internal_path) const {
    if (!is_open_ || !unzip_handle_) {
        return ZipError::NotOpen;
    }
    for (const auto& entry : entries_) {
        if (entry.path == internal_path) {
            return ZipError::Ok;
        }
    }
    return ZipError::FileNotFound;
}

ZipError ZipReader::extractFile(std::string_view internal_path, std::string& content) const {
    if (!is_open_ || !unzip_handle_) {
        ARCHIVE_ERROR("Zip archive not opened for reading");
        return ZipError::NotOpen;
    }

    std::string path_str(internal_path);
    if (mz_zip_reader_locate_entry(unzip_handle_, path_str.c_str(), 0) != MZ_OK) {
        ARCHIVE_ERROR("File {} not found in zip archive", path_str);
        return ZipError::FileNotFound;
    }

    mz_zip_file* info = nullptr;
    if (mz_zip_reader_entry_get_info(unzip_handle_, &info) != MZ_OK || !info) {
        return ZipError::BadFormat;
    }

    if (mz_zip_reader_entry_open(unzip_handle_) != MZ_OK) {
        ARCHIVE_ERROR("Failed to open entry: {}", path_str);
        return ZipError::IoFail;
    }

    std::string buffer(static_cast<size_t>(info->uncompressed_size), '\0');
    size_t total = 0;
    while (total < buffer.size()) {
        int32_t read = mz_zip_reader_entry_read(unzip_handle_, &buffer[total],
                                                static_cast<int32_t>(buffer.size() - total));
        if (read <= 0) {
            break;
        }
        total += static_cast<size_t>(read);
    }
    mz_zip_reader_entry_close(unzip_handle_);

    if (total != buffer.size()) {
        ARCHIVE_ERROR("Incomplete read for {}, expected: {} bytes, read: {} bytes",
                      path_str, buffer.size(), total);
        return ZipError::IoFail;
    }

    content.swap(buffer);
    ARCHIVE_DEBUG("Extracted {} from zip, size: {} bytes", path_str, content.size());
    return ZipError::Ok;
}

bool ZipReader::initializeReader() {
    unzip_handle_ = mz_zip_reader_create();
    if (!unzip_handle_) {
        ARCHIVE_ERROR("Failed to create zip reader");
        return false;
    }

    int32_t result = mz_zip_reader_open_file(unzip_handle_, filepath_.c_str());
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to open zip file for reading: {}, error: {}", filepath_.string(), result);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
        return false;
    }

    is_open_ = true;
    buildEntryList();
    ARCHIVE_DEBUG("Zip archive opened for reading: {} ({} entries)", filepath_.string(), entries_.size());
    return true;
}

void ZipReader::buildEntryList() {
    entries_.clear();

    if (mz_zip_reader_goto_first_entry(unzip_handle_) != MZ_OK) {
        return;
    }

    do {
        mz_zip_file* file_info = nullptr;
        if (mz_zip_reader_entry_get_info(unzip_handle_, &file_info) == MZ_OK && file_info &&
            file_info->filename && file_info->filename[0] != '\0') {
            EntryInfo info;
            info.path = file_info->filename;
            info.compressed_size = file_info->compressed_size;
            info.uncompressed_size = file_info->uncompressed_size;
            info.crc32 = file_info->crc;
            info.compression_method = file_info->compression_method;
            info.modified_date = file_info->modified_date;
            entries_.push_back(std::move(info));
        }
    } while (mz_zip_reader_goto_next_entry(unzip_handle_) == MZ_OK);
}

void ZipReader::cleanup() {
    if (unzip_handle_) {
        mz_zip_reader_close(unzip_handle_);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
    }
    is_open_ = false;
    entries_.clear();
}

}} // namespace cosmic::archive
