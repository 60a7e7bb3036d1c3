#include "cosmic/core/BatchFileWriter.hpp"
#include "cosmic/archive/ZipWriter.hpp"
#include "cosmic/core/Exception.hpp"
#include "cosmic/utils/ModuleLoggers.hpp"

namespace cosmic {
namespace core {

BatchFileWriter::BatchFileWriter(archive::ZipWriter* zip_writer)
    : zip_writer_(zip_writer) {
    if (!zip_writer_) {
        COSMIC_THROW(ParameterException, "ZipWriter cannot be null", "zip_writer");
    }
}

BatchFileWriter::~BatchFileWriter() {
    if (streaming_file_open_) {
        CORE_WARN("BatchFileWriter destroyed with open streaming file: {}", current_path_);
    }
}

bool BatchFileWriter::hasPath(const std::string& path) const {
    for (const auto& file : files_) {
        if (file.first == path) return true;
    }
    return false;
}

bool BatchFileWriter::writeFile(const std::string& path, const std::string& content) {
    if (streaming_file_open_) {
        CORE_ERROR("Cannot write {} while streaming file {} is open", path, current_path_);
        return false;
    }
    if (hasPath(path)) {
        CORE_ERROR("Part {} already collected", path);
        return false;
    }

    files_.emplace_back(path, content);
    stats_.batch_files++;
    stats_.total_bytes += content.size();

    CORE_DEBUG("Collected part for batch write: {} ({} bytes)", path, content.size());
    return true;
}

bool BatchFileWriter::openStreamingFile(const std::string& path) {
    if (streaming_file_open_) {
        CORE_ERROR("Streaming file already open: {}", current_path_);
        return false;
    }
    if (hasPath(path)) {
        CORE_ERROR("Part {} already collected", path);
        return false;
    }

    current_path_ = path;
    current_content_.clear();
    streaming_file_open_ = true;
    return true;
}

bool BatchFileWriter::writeStreamingChunk(const char* data, size_t size) {
    if (!streaming_file_open_) {
        CORE_ERROR("No streaming file is open");
        return false;
    }
    if (!data || size == 0) {
        return true;
    }
    current_content_.append(data, size);
    return true;
}

bool BatchFileWriter::closeStreamingFile() {
    if (!streaming_file_open_) {
        CORE_ERROR("No streaming file is open");
        return false;
    }

    stats_.streaming_files++;
    stats_.total_bytes += current_content_.size();
    CORE_DEBUG("Collected streamed part: {} ({} bytes)", current_path_, current_content_.size());

    files_.emplace_back(std::move(current_path_), std::move(current_content_));
    current_path_.clear();
    current_content_.clear();
    streaming_file_open_ = false;
    return true;
}

bool BatchFileWriter::flush() {
    if (streaming_file_open_) {
        CORE_ERROR("Cannot flush while streaming file {} is open", current_path_);
        return false;
    }

    if (files_.empty()) {
        CORE_DEBUG("No parts to flush");
        return true;
    }

    const size_t count = files_.size();
    CORE_DEBUG("Flushing {} parts ({} bytes)", count, stats_.total_bytes);

    std::vector<archive::ZipWriter::FileEntry> entries;
    entries.reserve(count);
    for (auto& file : files_) {
        entries.emplace_back(std::move(file.first), std::move(file.second));
    }
    files_.clear();

    archive::ZipError result = zip_writer_->addFiles(std::move(entries));
    if (result != archive::ZipError::Ok) {
        CORE_ERROR("Failed to write parts to {}: {}", zip_writer_->getPath().string(), archive::toString(result));
        return false;
    }

    stats_.files_written += count;
    return true;
}

}} // namespace cosmic::core
