#pragma once

#include "cosmic/core/IFileWriter.hpp"

#include <string>
#include <utility>
#include <vector>

namespace cosmic {
namespace archive {
class ZipWriter;
}

namespace core {

/**
 * @brief 批量部件写入器
 *
 * 先把所有部件收集在内存中，flush() 时按收集顺序一次写入 ZIP。
 * 生成过程中途失败时归档里不会出现任何部件。
 */
class BatchFileWriter : public IFileWriter {
public:
    /**
     * @param zip_writer 已打开的ZIP写入器（不持有）
     * @throws ParameterException zip_writer 为空
     */
    explicit BatchFileWriter(archive::ZipWriter* zip_writer);
    ~BatchFileWriter() override;

    bool writeFile(const std::string& path, const std::string& content) override;
    bool openStreamingFile(const std::string& path) override;
    bool writeStreamingChunk(const char* data, size_t size) override;
    bool closeStreamingFile() override;
    std::string getTypeName() const override { return "BatchFileWriter"; }
    WriteStats getStats() const override { return stats_; }

    // 按收集顺序写入所有部件
    bool flush() override;

    size_t getFileCount() const { return files_.size(); }

private:
    bool hasPath(const std::string& path) const;

    std::vector<std::pair<std::string, std::string>> files_;
    archive::ZipWriter* zip_writer_;

    // 流式写入的临时状态
    std::string current_path_;
    std::string current_content_;
    bool streaming_file_open_ = false;

    WriteStats stats_;
};

}} // namespace cosmic::core
