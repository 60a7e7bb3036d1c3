#pragma once

#include <cstddef>
#include <string>

namespace cosmic {
namespace core {

/**
 * @brief 包部件写入接口
 *
 * 部件可以一次写入（writeFile），也可以分块写入
 * （openStreamingFile / writeStreamingChunk / closeStreamingFile）。
 */
class IFileWriter {
public:
    virtual ~IFileWriter() = default;

    /**
     * @brief 写入完整部件内容
     * @param path 归档内路径
     * @param content 部件内容
     * @return 是否成功
     */
    virtual bool writeFile(const std::string& path, const std::string& content) = 0;

    virtual bool openStreamingFile(const std::string& path) = 0;
    virtual bool writeStreamingChunk(const char* data, size_t size) = 0;
    virtual bool closeStreamingFile() = 0;

    /**
     * @brief 把已收集的部件提交到底层归档
     * @return 是否成功
     */
    virtual bool flush() = 0;

    virtual std::string getTypeName() const = 0;

    struct WriteStats {
        size_t files_written = 0;
        size_t total_bytes = 0;
        size_t streaming_files = 0;
        size_t batch_files = 0;
    };

    virtual WriteStats getStats() const = 0;
};

}} // namespace cosmic::core
