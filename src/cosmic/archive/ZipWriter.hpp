#pragma once

#include "cosmic/archive/ZipError.hpp"
#include "cosmic/core/Options.hpp"
#include "cosmic/core/Path.hpp"

#include <cstdint>
#include <ctime>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace cosmic {
namespace archive {

/**
 * @brief ZIP写入器
 *
 * 特性：
 * - 条目按添加顺序写入
 * - 所有条目使用同一个固定时间戳，相同输入产生相同字节
 * - 防重复写入
 */
class ZipWriter {
public:
    // 文件条目结构
    struct FileEntry {
        std::string internal_path;
        std::string content;

        FileEntry() = default;

        FileEntry(std::string path, std::string data)
            : internal_path(std::move(path)), content(std::move(data)) {}
    };

    struct Stats {
        size_t entries_written = 0;
        size_t bytes_written = 0;   // 未压缩字节数
    };

    explicit ZipWriter(const core::Path& path);
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    /**
     * 创建ZIP文件进行写入，已存在的文件会被替换
     * @return 是否成功
     */
    bool open();

    /**
     * 写出中央目录并关闭
     * @return 是否成功
     */
    bool close();

    bool isOpen() const { return is_open_; }

    /**
     * 添加文件
     * @param internal_path ZIP内部路径
     * @param content 文件内容
     * @return 错误码
     */
    ZipError addFile(std::string_view internal_path, std::string_view content);

    /**
     * 按顺序批量添加文件，遇到第一个错误即停止
     */
    ZipError addFiles(std::vector<FileEntry>&& files);

    /**
     * 设置压缩级别
     * @param level 0-9，0 表示仅存储
     */
    ZipError setCompressionLevel(int level);
    int getCompressionLevel() const { return compression_level_; }

    /**
     * 设置条目时间戳（须在写入条目之前调用）
     */
    ZipError setEntryTimestamp(const core::ArchiveTimestamp& timestamp);

    bool hasEntry(const std::string& internal_path) const {
        return written_paths_.count(internal_path) > 0;
    }

    const core::Path& getPath() const { return filepath_; }
    Stats getStats() const { return stats_; }

private:
    bool initializeWriter();
    void cleanup();
    ZipError writeFileEntry(std::string_view internal_path, const void* data, size_t size);

    /**
     * @brief 时间戳字段按本地时间换算为 time_t
     *
     * minizip 以 localtime 把 time_t 转回 DOS 日期，
     * 因此写入归档的字段与传入的字段相同。
     */
    static std::time_t toLocalTime(const core::ArchiveTimestamp& timestamp);

    void* zip_handle_ = nullptr;
    core::Path filepath_;
    bool is_open_ = false;
    int compression_level_ = 6;
    std::time_t entry_time_ = 0;

    std::unordered_set<std::string> written_paths_;
    Stats stats_;
};

}} // namespace cosmic::archive
