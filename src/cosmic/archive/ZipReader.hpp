#pragma once

#include "cosmic/archive/ZipError.hpp"
#include "cosmic/core/Path.hpp"

#include <cstdint>
#include <ctime>
#include <string>
#include <string_view>
#include <vector>

namespace cosmic {
namespace archive {

/**
 * @brief ZIP读取器
 *
 * 用于回读生成的工作簿（校验与测试），条目按归档中的顺序列出。
 */
class ZipReader {
public:
    struct EntryInfo {
        std::string path;
        int64_t compressed_size = 0;
        int64_t uncompressed_size = 0;
        uint32_t crc32 = 0;
        uint16_t compression_method = 0;
        std::time_t modified_date = 0;
    };

    explicit ZipReader(const core::Path& path);
    ~ZipReader();

    ZipReader(const ZipReader&) = delete;
    ZipReader& operator=(const ZipReader&) = delete;

    bool open();
    void close();
    bool isOpen() const { return is_open_; }

    /**
     * @brief 按归档顺序返回条目路径
     */
    std::vector<std::string> listFiles() const;
    const std::vector<EntryInfo>& entries() const { return entries_; }

    ZipError fileExists(std::string_view internal_path) const;

    /**
     * @brief 解压单个条目
     * @param internal_path ZIP内部路径
     * @param content 输出内容
     * @return 错误码
     */
    ZipError extractFile(std::string_view internal_path, std::string& content) const;

private:
    bool initializeReader();
    void buildEntryList();
    void cleanup();

    void* unzip_handle_ = nullptr;
    core::Path filepath_;
    bool is_open_ = false;
    std::vector<EntryInfo> entries_;
};

}} // namespace cosmic::archive
