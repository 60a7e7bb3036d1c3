#pragma once

#include "cosmic/utils/Logger.hpp"

#include <cstdint>
#include <string>

namespace cosmic {
namespace core {

/**
 * @file Options.hpp
 * @brief 解析与导出的配置选项
 */

/**
 * @brief 文档解析后端
 */
enum class ParserBackend {
    Auto,      // 自动选择：.json 使用 yaml-cpp，其余使用内置解析器
    Builtin,   // 内置缩进解析器
    YamlCpp    // yaml-cpp 完整解析器
};

/**
 * @brief 解析选项
 */
struct ParserOptions {
    ParserBackend backend = ParserBackend::Auto;
    bool reject_tab_indentation = true;   // 缩进中出现制表符时报错
};

/**
 * @brief ZIP 条目时间戳（本地时间字段）
 */
struct ArchiveTimestamp {
    int year = 1980;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;
};

/**
 * @brief 工作簿导出选项
 */
struct ExportOptions {
    int compression_level = 6;          // ZIP压缩级别（0 为仅存储）
    bool atomic_write = true;           // 先写临时文件再重命名
    std::string temp_suffix = ".tmp";   // 临时文件后缀
    ArchiveTimestamp entry_timestamp;   // 所有条目使用固定时间戳
};

/**
 * @brief 日志选项（命令行使用）
 */
struct LogOptions {
    std::string path;                           // 为空则不写文件
    Logger::Level level = Logger::Level::INFO;
    bool console = true;
};

}} // namespace cosmic::core
