#pragma once

#include "cosmic/core/Options.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace cosmic {
namespace parser {

/**
 * @brief 预处理后的一行
 */
struct LineRecord {
    size_t indent = 0;        // 前导空格数
    std::string content;      // 去掉缩进和行尾空白后的内容
    size_t line_number = 0;   // 源文件行号（1 起始），仅用于错误信息
};

/**
 * @brief 行预处理器
 *
 * 丢弃空行和整行注释（首个非空白字符为 '#'），不处理行内注释。
 */
class LinePreprocessor {
public:
    /**
     * @brief 切分并预处理原始文本
     * @throws ParseException 缩进中出现制表符且 options.reject_tab_indentation 为 true
     */
    static std::vector<LineRecord> process(std::string_view text,
                                           const core::ParserOptions& options = core::ParserOptions());
};

}} // namespace cosmic::parser
