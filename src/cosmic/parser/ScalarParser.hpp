#pragma once

#include "cosmic/parser/Value.hpp"

#include <optional>
#include <string_view>

namespace cosmic {
namespace parser {

/**
 * @brief 标量类型推断
 *
 * 优先级：成对引号 -> 布尔 -> null -> 整数 -> 浮点（含 '.' 时）-> 原样字符串。
 * 关键字大小写不敏感，不会失败。
 */
class ScalarParser {
public:
    static Value parse(std::string_view token);

    /**
     * @brief 完整解析 64 位整数，允许前导 '+' / '-'
     * @return 无法完整解析或溢出时为空
     */
    static std::optional<int64_t> parseInteger(std::string_view token);

    /**
     * @brief 完整解析浮点数，允许前导 '+' / '-'
     */
    static std::optional<double> parseFloat(std::string_view token);

    /**
     * @brief 去除首尾空白（空格、制表符、回车、换行）
     */
    static std::string_view trim(std::string_view text);
    static std::string_view trimLeft(std::string_view text);
    static std::string_view trimRight(std::string_view text);
};

}} // namespace cosmic::parser
