#pragma once

#include "cosmic/core/CellValue.hpp"
#include "cosmic/xml/XMLStreamWriter.hpp"

#include <cstdint>
#include <string>

namespace cosmic {
namespace xml {

/**
 * @brief 单元格编码器
 *
 * 把单个 CellValue 编码为最小的 <c> 元素：
 * - 空值：<c r="A1"/>
 * - 整数/浮点：<c r="A1"><v>42</v></c>
 * - 日期：<c r="A1" s="1"><v>序列号</v></c>
 * - 字符串：内联字符串，保留空白
 */
class CellEncoder {
public:
    // 日期单元格使用的样式索引（见 StyleSerializer）
    static constexpr int DATE_STYLE_INDEX = 1;

    /**
     * @brief 编码到写入器
     * @param value 单元格值
     * @param row 行号（1 起始）
     * @param col 列号（1 起始）
     * @param writer XML写入器
     */
    static void encode(const core::CellValue& value, uint32_t row, uint32_t col, XMLStreamWriter& writer);

    static std::string encode(const core::CellValue& value, uint32_t row, uint32_t col);

    /**
     * @brief 数值的文本形式，与区域设置无关
     *
     * 浮点数使用最短往返表示。
     */
    static std::string formatNumber(int64_t value);
    static std::string formatNumber(double value);

private:
    static void writeInlineString(std::string_view text, XMLStreamWriter& writer);
};

}} // namespace cosmic::xml
