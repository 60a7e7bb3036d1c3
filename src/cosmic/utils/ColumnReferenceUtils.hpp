/**
 * @file ColumnReferenceUtils.hpp
 * @brief 列引用与单元格引用工具
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace cosmic {
namespace utils {

/**
 * @brief 列字母与列号之间的双射转换（双射 26 进制，无零位）
 *
 * 1 -> A, 26 -> Z, 27 -> AA, 702 -> ZZ, 703 -> AAA
 */
class ColumnReferenceUtils {
public:
    // Excel 支持的最大列号（XFD）
    static constexpr uint32_t MAX_COLUMN = 16384;

    /**
     * @brief 列号转列字母
     * @param column 列号（1-based）
     * @throws ParameterException column 为 0
     */
    static std::string columnToLetters(uint32_t column);

    /**
     * @brief 解析纯列引用到列号
     * @param col_ref 列引用（如 "C", "AA"），大小写不敏感
     * @return 列号（1-based），非法输入返回 0
     */
    static uint32_t parseColumnOnly(std::string_view col_ref);

    /**
     * @brief 生成单元格引用，例如 (1, 1) -> "A1"
     * @param row 行号（1-based）
     * @param column 列号（1-based）
     */
    static std::string cellReference(uint32_t row, uint32_t column);
};

}} // namespace cosmic::utils
