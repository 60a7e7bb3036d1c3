/**
 * @file ColumnReferenceUtils.cpp
 * @brief 列引用与单元格引用工具实现
 */

#include "cosmic/utils/ColumnReferenceUtils.hpp"
#include "cosmic/core/Exception.hpp"

#include <algorithm>
#include <fmt/format.h>

namespace cosmic {
namespace utils {

std::string ColumnReferenceUtils::columnToLetters(uint32_t column) {
    if (column == 0) {
        COSMIC_THROW(core::ParameterException, "Column number must be 1-based", "column");
    }

    // 每一位取 (n-1) % 26，保证没有“零”字母
    char letters[8];
    size_t len = 0;
    uint32_t n = column;
    while (n > 0) {
        uint32_t rem = (n - 1) % 26;
        letters[len++] = static_cast<char>('A' + rem);
        n = (n - 1) / 26;
    }
    std::reverse(letters, letters + len);
    return std::string(letters, len);
}

uint32_t ColumnReferenceUtils::parseColumnOnly(std::string_view col_ref) {
    if (col_ref.empty() || col_ref.size() > 7) return 0;

    uint32_t result = 0;
    for (char c : col_ref) {
        if (c >= 'a' && c <= 'z') {
            c = static_cast<char>(c - 'a' + 'A');
        }
        if (c < 'A' || c > 'Z') {
            return 0;
        }
        result = result * 26 + static_cast<uint32_t>(c - 'A' + 1);
    }
    return result;
}

std::string ColumnReferenceUtils::cellReference(uint32_t row, uint32_t column) {
    return fmt::format("{}{}", columnToLetters(column), row);
}

}} // namespace cosmic::utils
