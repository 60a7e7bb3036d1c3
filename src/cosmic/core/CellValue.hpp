#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace cosmic {
namespace core {

/**
 * @brief 公历日期（无时间部分）
 */
struct Date {
    int year = 1899;
    unsigned month = 12;
    unsigned day = 30;

    bool operator==(const Date& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator!=(const Date& other) const { return !(*this == other); }
};

/**
 * @brief 单元格值：空 / 整数 / 浮点 / 字符串 / 日期
 */
using CellValue = std::variant<std::monostate, int64_t, double, std::string, Date>;

using Row = std::vector<CellValue>;

/**
 * @brief 工作表：名称 + 行
 *
 * 第一行通常为表头，写出时不做区分。
 */
struct Sheet {
    std::string name;
    std::vector<Row> rows;
};

}} // namespace cosmic::core
