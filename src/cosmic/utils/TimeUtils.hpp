#pragma once

#include <cstdint>

namespace cosmic {
namespace utils {

/**
 * @brief 时间工具类 - 日历日期与 Excel 序列号之间的换算
 *
 * 使用纯整数的公历算法，不依赖时区和 mktime。
 * Excel 序列号以 1899-12-30 为 0 日（1900 日期系统，含闰年缺陷补偿）。
 */
class TimeUtils {
public:
    /**
     * @brief 公历日期转距 1970-01-01 的天数（可为负）
     */
    static int64_t daysFromCivil(int year, unsigned month, unsigned day) {
        year -= month <= 2 ? 1 : 0;
        const int64_t era = (year >= 0 ? year : year - 399) / 400;
        const unsigned yoe = static_cast<unsigned>(year - era * 400);
        const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
        const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + static_cast<int64_t>(doe) - 719468;
    }

    /**
     * @brief 日期转 Excel 序列号
     *
     * 1899-12-31 -> 1，1900-01-01 -> 2
     */
    static int64_t toExcelSerial(int year, unsigned month, unsigned day) {
        return daysFromCivil(year, month, day) - daysFromCivil(1899, 12, 30);
    }

    /**
     * @brief 校验年月日组合是否为合法公历日期
     */
    static bool isValidDate(int year, unsigned month, unsigned day) {
        if (month < 1 || month > 12 || day < 1) return false;
        static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        unsigned limit = kDays[month - 1];
        if (month == 2 && isLeapYear(year)) {
            limit = 29;
        }
        return day <= limit;
    }

    static bool isLeapYear(int year) {
        return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    }
};

}} // namespace cosmic::utils
