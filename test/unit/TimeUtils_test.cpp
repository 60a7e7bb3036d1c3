#include "cosmic/utils/TimeUtils.hpp"
#include <gtest/gtest.h>

namespace cosmic {
namespace utils {

// 测试1: Excel 日期序号，纪元为 1899-12-30
TEST(TimeUtilsTest, ExcelSerial) {
    EXPECT_EQ(TimeUtils::toExcelSerial(1899, 12, 30), 0);
    EXPECT_EQ(TimeUtils::toExcelSerial(1899, 12, 31), 1);
    EXPECT_EQ(TimeUtils::toExcelSerial(1900, 1, 1), 2);
    EXPECT_EQ(TimeUtils::toExcelSerial(1900, 3, 1), 61);
    EXPECT_EQ(TimeUtils::toExcelSerial(2024, 1, 1), 45292);
}

// 测试2: 与 Unix 纪元的换算
TEST(TimeUtilsTest, DaysFromCivil) {
    EXPECT_EQ(TimeUtils::daysFromCivil(1970, 1, 1), 0);
    EXPECT_EQ(TimeUtils::daysFromCivil(1970, 1, 2), 1);
    EXPECT_EQ(TimeUtils::daysFromCivil(1969, 12, 31), -1);
    EXPECT_EQ(TimeUtils::daysFromCivil(2000, 3, 1), 11017);
}

// 测试3: 日期合法性
TEST(TimeUtilsTest, DateValidation) {
    EXPECT_TRUE(TimeUtils::isValidDate(2024, 2, 29));
    EXPECT_FALSE(TimeUtils::isValidDate(2023, 2, 29));
    EXPECT_FALSE(TimeUtils::isValidDate(1900, 2, 29));
    EXPECT_TRUE(TimeUtils::isValidDate(2000, 2, 29));
    EXPECT_FALSE(TimeUtils::isValidDate(2024, 13, 1));
    EXPECT_FALSE(TimeUtils::isValidDate(2024, 4, 31));
    EXPECT_FALSE(TimeUtils::isValidDate(2024, 1, 0));

    EXPECT_TRUE(TimeUtils::isLeapYear(2000));
    EXPECT_FALSE(TimeUtils::isLeapYear(1900));
}

}} // namespace cosmic::utils
