#include "cosmic/utils/ColumnReferenceUtils.hpp"
#include "cosmic/core/Exception.hpp"
#include <gtest/gtest.h>

namespace cosmic {
namespace utils {

// 测试1: 列号转字母
TEST(ColumnReferenceUtilsTest, ColumnToLetters) {
    EXPECT_EQ(ColumnReferenceUtils::columnToLetters(1), "A");
    EXPECT_EQ(ColumnReferenceUtils::columnToLetters(26), "Z");
    EXPECT_EQ(ColumnReferenceUtils::columnToLetters(27), "AA");
    EXPECT_EQ(ColumnReferenceUtils::columnToLetters(52), "AZ");
    EXPECT_EQ(ColumnReferenceUtils::columnToLetters(702), "ZZ");
    EXPECT_EQ(ColumnReferenceUtils::columnToLetters(703), "AAA");
    EXPECT_EQ(ColumnReferenceUtils::columnToLetters(ColumnReferenceUtils::MAX_COLUMN), "XFD");
}

// 测试2: 列号从 1 开始
TEST(ColumnReferenceUtilsTest, ZeroColumnThrows) {
    EXPECT_THROW(ColumnReferenceUtils::columnToLetters(0), core::ParameterException);
}

// 测试3: 字母转列号
TEST(ColumnReferenceUtilsTest, ParseColumnOnly) {
    EXPECT_EQ(ColumnReferenceUtils::parseColumnOnly("A"), 1u);
    EXPECT_EQ(ColumnReferenceUtils::parseColumnOnly("zz"), 702u);
    EXPECT_EQ(ColumnReferenceUtils::parseColumnOnly("XFD"), 16384u);
    EXPECT_EQ(ColumnReferenceUtils::parseColumnOnly(""), 0u);
    EXPECT_EQ(ColumnReferenceUtils::parseColumnOnly("A1"), 0u);

    for (uint32_t col : {1u, 26u, 27u, 702u, 703u, 16384u}) {
        EXPECT_EQ(ColumnReferenceUtils::parseColumnOnly(ColumnReferenceUtils::columnToLetters(col)), col);
    }
}

TEST(ColumnReferenceUtilsTest, CellReference) {
    EXPECT_EQ(ColumnReferenceUtils::cellReference(1, 1), "A1");
    EXPECT_EQ(ColumnReferenceUtils::cellReference(10, 28), "AB10");
    EXPECT_EQ(ColumnReferenceUtils::cellReference(1048576, 16384), "XFD1048576");
}

}} // namespace cosmic::utils
