#include "cosmic/parser/ScalarParser.hpp"
#include <gtest/gtest.h>
#include <cstdint>
#include <optional>

namespace cosmic {
namespace parser {

// 测试1: 整数
TEST(ScalarParserTest, ParsesIntegers) {
    Value v = ScalarParser::parse("42");
    ASSERT_TRUE(v.isInteger());
    EXPECT_EQ(v.asInteger(), 42);

    EXPECT_EQ(ScalarParser::parse("-7").asInteger(), -7);
    EXPECT_EQ(ScalarParser::parse("+5").asInteger(), 5);
    EXPECT_EQ(ScalarParser::parse("0").asInteger(), 0);
}

// 测试2: 浮点数需要包含小数点
TEST(ScalarParserTest, ParsesFloatsWithDecimalPoint) {
    Value v = ScalarParser::parse("3.14");
    ASSERT_TRUE(v.isFloat());
    EXPECT_DOUBLE_EQ(v.asFloat(), 3.14);

    EXPECT_DOUBLE_EQ(ScalarParser::parse("-0.5").asFloat(), -0.5);
    EXPECT_DOUBLE_EQ(ScalarParser::parse("1.5e3").asFloat(), 1500.0);

    // 没有小数点的指数形式保持为字符串
    Value exp = ScalarParser::parse("1e5");
    ASSERT_TRUE(exp.isString());
    EXPECT_EQ(exp.asString(), "1e5");

    EXPECT_TRUE(ScalarParser::parse("1.2.3").isString());
}

// 测试3: 布尔与空值不区分大小写
TEST(ScalarParserTest, ParsesBooleansAndNull) {
    EXPECT_TRUE(ScalarParser::parse("true").asBool());
    EXPECT_TRUE(ScalarParser::parse("True").asBool());
    Value upper = ScalarParser::parse("TRUE");
    ASSERT_TRUE(upper.isBool());
    EXPECT_TRUE(upper.asBool());
    EXPECT_FALSE(ScalarParser::parse("FALSE").asBool());
    EXPECT_TRUE(ScalarParser::parse("null").isNull());
    EXPECT_TRUE(ScalarParser::parse("Null").isNull());

    // yes/no 不是布尔
    EXPECT_TRUE(ScalarParser::parse("yes").isString());
}

// 测试4: 成对引号去除，内部文本不做推断
TEST(ScalarParserTest, StripsMatchingQuotes) {
    Value quoted = ScalarParser::parse("\"42\"");
    ASSERT_TRUE(quoted.isString());
    EXPECT_EQ(quoted.asString(), "42");

    Value single = ScalarParser::parse("'42'");
    ASSERT_TRUE(single.isString());
    EXPECT_EQ(single.asString(), "42");

    EXPECT_EQ(ScalarParser::parse("'hello world'").asString(), "hello world");
    EXPECT_EQ(ScalarParser::parse("'true'").asString(), "true");
    EXPECT_EQ(ScalarParser::parse("''").asString(), "");

    // 引号不匹配时原样保留
    EXPECT_EQ(ScalarParser::parse("'mixed\"").asString(), "'mixed\"");
    EXPECT_EQ(ScalarParser::parse("\"").asString(), "\"");
}

// 测试5: 超出 int64 的整数退化为字符串
TEST(ScalarParserTest, OverflowingIntegerStaysString) {
    Value v = ScalarParser::parse("99999999999999999999");
    ASSERT_TRUE(v.isString());
    EXPECT_EQ(v.asString(), "99999999999999999999");

    EXPECT_EQ(ScalarParser::parse("9223372036854775807").asInteger(), INT64_MAX);
}

// 测试6: 普通文本
TEST(ScalarParserTest, PlainText) {
    EXPECT_EQ(ScalarParser::parse("Customer places order").asString(), "Customer places order");
    EXPECT_EQ(ScalarParser::parse("12abc").asString(), "12abc");
    EXPECT_EQ(ScalarParser::parse("+-1").asString(), "+-1");
}

// 测试7: 空白裁剪
TEST(ScalarParserTest, Trim) {
    EXPECT_EQ(ScalarParser::trim("  a b \t"), "a b");
    EXPECT_EQ(ScalarParser::trimLeft("  a "), "a ");
    EXPECT_EQ(ScalarParser::trimRight("  a \r"), "  a");
    EXPECT_EQ(ScalarParser::trim("   "), "");
}

TEST(ScalarParserTest, NumberHelpers) {
    EXPECT_EQ(ScalarParser::parseInteger("123"), std::optional<int64_t>(123));
    EXPECT_FALSE(ScalarParser::parseInteger("12.5").has_value());
    EXPECT_FALSE(ScalarParser::parseInteger("").has_value());
    ASSERT_TRUE(ScalarParser::parseFloat("2.25").has_value());
    EXPECT_DOUBLE_EQ(*ScalarParser::parseFloat("2.25"), 2.25);
    EXPECT_FALSE(ScalarParser::parseFloat("abc").has_value());
}

}} // namespace cosmic::parser
