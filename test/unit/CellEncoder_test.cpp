#include "cosmic/xml/CellEncoder.hpp"
#include "cosmic/core/Exception.hpp"
#include "cosmic/utils/Logger.hpp"
#include <gtest/gtest.h>
#include <cstdint>
#include <limits>
#include <string>

namespace cosmic {
namespace xml {

class CellEncoderTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("logs/CellEncoder_test.log",
                                         Logger::Level::DEBUG,
                                         false);
    }

    void TearDown() override {
        Logger::getInstance().shutdown();
    }
};

// 测试1: 空单元格只保留引用
TEST_F(CellEncoderTest, AbsentValue) {
    EXPECT_EQ(CellEncoder::encode(core::CellValue(), 1, 1), "<c r=\"A1\"/>");
}

// 测试2: 整数
TEST_F(CellEncoderTest, Integer) {
    EXPECT_EQ(CellEncoder::encode(core::CellValue(int64_t(42)), 1, 1), "<c r=\"A1\"><v>42</v></c>");
    EXPECT_EQ(CellEncoder::encode(core::CellValue(std::numeric_limits<int64_t>::min()), 3, 27),
              "<c r=\"AA3\"><v>-9223372036854775808</v></c>");
}

// 测试3: 浮点数使用最短往返表示
TEST_F(CellEncoderTest, Float) {
    EXPECT_EQ(CellEncoder::encode(core::CellValue(2.5), 2, 3), "<c r=\"C2\"><v>2.5</v></c>");
    EXPECT_EQ(CellEncoder::formatNumber(0.1), "0.1");
    EXPECT_EQ(CellEncoder::formatNumber(-1.25), "-1.25");
}

// 测试4: 非有限数值写为文本
TEST_F(CellEncoderTest, NonFiniteFloatBecomesText) {
    std::string xml = CellEncoder::encode(core::CellValue(std::numeric_limits<double>::infinity()), 1, 1);
    EXPECT_EQ(xml, "<c r=\"A1\" t=\"inlineStr\"><is><t xml:space=\"preserve\">inf</t></is></c>");
}

// 测试5: 日期写为序号并引用日期样式
TEST_F(CellEncoderTest, Date) {
    EXPECT_EQ(CellEncoder::encode(core::CellValue(core::Date{1899, 12, 31}), 1, 1),
              "<c r=\"A1\" s=\"1\"><v>1</v></c>");
    EXPECT_EQ(CellEncoder::encode(core::CellValue(core::Date{2024, 1, 1}), 5, 2),
              "<c r=\"B5\" s=\"1\"><v>45292</v></c>");
}

// 测试6: 非法日期
TEST_F(CellEncoderTest, InvalidDateThrows) {
    EXPECT_THROW(CellEncoder::encode(core::CellValue(core::Date{2023, 2, 29}), 1, 1),
                 core::ParameterException);
}

// 测试7: 内联字符串转义
TEST_F(CellEncoderTest, InlineString) {
    EXPECT_EQ(CellEncoder::encode(core::CellValue(std::string("a & b <c>")), 1, 2),
              "<c r=\"B1\" t=\"inlineStr\"><is><t xml:space=\"preserve\">a &amp; b &lt;c&gt;</t></is></c>");
    EXPECT_EQ(CellEncoder::encode(core::CellValue(std::string("say \"hi\"")), 1, 1),
              "<c r=\"A1\" t=\"inlineStr\"><is><t xml:space=\"preserve\">say &quot;hi&quot;</t></is></c>");
}

// 测试8: 空字符串与前后空白
TEST_F(CellEncoderTest, EmptyAndPaddedStrings) {
    EXPECT_EQ(CellEncoder::encode(core::CellValue(std::string()), 1, 1),
              "<c r=\"A1\" t=\"inlineStr\"><is><t xml:space=\"preserve\"></t></is></c>");
    EXPECT_EQ(CellEncoder::encode(core::CellValue(std::string("  x  ")), 1, 1),
              "<c r=\"A1\" t=\"inlineStr\"><is><t xml:space=\"preserve\">  x  </t></is></c>");
}

// 测试9: 多字节 UTF-8 原样保留，非法序列被替换
TEST_F(CellEncoderTest, Utf8Text) {
    EXPECT_EQ(CellEncoder::encode(core::CellValue(std::string("功能处理")), 1, 1),
              "<c r=\"A1\" t=\"inlineStr\"><is><t xml:space=\"preserve\">功能处理</t></is></c>");

    std::string xml = CellEncoder::encode(core::CellValue(std::string("ok\xFF")), 1, 1);
    EXPECT_EQ(xml.find('\xFF'), std::string::npos);
    EXPECT_NE(xml.find("ok"), std::string::npos);
}

}} // namespace cosmic::xml
