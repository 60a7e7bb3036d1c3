#include "cosmic/xml/XMLStreamWriter.hpp"
#include "cosmic/core/Exception.hpp"
#include "cosmic/utils/Logger.hpp"
#include "cosmic/utils/XMLUtils.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace cosmic {
namespace xml {

class XMLStreamWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("logs/XMLStreamWriter_test.log",
                                         Logger::Level::DEBUG,
                                         false);
    }

    void TearDown() override {
        Logger::getInstance().shutdown();
    }
};

// 测试1: 文档声明
TEST_F(XMLStreamWriterTest, Declaration) {
    XMLStreamWriter writer;
    writer.startDocument();
    writer.endDocument();
    EXPECT_EQ(writer.toString(), "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n");
}

// 测试2: 空元素自闭合
TEST_F(XMLStreamWriterTest, SelfClosingElement) {
    XMLStreamWriter writer;
    writer.startElement("root");
    writer.writeEmptyElement("child");
    writer.startElement("item");
    writer.writeAttribute("id", 3);
    writer.endElement();
    writer.endElement();
    EXPECT_EQ(writer.toString(), "<root><child/><item id=\"3\"/></root>");
}

// 测试3: 属性与文本转义
TEST_F(XMLStreamWriterTest, EscapesAttributesAndText) {
    XMLStreamWriter writer;
    writer.startElement("t");
    writer.writeAttribute("name", "R&D \"team\"");
    writer.writeText("a < b & c > 'd'");
    writer.endElement();
    EXPECT_EQ(writer.toString(),
              "<t name=\"R&amp;D &quot;team&quot;\">a &lt; b &amp; c &gt; &apos;d&apos;</t>");
}

// 测试4: 无效控制字符被丢弃
TEST_F(XMLStreamWriterTest, DropsControlCharacters) {
    XMLStreamWriter writer;
    writer.startElement("t");
    writer.writeText(std::string("a\x01" "b\tc", 5));
    writer.endElement();
    EXPECT_EQ(writer.toString(), "<t>ab\tc</t>");
}

// 测试5: 数值属性重载
TEST_F(XMLStreamWriterTest, NumericAttributes) {
    XMLStreamWriter writer;
    writer.startElement("row");
    writer.writeAttribute("r", static_cast<size_t>(1048576));
    writer.writeAttribute("big", static_cast<int64_t>(-9000000000LL));
    writer.endElement();
    EXPECT_EQ(writer.toString(), "<row r=\"1048576\" big=\"-9000000000\"/>");
}

// 测试6: 状态错误
TEST_F(XMLStreamWriterTest, InvalidOperationsThrow) {
    XMLStreamWriter writer;
    EXPECT_THROW(writer.endElement(), core::OperationException);
    EXPECT_THROW(writer.writeAttribute("a", "b"), core::OperationException);
    EXPECT_THROW(writer.startElement(""), core::ParameterException);

    writer.startElement("root");
    writer.writeText("x");
    // 开始标签已闭合，不能再写属性
    EXPECT_THROW(writer.writeAttribute("late", "1"), core::OperationException);
}

// 测试7: endDocument 自动闭合未结束的元素
TEST_F(XMLStreamWriterTest, EndDocumentClosesOpenElements) {
    XMLStreamWriter writer;
    writer.startElement("a");
    writer.startElement("b");
    writer.writeText("x");
    EXPECT_EQ(writer.depth(), 2u);
    writer.endDocument();
    EXPECT_EQ(writer.depth(), 0u);
    EXPECT_EQ(writer.toString(), "<a><b>x</b></a>");
}

// 测试8: 回调模式按块输出，拼接结果与内存模式一致
TEST_F(XMLStreamWriterTest, CallbackModeMatchesMemoryMode) {
    auto build = [](XMLStreamWriter& writer) {
        writer.startDocument();
        writer.startElement("sheetData");
        for (int i = 1; i <= 50; ++i) {
            writer.startElement("row");
            writer.writeAttribute("r", i);
            writer.writeText("value");
            writer.endElement();
        }
        writer.endElement();
        writer.endDocument();
    };

    XMLStreamWriter memory;
    build(memory);

    std::vector<std::string> chunks;
    XMLStreamWriter streaming([&chunks](std::string_view chunk) {
        chunks.emplace_back(chunk);
    }, 64);
    build(streaming);

    EXPECT_GT(chunks.size(), 1u);
    std::string joined;
    for (const auto& chunk : chunks) {
        joined += chunk;
    }
    EXPECT_EQ(joined, memory.toString());
    EXPECT_EQ(streaming.getBytesWritten(), joined.size());
    EXPECT_EQ(streaming.getOutputMode(), XMLStreamWriter::OutputMode::CALLBACK);
}

TEST_F(XMLStreamWriterTest, NullCallbackThrows) {
    XMLStreamWriter::WriteCallback empty;
    EXPECT_THROW({ XMLStreamWriter writer(empty); }, core::ParameterException);
}

TEST_F(XMLStreamWriterTest, XMLUtilsEscaping) {
    EXPECT_EQ(utils::XMLUtils::escapeXML("<a href=\"x\">&</a>"),
              "&lt;a href=&quot;x&quot;&gt;&amp;&lt;/a&gt;");
    EXPECT_EQ(utils::XMLUtils::escapeXML("plain"), "plain");
    EXPECT_EQ(utils::XMLUtils::sanitizeUtf8("valid 文本"), "valid 文本");
    EXPECT_NE(utils::XMLUtils::sanitizeUtf8("bad\xC3"), "bad\xC3");
}

}} // namespace cosmic::xml
