#include "cosmic/xml/ContentTypes.hpp"
#include "cosmic/xml/Relationships.hpp"
#include "cosmic/xml/StyleSerializer.hpp"
#include "cosmic/xml/WorkbookXMLGenerator.hpp"
#include "cosmic/xml/WorksheetXMLGenerator.hpp"
#include "cosmic/core/Exception.hpp"
#include "cosmic/utils/Logger.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace cosmic {
namespace xml {

namespace {

size_t countOccurrences(const std::string& text, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

} // namespace

class WorkbookPartsTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("logs/WorkbookParts_test.log",
                                         Logger::Level::DEBUG,
                                         false);

        sheets_.push_back(core::Sheet{"Summary", {}});
        sheets_.push_back(core::Sheet{"R&D", {}});
        sheets_.push_back(core::Sheet{"Data Movements", {}});
    }

    void TearDown() override {
        Logger::getInstance().shutdown();
    }

    std::vector<core::Sheet> sheets_;
};

// 测试1: 内容类型清单
TEST_F(WorkbookPartsTest, ContentTypes) {
    ContentTypes types;
    types.addExcelDefaults();
    types.addOverride("/xl/workbook.xml", content_type::WORKBOOK);
    std::string xml = types.generate();

    EXPECT_NE(xml.find("<Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\">"),
              std::string::npos);
    EXPECT_NE(xml.find("<Default Extension=\"rels\" ContentType=\"application/vnd.openxmlformats-package.relationships+xml\"/>"),
              std::string::npos);
    EXPECT_NE(xml.find("<Default Extension=\"xml\" ContentType=\"application/xml\"/>"), std::string::npos);
    EXPECT_NE(xml.find("<Override PartName=\"/xl/workbook.xml\""), std::string::npos);
    EXPECT_EQ(types.overrideCount(), 1u);

    EXPECT_THROW(types.addOverride("xl/styles.xml", content_type::STYLES), core::ParameterException);
}

// 测试2: 关系编号
TEST_F(WorkbookPartsTest, Relationships) {
    Relationships rels;
    EXPECT_EQ(rels.addAutoRelationship(relationship_type::WORKSHEET, "worksheets/sheet1.xml"), "rId1");
    EXPECT_EQ(rels.addAutoRelationship(relationship_type::STYLES, "styles.xml"), "rId2");
    EXPECT_THROW(rels.addRelationship("rId1", relationship_type::WORKSHEET, "x.xml"), core::ParameterException);

    std::string xml = rels.generate();
    EXPECT_NE(xml.find("<Relationship Id=\"rId2\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles\" Target=\"styles.xml\"/>"),
              std::string::npos);
}

// 测试3: 样式表只有常规样式和日期样式
TEST_F(WorkbookPartsTest, StyleSheet) {
    std::string xml = StyleSerializer::serialize();
    EXPECT_EQ(xml.rfind("<?xml", 0), 0u);
    EXPECT_NE(xml.find("<fonts count=\"1\">"), std::string::npos);
    EXPECT_NE(xml.find("<fills count=\"2\">"), std::string::npos);
    EXPECT_NE(xml.find("<borders count=\"1\">"), std::string::npos);
    EXPECT_NE(xml.find("<cellXfs count=\"2\">"), std::string::npos);
    EXPECT_NE(xml.find("numFmtId=\"14\""), std::string::npos);
    EXPECT_NE(xml.find("applyNumberFormat=\"1\""), std::string::npos);
    EXPECT_NE(xml.find("</styleSheet>"), std::string::npos);
}

// 测试4: 工作簿清单按位置分配编号
TEST_F(WorkbookPartsTest, WorkbookDocument) {
    WorkbookXMLGenerator generator(sheets_);
    std::string xml = generator.generateWorkbook();

    EXPECT_NE(xml.find("<sheet name=\"Summary\" sheetId=\"1\" r:id=\"rId1\"/>"), std::string::npos);
    EXPECT_NE(xml.find("<sheet name=\"R&amp;D\" sheetId=\"2\" r:id=\"rId2\"/>"), std::string::npos);
    EXPECT_NE(xml.find("<sheet name=\"Data Movements\" sheetId=\"3\" r:id=\"rId3\"/>"), std::string::npos);
}

// 测试5: 工作簿关系：每个工作表一个，样式排在最后
TEST_F(WorkbookPartsTest, WorkbookRelationships) {
    WorkbookXMLGenerator generator(sheets_);
    Relationships rels = generator.buildWorkbookRelationships();
    ASSERT_EQ(rels.size(), 4u);
    EXPECT_EQ(rels.relationships()[2].id, "rId3");
    EXPECT_EQ(rels.relationships()[2].target, "worksheets/sheet3.xml");
    EXPECT_EQ(rels.relationships()[3].id, "rId4");
    EXPECT_EQ(rels.relationships()[3].target, "styles.xml");

    std::string root = generator.generateRootRels();
    EXPECT_NE(root.find("Id=\"rId1\""), std::string::npos);
    EXPECT_NE(root.find("Target=\"xl/workbook.xml\""), std::string::npos);
}

// 测试6: 内容类型覆盖每个工作表
TEST_F(WorkbookPartsTest, ContentTypesCoverEverySheet) {
    WorkbookXMLGenerator generator(sheets_);
    std::string xml = generator.generateContentTypes();

    EXPECT_EQ(countOccurrences(xml, content_type::WORKSHEET), 3u);
    for (size_t i = 0; i < sheets_.size(); ++i) {
        std::string part = "PartName=\"/" + WorkbookXMLGenerator::worksheetPath(i) + "\"";
        EXPECT_NE(xml.find(part), std::string::npos) << part;
    }
    EXPECT_NE(xml.find("PartName=\"/xl/styles.xml\""), std::string::npos);
    EXPECT_EQ(WorkbookXMLGenerator::worksheetPath(0), "xl/worksheets/sheet1.xml");
}

// 测试7: 工作表稀疏输出
TEST_F(WorkbookPartsTest, WorksheetSkipsEmptyRows) {
    core::Sheet sheet;
    sheet.name = "Data";
    sheet.rows.push_back({core::CellValue(std::string("a")), core::CellValue(int64_t(1))});
    sheet.rows.push_back({});
    sheet.rows.push_back({core::CellValue(), core::CellValue(2.5)});

    WorksheetXMLGenerator generator(sheet);
    std::string xml = generator.generate();

    EXPECT_NE(xml.find("<worksheet xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\" "
                       "xmlns:r=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\">"),
              std::string::npos);
    EXPECT_NE(xml.find("<row r=\"1\"><c r=\"A1\" t=\"inlineStr\">"), std::string::npos);
    EXPECT_NE(xml.find("<c r=\"B1\"><v>1</v></c></row>"), std::string::npos);
    EXPECT_EQ(xml.find("<row r=\"2\""), std::string::npos);
    EXPECT_NE(xml.find("<row r=\"3\"><c r=\"A3\"/><c r=\"B3\"><v>2.5</v></c></row>"), std::string::npos);
    EXPECT_NE(xml.find("</sheetData></worksheet>"), std::string::npos);
}

// 测试8: 空工作表仍输出 sheetData
TEST_F(WorkbookPartsTest, EmptyWorksheet) {
    core::Sheet sheet{"Empty", {}};
    std::string xml = WorksheetXMLGenerator(sheet).generate();
    EXPECT_NE(xml.find("<sheetData/>"), std::string::npos);
}

// 测试9: 流式生成与内存生成结果一致
TEST_F(WorkbookPartsTest, StreamingWorksheetMatchesMemory) {
    core::Sheet sheet;
    sheet.name = "Big";
    for (int r = 0; r < 500; ++r) {
        sheet.rows.push_back({core::CellValue(std::string("row")), core::CellValue(int64_t(r))});
    }

    WorksheetXMLGenerator generator(sheet);
    std::string streamed;
    generator.generate([&streamed](std::string_view chunk) {
        streamed.append(chunk.data(), chunk.size());
    });
    EXPECT_EQ(streamed, generator.generate());
}

}} // namespace cosmic::xml
