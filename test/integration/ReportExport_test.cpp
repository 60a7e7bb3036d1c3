#include "cosmic/archive/ZipReader.hpp"
#include "cosmic/config/MeasurementLoader.hpp"
#include "cosmic/core/Exception.hpp"
#include "cosmic/report/ExcelReport.hpp"
#include "cosmic/xml/ContentTypes.hpp"
#include "cosmic/utils/Logger.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace cosmic {
namespace report {

namespace {

const char* kTwoProcessConfig =
    "system:\n"
    "  name: Library\n"
    "functional_processes:\n"
    "  - name: Borrow book\n"
    "    trigger: Member requests loan\n"
    "    object_of_interest: Loan\n"
    "    description: Register a loan\n"
    "    data_movements:\n"
    "      - type: E\n"
    "        description: Loan request\n"
    "      - type: R\n"
    "        description: Read member\n"
    "      - type: W\n"
    "        description: Store loan\n"
    "      - type: X\n"
    "        description: Confirmation\n"
    "  - name: Return book\n"
    "    trigger: Member returns book\n"
    "    object_of_interest: Loan\n"
    "    description: Close a loan\n"
    "    data_movements:\n"
    "      - type: Entry\n"
    "        description: Return request\n"
    "      - type: Read\n"
    "        description: Read loan\n"
    "      - type: Write\n"
    "        description: Update loan\n"
    "      - type: Exit\n"
    "        description: Receipt\n";

size_t countOccurrences(const std::string& text, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

} // namespace

class ReportExportTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("logs/ReportExport_test.log",
                                         Logger::Level::DEBUG,
                                         false);
        test_dir_ = "test_report_export";
        std::filesystem::create_directories(test_dir_);

        config_path_ = test_dir_ + "/library.yaml";
        std::ofstream out(config_path_, std::ios::binary);
        out << kTwoProcessConfig;
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
        Logger::getInstance().shutdown();
    }

    // 辅助函数：导出并打开结果
    core::Path exportReport(const std::string& name) const {
        model::SystemMeasurement measurement = config::loadMeasurement(core::Path(config_path_));
        ExcelReport report(measurement);
        return report.exportTo(core::Path(test_dir_ + "/" + name));
    }

    static std::string extract(const archive::ZipReader& reader, const std::string& part) {
        std::string content;
        EXPECT_EQ(reader.extractFile(part, content), archive::ZipError::Ok) << part;
        return content;
    }

    static std::string readBytes(const std::string& path) {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    std::string test_dir_;
    std::string config_path_;
};

// 测试1: 归档包含五个固定部件和三个工作表，顺序固定
TEST_F(ReportExportTest, ArchiveLayout) {
    core::Path output = exportReport("report.xlsx");
    EXPECT_TRUE(output.exists());

    archive::ZipReader reader(output);
    ASSERT_TRUE(reader.open());
    std::vector<std::string> expected = {
        "[Content_Types].xml",
        "_rels/.rels",
        "xl/workbook.xml",
        "xl/_rels/workbook.xml.rels",
        "xl/styles.xml",
        "xl/worksheets/sheet1.xml",
        "xl/worksheets/sheet2.xml",
        "xl/worksheets/sheet3.xml",
    };
    EXPECT_EQ(reader.listFiles(), expected);

    std::string content_types = extract(reader, "[Content_Types].xml");
    EXPECT_EQ(countOccurrences(content_types, xml::content_type::WORKSHEET), 3u);
    for (int i = 1; i <= 3; ++i) {
        std::string part = "PartName=\"/xl/worksheets/sheet" + std::to_string(i) + ".xml\"";
        EXPECT_NE(content_types.find(part), std::string::npos) << part;
    }

    std::string styles = extract(reader, "xl/styles.xml");
    EXPECT_NE(styles.find("<cellXfs count=\"2\">"), std::string::npos);
    EXPECT_NE(styles.find("numFmtId=\"14\""), std::string::npos);

    std::string workbook = extract(reader, "xl/workbook.xml");
    EXPECT_NE(workbook.find("<sheet name=\"Summary\" sheetId=\"1\" r:id=\"rId1\"/>"), std::string::npos);
    EXPECT_NE(workbook.find("<sheet name=\"Functional Processes\" sheetId=\"2\" r:id=\"rId2\"/>"), std::string::npos);
    EXPECT_NE(workbook.find("<sheet name=\"Data Movements\" sheetId=\"3\" r:id=\"rId3\"/>"), std::string::npos);

    std::string rels = extract(reader, "xl/_rels/workbook.xml.rels");
    EXPECT_NE(rels.find("Id=\"rId3\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet\" Target=\"worksheets/sheet3.xml\""),
              std::string::npos);
}

// 测试2: 汇总与每个处理的计数
TEST_F(ReportExportTest, TwoProcessScenario) {
    core::Path output = exportReport("report.xlsx");
    archive::ZipReader reader(output);
    ASSERT_TRUE(reader.open());

    // Summary: Total CFP = 8
    std::string summary = extract(reader, "xl/worksheets/sheet1.xml");
    EXPECT_NE(summary.find("<t xml:space=\"preserve\">Total CFP</t>"), std::string::npos);
    EXPECT_NE(summary.find("<c r=\"B2\"><v>8</v></c>"), std::string::npos);

    // Functional Processes: 每行 E/X/R/W 各 1，合计 4
    std::string processes = extract(reader, "xl/worksheets/sheet2.xml");
    for (int row = 2; row <= 3; ++row) {
        std::string r = std::to_string(row);
        EXPECT_NE(processes.find("<c r=\"E" + r + "\"><v>1</v></c><c r=\"F" + r + "\"><v>1</v></c>"
                                 "<c r=\"G" + r + "\"><v>1</v></c><c r=\"H" + r + "\"><v>1</v></c>"
                                 "<c r=\"I" + r + "\"><v>4</v></c>"),
                  std::string::npos) << "row " << row;
    }
    EXPECT_NE(processes.find(">Borrow book<"), std::string::npos);
    EXPECT_NE(processes.find(">Return book<"), std::string::npos);
    EXPECT_EQ(processes.find("<row r=\"4\""), std::string::npos);

    // Data Movements: 表头加八条移动
    std::string movements = extract(reader, "xl/worksheets/sheet3.xml");
    EXPECT_EQ(countOccurrences(movements, "<row "), 9u);
    EXPECT_NE(movements.find("<c r=\"B9\"><v>4</v></c>"), std::string::npos);
}

// 测试3: 相同输入导出字节一致
TEST_F(ReportExportTest, ExportIsReproducible) {
    core::Path first = exportReport("first.xlsx");
    core::Path second = exportReport("second.xlsx");

    std::string a = readBytes(first.string());
    EXPECT_FALSE(a.empty());
    EXPECT_EQ(a, readBytes(second.string()));
}

// 测试4: 返回路径与请求路径一致，且没有残留临时文件
TEST_F(ReportExportTest, ReturnsRequestedPath) {
    core::Path output = exportReport("nested.xlsx");
    EXPECT_EQ(output.string(), test_dir_ + "/nested.xlsx");
    EXPECT_FALSE(std::filesystem::exists(test_dir_ + "/nested.xlsx.tmp"));
}

// 测试5: 没有处理的度量仍生成三个工作表
TEST_F(ReportExportTest, EmptyMeasurement) {
    model::SystemMeasurement measurement;
    ExcelReport report(measurement);
    core::Path output = report.exportTo(core::Path(test_dir_ + "/empty.xlsx"));

    archive::ZipReader reader(output);
    ASSERT_TRUE(reader.open());
    EXPECT_EQ(reader.listFiles().size(), 8u);
    std::string summary = extract(reader, "xl/worksheets/sheet1.xml");
    EXPECT_NE(summary.find("<c r=\"B2\"><v>0</v></c>"), std::string::npos);
}

}} // namespace cosmic::report
