#pragma once

#include "cosmic/core/CellValue.hpp"
#include "cosmic/xml/XMLStreamWriter.hpp"

#include <string>

namespace cosmic {
namespace xml {

/**
 * @brief 工作表XML生成器
 *
 * 每个非空行输出一个 <row r="N">，行内单元格逐个交给 CellEncoder；
 * 没有单元格的行整行省略。
 */
class WorksheetXMLGenerator {
public:
    explicit WorksheetXMLGenerator(const core::Sheet& sheet);

    /**
     * @brief 流式生成，数据块通过回调输出
     */
    void generate(const XMLStreamWriter::WriteCallback& callback) const;

    std::string generate() const;

    /**
     * @brief 生成到已有写入器（含XML声明）
     */
    void generate(XMLStreamWriter& writer) const;

private:
    void writeSheetData(XMLStreamWriter& writer) const;

    const core::Sheet& sheet_;
};

}} // namespace cosmic::xml
