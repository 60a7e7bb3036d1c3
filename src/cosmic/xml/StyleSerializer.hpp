#pragma once

#include "cosmic/xml/XMLStreamWriter.hpp"

#include <string>

namespace cosmic {
namespace xml {

/**
 * @brief xl/styles.xml 序列化器
 *
 * 只定义两个单元格格式：
 * - cellXfs[0] 常规
 * - cellXfs[1] 日期（内置 numFmtId 14）
 */
class StyleSerializer {
public:
    static constexpr int GENERAL_NUM_FMT_ID = 0;
    static constexpr int DATE_NUM_FMT_ID = 14;

    static void serialize(XMLStreamWriter& writer);
    static void serialize(const XMLStreamWriter::WriteCallback& callback);
    static std::string serialize();

private:
    static void writeFonts(XMLStreamWriter& writer);
    static void writeFills(XMLStreamWriter& writer);
    static void writeBorders(XMLStreamWriter& writer);
    static void writeCellXfs(XMLStreamWriter& writer);
    static void writeCellStyles(XMLStreamWriter& writer);
};

}} // namespace cosmic::xml
