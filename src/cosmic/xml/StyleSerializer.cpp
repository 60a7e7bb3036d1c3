#include "cosmic/xml/StyleSerializer.hpp"

namespace cosmic {
namespace xml {

void StyleSerializer::serialize(XMLStreamWriter& writer) {
    writer.startDocument();
    writer.startElement("styleSheet");
    writer.writeAttribute("xmlns", "http://schemas.openxmlformats.org/spreadsheetml/2006/main");

    writeFonts(writer);
    writeFills(writer);
    writeBorders(writer);

    // 最小合法的 cellStyleXfs
    writer.startElement("cellStyleXfs");
    writer.writeAttribute("count", 1);
    writer.startElement("xf");
    writer.writeAttribute("numFmtId", GENERAL_NUM_FMT_ID);
    writer.writeAttribute("fontId", 0);
    writer.writeAttribute("fillId", 0);
    writer.writeAttribute("borderId", 0);
    writer.endElement(); // xf
    writer.endElement(); // cellStyleXfs

    writeCellXfs(writer);
    writeCellStyles(writer);

    writer.endElement(); // styleSheet
    writer.endDocument();
}

void StyleSerializer::serialize(const XMLStreamWriter::WriteCallback& callback) {
    XMLStreamWriter writer(callback);
    serialize(writer);
}

std::string StyleSerializer::serialize() {
    XMLStreamWriter writer;
    serialize(writer);
    return writer.toString();
}

void StyleSerializer::writeFonts(XMLStreamWriter& writer) {
    writer.startElement("fonts");
    writer.writeAttribute("count", 1);
    writer.startElement("font");
    writer.startElement("sz");
    writer.writeAttribute("val", 11);
    writer.endElement(); // sz
    writer.startElement("name");
    writer.writeAttribute("val", "Calibri");
    writer.endElement(); // name
    writer.startElement("family");
    writer.writeAttribute("val", 2);
    writer.endElement(); // family
    writer.endElement(); // font
    writer.endElement(); // fonts
}

void StyleSerializer::writeFills(XMLStreamWriter& writer) {
    // Excel 要求前两个填充固定为 none 与 gray125
    writer.startElement("fills");
    writer.writeAttribute("count", 2);
    writer.startElement("fill");
    writer.startElement("patternFill");
    writer.writeAttribute("patternType", "none");
    writer.endElement(); // patternFill
    writer.endElement(); // fill
    writer.startElement("fill");
    writer.startElement("patternFill");
    writer.writeAttribute("patternType", "gray125");
    writer.endElement(); // patternFill
    writer.endElement(); // fill
    writer.endElement(); // fills
}

void StyleSerializer::writeBorders(XMLStreamWriter& writer) {
    writer.startElement("borders");
    writer.writeAttribute("count", 1);
    writer.startElement("border");
    writer.writeEmptyElement("left");
    writer.writeEmptyElement("right");
    writer.writeEmptyElement("top");
    writer.writeEmptyElement("bottom");
    writer.writeEmptyElement("diagonal");
    writer.endElement(); // border
    writer.endElement(); // borders
}

void StyleSerializer::writeCellXfs(XMLStreamWriter& writer) {
    writer.startElement("cellXfs");
    writer.writeAttribute("count", 2);

    writer.startElement("xf");
    writer.writeAttribute("numFmtId", GENERAL_NUM_FMT_ID);
    writer.writeAttribute("fontId", 0);
    writer.writeAttribute("fillId", 0);
    writer.writeAttribute("borderId", 0);
    writer.writeAttribute("xfId", 0);
    writer.endElement(); // xf

    writer.startElement("xf");
    writer.writeAttribute("numFmtId", DATE_NUM_FMT_ID);
    writer.writeAttribute("fontId", 0);
    writer.writeAttribute("fillId", 0);
    writer.writeAttribute("borderId", 0);
    writer.writeAttribute("xfId", 0);
    writer.writeAttribute("applyNumberFormat", 1);
    writer.endElement(); // xf

    writer.endElement(); // cellXfs
}

void StyleSerializer::writeCellStyles(XMLStreamWriter& writer) {
    writer.startElement("cellStyles");
    writer.writeAttribute("count", 1);
    writer.startElement("cellStyle");
    writer.writeAttribute("name", "Normal");
    writer.writeAttribute("xfId", 0);
    writer.writeAttribute("builtinId", 0);
    writer.endElement(); // cellStyle
    writer.endElement(); // cellStyles
}

}} // namespace cosmic::xml
