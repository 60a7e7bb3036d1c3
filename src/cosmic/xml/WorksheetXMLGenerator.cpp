#include "cosmic/xml/WorksheetXMLGenerator.hpp"
#include "cosmic/xml/CellEncoder.hpp"
#include "cosmic/utils/ModuleLoggers.hpp"

namespace cosmic {
namespace xml {

WorksheetXMLGenerator::WorksheetXMLGenerator(const core::Sheet& sheet)
    : sheet_(sheet) {
}

void WorksheetXMLGenerator::generate(const XMLStreamWriter::WriteCallback& callback) const {
    XMLStreamWriter writer(callback);
    generate(writer);
}

std::string WorksheetXMLGenerator::generate() const {
    XMLStreamWriter writer;
    generate(writer);
    return writer.toString();
}

void WorksheetXMLGenerator::generate(XMLStreamWriter& writer) const {
    writer.startDocument();
    writer.startElement("worksheet");
    writer.writeAttribute("xmlns", "http://schemas.openxmlformats.org/spreadsheetml/2006/main");
    writer.writeAttribute("xmlns:r", "http://schemas.openxmlformats.org/officeDocument/2006/relationships");

    writeSheetData(writer);

    writer.endElement(); // worksheet
    writer.endDocument();

    XML_DEBUG("Generated worksheet '{}' ({} rows)", sheet_.name, sheet_.rows.size());
}

void WorksheetXMLGenerator::writeSheetData(XMLStreamWriter& writer) const {
    writer.startElement("sheetData");

    for (size_t r = 0; r < sheet_.rows.size(); ++r) {
        const core::Row& row = sheet_.rows[r];
        if (row.empty()) continue;

        const uint32_t row_num = static_cast<uint32_t>(r + 1);
        writer.startElement("row");
        writer.writeAttribute("r", static_cast<size_t>(row_num));

        for (size_t c = 0; c < row.size(); ++c) {
            CellEncoder::encode(row[c], row_num, static_cast<uint32_t>(c + 1), writer);
        }

        writer.endElement(); // row
    }

    writer.endElement(); // sheetData
}

}} // namespace cosmic::xml
