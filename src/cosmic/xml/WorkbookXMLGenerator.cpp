#include "cosmic/xml/WorkbookXMLGenerator.hpp"

#include <fmt/format.h>

namespace cosmic {
namespace xml {

WorkbookXMLGenerator::WorkbookXMLGenerator(const std::vector<core::Sheet>& sheets)
    : sheets_(sheets) {
}

std::string WorkbookXMLGenerator::worksheetPath(size_t index) {
    return fmt::format("xl/worksheets/sheet{}.xml", index + 1);
}

std::string WorkbookXMLGenerator::generateWorkbook() const {
    XMLStreamWriter writer;
    generateWorkbook(writer);
    return writer.toString();
}

void WorkbookXMLGenerator::generateWorkbook(XMLStreamWriter& writer) const {
    writer.startDocument();
    writer.startElement("workbook");
    writer.writeAttribute("xmlns", "http://schemas.openxmlformats.org/spreadsheetml/2006/main");
    writer.writeAttribute("xmlns:r", "http://schemas.openxmlformats.org/officeDocument/2006/relationships");

    writer.startElement("sheets");
    for (size_t i = 0; i < sheets_.size(); ++i) {
        writer.startElement("sheet");
        writer.writeAttribute("name", sheets_[i].name);
        writer.writeAttribute("sheetId", i + 1);
        writer.writeAttribute("r:id", fmt::format("rId{}", i + 1));
        writer.endElement(); // sheet
    }
    writer.endElement(); // sheets

    writer.endElement(); // workbook
    writer.endDocument();
}

Relationships WorkbookXMLGenerator::buildWorkbookRelationships() const {
    Relationships rels;
    for (size_t i = 0; i < sheets_.size(); ++i) {
        rels.addRelationship(fmt::format("rId{}", i + 1), relationship_type::WORKSHEET,
                             fmt::format("worksheets/sheet{}.xml", i + 1));
    }
    rels.addAutoRelationship(relationship_type::STYLES, "styles.xml");
    return rels;
}

std::string WorkbookXMLGenerator::generateWorkbookRels() const {
    return buildWorkbookRelationships().generate();
}

std::string WorkbookXMLGenerator::generateRootRels() const {
    Relationships rels;
    rels.addRelationship("rId1", relationship_type::OFFICE_DOCUMENT, "xl/workbook.xml");
    return rels.generate();
}

ContentTypes WorkbookXMLGenerator::buildContentTypes() const {
    ContentTypes content_types;
    content_types.addExcelDefaults();
    content_types.addOverride("/xl/workbook.xml", content_type::WORKBOOK);
    content_types.addOverride("/xl/styles.xml", content_type::STYLES);
    for (size_t i = 0; i < sheets_.size(); ++i) {
        content_types.addOverride("/" + worksheetPath(i), content_type::WORKSHEET);
    }
    return content_types;
}

std::string WorkbookXMLGenerator::generateContentTypes() const {
    return buildContentTypes().generate();
}

}} // namespace cosmic::xml
