#include "cosmic/xml/ContentTypes.hpp"
#include "cosmic/core/Exception.hpp"

namespace cosmic {
namespace xml {

void ContentTypes::addDefault(const std::string& extension, const std::string& content_type) {
    default_types_.push_back({extension, content_type});
}

void ContentTypes::addOverride(const std::string& part_name, const std::string& content_type) {
    if (part_name.empty() || part_name.front() != '/') {
        COSMIC_THROW(core::ParameterException, "Override part name must be absolute: " + part_name, "part_name");
    }
    override_types_.push_back({part_name, content_type});
}

void ContentTypes::generate(const XMLStreamWriter::WriteCallback& callback) const {
    XMLStreamWriter writer(callback);
    write(writer);
}

std::string ContentTypes::generate() const {
    XMLStreamWriter writer;
    write(writer);
    return writer.toString();
}

void ContentTypes::write(XMLStreamWriter& writer) const {
    writer.startDocument();
    writer.startElement("Types");
    writer.writeAttribute("xmlns", "http://schemas.openxmlformats.org/package/2006/content-types");

    for (const auto& def : default_types_) {
        writer.startElement("Default");
        writer.writeAttribute("Extension", def.extension);
        writer.writeAttribute("ContentType", def.content_type);
        writer.endElement(); // Default
    }

    for (const auto& override : override_types_) {
        writer.startElement("Override");
        writer.writeAttribute("PartName", override.part_name);
        writer.writeAttribute("ContentType", override.content_type);
        writer.endElement(); // Override
    }

    writer.endElement(); // Types
    writer.endDocument();
}

void ContentTypes::addExcelDefaults() {
    addDefault("rels", content_type::RELATIONSHIPS);
    addDefault("xml", content_type::XML);
}

}} // namespace cosmic::xml
