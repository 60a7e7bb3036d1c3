#include "cosmic/xml/Relationships.hpp"
#include "cosmic/core/Exception.hpp"

#include <fmt/format.h>

namespace cosmic {
namespace xml {

void Relationships::addRelationship(const std::string& id, const std::string& type, const std::string& target) {
    for (const auto& rel : relationships_) {
        if (rel.id == id) {
            COSMIC_THROW(core::ParameterException, "Duplicate relationship id: " + id, "id");
        }
    }
    relationships_.push_back({id, type, target});
}

std::string Relationships::addAutoRelationship(const std::string& type, const std::string& target) {
    std::string id = fmt::format("rId{}", relationships_.size() + 1);
    addRelationship(id, type, target);
    return id;
}

void Relationships::generate(const XMLStreamWriter::WriteCallback& callback) const {
    XMLStreamWriter writer(callback);
    write(writer);
}

std::string Relationships::generate() const {
    XMLStreamWriter writer;
    write(writer);
    return writer.toString();
}

void Relationships::write(XMLStreamWriter& writer) const {
    writer.startDocument();
    writer.startElement("Relationships");
    writer.writeAttribute("xmlns", "http://schemas.openxmlformats.org/package/2006/relationships");

    for (const auto& rel : relationships_) {
        writer.startElement("Relationship");
        writer.writeAttribute("Id", rel.id);
        writer.writeAttribute("Type", rel.type);
        writer.writeAttribute("Target", rel.target);
        writer.endElement(); // Relationship
    }

    writer.endElement(); // Relationships
    writer.endDocument();
}

}} // namespace cosmic::xml
