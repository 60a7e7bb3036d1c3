#include "cosmic/xml/XMLStreamWriter.hpp"
#include "cosmic/core/Exception.hpp"
#include "cosmic/utils/ModuleLoggers.hpp"
#include "cosmic/utils/XMLUtils.hpp"

#include <fmt/format.h>

namespace cosmic {
namespace xml {

XMLStreamWriter::XMLStreamWriter() {
    buffer_.reserve(4096);
    pending_attributes_.reserve(8);
}

XMLStreamWriter::XMLStreamWriter(WriteCallback callback, size_t chunk_size)
    : output_mode_(OutputMode::CALLBACK)
    , write_callback_(std::move(callback))
    , chunk_size_(chunk_size == 0 ? DEFAULT_CHUNK_SIZE : chunk_size) {
    if (!write_callback_) {
        COSMIC_THROW(core::ParameterException, "Callback cannot be null", "callback");
    }
    buffer_.reserve(chunk_size_);
    pending_attributes_.reserve(8);
}

XMLStreamWriter::~XMLStreamWriter() {
    if (!element_stack_.empty()) {
        XML_DEBUG("XMLStreamWriter destroyed with {} unclosed elements", element_stack_.size());
    }
}

void XMLStreamWriter::startDocument() {
    buffer_.append("<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n");
}

void XMLStreamWriter::endDocument() {
    while (!element_stack_.empty()) {
        XML_WARN("Auto-closing unclosed element: {}", element_stack_.back());
        endElement();
    }
    flush();
}

void XMLStreamWriter::startElement(const std::string& name) {
    if (name.empty()) {
        COSMIC_THROW(core::ParameterException, "Element name cannot be empty", "name");
    }

    ensureElementClosed();

    buffer_.push_back('<');
    buffer_.append(name);

    element_stack_.push_back(name);
    in_element_ = true;
}

void XMLStreamWriter::endElement() {
    if (element_stack_.empty()) {
        COSMIC_THROW(core::OperationException, "No element to close", "endElement",
                     core::ErrorCode::XmlWriteError);
    }

    std::string element_name = std::move(element_stack_.back());
    element_stack_.pop_back();

    if (in_element_) {
        // 自闭合元素
        writeAttributesToBuffer();
        buffer_.append("/>");
        in_element_ = false;
    } else {
        buffer_.append("</");
        buffer_.append(element_name);
        buffer_.push_back('>');
    }

    flushIfNeeded();
}

void XMLStreamWriter::writeEmptyElement(const std::string& name) {
    startElement(name);
    endElement();
}

void XMLStreamWriter::requireOpenTag(const char* operation) const {
    if (!in_element_) {
        COSMIC_THROW(core::OperationException, "Cannot write attribute outside of element",
                     operation, core::ErrorCode::XmlWriteError);
    }
}

void XMLStreamWriter::writeAttribute(const std::string& name, std::string_view value) {
    requireOpenTag("writeAttribute");
    if (name.empty()) {
        COSMIC_THROW(core::ParameterException, "Attribute name cannot be empty", "name");
    }
    pending_attributes_.emplace_back(name, std::string(value));
}

void XMLStreamWriter::writeAttribute(const std::string& name, const char* value) {
    writeAttribute(name, std::string_view(value ? value : ""));
}

void XMLStreamWriter::writeAttribute(const std::string& name, int64_t value) {
    requireOpenTag("writeAttribute");
    pending_attributes_.emplace_back(name, fmt::format("{}", value));
}

void XMLStreamWriter::writeAttribute(const std::string& name, int value) {
    writeAttribute(name, static_cast<int64_t>(value));
}

void XMLStreamWriter::writeAttribute(const std::string& name, size_t value) {
    requireOpenTag("writeAttribute");
    pending_attributes_.emplace_back(name, fmt::format("{}", value));
}

void XMLStreamWriter::writeText(std::string_view text) {
    ensureElementClosed();
    if (text.empty()) {
        return;
    }
    utils::XMLUtils::appendEscaped(buffer_, text);
    flushIfNeeded();
}

void XMLStreamWriter::writeRaw(std::string_view data) {
    ensureElementClosed();
    buffer_.append(data.data(), data.size());
    flushIfNeeded();
}

void XMLStreamWriter::ensureElementClosed() {
    if (in_element_) {
        writeAttributesToBuffer();
        buffer_.push_back('>');
        in_element_ = false;
    }
}

void XMLStreamWriter::writeAttributesToBuffer() {
    for (const auto& attr : pending_attributes_) {
        buffer_.push_back(' ');
        buffer_.append(attr.key);
        buffer_.append("=\"");
        utils::XMLUtils::appendEscaped(buffer_, attr.value);
        buffer_.push_back('"');
    }
    pending_attributes_.clear();
}

void XMLStreamWriter::flushIfNeeded() {
    if (output_mode_ == OutputMode::CALLBACK && buffer_.size() >= chunk_size_) {
        flush();
    }
}

void XMLStreamWriter::flush() {
    if (output_mode_ != OutputMode::CALLBACK || buffer_.empty()) {
        return;
    }
    // 开始标签尚未闭合时不能切分（属性仍在累积）
    if (in_element_) {
        return;
    }
    write_callback_(std::string_view(buffer_));
    bytes_written_ += buffer_.size();
    buffer_.clear();
}

std::string XMLStreamWriter::toString() const {
    if (output_mode_ != OutputMode::MEMORY_BUFFER) {
        XML_WARN("toString() called in non-memory mode");
        return "";
    }
    return buffer_;
}

}} // namespace cosmic::xml
