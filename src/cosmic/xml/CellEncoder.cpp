#include "cosmic/xml/CellEncoder.hpp"
#include "cosmic/core/Exception.hpp"
#include "cosmic/utils/ColumnReferenceUtils.hpp"
#include "cosmic/utils/ModuleLoggers.hpp"
#include "cosmic/utils/TimeUtils.hpp"

#include <cmath>
#include <fmt/format.h>
#include <type_traits>

namespace cosmic {
namespace xml {

void CellEncoder::encode(const core::CellValue& value, uint32_t row, uint32_t col, XMLStreamWriter& writer) {
    writer.startElement("c");
    writer.writeAttribute("r", utils::ColumnReferenceUtils::cellReference(row, col));

    std::visit([&](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            // 空单元格只保留位置
        } else if constexpr (std::is_same_v<T, int64_t>) {
            writer.startElement("v");
            writer.writeRaw(formatNumber(v));
            writer.endElement(); // v
        } else if constexpr (std::is_same_v<T, double>) {
            if (std::isfinite(v)) {
                writer.startElement("v");
                writer.writeRaw(formatNumber(v));
                writer.endElement(); // v
            } else {
                // NaN/Inf 无法作为数值存储
                XML_WARN("Non-finite number at {} written as text", utils::ColumnReferenceUtils::cellReference(row, col));
                writeInlineString(formatNumber(v), writer);
            }
        } else if constexpr (std::is_same_v<T, core::Date>) {
            if (!utils::TimeUtils::isValidDate(v.year, v.month, v.day)) {
                COSMIC_THROW(core::ParameterException,
                             fmt::format("Invalid date {}-{}-{}", v.year, v.month, v.day), "value");
            }
            writer.writeAttribute("s", DATE_STYLE_INDEX);
            writer.startElement("v");
            writer.writeRaw(formatNumber(utils::TimeUtils::toExcelSerial(v.year, v.month, v.day)));
            writer.endElement(); // v
        } else {
            writeInlineString(v, writer);
        }
    }, value);

    writer.endElement(); // c
}

std::string CellEncoder::encode(const core::CellValue& value, uint32_t row, uint32_t col) {
    XMLStreamWriter writer;
    encode(value, row, col, writer);
    return writer.toString();
}

std::string CellEncoder::formatNumber(int64_t value) {
    return fmt::format("{}", value);
}

std::string CellEncoder::formatNumber(double value) {
    return fmt::format("{}", value);
}

void CellEncoder::writeInlineString(std::string_view text, XMLStreamWriter& writer) {
    writer.writeAttribute("t", "inlineStr");
    writer.startElement("is");
    writer.startElement("t");
    writer.writeAttribute("xml:space", "preserve");
    writer.writeText(text);
    writer.endElement(); // t
    writer.endElement(); // is
}

}} // namespace cosmic::xml
