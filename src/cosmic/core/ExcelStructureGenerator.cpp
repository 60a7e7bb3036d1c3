#include "cosmic/core/ExcelStructureGenerator.hpp"
#include "cosmic/core/Exception.hpp"
#include "cosmic/core/Workbook.hpp"
#include "cosmic/utils/ModuleLoggers.hpp"
#include "cosmic/xml/StyleSerializer.hpp"
#include "cosmic/xml/WorkbookXMLGenerator.hpp"
#include "cosmic/xml/WorksheetXMLGenerator.hpp"

#include <chrono>

namespace cosmic {
namespace core {

ExcelStructureGenerator::ExcelStructureGenerator(const Workbook* workbook, std::unique_ptr<IFileWriter> writer)
    : workbook_(workbook), writer_(std::move(writer)) {
    if (!workbook_) {
        COSMIC_THROW(ParameterException, "Workbook cannot be null", "workbook");
    }
    if (!writer_) {
        COSMIC_THROW(ParameterException, "FileWriter cannot be null", "writer");
    }
}

ExcelStructureGenerator::~ExcelStructureGenerator() = default;

bool ExcelStructureGenerator::generate() {
    auto start_time = std::chrono::steady_clock::now();
    CORE_DEBUG("Starting package generation using {}", writer_->getTypeName());
    last_error_.clear();

    try {
        if (!generateBasicFiles()) {
            return fail("Failed to generate workbook parts");
        }
        if (!generateWorksheets()) {
            return fail("Failed to generate worksheet parts");
        }
        if (!finalize()) {
            return fail("Failed to write parts to archive");
        }
    } catch (const CosmicException& e) {
        return fail(e.what());
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    auto stats = writer_->getStats();
    CORE_DEBUG("Package generation completed: {} parts ({} streamed), {} bytes in {}ms",
               stats.files_written, stats.streaming_files, stats.total_bytes, elapsed.count());
    return true;
}

IFileWriter::WriteStats ExcelStructureGenerator::getWriterStats() const {
    return writer_->getStats();
}

bool ExcelStructureGenerator::fail(const std::string& message) {
    if (last_error_.empty()) {
        last_error_ = message;
    }
    CORE_ERROR("Package generation failed: {}", message);
    return false;
}

bool ExcelStructureGenerator::generateBasicFiles() {
    xml::WorkbookXMLGenerator generator(workbook_->getSheets());

    if (!writer_->writeFile("[Content_Types].xml", generator.generateContentTypes())) {
        return fail("Cannot write [Content_Types].xml");
    }
    if (!writer_->writeFile("_rels/.rels", generator.generateRootRels())) {
        return fail("Cannot write _rels/.rels");
    }
    if (!writer_->writeFile("xl/workbook.xml", generator.generateWorkbook())) {
        return fail("Cannot write xl/workbook.xml");
    }
    if (!writer_->writeFile("xl/_rels/workbook.xml.rels", generator.generateWorkbookRels())) {
        return fail("Cannot write xl/_rels/workbook.xml.rels");
    }
    if (!writer_->writeFile("xl/styles.xml", xml::StyleSerializer::serialize())) {
        return fail("Cannot write xl/styles.xml");
    }

    CORE_DEBUG("Generated basic package parts");
    return true;
}

bool ExcelStructureGenerator::generateWorksheets() {
    size_t worksheet_count = workbook_->getSheetCount();
    CORE_DEBUG("Generating {} worksheets", worksheet_count);

    for (size_t i = 0; i < worksheet_count; ++i) {
        std::string worksheet_path = xml::WorkbookXMLGenerator::worksheetPath(i);

        if (!writer_->openStreamingFile(worksheet_path)) {
            return fail("Cannot open " + worksheet_path);
        }

        bool chunk_ok = true;
        xml::WorksheetXMLGenerator generator(workbook_->getSheet(i));
        generator.generate([this, &chunk_ok](std::string_view chunk) {
            if (chunk_ok && !writer_->writeStreamingChunk(chunk.data(), chunk.size())) {
                chunk_ok = false;
            }
        });

        if (!writer_->closeStreamingFile() || !chunk_ok) {
            return fail("Cannot write " + worksheet_path);
        }
    }

    return true;
}

bool ExcelStructureGenerator::finalize() {
    return writer_->flush();
}

}} // namespace cosmic::core
