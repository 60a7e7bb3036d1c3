#include "cosmic/core/Workbook.hpp"
#include "cosmic/archive/ZipWriter.hpp"
#include "cosmic/core/BatchFileWriter.hpp"
#include "cosmic/core/Exception.hpp"
#include "cosmic/core/ExcelStructureGenerator.hpp"
#include "cosmic/utils/ModuleLoggers.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/format.h>
#include <unordered_set>
#include <utf8.h>

namespace cosmic {
namespace core {

namespace {

std::string foldCase(const std::string& name) {
    std::string folded(name);
    std::transform(folded.begin(), folded.end(), folded.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return folded;
}

} // namespace

Workbook::Workbook(std::vector<Sheet> sheets)
    : sheets_(std::move(sheets)) {
    validate();
}

const Sheet& Workbook::getSheet(size_t index) const {
    if (index >= sheets_.size()) {
        COSMIC_THROW(ParameterException,
                     fmt::format("Sheet index {} out of range (sheet count {})", index, sheets_.size()),
                     "index");
    }
    return sheets_[index];
}

std::string Workbook::checkSheetName(const std::string& name) {
    if (name.empty()) {
        return "sheet name cannot be empty";
    }
    if (!utf8::is_valid(name.begin(), name.end())) {
        return "sheet name is not valid UTF-8";
    }
    // Excel 按字符计长，这里按 UTF-8 码点计数
    auto length = static_cast<size_t>(utf8::distance(name.begin(), name.end()));
    if (length > MAX_SHEET_NAME_LENGTH) {
        return fmt::format("sheet name '{}' exceeds {} characters", name, MAX_SHEET_NAME_LENGTH);
    }
    if (name.find_first_of("[]:*?/\\") != std::string::npos) {
        return fmt::format("sheet name '{}' contains an invalid character", name);
    }
    if (name.front() == '\'' || name.back() == '\'') {
        return fmt::format("sheet name '{}' cannot start or end with an apostrophe", name);
    }
    return std::string();
}

void Workbook::validate() const {
    if (sheets_.empty()) {
        COSMIC_THROW(CosmicException, "Workbook must contain at least one sheet", ErrorCode::InvalidWorkbook);
    }

    std::unordered_set<std::string> seen;
    for (const auto& sheet : sheets_) {
        std::string problem = checkSheetName(sheet.name);
        if (!problem.empty()) {
            COSMIC_THROW(CosmicException, "Invalid worksheet: " + problem, ErrorCode::InvalidWorksheet);
        }
        if (!seen.insert(foldCase(sheet.name)).second) {
            COSMIC_THROW(CosmicException, fmt::format("Duplicate sheet name '{}'", sheet.name),
                         ErrorCode::InvalidWorksheet);
        }
        if (sheet.rows.size() > MAX_ROWS) {
            COSMIC_THROW(CosmicException,
                         fmt::format("Sheet '{}' has {} rows, limit is {}", sheet.name, sheet.rows.size(), MAX_ROWS),
                         ErrorCode::InvalidWorksheet);
        }
        for (const auto& row : sheet.rows) {
            if (row.size() > MAX_COLUMNS) {
                COSMIC_THROW(CosmicException,
                             fmt::format("Sheet '{}' has a row of {} cells, limit is {}",
                                         sheet.name, row.size(), MAX_COLUMNS),
                             ErrorCode::InvalidWorksheet);
            }
        }
    }
}

Path Workbook::save(const Path& path, const ExportOptions& options) const {
    if (path.empty()) {
        COSMIC_THROW(ParameterException, "Output path cannot be empty", "path");
    }

    const Path target = path;
    const Path temp = options.atomic_write ? path.withSuffix(options.temp_suffix) : path;
    CORE_INFO("Writing workbook with {} sheets to {}", sheets_.size(), target.string());

    std::string failure;
    {
        archive::ZipWriter zip(temp);
        if (zip.setCompressionLevel(options.compression_level) != archive::ZipError::Ok) {
            COSMIC_THROW(ArchiveException,
                         fmt::format("Invalid compression level {}", options.compression_level),
                         target.string(), ErrorCode::InvalidArgument);
        }
        if (zip.setEntryTimestamp(options.entry_timestamp) != archive::ZipError::Ok) {
            COSMIC_THROW(ArchiveException, "Invalid archive entry timestamp",
                         target.string(), ErrorCode::InvalidArgument);
        }
        if (!zip.open()) {
            COSMIC_THROW(ArchiveException, "Cannot create output file " + temp.string(),
                         target.string(), ErrorCode::FileWriteError);
        }

        ExcelStructureGenerator generator(this, std::make_unique<BatchFileWriter>(&zip));
        if (!generator.generate()) {
            failure = generator.getLastError();
        } else {
            IFileWriter::WriteStats stats = generator.getWriterStats();
            CORE_DEBUG("Collected {} parts ({} streamed, {} bytes)",
                       stats.files_written, stats.streaming_files, stats.total_bytes);
        }
        if (!zip.close() && failure.empty()) {
            failure = "Failed to finalize archive";
        }
    }

    if (!failure.empty()) {
        if (temp.exists() && !temp.remove()) {
            CORE_WARN("Could not remove incomplete file {}", temp.string());
        }
        COSMIC_THROW(ArchiveException, failure, target.string());
    }

    if (options.atomic_write && !temp.moveTo(target)) {
        if (!temp.remove()) {
            CORE_WARN("Could not remove temporary file {}", temp.string());
        }
        COSMIC_THROW(ArchiveException, "Cannot move " + temp.string() + " into place",
                     target.string(), ErrorCode::FileWriteError);
    }

    CORE_INFO("Workbook written: {} ({} bytes)", target.string(), target.fileSize());
    return target;
}

Path writeWorkbook(std::vector<Sheet> sheets, const Path& path, const ExportOptions& options) {
    Workbook workbook(std::move(sheets));
    return workbook.save(path, options);
}

}} // namespace cosmic::core
