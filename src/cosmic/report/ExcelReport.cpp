#include "cosmic/report/ExcelReport.hpp"
#include "cosmic/core/Workbook.hpp"
#include "cosmic/model/CosmicCalculator.hpp"
#include "cosmic/utils/ModuleLoggers.hpp"

#include <optional>
#include <string>

namespace cosmic {
namespace report {

namespace {

core::CellValue optionalCell(const std::optional<std::string>& value) {
    if (value) {
        return core::CellValue(*value);
    }
    return core::CellValue();
}

core::CellValue countCell(size_t value) {
    return core::CellValue(static_cast<int64_t>(value));
}

core::Row headerRow(std::initializer_list<const char*> titles) {
    core::Row row;
    row.reserve(titles.size());
    for (const char* title : titles) {
        row.emplace_back(std::string(title));
    }
    return row;
}

} // namespace

ExcelReport::ExcelReport(const model::SystemMeasurement& measurement)
    : measurement_(measurement) {
}

core::Sheet ExcelReport::buildSummarySheet() const {
    model::CosmicCalculator calculator(measurement_);

    core::Sheet sheet;
    sheet.name = SUMMARY_SHEET;
    sheet.rows.push_back(headerRow({"Metric", "Value"}));
    sheet.rows.push_back({core::CellValue(std::string("Total CFP")), countCell(calculator.totalCfp())});
    return sheet;
}

core::Sheet ExcelReport::buildFunctionalProcessSheet() const {
    model::CosmicCalculator calculator(measurement_);

    core::Sheet sheet;
    sheet.name = PROCESS_SHEET;
    sheet.rows.push_back(headerRow({"Functional Process", "Trigger", "Object of Interest", "Description",
                                    "Entry (E)", "Exit (X)", "Read (R)", "Write (W)", "Total CFP"}));

    for (const auto& summary : calculator.summarize()) {
        sheet.rows.push_back({
            core::CellValue(summary.name),
            optionalCell(summary.trigger),
            optionalCell(summary.object_of_interest),
            optionalCell(summary.description),
            countCell(summary.entry_count),
            countCell(summary.exit_count),
            countCell(summary.read_count),
            countCell(summary.write_count),
            countCell(summary.total_cfp),
        });
    }
    return sheet;
}

core::Sheet ExcelReport::buildDataMovementSheet() const {
    core::Sheet sheet;
    sheet.name = MOVEMENT_SHEET;
    sheet.rows.push_back(headerRow({"Functional Process", "Sequence", "Movement Type", "Description",
                                    "Object of Interest", "Trigger", "Code Reference", "Notes"}));

    for (const auto& process : measurement_.functional_processes) {
        size_t sequence = 1;
        for (const auto& movement : process.data_movements) {
            // 未填写时沿用所属处理的值
            const auto& object_of_interest = movement.object_of_interest ? movement.object_of_interest
                                                                         : process.object_of_interest;
            const auto& trigger = movement.trigger ? movement.trigger : process.trigger;

            sheet.rows.push_back({
                core::CellValue(process.name),
                countCell(sequence++),
                core::CellValue(std::string(model::toString(movement.type))),
                core::CellValue(movement.description),
                optionalCell(object_of_interest),
                optionalCell(trigger),
                optionalCell(movement.code_reference),
                optionalCell(movement.notes),
            });
        }
    }
    return sheet;
}

std::vector<core::Sheet> ExcelReport::buildSheets() const {
    std::vector<core::Sheet> sheets;
    sheets.reserve(3);
    sheets.push_back(buildSummarySheet());
    sheets.push_back(buildFunctionalProcessSheet());
    sheets.push_back(buildDataMovementSheet());
    return sheets;
}

core::Path ExcelReport::exportTo(const core::Path& path, const core::ExportOptions& options) const {
    MODEL_INFO("Exporting report for '{}' ({} CFP) to {}", measurement_.name, measurement_.totalCfp(), path.string());
    return core::writeWorkbook(buildSheets(), path, options);
}

}} // namespace cosmic::report
