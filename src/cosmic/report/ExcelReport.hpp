#pragma once

#include "cosmic/core/CellValue.hpp"
#include "cosmic/core/Options.hpp"
#include "cosmic/core/Path.hpp"
#include "cosmic/model/Measurement.hpp"

#include <vector>

namespace cosmic {
namespace report {

/**
 * @brief COSMIC 度量报表
 *
 * 工作表顺序：Summary、Functional Processes、Data Movements。
 */
class ExcelReport {
public:
    static constexpr const char* SUMMARY_SHEET = "Summary";
    static constexpr const char* PROCESS_SHEET = "Functional Processes";
    static constexpr const char* MOVEMENT_SHEET = "Data Movements";

    explicit ExcelReport(const model::SystemMeasurement& measurement);

    std::vector<core::Sheet> buildSheets() const;

    core::Sheet buildSummarySheet() const;
    core::Sheet buildFunctionalProcessSheet() const;
    core::Sheet buildDataMovementSheet() const;

    /**
     * @brief 写出报表
     * @return 写出的路径
     * @throws ArchiveException 写出失败
     */
    core::Path exportTo(const core::Path& path,
                        const core::ExportOptions& options = core::ExportOptions()) const;

private:
    const model::SystemMeasurement& measurement_;
};

}} // namespace cosmic::report
