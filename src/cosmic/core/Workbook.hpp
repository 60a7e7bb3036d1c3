#pragma once

#include "cosmic/core/CellValue.hpp"
#include "cosmic/core/Options.hpp"
#include "cosmic/core/Path.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace cosmic {
namespace core {

/**
 * @brief 工作簿：按顺序排列的工作表
 *
 * 构造后不可修改；工作表编号即位置（1 起始），不会被重新编号。
 */
class Workbook {
public:
    static constexpr size_t MAX_SHEET_NAME_LENGTH = 31;
    static constexpr size_t MAX_ROWS = 1048576;
    static constexpr size_t MAX_COLUMNS = 16384;

    /**
     * @throws CosmicException (InvalidWorkbook / InvalidWorksheet) 工作表为空、名称非法或重复、尺寸超限
     */
    explicit Workbook(std::vector<Sheet> sheets);

    size_t getSheetCount() const { return sheets_.size(); }

    /**
     * @throws ParameterException 索引越界
     */
    const Sheet& getSheet(size_t index) const;

    const std::vector<Sheet>& getSheets() const { return sheets_; }

    /**
     * @brief 写出 .xlsx 文件
     *
     * 默认先写入 <path>.tmp，成功后重命名为目标路径；
     * 失败时删除临时文件，目标路径保持原样。
     *
     * @return 写出的路径
     * @throws ArchiveException 写出失败
     */
    Path save(const Path& path, const ExportOptions& options = ExportOptions()) const;

    /**
     * @brief 校验工作表名称（非空、不超过31字符、不含 []:*?/\ ）
     * @return 为空表示合法，否则为原因
     */
    static std::string checkSheetName(const std::string& name);

private:
    void validate() const;

    std::vector<Sheet> sheets_;
};

/**
 * @brief 由工作表列表构建工作簿并写出
 * @return 写出的路径
 */
Path writeWorkbook(std::vector<Sheet> sheets, const Path& path,
                   const ExportOptions& options = ExportOptions());

}} // namespace cosmic::core
