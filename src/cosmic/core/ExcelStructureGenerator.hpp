#pragma once

#include "cosmic/core/IFileWriter.hpp"

#include <memory>
#include <string>

namespace cosmic {
namespace core {

class Workbook;

/**
 * @brief Excel包结构生成器
 *
 * 以固定顺序把所有部件交给 IFileWriter：
 * [Content_Types].xml、_rels/.rels、xl/workbook.xml、
 * xl/_rels/workbook.xml.rels、xl/styles.xml，然后按工作簿顺序输出各工作表。
 */
class ExcelStructureGenerator {
public:
    /**
     * @param workbook 工作簿（不持有）
     * @param writer 部件写入器
     * @throws ParameterException 参数为空
     */
    ExcelStructureGenerator(const Workbook* workbook, std::unique_ptr<IFileWriter> writer);
    ~ExcelStructureGenerator();

    /**
     * @brief 生成完整的包结构
     * @return 是否成功，失败原因见 getLastError()
     */
    bool generate();

    IFileWriter::WriteStats getWriterStats() const;
    const std::string& getLastError() const { return last_error_; }

private:
    bool generateBasicFiles();
    bool generateWorksheets();
    bool finalize();

    bool fail(const std::string& message);

    const Workbook* workbook_;
    std::unique_ptr<IFileWriter> writer_;
    std::string last_error_;
};

}} // namespace cosmic::core
