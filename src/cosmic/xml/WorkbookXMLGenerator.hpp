#pragma once

#include "cosmic/core/CellValue.hpp"
#include "cosmic/xml/ContentTypes.hpp"
#include "cosmic/xml/Relationships.hpp"
#include "cosmic/xml/XMLStreamWriter.hpp"

#include <string>
#include <vector>

namespace cosmic {
namespace xml {

/**
 * @brief 工作簿级部件生成器
 *
 * 工作表按位置编号（1 起始）：sheetId、rIdN 与 sheetN.xml 一一对应，
 * 样式关系固定为 rId{N+1}。
 */
class WorkbookXMLGenerator {
public:
    explicit WorkbookXMLGenerator(const std::vector<core::Sheet>& sheets);

    // xl/workbook.xml
    std::string generateWorkbook() const;
    void generateWorkbook(XMLStreamWriter& writer) const;

    // xl/_rels/workbook.xml.rels
    std::string generateWorkbookRels() const;

    // _rels/.rels
    std::string generateRootRels() const;

    // [Content_Types].xml
    std::string generateContentTypes() const;

    ContentTypes buildContentTypes() const;
    Relationships buildWorkbookRelationships() const;

    /**
     * @brief 工作表在归档中的路径
     * @param index 0 起始位置
     */
    static std::string worksheetPath(size_t index);

private:
    const std::vector<core::Sheet>& sheets_;
};

}} // namespace cosmic::xml
