#pragma once

#include "cosmic/xml/XMLStreamWriter.hpp"

#include <string>
#include <vector>

namespace cosmic {
namespace xml {

namespace content_type {
constexpr const char* RELATIONSHIPS = "application/vnd.openxmlformats-package.relationships+xml";
constexpr const char* XML           = "application/xml";
constexpr const char* WORKBOOK      = "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet.main+xml";
constexpr const char* WORKSHEET     = "application/vnd.openxmlformats-officedocument.spreadsheetml.worksheet+xml";
constexpr const char* STYLES        = "application/vnd.openxmlformats-officedocument.spreadsheetml.styles+xml";
} // namespace content_type

/**
 * @brief [Content_Types].xml 生成器
 */
class ContentTypes {
public:
    ContentTypes() = default;

    // 添加默认内容类型（按扩展名）
    void addDefault(const std::string& extension, const std::string& content_type);

    // 添加覆盖内容类型（按部件名，须以 / 开头）
    void addOverride(const std::string& part_name, const std::string& content_type);

    // 生成XML内容到回调函数
    void generate(const XMLStreamWriter::WriteCallback& callback) const;

    std::string generate() const;

    // rels 与 xml 两个默认类型
    void addExcelDefaults();

    size_t overrideCount() const { return override_types_.size(); }

private:
    void write(XMLStreamWriter& writer) const;

    struct DefaultType {
        std::string extension;
        std::string content_type;
    };

    struct OverrideType {
        std::string part_name;
        std::string content_type;
    };

    std::vector<DefaultType> default_types_;
    std::vector<OverrideType> override_types_;
};

}} // namespace cosmic::xml
