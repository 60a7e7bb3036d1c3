#pragma once

#include "cosmic/xml/XMLStreamWriter.hpp"

#include <string>
#include <vector>

namespace cosmic {
namespace xml {

namespace relationship_type {
constexpr const char* OFFICE_DOCUMENT = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument";
constexpr const char* WORKSHEET       = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet";
constexpr const char* STYLES          = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles";
} // namespace relationship_type

struct Relationship {
    std::string id;
    std::string type;
    std::string target;
};

/**
 * @brief .rels 关系文件生成器（仅内部目标）
 */
class Relationships {
public:
    Relationships() = default;

    void addRelationship(const std::string& id, const std::string& type, const std::string& target);

    /**
     * @brief 以 rId{size+1} 自动编号添加关系
     * @return 分配的ID
     */
    std::string addAutoRelationship(const std::string& type, const std::string& target);

    void generate(const XMLStreamWriter::WriteCallback& callback) const;
    std::string generate() const;

    size_t size() const { return relationships_.size(); }
    const std::vector<Relationship>& relationships() const { return relationships_; }

private:
    void write(XMLStreamWriter& writer) const;

    std::vector<Relationship> relationships_;
};

}} // namespace cosmic::xml
