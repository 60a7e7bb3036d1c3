#pragma once

#include "cosmic/parser/Value.hpp"

#include <string_view>

namespace cosmic {
namespace parser {

/**
 * @brief 文档解析能力接口
 *
 * 内置缩进解析器与 yaml-cpp 解析器实现同一接口，由 ParserProvider 选择。
 */
class IDocumentParser {
public:
    virtual ~IDocumentParser() = default;

    /**
     * @brief 解析完整文档
     * @throws ParseException 结构错误
     */
    virtual Value parse(std::string_view text) const = 0;

    // 后端名称，用于日志
    virtual const char* name() const = 0;
};

}} // namespace cosmic::parser
