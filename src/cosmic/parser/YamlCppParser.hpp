#pragma once

#include "cosmic/parser/IDocumentParser.hpp"

namespace YAML {
class Node;
}

namespace cosmic {
namespace parser {

/**
 * @brief 基于 yaml-cpp 的完整 YAML 解析器（也用于 JSON）
 *
 * 普通（未加引号）标量按 ScalarParser 的规则推断类型，
 * 与内置解析器产出的值保持一致；加引号的标量始终是字符串。
 */
class YamlCppParser : public IDocumentParser {
public:
    Value parse(std::string_view text) const override;

    const char* name() const override { return "yaml-cpp"; }

private:
    static Value convert(const YAML::Node& node);
};

}} // namespace cosmic::parser
