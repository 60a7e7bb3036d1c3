#pragma once

#include "cosmic/parser/IDocumentParser.hpp"
#include "cosmic/parser/IndentTreeParser.hpp"

namespace cosmic {
namespace parser {

/**
 * @brief 内置 YAML 子集解析器
 */
class SimpleYamlParser : public IDocumentParser {
public:
    explicit SimpleYamlParser(core::ParserOptions options = core::ParserOptions())
        : tree_parser_(options) {}

    Value parse(std::string_view text) const override {
        return tree_parser_.parseDocument(text);
    }

    const char* name() const override { return "builtin"; }

private:
    IndentTreeParser tree_parser_;
};

}} // namespace cosmic::parser
