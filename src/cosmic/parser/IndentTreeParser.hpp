#pragma once

#include "cosmic/core/Options.hpp"
#include "cosmic/parser/LinePreprocessor.hpp"
#include "cosmic/parser/Value.hpp"

#include <string_view>
#include <vector>

namespace cosmic {
namespace parser {

/**
 * @brief 块解析结果：值与下一个未消费行的下标
 */
struct ParseResult {
    Value value;
    size_t next_index = 0;
};

/**
 * @brief 基于缩进的树解析器（YAML 子集）
 *
 * 仅以缩进表示嵌套：
 * - "- " 或单独的 "-" 开头为列表项
 * - "key: value" / "key:" 为映射项
 * 同一缩进块只能是列表或映射之一，混用抛出 ParseException。
 * 解析是纯函数，对象本身不持有游标状态，可重复调用。
 */
class IndentTreeParser {
public:
    explicit IndentTreeParser(core::ParserOptions options = core::ParserOptions())
        : options_(options) {}

    /**
     * @brief 从 start 开始解析一个缩进块
     * @param lines 预处理后的行
     * @param start 起始行下标
     * @param indent 该块的期望缩进；缩进小于它的行结束本块
     * @return 块的值以及下一行下标；空块返回空映射
     * @throws ParseException 列表与映射混用，或列表项映射的续行不是映射
     */
    ParseResult parseBlock(const std::vector<LineRecord>& lines, size_t start, size_t indent) const;

    /**
     * @brief 预处理并解析整个文档，根缩进取首行缩进
     *
     * 根节点可能是列表或标量，由调用方校验。
     */
    Value parseDocument(std::string_view text) const;

private:
    ParseResult parseListItem(const std::vector<LineRecord>& lines, size_t index) const;

    core::ParserOptions options_;
};

}} // namespace cosmic::parser
