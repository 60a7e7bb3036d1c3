#include "cosmic/parser/IndentTreeParser.hpp"
#include "cosmic/parser/ScalarParser.hpp"
#include "cosmic/core/Exception.hpp"
#include "cosmic/utils/ModuleLoggers.hpp"

namespace cosmic {
namespace parser {

namespace {

constexpr const char* kMixedStructures =
    "Mixed list and mapping structures are not supported in simple YAML parser";
constexpr const char* kListItemContinuation =
    "List item mappings must contain dictionary structures at consistent indentation";

bool isListItem(const std::string& content) {
    return content == "-" || (content.size() >= 2 && content[0] == '-' && content[1] == ' ');
}

// 按第一个冒号切分；没有冒号时整行都是键
void splitKeyValue(std::string_view text, std::string_view& key, std::string_view& value_part) {
    size_t colon = text.find(':');
    if (colon == std::string_view::npos) {
        key = ScalarParser::trim(text);
        value_part = std::string_view();
        return;
    }
    key = ScalarParser::trim(text.substr(0, colon));
    value_part = ScalarParser::trimLeft(text.substr(colon + 1));
}

// 标量作为映射键时的文本形式，与 True/False 的写法保持一致
std::string scalarKey(const Value& scalar) {
    return scalar.isNull() ? std::string("None") : scalar.toScalarString();
}

} // namespace

ParseResult IndentTreeParser::parseBlock(const std::vector<LineRecord>& lines,
                                         size_t start, size_t indent) const {
    enum class BlockKind { Undecided, Sequence, Map };

    BlockKind kind = BlockKind::Undecided;
    List list;
    Mapping mapping;

    size_t index = start;
    while (index < lines.size()) {
        const LineRecord& line = lines[index];
        if (line.indent < indent) {
            break;
        }

        if (isListItem(line.content)) {
            if (kind == BlockKind::Map) {
                COSMIC_THROW(core::ParseException, kMixedStructures, line.line_number);
            }
            kind = BlockKind::Sequence;

            ParseResult item = parseListItem(lines, index);
            list.push_back(std::move(item.value));
            index = item.next_index;
            continue;
        }

        if (kind == BlockKind::Sequence) {
            COSMIC_THROW(core::ParseException, kMixedStructures, line.line_number);
        }
        kind = BlockKind::Map;

        std::string_view key;
        std::string_view value_part;
        splitKeyValue(line.content, key, value_part);
        ++index;

        if (!value_part.empty()) {
            mapping.set(std::string(key), ScalarParser::parse(value_part));
        } else if (index < lines.size() && lines[index].indent > line.indent) {
            ParseResult nested = parseBlock(lines, index, lines[index].indent);
            mapping.set(std::string(key), std::move(nested.value));
            index = nested.next_index;
        } else {
            mapping.set(std::string(key), Value());
        }
    }

    if (kind == BlockKind::Sequence) {
        return ParseResult{Value(std::move(list)), index};
    }
    return ParseResult{Value(std::move(mapping)), index};
}

ParseResult IndentTreeParser::parseListItem(const std::vector<LineRecord>& lines, size_t index) const {
    const LineRecord& line = lines[index];
    const size_t item_indent = line.indent;

    std::string_view remainder;
    if (line.content.size() > 1) {
        remainder = ScalarParser::trim(std::string_view(line.content).substr(2));
    }

    size_t next = index + 1;
    auto hasDeeper = [&lines, item_indent](size_t i) {
        return i < lines.size() && lines[i].indent > item_indent;
    };

    // "-" 单独成行：值为下方更深的块，否则为空
    if (remainder.empty()) {
        if (hasDeeper(next)) {
            return parseBlock(lines, next, lines[next].indent);
        }
        return ParseResult{Value(), next};
    }

    // "- key: value"：列表项为映射，更深的续行合并进同一映射
    if (remainder.find(':') != std::string_view::npos) {
        std::string_view key;
        std::string_view value_part;
        splitKeyValue(remainder, key, value_part);

        Mapping item;
        if (!value_part.empty()) {
            item.set(std::string(key), ScalarParser::parse(value_part));
        } else if (hasDeeper(next)) {
            ParseResult nested = parseBlock(lines, next, lines[next].indent);
            item.set(std::string(key), std::move(nested.value));
            next = nested.next_index;
        } else {
            item.set(std::string(key), Value());
        }

        while (hasDeeper(next)) {
            const size_t continuation_line = lines[next].line_number;
            ParseResult extra = parseBlock(lines, next, lines[next].indent);
            if (!extra.value.isMapping()) {
                COSMIC_THROW(core::ParseException, kListItemContinuation, continuation_line);
            }
            item.merge(std::move(extra.value.asMapping()));
            next = extra.next_index;
        }
        return ParseResult{Value(std::move(item)), next};
    }

    // "- scalar"：有更深续行时按续行类型包装
    Value scalar = ScalarParser::parse(remainder);
    if (!hasDeeper(next)) {
        return ParseResult{std::move(scalar), next};
    }

    ParseResult nested = parseBlock(lines, next, lines[next].indent);
    if (nested.value.isMapping()) {
        Mapping wrapped;
        wrapped.set(scalarKey(scalar), std::move(nested.value));
        return ParseResult{Value(std::move(wrapped)), nested.next_index};
    }

    List flattened;
    flattened.push_back(std::move(scalar));
    if (nested.value.isList()) {
        for (auto& element : nested.value.asList()) {
            flattened.push_back(std::move(element));
        }
    } else {
        flattened.push_back(std::move(nested.value));
    }
    return ParseResult{Value(std::move(flattened)), nested.next_index};
}

Value IndentTreeParser::parseDocument(std::string_view text) const {
    std::vector<LineRecord> lines = LinePreprocessor::process(text, options_);
    if (lines.empty()) {
        PARSER_DEBUG("Empty document parsed as empty mapping");
        return Value(Mapping());
    }

    ParseResult result = parseBlock(lines, 0, lines[0].indent);
    if (result.next_index < lines.size()) {
        COSMIC_THROW(core::ParseException,
                     "Line is indented less than the document root",
                     lines[result.next_index].line_number);
    }

    PARSER_DEBUG("Parsed {} lines, root is {}", lines.size(), Value::typeName(result.value.type()));
    return std::move(result.value);
}

}} // namespace cosmic::parser
