#include "cosmic/parser/LinePreprocessor.hpp"
#include "cosmic/parser/ScalarParser.hpp"
#include "cosmic/core/Exception.hpp"
#include "cosmic/utils/ModuleLoggers.hpp"

namespace cosmic {
namespace parser {

std::vector<LineRecord> LinePreprocessor::process(std::string_view text,
                                                  const core::ParserOptions& options) {
    std::vector<LineRecord> records;

    size_t line_number = 0;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t newline = text.find('\n', pos);
        if (newline == std::string_view::npos) {
            newline = text.size();
        }
        std::string_view line = text.substr(pos, newline - pos);
        pos = newline + 1;
        ++line_number;

        line = ScalarParser::trimRight(line);
        if (line.empty()) {
            continue;
        }

        std::string_view stripped = ScalarParser::trimLeft(line);
        if (stripped.front() == '#') {
            continue;
        }

        size_t indent = 0;
        while (indent < line.size() && line[indent] == ' ') {
            ++indent;
        }

        if (line[indent] == '\t') {
            if (options.reject_tab_indentation) {
                COSMIC_THROW(core::ParseException,
                             "Tab characters are not supported in indentation", line_number);
            }
            PARSER_DEBUG("Tab in indentation at line {} kept as content", line_number);
        }

        records.push_back(LineRecord{indent, std::string(line.substr(indent)), line_number});
    }

    PARSER_TRACE("Preprocessed {} lines into {} records", line_number, records.size());
    return records;
}

}} // namespace cosmic::parser
