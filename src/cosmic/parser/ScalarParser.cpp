#include "cosmic/parser/ScalarParser.hpp"

#include <cctype>
#include <charconv>
#include <system_error>
#include <fast_float/fast_float.h>

namespace cosmic {
namespace parser {

namespace {

bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

bool equalsIgnoreCase(std::string_view text, std::string_view keyword) {
    if (text.size() != keyword.size()) return false;
    for (size_t i = 0; i < text.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(text[i])) != keyword[i]) {
            return false;
        }
    }
    return true;
}

// from_chars 不接受前导 '+'，手动剥离；"+-1" 之类保持非法
std::string_view stripLeadingPlus(std::string_view token) {
    if (token.size() > 1 && token[0] == '+' && token[1] != '-' && token[1] != '+') {
        return token.substr(1);
    }
    return token;
}

} // namespace

std::string_view ScalarParser::trimLeft(std::string_view text) {
    size_t start = 0;
    while (start < text.size() && isSpace(text[start])) ++start;
    return text.substr(start);
}

std::string_view ScalarParser::trimRight(std::string_view text) {
    size_t end = text.size();
    while (end > 0 && isSpace(text[end - 1])) --end;
    return text.substr(0, end);
}

std::string_view ScalarParser::trim(std::string_view text) {
    return trimRight(trimLeft(text));
}

std::optional<int64_t> ScalarParser::parseInteger(std::string_view token) {
    token = stripLeadingPlus(token);
    if (token.empty()) return std::nullopt;

    int64_t value = 0;
    const char* first = token.data();
    const char* last = token.data() + token.size();
    auto result = std::from_chars(first, last, value);
    if (result.ec != std::errc{} || result.ptr != last) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> ScalarParser::parseFloat(std::string_view token) {
    token = stripLeadingPlus(token);
    if (token.empty()) return std::nullopt;

    double value = 0.0;
    const char* first = token.data();
    const char* last = token.data() + token.size();
    auto result = fast_float::from_chars(first, last, value);
    if (result.ec != std::errc{} || result.ptr != last) {
        return std::nullopt;
    }
    return value;
}

Value ScalarParser::parse(std::string_view token) {
    // 1. 成对引号：原样返回内部文本，不处理转义
    if (token.size() >= 2) {
        char open = token.front();
        if ((open == '"' || open == '\'') && token.back() == open) {
            return Value(std::string(token.substr(1, token.size() - 2)));
        }
    }

    // 2. 布尔
    if (equalsIgnoreCase(token, "true")) return Value(true);
    if (equalsIgnoreCase(token, "false")) return Value(false);

    // 3. 空值
    if (equalsIgnoreCase(token, "null")) return Value();

    // 4. 数值
    if (auto integer = parseInteger(token)) {
        return Value(*integer);
    }
    if (token.find('.') != std::string_view::npos) {
        if (auto number = parseFloat(token)) {
            return Value(*number);
        }
    }

    return Value(std::string(token));
}

}} // namespace cosmic::parser
