#include "cosmic/utils/XMLUtils.hpp"

#include <iterator>
#include <utf8.h>

namespace cosmic {
namespace utils {

std::string XMLUtils::sanitizeUtf8(std::string_view text) {
    if (utf8::is_valid(text.begin(), text.end())) {
        return std::string(text);
    }
    std::string result;
    result.reserve(text.size() + 8);
    utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(result));
    return result;
}

void XMLUtils::appendEscaped(std::string& target, std::string_view text) {
    // 先修复编码，再逐字节转义（多字节序列的字节均 >= 0x80，不受影响）
    std::string clean;
    if (!utf8::is_valid(text.begin(), text.end())) {
        clean = sanitizeUtf8(text);
        text = clean;
    }

    for (char c : text) {
        switch (c) {
        case '<':
            target.append(LT);
            break;
        case '>':
            target.append(GT);
            break;
        case '&':
            target.append(AMP);
            break;
        case '"':
            target.append(QUOT);
            break;
        case '\'':
            target.append(APOS);
            break;
        default: {
            unsigned char uc = static_cast<unsigned char>(c);
            if (uc < 0x20 && uc != 0x09 && uc != 0x0A && uc != 0x0D) {
                continue; // 跳过无效控制字符
            }
            target.push_back(c);
            break;
        }
        }
    }
}

std::string XMLUtils::escapeXML(std::string_view text) {
    std::string result;
    result.reserve(text.size() + text.size() / 5);
    appendEscaped(result, text);
    return result;
}

} // namespace utils
} // namespace cosmic
