#pragma once

#include <string>
#include <string_view>

namespace cosmic {
namespace utils {

/**
 * @brief XML工具类 - 提供XML相关的辅助函数
 */
class XMLUtils {
public:
    // XML 实体字面量
    static constexpr const char* AMP  = "&amp;";
    static constexpr const char* LT   = "&lt;";
    static constexpr const char* GT   = "&gt;";
    static constexpr const char* QUOT = "&quot;";
    static constexpr const char* APOS = "&apos;";

    /**
     * @brief XML转义 - 将特殊字符转换为XML实体
     * @param text 需要转义的文本
     * @return 转义后的文本
     *
     * 转义规则：
     * - < -> &lt;
     * - > -> &gt;
     * - & -> &amp;
     * - " -> &quot;
     * - ' -> &apos;
     * - 跳过无效控制字符（保留制表符、换行符、回车符）
     * - 非法 UTF-8 序列替换为 U+FFFD
     */
    static std::string escapeXML(std::string_view text);

    /**
     * @brief 追加转义后的文本到目标缓冲
     */
    static void appendEscaped(std::string& target, std::string_view text);

    /**
     * @brief 将非法 UTF-8 序列替换为 U+FFFD，合法输入原样返回
     */
    static std::string sanitizeUtf8(std::string_view text);
};

} // namespace utils
} // namespace cosmic
