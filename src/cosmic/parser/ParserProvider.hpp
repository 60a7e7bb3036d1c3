#pragma once

#include "cosmic/core/Options.hpp"
#include "cosmic/core/Path.hpp"
#include "cosmic/parser/IDocumentParser.hpp"

#include <memory>

namespace cosmic {
namespace parser {

/**
 * @brief 解析后端选择器
 *
 * 构造时根据选项一次性创建后端，之后按源文件选择：
 * - .json 文件始终使用 yaml-cpp（JSON 是 YAML 的子集）
 * - 其余文件使用 options.backend 指定的后端，Auto 时为内置解析器
 */
class ParserProvider {
public:
    explicit ParserProvider(core::ParserOptions options = core::ParserOptions());

    const IDocumentParser& select(const core::Path& source) const;

    /**
     * @brief 解析后端选择（不创建对象）
     */
    static core::ParserBackend resolve(core::ParserBackend requested, const core::Path& source);

    static std::unique_ptr<IDocumentParser> create(core::ParserBackend backend,
                                                   const core::ParserOptions& options);

    /**
     * @brief 解析后端名称（auto / builtin / yaml-cpp）
     * @return 是否识别
     */
    static bool parseBackendName(const std::string& name, core::ParserBackend& out);

private:
    core::ParserOptions options_;
    std::unique_ptr<IDocumentParser> builtin_;
    std::unique_ptr<IDocumentParser> yaml_cpp_;
};

}} // namespace cosmic::parser
