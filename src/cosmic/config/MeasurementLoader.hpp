#pragma once

#include "cosmic/core/Options.hpp"
#include "cosmic/core/Path.hpp"
#include "cosmic/model/Measurement.hpp"
#include "cosmic/parser/Value.hpp"

namespace cosmic {
namespace config {

/**
 * @brief 读取并解析配置文件
 *
 * .json 文件始终使用 yaml-cpp 后端，其余按 options.backend 选择。
 *
 * @throws FileException 文件不存在或无法读取
 * @throws ParseException 解析失败（消息包含文件路径与原因）
 */
parser::Value loadDocument(const core::Path& path,
                           const core::ParserOptions& options = core::ParserOptions());

/**
 * @brief 读取配置并构建度量模型
 * @throws ConfigException 根节点不是映射或字段不合法
 */
model::SystemMeasurement loadMeasurement(const core::Path& path,
                                         const core::ParserOptions& options = core::ParserOptions());

}} // namespace cosmic::config
