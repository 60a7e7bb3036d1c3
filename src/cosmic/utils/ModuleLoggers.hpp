#pragma once
#include "Logger.hpp"

/**
 * @file ModuleLoggers.hpp
 * @brief 模块化日志宏定义
 *
 * 每个模块都有自己的日志宏，格式: [等级][模块] 消息
 */

// 核心模块 (core)
#define CORE_DEBUG(...)    COSMIC_LOG_DEBUG("[DBG][core] " __VA_ARGS__)
#define CORE_INFO(...)     COSMIC_LOG_INFO("[INF][core] " __VA_ARGS__)
#define CORE_WARN(...)     COSMIC_LOG_WARN("[WRN][core] " __VA_ARGS__)
#define CORE_ERROR(...)    COSMIC_LOG_ERROR("[ERR][core] " __VA_ARGS__)

// 解析模块 (parser)
#define PARSER_TRACE(...)  COSMIC_LOG_TRACE("[TRC][pars] " __VA_ARGS__)
#define PARSER_DEBUG(...)  COSMIC_LOG_DEBUG("[DBG][pars] " __VA_ARGS__)
#define PARSER_INFO(...)   COSMIC_LOG_INFO("[INF][pars] " __VA_ARGS__)
#define PARSER_WARN(...)   COSMIC_LOG_WARN("[WRN][pars] " __VA_ARGS__)
#define PARSER_ERROR(...)  COSMIC_LOG_ERROR("[ERR][pars] " __VA_ARGS__)

// 配置加载模块 (config)
#define CONFIG_DEBUG(...)  COSMIC_LOG_DEBUG("[DBG][conf] " __VA_ARGS__)
#define CONFIG_INFO(...)   COSMIC_LOG_INFO("[INF][conf] " __VA_ARGS__)
#define CONFIG_WARN(...)   COSMIC_LOG_WARN("[WRN][conf] " __VA_ARGS__)
#define CONFIG_ERROR(...)  COSMIC_LOG_ERROR("[ERR][conf] " __VA_ARGS__)

// XML模块 (xml)
#define XML_DEBUG(...)     COSMIC_LOG_DEBUG("[DBG][xml ] " __VA_ARGS__)
#define XML_INFO(...)      COSMIC_LOG_INFO("[INF][xml ] " __VA_ARGS__)
#define XML_WARN(...)      COSMIC_LOG_WARN("[WRN][xml ] " __VA_ARGS__)
#define XML_ERROR(...)     COSMIC_LOG_ERROR("[ERR][xml ] " __VA_ARGS__)

// 归档模块 (archive)
#define ARCHIVE_DEBUG(...) COSMIC_LOG_DEBUG("[DBG][arch] " __VA_ARGS__)
#define ARCHIVE_INFO(...)  COSMIC_LOG_INFO("[INF][arch] " __VA_ARGS__)
#define ARCHIVE_WARN(...)  COSMIC_LOG_WARN("[WRN][arch] " __VA_ARGS__)
#define ARCHIVE_ERROR(...) COSMIC_LOG_ERROR("[ERR][arch] " __VA_ARGS__)

// 领域模型模块 (model / report)
#define MODEL_DEBUG(...)   COSMIC_LOG_DEBUG("[DBG][modl] " __VA_ARGS__)
#define MODEL_INFO(...)    COSMIC_LOG_INFO("[INF][modl] " __VA_ARGS__)
#define MODEL_WARN(...)    COSMIC_LOG_WARN("[WRN][modl] " __VA_ARGS__)
#define MODEL_ERROR(...)   COSMIC_LOG_ERROR("[ERR][modl] " __VA_ARGS__)
