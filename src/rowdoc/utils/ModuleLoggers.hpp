#pragma once
#include "Logger.hpp"

/**
 * @file ModuleLoggers.hpp
 * @brief 模块化日志宏定义
 *
 * 每个模块都有自己的日志宏，格式: [等级][模块] 消息
 */

// 核心模块 (core)
#define CORE_DEBUG(...)    ROWDOC_LOG_DEBUG("[DBG][core] " __VA_ARGS__)
#define CORE_INFO(...)     ROWDOC_LOG_INFO("[INF][core] " __VA_ARGS__)
#define CORE_WARN(...)     ROWDOC_LOG_WARN("[WRN][core] " __VA_ARGS__)
#define CORE_ERROR(...)    ROWDOC_LOG_ERROR("[ERR][core] " __VA_ARGS__)

// 文档构建模块 (builder)
#define BUILDER_TRACE(...)    ROWDOC_LOG_TRACE("[TRC][bldr] " __VA_ARGS__)
#define BUILDER_DEBUG(...)    ROWDOC_LOG_DEBUG("[DBG][bldr] " __VA_ARGS__)
#define BUILDER_INFO(...)     ROWDOC_LOG_INFO("[INF][bldr] " __VA_ARGS__)
#define BUILDER_WARN(...)     ROWDOC_LOG_WARN("[WRN][bldr] " __VA_ARGS__)
#define BUILDER_ERROR(...)    ROWDOC_LOG_ERROR("[ERR][bldr] " __VA_ARGS__)

// XML模块 (xml)
#define XML_TRACE(...)    ROWDOC_LOG_TRACE("[TRC][xml ] " __VA_ARGS__)
#define XML_DEBUG(...)    ROWDOC_LOG_DEBUG("[DBG][xml ] " __VA_ARGS__)
#define XML_WARN(...)     ROWDOC_LOG_WARN("[WRN][xml ] " __VA_ARGS__)
#define XML_ERROR(...)    ROWDOC_LOG_ERROR("[ERR][xml ] " __VA_ARGS__)

// 配置模块 (config)
#define CONFIG_DEBUG(...)    ROWDOC_LOG_DEBUG("[DBG][conf] " __VA_ARGS__)
#define CONFIG_INFO(...)     ROWDOC_LOG_INFO("[INF][conf] " __VA_ARGS__)
#define CONFIG_WARN(...)     ROWDOC_LOG_WARN("[WRN][conf] " __VA_ARGS__)
#define CONFIG_ERROR(...)    ROWDOC_LOG_ERROR("[ERR][conf] " __VA_ARGS__)

// 工具模块 (utils)
#define UTILS_DEBUG(...)    ROWDOC_LOG_DEBUG("[DBG][util] " __VA_ARGS__)
#define UTILS_INFO(...)     ROWDOC_LOG_INFO("[INF][util] " __VA_ARGS__)
#define UTILS_WARN(...)     ROWDOC_LOG_WARN("[WRN][util] " __VA_ARGS__)
#define UTILS_ERROR(...)    ROWDOC_LOG_ERROR("[ERR][util] " __VA_ARGS__)
