#pragma once
#include "Logger.hpp"

/**
 * @file ModuleLoggers.hpp
 * @brief 模块化日志宏定义
 *
 * 每个模块都有自己的日志宏，格式: [等级][模块] 消息
 */

// 核心模块 (core)
#define CORE_DEBUG(...)    XLSXEXTRACT_LOG_DEBUG("[DBG][core] " __VA_ARGS__)
#define CORE_INFO(...)     XLSXEXTRACT_LOG_INFO("[INF][core] " __VA_ARGS__)
#define CORE_WARN(...)     XLSXEXTRACT_LOG_WARN("[WRN][core] " __VA_ARGS__)
#define CORE_ERROR(...)    XLSXEXTRACT_LOG_ERROR("[ERR][core] " __VA_ARGS__)

// 匹配与传输引擎 (match)
#define MATCH_TRACE(...)   XLSXEXTRACT_LOG_TRACE("[TRC][mtch] " __VA_ARGS__)
#define MATCH_DEBUG(...)   XLSXEXTRACT_LOG_DEBUG("[DBG][mtch] " __VA_ARGS__)
#define MATCH_INFO(...)    XLSXEXTRACT_LOG_INFO("[INF][mtch] " __VA_ARGS__)
#define MATCH_WARN(...)    XLSXEXTRACT_LOG_WARN("[WRN][mtch] " __VA_ARGS__)

// 读取模块 (reader)
#define READER_DEBUG(...)  XLSXEXTRACT_LOG_DEBUG("[DBG][read] " __VA_ARGS__)
#define READER_INFO(...)   XLSXEXTRACT_LOG_INFO("[INF][read] " __VA_ARGS__)
#define READER_WARN(...)   XLSXEXTRACT_LOG_WARN("[WRN][read] " __VA_ARGS__)
#define READER_ERROR(...)  XLSXEXTRACT_LOG_ERROR("[ERR][read] " __VA_ARGS__)

// 写入模块 (writer)
#define WRITER_DEBUG(...)  XLSXEXTRACT_LOG_DEBUG("[DBG][writ] " __VA_ARGS__)
#define WRITER_INFO(...)   XLSXEXTRACT_LOG_INFO("[INF][writ] " __VA_ARGS__)
#define WRITER_WARN(...)   XLSXEXTRACT_LOG_WARN("[WRN][writ] " __VA_ARGS__)
#define WRITER_ERROR(...)  XLSXEXTRACT_LOG_ERROR("[ERR][writ] " __VA_ARGS__)

// XML模块 (xml)
#define XML_DEBUG(...)     XLSXEXTRACT_LOG_DEBUG("[DBG][xml ] " __VA_ARGS__)
#define XML_WARN(...)      XLSXEXTRACT_LOG_WARN("[WRN][xml ] " __VA_ARGS__)
#define XML_ERROR(...)     XLSXEXTRACT_LOG_ERROR("[ERR][xml ] " __VA_ARGS__)

// 归档模块 (archive)
#define ARCHIVE_DEBUG(...) XLSXEXTRACT_LOG_DEBUG("[DBG][arch] " __VA_ARGS__)
#define ARCHIVE_INFO(...)  XLSXEXTRACT_LOG_INFO("[INF][arch] " __VA_ARGS__)
#define ARCHIVE_WARN(...)  XLSXEXTRACT_LOG_WARN("[WRN][arch] " __VA_ARGS__)
#define ARCHIVE_ERROR(...) XLSXEXTRACT_LOG_ERROR("[ERR][arch] " __VA_ARGS__)

// 配置表运行器 (config)
#define CONFIG_DEBUG(...)  XLSXEXTRACT_LOG_DEBUG("[DBG][conf] " __VA_ARGS__)
#define CONFIG_INFO(...)   XLSXEXTRACT_LOG_INFO("[INF][conf] " __VA_ARGS__)
#define CONFIG_WARN(...)   XLSXEXTRACT_LOG_WARN("[WRN][conf] " __VA_ARGS__)
#define CONFIG_ERROR(...)  XLSXEXTRACT_LOG_ERROR("[ERR][conf] " __VA_ARGS__)

// 工具模块 (utils)
#define UTILS_DEBUG(...)   XLSXEXTRACT_LOG_DEBUG("[DBG][util] " __VA_ARGS__)
#define UTILS_WARN(...)    XLSXEXTRACT_LOG_WARN("[WRN][util] " __VA_ARGS__)
