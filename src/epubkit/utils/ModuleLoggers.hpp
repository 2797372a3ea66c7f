#pragma once
#include "epubkit/utils/Logger.hpp"
#include "epubkit/utils/LogConfig.hpp"

/**
 * @file ModuleLoggers.hpp
 * @brief 模块化日志宏定义
 *
 * 每个模块都有自己的日志宏，格式: [等级][模块] 消息
 */

// 核心模块 (core)
#define CORE_DEBUG(...)    EPUBKIT_LOG_DEBUG("[DBG][core] " __VA_ARGS__)
#define CORE_INFO(...)     EPUBKIT_LOG_INFO("[INF][core] " __VA_ARGS__)
#define CORE_WARN(...)     EPUBKIT_LOG_WARN("[WRN][core] " __VA_ARGS__)
#define CORE_ERROR(...)    EPUBKIT_LOG_ERROR("[ERR][core] " __VA_ARGS__)

// 归档模块 (archive)
#define ARCHIVE_DEBUG(...)    EPUBKIT_LOG_DEBUG("[DBG][arch] " __VA_ARGS__)
#define ARCHIVE_INFO(...)     EPUBKIT_LOG_INFO("[INF][arch] " __VA_ARGS__)
#define ARCHIVE_WARN(...)     EPUBKIT_LOG_WARN("[WRN][arch] " __VA_ARGS__)
#define ARCHIVE_ERROR(...)    EPUBKIT_LOG_ERROR("[ERR][arch] " __VA_ARGS__)

// XML模块 (xml)
#define XML_DEBUG(...)    EPUBKIT_LOG_DEBUG("[DBG][xml ] " __VA_ARGS__)
#define XML_INFO(...)     EPUBKIT_LOG_INFO("[INF][xml ] " __VA_ARGS__)
#define XML_WARN(...)     EPUBKIT_LOG_WARN("[WRN][xml ] " __VA_ARGS__)
#define XML_ERROR(...)    EPUBKIT_LOG_ERROR("[ERR][xml ] " __VA_ARGS__)

// 读取模块 (reader)
#define READER_DEBUG(...)    EPUBKIT_LOG_DEBUG("[DBG][read] " __VA_ARGS__)
#define READER_INFO(...)     EPUBKIT_LOG_INFO("[INF][read] " __VA_ARGS__)
#define READER_WARN(...)     EPUBKIT_LOG_WARN("[WRN][read] " __VA_ARGS__)
#define READER_ERROR(...)    EPUBKIT_LOG_ERROR("[ERR][read] " __VA_ARGS__)

// 电子书模型模块 (epub)
#define EPUB_DEBUG(...)    EPUBKIT_LOG_DEBUG("[DBG][epub] " __VA_ARGS__)
#define EPUB_INFO(...)     EPUBKIT_LOG_INFO("[INF][epub] " __VA_ARGS__)
#define EPUB_WARN(...)     EPUBKIT_LOG_WARN("[WRN][epub] " __VA_ARGS__)
#define EPUB_ERROR(...)    EPUBKIT_LOG_ERROR("[ERR][epub] " __VA_ARGS__)

// 条件日志宏
#if ENABLE_ZIP_DEBUG_LOGS
    #define EPUBKIT_LOG_ZIP_DEBUG(...) ARCHIVE_DEBUG(__VA_ARGS__)
#else
    #define EPUBKIT_LOG_ZIP_DEBUG(...) do {} while(0)
#endif

#if ENABLE_CHAPTER_DEBUG_LOGS
    #define EPUBKIT_LOG_CHAPTER_DEBUG(...) EPUB_DEBUG(__VA_ARGS__)
#else
    #define EPUBKIT_LOG_CHAPTER_DEBUG(...) do {} while(0)
#endif
