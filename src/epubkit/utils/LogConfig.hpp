#pragma once

// 日志控制宏
// 设置为 0 禁用特定类型的日志，设置为 1 启用

#define ENABLE_ZIP_DEBUG_LOGS 0       // 条目级ZIP读取日志（每个条目一行，量很大）
#define ENABLE_CHAPTER_DEBUG_LOGS 0   // 章节逐项提取日志

// 条件日志宏在ModuleLoggers.hpp中基于模块宏定义：
// EPUBKIT_LOG_ZIP_DEBUG     -> ARCHIVE_DEBUG
// EPUBKIT_LOG_CHAPTER_DEBUG -> EPUB_DEBUG
