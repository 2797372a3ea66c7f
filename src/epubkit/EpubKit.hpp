#pragma once

// EpubKit - EPUB电子书读取库

// === 核心公共接口 ===
#include "epubkit/core/CancellationToken.hpp"
#include "epubkit/core/EpubOptions.hpp"
#include "epubkit/core/EpubTypes.hpp"
#include "epubkit/core/ErrorCode.hpp"
#include "epubkit/core/Exception.hpp"
#include "epubkit/core/Expected.hpp"
#include "epubkit/epub/Epub.hpp"
#include "epubkit/utils/Logger.hpp"

// 标准库依赖
#include <memory>
#include <string>
#include <vector>

// 版本信息
#define EPUBKIT_VERSION_MAJOR 1
#define EPUBKIT_VERSION_MINOR 0
#define EPUBKIT_VERSION_PATCH 0
#define EPUBKIT_VERSION_STRING "1.0.0"

// 平台检测
#ifdef _WIN32
    #define EPUBKIT_WINDOWS
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
#elif defined(__linux__)
    #define EPUBKIT_LINUX
#elif defined(__APPLE__)
    #define EPUBKIT_MACOS
#endif

// 导出宏定义
#ifdef EPUBKIT_WINDOWS
    #ifdef EPUBKIT_SHARED
        #ifdef EPUBKIT_EXPORTS
            #define EPUBKIT_API __declspec(dllexport)
        #else
            #define EPUBKIT_API __declspec(dllimport)
        #endif
    #else
        #define EPUBKIT_API
    #endif
#else
    #define EPUBKIT_API
#endif

namespace epubkit {

inline std::string getVersion() {
    return EPUBKIT_VERSION_STRING;
}

/**
 * @brief 初始化EpubKit（日志系统）
 * @param log_file_path 日志文件路径
 * @param enable_console 是否启用控制台日志
 * @return 初始化是否成功
 */
EPUBKIT_API bool initialize(const std::string& log_file_path = "logs/epubkit.log",
                            bool enable_console = true);

/**
 * @brief 刷新并关闭日志
 */
EPUBKIT_API void cleanup();

// === 用户层接口（失败时抛出 core::EpubKitException） ===

/**
 * @brief 打开EPUB文件
 * @throws core::FileException 文件不存在或无法打开
 * @throws core::XMLException container.xml、包文档或NCX无法解析
 */
EPUBKIT_API std::unique_ptr<epub::Epub> openEpub(const std::string& filename);

/**
 * @brief 从内存数据打开EPUB
 */
EPUBKIT_API std::unique_ptr<epub::Epub> openEpub(std::vector<uint8_t> data);

} // namespace epubkit
