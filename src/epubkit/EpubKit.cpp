#include "epubkit/EpubKit.hpp"
#include "epubkit/core/ExceptionBridge.hpp"
#include <iostream>

namespace epubkit {

EPUBKIT_API bool initialize(const std::string& log_file_path, bool enable_console) {
    try {
        Logger::getInstance().initialize(log_file_path, Logger::Level::INFO, enable_console);
        EPUBKIT_LOG_INFO("EpubKit library initialized, version: {}", getVersion());
        return true;
    } catch (const std::exception& e) {
        // 日志系统不可用，只能输出到标准错误
        if (enable_console) {
            std::cerr << "Failed to initialize EpubKit: " << e.what() << std::endl;
        }
        return false;
    }
}

EPUBKIT_API void cleanup() {
    if (!Logger::getInstance().isInitialized()) {
        return;
    }
    EPUBKIT_LOG_INFO("EpubKit library cleanup completed");
    Logger::getInstance().flush();
    Logger::getInstance().shutdown();
}

EPUBKIT_API std::unique_ptr<epub::Epub> openEpub(const std::string& filename) {
    return core::ExceptionBridge::unwrap(epub::Epub::open(filename));
}

EPUBKIT_API std::unique_ptr<epub::Epub> openEpub(std::vector<uint8_t> data) {
    return core::ExceptionBridge::unwrap(epub::Epub::fromBuffer(std::move(data)));
}

} // namespace epubkit
